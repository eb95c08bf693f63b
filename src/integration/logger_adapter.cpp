/**
 * @file logger_adapter.cpp
 * @brief Implementation of the store logging adapter
 */

#include <initiative/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace initiative::integration {

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);

        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "initiative.log";
            auto writer = std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,  // Convert MB to bytes
                config.max_files);
            logger_->add_writer(std::move(writer));
        }

        logger_->start();

        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        audit_log_path_.clear();
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_) {
            return;
        }

        if (!is_level_enabled(level)) {
            return;
        }

        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        nlohmann::json entry;
        entry["timestamp"] = format_iso8601();
        entry["event_type"] = event_type;
        entry["outcome"] = outcome;
        for (const auto& [key, value] : fields) {
            entry[key] = value;
        }

        file << entry.dump() << '\n';
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm tm_val{};
#ifdef _WIN32
        localtime_s(&tm_val, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_val);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        oss << std::put_time(&tm_val, "%z");
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Migration Audit Trail
// =============================================================================

void logger_adapter::log_migration_applied(const std::string& store_path,
                                           int version,
                                           const std::string& description,
                                           std::size_t records_rewritten) {
    info("Schema version {} applied to {}: {} ({} records rewritten)",
         version, store_path, description, records_rewritten);

    write_audit_log("MIGRATION", "success",
                    {{"store", store_path},
                     {"version", std::to_string(version)},
                     {"description", description},
                     {"records_rewritten", std::to_string(records_rewritten)}});
}

void logger_adapter::log_migration_failed(const std::string& store_path,
                                          int version,
                                          const std::string& reason) {
    error("Schema version {} failed on {}: {}", version, store_path, reason);

    write_audit_log("MIGRATION", "failure",
                    {{"store", store_path},
                     {"version", std::to_string(version)},
                     {"reason", reason}});
}

void logger_adapter::log_journal_exported(const std::string& store_path,
                                          std::size_t thing_count) {
    info("Journal exported from {}: {} things", store_path, thing_count);

    write_audit_log("EXPORT", "success",
                    {{"store", store_path},
                     {"thing_count", std::to_string(thing_count)}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

}  // namespace initiative::integration
