/**
 * @file logger_adapter.hpp
 * @brief Adapter for store logging and migration audit trail using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with journal store operations. It supports standard logging and an
 * append-only audit trail of schema migrations and exports.
 */

#pragma once

#include <initiative/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace initiative::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON-lines migration audit trail
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade for the journal store
 *
 * Messages logged before initialize() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/initiative";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Opened store {} at version {}", path, 7);
 * logger_adapter::log_migration_applied(path, 7, "Normalize spellings", 12);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail path.
     * Repeated calls are ignored until shutdown().
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(initiative::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, initiative::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(initiative::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, initiative::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(initiative::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, initiative::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(initiative::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, initiative::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(initiative::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, initiative::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(initiative::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, initiative::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Migration Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a committed schema version step
     *
     * @param store_path Path of the store that was migrated
     * @param version Schema version that was committed
     * @param description Description of the schema version
     * @param records_rewritten Number of records passed through the transform
     */
    static void log_migration_applied(const std::string& store_path,
                                      int version,
                                      const std::string& description,
                                      std::size_t records_rewritten);

    /**
     * @brief Record a rolled-back schema version step
     *
     * @param store_path Path of the store being migrated
     * @param version Schema version that failed
     * @param reason Error message reported by the step
     */
    static void log_migration_failed(const std::string& store_path,
                                     int version,
                                     const std::string& reason);

    /**
     * @brief Record a journal export
     *
     * @param store_path Path of the exported store
     * @param thing_count Number of things written to the export
     */
    static void log_journal_exported(const std::string& store_path,
                                     std::size_t thing_count);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace initiative::integration
