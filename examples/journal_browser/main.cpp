/**
 * @file main.cpp
 * @brief Journal Browser - journal store viewer
 *
 * A command-line utility for inspecting a journal store: listing things,
 * reading settings, showing the schema history and exporting a backup.
 * Opening a store migrates it to the configured schema version.
 *
 * Usage:
 *   journal_browser <database> <command> [options]
 *
 * Example:
 *   journal_browser journal.db things --type Npc
 *   journal_browser journal.db show 4f3c2a10-...
 *   journal_browser journal.db history
 *   journal_browser journal.db export > backup.json
 */

#include <initiative/integration/logger_adapter.hpp>
#include <initiative/storage/data_store.hpp>
#include <initiative/storage/journal_export.hpp>
#include <initiative/storage/store_config.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace initiative::storage;
using initiative::integration::log_level;
using initiative::integration::logger_adapter;
using initiative::integration::logger_config;

namespace {

/**
 * @brief Command types supported by the browser
 */
enum class command_type {
    things,
    show,
    get,
    version,
    history,
    exporting,
    help
};

/**
 * @brief Command line options
 */
struct options {
    std::string db_path;
    command_type command{command_type::help};

    // Command argument (uuid for show, key for get)
    std::string argument;

    // Filter options
    std::string type;

    std::string config_path;

    // Output options
    bool verbose{false};
};

/**
 * @brief Print program usage
 * @param program_name Name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
Journal Browser - Journal Store Viewer

Usage: )" << program_name
              << R"( <database> <command> [options]

Commands:
  things         List all things (optionally filtered by type)
  show <uuid>    Print one thing as JSON
  get <key>      Print one setting as JSON
  version        Show the schema version of the store
  history        Show the applied schema versions
  export         Print the JSON backup document

Filter Options:
  --type <type>           Only list things of this type (e.g., Npc, Place)

General Options:
  --config <file>         Read store settings from a JSON file
  --verbose, -v           Log store activity to the console
  --help, -h              Show this help message

Examples:
  )" << program_name
              << R"( journal.db things
  )" << program_name
              << R"( journal.db things --type Place
  )" << program_name
              << R"( journal.db get time
  )" << program_name
              << R"( journal.db export > backup.json

Exit Codes:
  0  Success
  1  Invalid arguments or command
  2  Database error
  3  Record not found
)";
}

/**
 * @brief Parse command string to enum
 * @param cmd Command string
 * @return Corresponding command_type
 */
command_type parse_command(const std::string& cmd) {
    if (cmd == "things") {
        return command_type::things;
    }
    if (cmd == "show") {
        return command_type::show;
    }
    if (cmd == "get") {
        return command_type::get;
    }
    if (cmd == "version") {
        return command_type::version;
    }
    if (cmd == "history") {
        return command_type::history;
    }
    if (cmd == "export") {
        return command_type::exporting;
    }
    return command_type::help;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output options structure
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 3) {
        return false;
    }

    opts.db_path = argv[1];
    opts.command = parse_command(argv[2]);

    if (opts.command == command_type::help) {
        std::string arg1 = argv[1];
        if (arg1 == "--help" || arg1 == "-h") {
            return false;
        }
        std::cerr << "Error: Unknown command '" << argv[2] << "'\n";
        return false;
    }

    int first_option = 3;
    if (opts.command == command_type::show || opts.command == command_type::get) {
        if (argc < 4 || argv[3][0] == '-') {
            std::cerr << "Error: '" << argv[2] << "' requires an argument\n";
            return false;
        }
        opts.argument = argv[3];
        first_option = 4;
    }

    for (int i = first_option; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--type" && i + 1 < argc) {
            opts.type = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        }
    }

    return true;
}

/**
 * @brief Truncate string to fit column width
 */
std::string truncate(const std::string& str, size_t max_len) {
    if (str.length() <= max_len) {
        return str;
    }
    if (max_len <= 3) {
        return str.substr(0, max_len);
    }
    return str.substr(0, max_len - 3) + "...";
}

void print_separator(const std::vector<size_t>& widths) {
    for (size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) {
            std::cout << "+";
        }
        std::cout << std::string(widths[i] + 2, '-');
    }
    std::cout << "\n";
}

void print_row(const std::vector<std::string>& values,
               const std::vector<size_t>& widths) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            std::cout << "|";
        }
        std::cout << " " << std::left << std::setw(static_cast<int>(widths[i]))
                  << truncate(values[i], widths[i]) << " ";
    }
    std::cout << "\n";
}

/**
 * @brief List things in the store
 * @param store Journal store
 * @param opts Command options
 * @return Exit code
 */
int list_things(data_store& store, const options& opts) {
    auto result = store.things().find_all();
    if (result.is_err()) {
        std::cerr << "Error: Failed to read things: " << result.error().message
                  << "\n";
        return 2;
    }

    std::vector<thing_record> things;
    for (auto& thing : result.value()) {
        if (opts.type.empty() || thing.type == opts.type) {
            things.push_back(std::move(thing));
        }
    }

    std::cout << "\n=== Things (" << things.size() << " total) ===\n\n";

    if (things.empty()) {
        std::cout << "No things found.\n";
        return 0;
    }

    std::vector<std::string> headers = {"UUID", "Name", "Type", "Subtype"};
    std::vector<size_t> widths = {36, 24, 10, 16};

    print_row(headers, widths);
    print_separator(widths);

    for (const auto& thing : things) {
        std::vector<std::string> row = {
            thing.uuid, thing.name.value_or("-"), thing.type.value_or("-"),
            thing.string_field("subtype").value_or("-")};
        print_row(row, widths);
    }

    return 0;
}

int show_thing(data_store& store, const options& opts) {
    auto thing = store.get_thing(opts.argument);
    if (!thing.has_value()) {
        std::cerr << "Error: No thing with uuid " << opts.argument << "\n";
        return 3;
    }

    std::cout << to_document(*thing).dump(2) << "\n";
    return 0;
}

int show_value(data_store& store, const options& opts) {
    auto value = store.key_values().find(opts.argument);
    if (value.is_err()) {
        std::cerr << "Error: " << value.error().message << "\n";
        return value.error().code == initiative::error_codes::record_not_found ? 3
                                                                               : 2;
    }

    std::cout << value.value().dump(2) << "\n";
    return 0;
}

int show_version(data_store& store) {
    std::cout << "Schema version: " << store.current_version() << "\n";
    return 0;
}

int show_history(data_store& store) {
    auto history = store.history();

    std::cout << "\n=== Schema History (" << history.size()
              << " versions) ===\n\n";

    std::vector<std::string> headers = {"Version", "Applied", "Description"};
    std::vector<size_t> widths = {7, 19, 40};

    print_row(headers, widths);
    print_separator(widths);

    for (const auto& entry : history) {
        print_row({std::to_string(entry.version), entry.applied_at,
                   entry.description},
                  widths);
    }

    return 0;
}

int do_export(data_store& store) {
    std::cout << export_journal(store).dump(2) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    logger_config log_config;
    log_config.enable_console = opts.verbose;
    log_config.enable_file = false;
    log_config.enable_audit_log = false;
    log_config.min_level = opts.verbose ? log_level::debug : log_level::warn;
    logger_adapter::initialize(log_config);

    store_config config;
    if (!opts.config_path.empty()) {
        auto config_result = load_store_config(opts.config_path);
        if (config_result.is_err()) {
            std::cerr << "Error: " << config_result.error().message << "\n";
            logger_adapter::shutdown();
            return 1;
        }
        config = config_result.value();
    }

    // Check database file exists
    if (!fs::exists(opts.db_path)) {
        std::cerr << "Error: Database file not found: " << opts.db_path << "\n";
        logger_adapter::shutdown();
        return 2;
    }

    auto store_result = data_store::open(opts.db_path, config);
    if (store_result.is_err()) {
        std::cerr << "Error: Failed to open database: "
                  << store_result.error().message << "\n";
        logger_adapter::shutdown();
        return 2;
    }

    auto& store = *store_result.value();

    int exit_code = 0;
    switch (opts.command) {
        case command_type::things:
            exit_code = list_things(store, opts);
            break;
        case command_type::show:
            exit_code = show_thing(store, opts);
            break;
        case command_type::get:
            exit_code = show_value(store, opts);
            break;
        case command_type::version:
            exit_code = show_version(store);
            break;
        case command_type::history:
            exit_code = show_history(store);
            break;
        case command_type::exporting:
            exit_code = do_export(store);
            break;
        case command_type::help:
            print_usage(argv[0]);
            break;
    }

    logger_adapter::shutdown();
    return exit_code;
}
