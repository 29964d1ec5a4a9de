#include "analysis/schema_analyzer.hpp"
#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "dialect/dialect_registry.hpp"
#include "serialization/file_io.hpp"
#include "serialization/graph_writer.hpp"
#include "serialization/relationship_writer.hpp"
#include "serialization/schema_reader.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace schemagraph;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::string command;
    std::string input_path;                 // Schema JSON or config TOML
    std::optional<std::string> config_path;
    std::optional<std::string> db_type;
    std::optional<std::string> output_dir;
    std::optional<std::string> log_level;
    bool json = false;
    bool quiet = false;
};

void print_usage(std::ostream& out) {
    out << "Usage:\n"
           "  schemagraph analyze <schema.json> [--config <file>] [--db-type <type>]\n"
           "                      [--output <dir>] [--json] [--quiet] [--log-level <level>]\n"
           "  schemagraph validate-config <config.toml>\n"
           "  schemagraph validate-schema <schema.json> [--db-type <type>]\n"
           "  schemagraph <db-type> <schema.json> [options]   (same as analyze --db-type)\n"
           "\n"
           "Database types: postgresql, mysql, mssql, oracle, redshift, sybase, db2, generic\n";
}

bool is_database_type(std::string_view name) {
    try {
        (void)parse_database_type(name);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

// ============================================================================
// Argument parsing
// ============================================================================

CliOptions parse_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw UsageError("missing command");
    }

    CliOptions opts;
    size_t i = 0;
    if (args[0] == "analyze" || args[0] == "validate-config" || args[0] == "validate-schema" ||
        args[0] == "--help" || args[0] == "-h" || args[0] == "help") {
        opts.command = args[0];
        i = 1;
    } else if (is_database_type(args[0])) {
        // Legacy form: "schemagraph postgres schema.json"
        opts.command = "analyze";
        opts.db_type = args[0];
        i = 1;
    } else {
        throw UsageError(std::format("unknown command '{}'", args[0]));
    }

    if (opts.command == "--help" || opts.command == "-h" || opts.command == "help") {
        opts.command = "help";
        return opts;
    }

    const auto take_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= args.size()) {
            throw UsageError(std::format("{} requires a value", flag));
        }
        return args[++i];
    };

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" || arg == "-c") {
            opts.config_path = take_value(arg);
        } else if (arg == "--db-type" || arg == "-t") {
            opts.db_type = take_value(arg);
        } else if (arg == "--output" || arg == "-o") {
            opts.output_dir = take_value(arg);
        } else if (arg == "--log-level") {
            opts.log_level = take_value(arg);
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.command = "help";
            return opts;
        } else if (arg.starts_with("-")) {
            throw UsageError(std::format("unknown option '{}'", arg));
        } else if (opts.input_path.empty()) {
            opts.input_path = arg;
        } else {
            throw UsageError(std::format("unexpected argument '{}'", arg));
        }
    }

    if (opts.input_path.empty()) {
        throw UsageError(std::format("{} requires an input file", opts.command));
    }
    if (opts.db_type && !is_database_type(*opts.db_type)) {
        throw UsageError(std::format("Unknown database type: {}", *opts.db_type));
    }
    if (opts.log_level && !utils::log::parse_level(*opts.log_level)) {
        throw UsageError(std::format("unknown log level '{}'", *opts.log_level));
    }
    return opts;
}

// ============================================================================
// Commands
// ============================================================================

const char* confidence_marker(double confidence) {
    if (confidence > 0.8) return "🟢";
    if (confidence > 0.6) return "🟡";
    return "🔴";
}

void print_relationships(const RelationshipMap& relationships) {
    for (const auto& [table, entry] : relationships) {
        std::cout << std::format("{} (primary key: {})\n", table, entry.primary_key.value_or("none"));
        if (entry.foreign_keys.empty()) {
            std::cout << "  no foreign keys\n";
            continue;
        }
        for (const auto& rel : entry.foreign_keys) {
            std::cout << std::format("  {} {} -> {} ({:.2f}, {}{})\n",
                confidence_marker(rel.confidence), rel.source_column, rel.references(),
                rel.confidence, basis_to_string(rel.basis), rel.dangling ? ", dangling" : "");
        }
    }
}

void apply_log_level(const CliOptions& opts, const AppConfig& config) {
    if (opts.log_level) {
        utils::log::set_level(*utils::log::parse_level(*opts.log_level));
    } else if (opts.quiet) {
        utils::log::set_level(utils::log::Level::WARN);
    } else if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }
}

std::optional<AppConfig> load_config(const CliOptions& opts) {
    if (!opts.config_path) {
        return AppConfig{};
    }
    auto result = ConfigLoader::load_from_file(*opts.config_path);
    if (!result.success) {
        utils::log::error(result.error_message);
        return std::nullopt;
    }
    return std::move(result.config);
}

/**
 * @brief Read, resolve the dialect and validate a schema description
 * @return Model, or nullopt after logging the problems
 */
std::optional<SchemaModel> load_model(const CliOptions& opts, const AppConfig& config) {
    const auto description = read_schema_file(opts.input_path);
    if (description.is_error()) {
        utils::log::error(std::format("{}: {}", opts.input_path, description.error_message()));
        return std::nullopt;
    }

    const auto fallback = config.input.database_type
        ? parse_database_type(*config.input.database_type)
        : DatabaseType::POSTGRESQL;
    const auto type = resolve_database_type(description.value(), opts.db_type, fallback);

    const auto registry = DialectRegistry::with_builtin_dialects();
    try {
        return load_schema_model(description.value(), registry, type);
    } catch (const InvalidSchemaError& e) {
        utils::log::error(std::format("{}: invalid schema ({} problems)", opts.input_path, e.problems().size()));
        for (const auto& problem : e.problems()) {
            utils::log::error(std::format("  - {}", problem));
        }
        return std::nullopt;
    }
}

bool write_output(const Result<std::string>& written) {
    if (written.is_error()) {
        utils::log::error(written.error_message());
        return false;
    }
    utils::log::info(std::format("Wrote {}", written.value()));
    return true;
}

int run_analyze(const CliOptions& opts) {
    const auto config = load_config(opts);
    if (!config) return kExitFailure;
    apply_log_level(opts, *config);

    const auto model = load_model(opts, *config);
    if (!model) return kExitFailure;

    SchemaAnalyzer analyzer(make_inference_config(config->inference));
    const auto result = analyzer.analyze(*model);

    const std::string database = model->database().empty()
        ? std::filesystem::path(opts.input_path).stem().string()
        : model->database();
    const std::filesystem::path out_dir = opts.output_dir.value_or(config->output.directory);
    const auto out_path = [&](const std::string& pattern) {
        return (out_dir / expand_file_pattern(pattern, database)).string();
    };

    bool ok = write_output(io::write_text_file(
        out_path(config->output.relationships_file), relationships_to_yaml(result.relationships)));
    ok = write_output(io::write_text_file(
        out_path(config->output.graph_file), graph_to_node_link_json(result.graph).dump(2) + "\n")) && ok;
    if (opts.json || config->output.write_json_relationships) {
        ok = write_output(io::write_text_file(
            out_path(config->output.relationships_json_file),
            relationships_to_json(result.relationships).dump(2) + "\n")) && ok;
    }

    if (!opts.quiet) {
        print_relationships(result.relationships);
        std::cout << std::format("\n{} tables, {} declared, {} inferred, {} dangling\n",
            result.stats.table_count, result.stats.declared_count,
            result.stats.inferred_count, result.stats.dangling_count);
    }

    return ok ? kExitOk : kExitFailure;
}

int run_validate_config(const CliOptions& opts) {
    const auto result = ConfigLoader::load_from_file(opts.input_path);
    if (!result.success) {
        std::cout << result.error_message << "\n";
        return kExitFailure;
    }
    std::cout << std::format("{}: OK\n", opts.input_path);
    return kExitOk;
}

int run_validate_schema(const CliOptions& opts) {
    AppConfig config;
    apply_log_level(opts, config);

    const auto model = load_model(opts, config);
    if (!model) return kExitFailure;

    std::cout << std::format("{}: OK ({} tables, {} columns, {} declared foreign keys, {})\n",
        opts.input_path, model->table_count(), model->column_count(),
        model->declared_foreign_key_count(), database_type_to_string(model->database_type()));
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    CliOptions opts;
    try {
        opts = parse_args(args);
    } catch (const UsageError& e) {
        std::cerr << "schemagraph: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    try {
        if (opts.command == "help") {
            print_usage(std::cout);
            return kExitOk;
        }
        if (opts.command == "validate-config") {
            return run_validate_config(opts);
        }
        if (opts.command == "validate-schema") {
            return run_validate_schema(opts);
        }
        return run_analyze(opts);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}
