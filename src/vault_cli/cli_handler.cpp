#include "vault_cli/cli_handler.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "vault_core/config.hpp"
#include "vault_core/record_json.hpp"

namespace vault_cli {

namespace {

const std::unordered_map<std::string, Command> &command_names() {
    static const std::unordered_map<std::string, Command> names = {
        {"stats", Command::Stats},     {"size", Command::Size},     {"sources", Command::Sources},
        {"get", Command::Get},         {"list", Command::List},     {"ls", Command::List},
        {"search", Command::Search},   {"s", Command::Search},      {"import", Command::Import},
        {"delete", Command::Delete},   {"rm", Command::Delete},     {"purge", Command::Purge},
        {"clear", Command::Clear},     {"health", Command::Health}, {"help", Command::Help},
        {"h", Command::Help},
        {"--help", Command::Help},     {"-h", Command::Help}};
    return names;
}

int parse_int(const std::string &flag, const std::string &value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::invalid_argument &) {
        throw CliError("Invalid number for " + flag + ": " + value);
    } catch (const std::out_of_range &) {
        throw CliError("Number out of range for " + flag + ": " + value);
    }
}

}  // namespace

CliHandler::CliHandler(std::ostream &out) : out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
    CliOptions options;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.size() > 1 && arg[0] == '-' && command_names().count(arg) == 0) {
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + arg);
            }
            std::string value = argv[++i];

            if (arg == "--path" || arg == "-p") {
                options.storage_path = value;
            } else if (arg == "--dim" || arg == "-d") {
                options.dimension = parse_int(arg, value);
                if (options.dimension <= 0) {
                    throw CliError("--dim must be greater than 0");
                }
            } else if (arg == "--config" || arg == "-c") {
                options.config_path = value;
            } else if (arg == "--id" || arg == "-i") {
                options.id = value;
            } else if (arg == "--file" || arg == "-f") {
                options.file_path = value;
            } else if (arg == "--vector" || arg == "-v") {
                options.vector = value;
            } else if (arg == "--top-k" || arg == "-k") {
                options.top_k = parse_int(arg, value);
            } else if (arg == "--limit" || arg == "-l") {
                int limit = parse_int(arg, value);
                if (limit < 0) {
                    throw CliError("--limit cannot be negative");
                }
                options.limit = static_cast<size_t>(limit);
            } else if (arg == "--source" || arg == "-s") {
                options.source = value;
            } else if (arg == "--source-contains") {
                options.source_contains = value;
            } else if (arg == "--meta" || arg == "-m") {
                options.metadata_terms.push_back(value);
            } else {
                throw CliError("Unknown option: " + arg);
            }
            continue;
        }

        if (have_command) {
            throw CliError("Unexpected argument: " + arg);
        }
        auto it = command_names().find(arg);
        if (it == command_names().end()) {
            throw CliError("Unknown command: " + arg);
        }
        options.command = it->second;
        have_command = true;
    }

    switch (options.command) {
        case Command::Get:
        case Command::Delete:
            if (options.id.empty()) {
                throw CliError("This command requires a record id. Usage: get|delete --id <id>");
            }
            break;
        case Command::Search:
            if (options.vector.empty()) {
                throw CliError("Search command requires a vector. Usage: search --vector \"0.1,0.2,...\"");
            }
            break;
        case Command::Import:
            if (options.file_path.empty()) {
                throw CliError("Import command requires a file. Usage: import --file <records.jsonl>");
            }
            break;
        case Command::Purge:
            if (options.source.empty() && options.source_contains.empty() &&
                options.metadata_terms.empty()) {
                throw CliError(
                    "Purge command requires at least one of --source, --source-contains or --meta");
            }
            break;
        default:
            break;
    }

    return options;
}

vault_core::CollectionOptions CliHandler::resolve_collection_options(const CliOptions &options) {
    vault_core::Config config = options.config_path.empty()
                                    ? vault_core::Config::from_json(nlohmann::json::object())
                                    : vault_core::Config::from_file(options.config_path);
    vault_core::CollectionOptions collection = config.collection;
    if (!options.storage_path.empty()) {
        collection.storage_path = options.storage_path;
    }
    if (options.dimension > 0) {
        collection.dimension = static_cast<size_t>(options.dimension);
    }
    return collection;
}

std::vector<float> CliHandler::parse_vector(const std::string &text) {
    std::vector<float> values;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        try {
            size_t consumed = 0;
            float value = std::stof(item, &consumed);
            if (item.find_first_not_of(" \t", consumed) != std::string::npos) {
                throw CliError("Invalid vector component: '" + item + "'");
            }
            values.push_back(value);
        } catch (const std::invalid_argument &) {
            throw CliError("Invalid vector component: '" + item + "'");
        } catch (const std::out_of_range &) {
            throw CliError("Vector component out of range: '" + item + "'");
        }
    }
    if (values.empty()) {
        throw CliError("Vector cannot be empty");
    }
    return values;
}

vault_core::MetadataValue CliHandler::parse_metadata_value(const std::string &text) {
    // JSON scalars keep their type; anything else is matched as a plain string
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || parsed.is_null() || parsed.is_structured()) {
        return text;
    }
    return parsed.get<vault_core::MetadataValue>();
}

vault_core::RecordFilter CliHandler::build_purge_filter(const CliOptions &options) {
    vault_core::RecordFilter filter;
    if (!options.source.empty()) {
        filter.and_also(vault_core::SourceEquals{options.source});
    }
    if (!options.source_contains.empty()) {
        filter.and_also(vault_core::SourceContains{options.source_contains});
    }
    for (const auto &term : options.metadata_terms) {
        auto separator = term.find('=');
        if (separator == std::string::npos || separator == 0) {
            throw CliError("Metadata filter must be key=value, got: " + term);
        }
        filter.and_also(vault_core::MetadataEquals{term.substr(0, separator),
                                                   parse_metadata_value(term.substr(separator + 1))});
    }
    return filter;
}

void CliHandler::execute_command(const CliOptions &options) {
    if (options.command == Command::Help) {
        print_help();
        return;
    }

    vault_core::VectorEngine engine(resolve_collection_options(options));
    engine.open();

    switch (options.command) {
        case Command::Stats:
            handle_stats_command(engine);
            break;
        case Command::Size:
            handle_size_command(engine);
            break;
        case Command::Sources:
            handle_sources_command(engine);
            break;
        case Command::Get:
            handle_get_command(engine, options);
            break;
        case Command::List:
            handle_list_command(engine, options);
            break;
        case Command::Search:
            handle_search_command(engine, options);
            break;
        case Command::Import:
            handle_import_command(engine, options);
            break;
        case Command::Delete:
            handle_delete_command(engine, options);
            break;
        case Command::Purge:
            handle_purge_command(engine, options);
            break;
        case Command::Clear:
            handle_clear_command(engine);
            break;
        case Command::Health:
            handle_health_command(engine);
            break;
        case Command::Help:
            break;
    }

    engine.close();
}

void CliHandler::handle_stats_command(vault_core::VectorEngine &engine) {
    print_json_response(engine.stats());
}

void CliHandler::handle_size_command(vault_core::VectorEngine &engine) {
    print_json_response({{"size", engine.size()}});
}

void CliHandler::handle_sources_command(vault_core::VectorEngine &engine) {
    print_json_response(engine.list_sources());
}

void CliHandler::handle_get_command(vault_core::VectorEngine &engine, const CliOptions &options) {
    auto record = engine.get(options.id);
    if (!record) {
        throw CliError("Record not found: " + options.id);
    }
    print_json_response(*record);
}

void CliHandler::handle_list_command(vault_core::VectorEngine &engine, const CliOptions &options) {
    nlohmann::json records = nlohmann::json::array();
    auto cursor = engine.all();
    while (auto record = cursor.next()) {
        if (options.limit > 0 && records.size() >= options.limit) {
            break;
        }
        nlohmann::json entry = *record;
        // Vectors make listings unreadable; use get for the full record
        entry.erase("embedding");
        records.push_back(std::move(entry));
    }
    print_json_response(records);
}

void CliHandler::handle_search_command(vault_core::VectorEngine &engine, const CliOptions &options) {
    auto results = engine.search_by_vector(parse_vector(options.vector), options.top_k);
    nlohmann::json response = nlohmann::json::array();
    for (const auto &result : results) {
        response.push_back(result);
    }
    print_json_response(response);
}

void CliHandler::handle_import_command(vault_core::VectorEngine &engine, const CliOptions &options) {
    std::ifstream input(options.file_path);
    if (!input.is_open()) {
        throw CliError("Failed to open import file: " + options.file_path);
    }

    std::vector<vault_core::Record> records;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            records.push_back(nlohmann::json::parse(line).get<vault_core::Record>());
        } catch (const std::exception &e) {
            throw CliError("Invalid record on line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    vault_core::BatchResult result = engine.add_batch(records);
    nlohmann::json rejected = nlohmann::json::array();
    for (const auto &entry : result.rejected) {
        rejected.push_back(
            {{"id", entry.id}, {"kind", vault_core::to_string(entry.kind)}, {"message", entry.message}});
    }
    print_json_response({{"inserted", result.inserted},
                         {"replaced", result.replaced},
                         {"rejected", rejected}});
}

void CliHandler::handle_delete_command(vault_core::VectorEngine &engine, const CliOptions &options) {
    print_json_response({{"id", options.id}, {"removed", engine.remove(options.id)}});
}

void CliHandler::handle_purge_command(vault_core::VectorEngine &engine, const CliOptions &options) {
    vault_core::RecordFilter filter = build_purge_filter(options);
    size_t removed = engine.remove_where(filter);
    print_json_response({{"filter", filter.describe()}, {"removed", removed}});
}

void CliHandler::handle_clear_command(vault_core::VectorEngine &engine) {
    print_json_response({{"removed", engine.clear()}});
}

void CliHandler::handle_health_command(vault_core::VectorEngine &engine) {
    vault_core::HealthReport report = engine.health_check();
    print_json_response(report);
    if (!report.healthy) {
        throw CliError("Collection is unhealthy: " + report.error);
    }
}

void CliHandler::print_json_response(const nlohmann::json &response) {
    out_ << response.dump(2) << std::endl;
}

void CliHandler::print_help() {
    out_ << R"(
Vault CLI - embedding collection administration

Usage: vault_cli <command> [options]

Collection options (any command):
  --config, -c <file>      JSON configuration file
  --path, -p <dir>         Storage root (overrides the config)
  --dim, -d <num>          Embedding dimension (overrides the config)

Commands:
  stats                    Collection statistics
  size                     Number of records
  sources                  Distinct source references
  get --id <id>            Print one record
  list, ls                 List records in insertion order
    --limit, -l <num>      Stop after num records
  search, s                Rank records against a query vector
    --vector, -v <csv>     Comma separated query vector
    --top-k, -k <num>      Number of results to return (default: 5)
  import --file <path>     Add records from a JSON lines file
  delete, rm --id <id>     Remove one record
  purge                    Remove every record matching all given clauses
    --source, -s <ref>     Exact source reference
    --source-contains <s>  Source reference substring
    --meta, -m <key=value> Metadata equality, repeatable
  clear                    Remove every record
  health                   Open the collection and verify its database
  help, h                  Show this help message

Examples:
  vault_cli stats --path ./data/vault --dim 384
  vault_cli import --config vault.json --file chunks.jsonl
  vault_cli search --config vault.json --vector "0.1,0.2,0.3" --top-k 10
  vault_cli purge --config vault.json --source paper.pdf --meta page=3
)" << std::endl;
}

}  // namespace vault_cli
