#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vault_core/collection_options.hpp"
#include "vault_core/record_filter.hpp"
#include "vault_core/vector_engine.hpp"

namespace vault_cli
{

  enum class Command
  {
    Stats,
    Size,
    Sources,
    Get,
    List,
    Search,
    Import,
    Delete,
    Purge,
    Clear,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;

    // Collection location; --config is applied first, --path and --dim override it
    std::string config_path;
    std::string storage_path;
    int dimension = 0;

    std::string id;
    std::string file_path;
    std::string vector;
    int top_k = 5;
    size_t limit = 0;  // 0 lists everything

    // purge clauses
    std::string source;
    std::string source_contains;
    std::vector<std::string> metadata_terms;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(std::ostream &out = std::cout);

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Opens the collection, runs the command and closes it again. Errors are
    // thrown to the caller.
    void execute_command(const CliOptions &options);

    static vault_core::CollectionOptions resolve_collection_options(const CliOptions &options);
    static std::vector<float> parse_vector(const std::string &text);
    static vault_core::RecordFilter build_purge_filter(const CliOptions &options);
    static vault_core::MetadataValue parse_metadata_value(const std::string &text);

  private:
    std::ostream &out_;

    // Command handlers
    void handle_stats_command(vault_core::VectorEngine &engine);
    void handle_size_command(vault_core::VectorEngine &engine);
    void handle_sources_command(vault_core::VectorEngine &engine);
    void handle_get_command(vault_core::VectorEngine &engine, const CliOptions &options);
    void handle_list_command(vault_core::VectorEngine &engine, const CliOptions &options);
    void handle_search_command(vault_core::VectorEngine &engine, const CliOptions &options);
    void handle_import_command(vault_core::VectorEngine &engine, const CliOptions &options);
    void handle_delete_command(vault_core::VectorEngine &engine, const CliOptions &options);
    void handle_purge_command(vault_core::VectorEngine &engine, const CliOptions &options);
    void handle_clear_command(vault_core::VectorEngine &engine);
    void handle_health_command(vault_core::VectorEngine &engine);

    void print_json_response(const nlohmann::json &response);
    void print_help();
  };

}
