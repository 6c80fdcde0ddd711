#include <iostream>

#include "vault_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  try
  {
    vault_cli::CliHandler handler;

    // Parse command line arguments
    vault_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
