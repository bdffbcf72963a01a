#include "dsan_cli/cli_handler.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
  try
  {
    dsan_cli::CliHandler handler;

    // Parse command line arguments
    dsan_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Per-file failures are reported in the log; the run itself still succeeds
    handler.execute_command(options);
  }
  catch (const dsan_cli::CliError &e)
  {
    if (e.exit_code() == 2)
    {
      std::cerr << dsan_cli::CliHandler::usage() << std::endl;
    }
    std::cerr << "Error: " << e.what() << std::endl;
    return e.exit_code();
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
