#include "tome_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    tome_cli::CliOptions options = tome_cli::CliHandler::parse_arguments(argc, argv);

    // --config wins over the TOME_CONFIG environment variable
    std::string config_path = options.config_path;
    if (config_path.empty())
    {
      const char *env_config = std::getenv("TOME_CONFIG");
      config_path = env_config ? env_config : "";
    }
    Config config = config_path.empty() ? Config::from_json(nlohmann::json::object())
                                        : Config::from_file(config_path);

    tome_cli::CliHandler handler(config, std::cout);
    return handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
