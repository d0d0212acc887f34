#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "line_reader.hpp"
#include "log.hpp"
#include "pilot_cli.hpp"
#include "process_runner.hpp"
#include "rclone_client.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    const auto workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "rcpilot");
    parser.parse(argc, argv, *settings);

    std::filesystem::path log_file;
    const auto log_setting = settings->get<std::string>("log_file");
    if(!log_setting.empty()) {
      log_file = std::filesystem::path(log_setting).is_absolute()
        ? std::filesystem::path(log_setting)
        : workspace_root / log_setting;
    }
    init(settings->get<bool>("verbose"), log_file);
    auto logger = std::make_shared<Logger>("rcpilot");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    const auto command = settings->get<std::string>("command");
    if(settings->help_requested() || command.empty() || command == "help") {
      parser.usage();
      return 0;
    }

    // a served client hanging up must not take us down while writing to it
    std::signal(SIGPIPE, SIG_IGN);

    auto rclone = std::make_shared<RcloneClient>(std::make_shared<ProcessCommandRunner>(),
                                                 settings->get<std::string>("rclone_binary"),
                                                 logger);
    if(!rclone->is_installed()) {
      logger->error("'{}' could not be run. Install rclone (https://rclone.org/install/) or set --rclone_binary.",
                    rclone->binary());
      return 1;
    }

    PilotCLI cli(settings, rclone, std::make_shared<ConsoleLineReader>(), logger);
    return cli.execute(command);
  } catch(std::exception& e) {
    init(false);
    Logger logger("rcpilot-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
