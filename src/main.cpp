#include <cpptrace/cpptrace.hpp>

#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "tree_tool.hpp"

int main(int argc, char** argv){
  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "zktree");
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->load();

    parser.parse(argc, argv, *settings);
    if(settings->help_requested() || argc <= 1) {
      parser.usage();
      return argc <= 1 ? kExitFatal : kExitOk;
    }

    init(settings->get<bool>("verbose"));
    Logger logger("zktree");
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger.error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    TreeTool tool(settings);
    return tool.run();
  } catch(const UsageError& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage();
    return kExitFatal;
  } catch(std::exception& e) {
    init(false);
    Logger logger("zktree-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFatal;
  }
}
