#include "configloader.hpp"
#include "logging.hpp"
#include "sweepui.hpp"

int main(int argc, char *argv[]) {
  std::filesystem::path root = std::filesystem::current_path();
  std::filesystem::path configFile = ConfigLoader::defaultPath();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "-p" || arg == "--path") && i + 1 < argc) {
      root = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      configFile = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      std::cout << "[-p directory] [--config file]\n";
      return 0;
    }
  }

  try {
    SweepConfig config = ConfigLoader::load(configFile);

    LogOptions logOptions;
    logOptions.level = config.logLevel;
    logOptions.file = defaultLogFile();
    initLogging(logOptions);

    SweepUI ui(root, config);
    ui.initialize();
    ui.run();
  } catch (const std::exception &e) {
    // The screen has been restored by the time we get here
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
