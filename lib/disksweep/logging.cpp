#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace {

spdlog::level::level_enum resolveLevel(const std::string &configured) {
  std::string name = configured;
  if (const char *env = std::getenv("DISKSWEEP_LOG_LEVEL"); env && *env)
    name = env;

  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only "off" itself may mean that
  if (level == spdlog::level::off && name != "off")
    return spdlog::level::info;
  return level;
}

} // namespace

fs::path defaultLogFile() {
  if (const char *xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return fs::path(xdg) / "disksweep" / "disksweep.log";
  if (const char *home = std::getenv("HOME"); home && *home)
    return fs::path(home) / ".local" / "state" / "disksweep" / "disksweep.log";
  return fs::temp_directory_path() / "disksweep.log";
}

void initLogging(const LogOptions &options) {
  std::shared_ptr<spdlog::logger> logger;
  std::string fileError;
  spdlog::drop("disksweep");

  if (!options.file.empty()) {
    try {
      std::error_code ec;
      fs::create_directories(options.file.parent_path(), ec);
      logger = spdlog::basic_logger_mt("disksweep", options.file.string());
    } catch (const spdlog::spdlog_ex &e) {
      fileError = e.what();
    }
  }

  if (!logger) {
    logger = spdlog::stderr_color_mt("disksweep");
  }

  logger->set_level(resolveLevel(options.level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  spdlog::set_default_logger(logger);

  if (!fileError.empty())
    spdlog::warn("Cannot open log file {}: {}", options.file.string(),
                 fileError);
}
