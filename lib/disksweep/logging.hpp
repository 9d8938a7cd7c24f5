#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <filesystem>
#include <string>

/**
 * @brief Where and how verbosely disksweep logs
 */
struct LogOptions {
  /** @brief spdlog level name; DISKSWEEP_LOG_LEVEL overrides it */
  std::string level = "info";

  /**
   * @brief Log file; empty logs to stderr
   *
   * The TUI owns the terminal and therefore always logs to a file.
   */
  std::filesystem::path file;
};

/**
 * @brief Installs the process-wide default spdlog logger
 *
 * Safe to call more than once; the last call wins. If the log file cannot
 * be opened, logging falls back to stderr and a warning is emitted.
 */
void initLogging(const LogOptions &options);

/**
 * @brief $XDG_STATE_HOME/disksweep/disksweep.log, or
 *        ~/.local/state/disksweep/disksweep.log
 */
std::filesystem::path defaultLogFile();

#endif // LOGGING_HPP
