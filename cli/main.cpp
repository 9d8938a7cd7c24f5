#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "category.hpp"
#include "cleaner.hpp"
#include "configloader.hpp"
#include "logging.hpp"
#include "scansession.hpp"
#include "utils.hpp"

namespace {

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int) { interrupted = 1; }

} // namespace

/**
 * @struct CliOptions
 * @brief Command-line flags after parsing
 *
 * Values that also exist in the configuration file are kept optional here so
 * that only flags the user actually passed override the file.
 */
struct CliOptions {
  std::string path;
  std::optional<std::string> configFile;
  std::vector<std::string> excludes;
  std::optional<std::uintmax_t> maxSize;
  std::optional<std::uintmax_t> minSize;
  std::optional<unsigned int> maxAgeDays;
  bool hidden = false;
  bool followSymlinks = false;
  std::optional<std::string> hash;
  std::optional<std::size_t> workers;
  std::vector<Category> cleanCategories;
  bool cleanDuplicates = false;
  std::optional<std::string> backupDir;
  bool trash = false;
  bool unsafe = false;
  bool assumeYes = false;
  bool dryRun = false;
  bool verbose = false;
};

/**
 * @class Application
 * @brief Command-line front end: scan a directory, report, optionally clean
 *
 * run() drives one ScanSession to completion while printing a progress line
 * to stderr, then prints on stdout:
 *  - the per-category summary (files and bytes, disposable categories marked)
 *  - every duplicate group with its wasted space
 *  - scan warnings and hash failures
 *
 * When a cleanup selection was requested (--clean-category,
 * --clean-duplicates) the selection is listed with its estimated size and,
 * unless --yes was given, the user has to type "yes" before anything is
 * removed. --dry-run stops after the listing.
 *
 * Error handling
 *  - ScanError (invalid root) and ConfigError are reported and turned into
 *    exit code 2 by main().
 *  - Per-file failures never stop the run; they show up in the output.
 *
 * Exit codes: 0 success, 1 some cleanup failed or the scan was cancelled,
 * 2 usage or configuration error.
 */
class Application {
private:
  const CliOptions &m_options;
  SweepConfig m_config;

public:
  Application(const CliOptions &options, SweepConfig config)
      : m_options(options), m_config(std::move(config)) {}

  int run() {
    std::cout << "Scan directory: " << m_options.path << std::endl;

    auto session = ScanSession::start(m_options.path, m_config);
    waitWithProgress(*session);

    const ScanResult &result = session->results();
    std::cout << "Scan " << (result.isCancelled() ? "cancelled" : "finished")
              << ". " << result.statistics.totalFiles << " files, "
              << formatBytes(static_cast<long long>(result.statistics.totalBytes))
              << " in " << result.duration.count() << " ms." << std::endl;

    showCategories(result);
    showDuplicates(result);
    showProblems(result);

    if (result.isCancelled()) {
      std::cout << "\nScan was cancelled, results are incomplete." << std::endl;
      return 1;
    }

    std::vector<std::filesystem::path> selection = buildSelection(result);
    if (selection.empty()) {
      if (!m_options.cleanCategories.empty() || m_options.cleanDuplicates)
        std::cout << "\nNothing selected for cleanup." << std::endl;
      return 0;
    }

    return cleanSelection(*session, selection);
  }

private:
  void waitWithProgress(ScanSession &session) const {
    std::size_t spinner = 0;
    const char *frames = "|/-\\";
    bool cancelRequested = false;

    while (!session.isFinished()) {
      if (interrupted && !cancelRequested) {
        std::cerr << "\nCancelling..." << std::endl;
        session.requestCancel();
        cancelRequested = true;
      }

      auto snap = session.pollProgress();
      std::cerr << "\r" << frames[spinner++ % 4] << " " << phaseName(snap.phase)
                << ": " << snap.itemsProcessed;
      if (snap.itemsTotal)
        std::cerr << "/" << *snap.itemsTotal;
      std::cerr << " files, "
                << formatBytes(static_cast<long long>(snap.bytesProcessed))
                << "        " << std::flush;

      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cerr << "\r" << std::string(60, ' ') << "\r" << std::flush;
  }

  void showCategories(const ScanResult &result) const {
    std::cout << "\n--- Categories ---" << std::endl;

    for (Category category : allCategories()) {
      auto files = result.statistics.filesPerCategory.find(category);
      if (files == result.statistics.filesPerCategory.end() ||
          files->second == 0)
        continue;

      auto bytes = result.statistics.bytesPerCategory.at(category);
      std::cout << "  " << (isSafeToDelete(category) ? "* " : "  ")
                << categoryName(category) << ": " << files->second
                << " files, " << formatBytes(static_cast<long long>(bytes))
                << std::endl;
    }
    std::cout << "  (* usually safe to delete)" << std::endl;
  }

  void showDuplicates(const ScanResult &result) const {
    std::cout << "\n--- Duplicate detection (" << m_config.hashAlgorithm
              << ") ---" << std::endl;

    if (result.duplicateGroups.empty()) {
      std::cout << "No duplicate groups found." << std::endl;
      return;
    }

    int groupNumber = 0;
    for (const auto &group : result.duplicateGroups) {
      ++groupNumber;
      std::cout << "\n# DUPLICATE GROUP " << groupNumber << " ("
                << group.paths.size() << " files, "
                << formatBytes(static_cast<long long>(group.fileSize))
                << " each, wasted "
                << formatBytes(static_cast<long long>(group.wastedSpace))
                << ")" << std::endl;
      if (m_options.verbose)
        std::cout << "    Hash: " << group.hash << std::endl;
      for (const auto &path : group.paths)
        std::cout << "    -> " << path.string() << std::endl;
    }

    std::cout << "\nTotal " << result.duplicateGroups.size()
              << " duplicate groups, "
              << formatBytes(static_cast<long long>(result.statistics.wastedBytes))
              << " reclaimable." << std::endl;
  }

  void showProblems(const ScanResult &result) const {
    if (result.warnings.empty() && result.hashFailures.empty())
      return;

    std::cout << "\n--- Problems ---" << std::endl;
    std::size_t shown = 0;
    for (const auto &warning : result.warnings) {
      if (!m_options.verbose && shown++ >= 20)
        break;
      std::cout << "  [" << warningKindName(warning.kind) << "] "
                << warning.path.string() << ": " << warning.message
                << std::endl;
    }
    if (!m_options.verbose && result.warnings.size() > 20)
      std::cout << "  ... " << result.warnings.size() - 20
                << " more warnings (use -v to list all)" << std::endl;

    for (const auto &failure : result.hashFailures)
      std::cout << "  [hash-failed] " << failure.path.string() << ": "
                << failure.reason << std::endl;
  }

  std::vector<std::filesystem::path>
  buildSelection(const ScanResult &result) const {
    std::vector<std::filesystem::path> selection;

    for (Category category : m_options.cleanCategories) {
      auto paths = result.pathsInCategory(category);
      selection.insert(selection.end(), paths.begin(), paths.end());
    }
    if (m_options.cleanDuplicates) {
      auto paths = result.redundantDuplicates();
      selection.insert(selection.end(), paths.begin(), paths.end());
    }

    // A file may be both in a category and a redundant duplicate
    std::vector<std::filesystem::path> unique;
    for (auto &path : selection) {
      if (std::find(unique.begin(), unique.end(), path) == unique.end())
        unique.push_back(std::move(path));
    }
    return unique;
  }

  int cleanSelection(ScanSession &session,
                     const std::vector<std::filesystem::path> &selection) const {
    std::cout << "\n--- Cleanup selection ---" << std::endl;
    for (const auto &path : selection)
      std::cout << "    " << path.string() << std::endl;

    auto estimate = Cleaner::estimateCleanupSize(selection);
    std::cout << selection.size() << " files, about "
              << formatBytes(static_cast<long long>(estimate)) << "."
              << std::endl;
    std::cout << "Safe mode: " << (m_config.safeMode ? "on" : "OFF")
              << ", backup: "
              << (m_config.backupBeforeDelete ? m_config.backupDir.string()
                                              : std::string("none"))
              << ", trash: " << (m_config.useTrash ? "on" : "off")
              << std::endl;

    if (m_options.dryRun) {
      std::cout << "Dry run, nothing removed." << std::endl;
      return 0;
    }

    if (!m_options.assumeYes) {
      std::cout << "Type 'yes' to delete these files: " << std::flush;
      std::string answer;
      if (!std::getline(std::cin, answer) || answer != "yes") {
        std::cout << "Aborted, nothing removed." << std::endl;
        return 0;
      }
    }

    auto outcomes = session.clean(selection);
    for (const auto &outcome : outcomes) {
      std::cout << "  " << statusName(outcome.status);
      if (outcome.reason != CleanupOutcome::Reason::None)
        std::cout << " (" << reasonName(outcome.reason) << ")";
      std::cout << ": " << outcome.path.string();
      if (!outcome.detail.empty() && !outcome.isRemoved())
        std::cout << " - " << outcome.detail;
      std::cout << std::endl;
    }

    auto summary = Cleaner::summarize(outcomes);
    std::cout << "\nDeleted " << summary.deleted + summary.backedUp
              << " files (" << summary.backedUp << " backed up), moved "
              << summary.trashed << " to the trash, freed "
              << formatBytes(static_cast<long long>(summary.bytesFreed))
              << ". Failed: " << summary.failed
              << ", skipped: " << summary.skipped << "." << std::endl;
    return summary.failed > 0 ? 1 : 0;
  }
};

static void printUsage(const char *program) {
  std::cout
      << "Usage: " << program << " [options]\n"
      << "\n"
      << "Scan options:\n"
      << "  -p, --path DIR           directory to scan (default: current)\n"
      << "  -x, --exclude DIR        skip DIR and everything below (repeatable)\n"
      << "      --max-size SIZE      do not hash files above SIZE (e.g. 2GiB)\n"
      << "      --min-size SIZE      ignore files below SIZE\n"
      << "      --max-age DAYS       ignore files not modified in DAYS days\n"
      << "      --hidden             include hidden files\n"
      << "      --follow-symlinks    follow symbolic links\n"
      << "      --hash ALGO          sha256 (default), sha1, md5, blake2b512, fnv1a\n"
      << "      --workers N          hashing threads (default: all cores)\n"
      << "      --config FILE        configuration file (default: "
      << ConfigLoader::defaultPath().string() << ")\n"
      << "\n"
      << "Cleanup options:\n"
      << "      --clean-category NAME  delete files of a category (repeatable)\n"
      << "      --clean-duplicates     delete all but the first file of each group\n"
      << "      --backup-dir DIR       copy files to DIR before deleting\n"
      << "      --trash                move files to the trash instead\n"
      << "      --unsafe               allow deleting protected paths\n"
      << "  -y, --yes                  do not ask for confirmation\n"
      << "      --dry-run              show the selection, remove nothing\n"
      << "\n"
      << "  -v, --verbose            more output and debug logging\n"
      << "  -h, --help               show this help\n"
      << "\n"
      << "Categories:";
  for (Category category : allCategories())
    std::cout << " " << categoryName(category);
  std::cout << std::endl;
}

int main(int argc, char *argv[]) {
  CliOptions options;

  auto needValue = [&](int &i, const std::string &flag) -> std::string {
    if (i + 1 >= argc)
      throw std::invalid_argument(flag + " needs a value");
    return argv[++i];
  };

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "-p" || arg == "--path") {
        options.path = needValue(i, arg);
      } else if (arg == "-x" || arg == "--exclude") {
        options.excludes.push_back(needValue(i, arg));
      } else if (arg == "--max-size") {
        options.maxSize = parseSize(needValue(i, arg));
      } else if (arg == "--min-size") {
        options.minSize = parseSize(needValue(i, arg));
      } else if (arg == "--max-age") {
        unsigned long days = std::stoul(needValue(i, arg));
        if (days > std::numeric_limits<unsigned int>::max())
          throw std::invalid_argument("--max-age is out of range");
        options.maxAgeDays = static_cast<unsigned int>(days);
      } else if (arg == "--hidden") {
        options.hidden = true;
      } else if (arg == "--follow-symlinks") {
        options.followSymlinks = true;
      } else if (arg == "--config") {
        options.configFile = needValue(i, arg);
      } else if (arg == "--hash") {
        options.hash = needValue(i, arg);
      } else if (arg == "--workers") {
        options.workers = static_cast<std::size_t>(std::stoul(needValue(i, arg)));
      } else if (arg == "--clean-category") {
        std::string name = needValue(i, arg);
        auto category = categoryFromName(name);
        if (!category)
          throw std::invalid_argument("unknown category: " + name);
        options.cleanCategories.push_back(*category);
      } else if (arg == "--clean-duplicates") {
        options.cleanDuplicates = true;
      } else if (arg == "--backup-dir") {
        options.backupDir = needValue(i, arg);
      } else if (arg == "--trash") {
        options.trash = true;
      } else if (arg == "--unsafe") {
        options.unsafe = true;
      } else if (arg == "-y" || arg == "--yes") {
        options.assumeYes = true;
      } else if (arg == "--dry-run") {
        options.dryRun = true;
      } else if (arg == "-v" || arg == "--verbose") {
        options.verbose = true;
      } else if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else {
        throw std::invalid_argument("unknown option: " + arg);
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "Try '" << argv[0] << " --help'." << std::endl;
    return 2;
  }

  if (options.path.empty())
    options.path = std::filesystem::current_path().string();

  SweepConfig config;
  try {
    config = ConfigLoader::load(options.configFile
                                    ? std::filesystem::path(*options.configFile)
                                    : ConfigLoader::defaultPath());
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 2;
  }

  // Flags override the configuration file
  for (const auto &dir : options.excludes)
    config.excludeDirs.emplace_back(dir);
  if (options.maxSize)
    config.maxFileSize = options.maxSize;
  if (options.minSize)
    config.minFileSize = *options.minSize;
  if (options.maxAgeDays)
    config.maxFileAgeDays = options.maxAgeDays;
  if (options.hidden)
    config.includeHidden = true;
  if (options.followSymlinks)
    config.followSymlinks = true;
  if (options.hash)
    config.hashAlgorithm = *options.hash;
  if (options.workers)
    config.workers = *options.workers;
  if (options.backupDir) {
    config.backupDir = *options.backupDir;
    config.backupBeforeDelete = true;
  }
  if (options.trash)
    config.useTrash = true;
  if (options.unsafe)
    config.safeMode = false;
  if (options.verbose)
    config.logLevel = "debug";

  LogOptions logOptions;
  logOptions.level = config.logLevel;
  initLogging(logOptions);

  std::signal(SIGINT, onInterrupt);

  try {
    Application app(options, config);
    return app.run();
  } catch (const ScanError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }
}
