#include "scansession.hpp"
#include "cleaner.hpp"
#include "duplicatefinder.hpp"
#include "filescanner.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

ScanSession::ScanSession(ConstructionKey, fs::path root, SweepConfig config,
                         FileCategorizer categorizer)
    : m_root(std::move(root)), m_config(std::move(config)),
      m_categorizer(std::move(categorizer)),
      m_hasher(makeHashCalculator(m_config.hashAlgorithm)) {}

std::shared_ptr<ScanSession> ScanSession::start(const fs::path &root,
                                                const SweepConfig &config,
                                                FileCategorizer categorizer) {
  auto session = std::make_shared<ScanSession>(ConstructionKey{}, root, config,
                                               std::move(categorizer));
  ScanSession *self = session.get();
  session->m_done =
      std::async(std::launch::async, [self]() { self->run(); }).share();
  return session;
}

ScanSession::~ScanSession() {
  if (m_done.valid()) {
    requestCancel();
    m_done.wait();
  }
}

void ScanSession::run() {
  auto start = std::chrono::steady_clock::now();
  const CancellationToken &cancel = m_progress.token();

  FileScanner scanner(m_categorizer);
  ScanResult result;
  try {
    result = scanner.scan(m_root, m_config.scanOptions(), m_progress, cancel);
  } catch (const ScanError &e) {
    spdlog::error("{}", e.what());
    m_progress.finish();
    throw;
  }

  if (!result.isCancelled()) {
    DuplicateFinder finder(*m_hasher, m_config.workers);
    auto report = finder.findDuplicates(result.records, m_progress, cancel);
    result.duplicateGroups = std::move(report.groups);
    result.hashFailures = std::move(report.hashFailures);
    if (report.cancelled)
      result.status = ScanStatus::Cancelled;
    result.updateStatistics();
  }

  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  m_result = std::move(result);
  m_progress.finish();

  spdlog::info("Session for {} finished in {} ms: {} duplicate group(s), "
               "{} wasted bytes{}",
               m_root.string(), m_result.duration.count(),
               m_result.duplicateGroups.size(),
               m_result.statistics.wastedBytes,
               m_result.isCancelled() ? " (cancelled)" : "");
}

bool ScanSession::isFinished() const {
  return m_done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void ScanSession::wait() const { m_done.wait(); }

void ScanSession::requestCancel() {
  m_progress.cancel();
  std::lock_guard<std::mutex> lock(m_cleanMutex);
  m_cleanToken.cancel();
}

const ScanResult &ScanSession::results() const {
  if (!isFinished())
    throw std::logic_error("scan session is still running");
  m_done.get();
  return m_result;
}

std::vector<CleanupOutcome>
ScanSession::clean(const std::vector<fs::path> &selected) {
  const ScanResult &result = results();

  CancellationToken token;
  {
    std::lock_guard<std::mutex> lock(m_cleanMutex);
    m_cleanToken = token;
  }

  Cleaner cleaner(m_config.cleanupOptions({result.root}));
  return cleaner.clean(selected, &m_progress, &token);
}
