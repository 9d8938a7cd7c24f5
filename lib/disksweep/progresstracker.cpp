#include "progresstracker.hpp"

std::string phaseName(Phase phase) {
  switch (phase) {
  case Phase::Idle:
    return "Idle";
  case Phase::Scanning:
    return "Scanning";
  case Phase::Hashing:
    return "Hashing";
  case Phase::Cleaning:
    return "Cleaning";
  }
  return "Idle";
}

void ProgressTracker::enterPhaseLocked(Phase phase) {
  m_phase = phase;
  m_items = 0;
  m_bytes = 0;
  m_total.reset();
  m_current.clear();
}

void ProgressTracker::advance(Phase phase, std::uint64_t itemsDelta,
                              std::uint64_t bytesDelta) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (phase != m_phase) {
    enterPhaseLocked(phase);
  }
  m_items += itemsDelta;
  m_bytes += bytesDelta;
}

void ProgressTracker::setTotal(Phase phase, std::uint64_t total) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (phase != m_phase) {
    enterPhaseLocked(phase);
  }
  m_total = total;
}

void ProgressTracker::setCurrentItem(const std::string &item) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_current = item;
}

void ProgressTracker::beginPhase(Phase phase) {
  std::lock_guard<std::mutex> lock(m_mutex);
  enterPhaseLocked(phase);
}

void ProgressTracker::finish() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_phase = Phase::Idle;
  m_current.clear();
}

void ProgressTracker::reset() {
  std::lock_guard<std::mutex> lock(m_mutex);
  enterPhaseLocked(Phase::Idle);
}

ProgressSnapshot ProgressTracker::snapshot() const {
  ProgressSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    snap.phase = m_phase;
    snap.itemsProcessed = m_items;
    snap.itemsTotal = m_total;
    snap.bytesProcessed = m_bytes;
    snap.currentItem = m_current;
  }
  snap.cancelled = m_token.isCancelled();
  return snap;
}
