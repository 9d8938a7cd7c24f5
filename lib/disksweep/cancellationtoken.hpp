#ifndef CANCELLATIONTOKEN_HPP
#define CANCELLATIONTOKEN_HPP

#include <atomic>
#include <memory>

/**
 * @class CancellationToken
 * @brief Shared, pollable cancellation flag
 *
 * Copies share the same flag, so a token handed to a worker observes a
 * cancel() issued through any other copy. Long-running loops poll
 * isCancelled() once per unit of work; nothing is interrupted forcibly.
 */
class CancellationToken {
private:
  std::shared_ptr<std::atomic<bool>> m_flag =
      std::make_shared<std::atomic<bool>>(false);

public:
  /** @brief Requests cancellation. Idempotent. */
  void cancel() const { m_flag->store(true, std::memory_order_release); }

  bool isCancelled() const { return m_flag->load(std::memory_order_acquire); }
};

#endif // CANCELLATIONTOKEN_HPP
