#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "cancellationtoken.hpp"

/**
 * @brief Raised when a file cannot be opened or read while hashing
 */
class HashError : public std::runtime_error {
public:
  explicit HashError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Raised when cancellation is observed in the middle of a file
 */
class HashCancelled : public std::runtime_error {
public:
  HashCancelled() : std::runtime_error("hashing cancelled") {}
};

struct HashDigest {
  /** @brief Uppercase hexadecimal digest */
  std::string hex;

  /** @brief Number of content bytes folded into the digest */
  std::uintmax_t bytesRead = 0;
};

class IHashCalculator {
public:
  /** @brief Bytes read per chunk; bounds per-worker memory */
  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

  /** @brief Cancellation is polled once per this many chunks */
  static constexpr std::size_t CHUNKS_PER_CANCEL_CHECK = 16;

  /**
   * @throws HashError if the file cannot be read
   * @throws HashCancelled if cancel fires before the file is finished
   */
  virtual HashDigest calculateHash(const std::string &filePath,
                                   const CancellationToken *cancel) const = 0;

  /** @brief Algorithm name as accepted by makeHashCalculator() */
  virtual std::string name() const = 0;

  virtual ~IHashCalculator() = default;
};

/**
 * @brief Reads a file in CHUNK_SIZE pieces and hands each to fold
 *
 * @return Total number of bytes read
 * @throws HashError, HashCancelled
 */
std::uintmax_t
streamFile(const std::string &filePath, const CancellationToken *cancel,
           const std::function<void(const char *, std::size_t)> &fold);

/**
 * @brief Creates a hasher by name: "fnv1a" or any OpenSSL digest name
 *        ("sha256", "sha1", "md5", "blake2b512", ...)
 *
 * @throws std::invalid_argument for unknown algorithms
 */
std::unique_ptr<IHashCalculator> makeHashCalculator(const std::string &algorithm);

#endif // IHASHCALCULATOR_HPP
