#ifndef FNV1A_HPP
#define FNV1A_HPP

#include "ihashcalculator.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>

/**
 * @brief Implementation of FNV-1a (Fowler-Noll-Vo) hash algorithm
 *
 * FNV-1a is a non-cryptographic hash function designed for fast hash table lookup.
 * This implementation uses the 64-bit version of the algorithm with:
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * Content is streamed in chunks, so memory use does not grow with file size.
 * With only 64 bits a collision between two same-sized files is unlikely but
 * possible; EvpHashCalculator is the default for duplicate detection.
 *
 * @note Inherits from IHashCalculator interface
 *
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
class FNV1A : public IHashCalculator {
public:
  HashDigest calculateHash(const std::string &filePath,
                           const CancellationToken *cancel) const override {
    const uint64_t FNV_prime = 1099511628211u;
    uint64_t hash = 1469598103934665603u;

    HashDigest digest;
    digest.bytesRead =
        streamFile(filePath, cancel, [&hash](const char *data, std::size_t n) {
          for (std::size_t i = 0; i < n; ++i) {
            hash ^= static_cast<unsigned char>(data[i]);
            hash *= FNV_prime;
          }
        });

    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setw(16) << std::setfill('0') << hash;
    digest.hex = ss.str();

    return digest;
  }

  std::string name() const override { return "fnv1a"; }
};

#endif // FNV1A_HPP
