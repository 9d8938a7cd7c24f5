#ifndef EVPHASHCALCULATOR_HPP
#define EVPHASHCALCULATOR_HPP

#include "ihashcalculator.hpp"

#include <openssl/evp.h>

/**
 * @brief Content hashing through an OpenSSL EVP digest (SHA-256 by default)
 *
 * The digest is resolved once by name; each calculateHash() call uses its own
 * EVP_MD_CTX, so one instance can be shared by all hashing workers.
 */
class EvpHashCalculator : public IHashCalculator {
private:
  std::string m_name;
  const EVP_MD *m_md;

public:
  /**
   * @throws std::invalid_argument if OpenSSL does not know the digest
   */
  explicit EvpHashCalculator(const std::string &algorithm = "sha256");

  HashDigest calculateHash(const std::string &filePath,
                           const CancellationToken *cancel) const override;

  std::string name() const override { return m_name; }
};

#endif // EVPHASHCALCULATOR_HPP
