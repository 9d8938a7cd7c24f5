#include "evphashcalculator.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

} // namespace

EvpHashCalculator::EvpHashCalculator(const std::string &algorithm)
    : m_name(algorithm), m_md(EVP_get_digestbyname(algorithm.c_str())) {
  if (m_md == nullptr) {
    throw std::invalid_argument("Invalid hash algorithm: " + algorithm);
  }
}

HashDigest EvpHashCalculator::calculateHash(const std::string &filePath,
                                            const CancellationToken *cancel) const {
  EvpContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw HashError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), m_md, nullptr) != 1) {
    throw HashError("EVP_DigestInit_ex failed for " + m_name);
  }

  HashDigest digest;
  digest.bytesRead = streamFile(
      filePath, cancel, [&ctx, this](const char *data, std::size_t n) {
        if (EVP_DigestUpdate(ctx.get(), data, n) != 1) {
          throw HashError("EVP_DigestUpdate failed for " + m_name);
        }
      });

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &length) != 1) {
    throw HashError("EVP_DigestFinal_ex failed for " + m_name);
  }

  std::stringstream ss;
  ss << std::hex << std::uppercase << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    ss << std::setw(2) << static_cast<unsigned int>(md[i]);
  }
  digest.hex = ss.str();

  return digest;
}
