#include "ihashcalculator.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include "evphashcalculator.hpp"
#include "fnv1a.hpp"

std::uintmax_t
streamFile(const std::string &filePath, const CancellationToken *cancel,
           const std::function<void(const char *, std::size_t)> &fold) {
  std::ifstream file(filePath, std::ios::binary);
  if (!file) {
    throw HashError("Cannot open " + filePath + ": " + std::strerror(errno));
  }

  std::vector<char> buffer(IHashCalculator::CHUNK_SIZE);
  std::uintmax_t total = 0;
  std::size_t chunks = 0;

  while (file) {
    if (cancel && ++chunks % IHashCalculator::CHUNKS_PER_CANCEL_CHECK == 0 &&
        cancel->isCancelled()) {
      throw HashCancelled();
    }

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = file.gcount();
    if (n > 0) {
      fold(buffer.data(), static_cast<std::size_t>(n));
      total += static_cast<std::uintmax_t>(n);
    }
  }

  if (file.bad()) {
    throw HashError("Read error on " + filePath);
  }

  return total;
}

std::unique_ptr<IHashCalculator> makeHashCalculator(const std::string &algorithm) {
  if (algorithm == "fnv1a") {
    return std::make_unique<FNV1A>();
  }
  return std::make_unique<EvpHashCalculator>(algorithm);
}
