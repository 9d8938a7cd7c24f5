/**
 * @file utils.hpp
 * @brief Utility functions shared by the disksweep front ends and config
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable file size formatting
 * - parseSize: Size strings ("500MB", "2GiB") to byte counts
 *
 * @see safe_at()
 * @see formatBytes()
 * @see parseSize()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cctype>
#include <cstddef> // size_t
#include <cstdint>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Bounds-checked element lookup
 *
 * UI indices come from cursor arithmetic and may point one past the list or
 * below zero after the list shrank.
 *
 * @return Pointer to vec[index], or nullptr when index is out of range
 *
 * @code
 * if (const ListEntry *entry = safe_at(m_entries, selectedIndex()))
 *   toggle(entry->m_path);
 * @endcode
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Byte count as text with one decimal and a 1024-based unit
 *
 * Units go from B up to TB; larger values stay in TB.
 *
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 */
inline std::string formatBytes(long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Parses a human-readable size into bytes
 *
 * Accepts a non-negative integer optionally followed by a unit. Units are
 * case-insensitive and may be separated from the number by spaces.
 *
 * - No unit or "B": bytes
 * - "K", "M", "G", "T" and "KiB", "MiB", "GiB", "TiB": binary (1024-based)
 * - "KB", "MB", "GB", "TB": decimal (1000-based)
 *
 * @param text Size string such as "500", "10K", "10KB" or "2GiB"
 * @return std::uintmax_t The size in bytes
 *
 * @throws std::invalid_argument if the text is empty, not a number, carries
 *         an unknown unit, or overflows
 *
 * Example outputs:
 * - parseSize("500") → 500
 * - parseSize("10K") → 10240
 * - parseSize("10KB") → 10000
 * - parseSize("1MiB") → 1048576
 */
inline std::uintmax_t parseSize(const std::string &text) {
  size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
    ++pos;

  std::uintmax_t value = 0;
  size_t digits = 0;
  const std::uintmax_t max = std::numeric_limits<std::uintmax_t>::max();
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    unsigned digit = static_cast<unsigned>(text[pos] - '0');
    if (value > (max - digit) / 10)
      throw std::invalid_argument("size out of range: " + text);
    value = value * 10 + digit;
    ++pos;
    ++digits;
  }
  if (digits == 0)
    throw std::invalid_argument("invalid size: '" + text + "'");

  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
    ++pos;

  std::string unit;
  for (; pos < text.size(); ++pos) {
    if (std::isspace(static_cast<unsigned char>(text[pos])))
      break;
    unit += static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos])));
  }
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
    ++pos;
  if (pos != text.size())
    throw std::invalid_argument("invalid size: '" + text + "'");

  std::uintmax_t base = 1024;
  int exponent = 0;
  if (unit.empty() || unit == "B") {
    exponent = 0;
  } else {
    const std::string prefixes = "KMGT";
    auto index = prefixes.find(unit[0]);
    if (index == std::string::npos)
      throw std::invalid_argument("unknown size unit: '" + unit + "'");
    exponent = static_cast<int>(index) + 1;

    std::string suffix = unit.substr(1);
    if (suffix.empty() || suffix == "IB")
      base = 1024;
    else if (suffix == "B")
      base = 1000;
    else
      throw std::invalid_argument("unknown size unit: '" + unit + "'");
  }

  for (int i = 0; i < exponent; ++i) {
    if (value > max / base)
      throw std::invalid_argument("size out of range: " + text);
    value *= base;
  }
  return value;
}

#endif // UTILS_HPP