/**
 * @file utils.hpp
 * @brief Small helpers shared by the SafeStore library and CLI
 *
 * Key utilities:
 * - randomHexString: collision-resistant tags for run directories and
 *   retired file names
 * - formatBytes: human-readable sizes printed by the CLI `size` command
 *
 * @see randomHexString()
 * @see formatBytes()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

/**
 * @brief Generates a random lowercase hex string
 *
 * Draws from a per-thread std::mt19937_64 seeded once from
 * std::random_device. Each output byte becomes two hex characters, so
 * randomHexString(16) yields 32 characters (128 random bits).
 *
 * @param bytes Number of random bytes to render
 *
 * @return std::string Hex string of length 2 * bytes
 *
 * @note Not suitable for cryptographic secrets, only for unique names
 */
inline std::string randomHexString(size_t bytes) {
  static thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();

  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes * 2);

  uint64_t pool = 0;
  for (size_t i = 0; i < bytes; ++i) {
    if (i % 8 == 0)
      pool = engine();
    auto byte = static_cast<unsigned>(pool & 0xff);
    pool >>= 8;
    out += digits[byte >> 4];
    out += digits[byte & 0x0f];
  }
  return out;
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * The CLI `size` command prints it next to the exact byte count reported
 * by SafeFileOps::fileSizeOfPath(). Uses binary units (1024 bytes = 1 KB) and one decimal place.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 */
inline std::string formatBytes(uintmax_t bytes) {
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

#endif // UTILS_HPP
