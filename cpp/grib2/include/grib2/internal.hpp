#pragma once

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace grib2 {

namespace internal {

constexpr uint64_t IdentificationSectionLength = 21;
constexpr int64_t MissingScaleFactor = -127;

inline std::string ToHex(uint8_t byte) {
  std::string result{2, '\0'};
  result[0] = "0123456789ABCDEF"[(uint8_t(byte) >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[uint8_t(byte) & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using grib2::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

template <typename T>
inline void Append(std::vector<T>& to, const std::vector<T>& from) {
  to.insert(to.end(), from.begin(), from.end());
}

// Big-endian readers. GRIB2 stores every multi-octet quantity most significant
// octet first.

inline uint16_t ParseUint16(const std::byte* data) {
  return uint16_t((uint16_t(data[0]) << 8) | uint16_t(data[1]));
}

inline uint32_t ParseUint24(const std::byte* data) {
  return (uint32_t(data[0]) << 16) | (uint32_t(data[1]) << 8) | uint32_t(data[2]);
}

inline uint32_t ParseUint32(const std::byte* data) {
  return (uint32_t(data[0]) << 24) | (uint32_t(data[1]) << 16) | (uint32_t(data[2]) << 8) |
         uint32_t(data[3]);
}

inline uint64_t ParseUint64(const std::byte* data) {
  return (uint64_t(data[0]) << 56) | (uint64_t(data[1]) << 48) | (uint64_t(data[2]) << 40) |
         (uint64_t(data[3]) << 32) | (uint64_t(data[4]) << 24) | (uint64_t(data[5]) << 16) |
         (uint64_t(data[6]) << 8) | uint64_t(data[7]);
}

inline Status ParseUint32(const std::byte* data, uint64_t maxSize, uint32_t* output) {
  if (maxSize < 4) {
    const auto msg = StrCat("cannot read uint32 from ", maxSize, " bytes");
    return Status{StatusCode::InvalidSection, msg};
  }
  *output = ParseUint32(data);
  return StatusCode::Success;
}

/**
 * @brief Reads an unsigned integer of `width` octets (1 to 8).
 */
inline uint64_t ParseUnsigned(const std::byte* data, size_t width) {
  uint64_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value = (value << 8) | uint64_t(data[i]);
  }
  return value;
}

/**
 * @brief Reads a sign-magnitude integer of `width` octets: the most significant
 * bit is the sign and the remaining bits are the magnitude.
 */
inline int64_t ParseSignMagnitude(const std::byte* data, size_t width) {
  const uint64_t raw = ParseUnsigned(data, width);
  const uint64_t signBit = uint64_t(1) << (width * 8 - 1);
  const int64_t magnitude = int64_t(raw & (signBit - 1));
  return (raw & signBit) ? -magnitude : magnitude;
}

/**
 * @brief Largest magnitude representable in `width` octets, signed or not.
 */
inline uint64_t MaxMagnitude(size_t width, bool isSigned) {
  const size_t bits = width * 8 - (isSigned ? 1 : 0);
  return bits >= 64 ? std::numeric_limits<uint64_t>::max() : (uint64_t(1) << bits) - 1;
}

inline void WriteUnsigned(uint64_t value, size_t width, std::byte* output) {
  for (size_t i = 0; i < width; ++i) {
    output[width - 1 - i] = std::byte(value & 0xFF);
    value >>= 8;
  }
}

inline void WriteSignMagnitude(int64_t value, size_t width, std::byte* output) {
  const uint64_t signBit = uint64_t(1) << (width * 8 - 1);
  const uint64_t magnitude = value < 0 ? uint64_t(-value) : uint64_t(value);
  WriteUnsigned(value < 0 ? (magnitude | signBit) : magnitude, width, output);
}

inline float IeeeToFloat(uint32_t bits) {
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

inline uint32_t FloatToIeee(float value) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  return bits;
}

inline double Pow10(int64_t exponent) {
  return std::pow(10.0, double(exponent));
}

/**
 * @brief Finds the smallest decimal scale factor (0-9) such that
 * `value * 10^scale` is integral, mirroring how GRIB2 encoders choose scale
 * factors for fixed-surface values and thresholds.
 */
inline int64_t DecimalScaleFor(double value) {
  for (int64_t scale = 0; scale < 10; ++scale) {
    const double scaled = value * Pow10(scale);
    if (std::fabs(scaled - std::round(scaled)) < 1e-6 * std::max(1.0, std::fabs(scaled))) {
      return scale;
    }
  }
  return 9;
}

inline bool IsMagic(const std::byte* data) {
  return std::memcmp(data, Magic, sizeof(Magic)) == 0;
}

inline bool IsTrailer(const std::byte* data) {
  return std::memcmp(data, Trailer, sizeof(Trailer)) == 0;
}

/**
 * @brief Renders four bytes for error messages, printable ASCII as-is and
 * anything else as hex.
 */
inline std::string TagToString(const std::byte* data) {
  std::string result;
  for (size_t i = 0; i < 4; ++i) {
    const auto c = uint8_t(data[i]);
    if (c >= 0x20 && c < 0x7F) {
      result.push_back(char(c));
    } else {
      result += "\\x" + ToHex(c);
    }
  }
  return result;
}

}  // namespace internal

}  // namespace grib2
