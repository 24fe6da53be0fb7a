#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace grib2 {

#define GRIB2_LIBRARY_VERSION "0.1.0"

using ByteOffset = uint64_t;
using ByteArray = std::vector<std::byte>;
using TemplateNumber = uint16_t;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char LibraryVersion[] = GRIB2_LIBRARY_VERSION;
constexpr uint8_t Magic[] = {'G', 'R', 'I', 'B'};
constexpr uint8_t Trailer[] = {'7', '7', '7', '7'};
constexpr uint8_t Edition = 2;
constexpr uint8_t LegacyEdition = 1;
constexpr uint64_t IndicatorSectionLength = 16;
constexpr uint64_t SectionHeaderLength = 5;
constexpr uint64_t DefaultScanWindow = 2048;
/// Sections 0 through 7 plus the "7777" end section.
constexpr size_t SectionSlots = 9;

/**
 * @brief GRIB2 section numbers.
 */
enum struct SectionKind : uint8_t {
  Indicator = 0,
  Identification = 1,
  LocalUse = 2,
  GridDefinition = 3,
  ProductDefinition = 4,
  DataRepresentation = 5,
  Bitmap = 6,
  Data = 7,
  End = 8,
};

/**
 * @brief Get the string representation of a SectionKind.
 */
GRIB2_PUBLIC
std::string_view SectionKindString(SectionKind kind);

/**
 * @brief Values of the section 6 bitmap indicator octet (code table 6.0).
 */
enum struct BitmapIndicator : uint8_t {
  Follows = 0,
  Reuse = 254,
  None = 255,
};

/**
 * @brief Byte range of one section within the stream.
 */
struct GRIB2_PUBLIC SectionOffset {
  uint8_t sectionNumber = 0;
  ByteOffset byteOffset = 0;
  uint64_t byteLength = 0;

  ByteOffset end() const {
    return byteOffset + byteLength;
  }
};

/**
 * @brief Reference time of a message, decoded from section 1.
 */
struct GRIB2_PUBLIC ReferenceDate {
  uint16_t year = 0;
  uint8_t month = 0;
  uint8_t day = 0;
  uint8_t hour = 0;
  uint8_t minute = 0;
  uint8_t second = 0;

  /**
   * @brief Seconds since 1970-01-01T00:00:00 in the proleptic Gregorian calendar.
   */
  int64_t epochSeconds() const;
  /**
   * @brief Formats the date as "YYYY-MM-DDTHH:MM:SS".
   */
  std::string isoString() const;

  static ReferenceDate FromEpochSeconds(int64_t seconds);

  bool operator==(const ReferenceDate& other) const;
  bool operator!=(const ReferenceDate& other) const;
};

/**
 * @brief Identifies the physical parameter of a message (code table 4.2).
 */
struct GRIB2_PUBLIC ParameterIdentity {
  uint8_t discipline = 0;
  uint8_t category = 0;
  uint8_t number = 0;

  bool operator==(const ParameterIdentity& other) const;
  bool operator!=(const ParameterIdentity& other) const;
};

/**
 * @brief The packed bitmap bits of a section 6 whose indicator is 0.
 */
struct GRIB2_PUBLIC Bitmap {
  SectionOffset section;
  ByteArray bytes;
};

using BitmapPtr = std::shared_ptr<const Bitmap>;

/**
 * @brief Location and lightweight metadata of one GRIB2 field. A message that
 * repeats sections 2-7 produces one MessageLocation per data section; all of
 * them share the message's file offset and declared length.
 */
struct GRIB2_PUBLIC MessageLocation {
  ByteOffset fileOffset = 0;
  uint64_t declaredTotalLength = 0;
  uint8_t discipline = 0;
  uint8_t edition = Edition;
  uint32_t messageNumber = 0;
  bool isSubmessage = false;
  std::optional<uint8_t> submessageBeginSection;
  std::optional<ByteOffset> submessageOffset;
  std::array<std::optional<SectionOffset>, SectionSlots> sectionOffsets;
  ReferenceDate referenceDate;
  ParameterIdentity parameterIdentity;
  uint32_t gridPointCount = 0;
  TemplateNumber gridTemplateNumber = 0;
  TemplateNumber productTemplateNumber = 0;
  TemplateNumber representationTemplateNumber = 0;
  uint32_t numberOfPackedValues = 0;
  uint8_t bitmapIndicator = uint8_t(BitmapIndicator::None);
  /**
   * @brief Set when this field's section 6 carries its own bitmap.
   */
  BitmapPtr bitmap;
  /**
   * @brief Set when this field's section 6 reuses the bitmap of an earlier field.
   */
  std::weak_ptr<const Bitmap> carriedBitmap;

  const std::optional<SectionOffset>& section(SectionKind kind) const;
  /**
   * @brief Returns the bitmap that applies to this field: its own, the carried
   * one if it is still alive, or nullptr.
   */
  BitmapPtr resolveBitmap() const;
  ByteOffset endOffset() const {
    return fileOffset + declaredTotalLength;
  }
};

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "types.inl"
#endif
