#include "internal.hpp"
#include <cstdio>

namespace grib2 {

std::string_view SectionKindString(SectionKind kind) {
  switch (kind) {
    case SectionKind::Indicator:
      return "Indicator";
    case SectionKind::Identification:
      return "Identification";
    case SectionKind::LocalUse:
      return "LocalUse";
    case SectionKind::GridDefinition:
      return "GridDefinition";
    case SectionKind::ProductDefinition:
      return "ProductDefinition";
    case SectionKind::DataRepresentation:
      return "DataRepresentation";
    case SectionKind::Bitmap:
      return "Bitmap";
    case SectionKind::Data:
      return "Data";
    case SectionKind::End:
      return "End";
    default:
      return "Unknown";
  }
}

// ReferenceDate ///////////////////////////////////////////////////////////////

// Civil date <-> day number conversions from Howard Hinnant's date algorithms.
static int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = unsigned(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + int64_t(doe) - 719468;
}

int64_t ReferenceDate::epochSeconds() const {
  const int64_t days = DaysFromCivil(year, month, day);
  return days * 86400 + int64_t(hour) * 3600 + int64_t(minute) * 60 + int64_t(second);
}

std::string ReferenceDate::isoString() const {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04u-%02u-%02uT%02u:%02u:%02u", unsigned(year),
                unsigned(month), unsigned(day), unsigned(hour), unsigned(minute), unsigned(second));
  return buffer;
}

ReferenceDate ReferenceDate::FromEpochSeconds(int64_t seconds) {
  int64_t days = seconds / 86400;
  int64_t secondOfDay = seconds % 86400;
  if (secondOfDay < 0) {
    secondOfDay += 86400;
    days -= 1;
  }

  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = unsigned(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const int64_t y = int64_t(yoe) + era * 400 + (m <= 2);

  ReferenceDate date;
  date.year = uint16_t(y);
  date.month = uint8_t(m);
  date.day = uint8_t(d);
  date.hour = uint8_t(secondOfDay / 3600);
  date.minute = uint8_t((secondOfDay % 3600) / 60);
  date.second = uint8_t(secondOfDay % 60);
  return date;
}

bool ReferenceDate::operator==(const ReferenceDate& other) const {
  return year == other.year && month == other.month && day == other.day && hour == other.hour &&
         minute == other.minute && second == other.second;
}

bool ReferenceDate::operator!=(const ReferenceDate& other) const {
  return !(*this == other);
}

// ParameterIdentity ///////////////////////////////////////////////////////////

bool ParameterIdentity::operator==(const ParameterIdentity& other) const {
  return discipline == other.discipline && category == other.category && number == other.number;
}

bool ParameterIdentity::operator!=(const ParameterIdentity& other) const {
  return !(*this == other);
}

// MessageLocation /////////////////////////////////////////////////////////////

const std::optional<SectionOffset>& MessageLocation::section(SectionKind kind) const {
  return sectionOffsets[size_t(kind)];
}

BitmapPtr MessageLocation::resolveBitmap() const {
  if (bitmap) {
    return bitmap;
  }
  return carriedBitmap.lock();
}

}  // namespace grib2
