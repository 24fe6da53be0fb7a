#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace grib2 {

/**
 * @brief How a named field is computed from the raw integer array.
 */
enum struct FieldCodec : uint8_t {
  /// raw[index]
  Integer,
  /// raw[index] / 10^raw[secondary]; a scale factor of -127 means 0.0
  Scaled,
  /// raw[index] holds the bits of an IEEE-754 single precision float
  IeeeFloat,
  /// latitude or longitude in degrees, scaled by the grid's angle units
  Coordinate,
  /// grid length in X, scaled by the grid's length units, sign-corrected
  GridLengthX,
  /// grid length in Y, scaled by the grid's length units, sign-corrected
  GridLengthY,
  /// raw[index] in units of code table 4.4 value raw[secondary], as seconds
  TimeSeconds,
  /// Earth radius or axes derived from the shape of the Earth at raw[index]
  EarthRadius,
  EarthMajorAxis,
  EarthMinorAxis,
};

/**
 * @brief A named field of a template.
 */
struct GRIB2_PUBLIC FieldSpec {
  std::string_view name;
  int16_t index;
  int16_t secondary = -1;
  FieldCodec codec = FieldCodec::Integer;
  std::string_view unit;

  bool writable() const;
};

/**
 * @brief Raw indices of the fields every grid definition template shares. An
 * index of -1 means the template does not carry that field.
 */
struct GRIB2_PUBLIC GridCommon {
  int16_t shapeOfEarth = -1;
  int16_t nx = -1;
  int16_t ny = -1;
  int16_t basicAngle = -1;
  int16_t basicAngleSubdivisions = -1;
  int16_t latitudeFirst = -1;
  int16_t longitudeFirst = -1;
  int16_t latitudeLast = -1;
  int16_t longitudeLast = -1;
  int16_t scanModeFlags = -1;
  /// Coordinates are in units of basicAngle / basicAngleSubdivisions degrees.
  bool angularUnits = false;
  /// Grid lengths take the direction of travel from first to last gridpoint.
  bool signedLengths = false;
};

/**
 * @brief Raw indices of the fields every product definition template shares.
 */
struct GRIB2_PUBLIC ProductCommon {
  int16_t parameterCategory = 0;
  int16_t parameterNumber = 1;
  int16_t typeOfGeneratingProcess = -1;
  int16_t generatingProcess = -1;
  int16_t unitOfForecastTime = -1;
  int16_t valueOfForecastTime = -1;
  int16_t typeOfFirstFixedSurface = -1;
  int16_t typeOfSecondFixedSurface = -1;
  /// First of the six end-of-period fields (year..second), statistical templates only.
  int16_t endOfPeriod = -1;
  int16_t unitOfTimeRange = -1;
  int16_t lengthOfTimeRange = -1;
};

/**
 * @brief Raw indices of the fields every data representation template shares.
 */
struct GRIB2_PUBLIC RepresentationCommon {
  int16_t referenceValue = -1;
  int16_t binaryScaleFactor = -1;
  int16_t decimalScaleFactor = -1;
  int16_t bitsPerValue = -1;
  int16_t typeOfValues = -1;
};

/**
 * @brief A block of octets repeated after the fixed part of a template. The
 * repeat count is `raw[countIndex] + countAdjust`.
 */
struct GRIB2_PUBLIC TemplateExtension {
  int16_t countIndex;
  int16_t countAdjust;
  std::vector<int8_t> block;
};

/**
 * @brief Describes the payload of one template: the octet width of every raw
 * element (negative widths are sign-magnitude integers), its named fields and
 * the indices of the fields it shares with the other templates of its section.
 */
struct GRIB2_PUBLIC TemplateLayout {
  SectionKind kind;
  TemplateNumber number;
  std::string_view description;
  std::vector<int8_t> octets;
  std::vector<FieldSpec> fields;
  std::optional<TemplateExtension> extension;
  std::variant<GridCommon, ProductCommon, RepresentationCommon> common;

  size_t fixedFieldCount() const;
  uint64_t fixedByteLength() const;
  const FieldSpec* field(std::string_view name) const;

  const GridCommon* grid() const;
  const ProductCommon* product() const;
  const RepresentationCommon* representation() const;
};

/**
 * @brief Static table of every supported template, keyed by section kind and
 * template number. Built once on first use.
 */
class GRIB2_PUBLIC TemplateRegistry final {
public:
  static const TemplateRegistry& Instance();

  /**
   * @brief Look up a template layout. Returns nullptr for unregistered
   * templates.
   */
  const TemplateLayout* find(SectionKind kind, TemplateNumber number) const;
  /**
   * @brief Template numbers registered for one section kind, ascending.
   */
  std::vector<TemplateNumber> templateNumbers(SectionKind kind) const;

  TemplateRegistry(const TemplateRegistry&) = delete;
  TemplateRegistry& operator=(const TemplateRegistry&) = delete;

private:
  TemplateRegistry();

  void add(TemplateLayout layout);

  std::map<std::pair<SectionKind, TemplateNumber>, TemplateLayout> layouts_;
};

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "templates.inl"
#endif
