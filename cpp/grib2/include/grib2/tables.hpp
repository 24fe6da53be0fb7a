#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace grib2 {

/**
 * @brief Names and units of a physical parameter (code table 4.2).
 */
struct GRIB2_PUBLIC ParameterName {
  std::string fullName;
  std::string units;
  std::string shortName;
};

/**
 * @brief Resolves (discipline, category, number) triples to parameter names.
 * The library only consumes this interface; applications plug in whatever
 * tables they need.
 */
struct GRIB2_PUBLIC IParameterTable {
  virtual ~IParameterTable() = default;

  virtual std::optional<ParameterName> lookupParameterName(uint8_t discipline, uint8_t category,
                                                           uint8_t number) const = 0;
};

/**
 * @brief An in-memory IParameterTable.
 */
class GRIB2_PUBLIC ParameterTable final : public IParameterTable {
public:
  ParameterTable() = default;

  /**
   * @brief A table preloaded with commonly used entries of WMO code table 4.2
   * (meteorological, hydrological and oceanographic products).
   */
  static ParameterTable Wmo();

  void add(const ParameterIdentity& identity, ParameterName name);
  size_t size() const;

  std::optional<ParameterName> lookupParameterName(uint8_t discipline, uint8_t category,
                                                   uint8_t number) const override;

private:
  std::map<std::tuple<uint8_t, uint8_t, uint8_t>, ParameterName> names_;
};

/**
 * @brief Length in seconds of one unit of WMO code table 4.4, or std::nullopt
 * for units without a fixed length (months, years, ...) and unknown codes.
 */
GRIB2_PUBLIC
std::optional<int64_t> TimeUnitSeconds(int64_t unit);

/**
 * @brief Dimensions of the Earth model of code table 3.2, in meters.
 */
struct GRIB2_PUBLIC EarthShape {
  double majorAxis = 0.0;
  double minorAxis = 0.0;

  bool spherical() const {
    return majorAxis == minorAxis;
  }
};

/**
 * @brief Returns the Earth model for shapes with fixed dimensions. Shapes 1, 3
 * and 7 take their dimensions from the grid template and return std::nullopt
 * here, as do reserved and missing codes.
 */
GRIB2_PUBLIC
std::optional<EarthShape> PredefinedEarthShape(int64_t shapeOfEarth);

/**
 * @brief Human readable description of a fixed surface (code table 4.5) and its
 * value, e.g. "500 mb", "2 m above ground" or "surface".
 */
GRIB2_PUBLIC
std::string LevelDescription(int64_t typeOfSurface, double value);

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "tables.inl"
#endif
