#include "internal.hpp"
#include <cmath>
#include <cstdio>

namespace grib2 {

// ParameterTable //////////////////////////////////////////////////////////////

ParameterTable ParameterTable::Wmo() {
  ParameterTable table;
  // Discipline 0, meteorological products
  table.add({0, 0, 0}, {"Temperature", "K", "TMP"});
  table.add({0, 0, 2}, {"Potential Temperature", "K", "POT"});
  table.add({0, 0, 4}, {"Maximum Temperature", "K", "TMAX"});
  table.add({0, 0, 5}, {"Minimum Temperature", "K", "TMIN"});
  table.add({0, 0, 6}, {"Dew Point Temperature", "K", "DPT"});
  table.add({0, 1, 0}, {"Specific Humidity", "kg/kg", "SPFH"});
  table.add({0, 1, 1}, {"Relative Humidity", "%", "RH"});
  table.add({0, 1, 3}, {"Precipitable Water", "kg/m^2", "PWAT"});
  table.add({0, 1, 8}, {"Total Precipitation", "kg/m^2", "APCP"});
  table.add({0, 1, 13}, {"Water Equivalent of Accumulated Snow Depth", "kg/m^2", "WEASD"});
  table.add({0, 2, 0}, {"Wind Direction (from which blowing)", "degree true", "WDIR"});
  table.add({0, 2, 1}, {"Wind Speed", "m/s", "WIND"});
  table.add({0, 2, 2}, {"U-Component of Wind", "m/s", "UGRD"});
  table.add({0, 2, 3}, {"V-Component of Wind", "m/s", "VGRD"});
  table.add({0, 2, 8}, {"Vertical Velocity (Pressure)", "Pa/s", "VVEL"});
  table.add({0, 2, 10}, {"Absolute Vorticity", "1/s", "ABSV"});
  table.add({0, 2, 22}, {"Wind Speed (Gust)", "m/s", "GUST"});
  table.add({0, 3, 0}, {"Pressure", "Pa", "PRES"});
  table.add({0, 3, 1}, {"Pressure Reduced to MSL", "Pa", "PRMSL"});
  table.add({0, 3, 5}, {"Geopotential Height", "gpm", "HGT"});
  table.add({0, 6, 1}, {"Total Cloud Cover", "%", "TCDC"});
  table.add({0, 7, 6}, {"Convective Available Potential Energy", "J/kg", "CAPE"});
  table.add({0, 7, 7}, {"Convective Inhibition", "J/kg", "CIN"});
  table.add({0, 16, 196}, {"Composite reflectivity", "dB", "REFC"});
  table.add({0, 19, 0}, {"Visibility", "m", "VIS"});
  // Discipline 1, hydrological products
  table.add({1, 0, 5}, {"Baseflow-Groundwater Runoff", "kg/m^2", "BGRUN"});
  table.add({1, 1, 2}, {"Probability of Frozen Precipitation", "%", "CPOFP"});
  // Discipline 2, land surface products
  table.add({2, 0, 0}, {"Land Cover (0=sea, 1=land)", "Proportion", "LAND"});
  table.add({2, 0, 7}, {"Model Terrain Height", "m", "MTERH"});
  // Discipline 10, oceanographic products
  table.add({10, 0, 3}, {"Significant Height of Combined Wind Waves and Swell", "m", "HTSGW"});
  table.add({10, 2, 0}, {"Ice Cover", "Proportion", "ICEC"});
  table.add({10, 3, 0}, {"Water Temperature", "K", "WTMP"});
  return table;
}

void ParameterTable::add(const ParameterIdentity& identity, ParameterName name) {
  names_[std::make_tuple(identity.discipline, identity.category, identity.number)] =
    std::move(name);
}

size_t ParameterTable::size() const {
  return names_.size();
}

std::optional<ParameterName> ParameterTable::lookupParameterName(uint8_t discipline,
                                                                 uint8_t category,
                                                                 uint8_t number) const {
  const auto it = names_.find(std::make_tuple(discipline, category, number));
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Code tables /////////////////////////////////////////////////////////////////

std::optional<int64_t> TimeUnitSeconds(int64_t unit) {
  switch (unit) {
    case 0:
      return 60;
    case 1:
      return 3600;
    case 2:
      return 86400;
    case 10:
      return 3 * 3600;
    case 11:
      return 6 * 3600;
    case 12:
      return 12 * 3600;
    case 13:
      return 1;
    default:
      return std::nullopt;
  }
}

std::optional<EarthShape> PredefinedEarthShape(int64_t shapeOfEarth) {
  switch (shapeOfEarth) {
    case 0:
      return EarthShape{6367470.0, 6367470.0};
    case 2:
      return EarthShape{6378160.0, 6356775.0};
    case 4:
      return EarthShape{6378137.0, 6356752.314};
    case 5:
      return EarthShape{6378137.0, 6356752.3142};
    case 6:
      return EarthShape{6371229.0, 6371229.0};
    case 8:
      return EarthShape{6371200.0, 6371200.0};
    case 9:
      return EarthShape{6377563.396, 6356256.909};
    default:
      return std::nullopt;
  }
}

static std::string FormatLevelValue(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%g", value);
  return buffer;
}

std::string LevelDescription(int64_t typeOfSurface, double value) {
  switch (typeOfSurface) {
    case 1:
      return "surface";
    case 2:
      return "cloud base";
    case 3:
      return "cloud top";
    case 4:
      return "0C isotherm";
    case 6:
      return "max wind";
    case 7:
      return "tropopause";
    case 8:
      return "top of atmosphere";
    case 100:
      return FormatLevelValue(value / 100.0) + " mb";
    case 101:
      return "mean sea level";
    case 102:
      return FormatLevelValue(value) + " m above mean sea level";
    case 103:
      return FormatLevelValue(value) + " m above ground";
    case 104:
      return FormatLevelValue(value) + " sigma level";
    case 105:
      return FormatLevelValue(value) + " hybrid level";
    case 106:
      return FormatLevelValue(value) + " m below ground";
    case 107:
      return FormatLevelValue(value) + " K isentropic level";
    case 108:
      return FormatLevelValue(value / 100.0) + " mb above ground";
    case 109:
      return FormatLevelValue(value) + " PV level";
    case 200:
      return "entire atmosphere";
    default:
      return internal::StrCat("level type ", typeOfSurface, " ", FormatLevelValue(value));
  }
}

}  // namespace grib2
