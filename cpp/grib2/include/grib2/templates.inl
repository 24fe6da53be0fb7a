#include "internal.hpp"
#include <algorithm>

namespace grib2 {

namespace {

using Octets = std::vector<int8_t>;
using Fields = std::vector<FieldSpec>;

// Grid definition templates (section 3) ///////////////////////////////////////

// Octets 15-30 of section 3: shape of the Earth and the grid dimensions.
const Octets EarthShapeOctets = {1, 1, 4, 1, 4, 1, 4, 4, 4};

Fields EarthShapeFields() {
  return {
    {"shapeOfEarth", 0},
    {"scaleFactorOfRadiusOfSphericalEarth", 1},
    {"scaledValueOfRadiusOfSphericalEarth", 2},
    {"scaleFactorOfEarthMajorAxis", 3},
    {"scaledValueOfEarthMajorAxis", 4},
    {"scaleFactorOfEarthMinorAxis", 5},
    {"scaledValueOfEarthMinorAxis", 6},
    {"nx", 7},
    {"ny", 8},
    {"earthRadius", 0, -1, FieldCodec::EarthRadius, "m"},
    {"earthMajorAxis", 0, -1, FieldCodec::EarthMajorAxis, "m"},
    {"earthMinorAxis", 0, -1, FieldCodec::EarthMinorAxis, "m"},
  };
}

TemplateLayout LatLonLayout(TemplateNumber number, std::string_view description, bool gaussian) {
  TemplateLayout layout{SectionKind::GridDefinition, number, description};
  layout.octets = EarthShapeOctets;
  internal::Append(layout.octets, {4, 4, -4, 4, 1, -4, 4, 4, 4, 1});
  layout.fields = EarthShapeFields();
  internal::Append(layout.fields, {
                          {"basicAngleOfTheInitialProductionDomain", 9},
                          {"basicAngleSubdivisions", 10},
                          {"latitudeFirstGridpoint", 11, -1, FieldCodec::Coordinate, "degrees"},
                          {"longitudeFirstGridpoint", 12, -1, FieldCodec::Coordinate, "degrees"},
                          {"resolutionAndComponentFlags", 13},
                          {"latitudeLastGridpoint", 14, -1, FieldCodec::Coordinate, "degrees"},
                          {"longitudeLastGridpoint", 15, -1, FieldCodec::Coordinate, "degrees"},
                          {"gridlengthXDirection", 16, -1, FieldCodec::GridLengthX, "degrees"},
                          {"scanModeFlags", 18},
                        });
  if (gaussian) {
    layout.fields.push_back({"numberOfParallelsBetweenPoleAndEquator", 17});
  } else {
    layout.fields.push_back({"gridlengthYDirection", 17, -1, FieldCodec::GridLengthY, "degrees"});
  }

  GridCommon common;
  common.shapeOfEarth = 0;
  common.nx = 7;
  common.ny = 8;
  common.basicAngle = 9;
  common.basicAngleSubdivisions = 10;
  common.latitudeFirst = 11;
  common.longitudeFirst = 12;
  common.latitudeLast = 14;
  common.longitudeLast = 15;
  common.scanModeFlags = 18;
  common.angularUnits = true;
  common.signedLengths = true;
  layout.common = common;
  return layout;
}

void AddRotation(TemplateLayout& layout) {
  internal::Append(layout.octets, {-4, 4, 4});
  internal::Append(layout.fields, {
                          {"latitudeSouthernPole", 19, -1, FieldCodec::Coordinate, "degrees"},
                          {"longitudeSouthernPole", 20, -1, FieldCodec::Coordinate, "degrees"},
                          {"anglePoleRotation", 21},
                        });
}

// Arakawa staggered rotated latitude/longitude grids (NCEP local templates).
// Octets 14-15 hold the center gridpoint rather than the last one.
TemplateLayout StaggeredLayout(TemplateNumber number, std::string_view description) {
  TemplateLayout layout = LatLonLayout(number, description, false);
  for (auto& field : layout.fields) {
    if (field.index == 14 && field.codec == FieldCodec::Coordinate) {
      field.name = "latitudeCenterGridpoint";
    } else if (field.index == 15 && field.codec == FieldCodec::Coordinate) {
      field.name = "longitudeCenterGridpoint";
    }
  }
  return layout;
}

TemplateLayout ProjectedLayout(TemplateNumber number, std::string_view description) {
  TemplateLayout layout{SectionKind::GridDefinition, number, description};
  layout.octets = EarthShapeOctets;
  layout.fields = EarthShapeFields();
  internal::Append(layout.fields, {
                          {"latitudeFirstGridpoint", 9, -1, FieldCodec::Coordinate, "degrees"},
                          {"longitudeFirstGridpoint", 10, -1, FieldCodec::Coordinate, "degrees"},
                          {"resolutionAndComponentFlags", 11},
                          {"latitudeTrueScale", 12, -1, FieldCodec::Coordinate, "degrees"},
                        });

  GridCommon common;
  common.shapeOfEarth = 0;
  common.nx = 7;
  common.ny = 8;
  common.latitudeFirst = 9;
  common.longitudeFirst = 10;
  layout.common = common;
  return layout;
}

TemplateLayout MercatorLayout() {
  TemplateLayout layout = ProjectedLayout(10, "Mercator");
  internal::Append(layout.octets, {-4, 4, 1, -4, -4, 4, 1, 4, 4, 4});
  internal::Append(layout.fields, {
                          {"latitudeLastGridpoint", 13, -1, FieldCodec::Coordinate, "degrees"},
                          {"longitudeLastGridpoint", 14, -1, FieldCodec::Coordinate, "degrees"},
                          {"scanModeFlags", 15},
                          {"gridOrientation", 16, -1, FieldCodec::Coordinate, "degrees"},
                          {"gridlengthXDirection", 17, -1, FieldCodec::GridLengthX, "m"},
                          {"gridlengthYDirection", 18, -1, FieldCodec::GridLengthY, "m"},
                        });
  auto& common = std::get<GridCommon>(layout.common);
  common.latitudeLast = 13;
  common.longitudeLast = 14;
  common.scanModeFlags = 15;
  return layout;
}

TemplateLayout PolarStereographicLayout(TemplateNumber number, std::string_view description) {
  TemplateLayout layout = ProjectedLayout(number, description);
  internal::Append(layout.octets, {-4, 4, 1, -4, 4, 4, 4, 1, 1});
  internal::Append(layout.fields, {
                          {"gridOrientation", 13, -1, FieldCodec::Coordinate, "degrees"},
                          {"gridlengthXDirection", 14, -1, FieldCodec::GridLengthX, "m"},
                          {"gridlengthYDirection", 15, -1, FieldCodec::GridLengthY, "m"},
                          {"projectionCenterFlag", 16},
                          {"scanModeFlags", 17},
                        });
  std::get<GridCommon>(layout.common).scanModeFlags = 17;
  return layout;
}

TemplateLayout LambertLayout(TemplateNumber number, std::string_view description) {
  TemplateLayout layout = PolarStereographicLayout(number, description);
  internal::Append(layout.octets, {-4, -4, -4, 4});
  internal::Append(layout.fields, {
                          {"standardLatitude1", 18, -1, FieldCodec::Coordinate, "degrees"},
                          {"standardLatitude2", 19, -1, FieldCodec::Coordinate, "degrees"},
                          {"latitudeSouthernPole", 20, -1, FieldCodec::Coordinate, "degrees"},
                          {"longitudeSouthernPole", 21, -1, FieldCodec::Coordinate, "degrees"},
                        });
  return layout;
}

TemplateLayout SphericalHarmonicLayout() {
  TemplateLayout layout{SectionKind::GridDefinition, 50, "Spherical harmonic coefficients"};
  layout.octets = {4, 4, 4, 1, 1};
  layout.fields = {
    {"pentagonalResolutionParameterJ", 0},
    {"pentagonalResolutionParameterK", 1},
    {"pentagonalResolutionParameterM", 2},
    {"spectralRepresentationType", 3},
    {"spectralRepresentationMode", 4},
  };
  layout.common = GridCommon{};
  return layout;
}

// Product definition templates (section 4) ////////////////////////////////////

Fields GeneratingProcessFields(int16_t at) {
  return {
    {"typeOfGeneratingProcess", at},
    {"backgroundGeneratingProcessIdentifier", int16_t(at + 1)},
    {"generatingProcess", int16_t(at + 2)},
    {"hoursAfterDataCutoff", int16_t(at + 3), -1, FieldCodec::Integer, "h"},
    {"minutesAfterDataCutoff", int16_t(at + 4), -1, FieldCodec::Integer, "min"},
    {"unitOfForecastTime", int16_t(at + 5)},
    {"valueOfForecastTime", int16_t(at + 6)},
    {"leadTime", int16_t(at + 6), int16_t(at + 5), FieldCodec::TimeSeconds, "s"},
  };
}

Fields FixedSurfaceFields(int16_t at) {
  return {
    {"typeOfFirstFixedSurface", at},
    {"scaleFactorOfFirstFixedSurface", int16_t(at + 1)},
    {"scaledValueOfFirstFixedSurface", int16_t(at + 2)},
    {"valueOfFirstFixedSurface", int16_t(at + 2), int16_t(at + 1), FieldCodec::Scaled},
    {"typeOfSecondFixedSurface", int16_t(at + 3)},
    {"scaleFactorOfSecondFixedSurface", int16_t(at + 4)},
    {"scaledValueOfSecondFixedSurface", int16_t(at + 5)},
    {"valueOfSecondFixedSurface", int16_t(at + 5), int16_t(at + 4), FieldCodec::Scaled},
  };
}

ProductCommon ProductPrefix(int16_t process, int16_t surfaces) {
  ProductCommon common;
  common.typeOfGeneratingProcess = process;
  common.generatingProcess = int16_t(process + 2);
  common.unitOfForecastTime = int16_t(process + 5);
  common.valueOfForecastTime = int16_t(process + 6);
  if (surfaces >= 0) {
    common.typeOfFirstFixedSurface = surfaces;
    common.typeOfSecondFixedSurface = int16_t(surfaces + 3);
  }
  return common;
}

// Octets 10-34 of section 4, shared by the analysis/forecast family of templates.
TemplateLayout ProductLayout(TemplateNumber number, std::string_view description) {
  TemplateLayout layout{SectionKind::ProductDefinition, number, description};
  layout.octets = {1, 1, 1, 1, 1, 2, 1, 1, -4, 1, -1, -4, 1, -1, -4};
  layout.fields = {{"parameterCategory", 0}, {"parameterNumber", 1}};
  internal::Append(layout.fields, GeneratingProcessFields(2));
  internal::Append(layout.fields, FixedSurfaceFields(9));
  layout.common = ProductPrefix(2, 9);
  return layout;
}

void AddEnsemble(TemplateLayout& layout) {
  const auto at = int16_t(layout.octets.size());
  internal::Append(layout.octets, {1, 1, 1});
  internal::Append(layout.fields, {
                          {"typeOfEnsembleForecast", at},
                          {"perturbationNumber", int16_t(at + 1)},
                          {"numberOfEnsembleForecasts", int16_t(at + 2)},
                        });
}

void AddDerivedForecast(TemplateLayout& layout) {
  const auto at = int16_t(layout.octets.size());
  internal::Append(layout.octets, {1, 1});
  internal::Append(layout.fields, {
                          {"typeOfDerivedForecast", at},
                          {"numberOfEnsembleForecasts", int16_t(at + 1)},
                        });
}

void AddProbability(TemplateLayout& layout) {
  const auto at = int16_t(layout.octets.size());
  internal::Append(layout.octets, {1, 1, 1, -1, -4, -1, -4});
  internal::Append(layout.fields,
         {
           {"forecastProbabilityNumber", at},
           {"totalNumberOfForecastProbabilities", int16_t(at + 1)},
           {"typeOfProbability", int16_t(at + 2)},
           {"scaleFactorOfThresholdLowerLimit", int16_t(at + 3)},
           {"scaledValueOfThresholdLowerLimit", int16_t(at + 4)},
           {"scaleFactorOfThresholdUpperLimit", int16_t(at + 5)},
           {"scaledValueOfThresholdUpperLimit", int16_t(at + 6)},
           {"thresholdLowerLimit", int16_t(at + 4), int16_t(at + 3), FieldCodec::Scaled},
           {"thresholdUpperLimit", int16_t(at + 6), int16_t(at + 5), FieldCodec::Scaled},
         });
}

void AddPercentile(TemplateLayout& layout) {
  const auto at = int16_t(layout.octets.size());
  layout.octets.push_back(1);
  layout.fields.push_back({"percentileValue", at, -1, FieldCodec::Integer, "%"});
}

// End of the overall time interval followed by one time range specification.
// Further time ranges repeat the last six elements.
void AddStatisticalPeriod(TemplateLayout& layout) {
  const auto at = int16_t(layout.octets.size());
  internal::Append(layout.octets, {2, 1, 1, 1, 1, 1, 1, 4, 1, 1, 1, 4, 1, 4});
  internal::Append(layout.fields,
         {
           {"yearOfEndOfTimePeriod", at},
           {"monthOfEndOfTimePeriod", int16_t(at + 1)},
           {"dayOfEndOfTimePeriod", int16_t(at + 2)},
           {"hourOfEndOfTimePeriod", int16_t(at + 3)},
           {"minuteOfEndOfTimePeriod", int16_t(at + 4)},
           {"secondOfEndOfTimePeriod", int16_t(at + 5)},
           {"numberOfTimeRanges", int16_t(at + 6)},
           {"numberOfMissingValues", int16_t(at + 7)},
           {"statisticalProcess", int16_t(at + 8)},
           {"typeOfTimeIncrementOfStatisticalProcess", int16_t(at + 9)},
           {"unitOfTimeRangeOfStatisticalProcess", int16_t(at + 10)},
           {"timeRangeOfStatisticalProcess", int16_t(at + 11)},
           {"unitOfTimeRangeOfSuccessiveFields", int16_t(at + 12)},
           {"timeIncrementOfSuccessiveFields", int16_t(at + 13)},
           {"duration", int16_t(at + 11), int16_t(at + 10), FieldCodec::TimeSeconds, "s"},
         });
  layout.extension = TemplateExtension{int16_t(at + 6), -1, {1, 1, 1, 4, 1, 4}};

  auto& common = std::get<ProductCommon>(layout.common);
  common.endOfPeriod = at;
  common.unitOfTimeRange = int16_t(at + 10);
  common.lengthOfTimeRange = int16_t(at + 11);
}

TemplateLayout SpatialProcessingLayout() {
  TemplateLayout layout = ProductLayout(15, "Average, accumulation, extreme values or other "
                                            "statistically-processed values over a spatial area");
  internal::Append(layout.octets, {1, 1, 1});
  internal::Append(layout.fields, {
                          {"statisticalProcess", 15},
                          {"typeOfSpatialProcessing", 16},
                          {"numberOfDataPointsForSpatialProcessing", 17},
                        });
  return layout;
}

// Per-band satellite descriptors repeated numberOfContributingSpectralBands times.
const Octets SpectralBandOctets = {2, 2, 2, 1, -4};

TemplateLayout SatelliteLayout() {
  TemplateLayout layout{SectionKind::ProductDefinition, 31, "Satellite product"};
  layout.octets = {1, 1, 1, 1, 1};
  layout.fields = {
    {"parameterCategory", 0},
    {"parameterNumber", 1},
    {"typeOfGeneratingProcess", 2},
    {"observationGeneratingProcessIdentifier", 3},
    {"numberOfContributingSpectralBands", 4},
  };
  layout.extension = TemplateExtension{4, 0, SpectralBandOctets};
  ProductCommon common;
  common.typeOfGeneratingProcess = 2;
  layout.common = common;
  return layout;
}

TemplateLayout SimulatedSatelliteLayout() {
  TemplateLayout layout{SectionKind::ProductDefinition, 32,
                        "Analysis or forecast at a horizontal level or in a horizontal layer at a "
                        "point in time for simulated (synthetic) satellite data"};
  layout.octets = {1, 1, 1, 1, 1, 2, 1, 1, -4, 1};
  layout.fields = {{"parameterCategory", 0}, {"parameterNumber", 1}};
  internal::Append(layout.fields, GeneratingProcessFields(2));
  layout.fields.push_back({"numberOfContributingSpectralBands", 9});
  layout.extension = TemplateExtension{9, 0, SpectralBandOctets};
  layout.common = ProductPrefix(2, -1);
  return layout;
}

TemplateLayout AerosolOpticalLayout() {
  TemplateLayout layout{SectionKind::ProductDefinition, 48,
                        "Analysis or forecast at a horizontal level or in a horizontal layer at a "
                        "point in time for optical properties of aerosol"};
  layout.octets = {1, 1, 2, 1, -1, -4, -1, -4, 1, -1, -4, -1, -4};
  internal::Append(layout.octets, {1, 1, 1, 2, 1, 1, -4});
  internal::Append(layout.octets, {1, -1, -4, 1, -1, -4});
  layout.fields = {
    {"parameterCategory", 0},
    {"parameterNumber", 1},
    {"typeOfAerosol", 2},
    {"typeOfIntervalForAerosolSize", 3},
    {"scaleFactorOfFirstSize", 4},
    {"scaledValueOfFirstSize", 5},
    {"scaleFactorOfSecondSize", 6},
    {"scaledValueOfSecondSize", 7},
    {"typeOfIntervalForAerosolWavelength", 8},
    {"scaleFactorOfFirstWavelength", 9},
    {"scaledValueOfFirstWavelength", 10},
    {"scaleFactorOfSecondWavelength", 11},
    {"scaledValueOfSecondWavelength", 12},
    {"firstSize", 5, 4, FieldCodec::Scaled, "m"},
    {"secondSize", 7, 6, FieldCodec::Scaled, "m"},
    {"firstWavelength", 10, 9, FieldCodec::Scaled, "m"},
    {"secondWavelength", 12, 11, FieldCodec::Scaled, "m"},
  };
  internal::Append(layout.fields, GeneratingProcessFields(13));
  internal::Append(layout.fields, FixedSurfaceFields(20));
  layout.common = ProductPrefix(13, 20);
  return layout;
}

// Data representation templates (section 5) ///////////////////////////////////

TemplateLayout PackingLayout(TemplateNumber number, std::string_view description,
                             bool typeOfValues) {
  TemplateLayout layout{SectionKind::DataRepresentation, number, description};
  layout.octets = {4, -2, -2, 1};
  layout.fields = {
    {"referenceValue", 0, -1, FieldCodec::IeeeFloat},
    {"binaryScaleFactor", 1},
    {"decimalScaleFactor", 2},
    {"nBitsPacking", 3},
  };
  RepresentationCommon common;
  common.referenceValue = 0;
  common.binaryScaleFactor = 1;
  common.decimalScaleFactor = 2;
  common.bitsPerValue = 3;
  if (typeOfValues) {
    layout.octets.push_back(1);
    layout.fields.push_back({"typeOfValues", 4});
    common.typeOfValues = 4;
  }
  layout.common = common;
  return layout;
}

TemplateLayout ComplexPackingLayout(TemplateNumber number, std::string_view description) {
  TemplateLayout layout = PackingLayout(number, description, true);
  internal::Append(layout.octets, {1, 1, 4, 4, 4, 1, 1, 4, 1, 4, 1});
  internal::Append(layout.fields, {
                          {"groupSplittingMethod", 5},
                          {"typeOfMissingValueManagement", 6},
                          {"priMissingValue", 7},
                          {"secMissingValue", 8},
                          {"nGroups", 9},
                          {"refGroupWidth", 10},
                          {"nBitsGroupWidth", 11},
                          {"refGroupLength", 12},
                          {"groupLengthIncrement", 13},
                          {"lengthOfLastGroup", 14},
                          {"nBitsScaledGroupLength", 15},
                        });
  return layout;
}

}  // namespace

// FieldSpec ///////////////////////////////////////////////////////////////////

bool FieldSpec::writable() const {
  switch (codec) {
    case FieldCodec::EarthRadius:
    case FieldCodec::EarthMajorAxis:
    case FieldCodec::EarthMinorAxis:
      return false;
    default:
      return true;
  }
}

// TemplateLayout //////////////////////////////////////////////////////////////

size_t TemplateLayout::fixedFieldCount() const {
  return octets.size();
}

uint64_t TemplateLayout::fixedByteLength() const {
  uint64_t length = 0;
  for (const auto width : octets) {
    length += uint64_t(width < 0 ? -width : width);
  }
  return length;
}

const FieldSpec* TemplateLayout::field(std::string_view name) const {
  const auto it = std::find_if(fields.begin(), fields.end(), [name](const FieldSpec& spec) {
    return spec.name == name;
  });
  return it == fields.end() ? nullptr : &*it;
}

const GridCommon* TemplateLayout::grid() const {
  return std::get_if<GridCommon>(&common);
}

const ProductCommon* TemplateLayout::product() const {
  return std::get_if<ProductCommon>(&common);
}

const RepresentationCommon* TemplateLayout::representation() const {
  return std::get_if<RepresentationCommon>(&common);
}

// TemplateRegistry ////////////////////////////////////////////////////////////

const TemplateRegistry& TemplateRegistry::Instance() {
  static const TemplateRegistry registry;
  return registry;
}

TemplateRegistry::TemplateRegistry() {
  add(LatLonLayout(0, "Latitude/longitude", false));
  {
    auto layout = LatLonLayout(1, "Rotated latitude/longitude", false);
    AddRotation(layout);
    add(std::move(layout));
  }
  add(MercatorLayout());
  add(PolarStereographicLayout(20, "Polar stereographic projection"));
  add(LambertLayout(30, "Lambert conformal"));
  add(LambertLayout(31, "Albers equal area"));
  add(LatLonLayout(40, "Gaussian latitude/longitude", true));
  {
    auto layout = LatLonLayout(41, "Rotated Gaussian latitude/longitude", true);
    AddRotation(layout);
    add(std::move(layout));
  }
  add(SphericalHarmonicLayout());
  add(StaggeredLayout(32768, "Rotated latitude/longitude (Arakawa staggered E-grid)"));
  {
    auto layout =
      StaggeredLayout(32769, "Rotated latitude/longitude (Arakawa non-E staggered grid)");
    internal::Append(layout.octets, {-4, 4});
    internal::Append(layout.fields, {
                            {"latitudeLastGridpoint", 19, -1, FieldCodec::Coordinate, "degrees"},
                            {"longitudeLastGridpoint", 20, -1, FieldCodec::Coordinate, "degrees"},
                          });
    auto& common = std::get<GridCommon>(layout.common);
    common.latitudeLast = 19;
    common.longitudeLast = 20;
    add(std::move(layout));
  }

  add(ProductLayout(0, "Analysis or forecast at a horizontal level or in a horizontal layer at "
                       "a point in time"));
  {
    auto layout = ProductLayout(1, "Individual ensemble forecast, control and perturbed, at a "
                                   "horizontal level or in a horizontal layer at a point in time");
    AddEnsemble(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(2, "Derived forecasts based on all ensemble members at a "
                                   "horizontal level or in a horizontal layer at a point in time");
    AddDerivedForecast(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(5, "Probability forecasts at a horizontal level or in a "
                                   "horizontal layer at a point in time");
    AddProbability(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(6, "Percentile forecasts at a horizontal level or in a "
                                   "horizontal layer at a point in time");
    AddPercentile(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(8, "Average, accumulation, extreme values or other "
                                   "statistically processed values in a continuous time interval");
    AddStatisticalPeriod(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(9, "Probability forecasts in a continuous time interval");
    AddProbability(layout);
    AddStatisticalPeriod(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(10, "Percentile forecasts in a continuous time interval");
    AddPercentile(layout);
    AddStatisticalPeriod(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(11, "Individual ensemble forecast, control and perturbed, in a "
                                    "continuous time interval");
    AddEnsemble(layout);
    AddStatisticalPeriod(layout);
    add(std::move(layout));
  }
  {
    auto layout = ProductLayout(12, "Derived forecasts based on all ensemble members in a "
                                    "continuous time interval");
    AddDerivedForecast(layout);
    AddStatisticalPeriod(layout);
    add(std::move(layout));
  }
  add(SpatialProcessingLayout());
  add(SatelliteLayout());
  add(SimulatedSatelliteLayout());
  add(AerosolOpticalLayout());

  add(PackingLayout(0, "Grid point data - simple packing", true));
  add(ComplexPackingLayout(2, "Grid point data - complex packing"));
  {
    auto layout = ComplexPackingLayout(3, "Grid point data - complex packing and spatial "
                                          "differencing");
    internal::Append(layout.octets, {1, 1});
    internal::Append(layout.fields, {
                            {"spatialDifferenceOrder", 16},
                            {"nBytesSpatialDifference", 17},
                          });
    add(std::move(layout));
  }
  {
    TemplateLayout layout{SectionKind::DataRepresentation, 4, "Grid point data - IEEE floating "
                                                              "point data"};
    layout.octets = {1};
    layout.fields = {{"precision", 0}};
    layout.common = RepresentationCommon{};
    add(std::move(layout));
  }
  {
    auto layout = PackingLayout(40, "Grid point data - JPEG 2000 code stream format", true);
    internal::Append(layout.octets, {1, 1});
    internal::Append(layout.fields, {{"typeOfCompression", 5}, {"targetCompressionRatio", 6}});
    add(std::move(layout));
  }
  add(PackingLayout(41, "Grid point data - Portable Network Graphics (PNG)", true));
  {
    auto layout = PackingLayout(42, "Grid point and spectral data - CCSDS recommended lossless "
                                    "compression",
                                true);
    internal::Append(layout.octets, {1, 1, 2});
    internal::Append(layout.fields, {
                            {"compressionOptionsMask", 5},
                            {"blockSize", 6},
                            {"refSampleInterval", 7},
                          });
    add(std::move(layout));
  }
  {
    auto layout = PackingLayout(50, "Spectral data - simple packing", false);
    layout.octets.push_back(4);
    layout.fields.push_back({"realOfCoefficient", 4, -1, FieldCodec::IeeeFloat});
    add(std::move(layout));
  }
}

void TemplateRegistry::add(TemplateLayout layout) {
  const auto key = std::make_pair(layout.kind, layout.number);
  layouts_.insert_or_assign(key, std::move(layout));
}

const TemplateLayout* TemplateRegistry::find(SectionKind kind, TemplateNumber number) const {
  const auto it = layouts_.find(std::make_pair(kind, number));
  return it == layouts_.end() ? nullptr : &it->second;
}

std::vector<TemplateNumber> TemplateRegistry::templateNumbers(SectionKind kind) const {
  std::vector<TemplateNumber> numbers;
  for (const auto& [key, layout] : layouts_) {
    if (key.first == kind) {
      numbers.push_back(key.second);
    }
  }
  return numbers;
}

}  // namespace grib2
