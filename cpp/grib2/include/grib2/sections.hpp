#pragma once

#include "tables.hpp"
#include "templates.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace grib2 {

/**
 * @brief The decoded payload of a section 3, 4 or 5 template: the raw integer
 * of every template element plus the static layout that names them.
 *
 * Fields are read and written by name. Derived fields (scaled values,
 * coordinates, grid lengths, durations) are computed from one or two raw
 * elements on every access, and writing one updates every element backing it.
 * Geometry scale and direction signs are cached when the view is decoded and
 * refreshed whenever a raw element changes.
 */
class GRIB2_PUBLIC FieldView {
public:
  FieldView() = default;

  /**
   * @brief Decodes a template payload (the bytes following the template number)
   * according to `layout`.
   *
   * @param layout Registered layout of the template.
   * @param data Template payload.
   * @param size Number of bytes available at `data`. Bytes past the template
   *   are left alone.
   * @param view Output view.
   * @param consumed Optional output; the number of template bytes decoded.
   * @return Status InvalidSection if `size` is too small for the template.
   */
  static Status Decode(const TemplateLayout& layout, const std::byte* data, uint64_t size,
                       FieldView* view, uint64_t* consumed = nullptr);
  /**
   * @brief Creates a view of `layout` with every raw element set to zero.
   */
  static FieldView Create(const TemplateLayout& layout);

  bool valid() const {
    return layout_ != nullptr;
  }
  SectionKind kind() const;
  TemplateNumber templateNumber() const;
  const TemplateLayout* layout() const {
    return layout_;
  }
  const std::vector<int64_t>& rawArray() const {
    return raw_;
  }
  /**
   * @brief Raw element `index`, or 0 when out of range.
   */
  int64_t raw(size_t index) const;
  /**
   * @brief Octet width of raw element `index`; negative for sign-magnitude
   * elements.
   */
  int8_t width(size_t index) const;
  /**
   * @brief Overwrites one raw element. Changing the repeat count of a template
   * extension grows or shrinks the raw array accordingly.
   */
  Status setRaw(size_t index, int64_t value);

  int dxSign() const {
    return geometry_.dxSign;
  }
  int dySign() const {
    return geometry_.dySign;
  }
  /**
   * @brief Encoded size of the template payload in bytes.
   */
  uint64_t byteLength() const;

  bool has(std::string_view name) const;
  /**
   * @brief Reads a named field.
   *
   * @return Status UnknownField if the template has no such field, or
   *   InvalidFieldValue if a derived field cannot be computed (for example an
   *   unsupported time unit).
   */
  Status get(std::string_view name, double* value) const;
  std::optional<double> value(std::string_view name) const;
  /**
   * @brief Writes a named field, back-computing every raw element behind it.
   *
   * @return Status UnknownField, ReadOnlyField, or InvalidFieldValue when the
   *   value cannot be represented in the template's octets.
   */
  Status set(std::string_view name, double value);

  /**
   * @brief Appends the encoded template payload to `output`.
   */
  void encode(ByteArray* output) const;

private:
  struct Geometry {
    int dxSign = 1;
    int dySign = 1;
    double llScale = 1.0;
    double llDivisor = 1e6;
    double xyDivisor = 1e3;
  };

  void resizeExtension();
  void updateGeometry();
  Status earthDimension(const FieldSpec& spec, double* value) const;
  Status setScaled(const FieldSpec& spec, double value);
  Status setChecked(size_t index, double value, std::string_view name);

  const TemplateLayout* layout_ = nullptr;
  std::vector<int64_t> raw_;
  std::vector<int8_t> octets_;
  Geometry geometry_;
};

/**
 * @brief The length and number of a section header.
 */
struct GRIB2_PUBLIC SectionHeader {
  uint32_t length = 0;
  uint8_t number = 0;
};

/**
 * @brief Section 0.
 */
struct GRIB2_PUBLIC IndicatorSection {
  uint8_t discipline = 0;
  uint8_t edition = Edition;
  uint64_t totalLength = 0;
};

/**
 * @brief Section 1.
 */
struct GRIB2_PUBLIC IdentificationSection {
  uint16_t originatingCenter = 0;
  uint16_t originatingSubCenter = 0;
  uint8_t masterTableVersion = 2;
  uint8_t localTableVersion = 0;
  uint8_t significanceOfReferenceTime = 0;
  ReferenceDate referenceDate;
  uint8_t productionStatus = 0;
  uint8_t typeOfData = 0;
  /// Octets past the fixed part of the section, kept verbatim.
  ByteArray reserved;
};

/**
 * @brief Section 3.
 */
struct GRIB2_PUBLIC GridDefinitionSection {
  uint8_t sourceOfDefinition = 0;
  uint32_t numberOfDataPoints = 0;
  uint8_t octetsForOptionalList = 0;
  uint8_t interpretationOfList = 0;
  TemplateNumber templateNumber = 0;
  FieldView grid;
  /// Optional list of numbers defining the number of points per row or column.
  ByteArray optionalList;

  /**
   * @brief Sets a grid field. Setting `nx` or `ny` also updates
   * `numberOfDataPoints`.
   */
  Status set(std::string_view name, double value);
};

/**
 * @brief Section 4.
 */
struct GRIB2_PUBLIC ProductDefinitionSection {
  TemplateNumber templateNumber = 0;
  FieldView product;
  /// Hybrid coordinate values, as raw 32-bit words.
  std::vector<uint32_t> coordinateValues;
};

/**
 * @brief Section 5.
 */
struct GRIB2_PUBLIC DataRepresentationSection {
  uint32_t numberOfPackedValues = 0;
  TemplateNumber templateNumber = 0;
  FieldView representation;
};

/**
 * @brief Every metadata section of one field, fully decoded.
 */
struct GRIB2_PUBLIC DecodedMessage {
  MessageLocation location;
  IndicatorSection indicator;
  IdentificationSection identification;
  std::optional<ByteArray> localUse;
  GridDefinitionSection grid;
  ProductDefinitionSection product;
  DataRepresentationSection representation;
};

/**
 * @brief Parses and serializes individual sections. Every Parse function takes
 * the complete section, header included, and `size` set to the section's
 * declared length.
 */
struct GRIB2_PUBLIC SectionDecoder {
  static Status ReadSectionHeader(const std::byte* data, uint64_t size, SectionHeader* header);

  static Status ParseIndicator(const std::byte* data, uint64_t size, IndicatorSection* section);
  static Status ParseIdentification(const std::byte* data, uint64_t size,
                                    IdentificationSection* section);
  /**
   * @brief Parses section 3. The header fields are filled in even when the
   * template is unknown, in which case UnknownTemplate is returned.
   */
  static Status ParseGridDefinition(const std::byte* data, uint64_t size,
                                    GridDefinitionSection* section);
  static Status ParseProductDefinition(const std::byte* data, uint64_t size,
                                       ProductDefinitionSection* section);
  static Status ParseDataRepresentation(const std::byte* data, uint64_t size,
                                        DataRepresentationSection* section);

  /**
   * @brief Decodes only the template of a section 3, 4 or 5.
   *
   * @return Status UnknownTemplate if the template number is not registered
   *   for `kind`.
   */
  static Status Decode(SectionKind kind, const std::byte* data, uint64_t size,
                       TemplateNumber* templateNumber, FieldView* view);
  /**
   * @brief Appends the template payload of `view` to `output`.
   */
  static void Encode(const FieldView& view, ByteArray* output);

  static void WriteIndicator(const IndicatorSection& section, ByteArray* output);
  static void WriteIdentification(const IdentificationSection& section, ByteArray* output);
  static void WriteGridDefinition(const GridDefinitionSection& section, ByteArray* output);
  static void WriteProductDefinition(const ProductDefinitionSection& section, ByteArray* output);
  static void WriteDataRepresentation(const DataRepresentationSection& section,
                                      ByteArray* output);
  /**
   * @brief Appends a section whose payload is opaque to this library
   * (local use, bitmap, data).
   */
  static void WriteRawSection(SectionKind kind, const ByteArray& payload, ByteArray* output);
};

/**
 * @brief Forecast lead time of a product definition, in seconds.
 */
GRIB2_PUBLIC
std::optional<int64_t> LeadTimeSeconds(const FieldView& product);

/**
 * @brief Length of the statistical processing period of a product definition,
 * in seconds. std::nullopt for templates without one.
 */
GRIB2_PUBLIC
std::optional<int64_t> DurationSeconds(const FieldView& product);

/**
 * @brief The date a product is valid for: the end of its statistical period
 * when it has one, otherwise the reference date plus the lead time.
 */
GRIB2_PUBLIC
std::optional<ReferenceDate> ValidDate(const ReferenceDate& referenceDate,
                                       const FieldView& product);

/**
 * @brief Unpacks bitmaps and data values. No codec is bundled; callers
 * provide one for the packing schemes they care about.
 */
struct GRIB2_PUBLIC ICodec {
  virtual ~ICodec() = default;

  /**
   * @brief Expands a section 6 bitmap payload (the bytes after the indicator)
   * into one flag per grid point.
   */
  virtual Status decodeBitmap(const std::byte* data, uint64_t size, uint32_t numberOfPoints,
                              std::vector<bool>* bitmap) = 0;
  /**
   * @brief Unpacks a section 7 payload (the bytes after the section header)
   * into `numberOfPackedValues` values.
   */
  virtual Status decodeData(const DataRepresentationSection& representation,
                            const std::byte* data, uint64_t size, std::vector<float>* values) = 0;
};

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "sections.inl"
#endif
