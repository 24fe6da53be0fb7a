#include "internal.hpp"
#include <cmath>
#include <limits>

namespace grib2 {

namespace {

std::string TemplateLabel(SectionKind kind, TemplateNumber number) {
  return internal::StrCat("template ", int(kind), ".", number);
}

bool IsMissingValue(int64_t value, int8_t width) {
  const size_t octets = size_t(width < 0 ? -width : width);
  if (width < 0) {
    return value == -int64_t(internal::MaxMagnitude(octets, true));
  }
  return uint64_t(value) == internal::MaxMagnitude(octets, false);
}

double ScaledValue(int64_t value, int64_t factor) {
  if (factor == internal::MissingScaleFactor) {
    return 0.0;
  }
  return double(value) / internal::Pow10(factor);
}

size_t ExtensionCount(const TemplateExtension& extension, const std::vector<int64_t>& raw) {
  const size_t countIndex = size_t(extension.countIndex);
  if (countIndex >= raw.size()) {
    return 0;
  }
  const int64_t count = raw[countIndex] + extension.countAdjust;
  return count < 0 ? 0 : size_t(count);
}

Status DecodeElements(const TemplateLayout& layout, const std::vector<int8_t>& octets,
                      const std::byte* data, uint64_t size, uint64_t* offset,
                      std::vector<int64_t>* raw) {
  for (size_t index = raw->size(); index < octets.size(); ++index) {
    const int8_t width = octets[index];
    const size_t octetCount = size_t(width < 0 ? -width : width);
    if (*offset + octetCount > size) {
      const auto msg =
        internal::StrCat(TemplateLabel(layout.kind, layout.number), " needs more than ", size,
                         " bytes (element ", index, " at offset ", *offset, ")");
      return Status{StatusCode::InvalidSection, msg};
    }
    const std::byte* element = data + *offset;
    raw->push_back(width < 0 ? internal::ParseSignMagnitude(element, octetCount)
                             : int64_t(internal::ParseUnsigned(element, octetCount)));
    *offset += octetCount;
  }
  return StatusCode::Success;
}

void AppendUnsigned(uint64_t value, size_t width, ByteArray* output) {
  const size_t start = output->size();
  output->resize(start + width);
  internal::WriteUnsigned(value, width, output->data() + start);
}

void AppendSection(SectionKind kind, const ByteArray& body, ByteArray* output) {
  AppendUnsigned(SectionHeaderLength + body.size(), 4, output);
  output->push_back(std::byte(kind));
  output->insert(output->end(), body.begin(), body.end());
}

Status ExpectSection(const std::byte* data, uint64_t size, SectionKind kind,
                     uint64_t minimumLength, SectionHeader* header) {
  if (auto status = SectionDecoder::ReadSectionHeader(data, size, header); !status.ok()) {
    return status;
  }
  if (header->number != uint8_t(kind)) {
    const auto msg = internal::StrCat("expected section ", int(kind), ", found section ",
                                      int(header->number));
    return Status{StatusCode::InvalidSection, msg};
  }
  if (header->length < minimumLength) {
    const auto msg = internal::StrCat("section ", int(kind), " length ", header->length,
                                      " is shorter than the minimum of ", minimumLength);
    return Status{StatusCode::InvalidSection, msg};
  }
  if (header->length > size) {
    const auto msg = internal::StrCat("section ", int(kind), " declares ", header->length,
                                      " bytes but only ", size, " are available");
    return Status{StatusCode::InvalidSection, msg};
  }
  return StatusCode::Success;
}

Status DecodeTemplate(SectionKind kind, TemplateNumber number, const std::byte* data,
                      uint64_t size, FieldView* view, uint64_t* consumed) {
  const TemplateLayout* layout = TemplateRegistry::Instance().find(kind, number);
  if (!layout) {
    const auto msg = internal::StrCat(TemplateLabel(kind, number), " is not supported");
    return Status{StatusCode::UnknownTemplate, msg};
  }
  return FieldView::Decode(*layout, data, size, view, consumed);
}

constexpr uint64_t GridTemplateOffset = 12;
constexpr uint64_t ProductTemplateOffset = 7;
constexpr uint64_t RepresentationTemplateOffset = 9;

}  // namespace

// FieldView ///////////////////////////////////////////////////////////////////

Status FieldView::Decode(const TemplateLayout& layout, const std::byte* data, uint64_t size,
                         FieldView* view, uint64_t* consumed) {
  FieldView result;
  result.layout_ = &layout;
  result.octets_ = layout.octets;
  result.raw_.reserve(layout.octets.size());

  uint64_t offset = 0;
  if (auto status = DecodeElements(layout, result.octets_, data, size, &offset, &result.raw_);
      !status.ok()) {
    return status;
  }
  if (layout.extension) {
    const size_t count = ExtensionCount(*layout.extension, result.raw_);
    for (size_t i = 0; i < count; ++i) {
      internal::Append(result.octets_, layout.extension->block);
    }
    if (auto status = DecodeElements(layout, result.octets_, data, size, &offset, &result.raw_);
        !status.ok()) {
      return status;
    }
  }

  result.updateGeometry();
  *view = std::move(result);
  if (consumed) {
    *consumed = offset;
  }
  return StatusCode::Success;
}

FieldView FieldView::Create(const TemplateLayout& layout) {
  FieldView view;
  view.layout_ = &layout;
  view.octets_ = layout.octets;
  view.raw_.assign(layout.octets.size(), 0);
  view.resizeExtension();
  view.updateGeometry();
  return view;
}

SectionKind FieldView::kind() const {
  return layout_ ? layout_->kind : SectionKind::Indicator;
}

TemplateNumber FieldView::templateNumber() const {
  return layout_ ? layout_->number : 0;
}

int64_t FieldView::raw(size_t index) const {
  return index < raw_.size() ? raw_[index] : 0;
}

int8_t FieldView::width(size_t index) const {
  return index < octets_.size() ? octets_[index] : 0;
}

uint64_t FieldView::byteLength() const {
  uint64_t length = 0;
  for (const auto width : octets_) {
    length += uint64_t(width < 0 ? -width : width);
  }
  return length;
}

Status FieldView::setRaw(size_t index, int64_t value) {
  if (index >= raw_.size()) {
    const auto msg = internal::StrCat("element ", index, " is out of range for ",
                                      TemplateLabel(kind(), templateNumber()));
    return Status{StatusCode::InvalidFieldValue, msg};
  }
  const int8_t width = octets_[index];
  const size_t octetCount = size_t(width < 0 ? -width : width);
  const uint64_t magnitude = value < 0 ? uint64_t(0) - uint64_t(value) : uint64_t(value);
  if ((width > 0 && value < 0) || magnitude > internal::MaxMagnitude(octetCount, width < 0)) {
    const auto msg = internal::StrCat("value ", value, " does not fit element ", index, " of ",
                                      TemplateLabel(kind(), templateNumber()), " (", octetCount,
                                      width < 0 ? " signed octets)" : " octets)");
    return Status{StatusCode::InvalidFieldValue, msg};
  }

  raw_[index] = value;
  if (layout_->extension && index == size_t(layout_->extension->countIndex)) {
    resizeExtension();
  }
  updateGeometry();
  return StatusCode::Success;
}

void FieldView::resizeExtension() {
  if (!layout_ || !layout_->extension) {
    return;
  }
  const size_t count = ExtensionCount(*layout_->extension, raw_);
  octets_ = layout_->octets;
  for (size_t i = 0; i < count; ++i) {
    internal::Append(octets_, layout_->extension->block);
  }
  raw_.resize(octets_.size(), 0);
}

void FieldView::updateGeometry() {
  geometry_ = Geometry{};
  const GridCommon* grid = layout_ ? layout_->grid() : nullptr;
  if (!grid) {
    return;
  }

  if (grid->angularUnits) {
    const int64_t missing = int64_t(internal::MaxMagnitude(4, false));
    const int64_t basicAngle = raw(size_t(grid->basicAngle));
    const int64_t subdivisions = raw(size_t(grid->basicAngleSubdivisions));
    if (basicAngle != 0 && basicAngle != missing) {
      geometry_.llScale = double(basicAngle);
      if (subdivisions != 0 && subdivisions != missing) {
        geometry_.llDivisor = double(subdivisions);
      }
    }
    geometry_.xyDivisor = geometry_.llDivisor;
  }

  if (grid->signedLengths && grid->longitudeFirst >= 0 && grid->longitudeLast >= 0 &&
      raw(size_t(grid->longitudeFirst)) > raw(size_t(grid->longitudeLast))) {
    geometry_.dxSign = -1;
  }
  if (grid->latitudeFirst >= 0 && grid->latitudeLast >= 0 &&
      raw(size_t(grid->latitudeFirst)) > raw(size_t(grid->latitudeLast))) {
    geometry_.dySign = -1;
  }
}

bool FieldView::has(std::string_view name) const {
  return layout_ && layout_->field(name) != nullptr;
}

Status FieldView::get(std::string_view name, double* value) const {
  const FieldSpec* spec = layout_ ? layout_->field(name) : nullptr;
  if (!spec) {
    const auto msg = internal::StrCat(TemplateLabel(kind(), templateNumber()),
                                      " has no field named ", name);
    return Status{StatusCode::UnknownField, msg};
  }

  const size_t index = size_t(spec->index);
  const int64_t primary = raw(index);
  switch (spec->codec) {
    case FieldCodec::Integer:
      *value = double(primary);
      break;
    case FieldCodec::Scaled:
      *value = IsMissingValue(primary, width(index))
                 ? 0.0
                 : ScaledValue(primary, raw(size_t(spec->secondary)));
      break;
    case FieldCodec::IeeeFloat:
      *value = double(internal::IeeeToFloat(uint32_t(primary)));
      break;
    case FieldCodec::Coordinate:
      *value = double(primary) * geometry_.llScale / geometry_.llDivisor;
      break;
    case FieldCodec::GridLengthX:
      *value = double(primary) * geometry_.llScale / geometry_.xyDivisor * geometry_.dxSign;
      break;
    case FieldCodec::GridLengthY:
      *value = double(primary) * geometry_.llScale / geometry_.xyDivisor * geometry_.dySign;
      break;
    case FieldCodec::TimeSeconds: {
      const int64_t unit = raw(size_t(spec->secondary));
      const auto seconds = TimeUnitSeconds(unit);
      if (!seconds) {
        const auto msg =
          internal::StrCat("time unit ", unit, " of field ", name, " has no fixed length");
        return Status{StatusCode::InvalidFieldValue, msg};
      }
      *value = double(primary * *seconds);
      break;
    }
    case FieldCodec::EarthRadius:
    case FieldCodec::EarthMajorAxis:
    case FieldCodec::EarthMinorAxis:
      return earthDimension(*spec, value);
  }
  return StatusCode::Success;
}

std::optional<double> FieldView::value(std::string_view name) const {
  double result = 0.0;
  if (!get(name, &result).ok()) {
    return std::nullopt;
  }
  return result;
}

Status FieldView::earthDimension(const FieldSpec& spec, double* value) const {
  const size_t base = size_t(spec.index);
  const int64_t shape = raw(base);

  EarthShape earth;
  if (const auto predefined = PredefinedEarthShape(shape)) {
    earth = *predefined;
  } else if (shape == 1) {
    const double radius = ScaledValue(raw(base + 2), raw(base + 1));
    earth = EarthShape{radius, radius};
  } else if (shape == 3 || shape == 7) {
    const double units = shape == 3 ? 1000.0 : 1.0;
    earth = EarthShape{ScaledValue(raw(base + 4), raw(base + 3)) * units,
                       ScaledValue(raw(base + 6), raw(base + 5)) * units};
  } else {
    const auto msg = internal::StrCat("shape of the earth ", shape, " has no known dimensions");
    return Status{StatusCode::InvalidFieldValue, msg};
  }

  switch (spec.codec) {
    case FieldCodec::EarthRadius:
      if (!earth.spherical()) {
        const auto msg = internal::StrCat("shape of the earth ", shape, " is not a sphere");
        return Status{StatusCode::InvalidFieldValue, msg};
      }
      *value = earth.majorAxis;
      break;
    case FieldCodec::EarthMajorAxis:
      *value = earth.majorAxis;
      break;
    default:
      *value = earth.minorAxis;
      break;
  }
  return StatusCode::Success;
}

Status FieldView::set(std::string_view name, double value) {
  const FieldSpec* spec = layout_ ? layout_->field(name) : nullptr;
  if (!spec) {
    const auto msg = internal::StrCat(TemplateLabel(kind(), templateNumber()),
                                      " has no field named ", name);
    return Status{StatusCode::UnknownField, msg};
  }
  if (!spec->writable()) {
    const auto msg = internal::StrCat("field ", name, " of ",
                                      TemplateLabel(kind(), templateNumber()), " is derived");
    return Status{StatusCode::ReadOnlyField, msg};
  }
  if (!std::isfinite(value)) {
    const auto msg = internal::StrCat("field ", name, " cannot hold a non-finite value");
    return Status{StatusCode::InvalidFieldValue, msg};
  }

  const size_t index = size_t(spec->index);
  switch (spec->codec) {
    case FieldCodec::Scaled:
      return setScaled(*spec, value);
    case FieldCodec::IeeeFloat:
      return setRaw(index, int64_t(internal::FloatToIeee(float(value))));
    case FieldCodec::Coordinate: {
      double degrees = value;
      if (width(index) > 0 && degrees < 0.0) {
        degrees += 360.0;
      }
      return setChecked(index, std::round(degrees * geometry_.llDivisor / geometry_.llScale),
                        name);
    }
    case FieldCodec::GridLengthX:
    case FieldCodec::GridLengthY:
      return setChecked(
        index, std::round(std::fabs(value) * geometry_.xyDivisor / geometry_.llScale), name);
    case FieldCodec::TimeSeconds: {
      const int64_t unit = raw(size_t(spec->secondary));
      const auto seconds = TimeUnitSeconds(unit);
      if (!seconds) {
        const auto msg =
          internal::StrCat("time unit ", unit, " of field ", name, " has no fixed length");
        return Status{StatusCode::InvalidFieldValue, msg};
      }
      return setChecked(index, value / double(*seconds), name);
    }
    default:
      return setChecked(index, value, name);
  }
}

Status FieldView::setChecked(size_t index, double value, std::string_view name) {
  // 2^62 keeps the conversion to int64_t defined; no template element is wider
  // than four octets anyway.
  if (value != std::trunc(value) || std::fabs(value) > 4.6e18) {
    const auto msg =
      internal::StrCat("field ", name, " cannot hold ", value, " as a whole number of units");
    return Status{StatusCode::InvalidFieldValue, msg};
  }
  return setRaw(index, int64_t(value));
}

Status FieldView::setScaled(const FieldSpec& spec, double value) {
  const size_t valueIndex = size_t(spec.index);
  const size_t factorIndex = size_t(spec.secondary);
  const int8_t valueWidth = width(valueIndex);
  const uint64_t limit =
    internal::MaxMagnitude(size_t(valueWidth < 0 ? -valueWidth : valueWidth), valueWidth < 0);

  int64_t factor = internal::DecimalScaleFor(value);
  double scaled = std::round(value * internal::Pow10(factor));
  while (std::fabs(scaled) > double(limit) && factor > -9) {
    --factor;
    scaled = std::round(value * internal::Pow10(factor));
  }
  if (std::fabs(scaled) > double(limit) || (valueWidth > 0 && scaled < 0.0)) {
    const auto msg = internal::StrCat("field ", spec.name, " cannot represent ", value);
    return Status{StatusCode::InvalidFieldValue, msg};
  }

  if (auto status = setRaw(factorIndex, factor); !status.ok()) {
    return status;
  }
  return setRaw(valueIndex, int64_t(scaled));
}

void FieldView::encode(ByteArray* output) const {
  for (size_t i = 0; i < raw_.size(); ++i) {
    const int8_t width = octets_[i];
    const size_t start = output->size();
    if (width < 0) {
      output->resize(start + size_t(-width));
      internal::WriteSignMagnitude(raw_[i], size_t(-width), output->data() + start);
    } else {
      output->resize(start + size_t(width));
      internal::WriteUnsigned(uint64_t(raw_[i]), size_t(width), output->data() + start);
    }
  }
}

// GridDefinitionSection ///////////////////////////////////////////////////////

Status GridDefinitionSection::set(std::string_view name, double value) {
  if (name == "nx" || name == "ny") {
    const auto other = grid.value(name == "nx" ? "ny" : "nx");
    if (other && value * *other > double(std::numeric_limits<uint32_t>::max())) {
      const auto msg = internal::StrCat(name, "=", value, " gives more than ",
                                        std::numeric_limits<uint32_t>::max(), " grid points");
      return Status{StatusCode::InvalidFieldValue, msg};
    }
  }
  if (auto status = grid.set(name, value); !status.ok()) {
    return status;
  }
  if (name == "nx" || name == "ny") {
    const auto nx = grid.value("nx");
    const auto ny = grid.value("ny");
    if (nx && ny) {
      numberOfDataPoints = uint32_t(*nx * *ny);
    }
  }
  return StatusCode::Success;
}

// SectionDecoder //////////////////////////////////////////////////////////////

Status SectionDecoder::ReadSectionHeader(const std::byte* data, uint64_t size,
                                         SectionHeader* header) {
  if (auto status = internal::ParseUint32(data, size, &header->length); !status.ok()) {
    return status;
  }
  if (size < SectionHeaderLength) {
    const auto msg = internal::StrCat("section header needs ", SectionHeaderLength,
                                      " bytes, only ", size, " available");
    return Status{StatusCode::InvalidSection, msg};
  }
  header->number = uint8_t(data[4]);
  return StatusCode::Success;
}

Status SectionDecoder::ParseIndicator(const std::byte* data, uint64_t size,
                                      IndicatorSection* section) {
  if (size < IndicatorSectionLength) {
    const auto msg = internal::StrCat("indicator section needs ", IndicatorSectionLength,
                                      " bytes, only ", size, " available");
    return Status{StatusCode::InvalidSection, msg};
  }
  if (!internal::IsMagic(data)) {
    const auto msg = internal::StrCat("invalid magic bytes: ", internal::TagToString(data));
    return Status{StatusCode::FormatError, msg};
  }
  section->discipline = uint8_t(data[6]);
  section->edition = uint8_t(data[7]);
  if (section->edition != Edition) {
    const auto msg = internal::StrCat("unsupported GRIB edition ", int(section->edition));
    return Status{StatusCode::UnsupportedEdition, msg};
  }
  section->totalLength = internal::ParseUint64(data + 8);
  return StatusCode::Success;
}

Status SectionDecoder::ParseIdentification(const std::byte* data, uint64_t size,
                                           IdentificationSection* section) {
  SectionHeader header;
  if (auto status = ExpectSection(data, size, SectionKind::Identification,
                                  internal::IdentificationSectionLength, &header);
      !status.ok()) {
    return status;
  }

  section->originatingCenter = internal::ParseUint16(data + 5);
  section->originatingSubCenter = internal::ParseUint16(data + 7);
  section->masterTableVersion = uint8_t(data[9]);
  section->localTableVersion = uint8_t(data[10]);
  section->significanceOfReferenceTime = uint8_t(data[11]);
  section->referenceDate.year = internal::ParseUint16(data + 12);
  section->referenceDate.month = uint8_t(data[14]);
  section->referenceDate.day = uint8_t(data[15]);
  section->referenceDate.hour = uint8_t(data[16]);
  section->referenceDate.minute = uint8_t(data[17]);
  section->referenceDate.second = uint8_t(data[18]);
  section->productionStatus = uint8_t(data[19]);
  section->typeOfData = uint8_t(data[20]);
  section->reserved.assign(data + internal::IdentificationSectionLength, data + header.length);
  return StatusCode::Success;
}

Status SectionDecoder::ParseGridDefinition(const std::byte* data, uint64_t size,
                                           GridDefinitionSection* section) {
  SectionHeader header;
  if (auto status =
        ExpectSection(data, size, SectionKind::GridDefinition, GridTemplateOffset + 2, &header);
      !status.ok()) {
    return status;
  }

  section->sourceOfDefinition = uint8_t(data[5]);
  section->numberOfDataPoints = internal::ParseUint32(data + 6);
  section->octetsForOptionalList = uint8_t(data[10]);
  section->interpretationOfList = uint8_t(data[11]);
  section->templateNumber = internal::ParseUint16(data + GridTemplateOffset);

  const uint64_t payloadOffset = GridTemplateOffset + 2;
  uint64_t consumed = 0;
  if (auto status = DecodeTemplate(SectionKind::GridDefinition, section->templateNumber,
                                   data + payloadOffset, header.length - payloadOffset,
                                   &section->grid, &consumed);
      !status.ok()) {
    return status;
  }
  section->optionalList.assign(data + payloadOffset + consumed, data + header.length);
  return StatusCode::Success;
}

Status SectionDecoder::ParseProductDefinition(const std::byte* data, uint64_t size,
                                              ProductDefinitionSection* section) {
  SectionHeader header;
  if (auto status = ExpectSection(data, size, SectionKind::ProductDefinition,
                                  ProductTemplateOffset + 2, &header);
      !status.ok()) {
    return status;
  }

  const uint16_t coordinateCount = internal::ParseUint16(data + 5);
  section->templateNumber = internal::ParseUint16(data + ProductTemplateOffset);

  const uint64_t payloadOffset = ProductTemplateOffset + 2;
  uint64_t consumed = 0;
  if (auto status = DecodeTemplate(SectionKind::ProductDefinition, section->templateNumber,
                                   data + payloadOffset, header.length - payloadOffset,
                                   &section->product, &consumed);
      !status.ok()) {
    return status;
  }

  const uint64_t coordinateOffset = payloadOffset + consumed;
  if (coordinateOffset + uint64_t(coordinateCount) * 4 > header.length) {
    const auto msg = internal::StrCat("section 4 declares ", coordinateCount,
                                      " coordinate values but has room for ",
                                      (header.length - coordinateOffset) / 4);
    return Status{StatusCode::InvalidSection, msg};
  }
  section->coordinateValues.resize(coordinateCount);
  for (size_t i = 0; i < coordinateCount; ++i) {
    section->coordinateValues[i] = internal::ParseUint32(data + coordinateOffset + i * 4);
  }
  return StatusCode::Success;
}

Status SectionDecoder::ParseDataRepresentation(const std::byte* data, uint64_t size,
                                               DataRepresentationSection* section) {
  SectionHeader header;
  if (auto status = ExpectSection(data, size, SectionKind::DataRepresentation,
                                  RepresentationTemplateOffset + 2, &header);
      !status.ok()) {
    return status;
  }

  section->numberOfPackedValues = internal::ParseUint32(data + 5);
  section->templateNumber = internal::ParseUint16(data + RepresentationTemplateOffset);

  const uint64_t payloadOffset = RepresentationTemplateOffset + 2;
  return DecodeTemplate(SectionKind::DataRepresentation, section->templateNumber,
                        data + payloadOffset, header.length - payloadOffset,
                        &section->representation, nullptr);
}

Status SectionDecoder::Decode(SectionKind kind, const std::byte* data, uint64_t size,
                              TemplateNumber* templateNumber, FieldView* view) {
  uint64_t templateOffset = 0;
  switch (kind) {
    case SectionKind::GridDefinition:
      templateOffset = GridTemplateOffset;
      break;
    case SectionKind::ProductDefinition:
      templateOffset = ProductTemplateOffset;
      break;
    case SectionKind::DataRepresentation:
      templateOffset = RepresentationTemplateOffset;
      break;
    default: {
      const auto msg =
        internal::StrCat("section ", int(kind), " (", SectionKindString(kind), ") has no template");
      return Status{StatusCode::InvalidSection, msg};
    }
  }

  SectionHeader header;
  if (auto status = ExpectSection(data, size, kind, templateOffset + 2, &header); !status.ok()) {
    return status;
  }
  *templateNumber = internal::ParseUint16(data + templateOffset);
  const uint64_t payloadOffset = templateOffset + 2;
  return DecodeTemplate(kind, *templateNumber, data + payloadOffset,
                        header.length - payloadOffset, view, nullptr);
}

void SectionDecoder::Encode(const FieldView& view, ByteArray* output) {
  view.encode(output);
}

void SectionDecoder::WriteIndicator(const IndicatorSection& section, ByteArray* output) {
  for (const auto c : Magic) {
    output->push_back(std::byte(c));
  }
  output->push_back(std::byte(0));
  output->push_back(std::byte(0));
  output->push_back(std::byte(section.discipline));
  output->push_back(std::byte(section.edition));
  AppendUnsigned(section.totalLength, 8, output);
}

void SectionDecoder::WriteIdentification(const IdentificationSection& section,
                                         ByteArray* output) {
  ByteArray body;
  AppendUnsigned(section.originatingCenter, 2, &body);
  AppendUnsigned(section.originatingSubCenter, 2, &body);
  body.push_back(std::byte(section.masterTableVersion));
  body.push_back(std::byte(section.localTableVersion));
  body.push_back(std::byte(section.significanceOfReferenceTime));
  AppendUnsigned(section.referenceDate.year, 2, &body);
  body.push_back(std::byte(section.referenceDate.month));
  body.push_back(std::byte(section.referenceDate.day));
  body.push_back(std::byte(section.referenceDate.hour));
  body.push_back(std::byte(section.referenceDate.minute));
  body.push_back(std::byte(section.referenceDate.second));
  body.push_back(std::byte(section.productionStatus));
  body.push_back(std::byte(section.typeOfData));
  body.insert(body.end(), section.reserved.begin(), section.reserved.end());
  AppendSection(SectionKind::Identification, body, output);
}

void SectionDecoder::WriteGridDefinition(const GridDefinitionSection& section,
                                         ByteArray* output) {
  ByteArray body;
  body.push_back(std::byte(section.sourceOfDefinition));
  AppendUnsigned(section.numberOfDataPoints, 4, &body);
  body.push_back(std::byte(section.octetsForOptionalList));
  body.push_back(std::byte(section.interpretationOfList));
  AppendUnsigned(section.templateNumber, 2, &body);
  section.grid.encode(&body);
  body.insert(body.end(), section.optionalList.begin(), section.optionalList.end());
  AppendSection(SectionKind::GridDefinition, body, output);
}

void SectionDecoder::WriteProductDefinition(const ProductDefinitionSection& section,
                                            ByteArray* output) {
  ByteArray body;
  AppendUnsigned(section.coordinateValues.size(), 2, &body);
  AppendUnsigned(section.templateNumber, 2, &body);
  section.product.encode(&body);
  for (const auto word : section.coordinateValues) {
    AppendUnsigned(word, 4, &body);
  }
  AppendSection(SectionKind::ProductDefinition, body, output);
}

void SectionDecoder::WriteDataRepresentation(const DataRepresentationSection& section,
                                             ByteArray* output) {
  ByteArray body;
  AppendUnsigned(section.numberOfPackedValues, 4, &body);
  AppendUnsigned(section.templateNumber, 2, &body);
  section.representation.encode(&body);
  AppendSection(SectionKind::DataRepresentation, body, output);
}

void SectionDecoder::WriteRawSection(SectionKind kind, const ByteArray& payload,
                                     ByteArray* output) {
  AppendSection(kind, payload, output);
}

// Product time helpers ////////////////////////////////////////////////////////

std::optional<int64_t> LeadTimeSeconds(const FieldView& product) {
  const auto seconds = product.value("leadTime");
  if (!seconds) {
    return std::nullopt;
  }
  return int64_t(*seconds);
}

std::optional<int64_t> DurationSeconds(const FieldView& product) {
  const auto seconds = product.value("duration");
  if (!seconds) {
    return std::nullopt;
  }
  return int64_t(*seconds);
}

std::optional<ReferenceDate> ValidDate(const ReferenceDate& referenceDate,
                                       const FieldView& product) {
  const ProductCommon* common = product.layout() ? product.layout()->product() : nullptr;
  if (common && common->endOfPeriod >= 0) {
    const size_t at = size_t(common->endOfPeriod);
    ReferenceDate end;
    end.year = uint16_t(product.raw(at));
    end.month = uint8_t(product.raw(at + 1));
    end.day = uint8_t(product.raw(at + 2));
    end.hour = uint8_t(product.raw(at + 3));
    end.minute = uint8_t(product.raw(at + 4));
    end.second = uint8_t(product.raw(at + 5));
    return end;
  }

  const auto lead = LeadTimeSeconds(product);
  if (!lead) {
    return std::nullopt;
  }
  return ReferenceDate::FromEpochSeconds(referenceDate.epochSeconds() + *lead);
}

}  // namespace grib2
