#include "internal.hpp"
#include <cmath>
#include <limits>
#include <set>

namespace grib2 {

namespace {

using MetadataGetter = AttributeValue (*)(const MessageLocation&);
using IdentificationGetter = int64_t (*)(const IdentificationSection&);

const std::map<std::string_view, MetadataGetter>& MetadataAttributes() {
  static const std::map<std::string_view, MetadataGetter> attributes = {
    {"messageNumber",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.messageNumber); }},
    {"discipline", [](const MessageLocation& l) -> AttributeValue { return int64_t(l.discipline); }},
    {"edition", [](const MessageLocation& l) -> AttributeValue { return int64_t(l.edition); }},
    {"isSubmessage",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.isSubmessage ? 1 : 0); }},
    {"fileOffset", [](const MessageLocation& l) -> AttributeValue { return int64_t(l.fileOffset); }},
    {"year",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.referenceDate.year); }},
    {"month",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.referenceDate.month); }},
    {"day", [](const MessageLocation& l) -> AttributeValue { return int64_t(l.referenceDate.day); }},
    {"hour",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.referenceDate.hour); }},
    {"minute",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.referenceDate.minute); }},
    {"second",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.referenceDate.second); }},
    {"refDate",
     [](const MessageLocation& l) -> AttributeValue { return l.referenceDate.isoString(); }},
    {"parameterCategory",
     [](const MessageLocation& l) -> AttributeValue {
       return int64_t(l.parameterIdentity.category);
     }},
    {"parameterNumber",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.parameterIdentity.number); }},
    {"gridPointCount",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.gridPointCount); }},
    {"numberOfDataPoints",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.gridPointCount); }},
    {"gridDefinitionTemplateNumber",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.gridTemplateNumber); }},
    {"productDefinitionTemplateNumber",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.productTemplateNumber); }},
    {"dataRepresentationTemplateNumber",
     [](const MessageLocation& l) -> AttributeValue {
       return int64_t(l.representationTemplateNumber);
     }},
    {"numberOfPackedValues",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.numberOfPackedValues); }},
    {"bitmapIndicator",
     [](const MessageLocation& l) -> AttributeValue { return int64_t(l.bitmapIndicator); }},
  };
  return attributes;
}

const std::map<std::string_view, IdentificationGetter>& IdentificationAttributes() {
  static const std::map<std::string_view, IdentificationGetter> attributes = {
    {"originatingCenter", [](const IdentificationSection& s) { return int64_t(s.originatingCenter); }},
    {"originatingSubCenter",
     [](const IdentificationSection& s) { return int64_t(s.originatingSubCenter); }},
    {"masterTableVersion",
     [](const IdentificationSection& s) { return int64_t(s.masterTableVersion); }},
    {"localTableVersion",
     [](const IdentificationSection& s) { return int64_t(s.localTableVersion); }},
    {"significanceOfReferenceTime",
     [](const IdentificationSection& s) { return int64_t(s.significanceOfReferenceTime); }},
    {"productionStatus", [](const IdentificationSection& s) { return int64_t(s.productionStatus); }},
    {"typeOfData", [](const IdentificationSection& s) { return int64_t(s.typeOfData); }},
  };
  return attributes;
}

double AttributeAsDouble(const AttributeValue& value) {
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    return double(*integer);
  }
  return std::get<double>(value);
}

std::optional<std::string> LevelOf(const FieldView& product) {
  const auto type = product.value("typeOfFirstFixedSurface");
  if (!type) {
    return std::nullopt;
  }
  return LevelDescription(int64_t(*type), product.value("valueOfFirstFixedSurface").value_or(0.0));
}

}  // namespace

bool AttributeMatches(const AttributeValue& actual, const AttributeValue& expected) {
  const auto* actualString = std::get_if<std::string>(&actual);
  const auto* expectedString = std::get_if<std::string>(&expected);
  if (actualString || expectedString) {
    return actualString && expectedString && *actualString == *expectedString;
  }
  const auto* actualInteger = std::get_if<int64_t>(&actual);
  const auto* expectedInteger = std::get_if<int64_t>(&expected);
  if (actualInteger && expectedInteger) {
    return *actualInteger == *expectedInteger;
  }
  const double a = AttributeAsDouble(actual);
  const double b = AttributeAsDouble(expected);
  return std::fabs(a - b) <= 1e-9 * std::max({1.0, std::fabs(a), std::fabs(b)});
}

std::string AttributeToString(const AttributeValue& value) {
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    return std::to_string(*integer);
  }
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%g", std::get<double>(value));
  return buffer;
}

// MessageIndex ////////////////////////////////////////////////////////////////

MessageIndex::MessageIndex() {
  clear();
}

void MessageIndex::clear() {
  records_.clear();
  records_.emplace_back();
  current_ = 0;
}

void MessageIndex::append(MessageLocation location) {
  records_.push_back(std::move(location));
}

size_t MessageIndex::size() const {
  return records_.size() - 1;
}

bool MessageIndex::empty() const {
  return size() == 0;
}

const MessageLocation* MessageIndex::get(size_t messageNumber) const {
  if (messageNumber == 0 || messageNumber >= records_.size()) {
    return nullptr;
  }
  return &records_[messageNumber];
}

std::vector<const MessageLocation*> MessageIndex::select(const Predicates& predicates,
                                                         const AttributeResolver& resolve) const {
  std::vector<const MessageLocation*> matches;
  for (auto it = begin(); it != end(); ++it) {
    const MessageLocation& location = *it;
    bool matched = true;
    for (const auto& [name, expected] : predicates) {
      const auto actual = resolve(location, name);
      if (!actual || !AttributeMatches(*actual, expected)) {
        matched = false;
        break;
      }
    }
    if (matched) {
      matches.push_back(&location);
    }
  }
  return matches;
}

std::optional<ByteOffset> MessageIndex::seek(size_t messageNumber) {
  const MessageLocation* location = get(messageNumber);
  if (!location) {
    return std::nullopt;
  }
  current_ = messageNumber;
  return location->fileOffset;
}

size_t MessageIndex::tell() const {
  return current_;
}

const MessageLocation* MessageIndex::next() {
  const MessageLocation* location = get(current_ + 1);
  if (location) {
    ++current_;
  }
  return location;
}

MessageIndex::const_iterator MessageIndex::begin() const {
  return records_.begin() + 1;
}

MessageIndex::const_iterator MessageIndex::end() const {
  return records_.end();
}

// ReaderOptions ///////////////////////////////////////////////////////////////

Status ReaderOptions::validate() const {
  return scan.validate();
}

// GribReader //////////////////////////////////////////////////////////////////

struct GribReader::DecodeCache {
  const MessageLocation* location = nullptr;
  Status status;
  DecodedMessage message;
};

GribReader::~GribReader() {
  close();
}

Status GribReader::open(IReadable& reader, const ReaderOptions& options) {
  reset_();
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }
  options_ = options;
  parameterTable_ = options.parameterTable
                      ? options.parameterTable
                      : std::make_shared<const ParameterTable>(ParameterTable::Wmo());
  input_ = &reader;
  if (!options.decompress) {
    return StatusCode::Success;
  }

  std::byte* data = nullptr;
  const uint64_t magicBytes = reader.read(&data, 0, 4);
  const Compression compression = DetectCompression(data, magicBytes);
  if (compression == Compression::None) {
    return StatusCode::Success;
  }

  const uint64_t fileSize = reader.size();
  if (reader.read(&data, 0, fileSize) != fileSize) {
    input_ = nullptr;
    const auto msg = internal::StrCat("failed to read ", fileSize, " compressed bytes");
    return Status{StatusCode::ReadFailed, msg};
  }

  switch (compression) {
    case Compression::Zstd:
#ifndef GRIB2_COMPRESSION_NO_ZSTD
      decompressedInput_ = std::make_unique<ZStdReader>();
#endif
      break;
    case Compression::Lz4:
#ifndef GRIB2_COMPRESSION_NO_LZ4
      decompressedInput_ = std::make_unique<LZ4Reader>();
#endif
      break;
    default:
      break;
  }
  if (!decompressedInput_) {
    input_ = nullptr;
    return Status{StatusCode::DecompressionFailed,
                  compression == Compression::Zstd ? "zstd support is disabled"
                                                   : "lz4 support is disabled"};
  }

  decompressedInput_->reset(data, fileSize);
  if (auto status = decompressedInput_->status(); !status.ok()) {
    input_ = nullptr;
    decompressedInput_.reset();
    return status;
  }
  input_ = decompressedInput_.get();
  return StatusCode::Success;
}

Status GribReader::open(std::string_view filename, const ReaderOptions& options) {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  file_ = std::fopen(std::string(filename).c_str(), "rb");
  if (!file_) {
    const auto msg = internal::StrCat("failed to open \"", filename, "\"");
    return Status{StatusCode::OpenFailed, msg};
  }

  fileInput_ = std::make_unique<FileReader>(file_);
  return open(*fileInput_, options);
}

Status GribReader::open(std::ifstream& stream, const ReaderOptions& options) {
  if (!stream.is_open()) {
    return Status{StatusCode::OpenFailed, "input stream is not open"};
  }
  fileStreamInput_ = std::make_unique<FileStreamReader>(stream);
  return open(*fileStreamInput_, options);
}

void GribReader::close() {
  reset_();
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  fileInput_.reset();
  fileStreamInput_.reset();
}

void GribReader::reset_() {
  input_ = nullptr;
  decompressedInput_.reset();
  parameterTable_.reset();
  index_.clear();
}

Status GribReader::readIndex(const ProblemCallback& onProblem) {
  if (!input_) {
    const Status status{StatusCode::NotOpen};
    if (onProblem) {
      onProblem(status);
    }
    return status;
  }

  index_.clear();
  MessageScanner scanner{*input_, options_.scan, onProblem};
  while (auto location = scanner.next()) {
    index_.append(std::move(*location));
  }
  return scanner.status();
}

IReadable* GribReader::dataSource() {
  return input_;
}

const MessageIndex& GribReader::index() const {
  return index_;
}

size_t GribReader::size() const {
  return index_.size();
}

const MessageLocation* GribReader::get(size_t messageNumber) const {
  return index_.get(messageNumber);
}

std::optional<ByteOffset> GribReader::seek(size_t messageNumber) {
  return index_.seek(messageNumber);
}

size_t GribReader::tell() const {
  return index_.tell();
}

const MessageLocation* GribReader::next() {
  return index_.next();
}

const IParameterTable& GribReader::parameterTable() const {
  static const ParameterTable empty;
  return parameterTable_ ? *parameterTable_ : empty;
}

std::vector<const MessageLocation*> GribReader::select(const Predicates& predicates) const {
  DecodeCache cache;
  return index_.select(predicates, [this, &cache](const MessageLocation& location,
                                                  std::string_view name) {
    return resolve_(location, name, &cache);
  });
}

std::optional<AttributeValue> GribReader::attribute(const MessageLocation& location,
                                                    std::string_view name) const {
  DecodeCache cache;
  return resolve_(location, name, &cache);
}

std::optional<AttributeValue> GribReader::resolve_(const MessageLocation& location,
                                                   std::string_view name,
                                                   DecodeCache* cache) const {
  const auto& metadata = MetadataAttributes();
  if (const auto it = metadata.find(name); it != metadata.end()) {
    return it->second(location);
  }

  if (name == "shortName") {
    return shortName_(location);
  }
  if (name == "fullName" || name == "units") {
    const ParameterIdentity& id = location.parameterIdentity;
    const auto parameter = parameterTable().lookupParameterName(id.discipline, id.category, id.number);
    if (!parameter) {
      return std::nullopt;
    }
    return name == "fullName" ? parameter->fullName : parameter->units;
  }

  if (cache->location != &location) {
    cache->location = &location;
    cache->status = decodeMessage(location.messageNumber, &cache->message);
  }
  if (!cache->status.ok()) {
    return std::nullopt;
  }
  const DecodedMessage& message = cache->message;

  const auto& identification = IdentificationAttributes();
  if (const auto it = identification.find(name); it != identification.end()) {
    return it->second(message.identification);
  }
  for (const FieldView* view : {&message.grid.grid, &message.product.product,
                                &message.representation.representation}) {
    if (view->has(name)) {
      const auto value = view->value(name);
      if (!value) {
        return std::nullopt;
      }
      return *value;
    }
  }
  if (name == "level") {
    if (auto level = LevelOf(message.product.product)) {
      return *level;
    }
    return std::nullopt;
  }
  if (name == "validDate") {
    if (const auto date = ValidDate(location.referenceDate, message.product.product)) {
      return date->isoString();
    }
  }
  return std::nullopt;
}

Status GribReader::readRange_(ByteOffset offset, uint64_t length, ByteArray* output) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!input_) {
    return StatusCode::NotOpen;
  }
  std::byte* data = nullptr;
  const uint64_t bytesRead = input_->read(&data, offset, length);
  if (bytesRead != length) {
    const auto msg = internal::StrCat("read of ", length, " bytes at offset ", offset,
                                      " returned ", bytesRead, " bytes");
    return Status{StatusCode::ReadFailed, msg};
  }
  output->assign(data, data + length);
  return StatusCode::Success;
}

Status GribReader::readMessage(size_t messageNumber, ByteArray* output) const {
  const MessageLocation* location = index_.get(messageNumber);
  if (!location) {
    const auto msg = internal::StrCat("message ", messageNumber, " is not in the index of ",
                                      index_.size(), " messages");
    return Status{StatusCode::MessageNotFound, msg};
  }
  return readRange_(location->fileOffset, location->declaredTotalLength, output);
}

Status GribReader::readSection(size_t messageNumber, SectionKind section, ByteArray* output) const {
  const MessageLocation* location = index_.get(messageNumber);
  if (!location) {
    const auto msg = internal::StrCat("message ", messageNumber, " is not in the index of ",
                                      index_.size(), " messages");
    return Status{StatusCode::MessageNotFound, msg};
  }
  const auto& offset = location->section(section);
  if (!offset) {
    const auto msg = internal::StrCat("message ", messageNumber, " has no section ", int(section),
                                      " (", SectionKindString(section), ")");
    return Status{StatusCode::InvalidSection, msg};
  }
  return readRange_(offset->byteOffset, offset->byteLength, output);
}

Status GribReader::decodeMessage(size_t messageNumber, DecodedMessage* message) const {
  const MessageLocation* location = index_.get(messageNumber);
  if (!location) {
    const auto msg = internal::StrCat("message ", messageNumber, " is not in the index of ",
                                      index_.size(), " messages");
    return Status{StatusCode::MessageNotFound, msg};
  }

  DecodedMessage result;
  result.location = *location;
  ByteArray bytes;

  if (auto status = readSection(messageNumber, SectionKind::Indicator, &bytes); !status.ok()) {
    return status;
  }
  if (auto status = SectionDecoder::ParseIndicator(bytes.data(), bytes.size(), &result.indicator);
      !status.ok()) {
    return status;
  }

  if (auto status = readSection(messageNumber, SectionKind::Identification, &bytes);
      !status.ok()) {
    return status;
  }
  if (auto status =
        SectionDecoder::ParseIdentification(bytes.data(), bytes.size(), &result.identification);
      !status.ok()) {
    return status;
  }

  if (location->section(SectionKind::LocalUse)) {
    if (auto status = readSection(messageNumber, SectionKind::LocalUse, &bytes); !status.ok()) {
      return status;
    }
    result.localUse = ByteArray(bytes.begin() + SectionHeaderLength, bytes.end());
  }

  if (auto status = readSection(messageNumber, SectionKind::GridDefinition, &bytes);
      !status.ok()) {
    return status;
  }
  if (auto status = SectionDecoder::ParseGridDefinition(bytes.data(), bytes.size(), &result.grid);
      !status.ok()) {
    return status;
  }

  if (auto status = readSection(messageNumber, SectionKind::ProductDefinition, &bytes);
      !status.ok()) {
    return status;
  }
  if (auto status =
        SectionDecoder::ParseProductDefinition(bytes.data(), bytes.size(), &result.product);
      !status.ok()) {
    return status;
  }

  if (auto status = readSection(messageNumber, SectionKind::DataRepresentation, &bytes);
      !status.ok()) {
    return status;
  }
  if (auto status = SectionDecoder::ParseDataRepresentation(bytes.data(), bytes.size(),
                                                            &result.representation);
      !status.ok()) {
    return status;
  }

  *message = std::move(result);
  return StatusCode::Success;
}

BitmapPtr GribReader::resolveBitmap(size_t messageNumber) const {
  const MessageLocation* location = index_.get(messageNumber);
  return location ? location->resolveBitmap() : nullptr;
}

Status GribReader::readValues(size_t messageNumber, ICodec& codec,
                              std::vector<float>* values) const {
  DecodedMessage message;
  if (auto status = decodeMessage(messageNumber, &message); !status.ok()) {
    return status;
  }
  ByteArray data;
  if (auto status = readSection(messageNumber, SectionKind::Data, &data); !status.ok()) {
    return status;
  }

  std::vector<float> packed;
  if (auto status = codec.decodeData(message.representation, data.data() + SectionHeaderLength,
                                     data.size() - SectionHeaderLength, &packed);
      !status.ok()) {
    return status;
  }

  const MessageLocation& location = message.location;
  if (location.bitmapIndicator == uint8_t(BitmapIndicator::None)) {
    *values = std::move(packed);
    return StatusCode::Success;
  }

  const BitmapPtr bitmap = location.resolveBitmap();
  if (!bitmap) {
    const auto msg = internal::StrCat("message ", messageNumber, " has bitmap indicator ",
                                      int(location.bitmapIndicator), " but no bitmap to apply");
    return Status{StatusCode::MissingBitmap, msg};
  }
  std::vector<bool> mask;
  if (auto status = codec.decodeBitmap(bitmap->bytes.data(), bitmap->bytes.size(),
                                       location.gridPointCount, &mask);
      !status.ok()) {
    return status;
  }

  values->assign(location.gridPointCount, std::numeric_limits<float>::quiet_NaN());
  size_t nextPacked = 0;
  for (size_t i = 0; i < mask.size() && i < values->size(); ++i) {
    if (!mask[i]) {
      continue;
    }
    if (nextPacked >= packed.size()) {
      const auto msg = internal::StrCat("bitmap of message ", messageNumber,
                                        " selects more points than the ", packed.size(),
                                        " packed values");
      return Status{StatusCode::InvalidSection, msg};
    }
    (*values)[i] = packed[nextPacked++];
  }
  return StatusCode::Success;
}

std::string GribReader::shortName_(const MessageLocation& location) const {
  const ParameterIdentity& id = location.parameterIdentity;
  if (const auto parameter =
        parameterTable().lookupParameterName(id.discipline, id.category, id.number)) {
    return parameter->shortName;
  }
  return internal::StrCat("VAR", int(id.discipline), "-", int(id.category), "-", int(id.number));
}

std::vector<std::string> GribReader::levels() const {
  std::vector<std::string> result;
  std::set<std::string> seen;
  ByteArray bytes;
  for (const auto& location : index_) {
    ProductDefinitionSection product;
    if (!readSection(location.messageNumber, SectionKind::ProductDefinition, &bytes).ok() ||
        !SectionDecoder::ParseProductDefinition(bytes.data(), bytes.size(), &product).ok()) {
      continue;
    }
    if (auto level = LevelOf(product.product); level && seen.insert(*level).second) {
      result.push_back(std::move(*level));
    }
  }
  return result;
}

std::vector<std::string> GribReader::variables() const {
  std::vector<std::string> result;
  std::set<std::string> seen;
  for (const auto& location : index_) {
    auto name = shortName_(location);
    if (seen.insert(name).second) {
      result.push_back(std::move(name));
    }
  }
  return result;
}

}  // namespace grib2
