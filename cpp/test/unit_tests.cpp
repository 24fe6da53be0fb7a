#define GRIB2_IMPLEMENTATION
#include <grib2/grib2.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <thread>

#ifndef GRIB2_COMPRESSION_NO_LZ4
#  include <lz4frame.h>
#endif
#ifndef GRIB2_COMPRESSION_NO_ZSTD
#  include <zstd.h>
#endif

using grib2::ByteArray;

void requireOk(const grib2::Status& status) {
  CAPTURE(status.code);
  CAPTURE(status.message);
  REQUIRE(status.ok());
}

ByteArray Bytes(std::initializer_list<uint8_t> values) {
  ByteArray bytes;
  for (const auto value : values) {
    bytes.push_back(std::byte(value));
  }
  return bytes;
}

ByteArray Concat(std::initializer_list<ByteArray> parts) {
  ByteArray result;
  for (const auto& part : parts) {
    grib2::internal::Append(result, part);
  }
  return result;
}

// A temperature field at 500 mb on a 4x3 lat/lon grid, 6 hour forecast
static grib2::MessageParts MakeParts(uint8_t category = 0, uint8_t number = 0,
                                     double pressure = 50000) {
  grib2::MessageParts parts;
  requireOk(grib2::MessageParts::Create(0, 0, 0, &parts));
  parts.identification.originatingCenter = 7;
  parts.identification.referenceDate = grib2::ReferenceDate{2022, 1, 2, 12, 0, 0};

  requireOk(parts.grid.set("shapeOfEarth", 6));
  requireOk(parts.grid.set("nx", 4));
  requireOk(parts.grid.set("ny", 3));
  requireOk(parts.grid.set("latitudeFirstGridpoint", 50));
  requireOk(parts.grid.set("longitudeFirstGridpoint", 350));
  requireOk(parts.grid.set("latitudeLastGridpoint", 40));
  requireOk(parts.grid.set("longitudeLastGridpoint", 10));
  requireOk(parts.grid.set("gridlengthXDirection", 5));
  requireOk(parts.grid.set("gridlengthYDirection", 5));

  auto& product = parts.product.product;
  requireOk(product.set("parameterCategory", category));
  requireOk(product.set("parameterNumber", number));
  requireOk(product.set("unitOfForecastTime", 1));
  requireOk(product.set("valueOfForecastTime", 6));
  requireOk(product.set("typeOfFirstFixedSurface", 100));
  requireOk(product.set("valueOfFirstFixedSurface", pressure));
  requireOk(product.set("typeOfSecondFixedSurface", 255));

  parts.representation.numberOfPackedValues = 12;
  requireOk(parts.representation.representation.set("nBitsPacking", 8));
  parts.data = ByteArray(12, std::byte(1));
  return parts;
}

static ByteArray WriteMessage(const grib2::MessageParts& parts) {
  grib2::BufferWriter output;
  grib2::GribWriter writer;
  writer.open(output);
  requireOk(writer.write(parts));
  writer.close();
  return output.buffer();
}

struct EncodedSections {
  ByteArray identification;
  ByteArray grid;
  ByteArray product;
  ByteArray representation;
  ByteArray bitmap;
  ByteArray data;
};

static EncodedSections EncodeSections(const grib2::MessageParts& parts) {
  EncodedSections sections;
  grib2::SectionDecoder::WriteIdentification(parts.identification, &sections.identification);
  grib2::SectionDecoder::WriteGridDefinition(parts.grid, &sections.grid);
  grib2::SectionDecoder::WriteProductDefinition(parts.product, &sections.product);
  grib2::SectionDecoder::WriteDataRepresentation(parts.representation,
                                                 &sections.representation);
  grib2::SectionDecoder::WriteRawSection(grib2::SectionKind::Bitmap,
                                         Bytes({uint8_t(parts.bitmapIndicator)}),
                                         &sections.bitmap);
  grib2::SectionDecoder::WriteRawSection(grib2::SectionKind::Data, parts.data, &sections.data);
  return sections;
}

// Wraps already encoded sections in section 0 and the trailer
static ByteArray Assemble(std::initializer_list<ByteArray> sections) {
  const ByteArray body = Concat(sections);
  grib2::IndicatorSection indicator;
  indicator.totalLength = grib2::IndicatorSectionLength + body.size() + 4;
  ByteArray message;
  grib2::SectionDecoder::WriteIndicator(indicator, &message);
  grib2::internal::Append(message, body);
  grib2::internal::Append(message, Bytes({'7', '7', '7', '7'}));
  return message;
}

// Expands bitmaps bit by bit and data one value per byte
struct ByteCodec : grib2::ICodec {
  grib2::Status decodeBitmap(const std::byte* data, uint64_t size, uint32_t numberOfPoints,
                             std::vector<bool>* bitmap) override {
    if (size * 8 < numberOfPoints) {
      return grib2::StatusCode::InvalidSection;
    }
    bitmap->resize(numberOfPoints);
    for (uint32_t i = 0; i < numberOfPoints; ++i) {
      (*bitmap)[i] = (uint8_t(data[i / 8]) >> (7 - i % 8)) & 1;
    }
    return grib2::StatusCode::Success;
  }

  grib2::Status decodeData(const grib2::DataRepresentationSection& representation,
                           const std::byte* data, uint64_t size,
                           std::vector<float>* values) override {
    if (size < representation.numberOfPackedValues) {
      return grib2::StatusCode::InvalidSection;
    }
    values->clear();
    for (uint32_t i = 0; i < representation.numberOfPackedValues; ++i) {
      values->push_back(float(uint8_t(data[i])));
    }
    return grib2::StatusCode::Success;
  }
};

// Records the reads a scan issues against an in-memory buffer
struct CountingReader : grib2::IReadable {
  explicit CountingReader(const ByteArray& bytes)
      : buffer(bytes.data(), bytes.size()) {}

  uint64_t size() const override {
    return buffer.size();
  }

  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override {
    largestRead = std::max(largestRead, size);
    const uint64_t bytesRead = buffer.read(output, offset, size);
    totalRead += bytesRead;
    return bytesRead;
  }

  grib2::BufferReader buffer;
  uint64_t largestRead = 0;
  uint64_t totalRead = 0;
};

struct ScanResult {
  std::vector<grib2::MessageLocation> locations;
  std::vector<grib2::Status> problems;
  grib2::Status status;
};

static ScanResult ScanAll(const ByteArray& bytes, const grib2::ScanOptions& options = {}) {
  ScanResult result;
  grib2::BufferReader reader{bytes.data(), bytes.size()};
  grib2::MessageScanner scanner{reader, options, [&](const grib2::Status& status) {
                                  result.problems.push_back(status);
                                }};
  while (auto location = scanner.next()) {
    result.locations.push_back(std::move(*location));
  }
  result.status = scanner.status();
  return result;
}

TEST_CASE("internal::Parse*()", "[sections]") {
  SECTION("sign-magnitude") {
    const auto negative = Bytes({0x80, 0x00, 0x00, 0x2A});
    REQUIRE(grib2::internal::ParseSignMagnitude(negative.data(), 4) == -42);
    const auto positive = Bytes({0x00, 0x00, 0x01, 0x00});
    REQUIRE(grib2::internal::ParseSignMagnitude(positive.data(), 4) == 256);
    const auto oneOctet = Bytes({0x81});
    REQUIRE(grib2::internal::ParseSignMagnitude(oneOctet.data(), 1) == -1);
  }

  SECTION("write sign-magnitude") {
    std::array<std::byte, 2> output;
    grib2::internal::WriteSignMagnitude(-5, 2, output.data());
    REQUIRE(uint8_t(output[0]) == 0x80);
    REQUIRE(uint8_t(output[1]) == 0x05);
  }

  SECTION("uint64_t") {
    const auto input = Bytes({0x12, 0x34, 0x56, 0x78, 0x90, 0xab, 0xcd, 0xef});
    REQUIRE(grib2::internal::ParseUint64(input.data()) == 0x1234567890abcdefull);
  }
}

TEST_CASE("MessageScanner", "[scanner]") {
  const ByteArray message = WriteMessage(MakeParts());

  SECTION("Single message") {
    const auto result = ScanAll(message);
    requireOk(result.status);
    REQUIRE(result.problems.empty());
    REQUIRE(result.locations.size() == 1);

    const auto& location = result.locations[0];
    REQUIRE(location.fileOffset == 0);
    REQUIRE(location.declaredTotalLength == message.size());
    const auto& trailer = location.section(grib2::SectionKind::End);
    REQUIRE(trailer.has_value());
    REQUIRE(location.declaredTotalLength == trailer->byteOffset + 4 - location.fileOffset);
    REQUIRE(location.messageNumber == 1);
    REQUIRE(location.discipline == 0);
    REQUIRE(location.edition == 2);
    REQUIRE_FALSE(location.isSubmessage);
    REQUIRE_FALSE(location.submessageBeginSection.has_value());
    REQUIRE(location.referenceDate.year == 2022);
    REQUIRE(location.referenceDate.hour == 12);
    REQUIRE(location.gridPointCount == 12);
    REQUIRE(location.gridTemplateNumber == 0);
    REQUIRE(location.productTemplateNumber == 0);
    REQUIRE(location.representationTemplateNumber == 0);
    REQUIRE(location.numberOfPackedValues == 12);
    REQUIRE(location.parameterIdentity == grib2::ParameterIdentity{0, 0, 0});
    REQUIRE(location.bitmapIndicator == 255);
    REQUIRE_FALSE(location.section(grib2::SectionKind::LocalUse).has_value());

    const auto& grid = location.section(grib2::SectionKind::GridDefinition);
    REQUIRE(grid.has_value());
    REQUIRE(grid->byteOffset == 16 + 21);
    REQUIRE(grid->byteLength == 72);
  }

  SECTION("Concatenated messages") {
    const ByteArray bytes = Concat({message, message, message});
    const auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 3);
    for (size_t i = 0; i < 3; ++i) {
      CAPTURE(i);
      REQUIRE(result.locations[i].fileOffset == i * message.size());
      REQUIRE(result.locations[i].messageNumber == i + 1);
    }
  }

  SECTION("Leading junk") {
    const ByteArray bytes = Concat({ByteArray(37, std::byte('x')), message});
    const auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.problems.empty());
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].fileOffset == 37);
  }

  SECTION("Junk spanning several scan windows") {
    grib2::ScanOptions options;
    options.windowSize = 16;
    const ByteArray bytes = Concat({ByteArray(100, std::byte('x')), message, message});
    const auto result = ScanAll(bytes, options);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 2);
    REQUIRE(result.locations[0].fileOffset == 100);
    REQUIRE(result.locations[1].fileOffset == 100 + message.size());
  }

  SECTION("Trailing junk") {
    const ByteArray bytes = Concat({message, ByteArray(10, std::byte('x'))});
    const auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.problems.size() == 1);
    REQUIRE(result.problems[0].code == grib2::StatusCode::FormatError);
  }

  SECTION("Junk only") {
    const auto result = ScanAll(ByteArray(5000, std::byte('x')));
    requireOk(result.status);
    REQUIRE(result.locations.empty());
    REQUIRE(result.problems.empty());
  }

  SECTION("GRIB1 messages are skipped") {
    ByteArray legacy = Bytes({'G', 'R', 'I', 'B', 0, 0, 20, 1});
    legacy.resize(20, std::byte(0));
    const ByteArray bytes = Concat({legacy, message});

    auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.problems.empty());
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].fileOffset == 20);

    grib2::ScanOptions options;
    options.reportSkippedLegacy = true;
    result = ScanAll(bytes, options);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.problems.size() == 1);
    REQUIRE(result.problems[0].code == grib2::StatusCode::UnsupportedEdition);
  }

  SECTION("Unsupported edition") {
    ByteArray bytes = message;
    bytes[7] = std::byte(3);
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::UnsupportedEdition);
    REQUIRE(result.locations.empty());
    REQUIRE(result.problems.size() == 1);
  }

  SECTION("Truncated tail keeps earlier messages") {
    ByteArray bytes = Concat({message, message});
    bytes.resize(bytes.size() - 10);
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::TruncatedMessage);
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].fileOffset == 0);
  }

  SECTION("Magic at the end of the stream") {
    const ByteArray bytes = Concat({message, Bytes({'G', 'R', 'I', 'B', 0, 0})});
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::TruncatedMessage);
    REQUIRE(result.locations.size() == 1);
  }

  SECTION("Out of order sections") {
    ByteArray bytes = message;
    // Number octet of section 4
    const size_t productOffset = 16 + 21 + 72;
    REQUIRE(uint8_t(bytes[productOffset + 4]) == 4);
    bytes[productOffset + 4] = std::byte(5);
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::SectionOrder);
    REQUIRE(result.locations.empty());
  }

  SECTION("Trailer at the wrong place") {
    ByteArray bytes = message;
    // Declare four more bytes than the message holds
    bytes[15] = std::byte(uint8_t(bytes[15]) + 4);
    bytes = Concat({bytes, ByteArray(4, std::byte(0))});
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::FormatError);
    REQUIRE(result.locations.empty());
  }

  SECTION("Section crossing the declared end") {
    ByteArray bytes = message;
    bytes[15] = std::byte(uint8_t(bytes[15]) - 8);
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::FormatError);
  }

  SECTION("shouldStop ends the scan between messages") {
    const ByteArray bytes = Concat({message, message, message});
    grib2::BufferReader reader{bytes.data(), bytes.size()};
    grib2::ScanOptions options;
    size_t seen = 0;
    options.shouldStop = [&seen] {
      return seen >= 2;
    };
    grib2::MessageScanner scanner{reader, options};
    while (scanner.next()) {
      ++seen;
    }
    requireOk(scanner.status());
    REQUIRE(seen == 2);
    REQUIRE(scanner.messageCount() == 2);
  }

  SECTION("Local use and data sections are stepped over") {
    auto parts = MakeParts();
    parts.localUse = ByteArray(64 * 1024, std::byte(2));
    parts.data = ByteArray(1024 * 1024, std::byte(1));
    const ByteArray bytes = WriteMessage(parts);

    CountingReader reader{bytes};
    grib2::ScanOptions options;
    grib2::MessageScanner scanner{reader, options};
    const auto location = scanner.next();
    REQUIRE(location.has_value());
    REQUIRE_FALSE(scanner.next().has_value());
    requireOk(scanner.status());
    REQUIRE(location->section(grib2::SectionKind::Data)->byteLength == 1024 * 1024 + 5);
    REQUIRE(location->section(grib2::SectionKind::LocalUse)->byteLength == 64 * 1024 + 5);
    REQUIRE(reader.largestRead <= options.windowSize);
    REQUIRE(reader.totalRead < 16 * 1024);
  }

  SECTION("Data section past the end of the stream") {
    auto parts = MakeParts();
    parts.data = ByteArray(4096, std::byte(1));
    ByteArray bytes = WriteMessage(parts);
    bytes.resize(bytes.size() - 1000);
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::TruncatedMessage);
    REQUIRE(result.locations.empty());
  }

  SECTION("Invalid options") {
    grib2::ScanOptions options;
    options.windowSize = 8;
    const auto result = ScanAll(message, options);
    REQUIRE(result.status.code == grib2::StatusCode::InvalidScanOptions);
    REQUIRE(result.locations.empty());
  }
}

TEST_CASE("Submessages", "[scanner]") {
  auto parts = MakeParts();
  const auto first = EncodeSections(parts);
  requireOk(parts.product.product.set("parameterCategory", 2));
  requireOk(parts.product.product.set("parameterNumber", 3));
  const auto second = EncodeSections(parts);

  SECTION("Restart at section 4") {
    const ByteArray bytes =
      Assemble({first.identification, first.grid, first.product, first.representation,
                first.bitmap, first.data, second.product, second.representation, second.bitmap,
                second.data});
    const auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 2);

    const auto& a = result.locations[0];
    const auto& b = result.locations[1];
    REQUIRE_FALSE(a.isSubmessage);
    REQUIRE(b.isSubmessage);
    REQUIRE(b.submessageBeginSection == uint8_t(4));
    const uint64_t restartOffset = 16 + first.identification.size() + first.grid.size() +
                                   first.product.size() + first.representation.size() +
                                   first.bitmap.size() + first.data.size();
    REQUIRE(b.submessageOffset == restartOffset);
    REQUIRE(b.fileOffset == a.fileOffset);
    REQUIRE(b.declaredTotalLength == a.declaredTotalLength);
    REQUIRE(b.messageNumber == 2);
    REQUIRE(b.parameterIdentity == grib2::ParameterIdentity{0, 2, 3});
    REQUIRE(a.parameterIdentity == grib2::ParameterIdentity{0, 0, 0});
    REQUIRE(b.referenceDate == a.referenceDate);
    REQUIRE(b.gridPointCount == 12);
    // Sections before the restart carry over
    REQUIRE(b.section(grib2::SectionKind::GridDefinition)->byteOffset ==
            a.section(grib2::SectionKind::GridDefinition)->byteOffset);
    REQUIRE(b.section(grib2::SectionKind::ProductDefinition)->byteOffset == restartOffset);
    REQUIRE_FALSE(a.section(grib2::SectionKind::End).has_value());
    REQUIRE(b.section(grib2::SectionKind::End).has_value());
  }

  SECTION("Restart at section 3") {
    const ByteArray bytes =
      Assemble({first.identification, first.grid, first.product, first.representation,
                first.bitmap, first.data, second.grid, second.product, second.representation,
                second.bitmap, second.data});
    const auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 2);
    REQUIRE(result.locations[1].isSubmessage);
    REQUIRE(result.locations[1].submessageBeginSection == uint8_t(3));
  }

  SECTION("Restart at section 2") {
    ByteArray localUse;
    grib2::SectionDecoder::WriteRawSection(grib2::SectionKind::LocalUse, Bytes({4, 5, 6}),
                                           &localUse);
    const ByteArray bytes =
      Assemble({first.identification, first.grid, first.product, first.representation,
                first.bitmap, first.data, localUse, second.grid, second.product,
                second.representation, second.bitmap, second.data});
    const auto result = ScanAll(bytes);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 2);

    const auto& a = result.locations[0];
    const auto& b = result.locations[1];
    REQUIRE_FALSE(a.section(grib2::SectionKind::LocalUse).has_value());
    REQUIRE(b.isSubmessage);
    REQUIRE(b.submessageBeginSection == uint8_t(2));
    const uint64_t restartOffset = 16 + first.identification.size() + first.grid.size() +
                                   first.product.size() + first.representation.size() +
                                   first.bitmap.size() + first.data.size();
    REQUIRE(b.submessageOffset == restartOffset);
    REQUIRE(b.section(grib2::SectionKind::LocalUse)->byteOffset == restartOffset);
    REQUIRE(b.section(grib2::SectionKind::GridDefinition)->byteOffset ==
            restartOffset + localUse.size());
    REQUIRE(b.parameterIdentity == grib2::ParameterIdentity{0, 2, 3});
  }

  SECTION("Restart at section 5 is rejected") {
    const ByteArray bytes =
      Assemble({first.identification, first.grid, first.product, first.representation,
                first.bitmap, first.data, second.representation, second.bitmap, second.data});
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::FormatError);
    REQUIRE(result.locations.empty());
  }

  SECTION("Trailer before section 7") {
    const ByteArray bytes = Assemble({first.identification, first.grid, first.product,
                                      first.representation, first.bitmap});
    const auto result = ScanAll(bytes);
    REQUIRE(result.status.code == grib2::StatusCode::SectionOrder);
  }
}

TEST_CASE("Bitmaps", "[scanner]") {
  auto parts = MakeParts();
  parts.bitmapIndicator = 0;
  parts.bitmap = Bytes({0xF0, 0xF0});
  parts.representation.numberOfPackedValues = 8;
  parts.data = Bytes({1, 2, 3, 4, 5, 6, 7, 8});
  const ByteArray withBitmap = WriteMessage(parts);
  parts.bitmapIndicator = 254;
  const ByteArray reusing = WriteMessage(parts);

  SECTION("Indicator 254 resolves to the previous bitmap") {
    const auto result = ScanAll(Concat({withBitmap, reusing}));
    requireOk(result.status);
    REQUIRE(result.problems.empty());
    REQUIRE(result.locations.size() == 2);

    const auto own = result.locations[0].resolveBitmap();
    REQUIRE(own != nullptr);
    REQUIRE(own->bytes == Bytes({0xF0, 0xF0}));
    REQUIRE(result.locations[1].bitmap == nullptr);
    const auto carried = result.locations[1].resolveBitmap();
    REQUIRE(carried == own);
    REQUIRE(carried->bytes == own->bytes);
  }

  SECTION("Indicator 254 without an earlier bitmap") {
    const auto result = ScanAll(reusing);
    requireOk(result.status);
    REQUIRE(result.locations.size() == 1);
    REQUIRE(result.locations[0].resolveBitmap() == nullptr);
    REQUIRE(result.problems.size() == 1);
    REQUIRE(result.problems[0].code == grib2::StatusCode::MissingBitmap);
  }
}

TEST_CASE("Scan() view", "[scanner]") {
  const ByteArray message = WriteMessage(MakeParts());
  const ByteArray bytes = Concat({message, message});
  grib2::BufferReader reader{bytes.data(), bytes.size()};

  auto view = grib2::Scan(reader);
  size_t count = 0;
  for (const auto& location : view) {
    ++count;
    REQUIRE(location.messageNumber == count);
  }
  REQUIRE(count == 2);

  // Every begin() starts over at offset 0
  auto it = view.begin();
  REQUIRE(it != view.end());
  REQUIRE(it->fileOffset == 0);
}

TEST_CASE("Concrete scenario", "[scanner]") {
  const ByteArray bytes = WriteMessage(MakeParts());
  const auto result = ScanAll(bytes);
  requireOk(result.status);
  REQUIRE(result.locations.size() == 1);
  REQUIRE(result.locations[0].discipline == 0);
  REQUIRE_FALSE(result.locations[0].isSubmessage);
  REQUIRE(result.locations[0].referenceDate.year == 2022);

  grib2::IdentificationSection identification;
  const auto& section = result.locations[0].section(grib2::SectionKind::Identification);
  requireOk(grib2::SectionDecoder::ParseIdentification(bytes.data() + section->byteOffset,
                                                       section->byteLength, &identification));
  REQUIRE(identification.originatingCenter == 7);
}

TEST_CASE("TemplateRegistry", "[templates]") {
  const auto& registry = grib2::TemplateRegistry::Instance();

  SECTION("Registered templates") {
    REQUIRE(registry.templateNumbers(grib2::SectionKind::GridDefinition) ==
            std::vector<grib2::TemplateNumber>{0, 1, 10, 20, 30, 31, 40, 41, 50, 32768, 32769});
    REQUIRE(registry.templateNumbers(grib2::SectionKind::ProductDefinition) ==
            std::vector<grib2::TemplateNumber>{0, 1, 2, 5, 6, 8, 9, 10, 11, 12, 15, 31, 32, 48});
    REQUIRE(registry.templateNumbers(grib2::SectionKind::DataRepresentation) ==
            std::vector<grib2::TemplateNumber>{0, 2, 3, 4, 40, 41, 42, 50});
    REQUIRE(registry.find(grib2::SectionKind::GridDefinition, 999) == nullptr);
  }

  SECTION("Template lengths match the WMO octet counts") {
    const auto length = [&](grib2::SectionKind kind, grib2::TemplateNumber number) {
      return registry.find(kind, number)->fixedByteLength();
    };
    // Section length minus the section 3, 4 and 5 headers
    REQUIRE(length(grib2::SectionKind::GridDefinition, 0) == 72 - 14);
    REQUIRE(length(grib2::SectionKind::GridDefinition, 1) == 84 - 14);
    REQUIRE(length(grib2::SectionKind::GridDefinition, 30) == 81 - 14);
    REQUIRE(length(grib2::SectionKind::ProductDefinition, 0) == 34 - 9);
    REQUIRE(length(grib2::SectionKind::ProductDefinition, 8) == 58 - 9);
    REQUIRE(length(grib2::SectionKind::DataRepresentation, 0) == 21 - 11);
    REQUIRE(length(grib2::SectionKind::DataRepresentation, 3) == 49 - 11);
  }

  SECTION("Every template encodes back to its own bytes") {
    for (const auto kind : {grib2::SectionKind::GridDefinition,
                            grib2::SectionKind::ProductDefinition,
                            grib2::SectionKind::DataRepresentation}) {
      for (const auto number : registry.templateNumbers(kind)) {
        CAPTURE(int(kind), number);
        const auto* layout = registry.find(kind, number);
        auto view = grib2::FieldView::Create(*layout);
        for (size_t i = 0; i < view.rawArray().size(); ++i) {
          requireOk(view.setRaw(i, int64_t(i % 100)));
        }
        ByteArray bytes;
        view.encode(&bytes);
        REQUIRE(bytes.size() == view.byteLength());

        grib2::FieldView decoded;
        uint64_t consumed = 0;
        requireOk(grib2::FieldView::Decode(*layout, bytes.data(), bytes.size(), &decoded,
                                           &consumed));
        REQUIRE(consumed == bytes.size());
        REQUIRE(decoded.rawArray() == view.rawArray());
      }
    }
  }
}

TEST_CASE("FieldView", "[templates]") {
  const auto& registry = grib2::TemplateRegistry::Instance();

  SECTION("Scaled fields set both raw elements") {
    auto product =
      grib2::FieldView::Create(*registry.find(grib2::SectionKind::ProductDefinition, 0));
    requireOk(product.set("valueOfFirstFixedSurface", 2.5));
    REQUIRE(product.value("scaleFactorOfFirstFixedSurface") == 1.0);
    REQUIRE(product.value("scaledValueOfFirstFixedSurface") == 25.0);
    REQUIRE(product.value("valueOfFirstFixedSurface") == 2.5);

    requireOk(product.set("valueOfFirstFixedSurface", -0.125));
    REQUIRE(product.value("scaleFactorOfFirstFixedSurface") == 3.0);
    REQUIRE(product.value("scaledValueOfFirstFixedSurface") == -125.0);

    // A missing scale factor reads as zero
    requireOk(product.setRaw(10, -127));
    REQUIRE(product.value("valueOfFirstFixedSurface") == 0.0);
  }

  SECTION("Grid lengths and coordinates") {
    auto grid = grib2::FieldView::Create(*registry.find(grib2::SectionKind::GridDefinition, 0));
    requireOk(grid.set("latitudeFirstGridpoint", 50));
    requireOk(grid.set("latitudeLastGridpoint", 40));
    requireOk(grid.set("longitudeFirstGridpoint", 350));
    requireOk(grid.set("longitudeLastGridpoint", 10));
    requireOk(grid.set("gridlengthXDirection", 0.25));
    requireOk(grid.set("gridlengthYDirection", 0.25));

    REQUIRE(grid.raw(11) == 50000000);
    REQUIRE(grid.raw(16) == 250000);
    REQUIRE(grid.dxSign() == -1);
    REQUIRE(grid.dySign() == -1);
    REQUIRE(grid.value("gridlengthXDirection") == -0.25);
    REQUIRE(grid.value("gridlengthYDirection") == -0.25);

    // Flipping the longitudes makes the grid run east
    requireOk(grid.set("longitudeFirstGridpoint", 0));
    REQUIRE(grid.dxSign() == 1);
    REQUIRE(grid.value("gridlengthXDirection") == 0.25);

    // Negative longitudes wrap into the unsigned range
    requireOk(grid.set("longitudeFirstGridpoint", -10));
    REQUIRE(grid.value("longitudeFirstGridpoint") == 350.0);

    // Coordinates in units of a basic angle
    requireOk(grid.setRaw(9, 1));
    requireOk(grid.setRaw(10, 1000));
    requireOk(grid.setRaw(11, 50000));
    REQUIRE(grid.value("latitudeFirstGridpoint") == 50.0);
  }

  SECTION("Projected grids are never sign-corrected in X") {
    auto grid = grib2::FieldView::Create(*registry.find(grib2::SectionKind::GridDefinition, 30));
    requireOk(grid.set("longitudeFirstGridpoint", 350));
    requireOk(grid.set("gridlengthXDirection", 3000));
    REQUIRE(grid.dxSign() == 1);
    REQUIRE(grid.raw(14) == 3000000);
    REQUIRE(grid.value("gridlengthXDirection") == 3000.0);
  }

  SECTION("Earth shape") {
    auto grid = grib2::FieldView::Create(*registry.find(grib2::SectionKind::GridDefinition, 0));
    requireOk(grid.set("shapeOfEarth", 6));
    REQUIRE(grid.value("earthRadius") == 6371229.0);

    requireOk(grid.set("shapeOfEarth", 1));
    requireOk(grid.set("scaleFactorOfRadiusOfSphericalEarth", 0));
    requireOk(grid.set("scaledValueOfRadiusOfSphericalEarth", 6371000));
    REQUIRE(grid.value("earthRadius") == 6371000.0);

    requireOk(grid.set("shapeOfEarth", 4));
    REQUIRE(grid.value("earthMajorAxis") == 6378137.0);
    double radius = 0;
    REQUIRE(grid.get("earthRadius", &radius).code == grib2::StatusCode::InvalidFieldValue);

    REQUIRE(grid.set("earthRadius", 1).code == grib2::StatusCode::ReadOnlyField);
  }

  SECTION("Unknown fields and values that do not fit") {
    auto grid = grib2::FieldView::Create(*registry.find(grib2::SectionKind::GridDefinition, 0));
    double value = 0;
    REQUIRE(grid.get("noSuchField", &value).code == grib2::StatusCode::UnknownField);
    REQUIRE(grid.set("noSuchField", 1).code == grib2::StatusCode::UnknownField);
    REQUIRE(grid.set("shapeOfEarth", 256).code == grib2::StatusCode::InvalidFieldValue);
    REQUIRE(grid.set("nx", -1).code == grib2::StatusCode::InvalidFieldValue);
    REQUIRE(grid.set("nx", 1.5).code == grib2::StatusCode::InvalidFieldValue);
    REQUIRE(grid.setRaw(7, int64_t(1) << 32).code == grib2::StatusCode::InvalidFieldValue);
    REQUIRE(grid.setRaw(1000, 0).code == grib2::StatusCode::InvalidFieldValue);
  }

  SECTION("Forecast time") {
    auto product =
      grib2::FieldView::Create(*registry.find(grib2::SectionKind::ProductDefinition, 0));
    requireOk(product.set("unitOfForecastTime", 1));
    requireOk(product.set("valueOfForecastTime", 6));
    REQUIRE(grib2::LeadTimeSeconds(product) == 21600);

    requireOk(product.set("leadTime", 7200));
    REQUIRE(product.raw(8) == 2);
    REQUIRE(product.set("leadTime", 5400).code == grib2::StatusCode::InvalidFieldValue);
    requireOk(product.set("unitOfForecastTime", 0));
    requireOk(product.set("leadTime", 5400));
    REQUIRE(product.value("valueOfForecastTime") == 90.0);

    const grib2::ReferenceDate reference{2022, 12, 31, 23, 0, 0};
    const auto valid = grib2::ValidDate(reference, product);
    REQUIRE(valid.has_value());
    REQUIRE(valid->isoString() == "2023-01-01T00:30:00");

    // Months have no fixed length
    requireOk(product.set("unitOfForecastTime", 3));
    REQUIRE_FALSE(grib2::LeadTimeSeconds(product).has_value());
    REQUIRE_FALSE(grib2::ValidDate(reference, product).has_value());
  }

  SECTION("Statistical periods repeat their time ranges") {
    auto product =
      grib2::FieldView::Create(*registry.find(grib2::SectionKind::ProductDefinition, 8));
    REQUIRE(product.byteLength() == 49);
    requireOk(product.set("numberOfTimeRanges", 2));
    REQUIRE(product.byteLength() == 49 + 12);
    REQUIRE(product.rawArray().size() == 29 + 6);

    requireOk(product.set("unitOfTimeRangeOfStatisticalProcess", 1));
    requireOk(product.set("timeRangeOfStatisticalProcess", 3));
    REQUIRE(grib2::DurationSeconds(product) == 10800);

    requireOk(product.set("yearOfEndOfTimePeriod", 2022));
    requireOk(product.set("monthOfEndOfTimePeriod", 1));
    requireOk(product.set("dayOfEndOfTimePeriod", 3));
    const auto valid = grib2::ValidDate(grib2::ReferenceDate{2022, 1, 2, 0, 0, 0}, product);
    REQUIRE(valid == grib2::ReferenceDate{2022, 1, 3, 0, 0, 0});

    requireOk(product.set("numberOfTimeRanges", 1));
    REQUIRE(product.byteLength() == 49);
  }
}

TEST_CASE("SectionDecoder", "[templates]") {
  auto parts = MakeParts();

  SECTION("Section 4 round trip") {
    grib2::ProductDefinitionSection section;
    section.templateNumber = 8;
    section.product = grib2::FieldView::Create(
      *grib2::TemplateRegistry::Instance().find(grib2::SectionKind::ProductDefinition, 8));
    requireOk(section.product.set("parameterCategory", 1));
    requireOk(section.product.set("parameterNumber", 8));
    requireOk(section.product.set("numberOfTimeRanges", 2));
    requireOk(section.product.set("valueOfFirstFixedSurface", -1.5));
    section.coordinateValues = {0x3F800000, 0x40000000};

    ByteArray bytes;
    grib2::SectionDecoder::WriteProductDefinition(section, &bytes);
    REQUIRE(bytes.size() == 9 + 61 + 8);

    grib2::ProductDefinitionSection decoded;
    requireOk(grib2::SectionDecoder::ParseProductDefinition(bytes.data(), bytes.size(), &decoded));
    REQUIRE(decoded.templateNumber == 8);
    REQUIRE(decoded.coordinateValues == section.coordinateValues);
    REQUIRE(decoded.product.value("valueOfFirstFixedSurface") == -1.5);
    REQUIRE(decoded.product.value("numberOfTimeRanges") == 2.0);

    ByteArray encoded;
    grib2::SectionDecoder::WriteProductDefinition(decoded, &encoded);
    REQUIRE(encoded == bytes);
  }

  SECTION("Decode() by section kind") {
    ByteArray bytes;
    grib2::SectionDecoder::WriteDataRepresentation(parts.representation, &bytes);
    grib2::TemplateNumber number = 99;
    grib2::FieldView view;
    requireOk(grib2::SectionDecoder::Decode(grib2::SectionKind::DataRepresentation, bytes.data(),
                                            bytes.size(), &number, &view));
    REQUIRE(number == 0);
    REQUIRE(view.kind() == grib2::SectionKind::DataRepresentation);
    REQUIRE(view.value("nBitsPacking") == 8.0);

    REQUIRE(grib2::SectionDecoder::Decode(grib2::SectionKind::Bitmap, bytes.data(), bytes.size(),
                                          &number, &view)
              .code == grib2::StatusCode::InvalidSection);
  }

  SECTION("Unknown template") {
    ByteArray bytes;
    grib2::SectionDecoder::WriteGridDefinition(parts.grid, &bytes);
    bytes[12] = std::byte(0x03);
    bytes[13] = std::byte(0xE7);

    grib2::GridDefinitionSection grid;
    const auto status = grib2::SectionDecoder::ParseGridDefinition(bytes.data(), bytes.size(), &grid);
    REQUIRE(status.code == grib2::StatusCode::UnknownTemplate);
    REQUIRE(grid.templateNumber == 999);
    REQUIRE(grid.numberOfDataPoints == 12);
  }

  SECTION("Setting nx and ny updates the point count") {
    requireOk(parts.grid.set("nx", 360));
    requireOk(parts.grid.set("ny", 181));
    REQUIRE(parts.grid.numberOfDataPoints == 360 * 181);
  }

  SECTION("Point counts beyond 32 bits are rejected") {
    requireOk(parts.grid.set("nx", 70000));
    const auto status = parts.grid.set("ny", 70000);
    REQUIRE(status.code == grib2::StatusCode::InvalidFieldValue);
    REQUIRE(parts.grid.grid.value("ny") == 3.0);
    REQUIRE(parts.grid.numberOfDataPoints == 70000 * 3);
  }

  SECTION("Section 1 keeps reserved octets") {
    parts.identification.reserved = Bytes({9, 8});
    ByteArray bytes;
    grib2::SectionDecoder::WriteIdentification(parts.identification, &bytes);
    REQUIRE(bytes.size() == 23);

    grib2::IdentificationSection decoded;
    requireOk(grib2::SectionDecoder::ParseIdentification(bytes.data(), bytes.size(), &decoded));
    REQUIRE(decoded.originatingCenter == 7);
    REQUIRE(decoded.referenceDate == parts.identification.referenceDate);
    REQUIRE(decoded.reserved == Bytes({9, 8}));
  }

  SECTION("Wrong section number") {
    ByteArray bytes;
    grib2::SectionDecoder::WriteGridDefinition(parts.grid, &bytes);
    grib2::ProductDefinitionSection product;
    REQUIRE(grib2::SectionDecoder::ParseProductDefinition(bytes.data(), bytes.size(), &product)
              .code == grib2::StatusCode::InvalidSection);
  }
}

TEST_CASE("Code tables", "[templates]") {
  REQUIRE(grib2::LevelDescription(100, 50000) == "500 mb");
  REQUIRE(grib2::LevelDescription(103, 2) == "2 m above ground");
  REQUIRE(grib2::LevelDescription(1, 0) == "surface");
  REQUIRE(grib2::TimeUnitSeconds(11) == 21600);
  REQUIRE_FALSE(grib2::TimeUnitSeconds(3).has_value());

  const auto table = grib2::ParameterTable::Wmo();
  const auto temperature = table.lookupParameterName(0, 0, 0);
  REQUIRE(temperature.has_value());
  REQUIRE(temperature->shortName == "TMP");
  REQUIRE_FALSE(table.lookupParameterName(0, 0, 250).has_value());
}

TEST_CASE("MessageIndex", "[index]") {
  grib2::MessageIndex index;
  REQUIRE(index.empty());
  REQUIRE(index.get(0) == nullptr);
  REQUIRE(index.get(1) == nullptr);

  for (uint32_t i = 1; i <= 3; ++i) {
    grib2::MessageLocation location;
    location.messageNumber = i;
    location.fileOffset = i * 100;
    index.append(location);
  }
  REQUIRE(index.size() == 3);
  REQUIRE(index.get(0) == nullptr);
  REQUIRE(index.get(4) == nullptr);
  REQUIRE(index.get(2)->fileOffset == 200);

  SECTION("seek, tell and next") {
    REQUIRE(index.tell() == 0);
    REQUIRE(index.next()->messageNumber == 1);
    REQUIRE(index.seek(3) == 300u);
    REQUIRE(index.tell() == 3);
    REQUIRE(index.next() == nullptr);
    REQUIRE_FALSE(index.seek(0).has_value());
    REQUIRE(index.tell() == 3);
  }

  SECTION("Iteration skips the sentinel") {
    size_t count = 0;
    for (const auto& location : index) {
      REQUIRE(location.messageNumber == ++count);
    }
    REQUIRE(count == 3);
  }

  SECTION("AttributeMatches") {
    using grib2::AttributeValue;
    REQUIRE(grib2::AttributeMatches(AttributeValue{int64_t(1)}, AttributeValue{1.0}));
    REQUIRE(grib2::AttributeMatches(AttributeValue{0.1 + 0.2}, AttributeValue{0.3}));
    REQUIRE_FALSE(grib2::AttributeMatches(AttributeValue{int64_t(1)}, AttributeValue{int64_t(2)}));
    REQUIRE_FALSE(
      grib2::AttributeMatches(AttributeValue{std::string("1")}, AttributeValue{int64_t(1)}));
    REQUIRE(grib2::AttributeMatches(AttributeValue{std::string("TMP")},
                                    AttributeValue{std::string("TMP")}));
  }
}

TEST_CASE("GribReader", "[index]") {
  auto temperature500 = MakeParts(0, 0, 50000);
  temperature500.localUse = Bytes({1, 2, 3});
  const ByteArray bytes = Concat({WriteMessage(temperature500), WriteMessage(MakeParts(2, 2, 50000)),
                                  WriteMessage(MakeParts(0, 0, 85000))});
  grib2::BufferReader buffer{bytes.data(), bytes.size()};

  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  requireOk(reader.readIndex());
  REQUIRE(reader.size() == 3);

  SECTION("get") {
    REQUIRE(reader.get(0) == nullptr);
    REQUIRE(reader.get(4) == nullptr);
    REQUIRE(reader.get(1)->parameterIdentity == grib2::ParameterIdentity{0, 0, 0});
    REQUIRE(reader.get(2)->parameterIdentity == grib2::ParameterIdentity{0, 2, 2});
  }

  SECTION("select is a conjunction") {
    auto matches = reader.select({{"shortName", std::string("TMP")}});
    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0]->messageNumber == 1);
    REQUIRE(matches[1]->messageNumber == 3);

    matches = reader.select({{"shortName", std::string("TMP")}, {"level", std::string("850 mb")}});
    REQUIRE(matches.size() == 1);
    REQUIRE(matches[0]->messageNumber == 3);

    // Field 1 has category 0 only, field 2 has number 2 only
    REQUIRE(reader.select({{"parameterCategory", int64_t(0)}, {"parameterNumber", int64_t(2)}})
              .empty());
    REQUIRE(reader.select({{"originatingCenter", int64_t(7)}}).size() == 3);
    REQUIRE(reader.select({{"latitudeFirstGridpoint", 50.0}}).size() == 3);
    REQUIRE(reader.select({{"nx", int64_t(4)}, {"nBitsPacking", int64_t(8)}}).size() == 3);
    REQUIRE(reader.select({{"noSuchAttribute", int64_t(0)}}).empty());
    REQUIRE(reader.select({}).size() == 3);
  }

  SECTION("attribute") {
    const auto* location = reader.get(1);
    REQUIRE(reader.attribute(*location, "year") == grib2::AttributeValue{int64_t(2022)});
    REQUIRE(reader.attribute(*location, "refDate") ==
            grib2::AttributeValue{std::string("2022-01-02T12:00:00")});
    REQUIRE(reader.attribute(*location, "validDate") ==
            grib2::AttributeValue{std::string("2022-01-02T18:00:00")});
    REQUIRE(reader.attribute(*location, "units") == grib2::AttributeValue{std::string("K")});
    REQUIRE(reader.attribute(*location, "level") == grib2::AttributeValue{std::string("500 mb")});
    REQUIRE(reader.attribute(*location, "earthRadius") == grib2::AttributeValue{6371229.0});
    REQUIRE_FALSE(reader.attribute(*location, "noSuchAttribute").has_value());
  }

  SECTION("levels and variables") {
    REQUIRE(reader.levels() == std::vector<std::string>{"500 mb", "850 mb"});
    REQUIRE(reader.variables() == std::vector<std::string>{"TMP", "UGRD"});
  }

  SECTION("seek and tell") {
    REQUIRE(reader.seek(2) == reader.get(2)->fileOffset);
    REQUIRE(reader.tell() == 2);
    REQUIRE(reader.next()->messageNumber == 3);
    REQUIRE(reader.next() == nullptr);
  }

  SECTION("readMessage and readSection") {
    ByteArray message;
    requireOk(reader.readMessage(2, &message));
    REQUIRE(message.size() == reader.get(2)->declaredTotalLength);
    REQUIRE(ByteArray(message.begin(), message.begin() + 4) == Bytes({'G', 'R', 'I', 'B'}));

    ByteArray section;
    requireOk(reader.readSection(1, grib2::SectionKind::LocalUse, &section));
    REQUIRE(section == Bytes({0, 0, 0, 8, 2, 1, 2, 3}));
    REQUIRE(reader.readSection(2, grib2::SectionKind::LocalUse, &section).code ==
            grib2::StatusCode::InvalidSection);
    REQUIRE(reader.readMessage(0, &message).code == grib2::StatusCode::MessageNotFound);
  }

  SECTION("decodeMessage") {
    grib2::DecodedMessage message;
    requireOk(reader.decodeMessage(1, &message));
    REQUIRE(message.indicator.totalLength == reader.get(1)->declaredTotalLength);
    REQUIRE(message.identification.originatingCenter == 7);
    REQUIRE(message.localUse == Bytes({1, 2, 3}));
    REQUIRE(message.grid.numberOfDataPoints == 12);
    REQUIRE(message.grid.grid.value("nx") == 4.0);
    REQUIRE(message.grid.grid.dxSign() == -1);
    REQUIRE(message.product.product.value("leadTime") == 21600.0);
    REQUIRE(message.representation.numberOfPackedValues == 12);
  }

  SECTION("readValues without a bitmap") {
    ByteCodec codec;
    std::vector<float> values;
    requireOk(reader.readValues(1, codec, &values));
    REQUIRE(values == std::vector<float>(12, 1.0f));
  }

  SECTION("close discards the index") {
    reader.close();
    REQUIRE(reader.size() == 0);
    ByteArray message;
    REQUIRE(reader.readMessage(1, &message).code == grib2::StatusCode::MessageNotFound);
    REQUIRE(reader.readIndex().code == grib2::StatusCode::NotOpen);
    REQUIRE(reader.readIndex(grib2::ProblemCallback{}).code == grib2::StatusCode::NotOpen);
  }
}

TEST_CASE("GribReader with unknown templates", "[index]") {
  ByteArray bytes = WriteMessage(MakeParts());
  // Grid definition template number
  bytes[16 + 21 + 12] = std::byte(0x03);
  bytes[16 + 21 + 13] = std::byte(0xE7);
  grib2::BufferReader buffer{bytes.data(), bytes.size()};

  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  std::vector<grib2::Status> problems;
  requireOk(reader.readIndex([&](const grib2::Status& status) {
    problems.push_back(status);
  }));
  REQUIRE(reader.size() == 1);
  REQUIRE(problems.size() == 1);
  REQUIRE(problems[0].code == grib2::StatusCode::UnknownTemplate);
  REQUIRE(reader.get(1)->gridTemplateNumber == 999);

  // Metadata still resolves; decoded fields exclude the record
  REQUIRE(reader.select({{"gridDefinitionTemplateNumber", int64_t(999)}}).size() == 1);
  REQUIRE(reader.select({{"originatingCenter", int64_t(7)}}).empty());

  grib2::DecodedMessage message;
  REQUIRE(reader.decodeMessage(1, &message).code == grib2::StatusCode::UnknownTemplate);
}

TEST_CASE("GribReader with unknown parameters", "[index]") {
  const ByteArray bytes = Concat({WriteMessage(MakeParts(0, 250)), WriteMessage(MakeParts())});
  grib2::BufferReader buffer{bytes.data(), bytes.size()};

  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  requireOk(reader.readIndex());
  REQUIRE(reader.variables() == std::vector<std::string>{"VAR0-0-250", "TMP"});

  const auto matches = reader.select({{"shortName", std::string("VAR0-0-250")}});
  REQUIRE(matches.size() == 1);
  REQUIRE(matches[0]->messageNumber == 1);
  REQUIRE_FALSE(reader.attribute(*matches[0], "fullName").has_value());
}

TEST_CASE("GribReader::readValues() with bitmaps", "[index]") {
  auto parts = MakeParts();
  parts.bitmapIndicator = 0;
  parts.bitmap = Bytes({0xF0, 0xF0});
  parts.representation.numberOfPackedValues = 8;
  parts.data = Bytes({1, 2, 3, 4, 5, 6, 7, 8});
  const ByteArray first = WriteMessage(parts);
  parts.bitmapIndicator = 254;
  const ByteArray second = WriteMessage(parts);
  const ByteArray bytes = Concat({first, second});
  grib2::BufferReader buffer{bytes.data(), bytes.size()};

  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  requireOk(reader.readIndex());
  REQUIRE(reader.resolveBitmap(2) == reader.resolveBitmap(1));

  ByteCodec codec;
  for (size_t n = 1; n <= 2; ++n) {
    CAPTURE(n);
    std::vector<float> values;
    requireOk(reader.readValues(n, codec, &values));
    REQUIRE(values.size() == 12);
    REQUIRE(values[0] == 1.0f);
    REQUIRE(values[3] == 4.0f);
    REQUIRE(std::isnan(values[4]));
    REQUIRE(std::isnan(values[7]));
    REQUIRE(values[8] == 5.0f);
    REQUIRE(values[11] == 8.0f);
  }
}

TEST_CASE("GribReader concurrent reads", "[index]") {
  ByteArray bytes;
  for (uint8_t i = 0; i < 8; ++i) {
    grib2::internal::Append(bytes, WriteMessage(MakeParts(0, i, 10000.0 * (i + 1))));
  }
  grib2::BufferReader buffer{bytes.data(), bytes.size()};

  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  requireOk(reader.readIndex());
  REQUIRE(reader.size() == 8);

  std::vector<ByteArray> expected(reader.size() + 1);
  for (size_t n = 1; n <= reader.size(); ++n) {
    requireOk(reader.readMessage(n, &expected[n]));
  }

  std::vector<size_t> mismatches(4, 0);
  std::vector<std::thread> threads;
  for (size_t t = 0; t < mismatches.size(); ++t) {
    threads.emplace_back([&, t] {
      for (int round = 0; round < 50; ++round) {
        for (size_t n = 1; n <= reader.size(); ++n) {
          ByteArray message;
          grib2::DecodedMessage decoded;
          if (!reader.readMessage(n, &message).ok() || message != expected[n] ||
              !reader.decodeMessage(n, &decoded).ok() ||
              decoded.location.parameterIdentity.number != n - 1) {
            ++mismatches[t];
          }
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  REQUIRE(mismatches == std::vector<size_t>(4, 0));
}

TEST_CASE("GribReader on files", "[index]") {
  const ByteArray bytes = WriteMessage(MakeParts());

  SECTION("FILE*") {
    std::FILE* file = std::tmpfile();
    REQUIRE(file != nullptr);
    REQUIRE(std::fwrite(bytes.data(), 1, bytes.size(), file) == bytes.size());
    std::rewind(file);

    grib2::FileReader input(file);
    grib2::GribReader reader;
    requireOk(reader.open(input));
    requireOk(reader.readIndex());
    REQUIRE(reader.size() == 1);
    ByteArray message;
    requireOk(reader.readMessage(1, &message));
    REQUIRE(message == bytes);
    reader.close();
    std::fclose(file);
  }

  SECTION("Missing file") {
    grib2::GribReader reader;
    REQUIRE(reader.open(std::string_view("does-not-exist.grib2")).code ==
            grib2::StatusCode::OpenFailed);
  }
}

#ifndef GRIB2_COMPRESSION_NO_ZSTD
TEST_CASE("zstd compressed files", "[index]") {
  const ByteArray bytes = Concat({WriteMessage(MakeParts()), WriteMessage(MakeParts(2, 2))});
  ByteArray compressed(ZSTD_compressBound(bytes.size()));
  const size_t size =
    ZSTD_compress(compressed.data(), compressed.size(), bytes.data(), bytes.size(), 1);
  REQUIRE_FALSE(ZSTD_isError(size));
  compressed.resize(size);
  REQUIRE(grib2::DetectCompression(compressed.data(), compressed.size()) ==
          grib2::Compression::Zstd);

  grib2::BufferReader buffer{compressed.data(), compressed.size()};
  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  REQUIRE(reader.dataSource() != &buffer);
  REQUIRE(reader.dataSource()->size() == bytes.size());
  requireOk(reader.readIndex());
  REQUIRE(reader.size() == 2);
  REQUIRE(reader.variables() == std::vector<std::string>{"TMP", "UGRD"});
}
#endif

#ifndef GRIB2_COMPRESSION_NO_LZ4
TEST_CASE("LZ4 compressed files", "[index]") {
  const ByteArray bytes = WriteMessage(MakeParts());
  ByteArray compressed(LZ4F_compressFrameBound(bytes.size(), nullptr));
  const size_t size = LZ4F_compressFrame(compressed.data(), compressed.size(), bytes.data(),
                                         bytes.size(), nullptr);
  REQUIRE_FALSE(LZ4F_isError(size));
  compressed.resize(size);

  grib2::BufferReader buffer{compressed.data(), compressed.size()};
  grib2::GribReader reader;
  requireOk(reader.open(buffer));
  requireOk(reader.readIndex());
  REQUIRE(reader.size() == 1);
  ByteArray message;
  requireOk(reader.readMessage(1, &message));
  REQUIRE(message == bytes);
}
#endif

TEST_CASE("GribWriter", "[writer]") {
  SECTION("Assembled message layout") {
    const ByteArray bytes = WriteMessage(MakeParts());
    REQUIRE(bytes.size() == 16 + 21 + 72 + 34 + 21 + 6 + 17 + 4);
    REQUIRE(ByteArray(bytes.begin(), bytes.begin() + 4) == Bytes({'G', 'R', 'I', 'B'}));
    REQUIRE(uint8_t(bytes[7]) == 2);
    REQUIRE(grib2::internal::ParseUint64(bytes.data() + 8) == bytes.size());
    REQUIRE(ByteArray(bytes.end() - 4, bytes.end()) == Bytes({'7', '7', '7', '7'}));
  }

  SECTION("Copying a multi-field message writes it once") {
    auto parts = MakeParts();
    const auto first = EncodeSections(parts);
    requireOk(parts.product.product.set("parameterNumber", 2));
    const auto second = EncodeSections(parts);
    const ByteArray multi =
      Assemble({first.identification, first.grid, first.product, first.representation,
                first.bitmap, first.data, second.product, second.representation, second.bitmap,
                second.data});
    const ByteArray single = WriteMessage(MakeParts(2, 2));
    const ByteArray bytes = Concat({multi, single});

    grib2::BufferReader buffer{bytes.data(), bytes.size()};
    grib2::GribReader reader;
    requireOk(reader.open(buffer));
    requireOk(reader.readIndex());
    REQUIRE(reader.size() == 3);

    grib2::BufferWriter output;
    grib2::GribWriter writer;
    writer.open(output);
    for (size_t n = 1; n <= reader.size(); ++n) {
      requireOk(writer.write(reader, n));
    }
    REQUIRE(writer.messageCount() == 2);
    REQUIRE(output.buffer() == bytes);

    REQUIRE(writer.write(reader, 4).code == grib2::StatusCode::MessageNotFound);
  }

  SECTION("Selected fields copy to a new file") {
    const ByteArray bytes = Concat({WriteMessage(MakeParts(0, 0)), WriteMessage(MakeParts(2, 2))});
    grib2::BufferReader buffer{bytes.data(), bytes.size()};
    grib2::GribReader reader;
    requireOk(reader.open(buffer));
    requireOk(reader.readIndex());

    std::stringstream stream;
    grib2::GribWriter writer;
    writer.open(stream);
    for (const auto* location : reader.select({{"shortName", std::string("UGRD")}})) {
      requireOk(writer.write(reader, location->messageNumber));
    }
    writer.close();

    const std::string written = stream.str();
    const ByteArray copied(reinterpret_cast<const std::byte*>(written.data()),
                           reinterpret_cast<const std::byte*>(written.data()) + written.size());
    REQUIRE(copied == WriteMessage(MakeParts(2, 2)));
  }

  SECTION("Errors") {
    grib2::BufferWriter output;
    grib2::GribWriter writer;
    REQUIRE(writer.write(MakeParts()).code == grib2::StatusCode::NotOpen);

    writer.open(output);
    auto parts = MakeParts();
    parts.grid.templateNumber = 1;
    REQUIRE(writer.write(parts).code == grib2::StatusCode::InvalidSection);
    parts = grib2::MessageParts{};
    REQUIRE(writer.write(parts).code == grib2::StatusCode::InvalidSection);
    REQUIRE(output.size() == 0);

    REQUIRE(grib2::MessageParts::Create(0, 0, 7, &parts).code ==
            grib2::StatusCode::UnknownTemplate);
  }
}
