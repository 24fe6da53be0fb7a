#define GRIB2_IMPLEMENTATION
#include <grib2/grib2.hpp>

#include <fmt/core.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using SectionOffsets = std::array<std::optional<grib2::SectionOffset>, grib2::SectionSlots>;

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(msg, std::forward<T>(args)...);
}

std::string ToString(const grib2::SectionOffset& section) {
  return StrFormat("{}@{}+{}", int(section.sectionNumber), section.byteOffset,
                   section.byteLength);
}

std::string ToString(const SectionOffsets& sections) {
  std::stringstream ss;
  ss << "[";
  bool first = true;
  for (const auto& section : sections) {
    if (!section) {
      continue;
    }
    if (!first) {
      ss << ", ";
    }
    ss << ToString(*section);
    first = false;
  }
  ss << "]";
  return ss.str();
}

std::string ToString(const grib2::MessageLocation& location) {
  std::string submessage = "no";
  if (location.isSubmessage) {
    submessage = StrFormat("from section {} at {}", int(*location.submessageBeginSection),
                           *location.submessageOffset);
  }
  return StrFormat(
    "[Field {}] offset={}, length={}, discipline={}, ref={}, parameter={}-{}, grid_template={}, "
    "points={}, product_template={}, representation_template={}, packed={}, bitmap={}, "
    "submessage={}, sections={}",
    location.messageNumber, location.fileOffset, location.declaredTotalLength,
    int(location.discipline), location.referenceDate.isoString(),
    int(location.parameterIdentity.category), int(location.parameterIdentity.number),
    location.gridTemplateNumber, location.gridPointCount, location.productTemplateNumber,
    location.representationTemplateNumber, location.numberOfPackedValues,
    int(location.bitmapIndicator), submessage, ToString(location.sectionOffsets));
}

std::string ToString(const grib2::FieldView& view) {
  if (!view.valid()) {
    return "<none>";
  }
  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (const auto& field : view.layout()->fields) {
    const auto value = view.value(field.name);
    if (!value) {
      continue;
    }
    if (!first) {
      ss << ", ";
    }
    ss << field.name << "=" << *value;
    first = false;
  }
  ss << "}";
  return ss.str();
}

void DumpRaw(grib2::IReadable& dataSource) {
  auto onProblem = [](const grib2::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };
  grib2::MessageScanner scanner{dataSource, {}, onProblem};
  while (auto location = scanner.next()) {
    std::cout << ToString(*location) << "\n";
  }
  std::cout << StrFormat("{} messages scanned, stopped at offset {}\n", scanner.messageCount(),
                         scanner.offset());
}

void DumpFields(grib2::IReadable& dataSource) {
  grib2::GribReader reader;
  auto status = reader.open(dataSource);
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }

  auto onProblem = [](const grib2::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };
  status = reader.readIndex(onProblem);
  if (!status.ok()) {
    std::cerr << "! scan ended early: " << status.message << "\n";
  }

  for (const auto& location : reader.index()) {
    const auto name = reader.attribute(location, "shortName");
    const auto level = reader.attribute(location, "level");
    std::cout << StrFormat("{}: {} {}\n", location.messageNumber,
                           name ? grib2::AttributeToString(*name) : "?",
                           level ? grib2::AttributeToString(*level) : "?");

    grib2::DecodedMessage message;
    status = reader.decodeMessage(location.messageNumber, &message);
    if (!status.ok()) {
      std::cerr << "! " << status.message << "\n";
      continue;
    }
    std::cout << StrFormat("  [Grid {}] {}\n", message.grid.templateNumber,
                           ToString(message.grid.grid));
    std::cout << StrFormat("  [Product {}] {}\n", message.product.templateNumber,
                           ToString(message.product.product));
    std::cout << StrFormat("  [Representation {}] {}\n", message.representation.templateNumber,
                           ToString(message.representation.representation));
  }

  reader.close();
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <input.grib2>\n";
    return 1;
  }

  const std::string inputFile = argv[1];
  std::ifstream input(inputFile, std::ios::binary);
  if (!input) {
    std::cerr << "! failed to open " << inputFile << "\n";
    return 1;
  }
  grib2::FileStreamReader dataSource{input};

  std::cout << "Scanned messages:\n";
  DumpRaw(dataSource);
  std::cout << "\nDecoded fields:\n";
  DumpFields(dataSource);

  return 0;
}
