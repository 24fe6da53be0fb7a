// Prints the index of a GRIB2 file as JSON, one object per field.
#define GRIB2_IMPLEMENTATION
#include <grib2/grib2.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string_view>

nlohmann::json ToJson(const grib2::AttributeValue& value) {
  return std::visit(
    [](const auto& v) {
      return nlohmann::json(v);
    },
    value);
}

nlohmann::json ToJson(const grib2::FieldView& view) {
  auto object = nlohmann::json::object();
  if (!view.valid()) {
    return object;
  }
  for (const auto& field : view.layout()->fields) {
    if (const auto value = view.value(field.name)) {
      object[std::string(field.name)] = *value;
    }
  }
  return object;
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <input.grib2>" << std::endl;
    return 1;
  }
  const char* inputFilename = argv[1];

  grib2::GribReader reader;
  {
    const auto res = reader.open(std::string_view(inputFilename));
    if (!res.ok()) {
      std::cerr << "Failed to open " << inputFilename << " for reading: " << res.message
                << std::endl;
      return 1;
    }
  }

  const auto res = reader.readIndex([](const grib2::Status& problem) {
    std::cerr << "warning: " << problem.message << std::endl;
  });
  if (!res.ok()) {
    std::cerr << "scan stopped early: " << res.message << std::endl;
  }

  auto fields = nlohmann::json::array();
  for (const auto& location : reader.index()) {
    nlohmann::json field;
    for (const std::string_view name :
         {"messageNumber", "fileOffset", "discipline", "refDate", "validDate", "shortName",
          "fullName", "units", "level", "isSubmessage"}) {
      if (const auto value = reader.attribute(location, name)) {
        field[std::string(name)] = ToJson(*value);
      }
    }

    grib2::DecodedMessage message;
    if (const auto status = reader.decodeMessage(location.messageNumber, &message);
        status.ok()) {
      field["grid"] = ToJson(message.grid.grid);
      field["grid"]["templateNumber"] = message.grid.templateNumber;
      field["product"] = ToJson(message.product.product);
      field["product"]["templateNumber"] = message.product.templateNumber;
      field["dataRepresentation"] = ToJson(message.representation.representation);
      field["dataRepresentation"]["templateNumber"] = message.representation.templateNumber;
    } else {
      field["error"] = status.message;
    }
    fields.push_back(std::move(field));
  }

  std::cout << fields.dump(2) << std::endl;
  reader.close();
  return 0;
}
