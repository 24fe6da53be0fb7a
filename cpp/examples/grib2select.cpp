#define GRIB2_IMPLEMENTATION
#include <grib2/grib2.hpp>

#include <fmt/core.h>

#include <cstdlib>
#include <iostream>
#include <string>

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(msg, std::forward<T>(args)...);
}

// "500" becomes an integer, "0.5" a double, anything else a string
grib2::AttributeValue ParseValue(const std::string& text) {
  char* end = nullptr;
  const long long integer = std::strtoll(text.c_str(), &end, 10);
  if (!text.empty() && *end == '\0') {
    return int64_t(integer);
  }
  const double real = std::strtod(text.c_str(), &end);
  if (!text.empty() && *end == '\0') {
    return real;
  }
  return text;
}

// Copies every message holding a field that matches all key=value predicates.
int main(int argc, char* argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <input.grib2> <output.grib2> [key=value ...]\n";
    return 1;
  }

  grib2::Predicates predicates;
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto separator = arg.find('=');
    if (separator == std::string::npos || separator == 0) {
      std::cerr << "! predicate \"" << arg << "\" is not of the form key=value\n";
      return 1;
    }
    predicates[arg.substr(0, separator)] = ParseValue(arg.substr(separator + 1));
  }

  grib2::GribReader reader;
  auto status = reader.open(std::string_view(argv[1]));
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  status = reader.readIndex([](const grib2::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  });
  if (!status.ok()) {
    std::cerr << "! scan ended early, selecting from the fields found so far\n";
  }

  const auto matches = reader.select(predicates);

  grib2::GribWriter writer;
  status = writer.open(std::string_view(argv[2]));
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  for (const auto* location : matches) {
    status = writer.write(reader, location->messageNumber);
    if (!status.ok()) {
      std::cerr << "! " << status.message << "\n";
      writer.close();
      return 1;
    }
  }
  std::cout << StrFormat("{} of {} fields matched, {} messages written to {}\n", matches.size(),
                         reader.size(), writer.messageCount(), argv[2]);
  writer.close();
  reader.close();
  return 0;
}
