#define GRIB2_IMPLEMENTATION
#include <grib2/grib2.hpp>

#include <benchmark/benchmark.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

constexpr size_t WriteIterations = 1000;
constexpr size_t FieldCount = 1000;

// A 0.25 degree global temperature field with `dataSize` bytes of packed data
static grib2::MessageParts MakeParts(uint8_t number, size_t dataSize) {
  grib2::MessageParts parts;
  const auto status = grib2::MessageParts::Create(0, 0, 0, &parts);
  if (!status.ok()) {
    std::abort();
  }
  parts.identification.originatingCenter = 7;
  parts.identification.referenceDate = grib2::ReferenceDate{2022, 1, 2, 12, 0, 0};
  (void)parts.grid.set("shapeOfEarth", 6);
  (void)parts.grid.set("nx", 1440);
  (void)parts.grid.set("ny", 721);
  (void)parts.grid.set("latitudeFirstGridpoint", 90);
  (void)parts.grid.set("latitudeLastGridpoint", -90);
  (void)parts.grid.set("longitudeLastGridpoint", 359.75);
  (void)parts.grid.set("gridlengthXDirection", 0.25);
  (void)parts.grid.set("gridlengthYDirection", 0.25);
  (void)parts.product.product.set("parameterNumber", number);
  (void)parts.product.product.set("typeOfFirstFixedSurface", 100);
  (void)parts.product.product.set("valueOfFirstFixedSurface", 50000);
  parts.representation.numberOfPackedValues = 1440 * 721;
  parts.data = grib2::ByteArray(dataSize, std::byte(0x55));
  return parts;
}

// `count` messages separated by `junk` bytes of padding
static grib2::ByteArray MakeFile(size_t count, size_t dataSize, size_t junk) {
  grib2::BufferWriter out;
  grib2::GribWriter writer;
  writer.open(out);
  const grib2::ByteArray padding(junk, std::byte('x'));
  for (size_t i = 0; i < count; ++i) {
    if (!writer.write(MakeParts(uint8_t(i % 8), dataSize)).ok()) {
      std::abort();
    }
    out.write(padding.data(), padding.size());
  }
  writer.close();
  return out.buffer();
}

static void BM_GribWriterBufferWriter(benchmark::State& state) {
  const auto parts = MakeParts(0, size_t(state.range(0)));

  while (state.KeepRunning()) {
    grib2::BufferWriter out{};
    grib2::GribWriter writer;
    writer.open(out);
    for (size_t i = 0; i < WriteIterations; i++) {
      (void)writer.write(parts);
      benchmark::ClobberMemory();
    }
    writer.close();
  }
}

static void BM_MessageScannerBufferReader(benchmark::State& state) {
  const auto bytes = MakeFile(FieldCount, size_t(state.range(0)), size_t(state.range(1)));

  while (state.KeepRunning()) {
    grib2::BufferReader reader{bytes.data(), bytes.size()};
    grib2::MessageScanner scanner{reader};
    size_t count = 0;
    while (auto location = scanner.next()) {
      benchmark::DoNotOptimize(location->fileOffset);
      ++count;
    }
    if (count != FieldCount) {
      state.SkipWithError("scan lost fields");
      break;
    }
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(bytes.size()));
}

static void BM_MessageScannerWindowSize(benchmark::State& state) {
  const auto bytes = MakeFile(100, 16, 100000);
  grib2::ScanOptions options;
  options.windowSize = uint64_t(state.range(0));

  while (state.KeepRunning()) {
    grib2::BufferReader reader{bytes.data(), bytes.size()};
    grib2::MessageScanner scanner{reader, options};
    while (auto location = scanner.next()) {
      benchmark::DoNotOptimize(location->fileOffset);
    }
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(bytes.size()));
}

static void BM_MessageScannerFileReader(benchmark::State& state) {
  const auto bytes = MakeFile(FieldCount, size_t(state.range(0)), 0);
  {
    std::ofstream out("benchmark.grib2", std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), std::streamsize(bytes.size()));
  }

  while (state.KeepRunning()) {
    std::FILE* file = std::fopen("benchmark.grib2", "rb");
    if (!file) {
      state.SkipWithError("failed to open benchmark.grib2");
      break;
    }
    grib2::FileReader reader{file};
    grib2::MessageScanner scanner{reader};
    while (auto location = scanner.next()) {
      benchmark::DoNotOptimize(location->fileOffset);
    }
    std::fclose(file);
  }
  std::remove("benchmark.grib2");
}

static void BM_FieldViewDecode(benchmark::State& state) {
  const auto kind = grib2::SectionKind(state.range(0));
  const auto number = grib2::TemplateNumber(state.range(1));
  const auto* layout = grib2::TemplateRegistry::Instance().find(kind, number);
  if (!layout) {
    state.SkipWithError("template not registered");
    return;
  }
  grib2::ByteArray payload;
  grib2::FieldView::Create(*layout).encode(&payload);

  while (state.KeepRunning()) {
    grib2::FieldView view;
    (void)grib2::FieldView::Decode(*layout, payload.data(), payload.size(), &view);
    benchmark::DoNotOptimize(view.rawArray().data());
  }
}

static void BM_GribReaderSelect(benchmark::State& state) {
  const auto bytes = MakeFile(FieldCount, 16, 0);
  grib2::BufferReader input{bytes.data(), bytes.size()};
  grib2::GribReader reader;
  if (!reader.open(input).ok() || !reader.readIndex().ok()) {
    state.SkipWithError("failed to index");
    return;
  }
  const grib2::Predicates predicates{{"shortName", std::string("TMP")},
                                     {"level", std::string("500 mb")}};

  while (state.KeepRunning()) {
    benchmark::DoNotOptimize(reader.select(predicates));
  }
}

int main(int argc, char* argv[]) {
  benchmark::RegisterBenchmark("BM_GribWriterBufferWriter", BM_GribWriterBufferWriter)
    ->Arg(16)
    ->Arg(1024)
    ->Arg(1024 * 1024);
  benchmark::RegisterBenchmark("BM_MessageScannerBufferReader", BM_MessageScannerBufferReader)
    ->Args({16, 0})
    ->Args({16, 1000})
    ->Args({64 * 1024, 0})
    ->Args({1024 * 1024, 0});
  benchmark::RegisterBenchmark("BM_MessageScannerWindowSize", BM_MessageScannerWindowSize)
    ->Arg(16)
    ->Arg(256)
    ->Arg(int64_t(grib2::DefaultScanWindow));
  benchmark::RegisterBenchmark("BM_MessageScannerFileReader", BM_MessageScannerFileReader)
    ->Arg(16)
    ->Arg(64 * 1024);
  benchmark::RegisterBenchmark("BM_FieldViewDecode", BM_FieldViewDecode)
    ->Args({int64_t(grib2::SectionKind::GridDefinition), 0})
    ->Args({int64_t(grib2::SectionKind::GridDefinition), 30})
    ->Args({int64_t(grib2::SectionKind::ProductDefinition), 8})
    ->Args({int64_t(grib2::SectionKind::DataRepresentation), 3});
  benchmark::RegisterBenchmark("BM_GribReaderSelect", BM_GribReaderSelect);
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  return 0;
}
