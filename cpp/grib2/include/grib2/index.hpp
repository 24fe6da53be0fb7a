#pragma once

#include "reader.hpp"
#include "scanner.hpp"
#include "sections.hpp"
#include "tables.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace grib2 {

/**
 * @brief The value of a message attribute, used for selection.
 */
using AttributeValue = std::variant<int64_t, double, std::string>;
/**
 * @brief Attribute name to required value. A record matches when every entry
 * matches.
 */
using Predicates = std::map<std::string, AttributeValue>;
/**
 * @brief Looks up a named attribute of a record; std::nullopt when the record
 * has no such attribute.
 */
using AttributeResolver =
  std::function<std::optional<AttributeValue>(const MessageLocation&, std::string_view)>;

/**
 * @brief Compares an attribute against a predicate value. Numbers compare
 * across int64_t and double with a relative tolerance of 1e-9; strings compare
 * exactly; a number never equals a string.
 */
GRIB2_PUBLIC
bool AttributeMatches(const AttributeValue& actual, const AttributeValue& expected);

GRIB2_PUBLIC
std::string AttributeToString(const AttributeValue& value);

/**
 * @brief The ordered list of fields found in a stream. Message numbers are
 * 1-based; number 0 is a sentinel that never refers to a field.
 */
class GRIB2_PUBLIC MessageIndex {
public:
  using const_iterator = std::vector<MessageLocation>::const_iterator;

  MessageIndex();

  void clear();
  void append(MessageLocation location);

  /**
   * @brief Number of fields, not counting the sentinel.
   */
  size_t size() const;
  bool empty() const;

  /**
   * @brief Returns field `messageNumber`, or nullptr for 0 and out of range
   * numbers.
   */
  const MessageLocation* get(size_t messageNumber) const;

  /**
   * @brief Returns the fields for which every predicate holds, in scan order.
   * A field lacking a predicate's attribute does not match.
   */
  std::vector<const MessageLocation*> select(const Predicates& predicates,
                                             const AttributeResolver& resolve) const;

  /**
   * @brief Makes `messageNumber` the current field and returns the offset of
   * its section 0. Out of range numbers leave the position unchanged.
   */
  std::optional<ByteOffset> seek(size_t messageNumber);
  /**
   * @brief Number of the current field; 0 before the first seek() or next().
   */
  size_t tell() const;
  /**
   * @brief Advances to the field after the current one.
   */
  const MessageLocation* next();

  const_iterator begin() const;
  const_iterator end() const;

private:
  std::vector<MessageLocation> records_;
  size_t current_ = 0;
};

/**
 * @brief Options for opening a GribReader.
 */
struct GRIB2_PUBLIC ReaderOptions {
  ScanOptions scan;
  /**
   * @brief Transparently decompress zstd and lz4 compressed files.
   */
  bool decompress = true;
  /**
   * @brief Resolves shortName, fullName and units. Defaults to
   * ParameterTable::Wmo().
   */
  std::shared_ptr<const IParameterTable> parameterTable;

  Status validate() const;
};

/**
 * @brief Provides indexed, random access to the fields of a GRIB2 file.
 *
 * After readIndex(), readMessage(), readSection(), decodeMessage() and
 * readValues() may be called from several threads at once; they share the data
 * source under a mutex. Everything else, including open() and close(), must be
 * externally synchronized.
 */
class GRIB2_PUBLIC GribReader final {
public:
  GribReader() = default;
  ~GribReader();

  GribReader(const GribReader&) = delete;
  GribReader& operator=(const GribReader&) = delete;

  /**
   * @brief Opens a data source. If `reader` holds a zstd or lz4 frame and
   * `options.decompress` is set, the whole source is decompressed into memory.
   *
   * @param reader An implementation of the IReadable interface that provides
   *   raw GRIB2 data. The reader must outlive this GribReader or be closed
   *   with close() first.
   * @return Status
   */
  Status open(IReadable& reader, const ReaderOptions& options = {});
  /**
   * @brief Opens a file with std::fopen().
   */
  Status open(std::string_view filename, const ReaderOptions& options = {});
  /**
   * @brief Opens an input file stream. The stream must outlive this reader.
   */
  Status open(std::ifstream& stream, const ReaderOptions& options = {});
  /**
   * @brief Closes the data source and discards the index.
   */
  void close();

  /**
   * @brief Scans the whole data source and builds the index.
   *
   * @param onProblem Receives every problem met during the scan, fatal or not.
   * @return Status The error that ended the scan early, or Success. The fields
   *   found before an error remain indexed.
   */
  Status readIndex(const ProblemCallback& onProblem = [](const Status&) {});

  /**
   * @brief Returns the data fields are read from, the decompressed one for
   * compressed inputs. nullptr when not open.
   */
  IReadable* dataSource();
  const MessageIndex& index() const;
  size_t size() const;

  const MessageLocation* get(size_t messageNumber) const;
  std::vector<const MessageLocation*> select(const Predicates& predicates) const;
  /**
   * @brief Resolves a named attribute of a field: index metadata first, then
   * the fields of sections 1, 3, 4 and 5, then shortName, fullName and units
   * through the parameter table.
   */
  std::optional<AttributeValue> attribute(const MessageLocation& location,
                                          std::string_view name) const;

  std::optional<ByteOffset> seek(size_t messageNumber);
  size_t tell() const;
  const MessageLocation* next();

  /**
   * @brief Copies the bytes of the whole message holding field
   * `messageNumber`, submessages included.
   */
  Status readMessage(size_t messageNumber, ByteArray* output) const;
  /**
   * @brief Copies one complete section, header included, of field
   * `messageNumber`.
   */
  Status readSection(size_t messageNumber, SectionKind section, ByteArray* output) const;
  /**
   * @brief Decodes sections 0 through 5 of field `messageNumber`.
   *
   * @return Status UnknownTemplate if any of its templates is not registered.
   */
  Status decodeMessage(size_t messageNumber, DecodedMessage* message) const;
  /**
   * @brief The bitmap that applies to field `messageNumber`, or nullptr.
   */
  BitmapPtr resolveBitmap(size_t messageNumber) const;
  /**
   * @brief Unpacks the data values of a field with `codec` and spreads them
   * over the grid using the field's bitmap. Masked points are NaN.
   */
  Status readValues(size_t messageNumber, ICodec& codec, std::vector<float>* values) const;

  /**
   * @brief Distinct level descriptions of the indexed fields, in scan order.
   */
  std::vector<std::string> levels() const;
  /**
   * @brief Distinct parameter short names of the indexed fields, in scan order.
   */
  std::vector<std::string> variables() const;

  const IParameterTable& parameterTable() const;

private:
  struct DecodeCache;

  Status readRange_(ByteOffset offset, uint64_t length, ByteArray* output) const;
  std::optional<AttributeValue> resolve_(const MessageLocation& location, std::string_view name,
                                         DecodeCache* cache) const;
  std::string shortName_(const MessageLocation& location) const;
  void reset_();

  IReadable* input_ = nullptr;
  std::FILE* file_ = nullptr;
  std::unique_ptr<FileReader> fileInput_;
  std::unique_ptr<FileStreamReader> fileStreamInput_;
  std::unique_ptr<ICompressedReader> decompressedInput_;
  ReaderOptions options_;
  std::shared_ptr<const IParameterTable> parameterTable_;
  MessageIndex index_;
  mutable std::mutex mutex_;
};

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "index.inl"
#endif
