#pragma once

#include "index.hpp"
#include "sections.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace grib2 {

/**
 * @brief An abstract interface for writing GRIB2 data.
 */
class GRIB2_PUBLIC IWritable {
public:
  virtual ~IWritable() = default;

  /**
   * @brief Called whenever the writer needs to write data to the output.
   *
   * @param data A pointer to the data to write.
   * @param size Size of the data in bytes.
   */
  void write(const std::byte* data, uint64_t size);
  /**
   * @brief Called when the writer is finished writing data to the output.
   */
  virtual void end() = 0;
  /**
   * @brief Returns the current size of the output in bytes. This must be equal
   * to the sum of all `size` parameters passed to `write()`.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief Flushes any buffered data to the output. Defaults to a no-op.
   */
  virtual void flush() {}

protected:
  virtual void handleWrite(const std::byte* data, uint64_t size) = 0;
};

/**
 * @brief Implements the IWritable interface by wrapping a FILE* pointer created
 * by fopen().
 */
class GRIB2_PUBLIC FileWriter final : public IWritable {
public:
  ~FileWriter() override;

  Status open(std::string_view filename);

  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  void flush() override;
  uint64_t size() const override;

private:
  std::FILE* file_ = nullptr;
  uint64_t size_ = 0;
};

/**
 * @brief Implements the IWritable interface by wrapping a std::ostream stream.
 */
class GRIB2_PUBLIC StreamWriter final : public IWritable {
public:
  StreamWriter(std::ostream& stream);

  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  void flush() override;
  uint64_t size() const override;

private:
  std::ostream& stream_;
  uint64_t size_ = 0;
};

/**
 * @brief An in-memory IWritable backed by a growable buffer.
 */
class GRIB2_PUBLIC BufferWriter final : public IWritable {
public:
  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  uint64_t size() const override;

  const std::byte* data() const;
  const ByteArray& buffer() const {
    return buffer_;
  }
  void clear();

private:
  ByteArray buffer_;
};

/**
 * @brief The sections of one single-field message to be assembled by
 * GribWriter. The total length in section 0 is computed when written.
 */
struct GRIB2_PUBLIC MessageParts {
  IndicatorSection indicator;
  IdentificationSection identification;
  /// Section 2 payload, after the section header.
  std::optional<ByteArray> localUse;
  GridDefinitionSection grid;
  ProductDefinitionSection product;
  DataRepresentationSection representation;
  uint8_t bitmapIndicator = uint8_t(BitmapIndicator::None);
  /// Packed bitmap bits, written after the indicator when it is 0.
  ByteArray bitmap;
  /// Section 7 payload, after the section header.
  ByteArray data;

  /**
   * @brief Creates parts with zeroed views of the given grid, product and data
   * representation templates.
   *
   * @return Status UnknownTemplate if any template is not registered.
   */
  static Status Create(TemplateNumber gridTemplate, TemplateNumber productTemplate,
                       TemplateNumber representationTemplate, MessageParts* parts);
};

/**
 * @brief Appends GRIB2 messages to an output. Not thread-safe; messages are
 * written in call order.
 */
class GRIB2_PUBLIC GribWriter final {
public:
  ~GribWriter();

  /**
   * @brief Open a new file for writing.
   *
   * @param filename Filename of the GRIB2 file to write.
   * @return Status
   */
  Status open(std::string_view filename);
  /**
   * @brief Open a new output using an IWritable that outlives this writer.
   */
  void open(IWritable& writer);
  /**
   * @brief Open a new output using a std::ostream that outlives this writer.
   */
  void open(std::ostream& stream);
  /**
   * @brief Flush and close the output.
   */
  void close();

  /**
   * @brief Copies the message holding field `messageNumber` verbatim, every
   * submessage included. Nothing is written when the previous call copied the
   * same message, so writing each field of a multi-field message once yields
   * a single copy.
   */
  Status write(const GribReader& reader, size_t messageNumber);
  /**
   * @brief Assembles and writes a complete message from `parts`.
   *
   * @return Status InvalidSection if a template view is missing or disagrees
   *   with its section's template number.
   */
  Status write(const MessageParts& parts);

  /**
   * @brief Number of messages written since open().
   */
  uint32_t messageCount() const;
  /**
   * @brief Returns the output sink, or nullptr when not open.
   */
  IWritable* dataSink();

private:
  void reset_();

  IWritable* output_ = nullptr;
  std::unique_ptr<FileWriter> fileOutput_;
  std::unique_ptr<StreamWriter> streamOutput_;
  const GribReader* lastReader_ = nullptr;
  std::optional<ByteOffset> lastCopiedOffset_;
  uint32_t messageCount_ = 0;
};

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "writer.inl"
#endif
