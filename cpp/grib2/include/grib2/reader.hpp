#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <fstream>
#include <memory>
#include <optional>
#include <vector>

namespace grib2 {

/**
 * @brief Compression applied to a whole GRIB2 file on disk.
 */
enum struct Compression {
  None,
  Lz4,
  Zstd,
};

/**
 * @brief An abstract interface for reading GRIB2 data. Implementations provide
 * random access; the scanner itself only ever moves forward.
 */
struct GRIB2_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Returns the size of the data source in bytes.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief Reads a portion of the data source.
   *
   * @param output A pointer to a pointer to the buffer to write to. This method
   *   either fills an internal buffer and points `output` at it, or points
   *   `output` directly at the source data. The pointed-to data must remain
   *   valid and unmodified until the next call to read().
   * @param offset The offset in bytes from the beginning of the source.
   * @param size The number of bytes to read.
   * @return uint64_t Number of bytes actually read. This is less than `size`
   *   when the end of the source is reached, and 0 on failure.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
};

/**
 * @brief IReadable implementation wrapping a FILE* pointer created by fopen()
 * and a read buffer.
 */
class GRIB2_PUBLIC FileReader final : public IReadable {
public:
  FileReader(std::FILE* file);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  std::FILE* file_;
  std::vector<std::byte> buffer_;
  uint64_t size_;
  uint64_t position_;
};

/**
 * @brief IReadable implementation wrapping a std::ifstream input file stream.
 */
class GRIB2_PUBLIC FileStreamReader final : public IReadable {
public:
  FileStreamReader(std::ifstream& stream);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  std::ifstream& stream_;
  std::vector<std::byte> buffer_;
  uint64_t size_;
  uint64_t position_;
};

/**
 * @brief An IReadable over bytes that must first be decoded into memory.
 */
class GRIB2_PUBLIC ICompressedReader : public IReadable {
public:
  virtual ~ICompressedReader() override = default;

  /**
   * @brief Clears any previous state and initializes with new data.
   *
   * @param data Data to read from. For decompressing readers this is the
   *   compressed file contents.
   * @param size Size of `data` in bytes.
   */
  virtual void reset(const std::byte* data, uint64_t size) = 0;
  /**
   * @brief Report the current status of decompression. A StatusCode other than
   * `StatusCode::Success` after `reset()` means the reader is unusable.
   */
  virtual Status status() const = 0;
};

/**
 * @brief A pass-through reader over an in-memory buffer. No internal buffers
 * are allocated and the caller keeps ownership of the data.
 */
class GRIB2_PUBLIC BufferReader final : public ICompressedReader {
public:
  BufferReader() = default;
  BufferReader(const std::byte* data, uint64_t size);
  BufferReader(const BufferReader&) = delete;
  BufferReader& operator=(const BufferReader&) = delete;
  BufferReader(BufferReader&&) = delete;
  BufferReader& operator=(BufferReader&&) = delete;

  void reset(const std::byte* data, uint64_t size) override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;
  Status status() const override;

private:
  const std::byte* data_ = nullptr;
  uint64_t size_ = 0;
};

#ifndef GRIB2_COMPRESSION_NO_ZSTD
/**
 * @brief ICompressedReader implementation that decompresses a Zstandard
 * (https://facebook.github.io/zstd/) compressed GRIB2 file into memory.
 */
class GRIB2_PUBLIC ZStdReader final : public ICompressedReader {
public:
  ZStdReader() = default;
  ZStdReader(const ZStdReader&) = delete;
  ZStdReader& operator=(const ZStdReader&) = delete;
  ZStdReader(ZStdReader&&) = delete;
  ZStdReader& operator=(ZStdReader&&) = delete;

  void reset(const std::byte* data, uint64_t size) override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;
  Status status() const override;

  /**
   * @brief Decompresses all Zstd frames in `data` into `output`. Frames that do
   * not record their content size are decompressed in streaming mode.
   *
   * @param data The Zstd-compressed input.
   * @param compressedSize The size of the Zstd-compressed input.
   * @param output The output vector, resized to the decompressed size, or
   *   cleared if decompression fails.
   * @return Status
   */
  static Status DecompressAll(const std::byte* data, uint64_t compressedSize, ByteArray* output);

private:
  Status status_;
  ByteArray uncompressedData_;
};
#endif

#ifndef GRIB2_COMPRESSION_NO_LZ4
/**
 * @brief ICompressedReader implementation that decompresses an LZ4 frame
 * (https://lz4.github.io/lz4/) compressed GRIB2 file into memory.
 */
class GRIB2_PUBLIC LZ4Reader final : public ICompressedReader {
public:
  LZ4Reader();
  LZ4Reader(const LZ4Reader&) = delete;
  LZ4Reader& operator=(const LZ4Reader&) = delete;
  LZ4Reader(LZ4Reader&&) = delete;
  LZ4Reader& operator=(LZ4Reader&&) = delete;
  ~LZ4Reader() override;

  void reset(const std::byte* data, uint64_t size) override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;
  Status status() const override;

  /**
   * @brief Decompresses an entire LZ4 frame into `output`.
   *
   * @param data The LZ4-compressed input.
   * @param compressedSize The size of the LZ4-compressed input.
   * @param output The output vector, resized to the decompressed size, or
   *   cleared if decompression fails.
   * @return Status
   */
  Status decompressAll(const std::byte* data, uint64_t compressedSize, ByteArray* output);

private:
  void* decompressionContext_ = nullptr;  // LZ4F_dctx*
  Status status_;
  ByteArray uncompressedData_;
};
#endif

/**
 * @brief Identifies a zstd or lz4 frame by its leading magic number.
 */
GRIB2_PUBLIC
Compression DetectCompression(const std::byte* data, uint64_t size);

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "reader.inl"
#endif
