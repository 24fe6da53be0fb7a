#include "internal.hpp"
#include <algorithm>
#include <cassert>
#ifndef GRIB2_COMPRESSION_NO_LZ4
#  include <lz4frame.h>
#endif
#ifndef GRIB2_COMPRESSION_NO_ZSTD
#  include <zstd.h>
#  include <zstd_errors.h>
#endif

namespace grib2 {

// BufferReader ////////////////////////////////////////////////////////////////

BufferReader::BufferReader(const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size) {}

void BufferReader::reset(const std::byte* data, uint64_t size) {
  data_ = data;
  size_ = size;
}

uint64_t BufferReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!data_ || offset >= size_) {
    return 0;
  }

  const auto available = size_ - offset;
  *output = const_cast<std::byte*>(data_) + offset;
  return std::min(size, available);
}

uint64_t BufferReader::size() const {
  return size_;
}

Status BufferReader::status() const {
  return StatusCode::Success;
}

// FileReader //////////////////////////////////////////////////////////////////

FileReader::FileReader(std::FILE* file)
    : file_(file)
    , size_(0)
    , position_(0) {
  assert(file_);

  std::fseek(file_, 0, SEEK_END);
  size_ = uint64_t(std::ftell(file_));
  std::fseek(file_, 0, SEEK_SET);
}

uint64_t FileReader::size() const {
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    if (std::fseek(file_, long(offset), SEEK_SET) != 0) {
      return 0;
    }
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  *output = buffer_.data();

  position_ += bytesRead;
  return bytesRead;
}

// FileStreamReader ////////////////////////////////////////////////////////////

FileStreamReader::FileStreamReader(std::ifstream& stream)
    : stream_(stream)
    , position_(0) {
  assert(stream.is_open());

  stream_.seekg(0, stream.end);
  size_ = uint64_t(stream_.tellg());
  stream_.seekg(0, stream.beg);
}

uint64_t FileStreamReader::size() const {
  return size_;
}

uint64_t FileStreamReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    // A short read at the end of the file leaves eofbit set, which would make
    // every later seekg() fail.
    stream_.clear();
    stream_.seekg(std::streamoff(offset));
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  stream_.read(reinterpret_cast<char*>(buffer_.data()), std::streamsize(size));
  *output = buffer_.data();

  const uint64_t bytesRead = uint64_t(stream_.gcount());
  position_ += bytesRead;
  return bytesRead;
}

#ifndef GRIB2_COMPRESSION_NO_LZ4
// LZ4Reader ///////////////////////////////////////////////////////////////////

LZ4Reader::LZ4Reader() {
  const LZ4F_errorCode_t err =
    LZ4F_createDecompressionContext((LZ4F_dctx**)&decompressionContext_, LZ4F_VERSION);
  if (LZ4F_isError(err)) {
    const auto msg =
      internal::StrCat("failed to create lz4 decompression context: ", LZ4F_getErrorName(err));
    status_ = Status{StatusCode::DecompressionFailed, msg};
    decompressionContext_ = nullptr;
  }
}

LZ4Reader::~LZ4Reader() {
  if (decompressionContext_) {
    LZ4F_freeDecompressionContext((LZ4F_dctx*)decompressionContext_);
  }
}

void LZ4Reader::reset(const std::byte* data, uint64_t size) {
  if (!decompressionContext_) {
    return;
  }
  status_ = decompressAll(data, size, &uncompressedData_);
}

uint64_t LZ4Reader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= uncompressedData_.size()) {
    return 0;
  }

  const auto available = uncompressedData_.size() - offset;
  *output = uncompressedData_.data() + offset;
  return std::min(size, available);
}

uint64_t LZ4Reader::size() const {
  return uncompressedData_.size();
}

Status LZ4Reader::status() const {
  return status_;
}

Status LZ4Reader::decompressAll(const std::byte* data, uint64_t compressedSize,
                                ByteArray* output) {
  if (!decompressionContext_) {
    return status_;
  }
  auto* context = (LZ4F_dctx*)decompressionContext_;
  output->clear();
  LZ4F_resetDecompressionContext(context);

  LZ4F_frameInfo_t frameInfo{};
  size_t consumed = size_t(compressedSize);
  const size_t infoResult = LZ4F_getFrameInfo(context, &frameInfo, data, &consumed);
  if (LZ4F_isError(infoResult)) {
    const auto msg = internal::StrCat("lz4 frame header of ", compressedSize,
                                      " byte input is invalid (", LZ4F_getErrorName(infoResult),
                                      ")");
    return Status{StatusCode::DecompressionFailed, msg};
  }
  if (frameInfo.contentSize > 0) {
    output->reserve(size_t(frameInfo.contentSize));
  }

  ByteArray block(256 * 1024);
  size_t status = infoResult;
  while (status != 0) {
    size_t dstSize = block.size();
    size_t srcSize = size_t(compressedSize) - consumed;
    status =
      LZ4F_decompress(context, block.data(), &dstSize, data + consumed, &srcSize, nullptr);
    if (LZ4F_isError(status)) {
      const auto msg = internal::StrCat("lz4 decompression of ", compressedSize,
                                        " bytes failed with error ", (int)status, " (",
                                        LZ4F_getErrorName(status), ")");
      output->clear();
      return Status{StatusCode::DecompressionFailed, msg};
    }
    output->insert(output->end(), block.begin(), block.begin() + std::ptrdiff_t(dstSize));
    consumed += srcSize;
    if (status != 0 && srcSize == 0 && dstSize == 0) {
      const auto msg =
        internal::StrCat("lz4 decompression of ", compressedSize, " bytes incomplete: consumed ",
                         consumed, " and produced ", output->size(), " bytes, expect ", status,
                         " more input bytes");
      output->clear();
      return Status{StatusCode::DecompressionSizeMismatch, msg};
    }
  }

  if (frameInfo.contentSize > 0 && output->size() != frameInfo.contentSize) {
    const auto msg =
      internal::StrCat("lz4 frame declares ", uint64_t(frameInfo.contentSize),
                       " content bytes but decompression produced ", output->size(), " bytes");
    output->clear();
    return Status{StatusCode::DecompressionSizeMismatch, msg};
  }
  return StatusCode::Success;
}
#endif

#ifndef GRIB2_COMPRESSION_NO_ZSTD
// ZStdReader //////////////////////////////////////////////////////////////////

void ZStdReader::reset(const std::byte* data, uint64_t size) {
  status_ = DecompressAll(data, size, &uncompressedData_);
}

uint64_t ZStdReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= uncompressedData_.size()) {
    return 0;
  }

  const auto available = uncompressedData_.size() - offset;
  *output = uncompressedData_.data() + offset;
  return std::min(size, available);
}

uint64_t ZStdReader::size() const {
  return uncompressedData_.size();
}

Status ZStdReader::status() const {
  return status_;
}

Status ZStdReader::DecompressAll(const std::byte* data, uint64_t compressedSize,
                                 ByteArray* output) {
  output->clear();

  const unsigned long long contentSize = ZSTD_getFrameContentSize(data, size_t(compressedSize));
  if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
    const auto msg =
      internal::StrCat("zstd decompression of ", compressedSize, " bytes failed: not a zstd frame");
    return Status{StatusCode::DecompressionFailed, msg};
  }
  if (contentSize != ZSTD_CONTENTSIZE_UNKNOWN) {
    output->reserve(size_t(contentSize));
  }

  std::unique_ptr<ZSTD_DStream, size_t (*)(ZSTD_DStream*)> stream{ZSTD_createDStream(),
                                                                 ZSTD_freeDStream};
  if (!stream) {
    return Status{StatusCode::DecompressionFailed, "failed to create zstd decompression stream"};
  }
  ZSTD_initDStream(stream.get());

  ByteArray block(ZSTD_DStreamOutSize());
  ZSTD_inBuffer input{data, size_t(compressedSize), 0};
  size_t remaining = 0;
  bool outputFull = false;
  while (input.pos < input.size || outputFull) {
    ZSTD_outBuffer out{block.data(), block.size(), 0};
    remaining = ZSTD_decompressStream(stream.get(), &out, &input);
    if (ZSTD_isError(remaining)) {
      const auto msg = internal::StrCat("zstd decompression of ", compressedSize,
                                        " bytes failed with error ", ZSTD_getErrorName(remaining));
      output->clear();
      return Status{StatusCode::DecompressionFailed, msg};
    }
    output->insert(output->end(), block.begin(), block.begin() + std::ptrdiff_t(out.pos));
    outputFull = out.pos == out.size;
  }

  if (remaining != 0) {
    const auto msg =
      internal::StrCat("zstd decompression of ", compressedSize, " bytes ended mid-frame after ",
                       output->size(), " output bytes");
    output->clear();
    return Status{StatusCode::DecompressionSizeMismatch, msg};
  }
  return StatusCode::Success;
}
#endif

Compression DetectCompression(const std::byte* data, uint64_t size) {
  if (size < 4) {
    return Compression::None;
  }
  const uint32_t magic = uint32_t(data[0]) | (uint32_t(data[1]) << 8) |
                         (uint32_t(data[2]) << 16) | (uint32_t(data[3]) << 24);
  if (magic == 0xFD2FB528) {
    return Compression::Zstd;
  }
  if (magic == 0x184D2204) {
    return Compression::Lz4;
  }
  return Compression::None;
}

}  // namespace grib2
