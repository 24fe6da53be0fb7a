#pragma once

#include "reader.hpp"
#include "sections.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <functional>
#include <iterator>
#include <memory>
#include <optional>

namespace grib2 {

/**
 * @brief Options for scanning a byte stream for GRIB2 messages.
 */
struct GRIB2_PUBLIC ScanOptions {
  /**
   * @brief Number of bytes probed at a time when searching for the "GRIB"
   * magic. Consecutive windows overlap by three bytes.
   */
  uint64_t windowSize = DefaultScanWindow;
  /**
   * @brief Report every skipped GRIB edition 1 message through the problem
   * callback.
   */
  bool reportSkippedLegacy = false;
  /**
   * @brief Consulted before each message. Returning true ends the scan
   * cleanly.
   */
  std::function<bool()> shouldStop;

  Status validate() const;
};

/**
 * @brief Remembers the most recent section 6 bitmap of a scan so that later
 * fields with bitmap indicator 254 can refer to it.
 */
struct GRIB2_PUBLIC BitmapAccumulator {
  BitmapPtr last;

  void reset() {
    last.reset();
  }
};

/**
 * @brief Walks the sections of one message with one token of lookahead. A token
 * is either a section header (length and number) or the "7777" trailer.
 */
class GRIB2_PUBLIC SectionCursor {
public:
  SectionCursor(IReadable& source, ByteOffset offset, ByteOffset messageEnd);

  /**
   * @brief Reads the next token without consuming it.
   *
   * @return Status TruncatedMessage if the source ends before a complete token,
   *   FormatError if the peeked section is malformed or crosses the declared
   *   end of the message.
   */
  Status peek();
  /**
   * @brief Advances past the peeked section, reading only its first
   * `readLength` bytes into `data`. `data` stays valid until the next read from
   * the source.
   *
   * @return Status TruncatedMessage if the source ends inside the section.
   */
  Status consumeSection(uint64_t readLength, const std::byte** data);
  void consumeTrailer();

  bool atTrailer() const {
    return trailer_;
  }
  const SectionHeader& header() const {
    return header_;
  }
  ByteOffset offset() const {
    return offset_;
  }
  ByteOffset messageEnd() const {
    return messageEnd_;
  }

private:
  IReadable& source_;
  ByteOffset offset_;
  ByteOffset messageEnd_;
  SectionHeader header_;
  bool trailer_ = false;
};

/**
 * @brief Finds GRIB2 messages in a byte stream and emits one MessageLocation per
 * field (data section). Scanning is strictly forward and single pass.
 *
 * Junk between messages is skipped. GRIB edition 1 messages are stepped over.
 * A structural error ends the scan; the locations returned before it stay
 * valid and the error is available from status().
 */
class GRIB2_PUBLIC MessageScanner {
public:
  MessageScanner(
    IReadable& source, const ScanOptions& options = {},
    const ProblemCallback& onProblem = [](const Status&) {});

  MessageScanner(const MessageScanner&) = delete;
  MessageScanner& operator=(const MessageScanner&) = delete;

  /**
   * @brief Returns the next field, or std::nullopt once the stream is
   * exhausted or an error ended the scan.
   */
  std::optional<MessageLocation> next();

  /**
   * @brief The error that ended the scan, or Success.
   */
  const Status& status() const;
  /**
   * @brief Stream offset the scanner will continue from.
   */
  ByteOffset offset() const;
  /**
   * @brief Number of complete GRIB2 messages (not fields) scanned so far.
   */
  uint32_t messageCount() const;

private:
  enum struct State {
    Searching,
    InMessage,
    Done,
  };

  void beginMessage();
  void endOfStream();
  std::optional<MessageLocation> readField();
  void restartAt(const MessageLocation& field, uint8_t sectionNumber, ByteOffset offset);
  Status readGridDefinition(const std::byte* data, uint64_t size, MessageLocation* location);
  Status readBitmap(const std::byte* data, uint64_t size, const SectionOffset& section,
                    MessageLocation* location);
  void fail(Status status);
  void problem(const Status& status) const;

  IReadable& source_;
  ScanOptions options_;
  ProblemCallback onProblem_;
  Status status_;
  State state_ = State::Searching;
  ByteOffset offset_ = 0;
  uint64_t skippedBytes_ = 0;
  uint32_t messageCount_ = 0;
  uint32_t fieldCount_ = 0;
  // Section number last read before the next field starts.
  uint8_t lastSection_ = 0;
  MessageLocation current_;
  std::optional<SectionCursor> cursor_;
  BitmapAccumulator bitmaps_;
};

/**
 * @brief A lazy, single pass view over the fields of a byte stream. Each call to
 * begin() starts a fresh scan at offset 0; abandoning the iteration cancels it.
 */
struct GRIB2_PUBLIC ScanView {
  struct GRIB2_PUBLIC Iterator {
    using iterator_category = std::input_iterator_tag;
    using difference_type = int64_t;
    using value_type = MessageLocation;
    using pointer = const MessageLocation*;
    using reference = const MessageLocation&;

    reference operator*() const;
    pointer operator->() const;
    Iterator& operator++();
    void operator++(int);
    GRIB2_PUBLIC friend bool operator==(const Iterator& a, const Iterator& b);
    GRIB2_PUBLIC friend bool operator!=(const Iterator& a, const Iterator& b);

  private:
    friend ScanView;

    Iterator() = default;
    Iterator(IReadable& source, const ScanOptions& options, const ProblemCallback& onProblem);

    class Impl {
    public:
      Impl(IReadable& source, const ScanOptions& options, const ProblemCallback& onProblem);

      Impl(const Impl&) = delete;
      Impl& operator=(const Impl&) = delete;
      Impl(Impl&&) = delete;
      Impl& operator=(Impl&&) = delete;

      void increment();
      reference dereference() const;
      bool has_value() const;

    private:
      MessageScanner scanner_;
      std::optional<MessageLocation> current_;
    };

    std::unique_ptr<Impl> impl_;
  };

  ScanView(IReadable& source, const ScanOptions& options, const ProblemCallback& onProblem);

  ScanView(const ScanView&) = delete;
  ScanView& operator=(const ScanView&) = delete;
  ScanView(ScanView&&) = default;
  ScanView& operator=(ScanView&&) = delete;

  Iterator begin();
  Iterator end();

private:
  IReadable& source_;
  ScanOptions options_;
  const ProblemCallback onProblem_;
};

/**
 * @brief Returns a lazy view over every field in `source`.
 */
GRIB2_PUBLIC
ScanView Scan(
  IReadable& source, const ScanOptions& options = {},
  const ProblemCallback& onProblem = [](const Status&) {});

}  // namespace grib2

#ifdef GRIB2_IMPLEMENTATION
#  include "scanner.inl"
#endif
