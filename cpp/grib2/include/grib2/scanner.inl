#include "internal.hpp"
#include <algorithm>

namespace grib2 {

namespace {

constexpr uint64_t GridHeaderLength = 14;
constexpr uint64_t ProductHeaderLength = 11;
constexpr uint64_t RepresentationHeaderLength = 11;
constexpr uint64_t BitmapHeaderLength = 6;

// Whether section `next` may follow section `last` inside one (sub)message.
bool SectionMayFollow(uint8_t last, uint8_t next) {
  switch (next) {
    case 2:
      return last == 1;
    case 3:
      return last == 1 || last == 2;
    default:
      return next >= 4 && next <= 7 && last == next - 1;
  }
}

}  // namespace

// ScanOptions /////////////////////////////////////////////////////////////////

Status ScanOptions::validate() const {
  if (windowSize < IndicatorSectionLength) {
    const auto msg = internal::StrCat("scan window of ", windowSize,
                                      " bytes is smaller than the indicator section");
    return Status{StatusCode::InvalidScanOptions, msg};
  }
  return StatusCode::Success;
}

// SectionCursor ///////////////////////////////////////////////////////////////

SectionCursor::SectionCursor(IReadable& source, ByteOffset offset, ByteOffset messageEnd)
    : source_(source)
    , offset_(offset)
    , messageEnd_(messageEnd) {}

Status SectionCursor::peek() {
  std::byte* data = nullptr;
  const uint64_t bytesRead = source_.read(&data, offset_, SectionHeaderLength);
  if (bytesRead < sizeof(Trailer)) {
    const auto msg = internal::StrCat("stream ends at offset ", offset_ + bytesRead,
                                      " before the declared message end ", messageEnd_);
    return Status{StatusCode::TruncatedMessage, msg};
  }

  trailer_ = internal::IsTrailer(data);
  if (trailer_) {
    return StatusCode::Success;
  }
  if (bytesRead < SectionHeaderLength) {
    const auto msg = internal::StrCat("stream ends inside the section header at offset ", offset_);
    return Status{StatusCode::TruncatedMessage, msg};
  }

  header_.length = internal::ParseUint32(data);
  header_.number = uint8_t(data[4]);
  if (header_.length < SectionHeaderLength) {
    const auto msg = internal::StrCat("section ", int(header_.number), " at offset ", offset_,
                                      " has invalid length ", header_.length);
    return Status{StatusCode::FormatError, msg};
  }
  if (offset_ + header_.length > messageEnd_) {
    const auto msg = internal::StrCat("section ", int(header_.number), " at offset ", offset_,
                                      " (length ", header_.length,
                                      ") crosses the declared message end ", messageEnd_);
    return Status{StatusCode::FormatError, msg};
  }
  return StatusCode::Success;
}

Status SectionCursor::consumeSection(uint64_t readLength, const std::byte** data) {
  if (offset_ + header_.length > source_.size()) {
    const auto available = source_.size() > offset_ ? source_.size() - offset_ : 0;
    const auto msg = internal::StrCat("section ", int(header_.number), " at offset ", offset_,
                                      " declares ", header_.length, " bytes, only ", available,
                                      " available");
    return Status{StatusCode::TruncatedMessage, msg};
  }
  readLength = std::min(readLength, uint64_t(header_.length));
  if (readLength > 0) {
    std::byte* section = nullptr;
    const uint64_t bytesRead = source_.read(&section, offset_, readLength);
    if (bytesRead < readLength) {
      const auto msg = internal::StrCat("read of section ", int(header_.number), " at offset ",
                                        offset_, " returned ", bytesRead, " of ", readLength,
                                        " bytes");
      return Status{StatusCode::ReadFailed, msg};
    }
    *data = section;
  }
  offset_ += header_.length;
  return StatusCode::Success;
}

void SectionCursor::consumeTrailer() {
  offset_ += sizeof(Trailer);
}

// MessageScanner //////////////////////////////////////////////////////////////

MessageScanner::MessageScanner(IReadable& source, const ScanOptions& options,
                               const ProblemCallback& onProblem)
    : source_(source)
    , options_(options)
    , onProblem_(onProblem) {
  if (auto status = options_.validate(); !status.ok()) {
    fail(status);
  }
}

const Status& MessageScanner::status() const {
  return status_;
}

ByteOffset MessageScanner::offset() const {
  return offset_;
}

uint32_t MessageScanner::messageCount() const {
  return messageCount_;
}

std::optional<MessageLocation> MessageScanner::next() {
  while (state_ != State::Done) {
    if (state_ == State::Searching) {
      beginMessage();
      continue;
    }
    auto location = readField();
    if (location) {
      location->messageNumber = ++fieldCount_;
      return location;
    }
  }
  return std::nullopt;
}

void MessageScanner::problem(const Status& status) const {
  if (onProblem_) {
    onProblem_(status);
  }
}

void MessageScanner::fail(Status status) {
  problem(status);
  status_ = std::move(status);
  state_ = State::Done;
  cursor_.reset();
}

void MessageScanner::endOfStream() {
  if (messageCount_ > 0 && skippedBytes_ > 0) {
    const auto msg = internal::StrCat("magic not found in the last ", skippedBytes_,
                                      " bytes of the stream");
    problem(Status{StatusCode::FormatError, msg});
  }
  state_ = State::Done;
}

void MessageScanner::beginMessage() {
  if (options_.shouldStop && options_.shouldStop()) {
    state_ = State::Done;
    return;
  }

  // Search for the magic, one window at a time
  std::byte* data = nullptr;
  while (true) {
    const uint64_t bytesRead = source_.read(&data, offset_, options_.windowSize);
    if (bytesRead < sizeof(Magic)) {
      skippedBytes_ += bytesRead;
      endOfStream();
      return;
    }

    uint64_t position = 0;
    while (position + sizeof(Magic) <= bytesRead && !internal::IsMagic(data + position)) {
      ++position;
    }
    if (position + sizeof(Magic) <= bytesRead) {
      skippedBytes_ += position;
      offset_ += position;
      break;
    }
    if (bytesRead < options_.windowSize) {
      skippedBytes_ += bytesRead;
      endOfStream();
      return;
    }
    const uint64_t advance = bytesRead - (sizeof(Magic) - 1);
    skippedBytes_ += advance;
    offset_ += advance;
  }

  const uint64_t bytesRead = source_.read(&data, offset_, IndicatorSectionLength);
  if (bytesRead < IndicatorSectionLength) {
    const auto msg = internal::StrCat("magic at offset ", offset_, " is followed by only ",
                                      bytesRead, " bytes");
    fail(Status{StatusCode::TruncatedMessage, msg});
    return;
  }

  const uint8_t edition = uint8_t(data[7]);
  if (edition == LegacyEdition) {
    const uint64_t legacyLength = std::max<uint64_t>(internal::ParseUint24(data + 4), 8);
    if (options_.reportSkippedLegacy) {
      const auto msg = internal::StrCat("skipped GRIB edition 1 message at offset ", offset_,
                                        " (", legacyLength, " bytes)");
      problem(Status{StatusCode::UnsupportedEdition, msg});
    }
    offset_ += legacyLength;
    skippedBytes_ = 0;
    return;
  }
  if (edition != Edition) {
    const auto msg =
      internal::StrCat("unsupported GRIB edition ", int(edition), " at offset ", offset_);
    fail(Status{StatusCode::UnsupportedEdition, msg});
    return;
  }

  const uint64_t totalLength = internal::ParseUint64(data + 8);
  if (totalLength < IndicatorSectionLength + internal::IdentificationSectionLength +
                      sizeof(Trailer)) {
    const auto msg = internal::StrCat("message at offset ", offset_,
                                      " declares an impossible length of ", totalLength);
    fail(Status{StatusCode::FormatError, msg});
    return;
  }

  current_ = MessageLocation{};
  current_.fileOffset = offset_;
  current_.declaredTotalLength = totalLength;
  current_.discipline = uint8_t(data[6]);
  current_.edition = edition;
  current_.parameterIdentity.discipline = current_.discipline;
  current_.sectionOffsets[0] = SectionOffset{0, offset_, IndicatorSectionLength};

  // Section 1 is decoded right away; it is the baseline of every submessage
  cursor_.emplace(source_, offset_ + IndicatorSectionLength, offset_ + totalLength);
  if (auto status = cursor_->peek(); !status.ok()) {
    fail(status);
    return;
  }
  if (cursor_->atTrailer() || cursor_->header().number != 1) {
    const auto msg = internal::StrCat("message at offset ", offset_,
                                      " does not start with section 1");
    fail(Status{StatusCode::SectionOrder, msg});
    return;
  }
  const SectionOffset identificationOffset{1, cursor_->offset(), cursor_->header().length};
  const std::byte* section = nullptr;
  if (auto status = cursor_->consumeSection(identificationOffset.byteLength, &section);
      !status.ok()) {
    fail(status);
    return;
  }
  IdentificationSection identification;
  if (auto status = SectionDecoder::ParseIdentification(section, identificationOffset.byteLength,
                                                        &identification);
      !status.ok()) {
    fail(status);
    return;
  }
  current_.referenceDate = identification.referenceDate;
  current_.sectionOffsets[1] = identificationOffset;

  skippedBytes_ = 0;
  lastSection_ = 1;
  state_ = State::InMessage;
}

std::optional<MessageLocation> MessageScanner::readField() {
  MessageLocation location = current_;

  while (true) {
    if (auto status = cursor_->peek(); !status.ok()) {
      fail(status);
      return std::nullopt;
    }

    if (lastSection_ == 7) {
      if (cursor_->atTrailer()) {
        const ByteOffset trailerOffset = cursor_->offset();
        if (trailerOffset + sizeof(Trailer) != cursor_->messageEnd()) {
          const auto msg = internal::StrCat("trailer at offset ", trailerOffset,
                                            " but the message declares its end at ",
                                            cursor_->messageEnd());
          fail(Status{StatusCode::FormatError, msg});
          return std::nullopt;
        }
        cursor_->consumeTrailer();
        location.sectionOffsets[size_t(SectionKind::End)] =
          SectionOffset{uint8_t(SectionKind::End), trailerOffset, sizeof(Trailer)};

        offset_ = cursor_->offset();
        cursor_.reset();
        ++messageCount_;
        state_ = State::Searching;
        return location;
      }

      const uint8_t number = cursor_->header().number;
      if (number < 2 || number > 4) {
        const auto msg = internal::StrCat("expected trailer or submessage at offset ",
                                          cursor_->offset(), ", found section ", int(number));
        fail(Status{StatusCode::FormatError, msg});
        return std::nullopt;
      }
      restartAt(location, number, cursor_->offset());
      return location;
    }

    if (cursor_->atTrailer()) {
      const auto msg = internal::StrCat("message at offset ", location.fileOffset,
                                        " ends after section ", int(lastSection_));
      fail(Status{StatusCode::SectionOrder, msg});
      return std::nullopt;
    }

    const uint8_t number = cursor_->header().number;
    if (!SectionMayFollow(lastSection_, number)) {
      const auto msg = internal::StrCat("section ", int(number), " at offset ", cursor_->offset(),
                                        " follows section ", int(lastSection_));
      fail(Status{StatusCode::SectionOrder, msg});
      return std::nullopt;
    }

    const SectionOffset sectionOffset{number, cursor_->offset(), cursor_->header().length};
    // Local use and data sections are stepped over; only the bitmap indicator
    // is read up front
    uint64_t readLength = sectionOffset.byteLength;
    if (number == uint8_t(SectionKind::LocalUse) || number == uint8_t(SectionKind::Data)) {
      readLength = 0;
    } else if (number == uint8_t(SectionKind::Bitmap)) {
      readLength = BitmapHeaderLength;
    }
    const std::byte* data = nullptr;
    if (auto status = cursor_->consumeSection(readLength, &data); !status.ok()) {
      fail(status);
      return std::nullopt;
    }
    location.sectionOffsets[number] = sectionOffset;
    lastSection_ = number;

    Status status;
    switch (SectionKind(number)) {
      case SectionKind::GridDefinition:
        status = readGridDefinition(data, sectionOffset.byteLength, &location);
        break;
      case SectionKind::ProductDefinition:
        if (sectionOffset.byteLength < ProductHeaderLength) {
          const auto msg = internal::StrCat("section 4 at offset ", sectionOffset.byteOffset,
                                            " is too short (", sectionOffset.byteLength, " bytes)");
          status = Status{StatusCode::InvalidSection, msg};
          break;
        }
        location.productTemplateNumber = internal::ParseUint16(data + 7);
        location.parameterIdentity.category = uint8_t(data[9]);
        location.parameterIdentity.number = uint8_t(data[10]);
        break;
      case SectionKind::DataRepresentation:
        if (sectionOffset.byteLength < RepresentationHeaderLength) {
          const auto msg = internal::StrCat("section 5 at offset ", sectionOffset.byteOffset,
                                            " is too short (", sectionOffset.byteLength, " bytes)");
          status = Status{StatusCode::InvalidSection, msg};
          break;
        }
        location.numberOfPackedValues = internal::ParseUint32(data + 5);
        location.representationTemplateNumber = internal::ParseUint16(data + 9);
        break;
      case SectionKind::Bitmap:
        status = readBitmap(data, sectionOffset.byteLength, sectionOffset, &location);
        break;
      default:
        break;
    }
    if (!status.ok()) {
      fail(status);
      return std::nullopt;
    }
  }
}

Status MessageScanner::readGridDefinition(const std::byte* data, uint64_t size,
                                          MessageLocation* location) {
  if (size < GridHeaderLength) {
    const auto msg = internal::StrCat("section 3 of message at offset ", location->fileOffset,
                                      " is too short (", size, " bytes)");
    return Status{StatusCode::InvalidSection, msg};
  }
  GridDefinitionSection grid;
  // The header fields are all the index needs; a template problem is not fatal
  if (auto status = SectionDecoder::ParseGridDefinition(data, size, &grid); !status.ok()) {
    problem(status);
  }
  location->gridPointCount = grid.numberOfDataPoints;
  location->gridTemplateNumber = grid.templateNumber;
  return StatusCode::Success;
}

Status MessageScanner::readBitmap(const std::byte* data, uint64_t size,
                                  const SectionOffset& section, MessageLocation* location) {
  if (size < BitmapHeaderLength) {
    const auto msg = internal::StrCat("section 6 at offset ", section.byteOffset,
                                      " has no bitmap indicator");
    return Status{StatusCode::InvalidSection, msg};
  }

  location->bitmapIndicator = uint8_t(data[5]);
  location->bitmap.reset();
  location->carriedBitmap.reset();
  switch (BitmapIndicator(location->bitmapIndicator)) {
    case BitmapIndicator::Follows: {
      std::byte* bits = nullptr;
      const uint64_t bytesRead = source_.read(&bits, section.byteOffset, size);
      if (bytesRead < size) {
        const auto msg = internal::StrCat("read of bitmap at offset ", section.byteOffset,
                                          " returned ", bytesRead, " of ", size, " bytes");
        return Status{StatusCode::ReadFailed, msg};
      }
      auto bitmap = std::make_shared<Bitmap>();
      bitmap->section = section;
      bitmap->bytes.assign(bits + BitmapHeaderLength, bits + size);
      location->bitmap = bitmap;
      bitmaps_.last = std::move(bitmap);
      break;
    }
    case BitmapIndicator::Reuse:
      if (bitmaps_.last) {
        location->carriedBitmap = bitmaps_.last;
      } else {
        const auto msg = internal::StrCat("section 6 at offset ", section.byteOffset,
                                          " reuses a bitmap, but none was defined before it");
        problem(Status{StatusCode::MissingBitmap, msg});
      }
      break;
    default:
      break;
  }
  return StatusCode::Success;
}

void MessageScanner::restartAt(const MessageLocation& field, uint8_t sectionNumber,
                               ByteOffset offset) {
  current_ = field;
  for (size_t slot = sectionNumber; slot < SectionSlots; ++slot) {
    current_.sectionOffsets[slot] = std::nullopt;
  }
  if (sectionNumber <= 3) {
    current_.gridPointCount = 0;
    current_.gridTemplateNumber = 0;
  }
  current_.productTemplateNumber = 0;
  current_.parameterIdentity.category = 0;
  current_.parameterIdentity.number = 0;
  current_.representationTemplateNumber = 0;
  current_.numberOfPackedValues = 0;
  current_.bitmapIndicator = uint8_t(BitmapIndicator::None);
  current_.bitmap.reset();
  current_.carriedBitmap.reset();

  current_.isSubmessage = true;
  current_.submessageBeginSection = sectionNumber;
  current_.submessageOffset = offset;
  lastSection_ = sectionNumber == 4 ? 3 : 1;
}

// ScanView ////////////////////////////////////////////////////////////////////

ScanView::ScanView(IReadable& source, const ScanOptions& options,
                   const ProblemCallback& onProblem)
    : source_(source)
    , options_(options)
    , onProblem_(onProblem) {}

ScanView::Iterator ScanView::begin() {
  return ScanView::Iterator{source_, options_, onProblem_};
}

ScanView::Iterator ScanView::end() {
  return ScanView::Iterator();
}

ScanView Scan(IReadable& source, const ScanOptions& options, const ProblemCallback& onProblem) {
  return ScanView{source, options, onProblem};
}

// ScanView::Iterator //////////////////////////////////////////////////////////

ScanView::Iterator::Iterator(IReadable& source, const ScanOptions& options,
                             const ProblemCallback& onProblem)
    : impl_(std::make_unique<Impl>(source, options, onProblem)) {
  if (!impl_->has_value()) {
    impl_ = nullptr;
  }
}

ScanView::Iterator::Impl::Impl(IReadable& source, const ScanOptions& options,
                               const ProblemCallback& onProblem)
    : scanner_(source, options, onProblem) {
  increment();
}

void ScanView::Iterator::Impl::increment() {
  current_ = scanner_.next();
}

ScanView::Iterator::reference ScanView::Iterator::Impl::dereference() const {
  return *current_;
}

bool ScanView::Iterator::Impl::has_value() const {
  return current_.has_value();
}

ScanView::Iterator::reference ScanView::Iterator::operator*() const {
  return impl_->dereference();
}

ScanView::Iterator::pointer ScanView::Iterator::operator->() const {
  return &impl_->dereference();
}

ScanView::Iterator& ScanView::Iterator::operator++() {
  impl_->increment();
  if (!impl_->has_value()) {
    impl_ = nullptr;
  }
  return *this;
}

void ScanView::Iterator::operator++(int) {
  ++*this;
}

bool operator==(const ScanView::Iterator& a, const ScanView::Iterator& b) {
  return a.impl_ == b.impl_;
}

bool operator!=(const ScanView::Iterator& a, const ScanView::Iterator& b) {
  return !(a == b);
}

}  // namespace grib2
