#include "internal.hpp"

namespace grib2 {

// IWritable ///////////////////////////////////////////////////////////////////

void IWritable::write(const std::byte* data, uint64_t size) {
  handleWrite(data, size);
}

// FileWriter //////////////////////////////////////////////////////////////////

FileWriter::~FileWriter() {
  end();
}

Status FileWriter::open(std::string_view filename) {
  end();
  file_ = std::fopen(std::string(filename).c_str(), "wb");
  if (!file_) {
    const auto msg = internal::StrCat("failed to open file \"", filename, "\" for writing");
    return Status(StatusCode::OpenFailed, msg);
  }
  return StatusCode::Success;
}

void FileWriter::handleWrite(const std::byte* data, uint64_t size) {
  if (!file_) {
    return;
  }
  size_ += std::fwrite(data, 1, size, file_);
}

void FileWriter::flush() {
  if (file_) {
    std::fflush(file_);
  }
}

void FileWriter::end() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  size_ = 0;
}

uint64_t FileWriter::size() const {
  return size_;
}

// StreamWriter ////////////////////////////////////////////////////////////////

StreamWriter::StreamWriter(std::ostream& stream)
    : stream_(stream)
    , size_(0) {}

void StreamWriter::handleWrite(const std::byte* data, uint64_t size) {
  stream_.write(reinterpret_cast<const char*>(data), std::streamsize(size));
  size_ += size;
}

void StreamWriter::flush() {
  stream_.flush();
}

void StreamWriter::end() {
  flush();
}

uint64_t StreamWriter::size() const {
  return size_;
}

// BufferWriter ////////////////////////////////////////////////////////////////

void BufferWriter::handleWrite(const std::byte* data, uint64_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

void BufferWriter::end() {
  // no-op
}

uint64_t BufferWriter::size() const {
  return buffer_.size();
}

const std::byte* BufferWriter::data() const {
  return buffer_.data();
}

void BufferWriter::clear() {
  buffer_.clear();
}

// MessageParts ////////////////////////////////////////////////////////////////

Status MessageParts::Create(TemplateNumber gridTemplate, TemplateNumber productTemplate,
                            TemplateNumber representationTemplate, MessageParts* parts) {
  const auto& registry = TemplateRegistry::Instance();
  const TemplateLayout* grid = registry.find(SectionKind::GridDefinition, gridTemplate);
  const TemplateLayout* product = registry.find(SectionKind::ProductDefinition, productTemplate);
  const TemplateLayout* representation =
    registry.find(SectionKind::DataRepresentation, representationTemplate);
  if (!grid || !product || !representation) {
    const auto msg = internal::StrCat("no registered templates for grid ", gridTemplate,
                                      ", product ", productTemplate, ", data representation ",
                                      representationTemplate);
    return Status{StatusCode::UnknownTemplate, msg};
  }

  *parts = MessageParts{};
  parts->grid.templateNumber = gridTemplate;
  parts->grid.grid = FieldView::Create(*grid);
  parts->product.templateNumber = productTemplate;
  parts->product.product = FieldView::Create(*product);
  parts->representation.templateNumber = representationTemplate;
  parts->representation.representation = FieldView::Create(*representation);
  return StatusCode::Success;
}

namespace {

Status CheckTemplateView(SectionKind kind, TemplateNumber templateNumber, const FieldView& view) {
  if (!view.valid()) {
    const auto msg = internal::StrCat("section ", int(kind), " (", SectionKindString(kind),
                                      ") has no template view");
    return Status{StatusCode::InvalidSection, msg};
  }
  if (view.kind() != kind || view.templateNumber() != templateNumber) {
    const auto msg = internal::StrCat("section ", int(kind), " declares template ",
                                      templateNumber, " but holds a view of template ",
                                      int(view.kind()), ".", view.templateNumber());
    return Status{StatusCode::InvalidSection, msg};
  }
  return StatusCode::Success;
}

}  // namespace

// GribWriter //////////////////////////////////////////////////////////////////

GribWriter::~GribWriter() {
  close();
}

Status GribWriter::open(std::string_view filename) {
  close();
  fileOutput_ = std::make_unique<FileWriter>();
  const auto status = fileOutput_->open(filename);
  if (!status.ok()) {
    fileOutput_.reset();
    return status;
  }
  open(*fileOutput_);
  return StatusCode::Success;
}

void GribWriter::open(IWritable& writer) {
  // Only close when opening a sink this writer does not own
  if (&writer != fileOutput_.get() && &writer != streamOutput_.get()) {
    close();
  }
  output_ = &writer;
}

void GribWriter::open(std::ostream& stream) {
  close();
  streamOutput_ = std::make_unique<StreamWriter>(stream);
  open(*streamOutput_);
}

void GribWriter::close() {
  if (output_) {
    output_->end();
  }
  reset_();
}

void GribWriter::reset_() {
  output_ = nullptr;
  fileOutput_.reset();
  streamOutput_.reset();
  lastReader_ = nullptr;
  lastCopiedOffset_.reset();
  messageCount_ = 0;
}

Status GribWriter::write(const GribReader& reader, size_t messageNumber) {
  if (!output_) {
    return StatusCode::NotOpen;
  }
  const MessageLocation* location = reader.get(messageNumber);
  if (!location) {
    const auto msg = internal::StrCat("message ", messageNumber, " is not in the index of ",
                                      reader.size(), " messages");
    return Status{StatusCode::MessageNotFound, msg};
  }
  if (lastReader_ == &reader && lastCopiedOffset_ == location->fileOffset) {
    return StatusCode::Success;
  }

  ByteArray bytes;
  if (auto status = reader.readMessage(messageNumber, &bytes); !status.ok()) {
    return status;
  }
  output_->write(bytes.data(), bytes.size());
  lastReader_ = &reader;
  lastCopiedOffset_ = location->fileOffset;
  ++messageCount_;
  return StatusCode::Success;
}

Status GribWriter::write(const MessageParts& parts) {
  if (!output_) {
    return StatusCode::NotOpen;
  }
  if (auto status = CheckTemplateView(SectionKind::GridDefinition, parts.grid.templateNumber,
                                      parts.grid.grid);
      !status.ok()) {
    return status;
  }
  if (auto status = CheckTemplateView(SectionKind::ProductDefinition,
                                      parts.product.templateNumber, parts.product.product);
      !status.ok()) {
    return status;
  }
  if (auto status =
        CheckTemplateView(SectionKind::DataRepresentation, parts.representation.templateNumber,
                          parts.representation.representation);
      !status.ok()) {
    return status;
  }

  ByteArray body;
  SectionDecoder::WriteIdentification(parts.identification, &body);
  if (parts.localUse) {
    SectionDecoder::WriteRawSection(SectionKind::LocalUse, *parts.localUse, &body);
  }
  SectionDecoder::WriteGridDefinition(parts.grid, &body);
  SectionDecoder::WriteProductDefinition(parts.product, &body);
  SectionDecoder::WriteDataRepresentation(parts.representation, &body);

  ByteArray bitmap{std::byte(parts.bitmapIndicator)};
  if (parts.bitmapIndicator == uint8_t(BitmapIndicator::Follows)) {
    internal::Append(bitmap, parts.bitmap);
  }
  SectionDecoder::WriteRawSection(SectionKind::Bitmap, bitmap, &body);
  SectionDecoder::WriteRawSection(SectionKind::Data, parts.data, &body);

  IndicatorSection indicator = parts.indicator;
  indicator.edition = Edition;
  indicator.totalLength = IndicatorSectionLength + body.size() + sizeof(Trailer);

  ByteArray message;
  message.reserve(indicator.totalLength);
  SectionDecoder::WriteIndicator(indicator, &message);
  internal::Append(message, body);
  for (const auto c : Trailer) {
    message.push_back(std::byte(c));
  }

  output_->write(message.data(), message.size());
  lastReader_ = nullptr;
  lastCopiedOffset_.reset();
  ++messageCount_;
  return StatusCode::Success;
}

uint32_t GribWriter::messageCount() const {
  return messageCount_;
}

IWritable* GribWriter::dataSink() {
  return output_;
}

}  // namespace grib2
