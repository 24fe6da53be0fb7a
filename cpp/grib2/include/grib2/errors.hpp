#pragma once

#include <string>

namespace grib2 {

/**
 * @brief Status codes for GRIB2 scanners, readers and writers.
 */
enum class StatusCode {
  Success = 0,
  NotOpen,
  OpenFailed,
  ReadFailed,
  FormatError,
  UnsupportedEdition,
  SectionOrder,
  TruncatedMessage,
  UnknownTemplate,
  InvalidSection,
  UnknownField,
  ReadOnlyField,
  InvalidFieldValue,
  MessageNotFound,
  MissingBitmap,
  DecompressionFailed,
  DecompressionSizeMismatch,
  InvalidScanOptions,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::FormatError:
        message = "malformed GRIB2 message";
        break;
      case StatusCode::UnsupportedEdition:
        message = "unsupported GRIB edition";
        break;
      case StatusCode::SectionOrder:
        message = "unexpected section number";
        break;
      case StatusCode::TruncatedMessage:
        message = "truncated message";
        break;
      case StatusCode::UnknownTemplate:
        message = "unknown template number";
        break;
      case StatusCode::InvalidSection:
        message = "invalid section";
        break;
      case StatusCode::UnknownField:
        message = "unknown field name";
        break;
      case StatusCode::ReadOnlyField:
        message = "field is read-only";
        break;
      case StatusCode::InvalidFieldValue:
        message = "value does not fit the field";
        break;
      case StatusCode::MessageNotFound:
        message = "message not found";
        break;
      case StatusCode::MissingBitmap:
        message = "bitmap reuse requested before any bitmap was seen";
        break;
      case StatusCode::DecompressionFailed:
        message = "decompression failed";
        break;
      case StatusCode::DecompressionSizeMismatch:
        message = "decompression size mismatch";
        break;
      case StatusCode::InvalidScanOptions:
        message = "invalid scan options";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace grib2
