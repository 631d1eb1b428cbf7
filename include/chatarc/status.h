#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace chatarc {

enum class ErrorCode : uint8_t {
    kOk = 0,
    kInvalidArgument = 1,
    kNotFound = 2,
    kAlreadyExists = 3,
    kFormat = 4,
    kIO = 5,
    kTransport = 6,
    kInternal = 7,
    kUnknown = 255,
};

/**
 * Status: result of an archive operation.
 * Unlike a static-message status the message is owned, so errno text and
 * paths can be attached at the failure site.
 */
class [[nodiscard]] Status {
 public:
  Status() noexcept : code_(ErrorCode::kOk) {}

  Status(ErrorCode code, std::string_view msg = "")
      : code_(code), msg_(msg) {}

  bool ok() const noexcept { return code_ == ErrorCode::kOk; }
  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return msg_; }

  bool IsFormatError() const noexcept { return code_ == ErrorCode::kFormat; }
  bool IsNotFound() const noexcept { return code_ == ErrorCode::kNotFound; }
  bool IsAlreadyExists() const noexcept { return code_ == ErrorCode::kAlreadyExists; }

  // --- Canonical Factories ---
  static Status Ok() noexcept { return Status(); }
  static Status InvalidArgument(std::string_view m) { return Status(ErrorCode::kInvalidArgument, m); }
  static Status NotFound(std::string_view m = "Not Found") { return Status(ErrorCode::kNotFound, m); }
  static Status AlreadyExists(std::string_view m = "Already Exists") { return Status(ErrorCode::kAlreadyExists, m); }
  static Status FormatError(std::string_view m) { return Status(ErrorCode::kFormat, m); }
  static Status IOError(std::string_view m) { return Status(ErrorCode::kIO, m); }
  static Status TransportError(std::string_view m) { return Status(ErrorCode::kTransport, m); }
  static Status Internal(std::string_view m) { return Status(ErrorCode::kInternal, m); }

  // Channel resolution failures surface as kNotFound.
  static Status ChannelNotFound(std::string_view m = "channel not found") { return NotFound(m); }

  static const char* CodeName(ErrorCode code) noexcept {
    switch (code) {
      case ErrorCode::kOk: return "OK";
      case ErrorCode::kInvalidArgument: return "InvalidArgument";
      case ErrorCode::kNotFound: return "NotFound";
      case ErrorCode::kAlreadyExists: return "AlreadyExists";
      case ErrorCode::kFormat: return "FormatError";
      case ErrorCode::kIO: return "IOError";
      case ErrorCode::kTransport: return "TransportError";
      case ErrorCode::kInternal: return "Internal";
      case ErrorCode::kUnknown: break;
    }
    return "Unknown";
  }

  std::string ToString() const {
    if (ok()) return "OK";
    std::string s = CodeName(code_);
    if (!msg_.empty()) {
        s += ": ";
        s += msg_;
    }
    return s;
  }

 private:
  ErrorCode code_;
  std::string msg_;
};

} // namespace chatarc
