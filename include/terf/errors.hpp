#pragma once

/// \file errors.hpp
/// \brief Error categories raised by the codec and the pipelines.
///
/// Every error is a `terf::Error`. Whether a pipeline may skip the failing
/// row and carry on is decided by the category through `recoverable()`,
/// never by the call site.

#include <stdexcept>
#include <string>

namespace terf {

/** Base class of all errors thrown by terf. */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}

    /// True when the pipeline may log the error and skip the current row.
    virtual bool recoverable() const { return false; }
};

/** Stream corruption detected while reading a frame. */
class FramingError : public Error {
  public:
    enum class Kind { InvalidHeaderChecksum, InvalidPayloadChecksum, TruncatedFrame };

    FramingError(Kind kind, const std::string& msg) : Error(msg), kind_{kind} {}

    Kind kind() const { return kind_; }

  private:
    Kind kind_;
};

/** Failure to open, create, read or write a file or stream. */
class IoError : public Error {
  public:
    explicit IoError(const std::string& msg) : Error(msg) {}
};

/** A payload that does not decode as an Example record. */
class RecordDecodeError : public Error {
  public:
    explicit RecordDecodeError(const std::string& msg) : Error(msg) {}
};

/** Invalid options or command line input. */
class UsageError : public Error {
  public:
    explicit UsageError(const std::string& msg) : Error(msg) {}
};

/** Malformed metadata row. The row is skipped. */
class RowParseError : public Error {
  public:
    explicit RowParseError(const std::string& msg) : Error(msg) {}
    bool recoverable() const override { return true; }
};

/** Referenced image is missing or cannot be decoded. The row is skipped. */
class ConversionError : public Error {
  public:
    explicit ConversionError(const std::string& msg) : Error(msg) {}
    bool recoverable() const override { return true; }
};

inline const char* to_string(FramingError::Kind kind) {
    switch (kind) {
    case FramingError::Kind::InvalidHeaderChecksum:
        return "invalid header checksum";
    case FramingError::Kind::InvalidPayloadChecksum:
        return "invalid payload checksum";
    case FramingError::Kind::TruncatedFrame:
        return "truncated frame";
    }
    return "framing error";
}

} // namespace terf
