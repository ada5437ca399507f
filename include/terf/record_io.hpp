#pragma once

/// \file record_io.hpp
/// \brief Length-prefixed, checksummed record framing.
///
/// A record file is a plain concatenation of frames:
///
///     uint64  length                (little endian)
///     uint32  masked crc32c(length) (little endian)
///     byte    payload[length]
///     uint32  masked crc32c(payload)
///
/// The payload is opaque to this layer. Compression, when used, wraps the
/// whole byte stream and is handled by compression.hpp.

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "terf/crc32c.hpp"
#include "terf/errors.hpp"

namespace terf {

inline constexpr std::size_t kFrameHeaderSize = 12;
inline constexpr std::size_t kFrameFooterSize = 4;

namespace detail {

inline void put_le64(char* out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i)
        out[i] = static_cast<char>((v >> (8 * i)) & 0xffu);
}

inline void put_le32(char* out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out[i] = static_cast<char>((v >> (8 * i)) & 0xffu);
}

inline std::uint64_t get_le64(const char* in) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i)
        v = (v << 8) | static_cast<unsigned char>(in[i]);
    return v;
}

inline std::uint32_t get_le32(const char* in) {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i)
        v = (v << 8) | static_cast<unsigned char>(in[i]);
    return v;
}

} // namespace detail

/**
 * @brief Writes records to a byte stream.
 *
 * Frames are assembled in an internal buffer which is handed to the sink
 * once it grows past the buffer size or when @ref flush is called. The
 * first failure of the sink is latched: the failing call throws, later
 * calls rethrow the same error and @ref error reports it.
 */
class RecordWriter {
  public:
    static constexpr std::size_t kDefaultBufferSize = 64 * 1024;

    explicit RecordWriter(std::ostream& out, std::size_t buffer_size = kDefaultBufferSize)
        : out_{&out, [](std::ostream*) {}}, buffer_size_{buffer_size} {}
    explicit RecordWriter(std::shared_ptr<std::ostream> out,
                          std::size_t buffer_size = kDefaultBufferSize)
        : out_{std::move(out)}, buffer_size_{buffer_size} {}

    RecordWriter(const RecordWriter&) = delete;
    RecordWriter& operator=(const RecordWriter&) = delete;

    /// Append one frame holding \p payload.
    void write(std::string_view payload) {
        if (error_)
            throw *error_;
        char header[kFrameHeaderSize];
        detail::put_le64(header, static_cast<std::uint64_t>(payload.size()));
        detail::put_le32(header + 8, masked_crc32c(header, 8));
        char footer[kFrameFooterSize];
        detail::put_le32(footer, masked_crc32c(payload.data(), payload.size()));

        buffer_.append(header, sizeof(header));
        buffer_.append(payload.data(), payload.size());
        buffer_.append(footer, sizeof(footer));
        ++count_;
        if (buffer_.size() >= buffer_size_)
            drain();
    }

    /// Hand all buffered bytes to the sink and flush it.
    void flush() {
        if (error_)
            throw *error_;
        drain();
        out_->flush();
        if (!*out_)
            fail("failed to flush record stream");
    }

    /// Error latched by a previous write or flush, if any.
    const std::optional<IoError>& error() const { return error_; }

    /// Number of frames accepted so far.
    std::uint64_t count() const { return count_; }

  private:
    void drain() {
        if (buffer_.empty())
            return;
        out_->write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
        if (!*out_)
            fail("failed to write record stream");
    }

    [[noreturn]] void fail(const std::string& msg) {
        error_.emplace(msg);
        throw *error_;
    }

    std::shared_ptr<std::ostream> out_{};
    std::size_t buffer_size_{kDefaultBufferSize};
    std::string buffer_{};
    std::optional<IoError> error_{};
    std::uint64_t count_{0};
};

/**
 * @brief Reads records from a byte stream.
 *
 * @ref next returns `std::nullopt` when the stream ends cleanly on a frame
 * boundary. Checksum mismatches and partial frames throw @ref FramingError.
 * A reader that has thrown keeps rethrowing the same error; frames after a
 * corrupt one are never returned.
 */
class RecordReader {
  public:
    explicit RecordReader(std::istream& in) : in_{&in, [](std::istream*) {}} {}
    explicit RecordReader(std::shared_ptr<std::istream> in) : in_{std::move(in)} {}

    RecordReader(const RecordReader&) = delete;
    RecordReader& operator=(const RecordReader&) = delete;

    std::optional<std::string> next() {
        if (error_)
            throw *error_;

        char header[kFrameHeaderSize];
        std::size_t got = read_some(header, sizeof(header));
        if (got == 0)
            return std::nullopt;
        if (got < sizeof(header))
            fail(FramingError::Kind::TruncatedFrame, "truncated record header");

        if (unmask_crc(detail::get_le32(header + 8)) != crc32c(header, 8))
            fail(FramingError::Kind::InvalidHeaderChecksum, "invalid crc for record length");

        std::uint64_t length = detail::get_le64(header);
        std::string payload;
        // Grow the buffer in bounded steps so a corrupted length that slipped
        // past the checksum cannot force one huge allocation.
        constexpr std::uint64_t kChunk = 1u << 20;
        std::uint64_t remaining = length;
        while (remaining > 0) {
            std::size_t step = static_cast<std::size_t>(remaining < kChunk ? remaining : kChunk);
            std::size_t old = payload.size();
            payload.resize(old + step);
            if (read_some(payload.data() + old, step) < step)
                fail(FramingError::Kind::TruncatedFrame, "truncated record payload");
            remaining -= step;
        }

        char footer[kFrameFooterSize];
        if (read_some(footer, sizeof(footer)) < sizeof(footer))
            fail(FramingError::Kind::TruncatedFrame, "truncated record footer");
        if (unmask_crc(detail::get_le32(footer)) != crc32c(payload))
            fail(FramingError::Kind::InvalidPayloadChecksum, "invalid crc for record payload");

        ++count_;
        return payload;
    }

    /// Number of records returned so far.
    std::uint64_t count() const { return count_; }

  private:
    std::size_t read_some(char* buf, std::size_t n) {
        in_->read(buf, static_cast<std::streamsize>(n));
        auto got = static_cast<std::size_t>(in_->gcount());
        if (got < n && in_->bad())
            throw IoError("failed to read record stream");
        return got;
    }

    [[noreturn]] void fail(FramingError::Kind kind, const std::string& msg) {
        error_.emplace(kind, msg);
        throw *error_;
    }

    std::shared_ptr<std::istream> in_{};
    std::optional<FramingError> error_{};
    std::uint64_t count_{0};
};

} // namespace terf
