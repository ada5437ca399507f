#pragma once

/// \file compression.hpp
/// \brief Whole-file stream compression around record files.
///
/// Compression is applied uniformly to an entire file and is invisible to
/// the record framing: RecordWriter and RecordReader only ever see a plain
/// std::ostream or std::istream. zlib is always available. zstd is used
/// when the build found it (TERF_HAS_ZSTD).

#include <cstddef>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>

#include "terf/config.hpp"
#include "terf/errors.hpp"

#if TERF_HAS_ZSTD
#include <zstd.h>
#endif

namespace terf {

enum class Compression { None, Zlib, Zstd };

inline const char* to_string(Compression c) {
    switch (c) {
    case Compression::None:
        return "none";
    case Compression::Zlib:
        return "zlib";
    case Compression::Zstd:
        return "zstd";
    }
    return "none";
}

inline Compression parse_compression(std::string_view name) {
    if (name == "none")
        return Compression::None;
    if (name == "zlib")
        return Compression::Zlib;
    if (name == "zstd") {
#if TERF_HAS_ZSTD
        return Compression::Zstd;
#else
        throw UsageError("zstd compression is not available in this build");
#endif
    }
    throw UsageError("unknown compression '" + std::string(name) + "'");
}

/** Output buffer that compresses into another stream buffer. */
class CompressingBuffer : public std::streambuf {
  public:
    /// Compress any pending input and write the end of stream marker.
    virtual void finish() = 0;
};

inline constexpr std::size_t kCompressionChunk = 64 * 1024;

// ---------------------------------------------------------------------------
// zlib
// ---------------------------------------------------------------------------

class ZlibDeflateBuffer : public CompressingBuffer {
  public:
    explicit ZlibDeflateBuffer(std::streambuf* sink, int level = Z_DEFAULT_COMPRESSION)
        : sink_{sink}, in_(kCompressionChunk), out_(kCompressionChunk) {
        if (deflateInit(&zs_, level) != Z_OK)
            throw IoError("failed to initialise zlib compressor");
        setp(in_.data(), in_.data() + in_.size());
    }

    ~ZlibDeflateBuffer() override { deflateEnd(&zs_); }

    void finish() override {
        if (finished_)
            return;
        compress(Z_FINISH);
        finished_ = true;
    }

  protected:
    int_type overflow(int_type ch) override {
        compress(Z_NO_FLUSH);
        if (!traits_type::eq_int_type(ch, traits_type::eof())) {
            *pptr() = traits_type::to_char_type(ch);
            pbump(1);
        }
        return traits_type::not_eof(ch);
    }

    int sync() override {
        if (!finished_)
            compress(Z_SYNC_FLUSH);
        return sink_->pubsync() == 0 ? 0 : -1;
    }

  private:
    void compress(int flush) {
        zs_.next_in = reinterpret_cast<Bytef*>(pbase());
        zs_.avail_in = static_cast<uInt>(pptr() - pbase());
        do {
            zs_.next_out = out_.data();
            zs_.avail_out = static_cast<uInt>(out_.size());
            if (deflate(&zs_, flush) == Z_STREAM_ERROR)
                throw IoError("zlib compression failed");
            auto have = static_cast<std::streamsize>(out_.size() - zs_.avail_out);
            if (have > 0 &&
                sink_->sputn(reinterpret_cast<const char*>(out_.data()), have) != have)
                throw IoError("failed to write compressed stream");
        } while (zs_.avail_out == 0);
        setp(in_.data(), in_.data() + in_.size());
    }

    std::streambuf* sink_;
    z_stream zs_{};
    std::vector<char> in_;
    std::vector<Bytef> out_;
    bool finished_{false};
};

class ZlibInflateBuffer : public std::streambuf {
  public:
    explicit ZlibInflateBuffer(std::streambuf* source)
        : source_{source}, in_(kCompressionChunk), out_(kCompressionChunk) {
        if (inflateInit(&zs_) != Z_OK)
            throw IoError("failed to initialise zlib decompressor");
    }

    ~ZlibInflateBuffer() override { inflateEnd(&zs_); }

  protected:
    int_type underflow() override {
        if (gptr() < egptr())
            return traits_type::to_int_type(*gptr());
        while (!done_) {
            if (zs_.avail_in == 0) {
                std::streamsize n =
                    source_->sgetn(reinterpret_cast<char*>(in_.data()),
                                   static_cast<std::streamsize>(in_.size()));
                if (n > 0) {
                    zs_.next_in = in_.data();
                    zs_.avail_in = static_cast<uInt>(n);
                } else if (!output_full_) {
                    throw IoError("truncated zlib stream");
                }
            }
            zs_.next_out = reinterpret_cast<Bytef*>(out_.data());
            zs_.avail_out = static_cast<uInt>(out_.size());
            int rc = inflate(&zs_, Z_NO_FLUSH);
            // A full output buffer may leave decoded bytes inside zlib.
            output_full_ = zs_.avail_out == 0;
            if (rc == Z_STREAM_END)
                done_ = true;
            else if (rc != Z_OK && rc != Z_BUF_ERROR)
                throw IoError(std::string("corrupt zlib stream: ") +
                              (zs_.msg ? zs_.msg : "inflate failed"));
            std::size_t have = out_.size() - zs_.avail_out;
            if (have > 0) {
                setg(out_.data(), out_.data(), out_.data() + have);
                return traits_type::to_int_type(*gptr());
            }
        }
        return traits_type::eof();
    }

  private:
    std::streambuf* source_;
    z_stream zs_{};
    std::vector<Bytef> in_;
    std::vector<char> out_;
    bool done_{false};
    bool output_full_{false};
};

// ---------------------------------------------------------------------------
// zstd
// ---------------------------------------------------------------------------

#if TERF_HAS_ZSTD
class ZstdCompressBuffer : public CompressingBuffer {
  public:
    explicit ZstdCompressBuffer(std::streambuf* sink, int level = 1)
        : sink_{sink}, cctx_{ZSTD_createCCtx()}, in_(kCompressionChunk),
          out_(ZSTD_CStreamOutSize()) {
        if (!cctx_)
            throw IoError("failed to initialise zstd compressor");
        ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, level);
        setp(in_.data(), in_.data() + in_.size());
    }

    ~ZstdCompressBuffer() override { ZSTD_freeCCtx(cctx_); }

    void finish() override {
        if (finished_)
            return;
        compress(ZSTD_e_end);
        finished_ = true;
    }

  protected:
    int_type overflow(int_type ch) override {
        compress(ZSTD_e_continue);
        if (!traits_type::eq_int_type(ch, traits_type::eof())) {
            *pptr() = traits_type::to_char_type(ch);
            pbump(1);
        }
        return traits_type::not_eof(ch);
    }

    int sync() override {
        if (!finished_)
            compress(ZSTD_e_flush);
        return sink_->pubsync() == 0 ? 0 : -1;
    }

  private:
    void compress(ZSTD_EndDirective mode) {
        ZSTD_inBuffer input{pbase(), static_cast<std::size_t>(pptr() - pbase()), 0};
        std::size_t remaining = 0;
        do {
            ZSTD_outBuffer output{out_.data(), out_.size(), 0};
            remaining = ZSTD_compressStream2(cctx_, &output, &input, mode);
            if (ZSTD_isError(remaining))
                throw IoError(std::string("zstd compression failed: ") +
                              ZSTD_getErrorName(remaining));
            auto have = static_cast<std::streamsize>(output.pos);
            if (have > 0 && sink_->sputn(out_.data(), have) != have)
                throw IoError("failed to write compressed stream");
        } while (mode == ZSTD_e_continue ? input.pos < input.size : remaining != 0);
        setp(in_.data(), in_.data() + in_.size());
    }

    std::streambuf* sink_;
    ZSTD_CCtx* cctx_;
    std::vector<char> in_;
    std::vector<char> out_;
    bool finished_{false};
};

class ZstdDecompressBuffer : public std::streambuf {
  public:
    explicit ZstdDecompressBuffer(std::streambuf* source)
        : source_{source}, dctx_{ZSTD_createDCtx()}, in_(ZSTD_DStreamInSize()),
          out_(ZSTD_DStreamOutSize()) {
        if (!dctx_)
            throw IoError("failed to initialise zstd decompressor");
    }

    ~ZstdDecompressBuffer() override { ZSTD_freeDCtx(dctx_); }

  protected:
    int_type underflow() override {
        if (gptr() < egptr())
            return traits_type::to_int_type(*gptr());
        while (true) {
            if (input_.pos == input_.size && !output_full_) {
                std::streamsize n =
                    source_->sgetn(in_.data(), static_cast<std::streamsize>(in_.size()));
                if (n <= 0) {
                    if (last_ == 0)
                        return traits_type::eof();
                    throw IoError("truncated zstd stream");
                }
                input_ = ZSTD_inBuffer{in_.data(), static_cast<std::size_t>(n), 0};
            }
            ZSTD_outBuffer output{out_.data(), out_.size(), 0};
            last_ = ZSTD_decompressStream(dctx_, &output, &input_);
            if (ZSTD_isError(last_))
                throw IoError(std::string("corrupt zstd stream: ") + ZSTD_getErrorName(last_));
            output_full_ = output.pos == output.size;
            if (output.pos > 0) {
                setg(out_.data(), out_.data(), out_.data() + output.pos);
                return traits_type::to_int_type(*gptr());
            }
        }
    }

  private:
    std::streambuf* source_;
    ZSTD_DCtx* dctx_;
    std::vector<char> in_;
    std::vector<char> out_;
    ZSTD_inBuffer input_{nullptr, 0, 0};
    std::size_t last_{0};
    bool output_full_{false};
};
#endif

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

/**
 * @brief Binary output file with optional whole-file compression.
 *
 * @ref close finishes the compressed stream and reports any failure. The
 * destructor closes on a best effort basis for the error paths where the
 * file is being abandoned anyway.
 */
class OutputFile : public std::ostream {
  public:
    OutputFile(const std::string& path, Compression compression)
        : std::ostream(nullptr), path_{path} {
        file_.open(path, std::ios::binary | std::ios::trunc);
        if (!file_)
            throw IoError("failed to create " + path);
        switch (compression) {
        case Compression::None:
            rdbuf(file_.rdbuf());
            break;
        case Compression::Zlib:
            codec_ = std::make_unique<ZlibDeflateBuffer>(file_.rdbuf());
            rdbuf(codec_.get());
            break;
        case Compression::Zstd:
#if TERF_HAS_ZSTD
            codec_ = std::make_unique<ZstdCompressBuffer>(file_.rdbuf());
            rdbuf(codec_.get());
            break;
#else
            throw UsageError("zstd compression is not available in this build");
#endif
        }
    }

    ~OutputFile() override {
        if (!closed_ && codec_) {
            try {
                codec_->finish();
            } catch (const std::exception&) {
                // The caller is already unwinding from an earlier error.
            }
        }
    }

    void close() {
        if (closed_)
            return;
        closed_ = true;
        flush();
        if (codec_)
            codec_->finish();
        file_.close();
        if (bad() || file_.fail())
            throw IoError("failed to write " + path_);
    }

    const std::string& path() const { return path_; }

  private:
    std::string path_{};
    std::ofstream file_{};
    std::unique_ptr<CompressingBuffer> codec_{};
    bool closed_{false};
};

/** Binary input file with optional whole-file decompression. */
class InputFile : public std::istream {
  public:
    InputFile(const std::string& path, Compression compression)
        : std::istream(nullptr), path_{path} {
        file_.open(path, std::ios::binary);
        if (!file_)
            throw IoError("failed to open " + path);
        switch (compression) {
        case Compression::None:
            rdbuf(file_.rdbuf());
            break;
        case Compression::Zlib:
            codec_ = std::make_unique<ZlibInflateBuffer>(file_.rdbuf());
            rdbuf(codec_.get());
            break;
        case Compression::Zstd:
#if TERF_HAS_ZSTD
            codec_ = std::make_unique<ZstdDecompressBuffer>(file_.rdbuf());
            rdbuf(codec_.get());
            break;
#else
            throw UsageError("zstd compression is not available in this build");
#endif
        }
        // Let decompression errors surface with their own message.
        exceptions(std::ios::badbit);
    }

    const std::string& path() const { return path_; }

  private:
    std::string path_{};
    std::ifstream file_{};
    std::unique_ptr<std::streambuf> codec_{};
};

} // namespace terf
