#pragma once

/// \file image.hpp
/// \brief Labeled image and its Example record representation.
///
/// Feature keys written to each Example:
///
///     image/height        int64  height in pixels
///     image/width         int64  width in pixels
///     image/colorspace    bytes  colour model (RGB, CMYK, Gray)
///     image/channels      int64  always 3
///     image/class/label   int64  index in the normalised label set
///     image/class/raw     int64  index in the raw label set
///     image/class/source  int64  source (organisation) of the image
///     image/class/text    bytes  human readable normalised label
///     image/format        bytes  upper case format name
///     image/filename      bytes  base name of the original file
///     image/id            int64  unique id
///     image/encoded       bytes  the encoded image

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "example.pb.h"
#include "terf/csv.hpp"
#include "terf/errors.hpp"
#include "terf/image_codec.hpp"

namespace terf {

namespace detail {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline void set_int64(tensorflow::Example& ex, const std::string& key, std::int64_t v) {
    (*ex.mutable_features()->mutable_feature())[key].mutable_int64_list()->add_value(v);
}

inline void set_bytes(tensorflow::Example& ex, const std::string& key, const std::string& v) {
    (*ex.mutable_features()->mutable_feature())[key].mutable_bytes_list()->add_value(v);
}

} // namespace detail

/// Integer feature \p key of \p ex, or 0 when absent or of another kind.
inline std::int64_t feature_int64(const tensorflow::Example& ex, const std::string& key) {
    const auto& features = ex.features().feature();
    auto it = features.find(key);
    if (it == features.end() || !it->second.has_int64_list() ||
        it->second.int64_list().value_size() == 0)
        return 0;
    return it->second.int64_list().value(0);
}

/// Float feature \p key of \p ex, or 0 when absent or of another kind.
inline float feature_float(const tensorflow::Example& ex, const std::string& key) {
    const auto& features = ex.features().feature();
    auto it = features.find(key);
    if (it == features.end() || !it->second.has_float_list() ||
        it->second.float_list().value_size() == 0)
        return 0.f;
    return it->second.float_list().value(0);
}

/// Bytes feature \p key of \p ex, or empty when absent or of another kind.
inline std::string feature_bytes(const tensorflow::Example& ex, const std::string& key) {
    const auto& features = ex.features().feature();
    auto it = features.find(key);
    if (it == features.end() || !it->second.has_bytes_list() ||
        it->second.bytes_list().value_size() == 0)
        return {};
    return it->second.bytes_list().value(0);
}

/** A labeled image together with its encoded bytes. */
struct Image {
    std::int64_t id{0};
    int width{0};
    int height{0};
    std::int64_t label_id{0};
    std::int64_t label_raw{0};
    std::string label_text{};
    std::int64_t source_id{0};
    std::string filename{};
    std::string format{};
    std::string colorspace{};
    std::string raw{};

    /// Attach encoded bytes and probe their configuration.
    void set_raw(std::string bytes) {
        ImageInfo info = probe_image(bytes);
        raw = std::move(bytes);
        width = info.width;
        height = info.height;
        format = std::move(info.format);
        colorspace = std::move(info.colorspace);
    }

    /// Load the image referenced by a metadata row.
    static Image from_row(const RowDescriptor& row) {
        std::ifstream in(row.path, std::ios::binary);
        if (!in)
            throw ConversionError("failed to open image file " + row.path);
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            throw ConversionError("failed to read image file " + row.path);

        Image img;
        img.id = row.image_id;
        img.label_id = row.label_id;
        img.label_raw = row.label_raw;
        img.label_text = row.label_text;
        img.source_id = row.source;
        img.filename = std::filesystem::path(row.path).filename().string();
        img.set_raw(std::move(bytes));
        return img;
    }

    tensorflow::Example to_example() const {
        tensorflow::Example ex;
        detail::set_int64(ex, "image/height", height);
        detail::set_int64(ex, "image/width", width);
        detail::set_bytes(ex, "image/colorspace", colorspace);
        detail::set_int64(ex, "image/channels", 3);
        detail::set_int64(ex, "image/class/label", label_id);
        detail::set_int64(ex, "image/class/raw", label_raw);
        detail::set_int64(ex, "image/class/source", source_id);
        detail::set_bytes(ex, "image/class/text", label_text);
        detail::set_bytes(ex, "image/format", detail::to_upper(format));
        detail::set_bytes(ex, "image/filename", filename);
        detail::set_int64(ex, "image/id", id);
        detail::set_bytes(ex, "image/encoded", raw);
        return ex;
    }

    static Image from_example(const tensorflow::Example& ex) {
        Image img;
        img.id = feature_int64(ex, "image/id");
        img.height = static_cast<int>(feature_int64(ex, "image/height"));
        img.width = static_cast<int>(feature_int64(ex, "image/width"));
        img.label_id = feature_int64(ex, "image/class/label");
        img.label_raw = feature_int64(ex, "image/class/raw");
        img.label_text = feature_bytes(ex, "image/class/text");
        img.source_id = feature_int64(ex, "image/class/source");
        img.filename = feature_bytes(ex, "image/filename");
        img.raw = feature_bytes(ex, "image/encoded");
        img.format = feature_bytes(ex, "image/format");
        img.colorspace = feature_bytes(ex, "image/colorspace");
        return img;
    }

    /// Serialize to the payload stored in a record frame. Feature map
    /// entries are written in key order so equal images give equal bytes.
    std::string serialize() const {
        tensorflow::Example ex = to_example();
        std::string out;
        bool ok = false;
        {
            google::protobuf::io::StringOutputStream sink(&out);
            google::protobuf::io::CodedOutputStream coded(&sink);
            coded.SetSerializationDeterministic(true);
            ok = ex.SerializeToCodedStream(&coded) && !coded.HadError();
        }
        if (!ok)
            throw ConversionError("failed to serialize example for " + filename);
        return out;
    }

    static Image parse(const std::string& payload) {
        tensorflow::Example ex;
        if (!ex.ParseFromString(payload))
            throw RecordDecodeError("record payload is not an Example");
        return from_example(ex);
    }

    /// Output file name: "<id>.<format>" when an id is set.
    /// Otherwise the last component of the stored filename, so the name
    /// never leaves the directory it is joined to.
    std::string name() const {
        if (id > 0)
            return std::to_string(id) + "." + detail::to_lower(format);
        std::string base = std::filesystem::path(filename).filename().string();
        if (!base.empty() && base != "." && base != "..")
            return base;
        return "image." + detail::to_lower(format);
    }

    /// Metadata row pointing at `base_dir/name()`.
    std::vector<std::string> csv_row(const std::string& base_dir) const {
        return {(std::filesystem::path(base_dir) / name()).string(),
                std::to_string(id),
                std::to_string(label_id),
                label_text,
                std::to_string(label_raw),
                std::to_string(source_id)};
    }

    /// Write the encoded bytes to \p path.
    void save(const std::string& path) const {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            throw IoError("failed to create " + path);
        out.write(raw.data(), static_cast<std::streamsize>(raw.size()));
        out.close();
        if (!out)
            throw IoError("failed to write " + path);
    }
};

} // namespace terf
