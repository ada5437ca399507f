#pragma once

/// \file csv.hpp
/// \brief Metadata table describing the images of a dataset.
///
/// The table is plain CSV with a fixed header:
///
///     image_path,image_id,label_id,label_text,label_raw,source
///
/// `terf build` reads it and `terf extract` writes it back out.

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "terf/errors.hpp"

namespace terf {

inline const std::vector<std::string>& metadata_header() {
    static const std::vector<std::string> header{"image_path", "image_id", "label_id",
                                                 "label_text", "label_raw", "source"};
    return header;
}

/// Strip a trailing carriage return left by CRLF line endings.
inline std::string_view chomp(std::string_view line) {
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

/**
 * @brief Split one CSV line into fields.
 *
 * Quoted fields may contain commas and doubled quotes. Throws RowParseError
 * on an unterminated quote.
 */
inline std::vector<std::string> parse_csv_fields(std::string_view line) {
    std::vector<std::string> out;
    std::string cell;
    bool in_quotes = false;
    line = chomp(line);
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            out.push_back(std::move(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    if (in_quotes)
        throw RowParseError("unterminated quoted field in CSV");
    out.push_back(std::move(cell));
    return out;
}

inline void write_csv_row(std::ostream& out, const std::vector<std::string>& fields) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i)
            out << ',';
        const auto& f = fields[i];
        bool quote = f.find_first_of(",\"\r\n") != std::string::npos ||
                     (!f.empty() && (f.front() == ' ' || f.back() == ' '));
        if (!quote) {
            out << f;
            continue;
        }
        out << '"';
        for (char c : f) {
            if (c == '"')
                out << '"';
            out << c;
        }
        out << '"';
    }
    out << '\n';
}

/** One row of the metadata table. */
struct RowDescriptor {
    std::string path{};
    std::int64_t image_id{0};
    std::int64_t label_id{0};
    std::string label_text{};
    std::int64_t label_raw{0};
    std::int64_t source{0};
};

namespace detail {

inline std::int64_t parse_int_field(const std::string& s, const char* name) {
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    std::string t = s.substr(b, e - b);
    try {
        std::size_t used = 0;
        long long v = std::stoll(t, &used);
        if (used != t.size())
            throw std::invalid_argument(t);
        return static_cast<std::int64_t>(v);
    } catch (const std::exception&) {
        throw RowParseError(std::string("invalid ") + name + " '" + s + "'");
    }
}

} // namespace detail

/// Parse a metadata row. Throws RowParseError for malformed rows.
inline RowDescriptor parse_row(const std::vector<std::string>& fields) {
    if (fields.size() != metadata_header().size()) {
        std::ostringstream msg;
        msg << "invalid row format: expected " << metadata_header().size() << " fields, got "
            << fields.size();
        throw RowParseError(msg.str());
    }
    RowDescriptor row;
    row.path = fields[0];
    row.image_id = detail::parse_int_field(fields[1], "image_id");
    row.label_id = detail::parse_int_field(fields[2], "label_id");
    row.label_text = fields[3];
    row.label_raw = detail::parse_int_field(fields[4], "label_raw");
    row.source = detail::parse_int_field(fields[5], "source");
    return row;
}

inline RowDescriptor parse_row(std::string_view line) { return parse_row(parse_csv_fields(line)); }

/// Read the header line and reject tables that do not start with image_path.
inline void read_metadata_header(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (chomp(line).empty())
            continue;
        auto header = parse_csv_fields(line);
        if (header.empty() || header[0] != "image_path")
            throw UsageError("invalid header: first column must be image_path");
        return;
    }
    if (in.bad())
        throw IoError("failed to read metadata table");
    throw UsageError("metadata table is empty");
}

/**
 * @brief Count the data rows of a metadata table.
 *
 * Blank lines are ignored and the header is not counted. Throws when the
 * table holds no data rows.
 */
inline std::size_t count_rows(std::istream& in) {
    std::size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!chomp(line).empty())
            ++lines;
    }
    if (in.bad())
        throw IoError("failed to read metadata table");
    if (lines <= 1)
        throw UsageError("no rows found in metadata table");
    return lines - 1;
}

} // namespace terf
