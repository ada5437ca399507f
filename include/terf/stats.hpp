#pragma once

/// \file stats.hpp
/// \brief Label and format counts over a set of records.

#include <cstdint>
#include <map>
#include <ostream>
#include <string>

#include "example.pb.h"
#include "terf/image.hpp"

namespace terf {

/**
 * @brief Counters collected by `terf summary`.
 *
 * @ref merge only adds counts, so merging is commutative and associative
 * and an empty Stats is its identity. Per-file results can therefore be
 * folded in whatever order the workers finish.
 */
struct Stats {
    std::uint64_t total{0};
    std::map<std::int64_t, std::uint64_t> source{};
    std::map<std::int64_t, std::uint64_t> label_id{};
    std::map<std::int64_t, std::uint64_t> label_raw{};
    std::map<std::string, std::uint64_t> label_text{};
    std::map<std::string, std::uint64_t> format{};
    std::map<std::string, std::uint64_t> colorspace{};

    /// Count one record.
    void add(const tensorflow::Example& ex) {
        ++total;
        ++label_text[feature_bytes(ex, "image/class/text")];
        ++label_id[feature_int64(ex, "image/class/label")];
        ++label_raw[feature_int64(ex, "image/class/raw")];
        ++source[feature_int64(ex, "image/class/source")];
        ++format[feature_bytes(ex, "image/format")];
        ++colorspace[feature_bytes(ex, "image/colorspace")];
    }

    void merge(const Stats& other) {
        total += other.total;
        add_counts(source, other.source);
        add_counts(label_id, other.label_id);
        add_counts(label_raw, other.label_raw);
        add_counts(label_text, other.label_text);
        add_counts(format, other.format);
        add_counts(colorspace, other.colorspace);
    }

    bool operator==(const Stats& o) const {
        return total == o.total && source == o.source && label_id == o.label_id &&
               label_raw == o.label_raw && label_text == o.label_text && format == o.format &&
               colorspace == o.colorspace;
    }
    bool operator!=(const Stats& o) const { return !(*this == o); }

    void print(std::ostream& out) const {
        out << "Total: " << total << '\n';
        out << "Label: \n";
        for (const auto& kv : label_text)
            out << "    - " << kv.first << ": " << kv.second << '\n';
        print_section(out, "Source", source);
        print_section(out, "Label ID", label_id);
        print_section(out, "Label Raw", label_raw);
        print_section(out, "Format", format);
        print_section(out, "Colorspace", colorspace);
    }

  private:
    template <typename K>
    static void add_counts(std::map<K, std::uint64_t>& into,
                           const std::map<K, std::uint64_t>& from) {
        for (const auto& kv : from)
            into[kv.first] += kv.second;
    }

    template <typename K>
    static void print_section(std::ostream& out, const char* title,
                              const std::map<K, std::uint64_t>& counts) {
        if (counts.empty())
            return;
        out << title << ": \n";
        for (const auto& kv : counts)
            out << "    - " << kv.first << ": " << kv.second << '\n';
    }
};

inline Stats merge(Stats a, const Stats& b) {
    a.merge(b);
    return a;
}

} // namespace terf
