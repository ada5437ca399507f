#pragma once

/// \file shard.hpp
/// \brief Grouping of metadata rows into numbered output shards.

#include <cstddef>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "terf/csv.hpp"

namespace terf {

/**
 * @brief A batch of rows destined for one output file.
 *
 * `id` is 1-based and follows input order. `total` is the number of shards
 * expected for the whole job and is fixed before the first shard is built,
 * so a shard's file name never depends on which worker writes it.
 */
struct Shard {
    std::size_t id{1};
    std::size_t total{1};
    std::vector<RowDescriptor> rows{};
};

/// Number of shards needed for \p total_records rows of \p per_shard each.
inline std::size_t total_shards(std::size_t total_records, std::size_t per_shard) {
    if (per_shard == 0)
        throw std::invalid_argument("rows per shard must be positive");
    if (per_shard > total_records)
        return 1;
    return (total_records + per_shard - 1) / per_shard;
}

/// "{name}-{id:05d}-of-{total:05d}"
inline std::string shard_file_name(const std::string& name, std::size_t id, std::size_t total) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "-%05zu-of-%05zu", id, total);
    return name + buf;
}

inline std::string shard_file_name(const std::string& name, const Shard& shard) {
    return shard_file_name(name, shard.id, shard.total);
}

/**
 * @brief Fills shards of a fixed size from a stream of rows.
 *
 * A completed shard is moved out to the caller and never referenced again
 * by the accumulator.
 */
class ShardAccumulator {
  public:
    ShardAccumulator(std::size_t per_shard, std::size_t total) : per_shard_{per_shard} {
        if (per_shard_ == 0)
            throw std::invalid_argument("rows per shard must be positive");
        current_.total = total;
    }

    /// Append \p row. Returns the shard once it holds `per_shard` rows.
    std::optional<Shard> accumulate(RowDescriptor row) {
        current_.rows.push_back(std::move(row));
        if (current_.rows.size() < per_shard_)
            return std::nullopt;
        return rotate();
    }

    /// Return the partially filled shard at end of input, if any.
    std::optional<Shard> flush() {
        if (current_.rows.empty())
            return std::nullopt;
        return rotate();
    }

    std::size_t per_shard() const { return per_shard_; }

  private:
    Shard rotate() {
        Shard done = std::move(current_);
        current_ = Shard{};
        current_.id = done.id + 1;
        current_.total = done.total;
        return done;
    }

    std::size_t per_shard_;
    Shard current_{};
};

} // namespace terf
