#pragma once

/// \file build.hpp
/// \brief Convert a metadata table and its images into sharded record files.
///
/// One producer thread reads the table and groups rows into shards. Shards
/// are handed through a bounded queue to a pool of workers; each worker
/// owns one shard at a time and writes it to
/// `{outdir}/{name}-{id:05d}-of-{total:05d}`.
///
/// Rows that fail to parse and images that cannot be loaded are logged and
/// skipped. Failing to create or write an output file stops the whole job.

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "terf/compression.hpp"
#include "terf/config.hpp"
#include "terf/csv.hpp"
#include "terf/errors.hpp"
#include "terf/image.hpp"
#include "terf/log.hpp"
#include "terf/pipeline.hpp"
#include "terf/record_io.hpp"
#include "terf/shard.hpp"

namespace terf {

/** Options of `terf build`. Zero and empty values select the defaults. */
struct BuildOptions {
    std::string input{};    ///< metadata table (must be seekable)
    std::string outdir{};   ///< output directory, default current directory
    std::string name{};     ///< shard base name, default "train"
    std::size_t per_shard{0};
    std::size_t threads{0}; ///< default host parallelism
    Compression compression{Compression::None};

    BuildOptions resolve() const {
        BuildOptions o = *this;
        if (o.input.empty())
            throw UsageError("an input metadata table is required");
        if (o.outdir.empty())
            o.outdir = std::filesystem::current_path().string();
        if (o.name.empty())
            o.name = TERF_DEFAULT_SHARD_NAME;
        if (o.per_shard == 0)
            o.per_shard = TERF_DEFAULT_PER_SHARD;
        if (o.threads == 0)
            o.threads = default_thread_count();
        return o;
    }
};

/// Outcome of writing one shard.
struct ShardReport {
    std::string path{};
    std::size_t id{0};
    std::size_t written{0};
    std::size_t skipped{0};
};

/// Outcome of a whole build.
struct BuildResult {
    std::size_t total_shards{0};  ///< shard count announced in file names
    std::size_t rows{0};          ///< data rows counted in the table
    std::size_t records{0};       ///< records written
    std::size_t skipped{0};       ///< rows dropped by parse or image errors
    std::vector<ShardReport> shards{}; ///< sorted by shard id
};

/**
 * @brief Write one shard to disk.
 *
 * Image level failures skip the row. Output failures throw. When \p token
 * is cancelled the worker stops after the current row and closes the file.
 */
inline ShardReport write_shard(const Shard& shard, const BuildOptions& opts, Logger& log,
                               const CancellationToken* token = nullptr) {
    ShardReport report;
    report.id = shard.id;
    report.path = (std::filesystem::path(opts.outdir) / shard_file_name(opts.name, shard)).string();

    log.info("Processing shard", {{"file", report.path},
                                  {"images", shard.rows.size()},
                                  {"compression", to_string(opts.compression)}});

    OutputFile out(report.path, opts.compression);
    RecordWriter writer(out);
    for (const auto& row : shard.rows) {
        if (token && token->cancelled())
            break;
        try {
            Image img = Image::from_row(row);
            writer.write(img.serialize());
            ++report.written;
        } catch (const Error& e) {
            if (!e.recoverable())
                throw;
            ++report.skipped;
            log.warn("Skipping image", {{"imagePath", row.path}, {"error", e.what()}});
        }
    }
    writer.flush();
    out.close();
    return report;
}

/// Run the full build pipeline described in this file.
inline BuildResult build_dataset(const BuildOptions& options, Logger& log) {
    const BuildOptions opts = options.resolve();

    std::ifstream in(opts.input);
    if (!in)
        throw IoError("failed to open " + opts.input);

    // First pass counts rows so every shard knows the final total.
    BuildResult result;
    result.rows = count_rows(in);
    result.total_shards = total_shards(result.rows, opts.per_shard);

    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in)
        throw IoError("metadata table is not seekable: " + opts.input);
    read_metadata_header(in);

    std::error_code ec;
    std::filesystem::create_directories(opts.outdir, ec);
    if (ec)
        throw IoError("failed to create " + opts.outdir + ": " + ec.message());

    log.info("Starting build", {{"input", opts.input},
                                {"rows", result.rows},
                                {"shards", result.total_shards},
                                {"threads", opts.threads}});

    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<Shard> shards(opts.threads, token);
    std::vector<std::vector<ShardReport>> per_worker(opts.threads);
    std::size_t parse_skipped = 0;

    {
        TaskGroup group(token);

        group.spawn([&] {
            ShardAccumulator acc(opts.per_shard, result.total_shards);
            std::string line;
            std::size_t line_no = 1;
            while (std::getline(in, line)) {
                ++line_no;
                if (chomp(line).empty())
                    continue;
                std::optional<Shard> full;
                try {
                    full = acc.accumulate(parse_row(line));
                } catch (const Error& e) {
                    if (!e.recoverable())
                        throw;
                    ++parse_skipped;
                    log.error("Failed to parse image record from csv",
                              {{"line", line_no}, {"error", e.what()}});
                    continue;
                }
                if (full && !shards.push(std::move(*full)))
                    return;
            }
            if (in.bad())
                throw IoError("failed to read " + opts.input);
            if (auto last = acc.flush()) {
                if (!shards.push(std::move(*last)))
                    return;
            }
            shards.close();
        });

        for (std::size_t w = 0; w < opts.threads; ++w) {
            group.spawn([&, w] {
                while (auto shard = shards.pop())
                    per_worker[w].push_back(write_shard(*shard, opts, log, token.get()));
            });
        }

        group.wait();
    }

    result.skipped = parse_skipped;
    for (auto& reports : per_worker) {
        for (auto& r : reports) {
            result.records += r.written;
            result.skipped += r.skipped;
            result.shards.push_back(std::move(r));
        }
    }
    std::sort(result.shards.begin(), result.shards.end(),
              [](const ShardReport& a, const ShardReport& b) { return a.id < b.id; });

    if (result.skipped > 0)
        log.warn("Some rows were skipped", {{"skipped", result.skipped},
                                            {"written", result.records}});
    log.info("Build complete", {{"shards", result.shards.size()}, {"records", result.records}});
    return result;
}

} // namespace terf
