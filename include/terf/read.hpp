#pragma once

/// \file read.hpp
/// \brief Read-side pipelines: `summary` and `extract`.
///
/// Both fan a list of record files out to a pool of workers. A worker reads
/// one whole file and produces one result, which a single aggregator folds
/// into the job's accumulator. Results arrive in completion order, so the
/// fold must not depend on order. Any worker error cancels the job and the
/// partially folded accumulator is dropped.

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "example.pb.h"
#include "terf/compression.hpp"
#include "terf/csv.hpp"
#include "terf/errors.hpp"
#include "terf/image.hpp"
#include "terf/log.hpp"
#include "terf/pipeline.hpp"
#include "terf/record_io.hpp"
#include "terf/stats.hpp"

namespace terf {

/// Name of the metadata table written by extract.
inline constexpr const char* kInfoFile = "info.csv";

/** Options shared by `terf summary` and `terf extract`. */
struct ReadOptions {
    std::string input{};  ///< record file or directory of record files
    std::string outdir{}; ///< extract only
    std::size_t threads{0};
    Compression compression{Compression::None};

    ReadOptions resolve() const {
        ReadOptions o = *this;
        if (o.input.empty())
            throw UsageError("an input file or directory is required");
        if (o.threads == 0)
            o.threads = default_thread_count();
        return o;
    }
};

/**
 * @brief Files to read for \p path.
 *
 * A directory yields its regular files sorted by name; anything else is
 * treated as a single record file.
 */
inline std::vector<std::string> list_inputs(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        throw IoError("failed to stat " + path + (ec ? ": " + ec.message() : ""));
    if (!fs::is_directory(status))
        return {path};

    std::vector<std::string> files;
    fs::directory_iterator it(path, ec);
    if (ec)
        throw IoError("failed to list " + path + ": " + ec.message());
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec))
            files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());
    return files;
}

/**
 * @brief Fan \p paths out to workers and fold their results.
 *
 * @param per_file Reads one file. Runs on worker threads.
 * @param fold     Merges one result into the accumulator. Runs on the
 *                 single aggregator thread only.
 */
template <typename Acc, typename Result>
Acc aggregate_files(const std::vector<std::string>& paths, std::size_t threads,
                    const std::function<Result(const std::string&, const CancellationToken&)>& per_file,
                    const std::function<void(Acc&, Result&&)>& fold, Acc init = Acc{}) {
    if (threads == 0)
        threads = 1;
    auto token = std::make_shared<CancellationToken>();
    BoundedQueue<std::string> files(threads, token);
    BoundedQueue<Result> results(threads, token);
    std::atomic<std::size_t> running{threads};
    Acc acc = std::move(init);

    {
        TaskGroup group(token);

        group.spawn([&] {
            for (const auto& p : paths) {
                if (!files.push(p))
                    return;
            }
            files.close();
        });

        for (std::size_t w = 0; w < threads; ++w) {
            group.spawn([&] {
                struct Finish {
                    std::atomic<std::size_t>& running;
                    BoundedQueue<Result>& results;
                    ~Finish() {
                        if (running.fetch_sub(1) == 1)
                            results.close();
                    }
                } finish{running, results};

                while (auto path = files.pop()) {
                    Result r = per_file(*path, *token);
                    if (!results.push(std::move(r)))
                        return;
                }
            });
        }

        group.spawn([&] {
            while (auto r = results.pop())
                fold(acc, std::move(*r));
        });

        group.wait();
    }
    return acc;
}

/// Count the records of one file.
inline Stats file_summary(const std::string& path, Compression compression, Logger& log,
                          const CancellationToken* token = nullptr) {
    log.info("Processing file", {{"path", path}, {"compression", to_string(compression)}});
    InputFile in(path, compression);
    RecordReader reader(in);
    Stats stats;
    tensorflow::Example ex;
    while (auto payload = reader.next()) {
        if (token && token->cancelled())
            break;
        if (!ex.ParseFromString(*payload))
            throw RecordDecodeError(path + ": record " + std::to_string(reader.count()) +
                                    " is not an Example");
        stats.add(ex);
    }
    return stats;
}

/// Aggregate statistics over every record of `opts.input`.
inline Stats summarize(const ReadOptions& options, Logger& log) {
    const ReadOptions opts = options.resolve();
    auto paths = list_inputs(opts.input);
    return aggregate_files<Stats, Stats>(
        paths, opts.threads,
        [&](const std::string& path, const CancellationToken& token) {
            return file_summary(path, opts.compression, log, &token);
        },
        [](Stats& acc, Stats&& s) { acc.merge(s); });
}

/// Output names already used by an extract job, shared by its workers.
class ClaimedNames {
  public:
    /// False when \p name was claimed before.
    bool claim(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return names_.insert(name).second;
    }

  private:
    std::mutex mutex_{};
    std::set<std::string> names_{};
};

/**
 * @brief Write the images of one record file into \p outdir.
 *
 * Returns the written images with their encoded bytes released. When
 * \p claimed is given, a name written earlier in the same job is reported
 * before it is overwritten.
 */
inline std::vector<Image> extract_file(const std::string& path, const std::string& outdir,
                                       Compression compression, Logger& log,
                                       const CancellationToken* token = nullptr,
                                       ClaimedNames* claimed = nullptr) {
    log.info("Processing file", {{"path", path}, {"compression", to_string(compression)}});
    InputFile in(path, compression);
    RecordReader reader(in);
    std::vector<Image> images;
    while (auto payload = reader.next()) {
        if (token && token->cancelled())
            break;
        Image img = Image::parse(*payload);
        auto dest = std::filesystem::path(outdir) / img.name();
        if (claimed && !claimed->claim(img.name()))
            log.warn("Duplicate image name, overwriting", {{"file", dest.string()}, {"path", path}});
        std::error_code ec;
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec)
            throw IoError("failed to create " + dest.parent_path().string() + ": " + ec.message());
        img.save(dest.string());
        img.raw.clear();
        img.raw.shrink_to_fit();
        images.push_back(std::move(img));
    }
    return images;
}

/// Outcome of an extract job.
struct ExtractResult {
    std::string info_path{};
    std::vector<Image> images{}; ///< metadata only, in arrival order
};

/**
 * @brief Extract every image of `opts.input` into `opts.outdir`.
 *
 * The metadata table is written only once every file was read
 * successfully.
 */
inline ExtractResult extract(const ReadOptions& options, Logger& log) {
    const ReadOptions opts = options.resolve();
    if (opts.outdir.empty())
        throw UsageError("an output directory is required");
    std::error_code ec;
    auto outdir = std::filesystem::absolute(opts.outdir, ec);
    if (ec)
        throw IoError("invalid output directory " + opts.outdir + ": " + ec.message());
    std::filesystem::create_directories(outdir, ec);
    if (ec)
        throw IoError("failed to create " + outdir.string() + ": " + ec.message());

    auto paths = list_inputs(opts.input);
    ClaimedNames claimed;
    using Images = std::vector<Image>;
    ExtractResult result;
    result.images = aggregate_files<Images, Images>(
        paths, opts.threads,
        [&](const std::string& path, const CancellationToken& token) {
            return extract_file(path, outdir.string(), opts.compression, log, &token, &claimed);
        },
        [](Images& acc, Images&& batch) {
            acc.insert(acc.end(), std::make_move_iterator(batch.begin()),
                       std::make_move_iterator(batch.end()));
        });

    if (result.images.empty())
        throw Error("no images found in " + opts.input);

    result.info_path = (outdir / kInfoFile).string();
    std::ofstream info(result.info_path, std::ios::trunc);
    if (!info)
        throw IoError("failed to create " + result.info_path);
    write_csv_row(info, metadata_header());
    for (const auto& img : result.images)
        write_csv_row(info, img.csv_row(outdir.string()));
    info.close();
    if (!info)
        throw IoError("failed to write " + result.info_path);
    log.info("Extract complete", {{"images", result.images.size()}, {"info", result.info_path}});
    return result;
}

} // namespace terf
