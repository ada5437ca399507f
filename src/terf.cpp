#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include <terf/build.hpp>
#include <terf/compression.hpp>
#include <terf/errors.hpp>
#include <terf/log.hpp>
#include <terf/read.hpp>

// ---------------------------------------------------------------------------
// terf command line tool
// ---------------------------------------------------------------------------
// Converts a labeled image table into sharded record files (build), turns
// record files back into images plus a metadata table (extract) and prints
// label counts (summary). All three commands run the concurrent pipelines
// from the library; any fatal pipeline error ends the process with status 1.
// ---------------------------------------------------------------------------

using namespace terf;

namespace {

void usage() {
    std::cerr << "Usage: terf [--debug] <command> [options]\n"
              << "Commands:\n"
              << "  build    -i <table.csv> [-o outdir] [-l name] [-n per_shard] [-t threads] [-z]\n"
              << "  extract  -i <file|dir> -o <outdir> [-t threads] [-z]\n"
              << "  summary  -i <file|dir> [-t threads] [-z]\n"
              << "Options:\n"
              << "  -z, --compress          zlib compressed record files\n"
              << "  --compression <kind>    none, zlib or zstd\n"
              << "  -d, --debug             print progress messages\n";
}

struct CliOptions {
    std::string command{};
    bool debug{false};
    std::string input{};
    std::string outdir{};
    std::string name{};
    std::size_t per_shard{0};
    std::size_t threads{0};
    Compression compression{Compression::None};
};

std::size_t parse_count(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size() || v < 0)
            throw std::invalid_argument(value);
        return static_cast<std::size_t>(v);
    } catch (const std::exception&) {
        throw UsageError("invalid value for " + flag + ": " + value);
    }
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions cli;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size())
                throw UsageError("missing value for " + arg);
            return args[++i];
        };
        if (arg == "-d" || arg == "--debug") {
            cli.debug = true;
        } else if (arg == "-i" || arg == "--input") {
            cli.input = value();
        } else if (arg == "-o" || arg == "--outdir") {
            cli.outdir = value();
        } else if (arg == "-l" || arg == "--name") {
            cli.name = value();
        } else if (arg == "-n" || arg == "--num") {
            cli.per_shard = parse_count(arg, value());
        } else if (arg == "-t" || arg == "--threads") {
            cli.threads = parse_count(arg, value());
        } else if (arg == "-z" || arg == "--compress") {
            cli.compression = Compression::Zlib;
        } else if (arg == "--compression") {
            cli.compression = parse_compression(value());
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else {
            throw UsageError("unexpected argument " + arg);
        }
    }
    return cli;
}

ReadOptions read_options(const CliOptions& cli) {
    ReadOptions opts;
    opts.input = cli.input;
    opts.outdir = cli.outdir;
    opts.threads = cli.threads;
    opts.compression = cli.compression;
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    try {
        cli = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << '\n';
        usage();
        return 1;
    }
    if (cli.command.empty()) {
        usage();
        return 1;
    }

    Logger log(cli.debug ? LogLevel::Info : LogLevel::Warn);

    try {
        if (cli.command == "build") {
            BuildOptions opts;
            opts.input = cli.input;
            opts.outdir = cli.outdir;
            opts.name = cli.name;
            opts.per_shard = cli.per_shard;
            opts.threads = cli.threads;
            opts.compression = cli.compression;
            build_dataset(opts, log);
            return 0;
        }
        if (cli.command == "extract") {
            extract(read_options(cli), log);
            return 0;
        }
        if (cli.command == "summary") {
            Stats stats = summarize(read_options(cli), log);
            stats.print(std::cout);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "terf: " << e.what() << '\n';
        return 1;
    }

    std::cerr << "Unknown command " << cli.command << '\n';
    usage();
    return 1;
}
