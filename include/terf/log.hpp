#pragma once

/// \file log.hpp
/// \brief Small structured logger passed explicitly to the pipelines.
///
/// Each event becomes one line of the form
///
///     level=info msg="Processing shard" file=train-00001-of-00003 images=1024
///
/// There is no global logger. The command line tool creates one with the
/// requested level and hands it to whatever needs to report progress.

#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace terf {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

inline const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

/// One key=value pair attached to a log event.
struct LogField {
    template <typename T>
    LogField(std::string k, const T& v) : key{std::move(k)} {
        std::ostringstream oss;
        oss << v;
        value = oss.str();
    }

    std::string key{};
    std::string value{};
};

class Logger {
  public:
    explicit Logger(LogLevel level = LogLevel::Warn, std::ostream& out = std::cerr)
        : level_{level}, out_{&out} {}

    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_ && level_ != LogLevel::Off; }

    void log(LogLevel level, std::string_view msg, const std::vector<LogField>& fields = {}) {
        if (!enabled(level))
            return;
        std::ostringstream line;
        line << "level=" << to_string(level) << " msg=" << quote(msg);
        for (const auto& f : fields)
            line << ' ' << f.key << '=' << quote(f.value);
        line << '\n';
        std::lock_guard<std::mutex> lock(mutex_);
        *out_ << line.str() << std::flush;
    }

    void debug(std::string_view msg, const std::vector<LogField>& fields = {}) {
        log(LogLevel::Debug, msg, fields);
    }
    void info(std::string_view msg, const std::vector<LogField>& fields = {}) {
        log(LogLevel::Info, msg, fields);
    }
    void warn(std::string_view msg, const std::vector<LogField>& fields = {}) {
        log(LogLevel::Warn, msg, fields);
    }
    void error(std::string_view msg, const std::vector<LogField>& fields = {}) {
        log(LogLevel::Error, msg, fields);
    }

  private:
    // Values containing spaces, quotes or '=' are quoted.
    static std::string quote(std::string_view v) {
        bool plain = !v.empty();
        for (char c : v) {
            if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') {
                plain = false;
                break;
            }
        }
        if (plain)
            return std::string(v);
        std::string out = "\"";
        for (char c : v) {
            if (c == '"' || c == '\\')
                out.push_back('\\');
            if (c == '\n') {
                out += "\\n";
                continue;
            }
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    LogLevel level_{LogLevel::Warn};
    std::ostream* out_;
    std::mutex mutex_{};
};

} // namespace terf
