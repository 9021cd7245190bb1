#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <memory>
#include <string>
#include <string_view>

namespace hellonet {

namespace log {

// Thin re-export of spdlog so that call sites read log::info("... {}", value).
// Format strings use fmt positional substitution ("{}").
namespace level = spdlog::level;

using spdlog::critical;
using spdlog::debug;
using spdlog::error;
using spdlog::info;
using spdlog::set_level;
using spdlog::trace;
using spdlog::warn;

// Line layout of every record: '[2024-01-31T12:34:56.789Z] [INFO] message'
inline constexpr std::string_view kPattern = "[%Y-%m-%dT%H:%M:%S.%eZ] [%*] %v";

// Sink dispatching records by severity: warn and above go to the alert sink (stderr by default),
// everything else to the info sink (stdout by default).
// Both underlying sinks are expected to be thread safe (_mt variants), the split itself holds no state
// besides the two pointers.
class LevelSplitSink final : public spdlog::sinks::sink {
 public:
  LevelSplitSink(spdlog::sink_ptr infoSink, spdlog::sink_ptr alertSink);

  void log(const spdlog::details::log_msg& msg) override;

  void flush() override;

  void set_pattern(const std::string& pattern) override;

  void set_formatter(std::unique_ptr<spdlog::formatter> sinkFormatter) override;

 private:
  spdlog::sink_ptr _infoSink;
  spdlog::sink_ptr _alertSink;
};

// Creates the formatter producing kPattern lines, with upper case level tags (INFO / WARN / ERROR) in UTC.
std::unique_ptr<spdlog::formatter> MakeFormatter();

// Builds a logger writing through a LevelSplitSink over the given sinks, formatted with MakeFormatter().
std::shared_ptr<spdlog::logger> MakeLevelSplitLogger(std::string name, spdlog::sink_ptr infoSink,
                                                     spdlog::sink_ptr alertSink);

// Installs the process-wide default logger: info to stdout, warn / error to stderr.
// Safe to call several times, the last call wins.
void InstallDefaultLogger(level::level_enum lvl = level::info);

}  // namespace log

}  // namespace hellonet
