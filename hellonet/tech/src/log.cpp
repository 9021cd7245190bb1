#include "hellonet/log.hpp"

#include <spdlog/details/log_msg.h>
#include <spdlog/formatter.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <ctime>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace hellonet::log {

namespace {

constexpr std::string_view LevelTag(level::level_enum lvl) noexcept {
  switch (lvl) {
    case level::trace:
      return "TRACE";
    case level::debug:
      return "DEBUG";
    case level::info:
      return "INFO";
    case level::warn:
      return "WARN";
    case level::err:
      return "ERROR";
    case level::critical:
      return "CRITICAL";
    default:
      return "OFF";
  }
}

// '%*' flag: upper case level tag.
class LevelTagFlag final : public spdlog::custom_flag_formatter {
 public:
  void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
    const std::string_view tag = LevelTag(msg.level);
    dest.append(tag.data(), tag.data() + tag.size());
  }

  [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<LevelTagFlag>();
  }
};

}  // namespace

LevelSplitSink::LevelSplitSink(spdlog::sink_ptr infoSink, spdlog::sink_ptr alertSink)
    : _infoSink(std::move(infoSink)), _alertSink(std::move(alertSink)) {}

void LevelSplitSink::log(const spdlog::details::log_msg& msg) {
  if (msg.level >= level::warn) {
    _alertSink->log(msg);
  } else {
    _infoSink->log(msg);
  }
}

void LevelSplitSink::flush() {
  _infoSink->flush();
  _alertSink->flush();
}

void LevelSplitSink::set_pattern(const std::string&) { set_formatter(MakeFormatter()); }

void LevelSplitSink::set_formatter(std::unique_ptr<spdlog::formatter> sinkFormatter) {
  _alertSink->set_formatter(sinkFormatter->clone());
  _infoSink->set_formatter(std::move(sinkFormatter));
}

std::unique_ptr<spdlog::formatter> MakeFormatter() {
  auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
  formatter->add_flag<LevelTagFlag>('*').set_pattern(std::string(kPattern));
  return formatter;
}

std::shared_ptr<spdlog::logger> MakeLevelSplitLogger(std::string name, spdlog::sink_ptr infoSink,
                                                     spdlog::sink_ptr alertSink) {
  auto splitSink = std::make_shared<LevelSplitSink>(std::move(infoSink), std::move(alertSink));
  splitSink->set_formatter(MakeFormatter());
  return std::make_shared<spdlog::logger>(std::move(name), std::move(splitSink));
}

void InstallDefaultLogger(level::level_enum lvl) {
  auto logger = MakeLevelSplitLogger("hellonet", std::make_shared<spdlog::sinks::stdout_sink_mt>(),
                                     std::make_shared<spdlog::sinks::stderr_sink_mt>());
  logger->set_level(lvl);
  // Each record is a complete, independent side effect: do not keep warnings buffered behind info lines.
  logger->flush_on(level::info);
  spdlog::set_default_logger(std::move(logger));
}

}  // namespace hellonet::log
