#pragma once

#include "spdlog/sinks/base_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/spdlog.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Fans every record out to stderr and, once configured, a rotating log file.
class LoggerSink : public spdlog::sinks::base_sink<std::mutex> {
public:
  LoggerSink(spdlog::sink_ptr consoleSink) { sinks_.push_back(consoleSink); }
  void addSink(spdlog::sink_ptr sink);
  void sink_it_(const spdlog::details::log_msg &msg) override;
  void flush_() override;
private:
  std::vector<spdlog::sink_ptr> sinks_;
};

extern std::shared_ptr<LoggerSink> loggerSink;
extern std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> fileSink;

void configureLogging(spdlog::level::level_enum level, const std::string& logFile);
spdlog::level::level_enum logLevel();
std::shared_ptr<spdlog::logger> makeLogger(const std::string& name);
