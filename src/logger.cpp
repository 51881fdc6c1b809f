#include "logger.h"
#include "spdlog/sinks/stdout_color_sinks.h"

std::shared_ptr<LoggerSink> loggerSink = std::make_shared<LoggerSink>(
  std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> fileSink;

#ifdef KBDOSD_DEBUG_LOGS
static spdlog::level::level_enum globalLevel = spdlog::level::debug;
#else
static spdlog::level::level_enum globalLevel = spdlog::level::info;
#endif

void LoggerSink::addSink(spdlog::sink_ptr sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(sink);
}

// base_sink already holds mutex_ here
void LoggerSink::sink_it_(const spdlog::details::log_msg &msg) {
  for (auto& sink : sinks_) {
    sink->log(msg);
  }
}

void LoggerSink::flush_() {
  for (auto& sink : sinks_) {
    sink->flush();
  }
}

void
configureLogging(spdlog::level::level_enum level, const std::string& logFile)
{
  globalLevel = level;
  if (!logFile.empty() && fileSink == nullptr) {
    fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      logFile, 1024 * 1024, 2);
    loggerSink->addSink(fileSink);
  }
}

spdlog::level::level_enum
logLevel()
{
  return globalLevel;
}

std::shared_ptr<spdlog::logger>
makeLogger(const std::string& name)
{
  auto logger = std::make_shared<spdlog::logger>(name, loggerSink);
  logger->set_level(globalLevel);
  logger->flush_on(spdlog::level::warn);
  return logger;
}
