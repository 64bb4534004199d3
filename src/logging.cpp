#include "logging.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

bool init_logging(const std::filesystem::path& file, const std::string& level, std::string& msg) {
  std::shared_ptr<spdlog::logger> logger;
  bool ok = true;
  try {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), false);
    logger = std::make_shared<spdlog::logger>("mgram", sink);
  } catch (const spdlog::spdlog_ex& e) {
    logger = std::make_shared<spdlog::logger>("mgram", std::make_shared<spdlog::sinks::null_sink_mt>());
    msg = std::string("log file unavailable: ") + e.what();
    ok = false;
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  logger->set_level(spdlog::level::from_str(level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  if (ok) spdlog::info("mgram started, log level {}", level);
  return ok;
}
