#include "log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

bool init_logging(const Settings& settings, std::string& msg) {
  std::shared_ptr<spdlog::logger> logger;
  bool ok = true;
  spdlog::drop("h5forest");
  if (!settings.log_file.empty()) {
    try {
      logger = spdlog::basic_logger_mt("h5forest", settings.log_file);
    } catch (const spdlog::spdlog_ex& e) {
      msg = std::string("cannot open log file: ") + e.what();
      ok = false;
    }
  }
  if (!logger) logger = spdlog::null_logger_mt("h5forest");
  logger->set_level(spdlog::level::from_str(settings.log_level));
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return ok;
}
