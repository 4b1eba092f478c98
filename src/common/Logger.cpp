#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <unistd.h>

namespace fleet::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  std::shared_ptr<spdlog::logger> spLogger;
  if (isatty(STDERR_FILENO) == 1) {
    spLogger = spdlog::stderr_color_mt("fleet");
  } else {
    spLogger = spdlog::stderr_logger_mt("fleet");
  }
  spLogger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

void Logger::shutdown() {
  if (!_bInitialized) return;
  spdlog::default_logger()->flush();
  spdlog::drop_all();
  _bInitialized = false;
}

}  // namespace fleet::common
