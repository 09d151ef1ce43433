#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace authn::common {

namespace {
constexpr const char* kLoggerName = "authn";
}  // namespace

std::once_flag Logger::_ofCreate;

void Logger::createOnce() {
  std::call_once(_ofCreate, [] {
    // An embedding application may already have registered one.
    auto spLogger = spdlog::get(kLoggerName);
    if (!spLogger) {
      spLogger = spdlog::stdout_color_mt(kLoggerName);
      spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
      spLogger->set_level(spdlog::level::info);
    }
    spdlog::set_default_logger(spLogger);
  });
}

void Logger::init(const std::string& sLevel) {
  createOnce();
  const auto lvl = spdlog::level::from_str(sLevel);
  spdlog::default_logger()->set_level(lvl);
  spdlog::default_logger()->debug("Log level set to '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  createOnce();
  return spdlog::default_logger();
}

}  // namespace authn::common
