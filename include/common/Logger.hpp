#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace authn::common {

/// Process-wide "authn" logger on top of spdlog's default logger.
/// The sink is created exactly once, on the first init() or get() from any
/// thread; later init() calls only change the level.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init(cfg.sLogLevel);
///   Logger::get()->info("Session {} revoked", iSessionId);
class Logger {
 public:
  /// Set the level ("trace" ... "critical", "off"), creating the logger
  /// first if needed.
  static void init(const std::string& sLevel);

  /// The shared logger. Safe to call concurrently before any init().
  static std::shared_ptr<spdlog::logger> get();

 private:
  static void createOnce();

  static std::once_flag _ofCreate;
};

}  // namespace authn::common
