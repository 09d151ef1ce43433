#pragma once

#include <memory>

#include "common/Config.hpp"

namespace authn::dal {
class ConnectionPool;
class SessionRepository;
}  // namespace authn::dal

namespace authn::core {

class SessionService;

/// Owns the wired-up session stack for one process: logger level, connection
/// pool, repository and service, all configured from a Config.
/// Construct once at startup before request threads run; the accessors are
/// then safe to share.
/// Class abbreviation: sc
class SessionContext {
 public:
  /// Wire everything from cfgApp. Throws StorageError if the pool cannot
  /// open its connections.
  explicit SessionContext(const common::Config& cfgApp);
  ~SessionContext();

  SessionContext(const SessionContext&) = delete;
  SessionContext& operator=(const SessionContext&) = delete;

  /// Config::load() followed by the constructor above.
  static std::unique_ptr<SessionContext> fromEnvironment();

  dal::ConnectionPool& pool() { return *_upPool; }
  dal::SessionRepository& repository() { return *_upRepo; }
  SessionService& service() { return *_upService; }

 private:
  std::unique_ptr<dal::ConnectionPool> _upPool;
  std::unique_ptr<dal::SessionRepository> _upRepo;
  std::unique_ptr<SessionService> _upService;
};

}  // namespace authn::core
