#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/DbErrors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace authn::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

namespace {

constexpr const char* kMask = "***";

// postgresql://user:pw@host/db?password=pw
std::string redactUri(const std::string& sDbUrl, std::size_t nScheme) {
  const std::size_t nAuthStart = nScheme + 3;
  const std::size_t nAuthEnd = std::min(sDbUrl.find_first_of("/?", nAuthStart), sDbUrl.size());
  const std::size_t nAt = sDbUrl.rfind('@', nAuthEnd == 0 ? 0 : nAuthEnd - 1);

  std::string sOut;
  if (nAt != std::string::npos && nAt >= nAuthStart && nAt < nAuthEnd) {
    sOut = sDbUrl.substr(0, nAuthStart) + kMask + sDbUrl.substr(nAt, nAuthEnd - nAt);
  } else {
    sOut = sDbUrl.substr(0, nAuthEnd);
  }

  const std::size_t nQuery = sDbUrl.find('?', nAuthEnd);
  sOut += sDbUrl.substr(nAuthEnd, (nQuery == std::string::npos ? sDbUrl.size() : nQuery) - nAuthEnd);
  if (nQuery == std::string::npos) {
    return sOut;
  }

  sOut += '?';
  std::size_t nPos = nQuery + 1;
  while (nPos <= sDbUrl.size()) {
    std::size_t nAmp = sDbUrl.find('&', nPos);
    if (nAmp == std::string::npos) nAmp = sDbUrl.size();
    const std::string sParam = sDbUrl.substr(nPos, nAmp - nPos);
    if (sParam.rfind("password=", 0) == 0) {
      sOut += std::string("password=") + kMask;
    } else {
      sOut += sParam;
    }
    if (nAmp < sDbUrl.size()) sOut += '&';
    nPos = nAmp + 1;
  }
  return sOut;
}

// host=db user=app password='p w' dbname=s
std::string redactKeywordValue(const std::string& sConnInfo) {
  std::string sOut;
  std::size_t nPos = 0;
  const std::size_t nLen = sConnInfo.size();
  while (nPos < nLen) {
    if (std::isspace(static_cast<unsigned char>(sConnInfo[nPos]))) {
      sOut += sConnInfo[nPos++];
      continue;
    }

    const std::size_t nKeyStart = nPos;
    while (nPos < nLen && sConnInfo[nPos] != '=' &&
           !std::isspace(static_cast<unsigned char>(sConnInfo[nPos]))) {
      ++nPos;
    }
    const std::string sKey = sConnInfo.substr(nKeyStart, nPos - nKeyStart);
    while (nPos < nLen && std::isspace(static_cast<unsigned char>(sConnInfo[nPos]))) ++nPos;
    if (nPos >= nLen || sConnInfo[nPos] != '=') {
      sOut += sConnInfo.substr(nKeyStart, nPos - nKeyStart);
      continue;
    }
    ++nPos;
    while (nPos < nLen && std::isspace(static_cast<unsigned char>(sConnInfo[nPos]))) ++nPos;

    const std::size_t nValStart = nPos;
    if (nPos < nLen && sConnInfo[nPos] == '\'') {
      ++nPos;
      while (nPos < nLen && sConnInfo[nPos] != '\'') {
        if (sConnInfo[nPos] == '\\' && nPos + 1 < nLen) ++nPos;
        ++nPos;
      }
      if (nPos < nLen) ++nPos;
    } else {
      while (nPos < nLen && !std::isspace(static_cast<unsigned char>(sConnInfo[nPos]))) {
        if (sConnInfo[nPos] == '\\' && nPos + 1 < nLen) ++nPos;
        ++nPos;
      }
    }

    sOut += sKey + "=";
    sOut += sKey == "password" ? std::string(kMask) : sConnInfo.substr(nValStart, nPos - nValStart);
  }
  return sOut;
}

}  // namespace

std::string ConnectionPool::redactUrl(const std::string& sDbUrl) {
  const auto nScheme = sDbUrl.find("://");
  if (nScheme != std::string::npos) {
    return redactUri(sDbUrl, nScheme);
  }
  return redactKeywordValue(sDbUrl);
}

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool size must be >= 1");
  }

  auto spLog = common::Logger::get();
  spLog->info("Initializing connection pool: size={}, url={}",
              _iPoolSize, redactUrl(_sDbUrl));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vAvailable.push_back(connect());
  }

  spLog->info("Connection pool ready: {} connections established", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::connect() {
  try {
    auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    if (!spConn->is_open()) {
      throw common::StorageError("storage_unavailable", "Failed to open database connection");
    }
    return spConn;
  } catch (const pqxx::failure& ex) {
    rethrowAsStorageError(ex, "connect");
  }
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw common::StorageError(
        "pool_exhausted", "Connection pool exhausted: timeout waiting for available connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale connection detected, reconnecting");
    try {
      spConn = connect();
    } catch (const common::StorageError&) {
      // Keep the slot: the dead handle goes back so later checkouts retry.
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("Connection validation failed: {}", ex.what());
    return false;
  }
}

}  // namespace authn::dal
