#pragma once

#include "dal/ConnectionPool.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <pqxx/pqxx>

namespace authn::test {

inline std::string getDbUrl() {
  const char* pUrl = std::getenv("AUTHN_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

/// Same database, but every transaction starts read-only, the way a hot
/// standby behaves for writes.
inline std::string readOnlyUrl(const std::string& sDbUrl) {
  if (sDbUrl.rfind("postgres", 0) == 0) {
    const char cSep = sDbUrl.find('?') == std::string::npos ? '?' : '&';
    return sDbUrl + cSep + "options=-c%20default_transaction_read_only%3Don";
  }
  return sDbUrl + " options='-c default_transaction_read_only=on'";
}

/// Create the schema (idempotent) and empty the tables.
inline void resetSchema(dal::ConnectionPool& cpPool) {
  std::ifstream ifs(AUTHN_SCHEMA_SQL_PATH);
  if (!ifs.is_open()) {
    throw std::runtime_error(std::string("Cannot open schema file: ") + AUTHN_SCHEMA_SQL_PATH);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();

  auto cg = cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(oss.str());
  txn.exec("TRUNCATE sessions, users RESTART IDENTITY CASCADE");
  txn.commit();
}

inline int64_t createUser(dal::ConnectionPool& cpPool, const std::string& sUsername) {
  auto cg = cpPool.checkout();
  pqxx::work txn(*cg);
  auto r = txn.exec("INSERT INTO users (username) VALUES ($1) RETURNING id",
                    pqxx::params{sUsername});
  const auto iId = r.one_row()[0].as<int64_t>();
  txn.commit();
  return iId;
}

}  // namespace authn::test
