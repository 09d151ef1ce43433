#include "core/SessionRecord.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace authn::core {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  const auto tpSeconds = std::chrono::floor<std::chrono::seconds>(tp);
  const auto iMicros =
      std::chrono::duration_cast<std::chrono::microseconds>(tp - tpSeconds).count();

  const std::time_t tt = std::chrono::system_clock::to_time_t(tpSeconds);
  std::tm tmUtc{};
  gmtime_r(&tt, &tmUtc);

  std::ostringstream oss;
  oss << std::put_time(&tmUtc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << iMicros << 'Z';
  return oss.str();
}

nlohmann::json toJson(const SessionRecord& sr) {
  return nlohmann::json{
      {"id", sr.iId},
      {"user_id", sr.iUserId},
      {"created_at", formatTimestamp(sr.tpCreatedAt)},
      {"last_used_at", formatTimestamp(sr.tpLastUsedAt)},
      {"last_ip_address", sr.ipLastAddress.toString()},
      {"last_user_agent", sr.sLastUserAgent},
  };
}

}  // namespace authn::core
