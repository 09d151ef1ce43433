#pragma once

#include <cstddef>

namespace authn::common {

/// Which write failures let findByTokenAndTouch degrade to a plain read.
enum class TouchFallback {
  AnyWriteFailure,  // any failure of the touch transaction
  ReadOnlyOnly,     // only SQLSTATE 25006 (read_only_sql_transaction)
};

/// Default upper bound for stored user agent strings, in bytes.
constexpr std::size_t kDefaultUserAgentMaxBytes = 1024;

}  // namespace authn::common
