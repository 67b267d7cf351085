#pragma once

#include <string>
#include <string_view>

namespace adapters::indodax {

inline constexpr std::string_view kQuoteIdr = "idr";

// Canonical Indodax pair id: lower-case, "<base>_idr" for IDR pairs given
// without a separator ("BTCIDR" -> "btc_idr"). Anything else is only
// lower-cased.
std::string normalize_pair(std::string_view raw);

}  // namespace adapters::indodax
