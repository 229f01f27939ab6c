#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace flowsched::util {

// Decimal digits only. No sign, no whitespace, no trailing text; values
// above max are rejected.
std::optional<uint64_t> ParseUnsigned(std::string_view text, uint64_t max = UINT64_MAX);

} // namespace flowsched::util
