#include "parse.hpp"

#include <charconv>
#include <system_error>

namespace flowsched::util {

std::optional<uint64_t> ParseUnsigned(std::string_view text, uint64_t max) {
  if (text.empty() || text.front() < '0' || text.front() > '9') {
    return std::nullopt;
  }

  uint64_t value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || value > max) {
    return std::nullopt;
  }
  return value;
}

} // namespace flowsched::util
