#pragma once

#include <cstddef>
#include <string>

namespace flowsched::db::sql {

/*
  Placeholder lists for IN (...) and multi-row VALUES clauses.

  Postgres: $1,$2,$3
  SQLite:   ?,?,?

  Both use ordered binding, so the same bind loop works for both.
*/

enum class PlaceholderStyle {
  kQuestion,
  kDollar,
};

// `count` placeholders separated by commas; `first` is the first $N index.
inline std::string Placeholders(std::size_t count, PlaceholderStyle style, std::size_t first = 1) {
  std::string out;
  out.reserve(count * 4);
  for (std::size_t i = 0; i < count; ++i) {
    if (i != 0) out += ',';
    if (style == PlaceholderStyle::kQuestion) {
      out += '?';
    } else {
      out += '$';
      out += std::to_string(first + i);
    }
  }
  return out;
}

// An id list may appear twice in one statement; 2 * 400 stays under the
// 999 bound-parameter limit of older SQLite builds.
inline constexpr std::size_t kMaxBatchRows = 400;

}
