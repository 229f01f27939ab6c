#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace flowsched::util {

/*
  UUID helpers

  Row identities are client-generated RFC4122 v4 UUIDs, stored in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Same name, same UUID, on every platform. Version nibble 8.
UUID NameBasedUUID(std::string_view name);

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered as text; the form every repository stores.
std::string NewId();

bool IsValidUUID(const std::string& str);

} // namespace flowsched::util
