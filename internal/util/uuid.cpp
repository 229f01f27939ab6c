#include "uuid.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace flowsched::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

UUID NameBasedUUID(std::string_view name) {
  // seed_seq and mt19937_64 are fully specified by the standard
  std::vector<uint32_t> seed;
  seed.reserve(name.size() + 1);
  for (char c : name)
    seed.push_back(static_cast<unsigned char>(c));
  seed.push_back(static_cast<uint32_t>(name.size()));
  std::seed_seq   seq(seed.begin(), seed.end());
  std::mt19937_64 rng(seq);

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 8
  id[6] = (id[6] & 0x0F) | 0x80;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  if (!IsValidUUID(str))
    throw InvalidArgument("Invalid UUID string: " + str);

  std::string hex;
  for (char c : str)
    if (c != '-') hex += c;

  UUID id{};
  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>((HexNibble(hex[2 * i]) << 4) | HexNibble(hex[2 * i + 1]));

  return id;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

bool IsValidUUID(const std::string& str) {
  if (str.size() != 36) return false;

  for (size_t i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') return false;
      continue;
    }
    if (HexNibble(str[i]) < 0) return false;
  }
  return true;
}

} // namespace flowsched::util
