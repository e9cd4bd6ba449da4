#include "warden/base64.hpp"

#include <array>

namespace warden {

static constexpr std::string_view base64_chars_url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  std::string result;
  result.reserve((data.size() * 4 + 2) / 3);

  int val = 0, valb = -6;
  for (uint8_t c : data) {
    val = ((val << 8) + c) & 0xFFFF;
    valb += 8;
    while (valb >= 0) {
      result.push_back(base64_chars_url[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(base64_chars_url[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  return result;
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  static const std::array<int8_t, 256> decode_table = []() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < base64_chars_url.size(); ++i) {
      table[static_cast<unsigned char>(base64_chars_url[i])] =
          static_cast<int8_t>(i);
    }
    return table;
  }();

  // A single trailing sextet cannot encode a whole byte
  if (encoded.size() % 4 == 1) {
    throw InvalidBase64Error("Invalid base64url length");
  }

  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);

  int val = 0, valb = -8;
  for (char c : encoded) {
    int8_t decoded = decode_table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      throw InvalidBase64Error("Invalid character in base64url string");
    }

    val = ((val << 6) + decoded) & 0xFFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

std::string base64UrlDecodeToString(std::string_view data) {
  auto bytes = base64UrlDecode(data);
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace warden
