#include "sesh/id/id.hpp"
#include <array>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace sesh::id {

std::optional<std::string> generate() {
  std::array<unsigned char, ID_BYTES> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    ERR_clear_error();
    return std::nullopt;
  }

  // 4 * ceil(16 / 3) = 24 chars plus the terminator
  std::array<unsigned char, 25> encoded{};
  int length = EVP_EncodeBlock(encoded.data(), bytes.data(),
                               static_cast<int>(bytes.size()));

  std::string id;
  id.reserve(ID_LENGTH);
  for (int i = 0; i < length; i++) {
    switch (encoded[i]) {
    case '+':
      id.push_back('-');
      break;
    case '/':
      id.push_back('_');
      break;
    case '=':
      break;
    default:
      id.push_back(static_cast<char>(encoded[i]));
      break;
    }
  }
  return id;
}

bool is_valid(const std::string &candidate) {
  if (candidate.size() != ID_LENGTH) {
    return false;
  }

  for (char c : candidate) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> parse(const std::string &candidate) {
  if (!is_valid(candidate)) {
    return std::nullopt;
  }
  return candidate;
}

} // namespace sesh::id
