#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <openssl/evp.h>
#include <string>
#include <string_view>

namespace crypto {

// Standard alphabet with padding, no line breaks.
inline std::string Base64Encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                          reinterpret_cast<const unsigned char *>(data.data()),
                          static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

inline bool IsBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
}

// Drops everything outside the base64 alphabet (line breaks, prompts, \r).
inline std::string FilterBase64(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (IsBase64Char(c)) {
      out.push_back(c);
    }
  }
  return out;
}

inline Result<std::string> Base64Decode(std::string_view text) {
  if (text.empty()) {
    return std::string{};
  }
  if (text.size() % 4 != 0) {
    return MakeError(ErrorKind::kTransfer,
                     "base64 length " + std::to_string(text.size()) +
                         " is not a multiple of 4");
  }
  std::string out(3 * (text.size() / 4), '\0');
  int n = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                          reinterpret_cast<const unsigned char *>(text.data()),
                          static_cast<int>(text.size()));
  if (n < 0) {
    return MakeError(ErrorKind::kTransfer, "invalid base64 input");
  }
  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t len = static_cast<std::size_t>(n);
  if (text.back() == '=') {
    --len;
    if (text[text.size() - 2] == '=') {
      --len;
    }
  }
  out.resize(len);
  return out;
}

} // namespace crypto
