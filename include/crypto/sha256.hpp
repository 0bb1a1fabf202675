#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <memory>
#include <openssl/evp.h>
#include <string>
#include <string_view>

namespace crypto {

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

inline std::string ToHex(const unsigned char *data, std::size_t len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
public:
  Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
  }

  void Update(std::string_view data) {
    if (ok_ && !data.empty()) {
      ok_ = EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) == 1;
    }
  }

  // Lowercase hex digest.
  Result<std::string> FinishHex() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), md, &len) != 1) {
      return MakeError(ErrorKind::kIntegrity, "sha256 digest failed");
    }
    return ToHex(md, len);
  }

private:
  MdCtxPtr ctx_;
  bool ok_ = false;
};

inline Result<std::string> Sha256Hex(std::string_view data) {
  Sha256 h;
  h.Update(data);
  return h.FinishHex();
}

// Finds the first run of exactly 64 hex digits, as printed by sha256sum,
// shasum and openssl dgst.
inline std::string ExtractHexDigest(std::string_view text) {
  auto isHex = [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
  };
  std::size_t i = 0;
  while (i < text.size()) {
    if (!isHex(text[i])) {
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < text.size() && isHex(text[j])) {
      ++j;
    }
    if (j - i == 64) {
      std::string out(text.substr(i, 64));
      for (char &c : out) {
        if (c >= 'A' && c <= 'F') {
          c = static_cast<char>(c - 'A' + 'a');
        }
      }
      return out;
    }
    i = j;
  }
  return {};
}

} // namespace crypto
