#include "rtk_vrchat/totp.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>

namespace rtk::vrchat {

bool base32_decode(const std::string& text, std::vector<uint8_t>& out, std::string& error) {
  out.clear();
  uint32_t buffer = 0;
  int bits = 0;
  for (char raw : text) {
    if (raw == ' ' || raw == '=' || raw == '-') continue;
    const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(raw)));
    int value = -1;
    if (c >= 'A' && c <= 'Z') {
      value = c - 'A';
    } else if (c >= '2' && c <= '7') {
      value = c - '2' + 26;
    }
    if (value < 0) {
      error = std::string("invalid base32 character: ") + raw;
      return false;
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(value);
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
    }
  }
  if (out.empty()) {
    error = "empty base32 key";
    return false;
  }
  return true;
}

bool totp_code(const std::vector<uint8_t>& key, int64_t unix_seconds, std::string& out, std::string& error) {
  if (key.empty()) {
    error = "empty TOTP key";
    return false;
  }
  uint64_t counter = static_cast<uint64_t>(unix_seconds / kTotpStepSeconds);
  unsigned char message[8];
  for (int i = 7; i >= 0; --i) {
    message[i] = static_cast<unsigned char>(counter & 0xFF);
    counter >>= 8;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), message, sizeof(message), digest,
            &digest_len) ||
      digest_len < 20) {
    error = "HMAC-SHA1 failed";
    return false;
  }

  // Dynamic truncation.
  const int offset = digest[digest_len - 1] & 0x0F;
  const uint32_t binary = (static_cast<uint32_t>(digest[offset] & 0x7F) << 24) |
                          (static_cast<uint32_t>(digest[offset + 1]) << 16) |
                          (static_cast<uint32_t>(digest[offset + 2]) << 8) |
                          static_cast<uint32_t>(digest[offset + 3]);
  uint32_t modulus = 1;
  for (int i = 0; i < kTotpDigits; ++i) modulus *= 10;

  std::string code = std::to_string(binary % modulus);
  if (code.size() < static_cast<size_t>(kTotpDigits)) {
    code.insert(0, static_cast<size_t>(kTotpDigits) - code.size(), '0');
  }
  out = std::move(code);
  return true;
}

int totp_remaining_seconds(int64_t unix_seconds) {
  return kTotpStepSeconds - static_cast<int>(unix_seconds % kTotpStepSeconds);
}

} // namespace rtk::vrchat
