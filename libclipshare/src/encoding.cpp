/**
 * @file encoding.cpp
 * @brief libsodium wrapper implementation for clipshare encoders
 */

#include "clipshare/encoding.h"
#include <atomic>
#include <cctype>
#include <sodium.h>

namespace clipshare {

namespace {
std::atomic<bool> g_initialized{false};

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

/// Length of the valid UTF-8 sequence starting at @p i, 0 if invalid
size_t utf8_sequence_length(const std::string &s, size_t i) {
  const auto c0 = static_cast<unsigned char>(s[i]);
  if (c0 < 0x80) {
    return 1;
  }

  size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (c0 >= 0xC2 && c0 <= 0xDF) {
    len = 2;
  } else if (c0 >= 0xE0 && c0 <= 0xEF) {
    len = 3;
    if (c0 == 0xE0)
      lo = 0xA0;
    if (c0 == 0xED)
      hi = 0x9F; // No UTF-16 surrogates
  } else if (c0 >= 0xF0 && c0 <= 0xF4) {
    len = 4;
    if (c0 == 0xF0)
      lo = 0x90;
    if (c0 == 0xF4)
      hi = 0x8F;
  } else {
    return 0;
  }

  if (i + len > s.size()) {
    return 0;
  }

  const auto c1 = static_cast<unsigned char>(s[i + 1]);
  if (c1 < lo || c1 > hi) {
    return 0;
  }
  for (size_t k = 2; k < len; ++k) {
    if (!is_continuation(static_cast<unsigned char>(s[i + k]))) {
      return 0;
    }
  }
  return len;
}
} // namespace

// ============================================================================
// Initialization
// ============================================================================

Result<void> encoding_init() {
  if (g_initialized.load()) {
    return Result<void>::ok();
  }

  if (sodium_init() < 0) {
    return Error(ErrorCode::Unknown, "Failed to initialize libsodium");
  }

  g_initialized.store(true);
  return Result<void>::ok();
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const Bytes &data) {
  const size_t encoded_len =
      sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
  std::string out(encoded_len, '\0');
  sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                    sodium_base64_VARIANT_ORIGINAL);

  // ENCODED_LEN counts the trailing NUL
  out.resize(encoded_len - 1);
  return out;
}

std::string base64_encode(const std::string &data) {
  return base64_encode(Bytes(data.begin(), data.end()));
}

Result<Bytes> base64_decode(const std::string &encoded) {
  CLIPSHARE_TRY(encoding_init());

  if (encoded.empty()) {
    return Bytes{};
  }

  Bytes out(encoded.size() / 4 * 3 + 3);
  size_t decoded_len = 0;

  // A null end pointer makes libsodium reject trailing garbage
  if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                        " \t\r\n", &decoded_len, nullptr,
                        sodium_base64_VARIANT_ORIGINAL) != 0) {
    return Error(ErrorCode::EncodingError, "Invalid base64 data");
  }

  out.resize(decoded_len);
  return out;
}

// ============================================================================
// Text Helpers
// ============================================================================

std::string percent_decode(const std::string &input) {
  std::string out;
  out.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '%' && i + 2 < input.size()) {
      int hi = hex_value(input[i + 1]);
      int lo = hex_value(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(input[i]);
  }

  return out;
}

std::string sanitize_utf8(const std::string &input) {
  std::string out;
  out.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    size_t len = utf8_sequence_length(input, i);
    if (len == 0) {
      ++i;
      continue;
    }
    out.append(input, i, len);
    i += len;
  }

  return out;
}

} // namespace clipshare
