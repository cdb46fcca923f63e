/**
 * @file encoding.h
 * @brief libsodium-backed encoders for clipshare
 *
 * Binary clipboard payloads travel as standard (padded) base64.
 */

#ifndef CLIPSHARE_ENCODING_H
#define CLIPSHARE_ENCODING_H

#include "error.h"
#include "types.h"
#include <string>

namespace clipshare {

/**
 * @brief Initialize libsodium
 * @return Success or error
 *
 * Safe to call more than once. The encoders call it on first use.
 */
CLIPSHARE_API Result<void> encoding_init();

/// Encode bytes as standard padded base64
CLIPSHARE_API std::string base64_encode(const Bytes &data);

/// Encode a byte string as standard padded base64
CLIPSHARE_API std::string base64_encode(const std::string &data);

/**
 * @brief Decode standard padded base64
 * @return Decoded bytes, or EncodingError when the input is malformed
 *
 * Whitespace (line breaks from MIME-style wrapping) is ignored.
 */
CLIPSHARE_API Result<Bytes> base64_decode(const std::string &encoded);

/**
 * @brief Decode %XX escapes in a URI component
 *
 * Malformed escapes are kept verbatim.
 */
CLIPSHARE_API std::string percent_decode(const std::string &input);

/**
 * @brief Drop invalid UTF-8 sequences from a byte string
 */
CLIPSHARE_API std::string sanitize_utf8(const std::string &input);

} // namespace clipshare

#endif // CLIPSHARE_ENCODING_H
