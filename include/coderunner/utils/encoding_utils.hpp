/**
 * @file encoding_utils.hpp
 * @brief Base64 and random-token helpers backed by OpenSSL
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace coderunner {
namespace utils {

/**
 * @class EncodingUtils
 * @brief Binary-safe encodings used on the bootstrap/manifest wire
 *
 * All methods are static and thread-safe.
 */
class EncodingUtils {
public:
    /**
     * @brief Standard base64 (RFC 4648, padded, no line breaks)
     * @param data Arbitrary bytes
     */
    static std::string ToBase64(const std::string& data);

    /**
     * @brief Decode padded base64
     * @return Decoded bytes, or std::nullopt for malformed input
     */
    static std::optional<std::string> FromBase64(const std::string& encoded);

    /// Length of ToBase64() output for @p raw_size input bytes
    static std::size_t Base64Length(std::size_t raw_size) { return 4 * ((raw_size + 2) / 3); }

    /**
     * @brief Cryptographically random lowercase hex token
     * @param num_bytes Random bytes drawn (token has 2x hex characters)
     * @throws std::runtime_error if the OpenSSL RNG fails
     */
    static std::string RandomHex(std::size_t num_bytes);

    /// Lowercase hex of arbitrary bytes
    static std::string ToHex(const std::string& data);
};

} // namespace utils
} // namespace coderunner
