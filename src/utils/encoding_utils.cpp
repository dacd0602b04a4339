/**
 * @file encoding_utils.cpp
 * @brief OpenSSL-backed base64 and random token generation
 *
 * EVP_EncodeBlock / EVP_DecodeBlock operate on whole blocks and do not handle
 * padding on decode: the decoded length always includes the zero bytes that
 * stand in for '=' characters, so they are trimmed here.
 *
 * @date 2025
 */

#include "coderunner/utils/encoding_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace coderunner {
namespace utils {

namespace {

bool IsBase64Char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // anonymous namespace

std::string EncodingUtils::ToBase64(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    std::string encoded(Base64Length(data.size()) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::optional<std::string> EncodingUtils::FromBase64(const std::string& encoded) {
    if (encoded.empty()) {
        return std::string();
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(encoded[i]);
        if (c == '=') {
            // '=' only allowed in the last two positions
            if (i < encoded.size() - 2) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            return std::nullopt;
        }
    }

    std::string decoded(encoded.size() / 4 * 3, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

std::string EncodingUtils::RandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("OpenSSL RAND_bytes failed");
    }
    return ToHex(std::string(bytes.begin(), bytes.end()));
}

std::string EncodingUtils::ToHex(const std::string& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : data) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

} // namespace utils
} // namespace coderunner
