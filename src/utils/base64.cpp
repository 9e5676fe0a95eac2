#include "utils/base64.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace printvoice {
namespace utils {

std::string encodeBase64(const uint8_t* data, size_t size) {
    if (size == 0) {
        return "";
    }

    std::string encoded(4 * ((size + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  data, static_cast<int>(size));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

std::string encodeBase64(const std::vector<uint8_t>& data) {
    return encodeBase64(data.data(), data.size());
}

std::vector<uint8_t> decodeBase64(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length is not a multiple of 4");
    }

    std::vector<uint8_t> decoded(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("malformed base64 input");
    }

    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    decoded.resize(static_cast<size_t>(written) - padding);
    return decoded;
}

} // namespace utils
} // namespace printvoice
