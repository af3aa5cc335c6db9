#include "utils/base64.hpp"

#include <openssl/evp.h>

namespace base64 {

static bool is_whitespace(char character) {
    return character == ' ' || character == '\n' || character == '\r' || character == '\t';
}

std::string encode(const std::vector<uint8_t> &bytes) {
    if (bytes.empty()) {
        return "";
    }
    // EVP_EncodeBlock writes a terminating NUL after the padded output.
    std::string output(((bytes.size() + 2) / 3) * 4 + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&output[0]), bytes.data(),
                                  static_cast<int>(bytes.size()));
    output.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return output;
}

bool decode(const std::string &text, std::vector<uint8_t> &output_bytes) {
    output_bytes.clear();

    std::string compact;
    compact.reserve(text.size());
    for (char character : text) {
        if (!is_whitespace(character)) {
            compact += character;
        }
    }

    // EVP_DecodeBlock reads '=' as a zero sextet anywhere, so padding is checked here.
    size_t data_length = compact.find('=');
    if (data_length == std::string::npos) {
        data_length = compact.size();
    }
    if (compact.find_first_not_of('=', data_length) != std::string::npos || compact.size() - data_length > 2) {
        return false;
    }
    if (data_length % 4 == 1) {
        return false;
    }
    if (data_length == 0) {
        return compact.empty();
    }

    compact.resize(data_length);
    size_t padding = (4 - data_length % 4) % 4;
    compact.append(padding, '=');

    output_bytes.resize((compact.size() / 4) * 3);
    int decoded = EVP_DecodeBlock(output_bytes.data(), reinterpret_cast<const unsigned char *>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0) {
        output_bytes.clear();
        return false;
    }
    // The decoded length counts the zero bytes produced by padding.
    output_bytes.resize(static_cast<size_t>(decoded) - padding);
    return true;
}

} // namespace base64
