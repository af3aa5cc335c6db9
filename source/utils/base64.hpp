#ifndef FRAMESYNC_BASE64_HPP
#define FRAMESYNC_BASE64_HPP

// Standard (RFC 4648) base64 over OpenSSL, used for CDP screencast payloads and
// MCP image content.

#include <cstdint>
#include <string>
#include <vector>

namespace base64 {

std::string encode(const std::vector<uint8_t> &bytes);

// Decodes padded or unpadded input; whitespace is skipped.
// Returns false on any character outside the alphabet.
bool decode(const std::string &text, std::vector<uint8_t> &output_bytes);

} // namespace base64

#endif // FRAMESYNC_BASE64_HPP
