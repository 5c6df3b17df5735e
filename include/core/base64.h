#ifndef BASE64_H
#define BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// RFC 4648 Base64 used for uploads carried inside JSON commands
namespace Base64 {

std::string encode(const uint8_t* data, size_t length);
std::string encode(const std::string& data);

// Whitespace is ignored. Returns false (and leaves out untouched) on invalid input.
bool decode(const std::string& encoded, std::vector<uint8_t>& out);

// Upper bound of decoded size, used to reject oversized uploads before decoding
size_t decodedSizeUpperBound(size_t encodedLength);

}  // namespace Base64

#endif  // BASE64_H
