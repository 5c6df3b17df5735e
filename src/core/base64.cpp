#include "core/base64.h"

#include <array>

namespace Base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int8_t kInvalid = -1;
constexpr int8_t kPad = -2;

std::array<int8_t, 256> buildReverseTable() {
    std::array<int8_t, 256> table{};
    table.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    table[static_cast<unsigned char>('=')] = kPad;
    return table;
}

bool isSpace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

}  // namespace

std::string encode(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(((length + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= length; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        out.push_back(kAlphabet[triple & 0x3F]);
    }

    size_t rest = length - i;
    if (rest > 0) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (rest == 2) {
            triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        out.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        out.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        out.push_back(rest == 2 ? kAlphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::string encode(const std::string& data) {
    return encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool decode(const std::string& encoded, std::vector<uint8_t>& out) {
    static const std::array<int8_t, 256> kReverse = buildReverseTable();

    std::vector<uint8_t> result;
    result.reserve(decodedSizeUpperBound(encoded.size()));

    uint32_t accumulator = 0;
    int quartetPos = 0;
    int padding = 0;

    for (char c : encoded) {
        if (isSpace(c)) {
            continue;
        }
        int8_t value = kReverse[static_cast<unsigned char>(c)];
        if (value == kInvalid) {
            return false;
        }
        if (value == kPad) {
            // Padding only in the last two positions of a quartet
            if (quartetPos < 2) {
                return false;
            }
            ++padding;
            accumulator <<= 6;
            ++quartetPos;
        } else {
            if (padding > 0) {
                return false;  // data after padding
            }
            accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
            ++quartetPos;
        }

        if (quartetPos == 4) {
            result.push_back(static_cast<uint8_t>((accumulator >> 16) & 0xFF));
            if (padding < 2) {
                result.push_back(static_cast<uint8_t>((accumulator >> 8) & 0xFF));
            }
            if (padding < 1) {
                result.push_back(static_cast<uint8_t>(accumulator & 0xFF));
            }
            accumulator = 0;
            quartetPos = 0;
            if (padding > 0) {
                padding = 3;  // sentinel: nothing may follow
            }
        }
    }

    if (quartetPos != 0) {
        return false;
    }
    out.swap(result);
    return true;
}

size_t decodedSizeUpperBound(size_t encodedLength) {
    return (encodedLength / 4) * 3 + 3;
}

}  // namespace Base64
