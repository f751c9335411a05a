/*
 * Minimal base64 codec (RFC 4648, standard alphabet, '=' padding).
 * Used for image payloads in JSON and HTML data URIs.
 */

#ifndef DOCRECON_BASE64_H
#define DOCRECON_BASE64_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docrecon_base64 {

static const char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static inline int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

static inline std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i+1]) << 8) | data[i+2];
        out += alphabet[(n >> 18) & 0x3f];
        out += alphabet[(n >> 12) & 0x3f];
        out += alphabet[(n >> 6) & 0x3f];
        out += alphabet[n & 0x3f];
    }

    size_t rem = len - i;
    if (rem == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += alphabet[(n >> 18) & 0x3f];
        out += alphabet[(n >> 12) & 0x3f];
        out += "==";
    } else if (rem == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i+1]) << 8);
        out += alphabet[(n >> 18) & 0x3f];
        out += alphabet[(n >> 12) & 0x3f];
        out += alphabet[(n >> 6) & 0x3f];
        out += '=';
    }
    return out;
}

static inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

/* Whitespace is skipped. Returns false on any other non-alphabet byte
   or when the input does not end on a quantum boundary. */
static inline bool decode(const std::string& in, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve((in.size() / 4) * 3);

    uint32_t acc = 0;
    int bits = 0;
    int pad = 0;
    size_t count = 0;

    for (char c : in) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            ++pad;
            ++count;
            continue;
        }
        if (pad) return false;   /* data after padding */
        int v = decode_char(c);
        if (v < 0) return false;
        acc = (acc << 6) | uint32_t(v);
        bits += 6;
        ++count;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(uint8_t((acc >> bits) & 0xff));
        }
    }

    return count % 4 == 0 && pad <= 2;
}

} // namespace docrecon_base64

#endif
