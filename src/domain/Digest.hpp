/**
 * @file Digest.hpp
 * @brief Value object holding a cryptographic content digest.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace forker::domain {

struct Digest {
    std::string algorithm;              ///< "sha256" or "sha512".
    std::vector<unsigned char> bytes;

    /// CRC-32 computed in the same pass. Quick-check signal for logs only, never an integrity decision.
    std::optional<std::uint32_t> quickCheckCrc32;

    bool empty() const { return bytes.empty(); }

    /** @brief Lowercase hex rendering of the digest bytes. */
    std::string hex() const {
        static const char* kHexDigits = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (unsigned char b : bytes) {
            out.push_back(kHexDigits[b >> 4]);
            out.push_back(kHexDigits[b & 0x0F]);
        }
        return out;
    }

    static Digest FromHex(const std::string& algorithm, const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw std::invalid_argument("Digest hex has odd length");
        }
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            throw std::invalid_argument("Digest hex contains a non-hex character");
        };

        Digest d;
        d.algorithm = algorithm;
        d.bytes.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            d.bytes.push_back(static_cast<unsigned char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
        }
        return d;
    }
};

/** @brief Byte-for-byte comparison. The quick-check CRC does not take part. */
inline bool operator==(const Digest& a, const Digest& b) {
    return a.algorithm == b.algorithm && a.bytes == b.bytes;
}

inline bool operator!=(const Digest& a, const Digest& b) {
    return !(a == b);
}

} // namespace forker::domain
