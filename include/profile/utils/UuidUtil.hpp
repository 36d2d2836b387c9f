#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>

namespace profile::utils {

/**
 * UUID generation and parsing utility.
 */
class UuidUtil {
public:
    using Bytes = std::array<uint8_t, 16>;

    /**
     * Generate a UUID v4 (random).
     */
    static Bytes generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dis;

        uint64_t ab = dis(gen);
        uint64_t cd = dis(gen);

        // Set version to 4 (random)
        ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        // Set variant to RFC 4122
        cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        Bytes bytes{};
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(ab >> (56 - 8 * i));
            bytes[8 + i] = static_cast<uint8_t>(cd >> (56 - 8 * i));
        }
        return bytes;
    }

    /**
     * Parse a UUID string.
     *
     * Accepts the 8-4-4-4-12 form in either case, optionally wrapped in
     * braces or prefixed with "urn:uuid:".
     */
    static std::optional<Bytes> parse(const std::string& text) {
        std::string uuid = text;
        if (uuid.size() == 38 && uuid.front() == '{' && uuid.back() == '}') {
            uuid = uuid.substr(1, 36);
        } else if (uuid.size() == 45 && toLowerAscii(uuid.substr(0, 9)) == "urn:uuid:") {
            uuid = uuid.substr(9);
        }

        if (!isValid(uuid)) {
            return std::nullopt;
        }

        std::string hex;
        hex.reserve(32);
        for (char c : uuid) {
            if (c != '-') hex.push_back(c);
        }

        Bytes bytes{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>((hexValue(hex[2 * i]) << 4) | hexValue(hex[2 * i + 1]));
        }
        return bytes;
    }

    /**
     * Validate canonical UUID format.
     */
    static bool isValid(const std::string& uuid) {
        if (uuid.length() != 36) {
            return false;
        }

        for (size_t i = 0; i < uuid.length(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (uuid[i] != '-') {
                    return false;
                }
            } else if (hexValue(uuid[i]) < 0) {
                return false;
            }
        }

        return true;
    }

    /**
     * Format as lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
     */
    static std::string toString(const Bytes& bytes) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    /**
     * Version nibble (4 for random UUIDs).
     */
    static int version(const Bytes& bytes) {
        return bytes[6] >> 4;
    }

private:
    static int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    static std::string toLowerAscii(std::string s) {
        for (auto& c : s) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        return s;
    }
};

} // namespace profile::utils
