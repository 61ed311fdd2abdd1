#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace lease::utils {

/**
 * @brief Base64 URL-safe кодирование без паддинга (RFC 4648 §5)
 */
class Base64Url {
public:
    static std::string encode(const std::string& input) {
        static const char* chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
        std::string result;
        result.reserve((input.size() * 4 + 2) / 3);

        uint32_t val = 0;
        int valb = -6;
        for (unsigned char c : input) {
            val = ((val << 8) | c) & 0xFFFFFF;
            valb += 8;
            while (valb >= 0) {
                result.push_back(chars[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6) {
            result.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
        }
        return result;
    }

    /**
     * @brief Строгое декодирование
     *
     * @return nullopt при недопустимом символе, паддинге или длине
     */
    static std::optional<std::string> decode(const std::string& input) {
        if (input.size() % 4 == 1) {
            return std::nullopt;
        }

        std::string result;
        result.reserve(input.size() * 3 / 4);

        uint32_t val = 0;
        int valb = -8;
        for (unsigned char c : input) {
            int digit = lookup(c);
            if (digit < 0) {
                return std::nullopt;
            }
            val = ((val << 6) | static_cast<uint32_t>(digit)) & 0xFFFFFF;
            valb += 6;
            if (valb >= 0) {
                result.push_back(static_cast<char>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        return result;
    }

private:
    static int lookup(unsigned char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '-') return 62;
        if (c == '_') return 63;
        return -1;
    }
};

} // namespace lease::utils
