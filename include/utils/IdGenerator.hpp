#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>

namespace lease::utils {

/**
 * @brief Генератор случайных идентификаторов
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    /**
     * @brief 128 бит в виде 32 hex-символов (jti токена)
     */
    static std::string generateTokenId() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(16) << dist(gen)
           << std::setw(16) << dist(gen);
        return ss.str();
    }
};

} // namespace lease::utils
