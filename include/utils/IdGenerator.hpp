#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace newsletter::utils
{

    /**
     * @brief Идентификаторы вида "<prefix>-<uuid v4>"
     *
     * @note thread_local генератор, безопасно из потоков обработчиков
     */
    class IdGenerator
    {
    public:
        static std::string uuid()
        {
            thread_local std::mt19937_64 gen{std::random_device{}()};
            std::uniform_int_distribution<uint64_t> dist;

            const uint64_t hi = (dist(gen) & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
            const uint64_t lo = (dist(gen) & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

            std::ostringstream ss;
            ss << std::hex << std::setfill('0')
               << std::setw(8) << (hi >> 32) << '-'
               << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
               << std::setw(4) << (hi & 0xFFFF) << '-'
               << std::setw(4) << (lo >> 48) << '-'
               << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
            return ss.str();
        }

        static std::string withPrefix(const std::string &prefix)
        {
            return prefix + "-" + uuid();
        }
    };

} // namespace newsletter::utils
