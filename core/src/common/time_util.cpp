#include <common/time_util.hpp>

#include <chrono>
#include <ctime>
#include <mutex>
#include <random>

namespace tp {
    double wall_seconds_now() {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    int local_hour_now() {
        const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_val{};
        localtime_r(&t, &tm_val);
        return tm_val.tm_hour;
    }

    std::string random_hex_id() {
        static std::mutex mtx;
        static std::mt19937_64 rng{std::random_device{}()};
        static constexpr char kHex[] = "0123456789abcdef";

        uint64_t hi = 0;
        uint64_t lo = 0;
        {
            std::lock_guard lk(mtx);
            hi = rng();
            lo = rng();
        }

        std::string out(32, '0');
        for (int i = 0; i < 16; ++i) {
            out[static_cast<size_t>(i)] = kHex[(hi >> (60 - 4 * i)) & 0xF];
            out[static_cast<size_t>(16 + i)] = kHex[(lo >> (60 - 4 * i)) & 0xF];
        }
        return out;
    }
}
