#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace tb::utils
{

// Random (version 4) UUID in canonical 8-4-4-4-12 form.
inline std::string generate_uuid4()
{
    thread_local std::mt19937_64 rng = []
    {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device(),
                           device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t high = dist(rng);
    std::uint64_t low = dist(rng);
    high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    low = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    constexpr char kHexDigits[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    auto append = [&](std::uint64_t value, int nibbles, int shift_from)
    {
        for (int i = 0; i < nibbles; ++i)
        {
            int shift = shift_from - 4 * i;
            result.push_back(kHexDigits[(value >> shift) & 0x0F]);
        }
    };
    append(high, 8, 60);
    result.push_back('-');
    append(high, 4, 28);
    result.push_back('-');
    append(high, 4, 12);
    result.push_back('-');
    append(low, 4, 60);
    result.push_back('-');
    append(low, 12, 44);
    return result;
}

} // namespace tb::utils
