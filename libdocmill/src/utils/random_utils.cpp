#include "../../include/random_utils.hpp"

#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

unsigned long long docmill::RandomUtils::next_u64() {
    return dist(rng);
}

std::string docmill::RandomUtils::random_suffix() {
    static constexpr char digits[] = "0123456789abcdef";
    auto v = next_u64();
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = digits[v & 0xF];
        v >>= 4;
    }
    return out;
}
