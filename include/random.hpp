#pragma once
#include <random>
#include "uint128.hpp"

// Entropy for ULID payloads. Not a security primitive: uniqueness is probabilistic.
class Random {
private:
    std::random_device rd;
    std::mt19937_64 gen;
public:
    Random() : gen(rd()) {}
    explicit Random(uint64_t seed) : gen(seed) {}
    ~Random() = default;

    // n uniformly random low bits, n in [0, 128]
    u128 bits(int n) {
        u128 v = u128hlp::make(gen(), gen());
        return v & u128hlp::mask(n);
    }

    // One engine per thread, so callers never share state.
    static Random& local() {
        static thread_local Random instance;
        return instance;
    }
};
