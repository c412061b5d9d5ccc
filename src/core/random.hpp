#pragma once
// core/random.hpp - Seeded PCG random source (PCG-XSH-RR 32/64)
//
// Scene construction draws initial orbital phases from this generator, so a
// fixed seed reproduces the exact same starting configuration.

#include "core/types.hpp"

namespace orrery::core
{

class PcgRng {
public:
    explicit PcgRng(u64 seed, u64 stream = 1)
        : m_state(seed + (stream | 1)), m_inc((stream << 1) | 1) {
        next();
    }

    u32 next() {
        u64 old = m_state;
        m_state = old * 6364136223846793005ULL + m_inc;
        u32 xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
        u32 rot = static_cast<u32>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    /// Uniform double in [0,1)
    f64 next_double() {
        return static_cast<f64>(next()) / 4294967296.0;
    }

    /// Uniform double in [lo, hi)
    f64 next_in_range(f64 lo, f64 hi) {
        return lo + next_double() * (hi - lo);
    }

private:
    u64 m_state;
    u64 m_inc;
};

} // namespace orrery::core
