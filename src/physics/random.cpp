/// @file random.cpp
/// @brief Mulberry32 generator

#include <newton/physics/random.hpp>
#include <algorithm>
#include <cmath>

namespace newton_physics {

namespace {
constexpr double TWO_PI = 6.28318530717958647692;
} // anonymous namespace

double PhysicsRandom::next() noexcept {
    m_state += 0x6D2B79F5u;
    std::uint32_t t = m_state;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
}

double PhysicsRandom::gaussian() noexcept {
    // u1 == 0 would send log() to -inf
    const double u1 = std::max(next(), 1e-300);
    const double u2 = next();
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(TWO_PI * u2);
}

} // namespace newton_physics
