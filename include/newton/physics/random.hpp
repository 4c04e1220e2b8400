/// @file random.hpp
/// @brief Deterministic random source for newton_physics

#pragma once

#include "fwd.hpp"

#include <cstdint>

namespace newton_physics {

/// Mulberry32 generator
///
/// The full generator state is a single 32-bit word, so it can be saved in a
/// checkpoint and restored exactly.
class PhysicsRandom {
public:
    explicit PhysicsRandom(std::uint32_t seed = 12345) noexcept
        : m_initial_seed(seed)
        , m_state(seed)
    {}

    /// Return to the initial seed
    void reset() noexcept { m_state = m_initial_seed; }

    /// Reseed and make the new seed the initial one
    void reseed(std::uint32_t seed) noexcept {
        m_initial_seed = seed;
        m_state = seed;
    }

    /// Uniform value in [0, 1)
    [[nodiscard]] double next() noexcept;

    /// Uniform value in [min, max)
    [[nodiscard]] double range(double min, double max) noexcept {
        return min + next() * (max - min);
    }

    /// Standard normal sample (Box-Muller)
    [[nodiscard]] double gaussian() noexcept;

    [[nodiscard]] std::uint32_t state() const noexcept { return m_state; }
    void set_state(std::uint32_t state) noexcept { m_state = state; }
    [[nodiscard]] std::uint32_t initial_seed() const noexcept { return m_initial_seed; }

private:
    std::uint32_t m_initial_seed;
    std::uint32_t m_state;
};

} // namespace newton_physics
