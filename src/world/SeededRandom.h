#pragma once

#include <cstdint>
#include <string>

namespace world
{

/// Folds a room code into the 32-bit generator seed every client derives identically.
std::uint32_t hashSeed(const std::string &seed);

/// Mulberry32 stream. Every client must consume draws in the same order.
class SeededRandom
{
  public:
    explicit SeededRandom(std::uint32_t seed) : m_state(seed) {}
    explicit SeededRandom(const std::string &seed) : m_state(hashSeed(seed)) {}

    double random();
    int randomInt(int min, int max);

    [[nodiscard]] std::uint32_t state() const noexcept { return m_state; }
    [[nodiscard]] std::uint64_t drawCount() const noexcept { return m_draws; }

  private:
    std::uint32_t m_state = 0;
    std::uint64_t m_draws = 0;
};

} // namespace world
