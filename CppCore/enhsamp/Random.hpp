#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Seedable random stream owned by one unit of work.
 *
 * Every replica, window, trial sequence and lambda stage draws from its own
 * @c RandomStream. Derived streams are produced with @c spawn so that a run
 * is reproducible from one seed regardless of how units are scheduled.
 */

#include <cstdint>
#include <cstddef>
#include <random>
#include <stdexcept>

namespace enhsamp {

/**
 * @class RandomStream
 * @brief A @c std::mt19937_64 engine with the draws the samplers need.
 */
class RandomStream {
public:
  /**
   * @brief Constructor seeding the engine.
   * @param seed The seed of this stream.
   */
  explicit RandomStream(uint64_t seed) : m_seed(seed), m_engine(seed) {}

  /**
   * @brief Standard normal deviate.
   * @return A draw from N(0, 1).
   */
  double normal() { return m_normal(m_engine); }

  /**
   * @brief Uniform deviate on [0, 1).
   * @return A uniform draw.
   */
  double uniform() { return m_uniform(m_engine); }

  /**
   * @brief Uniform index on [0, n).
   * @param n Exclusive upper bound, must be positive.
   * @return A uniformly drawn index.
   */
  size_t index(size_t n) {
    if (n == 0) {
      throw std::runtime_error("Cannot draw an index from an empty range");
    }
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(m_engine);
  }

  /**
   * @brief Derives an independent stream for a sub-unit of work.
   * @param stream_id Index of the sub-unit (replica, window, stage).
   * @return A new stream seeded from this seed and @a stream_id.
   */
  RandomStream spawn(uint64_t stream_id) const {
    std::seed_seq seq{static_cast<uint32_t>(m_seed),
                      static_cast<uint32_t>(m_seed >> 32),
                      static_cast<uint32_t>(stream_id),
                      static_cast<uint32_t>(stream_id >> 32)};
    uint32_t raw[2];
    seq.generate(raw, raw + 2);
    return RandomStream((static_cast<uint64_t>(raw[0]) << 32) | raw[1]);
  }

  /**
   * @brief Fetches the seed of this stream.
   * @return The seed.
   */
  [[nodiscard]] uint64_t seed() const { return m_seed; }

private:
  uint64_t m_seed;          //!< Seed the engine was created with.
  std::mt19937_64 m_engine; //!< The underlying engine.
  std::normal_distribution<double> m_normal{0.0, 1.0};
  std::uniform_real_distribution<double> m_uniform{0.0, 1.0};
};

} // namespace enhsamp
