#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Base classes and templates for model potentials.
 *
 * Provides the abstract interface and CRTP template for all potential energy
 * surfaces consumed by the integrator and the samplers. Handles the
 * high-level logic for caching, hashing, and force call registration.
 */

// clang-format off
#include <utility>
#include <vector>
#include <stdexcept>
// clang-format on

#ifdef ENHSAMP_HAS_CACHE
#define XXH_INLINE_ALL
#include "enhsamp/PotentialCache.hpp"
#include <xxhash.h>
#endif

#include "enhsamp/ForceStructs.hpp"
#include "enhsamp/PotHelpers.hpp"
#include "enhsamp/pot_types.hpp"
#include "enhsamp/types/Trajectory.hpp"

using enhsamp::types::Configuration;

namespace enhsamp {

/**
 * @class PotentialBase
 * @brief Abstract base class for all potential energy surfaces.
 */
class PotentialBase {
public:
  /**
   * @brief Constructor for PotentialBase.
   * @param inp_type The type of the potential.
   */
  explicit PotentialBase(PotType inp_type) : m_type(inp_type) {}

  /**
   * @brief Virtual destructor.
   */
  virtual ~PotentialBase() = default;

  /**
   * @brief Main interface for potential and force calculation.
   * @param positions The configuration.
   * @return A pair containing the energy and the force vector.
   */
  virtual std::pair<double, Configuration>
  operator()(const Configuration &positions) = 0;

  /**
   * @brief Energy of a configuration.
   * @param positions The configuration.
   * @return The potential energy.
   */
  double energy(const Configuration &positions) {
    return (*this)(positions).first;
  }

  /**
   * @brief Force on a configuration, the negative energy gradient.
   * @param positions The configuration.
   * @return The force vector, same dimension as @a positions.
   */
  Configuration force(const Configuration &positions) {
    return (*this)(positions).second;
  }

  /**
   * @brief Numeric parameters defining the surface.
   *
   * Composite potentials append the parameters of what they wrap. The values
   * are used in log messages and as part of the cache key.
   *
   * @return The flat parameter list.
   */
  virtual std::vector<double> parameters() const = 0;

#ifdef ENHSAMP_HAS_CACHE
  /**
   * @brief Sets the computation cache.
   * @param c Pointer to a PotentialCache instance.
   * @return Void.
   */
  virtual void set_cache(enhsamp::cache::PotentialCache * /*c*/) {
    throw std::runtime_error("PotentialBase::set_cache called directly");
  }
#endif

  /**
   * @brief Fetches the potential type.
   * @return The potential type.
   */
  [[nodiscard]] PotType get_type() const { return m_type; }

protected:
  PotType m_type; //!< The type of the potential energy surface.
};

/**
 * @class Potential
 * @brief Template class for specific potential implementations.
 *
 * Uses the Curiously Recurring Template Pattern to provide static
 * polymorphism for the internal @c forceImpl call.
 */
template <typename Derived>
class Potential : public PotentialBase, public registry<Derived> {
public:
  using PotentialBase::PotentialBase;

#ifdef ENHSAMP_HAS_CACHE
  /**
   * @brief Sets the computation cache for the specific implementation.
   * @param c Pointer to a PotentialCache instance.
   * @return Void.
   */
  void set_cache(enhsamp::cache::PotentialCache *c) override { _cache = c; }
#endif

  /**
   * @brief Implements the potential and force calculation logic.
   *
   * This method manages the transformation of a @c Configuration into the
   * flat @c ForceInput / @c ForceOut structures.
   *
   * # Caching Logic
   * If @c ENHSAMP_HAS_CACHE is defined, the method:
   * 1. Generates a @c XXH3_64bits hash of coordinates, type and parameters.
   * 2. Checks the @c rocksdb backend for a hit.
   * 3. Returns cached values if present, otherwise computes and stores results.
   *
   * @param positions The configuration.
   * @return A pair containing the energy and the force vector.
   */
  std::pair<double, Configuration>
  operator()(const Configuration &positions) override {
    size_t nDims = positions.size();
    Configuration forces(nDims, 0.0);
    double energy = 0.0;
    double variance = 0.0;

    ForceInput fi{.nDims = nDims, .pos = positions.data()};
    ForceOut fo{.F = forces.data(), .energy = energy, .variance = variance};

#ifdef ENHSAMP_HAS_CACHE
    // Hashing
    size_t hash_val = 0;
    hash_val ^= XXH3_64bits(fi.pos, fi.nDims * sizeof(double));
    std::vector<double> params = this->parameters();
    hash_val ^= XXH3_64bits(params.data(), params.size() * sizeof(double));
    size_t type_val = static_cast<size_t>(m_type);
    hash_val ^= XXH3_64bits(&type_val, sizeof(size_t));

    enhsamp::cache::KeyHash key(hash_val);

    // Cache Read
    if (_cache) {
      auto hit = _cache->find(key);
      if (hit) {
        _cache->deserialize_hit(*hit, fo.energy, forces);
        return {fo.energy, forces};
      }
    }

    // Computation
    static_cast<Derived *>(this)->forceImpl(fi, &fo);
    registry<Derived>::incrementForceCalls();

    // Cache Write
    if (_cache) {
      _cache->add_serialized(key, fo.energy, forces);
    }
#else
    static_cast<Derived *>(this)->forceImpl(fi, &fo);
    registry<Derived>::incrementForceCalls();
#endif

    return {fo.energy, forces};
  }

  /**
   * @brief Abstract hook for the actual implementation.
   * @param in Structure containing the coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  virtual void forceImpl(const ForceInput &in, ForceOut *out) const = 0;

private:
#ifdef ENHSAMP_HAS_CACHE
  enhsamp::cache::PotentialCache *_cache =
      nullptr; //!< Pointer to the optional calculation cache.
#endif
};

} // namespace enhsamp
