#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Trajectory generation with optional early termination.
 *
 * Generation is a finite-state loop. It starts in @c Running and, after
 * every recorded frame, either stays there or moves to a terminal state:
 * @c HitStateA or @c HitStateB when the corresponding predicate fires, or
 * @c MaxStepsReached when the step budget is spent. A terminal state fixes
 * the trajectory length.
 */

#include <string>
#include <vector>

#include "enhsamp/Integrator.hpp"
#include "enhsamp/Random.hpp"
#include "enhsamp/StateIndicator.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @brief States of the generation loop.
 */
enum class GeneratorState {
  Running,        //!< Steps remain and no predicate fired.
  HitStateA,      //!< The first predicate fired.
  HitStateB,      //!< The second predicate fired.
  MaxStepsReached //!< The step budget was spent.
};

std::string to_string(GeneratorState state);

/**
 * @brief Output of one generation call.
 */
struct GenerationResult {
  Trajectory trajectory; //!< Recorded frames, start point included.
  GeneratorState state{GeneratorState::Running}; //!< Terminal state.
  size_t steps_taken{0}; //!< Integrator steps actually performed.
};

/**
 * @class TrajectoryGenerator
 * @brief Drives an @c OverdampedLangevin integrator for a bounded number of
 * steps.
 *
 * The configuration after step @a i (0-based) is recorded when
 * @c i % output_stride == 0, so a full run of @a N steps holds
 * @c ceil(N / output_stride) + 1 frames. Biased generation is obtained by
 * handing the integrator a @c BiasedPotential.
 */
class TrajectoryGenerator {
public:
  /**
   * @brief Constructor for TrajectoryGenerator.
   * @param integrator    The bound integrator; must outlive the generator.
   * @param output_stride Recording stride, positive.
   */
  explicit TrajectoryGenerator(const OverdampedLangevin &integrator,
                               size_t output_stride = 1);

  /**
   * @brief Fixed-length generation.
   * @param start   Initial configuration.
   * @param n_steps Number of integrator steps.
   * @param rng     Random stream of the calling unit of work.
   * @return The trajectory, always in state @c MaxStepsReached.
   */
  GenerationResult fixed(const Configuration &start, size_t n_steps,
                         RandomStream &rng) const;

  /**
   * @brief Bounded generation that stops when a state is reached.
   * @param start     Initial configuration.
   * @param max_steps Step budget.
   * @param states    One or two predicates, checked in order (A, then B).
   * @param rng       Random stream of the calling unit of work.
   * @return The trajectory, ending at the first recorded frame inside a
   * state, or after @a max_steps.
   *
   * A start point already inside a state gives a one-frame trajectory.
   */
  GenerationResult bounded(const Configuration &start, size_t max_steps,
                           const std::vector<StateIndicator> &states,
                           RandomStream &rng) const;

  size_t output_stride() const { return m_stride; }

private:
  GenerationResult run(const Configuration &start, size_t n_steps,
                       const std::vector<StateIndicator> &states,
                       RandomStream &rng) const;

  const OverdampedLangevin &m_integrator;
  size_t m_stride;
};

/**
 * @brief Classifies a configuration against at most two predicates.
 * @param conf   The configuration.
 * @param states Predicates A and optionally B.
 * @return @c HitStateA, @c HitStateB or @c Running.
 */
GeneratorState classify(const Configuration &conf,
                        const std::vector<StateIndicator> &states);

} // namespace enhsamp
