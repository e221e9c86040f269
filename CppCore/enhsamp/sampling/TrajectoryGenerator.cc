// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/sampling/TrajectoryGenerator.hpp"
#include "enhsamp/logging.hpp"

#include <stdexcept>

namespace enhsamp {

std::string to_string(GeneratorState state) {
  switch (state) {
  case GeneratorState::Running:
    return "RUNNING";
  case GeneratorState::HitStateA:
    return "HIT_STATE_A";
  case GeneratorState::HitStateB:
    return "HIT_STATE_B";
  case GeneratorState::MaxStepsReached:
    return "MAX_STEPS_REACHED";
  }
  return "UNKNOWN";
}

GeneratorState classify(const Configuration &conf,
                        const std::vector<StateIndicator> &states) {
  if (!states.empty() && states[0](conf)) {
    return GeneratorState::HitStateA;
  }
  if (states.size() > 1 && states[1](conf)) {
    return GeneratorState::HitStateB;
  }
  return GeneratorState::Running;
}

TrajectoryGenerator::TrajectoryGenerator(const OverdampedLangevin &integrator,
                                         size_t output_stride)
    : m_integrator(integrator), m_stride(output_stride) {
  if (m_stride == 0) {
    throw std::runtime_error("Output stride must be positive");
  }
}

GenerationResult TrajectoryGenerator::fixed(const Configuration &start,
                                            size_t n_steps,
                                            RandomStream &rng) const {
  return run(start, n_steps, {}, rng);
}

GenerationResult
TrajectoryGenerator::bounded(const Configuration &start, size_t max_steps,
                             const std::vector<StateIndicator> &states,
                             RandomStream &rng) const {
  if (states.empty() || states.size() > 2) {
    throw std::runtime_error(
        "Bounded generation needs one or two state predicates");
  }
  return run(start, max_steps, states, rng);
}

/**
 * @details
 * The start point is classified before any step is taken. Afterwards the
 * predicates are only evaluated on recorded frames, so the stored
 * trajectory always ends on the frame that triggered the transition.
 */
GenerationResult
TrajectoryGenerator::run(const Configuration &start, size_t n_steps,
                         const std::vector<StateIndicator> &states,
                         RandomStream &rng) const {
  GenerationResult result{Trajectory(start.size()), GeneratorState::Running,
                          0};
  result.trajectory.append(start);
  result.state = classify(start, states);

  Configuration x = start;
  size_t i = 0;
  while (result.state == GeneratorState::Running) {
    if (i == n_steps) {
      result.state = GeneratorState::MaxStepsReached;
      break;
    }
    x = m_integrator.step(x, rng);
    if (i % m_stride == 0) {
      result.trajectory.append(x);
      result.state = classify(x, states);
    }
    ++i;
  }
  result.steps_taken = i;

  log::get()->trace("Generated {} frames in {} steps, state {}",
                    result.trajectory.frames(), result.steps_taken,
                    to_string(result.state));
  return result;
}

} // namespace enhsamp
