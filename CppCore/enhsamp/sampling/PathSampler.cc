// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of two-way shooting transition path sampling.
 */

#include "enhsamp/sampling/PathSampler.hpp"
#include "enhsamp/logging.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace enhsamp {

void validate(const TPSOptions &opts) {
  if (opts.path_length < 2) {
    throw std::runtime_error(fmt::format(
        "Path length must be at least 2 steps, got {}", opts.path_length));
  }
  if (opts.output_stride == 0) {
    throw std::runtime_error("TPS output stride must be positive");
  }
  if (opts.equilibration_trials >= opts.n_trials) {
    throw std::runtime_error(
        fmt::format("Equilibration ({} trials) must be shorter than the run "
                    "({} trials)",
                    opts.equilibration_trials, opts.n_trials));
  }
}

bool is_reactive_path(GeneratorState fwd_end, GeneratorState bwd_end) {
  return (fwd_end == GeneratorState::HitStateB &&
          bwd_end == GeneratorState::HitStateA) ||
         (fwd_end == GeneratorState::HitStateA &&
          bwd_end == GeneratorState::HitStateB);
}

double flexible_acceptance_probability(size_t n_old, size_t n_new) {
  if (n_new == 0) {
    throw std::runtime_error("Proposed path has zero length");
  }
  double ratio = static_cast<double>(n_old) / static_cast<double>(n_new);
  return std::min(1.0, ratio);
}

double PathEnsemble::acceptance_rate() const {
  if (n_trials == 0) {
    return 0.0;
  }
  return static_cast<double>(n_accepted) / static_cast<double>(n_trials);
}

double PathEnsemble::mean_path_frames() const {
  if (paths.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &path : paths) {
    total += static_cast<double>(path.frames());
  }
  return total / static_cast<double>(paths.size());
}

TransitionPathSampler::TransitionPathSampler(
    const OverdampedLangevin &integrator, StateIndicator state_a,
    StateIndicator state_b, TPSOptions opts, RandomStream rng)
    : m_generator(integrator), m_states{std::move(state_a), std::move(state_b)},
      m_opts(opts), m_rng(std::move(rng)) {
  validate(m_opts);
}

bool TransitionPathSampler::connects_states(const Trajectory &path) const {
  if (path.frames() < 2) {
    return false;
  }
  return is_reactive_path(classify(path.back(), m_states),
                          classify(path.front(), m_states));
}

void TransitionPathSampler::set_initial_path(Trajectory path) {
  if (!connects_states(path)) {
    throw std::runtime_error(
        fmt::format("Initial path must connect states '{}' and '{}'",
                    m_states[0].name(), m_states[1].name()));
  }
  m_current = std::move(path);
  m_trials = 0;
  m_accepted = 0;
  m_shooting_points.clear();
}

TrialOutcome TransitionPathSampler::trial() {
  return shoot_from(m_rng.index(m_current.frames()));
}

/**
 * @details
 * Both segments start from the same shooting point. Overdamped dynamics is
 * reversible, so the backward segment is generated with the ordinary
 * forward integrator and reversed when the path is assembled. The shooting
 * point appears once in the joined path.
 */
TrialOutcome TransitionPathSampler::shoot_from(size_t index) {
  if (m_current.empty()) {
    throw std::runtime_error("No current path; set an initial path first");
  }
  TrialOutcome outcome;
  outcome.shooting_index = index;
  const Configuration shooting_point = m_current.frame(index);

  const size_t fwd_steps = m_opts.path_length / 2 + 1;
  const size_t bwd_steps = m_opts.path_length / 2;

  GenerationResult fwd, bwd;
  if (m_opts.mode == PathLengthMode::Fixed) {
    fwd = m_generator.fixed(shooting_point, fwd_steps, m_rng);
    bwd = m_generator.fixed(shooting_point, bwd_steps, m_rng);
  } else {
    fwd = m_generator.bounded(shooting_point, fwd_steps, m_states, m_rng);
    bwd = m_generator.bounded(shooting_point, bwd_steps, m_states, m_rng);
  }
  ++m_trials;

  const size_t fwd_frames = fwd.trajectory.frames();
  const size_t bwd_frames = bwd.trajectory.frames();
  outcome.proposal_frames = fwd_frames + bwd_frames - 1;
  outcome.reactive =
      is_reactive_path(classify(fwd.trajectory.back(), m_states),
                       classify(bwd.trajectory.back(), m_states));

  if (outcome.reactive) {
    if (m_opts.mode == PathLengthMode::Fixed) {
      outcome.acceptance_probability = 1.0;
      outcome.accepted = true;
    } else {
      const size_t n_old = m_current.frames() - 1;
      const size_t n_new = fwd_frames + bwd_frames - 1;
      outcome.acceptance_probability =
          flexible_acceptance_probability(n_old, n_new);
      outcome.accepted = m_rng.uniform() < outcome.acceptance_probability;
    }
  }

  if (outcome.accepted) {
    Trajectory joined = bwd.trajectory.reversed();
    joined.extend(fwd.trajectory, 1);
    m_current = std::move(joined);
    m_shooting_points.push_back(shooting_point);
    ++m_accepted;
  }

  log::get()->debug("TPS trial {}: shoot {} reactive={} p_acc={:.3f} "
                    "accepted={} frames={}",
                    m_trials, index, outcome.reactive,
                    outcome.acceptance_probability, outcome.accepted,
                    m_current.frames());
  return outcome;
}

/**
 * @details
 * The current path is appended once the trial index reaches the
 * equilibration threshold and every @c output_stride trials after that,
 * whether the trial accepted or not.
 */
PathEnsemble TransitionPathSampler::run(Trajectory initial_path) {
  set_initial_path(std::move(initial_path));
  PathEnsemble ensemble;
  for (size_t t = 0; t < m_opts.n_trials; ++t) {
    trial();
    if (t >= m_opts.equilibration_trials &&
        (t - m_opts.equilibration_trials) % m_opts.output_stride == 0) {
      ensemble.paths.push_back(m_current);
    }
  }
  ensemble.shooting_points = m_shooting_points;
  ensemble.n_trials = m_trials;
  ensemble.n_accepted = m_accepted;

  log::get()->info("TPS ({}) finished: {} trials, acceptance {:.3f}, {} "
                   "paths, mean length {:.1f} frames",
                   m_opts.mode == PathLengthMode::Fixed ? "fixed" : "flexible",
                   ensemble.n_trials, ensemble.acceptance_rate(),
                   ensemble.paths.size(), ensemble.mean_path_frames());
  return ensemble;
}

Trajectory find_initial_path(const OverdampedLangevin &integrator,
                             const Configuration &seed,
                             const StateIndicator &state_a,
                             const StateIndicator &state_b, size_t max_steps,
                             size_t max_attempts, RandomStream &rng) {
  TrajectoryGenerator generator(integrator);
  const std::vector<StateIndicator> states{state_a, state_b};
  for (size_t attempt = 0; attempt < max_attempts; ++attempt) {
    auto fwd = generator.bounded(seed, max_steps, states, rng);
    auto bwd = generator.bounded(seed, max_steps, states, rng);
    if (is_reactive_path(fwd.state, bwd.state)) {
      Trajectory path = bwd.trajectory.reversed();
      path.extend(fwd.trajectory, 1);
      log::get()->info("Initial path found after {} attempts ({} frames)",
                       attempt + 1, path.frames());
      return path;
    }
  }
  throw std::runtime_error(fmt::format(
      "No reactive path between '{}' and '{}' after {} attempts",
      state_a.name(), state_b.name(), max_attempts));
}

} // namespace enhsamp
