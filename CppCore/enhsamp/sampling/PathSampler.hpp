#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Transition path sampling by two-way shooting.
 *
 * A Markov chain over whole trajectories. Each trial picks a shooting point
 * on the current path, grows a forward and a backward segment from it under
 * the same overdamped dynamics, and accepts the joined path if it connects
 * the two stable states (and, for flexible-length paths, passes the length
 * ratio test). Rejected trials repeat the current path in the ensemble.
 */

#include <vector>

#include "enhsamp/Integrator.hpp"
#include "enhsamp/Random.hpp"
#include "enhsamp/StateIndicator.hpp"
#include "enhsamp/sampling/TrajectoryGenerator.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @brief How shooting segments are grown.
 */
enum class PathLengthMode {
  Fixed,   //!< Segments always run their full step budget.
  Flexible //!< Segments stop on reaching a stable state.
};

/**
 * @brief Parameters of a TPS run.
 * @ingroup enhsamp
 */
struct TPSOptions {
  size_t path_length{100};         //!< Nominal path length in steps.
  size_t n_trials{1000};           //!< Number of shooting trials.
  size_t equilibration_trials{0};  //!< Trials before the first sample.
  size_t output_stride{1};         //!< Sample every n-th trial afterwards.
  PathLengthMode mode{PathLengthMode::Fixed};
};

/**
 * @brief Checks a TPS parameter bundle.
 * @param opts The options.
 * @return Void.
 *
 * @warning Throws @c std::runtime_error for a path length below 2, a zero
 * stride, or an equilibration not shorter than the run.
 */
void validate(const TPSOptions &opts);

/**
 * @brief Reactive-path test on the two segment endpoints.
 * @param fwd_end Classification of the last forward frame.
 * @param bwd_end Classification of the last backward frame.
 * @return True iff one segment ends in A and the other in B.
 */
bool is_reactive_path(GeneratorState fwd_end, GeneratorState bwd_end);

/**
 * @brief Flexible-length acceptance probability.
 * @param n_old Length measure of the current path.
 * @param n_new Length measure of the proposal, positive.
 * @return @c min(1, n_old / n_new).
 */
double flexible_acceptance_probability(size_t n_old, size_t n_new);

/**
 * @brief Record of one shooting trial.
 */
struct TrialOutcome {
  size_t shooting_index{0};           //!< Frame index of the shooting point.
  bool reactive{false};               //!< Proposal connects A and B.
  bool accepted{false};               //!< Proposal replaced the current path.
  double acceptance_probability{0.0}; //!< Probability used in the test.
  size_t proposal_frames{0};          //!< Frames of the joined proposal.
};

/**
 * @brief Output of a TPS run.
 */
struct PathEnsemble {
  std::vector<Trajectory> paths;              //!< Sampled paths with repeats.
  std::vector<Configuration> shooting_points; //!< Accepted shooting points.
  size_t n_trials{0};
  size_t n_accepted{0};

  double acceptance_rate() const;
  double mean_path_frames() const;
};

/**
 * @class TransitionPathSampler
 * @brief Owns the current path and the trial statistics of one TPS chain.
 */
class TransitionPathSampler {
public:
  /**
   * @brief Constructor for TransitionPathSampler.
   * @param integrator Dynamics used for both segments; must outlive the
   *                   sampler.
   * @param state_a    Predicate of state A.
   * @param state_b    Predicate of state B.
   * @param opts       Run parameters, validated here.
   * @param rng        Random stream owned by this chain.
   */
  TransitionPathSampler(const OverdampedLangevin &integrator,
                        StateIndicator state_a, StateIndicator state_b,
                        TPSOptions opts, RandomStream rng);

  /**
   * @brief Installs the first path of the chain and resets the counters.
   * @param path A reactive path.
   * @return Void.
   *
   * @warning Throws @c std::runtime_error unless the path starts in one
   * state and ends in the other.
   */
  void set_initial_path(Trajectory path);

  /**
   * @brief One trial with a uniformly drawn shooting point.
   * @return The trial record.
   */
  TrialOutcome trial();

  /**
   * @brief One trial from a given shooting point.
   * @param index Frame of the current path to shoot from.
   * @return The trial record.
   */
  TrialOutcome shoot_from(size_t index);

  /**
   * @brief Runs @c n_trials trials and collects the path ensemble.
   * @param initial_path A reactive path.
   * @return Sampled paths and statistics.
   */
  PathEnsemble run(Trajectory initial_path);

  const Trajectory &current_path() const { return m_current; }
  size_t trials() const { return m_trials; }
  size_t accepted() const { return m_accepted; }
  const std::vector<Configuration> &shooting_points() const {
    return m_shooting_points;
  }

private:
  bool connects_states(const Trajectory &path) const;

  TrajectoryGenerator m_generator;
  std::vector<StateIndicator> m_states;
  TPSOptions m_opts;
  RandomStream m_rng;

  Trajectory m_current;
  size_t m_trials{0};
  size_t m_accepted{0};
  std::vector<Configuration> m_shooting_points;
};

/**
 * @brief Finds a first reactive path by shooting from a seed configuration.
 * @param integrator   Dynamics, typically at an elevated temperature.
 * @param seed         Starting point, usually near the barrier.
 * @param state_a      Predicate of state A.
 * @param state_b      Predicate of state B.
 * @param max_steps    Step budget of each half.
 * @param max_attempts Number of forward/backward pairs to try.
 * @param rng          Random stream.
 * @return A path running from one state to the other.
 *
 * @warning Throws @c std::runtime_error when no attempt is reactive.
 */
Trajectory find_initial_path(const OverdampedLangevin &integrator,
                             const Configuration &seed,
                             const StateIndicator &state_a,
                             const StateIndicator &state_b, size_t max_steps,
                             size_t max_attempts, RandomStream &rng);

} // namespace enhsamp
