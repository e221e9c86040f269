#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Temperature replica exchange (parallel tempering).
 *
 * N walkers on a fixed ladder of inverse temperatures evolve independently.
 * Every @c exchange_frequency steps one pair is proposed for a swap and
 * accepted with the Metropolis criterion. All replicas complete their step
 * before the exchange reads their configurations.
 */

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "enhsamp/Potential.hpp"
#include "enhsamp/Random.hpp"
#include "enhsamp/SimParams.hpp"
#include "enhsamp/types/Trajectory.hpp"

using enhsamp::types::Configuration;
using enhsamp::types::Trajectory;

namespace enhsamp {

/**
 * @brief What an accepted exchange moves between two replicas.
 */
enum class SwapPolicy {
  ConfigurationSwap, //!< Indices keep their beta; configurations move.
  LabelSwap          //!< Replicas keep their configuration; betas move.
};

/**
 * @brief How the proposed pair is chosen.
 */
enum class PairSelection {
  RandomPair,    //!< Any two distinct indices, resampled until distinct.
  RandomNeighbor //!< A random pair adjacent in the beta ladder.
};

/**
 * @brief Parameters specific to replica exchange.
 * @ingroup enhsamp
 */
struct ReplicaExchangeOptions {
  std::vector<double> betas;     //!< Distinct positive inverse temperatures.
  size_t exchange_frequency{100}; //!< Steps between exchange attempts.
  SwapPolicy swap_policy{SwapPolicy::ConfigurationSwap};
  PairSelection pair_selection{PairSelection::RandomPair};
};

/**
 * @brief Checks a replica exchange parameter bundle.
 * @param opts The options.
 * @return Void.
 *
 * @warning Throws @c std::runtime_error for an empty ladder, non-positive
 * or repeated betas, or a zero exchange frequency.
 */
void validate(const ReplicaExchangeOptions &opts);

/**
 * @brief One walker.
 */
struct Replica {
  Configuration x; //!< Current configuration.
  double beta{1.0}; //!< Current inverse temperature.
  size_t id{0};     //!< Persistent walker identity.
};

/**
 * @brief Metropolis probability of exchanging two replicas.
 * @param beta_i Inverse temperature of replica i.
 * @param beta_j Inverse temperature of replica j.
 * @param u_i    Potential energy of replica i.
 * @param u_j    Potential energy of replica j.
 * @return @f$ \min(1, \exp[(\beta_i - \beta_j)(U_i - U_j)]) @f$.
 *
 * @details This is the detailed-balance ratio for swapping temperatures.
 * Written with @f$ \Delta U = U_i - U_j @f$ the exponent is
 * @f$ +\Delta U (\beta_i - \beta_j) @f$, not
 * @f$ -\Delta U (\beta_i - \beta_j) @f$: a colder replica (larger beta)
 * that holds the higher energy always swaps.
 */
double exchange_acceptance_probability(double beta_i, double beta_j,
                                       double u_i, double u_j);

/**
 * @class ExchangeMatrix
 * @brief Symmetric counts of attempted and accepted swaps per index pair.
 *
 * Each attempt increments both @c (i, j) and @c (j, i); the totals count
 * every attempt once.
 */
class ExchangeMatrix {
public:
  using CountMatrix =
      Eigen::Matrix<size_t, Eigen::Dynamic, Eigen::Dynamic>;

  explicit ExchangeMatrix(size_t n_replicas = 0);

  /**
   * @brief Records one attempt on the pair.
   * @param i        First replica index.
   * @param j        Second replica index, distinct from @a i.
   * @param accepted Outcome of the attempt.
   * @return Void.
   */
  void record(size_t i, size_t j, bool accepted);

  size_t attempted(size_t i, size_t j) const { return m_attempted(i, j); }
  size_t accepted(size_t i, size_t j) const { return m_accepted(i, j); }

  /**
   * @brief Acceptance ratio of one pair.
   * @param i First replica index.
   * @param j Second replica index.
   * @return accepted / attempted, NaN for a pair never attempted.
   */
  double acceptance_rate(size_t i, size_t j) const;

  size_t total_attempted() const;
  size_t total_accepted() const;
  size_t size() const { return static_cast<size_t>(m_attempted.rows()); }
  const CountMatrix &attempted_matrix() const { return m_attempted; }
  const CountMatrix &accepted_matrix() const { return m_accepted; }

  void reset();

private:
  CountMatrix m_attempted;
  CountMatrix m_accepted;
};

/**
 * @brief Output of a replica exchange run, indexed by replica position.
 */
struct ReplicaExchangeResult {
  std::vector<Trajectory> trajectories;          //!< Recorded frames.
  std::vector<std::vector<double>> beta_history; //!< Beta at each frame.
  std::vector<std::vector<double>> energies;     //!< Energy at each frame.
  std::vector<std::vector<size_t>> id_history;   //!< Walker id at each frame.
  std::vector<Replica> final_replicas;
  ExchangeMatrix exchanges;
};

/**
 * @class ReplicaExchangeController
 * @brief Owns the replicas, their random streams and the exchange counts.
 *
 * The @c beta field of the parameter bundle is ignored; the ladder of the
 * options takes its place. With one replica no exchange is ever attempted.
 */
class ReplicaExchangeController {
public:
  /**
   * @brief Constructor for ReplicaExchangeController.
   * @param pot    Shared surface.
   * @param starts One start per replica, or a single start used by all.
   * @param params Dynamics, run length, recording and seed.
   * @param opts   Ladder and exchange settings.
   */
  ReplicaExchangeController(std::shared_ptr<PotentialBase> pot,
                            std::vector<Configuration> starts,
                            SimParams params, ReplicaExchangeOptions opts);

  /**
   * @brief Advances every replica by one integrator step.
   * @return Void.
   */
  void propagate();

  /**
   * @brief Proposes one swap and applies it when accepted.
   * @return True when the swap was accepted; false also when N = 1.
   */
  bool attempt_exchange();

  /**
   * @brief Runs @c total_steps steps with periodic exchanges.
   * @return Recorded trajectories, histories and exchange counts.
   */
  ReplicaExchangeResult run();

  const std::vector<Replica> &replicas() const { return m_replicas; }
  const ExchangeMatrix &exchanges() const { return m_exchanges; }

private:
  std::pair<size_t, size_t> select_pair();

  std::shared_ptr<PotentialBase> m_pot;
  SimParams m_params;
  ReplicaExchangeOptions m_opts;
  std::vector<Replica> m_replicas;
  std::vector<RandomStream> m_streams;
  RandomStream m_exchange_rng;
  ExchangeMatrix m_exchanges;
};

std::string to_string(SwapPolicy policy);

} // namespace enhsamp
