// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of temperature replica exchange.
 */

#include "enhsamp/sampling/ReplicaExchange.hpp"
#include "enhsamp/Integrator.hpp"
#include "enhsamp/logging.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace enhsamp {

std::string to_string(SwapPolicy policy) {
  return policy == SwapPolicy::ConfigurationSwap ? "configuration-swap"
                                                 : "label-swap";
}

void validate(const ReplicaExchangeOptions &opts) {
  if (opts.betas.empty()) {
    throw std::runtime_error("Replica exchange needs at least one replica");
  }
  for (double beta : opts.betas) {
    if (!(beta > 0.0) || !std::isfinite(beta)) {
      throw std::runtime_error(
          fmt::format("Replica inverse temperature must be positive, got {}",
                      beta));
    }
  }
  std::vector<double> sorted = opts.betas;
  std::sort(sorted.begin(), sorted.end());
  if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
    throw std::runtime_error(fmt::format(
        "Replica inverse temperatures must be distinct: {}", opts.betas));
  }
  if (opts.exchange_frequency == 0) {
    throw std::runtime_error("Exchange frequency must be positive");
  }
}

/**
 * @details
 * Swapping the configurations of replicas at @f$ \beta_i @f$ and
 * @f$ \beta_j @f$ changes the joint Boltzmann weight by
 * @f$ \exp[(\beta_i - \beta_j)(U_i - U_j)] @f$. The exponent is clipped at
 * zero before exponentiation, so a favourable swap returns exactly 1.
 * In terms of @f$ \Delta U = U_i - U_j @f$ the exponent is
 * @f$ +\Delta U (\beta_i - \beta_j) @f$; with the opposite sign the
 * chain would drift high energies toward the cold end.
 */
double exchange_acceptance_probability(double beta_i, double beta_j,
                                       double u_i, double u_j) {
  const double exponent = (beta_i - beta_j) * (u_i - u_j);
  if (exponent >= 0.0) {
    return 1.0;
  }
  return std::exp(exponent);
}

ExchangeMatrix::ExchangeMatrix(size_t n_replicas)
    : m_attempted(CountMatrix::Zero(n_replicas, n_replicas)),
      m_accepted(CountMatrix::Zero(n_replicas, n_replicas)) {}

void ExchangeMatrix::record(size_t i, size_t j, bool accepted) {
  if (i == j || i >= size() || j >= size()) {
    throw std::runtime_error(
        fmt::format("Invalid exchange pair ({}, {}) for {} replicas", i, j,
                    size()));
  }
  ++m_attempted(i, j);
  ++m_attempted(j, i);
  if (accepted) {
    ++m_accepted(i, j);
    ++m_accepted(j, i);
  }
}

double ExchangeMatrix::acceptance_rate(size_t i, size_t j) const {
  if (m_attempted(i, j) == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return static_cast<double>(m_accepted(i, j)) /
         static_cast<double>(m_attempted(i, j));
}

size_t ExchangeMatrix::total_attempted() const {
  return m_attempted.sum() / 2;
}

size_t ExchangeMatrix::total_accepted() const { return m_accepted.sum() / 2; }

void ExchangeMatrix::reset() {
  m_attempted.setZero();
  m_accepted.setZero();
}

ReplicaExchangeController::ReplicaExchangeController(
    std::shared_ptr<PotentialBase> pot, std::vector<Configuration> starts,
    SimParams params, ReplicaExchangeOptions opts)
    : m_pot(std::move(pot)), m_params(params), m_opts(std::move(opts)),
      m_exchange_rng(RandomStream(params.seed).spawn(0)),
      m_exchanges(m_opts.betas.size()) {
  if (!m_pot) {
    throw std::runtime_error("Replica exchange needs a potential");
  }
  validate(m_params);
  validate(m_opts);
  const size_t n = m_opts.betas.size();
  if (starts.size() != 1 && starts.size() != n) {
    throw std::runtime_error(fmt::format(
        "Got {} start configurations for {} replicas", starts.size(), n));
  }

  RandomStream root(m_params.seed);
  for (size_t i = 0; i < n; ++i) {
    const Configuration &x0 = starts.size() == 1 ? starts[0] : starts[i];
    if (x0.size() != starts[0].size()) {
      throw std::runtime_error("Replica start configurations differ in size");
    }
    m_replicas.push_back(Replica{x0, m_opts.betas[i], i});
    m_streams.push_back(root.spawn(i + 1));
  }
}

void ReplicaExchangeController::propagate() {
  for (size_t i = 0; i < m_replicas.size(); ++i) {
    auto &rep = m_replicas[i];
    rep.x = langevin_step(rep.x, m_pot->force(rep.x), rep.beta,
                          m_params.timestep, m_params.diffusion, m_streams[i]);
  }
}

/**
 * @details
 * @c RandomPair draws @a j again until it differs from @a i. For
 * @c RandomNeighbor the indices are ordered by their current beta (which
 * changes under @c LabelSwap) and a random adjacent pair of that ordering is
 * returned.
 */
std::pair<size_t, size_t> ReplicaExchangeController::select_pair() {
  const size_t n = m_replicas.size();
  if (m_opts.pair_selection == PairSelection::RandomPair) {
    size_t i = m_exchange_rng.index(n);
    size_t j = m_exchange_rng.index(n);
    while (j == i) {
      j = m_exchange_rng.index(n);
    }
    return {i, j};
  }
  std::vector<size_t> ladder(n);
  std::iota(ladder.begin(), ladder.end(), 0);
  std::sort(ladder.begin(), ladder.end(), [this](size_t a, size_t b) {
    return m_replicas[a].beta < m_replicas[b].beta;
  });
  const size_t k = m_exchange_rng.index(n - 1);
  return {ladder[k], ladder[k + 1]};
}

bool ReplicaExchangeController::attempt_exchange() {
  if (m_replicas.size() < 2) {
    return false;
  }
  auto [i, j] = select_pair();
  auto &ri = m_replicas[i];
  auto &rj = m_replicas[j];
  const double u_i = m_pot->energy(ri.x);
  const double u_j = m_pot->energy(rj.x);
  const double p_acc =
      exchange_acceptance_probability(ri.beta, rj.beta, u_i, u_j);
  const bool accepted = m_exchange_rng.uniform() < p_acc;

  if (accepted) {
    if (m_opts.swap_policy == SwapPolicy::ConfigurationSwap) {
      std::swap(ri.x, rj.x);
      std::swap(ri.id, rj.id);
    } else {
      std::swap(ri.beta, rj.beta);
    }
  }
  m_exchanges.record(i, j, accepted);

  log::get()->trace("Exchange ({}, {}): U = ({:.4f}, {:.4f}) beta = ({}, {}) "
                    "p_acc = {:.4f} accepted = {}",
                    i, j, u_i, u_j, ri.beta, rj.beta, p_acc, accepted);
  return accepted;
}

/**
 * @details
 * Step @a s (1-based) first propagates every replica, then attempts an
 * exchange when @c s % exchange_frequency == 0, and finally records each
 * replica when @a s is past the equilibration and a multiple of the output
 * frequency. Exactly @c total_steps / exchange_frequency exchanges are
 * attempted when there are at least two replicas.
 */
ReplicaExchangeResult ReplicaExchangeController::run() {
  const size_t n = m_replicas.size();
  m_exchanges.reset();

  ReplicaExchangeResult result;
  const size_t dims = m_replicas.front().x.size();
  result.trajectories.assign(n, Trajectory(dims));
  result.beta_history.assign(n, {});
  result.energies.assign(n, {});
  result.id_history.assign(n, {});

  log::get()->info("Replica exchange: {} replicas, betas {}, {} steps, "
                   "exchange every {} ({})",
                   n, m_opts.betas, m_params.total_steps,
                   m_opts.exchange_frequency, to_string(m_opts.swap_policy));

  for (size_t s = 1; s <= m_params.total_steps; ++s) {
    propagate();
    if (n > 1 && s % m_opts.exchange_frequency == 0) {
      attempt_exchange();
    }
    if (s > m_params.equilibration_steps &&
        s % m_params.output_frequency == 0) {
      for (size_t i = 0; i < n; ++i) {
        const auto &rep = m_replicas[i];
        result.trajectories[i].append(rep.x);
        result.beta_history[i].push_back(rep.beta);
        result.energies[i].push_back(m_pot->energy(rep.x));
        result.id_history[i].push_back(rep.id);
      }
    }
  }

  result.final_replicas = m_replicas;
  result.exchanges = m_exchanges;

  log::get()->info("Replica exchange finished: {} of {} swaps accepted",
                   m_exchanges.total_accepted(), m_exchanges.total_attempted());
  return result;
}

} // namespace enhsamp
