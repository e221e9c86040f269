#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Free-energy estimators.
 *
 * Thermodynamic integration, free-energy perturbation (Zwanzig averaging,
 * single and staged) and Boltzmann inversion of a sampled density. Results
 * that are mathematically undefined are returned as NaN, never as zero;
 * callers drop them with @c finite_bins or @c std::isnan.
 */

#include <cstddef>
#include <utility>
#include <vector>

namespace enhsamp {
namespace analysis {

/**
 * @class RunningAverage
 * @brief Online mean, @f$ \bar{x}_0 = x_0 @f$,
 * @f$ \bar{x}_n = \bar{x}_{n-1} + (x_n - \bar{x}_{n-1}) / (n + 1) @f$.
 */
class RunningAverage {
public:
  void add(double sample) {
    ++m_count;
    if (m_count == 1) {
      m_mean = sample;
    } else {
      m_mean += (sample - m_mean) / static_cast<double>(m_count);
    }
  }

  /**
   * @brief Current mean.
   * @return The mean, NaN before the first sample.
   */
  double value() const;

  size_t count() const { return m_count; }

private:
  double m_mean{0.0};
  size_t m_count{0};
};

/**
 * @brief Trapezoidal thermodynamic integration.
 * @param lambdas Ascending coupling values from exactly 0 to exactly 1.
 * @param dudl    Sampled @f$ \langle \partial U / \partial \lambda \rangle @f$,
 *                one per lambda.
 * @return @f$ \Delta F = \int_0^1 \langle \partial U / \partial \lambda
 * \rangle \, d\lambda @f$.
 *
 * @warning Throws @c std::runtime_error for mismatched sizes, fewer than two
 * points, a grid that is not strictly ascending, or end points other than
 * 0 and 1.
 */
double thermodynamic_integration(const std::vector<double> &lambdas,
                                 const std::vector<double> &dudl);

/**
 * @class ZwanzigEstimator
 * @brief Free-energy perturbation from samples of the source system.
 *
 * Accumulates @f$ e^{-\beta (U_B - U_A)} @f$ as a running average and
 * reports @f$ \Delta F = -\beta^{-1} \ln \langle e^{-\beta \Delta U}
 * \rangle_A @f$.
 */
class ZwanzigEstimator {
public:
  /**
   * @brief Constructor for ZwanzigEstimator.
   * @param beta Inverse temperature of the source samples, positive.
   */
  explicit ZwanzigEstimator(double beta);

  /**
   * @brief Adds one sample.
   * @param delta_u @f$ U_B(x) - U_A(x) @f$ at a configuration drawn from A.
   * @return Void.
   */
  void add(double delta_u);

  /**
   * @brief Current estimate.
   * @return @f$ \Delta F @f$, NaN when no sample was added or the average
   * underflowed to zero.
   *
   * @details Zwanzig form
   * @f$ \Delta F = -\beta^{-1} \ln \langle e^{-\beta \Delta U} \rangle_A @f$.
   * The leading sign is negative, so a constant shift @f$ \Delta U = c @f$
   * gives @f$ \Delta F = c @f$ and not @f$ -c @f$.
   */
  double free_energy() const;

  double average() const { return m_avg.value(); }
  size_t count() const { return m_avg.count(); }
  double beta() const { return m_beta; }

private:
  double m_beta;
  RunningAverage m_avg;
};

/**
 * @brief Sum of chained per-stage FEP estimates.
 * @param stages One estimator per consecutive lambda pair.
 * @return The summed @f$ \Delta F @f$, NaN if any stage is undefined.
 */
double staged_free_energy(const std::vector<ZwanzigEstimator> &stages);

/**
 * @brief Boltzmann inversion, @f$ F = -\beta^{-1} \ln p @f$.
 * @param density Normalized density per bin.
 * @param beta    Inverse temperature, positive.
 * @return Free energy per bin; NaN where the density is zero or undefined.
 */
std::vector<double> boltzmann_inversion(const std::vector<double> &density,
                                        double beta);

/**
 * @brief Drops undefined bins before any comparison or integral.
 * @param x Bin coordinates.
 * @param f Values per bin, same size as @a x.
 * @return The @c (x, f) pairs whose value is finite.
 */
std::vector<std::pair<double, double>>
finite_bins(const std::vector<double> &x, const std::vector<double> &f);

/**
 * @brief Shifts a profile so that its lowest defined value is zero.
 * @param f Values per bin, possibly with NaN entries.
 * @return The shifted profile; NaN entries are kept.
 */
std::vector<double> shift_to_minimum(const std::vector<double> &f);

} // namespace analysis
} // namespace enhsamp
