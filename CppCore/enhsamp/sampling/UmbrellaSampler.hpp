#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Umbrella sampling: one harmonically restrained walker per window.
 *
 * Each window samples its collective variable under the restraint,
 * histograms the samples on the shared bins, inverts the density and
 * subtracts the restraint energy at every bin center. Joining the corrected
 * windows requires one additive offset per window, which this class does not
 * compute; @c overlap lists the bins two windows have in common for that
 * step.
 */

#include <memory>
#include <vector>

#include "enhsamp/CollectiveVariable.hpp"
#include "enhsamp/Potential.hpp"
#include "enhsamp/SimParams.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @brief Window layout and histogram settings.
 * @ingroup enhsamp
 */
struct UmbrellaOptions {
  std::vector<double> centers; //!< One restraint center per window.
  double force_constant{100.0}; //!< Shared restraint constant.
  double hist_lower{-2.0};     //!< Lower edge of the shared bins.
  double hist_upper{2.0};      //!< Upper edge of the shared bins.
  size_t n_bins{50};           //!< Number of shared bins.
  size_t n_workers{1};         //!< Worker threads running windows.
};

/**
 * @brief Checks an umbrella parameter bundle.
 * @param opts The options.
 * @return Void.
 *
 * @warning Throws @c std::runtime_error for no windows, a negative force
 * constant, an empty histogram range, zero bins or zero workers.
 */
void validate(const UmbrellaOptions &opts);

/**
 * @brief Output of one window.
 */
struct WindowResult {
  double center{0.0};
  double force_constant{0.0};
  Trajectory trajectory;               //!< Recorded frames, start included.
  std::vector<double> cv_samples;      //!< CV after equilibration.
  std::vector<double> bin_centers;
  std::vector<double> density;         //!< Normalized biased density.
  std::vector<double> raw_free_energy; //!< Inverted biased density.
  std::vector<double> free_energy;     //!< Raw minus the restraint energy.
};

/**
 * @class UmbrellaSampler
 * @brief Runs independent restrained windows and removes the restraint.
 *
 * Window @a w draws from the stream @c spawn(w) of the run seed, so results
 * do not depend on the number of workers.
 */
class UmbrellaSampler {
public:
  /**
   * @brief Constructor for UmbrellaSampler.
   * @param pot    The unbiased surface, shared by all windows.
   * @param cv     Differentiable collective variable.
   * @param opts   Window and histogram settings.
   * @param params Dynamics, run length, recording and seed.
   */
  UmbrellaSampler(std::shared_ptr<PotentialBase> pot,
                  std::shared_ptr<const CollectiveVariable> cv,
                  UmbrellaOptions opts, SimParams params);

  /**
   * @brief Runs one window.
   * @param window Index into the centers.
   * @param start  Start configuration.
   * @return The window result.
   */
  WindowResult run_window(size_t window, const Configuration &start) const;

  /**
   * @brief Runs every window from the same start.
   * @param start Start configuration.
   * @return One result per window, in center order.
   */
  std::vector<WindowResult> run(const Configuration &start) const;

  /**
   * @brief Runs every window from its own start.
   * @param starts One start per window.
   * @return One result per window, in center order.
   */
  std::vector<WindowResult> run(const std::vector<Configuration> &starts) const;

  size_t windows() const { return m_opts.centers.size(); }

private:
  std::shared_ptr<PotentialBase> m_pot;
  std::shared_ptr<const CollectiveVariable> m_cv;
  UmbrellaOptions m_opts;
  SimParams m_params;
};

/**
 * @brief Bins where both corrected window profiles are defined.
 * @param a First window.
 * @param b Second window, same bins.
 * @return Indices of the shared finite bins.
 */
std::vector<size_t> overlap(const WindowResult &a, const WindowResult &b);

} // namespace enhsamp
