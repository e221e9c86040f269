#pragma once
// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Sampling drivers for alchemical free-energy differences.
 *
 * Both drivers run overdamped dynamics on @c LambdaPotential at every point
 * of a lambda schedule, each stage with its own random stream. Thermodynamic
 * integration averages @f$ \partial U / \partial \lambda @f$ per stage;
 * staged perturbation accumulates a Zwanzig estimator towards the next
 * lambda per stage and sums the stages.
 */

#include <memory>
#include <vector>

#include "enhsamp/Potential.hpp"
#include "enhsamp/SimParams.hpp"
#include "enhsamp/analysis/FreeEnergy.hpp"
#include "enhsamp/types/Trajectory.hpp"

namespace enhsamp {

/**
 * @brief Output of a thermodynamic integration run.
 */
struct TIResult {
  std::vector<double> lambdas;
  std::vector<double> mean_dudl; //!< One average per lambda.
  std::vector<size_t> samples;   //!< Samples behind each average.
  double delta_f{0.0};           //!< Trapezoidal integral.
};

/**
 * @brief Output of a staged free-energy perturbation run.
 */
struct FEPResult {
  std::vector<double> lambdas;
  std::vector<analysis::ZwanzigEstimator> stages; //!< Stage k: lambda_k to k+1.
  std::vector<double> stage_delta_f;
  double delta_f{0.0}; //!< Sum of stages; NaN if any stage is undefined.
};

/**
 * @brief Thermodynamic integration between two surfaces.
 * @param source Surface at lambda = 0.
 * @param target Surface at lambda = 1.
 * @param lambdas Ascending schedule from exactly 0 to exactly 1.
 * @param start  Start configuration of every stage.
 * @param params Dynamics, run length per stage, recording and seed.
 * @return Per-stage averages and the integrated free energy.
 */
TIResult run_thermodynamic_integration(std::shared_ptr<PotentialBase> source,
                                       std::shared_ptr<PotentialBase> target,
                                       const std::vector<double> &lambdas,
                                       const Configuration &start,
                                       const SimParams &params);

/**
 * @brief Staged free-energy perturbation between two surfaces.
 * @param source Surface at lambda = 0.
 * @param target Surface at lambda = 1.
 * @param lambdas Ascending schedule from exactly 0 to exactly 1; a two-point
 *                schedule is plain single-stage FEP.
 * @param start  Start configuration of every stage.
 * @param params Dynamics, run length per stage, recording and seed.
 * @return Per-stage estimators and their sum.
 */
FEPResult run_staged_fep(std::shared_ptr<PotentialBase> source,
                         std::shared_ptr<PotentialBase> target,
                         const std::vector<double> &lambdas,
                         const Configuration &start, const SimParams &params);

} // namespace enhsamp
