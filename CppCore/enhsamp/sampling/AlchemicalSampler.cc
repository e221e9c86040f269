// MIT License
// Copyright 2024--present enhsamp developers

#include "enhsamp/sampling/AlchemicalSampler.hpp"
#include "enhsamp/Alchemical/LambdaPotential.hpp"
#include "enhsamp/Integrator.hpp"
#include "enhsamp/Random.hpp"
#include "enhsamp/logging.hpp"

#include <fmt/format.h>
#include <functional>
#include <stdexcept>

namespace enhsamp {

namespace {

void checkSchedule(const std::vector<double> &lambdas) {
  if (lambdas.size() < 2 || lambdas.front() != 0.0 || lambdas.back() != 1.0) {
    throw std::runtime_error(
        "Lambda schedule must hold at least two points from 0 to 1");
  }
  for (size_t i = 1; i < lambdas.size(); ++i) {
    if (!(lambdas[i] > lambdas[i - 1])) {
      throw std::runtime_error("Lambda schedule must be strictly ascending");
    }
  }
}

/**
 * @brief Runs one stage and hands every post-equilibration sample to @a visit.
 */
void sampleStage(LambdaPotential &pot, const Configuration &start,
                 const SimParams &params, RandomStream rng,
                 const std::function<void(const Configuration &)> &visit) {
  OverdampedLangevin integrator(pot, params);
  Configuration x = start;
  for (size_t s = 1; s <= params.total_steps; ++s) {
    x = integrator.step(x, rng);
    if (s > params.equilibration_steps && s % params.output_frequency == 0) {
      visit(x);
    }
  }
}

} // namespace

TIResult run_thermodynamic_integration(std::shared_ptr<PotentialBase> source,
                                       std::shared_ptr<PotentialBase> target,
                                       const std::vector<double> &lambdas,
                                       const Configuration &start,
                                       const SimParams &params) {
  validate(params);
  checkSchedule(lambdas);
  RandomStream root(params.seed);

  TIResult result;
  result.lambdas = lambdas;
  for (size_t k = 0; k < lambdas.size(); ++k) {
    LambdaPotential pot(source, target, lambdas[k]);
    analysis::RunningAverage dudl;
    sampleStage(pot, start, params, root.spawn(k),
                [&](const Configuration &x) { dudl.add(pot.dudl(x)); });
    result.mean_dudl.push_back(dudl.value());
    result.samples.push_back(dudl.count());
    log::get()->debug("TI lambda {:.3f}: <dU/dl> = {:.5f} over {} samples",
                      lambdas[k], dudl.value(), dudl.count());
  }
  result.delta_f =
      analysis::thermodynamic_integration(result.lambdas, result.mean_dudl);
  log::get()->info("TI over {} lambdas: dF = {:.5f}", lambdas.size(),
                   result.delta_f);
  return result;
}

FEPResult run_staged_fep(std::shared_ptr<PotentialBase> source,
                         std::shared_ptr<PotentialBase> target,
                         const std::vector<double> &lambdas,
                         const Configuration &start, const SimParams &params) {
  validate(params);
  checkSchedule(lambdas);
  RandomStream root(params.seed);

  FEPResult result;
  result.lambdas = lambdas;
  for (size_t k = 0; k + 1 < lambdas.size(); ++k) {
    LambdaPotential here(source, target, lambdas[k]);
    LambdaPotential next(source, target, lambdas[k + 1]);
    analysis::ZwanzigEstimator stage(params.beta);
    sampleStage(here, start, params, root.spawn(k),
                [&](const Configuration &x) {
                  stage.add(next.energy(x) - here.energy(x));
                });
    result.stage_delta_f.push_back(stage.free_energy());
    log::get()->debug("FEP stage {:.3f} -> {:.3f}: dF = {:.5f} over {} "
                      "samples",
                      lambdas[k], lambdas[k + 1], result.stage_delta_f.back(),
                      stage.count());
    result.stages.push_back(std::move(stage));
  }
  result.delta_f = analysis::staged_free_energy(result.stages);
  log::get()->info("Staged FEP over {} stages: dF = {:.5f}",
                   result.stages.size(), result.delta_f);
  return result;
}

} // namespace enhsamp
