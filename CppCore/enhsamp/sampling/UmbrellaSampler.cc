// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of the umbrella window manager.
 */

#include "enhsamp/sampling/UmbrellaSampler.hpp"
#include "enhsamp/Integrator.hpp"
#include "enhsamp/Umbrella/HarmonicBias.hpp"
#include "enhsamp/analysis/FreeEnergy.hpp"
#include "enhsamp/analysis/Histogram.hpp"
#include "enhsamp/logging.hpp"
#include "enhsamp/sampling/TrajectoryGenerator.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <fmt/format.h>
#include <stdexcept>
#include <thread>

namespace enhsamp {

void validate(const UmbrellaOptions &opts) {
  if (opts.centers.empty()) {
    throw std::runtime_error("Umbrella sampling needs at least one window");
  }
  if (!(opts.force_constant >= 0.0)) {
    throw std::runtime_error(fmt::format(
        "Force constant must be non-negative, got {}", opts.force_constant));
  }
  if (!(opts.hist_lower < opts.hist_upper)) {
    throw std::runtime_error(fmt::format("Histogram range [{}, {}) is empty",
                                         opts.hist_lower, opts.hist_upper));
  }
  if (opts.n_bins == 0) {
    throw std::runtime_error("Histogram needs at least one bin");
  }
  if (opts.n_workers == 0) {
    throw std::runtime_error("Umbrella sampling needs at least one worker");
  }
}

UmbrellaSampler::UmbrellaSampler(std::shared_ptr<PotentialBase> pot,
                                 std::shared_ptr<const CollectiveVariable> cv,
                                 UmbrellaOptions opts, SimParams params)
    : m_pot(std::move(pot)), m_cv(std::move(cv)), m_opts(std::move(opts)),
      m_params(params) {
  if (!m_pot) {
    throw std::runtime_error("Umbrella sampling needs a potential");
  }
  if (!m_cv || !m_cv->has_gradient()) {
    throw std::runtime_error(
        "Umbrella sampling needs a collective variable with a gradient");
  }
  validate(m_opts);
  validate(m_params);
}

/**
 * @details
 * Frame @a k > 0 of the generated trajectory holds the configuration after
 * @c (k-1) * output_frequency + 1 steps. Frames at or before the
 * equilibration step are not histogrammed.
 */
WindowResult UmbrellaSampler::run_window(size_t window,
                                         const Configuration &start) const {
  if (window >= m_opts.centers.size()) {
    throw std::runtime_error(fmt::format("Window {} out of range ({} windows)",
                                         window, m_opts.centers.size()));
  }
  WindowResult result;
  result.center = m_opts.centers[window];
  result.force_constant = m_opts.force_constant;

  HarmonicBias bias(m_cv, result.center, result.force_constant);
  BiasedPotential biased(m_pot, bias);
  OverdampedLangevin integrator(biased, m_params);
  TrajectoryGenerator generator(integrator, m_params.output_frequency);
  RandomStream rng = RandomStream(m_params.seed).spawn(window);

  result.trajectory =
      generator.fixed(start, m_params.total_steps, rng).trajectory;

  for (size_t k = 1; k < result.trajectory.frames(); ++k) {
    const size_t step = (k - 1) * m_params.output_frequency + 1;
    if (step > m_params.equilibration_steps) {
      result.cv_samples.push_back(m_cv->value(result.trajectory.frame(k)));
    }
  }

  analysis::Histogram hist(m_opts.hist_lower, m_opts.hist_upper,
                           m_opts.n_bins);
  hist.add(result.cv_samples);
  result.bin_centers = hist.centers();
  result.density = hist.density();
  result.raw_free_energy =
      analysis::boltzmann_inversion(result.density, m_params.beta);

  result.free_energy.resize(result.raw_free_energy.size());
  for (size_t i = 0; i < result.raw_free_energy.size(); ++i) {
    result.free_energy[i] =
        result.raw_free_energy[i] - bias.energy_at(result.bin_centers[i]);
  }

  if (hist.out_of_range() > 0) {
    log::get()->warn("Window {} (center {}): {} of {} samples outside the "
                     "histogram range",
                     window, result.center, hist.out_of_range(),
                     result.cv_samples.size());
  }
  log::get()->debug("Window {} (center {}): {} samples", window,
                    result.center, result.cv_samples.size());
  return result;
}

std::vector<WindowResult>
UmbrellaSampler::run(const Configuration &start) const {
  return run(std::vector<Configuration>(m_opts.centers.size(), start));
}

/**
 * @details
 * Windows are handed out to @c n_workers threads through a shared atomic
 * counter; each result slot is written by exactly one worker. An exception
 * from any window is rethrown after all workers have joined.
 */
std::vector<WindowResult>
UmbrellaSampler::run(const std::vector<Configuration> &starts) const {
  const size_t n = m_opts.centers.size();
  if (starts.size() != n) {
    throw std::runtime_error(fmt::format(
        "Got {} start configurations for {} windows", starts.size(), n));
  }
  std::vector<WindowResult> results(n);
  std::vector<std::exception_ptr> errors(n);
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t w = next++; w < n; w = next++) {
      try {
        results[w] = run_window(w, starts[w]);
      } catch (...) {
        errors[w] = std::current_exception();
      }
    }
  };

  const size_t n_threads = std::min(m_opts.n_workers, n);
  log::get()->info("Umbrella sampling: {} windows, k = {}, {} worker(s)", n,
                   m_opts.force_constant, n_threads);
  if (n_threads == 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(n_threads);
    for (size_t t = 0; t < n_threads; ++t) {
      pool.emplace_back(worker);
    }
    for (auto &th : pool) {
      th.join();
    }
  }

  for (const auto &err : errors) {
    if (err) {
      std::rethrow_exception(err);
    }
  }
  return results;
}

std::vector<size_t> overlap(const WindowResult &a, const WindowResult &b) {
  if (a.free_energy.size() != b.free_energy.size()) {
    throw std::runtime_error("Windows were histogrammed on different bins");
  }
  std::vector<size_t> shared;
  for (size_t i = 0; i < a.free_energy.size(); ++i) {
    if (std::isfinite(a.free_energy[i]) && std::isfinite(b.free_energy[i])) {
      shared.push_back(i);
    }
  }
  return shared;
}

} // namespace enhsamp
