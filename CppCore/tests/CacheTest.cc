// MIT License
// Copyright 2024--present enhsamp developers
#include <catch2/catch_all.hpp>
#include <filesystem>
#include <memory>
#include <vector>

#include "enhsamp/DoubleWell/DoubleWellPot.hpp"
#include "enhsamp/MullerBrown/MullerBrownPot.hpp"
#include "enhsamp/PotHelpers.hpp"
#include "enhsamp/sampling/TrajectoryGenerator.hpp"

#ifdef ENHSAMP_HAS_CACHE
#include "enhsamp/PotentialCache.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#endif

using namespace Catch::Matchers;
namespace fs = std::filesystem;

TEST_CASE("Potential caching", "[Cache]") {
#ifdef ENHSAMP_HAS_CACHE
  using Calls = enhsamp::registry<enhsamp::MullerBrownPot>;
  auto pot = std::make_shared<enhsamp::MullerBrownPot>();
  const Configuration conf{-0.5, 1.4};
  Calls::forceCalls = 0;
  auto [e_base, f_base] = (*pot)(conf);
  REQUIRE(Calls::forceCalls.load() == 1);

  SECTION("Manual DB management") {
    rocksdb::DB *db_ptr;
    rocksdb::Options options;
    options.create_if_missing = true;
    std::string db_path = "/tmp/enhsamp_test_rocksdb_manual";
    rocksdb::DestroyDB(db_path, options);
    rocksdb::Status status = rocksdb::DB::Open(options, db_path, &db_ptr);
    REQUIRE(status.ok());
    auto db = std::unique_ptr<rocksdb::DB, void (*)(rocksdb::DB *)>(
        db_ptr, [](rocksdb::DB *ptr) { delete ptr; });

    enhsamp::cache::PotentialCache pcache;
    pcache.set_db(db.get());
    pot->set_cache(&pcache);

    // Miss, then hit
    auto [e1, f1] = (*pot)(conf);
    auto [e2, f2] = (*pot)(conf);
    REQUIRE_THAT(e1, WithinAbs(e_base, 1e-12));
    REQUIRE_THAT(e2, WithinAbs(e_base, 1e-12));
    REQUIRE(f2 == f1);
    REQUIRE(Calls::forceCalls.load() == 2);
    pot->set_cache(nullptr);
  }

  SECTION("Persistence across cache objects") {
    std::string db_path = "/tmp/enhsamp_test_rocksdb_persist";
    rocksdb::Options opts;
    rocksdb::DestroyDB(db_path, opts);
    {
      enhsamp::cache::PotentialCache writer(db_path);
      pot->set_cache(&writer);
      (*pot)(conf);
      pot->set_cache(nullptr);
    }
    REQUIRE(fs::exists(db_path));
    {
      enhsamp::cache::PotentialCache reader(db_path);
      pot->set_cache(&reader);
      size_t before = Calls::forceCalls.load();
      auto [e, f] = (*pot)(conf);
      REQUIRE_THAT(e, WithinAbs(e_base, 1e-12));
      REQUIRE(Calls::forceCalls.load() == before);
      pot->set_cache(nullptr);
    }
  }

  SECTION("Parameters are part of the key") {
    std::string db_path = "/tmp/enhsamp_test_rocksdb_params";
    rocksdb::Options opts;
    rocksdb::DestroyDB(db_path, opts);
    enhsamp::cache::PotentialCache pcache(db_path);
    enhsamp::DoubleWellPot shallow(1.0), deep(4.0);
    shallow.set_cache(&pcache);
    deep.set_cache(&pcache);
    double e_shallow = shallow.energy({0.0});
    double e_deep = deep.energy({0.0});
    REQUIRE_THAT(e_shallow, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(e_deep, WithinAbs(4.0, 1e-12));
  }

  SECTION("Uninitialized cache falls through") {
    enhsamp::cache::PotentialCache empty;
    pot->set_cache(&empty);
    auto [e, f] = (*pot)(conf);
    REQUIRE_THAT(e, WithinAbs(e_base, 1e-12));
    pot->set_cache(nullptr);
  }
#else
  SKIP("Potential cache disabled (ENHSAMP_HAS_CACHE not defined)");
#endif
}

TEST_CASE("Cached surface under the trajectory generator",
          "[Cache][TrajectoryGenerator]") {
#ifdef ENHSAMP_HAS_CACHE
  using Calls = enhsamp::registry<enhsamp::DoubleWellPot>;
  const Configuration start{-0.8};
  const size_t n_steps = 500;

  // Uncached reference
  enhsamp::DoubleWellPot plain(2.0);
  enhsamp::OverdampedLangevin plain_dyn(plain, 2.0, 1e-3, 1.0);
  enhsamp::RandomStream plain_rng(314);
  auto reference =
      enhsamp::TrajectoryGenerator(plain_dyn).fixed(start, n_steps, plain_rng);

  std::string db_path = "/tmp/enhsamp_test_rocksdb_generator";
  rocksdb::Options opts;
  rocksdb::DestroyDB(db_path, opts);
  enhsamp::cache::PotentialCache pcache(db_path);

  enhsamp::DoubleWellPot cached(2.0);
  cached.set_cache(&pcache);
  enhsamp::OverdampedLangevin cached_dyn(cached, 2.0, 1e-3, 1.0);

  SECTION("First pass fills the cache without changing the path") {
    enhsamp::RandomStream rng(314);
    size_t before = Calls::forceCalls.load();
    auto res = enhsamp::TrajectoryGenerator(cached_dyn).fixed(start, n_steps,
                                                              rng);
    REQUIRE(res.trajectory == reference.trajectory);
    REQUIRE(Calls::forceCalls.load() > before);
  }

  SECTION("Replaying the same seed is served from the cache") {
    enhsamp::RandomStream first(314);
    enhsamp::TrajectoryGenerator(cached_dyn).fixed(start, n_steps, first);

    enhsamp::RandomStream replay(314);
    size_t before = Calls::forceCalls.load();
    auto res = enhsamp::TrajectoryGenerator(cached_dyn).fixed(start, n_steps,
                                                              replay);
    REQUIRE(Calls::forceCalls.load() == before);
    REQUIRE(res.trajectory == reference.trajectory);
  }
  cached.set_cache(nullptr);
#else
  SKIP("Potential cache disabled (ENHSAMP_HAS_CACHE not defined)");
#endif
}
