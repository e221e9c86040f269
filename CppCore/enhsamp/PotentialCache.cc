// MIT License
// Copyright 2024--present enhsamp developers

/**
 * @brief Implementation of the RocksDB-based potential cache.
 *
 * This file implements the methods for the PotentialCache class, handling the
 * low-level interactions with the RocksDB library for persistent storage of
 * energy and force evaluations.
 */

#include "enhsamp/PotentialCache.hpp"
#include "enhsamp/logging.hpp"
#include <cstring>
#include <rocksdb/options.h>
#include <stdexcept>
#include <vector>

namespace enhsamp::cache {

/**
 * @details
 * Initializes the RocksDB options, specifically setting `create_if_missing`.
 * It attempts to open the database at the specified path. If the open fails,
 * an error is logged and the internal database pointer remains null, so the
 * cache degrades to direct evaluation. If successful, the `own_db_` flag is
 * set to true.
 */
PotentialCache::PotentialCache(const std::string &db_path,
                               bool create_if_missing) {
  rocksdb::Options options;
  options.create_if_missing = create_if_missing;
  rocksdb::Status status = rocksdb::DB::Open(options, db_path, &db_);
  if (!status.ok()) {
    log::get()->error("Unable to open RocksDB at {}: {}", db_path,
                      status.ToString());
    db_ = nullptr;
  } else {
    own_db_ = true;
  }
}

PotentialCache::~PotentialCache() {
  if (own_db_ && db_) {
    delete db_;
  }
}

/**
 * @details
 * This function allows for manually injecting a RocksDB pointer.
 * If the current instance already owns a database, it is deleted before
 * accepting the new pointer. The caller keeps ownership of @a db.
 */
void PotentialCache::set_db(rocksdb::DB *db) {
  if (own_db_ && db_)
    delete db_;
  db_ = db;
  own_db_ = false;
}

/**
 * @details
 * Performs a binary copy (`std::memcpy`) from the serialized string buffer
 * back into the energy variable and force vector.
 *
 * The layout is assumed to be:
 * `[double energy] [double force_0] ... [double force_N]`
 *
 * @warning Throws @c std::runtime_error when the stored record does not
 * match the dimension of @a forces.
 */
void PotentialCache::deserialize_hit(const std::string &hit, double &energy,
                                     enhsamp::types::Configuration &forces) {
  if (hit.size() != (forces.size() + 1) * sizeof(double)) {
    throw std::runtime_error("Cached record does not match force dimension");
  }
  std::memcpy(&energy, hit.data(), sizeof(double));
  std::memcpy(forces.data(), hit.data() + sizeof(double),
              forces.size() * sizeof(double));
}

/**
 * @details
 * Serializes the energy and forces into a contiguous binary buffer and
 * stores it under the provided key. A failed write is logged and otherwise
 * ignored since the evaluation itself already succeeded.
 *
 * @note If the database is not initialized, this function returns immediately.
 */
void PotentialCache::add_serialized(const KeyHash &kv, double energy,
                                    const enhsamp::types::Configuration &forces) {
  if (!db_)
    return;
  size_t value_size = sizeof(double) + forces.size() * sizeof(double);
  std::vector<char> buffer(value_size);

  std::memcpy(buffer.data(), &energy, sizeof(double));
  std::memcpy(buffer.data() + sizeof(double), forces.data(),
              forces.size() * sizeof(double));

  rocksdb::Slice value(buffer.data(), buffer.size());
  rocksdb::Status s = db_->Put(rocksdb::WriteOptions(), kv.key, value);
  if (!s.ok()) {
    log::get()->warn("Cache write for key {} failed: {}", kv.key,
                     s.ToString());
  }
}

/**
 * @details
 * Queries the RocksDB instance for the given key.
 *
 * @return std::optional containing the serialized string if found,
 * or std::nullopt if the key does not exist or the DB is closed.
 */
std::optional<std::string> PotentialCache::find(const KeyHash &kv) {
  if (!db_)
    return std::nullopt;
  std::string value;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), kv.key, &value);
  if (s.ok()) {
    return value;
  }
  return std::nullopt;
}
} // namespace enhsamp::cache
