#pragma once

#include <cstddef>

#include <boost/container_hash/hash.hpp>

namespace seqpart {

/**
 * Combines the hashes of all @param values into one seed. Unlike std::hash, boost::hash is not randomized per process,
 * so the result can be used to name persisted artifacts.
 */
template <typename... Values>
size_t CombineHashes(const Values&... values) {
  size_t seed = 0;
  (boost::hash_combine(seed, values), ...);
  return seed;
}

}  // namespace seqpart
