#pragma once

#include <memory>
#include <optional>
#include <string>

#include "object_handle.hpp"
#include "object_index.hpp"
#include "preprocessor.hpp"
#include "storage/backend/abstract_storage.hpp"

namespace seqpart {

/**
 * Persists ObjectIndexes in a Storage so that later runs can skip preprocessing.
 *
 * An artifact is stored under `<object key>.<fingerprint>.seqidx`. The fingerprint hashes the object identity
 * (locator, size, checksum) together with everything that influences the index (chunk size, record sentinel, format
 * version). The artifact itself is a decimal size line followed by the gzip-compressed JSON document. Artifacts that
 * cannot be decoded or belong to another object version are treated as missing.
 */
class IndexStore {
 public:
  explicit IndexStore(std::shared_ptr<Storage> storage);

  static std::string ComputeFingerprint(const ObjectHandle& handle, size_t chunk_size, char record_sentinel);
  static std::string ArtifactKey(const ObjectHandle& handle, size_t chunk_size, char record_sentinel);

  /**
   * Returns the index built for @param handle with @param config, if one was stored.
   */
  std::optional<ObjectIndex> Load(const ObjectHandle& handle, const PreprocessConfig& config) const;

  /**
   * Returns any valid index of @param handle regardless of the configuration it was built with.
   */
  std::optional<ObjectIndex> LoadAny(const ObjectHandle& handle) const;

  /**
   * Throws an IOError if the artifact cannot be written.
   */
  void Store(const ObjectHandle& handle, const PreprocessConfig& config, const ObjectIndex& index) const;

  static std::string SerializeArtifact(const ObjectHandle& handle, size_t chunk_size, const ObjectIndex& index);

  /**
   * Returns std::nullopt if @param artifact is corrupt or was built for another object version.
   */
  static std::optional<ObjectIndex> DeserializeArtifact(const std::string& artifact, const ObjectHandle& handle);

 private:
  std::optional<ObjectIndex> LoadArtifact(const std::string& artifact_key, const ObjectHandle& handle) const;

  std::shared_ptr<Storage> storage_;
};

}  // namespace seqpart
