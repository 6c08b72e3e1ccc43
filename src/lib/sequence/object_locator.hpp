#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include <aws/core/utils/json/JsonSerializer.h>

#include "storage/backend/abstract_storage.hpp"

namespace seqpart {

enum class StorageBackend { kFilesystem, kS3 };

/**
 * Names an object independently of any open connection. For S3, the container is the bucket. For the filesystem, the
 * container is the root directory the key is relative to.
 */
struct ObjectLocator {
  StorageBackend backend = StorageBackend::kFilesystem;
  std::string container;
  std::string key;

  /**
   * s3://<bucket>/<key> or file://<directory>/<key>
   */
  std::string ToUri() const;

  /**
   * Parses the URI form. For file URIs, the last path component becomes the key and the rest the container. Throws an
   * InvalidArgumentError on unknown schemes or missing keys.
   */
  static ObjectLocator FromUri(const std::string& uri);

  Aws::Utils::Json::JsonValue ToJson() const;
  static ObjectLocator FromJson(const Aws::Utils::Json::JsonView& json);

  bool operator==(const ObjectLocator& other) const = default;
};

std::ostream& operator<<(std::ostream& stream, const ObjectLocator& locator);

/**
 * Maps a locator to the storage its object lives in. Used to reattach deserialized slices to a backend without I/O.
 */
using StorageResolver = std::function<std::shared_ptr<Storage>(const ObjectLocator&)>;

}  // namespace seqpart
