#pragma once

#include <memory>
#include <string>

#include <aws/core/utils/json/JsonSerializer.h>

#include "object_locator.hpp"
#include "storage/backend/abstract_storage.hpp"
#include "types.hpp"

namespace seqpart {

/**
 * A resolved, immutable reference to one object in a Storage. Size and checksum are fetched once by Resolve(); the
 * handle owns no object data and every ReadRange() is one independent ranged read.
 *
 * Handles are shared between the index, slices and attributes via std::shared_ptr<const ObjectHandle>. All member
 * functions are safe to call concurrently.
 */
class ObjectHandle {
 private:
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  /**
   * Looks up the object's status. Throws NotFoundError if the object does not exist and IOError on any other failure.
   */
  ObjectHandle(PrivateTag tag, std::shared_ptr<Storage> storage, ObjectLocator locator, uint64_t size_bytes,
               std::string checksum);

  static std::shared_ptr<const ObjectHandle> Resolve(std::shared_ptr<Storage> storage, ObjectLocator locator);

  /**
   * Recreates a handle from metadata that was resolved earlier, e.g., by a serialized slice. Does not touch storage.
   */
  static std::shared_ptr<const ObjectHandle> FromResolvedMetadata(std::shared_ptr<Storage> storage,
                                                                  ObjectLocator locator, uint64_t size_bytes,
                                                                  std::string checksum);

  const ObjectLocator& Locator() const { return locator_; }
  uint64_t Size() const { return size_bytes_; }
  const std::string& Checksum() const { return checksum_; }
  const std::shared_ptr<Storage>& GetStorage() const { return storage_; }

  /**
   * Returns the bytes of [start, end). Requires start < end <= Size(), otherwise throws a RangeError. Failed or short
   * reads throw an IOError.
   */
  std::string ReadRange(ByteOffset start, ByteOffset end) const;

  /**
   * Two handles refer to the same object version if their identities are equal.
   */
  bool HasSameIdentity(const ObjectHandle& other) const;

  /**
   * Locator plus cached size and checksum.
   */
  Aws::Utils::Json::JsonValue ToJson() const;
  static std::shared_ptr<const ObjectHandle> FromJson(const Aws::Utils::Json::JsonView& json,
                                                      const StorageResolver& resolver);

 private:

  const std::shared_ptr<Storage> storage_;
  const ObjectLocator locator_;
  const uint64_t size_bytes_;
  const std::string checksum_;
};

}  // namespace seqpart
