#pragma once

#include <memory>
#include <string>
#include <vector>

#include <aws/core/utils/json/JsonSerializer.h>

#include "object_handle.hpp"
#include "object_index.hpp"
#include "object_locator.hpp"
#include "types.hpp"

namespace seqpart {

/**
 * A lazy reference to one byte range of an object. Get() fetches the raw bytes on every call; nothing is cached and
 * nothing is decoded. Slices are cheap to copy and can be serialized to JSON and sent to a remote worker.
 */
class PartitionSlice {
 public:
  PartitionSlice(std::shared_ptr<const ObjectHandle> handle, size_t ordinal, const ByteRange& range,
                 std::vector<IndexEntry> entries = {});

  size_t Ordinal() const { return ordinal_; }
  const ByteRange& Range() const { return range_; }
  uint64_t Size() const { return range_.Size(); }
  bool IsEmpty() const { return range_.IsEmpty(); }

  /**
   * The index entries whose record start lies inside this slice.
   */
  const std::vector<IndexEntry>& Entries() const { return entries_; }
  const std::shared_ptr<const ObjectHandle>& Handle() const { return handle_; }

  /**
   * Performs one ranged read. Empty slices return an empty string without reading.
   */
  std::string Get() const;

  Aws::Utils::Json::JsonValue ToJson() const;
  std::string Serialize() const;

  /**
   * Reattaches the slice to the storage @param resolver returns for its locator. Does not perform any I/O.
   */
  static PartitionSlice FromJson(const Aws::Utils::Json::JsonView& json, const StorageResolver& resolver);
  static PartitionSlice Deserialize(const std::string& serialized_slice, const StorageResolver& resolver);

 private:
  std::shared_ptr<const ObjectHandle> handle_;
  size_t ordinal_;
  ByteRange range_;
  std::vector<IndexEntry> entries_;
};

}  // namespace seqpart
