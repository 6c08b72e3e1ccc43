#include "partition_slice.hpp"

#include <utility>

#include "constants.hpp"
#include "errors.hpp"
#include "utils/assert.hpp"
#include "utils/json.hpp"

namespace seqpart {

PartitionSlice::PartitionSlice(std::shared_ptr<const ObjectHandle> handle, size_t ordinal, const ByteRange& range,
                               std::vector<IndexEntry> entries)
    : handle_(std::move(handle)), ordinal_(ordinal), range_(range), entries_(std::move(entries)) {
  Assert(handle_ != nullptr, "A slice needs an object handle.");
  Assert(range_.first_byte <= range_.end_byte && range_.end_byte <= handle_->Size(),
         "Slice range must lie inside the object.");
}

std::string PartitionSlice::Get() const {
  if (range_.IsEmpty()) {
    return {};
  }
  return handle_->ReadRange(range_.first_byte, range_.end_byte);
}

Aws::Utils::Json::JsonValue PartitionSlice::ToJson() const {
  return handle_->ToJson()
      .WithInt64(kSliceOrdinalAttribute, static_cast<int64_t>(ordinal_))
      .WithObject(kSliceRangeAttribute, range_.ToJson())
      .WithArray(kSliceEntriesAttribute, VectorToJsonArray(entries_));
}

std::string PartitionSlice::Serialize() const { return ToJson().View().WriteCompact(); }

PartitionSlice PartitionSlice::FromJson(const Aws::Utils::Json::JsonView& json, const StorageResolver& resolver) {
  if (!json.ValueExists(kSliceOrdinalAttribute) || !json.ValueExists(kSliceRangeAttribute)) {
    throw FormatError("Slice document is incomplete.");
  }

  std::shared_ptr<const ObjectHandle> handle = ObjectHandle::FromJson(json, resolver);
  const ByteRange range = ByteRange::FromJson(json.GetObject(kSliceRangeAttribute));
  if (range.end_byte < range.first_byte || range.end_byte > handle->Size()) {
    throw FormatError("Slice range lies outside of " + handle->Locator().ToUri());
  }

  std::vector<IndexEntry> entries;
  if (json.ValueExists(kSliceEntriesAttribute)) {
    entries = JsonArrayToVector<IndexEntry>(json.GetArray(kSliceEntriesAttribute));
  }

  return {std::move(handle), static_cast<size_t>(json.GetInt64(kSliceOrdinalAttribute)), range, std::move(entries)};
}

PartitionSlice PartitionSlice::Deserialize(const std::string& serialized_slice, const StorageResolver& resolver) {
  const Aws::Utils::Json::JsonValue document(serialized_slice);
  if (!document.WasParseSuccessful()) {
    throw FormatError("Slice document is not valid JSON: " + document.GetErrorMessage());
  }
  return FromJson(document.View(), resolver);
}

}  // namespace seqpart
