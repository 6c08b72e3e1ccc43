#include "index_store.hpp"

#include <charconv>
#include <utility>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "errors.hpp"
#include "utils/assert.hpp"
#include "utils/compression.hpp"
#include "utils/hash.hpp"
#include "utils/string.hpp"

namespace seqpart {

namespace {

const std::string kArtifactChunkSizeAttribute = "chunk_size";
const std::string kArtifactIndexAttribute = "index";

// Upper bound of the deflate expansion ratio.
constexpr size_t kMaxGzipExpansionFactor = 1032;

}  // namespace

IndexStore::IndexStore(std::shared_ptr<Storage> storage) : storage_(std::move(storage)) {
  Assert(storage_ != nullptr, "An index store needs a storage.");
}

std::string IndexStore::ComputeFingerprint(const ObjectHandle& handle, size_t chunk_size, char record_sentinel) {
  const ObjectLocator& locator = handle.Locator();
  return ToHexString(CombineHashes(static_cast<int>(locator.backend), locator.container, locator.key, handle.Size(),
                                   handle.Checksum(), chunk_size, record_sentinel, kIndexFormatVersion));
}

std::string IndexStore::ArtifactKey(const ObjectHandle& handle, size_t chunk_size, char record_sentinel) {
  return handle.Locator().key + "." + ComputeFingerprint(handle, chunk_size, record_sentinel) +
         std::string(kIndexObjectSuffix);
}

std::string IndexStore::SerializeArtifact(const ObjectHandle& handle, size_t chunk_size, const ObjectIndex& index) {
  const Aws::Utils::Json::JsonValue document =
      Aws::Utils::Json::JsonValue()
          .WithObject(kIndexObjectAttribute, handle.ToJson())
          .WithInt64(kArtifactChunkSizeAttribute, static_cast<int64_t>(chunk_size))
          .WithObject(kArtifactIndexAttribute, index.ToJson());
  const std::string json = document.View().WriteCompact();

  return std::to_string(json.size()) + "\n" + Compress(json);
}

std::optional<ObjectIndex> IndexStore::DeserializeArtifact(const std::string& artifact, const ObjectHandle& handle) {
  const size_t header_end = artifact.find('\n');
  size_t json_size = 0;
  if (header_end == std::string::npos ||
      std::from_chars(artifact.data(), artifact.data() + header_end, json_size).ec != std::errc()) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Index artifact of " << handle.Locator() << " lacks its size line.");
    return std::nullopt;
  }

  const size_t compressed_size = artifact.size() - header_end - 1;
  if (json_size > compressed_size * kMaxGzipExpansionFactor) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Index artifact of " << handle.Locator() << " claims " << json_size
                                                                    << " bytes of JSON in " << compressed_size
                                                                    << " compressed bytes.");
    return std::nullopt;
  }

  std::string json;
  try {
    json = Decompress(artifact.substr(header_end + 1), json_size);
  } catch (const std::logic_error& error) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(),
                       "Index artifact of " << handle.Locator() << " cannot be decompressed: " << error.what());
    return std::nullopt;
  }

  const Aws::Utils::Json::JsonValue document(json);
  if (!document.WasParseSuccessful()) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Index artifact of " << handle.Locator() << " is not valid JSON: "
                                                                    << document.GetErrorMessage());
    return std::nullopt;
  }

  const Aws::Utils::Json::JsonView view = document.View();
  if (!view.ValueExists(kIndexObjectAttribute) || !view.ValueExists(kArtifactIndexAttribute)) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Index artifact of " << handle.Locator() << " is incomplete.");
    return std::nullopt;
  }

  try {
    const Aws::Utils::Json::JsonView object = view.GetObject(kIndexObjectAttribute);
    const bool same_object = ObjectLocator::FromJson(object) == handle.Locator() &&
                             object.ValueExists(kHandleSizeAttribute) &&
                             static_cast<uint64_t>(object.GetInt64(kHandleSizeAttribute)) == handle.Size() &&
                             object.ValueExists(kHandleChecksumAttribute) &&
                             object.GetString(kHandleChecksumAttribute) == handle.Checksum();
    if (!same_object) {
      AWS_LOGSTREAM_INFO(kIndexStoreTag.c_str(), "Ignoring index artifact of another version of " << handle.Locator());
      return std::nullopt;
    }

    ObjectIndex index = ObjectIndex::FromJson(view.GetObject(kArtifactIndexAttribute));
    if (index.format_version != kIndexFormatVersion || index.total_size_bytes != handle.Size()) {
      AWS_LOGSTREAM_INFO(kIndexStoreTag.c_str(), "Ignoring outdated index artifact of " << handle.Locator());
      return std::nullopt;
    }
    return index;
  } catch (const FormatError& error) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Index artifact of " << handle.Locator() << " is corrupt: "
                                                                    << error.what());
    return std::nullopt;
  }
}

std::optional<ObjectIndex> IndexStore::LoadArtifact(const std::string& artifact_key, const ObjectHandle& handle) const {
  const auto [artifact, error] = storage_->ReadObject(artifact_key);
  if (error) {
    if (error.GetType() != StorageErrorType::kNotFound) {
      AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Could not read index artifact " << artifact_key << ": "
                                                                                  << error.ToString());
    }
    return std::nullopt;
  }

  std::optional<ObjectIndex> index = DeserializeArtifact(artifact, handle);
  if (index.has_value()) {
    AWS_LOGSTREAM_DEBUG(kIndexStoreTag.c_str(), "Loaded index artifact " << artifact_key);
  }
  return index;
}

std::optional<ObjectIndex> IndexStore::Load(const ObjectHandle& handle, const PreprocessConfig& config) const {
  const size_t chunk_size = config.EffectiveChunkSize(handle.Size());
  return LoadArtifact(ArtifactKey(handle, chunk_size, config.record_sentinel), handle);
}

std::optional<ObjectIndex> IndexStore::LoadAny(const ObjectHandle& handle) const {
  const auto [statuses, error] = storage_->List(handle.Locator().key + ".");
  if (error) {
    AWS_LOGSTREAM_WARN(kIndexStoreTag.c_str(), "Could not list index artifacts of " << handle.Locator() << ": "
                                                                                    << error.ToString());
    return std::nullopt;
  }

  for (const auto& status : statuses) {
    if (!status.GetIdentifier().ends_with(kIndexObjectSuffix)) {
      continue;
    }

    std::optional<ObjectIndex> index = LoadArtifact(status.GetIdentifier(), handle);
    if (index.has_value()) {
      return index;
    }
  }
  return std::nullopt;
}

void IndexStore::Store(const ObjectHandle& handle, const PreprocessConfig& config, const ObjectIndex& index) const {
  const size_t chunk_size = config.EffectiveChunkSize(handle.Size());
  const std::string artifact_key = ArtifactKey(handle, chunk_size, config.record_sentinel);

  ThrowIfStorageError(storage_->WriteObject(artifact_key, SerializeArtifact(handle, chunk_size, index)),
                      "Could not write index artifact " + artifact_key);
  AWS_LOGSTREAM_DEBUG(kIndexStoreTag.c_str(), "Stored index artifact " << artifact_key);
}

}  // namespace seqpart
