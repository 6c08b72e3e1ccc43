#include "object_handle.hpp"

#include <sstream>
#include <utility>

#include "constants.hpp"
#include "errors.hpp"
#include "utils/assert.hpp"

namespace seqpart {

ObjectHandle::ObjectHandle(PrivateTag /*tag*/, std::shared_ptr<Storage> storage, ObjectLocator locator,
                           uint64_t size_bytes, std::string checksum)
    : storage_(std::move(storage)),
      locator_(std::move(locator)),
      size_bytes_(size_bytes),
      checksum_(std::move(checksum)) {}

std::shared_ptr<const ObjectHandle> ObjectHandle::Resolve(std::shared_ptr<Storage> storage, ObjectLocator locator) {
  Assert(storage != nullptr, "Cannot resolve an object without a storage.");

  const ObjectStatus status = storage->GetStatus(locator.key);
  ThrowIfStorageError(status.GetError(), "Could not resolve " + locator.ToUri());

  return std::make_shared<const ObjectHandle>(PrivateTag(), std::move(storage), std::move(locator), status.GetSize(),
                                              status.GetChecksum());
}

std::shared_ptr<const ObjectHandle> ObjectHandle::FromResolvedMetadata(std::shared_ptr<Storage> storage,
                                                                       ObjectLocator locator, uint64_t size_bytes,
                                                                       std::string checksum) {
  Assert(storage != nullptr, "A handle needs a storage.");
  return std::make_shared<const ObjectHandle>(PrivateTag(), std::move(storage), std::move(locator), size_bytes,
                                              std::move(checksum));
}

std::string ObjectHandle::ReadRange(ByteOffset start, ByteOffset end) const {
  if (start >= end || end > size_bytes_) {
    std::stringstream message;
    message << "Cannot read " << ByteRange{start, end} << " from " << locator_ << " of size " << size_bytes_ << ".";
    throw RangeError(message.str());
  }

  const auto expected_size = static_cast<size_t>(end - start);
  std::string data(expected_size, '\0');
  ByteBuffer buffer(data.data(), data.size());

  // Readers are not thread-safe, so every call opens its own.
  const auto reader = storage_->OpenForReading(locator_.key);
  ThrowIfStorageError(reader->Read(start, end - 1, &buffer), "Could not read from " + locator_.ToUri());

  if (buffer.Size() != expected_size || !buffer.IsExternal()) {
    std::stringstream message;
    message << "Short read from " << locator_ << ": expected " << expected_size << " bytes but got " << buffer.Size()
            << ".";
    throw IOError(message.str());
  }

  ThrowIfStorageError(reader->Close(), "Could not close reader of " + locator_.ToUri());
  return data;
}

bool ObjectHandle::HasSameIdentity(const ObjectHandle& other) const {
  return locator_ == other.locator_ && size_bytes_ == other.size_bytes_ && checksum_ == other.checksum_;
}

Aws::Utils::Json::JsonValue ObjectHandle::ToJson() const {
  return locator_.ToJson()
      .WithInt64(kHandleSizeAttribute, static_cast<int64_t>(size_bytes_))
      .WithString(kHandleChecksumAttribute, checksum_);
}

std::shared_ptr<const ObjectHandle> ObjectHandle::FromJson(const Aws::Utils::Json::JsonView& json,
                                                           const StorageResolver& resolver) {
  if (!json.ValueExists(kHandleSizeAttribute) || !json.ValueExists(kHandleChecksumAttribute)) {
    throw FormatError("Object handle document is incomplete.");
  }

  ObjectLocator locator = ObjectLocator::FromJson(json);
  std::shared_ptr<Storage> storage = resolver(locator);
  if (storage == nullptr) {
    throw InvalidArgumentError("No storage available for " + locator.ToUri());
  }

  return FromResolvedMetadata(std::move(storage), std::move(locator),
                              static_cast<uint64_t>(json.GetInt64(kHandleSizeAttribute)),
                              json.GetString(kHandleChecksumAttribute));
}

}  // namespace seqpart
