#include "abstract_storage.hpp"

namespace seqpart {

std::pair<std::string, StorageError> Storage::ReadObject(const std::string& object_identifier) {
  auto reader = OpenForReading(object_identifier);
  const ObjectStatus& status = reader->GetStatus();
  if (status.GetError()) {
    return {std::string(), status.GetError()};
  }

  std::string data(status.GetSize(), '\0');
  if (data.empty()) {
    return {std::move(data), reader->Close()};
  }

  ByteBuffer buffer(data.data(), data.size());
  const StorageError read_error = reader->Read(0, ObjectReader::kLastByteInFile, &buffer);
  if (read_error) {
    return {std::string(), read_error};
  }

  if (buffer.Size() != data.size() || !buffer.IsExternal()) {
    return {std::string(), StorageError(StorageErrorType::kIOError, "Object changed while it was read.")};
  }

  return {std::move(data), reader->Close()};
}

StorageError Storage::WriteObject(const std::string& object_identifier, const std::string& data) {
  auto writer = OpenForWriting(object_identifier);
  const StorageError write_error = writer->Write(data.data(), data.size());
  if (write_error) {
    return write_error;
  }

  return writer->Close();
}

}  // namespace seqpart
