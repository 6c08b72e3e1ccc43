#include "mock_storage.hpp"

#include <algorithm>
#include <vector>

namespace seqpart {

MockReader::MockReader(std::shared_ptr<std::string> data, std::string identifier, std::string checksum,
                       std::shared_ptr<std::atomic<size_t>> read_counter, StorageError simulated_error)
    : data_(std::move(data)),
      identifier_(std::move(identifier)),
      checksum_(std::move(checksum)),
      storage_read_counter_(std::move(read_counter)),
      simulated_error_(std::move(simulated_error)) {}

StorageError MockReader::Read(size_t first_byte, size_t last_byte, ByteBuffer* buffer) {
  num_reads_++;
  if (storage_read_counter_) {
    (*storage_read_counter_)++;
  }

  if (simulated_error_) {
    return simulated_error_;
  }

  if (!data_) {
    return StorageError(StorageErrorType::kNotFound);
  }

  if (first_byte >= data_->size()) {
    return StorageError::Success();
  }

  if (last_byte >= data_->size()) {
    last_byte = data_->size() - 1;
  }

  const size_t length = last_byte - first_byte + 1;
  buffer->Resize(length);
  std::copy_n(&data_->c_str()[first_byte], length, buffer->Data());

  return StorageError::Success();
}

const ObjectStatus& MockReader::GetStatus() {
  if (!data_) {
    status_ = ObjectStatus(StorageError(StorageErrorType::kNotFound));
  } else {
    status_ = ObjectStatus(identifier_, 1, checksum_, data_->size());
  }

  return status_;
}

const size_t& MockReader::GetReadOperationCounter() const { return num_reads_; }

StorageError MockReader::Close() { return StorageError::Success(); }

MockWriter::MockWriter(std::string object_identifier,
                       std::function<void(std::string&& key, std::string&& value)> setter)
    : object_identifier_(std::move(object_identifier)), setter_(std::move(setter)) {}

MockWriter::MockWriter(StorageError simulated_error) : simulated_error_(std::move(simulated_error)) {}

StorageError MockWriter::Write(const char* data, size_t length) {
  if (object_identifier_.empty()) {
    return simulated_error_;
  }
  stream_.write(data, static_cast<std::streamsize>(length));
  return StorageError::Success();
}

StorageError MockWriter::Close() {
  if (object_identifier_.empty()) {
    return simulated_error_;
  }

  setter_(std::move(object_identifier_), stream_.str());
  return StorageError::Success();
}

std::unique_ptr<ObjectWriter> MockStorage::OpenForWriting(const std::string& object_identifier) {
  if (simulate_write_error_) {
    simulate_error_after_--;
    if (simulate_error_after_ <= 0) {
      simulate_error_after_ = 0;
      const std::lock_guard guard(store_mutex_);
      return std::make_unique<MockWriter>(simulated_write_error_);
    }
  }

  return std::make_unique<MockWriter>(object_identifier, [&](std::string&& key, std::string&& value) {
    const std::lock_guard guard(store_mutex_);
    const std::string checksum = "version-" + std::to_string(++num_versions_);
    store_.insert_or_assign(std::move(key), StoredObject{std::make_shared<std::string>(std::move(value)), checksum});
  });
}

std::unique_ptr<ObjectReader> MockStorage::OpenForReading(const std::string& object_identifier) {
  const std::lock_guard guard(store_mutex_);

  auto iterator = store_.find(object_identifier);
  if (iterator == store_.end()) {
    return std::make_unique<MockReader>(nullptr, object_identifier, "", read_counter_, simulated_read_error_);
  }

  return std::make_unique<MockReader>(iterator->second.data, object_identifier, iterator->second.checksum,
                                      read_counter_, simulated_read_error_);
}

StorageError MockStorage::Delete(const std::string& object_identifier) {
  const std::lock_guard guard(store_mutex_);

  auto iterator = store_.find(object_identifier);
  if (iterator != store_.end()) {
    store_.erase(iterator);
  }

  return StorageError::Success();
}

std::pair<std::vector<ObjectStatus>, StorageError> MockStorage::List(const std::string& object_prefix) {
  const std::lock_guard guard(store_mutex_);

  std::vector<ObjectStatus> result;
  for (const auto& [identifier, object] : store_) {
    if (identifier.starts_with(object_prefix)) {
      result.emplace_back(identifier, 1, object.checksum, object.data->size());
    }
  }
  return std::make_pair(std::move(result), StorageError::Success());
}

void MockStorage::SetSimulateWriteErrorAfter(int n, StorageError error) {
  {
    const std::lock_guard guard(store_mutex_);
    simulated_write_error_ = std::move(error);
  }
  simulate_error_after_ = n;
  simulate_write_error_ = true;
}

void MockStorage::SetSimulateReadError(StorageError error) {
  const std::lock_guard guard(store_mutex_);
  simulated_read_error_ = std::move(error);
}

}  // namespace seqpart
