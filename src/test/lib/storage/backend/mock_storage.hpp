#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "storage/backend/abstract_storage.hpp"

namespace seqpart {

class MockWriter : public ObjectWriter {
 public:
  MockWriter() = default;
  explicit MockWriter(StorageError simulated_error);
  MockWriter(std::string object_identifier, std::function<void(std::string&& key, std::string&& value)> setter);
  StorageError Write(const char* data, size_t length) override;
  StorageError Close() override;

 private:
  std::string object_identifier_;
  std::stringstream stream_;
  std::function<void(std::string key, std::string value)> setter_;
  StorageError simulated_error_{StorageErrorType::kInternalError};
};

class MockReader : public ObjectReader {
 public:
  MockReader() = default;
  MockReader(std::shared_ptr<std::string> data, std::string identifier, std::string checksum,
             std::shared_ptr<std::atomic<size_t>> read_counter, StorageError simulated_error);
  StorageError Read(size_t first_byte, size_t last_byte, ByteBuffer* buffer) override;
  const ObjectStatus& GetStatus() override;
  StorageError Close() override;

  // Returns a reference to the counter. While you can use this reference to later check the current value of the
  // counter, keep in mind that it has the same lifetime as the MockReader itself.
  const size_t& GetReadOperationCounter() const;

 private:
  std::shared_ptr<std::string> data_;
  std::string identifier_;
  std::string checksum_;
  std::shared_ptr<std::atomic<size_t>> storage_read_counter_;
  StorageError simulated_error_{StorageErrorType::kNoError};
  size_t num_reads_ = 0;
};

/**
 * In-memory storage for tests. Every write produces a new checksum, so rewriting an object changes its identity just
 * like it does on S3 or the filesystem.
 */
class MockStorage : public Storage {
 public:
  std::unique_ptr<ObjectWriter> OpenForWriting(const std::string& object_identifier) override;
  std::unique_ptr<ObjectReader> OpenForReading(const std::string& object_identifier) override;
  StorageError Delete(const std::string& object_identifier) override;
  std::pair<std::vector<ObjectStatus>, StorageError> List(const std::string& object_prefix = "") override;

  // Simulates an error after `n` calls to `OpenForWriting`. The `n`th call to `OpenForWriting` will return an object
  // that will return @param error for any operation.
  void SetSimulateWriteErrorAfter(int n, StorageError error = StorageError(StorageErrorType::kInternalError));

  // Every subsequent Read() of any reader fails with @param error. Pass StorageError::Success() to stop.
  void SetSimulateReadError(StorageError error);

  // Number of Read() calls over all readers this storage handed out.
  size_t GetReadOperationCount() const { return *read_counter_; }
  void ResetReadOperationCount() { *read_counter_ = 0; }

 private:
  struct StoredObject {
    std::shared_ptr<std::string> data;
    std::string checksum;
  };

  std::map<std::string, StoredObject> store_;
  std::mutex store_mutex_;
  size_t num_versions_ = 0;
  std::atomic<bool> simulate_write_error_ = false;
  std::atomic<int> simulate_error_after_ = 0;
  std::shared_ptr<std::atomic<size_t>> read_counter_ = std::make_shared<std::atomic<size_t>>(0);
  StorageError simulated_read_error_{StorageErrorType::kNoError};
  StorageError simulated_write_error_{StorageErrorType::kInternalError};
};

}  // namespace seqpart
