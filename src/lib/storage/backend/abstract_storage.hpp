#pragma once

#include <ctime>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "storage/io_handle/byte_buffer.hpp"

namespace seqpart {

class ObjectStatus {
 public:
  ObjectStatus() : error_(StorageErrorType::kUninitialized) {}
  explicit ObjectStatus(StorageError error) : error_(std::move(error)) {}
  ObjectStatus(std::string identifier, time_t last_modified, std::string checksum, size_t object_size)
      : identifier_(std::move(identifier)),
        last_modified_timestamp_(last_modified),
        checksum_(std::move(checksum)),
        size_(object_size),
        error_(StorageErrorType::kNoError) {}

  const std::string& GetIdentifier() const { return identifier_; }
  const std::string& GetChecksum() const { return checksum_; }
  time_t GetLastModifiedTimestamp() const { return last_modified_timestamp_; }
  size_t GetSize() const { return size_; }
  const StorageError& GetError() const { return error_; }

 private:
  std::string identifier_;
  time_t last_modified_timestamp_{0};
  std::string checksum_;
  size_t size_{0};
  StorageError error_;
};

/**
 * ObjectWriter writes data to an object, creating it if necessary. Multiple calls to Write append. The object becomes
 * visible once Close returns successfully. This class is not thread-safe.
 */
class ObjectWriter {
 public:
  virtual ~ObjectWriter() = default;

  virtual StorageError Write(const char* data, size_t length) = 0;
  virtual StorageError Close() = 0;
};

/**
 * ObjectReader enables ranged read access to an object. The same instance can be used to read different parts of an
 * object, but it is not thread-safe; concurrent readers must open their own instance.
 */
class ObjectReader {
 public:
  static constexpr size_t kLastByteInFile = std::numeric_limits<size_t>::max();
  virtual ~ObjectReader() = default;

  /**
   * Reads at most `last_byte - first_byte + 1` bytes (both indices inclusive) into @param buffer, which is resized to
   * the number of bytes read. Passing kLastByteInFile reads up to the end of the object.
   */
  virtual StorageError Read(size_t first_byte, size_t last_byte, ByteBuffer* buffer) = 0;
  virtual const ObjectStatus& GetStatus() = 0;
  virtual StorageError Close() = 0;

 protected:
  ObjectStatus status_;
};

/**
 * Storage provides a common interface for accessing and manipulating objects. The functions are safe to call
 * concurrently from within different threads.
 */
class Storage {
 public:
  virtual ~Storage() = default;
  virtual std::unique_ptr<ObjectWriter> OpenForWriting(const std::string& object_identifier) = 0;
  virtual std::unique_ptr<ObjectReader> OpenForReading(const std::string& object_identifier) = 0;
  ObjectStatus GetStatus(const std::string& object_identifier) {
    return OpenForReading(object_identifier)->GetStatus();
  }
  virtual StorageError Delete(const std::string& object_identifier) = 0;
  virtual std::pair<std::vector<ObjectStatus>, StorageError> List(const std::string& object_prefix = "") = 0;

  /**
   * Reads an entire object. Meant for small objects such as index artifacts.
   */
  std::pair<std::string, StorageError> ReadObject(const std::string& object_identifier);

  /**
   * Creates or replaces an object with @param data.
   */
  StorageError WriteObject(const std::string& object_identifier, const std::string& data);
};

}  // namespace seqpart
