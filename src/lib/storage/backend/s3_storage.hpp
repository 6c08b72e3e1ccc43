#pragma once

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/GetObjectRequest.h>

#include "abstract_storage.hpp"
#include "stream.hpp"

namespace seqpart {

StorageErrorType TranslateS3Error(const Aws::S3::S3Errors error);

/**
 * S3ObjectWriter buffers all written data and uploads it with a single PutObject request on Close. Index artifacts are
 * small, so multipart uploads are not needed.
 */
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions,hicpp-special-member-functions)
class S3ObjectWriter : public ObjectWriter {
 public:
  S3ObjectWriter(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket, std::string object_id);
  ~S3ObjectWriter() override;

  StorageError Write(const char* data, size_t length) override;
  StorageError Close() override;

 private:
  std::shared_ptr<const Aws::S3::S3Client> client_;
  const std::string bucket_;
  const std::string object_id_;
  std::shared_ptr<std::stringbuf> body_;
  size_t body_size_bytes_{0};
  bool closed_{false};
};

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions,hicpp-special-member-functions)
class S3ObjectReader : public ObjectReader {
 public:
  S3ObjectReader(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket, std::string object_id);
  S3ObjectReader(const S3ObjectReader&) = delete;

  StorageError Read(size_t first_byte, size_t last_byte, ByteBuffer* buffer) override;
  const ObjectStatus& GetStatus() override;
  StorageError Close() override;

 private:
  static std::string GetRangeString(size_t first_byte, size_t last_byte);
  static size_t ParseContentLengthFromRange(const Aws::String& content_range);

  Aws::S3::Model::GetObjectRequest CreateGetObjectRequest(ByteBuffer* buffer, const std::string& range = "");
  StorageError ProcessGetObjectRequest(const Aws::S3::Model::GetObjectRequest& request);

  std::shared_ptr<const Aws::S3::S3Client> client_;
  const std::string bucket_;
  const std::string object_id_;
};

class S3Storage : public Storage {
 public:
  S3Storage(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket);

  std::unique_ptr<ObjectWriter> OpenForWriting(const std::string& object_identifier) override {
    return std::make_unique<S3ObjectWriter>(client_, bucket_, object_identifier);
  }

  std::unique_ptr<ObjectReader> OpenForReading(const std::string& object_identifier) override {
    return std::make_unique<S3ObjectReader>(client_, bucket_, object_identifier);
  }

  StorageError Delete(const std::string& object_identifier) override;
  std::pair<std::vector<ObjectStatus>, StorageError> List(const std::string& object_prefix = "") override;

  const std::string& GetBucket() const { return bucket_; }

 private:
  std::shared_ptr<const Aws::S3::S3Client> client_;
  const std::string bucket_;
};

}  // namespace seqpart
