#include "s3_storage.hpp"

#include <chrono>

#include <aws/core/utils/logging/LogMacros.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace seqpart {

namespace {

time_t ConvertAwsDateTime(const Aws::Utils::DateTime aws_datetime) {
  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds(aws_datetime.Millis()));
  return seconds.count();
}

template <class AwsOutcomeClass>
StorageError GetErrorFromOutcome(const AwsOutcomeClass& outcome) {
  const auto& error = outcome.GetError();
  return StorageError(TranslateS3Error(error.GetErrorType()), error.GetMessage());
}

}  // namespace

StorageErrorType TranslateS3Error(const Aws::S3::S3Errors error) {
  switch (error) {
    case Aws::S3::S3Errors::INCOMPLETE_SIGNATURE:
    case Aws::S3::S3Errors::INVALID_ACTION:
    case Aws::S3::S3Errors::INVALID_PARAMETER_COMBINATION:
    case Aws::S3::S3Errors::INVALID_PARAMETER_VALUE:
    case Aws::S3::S3Errors::INVALID_QUERY_PARAMETER:
    case Aws::S3::S3Errors::MALFORMED_QUERY_STRING:
    case Aws::S3::S3Errors::MISSING_ACTION:
    case Aws::S3::S3Errors::MISSING_PARAMETER:
    case Aws::S3::S3Errors::REQUEST_EXPIRED:
    case Aws::S3::S3Errors::REQUEST_TIME_TOO_SKEWED:
      return StorageErrorType::kInvalidArgument;

    case Aws::S3::S3Errors::INTERNAL_FAILURE:
    case Aws::S3::S3Errors::SERVICE_UNAVAILABLE:
      return StorageErrorType::kInternalError;

    case Aws::S3::S3Errors::ACCESS_DENIED:
    case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
    case Aws::S3::S3Errors::INVALID_CLIENT_TOKEN_ID:
    case Aws::S3::S3Errors::INVALID_SIGNATURE:
    case Aws::S3::S3Errors::MISSING_AUTHENTICATION_TOKEN:
    case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
    case Aws::S3::S3Errors::UNRECOGNIZED_CLIENT:
      return StorageErrorType::kPermissionDenied;

    case Aws::S3::S3Errors::SLOW_DOWN:
    case Aws::S3::S3Errors::THROTTLING:
      return StorageErrorType::kTemporary;

    case Aws::S3::S3Errors::NETWORK_CONNECTION:
    case Aws::S3::S3Errors::REQUEST_TIMEOUT:
      return StorageErrorType::kIOError;

    case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
    case Aws::S3::S3Errors::NO_SUCH_BUCKET:
    case Aws::S3::S3Errors::NO_SUCH_KEY:
      return StorageErrorType::kNotFound;
    default:
      return StorageErrorType::kUnknown;
  }
}

S3ObjectWriter::S3ObjectWriter(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket,
                               std::string object_id)
    : client_(std::move(client)),
      bucket_(std::move(bucket)),
      object_id_(std::move(object_id)),
      body_(std::make_shared<std::stringbuf>()) {}

S3ObjectWriter::~S3ObjectWriter() {
  if (!closed_) {
    const StorageError error = Close();
    if (error) {
      AWS_LOGSTREAM_ERROR(kBaseTag.c_str(), "Upload of " << object_id_ << " failed: " << error.ToString());
    }
  }
}

StorageError S3ObjectWriter::Write(const char* data, size_t length) {
  if (closed_) {
    return StorageError(StorageErrorType::kInvalidState);
  }

  body_->sputn(data, static_cast<std::streamsize>(length));
  body_size_bytes_ += length;
  return StorageError::Success();
}

StorageError S3ObjectWriter::Close() {
  if (closed_) {
    return StorageError::Success();
  }
  closed_ = true;

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(bucket_);
  request.SetKey(object_id_);
  request.SetContentLength(static_cast<long long>(body_size_bytes_));
  request.SetBody(std::make_shared<Aws::IOStream>(body_.get()));

  const auto outcome = client_->PutObject(request);
  if (!outcome.IsSuccess()) {
    return GetErrorFromOutcome(outcome);
  }

  return StorageError::Success();
}

S3ObjectReader::S3ObjectReader(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket,
                               std::string object_id)
    : client_(std::move(client)), bucket_(std::move(bucket)), object_id_(std::move(object_id)) {}

Aws::S3::Model::GetObjectRequest S3ObjectReader::CreateGetObjectRequest(ByteBuffer* buffer, const std::string& range) {
  const auto stream = std::make_shared<DelegateStreamBuffer>();
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket_);
  request.SetKey(object_id_);
  // The factory is invoked again on retries, so every attempt starts with an empty buffer.
  request.SetResponseStreamFactory([buffer, stream]() {
    buffer->Resize(0);
    stream->Reset(buffer);
    return Aws::New<Aws::IOStream>(kBaseTag.c_str(), stream.get());
  });

  if (!range.empty()) {
    request.SetRange(range);
  }
  return request;
}

StorageError S3ObjectReader::Read(size_t first_byte, size_t last_byte, ByteBuffer* buffer) {
  if (last_byte < first_byte) {
    return StorageError(StorageErrorType::kInvalidArgument, "Requested byte range is reversed.");
  }

  const bool read_entire_object = (first_byte == 0 && last_byte == kLastByteInFile);
  std::string range_string;
  if (!read_entire_object) {
    range_string = GetRangeString(first_byte, last_byte);
  }

  return ProcessGetObjectRequest(CreateGetObjectRequest(buffer, range_string));
}

StorageError S3ObjectReader::ProcessGetObjectRequest(const Aws::S3::Model::GetObjectRequest& request) {
  auto outcome = client_->GetObject(request);
  if (!outcome.IsSuccess()) {
    return GetErrorFromOutcome(outcome);
  }

  // If we do not have status information about the object, we can obtain it now.
  if (status_.GetError().IsError()) {
    const Aws::S3::Model::GetObjectResult& result = outcome.GetResult();
    const time_t last_modified = ConvertAwsDateTime(result.GetLastModified());
    const std::string& hash = result.GetETag();

    // For range requests, the actual length of the object is sent in the "Content-Range"-Header.
    const size_t size = result.GetContentRange().empty() ? result.GetContentLength()
                                                         : ParseContentLengthFromRange(result.GetContentRange());

    status_ = ObjectStatus(object_id_, last_modified, hash, size);
  }

  return StorageError::Success();
}

size_t S3ObjectReader::ParseContentLengthFromRange(const Aws::String& content_range) {
  // A header line might look like "Content-Range: bytes 0-1023/146515"
  // We are interested in the number after '/'.
  const size_t index_of_slash = content_range.find_last_of('/');
  if (index_of_slash == Aws::String::npos) {
    Fail("Found a malformed value for header entry 'Content-Range'.");
  }

  const Aws::String content_length_string = content_range.substr(index_of_slash + 1);
  try {
    return std::stoull(content_length_string);
  } catch (const std::exception& e) {
    // We have std::invalid_argument or std::out_of_range here.
    Fail(e.what());
  }
}

const ObjectStatus& S3ObjectReader::GetStatus() {
  if (status_.GetError()) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(bucket_);
    request.SetKey(object_id_);
    auto outcome = client_->HeadObject(request);

    if (!outcome.IsSuccess()) {
      status_ = ObjectStatus(GetErrorFromOutcome(outcome));
    } else {
      const auto& result = outcome.GetResult();
      const time_t last_modified = ConvertAwsDateTime(result.GetLastModified());
      const std::string& hash = result.GetETag();
      const size_t size = result.GetContentLength();

      status_ = ObjectStatus(object_id_, last_modified, hash, size);
    }
  }
  return status_;
}

std::string S3ObjectReader::GetRangeString(size_t first_byte, size_t last_byte) {
  std::stringstream stream;
  stream << "bytes=" << first_byte << "-";
  if (last_byte != kLastByteInFile) {
    stream << last_byte;
  }
  return stream.str();
}

StorageError S3ObjectReader::Close() { return StorageError::Success(); }

S3Storage::S3Storage(std::shared_ptr<const Aws::S3::S3Client> client, std::string bucket)
    : client_(std::move(client)), bucket_(std::move(bucket)) {}

StorageError S3Storage::Delete(const std::string& object_identifier) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(bucket_);
  request.SetKey(object_identifier);

  auto outcome = client_->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    return GetErrorFromOutcome(outcome);
  }

  return StorageError::Success();
}

std::pair<std::vector<ObjectStatus>, StorageError> S3Storage::List(const std::string& object_prefix) {
  bool has_more = true;
  std::string continuation_token;
  StorageError error = StorageError::Success();
  std::vector<ObjectStatus> result_vector;

  while (has_more) {
    Aws::S3::Model::ListObjectsV2Request request;
    request.SetBucket(bucket_);

    if (!object_prefix.empty()) {
      request.SetPrefix(object_prefix);
    }

    if (!continuation_token.empty()) {
      request.SetContinuationToken(continuation_token);
    }

    auto outcome = client_->ListObjectsV2(request);
    if (!outcome.IsSuccess()) {
      error = GetErrorFromOutcome(outcome);
      break;
    }
    const auto& result = outcome.GetResult();

    if (result.GetIsTruncated()) {
      continuation_token = result.GetNextContinuationToken();
    } else {
      has_more = false;
    }

    for (const auto& object : result.GetContents()) {
      result_vector.emplace_back(object.GetKey(), ConvertAwsDateTime(object.GetLastModified()), object.GetETag(),
                                 object.GetSize());
    }
  }

  return std::make_pair(std::move(result_vector), std::move(error));
}

}  // namespace seqpart
