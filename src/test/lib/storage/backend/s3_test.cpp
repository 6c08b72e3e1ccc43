#include <map>
#include <vector>

#include <gtest/gtest.h>

#include "sequence/errors.hpp"
#include "storage/backend/s3_storage.hpp"

namespace seqpart {

class AwsS3Test : public ::testing::Test {};

TEST_F(AwsS3Test, TestErrorTranslation) {
  const std::map<StorageErrorType, std::vector<Aws::S3::S3Errors>> mapping = {
      {StorageErrorType::kInvalidArgument,
       {Aws::S3::S3Errors::INCOMPLETE_SIGNATURE, Aws::S3::S3Errors::INVALID_ACTION,
        Aws::S3::S3Errors::INVALID_PARAMETER_COMBINATION, Aws::S3::S3Errors::INVALID_PARAMETER_VALUE,
        Aws::S3::S3Errors::MALFORMED_QUERY_STRING, Aws::S3::S3Errors::REQUEST_EXPIRED}},
      {StorageErrorType::kInternalError, {Aws::S3::S3Errors::INTERNAL_FAILURE, Aws::S3::S3Errors::SERVICE_UNAVAILABLE}},
      {StorageErrorType::kPermissionDenied,
       {Aws::S3::S3Errors::ACCESS_DENIED, Aws::S3::S3Errors::INVALID_SIGNATURE,
        Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH, Aws::S3::S3Errors::UNRECOGNIZED_CLIENT}},
      {StorageErrorType::kTemporary, {Aws::S3::S3Errors::SLOW_DOWN, Aws::S3::S3Errors::THROTTLING}},
      {StorageErrorType::kIOError, {Aws::S3::S3Errors::NETWORK_CONNECTION, Aws::S3::S3Errors::REQUEST_TIMEOUT}},
      {StorageErrorType::kNotFound,
       {Aws::S3::S3Errors::RESOURCE_NOT_FOUND, Aws::S3::S3Errors::NO_SUCH_BUCKET, Aws::S3::S3Errors::NO_SUCH_KEY}},
      {StorageErrorType::kUnknown, {Aws::S3::S3Errors::UNKNOWN}}};

  for (const auto& check : mapping) {
    for (const auto& error : check.second) {
      ASSERT_EQ(TranslateS3Error(error), check.first);
    }
  }
}

// Only a missing bucket or key surfaces as NotFoundError; every other S3 failure is an IOError.
TEST_F(AwsS3Test, TranslatedErrorsMapToExceptions) {
  EXPECT_THROW(ThrowIfStorageError(StorageError(TranslateS3Error(Aws::S3::S3Errors::NO_SUCH_KEY)), "GET genome.fa"),
               NotFoundError);
  EXPECT_THROW(ThrowIfStorageError(StorageError(TranslateS3Error(Aws::S3::S3Errors::ACCESS_DENIED)), "GET genome.fa"),
               IOError);
  EXPECT_THROW(ThrowIfStorageError(StorageError(TranslateS3Error(Aws::S3::S3Errors::SLOW_DOWN)), "GET genome.fa"),
               IOError);
  EXPECT_NO_THROW(ThrowIfStorageError(StorageError::Success(), "GET genome.fa"));
}

}  // namespace seqpart
