#pragma once

#include <aws/core/Aws.h>
#include <gtest/gtest.h>

namespace seqpart {

/**
 * Initializes the AWS SDK once for the whole test binary. The SDK provides JSON handling and logging to every test, and
 * the S3 clients of the storage tests. SEQPART_TEST_LOG_LEVEL (0 to 6) enables SDK console logging, e.g., 5 for debug.
 */
class AwsEnvironment : public ::testing::Environment {
 public:
  void SetUp() override;
  void TearDown() override;

 private:
  Aws::SDKOptions options_;
};

}  // namespace seqpart
