#pragma once

#include <memory>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Client.h>

#include "configuration.hpp"

namespace seqpart {

/**
 * Owns the AWS service clients of the command line tool. Requires Aws::InitAPI() to have been called. Credentials are
 * resolved by the SDK's default provider chain.
 */
class BaseClient {
 public:
  BaseClient();
  BaseClient(const BaseClient&) = delete;
  BaseClient(BaseClient&&) = default;
  const BaseClient& operator=(const BaseClient&) = delete;
  BaseClient& operator=(BaseClient&&) = default;

  ~BaseClient() = default;

  std::shared_ptr<const Aws::S3::S3Client> GetS3Client() const;

  const Aws::String& GetClientRegion() const;

 protected:
  static Aws::Client::ClientConfiguration GenerateClientConfig();

 private:
  std::shared_ptr<const Aws::S3::S3Client> s3_client_;

  Aws::String client_region_;

  inline static const Aws::Http::Scheme kHttpScheme = Aws::Http::Scheme::HTTPS;
  static constexpr bool kEnableTcpKeepAlive = true;
  static constexpr bool kVerifySsl = true;
};

}  // namespace seqpart
