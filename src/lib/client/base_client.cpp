#include "base_client.hpp"

#include <algorithm>
#include <thread>

#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/utils/threading/Executor.h>
#include <aws/s3/S3EndpointProvider.h>

namespace seqpart {

BaseClient::BaseClient() {
  const auto credentials_provider = std::make_shared<Aws::Auth::DefaultAWSCredentialsProviderChain>();
  const auto endpoint_provider = std::make_shared<Aws::S3::S3EndpointProvider>();

  auto client_configuration = GenerateClientConfig();
  client_region_ = client_configuration.region;

  client_configuration.executor = std::make_shared<Aws::Utils::Threading::PooledThreadExecutor>(
      std::max(1U, std::thread::hardware_concurrency()) * kIoThreadPoolToCpuRatio);

  s3_client_ = std::make_shared<const Aws::S3::S3Client>(credentials_provider, endpoint_provider, client_configuration);
}

std::shared_ptr<const Aws::S3::S3Client> BaseClient::GetS3Client() const { return s3_client_; }

const Aws::String& BaseClient::GetClientRegion() const { return client_region_; }

Aws::Client::ClientConfiguration BaseClient::GenerateClientConfig() {
  Aws::Client::ClientConfiguration client_configuration;
  client_configuration.scheme = kHttpScheme;
  client_configuration.maxConnections = kS3MaxConnections;
  client_configuration.requestTimeoutMs = kS3RequestTimeoutMs;
  client_configuration.connectTimeoutMs = kS3ConnectTimeoutMs;
  client_configuration.enableTcpKeepAlive = kEnableTcpKeepAlive;
  client_configuration.verifySSL = kVerifySsl;

  return client_configuration;
}

}  // namespace seqpart
