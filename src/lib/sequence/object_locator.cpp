#include "object_locator.hpp"

#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "errors.hpp"
#include "utils/assert.hpp"

namespace seqpart {

std::string ObjectLocator::ToUri() const {
  switch (backend) {
    case StorageBackend::kS3:
      return std::string(kS3UriScheme) + container + "/" + key;
    case StorageBackend::kFilesystem: {
      const bool needs_separator = !container.empty() && !container.ends_with('/');
      return std::string(kFilesystemUriScheme) + container + (needs_separator ? "/" : "") + key;
    }
  }
  Fail("Unexpected storage backend.");
}

ObjectLocator ObjectLocator::FromUri(const std::string& uri) {
  ObjectLocator locator;
  std::string path;

  if (uri.starts_with(kS3UriScheme)) {
    locator.backend = StorageBackend::kS3;
    path = uri.substr(kS3UriScheme.size());
    const size_t separator = path.find('/');
    if (separator == std::string::npos || separator == 0 || separator + 1 == path.size()) {
      throw InvalidArgumentError("S3 URI needs a bucket and a key: " + uri);
    }
    locator.container = path.substr(0, separator);
    locator.key = path.substr(separator + 1);
    return locator;
  }

  if (uri.starts_with(kFilesystemUriScheme)) {
    locator.backend = StorageBackend::kFilesystem;
    path = uri.substr(kFilesystemUriScheme.size());
    const size_t separator = path.find_last_of('/');
    if (path.empty() || separator + 1 == path.size()) {
      throw InvalidArgumentError("File URI needs a file name: " + uri);
    }
    locator.container = separator == std::string::npos ? "." : path.substr(0, separator == 0 ? 1 : separator);
    locator.key = separator == std::string::npos ? path : path.substr(separator + 1);
    return locator;
  }

  throw InvalidArgumentError("Unsupported URI scheme: " + uri);
}

Aws::Utils::Json::JsonValue ObjectLocator::ToJson() const {
  return Aws::Utils::Json::JsonValue()
      .WithString(kLocatorBackendAttribute, std::string(magic_enum::enum_name(backend)))
      .WithString(kLocatorContainerAttribute, container)
      .WithString(kLocatorKeyAttribute, key);
}

ObjectLocator ObjectLocator::FromJson(const Aws::Utils::Json::JsonView& json) {
  if (!json.ValueExists(kLocatorBackendAttribute) || !json.ValueExists(kLocatorContainerAttribute) ||
      !json.ValueExists(kLocatorKeyAttribute)) {
    throw FormatError("Locator document is incomplete.");
  }

  const auto backend = magic_enum::enum_cast<StorageBackend>(json.GetString(kLocatorBackendAttribute));
  if (!backend.has_value()) {
    throw FormatError("Unknown storage backend: " + json.GetString(kLocatorBackendAttribute));
  }

  return {*backend, json.GetString(kLocatorContainerAttribute), json.GetString(kLocatorKeyAttribute)};
}

std::ostream& operator<<(std::ostream& stream, const ObjectLocator& locator) {
  stream << locator.ToUri();
  return stream;
}

}  // namespace seqpart
