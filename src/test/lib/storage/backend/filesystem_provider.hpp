#pragma once

#include <filesystem>
#include <memory>

#include "abstract_provider.hpp"
#include "storage/backend/filesystem_storage.hpp"
#include "utils/string.hpp"

namespace seqpart {

class FilesystemStorageProvider : public StorageProvider {
 public:
  Storage& GetStorage() override { return *storage_; }

  void SetUp() override {
    root_directory_ = std::filesystem::temp_directory_path() / ("seqpart-test-" + RandomString(kSuffixLength));
    std::filesystem::create_directories(root_directory_);
    storage_ = std::make_unique<FilesystemStorage>(root_directory_.string());
  }

  void TearDown() override {
    storage_.reset(nullptr);
    std::error_code error_code;
    std::filesystem::remove_all(root_directory_, error_code);
  }

 private:
  static constexpr size_t kSuffixLength = 8;

  std::filesystem::path root_directory_;
  std::unique_ptr<FilesystemStorage> storage_;
};

}  // namespace seqpart
