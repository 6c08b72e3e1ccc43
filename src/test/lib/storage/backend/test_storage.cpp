#include "test_storage.hpp"

#include <filesystem>

#include "utils/assert.hpp"

namespace seqpart {

namespace {

std::string FindTestdataDirectory() {
  // Given /path/to/executable, look into /path/to/resources, /path/resources and /resources.
  std::filesystem::path directory = std::filesystem::read_symlink("/proc/self/exe").parent_path();
  while (true) {
    const std::filesystem::path resources = directory / "resources";
    if (std::filesystem::is_directory(resources)) {
      Assert(std::filesystem::is_directory(resources / "test"), "Directory resources/test is missing.");
      return (resources / "test").string();
    }

    if (!directory.has_parent_path() || directory.parent_path() == directory) {
      break;
    }
    directory = directory.parent_path();
  }

  Fail("Did not find resources directory.");
}

}  // namespace

TestStorage::TestStorage() : FilesystemStorage(FindTestdataDirectory()) {}

}  // namespace seqpart
