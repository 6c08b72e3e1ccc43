#include "filesystem_storage.hpp"

#include <filesystem>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <cerrno>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#else
#error "FilesystemStorage is not implemented on your platform."
#endif

namespace seqpart {

namespace {

StorageError ErrnoToStorageError() {
  // errno is set by `unlink`, `stat` or `opendir`.
  switch (errno) {
    case EACCES:
    case EPERM:
    case EROFS:
      return StorageError(StorageErrorType::kPermissionDenied);
    case EBUSY:
      return StorageError(StorageErrorType::kTemporary);
    case EIO:
      return StorageError(StorageErrorType::kIOError);
    case ENOENT:
    case ENOTDIR:
      return StorageError(StorageErrorType::kNotFound);
    case ENAMETOOLONG:
    case ELOOP:
    case EOVERFLOW:
      return StorageError(StorageErrorType::kOperationNotSupported);
    case EFAULT:
    case ENOMEM:
      return StorageError(StorageErrorType::kInternalError);
    default:
      return StorageError(StorageErrorType::kUnknown);
  }
}

// Wraps `stat` and returns the result as an ObjectStatus. The first `num_characters_hidden` characters of the path
// (the root directory) are stripped from the identifier. Files carry no content hash, so the checksum is derived from
// the modification time and the size; it changes whenever the file is rewritten.
ObjectStatus GetFileStatus(const std::string& filename, size_t num_characters_hidden = 0) {
  struct stat buffer{};
  const int stat_result = stat(filename.c_str(), &buffer);

  if (stat_result == -1) {
    return ObjectStatus(ErrnoToStorageError());
  }

  if (!S_ISREG(buffer.st_mode)) {  // NOLINT(hicpp-signed-bitwise)
    return ObjectStatus(StorageError(StorageErrorType::kNotFound, filename + " is not a regular file."));
  }

  const auto object_size = static_cast<size_t>(buffer.st_size);
  const int64_t last_modified = buffer.st_mtime;
  const std::string checksum = std::to_string(last_modified) + "-" + std::to_string(object_size);
  return {filename.substr(num_characters_hidden), last_modified, checksum, object_size};
}

}  // namespace

FilesystemWriter::FilesystemWriter(const std::string& filename) : error_(StorageErrorType::kNoError) {
  const std::filesystem::path path(filename);
  std::error_code error_code;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), error_code);
  }
  out_.open(filename.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (error_code || !out_.is_open()) {
    error_ = StorageError(StorageErrorType::kIOError, "Unable to open " + filename + " for writing.");
  }
}

FilesystemWriter::~FilesystemWriter() {
  if (out_.is_open()) {
    out_.close();
  }
}

StorageError FilesystemWriter::Write(const char* data, size_t length) {
  if (error_) {
    return error_;
  }

  out_.write(data, static_cast<std::streamsize>(length));
  if (!out_.good()) {
    return StorageError(StorageErrorType::kIOError);
  }
  return StorageError::Success();
}

StorageError FilesystemWriter::Close() {
  if (error_) {
    return error_;
  }

  if (out_.is_open()) {
    out_.close();
    if (out_.fail()) {
      return StorageError(StorageErrorType::kIOError);
    }
  }
  return StorageError::Success();
}

FilesystemReader::FilesystemReader(const std::string& filename, size_t num_characters_hidden)
    : error_(StorageErrorType::kNoError), filename_(filename), num_characters_hidden_(num_characters_hidden) {
  in_.open(filename.c_str(), std::ios::in | std::ios::binary);
  if (!in_.is_open()) {
    error_ = StorageError(StorageErrorType::kNotFound, filename.substr(num_characters_hidden) + " does not exist.");
  }
}

FilesystemReader::~FilesystemReader() {
  if (in_.is_open()) {
    in_.close();
  }
}

const ObjectStatus& FilesystemReader::GetStatus() {
  if (status_.GetError()) {
    status_ = GetFileStatus(filename_, num_characters_hidden_);
  }
  return status_;
}

StorageError FilesystemReader::Close() {
  if (in_.is_open()) {
    in_.close();
  }
  return StorageError::Success();
}

StorageError FilesystemReader::Read(size_t first_byte, size_t last_byte, ByteBuffer* buffer) {
  if (error_) {
    return error_;
  }

  const ObjectStatus& status = GetStatus();
  if (status.GetError()) {
    return status.GetError();
  }

  const size_t file_size = status.GetSize();
  if (first_byte >= file_size || last_byte < first_byte) {
    return StorageError(StorageErrorType::kInvalidArgument, "Requested byte range lies outside of " + filename_ + ".");
  }

  // Both `first_byte` and `last_byte` are inclusive. We cannot read more bytes than the file has.
  const size_t bytes_left = last_byte >= file_size ? file_size - first_byte : last_byte - first_byte + 1;

  in_.clear();
  in_.seekg(static_cast<std::ifstream::off_type>(first_byte), std::ios::beg);
  if (!in_.good()) {
    return StorageError(StorageErrorType::kIOError);
  }

  buffer->Resize(bytes_left);
  in_.read(buffer->CharData(), static_cast<std::streamsize>(bytes_left));

  if (std::cmp_not_equal(in_.gcount(), bytes_left)) {
    return StorageError(StorageErrorType::kIOError, "Short read from " + filename_ + ".");
  }

  return StorageError::Success();
}

StorageError FilesystemStorage::ListDirectoryRecursively(const std::string& directory_name, const std::string& prefix,
                                                         std::vector<ObjectStatus>* output_vector) {
  DIR* dir = opendir(directory_name.c_str());
  if (dir == nullptr) {
    return ErrnoToStorageError();
  }

  StorageError error = StorageError::Success();
  struct dirent* dir_entry{};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  while ((dir_entry = readdir(dir)) != nullptr) {
    if (dir_entry->d_name[0] == '.') {
      continue;
    }
    const std::string filename = JoinPath(directory_name, dir_entry->d_name);
    if (dir_entry->d_type == DT_REG && filename.starts_with(prefix)) {
      output_vector->emplace_back(GetFileStatus(filename, RootPrefixLength()));
    } else if (dir_entry->d_type == DT_DIR && (filename.starts_with(prefix) || prefix.starts_with(filename))) {
      error = ListDirectoryRecursively(filename, prefix, output_vector);
      if (error) {
        break;
      }
    }
  }

  closedir(dir);
  return error;
}

std::pair<std::vector<ObjectStatus>, StorageError> FilesystemStorage::List(const std::string& object_prefix) {
  std::vector<ObjectStatus> result_vector;
  const std::string full_prefix = JoinPath(root_directory_, object_prefix);
  StorageError error = ListDirectoryRecursively(root_directory_, full_prefix, &result_vector);
  return std::make_pair(std::move(result_vector), std::move(error));
}

StorageError FilesystemStorage::Delete(const std::string& object_identifier) {
  const std::string full_path = JoinPath(root_directory_, object_identifier);
  if (unlink(full_path.c_str()) == 0) {
    return StorageError::Success();
  }
  return ErrnoToStorageError();
}

std::string FilesystemStorage::JoinPath(const std::string& part_a, const std::string& part_b) {
  if (part_a.empty()) {
    return part_b;
  }
  if (part_b.empty()) {
    return part_a;
  }

  const bool part_a_ends_with_separator = part_a.back() == '/';
  const bool part_b_starts_with_separator = part_b.front() == '/';

  if (!part_a_ends_with_separator && !part_b_starts_with_separator) {
    return part_a + '/' + part_b;
  }

  if (part_a_ends_with_separator && part_b_starts_with_separator) {
    return part_a + part_b.substr(1);
  }

  return part_a + part_b;
}

size_t FilesystemStorage::RootPrefixLength() const {
  // The root directory including the separator JoinPath puts between it and an identifier.
  return JoinPath(root_directory_, "_").size() - 1;
}

std::unique_ptr<ObjectWriter> FilesystemStorage::OpenForWriting(const std::string& object_identifier) {
  return std::make_unique<FilesystemWriter>(JoinPath(root_directory_, object_identifier));
}

std::unique_ptr<ObjectReader> FilesystemStorage::OpenForReading(const std::string& object_identifier) {
  return std::make_unique<FilesystemReader>(JoinPath(root_directory_, object_identifier), RootPrefixLength());
}

}  // namespace seqpart
