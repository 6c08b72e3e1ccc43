#pragma once

#include <string>

#include <magic_enum/magic_enum.hpp>

namespace seqpart {

enum class StorageErrorType {
  kNoError = 0,
  kAlreadyExist,
  kNotFound,
  kInternalError,
  kInvalidArgument,
  kInvalidState,
  kIOError,
  kOperationNotSupported,
  kPermissionDenied,
  kTemporary,
  kUninitialized,
  kUnknown
};

/**
 * Result of a storage backend operation. Backends never throw; they return a StorageError, which converts to `true`
 * if the operation failed.
 */
class StorageError {
 public:
  static StorageError Success() { return StorageError(StorageErrorType::kNoError); }

  explicit StorageError(StorageErrorType type) : type_(type) {}
  StorageError(StorageErrorType type, std::string message) : type_(type), message_(std::move(message)) {}

  [[nodiscard]] StorageErrorType GetType() const { return type_; }
  [[nodiscard]] const std::string& GetMessage() const { return message_; }

  bool IsError() const { return type_ != StorageErrorType::kNoError; }
  explicit operator bool() const { return IsError(); }

  std::string ToString() const {
    const std::string type_name(magic_enum::enum_name(type_));
    return message_.empty() ? type_name : type_name + ": " + message_;
  }

 private:
  StorageErrorType type_;
  std::string message_;
};

}  // namespace seqpart
