#pragma once

#include <stdexcept>
#include <string>

#include "storage/backend/errors.hpp"

namespace seqpart {

enum class ErrorType { kNotFound, kIOError, kFormatError, kPreconditionError, kInvalidArgument, kRangeError };

/**
 * Base of all exceptions thrown by the sequence data source. The message is prefixed with the name of the error type.
 */
class SeqpartError : public std::runtime_error {
 public:
  SeqpartError(ErrorType type, const std::string& message);

  ErrorType GetType() const { return type_; }

 private:
  ErrorType type_;
};

// The object does not exist in its storage.
class NotFoundError : public SeqpartError {
 public:
  explicit NotFoundError(const std::string& message) : SeqpartError(ErrorType::kNotFound, message) {}
};

// A storage operation failed or returned fewer bytes than requested. Not retried.
class IOError : public SeqpartError {
 public:
  explicit IOError(const std::string& message) : SeqpartError(ErrorType::kIOError, message) {}
};

// The object is not a record-oriented sequence file, or a persisted document is malformed.
class FormatError : public SeqpartError {
 public:
  explicit FormatError(const std::string& message) : SeqpartError(ErrorType::kFormatError, message) {}
};

// An operation requires a state that has not been reached yet, e.g., attributes before preprocessing.
class PreconditionError : public SeqpartError {
 public:
  explicit PreconditionError(const std::string& message) : SeqpartError(ErrorType::kPreconditionError, message) {}
};

class InvalidArgumentError : public SeqpartError {
 public:
  explicit InvalidArgumentError(const std::string& message) : SeqpartError(ErrorType::kInvalidArgument, message) {}
};

// A byte range lies outside of an object.
class RangeError : public SeqpartError {
 public:
  explicit RangeError(const std::string& message) : SeqpartError(ErrorType::kRangeError, message) {}
};

/**
 * Translates a failed storage operation into the exception taxonomy: kNotFound becomes a NotFoundError, everything else
 * an IOError. Does nothing if @param error is not an error.
 */
void ThrowIfStorageError(const StorageError& error, const std::string& context);

}  // namespace seqpart
