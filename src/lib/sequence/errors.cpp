#include "errors.hpp"

#include <magic_enum/magic_enum.hpp>

namespace seqpart {

SeqpartError::SeqpartError(ErrorType type, const std::string& message)
    : std::runtime_error(std::string(magic_enum::enum_name(type)) + ": " + message), type_(type) {}

void ThrowIfStorageError(const StorageError& error, const std::string& context) {
  if (!error) {
    return;
  }

  if (error.GetType() == StorageErrorType::kNotFound) {
    throw NotFoundError(context + " (" + error.ToString() + ")");
  }
  throw IOError(context + " (" + error.ToString() + ")");
}

}  // namespace seqpart
