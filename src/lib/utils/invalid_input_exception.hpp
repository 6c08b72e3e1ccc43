#pragma once

#include <stdexcept>
#include <string>

namespace seqpart {

// Thrown for malformed user input, e.g., command line arguments or locator strings (see AssertInput).
class InvalidInputException : public std::runtime_error {
 public:
  explicit InvalidInputException(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace seqpart
