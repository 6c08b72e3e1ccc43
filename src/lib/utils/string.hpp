#pragma once

#include <cstdint>
#include <string>

namespace seqpart {

// Character sets for randomly generated strings
inline const std::string kCharacterSetUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline const std::string kCharacterSetLower = "abcdefghijklmnopqrstuvwxyz";
inline const std::string kCharacterSetDecimal = "0123456789";

/**
 * Crops @param file_path to ensure readable Assert messages.
 * E.g., "/long/path/1234/src/lib/file.cpp" becomes "src/lib/file.cpp"
 */
std::string TrimSourceFilePath(const std::string& file_path);

/**
 * @return A randomly generated string.
 */
std::string RandomString(const size_t length,
                         const std::string& character_set = kCharacterSetLower + kCharacterSetDecimal);

/**
 * @return The passed string in lowercase characters.
 */
std::string ToLowerCase(const std::string& input_string);

/**
 * @return The zero-padded, 16 character lowercase hex representation of @param value.
 */
std::string ToHexString(uint64_t value);

}  // namespace seqpart
