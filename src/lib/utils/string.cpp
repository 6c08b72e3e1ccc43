#include "string.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

#include "random.hpp"

namespace seqpart {

std::string TrimSourceFilePath(const std::string& file_path) {
  const auto src_position = file_path.find("/src/");

  return src_position == std::string::npos ? file_path : file_path.substr(src_position + 1);
}

std::string RandomString(const size_t length, const std::string& character_set) {
  auto random_generator = RandomGenerator<std::mt19937>();

  std::uniform_int_distribution<size_t> uniform_distribution(0, character_set.size() - 1);

  std::string random_string(length, '0');
  std::generate(random_string.begin(), random_string.end(),
                [&]() { return character_set[uniform_distribution(random_generator)]; });

  return random_string;
}

std::string ToLowerCase(const std::string& input_string) {
  std::string output_string;
  output_string.resize(input_string.size());
  std::transform(input_string.begin(), input_string.end(), output_string.begin(),
                 [](unsigned char input_string_character) { return std::tolower(input_string_character); });
  return output_string;
}

std::string ToHexString(uint64_t value) {
  std::ostringstream stream;
  stream << std::hex << std::setw(16) << std::setfill('0') << value;
  return stream.str();
}

}  // namespace seqpart
