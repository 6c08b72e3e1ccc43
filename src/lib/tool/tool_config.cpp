#include "tool_config.hpp"

#include <regex>
#include <string>

#include <boost/algorithm/string.hpp>

#include "constants.hpp"
#include "sequence_tool.hpp"
#include "utils/assert.hpp"

namespace seqpart {

ToolType ToolOptionToEnum(const std::string& tool_option) {
  std::smatch match;
  const bool is_match = std::regex_match(tool_option, match, std::regex(kToolRegex));
  AssertInput(is_match && match.size() == 3, "Tool must be specified in format 'action-target'.");
  const std::string action =
      match[1].str().replace(0, 1, boost::to_upper_copy(match[1].str().substr(0, 1))).insert(0, kConstPrefix);
  const std::string target = match[2].str().replace(0, 1, boost::to_upper_copy(match[2].str().substr(0, 1)));
  return magic_enum::enum_cast<ToolType>(action + target).value();
}

cxxopts::Options ConfigureCliOptions() {
  cxxopts::Options cli_options(kProgramName, "Preprocesses and partitions sequence files in remote storage.");
  // General options.
  cli_options.add_options(kHelpOption)("h, help", kHelpHint);
  cli_options.add_options(kToolOption)("t, tool", kToolHint, cxxopts::value<std::string>())(
      "v, verbosity", kVerbosityHint, cxxopts::value<int>()->default_value("0"));
  // Options naming the object, shared by all tools.
  cli_options.add_options("object")("u, uri", kObjectUriHint, cxxopts::value<std::string>())(
      "i, index_uri", kIndexUriHint, cxxopts::value<std::string>());
  // Preprocess-object specific option group.
  cli_options.add_options("preprocess-object")("chunk_size", kChunkSizeHint, cxxopts::value<size_t>())(
      "parallelism", kParallelismHint, cxxopts::value<size_t>()->default_value("0"))(
      "threads", kThreadsHint, cxxopts::value<size_t>())("sentinel", kSentinelHint,
                                                         cxxopts::value<std::string>()->default_value(">"));
  // Partition-object specific option group.
  cli_options.add_options("partition-object")("n, num_chunks", kNumChunksHint, cxxopts::value<int64_t>())(
      "partition_size", kPartitionSizeHint, cxxopts::value<uint64_t>())(
      "s, strategy", kStrategyHint, cxxopts::value<std::string>()->default_value("contiguous"))(
      "count_records", kCountRecordsHint, cxxopts::value<bool>()->default_value("false"));
  return cli_options;
}

}  // namespace seqpart
