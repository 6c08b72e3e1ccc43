#pragma once

#include <string>

#include <cxxopts.hpp>
#include <magic_enum/magic_enum.hpp>

namespace seqpart {

enum class ToolType { kPreprocessObject, kPartitionObject };

static constexpr auto kHelpOption = "help";
static constexpr auto kHelpHint = "Print usage";

static constexpr auto kToolOption = "tool";
static constexpr auto kToolHint = "Name of the tool, i.e., 'preprocess-object' or 'partition-object'";
static constexpr auto kToolRegex = "([a-z]*)-([a-z]*)";

static constexpr auto kVerbosityOption = "verbosity";
static constexpr auto kVerbosityHint = "0 logs warnings, 1 progress, 2 everything";

static constexpr auto kProgramName = "seqpart";

/**
 * Transforms user input, e.g., 'partition-object' to 'kPartitionObject' and returns the enum value. Throws
 * std::bad_optional_access for well-formed names of unknown tools.
 */
ToolType ToolOptionToEnum(const std::string& tool_option);

/**
 * Defines groups of valid CLI options which can be passed to the seqpart binary.
 */
cxxopts::Options ConfigureCliOptions();

}  // namespace seqpart
