#pragma once

#include <string>

namespace seqpart {

/**
 * One-shot GZIP compression through Arrow's codec interface.
 */
std::string Compress(const std::string& to_compress);

/**
 * GZIP does not let Arrow recover the original length, so callers must store @param decompressed_size themselves.
 */
std::string Decompress(const std::string& to_decompress, size_t decompressed_size);

}  // namespace seqpart
