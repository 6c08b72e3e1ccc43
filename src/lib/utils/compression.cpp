#include "compression.hpp"

#include <memory>

#include <arrow/util/compression.h>

#include "assert.hpp"

namespace seqpart {

namespace {

constexpr arrow::Compression::type kCompressionType = arrow::Compression::type::GZIP;

std::unique_ptr<arrow::util::Codec> CreateCodec() {
  auto codec_result = arrow::util::Codec::Create(kCompressionType);
  Assert(codec_result.ok(), "Could not create codec: " + codec_result.status().ToString());
  return std::move(*codec_result);
}

}  // namespace

std::string Compress(const std::string& to_compress) {
  const std::unique_ptr<arrow::util::Codec> codec = CreateCodec();

  const auto* const input_data = reinterpret_cast<const uint8_t*>(to_compress.data());
  const int64_t max_compressed_size = codec->MaxCompressedLen(static_cast<int64_t>(to_compress.size()), input_data);

  std::string output;
  output.resize(max_compressed_size);
  auto* output_data = reinterpret_cast<uint8_t*>(output.data());

  auto compression_result =
      codec->Compress(static_cast<int64_t>(to_compress.size()), input_data, max_compressed_size, output_data);
  Assert(compression_result.ok(), "Could not compress data: " + compression_result.status().ToString());
  output.resize(*compression_result);

  return output;
}

std::string Decompress(const std::string& to_decompress, size_t decompressed_size) {
  if (decompressed_size == 0) {
    return {};
  }

  const std::unique_ptr<arrow::util::Codec> codec = CreateCodec();
  const auto* const input_data = reinterpret_cast<const uint8_t*>(to_decompress.data());

  std::string output;
  output.resize(decompressed_size);
  auto* output_data = reinterpret_cast<uint8_t*>(output.data());

  const auto decompression_result = codec->Decompress(static_cast<int64_t>(to_decompress.size()), input_data,
                                                      static_cast<int64_t>(decompressed_size), output_data);
  Assert(decompression_result.ok(), "Decompression failed: " + decompression_result.status().ToString());
  Assert(static_cast<size_t>(*decompression_result) == decompressed_size,
         "Decompressed size does not match the recorded size.");
  return output;
}

}  // namespace seqpart
