#include "sequence_test_utils.hpp"

#include <random>

#include "utils/assert.hpp"
#include "utils/random.hpp"

namespace seqpart {

namespace {

const std::string kBases = "ACGT";

void AppendWrappedBases(size_t num_bases, size_t line_width, std::mt19937* generator, std::string* output) {
  std::uniform_int_distribution<size_t> distribution(0, kBases.size() - 1);
  for (size_t i = 0; i < num_bases; ++i) {
    output->push_back(kBases[distribution(*generator)]);
    if ((i + 1) % line_width == 0 || i + 1 == num_bases) {
      output->push_back('\n');
    }
  }
}

}  // namespace

std::string GenerateSequenceFile(const std::vector<SyntheticRecord>& records, size_t line_width,
                                 const std::string& preamble, uint32_t seed) {
  Assert(line_width > 0, "Lines need at least one base.");
  auto generator = RandomGenerator<std::mt19937>(seed);

  std::string content = preamble;
  for (const auto& record : records) {
    content += ">" + record.header + "\n";
    AppendWrappedBases(record.num_bases, line_width, &generator, &content);
  }
  return content;
}

std::string GenerateSingleRecordFile(size_t total_size_bytes, const std::string& header) {
  const size_t header_size = header.size() + 2;
  Assert(total_size_bytes > header_size + 1, "The file must be larger than its header line.");

  // Every base line ends with a line break, so n bases on lines of 60 take n + ceil(n / 60) bytes.
  constexpr size_t kLineWidth = 60;
  const size_t body_size = total_size_bytes - header_size;
  size_t num_bases = body_size - (body_size + kLineWidth) / (kLineWidth + 1);
  while (num_bases + (num_bases + kLineWidth - 1) / kLineWidth < body_size) {
    ++num_bases;
  }
  while (num_bases + (num_bases + kLineWidth - 1) / kLineWidth > body_size) {
    --num_bases;
  }

  std::string content = GenerateSequenceFile({{header, num_bases}}, kLineWidth);
  // Pad with a final line of bases when rounding left a gap.
  while (content.size() < total_size_bytes) {
    content.insert(content.size() - 1, "N");
  }
  Assert(content.size() == total_size_bytes, "Generated file has an unexpected size.");
  return content;
}

std::vector<ByteOffset> FindHeaderOffsets(const std::string& content, char record_sentinel) {
  std::vector<ByteOffset> offsets;
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == record_sentinel && (i == 0 || content[i - 1] == '\n')) {
      offsets.push_back(i);
    }
  }
  return offsets;
}

ObjectLocator MockLocator(const std::string& key) { return {StorageBackend::kFilesystem, kMockContainer, key}; }

std::shared_ptr<const ObjectHandle> PutObject(const std::shared_ptr<MockStorage>& storage, const std::string& key,
                                              const std::string& content) {
  const StorageError error = storage->WriteObject(key, content);
  Assert(!error, "Could not write test object: " + error.ToString());
  return ObjectHandle::Resolve(storage, MockLocator(key));
}

StorageResolver FixedStorageResolver(std::shared_ptr<Storage> storage) {
  return [storage = std::move(storage)](const ObjectLocator& /*locator*/) { return storage; };
}

}  // namespace seqpart
