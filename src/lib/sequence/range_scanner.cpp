#include "range_scanner.hpp"

#include <algorithm>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace seqpart {

namespace {

bool IsWhitespace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f'; }

// Returns the header line starting at `line_start` (relative to `data`), without its line break. Extends `data` by
// reading ahead from the handle until the line break or the end of the object is found.
std::string_view CompleteHeaderLine(const ObjectHandle& handle, ByteOffset data_offset, size_t line_start,
                                    std::string* data) {
  size_t line_end = data->find('\n', line_start);
  while (line_end == std::string::npos) {
    const ByteOffset read_from = data_offset + data->size();
    if (read_from >= handle.Size()) {
      line_end = data->size();
      break;
    }

    const ByteOffset read_until = std::min<ByteOffset>(read_from + kHeaderLookaheadBytes, handle.Size());
    const size_t search_from = data->size();
    data->append(handle.ReadRange(read_from, read_until));
    line_end = data->find('\n', search_from);
  }

  return std::string_view(*data).substr(line_start, line_end - line_start);
}

}  // namespace

std::string ParseRecordIdentifier(std::string_view header_line) {
  DebugAssert(!header_line.empty(), "A header line contains at least the sentinel.");
  const std::string_view text = header_line.substr(1);
  const auto identifier_end = std::ranges::find_if(text, IsWhitespace);
  return {text.begin(), identifier_end};
}

RangeScanResult ScanRange(const ObjectHandle& handle, const ByteRange& range, char record_sentinel) {
  Assert(range.end_byte <= handle.Size(), "Scan range exceeds the object.");

  RangeScanResult result;
  result.summary.range = range;
  if (range.IsEmpty()) {
    return result;
  }

  // The byte before the range decides whether the first byte of the range starts a line.
  const ByteOffset data_offset = range.first_byte == 0 ? 0 : range.first_byte - 1;
  std::string data = handle.ReadRange(data_offset, range.end_byte);
  const size_t range_begin = range.first_byte - data_offset;
  const size_t range_end = range.end_byte - data_offset;

  bool at_line_start = range.first_byte == 0 || data[0] == '\n';
  for (size_t position = range_begin; position < range_end; ++position) {
    const char c = data[position];
    if (at_line_start && c == record_sentinel) {
      const std::string_view header_line = CompleteHeaderLine(handle, data_offset, position, &data);
      result.headers.push_back({data_offset + position, ParseRecordIdentifier(header_line)});
      // The rest of the header line cannot contain another record start.
      position += header_line.size() - 1;
      at_line_start = false;
      continue;
    }
    at_line_start = c == '\n';
  }

  result.summary.num_record_headers = result.headers.size();
  result.summary.continues_previous_record =
      range.first_byte > 0 && (result.headers.empty() || result.headers.front().offset != range.first_byte);
  return result;
}

}  // namespace seqpart
