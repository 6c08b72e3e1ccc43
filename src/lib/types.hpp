#pragma once

#include <cstdint>
#include <limits>
#include <ostream>

#include <aws/core/utils/json/JsonSerializer.h>

namespace seqpart {

class Noncopyable {
 public:
  Noncopyable() = default;
  Noncopyable(const Noncopyable&) = delete;
  Noncopyable(Noncopyable&&) noexcept = default;

  Noncopyable& operator=(Noncopyable&&) noexcept = default;
  const Noncopyable& operator=(const Noncopyable&) = delete;

  ~Noncopyable() = default;
};

using TaskId = uint32_t;
using ByteOffset = uint64_t;

inline constexpr TaskId kInvalidTaskId = std::numeric_limits<TaskId>::max();

/**
 * A half-open byte range [first_byte, end_byte) of an object. Empty ranges (first_byte == end_byte) are legal and occur
 * when more partitions than bytes are requested.
 */
struct ByteRange {
  ByteOffset first_byte = 0;
  ByteOffset end_byte = 0;

  ByteOffset Size() const { return end_byte - first_byte; }
  bool IsEmpty() const { return first_byte == end_byte; }
  bool Contains(ByteOffset offset) const { return offset >= first_byte && offset < end_byte; }

  bool operator==(const ByteRange& other) const {
    return first_byte == other.first_byte && end_byte == other.end_byte;
  }

  Aws::Utils::Json::JsonValue ToJson() const {
    return Aws::Utils::Json::JsonValue()
        .WithInt64("first_byte", static_cast<int64_t>(first_byte))
        .WithInt64("end_byte", static_cast<int64_t>(end_byte));
  }

  static ByteRange FromJson(const Aws::Utils::Json::JsonView& json) {
    return {static_cast<ByteOffset>(json.GetInt64("first_byte")), static_cast<ByteOffset>(json.GetInt64("end_byte"))};
  }
};

inline std::ostream& operator<<(std::ostream& stream, const ByteRange& range) {
  stream << "[" << range.first_byte << ", " << range.end_byte << ")";
  return stream;
}

}  // namespace seqpart
