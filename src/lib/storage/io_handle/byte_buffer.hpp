#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <vector>

namespace seqpart {

/**
 * ByteBuffer is the target of ObjectReader::Read. It either owns its memory or writes into caller-provided memory of a
 * fixed capacity. A view over external memory switches to internal storage (copying what was written so far) when it is
 * resized beyond the external capacity, and switches back when it shrinks again.
 */
class ByteBuffer {
 public:
  explicit ByteBuffer(size_t initial_capacity = 0);
  ByteBuffer(void* memory, size_t capacity);

  uint8_t* Data();
  const uint8_t* Data() const;
  char* CharData();
  size_t Size() const;
  void Resize(size_t new_size);

  /**
   * @return true if the current contents live in the caller-provided memory.
   */
  bool IsExternal() const { return !internal_data_.has_value(); }

  std::string_view View() const;

 private:
  void MoveBackToExternalData(size_t new_size);

  uint8_t* external_data_;
  size_t external_data_capacity_;
  size_t external_data_size_;
  std::optional<std::vector<uint8_t>> internal_data_;
};

}  // namespace seqpart
