#include "byte_buffer.hpp"

#include <algorithm>

namespace seqpart {

ByteBuffer::ByteBuffer(void* memory, size_t capacity)
    : external_data_(reinterpret_cast<uint8_t*>(memory)), external_data_capacity_(capacity), external_data_size_(0) {}

ByteBuffer::ByteBuffer(size_t initial_capacity)
    : external_data_(nullptr), external_data_capacity_(0), external_data_size_(0) {
  internal_data_.emplace();
  internal_data_->reserve(initial_capacity);
}

uint8_t* ByteBuffer::Data() { return internal_data_ ? internal_data_->data() : external_data_; }

const uint8_t* ByteBuffer::Data() const { return internal_data_ ? internal_data_->data() : external_data_; }

char* ByteBuffer::CharData() { return reinterpret_cast<char*>(Data()); }

size_t ByteBuffer::Size() const { return internal_data_ ? internal_data_->size() : external_data_size_; }

std::string_view ByteBuffer::View() const { return {reinterpret_cast<const char*>(Data()), Size()}; }

void ByteBuffer::Resize(size_t new_size) {
  if (!internal_data_) {
    if (new_size <= external_data_capacity_) {
      external_data_size_ = new_size;
      return;
    }

    internal_data_.emplace(new_size);
    std::copy_n(external_data_, external_data_size_, internal_data_->data());
    return;
  }

  if (external_data_ != nullptr && new_size <= external_data_capacity_) {
    MoveBackToExternalData(new_size);
    return;
  }

  if (new_size > internal_data_->capacity()) {
    internal_data_->reserve(std::max<size_t>(new_size, internal_data_->capacity() * 2));
  }
  internal_data_->resize(new_size);
}

void ByteBuffer::MoveBackToExternalData(size_t new_size) {
  std::copy_n(internal_data_->data(), new_size, external_data_);
  external_data_size_ = new_size;
  internal_data_.reset();
}

}  // namespace seqpart
