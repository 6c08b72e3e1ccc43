#include "stream.hpp"

#include <algorithm>

namespace seqpart {

DelegateStreamBuffer::DelegateStreamBuffer(ByteBuffer* buffer) { Reset(buffer); }

void DelegateStreamBuffer::Reset(ByteBuffer* buffer) {
  buffer_ = buffer;
  setg(buffer_->CharData(), buffer_->CharData(), buffer_->CharData() + buffer_->Size());
  setp(buffer_->CharData(), buffer_->CharData());
}

std::streamsize DelegateStreamBuffer::xsputn(const char* s, std::streamsize n) {
  const size_t write_offset = pptr() - buffer_->CharData();
  const size_t read_offset = gptr() - buffer_->CharData();
  const size_t resulting_write_offset = write_offset + n;

  if (resulting_write_offset > buffer_->Size()) {
    // Resizing may move the data between external and internal memory, so all pointers are recomputed below.
    buffer_->Resize(resulting_write_offset);
  }

  std::copy_n(s, n, buffer_->CharData() + write_offset);

  setg(buffer_->CharData(), buffer_->CharData() + read_offset, buffer_->CharData() + buffer_->Size());
  setp(buffer_->CharData() + write_offset + n, buffer_->CharData() + buffer_->Size());

  return n;
}

int DelegateStreamBuffer::overflow(int ch) {
  if (ch != traits_type::eof()) {
    const char c = static_cast<char>(ch);
    xsputn(&c, 1);
  }

  return ch;
}

DelegateStreamBuffer::pos_type DelegateStreamBuffer::seekpos(pos_type pos, std::ios::openmode which) {
  const bool is_in = (std::ios::in & which) != 0;
  const bool is_out = (std::ios::out & which) != 0;
  const auto new_position = static_cast<size_t>(pos);
  const size_t max_position = buffer_->Size();

  if (new_position > max_position) {
    return {off_type(-1)};
  }

  if (is_in) {
    setg(buffer_->CharData(), buffer_->CharData() + new_position, buffer_->CharData() + max_position);
  }

  if (is_out) {
    setp(buffer_->CharData() + new_position, buffer_->CharData() + max_position);
  }

  return {off_type(pos)};
}

DelegateStreamBuffer::pos_type DelegateStreamBuffer::seekoff(off_type off, std::ios::seekdir dir,
                                                             std::ios::openmode which) {
  if (dir == std::ios::beg) {
    return seekpos(off, which);
  }
  if (dir == std::ios::end) {
    return seekpos(static_cast<off_type>(buffer_->Size()) + off, which);
  }

  const bool is_in = (std::ios::in & which) != 0;
  const bool is_out = (std::ios::out & which) != 0;
  pos_type result = {off_type(-1)};

  if (dir == std::ios::cur) {
    if (is_in) {
      result = seekpos(gptr() - buffer_->CharData() + off, std::ios::in);
    }
    if (is_out) {
      result = seekpos(pptr() - buffer_->CharData() + off, std::ios::out);
    }
  }
  return result;
}

}  // namespace seqpart
