#pragma once

#include <iostream>
#include <streambuf>

#include "storage/io_handle/byte_buffer.hpp"

namespace seqpart {

/**
 * A DelegateStreamBuffer reads and writes data from and to an externally owned ByteBuffer. It will resize the buffer
 * accordingly. The S3 reader uses it as response stream, so ranged GET bodies land directly in the caller's memory.
 */
class DelegateStreamBuffer : public std::streambuf {
 public:
  DelegateStreamBuffer() = default;

  explicit DelegateStreamBuffer(ByteBuffer* buffer);
  void Reset(ByteBuffer* buffer);

 protected:
  std::streamsize xsputn(const char* s, std::streamsize n) override;
  pos_type seekpos(pos_type pos, std::ios::openmode which = std::ios::in | std::ios::out) override;
  pos_type seekoff(off_type off, std::ios::seekdir dir,
                   std::ios::openmode which = std::ios::in | std::ios::out) override;

  int overflow(int ch = traits_type::eof()) override;

 private:
  ByteBuffer* buffer_ = nullptr;
};

}  // namespace seqpart
