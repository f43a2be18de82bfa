#include "byte_cursor.hpp"

#include "error.hpp"

namespace geoshp {

using namespace boost::endian;

byte_cursor::byte_cursor(std::unique_ptr<std::istream> stream)
    : stream_(std::move(stream)) {
  if (!stream_ || !*stream_) {
    throw io_error("cannot read from stream");
  }
  stream_->seekg(0, std::ios::end);
  size_ = static_cast<int64_t>(stream_->tellg());
  stream_->seekg(0, std::ios::beg);
  if (!*stream_ || size_ < 0) {
    throw io_error("stream is not seekable");
  }
}

int64_t byte_cursor::position() const {
  return static_cast<int64_t>(stream().tellg());
}

void byte_cursor::seek(int64_t offset) {
  if (offset < 0 || offset > size_) {
    throw io_error("seek to " + std::to_string(offset) +
                   " outside stream of " + std::to_string(size_) + " bytes");
  }
  std::istream& in = stream();
  in.clear();
  in.seekg(offset, std::ios::beg);
  if (!in) {
    throw io_error("seek to " + std::to_string(offset) + " failed");
  }
}

void byte_cursor::skip(int64_t count) {
  seek(position() + count);
}

int32_t byte_cursor::read_int32_big() {
  return read<big_int32_t>();
}

int32_t byte_cursor::read_int32_little() {
  return read<little_int32_t>();
}

double byte_cursor::read_double_little() {
  return read<little_float64_t>();
}

std::vector<char> byte_cursor::read_bytes(std::size_t count) {
  std::vector<char> bytes(count);
  if (count != 0) {
    read_bytes(bytes.data(), count);
  }
  return bytes;
}

void byte_cursor::read_bytes(char* out, std::size_t count) {
  std::istream& in = stream();
  int64_t at = static_cast<int64_t>(in.tellg());
  if (at < 0 || int64_t(count) > size_ - at) {
    throw io_error("read of " + std::to_string(count) + " bytes at " +
                   std::to_string(at) + " runs past end of stream");
  }
  in.read(out, static_cast<std::streamsize>(count));
  if (in.gcount() != static_cast<std::streamsize>(count)) {
    throw io_error("short read at " + std::to_string(at));
  }
}

void byte_cursor::close() {
  stream_.reset();
}

std::istream& byte_cursor::stream() const {
  if (!stream_) {
    throw io_error("stream is closed");
  }
  return *stream_;
}

} // namespace geoshp
