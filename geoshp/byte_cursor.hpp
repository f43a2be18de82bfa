#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <boost/endian/arithmetic.hpp>

namespace geoshp {

// Positioned reads over a seekable stream. Shapefiles mix big and little
// endian words, so both flavours are exposed. Not thread-safe; callers that
// share a cursor serialize seek+read pairs themselves.
class byte_cursor {
 public:
  explicit byte_cursor(std::unique_ptr<std::istream> stream);

  byte_cursor(const byte_cursor&) = delete;
  byte_cursor& operator=(const byte_cursor&) = delete;

  int64_t size() const { return size_; }
  int64_t position() const;
  bool is_open() const { return stream_ != nullptr; }

  void seek(int64_t offset);
  void skip(int64_t count);

  int32_t read_int32_big();
  int32_t read_int32_little();
  double read_double_little();
  std::vector<char> read_bytes(std::size_t count);
  void read_bytes(char* out, std::size_t count);

  // Reads one packed layout struct made of boost::endian types.
  template <class T>
  T read() {
    T value;
    read_bytes(reinterpret_cast<char*>(&value), sizeof(T));
    return value;
  }

  void close();

 private:
  std::istream& stream() const;

  std::unique_ptr<std::istream> stream_;
  int64_t size_ = 0;
};

} // namespace geoshp
