#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace geoshp {

class error : public std::runtime_error {
 public:
  explicit error(const std::string& what) : std::runtime_error(what) {}
};

// Stream failures: closed, exhausted or short reads.
class io_error : public error {
 public:
  explicit io_error(const std::string& what) : error(what) {}
};

class malformed_header : public error {
 public:
  explicit malformed_header(const std::string& what) : error(what) {}
};

class malformed_record : public error {
 public:
  explicit malformed_record(const std::string& what) : error(what) {}
};

// The payload ends before the structural fields of its geometry do.
class truncated_record : public error {
 public:
  explicit truncated_record(const std::string& what) : error(what) {}
};

class unsupported_shape_type : public error {
 public:
  explicit unsupported_shape_type(int32_t code)
      : error("unsupported shape type " + std::to_string(code)),
        code_(code) {}

  int32_t code() const { return code_; }

 private:
  int32_t code_;
};

class index_out_of_range : public error {
 public:
  explicit index_out_of_range(const std::string& what) : error(what) {}
};

class invalid_offset : public error {
 public:
  explicit invalid_offset(const std::string& what) : error(what) {}
};

// Any operation on a reader after close().
class reader_closed : public error {
 public:
  explicit reader_closed(const std::string& what) : error(what) {}
};

} // namespace geoshp
