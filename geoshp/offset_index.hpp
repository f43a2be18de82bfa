#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "shape_decoder.hpp"
#include "shapefile.hpp"

namespace geoshp {

class byte_cursor;

namespace shp {

// Walks record headers from the end of the file header to the declared file
// length, reading only as much of each payload as its bounding box needs.
class record_scanner {
 public:
  record_scanner(std::unique_ptr<byte_cursor> in,
                 const file_header& header,
                 const shape_decoder& decoder);
  ~record_scanner();

  // False once the declared file length is reached.
  bool next(mbr_info& out);

 private:
  std::unique_ptr<byte_cursor> in_;
  shape_decoder decoder_;
  int64_t end_;
  int64_t position_ = header_length;
  std::size_t ordinal_ = 0;
};

// Offsets and bounds of every record, in file order. Built on first use from
// a dedicated cursor, at most once per instance; a failed build is not kept
// and the next call starts over.
class offset_index {
 public:
  using table = std::vector<record_offset>;
  using cursor_factory = std::function<std::unique_ptr<byte_cursor>()>;

  offset_index(cursor_factory open,
               const file_header& header,
               const shape_decoder& decoder);

  void ensure_built() const { get(); }
  bool is_built() const;

  std::size_t size() const { return get()->size(); }

  // Throws index_out_of_range outside [0, size()).
  record_offset offset_at(int64_t ordinal) const;

  std::shared_ptr<const table> all() const { return get(); }

 private:
  std::shared_ptr<const table> get() const;
  std::shared_ptr<const table> build() const;

  cursor_factory open_;
  file_header header_;
  shape_decoder decoder_;

  mutable std::mutex build_mutex_;
  // Written once under build_mutex_, read with std::atomic_load.
  mutable std::shared_ptr<const table> table_;
};

} // namespace shp

} // namespace geoshp
