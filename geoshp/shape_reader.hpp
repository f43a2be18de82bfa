#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/iterator/iterator_facade.hpp>

#include "geometry.hpp"
#include "offset_index.hpp"
#include "options.hpp"
#include "shape_decoder.hpp"
#include "shapefile.hpp"
#include "stream_provider.hpp"

namespace geoshp {

class byte_cursor;

namespace shp {

class shape_reader;

// Decodes one record per dereference; nothing is cached between steps.
class shape_iterator :
    public boost::iterator_facade<shape_iterator, geometry,
                                  boost::forward_traversal_tag,
                                  geometry> {
 public:
  shape_iterator() = default;
  shape_iterator(const shape_reader* reader,
                 std::shared_ptr<const offset_index::table> offsets,
                 std::size_t position)
      : reader_(reader), offsets_(std::move(offsets)), position_(position) {}

 private:
  friend class boost::iterator_core_access;

  geometry dereference() const;
  void increment() { ++position_; }
  bool equal(const shape_iterator& that) const {
    return position_ == that.position_;
  }

  const shape_reader* reader_ = nullptr;
  std::shared_ptr<const offset_index::table> offsets_;
  std::size_t position_ = 0;
};

class shape_range {
 public:
  shape_range(const shape_reader* reader,
              std::shared_ptr<const offset_index::table> offsets)
      : reader_(reader), offsets_(std::move(offsets)) {}

  shape_iterator begin() const { return {reader_, offsets_, 0}; }
  shape_iterator end() const { return {reader_, offsets_, offsets_->size()}; }
  std::size_t size() const { return offsets_->size(); }

 private:
  const shape_reader* reader_;
  std::shared_ptr<const offset_index::table> offsets_;
};

// Single pass: advancing any copy advances the shared scanner.
class mbr_iterator :
    public boost::iterator_facade<mbr_iterator, const mbr_info,
                                  boost::single_pass_traversal_tag> {
 public:
  mbr_iterator() = default;
  explicit mbr_iterator(std::shared_ptr<record_scanner> scanner);

 private:
  friend class boost::iterator_core_access;

  const mbr_info& dereference() const { return current_; }
  void increment();
  bool equal(const mbr_iterator& that) const {
    return scanner_ == that.scanner_ &&
           (scanner_ == nullptr || current_.ordinal == that.current_.ordinal);
  }

  std::shared_ptr<record_scanner> scanner_;
  mbr_info current_;
};

class mbr_range {
 public:
  explicit mbr_range(std::shared_ptr<record_scanner> scanner)
      : scanner_(std::move(scanner)) {}

  mbr_iterator begin() const { return mbr_iterator(scanner_); }
  mbr_iterator end() const { return {}; }

 private:
  std::shared_ptr<record_scanner> scanner_;
};

// Random access to the geometries of a .shp file.
//
// The header is parsed on construction; the offset index is built on the
// first call that needs it. Reads may run concurrently from several threads:
// positioned reads share one stream handle under a lock, while index builds
// and bounding box scans open their own. close() must not race with reads.
// Ranges returned by the read_* calls refer to the reader and must not
// outlive it.
class shape_reader {
 public:
  explicit shape_reader(std::shared_ptr<const stream_provider> streams,
                        reader_options options = {});
  explicit shape_reader(const std::string& path, reader_options options = {});
  ~shape_reader();

  shape_reader(const shape_reader&) = delete;
  shape_reader& operator=(const shape_reader&) = delete;

  const file_header& header() const { return header_; }

  std::size_t record_count() const;
  std::shared_ptr<const offset_index::table> offsets() const;

  shape_range read_all_shapes() const;
  geometry read_shape_at_index(int64_t index) const;
  // `offset` is the position of a record header, as found in offsets() or
  // read_bounding_boxes(). The index is not consulted.
  geometry read_shape_at_offset(int64_t offset) const;
  // Streams every record's bounds from a fresh handle.
  mbr_range read_bounding_boxes() const;

  // Releases the stream handle. Idempotent; geometries already returned
  // stay valid, every later read throws reader_closed.
  void close();
  bool is_closed() const { return closed_; }

 private:
  void check_open() const;
  std::unique_ptr<byte_cursor> open_cursor() const;

  std::shared_ptr<const stream_provider> streams_;
  std::unique_ptr<byte_cursor> shape_;
  mutable std::mutex shape_mutex_;
  file_header header_;
  shape_decoder decoder_;
  offset_index index_;
  bool closed_ = false;
};

} // namespace shp

} // namespace geoshp
