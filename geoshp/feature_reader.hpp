#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/iterator/iterator_facade.hpp>
#include <boost/optional.hpp>

#include "dbase.hpp"
#include "geometry.hpp"
#include "options.hpp"
#include "shape_reader.hpp"
#include "stream_provider.hpp"

namespace geoshp {

struct feature {
  std::size_t ordinal = 0;
  shp::geometry geometry;
  boost::optional<shp::box> bounds;
  dbf::record attributes;
};

class feature_reader;

// Features whose record bounds intersect a query box, in file order.
class feature_iterator :
    public boost::iterator_facade<feature_iterator, const feature,
                                  boost::single_pass_traversal_tag> {
 public:
  feature_iterator() = default;
  feature_iterator(const feature_reader* reader, const shp::box& query,
                   shp::mbr_iterator first);

 private:
  friend class boost::iterator_core_access;

  const feature& dereference() const { return current_; }
  void increment();
  bool equal(const feature_iterator& that) const {
    return records_ == that.records_;
  }
  void satisfy();

  const feature_reader* reader_ = nullptr;
  shp::box query_;
  shp::mbr_iterator records_;
  feature current_;
};

class feature_range {
 public:
  feature_range(const feature_reader* reader, const shp::box& query,
                shp::mbr_range records)
      : reader_(reader), query_(query), records_(std::move(records)) {}

  feature_iterator begin() const {
    return {reader_, query_, records_.begin()};
  }
  feature_iterator end() const { return {}; }

 private:
  const feature_reader* reader_;
  shp::box query_;
  shp::mbr_range records_;
};

// A .shp file joined with its attribute table. Record N of the geometry file
// goes with row N of the table.
class feature_reader {
 public:
  explicit feature_reader(std::shared_ptr<const stream_provider> streams,
                          reader_options options = {});
  explicit feature_reader(const std::string& path,
                          reader_options options = {});
  feature_reader(std::unique_ptr<shp::shape_reader> shapes,
                 std::unique_ptr<dbf::attribute_source> attributes);
  ~feature_reader();

  const shp::file_header& header() const { return shapes_->header(); }
  // Bounds of the whole file, as declared in its header.
  const shp::box& bounds() const { return shapes_->header().bounds; }
  const dbf::field_table& fields() const { return attributes_->fields(); }
  std::size_t record_count() const { return shapes_->record_count(); }

  const shp::shape_reader& shapes() const { return *shapes_; }

  // Lazily reads every feature whose bounds intersect `query`. Null-shape
  // records never match.
  feature_range read_by_bounds(const shp::box& query) const;

  feature read_feature(int64_t ordinal) const;

  void close();
  bool is_closed() const { return shapes_->is_closed(); }

 private:
  friend class feature_iterator;

  feature join(const shp::mbr_info& info) const;

  std::unique_ptr<shp::shape_reader> shapes_;
  std::unique_ptr<dbf::attribute_source> attributes_;
};

} // namespace geoshp
