#include "shape_reader.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>
#include <thread>

#include "byte_cursor.hpp"
#include "error.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE shape_reader_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;
using shp::shape_type;

namespace {

// Serves fixed bytes per open call, counting opens of the shape stream.
class scripted_provider : public stream_provider {
 public:
  explicit scripted_provider(std::vector<std::string> shapes)
      : shapes_(std::move(shapes)) {}

  bool has(stream_role role) const override {
    return role == stream_role::shape;
  }
  std::unique_ptr<std::istream> open_read(stream_role role) const override {
    const std::size_t n = opens_++;
    memory_stream_provider bytes;
    bytes.set(role, shapes_[std::min(n, shapes_.size() - 1)]);
    return bytes.open_read(role);
  }

  int opens() const { return int(opens_); }

 private:
  std::vector<std::string> shapes_;
  mutable std::atomic<std::size_t> opens_{0};
};

std::shared_ptr<stream_provider> provider_of(const std::string& shp) {
  std::shared_ptr<memory_stream_provider> streams =
    std::make_shared<memory_stream_provider>();
  streams->set(stream_role::shape, shp);
  return streams;
}

const std::vector<xy> square = {{0, 0}, {0, 10}, {10, 10}, {10, 0}, {0, 0}};
const std::vector<xy> triangle = {{20, 20}, {25, 30}, {30, 20}, {20, 20}};

// Polygon file of three records, the second a null shape.
shapefile_builder polygon_file() {
  shapefile_builder file(shape_type::polygon);
  file.add_poly({0}, square)
      .add_null()
      .add_poly({0}, triangle)
      .bounds(0, 0, 30, 30);
  return file;
}

shapefile_builder line_file(int records) {
  shapefile_builder file(shape_type::polyline);
  for (int i = 0; i < records; ++i) {
    const double d = i;
    file.add_poly({0, 2}, {{d, d}, {d + 1, d}, {d, d + 2}, {d + 3, d + 3}});
  }
  return file;
}

} // namespace

BOOST_AUTO_TEST_CASE( offset_index_builds_on_demand ) {
  const std::string bytes = line_file(3).bytes();
  int opens = 0;
  auto open = [&bytes, &opens] {
    ++opens;
    return std::unique_ptr<byte_cursor>(new byte_cursor(
      std::unique_ptr<std::istream>(new std::istringstream(bytes))));
  };
  const shp::file_header header = shp::read_header(*open());
  shp::offset_index index(open, header, shp::shape_decoder(header.type));
  BOOST_CHECK(!index.is_built());
  BOOST_CHECK_EQUAL(opens, 1);

  index.ensure_built();
  BOOST_CHECK(index.is_built());
  BOOST_CHECK_EQUAL(opens, 2);
  index.ensure_built();
  BOOST_CHECK_EQUAL(index.size(), 3u);
  BOOST_CHECK(index.all() == index.all());
  BOOST_CHECK_EQUAL(index.offset_at(2).number, 3);
  BOOST_CHECK_THROW(index.offset_at(3), geoshp::index_out_of_range);
  BOOST_CHECK_EQUAL(opens, 2);
}

BOOST_AUTO_TEST_CASE( reads_all_shapes_in_file_order ) {
  const shapefile_builder file = polygon_file();
  shp::shape_reader in(provider_of(file.bytes()));

  BOOST_CHECK(in.header().type == shape_type::polygon);
  BOOST_CHECK_EQUAL(in.record_count(), 3u);

  std::vector<shp::geometry> shapes;
  for (const shp::geometry& g : in.read_all_shapes()) {
    shapes.push_back(g);
  }
  BOOST_REQUIRE_EQUAL(shapes.size(), 3u);
  BOOST_CHECK(boost::get<shp::polygon>(&shapes[0]) != nullptr);
  BOOST_CHECK(shp::is_null(shapes[1]));
  BOOST_CHECK_EQUAL(boost::get<shp::polygon>(shapes[2]).rings[0].size(), 4u);

  for (std::size_t i = 0; i < shapes.size(); ++i) {
    BOOST_CHECK(shapes[i] == in.read_shape_at_index(int64_t(i)));
  }
}

BOOST_AUTO_TEST_CASE( read_all_shapes_is_restartable ) {
  shp::shape_reader in(provider_of(line_file(5).bytes()));
  const shp::shape_range shapes = in.read_all_shapes();
  BOOST_CHECK_EQUAL(std::distance(shapes.begin(), shapes.end()), 5);
  BOOST_CHECK_EQUAL(std::distance(shapes.begin(), shapes.end()), 5);
  BOOST_CHECK(*in.read_all_shapes().begin() == *shapes.begin());
}

BOOST_AUTO_TEST_CASE( index_and_offset_reads_agree ) {
  const shapefile_builder file = line_file(8);
  shp::shape_reader in(provider_of(file.bytes()));
  std::shared_ptr<const shp::offset_index::table> offsets = in.offsets();

  BOOST_REQUIRE_EQUAL(offsets->size(), 8u);
  for (std::size_t i = 0; i < offsets->size(); ++i) {
    const shp::record_offset& r = (*offsets)[i];
    BOOST_CHECK_EQUAL(r.offset, file.offsets()[i]);
    BOOST_CHECK_EQUAL(r.number, int32_t(i + 1));
    BOOST_CHECK_GE(r.offset, shp::header_length);
    BOOST_CHECK_LT(r.offset, in.header().file_length);
    BOOST_CHECK(in.read_shape_at_index(int64_t(i)) ==
                in.read_shape_at_offset(r.offset));
  }
}

BOOST_AUTO_TEST_CASE( offset_index_keeps_record_bounds ) {
  shp::shape_reader in(provider_of(polygon_file().bytes()));
  std::shared_ptr<const shp::offset_index::table> offsets = in.offsets();
  BOOST_REQUIRE_EQUAL(offsets->size(), 3u);
  BOOST_REQUIRE((*offsets)[0].bounds);
  BOOST_CHECK_EQUAL((*offsets)[0].bounds->max_corner().x(), 10);
  BOOST_CHECK(!(*offsets)[1].bounds);
  BOOST_REQUIRE((*offsets)[2].bounds);
  BOOST_CHECK_EQUAL((*offsets)[2].bounds->min_corner().y(), 20);
}

BOOST_AUTO_TEST_CASE( index_bounds_are_checked ) {
  shp::shape_reader in(provider_of(polygon_file().bytes()));
  BOOST_CHECK_THROW(in.read_shape_at_index(-1), geoshp::index_out_of_range);
  BOOST_CHECK_THROW(in.read_shape_at_index(3), geoshp::index_out_of_range);
  BOOST_CHECK(shp::is_null(in.read_shape_at_index(1)));
}

BOOST_AUTO_TEST_CASE( invalid_offsets ) {
  const shapefile_builder file = polygon_file();
  shp::shape_reader in(provider_of(file.bytes()));
  BOOST_CHECK_THROW(in.read_shape_at_offset(50), invalid_offset);
  BOOST_CHECK_THROW(in.read_shape_at_offset(99), invalid_offset);
  BOOST_CHECK_THROW(in.read_shape_at_offset(file.file_length()), invalid_offset);
  BOOST_CHECK(shp::is_null(in.read_shape_at_offset(file.offsets()[1])));
}

BOOST_AUTO_TEST_CASE( offset_reads_bypass_the_index ) {
  const shapefile_builder file = polygon_file();
  std::shared_ptr<scripted_provider> streams =
    std::make_shared<scripted_provider>(std::vector<std::string>{file.bytes()});
  shp::shape_reader in(streams);
  BOOST_CHECK_EQUAL(streams->opens(), 1);

  const shp::geometry g = in.read_shape_at_offset(file.offsets()[2]);
  BOOST_CHECK_EQUAL(shp::num_points(g), 4u);
  BOOST_CHECK_EQUAL(streams->opens(), 1);

  in.read_shape_at_index(0);
  BOOST_CHECK_EQUAL(streams->opens(), 2);
}

BOOST_AUTO_TEST_CASE( reads_bounding_boxes_without_the_index ) {
  shp::shape_reader in(provider_of(polygon_file().bytes()));
  std::vector<shp::mbr_info> boxes;
  for (const shp::mbr_info& info : in.read_bounding_boxes()) {
    boxes.push_back(info);
  }
  BOOST_REQUIRE_EQUAL(boxes.size(), 3u);
  for (std::size_t i = 0; i < boxes.size(); ++i) {
    BOOST_CHECK_EQUAL(boxes[i].ordinal, i);
  }
  BOOST_CHECK(boxes[0].record.bounds);
  BOOST_CHECK(!boxes[1].record.bounds);
  BOOST_CHECK(shp::same(*boxes[2].record.bounds,
                        shp::box(shp::point_xy(20, 20), shp::point_xy(30, 30))));
  BOOST_CHECK(in.read_shape_at_offset(boxes[2].record.offset) ==
              in.read_shape_at_index(2));
}

BOOST_AUTO_TEST_CASE( close_is_idempotent_and_final ) {
  const shapefile_builder file = polygon_file();
  shp::shape_reader in(provider_of(file.bytes()));
  const shp::geometry first = in.read_shape_at_index(0);

  in.close();
  BOOST_CHECK(in.is_closed());
  BOOST_CHECK_NO_THROW(in.close());

  BOOST_CHECK_THROW(in.read_all_shapes(), reader_closed);
  BOOST_CHECK_THROW(in.read_shape_at_index(0), reader_closed);
  BOOST_CHECK_THROW(in.read_shape_at_offset(file.offsets()[0]), reader_closed);
  BOOST_CHECK_THROW(in.read_bounding_boxes(), reader_closed);
  BOOST_CHECK_THROW(in.record_count(), reader_closed);

  BOOST_CHECK_EQUAL(boost::get<shp::polygon>(first).rings[0].size(), 5u);
}

BOOST_AUTO_TEST_CASE( record_past_end_of_file_is_malformed ) {
  std::string bytes = line_file(2).bytes();
  bytes.resize(bytes.size() - 10);
  shp::shape_reader in(provider_of(bytes));
  BOOST_CHECK_THROW(in.record_count(), malformed_record);
  BOOST_CHECK_THROW(in.read_shape_at_index(0), malformed_record);
}

BOOST_AUTO_TEST_CASE( failed_index_build_is_retried ) {
  const std::string good = polygon_file().bytes();
  std::string broken = good;
  broken.resize(broken.size() - 4);
  std::shared_ptr<scripted_provider> streams = std::make_shared<scripted_provider>(
    std::vector<std::string>{good, broken, good});
  shp::shape_reader in(streams);

  BOOST_CHECK_THROW(in.record_count(), malformed_record);
  BOOST_CHECK_EQUAL(in.record_count(), 3u);
  BOOST_CHECK_EQUAL(streams->opens(), 3);
  BOOST_CHECK_EQUAL(in.record_count(), 3u);
  BOOST_CHECK_EQUAL(streams->opens(), 3);
}

BOOST_AUTO_TEST_CASE( index_is_built_once_under_concurrent_first_access ) {
  const shapefile_builder file = line_file(200);
  std::shared_ptr<scripted_provider> streams =
    std::make_shared<scripted_provider>(std::vector<std::string>{file.bytes()});
  shp::shape_reader in(streams);

  std::vector<std::shared_ptr<const shp::offset_index::table>> seen(8);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < seen.size(); ++t) {
    threads.emplace_back([&in, &seen, t] { seen[t] = in.offsets(); });
  }
  for (std::thread& t : threads) {
    t.join();
  }

  BOOST_CHECK_EQUAL(streams->opens(), 2);
  for (const auto& offsets : seen) {
    BOOST_CHECK(offsets == seen[0]);
  }
  BOOST_CHECK_EQUAL(seen[0]->size(), 200u);
}

BOOST_AUTO_TEST_CASE( separate_readers_build_identical_indexes ) {
  const std::string bytes = line_file(50).bytes();
  shp::shape_reader a(provider_of(bytes));
  shp::shape_reader b(provider_of(bytes));
  std::shared_ptr<const shp::offset_index::table> x = a.offsets();
  std::shared_ptr<const shp::offset_index::table> y = b.offsets();
  BOOST_REQUIRE_EQUAL(x->size(), y->size());
  for (std::size_t i = 0; i < x->size(); ++i) {
    BOOST_CHECK_EQUAL((*x)[i].offset, (*y)[i].offset);
    BOOST_CHECK_EQUAL((*x)[i].length, (*y)[i].length);
    BOOST_CHECK(a.read_shape_at_index(int64_t(i)) ==
                b.read_shape_at_offset((*y)[i].offset));
  }
}

BOOST_AUTO_TEST_CASE( concurrent_positioned_reads ) {
  const shapefile_builder file = line_file(64);
  shp::shape_reader in(provider_of(file.bytes()));
  std::vector<shp::geometry> expected;
  for (const shp::geometry& g : in.read_all_shapes()) {
    expected.push_back(g);
  }

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int round = 0; round < 20; ++round) {
        for (std::size_t i = t; i < expected.size(); i += 3) {
          const bool by_index = (round + i) % 2 == 0;
          const shp::geometry g = by_index
            ? in.read_shape_at_index(int64_t(i))
            : in.read_shape_at_offset(file.offsets()[i]);
          if (!(g == expected[i])) {
            ++mismatches;
          }
        }
      }
    });
  }
  threads.emplace_back([&] {
    for (int round = 0; round < 5; ++round) {
      std::size_t n = 0;
      for (const shp::mbr_info& info : in.read_bounding_boxes()) {
        if (info.ordinal != n++) {
          ++mismatches;
        }
      }
    }
  });
  for (std::thread& t : threads) {
    t.join();
  }
  BOOST_CHECK_EQUAL(mismatches.load(), 0);
}

BOOST_AUTO_TEST_CASE( point_files_round_trip ) {
  shapefile_builder file(shape_type::point);
  file.add_point(1, 2).add_null().add_point(-3, 4.5);
  shp::shape_reader in(provider_of(file.bytes()));
  BOOST_REQUIRE_EQUAL(in.record_count(), 3u);
  const shp::point p = boost::get<shp::point>(in.read_shape_at_index(2));
  BOOST_CHECK_EQUAL(p.xy.x(), -3);
  BOOST_CHECK_EQUAL(p.xy.y(), 4.5);
  BOOST_CHECK_EQUAL(shp::to_wkt(p), "POINT(-3 4.5)");
}
