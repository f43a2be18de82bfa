#include "stream_provider.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>

#include "error.hpp"
#include "feature_reader.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE stream_provider_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;

namespace {

std::string slurp(std::istream& in) {
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// Writes <base>.shp and <base>.dbf in the working directory and removes them
// on destruction.
class scratch_files {
 public:
  scratch_files(const std::string& base, const std::string& shp,
                const std::string& dbf)
      : base_(base) {
    write(base_ + ".shp", shp);
    write(base_ + ".dbf", dbf);
  }
  ~scratch_files() {
    std::remove((base_ + ".shp").c_str());
    std::remove((base_ + ".dbf").c_str());
  }

  const std::string& base() const { return base_; }

 private:
  static void write(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), bytes.size());
  }

  std::string base_;
};

std::string point_file() {
  return shapefile_builder(shp::shape_type::point)
    .add_point(1, 2).add_point(3, 4).add_point(-5, 6)
    .bounds(-5, 2, 3, 6)
    .bytes();
}

std::string point_table() {
  return dbase_builder()
    .field("NAME", 'C', 8)
    .row({"a"}).row({"b"}).row({"c"})
    .bytes();
}

} // namespace

BOOST_AUTO_TEST_CASE( memory_streams_are_independent ) {
  memory_stream_provider streams("shape bytes", "data bytes");
  BOOST_CHECK(streams.has(stream_role::shape));
  BOOST_CHECK(streams.has(stream_role::data));

  std::unique_ptr<std::istream> a = streams.open_read(stream_role::shape);
  std::unique_ptr<std::istream> b = streams.open_read(stream_role::shape);
  a->seekg(6);
  BOOST_CHECK_EQUAL(slurp(*a), "bytes");
  BOOST_CHECK_EQUAL(slurp(*b), "shape bytes");
  BOOST_CHECK_EQUAL(slurp(*streams.open_read(stream_role::data)), "data bytes");
}

BOOST_AUTO_TEST_CASE( memory_streams_outlive_the_provider ) {
  std::unique_ptr<std::istream> in;
  {
    memory_stream_provider streams;
    streams.set(stream_role::shape, "kept");
    in = streams.open_read(stream_role::shape);
  }
  BOOST_CHECK_EQUAL(slurp(*in), "kept");
}

BOOST_AUTO_TEST_CASE( missing_memory_stream ) {
  memory_stream_provider streams;
  streams.set(stream_role::shape, "x");
  BOOST_CHECK(!streams.has(stream_role::data));
  BOOST_CHECK_THROW(streams.open_read(stream_role::data), io_error);
}

BOOST_AUTO_TEST_CASE( file_paths_drop_the_shp_extension ) {
  BOOST_CHECK_EQUAL(file_stream_provider("data/roads.shp").base_path(),
                    "data/roads");
  BOOST_CHECK_EQUAL(file_stream_provider("data/ROADS.SHP").base_path(),
                    "data/ROADS");
  BOOST_CHECK_EQUAL(file_stream_provider("data/roads").base_path(),
                    "data/roads");
  const file_stream_provider streams("roads.shp");
  BOOST_CHECK_EQUAL(streams.path(stream_role::shape), "roads.shp");
  BOOST_CHECK_EQUAL(streams.path(stream_role::data), "roads.dbf");
  BOOST_CHECK_EQUAL(std::string(to_string(stream_role::data)), "data");
}

BOOST_AUTO_TEST_CASE( missing_files ) {
  const file_stream_provider streams("geoshp_no_such_file");
  BOOST_CHECK(!streams.has(stream_role::shape));
  BOOST_CHECK_THROW(streams.open_read(stream_role::shape), io_error);
  BOOST_CHECK_THROW(shp::shape_reader in("geoshp_no_such_file.shp"), io_error);
}

BOOST_AUTO_TEST_CASE( reads_files_from_disk ) {
  const scratch_files files("geoshp_provider_test", point_file(),
                            point_table());
  const file_stream_provider streams(files.base() + ".shp");
  BOOST_CHECK(streams.has(stream_role::shape));
  BOOST_CHECK(streams.has(stream_role::data));
  BOOST_CHECK_EQUAL(slurp(*streams.open_read(stream_role::shape)),
                    point_file());

  feature_reader in(files.base());
  BOOST_CHECK_EQUAL(in.record_count(), 3u);
  const feature third = in.read_feature(2);
  BOOST_CHECK_EQUAL(shp::to_wkt(third.geometry), "POINT(-5 6)");
  BOOST_CHECK_EQUAL(third.attributes["NAME"].text(), "c");

  std::size_t matches = 0;
  for (const feature& f : in.read_by_bounds(
         shp::box(shp::point_xy(0, 0), shp::point_xy(10, 10)))) {
    BOOST_CHECK_NE(f.ordinal, 2u);
    ++matches;
  }
  BOOST_CHECK_EQUAL(matches, 2u);
}
