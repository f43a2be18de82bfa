#include "dump.hpp"

#include <sstream>
#include <vector>

#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE dump_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;

namespace {

boost::optional<dump_options> parse(std::vector<const char*> args) {
  args.insert(args.begin(), "shpdump");
  return parse_arguments(int(args.size()), args.data());
}

// Points (1, 1), null, (50, 50) under a header box that only covers the
// first one.
std::shared_ptr<const stream_provider> stale_bounds_file() {
  const std::string shapes = shapefile_builder(shp::shape_type::point)
    .add_point(1, 1).add_null().add_point(50, 50)
    .bounds(0, 0, 10, 10)
    .bytes();
  const std::string table = dbase_builder()
    .field("ID", 'N', 4)
    .row({"0"}).row({"1"}).row({"2"})
    .bytes();
  return std::make_shared<memory_stream_provider>(shapes, table);
}

const char* const heading =
  "# Point, 3 records, bounds (0 0, 10 10)\n"
  "# ordinal\tgeometry\tID\n";

} // namespace

BOOST_AUTO_TEST_CASE( parses_path_and_switches ) {
  const boost::optional<dump_options> options =
    parse({"--verbose", "--bbox", "-1.5", "2", "1e3", "4", "roads.shp"});
  BOOST_REQUIRE(options);
  BOOST_CHECK_EQUAL(options->path, "roads.shp");
  BOOST_CHECK(options->verbose);
  BOOST_REQUIRE(options->query);
  BOOST_CHECK(shp::same(*options->query,
                        shp::box(shp::point_xy(-1.5, 2),
                                 shp::point_xy(1000, 4))));

  const boost::optional<dump_options> plain = parse({"roads"});
  BOOST_REQUIRE(plain);
  BOOST_CHECK(!plain->verbose);
  BOOST_CHECK(!plain->query);
}

BOOST_AUTO_TEST_CASE( rejects_bad_boxes ) {
  BOOST_CHECK(!parse({"--bbox", "a", "b", "c", "d", "t.shp"}));
  BOOST_CHECK(!parse({"--bbox", "1x", "0", "2", "2", "t.shp"}));
  BOOST_CHECK(!parse({"--bbox", " 1", "0", "2", "2", "t.shp"}));
  BOOST_CHECK(!parse({"--bbox", "", "0", "2", "2", "t.shp"}));
  BOOST_CHECK(!parse({"--bbox", "3", "0", "2", "2", "t.shp"}));
  BOOST_CHECK(!parse({"--bbox", "0", "3", "2", "2", "t.shp"}));
  BOOST_CHECK(!parse({"t.shp", "--bbox", "0", "0", "1"}));
  BOOST_CHECK(parse({"--bbox", "2", "2", "2", "2", "t.shp"}));
}

BOOST_AUTO_TEST_CASE( rejects_bad_usage ) {
  BOOST_CHECK(!parse({}));
  BOOST_CHECK(!parse({"--verbose"}));
  BOOST_CHECK(!parse({"a.shp", "b.shp"}));
  BOOST_CHECK(!parse({"--quiet", "a.shp"}));
}

BOOST_AUTO_TEST_CASE( dumps_every_record_without_a_query ) {
  feature_reader in(stale_bounds_file());
  std::ostringstream out;
  dump(in, boost::none, out);
  BOOST_CHECK_EQUAL(out.str(), std::string(heading) +
                    "0\tPOINT(1 1)\t0\n"
                    "1\tGEOMETRYCOLLECTION EMPTY\t1\n"
                    "2\tPOINT(50 50)\t2\n");
}

BOOST_AUTO_TEST_CASE( dumps_matching_records_for_a_query ) {
  feature_reader in(stale_bounds_file());
  std::ostringstream out;
  dump(in, shp::box(shp::point_xy(40, 40), shp::point_xy(60, 60)), out);
  BOOST_CHECK_EQUAL(out.str(), std::string(heading) +
                    "2\tPOINT(50 50)\t2\n");
}
