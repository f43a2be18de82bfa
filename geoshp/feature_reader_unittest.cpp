#include "feature_reader.hpp"

#include <string>

#include "error.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE feature_reader_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;
using shp::shape_type;

namespace {

shp::box make_box(double min_x, double min_y, double max_x, double max_y) {
  return shp::box(shp::point_xy(min_x, min_y), shp::point_xy(max_x, max_y));
}

// A grid of unit squares at (i, j) for i, j in [0, 5), row-major, with a
// null record after every seventh square.
struct grid {
  std::string shapes;
  std::string attributes;
  std::vector<boost::optional<shp::box>> boxes;
};

grid make_grid() {
  grid g;
  shapefile_builder file(shape_type::polygon);
  dbase_builder table;
  table.field("ID", 'N', 6).field("LABEL", 'C', 10);
  int id = 0;
  for (int j = 0; j < 5; ++j) {
    for (int i = 0; i < 5; ++i) {
      const double x = i, y = j;
      file.add_poly({0}, {{x, y}, {x, y + 1}, {x + 1, y + 1}, {x + 1, y},
                          {x, y}});
      g.boxes.push_back(make_box(x, y, x + 1, y + 1));
      table.row({std::to_string(id), "cell" + std::to_string(id)});
      ++id;
      if (id % 7 == 0) {
        file.add_null();
        g.boxes.push_back(boost::none);
        table.row({std::to_string(-id), "empty"});
      }
    }
  }
  file.bounds(0, 0, 5, 5);
  g.shapes = file.bytes();
  g.attributes = table.bytes();
  return g;
}

std::shared_ptr<const stream_provider> provider_of(const grid& g) {
  return std::make_shared<memory_stream_provider>(g.shapes, g.attributes);
}

std::vector<feature> collect(const feature_range& features) {
  std::vector<feature> out;
  for (const feature& f : features) {
    out.push_back(f);
  }
  return out;
}

} // namespace

BOOST_AUTO_TEST_CASE( exposes_header_and_fields ) {
  const grid g = make_grid();
  feature_reader in(provider_of(g));
  BOOST_CHECK(in.header().type == shape_type::polygon);
  BOOST_CHECK(shp::same(in.bounds(), make_box(0, 0, 5, 5)));
  BOOST_CHECK_EQUAL(in.record_count(), g.boxes.size());
  BOOST_REQUIRE_EQUAL(in.fields().size(), 2u);
  BOOST_CHECK_EQUAL(in.fields()[1].name, "LABEL");
}

BOOST_AUTO_TEST_CASE( bounds_query_matches_brute_force ) {
  const grid g = make_grid();
  feature_reader in(provider_of(g));

  const std::vector<shp::box> queries = {
    make_box(0.5, 0.5, 1.5, 1.5),
    make_box(2, 2, 2, 2),
    make_box(-10, -10, 10, 10),
    make_box(6, 6, 7, 7),
    make_box(4.5, -1, 10, 0.5),
  };
  for (const shp::box& query : queries) {
    std::vector<std::size_t> expected;
    for (std::size_t i = 0; i < g.boxes.size(); ++i) {
      if (g.boxes[i] && shp::intersects(*g.boxes[i], query)) {
        expected.push_back(i);
      }
    }
    std::vector<std::size_t> found;
    for (const feature& f : collect(in.read_by_bounds(query))) {
      found.push_back(f.ordinal);
      BOOST_CHECK(!shp::is_null(f.geometry));
    }
    BOOST_CHECK_EQUAL_COLLECTIONS(found.begin(), found.end(),
                                  expected.begin(), expected.end());
  }
}

BOOST_AUTO_TEST_CASE( touching_boxes_match ) {
  const grid g = make_grid();
  feature_reader in(provider_of(g));
  // The corner (2, 2) is shared by four cells.
  BOOST_CHECK_EQUAL(collect(in.read_by_bounds(make_box(2, 2, 2, 2))).size(),
                    4u);
}

BOOST_AUTO_TEST_CASE( null_records_never_match ) {
  const grid g = make_grid();
  feature_reader in(provider_of(g));
  const std::vector<feature> all =
    collect(in.read_by_bounds(make_box(-1e9, -1e9, 1e9, 1e9)));
  BOOST_CHECK_EQUAL(all.size(), 25u);
  for (const feature& f : all) {
    BOOST_CHECK(f.bounds);
    BOOST_CHECK_NE(f.attributes["LABEL"].text(), "empty");
  }
}

BOOST_AUTO_TEST_CASE( attributes_are_paired_by_ordinal ) {
  const grid g = make_grid();
  feature_reader in(provider_of(g));
  for (const feature& f : collect(in.read_by_bounds(in.bounds()))) {
    const shp::polygon& cell = boost::get<shp::polygon>(f.geometry);
    BOOST_CHECK(shp::same(cell.bounds, *f.bounds));
    BOOST_CHECK(shp::same(cell.bounds, *g.boxes[f.ordinal]));
    const int id = f.attributes["ID"].as_int();
    BOOST_CHECK_EQUAL(f.attributes["LABEL"].text(),
                      "cell" + std::to_string(id));
    // One null record precedes every seven cells.
    BOOST_CHECK_EQUAL(f.ordinal, std::size_t(id + id / 7));
  }
}

BOOST_AUTO_TEST_CASE( reads_single_features ) {
  const grid g = make_grid();
  feature_reader in(provider_of(g));

  const feature null_record = in.read_feature(7);
  BOOST_CHECK(shp::is_null(null_record.geometry));
  BOOST_CHECK(!null_record.bounds);
  BOOST_CHECK_EQUAL(null_record.attributes["ID"].as_int(), -7);

  const feature cell = in.read_feature(8);
  BOOST_CHECK_EQUAL(cell.attributes["ID"].as_int(), 7);
  BOOST_CHECK_THROW(in.read_feature(-1), geoshp::index_out_of_range);
  BOOST_CHECK_THROW(in.read_feature(int64_t(g.boxes.size())),
                    geoshp::index_out_of_range);
}

BOOST_AUTO_TEST_CASE( features_outlive_close ) {
  const grid g = make_grid();
  std::vector<feature> kept;
  {
    feature_reader in(provider_of(g));
    kept = collect(in.read_by_bounds(make_box(0, 0, 1, 1)));
    in.close();
    BOOST_CHECK(in.is_closed());
    BOOST_CHECK_NO_THROW(in.close());
    BOOST_CHECK_THROW(in.read_by_bounds(make_box(0, 0, 1, 1)), reader_closed);
    BOOST_CHECK_THROW(in.read_feature(0), reader_closed);
  }
  BOOST_REQUIRE_EQUAL(kept.size(), 4u);
  BOOST_CHECK_EQUAL(kept[0].attributes["LABEL"].text(), "cell0");
  BOOST_CHECK_EQUAL(shp::num_points(kept[3].geometry), 5u);
}

BOOST_AUTO_TEST_CASE( short_attribute_table_is_malformed ) {
  const grid g = make_grid();
  dbase_builder table;
  table.field("ID", 'N', 6).row({"0"}).row({"1"});
  feature_reader in(std::make_shared<memory_stream_provider>(g.shapes,
                                                             table.bytes()));
  BOOST_CHECK_EQUAL(collect(in.read_by_bounds(make_box(0, 0, 1.5, 0.5))).size(),
                    2u);
  BOOST_CHECK_THROW(collect(in.read_by_bounds(in.bounds())), malformed_record);
  BOOST_CHECK_THROW(in.read_feature(5), malformed_record);
}

BOOST_AUTO_TEST_CASE( missing_attribute_stream ) {
  std::shared_ptr<memory_stream_provider> streams =
    std::make_shared<memory_stream_provider>();
  streams->set(stream_role::shape, make_grid().shapes);
  BOOST_CHECK_THROW(feature_reader in(streams), io_error);
}

BOOST_AUTO_TEST_CASE( requires_both_collaborators ) {
  std::unique_ptr<shp::shape_reader> none;
  std::unique_ptr<dbf::attribute_source> nothing;
  BOOST_CHECK_THROW(feature_reader in(std::move(none), std::move(nothing)),
                    geoshp::error);
}
