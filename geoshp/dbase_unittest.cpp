#include "dbase.hpp"

#include <sstream>

#include "byte_cursor.hpp"
#include "error.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE dbase_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace geoshp::testing;

namespace {

std::unique_ptr<byte_cursor> cursor_of(const std::string& bytes) {
  return std::unique_ptr<byte_cursor>(
    new byte_cursor(std::unique_ptr<std::istream>(
      new std::istringstream(bytes))));
}

dbase_builder cities() {
  dbase_builder table;
  table.field("NAME", 'C', 12)
       .field("POP", 'N', 9)
       .field("AREA", 'N', 8, 2)
       .field("FOUNDED", 'D', 8)
       .field("CAPITAL", 'L', 1)
       .row({"Montreal", "1704694", "431.50", "16420517", "F"})
       .row({"Quebec", "531902", "485.77", "16080703", "T"}, true)
       .row({"Ottawa", "1017449", "2790.30", "18550101", "Y"});
  return table;
}

} // namespace

BOOST_AUTO_TEST_CASE( descriptors_are_packed ) {
  BOOST_CHECK_EQUAL(sizeof(dbf::detail::header), 32u);
  BOOST_CHECK_EQUAL(sizeof(dbf::detail::field_descriptor), 32u);
}

BOOST_AUTO_TEST_CASE( reads_field_table ) {
  dbf::dbase_reader in(cursor_of(cities().bytes()));
  BOOST_CHECK_EQUAL(in.record_count(), 3u);
  const dbf::field_table& fields = in.fields();
  BOOST_REQUIRE_EQUAL(fields.size(), 5u);
  BOOST_CHECK_EQUAL(fields[0].name, "NAME");
  BOOST_CHECK(fields[0].type == dbf::field_type::character);
  BOOST_CHECK_EQUAL(int(fields[0].length), 12);
  BOOST_CHECK(fields[2].type == dbf::field_type::numeric);
  BOOST_CHECK_EQUAL(int(fields[2].decimal_count), 2);
  BOOST_CHECK(fields[3].type == dbf::field_type::date);
  BOOST_CHECK(fields[4].type == dbf::field_type::logical);
}

BOOST_AUTO_TEST_CASE( values_are_trimmed_and_converted ) {
  dbf::dbase_reader in(cursor_of(cities().bytes()));
  const dbf::record montreal = in.read_record(0);
  BOOST_REQUIRE_EQUAL(montreal.size(), 5u);
  BOOST_CHECK(!montreal.is_deleted());

  BOOST_CHECK_EQUAL(montreal[0].text(), "Montreal");
  BOOST_CHECK_EQUAL(std::string(montreal["NAME"]), "Montreal");
  BOOST_CHECK_EQUAL(montreal["POP"].as_int(), 1704694);
  BOOST_CHECK_EQUAL(montreal["POP"].as_int64(), 1704694LL);
  BOOST_CHECK_CLOSE(montreal["AREA"].as_double(), 431.5, 1e-9);
  BOOST_CHECK(!montreal["CAPITAL"].as_bool());

  const dbf::date founded = montreal["FOUNDED"].as_date();
  BOOST_CHECK_EQUAL(founded.year, 1642);
  BOOST_CHECK_EQUAL(founded.month, 5);
  BOOST_CHECK_EQUAL(founded.day, 17);
}

BOOST_AUTO_TEST_CASE( deleted_rows_are_flagged ) {
  dbf::dbase_reader in(cursor_of(cities().bytes()));
  const dbf::record quebec = in.read_record(1);
  BOOST_CHECK(quebec.is_deleted());
  BOOST_CHECK(quebec["CAPITAL"].as_bool());
  BOOST_CHECK(in.read_record(2)["CAPITAL"].as_bool());
}

BOOST_AUTO_TEST_CASE( unknown_fields_are_rejected ) {
  dbf::dbase_reader in(cursor_of(cities().bytes()));
  const dbf::record r = in.read_record(2);
  BOOST_CHECK(r.has("AREA"));
  BOOST_CHECK(!r.has("area"));
  BOOST_CHECK_THROW(r["MAYOR"], geoshp::index_out_of_range);
  BOOST_CHECK_THROW(r[5], geoshp::index_out_of_range);
}

BOOST_AUTO_TEST_CASE( ordinals_are_checked ) {
  dbf::dbase_reader in(cursor_of(cities().bytes()));
  BOOST_CHECK_THROW(in.read_record(-1), geoshp::index_out_of_range);
  BOOST_CHECK_THROW(in.read_record(3), geoshp::index_out_of_range);
}

BOOST_AUTO_TEST_CASE( empty_values ) {
  dbase_builder table;
  table.field("NAME", 'C', 4).field("N", 'N', 4).row({"", ""});
  dbf::dbase_reader in(cursor_of(table.bytes()));
  const dbf::record r = in.read_record(0);
  BOOST_CHECK(r[0].empty());
  BOOST_CHECK(r[1].empty());
  BOOST_CHECK(!r[1].as_bool());
}

BOOST_AUTO_TEST_CASE( nul_padding_is_stripped ) {
  dbase_builder table;
  table.field("NAME", 'C', 8).field("N", 'N', 6)
       .row({std::string("ab\0\0\0\0", 6), std::string("\0\0", 2) + "42"});
  dbf::dbase_reader in(cursor_of(table.bytes()));
  const dbf::record r = in.read_record(0);
  BOOST_CHECK_EQUAL(r["NAME"].text(), "ab");
  BOOST_CHECK_EQUAL(r["NAME"].text().size(), 2u);
  BOOST_CHECK_EQUAL(r["N"].text(), "42");
  BOOST_CHECK_EQUAL(r["N"].as_int(), 42);
}

BOOST_AUTO_TEST_CASE( records_outlive_the_reader ) {
  dbf::record kept;
  {
    dbf::dbase_reader in(cursor_of(cities().bytes()));
    kept = in.read_record(2);
    in.close();
    BOOST_CHECK_THROW(in.read_record(0), reader_closed);
  }
  BOOST_CHECK_EQUAL(kept["NAME"].text(), "Ottawa");
  BOOST_CHECK_EQUAL(kept.fields().size(), 5u);
}

BOOST_AUTO_TEST_CASE( rejects_malformed_headers ) {
  const std::string bytes = cities().bytes();
  BOOST_CHECK_THROW(dbf::dbase_reader(cursor_of(bytes.substr(0, 20))),
                    malformed_header);

  // A header length pointing past the end of the file.
  std::string long_header = bytes;
  long_header[8] = char(0xFF);
  long_header[9] = char(0xFF);
  BOOST_CHECK_THROW(dbf::dbase_reader(cursor_of(long_header)),
                    malformed_header);

  // Fields wider than a record.
  std::string narrow = bytes;
  narrow[10] = char(4);
  narrow[11] = char(0);
  BOOST_CHECK_THROW(dbf::dbase_reader(cursor_of(narrow)), malformed_header);
}
