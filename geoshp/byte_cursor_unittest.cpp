#include "byte_cursor.hpp"

#include <sstream>

#include "error.hpp"
#include "testing/shapefile_builder.hpp"

#define BOOST_TEST_MODULE byte_cursor_unittest
#include <boost/test/included/unit_test.hpp>

using namespace geoshp;
using namespace boost::endian;

namespace {

std::unique_ptr<std::istream> stream_of(const std::string& bytes) {
  return std::unique_ptr<std::istream>(new std::istringstream(bytes));
}

std::string mixed_words() {
  std::string bytes;
  testing::append(bytes, big_int32_t(9994));
  testing::append(bytes, little_int32_t(-7));
  testing::append(bytes, little_float64_t(2.5));
  return bytes;
}

} // namespace

BOOST_AUTO_TEST_CASE( reads_both_byte_orders ) {
  byte_cursor in(stream_of(mixed_words()));
  BOOST_CHECK_EQUAL(in.size(), 16);
  BOOST_CHECK_EQUAL(in.read_int32_big(), 9994);
  BOOST_CHECK_EQUAL(in.read_int32_little(), -7);
  BOOST_CHECK_EQUAL(in.read_double_little(), 2.5);
  BOOST_CHECK_EQUAL(in.position(), 16);
}

BOOST_AUTO_TEST_CASE( seeks_to_absolute_offsets ) {
  byte_cursor in(stream_of(mixed_words()));
  in.seek(4);
  BOOST_CHECK_EQUAL(in.read_int32_little(), -7);
  in.seek(0);
  BOOST_CHECK_EQUAL(in.read_int32_big(), 9994);
  in.skip(4);
  BOOST_CHECK_EQUAL(in.read_double_little(), 2.5);
}

BOOST_AUTO_TEST_CASE( read_bytes_copies_the_requested_range ) {
  byte_cursor in(stream_of("abcdef"));
  in.seek(2);
  const std::vector<char> bytes = in.read_bytes(3);
  BOOST_CHECK_EQUAL(std::string(bytes.begin(), bytes.end()), "cde");
  BOOST_CHECK(in.read_bytes(0).empty());
}

BOOST_AUTO_TEST_CASE( reading_past_the_end_fails ) {
  byte_cursor in(stream_of(mixed_words()));
  in.seek(12);
  BOOST_CHECK_THROW(in.read_double_little(), io_error);
  in.seek(16);
  BOOST_CHECK_THROW(in.read_int32_big(), io_error);
  BOOST_CHECK_THROW(in.read_bytes(1), io_error);
}

BOOST_AUTO_TEST_CASE( seeking_outside_the_stream_fails ) {
  byte_cursor in(stream_of(mixed_words()));
  BOOST_CHECK_THROW(in.seek(-1), io_error);
  BOOST_CHECK_THROW(in.seek(17), io_error);
  in.seek(16);
  BOOST_CHECK_EQUAL(in.position(), 16);
}

BOOST_AUTO_TEST_CASE( closed_cursor_fails ) {
  byte_cursor in(stream_of(mixed_words()));
  in.close();
  BOOST_CHECK(!in.is_open());
  BOOST_CHECK_THROW(in.read_int32_big(), io_error);
  BOOST_CHECK_THROW(in.seek(0), io_error);
}

BOOST_AUTO_TEST_CASE( null_stream_is_rejected ) {
  std::unique_ptr<std::istream> none;
  BOOST_CHECK_THROW(byte_cursor in(std::move(none)), io_error);
}
