#pragma once

#include <iterator>
#include <string>

#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/phoenix_operator.hpp>

namespace geoshp {

namespace qi = boost::spirit::qi;

template <class T> struct default_parser {};
template <> struct default_parser<int> { using type = qi::int_type; };
template <> struct default_parser<long long> { using type = qi::long_long_type; };
template <> struct default_parser<double> { using type = qi::double_type; };

// Parses `value` as T, skipping surrounding blanks. Returns T{} when the text
// does not start with a T.
template <class T, class P = typename default_parser<T>::type, class U>
T extract(const U& value) {
  using boost::phoenix::ref; using qi::_1;
  T v = {};
  P parser;
  auto first = std::begin(value);
  qi::phrase_parse(first, std::end(value), parser[ref(v) = _1], qi::space);
  return v;
}

// Like extract(), but fails unless the whole of `value` is one T, with no
// surrounding blanks.
template <class T, class P = typename default_parser<T>::type>
bool parse_exact(const std::string& value, T& out) {
  P parser;
  auto first = value.begin();
  return qi::parse(first, value.end(), parser, out) && first == value.end();
}

template <class T>
const T* as(const char* first) {
	return reinterpret_cast<const T*>(first);
}
template <class T>
const T* as(const char* first, const char* last) {
	if (std::distance(first, last) < std::ptrdiff_t(sizeof(T))) {
		return nullptr;
	}
	return as<T>(first);
}

// Strips blank and NUL padding.
inline std::string trim(const std::string& s) {
  const std::string padding(" \0", 2);
  auto first = s.find_first_not_of(padding);
  if (first == std::string::npos) {
    return {};
  }
  auto last = s.find_last_not_of(padding);
  return s.substr(first, last - first + 1);
}

} // namespace geoshp
