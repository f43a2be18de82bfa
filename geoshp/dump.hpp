#pragma once

#include <ostream>
#include <string>

#include <boost/optional.hpp>

#include "feature_reader.hpp"
#include "geometry.hpp"

namespace geoshp {

struct dump_options {
  std::string path;
  bool verbose = false;
  boost::optional<shp::box> query;
};

// shpdump [--verbose] [--bbox minx miny maxx maxy] <path[.shp]>
// Returns none for a usage error: a missing path, a coordinate that is not a
// number, or a box with min > max.
boost::optional<dump_options> parse_arguments(int argc,
                                              const char* const* argv);

void usage(std::ostream& out);

// Writes a header summary, the field names, then one line per feature:
// ordinal, WKT and attribute values, tab separated. Without a query every
// record is written in file order, null shapes included.
void dump(const feature_reader& in, const boost::optional<shp::box>& query,
          std::ostream& out);

} // namespace geoshp
