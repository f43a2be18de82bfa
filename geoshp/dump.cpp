#include "dump.hpp"

#include "utility.hpp"

namespace geoshp {

namespace {

void print(const feature& f, std::ostream& out) {
  out << f.ordinal << '\t' << shp::to_wkt(f.geometry);
  for (std::size_t i = 0; i < f.attributes.size(); ++i) {
    out << '\t' << f.attributes[i].text();
  }
  out << '\n';
}

} // namespace

boost::optional<dump_options> parse_arguments(int argc,
                                              const char* const* argv) {
  dump_options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--bbox") {
      if (options.query || i + 4 >= argc) {
        return boost::none;
      }
      double v[4];
      for (double& d : v) {
        if (!parse_exact(argv[++i], d)) {
          return boost::none;
        }
      }
      if (v[0] > v[2] || v[1] > v[3]) {
        return boost::none;
      }
      options.query = shp::box(shp::point_xy(v[0], v[1]),
                               shp::point_xy(v[2], v[3]));
    } else if (options.path.empty() && arg.compare(0, 2, "--") != 0) {
      options.path = arg;
    } else {
      return boost::none;
    }
  }
  if (options.path.empty()) {
    return boost::none;
  }
  return options;
}

void usage(std::ostream& out) {
  out << "usage: shpdump [--verbose] [--bbox minx miny maxx maxy] "
         "<path[.shp]>" << std::endl;
}

void dump(const feature_reader& in, const boost::optional<shp::box>& query,
          std::ostream& out) {
  const shp::file_header& header = in.header();
  const shp::box& bounds = header.bounds;
  out << "# " << shp::to_string(header.type) << ", "
      << in.record_count() << " records, bounds ("
      << bounds.min_corner().x() << ' ' << bounds.min_corner().y()
      << ", " << bounds.max_corner().x() << ' '
      << bounds.max_corner().y() << ")\n";
  out << "# ordinal\tgeometry";
  for (const auto& field : in.fields()) {
    out << '\t' << field.name;
  }
  out << '\n';

  if (query) {
    for (const feature& f : in.read_by_bounds(*query)) {
      print(f, out);
    }
    return;
  }
  const int64_t count = int64_t(in.record_count());
  for (int64_t i = 0; i < count; ++i) {
    print(in.read_feature(i), out);
  }
}

} // namespace geoshp
