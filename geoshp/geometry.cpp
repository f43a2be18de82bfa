#include "geometry.hpp"

#include <algorithm>
#include <sstream>

#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/io/wkt/write.hpp>

namespace geoshp {

namespace shp {

namespace {

template <class Range>
bool same_points(const Range& a, const Range& b) {
  return a.size() == b.size() &&
    std::equal(a.begin(), a.end(), b.begin(),
               [](const point_xy& p, const point_xy& q) { return same(p, q); });
}

struct envelope_visitor : boost::static_visitor<boost::optional<box>> {
  boost::optional<box> operator()(const null_shape&) const { return {}; }
  boost::optional<box> operator()(const point& g) const {
    return box(g.xy, g.xy);
  }
  template <class G>
  boost::optional<box> operator()(const G& g) const { return g.bounds; }
};

struct num_points_visitor : boost::static_visitor<std::size_t> {
  std::size_t operator()(const null_shape&) const { return 0; }
  std::size_t operator()(const point&) const { return 1; }
  std::size_t operator()(const multipoint& g) const { return g.points.size(); }
  std::size_t operator()(const polyline& g) const {
    std::size_t n = 0;
    for (const auto& part : g.parts) n += part.size();
    return n;
  }
  std::size_t operator()(const polygon& g) const {
    std::size_t n = 0;
    for (const auto& r : g.rings) n += r.size();
    return n;
  }
  std::size_t operator()(const multipatch& g) const {
    std::size_t n = 0;
    for (const auto& p : g.patches) n += p.points.size();
    return n;
  }
};

struct wkt_visitor : boost::static_visitor<void> {
  std::ostream& out;
  explicit wkt_visitor(std::ostream& o) : out(o) {}

  void operator()(const null_shape&) const { out << "GEOMETRYCOLLECTION EMPTY"; }
  void operator()(const point& g) const { out << bg::wkt(g.xy); }
  void operator()(const multipoint& g) const { out << bg::wkt(g.points); }
  void operator()(const polyline& g) const { out << bg::wkt(g.parts); }
  void operator()(const polygon& g) const {
    bg::model::polygon<point_xy> poly;
    for (std::size_t i = 0; i < g.rings.size(); ++i) {
      if (i == 0) {
        poly.outer().assign(g.rings[i].begin(), g.rings[i].end());
      } else {
        poly.inners().emplace_back(g.rings[i].begin(), g.rings[i].end());
      }
    }
    out << bg::wkt(poly);
  }
  void operator()(const multipatch& g) const {
    multi_linestring lines;
    for (const auto& p : g.patches) {
      lines.push_back(p.points);
    }
    out << bg::wkt(lines);
  }
};

} // namespace

bool is_null(const geometry& g) {
  return boost::get<null_shape>(&g) != nullptr;
}

boost::optional<box> envelope(const geometry& g) {
  return boost::apply_visitor(envelope_visitor(), g);
}

std::size_t num_points(const geometry& g) {
  return boost::apply_visitor(num_points_visitor(), g);
}

bool intersects(const box& a, const box& b) {
  return !(a.max_corner().x() < b.min_corner().x() ||
           a.min_corner().x() > b.max_corner().x() ||
           a.max_corner().y() < b.min_corner().y() ||
           a.min_corner().y() > b.max_corner().y());
}

std::string to_wkt(const geometry& g) {
  std::ostringstream out;
  out.precision(15);
  boost::apply_visitor(wkt_visitor(out), g);
  return out.str();
}

bool same(const point_xy& a, const point_xy& b) {
  return a.x() == b.x() && a.y() == b.y();
}

bool same(const box& a, const box& b) {
  return same(a.min_corner(), b.min_corner()) &&
         same(a.max_corner(), b.max_corner());
}

bool operator==(const range& a, const range& b) {
  return a.min == b.min && a.max == b.max;
}

bool operator==(const measures& a, const measures& b) {
  return a.bounds == b.bounds && a.values == b.values;
}

bool operator==(const null_shape&, const null_shape&) {
  return true;
}

bool operator==(const point& a, const point& b) {
  return same(a.xy, b.xy) && a.z == b.z && a.m == b.m;
}

bool operator==(const multipoint& a, const multipoint& b) {
  return same(a.bounds, b.bounds) && same_points(a.points, b.points) &&
         a.z == b.z && a.m == b.m;
}

bool operator==(const polyline& a, const polyline& b) {
  return same(a.bounds, b.bounds) && a.parts.size() == b.parts.size() &&
         std::equal(a.parts.begin(), a.parts.end(), b.parts.begin(),
                    same_points<linestring>) &&
         a.z == b.z && a.m == b.m;
}

bool operator==(const polygon& a, const polygon& b) {
  return same(a.bounds, b.bounds) && a.rings.size() == b.rings.size() &&
         std::equal(a.rings.begin(), a.rings.end(), b.rings.begin(),
                    same_points<ring>) &&
         a.z == b.z && a.m == b.m;
}

bool operator==(const patch& a, const patch& b) {
  return a.type == b.type && same_points(a.points, b.points);
}

bool operator==(const multipatch& a, const multipatch& b) {
  return same(a.bounds, b.bounds) && a.patches == b.patches &&
         a.z == b.z && a.m == b.m;
}

} // namespace shp

} // namespace geoshp
