#pragma once

#include <boost/log/trivial.hpp>

namespace geoshp {

namespace log {

using severity = boost::log::trivial::severity_level;

// Installs a global filter dropping records below `level`. Without a call
// Boost.Log prints everything to the console.
void init(severity level);

} // namespace log

} // namespace geoshp
