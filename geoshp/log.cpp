#include "log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace geoshp {

namespace log {

namespace logging = boost::log;

void init(severity level) {
  static bool sink_added = false;
  if (!sink_added) {
    logging::add_console_log(
      std::clog,
      logging::keywords::format = "[%TimeStamp%] <%Severity%> %Message%");
    logging::add_common_attributes();
    sink_added = true;
  }
  logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace log

} // namespace geoshp
