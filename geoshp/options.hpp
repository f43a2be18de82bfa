#pragma once

namespace geoshp {

struct reader_options {
  // When false, a record whose declared content length is longer than its
  // geometry needs is accepted and the trailing bytes are skipped. A shorter
  // one is always a truncated_record.
  bool strict_content_length = true;
};

} // namespace geoshp
