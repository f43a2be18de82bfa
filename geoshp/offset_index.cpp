#include "offset_index.hpp"

#include <algorithm>

#include <boost/log/trivial.hpp>

#include "byte_cursor.hpp"
#include "error.hpp"

namespace geoshp {

namespace shp {

record_scanner::record_scanner(std::unique_ptr<byte_cursor> in,
                               const file_header& header,
                               const shape_decoder& decoder)
    : in_(std::move(in)),
      decoder_(decoder),
      end_(header.file_length) {}

record_scanner::~record_scanner() = default;

bool record_scanner::next(mbr_info& out) {
  if (position_ >= end_) {
    return false;
  }
  const int64_t limit = std::min(end_, in_->size());
  if (limit - position_ < int64_t(sizeof(detail::record_header))) {
    throw malformed_record("record header at " + std::to_string(position_) +
                           " runs past end of file");
  }
  in_->seek(position_);
  const detail::record_header framing = in_->read<detail::record_header>();
  const int32_t length = framing.length;
  const int64_t content = int64_t(length) * sizeof(uint16_t);
  const int64_t record_end =
    position_ + int64_t(sizeof(detail::record_header)) + content;
  if (length < 0 || record_end > limit) {
    throw malformed_record("record " + std::to_string(int32_t(framing.number)) +
                           " at " + std::to_string(position_) +
                           " declares " + std::to_string(length) +
                           " words, past end of file");
  }

  const std::size_t prefix =
    std::min<std::size_t>(std::size_t(content), shape_decoder::bounds_prefix);
  const std::vector<char> bytes = in_->read_bytes(prefix);

  out.ordinal = ordinal_;
  out.record.offset = position_;
  out.record.number = framing.number;
  out.record.length = length;
  out.record.bounds = decoder_.read_bounds(bytes.data(),
                                           bytes.data() + bytes.size());

  position_ = record_end;
  ++ordinal_;
  return true;
}

offset_index::offset_index(cursor_factory open,
                           const file_header& header,
                           const shape_decoder& decoder)
    : open_(std::move(open)),
      header_(header),
      decoder_(decoder) {}

bool offset_index::is_built() const {
  return std::atomic_load(&table_) != nullptr;
}

record_offset offset_index::offset_at(int64_t ordinal) const {
  std::shared_ptr<const table> offsets = get();
  if (ordinal < 0 || ordinal >= int64_t(offsets->size())) {
    throw index_out_of_range("record " + std::to_string(ordinal) +
                             " outside [0, " +
                             std::to_string(offsets->size()) + ")");
  }
  return (*offsets)[std::size_t(ordinal)];
}

std::shared_ptr<const offset_index::table> offset_index::get() const {
  std::shared_ptr<const table> built = std::atomic_load(&table_);
  if (built) {
    return built;
  }
  std::lock_guard<std::mutex> lock(build_mutex_);
  built = std::atomic_load(&table_);
  if (!built) {
    built = build();
    std::atomic_store(&table_, built);
  }
  return built;
}

std::shared_ptr<const offset_index::table> offset_index::build() const {
  record_scanner scanner(open_(), header_, decoder_);
  std::shared_ptr<table> offsets = std::make_shared<table>();
  mbr_info info;
  while (scanner.next(info)) {
    offsets->push_back(info.record);
  }
  BOOST_LOG_TRIVIAL(debug) << "indexed " << offsets->size() << " records";
  return offsets;
}

} // namespace shp

} // namespace geoshp
