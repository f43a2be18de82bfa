#include "stream_provider.hpp"

#include <fstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/mapped_file.hpp>
#include <boost/iostreams/stream.hpp>

#include "error.hpp"

namespace geoshp {

namespace iostreams = boost::iostreams;

namespace {

// Keeps the backing bytes alive for as long as the stream is.
class buffer_stream : public iostreams::stream<iostreams::array_source> {
 public:
  explicit buffer_stream(std::shared_ptr<const std::string> bytes)
      : iostreams::stream<iostreams::array_source>(
            iostreams::array_source(bytes->data(), bytes->size())),
        bytes_(std::move(bytes)) {}

 private:
  std::shared_ptr<const std::string> bytes_;
};

const char* extension(stream_role role) {
  switch (role) {
    case stream_role::shape: return ".shp";
    case stream_role::data: return ".dbf";
  }
  return "";
}

} // namespace

const char* to_string(stream_role role) {
  switch (role) {
    case stream_role::shape: return "shape";
    case stream_role::data: return "data";
  }
  return "unknown";
}

file_stream_provider::file_stream_provider(const std::string& path)
    : base_(path) {
  if (boost::algorithm::iends_with(base_, ".shp")) {
    base_.resize(base_.size() - 4);
  }
}

std::string file_stream_provider::path(stream_role role) const {
  return base_ + extension(role);
}

bool file_stream_provider::has(stream_role role) const {
  std::ifstream probe(path(role), std::ios::binary);
  return probe.good();
}

std::unique_ptr<std::istream>
    file_stream_provider::open_read(stream_role role) const {
  const std::string file = path(role);
  try {
    using mapped_stream = iostreams::stream<iostreams::mapped_file_source>;
    std::unique_ptr<std::istream> in(
      new mapped_stream(iostreams::mapped_file_source(file)));
    return in;
  } catch (const std::ios_base::failure& e) {
    throw io_error("cannot open " + file + ": " + e.what());
  }
}

memory_stream_provider::memory_stream_provider(std::string shape,
                                               std::string data) {
  set(stream_role::shape, std::move(shape));
  set(stream_role::data, std::move(data));
}

void memory_stream_provider::set(stream_role role, std::string bytes) {
  buffers_[role] = std::make_shared<const std::string>(std::move(bytes));
}

bool memory_stream_provider::has(stream_role role) const {
  return buffers_.count(role) != 0;
}

std::unique_ptr<std::istream>
    memory_stream_provider::open_read(stream_role role) const {
  auto it = buffers_.find(role);
  if (it == buffers_.end()) {
    throw io_error(std::string("no ") + to_string(role) + " stream");
  }
  return std::unique_ptr<std::istream>(new buffer_stream(it->second));
}

} // namespace geoshp
