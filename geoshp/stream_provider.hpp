#pragma once

#include <istream>
#include <map>
#include <memory>
#include <string>

namespace geoshp {

enum class stream_role {
  shape,  // .shp geometry records
  data,   // .dbf attribute rows
};

const char* to_string(stream_role role);

// Hands out a fresh, independently positioned stream per call, so that
// full scans can run beside positioned reads on another handle.
class stream_provider {
 public:
  virtual ~stream_provider() = default;

  virtual bool has(stream_role role) const = 0;
  virtual std::unique_ptr<std::istream> open_read(stream_role role) const = 0;
};

// <base>.shp and <base>.dbf on disk, memory mapped.
class file_stream_provider : public stream_provider {
 public:
  // Accepts the path with or without the .shp extension.
  explicit file_stream_provider(const std::string& path);

  const std::string& base_path() const { return base_; }
  std::string path(stream_role role) const;

  bool has(stream_role role) const override;
  std::unique_ptr<std::istream> open_read(stream_role role) const override;

 private:
  std::string base_;
};

class memory_stream_provider : public stream_provider {
 public:
  memory_stream_provider() = default;
  memory_stream_provider(std::string shape, std::string data);

  void set(stream_role role, std::string bytes);

  bool has(stream_role role) const override;
  std::unique_ptr<std::istream> open_read(stream_role role) const override;

 private:
  std::map<stream_role, std::shared_ptr<const std::string>> buffers_;
};

} // namespace geoshp
