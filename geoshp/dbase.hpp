#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/endian/arithmetic.hpp>

namespace geoshp {

class byte_cursor;

namespace dbf {
namespace detail {

using namespace boost::endian;
#pragma pack(push, 1)

struct header {
	struct date {
		uint8_t year;
		uint8_t month;
		uint8_t day;
	};

	uint8_t identifier;
	date last_updated;
	little_uint32_t num_records;
	little_uint16_t header_length;
	little_uint16_t record_length;
	uint8_t reserved_1[2];
	uint8_t incomplete_flag;
	uint8_t encryption_flag;
	uint8_t reserved_dos[12];
	uint8_t production_mdx_flag;
	uint8_t language_driver_id;
	uint8_t reserved_2[2];
};
static_assert(sizeof(header) == 32,
  "dbf::header is not packed");

struct field_descriptor {
	char name[11];
	uint8_t type;
	uint8_t reserved_1[4];
	uint8_t length;
	uint8_t decimal_count;
	little_uint16_t work_area_id;
	uint8_t example;
	uint8_t reserved_2[10];
	uint8_t production_mdx_flag;
};
static_assert(sizeof(field_descriptor) == 32,
  "dbf::field_descriptor is not packed");

#pragma pack(pop)

const char header_terminator = 0x0D;
const char deleted_flag = '*';

} // namespace detail

struct date {
	int year;
	int month;
	int day;
};

enum class field_type : char {
	character = 'C',
	date = 'D',
	floating_point = 'F',
	logical = 'L',
	memo = 'M',
	numeric = 'N',
};

struct field_descriptor {
	std::string name;
	field_type type;
	uint8_t length;
	uint8_t decimal_count;
};

using field_table = std::vector<field_descriptor>;

// One cell of a record, owning its text. Leading and trailing blanks are
// already stripped.
class value {
 public:
  value(field_descriptor field, std::string text)
      : field_(std::move(field)), text_(std::move(text)) {}

  const field_descriptor& field() const { return field_; }
  const std::string& text() const { return text_; }
  bool empty() const { return text_.empty(); }

  operator std::string() const { return text_; }
  operator int() const;
  operator double() const;
  operator date() const;

  int as_int() const { return operator int(); }
  long long as_int64() const;
  double as_double() const { return operator double(); }
  date as_date() const { return operator date(); }
  bool as_bool() const;

 private:
  field_descriptor field_;
  std::string text_;
};

// Attribute row by ordinal position. Owns its data, so it stays valid after
// the reader that produced it is closed.
class record {
 public:
  record() = default;
  record(std::shared_ptr<const field_table> fields,
         std::vector<std::string> values,
         bool deleted)
      : fields_(std::move(fields)),
        values_(std::move(values)),
        deleted_(deleted) {}

  std::size_t size() const { return values_.size(); }
  bool is_deleted() const { return deleted_; }
  const field_table& fields() const { return *fields_; }

  bool has(const std::string& name) const;

  // Throw index_out_of_range for an unknown position or name.
  value operator[](std::size_t i) const;
  value operator[](const std::string& name) const;

 private:
  std::shared_ptr<const field_table> fields_;
  std::vector<std::string> values_;
  bool deleted_ = false;
};

class attribute_source {
 public:
  virtual ~attribute_source() = default;

  virtual std::size_t record_count() const = 0;
  virtual const field_table& fields() const = 0;
  // Throws index_out_of_range outside [0, record_count()).
  virtual record read_record(int64_t ordinal) const = 0;
  virtual void close() = 0;
};

// dBASE III/IV table. Rows are fetched by seeking on one shared handle;
// concurrent callers are serialized.
class dbase_reader : public attribute_source {
 public:
  explicit dbase_reader(std::unique_ptr<byte_cursor> in);
  ~dbase_reader();

  std::size_t record_count() const override { return num_records_; }
  const field_table& fields() const override { return *fields_; }
  record read_record(int64_t ordinal) const override;
  void close() override;

 private:
  std::unique_ptr<byte_cursor> in_;
  mutable std::mutex mutex_;
  std::shared_ptr<const field_table> fields_;
  uint32_t num_records_ = 0;
  uint16_t header_length_ = 0;
  uint16_t record_length_ = 0;
};

} // namespace dbf

} // namespace geoshp
