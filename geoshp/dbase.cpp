#include "dbase.hpp"

#include <algorithm>

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/log/trivial.hpp>
#include <boost/utility/string_ref.hpp>

#include "byte_cursor.hpp"
#include "error.hpp"
#include "utility.hpp"

BOOST_FUSION_ADAPT_STRUCT(
  geoshp::dbf::date,
  (int, year)
  (int, month)
  (int, day)
)

namespace geoshp {

namespace dbf {

namespace {

// YYYYMMDD
template <class It>
struct date_parser : qi::grammar<It, date()> {
  date_parser() : date_parser::base_type(start) {
    start %= qi::uint_parser<int, 10, 4, 4>() >>
             qi::uint_parser<int, 10, 2, 2>() >>
             qi::uint_parser<int, 10, 2, 2>();
  }
  qi::rule<It, date()> start;
};

field_descriptor parse_descriptor(const detail::field_descriptor& raw) {
  boost::string_ref name(raw.name, sizeof(raw.name));
  name = name.substr(0, std::min(name.find('\0'), name.size()));
  return {
    name.to_string(),
    static_cast<field_type>(raw.type),
    raw.length,
    raw.decimal_count
  };
}

} // namespace

value::operator int() const {
  return extract<int>(text_);
}

value::operator double() const {
  return extract<double>(text_);
}

value::operator date() const {
  using iterator = std::string::const_iterator;
  return extract<date, date_parser<iterator>>(text_);
}

long long value::as_int64() const {
  return extract<long long>(text_);
}

bool value::as_bool() const {
  return !text_.empty() && std::string("TtYy").find(text_[0]) != std::string::npos;
}

bool record::has(const std::string& name) const {
  return std::any_of(fields_->begin(), fields_->end(),
    [&name](const field_descriptor& f) { return f.name == name; });
}

value record::operator[](std::size_t i) const {
  if (i >= values_.size()) {
    throw index_out_of_range("field " + std::to_string(i) + " outside [0, " +
                             std::to_string(values_.size()) + ")");
  }
  return {(*fields_)[i], values_[i]};
}

value record::operator[](const std::string& name) const {
  for (std::size_t i = 0; i < fields_->size(); ++i) {
    if ((*fields_)[i].name == name) {
      return (*this)[i];
    }
  }
  throw index_out_of_range("no field named " + name);
}

dbase_reader::dbase_reader(std::unique_ptr<byte_cursor> in)
    : in_(std::move(in)) {
  if (in_->size() < int64_t(sizeof(detail::header))) {
    throw malformed_header("dbase file is shorter than its header");
  }
  const detail::header header = in_->read<detail::header>();
  num_records_ = header.num_records;
  header_length_ = header.header_length;
  record_length_ = header.record_length;
  if (header_length_ < sizeof(detail::header) + 1 ||
      header_length_ > in_->size() || record_length_ < 1) {
    throw malformed_header("bad dbase header: header length " +
                           std::to_string(header_length_) +
                           ", record length " +
                           std::to_string(record_length_));
  }

  const std::vector<char> block =
    in_->read_bytes(header_length_ - sizeof(detail::header));
  const char* current = block.data();
  const char* last = block.data() + block.size();
  std::shared_ptr<field_table> fields = std::make_shared<field_table>();
  std::size_t width = 1;
  while (current != last && *current != detail::header_terminator) {
    const detail::field_descriptor* raw =
      as<detail::field_descriptor>(current, last);
    if (raw == nullptr) {
      throw malformed_header("dbase field descriptors are not terminated");
    }
    fields->push_back(parse_descriptor(*raw));
    width += raw->length;
    current += sizeof(detail::field_descriptor);
  }
  if (width > record_length_) {
    throw malformed_header("dbase fields span " + std::to_string(width) +
                           " bytes of a " + std::to_string(record_length_) +
                           " byte record");
  }
  fields_ = fields;

  BOOST_LOG_TRIVIAL(debug) << "opened dbase table of " << num_records_
                           << " records, " << fields_->size() << " fields";
}

dbase_reader::~dbase_reader() = default;

record dbase_reader::read_record(int64_t ordinal) const {
  if (ordinal < 0 || ordinal >= int64_t(num_records_)) {
    throw index_out_of_range("dbase record " + std::to_string(ordinal) +
                             " outside [0, " + std::to_string(num_records_) +
                             ")");
  }

  std::vector<char> row;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_) {
      throw reader_closed("dbase reader is closed");
    }
    in_->seek(header_length_ + ordinal * record_length_);
    row = in_->read_bytes(record_length_);
  }

  std::vector<std::string> values;
  values.reserve(fields_->size());
  const char* current = row.data() + 1;
  for (const field_descriptor& field : *fields_) {
    values.push_back(trim(std::string(current, current + field.length)));
    current += field.length;
  }
  return {fields_, std::move(values), row[0] == detail::deleted_flag};
}

void dbase_reader::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  in_.reset();
}

} // namespace dbf

} // namespace geoshp
