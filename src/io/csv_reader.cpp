#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>
#include <spdlog/spdlog.h>
#include <tally/io/csv_reader.hpp>

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::io {

namespace {

constexpr auto kExpectedHeader =
    std::array<std::string_view, 4>{"type", "client", "tx", "amount"};

constexpr auto kUtf8Bom = std::string_view{"\xEF\xBB\xBF"};

// Fields split on ',' with optional double-quote enclosure; no escape
// character, so a backslash is taken literally.
std::vector<std::string> split_fields(const std::string& line) {
  using separator_t = boost::escaped_list_separator<char>;
  auto tokens = boost::tokenizer<separator_t>{
      line, separator_t{std::string{}, std::string{","}, std::string{"\""}}};

  auto fields = std::vector<std::string>{};
  for (auto field : tokens) {
    boost::algorithm::trim(field);
    fields.push_back(std::move(field));
  }
  return fields;
}

}  // namespace

csv_reader::csv_reader(const std::filesystem::path& path) : file_{path} {
  if (!file_.is_open()) {
    throw std::runtime_error("cannot open input file '" + path.string() +
                             "'");
  }
  input_ = &file_;
  spdlog::debug("Reading transactions from '{}'", path.string());
}

csv_reader::csv_reader(std::istream& input) : input_{&input} {}

bool csv_reader::next(tally::schema::raw_record_t& record) {
  if (!header_read_) {
    read_header();
  }

  auto line = std::string{};
  while (read_line(line)) {
    boost::algorithm::trim(line);
    if (line.empty()) {
      continue;
    }
    record.line = line_;
    record.fields = split_fields(line);
    return true;
  }
  return false;
}

bool csv_reader::read_line(std::string& out) {
  if (!std::getline(*input_, out)) {
    if (input_->bad()) {
      throw std::runtime_error("read failure after line " +
                               std::to_string(line_));
    }
    return false;
  }
  ++line_;
  if (line_ == 1 && boost::algorithm::starts_with(out, kUtf8Bom)) {
    out.erase(0, kUtf8Bom.size());
  }
  return true;
}

void csv_reader::read_header() {
  header_read_ = true;
  auto line = std::string{};
  while (read_line(line)) {
    boost::algorithm::trim(line);
    if (line.empty()) {
      continue;
    }
    auto fields = split_fields(line);
    auto matches = fields.size() == kExpectedHeader.size();
    for (std::size_t i = 0; matches && i < fields.size(); ++i) {
      matches = boost::algorithm::iequals(fields[i], kExpectedHeader[i]);
    }
    if (!matches) {
      throw std::runtime_error("line " + std::to_string(line_) +
                               ": expected header 'type,client,tx,amount'");
    }
    return;
  }
}

}  // namespace tally::io
