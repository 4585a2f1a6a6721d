#pragma once
#include <filesystem>
#include <fstream>
#include <istream>
#include <tally/schema/primitives.hpp>

namespace tally::io {

/// Lazy, single-pass reader for `type, client, tx, amount` CSV input.
///
/// The header line is validated on the first call to `next`; a leading UTF-8
/// byte order mark is dropped. Fields are split on ',' (a field may be enclosed
/// in double quotes) and trimmed; blank lines are skipped. Throws
/// `std::runtime_error` when the file cannot be opened, the header is wrong,
/// or the stream fails.
class csv_reader final {
 public:
  explicit csv_reader(const std::filesystem::path& path);
  explicit csv_reader(std::istream& input);

  csv_reader(const csv_reader&) = delete;
  csv_reader& operator=(const csv_reader&) = delete;

  /// Read the next data row. Returns false at end of input.
  bool next(tally::schema::raw_record_t& record);

  /// Line number of the most recently read line.
  uint64_t line() const { return line_; }

 private:
  bool read_line(std::string& out);
  void read_header();

  std::ifstream file_;
  std::istream* input_{nullptr};
  uint64_t line_{};
  bool header_read_{false};
};

}  // namespace tally::io
