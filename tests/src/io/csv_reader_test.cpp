#include <gtest/gtest.h>
#include <tally/io/csv_reader.hpp>
#include <tally/testing/common.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<tally::schema::raw_record_t> read_all(tally::io::csv_reader& reader) {
  auto records = std::vector<tally::schema::raw_record_t>{};
  auto record = tally::schema::raw_record_t{};
  while (reader.next(record)) {
    records.push_back(record);
  }
  return records;
}

}  // namespace

TEST(csv_reader, trims_fields_and_tracks_lines) {
  auto input = std::istringstream{
      "type, client, tx, amount\n"
      "  deposit ,  1 , 1 ,  1.5  \n"
      "\n"
      "dispute, 1, 1,\r\n"};
  auto reader = tally::io::csv_reader{input};
  auto records = read_all(reader);

  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].line, 2u);
  EXPECT_EQ(records[0].fields,
            (std::vector<std::string>{"deposit", "1", "1", "1.5"}));
  EXPECT_EQ(records[1].line, 4u);
  EXPECT_EQ(records[1].fields,
            (std::vector<std::string>{"dispute", "1", "1", ""}));
}

TEST(csv_reader, accepts_short_dispute_rows) {
  auto input = std::istringstream{"type,client,tx,amount\nresolve,2,9\n"};
  auto reader = tally::io::csv_reader{input};
  auto records = read_all(reader);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].fields.size(), 3u);
}

TEST(csv_reader, unquotes_enclosed_fields) {
  auto input = std::istringstream{
      "\"type\",\"client\",\"tx\",\"amount\"\n"
      "deposit,1,1,\"1.0\"\n"
      "\"withdrawal\", \" 2 \" ,3, \"0.5\"\n"};
  auto reader = tally::io::csv_reader{input};
  auto records = read_all(reader);

  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].fields,
            (std::vector<std::string>{"deposit", "1", "1", "1.0"}));
  EXPECT_EQ(records[1].fields,
            (std::vector<std::string>{"withdrawal", "2", "3", "0.5"}));
}

TEST(csv_reader, drops_byte_order_mark_before_header) {
  auto input = std::istringstream{
      "\xEF\xBB\xBFtype,client,tx,amount\ndeposit,1,1,1\n"};
  auto reader = tally::io::csv_reader{input};
  auto records = read_all(reader);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].line, 2u);
  EXPECT_EQ(records[0].fields[0], "deposit");
}

TEST(csv_reader, header_is_case_insensitive) {
  auto input = std::istringstream{"Type,Client,TX,Amount\ndeposit,1,1,1\n"};
  auto reader = tally::io::csv_reader{input};
  EXPECT_EQ(read_all(reader).size(), 1u);
}

TEST(csv_reader, rejects_wrong_header) {
  auto input = std::istringstream{"deposit,1,1,1\n"};
  auto reader = tally::io::csv_reader{input};
  auto record = tally::schema::raw_record_t{};
  EXPECT_THROW(reader.next(record), std::runtime_error);
}

TEST(csv_reader, empty_input_yields_nothing) {
  auto input = std::istringstream{""};
  auto reader = tally::io::csv_reader{input};
  auto record = tally::schema::raw_record_t{};
  EXPECT_FALSE(reader.next(record));
}

TEST(csv_reader, opens_files_by_path) {
  auto path = tally::testing::make_temp_path("tally_reader");
  tally::testing::write_file(path, "type,client,tx,amount\ndeposit,3,4,2\n");
  {
    auto reader = tally::io::csv_reader{std::filesystem::path{path}};
    auto records = read_all(reader);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].fields[1], "3");
  }
  tally::testing::remove_path(path);
}

TEST(csv_reader, missing_file_throws) {
  EXPECT_THROW(tally::io::csv_reader{
                   std::filesystem::path{"/nonexistent/tally/input.csv"}},
               std::runtime_error);
}
