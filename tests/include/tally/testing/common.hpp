#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/wait.h>

namespace tally::testing {

inline tally::schema::amount_t make_amount(const std::string_view text) {
  auto value = tally::schema::amount_t::try_parse(text);
  if (!value) {
    throw std::invalid_argument("bad test amount");
  }
  return *value;
}

inline tally::schema::transaction_t make_deposit(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx,
    const std::string_view amount) {
  return tally::schema::transaction_t{
      .payload = tally::schema::deposit_t{
          .client_id = client, .tx_id = tx, .amount = make_amount(amount)}};
}

inline tally::schema::transaction_t make_withdrawal(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx,
    const std::string_view amount) {
  return tally::schema::transaction_t{
      .payload = tally::schema::withdrawal_t{
          .client_id = client, .tx_id = tx, .amount = make_amount(amount)}};
}

inline tally::schema::transaction_t make_dispute(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t reference) {
  return tally::schema::transaction_t{
      .payload = tally::schema::dispute_t{.client_id = client,
                                          .reference_id = reference}};
}

inline tally::schema::transaction_t make_resolve(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t reference) {
  return tally::schema::transaction_t{
      .payload = tally::schema::resolve_t{.client_id = client,
                                          .reference_id = reference}};
}

inline tally::schema::transaction_t make_chargeback(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t reference) {
  return tally::schema::transaction_t{
      .payload = tally::schema::chargeback_t{.client_id = client,
                                             .reference_id = reference}};
}

inline tally::schema::raw_record_t make_record(
    std::vector<std::string> fields,
    const uint64_t line = 2) {
  return tally::schema::raw_record_t{.line = line, .fields = std::move(fields)};
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     ".csv");
  return path.string();
}

inline void write_file(const std::string& path, const std::string_view body) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out << body;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

/// Run `command` through the shell; returns its exit status (-1 when it did
/// not exit normally) and everything it wrote to stdout.
inline std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

}  // namespace tally::testing
