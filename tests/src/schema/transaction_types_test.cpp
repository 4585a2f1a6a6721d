#include <gtest/gtest.h>
#include <tally/schema/account_state.hpp>
#include <tally/schema/processed_transaction.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <tally/testing/common.hpp>

TEST(transaction_types, defaults_are_stable) {
  auto tx = tally::schema::transaction_t{};
  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.sequence, 0u);
  EXPECT_TRUE(std::holds_alternative<tally::schema::deposit_t>(tx.payload));

  auto account = tally::schema::account_state_t{};
  EXPECT_FALSE(account.locked);
  EXPECT_TRUE(account.total().is_zero());

  auto processed = tally::schema::processed_transaction_t{};
  EXPECT_FALSE(processed.disputed);
  EXPECT_FALSE(processed.charged_back);
}

TEST(transaction_types, accessors_follow_active_payload) {
  auto deposit = tally::testing::make_deposit(3, 17, "2.5");
  EXPECT_EQ(tally::schema::kind(deposit),
            tally::schema::transaction_kind_t::deposit);
  EXPECT_EQ(tally::schema::client_id(deposit), 3u);
  EXPECT_EQ(tally::schema::reference_id(deposit), 17u);
  ASSERT_TRUE(tally::schema::amount(deposit).has_value());
  EXPECT_EQ(tally::schema::amount(deposit)->to_string(), "2.5000");

  auto chargeback = tally::testing::make_chargeback(4, 17);
  EXPECT_EQ(tally::schema::kind(chargeback),
            tally::schema::transaction_kind_t::chargeback);
  EXPECT_EQ(tally::schema::client_id(chargeback), 4u);
  EXPECT_EQ(tally::schema::reference_id(chargeback), 17u);
  EXPECT_FALSE(tally::schema::amount(chargeback).has_value());
}

TEST(transaction_types, kind_tokens_are_case_insensitive) {
  using tally::schema::transaction_kind_t;
  EXPECT_EQ(tally::schema::try_parse_transaction_kind("withdrawal").value(),
            transaction_kind_t::withdrawal);
  EXPECT_EQ(tally::schema::try_parse_transaction_kind("ChargeBack").value(),
            transaction_kind_t::chargeback);
  EXPECT_FALSE(tally::schema::try_parse_transaction_kind("refund").has_value());
  EXPECT_EQ(tally::schema::to_string(transaction_kind_t::resolve), "resolve");
}

TEST(transaction_types, error_codes_have_names) {
  EXPECT_EQ(tally::schema::to_string(
                tally::schema::transaction_error_code::insufficient_funds),
            "insufficient_funds");
  EXPECT_EQ(tally::schema::to_string(
                tally::schema::transaction_error_code::balance_overflow),
            "balance_overflow");
}
