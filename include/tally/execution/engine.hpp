#pragma once

#include <tally/schema/account_state.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/processed_transaction.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <tally/schema/transaction_result.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tally::execution {

/// Deterministic settlement state machine.
///
/// The engine owns every account and the bookkeeping for applied
/// deposits/withdrawals. Records are applied one at a time in input order;
/// a rejected record leaves all state untouched.
class engine final {
 public:
  engine() = default;

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;
  engine(engine&&) = default;
  engine& operator=(engine&&) = default;

  /// Apply one transaction.
  ///
  /// `code == 0` when the transaction changed state; otherwise `code` holds a
  /// `transaction_error_code` and `log` describes the rejection.
  tally::schema::transaction_result_t apply(
      const tally::schema::transaction_t& tx);

  /// Every account ever created, in the order clients were first seen.
  std::vector<tally::schema::account_state_t> snapshot() const;

  std::optional<tally::schema::account_state_t> account(
      tally::schema::client_id_t client_id) const;

  std::optional<tally::schema::processed_transaction_t> processed_transaction(
      tally::schema::transaction_id_t tx_id) const;

  std::size_t account_count() const { return accounts_.size(); }

 private:
  tally::schema::transaction_result_t apply_deposit(
      const tally::schema::deposit_t& deposit);
  tally::schema::transaction_result_t apply_withdrawal(
      const tally::schema::withdrawal_t& withdrawal);
  tally::schema::transaction_result_t apply_dispute(
      const tally::schema::dispute_t& dispute);
  tally::schema::transaction_result_t apply_resolve(
      const tally::schema::resolve_t& resolve);
  tally::schema::transaction_result_t apply_chargeback(
      const tally::schema::chargeback_t& chargeback);

  /// Return the client's account, creating it with zero balances if unseen.
  tally::schema::account_state_t& open_account(
      tally::schema::client_id_t client_id);

  /// Look up the referenced deposit/withdrawal and check it belongs to
  /// `client_id`. On failure `rejection` is filled and nullptr returned.
  tally::schema::processed_transaction_t* find_reference(
      tally::schema::client_id_t client_id,
      tally::schema::transaction_id_t reference_id,
      tally::schema::transaction_result_t& rejection);

  std::unordered_map<tally::schema::client_id_t,
                     tally::schema::account_state_t>
      accounts_;
  std::vector<tally::schema::client_id_t> discovery_order_;
  std::unordered_map<tally::schema::transaction_id_t,
                     tally::schema::processed_transaction_t>
      processed_;
};

}  // namespace tally::execution
