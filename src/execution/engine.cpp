#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>
#include <tally/execution/engine.hpp>
#include <utility>

using namespace tally::schema;

namespace {

constexpr auto kDepositCodespace = std::string_view{"tally.deposit"};
constexpr auto kWithdrawalCodespace = std::string_view{"tally.withdrawal"};
constexpr auto kDisputeCodespace = std::string_view{"tally.dispute"};
constexpr auto kResolveCodespace = std::string_view{"tally.resolve"};
constexpr auto kChargebackCodespace = std::string_view{"tally.chargeback"};

transaction_result_t make_rejection(const transaction_error_code code,
                                    const std::string_view codespace,
                                    std::string log) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_success(const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.codespace = std::string{codespace};
  return result;
}

std::string_view codespace_for(const transaction_kind_t kind) {
  switch (kind) {
    case transaction_kind_t::deposit:
      return kDepositCodespace;
    case transaction_kind_t::withdrawal:
      return kWithdrawalCodespace;
    case transaction_kind_t::dispute:
      return kDisputeCodespace;
    case transaction_kind_t::resolve:
      return kResolveCodespace;
    case transaction_kind_t::chargeback:
      return kChargebackCodespace;
  }
  return "tally";
}

}  // namespace

namespace tally::execution {

transaction_result_t engine::apply(const transaction_t& tx) {
  auto result = transaction_result_t{};
  try {
    result = std::visit(
        overloaded{
            [&](const deposit_t& value) { return apply_deposit(value); },
            [&](const withdrawal_t& value) { return apply_withdrawal(value); },
            [&](const dispute_t& value) { return apply_dispute(value); },
            [&](const resolve_t& value) { return apply_resolve(value); },
            [&](const chargeback_t& value) {
              return apply_chargeback(value);
            }},
        tx.payload);
  } catch (const std::overflow_error& ex) {
    result = make_rejection(transaction_error_code::balance_overflow,
                            codespace_for(kind(tx)), ex.what());
  }

  if (result.code != 0) {
    spdlog::debug(
        "Rejected {} tx={} client={} (line {}): {} [{}]", to_string(kind(tx)),
        reference_id(tx), client_id(tx), tx.sequence, result.log,
        to_string(static_cast<transaction_error_code>(result.code)));
  }
  return result;
}

std::vector<account_state_t> engine::snapshot() const {
  auto out = std::vector<account_state_t>{};
  out.reserve(discovery_order_.size());
  for (const auto client : discovery_order_) {
    out.push_back(accounts_.at(client));
  }
  return out;
}

std::optional<account_state_t> engine::account(
    const client_id_t client_id) const {
  if (auto it = accounts_.find(client_id); it != std::end(accounts_)) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<processed_transaction_t> engine::processed_transaction(
    const transaction_id_t tx_id) const {
  if (auto it = processed_.find(tx_id); it != std::end(processed_)) {
    return it->second;
  }
  return std::nullopt;
}

transaction_result_t engine::apply_deposit(const deposit_t& deposit) {
  auto& account = open_account(deposit.client_id);
  if (processed_.contains(deposit.tx_id)) {
    return make_rejection(transaction_error_code::duplicate_transaction,
                          kDepositCodespace,
                          "transaction id already applied");
  }
  if (account.locked) {
    return make_rejection(transaction_error_code::account_locked,
                          kDepositCodespace, "account is locked");
  }

  account.available = account.available + deposit.amount;
  processed_.emplace(deposit.tx_id,
                     processed_transaction_t{
                         .tx_id = deposit.tx_id,
                         .client_id = deposit.client_id,
                         .amount = deposit.amount,
                         .kind = transaction_kind_t::deposit});
  return make_success(kDepositCodespace);
}

transaction_result_t engine::apply_withdrawal(const withdrawal_t& withdrawal) {
  auto& account = open_account(withdrawal.client_id);
  if (processed_.contains(withdrawal.tx_id)) {
    return make_rejection(transaction_error_code::duplicate_transaction,
                          kWithdrawalCodespace,
                          "transaction id already applied");
  }
  if (account.locked) {
    return make_rejection(transaction_error_code::account_locked,
                          kWithdrawalCodespace, "account is locked");
  }
  if (account.available < withdrawal.amount) {
    return make_rejection(
        transaction_error_code::insufficient_funds, kWithdrawalCodespace,
        "available " + account.available.to_string() + " < requested " +
            withdrawal.amount.to_string());
  }

  account.available = account.available - withdrawal.amount;
  processed_.emplace(withdrawal.tx_id,
                     processed_transaction_t{
                         .tx_id = withdrawal.tx_id,
                         .client_id = withdrawal.client_id,
                         .amount = withdrawal.amount,
                         .kind = transaction_kind_t::withdrawal});
  return make_success(kWithdrawalCodespace);
}

transaction_result_t engine::apply_dispute(const dispute_t& dispute) {
  auto rejection = transaction_result_t{};
  auto* original =
      find_reference(dispute.client_id, dispute.reference_id, rejection);
  if (original == nullptr) {
    rejection.codespace = std::string{kDisputeCodespace};
    return rejection;
  }
  if (original->charged_back) {
    return make_rejection(transaction_error_code::already_charged_back,
                          kDisputeCodespace,
                          "referenced transaction was charged back");
  }
  if (original->disputed) {
    return make_rejection(transaction_error_code::already_disputed,
                          kDisputeCodespace,
                          "referenced transaction is already disputed");
  }

  auto& account = accounts_.at(dispute.client_id);
  auto available = account.available - original->amount;
  auto held = account.held + original->amount;
  account.available = std::move(available);
  account.held = std::move(held);
  original->disputed = true;
  return make_success(kDisputeCodespace);
}

transaction_result_t engine::apply_resolve(const resolve_t& resolve) {
  auto rejection = transaction_result_t{};
  auto* original =
      find_reference(resolve.client_id, resolve.reference_id, rejection);
  if (original == nullptr) {
    rejection.codespace = std::string{kResolveCodespace};
    return rejection;
  }
  if (!original->disputed) {
    return make_rejection(transaction_error_code::not_disputed,
                          kResolveCodespace,
                          "referenced transaction is not disputed");
  }

  auto& account = accounts_.at(resolve.client_id);
  auto held = account.held - original->amount;
  auto available = account.available + original->amount;
  account.held = std::move(held);
  account.available = std::move(available);
  original->disputed = false;
  return make_success(kResolveCodespace);
}

transaction_result_t engine::apply_chargeback(const chargeback_t& chargeback) {
  auto rejection = transaction_result_t{};
  auto* original =
      find_reference(chargeback.client_id, chargeback.reference_id, rejection);
  if (original == nullptr) {
    rejection.codespace = std::string{kChargebackCodespace};
    return rejection;
  }
  if (!original->disputed) {
    return make_rejection(transaction_error_code::not_disputed,
                          kChargebackCodespace,
                          "referenced transaction is not disputed");
  }

  auto& account = accounts_.at(chargeback.client_id);
  account.held = account.held - original->amount;
  account.locked = true;
  original->disputed = false;
  original->charged_back = true;
  spdlog::info("Account {} locked by chargeback of tx {}",
               chargeback.client_id, chargeback.reference_id);
  return make_success(kChargebackCodespace);
}

account_state_t& engine::open_account(const client_id_t client_id) {
  auto [it, inserted] = accounts_.try_emplace(
      client_id, account_state_t{.client_id = client_id});
  if (inserted) {
    discovery_order_.push_back(client_id);
  }
  return it->second;
}

processed_transaction_t* engine::find_reference(
    const client_id_t client_id,
    const transaction_id_t reference_id,
    transaction_result_t& rejection) {
  auto it = processed_.find(reference_id);
  if (it == std::end(processed_)) {
    rejection = make_rejection(transaction_error_code::reference_missing, {},
                               "referenced transaction " +
                                   std::to_string(reference_id) +
                                   " was never applied");
    return nullptr;
  }
  if (it->second.client_id != client_id) {
    rejection = make_rejection(transaction_error_code::client_mismatch, {},
                               "referenced transaction belongs to client " +
                                   std::to_string(it->second.client_id));
    return nullptr;
  }
  return &it->second;
}

}  // namespace tally::execution
