#pragma once

#include <schemata/contract/issue_error.hpp>
#include <schemata/contract/operation_builder.hpp>
#include <schemata/schema/operation.hpp>

#include <string>
#include <variant>

namespace schemata::contract {

struct issued_contract final {
  schemata::schema::genesis_t genesis;
  schemata::schema::contract_id_t contract_id{};
};

using issued_contract_t = issued_contract;
using issue_result_t = std::variant<issued_contract_t, issue_error_t>;

/// Builds the genesis of a new contract.
///
/// Fungible outputs get blindings that sum to zero per type, which is what
/// lets the genesis program check them against the declared supply. The
/// seed defaults to a hash of schema id, timestamp and issuer, so equal
/// parameters give an equal contract id.
class contract_builder final : public operation_builder<contract_builder> {
 public:
  contract_builder(schemata::schema::contract_schema_t schema,
                   schemata::schema::interface_binding_t binding,
                   schemata::schema::type_catalog catalog);

  contract_builder& set_timestamp(schemata::schema::timestamp_t timestamp);
  contract_builder& set_issuer(std::string issuer);
  contract_builder& set_testnet(bool testnet);

  issue_result_t issue_contract() const;

 private:
  schemata::schema::timestamp_t timestamp_{};
  std::string issuer_;
  bool testnet_{true};
};

}  // namespace schemata::contract
