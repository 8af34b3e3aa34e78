#include <schemata/blake3/hash.hpp>
#include <schemata/contract/contract_builder.hpp>

#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>

using namespace schemata::schema;

namespace schemata::contract {

namespace {

constexpr auto kGenesisSeedContext =
    std::string_view{"schemata.genesis-blinding-seed.v1"};

}  // namespace

contract_builder::contract_builder(contract_schema_t schema,
                                   interface_binding_t binding,
                                   type_catalog catalog)
    : operation_builder{builder_state{std::move(schema), std::move(binding),
                                      std::move(catalog)}} {}

contract_builder& contract_builder::set_timestamp(const timestamp_t timestamp) {
  timestamp_ = timestamp;
  return *this;
}

contract_builder& contract_builder::set_issuer(std::string issuer) {
  issuer_ = std::move(issuer);
  return *this;
}

contract_builder& contract_builder::set_testnet(const bool testnet) {
  testnet_ = testnet;
  return *this;
}

issue_result_t contract_builder::issue_contract() const {
  if (state_.error()) {
    return *state_.error();
  }

  auto genesis = genesis_t{};
  genesis.schema_id = make_schema_id(state_.schema());
  genesis.timestamp = timestamp_;
  genesis.issuer = issuer_;
  genesis.testnet = testnet_;
  genesis.globals = state_.globals();

  auto seed = seed_;
  if (!seed) {
    auto timestamp = std::array<uint8_t, 8>{};
    boost::endian::store_little_u64(timestamp.data(),
                                    static_cast<uint64_t>(timestamp_));
    seed = schemata::blake3::hasher{kGenesisSeedContext}
               .update(genesis.schema_id)
               .update(timestamp)
               .update(std::string_view{issuer_})
               .finalize();
  }
  genesis.assignments = state_.assignments(*seed, {});

  auto contract_id = make_contract_id(genesis);
  spdlog::debug("issued '{}' contract {}", state_.schema().name,
                to_hex(contract_id));
  return issued_contract_t{.genesis = std::move(genesis),
                           .contract_id = contract_id};
}

}  // namespace schemata::contract
