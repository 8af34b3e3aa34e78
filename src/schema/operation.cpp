#include <schemata/blake3/hash.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/operation.hpp>

namespace schemata::schema {

namespace {

constexpr auto kGenesisContext = std::string_view{"schemata.genesis.v1"};
constexpr auto kTransitionContext = std::string_view{"schemata.transition.v1"};

assignments_t conceal_all(const assignments_t& assignments) {
  auto concealed = assignments_t{};
  for (const auto& [type, items] : assignments) {
    auto& out = concealed[type];
    out.reserve(items.size());
    for (const auto& item : items) {
      out.push_back(assignment_t{.seal = item.seal, .state = conceal(item.state)});
    }
  }
  return concealed;
}

void collect(const op_id_t& op,
             const assignments_t& assignments,
             std::map<opout_t, assignment_t>& out) {
  for (const auto& [type, items] : assignments) {
    for (std::size_t i = 0; i < items.size(); ++i) {
      out.emplace(opout_t{.op = op,
                          .type = type,
                          .index = static_cast<uint16_t>(i)},
                  items[i]);
    }
  }
}

}  // namespace

contract_id_t make_contract_id(const genesis_t& genesis) {
  auto concealed = genesis;
  concealed.assignments = conceal_all(genesis.assignments);
  auto encoder = encoding::scale_encoder_t{};
  return schemata::blake3::tagged_hash(kGenesisContext,
                                       encoder.encode(concealed));
}

op_id_t make_operation_id(const transition_t& transition) {
  auto concealed = transition;
  concealed.assignments = conceal_all(transition.assignments);
  auto encoder = encoding::scale_encoder_t{};
  return schemata::blake3::tagged_hash(kTransitionContext,
                                       encoder.encode(concealed));
}

std::map<opout_t, assignment_t> outputs_of(const genesis_t& genesis) {
  auto out = std::map<opout_t, assignment_t>{};
  collect(make_contract_id(genesis), genesis.assignments, out);
  return out;
}

std::map<opout_t, assignment_t> outputs_of(const transition_t& transition) {
  auto out = std::map<opout_t, assignment_t>{};
  collect(make_operation_id(transition), transition.assignments, out);
  return out;
}

}  // namespace schemata::schema
