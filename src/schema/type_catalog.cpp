#include <schemata/blake3/hash.hpp>
#include <schemata/common/critical.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>
#include <schemata/schema/type_catalog.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace schemata::schema {

namespace {

constexpr auto kSemanticTypeContext =
    std::string_view{"schemata.semantic-type.v1"};
constexpr auto kTypeSystemContext = std::string_view{"schemata.type-system.v1"};

}  // namespace

sem_id_t make_sem_id(const type_definition_t& definition) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(definition);
  return schemata::blake3::tagged_hash(kSemanticTypeContext, encoded);
}

type_system_id_t make_type_system_id(const type_system_t& system) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(system);
  return schemata::blake3::tagged_hash(kTypeSystemContext, encoded);
}

bool type_catalog::add(type_definition_t definition) {
  auto existing = types_.find(definition.name);
  if (existing != std::end(types_)) {
    if (existing->second.definition.layout != definition.layout) {
      spdlog::warn("type '{}' already registered with another layout",
                   definition.name);
      return false;
    }
    return true;
  }
  auto id = make_sem_id(definition);
  auto name = definition.name;
  types_.emplace(std::move(name),
                 entry_t{.definition = std::move(definition), .id = id});
  return true;
}

std::optional<sem_id_t> type_catalog::resolve(
    const std::string_view name) const {
  auto it = types_.find(name);
  if (it == std::end(types_)) {
    return std::nullopt;
  }
  return it->second.id;
}

sem_id_t type_catalog::get(const std::string_view name) const {
  auto id = resolve(name);
  if (!id) {
    schemata::common::critical("unknown semantic type '{}'", name);
  }
  return *id;
}

std::optional<std::string_view> type_catalog::name_of(
    const sem_id_t& id) const {
  for (const auto& [name, entry] : types_) {
    if (entry.id == id) {
      return std::string_view{name};
    }
  }
  return std::nullopt;
}

bool type_catalog::contains(const std::string_view name) const {
  return types_.find(name) != std::end(types_);
}

std::size_t type_catalog::size() const {
  return types_.size();
}

type_system_t type_catalog::type_system() const {
  auto system = type_system_t{};
  system.types.reserve(types_.size());
  for (const auto& [name, entry] : types_) {
    system.types.emplace_back(name, entry.id);
  }
  return system;
}

type_catalog standard_types() {
  static const auto kDefinitions = std::array{
      type_definition_t{"RGBContract.Amount", "u64"},
      type_definition_t{"RGBContract.Precision",
                        "enum u8 {indivisible=0, deci, centi, milli, "
                        "deci_milli, centi_milli, micro, deci_micro, "
                        "centi_micro, nano, deci_nano, centi_nano, pico, "
                        "deci_pico, centi_pico, femto, deci_femto, "
                        "centi_femto, atto=18}"},
      type_definition_t{"RGBContract.Ticker", "str(1..8)"},
      type_definition_t{"RGBContract.Name", "str(1..40)"},
      type_definition_t{"RGBContract.Details", "str(1..255)"},
      type_definition_t{"RGBContract.Article", "str(1..40)"},
      type_definition_t{"RGBContract.Attachment",
                        "struct {type: str, digest: [u8; 32]}"},
      type_definition_t{"RGBContract.AssetSpec",
                        "struct {ticker: Ticker, name: Name, "
                        "details: option<Details>, precision: Precision}"},
      type_definition_t{"RGBContract.ContractTerms",
                        "struct {text: str, media: option<Attachment>}"},
      type_definition_t{"RGB21.TokenIndex", "u32"},
      type_definition_t{"RGB21.OwnedFraction", "u64"},
      type_definition_t{"RGB21.Allocation",
                        "struct {index: TokenIndex, fraction: OwnedFraction}"},
      type_definition_t{"RGB21.EmbeddedMedia",
                        "struct {type: str, data: bytes}"},
      type_definition_t{"RGB21.TokenData",
                        "struct {index: TokenIndex, ticker: option<Ticker>, "
                        "name: option<Name>, details: option<Details>, "
                        "preview: option<EmbeddedMedia>, "
                        "media: option<Attachment>}"},
      type_definition_t{"RGB21.AttachmentType", "struct {id: u8, name: str}"},
  };

  auto catalog = type_catalog{};
  for (const auto& definition : kDefinitions) {
    if (!catalog.add(definition)) {
      schemata::common::critical("standard type catalog is inconsistent");
    }
  }
  return catalog;
}

}  // namespace schemata::schema
