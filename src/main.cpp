#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <schemata/assets/asset_class.hpp>
#include <schemata/iface/conformance.hpp>
#include <schemata/schema/encoding/scale/encoder.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

bool write_file(const std::filesystem::path& path,
                const schemata::schema::bytes_t& bytes) {
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    spdlog::error("failed to write {}", path.string());
    return false;
  }
  spdlog::info("wrote {} ({} bytes)", path.string(), bytes.size());
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto output_dir = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Schemata"};
  description.add_options()("help,h", "Show the help message")(
      "output-dir,o",
      boost::program_options::value<std::string>(&output_dir)
          ->default_value("."),
      "Directory the schema, binding and library files are written to")(
      "log-file,l", boost::program_options::value<std::string>(&log_file),
      "Also log to this file")("disassemble,d",
                               "Log a listing of every validation library")(
      "check,c", "Check every binding against its interface")(
      "verbose,v", "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "schemata", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto directory = std::filesystem::path{output_dir};
  auto ec = std::error_code{};
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    spdlog::error("cannot create {}: {}", directory.string(), ec.message());
    spdlog::shutdown();
    return 1;
  }

  auto encoder = schemata::schema::encoding::scale_encoder_t{};
  auto written = std::set<schemata::schema::lib_id_t>{};
  auto ok = true;

  for (const auto& asset : schemata::assets::all_asset_classes()) {
    const auto& kit = schemata::assets::kit_of(asset);
    spdlog::info("{}: schema {}", kit.schema.name,
                 schemata::schema::to_hex(
                     schemata::schema::make_schema_id(kit.schema)));

    ok &= write_file(directory / (kit.schema.name + ".schema"),
                     encoder.encode(kit.schema));
    ok &= write_file(
        directory / (kit.schema.name + "-" + kit.iface.name + ".binding"),
        encoder.encode(kit.binding));

    for (const auto& lib : kit.scripts) {
      if (!written.insert(schemata::vm::make_lib_id(lib)).second) {
        continue;
      }
      ok &= write_file(directory / (lib.name + ".lib"), encoder.encode(lib));
      if (vm.contains("disassemble")) {
        for (const auto& line : schemata::vm::disassemble(lib)) {
          spdlog::info("{}: {}", lib.name, line);
        }
      }
    }

    if (vm.contains("check")) {
      auto mismatch = schemata::iface::check_conformance(
          kit.iface, kit.binding, kit.schema, kit.scripts);
      if (mismatch) {
        ok = false;
        spdlog::error("{} does not implement {}", kit.schema.name,
                      kit.iface.name);
      } else {
        spdlog::info("{} implements {}", kit.schema.name, kit.iface.name);
      }
    }
  }

  spdlog::shutdown();
  return ok ? 0 : 1;
}
