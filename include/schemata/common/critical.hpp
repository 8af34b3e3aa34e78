#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace schemata::common {

/// Logs the broken invariant, flushes every sink and stops the process. Used
/// where a built-in schema, library or binding turns out to be inconsistent.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("schemata: {}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(fmt::format_string<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Arg>(arg),
                                        std::forward<Args>(args)...)});
}

}  // namespace schemata::common
