#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace ipsec::log {

constexpr std::string_view Name = "ipsec";

// The library logger. Created on first use with no sinks attached and registered with
// spdlog under Name, so nothing is emitted until the host attaches a sink.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

// Not synchronized with logging. Attach sinks during setup, before other threads use the library.
void attachSink(const spdlog::sink_ptr& sink);
void setLevel(spdlog::level::level_enum level);

}
