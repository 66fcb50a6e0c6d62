#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

struct lua_State;

namespace hf::log {

/// Install the default "hordeflow" logger with a console sink and,
/// when log_file is non-empty, a truncating file sink.
void init(const std::filesystem::path& log_file = "hordeflow.log");

/// Flush and shutdown logging.
void shutdown();

// Logging functions exposed to tuning scripts as LOG/WARN/SPEW/ALERT.
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace hf::log
