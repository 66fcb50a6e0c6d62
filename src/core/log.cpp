#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace hf::log {

void init(const std::filesystem::path& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>(
        "hordeflow", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("HordeFlow v0.1.0");
}

void shutdown() {
    spdlog::shutdown();
}

/// Join all script arguments into one message. Non-string values are
/// rendered by type so a stray table argument never aborts the log call.
static std::string lua_concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        if (i > 1) result += ' ';
        if (lua_isnil(L, i)) {
            result += "nil";
        } else if (lua_isboolean(L, i)) {
            result += lua_toboolean(L, i) ? "true" : "false";
        } else if (lua_isstring(L, i)) {
            result += lua_tostring(L, i);
        } else {
            result += lua_typename(L, lua_type(L, i));
        }
    }
    return result;
}

int l_LOG(lua_State* L) {
    spdlog::info("[script] {}", lua_concat_args(L));
    return 0;
}

int l_WARN(lua_State* L) {
    spdlog::warn("[script] {}", lua_concat_args(L));
    return 0;
}

int l_SPEW(lua_State* L) {
    spdlog::debug("[script] {}", lua_concat_args(L));
    return 0;
}

int l_ALERT(lua_State* L) {
    spdlog::error("[script] {}", lua_concat_args(L));
    return 0;
}

} // namespace hf::log
