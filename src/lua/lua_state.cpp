#include "lua/lua_state.hpp"
#include "core/log.hpp"

#include <fstream>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace hf::lua {

LuaState::LuaState() {
    L_ = lua_open();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }

    // Tuning scripts only need arithmetic and tables; no io/os access.
    luaopen_base(L_);
    luaopen_table(L_);
    luaopen_string(L_);
    luaopen_math(L_);
    lua_settop(L_, 0);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::register_logging() {
    register_function("LOG", log::l_LOG);
    register_function("WARN", log::l_WARN);
    register_function("SPEW", log::l_SPEW);
    register_function("ALERT", log::l_ALERT);
}

void LuaState::set_global_number(const char* name, double value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

Result<void> LuaState::run_loaded(int load_status) {
    if (load_status != 0) {
        std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        return Error(std::move(err));
    }

    int status = lua_pcall(L_, 0, 0, 0);
    if (status != 0) {
        std::string err = lua_isstring(L_, -1) ? lua_tostring(L_, -1)
                                                : "unknown Lua error";
        lua_pop(L_, 1);
        return Error(std::move(err));
    }

    return {};
}

Result<void> LuaState::do_string(std::string_view code) {
    if (!L_) return Error("Lua state not initialized");
    return run_loaded(
        luaL_loadbuffer(L_, code.data(), code.size(), "=string"));
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error("Failed to open file: " + path.string());
    }

    // Directories open fine on some platforms but have no usable size
    std::error_code ec;
    auto size = file.tellg();
    if (!fs::is_regular_file(path, ec) || size < 0) {
        return Error("Failed to read file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return Error("Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    if (!L_) return Error("Lua state not initialized");

    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    return run_loaded(luaL_loadbuffer(L_, buf, len, name));
}

std::optional<double> LuaState::get_number_field(int table_index,
                                                 const char* field,
                                                 bool* type_error) const {
    int abs_index = table_index < 0 ? lua_gettop(L_) + table_index + 1
                                    : table_index;
    lua_pushstring(L_, field);
    lua_gettable(L_, abs_index);

    std::optional<double> result;
    if (lua_type(L_, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L_, -1);
    } else if (!lua_isnil(L_, -1) && type_error) {
        *type_error = true;
    }
    lua_pop(L_, 1);
    return result;
}

std::optional<bool> LuaState::get_bool_field(int table_index,
                                             const char* field,
                                             bool* type_error) const {
    int abs_index = table_index < 0 ? lua_gettop(L_) + table_index + 1
                                    : table_index;
    lua_pushstring(L_, field);
    lua_gettable(L_, abs_index);

    std::optional<bool> result;
    if (lua_isboolean(L_, -1)) {
        result = lua_toboolean(L_, -1) != 0;
    } else if (!lua_isnil(L_, -1) && type_error) {
        *type_error = true;
    }
    lua_pop(L_, 1);
    return result;
}

bool LuaState::push_global_table(const char* name) const {
    lua_getglobal(L_, name);
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

bool LuaState::push_table_field(int table_index, const char* field) const {
    int abs_index = table_index < 0 ? lua_gettop(L_) + table_index + 1
                                    : table_index;
    lua_pushstring(L_, field);
    lua_gettable(L_, abs_index);
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

void LuaState::pop(int n) const {
    lua_pop(L_, n);
}

} // namespace hf::lua
