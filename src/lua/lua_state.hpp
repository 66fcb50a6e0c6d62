#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

struct lua_State;

namespace hf::lua {

/// RAII wrapper around a Lua 5.0 state used to run tuning scripts.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Register LOG / WARN / SPEW / ALERT routed to spdlog.
    void register_logging();

    void set_global_number(const char* name, double value);

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    // Table access. Each reader looks up `field` in the table at
    // `table_index` and leaves the stack balanced. A missing field returns
    // nullopt; a field of the wrong type also returns nullopt and sets
    // `type_error` when given.

    std::optional<double> get_number_field(int table_index, const char* field,
                                           bool* type_error = nullptr) const;
    std::optional<bool> get_bool_field(int table_index, const char* field,
                                       bool* type_error = nullptr) const;

    /// Push global `name` if it is a table and return true; otherwise push
    /// nothing and return false.
    bool push_global_table(const char* name) const;

    /// Push `table[field]` if it is a table and return true; otherwise push
    /// nothing and return false.
    bool push_table_field(int table_index, const char* field) const;

    /// Pop n values.
    void pop(int n = 1) const;

private:
    Result<void> run_loaded(int load_status);

    lua_State* L_ = nullptr;
};

} // namespace hf::lua
