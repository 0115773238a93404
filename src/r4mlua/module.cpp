#include <sol/sol.hpp>

#include "r4mlua/lua_tracer.hpp"

#if defined(_WIN32)
#define R4MW4TCH_LUA_EXPORT __declspec(dllexport)
#else
#define R4MW4TCH_LUA_EXPORT __attribute__((visibility("default")))
#endif

// entry point for require("r4mw4tch")
extern "C" R4MW4TCH_LUA_EXPORT int luaopen_r4mw4tch(lua_State* L) {
  return sol::stack::call_lua(L, 1, r4mw4tch::lua::open_module);
}
