// exit_registry.hpp
// Stop hooks for background threads, run from std::atexit so that a process
// which never tears its clients down still stops them before exiting.
#pragma once

#include <cstdint>
#include <functional>

namespace aircast {

using ExitHookId = std::uint64_t;

// Hooks run once, newest first, on normal process exit.
ExitHookId register_exit_hook(std::function<void()> hook);

// Drop a hook once its owner has stopped by itself. Unknown ids are ignored.
void unregister_exit_hook(ExitHookId id);

// Run and clear every registered hook now.
void run_exit_hooks();

} // namespace aircast
