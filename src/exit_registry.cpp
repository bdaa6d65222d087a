#include "aircast/exit_registry.hpp"
#include "aircast/log.hpp"

#include <cstdlib>
#include <exception>
#include <map>
#include <mutex>

namespace aircast {

namespace {

struct Registry {
    std::mutex lock;
    ExitHookId next_id = 1;
    std::map<ExitHookId, std::function<void()>> hooks;
};

void run_at_exit() {
    run_exit_hooks();
}

Registry &registry() {
    static Registry instance;
    // Registered after `instance` is constructed, so the hook runs before its destructor.
    static const bool installed = (std::atexit(run_at_exit) == 0);
    if (!installed) log::error("Exit", "Could not install the exit handler");
    return instance;
}

} // namespace

ExitHookId register_exit_hook(std::function<void()> hook) {
    Registry &r = registry();
    std::lock_guard<std::mutex> lk(r.lock);
    ExitHookId id = r.next_id++;
    r.hooks.emplace(id, std::move(hook));
    return id;
}

void unregister_exit_hook(ExitHookId id) {
    Registry &r = registry();
    std::lock_guard<std::mutex> lk(r.lock);
    r.hooks.erase(id);
}

void run_exit_hooks() {
    std::map<ExitHookId, std::function<void()>> pending;
    {
        Registry &r = registry();
        std::lock_guard<std::mutex> lk(r.lock);
        pending.swap(r.hooks);
    }
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        try {
            it->second();
        } catch (const std::exception &e) {
            log::error("Exit", std::string("Shutdown hook failed: ") + e.what());
        }
    }
}

} // namespace aircast
