#include "aircast/discovery.hpp"
#include "aircast/errors.hpp"
#include "aircast/log.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>

#include <algorithm>
#include <memory>
#include <string>

namespace aircast {

namespace {

constexpr const char *service_type = "_airplay._tcp";

// Shared with the callbacks through their userdata pointer.
struct BrowseContext {
    AvahiSimplePoll *poll = nullptr;
    std::vector<Device> found;
    bool fast = false;
    std::string failure;
};

void resolve_callback(AvahiServiceResolver *r,
                      AvahiIfIndex, AvahiProtocol,
                      AvahiResolverEvent event, const char *name,
                      const char *, const char *, const char *host_name,
                      const AvahiAddress *address, uint16_t port,
                      AvahiStringList *, AvahiLookupResultFlags, void *userdata)
{
    auto *ctx = static_cast<BrowseContext *>(userdata);
    if (event == AVAHI_RESOLVER_FOUND) {
        char addr[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(addr, sizeof(addr), address);
        Device device(addr, port, std::string(name));

        if (std::find(ctx->found.begin(), ctx->found.end(), device) == ctx->found.end()) {
            log::debug("Discover", std::string("Found ") + name + " (" + host_name + ") @ " + device.address());
            ctx->found.push_back(std::move(device));
        }
        if (ctx->fast) avahi_simple_poll_quit(ctx->poll);
    } else {
        log::debug("Discover", std::string("Could not resolve ") + name + ": " +
                                   avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(r))));
    }
    avahi_service_resolver_free(r);
}

void browse_callback(AvahiServiceBrowser *b,
                     AvahiIfIndex interface,
                     AvahiProtocol protocol,
                     AvahiBrowserEvent event,
                     const char *name,
                     const char *type,
                     const char *domain,
                     AvahiLookupResultFlags,
                     void *userdata)
{
    auto *ctx = static_cast<BrowseContext *>(userdata);
    switch (event) {
    case AVAHI_BROWSER_NEW:
        if (!avahi_service_resolver_new(avahi_service_browser_get_client(b), interface, protocol,
                                        name, type, domain, AVAHI_PROTO_INET, (AvahiLookupFlags)0,
                                        resolve_callback, ctx)) {
            log::debug("Discover", std::string("Failed to resolve ") + name);
        }
        break;
    case AVAHI_BROWSER_FAILURE:
        ctx->failure = avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(b)));
        avahi_simple_poll_quit(ctx->poll);
        break;
    default:
        break;
    }
}

struct PollDeleter {
    void operator()(AvahiSimplePoll *p) const { avahi_simple_poll_free(p); }
};
struct ClientDeleter {
    void operator()(AvahiClient *c) const { avahi_client_free(c); }
};
struct BrowserDeleter {
    void operator()(AvahiServiceBrowser *b) const { avahi_service_browser_free(b); }
};

} // namespace

std::vector<Device> discover_devices(std::chrono::milliseconds timeout, bool fast) {
    BrowseContext ctx;
    ctx.fast = fast;

    std::unique_ptr<AvahiSimplePoll, PollDeleter> poll(avahi_simple_poll_new());
    if (!poll) throw ConnectionError("Failed to create the Avahi poll object");
    ctx.poll = poll.get();

    int error = 0;
    std::unique_ptr<AvahiClient, ClientDeleter> client(avahi_client_new(
        avahi_simple_poll_get(poll.get()), (AvahiClientFlags)0, nullptr, nullptr, &error));
    if (!client) throw ConnectionError(std::string("Avahi client error: ") + avahi_strerror(error));

    std::unique_ptr<AvahiServiceBrowser, BrowserDeleter> browser(avahi_service_browser_new(
        client.get(), AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, service_type, nullptr, (AvahiLookupFlags)0,
        browse_callback, &ctx));
    if (!browser) {
        throw ConnectionError(std::string("Avahi browser error: ") +
                              avahi_strerror(avahi_client_errno(client.get())));
    }

    log::debug("Discover", "Scanning for AirPlay devices...");

    // Iterate in short slices so the deadline is honoured without a helper thread.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) break;
        int rc = avahi_simple_poll_iterate(poll.get(), static_cast<int>(std::min<long long>(left.count(), 100)));
        if (rc != 0) break; // quit requested (1) or error (<0)
    }

    if (!ctx.failure.empty()) throw ConnectionError("Avahi browse failed: " + ctx.failure);
    return ctx.found;
}

} // namespace aircast
