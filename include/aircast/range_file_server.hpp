// range_file_server.hpp
// A minimal HTTP server that serves exactly the files it was given, by base
// name, to (optionally) a single client address. Supports HEAD and GET with a
// single byte range, which is all a receiver needs to seek in a video.
#pragma once

#include "aircast/exit_registry.hpp"
#include "aircast/socket_io.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace aircast {

// Inclusive byte offsets.
struct RangeSpec {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
};

struct RangeRequest {
    enum class Kind {
        whole_file,    // no header, or one we cannot parse
        single,        // one satisfiable span, clamped to the file
        multiple,      // more than one disjoint span
        unsatisfiable, // every span starts at or past EOF
        invalid        // a span with first > last
    };

    Kind kind = Kind::whole_file;
    RangeSpec span;
};

// Interpret a Range header value against a file of `file_size` bytes.
// Overlapping or adjacent spans are merged before counting them.
RangeRequest parse_range_header(std::string_view value, std::uint64_t file_size);

struct ServedFile {
    std::string basename;
    std::filesystem::path path;
};

class RangeFileServer {
public:
    // Throws std::invalid_argument for directories and for two different
    // files sharing a base name. URLs only ever carry the base name, so the
    // served layout never leaks and the names must be unique.
    // A connection that has not sent a complete request within
    // `request_timeout` is closed.
    explicit RangeFileServer(const std::vector<std::string> &paths,
                             std::optional<std::string> allowed_host = std::nullopt,
                             std::chrono::milliseconds request_timeout = std::chrono::seconds(10));
    ~RangeFileServer();

    RangeFileServer(const RangeFileServer &) = delete;
    RangeFileServer &operator=(const RangeFileServer &) = delete;

    // Bind an ephemeral port on a background thread and return the bound
    // address once listening. Further calls return the same address.
    tcp::endpoint start();

    // Close the listener and join the accept thread. Requests already being
    // served run to completion on their own threads.
    void stop();

    // Deduplicated, in the order given.
    const std::vector<ServedFile> &files() const { return files_; }

private:
    struct AccessList {
        std::map<std::string, std::filesystem::path> allowed;
        std::optional<std::string> allowed_host;
        std::chrono::milliseconds request_timeout{0};
    };

    void run(std::promise<tcp::endpoint> &bound);
    void do_accept();

    static void serve_connection(net::io_context &ioc, tcp::socket &socket, const AccessList &access);

    std::vector<ServedFile> files_;
    std::shared_ptr<const AccessList> access_;

    net::io_context ioc_;
    std::optional<tcp::acceptor> acceptor_;

    std::mutex lifecycle_lock_;
    std::thread worker_;
    std::optional<tcp::endpoint> bound_;
    bool stopped_ = false;
    std::optional<ExitHookId> exit_hook_;
};

} // namespace aircast
