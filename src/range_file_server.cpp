// range_file_server.cpp
// Serves an allow-list of local files over HTTP/1.1 with single Range support.
// One thread accepts; every accepted connection is handled on its own
// detached thread that owns its socket and io_context and shares only the
// read-only access list.

#include "aircast/range_file_server.hpp"
#include "aircast/errors.hpp"
#include "aircast/log.hpp"
#include "aircast/url.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace aircast {

namespace beast = boost::beast;
namespace http = beast::http;
namespace fs = std::filesystem;

namespace {

constexpr std::size_t chunk_size = 8192;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

bool parse_offset(std::string_view text, std::uint64_t &out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

// One "first-last", "first-" or "-suffix" spec, before clamping.
struct RawSpec {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
};

struct Connection {
    net::io_context ioc;
    tcp::socket socket{ioc};
};

std::string media_type_for(const fs::path &path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".mp4" || ext == ".m4v") return "video/mp4";
    if (ext == ".mov") return "video/quicktime";
    if (ext == ".m3u8") return "application/vnd.apple.mpegurl";
    if (ext == ".ts") return "video/mp2t";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    return "application/octet-stream";
}

template <class Body>
void finish(tcp::socket &socket, http::response<Body> &res) {
    beast::error_code ec;
    http::write(socket, res, ec);
    if (ec) log::debug("HTTP", "Write failed: " + ec.message());
}

void send_error(tcp::socket &socket, http::status status, unsigned version, const std::string &text,
                const std::string &content_range = {}) {
    http::response<http::string_body> err{status, version};
    err.set(http::field::server, "aircast");
    err.set(http::field::content_type, "text/plain");
    err.set(http::field::connection, "close");
    if (!content_range.empty()) err.set(http::field::content_range, content_range);
    err.body() = text;
    err.prepare_payload();
    finish(socket, err);
}

// Map a request target onto an allow-listed file. Throws AccessError.
const fs::path &resolve_target(beast::string_view target, const std::map<std::string, fs::path> &allowed) {
    std::string path(target.substr(0, target.find('?')));
    path = fs::path(url_decode(path)).lexically_normal().generic_string();
    path.erase(0, path.find_first_not_of('/'));
    while (!path.empty() && path.back() == '/') path.pop_back();

    auto it = allowed.find(path);
    if (it == allowed.end()) throw AccessError("Requested path was not in the allowed list");
    return it->second;
}

// Open the file and return its size. Throws ResourceError.
std::uint64_t open_checked(beast::file &file, const fs::path &path) {
    beast::error_code ec;
    file.open(path.c_str(), beast::file_mode::scan, ec);
    if (ec) throw ResourceError("Unable to open " + path.string() + ": " + ec.message());
    std::uint64_t size = file.size(ec);
    if (ec) throw ResourceError("Unable to stat " + path.string() + ": " + ec.message());
    return size;
}

} // namespace

RangeRequest parse_range_header(std::string_view value, std::uint64_t file_size) {
    RangeRequest whole;
    value = trim(value);

    size_t eq = value.find('=');
    if (eq == std::string_view::npos) return whole;
    std::string unit(trim(value.substr(0, eq)));
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (unit != "bytes") return whole;

    std::vector<RawSpec> raw;
    std::string_view specs = value.substr(eq + 1);
    while (true) {
        size_t comma = specs.find(',');
        std::string_view spec = trim(specs.substr(0, comma));
        if (!spec.empty()) {
            size_t dash = spec.find('-');
            if (dash == std::string_view::npos) return whole;

            std::string_view first_str = trim(spec.substr(0, dash));
            std::string_view last_str = trim(spec.substr(dash + 1));
            RawSpec r;
            std::uint64_t n = 0;
            if (!first_str.empty()) {
                if (!parse_offset(first_str, n)) return whole;
                r.first = n;
            }
            if (!last_str.empty()) {
                if (!parse_offset(last_str, n)) return whole;
                r.last = n;
            }
            if (!r.first && !r.last) return whole;
            raw.push_back(r);
        }
        if (comma == std::string_view::npos) break;
        specs.remove_prefix(comma + 1);
    }
    if (raw.empty()) return whole;

    for (const auto &r : raw) {
        if (r.first && r.last && *r.first > *r.last) return {RangeRequest::Kind::invalid, {}};
    }

    // Clamp to the file, dropping spans that start past the end.
    std::vector<RangeSpec> spans;
    for (const auto &r : raw) {
        RangeSpec span;
        if (!r.first) {
            // suffix: the last N bytes
            if (*r.last == 0 || file_size == 0) continue;
            span.first = *r.last >= file_size ? 0 : file_size - *r.last;
            span.last = file_size - 1;
        } else {
            if (*r.first >= file_size) continue;
            span.first = *r.first;
            span.last = r.last ? std::min(*r.last, file_size - 1) : file_size - 1;
        }
        spans.push_back(span);
    }
    if (spans.empty()) return {RangeRequest::Kind::unsatisfiable, {}};

    std::sort(spans.begin(), spans.end(),
              [](const RangeSpec &a, const RangeSpec &b) { return a.first < b.first; });
    std::vector<RangeSpec> merged{spans.front()};
    for (size_t i = 1; i < spans.size(); ++i) {
        RangeSpec &back = merged.back();
        if (spans[i].first <= back.last + 1) {
            back.last = std::max(back.last, spans[i].last);
        } else {
            merged.push_back(spans[i]);
        }
    }
    if (merged.size() > 1) return {RangeRequest::Kind::multiple, {}};
    return {RangeRequest::Kind::single, merged.front()};
}

RangeFileServer::RangeFileServer(const std::vector<std::string> &paths,
                                 std::optional<std::string> allowed_host,
                                 std::chrono::milliseconds request_timeout) {
    auto access = std::make_shared<AccessList>();
    access->allowed_host = std::move(allowed_host);
    access->request_timeout = request_timeout;

    for (const auto &p : paths) {
        std::error_code ec;
        fs::path real = fs::weakly_canonical(fs::absolute(p, ec), ec);
        if (ec) throw std::invalid_argument("Cannot resolve " + p + ": " + ec.message());

        if (fs::is_directory(real, ec)) {
            throw std::invalid_argument("Directories cannot be served: " + real.string());
        }

        std::string basename = real.filename().string();
        auto existing = access->allowed.find(basename);
        if (existing != access->allowed.end()) {
            if (existing->second == real) continue;
            throw std::invalid_argument(
                "Cannot serve two files with the same name in different directories: " + basename);
        }
        access->allowed.emplace(basename, real);
        files_.push_back(ServedFile{basename, real});
    }

    access_ = std::move(access);
}

RangeFileServer::~RangeFileServer() {
    stop();
}

tcp::endpoint RangeFileServer::start() {
    std::lock_guard<std::mutex> lk(lifecycle_lock_);
    if (stopped_) throw std::logic_error("RangeFileServer cannot be restarted after stop()");
    if (bound_) return *bound_;

    std::promise<tcp::endpoint> bound;
    std::future<tcp::endpoint> published = bound.get_future();
    worker_ = std::thread([this, bound = std::move(bound)]() mutable { run(bound); });

    try {
        bound_ = published.get();
    } catch (...) {
        worker_.join();
        throw;
    }
    exit_hook_ = register_exit_hook([this] { stop(); });

    for (const auto &f : files_) {
        log::debug("HTTP", "Serving " + f.basename + " on port " + std::to_string(bound_->port()));
    }
    return *bound_;
}

void RangeFileServer::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_lock_);
    stopped_ = true;
    if (worker_.joinable()) {
        net::post(ioc_, [this] {
            beast::error_code ec;
            if (acceptor_) acceptor_->close(ec);
        });
        worker_.join();
    }
    if (exit_hook_) {
        unregister_exit_hook(*exit_hook_);
        exit_hook_.reset();
    }
}

void RangeFileServer::run(std::promise<tcp::endpoint> &bound) {
    try {
        acceptor_.emplace(ioc_, tcp::endpoint(tcp::v4(), 0));
        bound.set_value(acceptor_->local_endpoint());
    } catch (...) {
        bound.set_exception(std::current_exception());
        return;
    }

    do_accept();
    ioc_.run();
}

void RangeFileServer::do_accept() {
    auto conn = std::make_shared<Connection>();
    acceptor_->async_accept(conn->socket, [this, conn](const beast::error_code &ec) {
        if (ec == net::error::operation_aborted || !acceptor_->is_open()) return;

        if (ec) {
            log::debug("HTTP", "Accept failed: " + ec.message());
        } else {
            std::thread([conn, access = access_] {
                try {
                    serve_connection(conn->ioc, conn->socket, *access);
                } catch (const std::exception &e) {
                    log::debug("HTTP", std::string("Connection error: ") + e.what());
                }
            }).detach();
        }
        do_accept();
    });
}

void RangeFileServer::serve_connection(net::io_context &ioc, tcp::socket &socket, const AccessList &access) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    {
        // A client that connects and never finishes its request is dropped.
        beast::tcp_stream stream(std::move(socket));
        stream.expires_after(access.request_timeout);
        http::async_read(stream, buffer, req, [&](const beast::error_code &e, std::size_t) { ec = e; });
        ioc.run();
        socket = stream.release_socket();
    }
    if (ec == beast::error::timeout) {
        log::debug("HTTP", "No request within " + std::to_string(access.request_timeout.count()) + " ms");
        return;
    }
    if (ec) {
        log::debug("HTTP", "Could not read request: " + ec.message());
        return;
    }

    const unsigned version = req.version();
    if (req.method() != http::verb::get && req.method() != http::verb::head) {
        send_error(socket, http::status::not_implemented, version, "Unsupported method");
        return;
    }

    fs::path path;
    beast::file file;
    std::uint64_t file_size = 0;
    try {
        if (access.allowed_host) {
            std::string client = socket.remote_endpoint().address().to_string();
            if (client != *access.allowed_host) throw AccessError("Client " + client + " is not allowed");
        }
        path = resolve_target(req.target(), access.allowed);
        file_size = open_checked(file, path);
    } catch (const AccessError &e) {
        log::debug("HTTP", e.what());
        send_error(socket, http::status::bad_request, version, "Bad Request");
        return;
    } catch (const ResourceError &e) {
        log::debug("HTTP", e.what());
        send_error(socket, http::status::internal_server_error, version, "Internal Server Error");
        return;
    }

    http::response<http::empty_body> res{http::status::ok, version};
    res.set(http::field::server, "aircast");
    res.set(http::field::content_type, media_type_for(path));
    res.set(http::field::accept_ranges, "bytes");
    res.set(http::field::connection, "close");

    if (req.method() == http::verb::head) {
        res.content_length(file_size);
        http::response_serializer<http::empty_body> sr{res};
        http::write_header(socket, sr, ec);
        if (ec) log::debug("HTTP", "Write failed: " + ec.message());
        socket.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    std::uint64_t first = 0;
    std::uint64_t end = file_size;

    auto range_header = req.find(http::field::range);
    RangeRequest range;
    if (range_header != req.end()) {
        auto value = range_header->value();
        range = parse_range_header(std::string_view(value.data(), value.size()), file_size);
    }

    switch (range.kind) {
    case RangeRequest::Kind::multiple:
        send_error(socket, http::status::bad_request, version, "Multiple ranges not supported");
        return;
    case RangeRequest::Kind::invalid:
        send_error(socket, http::status::bad_request, version, "Bad Request");
        return;
    case RangeRequest::Kind::unsatisfiable:
        send_error(socket, http::status::range_not_satisfiable, version, "Requested range not possible",
                   "bytes */" + std::to_string(file_size));
        return;
    case RangeRequest::Kind::single:
        first = range.span.first;
        end = range.span.last + 1;
        res.result(http::status::partial_content);
        res.set(http::field::content_range, "bytes " + std::to_string(range.span.first) + "-" +
                                                std::to_string(range.span.last) + "/" +
                                                std::to_string(file_size));
        break;
    case RangeRequest::Kind::whole_file:
        break;
    }

    std::uint64_t content_length = end - first;
    res.content_length(content_length);

    if (first > 0) {
        file.seek(first, ec);
        if (ec) {
            log::debug("HTTP", "Seek error: " + ec.message());
            send_error(socket, http::status::internal_server_error, version, "Internal Server Error");
            return;
        }
    }

    http::response_serializer<http::empty_body> sr{res};
    http::write_header(socket, sr, ec);
    if (ec) {
        log::debug("HTTP", "Write failed: " + ec.message());
        return;
    }

    // Headers are out; from here on a failure just ends the response early.
    std::array<char, chunk_size> chunk;
    std::uint64_t remaining = content_length;
    while (remaining > 0) {
        std::size_t to_read = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, chunk.size()));
        std::size_t bytes_read = file.read(chunk.data(), to_read, ec);
        if (ec || bytes_read == 0) break;

        net::write(socket, net::buffer(chunk.data(), bytes_read), ec);
        if (ec) break;
        remaining -= bytes_read;
    }

    if (range.kind == RangeRequest::Kind::single) {
        log::debug("HTTP", "Served range " + std::to_string(first) + "-" + std::to_string(end - 1) + " of " +
                               path.filename().string() + " (" + std::to_string(content_length - remaining) +
                               " bytes)");
    } else {
        log::debug("HTTP", "Served " + path.filename().string() + " (" +
                               std::to_string(content_length - remaining) + " bytes)");
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace aircast
