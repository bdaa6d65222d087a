#include "aircast/transcoder.hpp"
#include "aircast/errors.hpp"
#include "aircast/log.hpp"

#include <boost/process.hpp>
#include <json/json.h>

#include <cerrno>
#include <cstdlib>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace aircast {

namespace bp = boost::process;
namespace fs = std::filesystem;

namespace {

struct RunResult {
    int exit_code = 0;
    std::string output;
};

// A bare name is looked up on PATH; anything with a slash must exist as given.
fs::path locate(const std::string &binary) {
    if (binary.find('/') != std::string::npos) {
        std::error_code ec;
        if (fs::is_regular_file(binary, ec) && ::access(binary.c_str(), X_OK) == 0) return fs::absolute(binary);
        throw EncoderNotInstalledError("Cannot execute " + binary);
    }
    boost::filesystem::path found = bp::search_path(binary);
    if (found.empty()) throw EncoderNotInstalledError("Cannot find " + binary + " on PATH");
    return fs::path(found.string());
}

// Run to completion and collect stdout, plus stderr unless `quiet`.
RunResult run(const fs::path &exe, const std::vector<std::string> &args, bool quiet) {
    log::debug("Encode", "Running " + exe.string() + " with " + std::to_string(args.size()) + " arguments");

    RunResult result;
    bp::ipstream out;
    try {
        if (quiet) {
            bp::child c(exe.string(), bp::args(args), bp::std_out > out, bp::std_err > bp::null);
            result.output.assign(std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>());
            c.wait();
            result.exit_code = c.exit_code();
        } else {
            bp::child c(exe.string(), bp::args(args), (bp::std_out & bp::std_err) > out);
            result.output.assign(std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>());
            c.wait();
            result.exit_code = c.exit_code();
        }
    } catch (const bp::process_error &e) {
        throw EncoderNotInstalledError("Cannot execute " + exe.string() + ": " + e.what());
    }
    return result;
}

fs::path make_temp_dir() {
    std::string pattern = (fs::temp_directory_path() / "aircast-XXXXXX").string();
    if (!::mkdtemp(pattern.data())) {
        throw std::system_error(errno, std::generic_category(), "Unable to create a temporary directory");
    }
    return fs::path(pattern);
}

bool has_format(const std::string &format_name, const std::string &wanted) {
    size_t start = 0;
    while (start <= format_name.size()) {
        size_t comma = format_name.find(',', start);
        if (comma == std::string::npos) comma = format_name.size();
        if (format_name.compare(start, comma - start, wanted) == 0) return true;
        start = comma + 1;
    }
    return false;
}

} // namespace

Transcoder::Transcoder(const std::string &ffmpeg, const std::string &ffprobe)
    : ffmpeg_(locate(ffmpeg)), ffprobe_(locate(ffprobe)) {}

ProbeResult Transcoder::probe(const std::string &path) const {
    RunResult r = run(ffprobe_, {"-print_format", "json", "-v", "quiet", "-show_format", "-show_streams", path}, true);
    if (r.exit_code != 0) throw MediaParseError("Unknown input format: " + path);

    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(r.output, root) || !root.isObject()) {
        throw MediaParseError("Unknown input format: " + path);
    }

    ProbeResult result;
    result.format_name = root["format"]["format_name"].asString();
    for (const auto &stream : root["streams"]) {
        result.streams.push_back({stream["codec_type"].asString(), stream["codec_name"].asString()});
    }
    if (result.format_name.empty()) throw MediaParseError("No container format reported for " + path);
    return result;
}

SegmentOutput Transcoder::segment(const std::vector<std::string> &inputs, const fs::path &output_dir,
                                  const std::string &index, const std::string &transport_stream,
                                  const std::vector<std::string> &options) const {
    if (inputs.empty()) throw std::invalid_argument("Nothing to segment");

    fs::path dir = output_dir;
    if (dir.empty()) {
        dir = make_temp_dir();
    } else if (!fs::is_directory(dir)) {
        throw std::invalid_argument(dir.string() + " does not exist!");
    }

    SegmentOutput out{fs::absolute(dir / index), fs::absolute(dir / transport_stream)};

    std::vector<std::string> args;
    for (const auto &in : inputs) {
        args.push_back("-i");
        args.push_back(in);
    }
    for (const char *opt : {"-hls_flags", "single_file", "-hls_list_size", "0", "-hls_allow_cache", "1"}) {
        args.emplace_back(opt);
    }
    args.push_back("-hls_segment_filename");
    args.push_back(out.transport_stream.string());
    args.insert(args.end(), options.begin(), options.end());
    args.push_back(out.index.string());

    RunResult r = run(ffmpeg_, args, false);
    if (r.exit_code != 0) {
        if (r.output.find("Invalid data found when processing input") != std::string::npos) {
            throw MediaParseError("Unknown input format: " + inputs.front());
        }
        throw EncoderNotInstalledError(ffmpeg_.string() + " failed. It must be at least version 3.0.");
    }

    log::debug("Encode", "Wrote " + out.index.string());
    return out;
}

bool can_play(const ProbeResult &probe) {
    if (!has_format(probe.format_name, "mp4") && !has_format(probe.format_name, "mov") &&
        !has_format(probe.format_name, "hls") && !has_format(probe.format_name, "applehttp")) {
        return false;
    }
    for (const auto &s : probe.streams) {
        if (s.codec_type == "video" && s.codec_name != "h264") return false;
        if (s.codec_type == "audio" && s.codec_name != "aac" && s.codec_name != "mp3") return false;
    }
    return true;
}

std::vector<std::string> conversion_options(const ProbeResult &probe) {
    bool h264 = false;
    bool aac = false;
    for (const auto &s : probe.streams) {
        if (s.codec_type == "video" && s.codec_name == "h264") h264 = true;
        if (s.codec_type == "audio" && s.codec_name == "aac") aac = true;
    }
    return {"-c:v", h264 ? "copy" : "libx264", "-c:a", aac ? "copy" : "aac"};
}

} // namespace aircast
