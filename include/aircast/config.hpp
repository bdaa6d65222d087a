// config.hpp
// Command line options for the aircast tool. Unset options fall back to
// AIRCAST_* environment variables.
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace aircast {

struct CliOptions {
    std::string target;                // path or URL to play
    std::optional<std::string> device; // host[:port]; discovery when unset
    double position = 0.0;
    bool force = false;
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    std::string tmpdir;
    std::chrono::seconds timeout{5};
    bool verbose = false;
    bool help = false;
};

// Throws std::invalid_argument for unknown options, missing values and a
// missing target. With -h the target is not required.
CliOptions parse_cli_options(int argc, const char *const *argv);

std::string usage(const std::string &program);

} // namespace aircast
