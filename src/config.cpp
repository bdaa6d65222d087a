#include "aircast/config.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace aircast {

namespace {

std::string env_string(const char *key, const std::string &fallback) {
    const char *val = std::getenv(key);
    if (val && *val) return std::string(val);
    return fallback;
}

bool env_flag(const char *key, bool fallback) {
    const char *val = std::getenv(key);
    if (!val) return fallback;
    std::string s(val);
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return fallback;
}

double parse_number(const std::string &option, const std::string &value) {
    std::size_t used = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    return parsed;
}

} // namespace

CliOptions parse_cli_options(int argc, const char *const *argv) {
    CliOptions opts;
    std::string device = env_string("AIRCAST_DEVICE", "");
    opts.ffmpeg = env_string("AIRCAST_FFMPEG", opts.ffmpeg);
    opts.ffprobe = env_string("AIRCAST_FFPROBE", opts.ffprobe);
    opts.tmpdir = env_string("AIRCAST_TMPDIR", "");
    opts.verbose = env_flag("AIRCAST_VERBOSE", false);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-d" || arg == "--device" || arg == "--dev") {
            device = value();
        } else if (arg == "-p" || arg == "--position" || arg == "--pos") {
            opts.position = parse_number(arg, value());
            if (opts.position < 0.0) throw std::invalid_argument("Position cannot be negative");
        } else if (arg == "-f" || arg == "--force") {
            opts.force = true;
        } else if (arg == "--ffmpeg") {
            opts.ffmpeg = value();
        } else if (arg == "--ffprobe") {
            opts.ffprobe = value();
        } else if (arg == "--tmpdir") {
            opts.tmpdir = value();
        } else if (arg == "-t" || arg == "--timeout") {
            double secs = parse_number(arg, value());
            if (secs <= 0.0) throw std::invalid_argument("Timeout must be positive");
            opts.timeout = std::chrono::seconds(static_cast<long long>(secs + 0.5));
            if (opts.timeout.count() == 0) opts.timeout = std::chrono::seconds(1);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (opts.target.empty()) {
            opts.target = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (!device.empty()) opts.device = device;
    if (opts.target.empty() && !opts.help) throw std::invalid_argument("Missing path or URL to play");
    return opts;
}

std::string usage(const std::string &program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options] <path-or-url>\n"
       << "\n"
       << "Play a local or remote video on an AirPlay device. Local files are\n"
       << "converted with ffmpeg when needed and served over HTTP.\n"
       << "\n"
       << "  -d, --device host[:port]  device to use (AIRCAST_DEVICE); discovered when unset\n"
       << "  -p, --position secs       where to begin playback (default 0)\n"
       << "  -f, --force               play the target as given, without probing or converting\n"
       << "      --ffmpeg path         ffmpeg binary (AIRCAST_FFMPEG, default ffmpeg)\n"
       << "      --ffprobe path        ffprobe binary (AIRCAST_FFPROBE, default ffprobe)\n"
       << "      --tmpdir dir          directory for converted files (AIRCAST_TMPDIR)\n"
       << "  -t, --timeout secs        network timeout (default 5)\n"
       << "  -v, --verbose             print protocol traffic (AIRCAST_VERBOSE)\n"
       << "  -h, --help                show this help\n";
    return os.str();
}

} // namespace aircast
