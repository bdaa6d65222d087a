// aircast: play a local file or URL on an AirPlay receiver.
#include "aircast/config.hpp"
#include "aircast/device_client.hpp"
#include "aircast/errors.hpp"
#include "aircast/log.hpp"
#include "aircast/transcoder.hpp"

#ifdef AIRCAST_HAVE_AVAHI
#include "aircast/discovery.hpp"
#endif

#include <atomic>
#include <chrono>
#include <cctype>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

using namespace aircast;
namespace fs = std::filesystem;

static std::atomic<bool> shutdown_requested{false};

static void on_signal(int) {
    shutdown_requested = true;
}

static std::string humanize_seconds(double secs) {
    long total = secs > 0 ? static_cast<long>(secs) : 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld", total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

static std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

static Device resolve_device(const CliOptions &opts) {
    if (opts.device) return Device::parse(*opts.device);

#ifdef AIRCAST_HAVE_AVAHI
    std::cout << "[Discover] Scanning for AirPlay devices...\n";
    std::vector<Device> devices = discover_devices(std::chrono::seconds(2), true);
    if (devices.empty()) {
        throw std::runtime_error("No AirPlay devices were found. Use --device to manually specify a device.");
    }
    if (devices.size() > 1) {
        std::ostringstream os;
        os << "Multiple AirPlay devices were found. Use --device to select a specific one.\n\n"
           << "Available AirPlay devices:\n"
           << "--------------------\n";
        for (const auto &d : devices) os << "\t* " << d.name().value_or(d.host()) << ": " << d.address() << "\n";
        throw std::runtime_error(os.str());
    }
    return devices.front();
#else
    throw std::runtime_error("Built without device discovery. Use --device to specify a device.");
#endif
}

// Probe the target and convert it to HLS when the receiver cannot play it.
// Returns the files to serve, or just the target when no conversion happened.
static std::vector<std::string> prepare_media(const CliOptions &opts) {
    try {
        Transcoder encoder(opts.ffmpeg, opts.ffprobe);
        ProbeResult probe = encoder.probe(opts.target);
        if (can_play(probe)) return {opts.target};

        std::cout << "[Encode] Converting " << opts.target << " (" << probe.format_name << ")\n";
        SegmentOutput out = encoder.segment({opts.target}, opts.tmpdir, "airplay.m3u8", "airplay.ts",
                                            conversion_options(probe));
        return {out.index.string(), out.transport_stream.string()};
    } catch (const EncoderNotInstalledError &e) {
        log::debug("Encode", e.what());
        std::cout << "Encoder not installed, playback may not be successful.\n";
        return {opts.target};
    }
}

int main(int argc, char **argv) {
    CliOptions opts;
    try {
        opts = parse_cli_options(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }
    if (opts.help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    log::set_verbose(opts.verbose);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        Device device = resolve_device(opts);
        ClientOptions client_opts;
        client_opts.timeout = opts.timeout;
        DeviceClient client(device, client_opts);
        std::cout << "[AirPlay] Connected to " << device.name().value_or(device.address()) << "\n";

        std::vector<std::string> media{opts.target};
        if (!opts.force) media = prepare_media(opts);

        std::string url = media.front();
        if (media.size() > 1 || fs::exists(url)) url = client.serve(media).front();

        if (!client.play(url, opts.position)) {
            std::cerr << "[AirPlay] Device refused to play " << url << "\n";
            return 1;
        }

        std::string state = "loading";
        double duration = 0.0;
        double position = 0.0;
        while (!shutdown_requested) {
            for (const Event &ev : client.events(false)) {
                auto newstate = find_string(ev, "state");
                if (!newstate) continue;
                if (*newstate == "playing") {
                    auto d = ev.find("duration");
                    auto p = ev.find("position");
                    if (d != ev.end() && (d->second.is_real() || d->second.is_integer())) duration = d->second.as_real();
                    if (p != ev.end() && (p->second.is_real() || p->second.is_integer())) position = p->second.as_real();
                }
                state = *newstate;
            }
            if (state == "stopped") break;

            std::string label = capitalize(state);
            if (state == "playing") {
                PlaybackPosition pos = client.scrub();
                duration = pos.duration;
                position = pos.position;
            }
            if (state == "playing" || state == "paused") {
                label += ": " + humanize_seconds(position) + " / " + humanize_seconds(duration);
            }
            std::cout << "\r" << std::left << std::setw(28) << label << std::flush;

            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        std::cout << "\n";
    } catch (const MediaParseError &e) {
        log::debug("Encode", e.what());
        std::cerr << "Unknown input format. Use --force if you are sure your AirPlay device can play it.\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
