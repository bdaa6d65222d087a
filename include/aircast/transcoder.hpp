// transcoder.hpp
// ffprobe/ffmpeg wrapper used to turn arbitrary media into an HLS stream a
// receiver can play.
#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace aircast {

struct MediaStream {
    std::string codec_type; // "video", "audio", "subtitle", ...
    std::string codec_name;
};

struct ProbeResult {
    // ffprobe's comma separated list, e.g. "mov,mp4,m4a,3gp,3g2,mj2"
    std::string format_name;
    std::vector<MediaStream> streams;
};

struct SegmentOutput {
    std::filesystem::path index;
    std::filesystem::path transport_stream;
};

class Transcoder {
public:
    // Throws EncoderNotInstalledError when either binary cannot be found.
    explicit Transcoder(const std::string &ffmpeg = "ffmpeg", const std::string &ffprobe = "ffprobe");

    // Throws MediaParseError when ffprobe fails or prints something other than JSON.
    ProbeResult probe(const std::string &path) const;

    // Remux/encode `inputs` into a single-file HLS stream inside `output_dir`
    // (a new temporary directory when empty). `options` are passed to ffmpeg
    // before the output name.
    SegmentOutput segment(const std::vector<std::string> &inputs,
                          const std::filesystem::path &output_dir = {},
                          const std::string &index = "airplay.m3u8",
                          const std::string &transport_stream = "airplay.ts",
                          const std::vector<std::string> &options = {}) const;

    const std::filesystem::path &ffmpeg() const { return ffmpeg_; }
    const std::filesystem::path &ffprobe() const { return ffprobe_; }

private:
    std::filesystem::path ffmpeg_;
    std::filesystem::path ffprobe_;
};

// Whether a receiver can play the probed media without conversion.
bool can_play(const ProbeResult &probe);

// ffmpeg codec options that copy what is already compatible and re-encode the rest.
std::vector<std::string> conversion_options(const ProbeResult &probe);

} // namespace aircast
