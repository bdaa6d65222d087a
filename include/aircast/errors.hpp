// errors.hpp
// Exception types raised by the aircast library.
#pragma once

#include <stdexcept>
#include <string>

namespace aircast {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Socket setup, connect, or read failure.
struct ConnectionError : Error {
    using Error::Error;
};

// The peer sent something the protocol does not allow: bad status line,
// unexpected content-type, short body, missing headers.
struct ProtocolError : Error {
    using Error::Error;
};

// Operations that would need binary property lists.
struct UnsupportedOperationError : Error {
    using Error::Error;
};

// Malformed property list or parameter value.
struct ParseError : Error {
    using Error::Error;
};

// Raised inside the file server for disallowed hosts or paths (HTTP 400).
struct AccessError : Error {
    using Error::Error;
};

// Raised inside the file server when an allowed file cannot be read (HTTP 500).
struct ResourceError : Error {
    using Error::Error;
};

// ffmpeg/ffprobe missing, not executable, or too old.
struct EncoderNotInstalledError : Error {
    using Error::Error;
};

// ffmpeg/ffprobe could not understand the input.
struct MediaParseError : Error {
    using Error::Error;
};

} // namespace aircast
