#pragma once

#include <stdexcept>
#include <string>

namespace deepzoom {

class DeepZoomError : public std::runtime_error {
public:
    explicit DeepZoomError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public DeepZoomError {
public:
    explicit ConfigError(const std::string& message)
        : DeepZoomError("Config error: " + message) {}
};

class ValidationError : public DeepZoomError {
public:
    explicit ValidationError(const std::string& message)
        : DeepZoomError("Validation error: " + message) {}
};

enum class GeometryErrorKind {
    InvalidDimensions,
    InvalidLevel,
    InvalidTileIndex
};

inline std::string geometry_error_kind_to_string(GeometryErrorKind kind) {
    switch (kind) {
        case GeometryErrorKind::InvalidDimensions: return "InvalidDimensions";
        case GeometryErrorKind::InvalidLevel: return "InvalidLevel";
        case GeometryErrorKind::InvalidTileIndex: return "InvalidTileIndex";
        default: return "Unknown";
    }
}

// Out-of-range geometry query. Indicates a defect in the caller, never
// bad user input, so it is not clamped.
class GeometryError : public DeepZoomError {
public:
    GeometryError(GeometryErrorKind kind, const std::string& message)
        : DeepZoomError(geometry_error_kind_to_string(kind) + ": " + message),
          kind_(kind) {}

    GeometryErrorKind kind() const { return kind_; }

private:
    GeometryErrorKind kind_;
};

class IOError : public DeepZoomError {
public:
    explicit IOError(const std::string& message)
        : DeepZoomError("I/O error: " + message) {}
};

class DecodeError : public IOError {
public:
    explicit DecodeError(const std::string& message)
        : IOError("decode failed: " + message) {}
};

class EncodeError : public IOError {
public:
    explicit EncodeError(const std::string& message)
        : IOError("encode failed: " + message) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(const std::string& message)
        : IOError("write failed: " + message) {}
};

class StopRequested : public DeepZoomError {
public:
    StopRequested() : DeepZoomError("Stop requested by user") {}
};

} // namespace deepzoom
