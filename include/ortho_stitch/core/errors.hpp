#pragma once

#include <stdexcept>
#include <string>

namespace ortho_stitch {

class OrthoStitchError : public std::runtime_error {
public:
    explicit OrthoStitchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public OrthoStitchError {
public:
    explicit ConfigError(const std::string& message)
        : OrthoStitchError("Config error: " + message) {}
};

class ValidationError : public OrthoStitchError {
public:
    explicit ValidationError(const std::string& message)
        : OrthoStitchError("Validation error: " + message) {}
};

class IOError : public OrthoStitchError {
public:
    explicit IOError(const std::string& message)
        : OrthoStitchError("I/O error: " + message) {}
};

class TileDecodeError : public IOError {
public:
    explicit TileDecodeError(const std::string& message)
        : IOError("Tile decode error: " + message) {}
};

class OutputWriteError : public IOError {
public:
    explicit OutputWriteError(const std::string& message)
        : IOError("Output write error: " + message) {}
};

class EmptyInputError : public OrthoStitchError {
public:
    explicit EmptyInputError(const std::string& message)
        : OrthoStitchError("Empty input: " + message) {}
};

} // namespace ortho_stitch
