#pragma once
#include <stdexcept>
#include <string>

namespace lc {
    // Unparsable date/time text, malformed table rows
    class ParseError : public std::runtime_error {
    public:
        explicit ParseError(const std::string& msg) : std::runtime_error("ParseError: " + msg) {}
    };

    // Ephemeris data missing or not a finite number
    class EphemerisError : public std::runtime_error {
    public:
        explicit EphemerisError(const std::string& msg) : std::runtime_error("EphemerisError: " + msg) {}
    };

    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& msg) : std::runtime_error("ConfigError: " + msg) {}
    };
}
