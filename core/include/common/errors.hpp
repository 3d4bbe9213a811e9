#pragma once

#include <stdexcept>
#include <string>

namespace tp {
    enum class ErrorKind {
        InputError,          // caller sent something unusable
        ResourceUnavailable, // capture source or file could not be opened
        NotFound             // unknown or already stopped session
    };

    class TrafficError : public std::runtime_error {
    public:
        TrafficError(ErrorKind kind, const std::string& what)
            : std::runtime_error(what), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    inline const char* to_string(ErrorKind k) {
        switch (k) {
            case ErrorKind::InputError: return "InputError";
            case ErrorKind::ResourceUnavailable: return "ResourceUnavailable";
            case ErrorKind::NotFound: return "NotFound";
        }
        return "Unknown";
    }
}
