#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace mo {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(MANGOVERLAY_LIB_BUILD)
        #define MANGOVERLAY_API __declspec(dllexport)
    #else
        #define MANGOVERLAY_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(MANGOVERLAY_LIB_BUILD)
        #define MANGOVERLAY_API __attribute__((visibility("default")))
    #else
        #define MANGOVERLAY_API
    #endif
#endif

enum class ConfigErrc {
    Unknown = 1, NotFound, Io, Parse, InvalidValue, UnknownKey, NoDocument,
};

struct MANGOVERLAY_API ConfigError : public std::runtime_error {
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what), code_(ConfigErrc::Unknown) {}
    ConfigError(ConfigErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ConfigErrc code() const noexcept { return code_; }
private:
    ConfigErrc code_;
};

inline const char* to_string(ConfigErrc code) {
    switch (code) {
        case ConfigErrc::NotFound: return "not_found";
        case ConfigErrc::Io: return "io";
        case ConfigErrc::Parse: return "parse";
        case ConfigErrc::InvalidValue: return "invalid_value";
        case ConfigErrc::UnknownKey: return "unknown_key";
        case ConfigErrc::NoDocument: return "no_document";
        default: return "unknown";
    }
}

} // namespace mo
