#pragma once
#include <stdexcept>
#include <string>

namespace chatpace {

// Invalid thresholds or unknown option names. Raised when a plan or a
// config is built, never while a session is sending.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

// A split mode could not produce chunks. Never escapes split(): the
// splitter falls back to whole-text delivery.
class SplitError : public std::runtime_error {
public:
    explicit SplitError(const std::string& what)
        : std::runtime_error(what) {}
};

enum class DispatchErrorKind { Transient, Permanent };

inline const char* dispatch_error_kind_name(DispatchErrorKind kind) {
    switch (kind) {
        case DispatchErrorKind::Transient: return "transient";
        case DispatchErrorKind::Permanent: return "permanent";
    }
    return "transient";
}

// Sink-level failure. Sinks may throw it instead of returning a
// DispatchResult; any other std::exception is treated as transient.
class DispatchError : public std::runtime_error {
public:
    DispatchError(DispatchErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    DispatchErrorKind kind() const { return kind_; }
    bool transient() const { return kind_ == DispatchErrorKind::Transient; }

private:
    DispatchErrorKind kind_;
};

} // namespace chatpace
