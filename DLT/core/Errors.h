#pragma once
#include <stdexcept>
#include <string>

class TrackerError : public std::runtime_error {
public:
    explicit TrackerError(const std::string& msg)
        : std::runtime_error(msg) {
    }
};

// A source locator could not be turned into (path, size) before tracking
class InvalidReferenceError : public TrackerError {
public:
    explicit InvalidReferenceError(const std::string& locator)
        : TrackerError("The URL '" + locator + "' cannot be found."),
        ref(locator) {
    }

    const std::string& locator() const { return ref; }

private:
    std::string ref;
};

class StallError : public TrackerError {
public:
    enum class Kind {
        NetworkUnstable,
        NoProgress
    };

    StallError(Kind k, const std::string& msg)
        : TrackerError(msg), stallKind(k) {
    }

    Kind kind() const { return stallKind; }

private:
    Kind stallKind;
};
