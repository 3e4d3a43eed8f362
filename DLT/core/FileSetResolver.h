#pragma once
#include <string>
#include <vector>

#include "utils.h"

// Turns a source locator into the destination path and expected size.
// Implementations throw InvalidReferenceError when they cannot.
class LocatorResolver {
public:
    virtual ~LocatorResolver() = default;

    virtual TrackedFile resolve(const std::string& folder, const std::string& locator) = 0;
};

// URL locator: file name from the URL path, size from a HEAD request.
class HttpLocatorResolver : public LocatorResolver {
public:
    explicit HttpLocatorResolver(long timeoutSeconds = 10);

    TrackedFile resolve(const std::string& folder, const std::string& locator) override;

private:
    long timeout;
};

// "name=bytes" locator for files whose size is already known. Anything
// else goes to the fallback, or is rejected when there is none.
class ExplicitLocatorResolver : public LocatorResolver {
public:
    explicit ExplicitLocatorResolver(LocatorResolver* fallback = nullptr);

    TrackedFile resolve(const std::string& folder, const std::string& locator) override;

private:
    LocatorResolver* fallback;
};

std::string destinationPath(const std::string& folder, const std::string& name);

// Resolves every locator up front; the first failure aborts the whole set.
std::vector<TrackedFile> resolveFileSet(const std::string& folder,
    const std::vector<std::string>& locators,
    LocatorResolver& resolver);
