#include "FileSetResolver.h"
#include "Errors.h"
#include "../net/HttpClient.h"

#include <filesystem>
#include <set>
#include <cctype>

namespace fs = std::filesystem;

std::string destinationPath(const std::string& folder, const std::string& name) {
    return (fs::path(folder) / name).string();
}

HttpLocatorResolver::HttpLocatorResolver(long timeoutSeconds)
    : timeout(timeoutSeconds) {
}

TrackedFile HttpLocatorResolver::resolve(const std::string& folder, const std::string& locator) {
    HttpClient client(locator);
    HttpHeadResult head{};

    if (!client.head(head, timeout) || head.contentLength == 0)
        throw InvalidReferenceError(locator);

    return { destinationPath(folder, fileNameFromUrl(locator)), head.contentLength };
}

ExplicitLocatorResolver::ExplicitLocatorResolver(LocatorResolver* fb)
    : fallback(fb) {
}

TrackedFile ExplicitLocatorResolver::resolve(const std::string& folder, const std::string& locator) {
    const auto eq = locator.find_last_of('=');
    const bool hasSize = eq != std::string::npos && eq > 0 && eq + 1 < locator.size()
        && locator.find("://") == std::string::npos;

    if (!hasSize) {
        if (fallback)
            return fallback->resolve(folder, locator);
        throw InvalidReferenceError(locator);
    }

    const std::string name = locator.substr(0, eq);
    const std::string sizeStr = locator.substr(eq + 1);
    for (char ch : sizeStr) {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
            throw InvalidReferenceError(locator);
    }

    try {
        return { destinationPath(folder, name), std::stoull(sizeStr) };
    }
    catch (const std::out_of_range&) {
        throw InvalidReferenceError(locator);
    }
}

std::vector<TrackedFile> resolveFileSet(const std::string& folder,
    const std::vector<std::string>& locators,
    LocatorResolver& resolver) {
    std::vector<TrackedFile> files;
    std::set<std::string> seen;

    files.reserve(locators.size());
    for (const auto& locator : locators) {
        TrackedFile f = resolver.resolve(folder, locator);
        if (!seen.insert(f.path).second)
            throw TrackerError("Two sources download to the same file: " + f.path);
        files.push_back(std::move(f));
    }

    return files;
}
