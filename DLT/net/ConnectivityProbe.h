#pragma once
#include <string>

class ConnectivityProbe {
public:
    virtual ~ConnectivityProbe() = default;

    // Never throws: any failure is reported as unreachable.
    virtual bool isReachable(const std::string& url) = 0;
};

// One GET per call; reachable means the final response was 200.
class HttpConnectivityProbe : public ConnectivityProbe {
public:
    explicit HttpConnectivityProbe(long timeoutSeconds = 5);

    bool isReachable(const std::string& url) override;

private:
    long timeout;
};
