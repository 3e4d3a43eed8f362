#include "ConnectivityProbe.h"
#include "HttpClient.h"

#include <exception>

HttpConnectivityProbe::HttpConnectivityProbe(long timeoutSeconds)
    : timeout(timeoutSeconds > 0 ? timeoutSeconds : 5) {
}

bool HttpConnectivityProbe::isReachable(const std::string& url) {
    try {
        HttpClient client(url);
        long status = 0;
        if (!client.get(status, timeout))
            return false;
        return status == 200;
    }
    catch (const std::exception&) {
        return false;
    }
}
