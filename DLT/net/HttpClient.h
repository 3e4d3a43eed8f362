#pragma once
#include <string>
#include <cstdint>

struct HttpHeadResult {
    std::uint64_t contentLength = 0;
    long status = 0;
};

class HttpClient {
public:
    explicit HttpClient(const std::string& url);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    bool head(HttpHeadResult& out, long timeoutSeconds = 0);

    // Plain GET with the body thrown away. status is the final response code.
    bool get(long& status, long timeoutSeconds);

private:
    void* curl;
    std::string url;
};
