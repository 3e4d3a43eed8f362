#include "HttpClient.h"

#include <curl/curl.h>

static size_t discardCallback(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

HttpClient::HttpClient(const std::string& u)
    : url(u) {
    curl = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

bool HttpClient::head(HttpHeadResult& out, long timeoutSeconds) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c)
        return false;

    curl_easy_reset(c);

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    if (timeoutSeconds > 0)
        curl_easy_setopt(c, CURLOPT_TIMEOUT, timeoutSeconds);

    if (curl_easy_perform(c) != CURLE_OK)
        return false;

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);

    curl_off_t length = -1;
    if (curl_easy_getinfo(c, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length > 0)
        out.contentLength = static_cast<std::uint64_t>(length);

    return out.status >= 200 && out.status < 300;
}

bool HttpClient::get(long& status, long timeoutSeconds) {
    CURL* c = static_cast<CURL*>(curl);
    status = 0;
    if (!c)
        return false;

    curl_easy_reset(c);

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, timeoutSeconds);

    if (curl_easy_perform(c) != CURLE_OK)
        return false;

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    return true;
}
