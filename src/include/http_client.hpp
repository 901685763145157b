#pragma once

#include <string>
#include <cstdint>

namespace readalong {

struct HttpResponse {
    bool success = false;
    std::string error;
    long status_code = 0;
    int64_t bytes_written = 0;
};

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    // Stream url into dest_path, following redirects. Any HTTP status outside 2xx is a failure.
    // dest_path is truncated first; the caller owns cleanup of a failed download.
    HttpResponse Download(const std::string &url, const std::string &dest_path, int32_t timeout_seconds = 0);

private:
    void *curl_handle;
};

} // namespace readalong
