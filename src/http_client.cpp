#include "http_client.hpp"
#include <curl/curl.h>
#include <cstdio>
#include <strings.h>

namespace readalong {

// Callback for libcurl to write response data straight to the destination file
static size_t WriteFileCallback(void *contents, size_t size, size_t nmemb, void *userp) {
	FILE *file = static_cast<FILE *>(userp);
	return fwrite(contents, size, nmemb, file);
}

HttpClient::HttpClient() : curl_handle(nullptr) {
	curl_handle = curl_easy_init();
}

HttpClient::~HttpClient() {
	if (curl_handle) {
		curl_easy_cleanup(static_cast<CURL *>(curl_handle));
		curl_handle = nullptr;
	}
}

HttpResponse HttpClient::Download(const std::string &url, const std::string &dest_path, int32_t timeout_seconds) {
	HttpResponse response;

	if (!curl_handle) {
		response.error = "Failed to initialize HTTP client";
		return response;
	}

	FILE *file = fopen(dest_path.c_str(), "wb");
	if (!file) {
		response.error = "Cannot open " + dest_path + " for writing";
		return response;
	}

	CURL *curl = static_cast<CURL *>(curl_handle);

	// Reset curl handle for reuse
	curl_easy_reset(curl);

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteFileCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, file);

	// Model files are large; only bound the connect phase unless asked otherwise
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);

	// Required for multi-threaded environments - don't use signals for timeout
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	// The registry answers with redirects to a CDN
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "readalong-duckdb-extension");

	CURLcode res = curl_easy_perform(curl);

	long bytes = ftell(file);
	bool close_failed = fclose(file) != 0;

	if (res != CURLE_OK) {
		if (res == CURLE_OPERATION_TIMEDOUT) {
			response.error = "Download timed out after " + std::to_string(timeout_seconds) + " seconds";
		} else if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
			response.error = "Cannot connect to " + url;
		} else {
			response.error = std::string("Download failed: ") + curl_easy_strerror(res);
		}
		return response;
	}
	if (close_failed) {
		response.error = "Failed to write " + dest_path;
		return response;
	}

	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
	response.bytes_written = bytes < 0 ? 0 : bytes;

	// Non-HTTP transfers (file://) report no status code
	char *scheme = nullptr;
	curl_easy_getinfo(curl, CURLINFO_SCHEME, &scheme);
	bool is_http = scheme && (strcasecmp(scheme, "http") == 0 || strcasecmp(scheme, "https") == 0);

	if (!is_http || (response.status_code >= 200 && response.status_code < 300)) {
		response.success = true;
	} else {
		response.error = "Download failed: HTTP " + std::to_string(response.status_code);
	}

	return response;
}

} // namespace readalong
