/**
 * @file http_utils.cpp
 * @brief Shared HTTP Client Utilities Implementation
 */

#include "http_utils.h"
#include "url_utils.h"
#include "../debug/log_system.h"

#include <curl/curl.h>

static const char* TAG = "HTTP";

// Bodies larger than this are cut off; weather responses are a few KB
static constexpr size_t MAX_RESPONSE_BYTES = 256 * 1024;

// =============================================================================
// CurlTransport
// =============================================================================

static size_t appendBody(char* data, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    const size_t bytes = size * nmemb;
    if (body->size() + bytes > MAX_RESPONSE_BYTES) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    body->append(data, bytes);
    return bytes;
}

bool CurlTransport::get(const HttpRequest& request, HttpResponse* response) {
    if (response == nullptr) {
        return false;
    }
    *response = HttpResponse();

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        response->error = "curl_easy_init failed";
        return false;
    }

    char error_buffer[CURL_ERROR_SIZE] = "";
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response->body);

    const CURLcode result = curl_easy_perform(curl);
    if (result == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response->status);
    } else {
        response->error = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);
    }

    curl_easy_cleanup(curl);
    return result == CURLE_OK;
}

// =============================================================================
// HttpClientBuilder
// =============================================================================

HttpClientBuilder::HttpClientBuilder(const std::string& baseUrl)
    : _baseUrl(baseUrl), _timeoutMs(DEFAULT_HTTP_TIMEOUT_MS) {}

HttpClientBuilder& HttpClientBuilder::withQuery(const std::string& name, const std::string& value) {
    _query.emplace_back(name, value);
    return *this;
}

HttpClientBuilder& HttpClientBuilder::withTimeout(long timeoutMs) {
    _timeoutMs = timeoutMs;
    return *this;
}

HttpRequest HttpClientBuilder::build() const {
    HttpRequest request;
    request.url = buildUrl(_baseUrl, _query);
    request.timeout_ms = _timeoutMs;
    return request;
}

bool HttpClientBuilder::get(HttpTransport& transport, HttpResponse* response) const {
    const HttpRequest request = build();
    MK_LOGD(TAG, "GET %s", _baseUrl.c_str());
    if (!transport.get(request, response)) {
        MK_LOGW(TAG, "GET %s failed: %s", _baseUrl.c_str(),
                response ? response->error.c_str() : "no response");
        return false;
    }
    return true;
}

// =============================================================================
// Response helpers
// =============================================================================

bool handleHttpError(const HttpResponse& response, const char* context) {
    if (!response.error.empty() || response.status <= 0) {
        MK_LOGW(TAG, "%s failed: network error (%s)",
                context ? context : "request",
                response.error.empty() ? "no status" : response.error.c_str());
        return false;
    }

    if (response.status >= 200 && response.status < 300) {
        return true;
    }

    MK_LOGW(TAG, "%s failed: HTTP %ld", context ? context : "request", response.status);
    if (!response.body.empty() && response.body.size() < 200) {
        MK_LOGW(TAG, "Error response: %s", response.body.c_str());
    }
    return false;
}

bool parseJsonResponse(const std::string& body, JsonDocument& doc, const char* context) {
    if (body.empty()) {
        MK_LOGW(TAG, "%s: empty response", context ? context : "parse");
        return false;
    }

    DeserializationError error = deserializeJson(doc, body);
    if (error) {
        MK_LOGW(TAG, "%s: JSON parse error: %s", context ? context : "parse", error.c_str());
        if (body.size() < 200) {
            MK_LOGW(TAG, "Response was: %s", body.c_str());
        }
        return false;
    }
    return true;
}
