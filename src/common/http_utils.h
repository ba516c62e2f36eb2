/**
 * @file http_utils.h
 * @brief Shared HTTP Client Utilities
 *
 * Small fluent builder around libcurl for the weather requests, plus the
 * shared status/JSON error handling.
 *
 * Example usage:
 * @code
 * CurlTransport transport;
 * HttpClientBuilder builder("https://api.open-meteo.com/v1/forecast");
 * builder.withQuery("latitude", "47.2357")
 *        .withTimeout(5000);
 *
 * HttpResponse response;
 * if (builder.get(transport, &response) && handleHttpError(response, "forecast")) {
 *     JsonDocument doc;
 *     if (parseJsonResponse(response.body, doc, "forecast")) { ... }
 * }
 * @endcode
 */

#ifndef HTTP_UTILS_H
#define HTTP_UTILS_H

#include <ArduinoJson.h>
#include <string>
#include <utility>
#include <vector>

// Default request timeout (ms)
constexpr long DEFAULT_HTTP_TIMEOUT_MS = 15000;

/**
 * @brief A fully built GET request
 */
struct HttpRequest {
    std::string url;
    long timeout_ms = DEFAULT_HTTP_TIMEOUT_MS;
};

/**
 * @brief Result of a request that reached (or failed to reach) the server
 */
struct HttpResponse {
    long status = 0;          // HTTP status, 0 when no response was received
    std::string body;
    std::string error;        // Transport error description, empty on success
};

/**
 * @brief Performs requests; CurlTransport in production, scripted in tests
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Execute a GET request
     * @param request Request to send
     * @param response Receives status and body, or the transport error
     * @return false on transport failure (DNS, connect, timeout, TLS)
     */
    virtual bool get(const HttpRequest& request, HttpResponse* response) = 0;
};

/**
 * @brief libcurl-backed transport (easy interface, one handle per request)
 *
 * curl_global_init() must have been called by the program before use.
 */
class CurlTransport : public HttpTransport {
public:
    bool get(const HttpRequest& request, HttpResponse* response) override;
};

/**
 * @brief Builder for GET requests
 */
class HttpClientBuilder {
public:
    /**
     * @brief Construct a new HttpClientBuilder
     * @param baseUrl URL without query string
     */
    explicit HttpClientBuilder(const std::string& baseUrl);

    /**
     * @brief Add a query parameter (URL-encoded when the request is built)
     */
    HttpClientBuilder& withQuery(const std::string& name, const std::string& value);

    /**
     * @brief Set request timeout
     * @param timeoutMs Timeout in milliseconds (default 15000)
     */
    HttpClientBuilder& withTimeout(long timeoutMs);

    /**
     * @brief Build the request
     */
    HttpRequest build() const;

    /**
     * @brief Build and send the request through a transport
     * @return false on transport failure (already logged)
     */
    bool get(HttpTransport& transport, HttpResponse* response) const;

private:
    std::string _baseUrl;
    std::vector<std::pair<std::string, std::string>> _query;
    long _timeoutMs;
};

/**
 * @brief Consolidated error handling for HTTP responses
 *
 * Logs errors and returns false on HTTP error codes.
 *
 * @param response Completed response
 * @param context Context string for error logging (e.g., "openweather")
 * @return true if HTTP code indicates success (200-299), false otherwise
 */
bool handleHttpError(const HttpResponse& response, const char* context);

/**
 * @brief Parse a JSON response body with error handling
 *
 * Empty and malformed bodies are logged with the context and rejected.
 *
 * @param body Response body
 * @param doc JsonDocument to parse into
 * @param context Context string for error logging
 * @return true if parsing succeeded, false on error
 */
bool parseJsonResponse(const std::string& body, JsonDocument& doc, const char* context);

#endif // HTTP_UTILS_H
