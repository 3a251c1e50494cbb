// KeyRotor - HTTP Client
// Form-encoded HTTPS requests on top of cpr/libcurl

#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace keyrotor::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};          // 0 when no response was received
    std::string body;
    std::string error;          // transport-level error message
    double elapsedSeconds{0.0};

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isTransportError() const { return statusCode == 0; }
    bool isServerError() const { return statusCode >= 500; }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{30};
    int connectTimeoutSeconds{10};
    std::string userAgent{"KeyRotor/1.0"};
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Minimal HTTP client
 *
 * postForm is virtual so token exchange code can run against a scripted
 * transport in tests.
 */
class HttpClient {
public:
    HttpClient() = default;
    virtual ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief POST application/x-www-form-urlencoded fields
     * @param url Target URL
     * @param fields Form fields, encoded in order
     * @param options Request options
     * @return Response; statusCode 0 and error set on transport failure
     */
    virtual HttpResponse postForm(const std::string& url, const FormFields& fields,
                                  const HttpOptions& options = {});
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
    static void cleanup();

private:
    static bool s_initialized;
};

} // namespace keyrotor::utils
