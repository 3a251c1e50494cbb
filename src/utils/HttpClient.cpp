/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

namespace keyrotor::utils {

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

void CurlGlobalInit::init() {
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

void CurlGlobalInit::cleanup() {
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- HttpClient --

HttpResponse HttpClient::postForm(const std::string& url, const FormFields& fields,
                                  const HttpOptions& options) {
    HttpResponse result;

    try {
        cpr::Header headers{{"Content-Type", "application/x-www-form-urlencoded"}};
        for (const auto& [key, value] : options.headers) headers[key] = value;

        cpr::Payload payload{};
        for (const auto& [key, value] : fields) {
            payload.Add(cpr::Pair{key, value});
        }

        int timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : 30;
        int connectTimeout = options.connectTimeoutSeconds > 0 ? options.connectTimeoutSeconds : 10;

        cpr::Response response = cpr::Post(
            cpr::Url{url},
            headers,
            payload,
            cpr::Timeout{timeout * 1000},
            cpr::ConnectTimeout{connectTimeout * 1000},
            cpr::UserAgent{options.userAgent}
        );

        result.statusCode = static_cast<int>(response.status_code);
        result.body = response.text;
        result.error = response.error.message;
        result.elapsedSeconds = response.elapsed;

    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }

    return result;
}

} // namespace keyrotor::utils
