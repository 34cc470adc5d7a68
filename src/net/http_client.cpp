#include "http_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>

static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

HttpClient::HttpClient() {
    // curl_global_init is not thread-safe; run it once for the process.
    static const CURLcode init_rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_rc != CURLE_OK) {
        zt_log(fmt::format("curl_global_init failed: {}", curl_easy_strerror(init_rc)));
    }
}

Result<HttpResponse> HttpClient::get(const std::string& url, const std::string& basic_auth) {
    return perform(url, nullptr, basic_auth);
}

Result<HttpResponse> HttpClient::post_form(const std::string& url, const FormFields& fields) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<HttpResponse>::Err(ErrorKind::ConnectionFailure,
                                         "Failed to initialize CURL");
    }
    auto curl_guard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>{curl, curl_easy_cleanup};

    std::string body;
    for (const auto& [name, value] : fields) {
        char* k = curl_easy_escape(curl, name.c_str(), static_cast<int>(name.size()));
        char* v = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (!body.empty()) body += "&";
        body += std::string(k ? k : "") + "=" + std::string(v ? v : "");
        curl_free(k);
        curl_free(v);
    }

    return perform(url, &body, "");
}

Result<HttpResponse> HttpClient::perform(const std::string& url,
                                         const std::string* form_body,
                                         const std::string& basic_auth) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<HttpResponse>::Err(ErrorKind::ConnectionFailure,
                                         "Failed to initialize CURL");
    }
    auto curl_guard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>{curl, curl_easy_cleanup};

    std::string user_agent = fmt::format("ZulipTerminal/{}", ZT_VERSION);
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, HTTP_TIMEOUT_SECS);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, HTTP_CONNECT_TIMEOUT_SECS);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (form_body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(form_body->size()));
    }
    if (!basic_auth.empty()) {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERPWD, basic_auth.c_str());
    }

    const char* method = form_body ? "POST" : "GET";
    zt_log(fmt::format("{} {}", method, url));

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        zt_log(fmt::format("{} {} failed: {}", method, url, curl_easy_strerror(res)));
        return Result<HttpResponse>::Err(ErrorKind::ConnectionFailure,
                                         curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    zt_log(fmt::format("{} {} -> HTTP {} ({} bytes)", method, url,
                       response.status, response.body.size()));
    return Result<HttpResponse>::Ok(response);
}
