#pragma once

#include <string>
#include <vector>
#include <utility>
#include <core/types.hpp>

struct HttpResponse {
    long status = 0;
    std::string body;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

// Blocking libcurl wrapper. A transport failure (DNS, refused, timeout, TLS)
// is ConnectionFailure; any HTTP status is returned as a response.
class HttpClient {
public:
    HttpClient();

    Result<HttpResponse> get(const std::string& url,
                             const std::string& basic_auth = "");

    // application/x-www-form-urlencoded POST
    Result<HttpResponse> post_form(const std::string& url, const FormFields& fields);

private:
    Result<HttpResponse> perform(const std::string& url,
                                 const std::string* form_body,
                                 const std::string& basic_auth);
};
