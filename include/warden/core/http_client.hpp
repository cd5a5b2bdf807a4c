/*
 * warden C++17 - HTTP client
 *
 * Thin blocking libcurl wrapper. curl_global_init() is the application's
 * responsibility.
 */
#ifndef warden_CORE_HTTP_CLIENT_HPP
#define warden_CORE_HTTP_CLIENT_HPP

#include <string>
#include <map>

namespace warden {

struct HttpResponse {
    int status_code;      // 0 when the request never completed
    std::string body;
    std::string error;

    HttpResponse() : status_code(0) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

class HttpClient {
public:
    explicit HttpClient(int timeout_seconds = 30);

    HttpResponse post_json(const std::string& url, const std::string& body,
                           const std::map<std::string, std::string>& headers =
                               std::map<std::string, std::string>());

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    int timeout_seconds_;
};

} // namespace warden

#endif // warden_CORE_HTTP_CLIENT_HPP
