#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace tb::services
{

struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse
{
    // False when no HTTP response arrived (connect error, timeout).
    bool received = false;
    int status = 0;
    std::string body;
    std::vector<std::string> set_cookies;
    std::string error;

    bool ok() const noexcept
    {
        return received && status >= 200 && status < 300;
    }
};

// Blocking HTTP/1.1 client. Each request runs on a private mongoose manager
// polled on the calling thread until the response arrives or the timeout
// expires.
class HttpClient
{
  public:
    explicit HttpClient(
        std::chrono::milliseconds timeout = std::chrono::seconds(30));
    virtual ~HttpClient() = default;

    virtual HttpResponse perform(HttpRequest const &request);

    std::chrono::milliseconds timeout() const noexcept
    {
        return timeout_;
    }

  private:
    std::chrono::milliseconds timeout_;
};

} // namespace tb::services
