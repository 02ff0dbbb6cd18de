#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <map>
#include <string>

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;
};

// Minimal blocking HTTP/1.1 client over a plain TCP socket.
// One request per connection. Throws std::runtime_error on network errors.
class HttpClient {
public:
    HttpClient(std::string host, int port,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(120000));

    HttpResponse post(const std::string& path, const std::string& body,
                      const std::string& contentType = "application/json");

    // Parses a raw response (status line, headers, body). Decodes chunked bodies.
    static HttpResponse parseResponse(const std::string& raw);

private:
    std::string host_;
    int port_;
    std::chrono::milliseconds timeout_;
};

#endif
