#include "net/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using socket_t = int;
static constexpr socket_t kInvalidSocket = -1;

static void closesock(socket_t s) { ::close(s); }

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Closes the socket on every exit path
struct SocketGuard {
    socket_t sock = kInvalidSocket;
    ~SocketGuard() {
        if (sock != kInvalidSocket) closesock(sock);
    }
};

// Constructor
HttpClient::HttpClient(std::string host, int port, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), timeout_(timeout) {}

HttpResponse HttpClient::post(const std::string& path, const std::string& body, const std::string& contentType) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(port_);
    const int gai = ::getaddrinfo(host_.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        throw std::runtime_error("cannot resolve " + host_ + ": " + ::gai_strerror(gai));
    }

    SocketGuard guard;
    int lastErr = 0;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s == kInvalidSocket) {
            lastErr = errno;
            continue;
        }

        timeval tv{};
        tv.tv_sec = (long)(timeout_.count() / 1000);
        tv.tv_usec = (long)((timeout_.count() % 1000) * 1000);
        ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) {
            guard.sock = s;
            break;
        }
        lastErr = errno;
        closesock(s);
    }
    ::freeaddrinfo(res);

    if (guard.sock == kInvalidSocket) {
        throw std::runtime_error("cannot connect to " + host_ + ":" + port + ": " + std::strerror(lastErr));
    }

    std::string request;
    request += "POST " + path + " HTTP/1.1\r\n";
    request += "Host: " + host_ + ":" + port + "\r\n";
    request += "Content-Type: " + contentType + "\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Accept: application/json\r\n";
    request += "Connection: close\r\n\r\n";
    request += body;

    std::size_t sent = 0;
    while (sent < request.size()) {
        const ssize_t n = ::send(guard.sock, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("send() failed: ") + std::strerror(errno));
        }
        sent += (std::size_t)n;
    }

    std::string raw;
    char buff[4096];
    while (true) {
        const ssize_t n = ::recv(guard.sock, buff, sizeof(buff), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("recv() failed: ") + std::strerror(errno));
        }
        raw.append(buff, (std::size_t)n);
    }

    return parseResponse(raw);
}

HttpResponse HttpClient::parseResponse(const std::string& raw) {
    const auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) throw std::runtime_error("malformed HTTP response");

    HttpResponse resp;

    const auto lineEnd = raw.find("\r\n");
    const std::string statusLine = raw.substr(0, lineEnd);
    if (statusLine.compare(0, 5, "HTTP/") != 0) throw std::runtime_error("malformed HTTP status line");

    const auto sp = statusLine.find(' ');
    if (sp == std::string::npos) throw std::runtime_error("malformed HTTP status line");
    resp.status = std::atoi(statusLine.c_str() + sp + 1);

    std::size_t pos = lineEnd + 2;
    while (pos < headerEnd) {
        auto next = raw.find("\r\n", pos);
        if (next == std::string::npos || next > headerEnd) next = headerEnd;
        const std::string line = raw.substr(pos, next - pos);
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            resp.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        pos = next + 2;
    }

    std::string body = raw.substr(headerEnd + 4);

    auto te = resp.headers.find("transfer-encoding");
    if (te != resp.headers.end() && lower(te->second).find("chunked") != std::string::npos) {
        std::string decoded;
        std::size_t p = 0;
        while (p < body.size()) {
            const auto crlf = body.find("\r\n", p);
            if (crlf == std::string::npos) break;
            const std::size_t size = std::strtoul(body.substr(p, crlf - p).c_str(), nullptr, 16);
            if (size == 0) break;
            p = crlf + 2;
            if (p + size > body.size()) throw std::runtime_error("truncated chunked HTTP body");
            decoded.append(body, p, size);
            p += size + 2;
        }
        body.swap(decoded);
    }

    resp.body = std::move(body);
    return resp;
}
