#pragma once

// Minimal HTTP/1.1 plumbing for cmd_serve.cpp: one request per connection.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace scriptbox {

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Reads head + body. A Content-Length above max_body, a duplicate
// Content-Length or a head over 64KB fails the request.
inline bool read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false;
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return false;
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    int cl_count = 0;
    std::istringstream iss(head);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string low = line;
        for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        if (low.rfind("content-length:", 0) != 0) continue;
        if (++cl_count > 1) return false;
        std::string v = line.substr(15);
        while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
        if (v.empty() || !std::all_of(v.begin(), v.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;
        if (v.size() > 18) return false;
        cl = (size_t)std::stoull(v);
    }
    if (cl > max_body) return false;

    body = rest;
    while (body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false;
        body.append(buf.data(), (size_t)n);
    }
    if (body.size() > cl) body.resize(cl);
    return true;
}

inline const char* http_reason(int code) {
    switch (code) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "ERR";
    }
}

inline void send_all(int fd, const std::string& s) {
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

inline void send_bytes(int fd, int code, const char* content_type, const std::string& payload) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << payload.size() << "\r\n";
    oss << "X-Content-Type-Options: nosniff\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << payload;
    send_all(fd, oss.str());
}

inline void send_json(int fd, int code, const std::string& json) {
    send_bytes(fd, code, "application/json", json);
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line);
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c);
        for (char& ch : k) if (ch >= 'A' && ch <= 'Z') ch = (char)(ch - 'A' + 'a');
        if (k == key_lower) {
            std::string v = line.substr(c + 1);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            return v;
        }
    }
    return "";
}

inline bool constant_time_eq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); i++) diff |= (unsigned char)(a[i] ^ b[i]);
    return diff == 0;
}

// Accepts "X-Api-Token: <t>" or "Authorization: Bearer <t>". An empty
// expected token disables the check.
inline bool api_token_ok(const std::string& head, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    std::string x = header_value_ci(head, "x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    std::string auth = header_value_ci(head, "authorization");
    const std::string pfx = "Bearer ";
    if (auth.rfind(pfx, 0) == 0) return constant_time_eq(auth.substr(pfx.size()), expected_token);
    return false;
}

struct TokenBucket {
    double tokens{0.0};
    double rate_per_sec{0.0};
    double capacity{0.0};
    int64_t last_ms{0};

    void init(int rpm, int64_t now_ms) {
        last_ms = now_ms;
        if (rpm <= 0) { rate_per_sec = 0.0; capacity = 0.0; tokens = 0.0; return; }
        rate_per_sec = rpm / 60.0;
        capacity = (double)rpm;
        tokens = capacity;
    }

    bool allow(int cost, int64_t now_ms) {
        if (rate_per_sec <= 0.0 || capacity <= 0.0) return true;
        double dt = static_cast<double>(now_ms - last_ms) / 1000.0;
        if (dt > 0) {
            tokens = std::min(capacity, tokens + dt * rate_per_sec);
            last_ms = now_ms;
        }
        if (tokens >= cost) {
            tokens -= cost;
            return true;
        }
        return false;
    }
};

inline int64_t now_ms_steady() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Count a connection in `active` and run `spawn`, which starts its handler
// thread. If no thread can be started the count is given back, the client
// gets a 503 and `fd` is closed.
template <class Spawn>
bool start_connection(std::atomic<int>& active, int fd, Spawn&& spawn) {
    active.fetch_add(1);
    try {
        spawn();
        return true;
    } catch (const std::system_error& e) {
        active.fetch_sub(1);
        std::cerr << "[serve][WARN] cannot start connection thread: " << e.what() << "\n";
        send_json(fd, 503, "{\"ok\":false,\"error\":\"server busy\"}");
        ::close(fd);
        return false;
    }
}

} // namespace scriptbox
