// ============================================================================
// http_io.cpp - implementation for http_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "http_io.hpp"     // open_tcp(), write_all(), read_response(), parse_http_response(), ...

// POSIX socket headers
#include <fcntl.h>         // fcntl, O_NONBLOCK
#include <netdb.h>         // getaddrinfo, freeaddrinfo
#include <poll.h>          // poll(2) for every timed wait
#include <sys/socket.h>    // socket, connect, getsockopt, send, recv
#include <unistd.h>        // ::close

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <sstream>

namespace qlink {

using Clock = std::chrono::steady_clock;

static std::string lower(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

static std::string strip(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

// Milliseconds left until @p deadline, clamped at 0.
static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

const std::string* HttpResponse::header(const std::string& name) const {
    const std::string want = lower(name);
    for (const auto& h : headers)
        if (lower(h.first) == want) return &h.second;
    return nullptr;
}


// ---------------------------------------------------------------------------
// open_tcp()
// ----------
// Resolve with getaddrinfo() and try each address in turn.
// - Socket is put in O_NONBLOCK so connect() returns EINPROGRESS.
// - poll(POLLOUT) bounds the wait; SO_ERROR tells us how it went.
// - Blocking mode is restored before returning; later calls use poll() anyway.
//
// Returns: fd >= 0, or -1 with err = resolve_failed | connect_failed | timeout.
// ---------------------------------------------------------------------------
int open_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& err) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        err = "resolve_failed";
        return -1;
    }

    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    err = "connect_failed";
    int fd = -1;

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            int pr = ::poll(&pfd, 1, remaining_ms(deadline));
            if (pr == 0) {
                err = "timeout";
                rc  = -1;
            } else if (pr > 0) {
                int so_err = 0;
                socklen_t len = sizeof(so_err);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len);
                rc = so_err == 0 ? 0 : -1;
            }
        }

        if (rc == 0) {
            ::fcntl(fd, F_SETFL, flags);          // back to blocking
            break;
        }
        ::close(fd);
        fd = -1;
        if (remaining_ms(deadline) == 0) { err = "timeout"; break; }
    }

    ::freeaddrinfo(res);
    if (fd >= 0) err.clear();
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// send() until every byte is out. MSG_NOSIGNAL keeps a dead peer from
// killing the process with SIGPIPE.
// ---------------------------------------------------------------------------
bool write_all(int fd, const std::string& data, int timeout_ms, std::string& err) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t off = 0;
    pollfd pfd{fd, POLLOUT, 0};

    while (off < data.size()) {
        int pr = ::poll(&pfd, 1, remaining_ms(deadline));
        if (pr == 0) { err = "timeout"; return false; }
        if (pr < 0) {
            if (errno == EINTR) continue;
            err = "write_failed";
            return false;
        }
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            err = "write_failed";
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}


// ---------------------------------------------------------------------------
// response_complete()
// -------------------
// Decide from what we have so far whether the response is finished:
// - headers not yet terminated      -> no
// - Content-Length present          -> body length reached
// - chunked                         -> terminating "0\r\n\r\n" seen
// - neither                         -> only EOF ends it
// ---------------------------------------------------------------------------
static bool response_complete(const std::string& raw) {
    const std::size_t hdr_end = raw.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;

    const std::string head = lower(raw.substr(0, hdr_end));
    const std::size_t body_at = hdr_end + 4;

    std::size_t cl = head.find("\r\ncontent-length:");
    if (cl != std::string::npos) {
        std::size_t v = cl + 17;
        std::size_t eol = head.find("\r\n", v);
        std::string num = strip(head.substr(v, eol == std::string::npos ? std::string::npos : eol - v));
        char* endp = nullptr;
        unsigned long want = std::strtoul(num.c_str(), &endp, 10);
        if (endp && *endp == '\0' && !num.empty())
            return raw.size() - body_at >= want;
    }
    if (head.find("transfer-encoding: chunked") != std::string::npos ||
        head.find("transfer-encoding:chunked") != std::string::npos) {
        return raw.find("\r\n0\r\n\r\n", body_at - 2) != std::string::npos;
    }
    return false;
}

bool read_response(int fd, std::string& raw, int timeout_ms, std::string& err) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    raw.clear();
    char buf[4096];
    pollfd pfd{fd, POLLIN, 0};

    while (true) {
        int pr = ::poll(&pfd, 1, remaining_ms(deadline));
        if (pr == 0) { err = "timeout"; return false; }
        if (pr < 0) {
            if (errno == EINTR) continue;
            err = "read_failed";
            return false;
        }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            err = "read_failed";
            return false;
        }
        if (n == 0) {                              // peer closed
            if (raw.empty()) { err = "empty_response"; return false; }
            return true;
        }
        raw.append(buf, static_cast<std::size_t>(n));
        if (response_complete(raw)) return true;
    }
}


// ---------------------------------------------------------------------------
// decode_chunked()
// ----------------
// <hex-size>[;ext]\r\n<data>\r\n ... 0\r\n[trailers]\r\n
// Trailers are ignored.
// ---------------------------------------------------------------------------
bool decode_chunked(const std::string& body, std::string& out) {
    out.clear();
    std::size_t pos = 0;
    while (true) {
        std::size_t eol = body.find("\r\n", pos);
        if (eol == std::string::npos) return false;

        std::string size_txt = body.substr(pos, eol - pos);
        std::size_t semi = size_txt.find(';');
        if (semi != std::string::npos) size_txt.resize(semi);
        size_txt = strip(size_txt);
        if (size_txt.empty()) return false;

        char* endp = nullptr;
        unsigned long n = std::strtoul(size_txt.c_str(), &endp, 16);
        if (!endp || *endp != '\0') return false;

        pos = eol + 2;
        if (n == 0) return true;
        if (body.size() < pos + n + 2) return false;  // truncated
        out.append(body, pos, n);
        pos += n;
        if (body.compare(pos, 2, "\r\n") != 0) return false;
        pos += 2;
    }
}

bool parse_http_response(const std::string& raw, HttpResponse& out, std::string& err) {
    out = HttpResponse{};

    const std::size_t hdr_end = raw.find("\r\n\r\n");
    if (hdr_end == std::string::npos) { err = "bad_response"; return false; }

    std::istringstream head(raw.substr(0, hdr_end));
    std::string line;
    if (!std::getline(head, line)) { err = "bad_response"; return false; }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // "HTTP/1.1 200 OK"
    if (line.compare(0, 5, "HTTP/") != 0) { err = "bad_status_line"; return false; }
    std::size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) { err = "bad_status_line"; return false; }
    std::size_t sp2 = line.find(' ', sp1 + 1);
    std::string code = line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    if (code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
        !std::isdigit(static_cast<unsigned char>(code[1])) ||
        !std::isdigit(static_cast<unsigned char>(code[2]))) {
        err = "bad_status_line";
        return false;
    }
    out.status = std::atoi(code.c_str());
    if (sp2 != std::string::npos) out.reason = line.substr(sp2 + 1);

    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::size_t colon = line.find(':');
        if (colon == std::string::npos) continue;        // tolerate junk header lines
        std::string name = strip(line.substr(0, colon));
        if (out.header(name)) continue;                  // first one wins
        out.headers.emplace_back(name, strip(line.substr(colon + 1)));
    }

    std::string body = raw.substr(hdr_end + 4);
    const std::string* te = out.header("Transfer-Encoding");
    if (te && lower(*te).find("chunked") != std::string::npos) {
        if (!decode_chunked(body, out.body)) { err = "bad_chunked_body"; return false; }
        return true;
    }

    const std::string* cl = out.header("Content-Length");
    if (cl) {
        char* endp = nullptr;
        unsigned long want = std::strtoul(cl->c_str(), &endp, 10);
        if (!endp || *endp != '\0') { err = "bad_content_length"; return false; }
        if (body.size() < want) { err = "truncated_body"; return false; }
        body.resize(want);
    }
    out.body = std::move(body);
    return true;
}

std::string build_http_request(const std::string& method, const std::string& host, uint16_t port,
                               const std::string& path, const std::string& body,
                               const std::string& content_type) {
    std::ostringstream os;
    os << method << ' ' << (path.empty() ? "/" : path) << " HTTP/1.1\r\n";
    os << "Host: " << host << ':' << port << "\r\n";
    os << "Accept: application/json\r\n";
    os << "Connection: close\r\n";
    if (!body.empty() || method == "POST") {
        os << "Content-Type: " << content_type << "\r\n";
        os << "Content-Length: " << body.size() << "\r\n";
    }
    os << "\r\n" << body;
    return os.str();
}

void close_tcp(int fd) {
    if (fd >= 0) ::close(fd);
}

bool http_request(const std::string& host, uint16_t port,
                  const std::string& method, const std::string& path,
                  const std::string& body, HttpResponse& out,
                  int timeout_ms, std::string& err) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    int fd = open_tcp(host, port, timeout_ms, err);
    if (fd < 0) return false;

    std::string raw;
    bool ok = write_all(fd, build_http_request(method, host, port, path, body), remaining_ms(deadline), err) &&
              read_response(fd, raw, remaining_ms(deadline), err) &&
              parse_http_response(raw, out, err);
    close_tcp(fd);
    return ok;
}

} // namespace qlink
