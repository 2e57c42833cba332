/**
 * @page ql-http-io-hdr HTTP I/O API (Header)
 * @file http_io.hpp
 * @brief Minimal blocking HTTP/1.1 client over POSIX sockets, one request per connection.
 *
 * @details
 * PURPOSE
 * -------
 * The bridge exposes four JSON endpoints on a plain HTTP port, usually on the
 * same host. Pulling a full HTTP stack in for that is overkill; this file is the
 * same kind of thin syscall layer the project uses for its other links: open,
 * write everything, read with a deadline, close.
 *
 * ROLE
 * ----
 * - qlink::open_tcp: resolve + non-blocking connect bounded by a timeout.
 * - qlink::write_all: loop until the whole request is written.
 * - qlink::read_response: accumulate bytes until the response is complete
 *   (Content-Length satisfied, final chunk seen, or peer closed).
 * - qlink::parse_http_response: status line, headers, body (chunked decoded).
 * - qlink::http_request: the four calls above glued together.
 *
 * DESIGN CHOICES
 * --------------
 * - `Connection: close` on every request. No keep-alive, no pooling; the
 *   inventory sends a few dozen requests per run.
 * - One overall deadline per request. Expiry returns false with err="timeout";
 *   the bridge layer maps that to a Transport error.
 * - No TLS. The bridge is a LAN service.
 *
 * EXAMPLE
 * -------
 * @code
 *   qlink::HttpResponse resp;
 *   std::string err;
 *   if (!qlink::http_request("localhost", 3000, "GET", "/servers", "", resp, 5000, err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *   } else if (resp.status == 200) {
 *       // resp.body holds the JSON text
 *   }
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * - Responses are buffered whole in memory (bridge replies are small).
 * - Header names are matched case-insensitively; duplicate headers keep the first.
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qlink {

struct HttpResponse {
    int status{0};
    std::string reason;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// Case-insensitive lookup; nullptr when absent.
    const std::string* header(const std::string& name) const;
};

/**
 * @brief Resolve @p host and connect within @p timeout_ms.
 * @return connected socket fd (blocking mode restored) or -1 with @p err set
 *         ("resolve_failed", "connect_failed", "timeout").
 */
int open_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string& err);

/// Write every byte of @p data; false on error or if @p timeout_ms passes.
bool write_all(int fd, const std::string& data, int timeout_ms, std::string& err);

/**
 * @brief Read one complete HTTP response into @p raw.
 *
 * Stops as soon as the response is complete according to its framing, or at
 * EOF. Returns false on poll/read error, on timeout, or on EOF before any byte.
 */
bool read_response(int fd, std::string& raw, int timeout_ms, std::string& err);

/// Parse status line, headers and body. Chunked bodies are decoded.
bool parse_http_response(const std::string& raw, HttpResponse& out, std::string& err);

/// Decode a chunked transfer-encoded body. False if malformed or truncated.
bool decode_chunked(const std::string& body, std::string& out);

/// Assemble request text (request line, Host, Connection: close, body headers).
std::string build_http_request(const std::string& method, const std::string& host, uint16_t port,
                               const std::string& path, const std::string& body,
                               const std::string& content_type = "application/json");

/// Close a descriptor from open_tcp(); negative fd is a no-op.
void close_tcp(int fd);

/**
 * @brief One full request/response exchange.
 * @return true if a well-formed response arrived (any status code); false on
 *         transport trouble with @p err set.
 */
bool http_request(const std::string& host, uint16_t port,
                  const std::string& method, const std::string& path,
                  const std::string& body, HttpResponse& out,
                  int timeout_ms, std::string& err);

} // namespace qlink
