/*
 * HiveMem C++ - HTTP client (libcurl)
 *
 * Minimal blocking client used by the sync transport to push deltas.
 * Every request is bounded by connect/total timeouts and can be aborted
 * mid-transfer through a cancellation flag.
 */
#ifndef hivemem_CORE_HTTP_CLIENT_HPP
#define hivemem_CORE_HTTP_CLIENT_HPP

#include <hivemem/core/json.hpp>
#include <atomic>
#include <map>
#include <string>

namespace hivemem {

struct HttpResponse {
    int status_code;        // 0 when the transfer itself failed
    std::string body;
    std::string error;
    bool aborted;

    HttpResponse() : status_code(0), aborted(false) {}

    // Parsed body, null when the body is not JSON
    Json json() const;
};

class HttpClient {
public:
    HttpClient();

    void set_timeout_ms(long timeout_ms) { timeout_ms_ = timeout_ms; }
    void set_connect_timeout_ms(long timeout_ms) { connect_timeout_ms_ = timeout_ms; }

    // Transfer stops with aborted=true once *cancel becomes true
    void set_cancel_flag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers);

private:
    long timeout_ms_;
    long connect_timeout_ms_;
    const std::atomic<bool>* cancel_;
};

} // namespace hivemem

#endif // hivemem_CORE_HTTP_CLIENT_HPP
