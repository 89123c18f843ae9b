/*
 * HiveMem C++ - Sync listener
 *
 * Small HTTP/1.1 endpoint accepting `POST /sync` with a JSON body. Uses
 * poll() over non-blocking sockets on a single thread; every connection
 * carries exactly one request and is closed after the response.
 */
#ifndef hivemem_SYNC_SYNC_SERVER_HPP
#define hivemem_SYNC_SYNC_SERVER_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace hivemem {

class SyncServer {
public:
    // Returns the HTTP status; response receives the JSON body
    typedef std::function<int(const std::string& body, std::string& response)> Handler;

    static constexpr int MAX_CONNECTIONS = 32;
    static constexpr size_t MAX_REQUEST_SIZE = 16 * 1024 * 1024;

    SyncServer(const std::string& host, int port, Handler handler);
    ~SyncServer();

    // Binds, listens and starts the serving thread. Port 0 picks a free port.
    bool start();
    void stop();
    bool running() const { return running_.load(); }

    int bound_port() const { return bound_port_; }
    const std::string& last_error() const { return last_error_; }

private:
    struct Connection {
        int fd;
        std::string read_buffer;
        std::string write_buffer;
        bool responded;
        bool wants_close;

        explicit Connection(int f) : fd(f), responded(false), wants_close(false) {}
    };

    SyncServer(const SyncServer&);
    SyncServer& operator=(const SyncServer&);

    bool create_socket();
    void serve_loop();
    void poll_once(int timeout_ms);
    void accept_new_connections();
    // true once a full request was consumed and a response queued
    bool try_handle(Connection& conn);
    void queue_response(Connection& conn, int status, const std::string& body);
    void cleanup_closed_connections();

    std::string host_;
    int port_;
    int bound_port_;
    Handler handler_;
    int server_fd_;
    std::vector<Connection> connections_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::string last_error_;
};

} // namespace hivemem

#endif // hivemem_SYNC_SYNC_SERVER_HPP
