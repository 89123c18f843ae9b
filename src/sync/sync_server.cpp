/*
 * HiveMem C++ - Sync listener Implementation
 */
#include <hivemem/sync/sync_server.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace hivemem {

namespace {

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        default: return "Internal Server Error";
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

} // anonymous namespace

SyncServer::SyncServer(const std::string& host, int port, Handler handler)
    : host_(host)
    , port_(port)
    , bound_port_(0)
    , handler_(handler)
    , server_fd_(-1)
    , running_(false)
{
}

SyncServer::~SyncServer() {
    stop();
}

bool SyncServer::start() {
    if (running_) return true;
    if (!create_socket()) {
        return false;
    }
    running_ = true;
    thread_ = std::thread(&SyncServer::serve_loop, this);
    LOG_INFO("[SyncServer] Listening on %s:%d", host_.c_str(), bound_port_);
    return true;
}

void SyncServer::stop() {
    bool was_running = running_.exchange(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    for (auto& conn : connections_) {
        if (conn.fd >= 0) close(conn.fd);
    }
    connections_.clear();
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
    if (was_running) {
        LOG_INFO("[SyncServer] Listener on port %d closed", bound_port_);
    }
}

bool SyncServer::create_socket() {
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        last_error_ = std::string("socket() failed: ") + strerror(errno);
        LOG_ERROR("[SyncServer] %s", last_error_.c_str());
        return false;
    }

    int yes = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    set_nonblocking(server_fd_);

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    std::string host = (host_.empty() || host_ == "localhost") ? "127.0.0.1" : host_;
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        last_error_ = "invalid listen address: " + host_;
        LOG_ERROR("[SyncServer] %s", last_error_.c_str());
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = std::string("bind() failed: ") + strerror(errno);
        LOG_ERROR("[SyncServer] %s (%s:%d)", last_error_.c_str(), host.c_str(), port_);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, MAX_CONNECTIONS) < 0) {
        last_error_ = std::string("listen() failed: ") + strerror(errno);
        LOG_ERROR("[SyncServer] %s", last_error_.c_str());
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port_;
    }
    return true;
}

void SyncServer::serve_loop() {
    while (running_) {
        poll_once(100);
    }
}

void SyncServer::poll_once(int timeout_ms) {
    std::vector<pollfd> fds;
    fds.reserve(1 + connections_.size());
    pollfd server_pfd;
    server_pfd.fd = server_fd_;
    server_pfd.events = POLLIN;
    server_pfd.revents = 0;
    fds.push_back(server_pfd);

    for (const auto& conn : connections_) {
        pollfd pfd;
        pfd.fd = conn.fd;
        pfd.events = POLLIN;
        if (!conn.write_buffer.empty()) pfd.events |= POLLOUT;
        pfd.revents = 0;
        fds.push_back(pfd);
    }

    int ret = ::poll(fds.data(), fds.size(), timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            LOG_WARN("[SyncServer] poll() error: %s", strerror(errno));
        }
        return;
    }
    if (ret == 0) return;

    if (fds[0].revents & POLLIN) {
        accept_new_connections();
    }

    for (size_t i = 1; i < fds.size() && i - 1 < connections_.size(); ++i) {
        Connection& conn = connections_[i - 1];

        if (fds[i].revents & POLLIN) {
            char buf[4096];
            ssize_t n = read(conn.fd, buf, sizeof(buf));
            if (n > 0) {
                conn.read_buffer.append(buf, static_cast<size_t>(n));
                if (conn.read_buffer.size() > MAX_REQUEST_SIZE) {
                    queue_response(conn, 413, "{\"error\":\"request too large\"}");
                } else if (!conn.responded) {
                    try_handle(conn);
                }
            } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                conn.wants_close = true;
            }
        }

        if ((fds[i].revents & POLLOUT) && !conn.write_buffer.empty()) {
            ssize_t n = write(conn.fd, conn.write_buffer.data(), conn.write_buffer.size());
            if (n > 0) {
                conn.write_buffer.erase(0, static_cast<size_t>(n));
                if (conn.write_buffer.empty() && conn.responded) {
                    conn.wants_close = true;
                }
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                conn.wants_close = true;
            }
        }

        if (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            conn.wants_close = true;
        }
    }

    cleanup_closed_connections();
}

void SyncServer::accept_new_connections() {
    while (true) {
        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("[SyncServer] accept() error: %s", strerror(errno));
            }
            break;
        }
        if (connections_.size() >= static_cast<size_t>(MAX_CONNECTIONS)) {
            LOG_WARN("[SyncServer] Max connections reached, rejecting");
            close(client_fd);
            continue;
        }
        set_nonblocking(client_fd);
        connections_.push_back(Connection(client_fd));
    }
}

bool SyncServer::try_handle(Connection& conn) {
    size_t header_end = conn.read_buffer.find("\r\n\r\n");
    if (header_end == std::string::npos) return false;

    std::string head = conn.read_buffer.substr(0, header_end);
    std::vector<std::string> lines = split(head, '\n');
    if (lines.empty()) {
        queue_response(conn, 400, "{\"error\":\"empty request\"}");
        return true;
    }

    std::vector<std::string> request_line = split(trim(lines[0]), ' ');
    if (request_line.size() < 2) {
        queue_response(conn, 400, "{\"error\":\"malformed request line\"}");
        return true;
    }

    size_t content_length = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) == "content-length") {
            content_length = static_cast<size_t>(std::strtoul(trim(line.substr(colon + 1)).c_str(), nullptr, 10));
        }
    }
    if (content_length > MAX_REQUEST_SIZE) {
        queue_response(conn, 413, "{\"error\":\"request too large\"}");
        return true;
    }

    size_t body_start = header_end + 4;
    if (conn.read_buffer.size() < body_start + content_length) {
        return false;   // body still arriving
    }

    if (request_line[1] != "/sync") {
        queue_response(conn, 404, "{\"error\":\"unknown path\"}");
        return true;
    }
    if (request_line[0] != "POST") {
        queue_response(conn, 405, "{\"error\":\"POST required\"}");
        return true;
    }

    std::string body = conn.read_buffer.substr(body_start, content_length);
    std::string response;
    int status = handler_ ? handler_(body, response) : 500;
    queue_response(conn, status, response);
    return true;
}

void SyncServer::queue_response(Connection& conn, int status, const std::string& body) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
    out += "Content-Type: application/json\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    conn.write_buffer += out;
    conn.responded = true;
    conn.read_buffer.clear();
}

void SyncServer::cleanup_closed_connections() {
    auto it = std::remove_if(connections_.begin(), connections_.end(),
        [](const Connection& conn) {
            if (conn.wants_close) {
                close(conn.fd);
                return true;
            }
            return false;
        });
    connections_.erase(it, connections_.end());
}

} // namespace hivemem
