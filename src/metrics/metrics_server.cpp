#include "metrics/metrics_server.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace {

int create_and_bind_tcp(const std::string& host_port) {
    size_t colon = host_port.rfind(':');
    if (colon == std::string::npos) throw std::runtime_error("MetricsServer: bad host:port " + host_port);
    std::string host = host_port.substr(0, colon);
    const std::string port_str = host_port.substr(colon + 1);
    if (port_str.empty() || port_str.size() > 5 ||
        port_str.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("MetricsServer: bad host:port " + host_port);
    }
    const int port = std::stoi(port_str);
    if (port > 65535) throw std::runtime_error("MetricsServer: bad host:port " + host_port);

    int sock = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock < 0) throw std::runtime_error(fmt::format("MetricsServer: socket: {}", strerror(errno)));

    int opt = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (host == "*" || host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        ::close(sock);
        throw std::runtime_error("MetricsServer: bad listen address " + host);
    }

    if (::bind(sock, (sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = errno;
        ::close(sock);
        throw std::runtime_error(fmt::format("MetricsServer: bind {}: {}", host_port, strerror(err)));
    }

    if (listen(sock, 16) < 0) {
        int err = errno;
        ::close(sock);
        throw std::runtime_error(fmt::format("MetricsServer: listen: {}", strerror(err)));
    }
    return sock;
}

} // namespace

MetricsServer::MetricsServer(std::string address, const Metrics& metrics)
    : address_(std::move(address)), metrics_(metrics)
{
}

MetricsServer::~MetricsServer() {
    if (listen_fd_ >= 0) ::close(listen_fd_);
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
}

void MetricsServer::bind() {
    listen_fd_ = create_and_bind_tcp(address_);

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, (sockaddr*)&bound, &len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) throw std::runtime_error("MetricsServer: epoll_create1");

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listen_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listen_fd_, &ev) < 0)
        throw std::runtime_error("MetricsServer: epoll_ctl add");
    spdlog::info("MetricsServer: serving metrics on {} (port {})", address_, port_);
}

void MetricsServer::serve(const StopToken& stop) {
    if (listen_fd_ < 0) bind();

    constexpr int max_events = 16;
    epoll_event events[max_events];
    while (!stop.stop_requested()) {
        int nf = epoll_wait(epoll_fd_, events, max_events, 200);
        if (nf < 0) {
            if (errno == EINTR) continue;
            spdlog::error("MetricsServer: epoll_wait error {}", strerror(errno));
            break;
        }
        for (int i = 0; i < nf; ++i) {
            if (events[i].data.fd != listen_fd_) continue;
            int conn = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (conn < 0) continue;
            handle_client(conn);
            ::close(conn);
        }
    }
    spdlog::info("MetricsServer: stopped");
}

void MetricsServer::handle_client(int conn) {
    // 只读一次请求头，内容无关紧要
    timeval tv{1, 0};
    setsockopt(conn, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    char buf[2048];
    if (read(conn, buf, sizeof(buf)) < 0) {
        spdlog::debug("MetricsServer: read request failed: {}", strerror(errno));
    }

    const std::string body = metrics_.render();
    const std::string resp = fmt::format(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain; version=0.0.4\r\n"
        "Content-Length: {}\r\n"
        "Connection: close\r\n\r\n{}",
        body.size(), body);

    std::size_t sent = 0;
    while (sent < resp.size()) {
        ssize_t n = ::send(conn, resp.data() + sent, resp.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            spdlog::debug("MetricsServer: client went away: {}", strerror(errno));
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}
