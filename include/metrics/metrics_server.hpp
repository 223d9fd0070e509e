#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <string>

#include "common/stop_token.hpp"
#include "metrics/metrics.hpp"

// 极简 HTTP 导出端：任何请求都返回当前指标文本
class MetricsServer {
public:
    // address 形如 "host:port"，host 为 "*" 时监听所有地址
    MetricsServer(std::string address, const Metrics& metrics);
    ~MetricsServer();

    MetricsServer(const MetricsServer&)            = delete;
    MetricsServer& operator=(const MetricsServer&) = delete;

    // 绑定失败抛 std::runtime_error
    void bind();

    // 阻塞运行直到 stop 被触发
    void serve(const StopToken& stop);

    int port() const { return port_; }

private:
    void handle_client(int conn);

    std::string    address_;
    const Metrics& metrics_;
    int            listen_fd_ = -1;
    int            epoll_fd_  = -1;
    int            port_      = 0;
};
