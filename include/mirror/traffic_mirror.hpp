#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <memory>
#include <string>
#include <vector>

#include "common/process_runner.hpp"

/*==========================================================
 * 流量镜像
 *
 * 用 tc 把源网卡的入向和出向报文复制到目标网卡。
 * dst 为空时 start/stop 都不做任何事。
 *=========================================================*/
class TrafficMirror {
public:
    TrafficMirror(std::shared_ptr<ProcessRunner> runner, std::string src, std::string dst);

    bool enabled() const { return !dst_.empty(); }
    const std::string& source() const { return src_; }
    const std::string& destination() const { return dst_; }

    // 安装失败抛 std::runtime_error，已装上的部分会先回滚
    void start();

    // 尽力删除，任何一步失败返回 false
    bool stop();

private:
    ProcessRunner::Result tc(std::vector<std::string> args);

    std::shared_ptr<ProcessRunner> runner_;
    std::string                    src_;
    std::string                    dst_;
};
