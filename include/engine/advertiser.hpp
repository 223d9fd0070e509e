#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "common/process_runner.hpp"
#include "engine/engine.hpp"
#include "registry/instance.h"

/*==========================================================
 * VIP 通告器
 *
 * 每种引擎对应一个实现，全部通过 ProcessRunner 调用系统命令。
 * advertise 失败抛 std::runtime_error；withdraw / cleanup 只记日志。
 *=========================================================*/
class IAdvertiser {
public:
    virtual ~IAdvertiser() = default;

    // 引擎启动时调用一次，失败抛异常
    virtual void prepare(const EngineParams& params) { (void)params; }

    virtual void advertise(Instance& instance) = 0;

    // 返回是否成功撤销
    virtual bool withdraw(const Instance& instance) = 0;

    // 引擎退出时调用一次
    virtual void cleanup() {}

    virtual std::string name() const = 0;
};

// "10.0.0.1" -> "10.0.0.1/32"，IPv6 用 /128
std::string vip_cidr(const std::string& vip);
bool is_ipv6(const std::string& vip);

// 网卡地址增删的公共部分
class AddressAdvertiser : public IAdvertiser {
public:
    AddressAdvertiser(std::shared_ptr<ProcessRunner> runner, std::string interface);

    void advertise(Instance& instance) override;
    bool withdraw(const Instance& instance) override;

protected:
    ProcessRunner::Result run(const std::string& exe, std::vector<std::string> args);

    std::shared_ptr<ProcessRunner> runner_;
    std::string                    interface_;
};

// 网卡加地址后发送免费 ARP
class ArpAdvertiser : public AddressAdvertiser {
public:
    using AddressAdvertiser::AddressAdvertiser;

    void advertise(Instance& instance) override;
    std::string name() const override { return "arp"; }
};

// 地址挂在已存在的 WireGuard 隧道网卡上
class WireguardAdvertiser : public AddressAdvertiser {
public:
    using AddressAdvertiser::AddressAdvertiser;

    void prepare(const EngineParams& params) override;
    std::string name() const override { return "wireguard"; }
};

// 写入指定路由表，由外部路由进程分发
class RoutingTableAdvertiser : public IAdvertiser {
public:
    RoutingTableAdvertiser(std::shared_ptr<ProcessRunner> runner, std::string interface, int table, int protocol);

    void advertise(Instance& instance) override;
    bool withdraw(const Instance& instance) override;
    std::string name() const override { return "routing_table"; }

private:
    std::vector<std::string> route_args(const std::string& verb, const std::string& vip) const;

    std::shared_ptr<ProcessRunner> runner_;
    std::string                    interface_;
    int                            table_;
    int                            protocol_;
};

// 通过 gobgp CLI 操作本机 gobgpd
class BgpAdvertiser : public IAdvertiser {
public:
    explicit BgpAdvertiser(std::shared_ptr<ProcessRunner> runner);

    void prepare(const EngineParams& params) override;
    void advertise(Instance& instance) override;
    bool withdraw(const Instance& instance) override;
    void cleanup() override;
    std::string name() const override { return "bgp"; }

    const BgpConfig& config() const { return bgp_; }

private:
    ProcessRunner::Result gobgp(std::vector<std::string> args);

    std::shared_ptr<ProcessRunner> runner_;
    BgpConfig                      bgp_;
};
