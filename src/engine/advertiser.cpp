#include "engine/advertiser.hpp"

#include <any>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

using namespace std::chrono_literals;

namespace {

constexpr auto COMMAND_TIMEOUT = std::chrono::milliseconds{10000};

// 优先使用 advertise 时记录下的前缀
std::string recorded_cidr(const Instance& instance) {
    if (const auto* cidr = std::any_cast<std::string>(&instance.EngineState)) {
        return *cidr;
    }
    return vip_cidr(instance.VIP);
}

} // namespace

bool is_ipv6(const std::string& vip) {
    return vip.find(':') != std::string::npos;
}

std::string vip_cidr(const std::string& vip) {
    return vip + (is_ipv6(vip) ? "/128" : "/32");
}

/*------------------------------------------------------
 * AddressAdvertiser
 *----------------------------------------------------*/
AddressAdvertiser::AddressAdvertiser(std::shared_ptr<ProcessRunner> runner, std::string interface)
    : runner_(std::move(runner)), interface_(std::move(interface))
{
    if (!runner_) {
        throw std::invalid_argument("AddressAdvertiser: process runner must not be null");
    }
}

ProcessRunner::Result AddressAdvertiser::run(const std::string& exe, std::vector<std::string> args) {
    return runner_->run({exe, std::move(args), COMMAND_TIMEOUT});
}

void AddressAdvertiser::advertise(Instance& instance) {
    if (interface_.empty()) {
        throw std::runtime_error(fmt::format("{}: no interface configured for VIP {}", name(), instance.VIP));
    }
    const std::string cidr = vip_cidr(instance.VIP);
    auto res = run("ip", {"addr", "add", cidr, "dev", interface_});
    if (!res.ok() && res.output.find("File exists") == std::string::npos) {
        throw std::runtime_error(fmt::format("{}: failed to add {} to {}: {}",
                                             name(), cidr, interface_, res.output));
    }
    instance.Interface   = interface_;
    instance.EngineState = cidr;
    spdlog::info("{}: added {} to {} for service {}/{}", name(), cidr, interface_,
                 instance.Namespace, instance.Name);
}

bool AddressAdvertiser::withdraw(const Instance& instance) {
    const std::string cidr  = recorded_cidr(instance);
    const std::string iface = instance.Interface.empty() ? interface_ : instance.Interface;
    auto res = run("ip", {"addr", "del", cidr, "dev", iface});
    if (!res.ok()) {
        if (res.output.find("Cannot assign requested address") != std::string::npos) {
            spdlog::debug("{}: {} already absent from {}", name(), cidr, iface);
            return true;
        }
        spdlog::error("{}: failed to remove {} from {}: {}", name(), cidr, iface, res.output);
        return false;
    }
    spdlog::info("{}: removed {} from {}", name(), cidr, iface);
    return true;
}

/*------------------------------------------------------
 * ArpAdvertiser
 *----------------------------------------------------*/
void ArpAdvertiser::advertise(Instance& instance) {
    AddressAdvertiser::advertise(instance);
    if (is_ipv6(instance.VIP)) {
        // IPv6 依赖内核的 unsolicited NA
        return;
    }
    auto res = run("arping", {"-U", "-c", "3", "-I", interface_, instance.VIP});
    if (!res.ok()) {
        spdlog::warn("arp: gratuitous ARP for {} on {} failed: {}", instance.VIP, interface_, res.output);
    }
}

/*------------------------------------------------------
 * WireguardAdvertiser
 *----------------------------------------------------*/
void WireguardAdvertiser::prepare(const EngineParams& params) {
    (void)params;
    auto res = run("ip", {"link", "show", interface_});
    if (!res.ok()) {
        throw std::runtime_error(fmt::format("wireguard: tunnel interface {} is not present: {}",
                                             interface_, res.output));
    }
}

/*------------------------------------------------------
 * RoutingTableAdvertiser
 *----------------------------------------------------*/
RoutingTableAdvertiser::RoutingTableAdvertiser(std::shared_ptr<ProcessRunner> runner, std::string interface,
                                               int table, int protocol)
    : runner_(std::move(runner)), interface_(std::move(interface)), table_(table), protocol_(protocol)
{
    if (!runner_) {
        throw std::invalid_argument("RoutingTableAdvertiser: process runner must not be null");
    }
}

std::vector<std::string> RoutingTableAdvertiser::route_args(const std::string& verb, const std::string& vip) const {
    std::vector<std::string> args;
    if (is_ipv6(vip)) args.push_back("-6");
    args.insert(args.end(), {"route", verb, vip_cidr(vip), "dev", interface_,
                             "table", std::to_string(table_), "proto", std::to_string(protocol_)});
    return args;
}

void RoutingTableAdvertiser::advertise(Instance& instance) {
    auto res = runner_->run({"ip", route_args("replace", instance.VIP), COMMAND_TIMEOUT});
    if (!res.ok()) {
        throw std::runtime_error(fmt::format("routing_table: failed to add route for {} to table {}: {}",
                                             instance.VIP, table_, res.output));
    }
    instance.Interface   = interface_;
    instance.EngineState = vip_cidr(instance.VIP);
    spdlog::info("routing_table: added route {} to table {}", vip_cidr(instance.VIP), table_);
}

bool RoutingTableAdvertiser::withdraw(const Instance& instance) {
    auto res = runner_->run({"ip", route_args("del", instance.VIP), COMMAND_TIMEOUT});
    if (!res.ok()) {
        spdlog::error("routing_table: failed to delete route for {} from table {}: {}",
                      instance.VIP, table_, res.output);
        return false;
    }
    spdlog::info("routing_table: deleted route {} from table {}", vip_cidr(instance.VIP), table_);
    return true;
}

/*------------------------------------------------------
 * BgpAdvertiser
 *----------------------------------------------------*/
BgpAdvertiser::BgpAdvertiser(std::shared_ptr<ProcessRunner> runner)
    : runner_(std::move(runner))
{
    if (!runner_) {
        throw std::invalid_argument("BgpAdvertiser: process runner must not be null");
    }
}

ProcessRunner::Result BgpAdvertiser::gobgp(std::vector<std::string> args) {
    return runner_->run({bgp_.GobgpPath, std::move(args), COMMAND_TIMEOUT});
}

void BgpAdvertiser::prepare(const EngineParams& params) {
    bgp_ = params.Bgp;
    const std::string router_id = bgp_.RouterID.empty() ? bgp_.SourceIP : bgp_.RouterID;
    if (router_id.empty()) {
        throw std::runtime_error("bgp: neither router_id nor source_ip is configured");
    }

    auto res = gobgp({"global", "as", std::to_string(bgp_.AS), "router-id", router_id});
    if (!res.ok()) {
        throw std::runtime_error(fmt::format("bgp: failed to configure global AS {}: {}", bgp_.AS, res.output));
    }
    for (const auto& peer : bgp_.Peers) {
        if (!peer.Password.empty()) {
            spdlog::warn("bgp: password for peer {} must be configured in gobgpd, ignoring", peer.Address);
        }
        res = gobgp({"neighbor", "add", peer.Address, "as", std::to_string(peer.AS)});
        if (!res.ok()) {
            throw std::runtime_error(fmt::format("bgp: failed to add peer {}: {}", peer.Address, res.output));
        }
        spdlog::info("bgp: added peer {} AS {}", peer.Address, peer.AS);
    }
}

void BgpAdvertiser::advertise(Instance& instance) {
    const std::string cidr = vip_cidr(instance.VIP);
    auto res = gobgp({"global", "rib", "add", cidr, "-a", is_ipv6(instance.VIP) ? "ipv6" : "ipv4"});
    if (!res.ok()) {
        throw std::runtime_error(fmt::format("bgp: failed to advertise {}: {}", cidr, res.output));
    }
    instance.EngineState = cidr;
    spdlog::info("bgp: advertising {} for service {}/{}", cidr, instance.Namespace, instance.Name);
}

bool BgpAdvertiser::withdraw(const Instance& instance) {
    const std::string cidr = recorded_cidr(instance);
    auto res = gobgp({"global", "rib", "del", cidr, "-a", is_ipv6(instance.VIP) ? "ipv6" : "ipv4"});
    if (!res.ok()) {
        spdlog::error("bgp: failed to withdraw {}: {}", cidr, res.output);
        return false;
    }
    spdlog::info("bgp: withdrew {}", cidr);
    return true;
}

void BgpAdvertiser::cleanup() {
    for (const auto& peer : bgp_.Peers) {
        auto res = gobgp({"neighbor", "del", peer.Address});
        if (!res.ok()) {
            spdlog::error("bgp: failed to remove peer {}: {}", peer.Address, res.output);
        }
    }
}
