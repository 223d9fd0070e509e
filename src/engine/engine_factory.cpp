#include "engine/engine_factory.hpp"

#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include "election/file_lease_lock.hpp"
#include "engine/bgp_engine.hpp"

LockFactory make_lock_factory(EngineContext& ctx) {
    const std::string& type = ctx.config.LeaderElectionType;

    if (type == VIPKEEPER_LEADER_ELECTION_FILE) {
        const std::filesystem::path dir = ctx.config.LeaseDir;
        return [dir](const std::string& lease_name) -> std::unique_ptr<LeaseLock> {
            return std::make_unique<FileLeaseLock>(dir / (lease_name + ".json"));
        };
    }

    if (type == VIPKEEPER_LEADER_ELECTION_KUBERNETES) {
        ClusterApi* client = ctx.client;
        const std::string ns = ctx.lease_namespace;
        return [client, ns](const std::string& lease_name) -> std::unique_ptr<LeaseLock> {
            if (!client) {
                throw std::runtime_error("kubernetes leader election requires a kubernetes client");
            }
            return std::make_unique<KubeLeaseLock>(*client, ns, lease_name);
        };
    }

    return [type](const std::string& lease_name) -> std::unique_ptr<LeaseLock> {
        throw std::runtime_error(fmt::format(
            "leader election backend '{}' cannot serve per-service lease {}", type, lease_name));
    };
}

LeaderElector::Options election_options(const VipConfig& config) {
    LeaderElector::Options opt;
    opt.identity       = config.NodeName;
    opt.lease_duration = std::chrono::seconds(config.LeaseDuration);
    opt.renew_deadline = std::chrono::seconds(config.RenewDeadline);
    opt.retry_period   = std::chrono::seconds(config.RetryPeriod);
    return opt;
}

std::unique_ptr<IEngine> make_default_engine(EngineKind kind, EngineContext& ctx) {
    const VipConfig& c = ctx.config;
    auto locks    = make_lock_factory(ctx);
    auto election = election_options(c);

    spdlog::debug("EngineFactory: building {} engine, lease backend {}", engine_name(kind), c.LeaderElectionType);
    switch (kind) {
        case EngineKind::Bgp:
            return std::make_unique<BgpEngine>(ctx.client, ctx.registry, ctx.metrics, ctx.runner,
                                               std::move(locks), std::move(election));
        case EngineKind::Arp:
            return std::make_unique<ServiceEngine>(
                "arp", ctx.client, ctx.registry, ctx.metrics,
                std::make_unique<ArpAdvertiser>(ctx.runner, service_interface(c)),
                std::move(locks), std::move(election));
        case EngineKind::Wireguard:
            return std::make_unique<ServiceEngine>(
                "wireguard", ctx.client, ctx.registry, ctx.metrics,
                std::make_unique<WireguardAdvertiser>(ctx.runner, c.WireguardInterface),
                std::move(locks), std::move(election));
        case EngineKind::RoutingTable:
            return std::make_unique<ServiceEngine>(
                "routing_table", ctx.client, ctx.registry, ctx.metrics,
                std::make_unique<RoutingTableAdvertiser>(ctx.runner, service_interface(c),
                                                         c.RoutingTableID, c.RoutingTableProtocol),
                std::move(locks), std::move(election));
    }
    throw std::logic_error("EngineFactory: unknown engine kind");
}
