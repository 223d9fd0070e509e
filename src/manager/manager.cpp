#include "manager/manager.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

#include <fmt/core.h>

#include "manager/annotations.hpp"
#include "metrics/metrics_server.hpp"

namespace {

ManagerDeps with_defaults(ManagerDeps deps) {
    if (!deps.hostname)       deps.hostname = system_hostname;
    if (!deps.engine_factory) deps.engine_factory = make_default_engine;
    if (!deps.runner)         deps.runner = std::make_shared<ProcessRunner>();
    if (!deps.env.make_client) {
        throw std::invalid_argument("Manager: bootstrap environment has no client factory");
    }
    return deps;
}

VipConfig with_node_name(VipConfig config, const std::function<std::string()>& hostname) {
    if (!config.NodeName.empty()) return config;

    spdlog::warn("Node name is missing from the config, fall back to hostname");
    std::string name;
    try {
        name = hostname();
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("could not get hostname: {}", e.what()));
    }
    if (name.empty()) {
        throw std::runtime_error("could not get hostname: empty hostname");
    }
    config.NodeName = std::move(name);
    return config;
}

// start() 无论以何种方式返回都要走完停机流程
class FinishGuard {
public:
    explicit FinishGuard(ShutdownCoordinator& c) : c_(c) {}
    ~FinishGuard() { c_.finish(); }

    FinishGuard(const FinishGuard&)            = delete;
    FinishGuard& operator=(const FinishGuard&) = delete;

private:
    ShutdownCoordinator& c_;
};

} // namespace

std::string system_hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        throw std::runtime_error(strerror(errno));
    }
    return buf;
}

ManagerDeps default_manager_deps() {
    ManagerDeps deps;
    deps.hostname       = system_hostname;
    deps.env            = default_bootstrap_env();
    deps.engine_factory = make_default_engine;
    deps.runner         = std::make_shared<ProcessRunner>();
    return deps;
}

/*------------------------------------------------------
 * Manager
 *----------------------------------------------------*/
Manager::Manager(VipConfig config, ManagerDeps deps)
    : deps_(with_defaults(std::move(deps))),
      config_(with_node_name(std::move(config), deps_.hostname)),
      client_(resolve_client(config_, deps_.env)),
      mirror_(deps_.runner, service_interface(config_), config_.MirrorDestInterface)
{
    spdlog::info("Manager: node {} using {} leader election", config_.NodeName, config_.LeaderElectionType);
}

Manager::~Manager() {
    // teardown 引用了 mirror_，必须在成员析构前执行
    coordinator_.finish();
}

std::optional<EngineKind> Manager::started_engine() const {
    const int v = started_engine_.load();
    if (v < 0) return std::nullopt;
    return static_cast<EngineKind>(v);
}

bool Manager::request_shutdown(int signo) {
    return coordinator_.trigger(signo);
}

void Manager::spawn_metrics_server() {
    if (config_.MetricsAddress.empty()) return;

    // 先在当前线程绑定，端口被占用时直接启动失败
    auto server = std::make_shared<MetricsServer>(config_.MetricsAddress, metrics_);
    server->bind();
    coordinator_.spawn("metrics-server", [server](const StopToken& stop) { server->serve(stop); });
}

EngineParams Manager::build_params(EngineKind kind) {
    EngineParams params;
    params.Bgp = config_.BGP;
    if (kind != EngineKind::Bgp || config_.Annotations.empty()) {
        return params;
    }

    std::optional<BgpConfig> bgp;
    try {
        bgp = wait_for_bgp_annotations(client_.get(), config_.NodeName, config_.Annotations, config_.BGP,
                                       coordinator_.token(), deps_.annotation_poll);
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("error watching node annotations: {}", e.what()));
    }
    if (bgp) params.Bgp = std::move(*bgp);
    return params;
}

void Manager::start() {
    if (started_.exchange(true)) {
        throw std::logic_error("Manager: start() may only be called once");
    }

    const auto kind = select_engine(config_);
    if (!kind) {
        spdlog::error("prematurely exiting load-balancer as no modes [ARP/BGP/Wireguard/RoutingTable] are enabled");
        coordinator_.finish();
        return;
    }

    if (deps_.capture_signals) coordinator_.arm();
    FinishGuard guard(coordinator_);

    spawn_metrics_server();

    EngineParams params = build_params(*kind);
    if (coordinator_.token().stop_requested()) {
        spdlog::info("Manager: shutdown requested before the {} engine started", engine_name(*kind));
        return;
    }

    lease_namespace_ = resolve_lease_namespace(config_, deps_.env);
    EngineContext ctx{config_, client_.get(), registry_, metrics_, deps_.runner, lease_namespace_};
    std::unique_ptr<IEngine> engine = deps_.engine_factory(*kind, ctx);
    if (!engine) {
        throw std::runtime_error(fmt::format("engine factory returned no {} engine", engine_name(*kind)));
    }

    mirror_.start();
    if (mirror_.enabled()) {
        coordinator_.add_teardown("traffic-mirror", [this] {
            if (!mirror_.stop()) {
                spdlog::error("Manager: failed to stop traffic mirroring from {} to {}",
                              mirror_.source(), mirror_.destination());
            }
        });
    }

    started_engine_ = static_cast<int>(*kind);
    spdlog::info("Manager: starting {} engine for node {}", engine->name(), config_.NodeName);
    engine->run(config_.NodeName, params, coordinator_.token());
    spdlog::info("Manager: {} engine returned", engine->name());
}
