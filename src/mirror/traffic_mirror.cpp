#include "mirror/traffic_mirror.hpp"

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

TrafficMirror::TrafficMirror(std::shared_ptr<ProcessRunner> runner, std::string src, std::string dst)
    : runner_(std::move(runner)), src_(std::move(src)), dst_(std::move(dst))
{
    if (!runner_) {
        throw std::invalid_argument("TrafficMirror: process runner must not be null");
    }
}

ProcessRunner::Result TrafficMirror::tc(std::vector<std::string> args) {
    return runner_->run({"tc", std::move(args), std::chrono::milliseconds{5000}});
}

void TrafficMirror::start() {
    if (!enabled()) return;
    if (src_.empty()) {
        throw std::runtime_error("TrafficMirror: mirror destination set but no source interface configured");
    }
    spdlog::info("TrafficMirror: mirroring traffic from {} to {}", src_, dst_);

    // 入向：ingress qdisc + mirred；出向：root prio qdisc + mirred
    const std::vector<std::vector<std::string>> steps = {
        {"qdisc", "add", "dev", src_, "handle", "ffff:", "ingress"},
        {"filter", "add", "dev", src_, "parent", "ffff:", "protocol", "all", "u32", "match", "u32", "0", "0",
         "action", "mirred", "egress", "mirror", "dev", dst_},
        {"qdisc", "add", "dev", src_, "handle", "1:", "root", "prio"},
        {"filter", "add", "dev", src_, "parent", "1:", "protocol", "all", "u32", "match", "u32", "0", "0",
         "action", "mirred", "egress", "mirror", "dev", dst_},
    };

    for (const auto& args : steps) {
        auto res = tc(args);
        if (!res.ok()) {
            const std::string what = fmt::format("TrafficMirror: `{}` failed: {}",
                                                 ProcessRunner::describe({"tc", args, std::nullopt}), res.output);
            stop();
            throw std::runtime_error(what);
        }
    }
}

bool TrafficMirror::stop() {
    if (!enabled()) return true;

    bool ok = true;
    auto res = tc({"qdisc", "del", "dev", src_, "handle", "ffff:", "ingress"});
    if (!res.ok()) {
        spdlog::debug("TrafficMirror: removing ingress qdisc on {}: {}", src_, res.output);
        ok = false;
    }
    res = tc({"qdisc", "del", "dev", src_, "root"});
    if (!res.ok()) {
        spdlog::debug("TrafficMirror: removing root qdisc on {}: {}", src_, res.output);
        ok = false;
    }
    if (ok) spdlog::info("TrafficMirror: stopped mirroring {} to {}", src_, dst_);
    return ok;
}
