#include "election/lease_lock.hpp"

#include <chrono>
#include <ctime>

#include <fmt/core.h>
#include <fmt/chrono.h>

KubeLeaseLock::KubeLeaseLock(ClusterApi& client, std::string ns, std::string name)
    : client_(client), ns_(std::move(ns)), name_(std::move(name))
{
}

std::optional<LeaseRecord> KubeLeaseLock::get() {
    return client_.get_lease(ns_, name_);
}

bool KubeLeaseLock::create(const LeaseRecord& rec) {
    return client_.create_lease(ns_, name_, rec);
}

bool KubeLeaseLock::update(const LeaseRecord& rec) {
    return client_.update_lease(ns_, name_, rec);
}

std::string KubeLeaseLock::describe() const {
    return fmt::format("{}/{}", ns_, name_);
}

std::string now_micro_time() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto secs = time_point_cast<seconds>(now);
    const auto micros = duration_cast<microseconds>(now - secs).count();
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}Z", tm, micros);
}
