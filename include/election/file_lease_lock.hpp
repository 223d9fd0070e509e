#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "election/lease_lock.hpp"

namespace fs = std::filesystem;

/*==========================================================
 * 本机文件租约
 *
 * 租约以 JSON 存在文件里，读改写期间持有 flock 排他锁；
 * epoch 充当 ResourceVersion，每次写入加一。
 * 适用于单机部署与测试，不能跨主机。
 *=========================================================*/
class FileLeaseLock : public LeaseLock {
public:
    explicit FileLeaseLock(fs::path path);
    ~FileLeaseLock() override;

    FileLeaseLock(const FileLeaseLock&)            = delete;
    FileLeaseLock& operator=(const FileLeaseLock&) = delete;

    std::optional<LeaseRecord> get() override;
    bool create(const LeaseRecord& rec) override;
    bool update(const LeaseRecord& rec) override;
    std::string describe() const override;

private:
    struct Lease {
        uint64_t    epoch = 0;
        std::string holder;
        int         duration = 0;
        std::string acquired_at;
        std::string renewed_at;
        int         transitions = 0;
        NLOHMANN_DEFINE_TYPE_INTRUSIVE(Lease, epoch, holder, duration, acquired_at, renewed_at, transitions)
    };

    // 持锁期间的读写
    std::optional<Lease> read_lease();
    void write_lease(const Lease& l);

    static LeaseRecord to_record(const Lease& l);
    static Lease from_record(const LeaseRecord& rec, uint64_t epoch);

    fs::path path_;
    int      fd_ = -1;
};
