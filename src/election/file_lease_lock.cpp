#include "election/file_lease_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace {

// flock 的 RAII 包装，作用域内排他
class FlockGuard {
public:
    explicit FlockGuard(int fd) : fd_(fd) {
        while (flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                throw std::runtime_error(fmt::format("FileLeaseLock: flock failed: {}", strerror(errno)));
            }
        }
    }
    ~FlockGuard() { flock(fd_, LOCK_UN); }

    FlockGuard(const FlockGuard&)            = delete;
    FlockGuard& operator=(const FlockGuard&) = delete;

private:
    int fd_;
};

} // namespace

FileLeaseLock::FileLeaseLock(fs::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path());
    }
    /* 锁文件描述符只打开一次，析构时关闭 */
    fd_ = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error(fmt::format("FileLeaseLock: cannot open lease file {}: {}",
                                             path_.string(), strerror(errno)));
    }
}

FileLeaseLock::~FileLeaseLock() {
    if (fd_ >= 0) close(fd_);
}

/*------------------------------------------------------
 * 读写
 *----------------------------------------------------*/
std::optional<FileLeaseLock::Lease> FileLeaseLock::read_lease() {
    if (lseek(fd_, 0, SEEK_SET) < 0) {
        throw std::runtime_error(fmt::format("FileLeaseLock: lseek {}: {}", path_.string(), strerror(errno)));
    }
    std::string data;
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            throw std::runtime_error(fmt::format("FileLeaseLock: read {}: {}", path_.string(), strerror(errno)));
        }
        if (n == 0) break;
        data.append(buf, static_cast<std::size_t>(n));
    }
    if (data.empty()) return std::nullopt;

    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded()) {
        // 半截写入等损坏内容当作无租约，下一次写入会覆盖
        spdlog::warn("FileLeaseLock: {} holds malformed lease data, treating as empty", path_.string());
        return std::nullopt;
    }
    try {
        return j.get<Lease>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("FileLeaseLock: {} lease decode error: {}", path_.string(), e.what());
        return std::nullopt;
    }
}

void FileLeaseLock::write_lease(const Lease& l) {
    const std::string data = nlohmann::json(l).dump();
    if (ftruncate(fd_, 0) != 0 || lseek(fd_, 0, SEEK_SET) < 0) {
        throw std::runtime_error(fmt::format("FileLeaseLock: truncate {}: {}", path_.string(), strerror(errno)));
    }
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd_, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            throw std::runtime_error(fmt::format("FileLeaseLock: write {}: {}", path_.string(), strerror(errno)));
        }
        written += static_cast<std::size_t>(n);
    }
    if (fsync(fd_) != 0) {
        spdlog::warn("FileLeaseLock: fsync {}: {}", path_.string(), strerror(errno));
    }
}

LeaseRecord FileLeaseLock::to_record(const Lease& l) {
    LeaseRecord rec;
    rec.HolderIdentity       = l.holder;
    rec.LeaseDurationSeconds = l.duration;
    rec.AcquireTime          = l.acquired_at;
    rec.RenewTime            = l.renewed_at;
    rec.LeaseTransitions     = l.transitions;
    rec.ResourceVersion      = std::to_string(l.epoch);
    return rec;
}

FileLeaseLock::Lease FileLeaseLock::from_record(const LeaseRecord& rec, uint64_t epoch) {
    Lease l;
    l.epoch       = epoch;
    l.holder      = rec.HolderIdentity;
    l.duration    = rec.LeaseDurationSeconds;
    l.acquired_at = rec.AcquireTime;
    l.renewed_at  = rec.RenewTime;
    l.transitions = rec.LeaseTransitions;
    return l;
}

/*------------------------------------------------------
 * LeaseLock 接口
 *----------------------------------------------------*/
std::optional<LeaseRecord> FileLeaseLock::get() {
    FlockGuard guard(fd_);
    auto lease = read_lease();
    if (!lease) return std::nullopt;
    return to_record(*lease);
}

bool FileLeaseLock::create(const LeaseRecord& rec) {
    FlockGuard guard(fd_);
    if (read_lease()) {
        return false; // 其他人已创建
    }
    write_lease(from_record(rec, 1));
    return true;
}

bool FileLeaseLock::update(const LeaseRecord& rec) {
    FlockGuard guard(fd_);
    auto current = read_lease();
    if (!current) return false;
    if (std::to_string(current->epoch) != rec.ResourceVersion) {
        return false; // 版本冲突
    }
    write_lease(from_record(rec, current->epoch + 1));
    return true;
}

std::string FileLeaseLock::describe() const {
    return path_.string();
}
