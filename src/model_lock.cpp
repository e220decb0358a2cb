#include "model_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "lib.hpp"

namespace fs = std::filesystem;

namespace {

    std::shared_ptr<std::mutex> mutex_for(const std::string& key) {
        static std::mutex registry_mx;
        static std::map<std::string, std::shared_ptr<std::mutex>> registry;
        std::lock_guard<std::mutex> lk(registry_mx);
        auto& mx = registry[key];
        if (!mx) mx = std::make_shared<std::mutex>();
        return mx;
    }

}

ModelLock::ModelLock(const fs::path& model_dir) {
    fs::create_directories(model_dir);
    fs::path canonical = fs::weakly_canonical(model_dir);
    mx_ = mutex_for(canonical.string());
    guard_ = std::unique_lock<std::mutex>(*mx_);

    fs::path file = canonical / LOCK_FILE;
    fd_ = ::open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) THROW("Can not open lock file %s: %s", file.c_str(), std::strerror(errno));
    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        THROW("Can not lock %s: %s", file.c_str(), std::strerror(err));
    }
    SPDLOG_TRACE("Locked {}", file.string());
}

ModelLock::~ModelLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}
