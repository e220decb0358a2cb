#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#define LOCK_FILE ".lock"

/**
 * ModelLock
 *  - coarse per-model lock held around "write new unit" and "apply next unit"
 *  - a process wide mutex per model directory plus flock() on <dir>/.lock,
 *    so two threads or two ormigrate processes never interleave
 */
class ModelLock {
public:
    explicit ModelLock(const std::filesystem::path& model_dir);
    ~ModelLock();

    ModelLock(const ModelLock&) = delete;
    ModelLock& operator=(const ModelLock&) = delete;

private:
    std::shared_ptr<std::mutex> mx_;
    std::unique_lock<std::mutex> guard_;
    int fd_ = -1;
};
