#pragma once

#include <cstdint>
#include <cstring>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#ifdef __linux__
    #include <fcntl.h>
    #include <sys/mman.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace tessera::ipc
{

// Holds snapshot bitmaps by name.  The view process publishes a capture
// and sends only the name across the channel; the UI maps it by name.
class BlobStore
{
   public:
    virtual ~BlobStore() = default;

    virtual bool publish(const std::string& name, std::span<const uint8_t> bytes) = 0;
    virtual void release(const std::string& name)                               = 0;
    virtual std::optional<std::vector<uint8_t>> read(const std::string& name) const = 0;
    virtual size_t active_count() const                                         = 0;
};

// Keeps blobs in process memory.  Used by tests and in-process setups.
class MemoryBlobStore : public BlobStore
{
   public:
    bool publish(const std::string& name, std::span<const uint8_t> bytes) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        blobs_[name].assign(bytes.begin(), bytes.end());
        return true;
    }

    void release(const std::string& name) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        blobs_.erase(name);
    }

    std::optional<std::vector<uint8_t>> read(const std::string& name) const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto                        it = blobs_.find(name);
        if (it == blobs_.end())
            return std::nullopt;
        return it->second;
    }

    size_t active_count() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return blobs_.size();
    }

   private:
    mutable std::mutex                                     mu_;
    std::unordered_map<std::string, std::vector<uint8_t>> blobs_;
};

// POSIX shared-memory segments, one per blob.  Names must start with '/'.
// Every segment still published is unlinked on destruction so a crashed
// UI never leaves snapshots behind in /dev/shm.
class ShmBlobStore : public BlobStore
{
   public:
    ShmBlobStore() = default;
    ~ShmBlobStore() override { cleanup_all(); }

    ShmBlobStore(const ShmBlobStore&)            = delete;
    ShmBlobStore& operator=(const ShmBlobStore&) = delete;

    bool publish(const std::string& name, std::span<const uint8_t> bytes) override
    {
#ifdef __linux__
        std::lock_guard<std::mutex> lock(mu_);
        int fd = ::shm_open(name.c_str(), O_CREAT | O_RDWR | O_TRUNC, 0600);
        if (fd < 0)
            return false;
        if (bytes.empty() || ::ftruncate(fd, static_cast<off_t>(bytes.size())) != 0)
        {
            ::close(fd);
            ::shm_unlink(name.c_str());
            return false;
        }
        void* mem = ::mmap(nullptr, bytes.size(), PROT_WRITE, MAP_SHARED, fd, 0);
        ::close(fd);
        if (mem == MAP_FAILED)
        {
            ::shm_unlink(name.c_str());
            return false;
        }
        std::memcpy(mem, bytes.data(), bytes.size());
        ::munmap(mem, bytes.size());
        sizes_[name] = bytes.size();
        return true;
#else
        (void)name;
        (void)bytes;
        return false;
#endif
    }

    void release(const std::string& name) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (sizes_.erase(name) > 0)
            unlink_shm(name);
    }

    std::optional<std::vector<uint8_t>> read(const std::string& name) const override
    {
#ifdef __linux__
        int fd = ::shm_open(name.c_str(), O_RDONLY, 0);
        if (fd < 0)
            return std::nullopt;
        struct stat st
        {
        };
        if (::fstat(fd, &st) != 0 || st.st_size <= 0)
        {
            ::close(fd);
            return std::nullopt;
        }
        auto  size = static_cast<size_t>(st.st_size);
        void* mem  = ::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
        ::close(fd);
        if (mem == MAP_FAILED)
            return std::nullopt;
        std::vector<uint8_t> out(size);
        std::memcpy(out.data(), mem, size);
        ::munmap(mem, size);
        return out;
#else
        (void)name;
        return std::nullopt;
#endif
    }

    size_t active_count() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return sizes_.size();
    }

    void cleanup_all()
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto& [name, size] : sizes_)
            unlink_shm(name);
        sizes_.clear();
    }

   private:
    mutable std::mutex                      mu_;
    std::unordered_map<std::string, size_t> sizes_;

    static void unlink_shm([[maybe_unused]] const std::string& name)
    {
#ifdef __linux__
        ::shm_unlink(name.c_str());
#endif
    }
};

}   // namespace tessera::ipc
