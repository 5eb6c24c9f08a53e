#include "memrun/memory_file.hpp"
#include "memrun/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <string>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/mman.h>
#include <sys/sysinfo.h>
#include <unistd.h>

namespace memrun {

namespace {

// MemAvailable + SwapFree from /proc/meminfo, or the sysinfo totals when that is unreadable.
std::optional<std::uint64_t> availableMemory() {
    std::ifstream meminfo("/proc/meminfo");
    std::string name;
    std::uint64_t kib = 0;
    std::uint64_t total = 0;
    int found = 0;
    while (meminfo >> name >> kib) {
        if (name == "MemAvailable:" || name == "SwapFree:") {
            total += kib * 1024;
            ++found;
        }
        meminfo.ignore(64, '\n');
    }
    if (found > 0) {
        return total;
    }

    struct sysinfo info {};
    if (::sysinfo(&info) != 0) {
        return std::nullopt;
    }
    return (static_cast<std::uint64_t>(info.totalram) + info.totalswap) * info.mem_unit;
}

bool isOutOfMemory(int err) { return err == ENOSPC || err == ENOMEM; }

} // namespace

MemoryFile MemoryFile::allocate(const std::string& name, std::uint64_t size) {
    // No MFD_CLOEXEC: the descriptor must survive execvp into the target program.
    const int fd = memfd_create(name.c_str(), 0);
    if (fd == -1) {
        throw AllocationError(fmt::format("memfd_create({}) failed: {}", name, std::strerror(errno)));
    }

    MemoryFile file{fd, size};
    if (ftruncate(fd, static_cast<off_t>(size)) == -1) {
        throw AllocationError(fmt::format("Cannot size memory file to {} bytes: {}", size, std::strerror(errno)));
    }
    if (size == 0) {
        return file;
    }

    // ftruncate reserves nothing; reject sizes that cannot fit before asking shmem for pages,
    // so an impossible request fails here instead of waking the OOM killer.
    const auto available = availableMemory();
    if (available && size > *available) {
        throw AllocationError(fmt::format("Object of {} bytes exceeds {} bytes of available memory", size,
                                          *available));
    }
    int rc = 0;
    do {
        rc = ::fallocate(fd, 0, 0, static_cast<off_t>(size));
    } while (rc == -1 && errno == EINTR);
    if (rc == -1 && errno != EOPNOTSUPP) {
        throw AllocationError(fmt::format("Cannot reserve {} bytes for memory file: {}", size, std::strerror(errno)));
    }
    return file;
}

MemoryFile::~MemoryFile() { release(); }

MemoryFile::MemoryFile(MemoryFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), size_(std::exchange(other.size_, 0)) {}

MemoryFile& MemoryFile::operator=(MemoryFile&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void MemoryFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) const {
    if (fd_ < 0) {
        throw std::logic_error("write to a released memory file");
    }
    while (size > 0) {
        const ssize_t n = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(),
                                    fmt::format("pwrite at offset {}", offset));
        }
        data += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
}

MemoryRegion MemoryFile::region(const ByteRange& range) const {
    if (range.start > range.end || range.end > size_) {
        throw std::out_of_range(
            fmt::format("range [{}, {}) outside memory file of {} bytes", range.start, range.end, size_));
    }
    return MemoryRegion{*this, range};
}

std::string MemoryFile::path() const {
    // Resolves in the exec'd image (same process) and in a forked child (inherited fd).
    return fmt::format("/proc/self/fd/{}", fd_);
}

void MemoryFile::release() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        size_ = 0;
    }
}

void MemoryRegion::write(const char* data, std::size_t size) {
    if (size > range_.length() - written_) {
        throw ChunkTransientError(fmt::format("response for range [{}, {}) exceeds {} bytes",
                                              range_.start, range_.end, range_.length()));
    }
    try {
        file_->writeAt(range_.start + written_, data, size);
    } catch (const std::system_error& ex) {
        if (isOutOfMemory(ex.code().value())) {
            throw AllocationError(ex.what());
        }
        throw ChunkTransientError(ex.what());
    }
    written_ += size;
}

} // namespace memrun
