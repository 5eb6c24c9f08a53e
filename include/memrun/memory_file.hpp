#pragma once

#include "chunk_plan.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace memrun {

class MemoryRegion;

// Anonymous memory-backed file (memfd), sized up front and addressable by path.
// The descriptor stays open across exec so a replacement image can open path().
class MemoryFile {
public:
    static MemoryFile allocate(const std::string& name, std::uint64_t size);

    MemoryFile() = default;
    ~MemoryFile();

    MemoryFile(const MemoryFile&) = delete;
    MemoryFile& operator=(const MemoryFile&) = delete;
    MemoryFile(MemoryFile&& other) noexcept;
    MemoryFile& operator=(MemoryFile&& other) noexcept;

    // Positioned write. Concurrent callers must use disjoint ranges.
    void writeAt(std::uint64_t offset, const char* data, std::size_t size) const;

    // Write capability restricted to one range of the file.
    [[nodiscard]] MemoryRegion region(const ByteRange& range) const;

    [[nodiscard]] std::string path() const;
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void release() noexcept;

private:
    MemoryFile(int fd, std::uint64_t size) : fd_(fd), size_(size) {}

    int fd_{-1};
    std::uint64_t size_{0};
};

// Appends sequentially within [range.start, range.end) of a MemoryFile.
// Bytes past the end of the range are rejected as a malformed response.
class MemoryRegion {
public:
    void write(const char* data, std::size_t size);
    void reset() noexcept { written_ = 0; }

    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] bool complete() const noexcept { return written_ == range_.length(); }

private:
    friend class MemoryFile;
    MemoryRegion(const MemoryFile& file, ByteRange range) : file_(&file), range_(range) {}

    const MemoryFile* file_;
    ByteRange range_;
    std::uint64_t written_{0};
};

} // namespace memrun
