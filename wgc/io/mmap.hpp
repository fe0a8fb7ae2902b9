#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <type_traits>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

// =============================================================================
/// @file mmap.hpp
/// @brief RAII memory-mapped typed arrays
///
/// Snapshot arrays (CSR offsets, neighbour lists, identity blobs) are opened
/// through MappedArray so a graph larger than RAM is paged in on demand. The
/// builder uses MappedArray::create() to scatter the reverse CSR directly into
/// its final file.
// =============================================================================

namespace wgc::io {

namespace detail {

inline std::string errno_text() {
    return std::strerror(errno);
}

inline void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace detail

/// @brief Typed view over a memory-mapped file.
///
/// Read-only mappings are safe for concurrent readers. Writers to a writable
/// mapping must partition the element range themselves.
///
/// @tparam T Element type (trivially copyable)
template <typename T>
class MappedArray {
    static_assert(std::is_trivially_copyable_v<T>, "MappedArray: T must be trivially copyable");

public:
    using value_type = T;

    constexpr MappedArray() noexcept = default;

    /// @brief Map an existing file.
    ///
    /// @throws FileNotFoundError if the file does not exist
    /// @throws ValueError if the file size is not a multiple of sizeof(T)
    /// @throws IOError if the file cannot be opened or mapped
    explicit MappedArray(const std::string& path, bool writable = false)
        : MappedArray() {
        writable_ = writable;
        fd_ = ::open(path.c_str(), writable ? O_RDWR : O_RDONLY);
        if (fd_ < 0) {
            if (errno == ENOENT) {
                throw FileNotFoundError(path);
            }
            throw IOError("cannot open " + path + ": " + detail::errno_text());
        }

        struct stat st {};
        if (::fstat(fd_, &st) != 0) {
            const std::string reason = detail::errno_text();
            detail::close_fd(fd_);
            throw IOError("cannot stat " + path + ": " + reason);
        }
        attach(path, static_cast<Size>(st.st_size));
    }

    /// @brief Create (or truncate) `path` to hold `count` elements and map it
    /// writable. Contents start zeroed.
    static MappedArray create(const std::string& path, Size count) {
        MappedArray out;
        out.writable_ = true;
        out.fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
        if (out.fd_ < 0) {
            throw IOError("cannot create " + path + ": " + detail::errno_text());
        }
        const Size bytes = count * sizeof(T);
        if (::ftruncate(out.fd_, static_cast<off_t>(bytes)) != 0) {
            throw WriteError("cannot grow " + path + ": " + detail::errno_text());
        }
        out.attach(path, bytes);
        return out;
    }

    ~MappedArray() noexcept { unmap(); }

    MappedArray(MappedArray&& other) noexcept { steal(other); }

    MappedArray& operator=(MappedArray&& other) noexcept {
        if (this != &other) {
            unmap();
            steal(other);
        }
        return *this;
    }

    MappedArray(const MappedArray&) = delete;
    MappedArray& operator=(const MappedArray&) = delete;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    WGC_NODISCARD const T* data() const noexcept { return static_cast<const T*>(base_); }

    /// @throws ValueError if the mapping is read-only
    WGC_NODISCARD T* mutable_data() {
        if (WGC_UNLIKELY(!writable_)) {
            throw ValueError("MappedArray: mapping is read-only");
        }
        return static_cast<T*>(base_);
    }

    WGC_NODISCARD Size size() const noexcept { return count_; }
    WGC_NODISCARD Size byte_size() const noexcept { return bytes_; }
    WGC_NODISCARD bool empty() const noexcept { return count_ == 0; }

    WGC_FORCE_INLINE const T& operator[](Size i) const noexcept { return data()[i]; }

    WGC_NODISCARD const T* begin() const noexcept { return data(); }
    WGC_NODISCARD const T* end() const noexcept { return data() + count_; }

    WGC_NODISCARD Array<const T> as_array() const noexcept {
        return Array<const T>(data(), count_);
    }

    /// @brief msync a writable mapping to disk.
    void flush() {
        if (!writable_ || base_ == nullptr) {
            return;
        }
        if (::msync(base_, bytes_, MS_SYNC) != 0) {
            throw WriteError("msync failed: " + detail::errno_text());
        }
    }

    /// Neighbour lists are read in graph order, not file order.
    void advise_random() const noexcept { advise(MADV_RANDOM); }

private:
    void attach(const std::string& path, Size file_size) {
        if (file_size == 0) {
            return;
        }
        if (file_size % sizeof(T) != 0) {
            throw ValueError(path + " is not a whole number of " + std::to_string(sizeof(T)) + "-byte elements");
        }
        const int prot = writable_ ? (PROT_READ | PROT_WRITE) : PROT_READ;
        void* p = ::mmap(nullptr, file_size, prot, MAP_SHARED, fd_, 0);
        if (p == MAP_FAILED) {
            throw IOError("cannot map " + path + ": " + detail::errno_text());
        }
        base_ = p;
        bytes_ = file_size;
        count_ = file_size / sizeof(T);
        advise(MADV_SEQUENTIAL);
    }

    void advise(int hint) const noexcept {
        if (base_ != nullptr) {
            ::madvise(base_, bytes_, hint);
        }
    }

    void unmap() noexcept {
        if (base_ != nullptr) {
            ::munmap(base_, bytes_);
            base_ = nullptr;
        }
        detail::close_fd(fd_);
    }

    void steal(MappedArray& other) noexcept {
        base_ = other.base_;
        count_ = other.count_;
        bytes_ = other.bytes_;
        writable_ = other.writable_;
        fd_ = other.fd_;
        other.base_ = nullptr;
        other.count_ = 0;
        other.bytes_ = 0;
        other.writable_ = false;
        other.fd_ = -1;
    }

    void* base_ = nullptr;
    Size count_ = 0;
    Size bytes_ = 0;
    bool writable_ = false;
    int fd_ = -1;
};

static_assert(ArrayLike<MappedArray<NodeId>>);

} // namespace wgc::io
