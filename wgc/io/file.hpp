#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"

#include <cstdio>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// =============================================================================
/// @file file.hpp
/// @brief Durable file primitives: buffered binary streams, fsync, atomic
///        replace, pointer files and key/value metadata
///
/// Every artifact that readers may observe (snapshot pointer, checkpoint
/// pointer, score file, graph.meta) is published with write-temp, fsync,
/// rename, fsync-parent so a crash leaves either the old or the new file.
// =============================================================================

namespace wgc::io {

// =============================================================================
// Binary Streams
// =============================================================================

/// @brief Buffered sequential writer for raw arrays.
///
/// close() flushes, fsyncs and reports errors. The destructor closes
/// silently if close() was never reached (error path cleanup).
class BinaryWriter {
public:
    explicit BinaryWriter(const std::string& path);
    ~BinaryWriter() noexcept;

    BinaryWriter(const BinaryWriter&) = delete;
    BinaryWriter& operator=(const BinaryWriter&) = delete;

    template <typename T>
    void write(const T* values, Size count) {
        write_bytes(values, count * sizeof(T));
    }

    template <typename T>
    void write_value(const T& value) {
        write_bytes(&value, sizeof(T));
    }

    void write_bytes(const void* bytes, Size n);

    /// @throws WriteError on flush or fsync failure
    void close();

    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    FILE* file_ = nullptr;
    std::uint64_t bytes_written_ = 0;
};

/// @brief Buffered sequential reader for raw arrays.
class BinaryReader {
public:
    explicit BinaryReader(const std::string& path);
    ~BinaryReader() noexcept;

    BinaryReader(const BinaryReader&) = delete;
    BinaryReader& operator=(const BinaryReader&) = delete;

    /// Reads up to `count` elements, returns the number read (0 at EOF).
    /// @throws ReadError on I/O failure or a trailing partial element
    template <typename T>
    Size read(T* out, Size count) {
        return read_bytes(out, count * sizeof(T), sizeof(T)) / sizeof(T);
    }

private:
    Size read_bytes(void* out, Size n, Size element_size);

    std::string path_;
    FILE* file_ = nullptr;
};

// =============================================================================
// Durability
// =============================================================================

void fsync_file(const std::string& path);
void fsync_dir(const std::string& dir);

/// Rename `from` onto `to` and fsync the parent directory of `to`.
void durable_rename(const std::string& from, const std::string& to);

/// Replace `path` with `contents` atomically.
void atomic_write_text(const std::string& path, std::string_view contents);

/// Entire file as a string. @throws FileNotFoundError, ReadError
std::string read_text(const std::string& path);

// =============================================================================
// Pointer Files
// =============================================================================

/// @brief Single-token file naming the current artifact (CURRENT, LATEST).
///
/// Returns nullopt if the pointer does not exist. Whitespace is trimmed.
std::optional<std::string> read_pointer(const std::string& path);

void write_pointer(const std::string& path, std::string_view target);

// =============================================================================
// Metadata
// =============================================================================

/// Plain text, one "key value" pair per line, '#' starts a comment.
using Metadata = std::map<std::string, std::string>;

Metadata read_metadata(const std::string& path);
void write_metadata(const std::string& path, const Metadata& meta);

/// @throws ValueError if `key` is missing or not an unsigned integer
std::uint64_t metadata_u64(const Metadata& meta, const std::string& key);

} // namespace wgc::io
