#include "wgc/io/file.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace wgc::io {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

std::string parent_of(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

std::string_view trim(std::string_view s) {
    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

void fsync_fd(int fd, const std::string& what) {
    if (::fsync(fd) != 0) {
        const std::string err = errno_text();
        ::close(fd);
        throw WriteError("fsync failed for " + what + ": " + err);
    }
}

} // anonymous namespace

// =============================================================================
// BinaryWriter
// =============================================================================

BinaryWriter::BinaryWriter(const std::string& path) : path_(path) {
    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        throw IOError("Failed to create " + path + ": " + errno_text());
    }
}

BinaryWriter::~BinaryWriter() noexcept {
    if (file_) {
        std::fclose(file_);
    }
}

void BinaryWriter::write_bytes(const void* bytes, Size n) {
    if (n == 0) {
        return;
    }
    if (!file_) {
        throw WriteError("BinaryWriter: write after close to " + path_);
    }
    if (std::fwrite(bytes, 1, n, file_) != n) {
        throw WriteError("Short write to " + path_ + ": " + errno_text());
    }
    bytes_written_ += n;
}

void BinaryWriter::close() {
    if (!file_) {
        return;
    }
    FILE* f = file_;
    file_ = nullptr;

    if (std::fflush(f) != 0) {
        const std::string err = errno_text();
        std::fclose(f);
        throw WriteError("Flush failed for " + path_ + ": " + err);
    }
    if (::fsync(::fileno(f)) != 0) {
        const std::string err = errno_text();
        std::fclose(f);
        throw WriteError("fsync failed for " + path_ + ": " + err);
    }
    if (std::fclose(f) != 0) {
        throw WriteError("Close failed for " + path_ + ": " + errno_text());
    }
}

// =============================================================================
// BinaryReader
// =============================================================================

BinaryReader::BinaryReader(const std::string& path) : path_(path) {
    file_ = std::fopen(path.c_str(), "rb");
    if (!file_) {
        if (errno == ENOENT) {
            throw FileNotFoundError(path);
        }
        throw IOError("Failed to open " + path + ": " + errno_text());
    }
}

BinaryReader::~BinaryReader() noexcept {
    if (file_) {
        std::fclose(file_);
    }
}

Size BinaryReader::read_bytes(void* out, Size n, Size element_size) {
    const Size got = std::fread(out, 1, n, file_);
    if (got < n && std::ferror(file_)) {
        throw ReadError("Read failed for " + path_ + ": " + errno_text());
    }
    if (got % element_size != 0) {
        throw ReadError("Truncated record in " + path_);
    }
    return got;
}

// =============================================================================
// Durability
// =============================================================================

void fsync_file(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw IOError("Failed to open " + path + " for fsync: " + errno_text());
    }
    fsync_fd(fd, path);
    ::close(fd);
}

void fsync_dir(const std::string& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw IOError("Failed to open directory " + dir + ": " + errno_text());
    }
    fsync_fd(fd, dir);
    ::close(fd);
}

void durable_rename(const std::string& from, const std::string& to) {
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        throw WriteError("Failed to rename " + from + " to " + to + ": " + errno_text());
    }
    fsync_dir(parent_of(to));
}

void atomic_write_text(const std::string& path, std::string_view contents) {
    const std::string tmp = path + ".tmp";
    try {
        BinaryWriter out(tmp);
        out.write(contents.data(), contents.size());
        out.close();
        durable_rename(tmp, path);
    } catch (const Exception&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

std::string read_text(const std::string& path) {
    BinaryReader in(path);
    std::string out;
    char buf[4096];
    Size got = 0;
    while ((got = in.read(buf, sizeof(buf))) > 0) {
        out.append(buf, got);
    }
    return out;
}

// =============================================================================
// Pointer Files
// =============================================================================

std::optional<std::string> read_pointer(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    const std::string text = read_text(path);
    const std::string_view target = trim(text);
    if (target.empty()) {
        throw ReadError("Empty pointer file: " + path);
    }
    return std::string(target);
}

void write_pointer(const std::string& path, std::string_view target) {
    std::string line(target);
    line.push_back('\n');
    atomic_write_text(path, line);
}

// =============================================================================
// Metadata
// =============================================================================

Metadata read_metadata(const std::string& path) {
    const std::string text = read_text(path);
    Metadata meta;

    std::string_view rest(text);
    while (!rest.empty()) {
        const auto eol = rest.find('\n');
        std::string_view line = trim(rest.substr(0, eol));
        rest = (eol == std::string_view::npos) ? std::string_view() : rest.substr(eol + 1);

        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto sep = line.find_first_of(" \t");
        if (sep == std::string_view::npos) {
            throw ValueError("Invalid metadata line in " + path + ": " + std::string(line));
        }
        meta[std::string(line.substr(0, sep))] = std::string(trim(line.substr(sep + 1)));
    }
    return meta;
}

void write_metadata(const std::string& path, const Metadata& meta) {
    std::string text;
    for (const auto& [key, value] : meta) {
        text += key;
        text += ' ';
        text += value;
        text += '\n';
    }
    atomic_write_text(path, text);
}

std::uint64_t metadata_u64(const Metadata& meta, const std::string& key) {
    const auto it = meta.find(key);
    if (it == meta.end()) {
        throw ValueError("Metadata key missing: " + key);
    }
    std::uint64_t value = 0;
    const char* first = it->second.data();
    const char* last = first + it->second.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        throw ValueError("Metadata key " + key + " is not an unsigned integer: " + it->second);
    }
    return value;
}

} // namespace wgc::io
