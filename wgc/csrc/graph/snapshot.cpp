#include "wgc/graph/snapshot.hpp"
#include "wgc/io/file.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace wgc::graph {

namespace {

constexpr const char* SNAPSHOTS_DIR = "snapshots";
constexpr const char* CURRENT_FILE = "CURRENT";
constexpr const char* STAGING_SUFFIX = ".staging";

std::string join(const std::string& dir, const char* name) {
    return (fs::path(dir) / name).string();
}

// "v000042" -> 42; anything else -> nullopt
std::optional<std::uint32_t> parse_version_name(const std::string& name) {
    if (name.size() < 2 || name[0] != 'v') {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (Size i = 1; i < name.size(); ++i) {
        const char c = name[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > 0xFFFFFFFFULL) {
            return std::nullopt;
        }
    }
    return static_cast<std::uint32_t>(value);
}

template <typename T>
void check_indptr(const io::MappedArray<T>& indptr, Size num_nodes, Size num_indices,
                  const std::string& what) {
    if (indptr.size() != num_nodes + 1) {
        throw ReadError(what + ": expected " + std::to_string(num_nodes + 1) +
                        " offsets, found " + std::to_string(indptr.size()));
    }
    if (indptr[0] != 0 || static_cast<Size>(indptr[num_nodes]) != num_indices) {
        throw ReadError(what + ": offsets do not span the index array");
    }
}

} // anonymous namespace

// =============================================================================
// GraphSnapshot
// =============================================================================

GraphSnapshot GraphSnapshot::open(const std::string& dir) {
    const io::Metadata meta = io::read_metadata(join(dir, META_FILE));

    const std::uint64_t format = io::metadata_u64(meta, "format_version");
    if (format != graph::config::FORMAT_VERSION) {
        throw ReadError("Snapshot " + dir + " has format version " + std::to_string(format) +
                        ", expected " + std::to_string(graph::config::FORMAT_VERSION));
    }

    GraphSnapshot snap;
    snap.dir_ = dir;
    snap.version_ = static_cast<std::uint32_t>(io::metadata_u64(meta, "version"));
    snap.num_nodes_ = static_cast<Size>(io::metadata_u64(meta, "num_nodes"));
    snap.num_edges_ = static_cast<Index>(io::metadata_u64(meta, "num_edges"));
    snap.self_loops_ = static_cast<Index>(io::metadata_u64(meta, "self_loops"));

    snap.out_indptr_ = io::MappedArray<Index>(join(dir, OUT_INDPTR_FILE));
    snap.out_indices_ = io::MappedArray<NodeId>(join(dir, OUT_INDICES_FILE));
    snap.in_indptr_ = io::MappedArray<Index>(join(dir, IN_INDPTR_FILE));
    snap.in_indices_ = io::MappedArray<NodeId>(join(dir, IN_INDICES_FILE));
    snap.identities_ = MappedIdentityView(dir);

    const auto edges = static_cast<Size>(snap.num_edges_);
    if (snap.out_indices_.size() != edges || snap.in_indices_.size() != edges) {
        throw ReadError("Snapshot " + dir + ": neighbour arrays disagree with num_edges");
    }
    check_indptr(snap.out_indptr_, snap.num_nodes_, edges, "Snapshot " + dir + " forward CSR");
    check_indptr(snap.in_indptr_, snap.num_nodes_, edges, "Snapshot " + dir + " reverse CSR");
    if (snap.identities_.size() != snap.num_nodes_) {
        throw ReadError("Snapshot " + dir + ": identity table size disagrees with num_nodes");
    }

    VLOG(1) << "Opened snapshot v" << snap.version_ << " (" << snap.num_nodes_ << " nodes, "
            << snap.num_edges_ << " edges) from " << dir;
    return snap;
}

// =============================================================================
// SnapshotStore
// =============================================================================

SnapshotStore::SnapshotStore(std::string root)
    : root_(std::move(root)),
      snapshots_dir_(join(root_, SNAPSHOTS_DIR)),
      current_path_(join(root_, CURRENT_FILE)) {
    std::error_code ec;
    fs::create_directories(snapshots_dir_, ec);
    if (ec) {
        throw IOError("Failed to create " + snapshots_dir_ + ": " + ec.message());
    }
}

std::string SnapshotStore::version_name(std::uint32_t version) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "v%06u", static_cast<unsigned>(version));
    return buf;
}

std::string SnapshotStore::version_dir(std::uint32_t version) const {
    return (fs::path(snapshots_dir_) / version_name(version)).string();
}

std::vector<std::uint32_t> SnapshotStore::list_versions() const {
    std::vector<std::uint32_t> versions;
    for (const auto& entry : fs::directory_iterator(snapshots_dir_)) {
        if (!entry.is_directory()) {
            continue;
        }
        if (auto v = parse_version_name(entry.path().filename().string())) {
            versions.push_back(*v);
        }
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

std::optional<std::uint32_t> SnapshotStore::current_version() const {
    const auto target = io::read_pointer(current_path_);
    if (!target) {
        return std::nullopt;
    }
    const auto version = parse_version_name(*target);
    if (!version) {
        throw ReadError("CURRENT in " + root_ + " names an invalid snapshot: " + *target);
    }
    return version;
}

std::uint32_t SnapshotStore::next_version() const {
    const auto versions = list_versions();
    const std::uint32_t last = versions.empty() ? 0 : versions.back();
    if (last == 0xFFFFFFFFu) {
        throw OverflowError("Snapshot version space exhausted in " + root_);
    }
    return last + 1;
}

std::string SnapshotStore::begin_staging(std::uint32_t version) const {
    const std::string dir = version_dir(version) + STAGING_SUFFIX;
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        LOG(WARNING) << "Removing stale staging directory " << dir;
        fs::remove_all(dir, ec);
        if (ec) {
            throw IOError("Failed to remove stale staging directory " + dir + ": " + ec.message());
        }
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Failed to create staging directory " + dir + ": " + ec.message());
    }
    return dir;
}

void SnapshotStore::publish(const std::string& staging_dir, std::uint32_t version) {
    const std::string final_dir = version_dir(version);
    std::error_code ec;
    if (fs::exists(final_dir, ec)) {
        throw WriteError("Snapshot " + final_dir + " already exists");
    }

    io::fsync_dir(staging_dir);
    io::durable_rename(staging_dir, final_dir);
    io::write_pointer(current_path_, version_name(version));

    LOG(INFO) << "Published snapshot " << version_name(version) << " in " << root_;
}

GraphSnapshot SnapshotStore::open_latest() const {
    const auto version = current_version();
    if (!version) {
        throw FileNotFoundError(current_path_);
    }
    return open(*version);
}

GraphSnapshot SnapshotStore::open(std::uint32_t version) const {
    GraphSnapshot snap = GraphSnapshot::open(version_dir(version));
    if (snap.version() != version) {
        throw ReadError("Snapshot directory " + version_name(version) + " records version " +
                        std::to_string(snap.version()));
    }
    return snap;
}

} // namespace wgc::graph
