#include "wgc/graph/builder.hpp"
#include "wgc/io/file.hpp"
#include "wgc/io/mmap.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <queue>
#include <utility>

namespace fs = std::filesystem;

namespace wgc::graph {

namespace {

constexpr const char* RUNS_DIR = "runs";
constexpr const char* CURSOR_FILE = "in_cursor.tmp";

std::string join(const std::string& dir, const char* name) {
    return (fs::path(dir) / name).string();
}

void sort_unique(std::vector<Edge>& edges) {
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
}

// Batched sequential reader over one spilled run.
class RunCursor {
public:
    explicit RunCursor(const std::string& path)
        : reader_(path), batch_(config::RUN_READ_BATCH) {
        refill();
    }

    [[nodiscard]] bool valid() const noexcept { return pos_ < len_; }
    [[nodiscard]] const Edge& head() const noexcept { return batch_[pos_]; }

    void advance() {
        if (++pos_ == len_) {
            refill();
        }
    }

private:
    void refill() {
        len_ = reader_.read(batch_.data(), batch_.size());
        pos_ = 0;
    }

    io::BinaryReader reader_;
    std::vector<Edge> batch_;
    Size pos_ = 0;
    Size len_ = 0;
};

// Calls `emit` on every distinct edge of all runs in (source, target) order.
void merge_runs(const std::vector<std::string>& runs, const std::function<void(const Edge&)>& emit) {
    std::vector<std::unique_ptr<RunCursor>> cursors;
    cursors.reserve(runs.size());

    using Entry = std::pair<Edge, Size>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<>> heap;

    for (const std::string& path : runs) {
        cursors.push_back(std::make_unique<RunCursor>(path));
        if (cursors.back()->valid()) {
            heap.emplace(cursors.back()->head(), cursors.size() - 1);
        }
    }

    bool have_last = false;
    Edge last{};
    while (!heap.empty()) {
        const auto [edge, run] = heap.top();
        heap.pop();

        if (!have_last || edge != last) {
            emit(edge);
            last = edge;
            have_last = true;
        }

        RunCursor& cursor = *cursors[run];
        cursor.advance();
        if (cursor.valid()) {
            heap.emplace(cursor.head(), run);
        }
    }
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

GraphBuilder::GraphBuilder(SnapshotStore& store, NodeIdentityTable identities, BuildConfig config)
    : store_(store), config_(config), identities_(std::move(identities)) {
    config_.validate();
    version_ = store_.next_version();
    staging_dir_ = store_.begin_staging(version_);
    buffer_.reserve(std::min<Size>(config_.max_buffered_edges, Size(1) << 20));
    VLOG(1) << "Building snapshot v" << version_ << " in " << staging_dir_;
}

GraphBuilder::GraphBuilder(SnapshotStore& store, BuildConfig config)
    : GraphBuilder(store, NodeIdentityTable(), config) {
    if (!config_.reuse_identities) {
        return;
    }
    if (const auto current = store_.current_version()) {
        identities_ = NodeIdentityTable::load(store_.version_dir(*current));
        LOG(INFO) << "Reusing " << identities_.size() << " node ids from snapshot "
                  << SnapshotStore::version_name(*current);
    } else {
        LOG(INFO) << "No previous snapshot in " << store_.root() << "; assigning fresh node ids";
    }
}

GraphBuilder::~GraphBuilder() {
    if (!finished_) {
        discard_staging();
    }
}

void GraphBuilder::discard_staging() noexcept {
    if (staging_dir_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(staging_dir_, ec);
    if (ec) {
        LOG(WARNING) << "Failed to remove staging directory " << staging_dir_ << ": " << ec.message();
    }
}

// =============================================================================
// Ingestion
// =============================================================================

void GraphBuilder::add_edge(Edge edge) {
    WGC_CHECK_ARG(!finished_, "GraphBuilder: add_edge after finish");
    const Size n = identities_.size();
    if (WGC_UNLIKELY(edge.source >= n || edge.target >= n)) {
        throw MalformedEdgeError("(" + std::to_string(edge.source) + ", " + std::to_string(edge.target) +
                                 ") references a node outside [0, " + std::to_string(n) + ")");
    }

    buffer_.push_back(edge);
    ++stats_.edges_added;
    if (buffer_.size() >= config_.max_buffered_edges) {
        spill();
    }
}

void GraphBuilder::add_edge(std::string_view source, std::string_view target) {
    const NodeId s = identities_.intern(source);
    const NodeId t = identities_.intern(target);
    add_edge(Edge{s, t});
}

std::uint64_t GraphBuilder::ingest(EdgeReader& reader) {
    RawEdge raw;
    std::uint64_t n = 0;
    while (reader.next(raw)) {
        add_edge(raw.source, raw.target);
        ++n;
        LOG_EVERY_N(INFO, 10000000) << "Ingested " << n << " edge records from " << reader.source_name();
    }
    stats_.records_read += n;
    LOG(INFO) << "Ingested " << n << " edge records (" << identities_.size() << " nodes so far)";
    return n;
}

void GraphBuilder::spill() {
    sort_unique(buffer_);
    if (buffer_.empty()) {
        return;
    }

    const std::string runs_dir = join(staging_dir_, RUNS_DIR);
    std::error_code ec;
    fs::create_directories(runs_dir, ec);
    if (ec) {
        throw IOError("Failed to create " + runs_dir + ": " + ec.message());
    }

    char name[32];
    std::snprintf(name, sizeof(name), "run_%06zu.bin", runs_.size());
    const std::string path = join(runs_dir, name);

    io::BinaryWriter out(path);
    out.write(buffer_.data(), buffer_.size());
    out.close();

    VLOG(1) << "Spilled run " << runs_.size() << " with " << buffer_.size() << " edges";
    runs_.push_back(path);
    ++stats_.runs_spilled;
    buffer_.clear();
}

// =============================================================================
// Compaction
// =============================================================================

void GraphBuilder::write_snapshot(std::vector<Edge>& in_memory) {
    const Size num_nodes = identities_.size();
    const std::string& dir = staging_dir_;

    // Forward CSR is streamed in sorted order; reverse counts accumulate in
    // the mapped in_indptr file (shifted by one for the prefix sum below).
    io::BinaryWriter out_indptr(join(dir, OUT_INDPTR_FILE));
    io::BinaryWriter out_indices(join(dir, OUT_INDICES_FILE));
    auto in_indptr = io::MappedArray<Index>::create(join(dir, IN_INDPTR_FILE), num_nodes + 1);
    Index* in_counts = in_indptr.mutable_data();

    Index written = 0;
    Index self_loops = 0;
    Size next_row = 1;
    out_indptr.write_value(Index(0));

    const auto emit = [&](const Edge& e) {
        while (next_row <= e.source) {
            out_indptr.write_value(written);
            ++next_row;
        }
        if (WGC_UNLIKELY(written == std::numeric_limits<Index>::max())) {
            throw OverflowError("Edge count exceeds the Index range");
        }
        out_indices.write_value(e.target);
        ++written;
        ++in_counts[static_cast<Size>(e.target) + 1];
        if (e.source == e.target) {
            ++self_loops;
        }
    };

    if (runs_.empty()) {
        sort_unique(in_memory);
        for (const Edge& e : in_memory) {
            emit(e);
        }
    } else {
        spill();
        LOG(INFO) << "Merging " << runs_.size() << " sorted runs";
        merge_runs(runs_, emit);
        std::error_code ec;
        fs::remove_all(join(dir, RUNS_DIR), ec);
        if (ec) {
            throw IOError("Failed to remove spilled runs in " + dir + ": " + ec.message());
        }
        runs_.clear();
    }

    while (next_row <= num_nodes) {
        out_indptr.write_value(written);
        ++next_row;
    }
    out_indptr.close();
    out_indices.close();

    for (Size i = 1; i <= num_nodes; ++i) {
        in_counts[i] += in_counts[i - 1];
    }

    // Scatter sources row by row; ascending sources keep each in-list sorted.
    {
        const io::MappedArray<Index> fwd_indptr(join(dir, OUT_INDPTR_FILE));
        const io::MappedArray<NodeId> fwd_indices(join(dir, OUT_INDICES_FILE));
        auto cursor_file = io::MappedArray<Index>::create(join(dir, CURSOR_FILE), num_nodes);
        auto in_indices = io::MappedArray<NodeId>::create(join(dir, IN_INDICES_FILE), static_cast<Size>(written));

        Index* cursor = cursor_file.mutable_data();
        NodeId* rev = in_indices.mutable_data();
        std::copy(in_counts, in_counts + num_nodes, cursor);

        for (Size s = 0; s < num_nodes; ++s) {
            for (Index k = fwd_indptr[s]; k < fwd_indptr[s + 1]; ++k) {
                const NodeId t = fwd_indices[static_cast<Size>(k)];
                rev[cursor[t]++] = static_cast<NodeId>(s);
            }
        }
        in_indices.flush();
    }
    std::error_code ec;
    fs::remove(join(dir, CURSOR_FILE), ec);
    if (ec) {
        throw IOError("Failed to remove " + std::string(CURSOR_FILE) + ": " + ec.message());
    }
    in_indptr.flush();

    identities_.save(dir);

    io::Metadata meta;
    meta["format_version"] = std::to_string(config::FORMAT_VERSION);
    meta["version"] = std::to_string(version_);
    meta["num_nodes"] = std::to_string(num_nodes);
    meta["num_edges"] = std::to_string(written);
    meta["self_loops"] = std::to_string(self_loops);
    io::write_metadata(join(dir, META_FILE), meta);

    stats_.num_nodes = num_nodes;
    stats_.num_edges = written;
    stats_.self_loops = self_loops;

    LOG(INFO) << "Compacted snapshot v" << version_ << ": " << num_nodes << " nodes, " << written
              << " distinct edges, " << self_loops << " self-loops";
}

GraphSnapshot GraphBuilder::finish() {
    WGC_CHECK_ARG(!finished_, "GraphBuilder: finish called twice");

    write_snapshot(buffer_);
    buffer_.clear();
    buffer_.shrink_to_fit();

    store_.publish(staging_dir_, version_);
    finished_ = true;
    return store_.open(version_);
}

// =============================================================================
// One-shot helpers
// =============================================================================

GraphSnapshot GraphBuilder::build(SnapshotStore& store, EdgeReader& reader, BuildConfig config) {
    GraphBuilder builder(store, config);
    builder.ingest(reader);
    return builder.finish();
}

GraphSnapshot GraphBuilder::build(SnapshotStore& store, NodeIdentityTable identities,
                                  std::span<const Edge> edges, BuildConfig config) {
    GraphBuilder builder(store, std::move(identities), config);
    for (const Edge& e : edges) {
        builder.add_edge(e);
    }
    return builder.finish();
}

} // namespace wgc::graph
