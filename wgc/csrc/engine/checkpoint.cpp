#include "wgc/engine/checkpoint.hpp"
#include "wgc/io/file.hpp"
#include "wgc/io/hdf5.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace wgc::engine {

namespace {

constexpr const char* LATEST_FILE = "LATEST";
constexpr const char* FILE_PREFIX = "round_";
constexpr const char* FILE_SUFFIX = ".h5";
constexpr const char* TMP_SUFFIX = ".tmp";

// Target uncompressed bytes per registers chunk.
constexpr Size CHUNK_BYTES = Size(1) << 20;

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "round_000012.h5" -> 12
std::optional<std::uint32_t> parse_file_name(const std::string& name) {
    const std::string prefix(FILE_PREFIX);
    const std::string suffix(FILE_SUFFIX);
    if (name.size() <= prefix.size() + suffix.size() ||
        name.compare(0, prefix.size(), prefix) != 0 || !ends_with(name, suffix)) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (Size i = prefix.size(); i < name.size() - suffix.size(); ++i) {
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

void remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw IOError("Failed to remove " + path + ": " + ec.message());
    }
}

template <typename T>
void write_vector(io::h5::File& file, const char* name, const memory::AlignedBuffer<T>& values) {
    file.write_dataset(name, values.get(), {static_cast<hsize_t>(values.size())});
}

void write_state(io::h5::File& file, const EngineState& state) {
    const Size n = state.num_nodes();
    const Size m = state.sketches.registers_per_sketch();

    file.write_attr<std::int32_t>("format_version", config::CHECKPOINT_FORMAT_VERSION);
    file.write_attr<std::uint32_t>("round", state.round);
    file.write_attr<std::uint8_t>("terminal", state.terminal ? 1 : 0);
    file.write_attr<std::uint8_t>("reason", static_cast<std::uint8_t>(state.reason));
    file.write_attr<double>("last_round_delta", state.last_round_delta);
    file.write_attr<std::uint64_t>("num_nodes", static_cast<std::uint64_t>(n));
    file.write_attr<std::int32_t>("precision", state.sketches.precision());
    file.write_attr<std::uint64_t>("seed", state.sketches.seed());
    file.write_attr<std::uint8_t>("direction", static_cast<std::uint8_t>(state.direction));
    file.write_attr<std::uint32_t>("graph_version", state.graph_version);
    file.write_attr_string("direction_name", to_string(state.direction));

    io::h5::DatasetCreateProps props;
    if (n > 0) {
        const Size rows = std::clamp<Size>(CHUNK_BYTES / m, 1, n);
        props.chunked({static_cast<hsize_t>(rows), static_cast<hsize_t>(m)}).compress();
    }
    file.write_dataset("registers", state.sketches.data().data(),
                       {static_cast<hsize_t>(n), static_cast<hsize_t>(m)}, props);

    write_vector(file, "accumulators", state.accumulators);
    write_vector(file, "compensation", state.compensation);
    write_vector(file, "estimates", state.estimates);
    write_vector(file, "changed", state.changed);
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

CheckpointManager::CheckpointManager(std::string dir, Size keep_last)
    : dir_(std::move(dir)), latest_path_((fs::path(dir_) / LATEST_FILE).string()), keep_last_(keep_last) {
    WGC_CHECK_ARG(keep_last_ >= 1, "CheckpointManager: keep_last must be at least 1");
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw IOError("Failed to create checkpoint directory " + dir_ + ": " + ec.message());
    }
}

std::string CheckpointManager::file_name(std::uint32_t round) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%06u%s", FILE_PREFIX, static_cast<unsigned>(round), FILE_SUFFIX);
    return buf;
}

std::string CheckpointManager::path_for(std::uint32_t round) const {
    return (fs::path(dir_) / file_name(round)).string();
}

// =============================================================================
// Listing
// =============================================================================

std::vector<std::uint32_t> CheckpointManager::list() const {
    std::vector<std::uint32_t> rounds;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (const auto r = parse_file_name(entry.path().filename().string())) {
            rounds.push_back(*r);
        }
    }
    std::sort(rounds.begin(), rounds.end());
    return rounds;
}

std::optional<std::uint32_t> CheckpointManager::latest_round() const {
    const auto name = io::read_pointer(latest_path_);
    if (!name) {
        return std::nullopt;
    }
    const auto round = parse_file_name(*name);
    if (!round) {
        throw ReadError("LATEST in " + dir_ + " names an invalid checkpoint: " + *name);
    }
    return round;
}

// =============================================================================
// Commit
// =============================================================================

CheckpointInfo CheckpointManager::commit(std::uint32_t round, const EngineState& state) {
    WGC_CHECK_ARG(round == state.round, "CheckpointManager::commit: round does not match state");

    const std::string final_path = path_for(round);
    const std::string tmp_path = final_path + TMP_SUFFIX;

    std::error_code ec;
    if (fs::exists(final_path, ec)) {
        throw WriteError("Checkpoint " + final_path + " already exists");
    }
    fs::remove(tmp_path, ec);

    try {
        {
            io::h5::File file = io::h5::File::create(tmp_path, H5F_ACC_TRUNC);
            write_state(file, state);
            file.flush();
        }
        io::fsync_file(tmp_path);
        io::durable_rename(tmp_path, final_path);
    } catch (...) {
        fs::remove(tmp_path, ec);
        throw;
    }

    io::write_pointer(latest_path_, file_name(round));
    LOG(INFO) << "Committed checkpoint " << file_name(round)
              << (state.terminal ? " (terminal)" : "") << " in " << dir_;

    prune(round);
    return CheckpointInfo{round, state.terminal, final_path};
}

void CheckpointManager::prune(std::uint32_t newest) {
    const auto rounds = list();
    if (rounds.size() <= keep_last_) {
        return;
    }
    const Size excess = rounds.size() - keep_last_;
    for (Size i = 0; i < excess; ++i) {
        if (rounds[i] == newest) {
            continue;
        }
        std::error_code ec;
        fs::remove(path_for(rounds[i]), ec);
        if (ec) {
            LOG(WARNING) << "Failed to prune checkpoint " << file_name(rounds[i]) << ": " << ec.message();
        } else {
            VLOG(1) << "Pruned checkpoint " << file_name(rounds[i]);
        }
    }
}

// =============================================================================
// Resume
// =============================================================================

void CheckpointManager::discard_uncommitted(std::uint32_t latest) {
    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        const std::string name = entry.path().filename().string();
        const auto round = parse_file_name(name);
        if (ends_with(name, TMP_SUFFIX) || (round && *round > latest)) {
            stale.push_back(entry.path());
        }
    }
    for (const fs::path& path : stale) {
        LOG(WARNING) << "Discarding uncommitted checkpoint file " << path.filename().string();
        remove_file(path.string());
    }
}

EngineState CheckpointManager::load(const std::string& path) {
    const io::h5::File file(path);

    const auto format = file.read_attr<std::int32_t>("format_version");
    if (format != config::CHECKPOINT_FORMAT_VERSION) {
        throw CheckpointMismatchError(path + " has format version " + std::to_string(format) +
                                      ", expected " + std::to_string(config::CHECKPOINT_FORMAT_VERSION));
    }

    const auto direction = file.read_attr<std::uint8_t>("direction");
    const auto reason = file.read_attr<std::uint8_t>("reason");
    if (direction > static_cast<std::uint8_t>(Direction::Outbound) ||
        reason > static_cast<std::uint8_t>(TerminalReason::EmptyGraph)) {
        throw ReadError(path + " holds an invalid direction or terminal reason");
    }

    EngineConfig shape;
    shape.precision = file.read_attr<std::int32_t>("precision");
    shape.seed = file.read_attr<std::uint64_t>("seed");
    shape.direction = static_cast<Direction>(direction);

    const auto num_nodes = static_cast<Size>(file.read_attr<std::uint64_t>("num_nodes"));
    EngineState state = EngineState::allocate(num_nodes, shape, file.read_attr<std::uint32_t>("graph_version"));
    state.round = file.read_attr<std::uint32_t>("round");
    state.terminal = file.read_attr<std::uint8_t>("terminal") != 0;
    state.reason = static_cast<TerminalReason>(reason);
    state.last_round_delta = file.read_attr<double>("last_round_delta");

    file.open_dataset("registers").read(state.sketches.data());
    file.open_dataset("accumulators").read(state.accumulators.array());
    file.open_dataset("compensation").read(state.compensation.array());
    file.open_dataset("estimates").read(state.estimates.array());
    file.open_dataset("changed").read(state.changed.array());
    return state;
}

std::optional<EngineState> CheckpointManager::resume(const graph::GraphSnapshot& graph,
                                                     const EngineConfig& config) {
    const auto latest = latest_round();
    discard_uncommitted(latest.value_or(0));
    if (!latest) {
        LOG(INFO) << "No checkpoint in " << dir_ << "; starting from round 0";
        return std::nullopt;
    }

    const std::string path = path_for(*latest);
    EngineState state = load(path);

    const auto mismatch = [&](const std::string& what, const std::string& have, const std::string& want) {
        throw CheckpointMismatchError(file_name(*latest) + " was written for " + what + " " + have +
                                      ", current run uses " + want);
    };
    if (state.num_nodes() != graph.num_nodes()) {
        mismatch("num_nodes", std::to_string(state.num_nodes()), std::to_string(graph.num_nodes()));
    }
    if (state.graph_version != graph.version()) {
        mismatch("graph version", std::to_string(state.graph_version), std::to_string(graph.version()));
    }
    if (state.sketches.precision() != config.precision) {
        mismatch("precision", std::to_string(state.sketches.precision()), std::to_string(config.precision));
    }
    if (state.sketches.seed() != config.seed) {
        mismatch("seed", std::to_string(state.sketches.seed()), std::to_string(config.seed));
    }
    if (state.direction != config.direction) {
        mismatch("direction", to_string(state.direction), to_string(config.direction));
    }
    if (state.round > config.max_rounds) {
        throw CheckpointMismatchError(file_name(*latest) + " is at round " + std::to_string(state.round) +
                                      ", past max_rounds " + std::to_string(config.max_rounds) +
                                      "; start a fresh run to use a lower cap");
    }

    LOG(INFO) << "Resuming from " << file_name(*latest) << " (round " << state.round
              << (state.terminal ? ", terminal" : "") << ")";
    return state;
}

// =============================================================================
// Clear
// =============================================================================

void CheckpointManager::clear() {
    std::vector<fs::path> doomed;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        const std::string name = entry.path().filename().string();
        if (parse_file_name(name) || ends_with(name, TMP_SUFFIX) || name == LATEST_FILE) {
            doomed.push_back(entry.path());
        }
    }
    // Pointer first, so a partial clear never leaves LATEST naming a missing file.
    std::sort(doomed.begin(), doomed.end(), [](const fs::path& a, const fs::path& b) {
        return (a.filename() == LATEST_FILE) > (b.filename() == LATEST_FILE);
    });
    for (const fs::path& path : doomed) {
        remove_file(path.string());
    }
    const Size removed = doomed.size();
    if (removed > 0) {
        io::fsync_dir(dir_);
    }
    LOG(INFO) << "Cleared " << removed << " checkpoint files from " << dir_;
}

} // namespace wgc::engine
