#include "wgc/graph/identity.hpp"
#include "wgc/io/file.hpp"

#include <filesystem>
#include <vector>

namespace wgc::graph {

namespace {

std::string join(const std::string& dir, const char* name) {
    return (std::filesystem::path(dir) / name).string();
}

} // anonymous namespace

NodeId NodeIdentityTable::intern(std::string_view external_id) {
    if (WGC_UNLIKELY(external_id.empty())) {
        throw MalformedEdgeError("empty node identifier");
    }

    const auto it = index_.find(external_id);
    if (it != index_.end()) {
        return it->second;
    }

    if (WGC_UNLIKELY(ids_.size() >= MAX_NODES)) {
        throw OverflowError("NodeIdentityTable: node id space exhausted");
    }

    const auto id = static_cast<NodeId>(ids_.size());
    const std::string& stored = ids_.emplace_back(external_id);
    index_.emplace(std::string_view(stored), id);
    return id;
}

std::optional<NodeId> NodeIdentityTable::find(std::string_view external_id) const {
    const auto it = index_.find(external_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view NodeIdentityTable::resolve(NodeId node) const {
    WGC_CHECK_NODE(node, ids_.size());
    return ids_[node];
}

void NodeIdentityTable::save(const std::string& dir) const {
    io::BinaryWriter bytes(join(dir, IDS_FILE));
    io::BinaryWriter offsets(join(dir, ID_OFFSETS_FILE));

    std::uint64_t offset = 0;
    offsets.write_value(offset);
    for (const std::string& id : ids_) {
        bytes.write(id.data(), id.size());
        offset += id.size();
        offsets.write_value(offset);
    }

    bytes.close();
    offsets.close();
}

NodeIdentityTable NodeIdentityTable::load(const std::string& dir) {
    const io::MappedArray<char> bytes(join(dir, IDS_FILE));
    const io::MappedArray<std::uint64_t> offsets(join(dir, ID_OFFSETS_FILE));

    if (offsets.empty() || offsets[0] != 0 || offsets[offsets.size() - 1] != bytes.size()) {
        throw ReadError("Identity table in " + dir + " has inconsistent offsets");
    }

    NodeIdentityTable table;
    const Size n = offsets.size() - 1;
    for (Size i = 0; i < n; ++i) {
        if (offsets[i + 1] < offsets[i]) {
            throw ReadError("Identity table in " + dir + " has decreasing offsets");
        }
        const std::string_view id(bytes.data() + offsets[i], offsets[i + 1] - offsets[i]);
        if (table.intern(id) != static_cast<NodeId>(i)) {
            throw ReadError("Identity table in " + dir + " repeats identifier " + std::string(id));
        }
    }
    return table;
}

MappedIdentityView::MappedIdentityView(const std::string& dir)
    : bytes_(join(dir, IDS_FILE)), offsets_(join(dir, ID_OFFSETS_FILE)) {
    if (offsets_.empty() || offsets_[offsets_.size() - 1] != bytes_.size()) {
        throw ReadError("Identity table in " + dir + " has inconsistent offsets");
    }
    offsets_.advise_random();
    bytes_.advise_random();
}

} // namespace wgc::graph
