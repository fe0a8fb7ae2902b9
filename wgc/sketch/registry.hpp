#pragma once

#include "wgc/config.hpp"
#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/core/macros.hpp"
#include "wgc/core/memory.hpp"
#include "wgc/sketch/hyperloglog.hpp"

#include <cstdint>
#include <utility>

// =============================================================================
// FILE: wgc/sketch/registry.hpp
// BRIEF: One HyperLogLog sketch per node in a single aligned arena
// =============================================================================

namespace wgc::sketch {

/// @brief N sketches of 2^p registers each, stored row-major.
///
/// A registry is one generation of sketch state. The engine keeps two (the
/// previous round, read-only, and the next round, written once per node) and
/// swaps them between rounds. Distinct nodes never share bytes, so
/// concurrent writers to different nodes need no locking.
class SketchRegistry {
public:
    using Register = hll::Register;

    SketchRegistry() = default;

    /// All registers start at zero.
    /// @throws RangeError on an invalid precision
    SketchRegistry(Size num_nodes, int precision, std::uint64_t seed = config::DEFAULT_SEED)
        : num_nodes_(num_nodes),
          precision_((hll::check_precision(precision), precision)),
          m_(hll::num_registers(precision)),
          seed_(seed),
          arena_(checked_arena_size(num_nodes, hll::num_registers(precision))) {}

    SketchRegistry(SketchRegistry&&) noexcept = default;
    SketchRegistry& operator=(SketchRegistry&&) noexcept = default;
    SketchRegistry(const SketchRegistry&) = delete;
    SketchRegistry& operator=(const SketchRegistry&) = delete;

    [[nodiscard]] Size num_nodes() const noexcept { return num_nodes_; }
    [[nodiscard]] int precision() const noexcept { return precision_; }
    [[nodiscard]] Size registers_per_sketch() const noexcept { return m_; }
    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

    [[nodiscard]] WGC_FORCE_INLINE Register* sketch(NodeId node) noexcept {
        return arena_.get() + static_cast<Size>(node) * m_;
    }

    [[nodiscard]] WGC_FORCE_INLINE const Register* sketch(NodeId node) const noexcept {
        return arena_.get() + static_cast<Size>(node) * m_;
    }

    /// Insert the node's own id into its sketch (the round-0 baseline).
    void seed_node(NodeId node) {
        WGC_CHECK_NODE(node, num_nodes_);
        hll::insert(sketch(node), precision_, node, seed_);
    }

    /// Seed every node.
    void seed_all() noexcept {
        for (Size i = 0; i < num_nodes_; ++i) {
            const auto node = static_cast<NodeId>(i);
            hll::insert(sketch(node), precision_, node, seed_);
        }
    }

    /// Register-wise max of `source` into the sketch of `target`.
    /// @return true if any register changed
    WGC_FORCE_INLINE bool merge_into(NodeId target, const Register* source) noexcept {
        return hll::merge(sketch(target), source, m_);
    }

    [[nodiscard]] double estimate(NodeId node) const noexcept {
        return hll::estimate(sketch(node), precision_);
    }

    /// Copy node's sketch from another generation of the same shape.
    WGC_FORCE_INLINE void copy_from(const SketchRegistry& other, NodeId node) noexcept {
        std::memcpy(sketch(node), other.sketch(node), m_);
    }

    /// @throws DimensionError if the shapes differ
    void check_compatible(const SketchRegistry& other) const {
        WGC_CHECK_DIM(num_nodes_ == other.num_nodes_ && precision_ == other.precision_,
                      "SketchRegistry: generations differ in shape");
    }

    [[nodiscard]] Array<Register> data() noexcept { return arena_.array(); }
    [[nodiscard]] Array<const Register> data() const noexcept { return arena_.array(); }
    [[nodiscard]] Size byte_size() const noexcept { return arena_.size(); }

    void clear() noexcept { memory::zero(arena_.array()); }

    void swap(SketchRegistry& other) noexcept {
        std::swap(num_nodes_, other.num_nodes_);
        std::swap(precision_, other.precision_);
        std::swap(m_, other.m_);
        std::swap(seed_, other.seed_);
        arena_.swap(other.arena_);
    }

private:
    static Size checked_arena_size(Size num_nodes, Size m) {
        if (num_nodes != 0 && m > static_cast<Size>(-1) / num_nodes) {
            throw OverflowError("SketchRegistry: arena size overflows");
        }
        return num_nodes * m;
    }

    Size num_nodes_ = 0;
    int precision_ = config::DEFAULT_PRECISION;
    Size m_ = 0;
    std::uint64_t seed_ = config::DEFAULT_SEED;
    memory::AlignedBuffer<Register> arena_;
};

} // namespace wgc::sketch
