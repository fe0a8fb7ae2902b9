#pragma once

#include "wgc/core/type.hpp"
#include "wgc/core/error.hpp"
#include "wgc/engine/centrality_engine.hpp"
#include "wgc/io/file.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <charconv>
#include <concepts>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// =============================================================================
// FILE: wgc/engine/score_writer.hpp
// BRIEF: Final scores joined to external identifiers
// =============================================================================

namespace wgc::engine {

struct ScoreOptions {
    // Divide by N - 1, giving scores in [0, 1].
    bool normalize = false;

    // 0 keeps every node in node-id order; otherwise the k best by score.
    Size top_k = 0;
};

struct ScoredNode {
    NodeId node = 0;
    std::string external_id;
    double score = 0.0;
};

/// Anything that maps dense ids back to external identifiers
/// (NodeIdentityTable, MappedIdentityView).
template <typename T>
concept IdentityLookup = requires(const T& ids, NodeId node) {
    { ids.size() } -> std::convertible_to<Size>;
    { ids.resolve(node) } -> std::convertible_to<std::string_view>;
};

class ScoreWriter {
public:
    explicit ScoreWriter(ScoreOptions options = {}) : options_(options) {}

    [[nodiscard]] const ScoreOptions& options() const noexcept { return options_; }

    /// Scores joined to their identifiers, in memory.
    ///
    /// @throws IncompleteRunError unless the run reached a terminal state
    /// @throws DimensionError if the identity table does not cover the scores
    template <IdentityLookup Ids>
    [[nodiscard]] std::vector<ScoredNode> emit(const CentralityResult& result, const Ids& ids) const {
        const double scale = check(result, ids);
        std::vector<ScoredNode> out;
        if (options_.top_k > 0) {
            const auto best = ranked(result, scale);
            out.reserve(best.size());
            for (const Ranked& r : best) {
                out.push_back(ScoredNode{r.node, std::string(ids.resolve(r.node)), r.score});
            }
            return out;
        }
        const Size n = result.scores.size();
        out.reserve(n);
        for (Size i = 0; i < n; ++i) {
            const auto node = static_cast<NodeId>(i);
            out.push_back(ScoredNode{node, std::string(ids.resolve(node)), result.scores[i] * scale});
        }
        return out;
    }

    /// `external_id<TAB>score` per line, replacing `path` atomically.
    ///
    /// Without top_k, lines are streamed in node-id order and identifiers
    /// are resolved one at a time, so memory stays flat in N. With top_k
    /// only the k best entries are held.
    ///
    /// @return lines written
    /// @throws IncompleteRunError unless the run reached a terminal state
    /// @throws DimensionError if the identity table does not cover the scores
    /// @throws IOError if the file cannot be written (previous output intact)
    template <IdentityLookup Ids>
    Size write(const std::string& path, const CentralityResult& result, const Ids& ids) const {
        const double scale = check(result, ids);
        Size lines = 0;
        if (options_.top_k > 0) {
            const auto best = ranked(result, scale);
            replace_file(path, [&](TsvSink& sink) {
                for (const Ranked& r : best) {
                    sink.line(ids.resolve(r.node), r.score);
                }
            });
            lines = best.size();
        } else {
            const Size n = result.scores.size();
            replace_file(path, [&](TsvSink& sink) {
                for (Size i = 0; i < n; ++i) {
                    sink.line(ids.resolve(static_cast<NodeId>(i)), result.scores[i] * scale);
                }
            });
            lines = n;
        }
        LOG(INFO) << "Wrote " << lines << " scores to " << path;
        return lines;
    }

    /// Writes rows already produced by emit().
    /// @return lines written
    static Size write_tsv(const std::string& path, const std::vector<ScoredNode>& scores) {
        replace_file(path, [&](TsvSink& sink) {
            for (const ScoredNode& s : scores) {
                sink.line(s.external_id, s.score);
            }
        });
        LOG(INFO) << "Wrote " << scores.size() << " scores to " << path;
        return scores.size();
    }

private:
    struct Ranked {
        double score;
        NodeId node;
    };

    // Formats lines into a small reused buffer ahead of the writer.
    class TsvSink {
    public:
        explicit TsvSink(io::BinaryWriter& out) : out_(out) { buf_.reserve(FLUSH_AT + 256); }

        void line(std::string_view external_id, double score) {
            char num[64];
            const auto [end, ec] = std::to_chars(num, num + sizeof(num), score);
            if (ec != std::errc()) {
                throw InternalError("ScoreWriter: failed to format score for " + std::string(external_id));
            }
            buf_.append(external_id);
            buf_.push_back('\t');
            buf_.append(num, end);
            buf_.push_back('\n');
            if (buf_.size() >= FLUSH_AT) {
                flush();
            }
        }

        void flush() {
            out_.write(buf_.data(), buf_.size());
            buf_.clear();
        }

    private:
        static constexpr Size FLUSH_AT = Size(1) << 16;

        io::BinaryWriter& out_;
        std::string buf_;
    };

    template <IdentityLookup Ids>
    double check(const CentralityResult& result, const Ids& ids) const {
        if (!result.terminal) {
            throw IncompleteRunError("ScoreWriter: run stopped after round " +
                                     std::to_string(result.rounds_completed) + " without reaching a terminal state");
        }
        const Size n = result.scores.size();
        WGC_CHECK_DIM(static_cast<Size>(ids.size()) == n, "ScoreWriter: identity table size does not match scores");
        return (options_.normalize && n > 1) ? 1.0 / static_cast<double>(n - 1) : 1.0;
    }

    // The top_k best by score descending, ties by node id ascending. Holds
    // at most k entries: a heap whose front is the worst one kept.
    std::vector<Ranked> ranked(const CentralityResult& result, double scale) const {
        const Size k = std::min(options_.top_k, result.scores.size());
        const auto better = [](const Ranked& a, const Ranked& b) {
            return a.score != b.score ? a.score > b.score : a.node < b.node;
        };
        std::vector<Ranked> heap;
        heap.reserve(k);
        for (Size i = 0; i < result.scores.size() && k > 0; ++i) {
            const Ranked r{result.scores[i] * scale, static_cast<NodeId>(i)};
            if (heap.size() < k) {
                heap.push_back(r);
                std::push_heap(heap.begin(), heap.end(), better);
            } else if (better(r, heap.front())) {
                std::pop_heap(heap.begin(), heap.end(), better);
                heap.back() = r;
                std::push_heap(heap.begin(), heap.end(), better);
            }
        }
        std::sort_heap(heap.begin(), heap.end(), better);
        return heap;
    }

    // Writes `path.tmp`, fsyncs it and renames it over `path`.
    template <typename Fill>
    static void replace_file(const std::string& path, Fill&& fill) {
        const std::string tmp = path + ".tmp";
        try {
            io::BinaryWriter out(tmp);
            TsvSink sink(out);
            fill(sink);
            sink.flush();
            out.close();
            io::durable_rename(tmp, path);
        } catch (const Exception&) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw;
        }
    }

    ScoreOptions options_;
};

} // namespace wgc::engine
