#include <packops-cpp/diff.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace packops_cpp {

namespace {

struct Match {
    std::size_t before;
    std::size_t after;
};

/// Longest common subsequence in linear space (Hirschberg). Matched index
/// pairs are appended to `out` in increasing order.
class Aligner {
public:
    Aligner(const Sequence& before, const Sequence& after, std::vector<Match>& out)
        : before_{before}, after_{after}, out_{out} {}

    void align(std::size_t b0, std::size_t b1, std::size_t a0, std::size_t a1) {
        if (b0 == b1 || a0 == a1) return;
        if (b1 - b0 == 1) {
            for (auto j = a0; j < a1; ++j) {
                if (before_[b0] == after_[j]) {
                    out_.push_back(Match{b0, j});
                    return;
                }
            }
            return;
        }

        const auto mid = b0 + (b1 - b0) / 2;
        const auto head = forward_lengths(b0, mid, a0, a1);
        const auto tail = backward_lengths(mid, b1, a0, a1);
        const auto width = a1 - a0;

        auto split = std::size_t{0};
        auto best = std::size_t{0};
        for (std::size_t k = 0; k <= width; ++k) {
            const auto total = head[k] + tail[width - k];
            if (total > best) {
                best = total;
                split = k;
            }
        }
        align(b0, mid, a0, a0 + split);
        align(mid, b1, a0 + split, a1);
    }

private:
    // row[k] = LCS length of before[b0, b1) and after[a0, a0 + k)
    auto forward_lengths(std::size_t b0, std::size_t b1, std::size_t a0, std::size_t a1) const
        -> std::vector<std::size_t> {
        auto row = std::vector<std::size_t>(a1 - a0 + 1, 0);
        auto prev = row;
        for (auto i = b0; i < b1; ++i) {
            std::swap(row, prev);
            for (auto j = a0; j < a1; ++j) {
                const auto k = j - a0 + 1;
                row[k] = before_[i] == after_[j] ? prev[k - 1] + 1 : std::max(prev[k], row[k - 1]);
            }
        }
        return row;
    }

    // row[k] = LCS length of before[b0, b1) and after[a1 - k, a1)
    auto backward_lengths(std::size_t b0, std::size_t b1, std::size_t a0, std::size_t a1) const
        -> std::vector<std::size_t> {
        auto row = std::vector<std::size_t>(a1 - a0 + 1, 0);
        auto prev = row;
        for (auto i = b1; i-- > b0;) {
            std::swap(row, prev);
            for (auto k = std::size_t{1}; k <= a1 - a0; ++k) {
                row[k] = before_[i] == after_[a1 - k] ? prev[k - 1] + 1 : std::max(prev[k], row[k - 1]);
            }
        }
        return row;
    }

    const Sequence& before_;
    const Sequence& after_;
    std::vector<Match>& out_;
};

class Differ {
public:
    explicit Differ(Diff& out) : out_{out} {}

    void compare(const Node& before, const Node& after, Path& path) {
        // Unmodified subtrees keep sharing storage with the original.
        if (before.shares_storage_with(after)) return;

        if (before.is_number() && after.is_number() && before == after) return;

        if (before.kind() != after.kind()) {
            out_.type_changes.push_back(TypeChange{path, before, after});
            return;
        }

        if (before.is_mapping()) {
            compare_mappings(before.as_mapping(), after.as_mapping(), path);
        } else if (before.is_sequence()) {
            compare_sequences(before.as_sequence(), after.as_sequence(), path);
        } else if (!(before == after)) {
            out_.changed.push_back(ValueChange{path, before, after});
        }
    }

private:
    void compare_mappings(const Mapping& before, const Mapping& after, Path& path) {
        for (const auto& [key, old_value] : before) {
            path.push_back(KeySegment{key});
            if (const auto* new_value = after.find(key)) {
                compare(old_value, *new_value, path);
            } else {
                out_.removed.push_back(DiffEntry{path, old_value});
            }
            path.pop_back();
        }
        for (const auto& [key, new_value] : after) {
            if (before.contains(key)) continue;
            path.push_back(KeySegment{key});
            out_.added.push_back(DiffEntry{path, new_value});
            path.pop_back();
        }
    }

    void compare_sequences(const Sequence& before, const Sequence& after, Path& path) {
        const auto n = before.size();
        const auto m = after.size();

        auto matches = std::vector<Match>{};
        auto prefix = std::size_t{0};
        while (prefix < n && prefix < m && before[prefix] == after[prefix]) {
            matches.push_back(Match{prefix, prefix});
            ++prefix;
        }
        auto suffix = std::size_t{0};
        while (suffix < n - prefix && suffix < m - prefix
               && before[n - 1 - suffix] == after[m - 1 - suffix]) {
            ++suffix;
        }
        Aligner{before, after, matches}.align(prefix, n - suffix, prefix, m - suffix);
        for (auto k = suffix; k > 0; --k) matches.push_back(Match{n - k, m - k});

        auto gap_i = std::size_t{0};
        auto gap_j = std::size_t{0};
        for (const auto& match : matches) {
            flush_gap(before, after, gap_i, match.before, gap_j, match.after, path);
            gap_i = match.before + 1;
            gap_j = match.after + 1;
        }
        flush_gap(before, after, gap_i, n, gap_j, m, path);
    }

    /// Report the unaligned runs before[bi, be) and after[ai, ae).
    void flush_gap(const Sequence& before, const Sequence& after,
                   std::size_t bi, std::size_t be, std::size_t ai, std::size_t ae,
                   Path& path) {
        while (bi < be && ai < ae) {
            path.push_back(IndexSegment{ai});
            compare(before[bi], after[ai], path);
            path.pop_back();
            ++bi;
            ++ai;
        }
        for (; bi < be; ++bi) {
            path.push_back(IndexSegment{bi});
            out_.removed.push_back(DiffEntry{path, before[bi]});
            path.pop_back();
        }
        for (; ai < ae; ++ai) {
            path.push_back(IndexSegment{ai});
            out_.added.push_back(DiffEntry{path, after[ai]});
            path.pop_back();
        }
    }

    Diff& out_;
};

}  // anonymous namespace

auto Diff::find_changed(std::string_view path) const -> const ValueChange* {
    auto it = std::find_if(changed.begin(), changed.end(),
                           [&](const ValueChange& c) { return to_string(c.path) == path; });
    return it == changed.end() ? nullptr : &*it;
}

auto compute_diff(const Node& before, const Node& after) -> Diff {
    auto diff = Diff{};
    auto path = Path{};
    Differ{diff}.compare(before, after, path);
    return diff;
}

}  // namespace packops_cpp
