#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace chitty::metrics {

/// Label name -> label value, as supplied by callers.
using LabelSet = std::map<std::string, std::string>;

/// Canonical form of a LabelSet: pairs sorted by label name plus a content hash.
/// Used as the series key inside a family and to order series on render.
class LabelKey {
public:
    using Pair = std::pair<std::string, std::string>;

    LabelKey() = default;
    LabelKey(const LabelSet& labels);  // NOLINT(google-explicit-constructor)

    const std::vector<Pair>& pairs() const { return pairs_; }
    std::vector<std::string> names() const;
    bool empty() const { return pairs_.empty(); }
    size_t size() const { return pairs_.size(); }
    size_t hash() const { return hash_; }

    bool operator==(const LabelKey& other) const {
        return hash_ == other.hash_ && pairs_ == other.pairs_;
    }
    bool operator!=(const LabelKey& other) const { return !(*this == other); }
    bool operator<(const LabelKey& other) const { return pairs_ < other.pairs_; }

private:
    void rehash();

    std::vector<Pair> pairs_;
    size_t hash_{0};
};

struct LabelKeyHash {
    size_t operator()(const LabelKey& key) const { return key.hash(); }
};

}  // namespace chitty::metrics
