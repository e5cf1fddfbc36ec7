#include "metrics/label_key.h"

#include <cstdint>

namespace chitty::metrics {

namespace {
// FNV-1a, fed with a separator byte between fields so ("ab","c") != ("a","bc").
constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void mix(uint64_t& hash, const std::string& s) {
    for (char c : s) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
        hash *= kFnvPrime;
    }
    hash ^= 0xff;
    hash *= kFnvPrime;
}
}  // namespace

LabelKey::LabelKey(const LabelSet& labels) : pairs_(labels.begin(), labels.end()) {
    // std::map already iterates in name order
    rehash();
}

std::vector<std::string> LabelKey::names() const {
    std::vector<std::string> out;
    out.reserve(pairs_.size());
    for (const auto& p : pairs_) out.push_back(p.first);
    return out;
}

void LabelKey::rehash() {
    uint64_t h = kFnvOffset;
    for (const auto& p : pairs_) {
        mix(h, p.first);
        mix(h, p.second);
    }
    hash_ = static_cast<size_t>(h);
}

}  // namespace chitty::metrics
