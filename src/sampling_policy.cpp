#include "sampling_policy.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace codescope {

namespace {

using Ranking = std::vector<const CandidateFile*>;

Ranking rank(const std::vector<CandidateFile>& candidates,
             bool (*before)(const CandidateFile*, const CandidateFile*)) {
    Ranking order;
    order.reserve(candidates.size());
    for (const auto& c : candidates) order.push_back(&c);
    std::stable_sort(order.begin(), order.end(), before);
    return order;
}

} // namespace

SamplingQuotas compute_quotas(size_t limit) {
    SamplingQuotas q;
    q.core = std::max<size_t>(1, limit / 2);
    q.recent = std::max<size_t>(1, (limit * 3) / 10);
    size_t used = q.core + q.recent;
    q.heavy = used < limit ? limit - used : 1;
    return q;
}

int core_score(const std::string& rel_path) {
    std::string rel = "/" + rel_path;
    std::transform(rel.begin(), rel.end(), rel.begin(), [](unsigned char c) {
        return c == '\\' ? '/' : static_cast<char>(std::tolower(c));
    });

    int score = 0;
    for (const char* dir : {"/src/", "/app/", "/lib/"}) {
        if (rel.find(dir) != std::string::npos) score += 3;
    }
    for (const char* keyword : {"core", "main", "service", "api", "model"}) {
        if (rel.find(keyword) != std::string::npos) score += 1;
    }
    return score;
}

std::vector<CandidateFile> select_sampling_tiers(const std::vector<CandidateFile>& candidates, size_t limit) {
    if (limit == 0) return {};
    if (candidates.size() <= limit) return candidates;

    const SamplingQuotas quotas = compute_quotas(limit);

    std::vector<int> scores(candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) scores[i] = core_score(candidates[i].rel_path);

    Ranking core;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (scores[i] > 0) core.push_back(&candidates[i]);
    }
    const CandidateFile* base = candidates.data();
    std::stable_sort(core.begin(), core.end(), [&](const CandidateFile* a, const CandidateFile* b) {
        int sa = scores[a - base], sb = scores[b - base];
        if (sa != sb) return sa > sb;
        return a->mtime > b->mtime;
    });

    Ranking recent = rank(candidates, [](const CandidateFile* a, const CandidateFile* b) {
        return a->mtime > b->mtime;
    });
    Ranking heavy = rank(candidates, [](const CandidateFile* a, const CandidateFile* b) {
        return a->size > b->size;
    });

    std::vector<CandidateFile> selected;
    selected.reserve(limit);
    std::unordered_set<const CandidateFile*> seen;

    auto take = [&](const Ranking& from, size_t quota) {
        size_t taken = 0;
        for (const CandidateFile* c : from) {
            if (taken >= quota || selected.size() >= limit) break;
            if (!seen.insert(c).second) continue;
            selected.push_back(*c);
            taken++;
        }
    };

    take(core, quotas.core);
    take(recent, quotas.recent);
    take(heavy, quotas.heavy);
    // Whatever a tier could not fill goes to the recent tier.
    take(recent, limit - selected.size());
    return selected;
}

} // namespace codescope
