#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace codescope {

struct CandidateFile {
    std::string rel_path;
    double mtime = 0.0;   // seconds since epoch
    uint64_t size = 0;
};

struct SamplingQuotas {
    size_t core = 0;
    size_t recent = 0;
    size_t heavy = 0;
};

// core = 50%, recent = 30%, heavy = remainder; each at least 1.
SamplingQuotas compute_quotas(size_t limit);

// +3 per conventional source directory (src/, app/, lib/), +1 per core keyword.
int core_score(const std::string& rel_path);

/**
 * Picks at most `limit` candidates in three tiers: core (scored paths,
 * newest first on ties), recent (newest first) and heavy (largest first).
 * Tiers never pick a path twice; quota a tier cannot fill spills over to the
 * recent tier. Returns the input unchanged when it already fits.
 */
std::vector<CandidateFile> select_sampling_tiers(const std::vector<CandidateFile>& candidates, size_t limit);

} // namespace codescope
