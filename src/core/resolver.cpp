#include <penv/resolver.hpp>
#include <penv/log.hpp>

#include <algorithm>

namespace penv {

std::vector<Version> matching_versions(const Requirement& req,
                                       const std::vector<Version>& candidates) {
    std::vector<Version> out;
    for (const auto& v : candidates) {
        if (req.accepts(v)) out.push_back(v);
    }
    std::sort(out.begin(), out.end(),
              [](const Version& a, const Version& b) { return a > b; });
    return out;
}

Result<ResolvedVersion> resolve(const Requirement& req,
                                const std::vector<Version>& candidates) {
    if (req.is_source()) {
        return Result<ResolvedVersion>::ok(ResolvedVersion::source(req.source, ""));
    }

    if (candidates.empty()) {
        return PenvError{PenvError::NoReleases,
            "no versions available to satisfy '" + req.to_string() + "'"};
    }

    const Version* best = nullptr;
    for (const auto& v : candidates) {
        if (!req.accepts(v)) continue;
        if (!best || v > *best) best = &v;
    }

    if (!best) {
        return PenvError{PenvError::NotFound,
            "no version satisfies '" + req.to_string() + "'",
            "broaden the requirement or list candidates with `penv cache available`"};
    }

    log::debug("resolved '%s' to %s among %zu candidates",
               req.to_string().c_str(), best->to_string().c_str(), candidates.size());
    return Result<ResolvedVersion>::ok(ResolvedVersion::release(*best));
}

} // namespace penv
