#pragma once

#include <penv/requirement.hpp>
#include <penv/result.hpp>
#include <penv/version.hpp>
#include <vector>

namespace penv {

// Pick the highest candidate satisfying the requirement.
//
//   Range   highest version in range (prereleases only when requested)
//   Latest  highest non-prerelease version
//   Source  the source itself; the commit is pinned later by the checkout
//
// Errors: NoReleases when `candidates` is empty, NotFound when candidates
// exist but none satisfies the requirement. Candidate order is irrelevant.
Result<ResolvedVersion> resolve(const Requirement& req,
                                const std::vector<Version>& candidates);

// All candidates satisfying the requirement, highest first
std::vector<Version> matching_versions(const Requirement& req,
                                       const std::vector<Version>& candidates);

} // namespace penv
