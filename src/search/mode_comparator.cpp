#include <qms/search/mode_comparator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>

namespace qms::search {

double tagDiversity(const catalog::Movie& a, const catalog::Movie& b) {
    std::set<std::string> tagsA(a.tags.begin(), a.tags.end());
    std::set<std::string> tagsB(b.tags.begin(), b.tags.end());

    std::vector<std::string> shared;
    std::set_intersection(tagsA.begin(), tagsA.end(), tagsB.begin(), tagsB.end(),
                          std::back_inserter(shared));

    const size_t unionSize = tagsA.size() + tagsB.size() - shared.size();
    if (unionSize == 0) {
        return 0.0;
    }
    return 1.0 - static_cast<double>(shared.size()) / static_cast<double>(unionSize);
}

ModeComparator::ModeComparator(const RankingConfig& config) : classical_(config), quantum_(config) {}

Result<ComparisonResult> ModeComparator::compare(const std::vector<catalog::Movie>& candidates,
                                                 const TokenSet& queryTokens) const {
    if (candidates.empty()) {
        return Error{ErrorCode::EmptyCandidateSet, "no candidates to compare"};
    }
    if (queryTokens.empty()) {
        return Error{ErrorCode::InvalidQuery, "query has no searchable tokens"};
    }

    auto classical = classical_.rank(candidates, queryTokens);
    if (!classical) {
        return classical.error();
    }
    auto quantum = quantum_.rank(candidates, queryTokens);
    if (!quantum) {
        return quantum.error();
    }

    ComparisonResult out;
    out.classical = std::move(classical).value();
    out.quantum = std::move(quantum).value();
    out.classicalIndex = out.classical.index;
    out.quantumIndex = out.quantum.index;
    out.quantumIterations = out.quantum.iterations;
    out.agree = out.classicalIndex == out.quantumIndex;
    out.diversity =
        out.agree ? 0.0
                  : tagDiversity(candidates[out.classicalIndex], candidates[out.quantumIndex]);

    if (!out.agree) {
        spdlog::debug("Ranking modes disagree: classical={} quantum={} diversity={:.3f}",
                      out.classicalIndex, out.quantumIndex, out.diversity);
    }
    return out;
}

} // namespace qms::search
