#include "batchsync/group_classifier.hpp"

#include <utility>

namespace batchsync {

const char* StrategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::Archive: return "ARCHIVE";
        case Strategy::Raw:     return "RAW";
    }
    return "UNKNOWN";
}

std::expected<ClassifiedGroup, std::string> GroupClassifier::Classify(DirectoryGroup group) const {
    if (group.files.empty()) {
        const std::string dir = group.relative_dir.empty() ? "." : group.relative_dir.string();
        return std::unexpected("cannot classify empty group: " + dir);
    }

    ClassifiedGroup out;
    out.total_bytes = group.TotalBytes();
    // Integer division: for an integral threshold T, floor(total/n) < T
    // exactly when total/n < T, so truncation never changes the decision.
    out.mean_bytes = out.total_bytes / group.files.size();
    out.strategy = Decide(out.mean_bytes);
    out.group = std::move(group);
    return out;
}

} // namespace batchsync
