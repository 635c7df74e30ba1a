#pragma once

#include "batchsync/file_record.hpp"
#include "util/run_config.hpp"

#include <cstdint>
#include <expected>
#include <string>

namespace batchsync {

enum class Strategy {
    Archive,
    Raw,
};

const char* StrategyName(Strategy strategy);

struct ClassifiedGroup {
    DirectoryGroup group;
    Strategy strategy = Strategy::Raw;
    std::uint64_t total_bytes = 0;
    std::uint64_t mean_bytes = 0;
};

// All-or-nothing per directory: a group whose mean file size is strictly
// below the threshold is bundled, anything else (including a mean exactly at
// the threshold) moves file by file. One large file can therefore push a
// directory of small files to Raw.
class GroupClassifier {
  public:
    explicit GroupClassifier(std::uint64_t threshold_bytes = config::kDefaultSizeThresholdBytes)
        : threshold_(threshold_bytes) {}

    // An empty group cannot be classified; the scanner never produces one.
    std::expected<ClassifiedGroup, std::string> Classify(DirectoryGroup group) const;

    Strategy Decide(std::uint64_t mean_bytes) const {
        return mean_bytes < threshold_ ? Strategy::Archive : Strategy::Raw;
    }

    std::uint64_t Threshold() const { return threshold_; }

  private:
    std::uint64_t threshold_;
};

} // namespace batchsync
