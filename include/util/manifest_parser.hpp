#pragma once

#include "util/transfer_manifest.hpp"

#include <expected>
#include <string>

namespace batchsync {

// Reads back the document produced by SerializeManifest().
class ManifestParser {
  public:
    std::expected<TransferManifest, std::string> Parse(const std::string& json_input) const;
};

} // namespace batchsync
