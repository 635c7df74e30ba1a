#include "util/manifest_parser.hpp"

#include <nlohmann/json.hpp>

namespace batchsync {

using json = nlohmann::json;

namespace {

std::expected<std::vector<TransferItem>, std::string> ParseItemsArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'items' must be an array");
    }

    std::vector<TransferItem> out;
    out.reserve(arr.size());

    for (const auto& item : arr) {
        if (!item.is_object()) {
            return std::unexpected("transfer item must be an object");
        }
        TransferItem t;
        t.source = item.value("source", "");
        t.destination = item.value("destination", "");
        t.size_bytes = item.value("size", 0ULL);
        t.sha256 = item.value("sha256", "");

        const std::string kind = item.value("kind", "");
        const auto parsed_kind = ParseTransferKind(kind);
        if (!parsed_kind) {
            return std::unexpected("unknown transfer kind: '" + kind + "'");
        }
        t.kind = *parsed_kind;

        if (t.source.empty() || t.destination.empty()) {
            return std::unexpected("transfer item missing source or destination");
        }
        out.push_back(std::move(t));
    }

    return out;
}

} // namespace

std::expected<TransferManifest, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        TransferManifest m;
        m.label = j.value("label", "");
        m.source_endpoint = j.value("source_endpoint", "");
        m.dest_endpoint = j.value("dest_endpoint", "");
        if (m.label.empty()) {
            return std::unexpected("manifest missing label");
        }

        if (j.contains("sync")) {
            const auto& sync = j["sync"];
            if (!sync.is_object()) {
                return std::unexpected("'sync' must be an object");
            }
            m.policy.verify_checksum = sync.value("verify_checksum", m.policy.verify_checksum);
            m.policy.preserve_timestamp =
                sync.value("preserve_timestamp", m.policy.preserve_timestamp);
            const std::string level = sync.value("sync_level", "none");
            const auto parsed_level = ParseSyncLevel(level);
            if (!parsed_level) {
                return std::unexpected("unknown sync_level: '" + level + "'");
            }
            m.policy.sync_level = *parsed_level;
        }

        if (j.contains("items")) {
            auto parsed = ParseItemsArray(j["items"]);
            if (!parsed)
                return std::unexpected(parsed.error());
            m.items = std::move(*parsed);
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace batchsync
