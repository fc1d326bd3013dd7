#include "setup_recorder.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

std::string RecordAction::kind_string() const {
    switch (kind) {
        case Kind::Create: return "CREATE";
        case Kind::Update: return "UPDATE";
        case Kind::Skip: return "SKIP";
        default: return "UNKNOWN";
    }
}

SetupRecorder::SetupRecorder(std::map<std::string, Confidence> seed) : cache_(std::move(seed)) {}

std::optional<Confidence> SetupRecorder::known(const std::string& setup_id) const {
    auto it = cache_.find(setup_id);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RecordAction> SetupRecorder::plan(const std::vector<SetupCandidate>& candidates) const {
    // Last occurrence of an identity wins
    std::unordered_map<std::string, size_t> last_index;
    for (size_t i = 0; i < candidates.size(); ++i) {
        last_index[candidates[i].setup_id()] = i;
    }

    std::vector<RecordAction> actions;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        if (last_index[c.setup_id()] != i) {
            continue;
        }

        RecordAction action;
        action.candidate = c;
        action.previous = known(c.setup_id());
        if (!action.previous) {
            action.kind = RecordAction::Kind::Create;
        } else if (*action.previous != c.confidence) {
            action.kind = RecordAction::Kind::Update;
        } else {
            action.kind = RecordAction::Kind::Skip;
        }
        actions.push_back(std::move(action));
    }
    return actions;
}

void SetupRecorder::commit(const RecordAction& action) {
    if (action.kind == RecordAction::Kind::Skip) {
        return;
    }
    cache_[action.candidate.setup_id()] = action.candidate.confidence;
}

RecordSummary SetupRecorder::record(const std::vector<SetupCandidate>& candidates,
                                    RecordStore& store, int64_t now_ms) {
    RecordSummary summary;

    for (const auto& action : plan(candidates)) {
        if (action.kind == RecordAction::Kind::Skip) {
            summary.skipped++;
            continue;
        }

        try {
            store.upsert_setup(action.candidate, now_ms);
            commit(action);
            if (action.kind == RecordAction::Kind::Create) {
                summary.created++;
            } else {
                summary.updated++;
            }
            spdlog::info("Setup {} {} ({})", action.kind_string(), action.candidate.setup_id(),
                         to_string(action.candidate.confidence));
        } catch (const PersistenceError& e) {
            summary.failed++;
            spdlog::error("Failed to record setup {}: {}", action.candidate.setup_id(), e.what());
        }
    }

    return summary;
}
