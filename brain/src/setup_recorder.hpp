#pragma once

#include "types.hpp"
#include "collaborators.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct RecordAction {
    enum class Kind {
        Create,
        Update,
        Skip
    };

    Kind kind = Kind::Skip;
    SetupCandidate candidate;
    std::optional<Confidence> previous;

    std::string kind_string() const;
};

struct RecordSummary {
    int created = 0;
    int updated = 0;
    int skipped = 0;
    int failed = 0;

    int writes() const { return created + updated; }
};

// Writes a setup only when it is new or its confidence moved. The cache is
// advanced after the write, so a failed write is planned again next cycle.
class SetupRecorder {
public:
    explicit SetupRecorder(std::map<std::string, Confidence> seed = {});

    std::vector<RecordAction> plan(const std::vector<SetupCandidate>& candidates) const;
    void commit(const RecordAction& action);

    RecordSummary record(const std::vector<SetupCandidate>& candidates,
                         RecordStore& store, int64_t now_ms);

    std::optional<Confidence> known(const std::string& setup_id) const;
    size_t size() const { return cache_.size(); }

private:
    std::map<std::string, Confidence> cache_;
};
