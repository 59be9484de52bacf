#pragma once
#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "term_coder/patch/PatchTypes.hpp"

namespace term_coder::staging {

struct PendingEdit {
    std::string instruction;
    PatchProposal proposal;

    bool operator==(const PendingEdit& o) const {
        return instruction == o.instruction && proposal == o.proposal;
    }

    nlohmann::json to_json() const {
        return {{"instruction", instruction}, {"proposal", proposal.to_json()}};
    }

    static PendingEdit from_json(const nlohmann::json& j) {
        PendingEdit e;
        e.instruction = j.value("instruction", "");
        e.proposal = PatchProposal::from_json(j.at("proposal"));
        return e;
    }
};

// Single slot at <root>/.term-coder/pending_edit.json. Last writer wins.
class PendingEditStore {
public:
    explicit PendingEditStore(const std::filesystem::path& root);

    // Replaces the slot as a whole (temp file + rename). Throws PatchIoError.
    void save(const PendingEdit& edit) const;

    // nullopt when the slot is absent or unreadable.
    std::optional<PendingEdit> load() const;

    void clear() const;

    const std::filesystem::path& slot_path() const { return slot_; }

private:
    std::filesystem::path slot_;
};

}
