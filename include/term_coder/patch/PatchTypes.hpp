#pragma once
#include <map>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace term_coder {

struct ImpactAssessment {
    int files_changed = 0;
    int lines_added = 0;
    int lines_removed = 0;

    bool operator==(const ImpactAssessment& o) const {
        return files_changed == o.files_changed && lines_added == o.lines_added && lines_removed == o.lines_removed;
    }

    nlohmann::json to_json() const {
        return {
            {"files_changed", files_changed},
            {"lines_added", lines_added},
            {"lines_removed", lines_removed}
        };
    }

    static ImpactAssessment from_json(const nlohmann::json& j) {
        ImpactAssessment i;
        i.files_changed = j.value("files_changed", 0);
        i.lines_added = j.value("lines_added", 0);
        i.lines_removed = j.value("lines_removed", 0);
        return i;
    }
};

struct SafetyThresholds {
    int max_files = 50;
    int max_lines = 2000;
};

// Whole-file replacement contents keyed by project-relative path.
using ChangeSet = std::map<std::string, std::string>;

struct PatchProposal {
    std::string instruction;
    std::string diff;
    std::string rationale;
    std::vector<std::string> affected_files; // first appearance in `diff`, no duplicates
    double safety_score = 0.0;
    ImpactAssessment estimated_impact;
    std::optional<ChangeSet> new_contents;

    bool operator==(const PatchProposal& o) const {
        return instruction == o.instruction && diff == o.diff && rationale == o.rationale &&
               affected_files == o.affected_files && safety_score == o.safety_score &&
               estimated_impact == o.estimated_impact && new_contents == o.new_contents;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"instruction", instruction},
            {"diff", diff},
            {"rationale", rationale},
            {"affected_files", affected_files},
            {"safety_score", safety_score},
            {"estimated_impact", estimated_impact.to_json()}
        };
        if (new_contents) j["new_contents"] = *new_contents;
        else j["new_contents"] = nullptr;
        return j;
    }

    // Throws nlohmann::json::exception on type mismatches.
    static PatchProposal from_json(const nlohmann::json& j) {
        PatchProposal p;
        p.instruction = j.value("instruction", "");
        p.diff = j.value("diff", "");
        p.rationale = j.value("rationale", "");
        p.affected_files = j.value("affected_files", std::vector<std::string>{});
        p.safety_score = j.value("safety_score", 0.0);
        if (j.contains("estimated_impact")) {
            p.estimated_impact = ImpactAssessment::from_json(j.at("estimated_impact"));
        }
        if (j.contains("new_contents") && !j.at("new_contents").is_null()) {
            p.new_contents = j.at("new_contents").get<ChangeSet>();
        }
        return p;
    }
};

}
