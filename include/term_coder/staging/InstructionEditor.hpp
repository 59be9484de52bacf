#pragma once
#include <string>
#include <vector>
#include <optional>
#include "term_coder/patch/PatchSystem.hpp"
#include "term_coder/staging/PendingEditStore.hpp"

namespace term_coder::staging {

// Offline edit producer understanding three instruction shapes:
//   replace 'A' -> 'B'
//   append 'TEXT'
//   prepend 'TEXT'
// Matching is case-insensitive and the first shape found wins.
class InstructionEditor {
public:
    explicit InstructionEditor(const PatchSystem& patches);

    // Changes for `files` only. Missing files read as empty; paths outside
    // the root are ignored.
    ChangeSet apply_instruction(const std::string& instruction,
                                const std::vector<std::string>& files) const;

    // nullopt when the instruction produces no textual change.
    std::optional<PendingEdit> generate(const std::string& instruction,
                                        const std::vector<std::string>& files) const;

private:
    const PatchSystem& patches_;
};

}
