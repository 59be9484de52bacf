#pragma once
#include <string>
#include <vector>

namespace term_coder {

enum class OpTag { EQUAL, REPLACE, DELETE, INSERT };

// a[i1, i2) becomes b[j1, j2)
struct Opcode {
    OpTag tag;
    int i1;
    int i2;
    int j1;
    int j2;

    bool operator==(const Opcode& o) const {
        return tag == o.tag && i1 == o.i1 && i2 == o.i2 && j1 == o.j1 && j2 == o.j2;
    }
};

class LineDiff {
public:
    // Above this many edits the changed middle is reported as one REPLACE.
    static constexpr int kMaxEditDistance = 2048;

    // Splits after every '\n'; line terminators stay attached.
    static std::vector<std::string> split_lines(const std::string& text);

    // Myers shortest edit script over lines, covering both inputs end to end.
    static std::vector<Opcode> compute_opcodes(const std::vector<std::string>& a,
                                               const std::vector<std::string>& b);

    // Hunks with at most `context` lines of surrounding EQUAL context.
    static std::vector<std::vector<Opcode>> group_opcodes(std::vector<Opcode> codes, int context);

    // Unified range "start,len" as printed inside "@@ ... @@".
    static std::string format_range(int start, int stop);
};

}
