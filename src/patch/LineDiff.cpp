#include "term_coder/patch/LineDiff.hpp"
#include <algorithm>

namespace term_coder {

namespace {

enum class Edit : char { KEEP, DEL, INS };

// Greedy Myers over a[a_lo, a_hi) x b[b_lo, b_hi). Fills `script` in forward order.
// Returns false when the edit distance exceeds the cap.
bool myers_script(const std::vector<std::string>& a, int a_lo, int a_hi,
                  const std::vector<std::string>& b, int b_lo, int b_hi,
                  std::vector<Edit>& script) {
    const int n = a_hi - a_lo;
    const int m = b_hi - b_lo;
    if (n == 0) { script.assign(static_cast<size_t>(m), Edit::INS); return true; }
    if (m == 0) { script.assign(static_cast<size_t>(n), Edit::DEL); return true; }

    // snaps[d][k + d] = furthest x on diagonal k after d edits
    std::vector<std::vector<int>> snaps;
    const int max_d = std::min(n + m, LineDiff::kMaxEditDistance);
    int found_d = -1;

    for (int d = 0; d <= max_d && found_d < 0; ++d) {
        std::vector<int> cur(static_cast<size_t>(2 * d + 1), 0);
        for (int k = -d; k <= d; k += 2) {
            int x;
            if (d == 0) {
                x = 0;
            } else {
                const auto& prev = snaps[d - 1];
                const int off = d - 1;
                bool down = (k == -d) || (k != d && prev[k - 1 + off] < prev[k + 1 + off]);
                x = down ? prev[k + 1 + off] : prev[k - 1 + off] + 1;
            }
            int y = x - k;
            while (x < n && y < m && a[a_lo + x] == b[b_lo + y]) { ++x; ++y; }
            cur[k + d] = x;
            if (x >= n && y >= m) { found_d = d; break; }
        }
        snaps.push_back(std::move(cur));
    }
    if (found_d < 0) return false;

    std::vector<Edit> rev;
    int x = n, y = m;
    for (int d = found_d; d > 0; --d) {
        const auto& prev = snaps[d - 1];
        const int off = d - 1;
        int k = x - y;
        bool down = (k == -d) || (k != d && prev[k - 1 + off] < prev[k + 1 + off]);
        int prev_k = down ? k + 1 : k - 1;
        int prev_x = prev[prev_k + off];
        int prev_y = prev_x - prev_k;
        while (x > prev_x && y > prev_y) { rev.push_back(Edit::KEEP); --x; --y; }
        rev.push_back(down ? Edit::INS : Edit::DEL);
        x = prev_x;
        y = prev_y;
    }
    while (x > 0 && y > 0) { rev.push_back(Edit::KEEP); --x; --y; }

    script.assign(rev.rbegin(), rev.rend());
    return true;
}

void push_code(std::vector<Opcode>& codes, OpTag tag, int i1, int i2, int j1, int j2) {
    if (i1 == i2 && j1 == j2) return;
    if (!codes.empty()) {
        Opcode& last = codes.back();
        if (last.tag == tag && last.i2 == i1 && last.j2 == j1) {
            last.i2 = i2;
            last.j2 = j2;
            return;
        }
    }
    codes.push_back({tag, i1, i2, j1, j2});
}

void push_change(std::vector<Opcode>& codes, int i1, int i2, int j1, int j2) {
    if (i1 == i2 && j1 == j2) return;
    OpTag tag = (i1 < i2 && j1 < j2) ? OpTag::REPLACE : (i1 < i2 ? OpTag::DELETE : OpTag::INSERT);
    push_code(codes, tag, i1, i2, j1, j2);
}

}

std::vector<std::string> LineDiff::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::vector<Opcode> LineDiff::compute_opcodes(const std::vector<std::string>& a,
                                              const std::vector<std::string>& b) {
    const int n = static_cast<int>(a.size());
    const int m = static_cast<int>(b.size());

    int prefix = 0;
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) ++prefix;
    int suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix && a[n - 1 - suffix] == b[m - 1 - suffix]) ++suffix;

    const int a_lo = prefix, a_hi = n - suffix;
    const int b_lo = prefix, b_hi = m - suffix;

    std::vector<Opcode> codes;
    push_code(codes, OpTag::EQUAL, 0, prefix, 0, prefix);

    std::vector<Edit> script;
    if (!myers_script(a, a_lo, a_hi, b, b_lo, b_hi, script)) {
        push_change(codes, a_lo, a_hi, b_lo, b_hi);
    } else {
        int x = a_lo, y = b_lo;
        int cx = x, cy = y; // start of the pending change run
        for (Edit e : script) {
            if (e == Edit::KEEP) {
                push_change(codes, cx, x, cy, y);
                push_code(codes, OpTag::EQUAL, x, x + 1, y, y + 1);
                ++x; ++y;
                cx = x; cy = y;
            } else if (e == Edit::DEL) {
                ++x;
            } else {
                ++y;
            }
        }
        push_change(codes, cx, x, cy, y);
    }

    push_code(codes, OpTag::EQUAL, a_hi, n, b_hi, m);
    return codes;
}

std::vector<std::vector<Opcode>> LineDiff::group_opcodes(std::vector<Opcode> codes, int context) {
    std::vector<std::vector<Opcode>> groups;
    const int n = std::max(0, context);

    if (codes.empty()) return groups;

    if (codes.front().tag == OpTag::EQUAL) {
        Opcode& c = codes.front();
        c.i1 = std::max(c.i1, c.i2 - n);
        c.j1 = std::max(c.j1, c.j2 - n);
    }
    if (codes.back().tag == OpTag::EQUAL) {
        Opcode& c = codes.back();
        c.i2 = std::min(c.i2, c.i1 + n);
        c.j2 = std::min(c.j2, c.j1 + n);
    }

    const int nn = n + n;
    std::vector<Opcode> group;
    for (Opcode c : codes) {
        if (c.tag == OpTag::EQUAL && c.i2 - c.i1 > nn) {
            group.push_back({OpTag::EQUAL, c.i1, std::min(c.i2, c.i1 + n), c.j1, std::min(c.j2, c.j1 + n)});
            groups.push_back(std::move(group));
            group.clear();
            c.i1 = std::max(c.i1, c.i2 - n);
            c.j1 = std::max(c.j1, c.j2 - n);
        }
        group.push_back(c);
    }
    if (!group.empty() && !(group.size() == 1 && group.front().tag == OpTag::EQUAL)) {
        groups.push_back(std::move(group));
    }
    return groups;
}

std::string LineDiff::format_range(int start, int stop) {
    int beginning = start + 1;
    int length = stop - start;
    if (length == 1) return std::to_string(beginning);
    if (length == 0) beginning -= 1;
    return std::to_string(beginning) + "," + std::to_string(length);
}

}
