#include "ojudge/judge/comparator.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>

namespace ojudge {
using namespace std;

const char *const EOF_MARKER = "[EOF]";

vector<string> normalize_output(const string &text) {
    string stripped = boost::algorithm::trim_copy(text);

    vector<string> lines;
    string line;
    for (size_t i = 0; i < stripped.size(); ++i) {
        char c = stripped[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < stripped.size() && stripped[i + 1] == '\n') ++i;
            boost::algorithm::trim_right(line);
            lines.push_back(move(line));
            line.clear();
        } else {
            line.push_back(c);
        }
    }
    // 空文本没有任何行，与 "" 比较时不会出现 [EOF]
    if (!stripped.empty()) {
        boost::algorithm::trim_right(line);
        lines.push_back(move(line));
    }
    return lines;
}

string output_mismatch::describe() const {
    return fmt::format("Mismatch at line {}:\n  Expected: {}\n  Got     : {}",
                       line, expected.value_or(EOF_MARKER), actual.value_or(EOF_MARKER));
}

comparison_result compare_outputs(const string &actual, const string &expected) {
    vector<string> actual_lines = normalize_output(actual);
    vector<string> expected_lines = normalize_output(expected);

    size_t total = max(actual_lines.size(), expected_lines.size());
    for (size_t i = 0; i < total; ++i) {
        optional<string> exp, act;
        if (i < expected_lines.size()) exp = expected_lines[i];
        if (i < actual_lines.size()) act = actual_lines[i];
        if (exp != act)
            return {status::WRONG_ANSWER, output_mismatch{i + 1, exp, act}};
    }
    return {status::ACCEPTED, nullopt};
}

}  // namespace ojudge
