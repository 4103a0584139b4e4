#include "tm/configuration.hpp"
#include <fmt/format.h>
#include <cctype>
#include "common/stl_utils.hpp"

namespace grader::tm {
using namespace std;

static const string_view ELLIPSIS = "...";

static string strip_blanks(string text, char blank, bool from_left) {
    if (from_left) {
        size_t first = text.find_first_not_of(blank);
        return first == string::npos ? string() : text.substr(first);
    } else {
        size_t last = text.find_last_not_of(blank);
        return last == string::npos ? string() : text.substr(0, last + 1);
    }
}

string configuration::to_string() const {
    return fmt::format("...{}[{}]{}...", left, state, right);
}

bool configuration::operator==(const configuration &other) const {
    return left == other.left && right == other.right &&
           canonical_state(state) == canonical_state(other.state);
}

bool configuration::operator!=(const configuration &other) const {
    return !(*this == other);
}

configuration make_configuration(string left, string state, string right, char blank) {
    return configuration{strip_blanks(move(left), blank, true), move(state), strip_blanks(move(right), blank, false)};
}

string canonical_state(const string &state) {
    if (state.size() > 1 && (state[0] == 'q' || state[0] == 'Q') && is_integer(state.substr(1)))
        return state.substr(1);
    return state;
}

optional<configuration> parse_configuration(string_view text, char blank) {
    if (text.size() < 2 * ELLIPSIS.size() ||
        text.substr(0, ELLIPSIS.size()) != ELLIPSIS ||
        text.substr(text.size() - ELLIPSIS.size()) != ELLIPSIS)
        return nullopt;
    text = text.substr(ELLIPSIS.size(), text.size() - 2 * ELLIPSIS.size());

    size_t open = text.find('['), close = text.find(']');
    if (open == string_view::npos || close == string_view::npos || close <= open + 1) return nullopt;
    if (text.find('[', open + 1) != string_view::npos || text.find(']', close + 1) != string_view::npos) return nullopt;

    string_view left = text.substr(0, open), state = text.substr(open + 1, close - open - 1), right = text.substr(close + 1);
    for (string_view part : {left, state, right})
        if (part.find_first_of(" \t") != string_view::npos) return nullopt;

    return make_configuration(string(left), string(state), string(right), blank);
}

optional<configuration> parse_configuration_lenient(string_view text, const set<char> &tape_alphabet, char blank) {
    enum { LEFT, STATE, RIGHT } part = LEFT;
    string left, state, right;

    for (char c : text) {
        if (part == STATE) {
            if (c == ']' || c == '|' || c == ')' || c == '}') part = RIGHT;
            else if (!isspace((unsigned char)c) && c != '.') state += c;
            continue;
        }

        if (tape_alphabet.count(c)) {
            (part == LEFT ? left : right) += c;
        } else if (isspace((unsigned char)c) || c == '.') {
            continue;
        } else if (part == LEFT && (c == '[' || c == '|' || c == '(' || c == '{')) {
            part = STATE;
        } else {
            return nullopt;
        }
    }

    if (part != RIGHT || state.empty()) return nullopt;
    return make_configuration(move(left), canonical_state(state), move(right), blank);
}

}  // namespace grader::tm
