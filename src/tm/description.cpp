#include "tm/description.hpp"
#include <algorithm>
#include "common/stl_utils.hpp"

namespace grader::tm {
using namespace std;

optional<direction> parse_move(const string &text) {
    string m = to_lower(text);
    if (m == "l" || m == "left") return direction::LEFT;
    if (m == "r" || m == "right") return direction::RIGHT;
    if (m == "n" || m == "s" || m == "none" || m == "stay") return direction::STAY;
    return nullopt;
}

bool tm_description::has_state(const string &state) const {
    return find_if(states.begin(), states.end(), [&](auto &s) { return s == state; }) != states.end();
}

const transition *tm_description::find(const string &state, char symbol) const {
    auto it = transitions.find({state, symbol});
    return it == transitions.end() ? nullptr : &it->second;
}

bool tm_description::is_accepting(const string &state) const {
    return accept.count(state) > 0;
}

bool tm_description::is_rejecting(const string &state) const {
    return reject.count(state) > 0;
}

}  // namespace grader::tm
