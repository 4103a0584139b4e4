#include "tm/parser.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <unordered_map>
#include "common/stl_utils.hpp"

namespace grader::tm {
using namespace std;

// clang-format off
static const unordered_map<tm_error_kind, const char *> error_string = boost::assign::map_list_of
    (tm_error_kind::PARSE_ERROR, "Parse Error")
    (tm_error_kind::AMBIGUOUS_TRANSITION, "Ambiguous Transition")
    (tm_error_kind::UNDECLARED_SYMBOL, "Undeclared Symbol");
// clang-format on

const char *get_display_message(tm_error_kind kind) {
    return error_string.at(kind);
}

string tm_parse_error::to_string() const {
    if (line == 0) return fmt::format("{}: {}", get_display_message(kind), message);
    return fmt::format("{} at line {}: {}", get_display_message(kind), line, message);
}

namespace {

struct rule {
    size_t line;
    string state;
    char symbol;
    transition target;
};

/**
 * @brief 语法分析阶段的结果，还没有经过确定性和引用完整性的检查
 */
struct draft {
    vector<string> states;
    set<char> input, tape;
    size_t input_line = 0;
    char blank = 'B';
    optional<string> start;
    size_t start_line = 0;
    vector<string> accept, reject;
    size_t accept_line = 0, reject_line = 0;
    vector<rule> rules;
};

tm_parse_error make_error(tm_error_kind kind, size_t line, string message, string state = "", optional<char> symbol = nullopt) {
    return tm_parse_error{kind, line, move(message), move(state), symbol};
}

bool is_comment(const string &line) {
    return boost::starts_with(line, "#") || boost::starts_with(line, "//");
}

vector<string> split_list(const string &value) {
    vector<string> tokens;
    boost::split(tokens, value, boost::is_any_of(", \t"), boost::token_compress_on);
    tokens.erase(remove_if(tokens.begin(), tokens.end(), [](auto &t) { return t.empty(); }), tokens.end());
    return tokens;
}

optional<set<char>> parse_alphabet(const string &value) {
    vector<string> tokens = split_list(value);
    set<char> alphabet;
    if (tokens.size() == 1) {
        // 紧凑写法，比如 "input: 01#"
        alphabet.insert(tokens[0].begin(), tokens[0].end());
        return alphabet;
    }
    for (auto &token : tokens) {
        if (token.size() != 1) return nullopt;
        alphabet.insert(token[0]);
    }
    return alphabet;
}

string normalize_key(string key) {
    key = to_lower(boost::trim_copy(key));
    key.erase(remove_if(key.begin(), key.end(), [](char c) { return c == ' ' || c == '_'; }), key.end());
    if (key == "inputalphabet") return "input";
    if (key == "tapealphabet") return "tape";
    if (key == "accepting" || key == "acceptstates") return "accept";
    if (key == "rejecting" || key == "rejectstates") return "reject";
    if (key == "startstate" || key == "initial") return "start";
    return key;
}

optional<tm_parse_error> parse_rule(const string &line, size_t line_no, draft &d) {
    size_t arrow = line.find("->");
    auto side = [&](string text) {
        boost::trim(text);
        if (boost::starts_with(text, "(") && boost::ends_with(text, ")"))
            text = text.substr(1, text.size() - 2);
        vector<string> parts;
        boost::split(parts, text, boost::is_any_of(","));
        for (auto &part : parts) boost::trim(part);
        return parts;
    };
    vector<string> lhs = side(line.substr(0, arrow)), rhs = side(line.substr(arrow + 2));
    auto malformed = [&](const string &reason) {
        return make_error(tm_error_kind::PARSE_ERROR, line_no, fmt::format("malformed transition rule '{}': {}", line, reason));
    };

    if (lhs.size() != 2) return malformed("expected 'state,symbol' before '->'");
    if (rhs.size() != 3) return malformed("expected 'state,symbol,move' after '->'");
    for (auto *state : {&lhs[0], &rhs[0]})
        if (state->empty() || state->find_first_of(" \t") != string::npos)
            return malformed(fmt::format("invalid state name '{}'", *state));
    for (auto *symbol : {&lhs[1], &rhs[1]})
        if (symbol->size() != 1)
            return malformed(fmt::format("tape symbol '{}' must be a single character", *symbol));
    auto dir = parse_move(rhs[2]);
    if (!dir) return malformed(fmt::format("unknown head move '{}'", rhs[2]));

    d.rules.push_back({line_no, lhs[0], lhs[1][0], transition{rhs[0], rhs[1][0], *dir, line_no}});
    return nullopt;
}

optional<tm_parse_error> parse_sectioned(const vector<string> &lines, draft &d) {
    set<string> seen_sections;
    for (size_t i = 0; i < lines.size(); ++i) {
        size_t line_no = i + 1;
        string line = boost::trim_copy(lines[i]);
        if (line.empty() || is_comment(line)) continue;

        if (line.find("->") != string::npos) {
            if (auto err = parse_rule(line, line_no, d)) return err;
            continue;
        }

        size_t colon = line.find(':');
        if (colon == string::npos)
            return make_error(tm_error_kind::PARSE_ERROR, line_no,
                              fmt::format("expected a 'section: value' declaration or a transition rule, found '{}'", line));

        string key = normalize_key(line.substr(0, colon));
        string value = boost::trim_copy(line.substr(colon + 1));
        if (!seen_sections.insert(key).second)
            return make_error(tm_error_kind::PARSE_ERROR, line_no, fmt::format("section '{}' is declared twice", key));

        if (key == "states") {
            d.states = split_list(value);
            if (d.states.empty())
                return make_error(tm_error_kind::PARSE_ERROR, line_no, "state list is empty");
        } else if (key == "input" || key == "tape") {
            auto alphabet = parse_alphabet(value);
            if (!alphabet)
                return make_error(tm_error_kind::PARSE_ERROR, line_no,
                                  fmt::format("{} alphabet must consist of single characters", key));
            if (key == "input") {
                d.input = *alphabet;
                d.input_line = line_no;
            } else {
                d.tape = *alphabet;
            }
        } else if (key == "blank") {
            if (value.size() != 1)
                return make_error(tm_error_kind::PARSE_ERROR, line_no, "blank symbol must be a single character");
            d.blank = value[0];
        } else if (key == "start") {
            vector<string> tokens = split_list(value);
            if (tokens.size() != 1)
                return make_error(tm_error_kind::PARSE_ERROR, line_no, "exactly one start state must be given");
            d.start = tokens[0];
            d.start_line = line_no;
        } else if (key == "accept") {
            d.accept = split_list(value);
            d.accept_line = line_no;
        } else if (key == "reject") {
            d.reject = split_list(value);
            d.reject_line = line_no;
        } else {
            return make_error(tm_error_kind::PARSE_ERROR, line_no, fmt::format("unknown section '{}'", key));
        }
    }
    return nullopt;
}

optional<tm_parse_error> parse_legacy(const vector<string> &lines, size_t first, draft &d) {
    vector<pair<size_t, string>> header;
    size_t i = first;
    for (; i < lines.size() && header.size() < 5; ++i) {
        string line = boost::trim_copy(lines[i]);
        if (!line.empty()) header.emplace_back(i + 1, line);
    }
    if (header.size() < 5)
        return make_error(tm_error_kind::PARSE_ERROR, lines.size(),
                          "incomplete header: expected number of states, input alphabet, tape alphabet, start state and final state");

    auto chars_of = [](const string &line) {
        set<char> alphabet;
        for (char c : line)
            if (!isspace((unsigned char)c)) alphabet.insert(c);
        return alphabet;
    };

    if (header[0].second.size() > 6)
        return make_error(tm_error_kind::PARSE_ERROR, header[0].first, "too many states");
    int num_states = stoi(header[0].second);
    for (int state = 0; state <= num_states; ++state)
        d.states.push_back(std::to_string(state));
    d.input = chars_of(header[1].second);
    d.input_line = header[1].first;
    d.tape = chars_of(header[2].second);
    for (size_t k : {3, 4})
        if (!is_integer(header[k].second))
            return make_error(tm_error_kind::PARSE_ERROR, header[k].first,
                              fmt::format("state '{}' must be a number", header[k].second));
    d.start = header[3].second;
    d.start_line = header[3].first;
    d.accept = {header[4].second};
    d.accept_line = header[4].first;

    for (; i < lines.size(); ++i) {
        size_t line_no = i + 1;
        string line = boost::trim_copy(lines[i]);
        if (line.empty() || line[0] == '#' || line[0] == '/') continue;

        vector<string> tokens = split_list(line);
        if (tokens.size() < 5)
            return make_error(tm_error_kind::PARSE_ERROR, line_no,
                              fmt::format("malformed transition rule '{}': expected 'state symbol state symbol move'", line));
        for (size_t k : {0, 2})
            if (!is_integer(tokens[k]))
                return make_error(tm_error_kind::PARSE_ERROR, line_no, fmt::format("state '{}' must be a number", tokens[k]));
        for (size_t k : {1, 3})
            if (tokens[k].size() != 1)
                return make_error(tm_error_kind::PARSE_ERROR, line_no,
                                  fmt::format("tape symbol '{}' must be a single character", tokens[k]));
        auto dir = parse_move(tokens[4]);
        if (!dir)
            return make_error(tm_error_kind::PARSE_ERROR, line_no, fmt::format("unknown head move '{}'", tokens[4]));
        d.rules.push_back({line_no, tokens[0], tokens[1][0], transition{tokens[2], tokens[3][0], *dir, line_no}});
    }
    return nullopt;
}

}  // namespace

tm_parse_result parse_tm(string_view text) {
    vector<string> lines = split_lines(text);
    draft d;

    size_t first = 0;
    while (first < lines.size()) {
        string line = boost::trim_copy(lines[first]);
        if (!line.empty() && !is_comment(line)) break;
        ++first;
    }

    optional<tm_parse_error> err;
    if (first < lines.size() && is_integer(boost::trim_copy(lines[first])))
        err = parse_legacy(lines, first, d);
    else
        err = parse_sectioned(lines, d);
    if (err) return *err;

    if (d.input.count(d.blank))
        return make_error(tm_error_kind::PARSE_ERROR, d.input_line,
                          fmt::format("blank symbol '{}' must not be part of the input alphabet", d.blank), "", d.blank);
    d.tape.insert(d.input.begin(), d.input.end());
    d.tape.insert(d.blank);

    // 确定性：每个 (状态, 符号) 最多一条规则
    map<pair<string, char>, size_t> first_rule;
    for (auto &r : d.rules) {
        auto [it, inserted] = first_rule.emplace(make_pair(r.state, r.symbol), r.line);
        if (!inserted)
            return make_error(tm_error_kind::AMBIGUOUS_TRANSITION, r.line,
                              fmt::format("state {} has more than one transition on symbol '{}' (lines {} and {})",
                                          r.state, r.symbol, it->second, r.line),
                              r.state, r.symbol);
    }

    // 引用完整性
    set<string> states(d.states.begin(), d.states.end());
    auto undeclared_state = [](size_t line, const string &state) {
        return make_error(tm_error_kind::UNDECLARED_SYMBOL, line, fmt::format("state {} is not declared", state), state);
    };
    auto undeclared_symbol = [](size_t line, const string &state, char symbol) {
        return make_error(tm_error_kind::UNDECLARED_SYMBOL, line,
                          fmt::format("symbol '{}' is not part of the tape alphabet", symbol), state, symbol);
    };
    for (auto &r : d.rules) {
        if (!states.count(r.state)) return undeclared_state(r.line, r.state);
        if (!d.tape.count(r.symbol)) return undeclared_symbol(r.line, r.state, r.symbol);
        if (!states.count(r.target.next_state)) return undeclared_state(r.line, r.target.next_state);
        if (!d.tape.count(r.target.write)) return undeclared_symbol(r.line, r.state, r.target.write);
    }
    if (d.start && !states.count(*d.start)) return undeclared_state(d.start_line, *d.start);
    for (auto &state : d.accept)
        if (!states.count(state)) return undeclared_state(d.accept_line, state);
    for (auto &state : d.reject)
        if (!states.count(state)) return undeclared_state(d.reject_line, state);

    if (!d.start)
        return make_error(tm_error_kind::PARSE_ERROR, 0, "missing start state declaration");

    tm_description tm;
    for (auto &state : d.states)
        if (!tm.has_state(state)) tm.states.push_back(state);
    tm.input_alphabet = move(d.input);
    tm.tape_alphabet = move(d.tape);
    tm.blank = d.blank;
    tm.start = *d.start;
    tm.accept.insert(d.accept.begin(), d.accept.end());
    tm.reject.insert(d.reject.begin(), d.reject.end());
    for (auto &r : d.rules)
        tm.transitions.emplace(make_pair(r.state, r.symbol), r.target);
    return tm;
}

}  // namespace grader::tm
