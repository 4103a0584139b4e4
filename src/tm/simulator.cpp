#include "tm/simulator.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <boost/functional/hash.hpp>
#include <deque>
#include <unordered_set>

namespace grader::tm {
using namespace std;

// clang-format off
static const unordered_map<tm_outcome, const char *> outcome_string = boost::assign::map_list_of
    (tm_outcome::ACCEPT, "accept")
    (tm_outcome::REJECT, "reject")
    (tm_outcome::STEP_LIMIT_EXCEEDED, "step limit exceeded")
    (tm_outcome::CYCLE_DETECTED, "cycle detected");
// clang-format on

const char *get_display_message(tm_outcome outcome) {
    return outcome_string.at(outcome);
}

static uint64_t mix_cell(long pos, char symbol) {
    // splitmix64
    uint64_t z = (uint64_t)pos * 0x9E3779B97F4A7C15ULL + (unsigned char)symbol;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

tape::tape(const string &input, char blank) : blank(blank) {
    for (size_t i = 0; i < input.size(); ++i) {
        pos = (long)i;
        write(input[i]);
    }
    pos = 0;
}

char tape::symbol_at(long p) const {
    auto it = cells.find(p);
    return it == cells.end() ? blank : it->second;
}

char tape::read() const {
    return symbol_at(pos);
}

void tape::write(char symbol) {
    auto it = cells.find(pos);
    if (it != cells.end()) {
        hash -= mix_cell(pos, it->second);
        cells.erase(it);
    }
    if (symbol != blank) {
        cells.emplace(pos, symbol);
        hash += mix_cell(pos, symbol);
    }
}

void tape::move(direction dir) {
    pos += static_cast<long>(dir);
}

long tape::head() const {
    return pos;
}

uint64_t tape::digest() const {
    return hash;
}

string tape::window(size_t radius) const {
    string result;
    long r = (long)radius;
    for (long p = pos - r; p <= pos + r; ++p)
        result += symbol_at(p);
    return result;
}

configuration tape::snapshot(const string &state) const {
    long lo = pos, hi = pos;
    for (auto &[p, symbol] : cells) {
        lo = min(lo, p);
        hi = max(hi, p);
    }
    string left, right;
    for (long p = lo; p < pos; ++p) left += symbol_at(p);
    for (long p = pos; p <= hi; ++p) right += symbol_at(p);
    return make_configuration(std::move(left), state, std::move(right), blank);
}

string tape::read_right(const set<char> &alphabet) const {
    string result;
    for (long p = pos;; ++p) {
        char symbol = symbol_at(p);
        if (!alphabet.count(symbol)) break;
        result += symbol;
    }
    return result;
}

namespace {

/**
 * @brief 格局指纹：状态、读写头位置、纸带哈希以及读写头附近的纸带内容
 */
struct fingerprint {
    const string *state;
    long head;
    uint64_t digest;
    string window;

    bool operator==(const fingerprint &other) const {
        return head == other.head && digest == other.digest &&
               *state == *other.state && window == other.window;
    }
};

struct fingerprint_hash {
    size_t operator()(const fingerprint &fp) const {
        size_t seed = 0;
        boost::hash_combine(seed, *fp.state);
        boost::hash_combine(seed, fp.head);
        boost::hash_combine(seed, fp.digest);
        boost::hash_combine(seed, fp.window);
        return seed;
    }
};

}  // namespace

tm_run simulate(const tm_description &tm, const string &input, const tm_limits &limits, bool record_trace) {
    tape t(input, tm.blank);
    const string *state = &tm.start;
    tm_run run;
    if (record_trace) run.trace.push_back(t.snapshot(*state));

    unordered_set<fingerprint, fingerprint_hash> seen;
    deque<const fingerprint *> history;

    auto finish = [&](tm_outcome outcome) {
        run.outcome = outcome;
        run.final_configuration = t.snapshot(*state);
        run.output = t.read_right(tm.input_alphabet);
        return std::move(run);
    };

    while (true) {
        if (tm.is_accepting(*state)) return finish(tm_outcome::ACCEPT);
        if (tm.is_rejecting(*state)) return finish(tm_outcome::REJECT);

        const transition *next = tm.find(*state, t.read());
        if (!next) return finish(tm_outcome::REJECT);

        if (run.steps >= limits.step_limit) return finish(tm_outcome::STEP_LIMIT_EXCEEDED);

        if (limits.cycle_history > 0) {
            auto [it, inserted] = seen.insert(fingerprint{state, t.head(), t.digest(), t.window(limits.cycle_window)});
            if (!inserted) {
                DLOG(INFO) << "Configuration " << t.snapshot(*state).to_string() << " repeated after " << run.steps << " steps";
                return finish(tm_outcome::CYCLE_DETECTED);
            }
            history.push_back(&*it);
            if (history.size() > limits.cycle_history) {
                seen.erase(seen.find(*history.front()));
                history.pop_front();
            }
        }

        t.write(next->write);
        t.move(next->dir);
        state = &next->next_state;
        ++run.steps;
        if (record_trace) run.trace.push_back(t.snapshot(*state));
    }
}

}  // namespace grader::tm
