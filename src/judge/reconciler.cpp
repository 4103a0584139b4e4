#include "judge/reconciler.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <optional>
#include <variant>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "judge/diff.hpp"
#include "tm/configuration.hpp"

namespace grader {
using namespace std;

output_schema output_schema::tokens() {
    output_schema schema;
    schema.fields = {field_kind::TOKEN};
    schema.variadic = true;
    return schema;
}

output_schema output_schema::configurations(set<char> tape_alphabet, char blank) {
    output_schema schema;
    schema.fields = {field_kind::CONFIGURATION};
    schema.tape_alphabet = move(tape_alphabet);
    schema.blank = blank;
    return schema;
}

vector<string> normalize_lines(const string &text) {
    vector<string> result;
    for (auto &line : split_lines(text)) {
        vector<string> words;
        string trimmed = boost::trim_copy(line);
        if (trimmed.empty()) continue;
        boost::split(words, trimmed, boost::is_space(), boost::token_compress_on);
        result.push_back(boost::join(words, " "));
    }
    return result;
}

namespace {

using value = variant<string, long long, double, tm::configuration>;
using parsed_output = vector<vector<value>>;

template <typename T>
optional<value> parse_number(const string &token) {
    try {
        return value(boost::lexical_cast<T>(token));
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
}

optional<value> parse_field(const output_schema &schema, field_kind kind, const string &token, bool strict) {
    switch (kind) {
        case field_kind::TOKEN:
            return value(token);
        case field_kind::INTEGER:
            return parse_number<long long>(token);
        case field_kind::NUMBER:
            return parse_number<double>(token);
        case field_kind::CONFIGURATION: {
            auto config = strict ? tm::parse_configuration(token, schema.blank)
                                 : tm::parse_configuration_lenient(token, schema.tape_alphabet, schema.blank);
            if (!config) return nullopt;
            return value(*config);
        }
    }
    return nullopt;
}

optional<parsed_output> parse_output(const output_schema &schema, const string &text, bool strict) {
    if (schema.fields.empty()) throw internal_error("output schema has no fields");
    bool whole_line = schema.fields.size() == 1 && schema.fields[0] == field_kind::CONFIGURATION;

    vector<string> lines;
    if (strict) {
        lines = split_lines(text);
    } else if (whole_line) {
        // 格局的宽松解析本身会忽略空白，这里只去掉空行
        for (auto &line : split_lines(text))
            if (!boost::trim_copy(line).empty()) lines.push_back(line);
    } else {
        lines = normalize_lines(text);
    }

    parsed_output result;
    for (auto &line : lines) {
        vector<string> tokens;
        if (whole_line) {
            tokens.push_back(line);
        } else {
            boost::split(tokens, line, boost::is_any_of(" "));
            // 严格模式下多余的空格会产生空字段
            for (auto &token : tokens)
                if (token.empty()) return nullopt;
        }

        if (schema.variadic ? tokens.size() < schema.fields.size() : tokens.size() != schema.fields.size())
            return nullopt;

        vector<value> fields;
        for (size_t i = 0; i < tokens.size(); ++i) {
            field_kind kind = schema.fields[min(i, schema.fields.size() - 1)];
            auto field = parse_field(schema, kind, tokens[i], strict);
            if (!field) return nullopt;
            fields.push_back(move(*field));
        }
        result.push_back(move(fields));
    }
    return result;
}

}  // namespace

reconcile_result reconcile(const output_schema &schema, const string &expected, const string &actual) {
    auto answer = parse_output(schema, expected, false);
    if (!answer) throw internal_error("expected answer does not match its output schema: " + expected);

    auto strict = parse_output(schema, actual, true);
    if (strict && *strict == *answer) return {reconcile_status::PASS, false, "", ""};

    auto lenient = parse_output(schema, actual, false);
    if (lenient && *lenient == *answer) return {reconcile_status::PASS, true, "", ""};

    string diff = line_diff(normalize_lines(expected), normalize_lines(actual));
    if (!lenient) return {reconcile_status::UNPARSEABLE, true, diff, actual};
    return {reconcile_status::FORMAT_MISMATCH, true, diff, ""};
}

}  // namespace grader
