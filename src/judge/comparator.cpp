#include "codejudge/judge/comparator.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace codejudge {
using namespace std;

static const regex integer_pattern("[+-]?[0-9]+");
static const regex decimal_pattern("[+-]?(([0-9]+\\.?[0-9]*|\\.[0-9]+)([eE][+-]?[0-9]+)?|inf|infinity|nan)", regex::icase);

static bool is_separator(char c) {
    return c == ',' || isspace((unsigned char)c);
}

static output_token classify(const string &text) {
    if (regex_match(text, integer_pattern))
        return {output_token::INTEGER, text};
    if (regex_match(text, decimal_pattern))
        return {output_token::DECIMAL, text};
    if (boost::algorithm::iequals(text, "true") || boost::algorithm::iequals(text, "false"))
        return {output_token::BOOLEAN, text};
    return {output_token::TEXT, text};
}

bool tokenize_output(const string &output, vector<output_token> &tokens) {
    tokens.clear();
    string body = boost::algorithm::trim_copy(output);
    bool open = !body.empty() && body.front() == '[';
    bool close = !body.empty() && body.back() == ']';
    if (open != close) return false;
    if (open) {
        if (body.size() < 2) return false;
        body = body.substr(1, body.size() - 2);
    }

    size_t pos = 0;
    bool after_comma = false;
    while (true) {
        while (pos < body.size() && isspace((unsigned char)body[pos])) ++pos;
        if (pos == body.size()) break;

        char c = body[pos];
        if (c == ',') {
            // 开头的逗号和连续的逗号意味着空元素
            if (tokens.empty() || after_comma) return false;
            after_comma = true;
            ++pos;
            continue;
        }
        if (c == '[' || c == ']') return false;

        if (c == '"' || c == '\'') {
            size_t end = body.find(c, pos + 1);
            if (end == string::npos) return false;
            tokens.push_back({output_token::TEXT, body.substr(pos + 1, end - pos - 1)});
            pos = end + 1;
            if (pos < body.size() && !is_separator(body[pos])) return false;
        } else {
            size_t end = pos;
            while (end < body.size() && !is_separator(body[end])) {
                if (body[end] == '[' || body[end] == ']') return false;
                ++end;
            }
            tokens.push_back(classify(body.substr(pos, end - pos)));
            pos = end;
        }
        after_comma = false;
    }
    return true;
}

// 去掉正号和前导零，"-0" 视为 "0"
static string normalize_integer(const string &text) {
    bool negative = text[0] == '-';
    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    size_t nonzero = text.find_first_not_of('0', start);
    if (nonzero == string::npos) return "0";
    return (negative ? "-" : "") + text.substr(nonzero);
}

static bool equal_decimal(const string &a, const string &b, double tolerance) {
    double x = strtod(a.c_str(), nullptr);
    double y = strtod(b.c_str(), nullptr);
    if (isnan(x) || isnan(y)) return isnan(x) && isnan(y);
    if (isinf(x) || isinf(y)) return x == y;
    return fabs(x - y) <= tolerance * max({1.0, fabs(x), fabs(y)});
}

static bool is_boolean_integer(const output_token &token) {
    if (token.kind != output_token::INTEGER) return false;
    string normalized = normalize_integer(token.text);
    return normalized == "0" || normalized == "1";
}

static bool boolean_value(const output_token &token) {
    if (token.kind == output_token::BOOLEAN)
        return boost::algorithm::iequals(token.text, "true");
    return normalize_integer(token.text) == "1";
}

static bool equal_token(const output_token &a, const output_token &b, const comparator_options &options) {
    if (a.kind == output_token::TEXT || b.kind == output_token::TEXT)
        return a.text == b.text;

    bool a_numeric = a.kind == output_token::INTEGER || a.kind == output_token::DECIMAL;
    bool b_numeric = b.kind == output_token::INTEGER || b.kind == output_token::DECIMAL;

    if (a.kind == output_token::INTEGER && b.kind == output_token::INTEGER)
        return normalize_integer(a.text) == normalize_integer(b.text);
    if (a_numeric && b_numeric)
        return equal_decimal(a.text, b.text, options.float_tolerance);

    // 至少一边是布尔值
    if (a.kind == output_token::BOOLEAN && b.kind == output_token::BOOLEAN)
        return boolean_value(a) == boolean_value(b);
    if (options.boolean_result && (is_boolean_integer(a) || is_boolean_integer(b)))
        return boolean_value(a) == boolean_value(b);
    return false;
}

bool equivalent(const string &actual, const string &expected, const comparator_options &options) {
    string a = boost::algorithm::trim_right_copy(actual);
    string b = boost::algorithm::trim_right_copy(expected);
    if (a == b) return true;

    vector<output_token> actual_tokens, expected_tokens;
    if (!tokenize_output(a, actual_tokens) || !tokenize_output(b, expected_tokens))
        return false;

    if (actual_tokens.size() != expected_tokens.size()) return false;
    for (size_t i = 0; i < actual_tokens.size(); ++i)
        if (!equal_token(actual_tokens[i], expected_tokens[i], options))
            return false;
    return true;
}

}  // namespace codejudge
