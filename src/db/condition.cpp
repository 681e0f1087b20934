#include "../../include/db/condition.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <cctype>

namespace primdb {
namespace db {

std::string op_to_string(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "=";
        case CompareOp::Ne: return "!=";
        case CompareOp::Gt: return ">";
        case CompareOp::Lt: return "<";
        case CompareOp::Ge: return ">=";
        case CompareOp::Le: return "<=";
        default: return "?";
    }
}

std::optional<CompareOp> op_from_string(const std::string& text) {
    if (text == "=" || text == "==") return CompareOp::Eq;
    if (text == "!=") return CompareOp::Ne;
    if (text == ">") return CompareOp::Gt;
    if (text == "<") return CompareOp::Lt;
    if (text == ">=") return CompareOp::Ge;
    if (text == "<=") return CompareOp::Le;
    return std::nullopt;
}

bool evaluate_compare(const DBValue& left, CompareOp op, const DBValue& right) {
    switch (op) {
        case CompareOp::Eq: return values_equal(left, right);
        case CompareOp::Ne: return !values_equal(left, right);
        default: break;
    }

    auto order = compare_values(left, right);
    if (!order) return false;

    switch (op) {
        case CompareOp::Gt: return *order > 0;
        case CompareOp::Lt: return *order < 0;
        case CompareOp::Ge: return *order >= 0;
        case CompareOp::Le: return *order <= 0;
        default:
            throw ValidationError("Unsupported operator: " + op_to_string(op));
    }
}

std::vector<std::string> split_respecting_quotes(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current_token;
    bool in_quotes = false;
    char quote_char = '\0';

    for (char c : text) {
        if (in_quotes) {
            current_token += c;
            if (c == quote_char) {
                in_quotes = false;
            }
        } else if (c == '\'' || c == '"') {
            in_quotes = true;
            quote_char = c;
            current_token += c;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current_token.empty()) {
                tokens.push_back(current_token);
                current_token.clear();
            }
        } else {
            current_token += c;
        }
    }

    if (in_quotes) {
        throw ParseError("Unterminated quote in: " + text);
    }
    if (!current_token.empty()) {
        tokens.push_back(current_token);
    }
    return tokens;
}

Condition parse_comparison(const std::string& phrase) {
    const std::string expr = trim(phrase);

    for (size_t i = 0; i < expr.size(); ++i) {
        const char c = expr[i];
        if (c == '\'' || c == '"') {
            break; // operator must precede any quoted value
        }

        std::string op_text;
        if ((c == '>' || c == '<' || c == '!') && i + 1 < expr.size() && expr[i + 1] == '=') {
            op_text = expr.substr(i, 2);
        } else if (c == '=' || c == '>' || c == '<') {
            op_text = std::string(1, c);
        } else {
            continue;
        }

        Condition cond;
        cond.field = trim(expr.substr(0, i));
        cond.op = *op_from_string(op_text);
        cond.raw_value = trim(expr.substr(i + op_text.size()));

        if (!is_identifier(cond.field)) {
            throw ParseError("Invalid field name in condition: '" + expr + "'");
        }
        if (cond.raw_value.empty()) {
            throw ParseError("Empty value in condition: '" + expr + "'");
        }
        return cond;
    }

    throw ParseError("Cannot parse condition: '" + expr + "'");
}

Conjunction parse_conjunction(const std::string& where_text) {
    Conjunction conditions;
    const auto tokens = split_respecting_quotes(where_text);
    if (tokens.empty()) {
        return conditions;
    }

    std::string phrase;
    for (const auto& token : tokens) {
        const std::string keyword = to_lower(token);
        if (keyword == "and") {
            if (phrase.empty()) {
                throw ParseError("Invalid where clause: empty part before AND");
            }
            conditions.push_back(parse_comparison(phrase));
            phrase.clear();
        } else if (keyword == "or") {
            throw ParseError("OR is not supported in conditions (use AND)");
        } else {
            if (!phrase.empty()) phrase += ' ';
            phrase += token;
        }
    }

    if (phrase.empty()) {
        throw ParseError("Invalid where clause: empty part after AND");
    }
    conditions.push_back(parse_comparison(phrase));
    return conditions;
}

} // namespace db
} // namespace primdb
