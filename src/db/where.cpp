#include "../../include/db/where.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <cctype>
#include <set>
#include <stdexcept>

namespace primdb {
namespace db {

namespace {

enum class TokenType {
    Name,
    Literal,
    Operator,
    LParen,
    RParen,
    And,
    Or,
    End
};

struct Token {
    TokenType type;
    std::string text;
    DBValue value;
    CompareOp op = CompareOp::Eq;
};

// Reserved words of general-purpose expression languages. None of them has
// a meaning in a where-clause, so they are rejected instead of being read
// as field names.
const std::set<std::string>& forbidden_keywords() {
    static const std::set<std::string> words = {
        "not", "in", "is", "lambda", "if", "else", "for", "while", "import",
        "from", "def", "class", "return", "yield", "await", "async", "global",
        "nonlocal", "del", "pass", "raise", "try", "except", "finally", "with",
        "as", "assert", "break", "continue"
    };
    return words;
}

bool is_ident_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class WhereLexer {
public:
    explicit WhereLexer(const std::string& text) : text_(text) {}

    std::vector<Token> tokenize() {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];

            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                lex_number(false);
            } else if (c == '-' && expects_operand() &&
                       (is_digit(peek(1)) || (peek(1) == '.' && is_digit(peek(2))))) {
                lex_number(true);
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                lex_word();
            } else if (c == '\'' || c == '"') {
                lex_string(c);
            } else {
                lex_symbol(c);
            }
        }
        push(TokenType::End, "end of expression");
        return std::move(tokens_);
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
    std::vector<Token> tokens_;

    char peek(size_t offset) const {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\0';
    }

    bool expects_operand() const {
        if (tokens_.empty()) return true;
        const auto last = tokens_.back().type;
        return last == TokenType::Operator || last == TokenType::LParen ||
               last == TokenType::And || last == TokenType::Or;
    }

    bool follows_operand() const {
        if (tokens_.empty()) return false;
        const auto last = tokens_.back().type;
        return last == TokenType::Name || last == TokenType::Literal || last == TokenType::RParen;
    }

    void push(TokenType type, const std::string& text) {
        Token token;
        token.type = type;
        token.text = text;
        tokens_.push_back(std::move(token));
    }

    void push_operator(CompareOp op, size_t length) {
        Token token;
        token.type = TokenType::Operator;
        token.text = text_.substr(pos_, length);
        token.op = op;
        tokens_.push_back(std::move(token));
        pos_ += length;
    }

    void push_literal(const std::string& text, DBValue value) {
        Token token;
        token.type = TokenType::Literal;
        token.text = text;
        token.value = std::move(value);
        tokens_.push_back(std::move(token));
    }

    void lex_number(bool negative) {
        const size_t start = pos_;
        if (negative) ++pos_;

        bool is_float = false;
        while (is_digit(peek(0))) ++pos_;
        if (peek(0) == '.') {
            is_float = true;
            ++pos_;
            while (is_digit(peek(0))) ++pos_;
        }
        if (peek(0) == 'e' || peek(0) == 'E') {
            is_float = true;
            ++pos_;
            if (peek(0) == '+' || peek(0) == '-') ++pos_;
            if (!is_digit(peek(0))) {
                throw WhereError("Invalid number in where expression: '" +
                                 text_.substr(start, pos_ - start) + "'");
            }
            while (is_digit(peek(0))) ++pos_;
        }
        if (is_ident_char(peek(0))) {
            throw WhereError("Invalid number in where expression: '" +
                             text_.substr(start, pos_ - start + 1) + "'");
        }

        const std::string text = text_.substr(start, pos_ - start);
        try {
            if (is_float) {
                push_literal(text, DBValue{static_cast<DBFloat>(std::stod(text))});
            } else {
                push_literal(text, DBValue{static_cast<DBInt>(std::stoll(text))});
            }
        } catch (const std::out_of_range&) {
            throw WhereError("Number out of range in where expression: '" + text + "'");
        }
    }

    void lex_string(char quote) {
        const size_t start = pos_;
        ++pos_;
        std::string value;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == quote) {
                ++pos_;
                push_literal(text_.substr(start, pos_ - start), DBValue{value});
                return;
            }
            if (c == '\\' && pos_ + 1 < text_.size()) {
                const char next = text_[pos_ + 1];
                switch (next) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case '0': value += '\0'; break;
                    case '\\': value += '\\'; break;
                    case '\'': value += '\''; break;
                    case '"': value += '"'; break;
                    default:
                        value += '\\';
                        value += next;
                        break;
                }
                pos_ += 2;
                continue;
            }
            value += c;
            ++pos_;
        }
        throw WhereError("Unterminated string in where expression");
    }

    void lex_word() {
        const size_t start = pos_;
        while (pos_ < text_.size() && is_ident_char(text_[pos_])) ++pos_;
        const std::string word = text_.substr(start, pos_ - start);
        const std::string lowered = to_lower(word);

        if (lowered == "and") {
            push(TokenType::And, word);
        } else if (lowered == "or") {
            push(TokenType::Or, word);
        } else if (lowered == "true") {
            push_literal(word, DBValue{true});
        } else if (lowered == "false") {
            push_literal(word, DBValue{false});
        } else if (lowered == "null" || lowered == "none") {
            push_literal(word, DBNull{});
        } else if (forbidden_keywords().count(word)) {
            throw WhereError("'" + word + "' is not allowed in where expressions");
        } else {
            push(TokenType::Name, word);
        }
    }

    void lex_symbol(char c) {
        switch (c) {
            case '(':
                if (follows_operand()) {
                    throw WhereError("Function calls are not allowed in where expressions: '" +
                                     tokens_.back().text + "(...)'");
                }
                push(TokenType::LParen, "(");
                ++pos_;
                return;
            case ')':
                push(TokenType::RParen, ")");
                ++pos_;
                return;
            case '=':
                // a lone '=' is read as equality
                push_operator(CompareOp::Eq, peek(1) == '=' ? 2 : 1);
                return;
            case '!':
                if (peek(1) == '=') {
                    push_operator(CompareOp::Ne, 2);
                    return;
                }
                break;
            case '<':
                if (peek(1) == '=') {
                    push_operator(CompareOp::Le, 2);
                } else if (peek(1) == '<' || peek(1) == '>') {
                    break;
                } else {
                    push_operator(CompareOp::Lt, 1);
                }
                return;
            case '>':
                if (peek(1) == '=') {
                    push_operator(CompareOp::Ge, 2);
                } else if (peek(1) == '>') {
                    break;
                } else {
                    push_operator(CompareOp::Gt, 1);
                }
                return;
            case ':':
                throw WhereError("Assignment is not allowed in where expressions");
            case '.':
                throw WhereError("Attribute access is not allowed in where expressions");
            case '[':
            case ']':
                throw WhereError("Subscripting is not allowed in where expressions");
            case ',':
                throw WhereError("Tuples are not allowed in where expressions");
            default:
                break;
        }

        if (std::string("+-*/%&|^~@<>!").find(c) != std::string::npos) {
            throw WhereError("Operator '" + text_.substr(pos_, 1) +
                             "' is not allowed in where expressions (only comparisons and and/or)");
        }
        throw WhereError("Unexpected character in where expression: '" + text_.substr(pos_, 1) + "'");
    }
};

constexpr int kMaxNesting = 100;

class WhereParser {
public:
    explicit WhereParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    WhereNodePtr parse() {
        auto root = parse_or();
        if (current().type != TokenType::End) {
            throw WhereError("Unexpected '" + current().text + "' in where expression");
        }
        return root;
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;

    const Token& current() const { return tokens_[pos_]; }
    void advance() {
        if (pos_ + 1 < tokens_.size()) ++pos_;
    }

    WhereNodePtr parse_or() {
        auto first = parse_and();
        if (current().type != TokenType::Or) return first;

        auto node = std::make_shared<WhereNode>();
        node->kind = WhereNode::Kind::Or;
        node->operands.push_back(first);
        while (current().type == TokenType::Or) {
            advance();
            node->operands.push_back(parse_and());
        }
        return node;
    }

    WhereNodePtr parse_and() {
        auto first = parse_comparison();
        if (current().type != TokenType::And) return first;

        auto node = std::make_shared<WhereNode>();
        node->kind = WhereNode::Kind::And;
        node->operands.push_back(first);
        while (current().type == TokenType::And) {
            advance();
            node->operands.push_back(parse_comparison());
        }
        return node;
    }

    WhereNodePtr parse_comparison() {
        auto first = parse_operand();
        if (current().type != TokenType::Operator) return first;

        auto node = std::make_shared<WhereNode>();
        node->kind = WhereNode::Kind::Compare;
        node->operands.push_back(first);
        while (current().type == TokenType::Operator) {
            node->ops.push_back(current().op);
            advance();
            node->operands.push_back(parse_operand());
        }
        return node;
    }

    WhereNodePtr parse_operand() {
        const Token& token = current();
        switch (token.type) {
            case TokenType::Name: {
                auto node = std::make_shared<WhereNode>();
                node->kind = WhereNode::Kind::Field;
                node->field = token.text;
                advance();
                return node;
            }
            case TokenType::Literal: {
                auto node = std::make_shared<WhereNode>();
                node->kind = WhereNode::Kind::Literal;
                node->literal = token.value;
                advance();
                return node;
            }
            case TokenType::LParen: {
                if (++depth_ > kMaxNesting) {
                    throw WhereError("Expression nested too deeply");
                }
                advance();
                auto inner = parse_or();
                if (current().type != TokenType::RParen) {
                    throw WhereError("Missing ')' in where expression");
                }
                advance();
                --depth_;
                return inner;
            }
            case TokenType::End:
                throw WhereError("Unexpected end of where expression");
            default:
                throw WhereError("Unexpected '" + token.text + "' in where expression");
        }
    }
};

DBValue evaluate(const WhereNode& node, const Record& record) {
    switch (node.kind) {
        case WhereNode::Kind::Literal:
            return node.literal;
        case WhereNode::Kind::Field: {
            auto it = record.find(node.field);
            return it != record.end() ? it->second : DBValue{DBNull{}};
        }
        case WhereNode::Kind::And:
            for (const auto& operand : node.operands) {
                if (!is_truthy(evaluate(*operand, record))) return DBValue{false};
            }
            return DBValue{true};
        case WhereNode::Kind::Or:
            for (const auto& operand : node.operands) {
                if (is_truthy(evaluate(*operand, record))) return DBValue{true};
            }
            return DBValue{false};
        case WhereNode::Kind::Compare: {
            DBValue left = evaluate(*node.operands[0], record);
            for (size_t i = 0; i < node.ops.size(); ++i) {
                DBValue right = evaluate(*node.operands[i + 1], record);
                if (!evaluate_compare(left, node.ops[i], right)) return DBValue{false};
                left = std::move(right);
            }
            return DBValue{true};
        }
    }
    return DBValue{false};
}

std::string render(const WhereNode& node) {
    switch (node.kind) {
        case WhereNode::Kind::Literal:
            return value_to_literal(node.literal);
        case WhereNode::Kind::Field:
            return node.field;
        case WhereNode::Kind::And:
        case WhereNode::Kind::Or: {
            const std::string glue = node.kind == WhereNode::Kind::And ? " and " : " or ";
            std::string out = "(";
            for (size_t i = 0; i < node.operands.size(); ++i) {
                if (i > 0) out += glue;
                out += render(*node.operands[i]);
            }
            return out + ")";
        }
        case WhereNode::Kind::Compare: {
            std::string out = "(" + render(*node.operands[0]);
            for (size_t i = 0; i < node.ops.size(); ++i) {
                out += " " + op_to_string(node.ops[i]) + " " + render(*node.operands[i + 1]);
            }
            return out + ")";
        }
    }
    return "";
}

} // namespace

bool Predicate::matches(const Record& record) const {
    if (!root_) return true;
    return is_truthy(evaluate(*root_, record));
}

std::string Predicate::signature() const {
    return root_ ? render(*root_) : "";
}

Predicate compile_where(const std::string& expression) {
    if (trim(expression).empty()) {
        return Predicate();
    }

    WhereLexer lexer(expression);
    WhereParser parser(lexer.tokenize());
    return Predicate(parser.parse());
}

Predicate make_conjunction(const std::vector<PreparedCondition>& conditions) {
    if (conditions.empty()) {
        return Predicate();
    }

    auto root = std::make_shared<WhereNode>();
    root->kind = WhereNode::Kind::And;
    for (const auto& cond : conditions) {
        auto field = std::make_shared<WhereNode>();
        field->kind = WhereNode::Kind::Field;
        field->field = cond.field;

        auto literal = std::make_shared<WhereNode>();
        literal->kind = WhereNode::Kind::Literal;
        literal->literal = cond.value;

        auto compare = std::make_shared<WhereNode>();
        compare->kind = WhereNode::Kind::Compare;
        compare->operands = {field, literal};
        compare->ops = {cond.op};
        root->operands.push_back(compare);
    }
    return Predicate(root);
}

} // namespace db
} // namespace primdb
