#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "condition.h"
#include "value.h"

namespace primdb {
namespace db {

// Node of a compiled where expression. These five kinds are the whole
// grammar: the compiler has no way to build anything else.
struct WhereNode {
    enum class Kind {
        And,
        Or,
        Compare,
        Field,
        Literal
    };

    Kind kind;
    // And/Or: the connected operands. Compare: the chained operands.
    std::vector<std::shared_ptr<const WhereNode>> operands;
    // Compare only: ops[i] sits between operands[i] and operands[i + 1]
    std::vector<CompareOp> ops;
    std::string field;
    DBValue literal;
};

using WhereNodePtr = std::shared_ptr<const WhereNode>;

// Compiled filter applied to one record at a time. A default-constructed
// predicate has no tree and matches everything.
class Predicate {
public:
    Predicate() = default;
    explicit Predicate(WhereNodePtr root) : root_(std::move(root)) {}

    bool empty() const { return root_ == nullptr; }
    bool matches(const Record& record) const;

    // Canonical text of the tree, used as the select cache key
    std::string signature() const;

    const WhereNode* root() const { return root_.get(); }

private:
    WhereNodePtr root_;
};

// Free-form boolean expression text, compiled by compile_where()
struct Expression {
    std::string text;
};

// Where-clause as handed over by the command parser: none, an AND-only
// condition list, or an expression.
using WhereClause = std::variant<std::monostate, Conjunction, Expression>;

// Comparison whose value has already been coerced against the schema
struct PreparedCondition {
    std::string field;
    CompareOp op;
    DBValue value;
};

// Compile an and/or/comparison expression over field names and literals.
// Throws WhereError for syntax errors and for any construct outside the
// allow-list (calls, attribute access, subscripts, arithmetic, assignment,
// other keywords). Blank text yields an empty predicate.
Predicate compile_where(const std::string& expression);

// AND of prepared conditions, evaluated left to right
Predicate make_conjunction(const std::vector<PreparedCondition>& conditions);

} // namespace db
} // namespace primdb
