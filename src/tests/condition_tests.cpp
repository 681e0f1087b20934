#include <cassert>
#include <iostream>
#include <string>

#include "../../include/db/condition.h"
#include "../../include/db/errors.h"
#include "test_util.h"

using namespace primdb::db;
using primdb::testing::throws;

int main() {
    // 1) single comparisons, with and without spaces
    {
        Condition c = parse_comparison("age>=30");
        assert(c.field == "age" && c.op == CompareOp::Ge && c.raw_value == "30");

        c = parse_comparison("  age  <  18 ");
        assert(c.field == "age" && c.op == CompareOp::Lt && c.raw_value == "18");

        c = parse_comparison("name!=\"Bob\"");
        assert(c.op == CompareOp::Ne && c.raw_value == "\"Bob\"");

        c = parse_comparison("x==1");
        assert(c.op == CompareOp::Eq && c.raw_value == "=1");
    }

    // 2) longest match at the first operator character
    {
        assert(parse_comparison("a>=1").op == CompareOp::Ge);
        assert(parse_comparison("a<=1").op == CompareOp::Le);
        assert(parse_comparison("a>1").op == CompareOp::Gt);
        assert(parse_comparison("a>=1").raw_value == "1");

        // operator characters inside the quoted value are not operators
        Condition c = parse_comparison("title=\"a>=b\"");
        assert(c.op == CompareOp::Eq && c.raw_value == "\"a>=b\"");
    }

    // 3) malformed comparisons
    {
        assert(throws<ParseError>([] { parse_comparison("=5"); }));
        assert(throws<ParseError>([] { parse_comparison("age>"); }));
        assert(throws<ParseError>([] { parse_comparison("age"); }));
        assert(throws<ParseError>([] { parse_comparison("1age=5"); }));
        assert(throws<ParseError>([] { parse_comparison("\"age\"=5"); }));
    }

    // 4) AND splitting, any case, quotes respected
    {
        Conjunction all = parse_conjunction("age>=30 and is_active=true");
        assert(all.size() == 2);
        assert(all[0].field == "age" && all[1].field == "is_active");

        all = parse_conjunction("a=1 AND b=2 And c = 3");
        assert(all.size() == 3 && all[2].raw_value == "3");

        all = parse_conjunction("name=\"Tom and Jerry\"");
        assert(all.size() == 1 && all[0].raw_value == "\"Tom and Jerry\"");

        assert(parse_conjunction("   ").empty());
    }

    // 5) OR and dangling AND are rejected
    {
        assert(throws<ParseError>([] { parse_conjunction("a=1 or b=2"); }));
        assert(throws<ParseError>([] { parse_conjunction("a=1 OR b=2"); }));
        assert(throws<ParseError>([] { parse_conjunction("and a=1"); }));
        assert(throws<ParseError>([] { parse_conjunction("a=1 and"); }));
        assert(throws<ParseError>([] { parse_conjunction("a=1 and and b=2"); }));
        assert(throws<ParseError>([] { parse_conjunction("name=\"open"); }));
    }

    // 6) comparison semantics
    {
        const DBValue null{DBNull{}};
        assert(!evaluate_compare(null, CompareOp::Gt, DBValue{DBInt{1}}));
        assert(!evaluate_compare(null, CompareOp::Le, DBValue{DBInt{1}}));
        assert(!evaluate_compare(DBValue{DBInt{1}}, CompareOp::Ge, null));
        assert(evaluate_compare(null, CompareOp::Eq, null));
        assert(evaluate_compare(null, CompareOp::Ne, DBValue{DBInt{0}}));

        assert(evaluate_compare(DBValue{DBInt{1}}, CompareOp::Eq, DBValue{DBFloat{1.0}}));
        assert(evaluate_compare(DBValue{DBInt{2}}, CompareOp::Gt, DBValue{DBFloat{1.5}}));
        assert(evaluate_compare(DBValue{DBText{"a"}}, CompareOp::Lt, DBValue{DBText{"b"}}));
        assert(!evaluate_compare(DBValue{DBText{"a"}}, CompareOp::Gt, DBValue{DBInt{1}}));
        assert(evaluate_compare(DBValue{DBText{"a"}}, CompareOp::Ne, DBValue{DBInt{1}}));
        assert(!evaluate_compare(DBValue{DBBool{true}}, CompareOp::Eq, DBValue{DBInt{1}}));
    }

    // 7) operator names
    {
        assert(op_to_string(CompareOp::Ge) == ">=");
        assert(*op_from_string("==") == CompareOp::Eq);
        assert(!op_from_string("=>"));
    }

    std::cout << "All condition tests passed.\n";
    return 0;
}
