#ifndef TOOLGATE_EXPRESSION_EVAL_HPP
#define TOOLGATE_EXPRESSION_EVAL_HPP

// Arithmetic expression evaluator over a fixed table of numeric functions and constants.
//
// Grammar:
//   expression := term (('+' | '-') term)*
//   term       := unary (('*' | '/' | '//' | '%') unary)*
//   unary      := ('+' | '-') unary | power
//   power      := primary ('**' unary)?
//   primary    := number | name | name '(' [argument (',' argument)*] ')' | '(' expression ')'
//   argument   := expression | '[' [expression (',' expression)*] ']'
//
// Bracketed list arguments are flattened into the argument list, so sum([1, 2, 3])
// and sum(1, 2, 3) are equivalent. There is no other syntax: no strings, no
// attribute access, no assignment, no names outside the table.

#include <cstdint>
#include <string>

namespace expression_eval {

// A numeric value that remembers whether it came from integer arithmetic.
struct Value {
    bool is_integer = true;
    int64_t integer_value = 0;
    double float_value = 0.0;

    static Value from_integer(int64_t number);
    static Value from_float(double number);

    double as_double() const;
    // "int" or "float".
    const char *type_name() const;
};

struct EvaluationResult {
    bool success = false;
    Value value;
    std::string error_message;
};

// Evaluate an expression. Never throws; errors are reported in error_message
// (e.g. "division by zero", "math domain error", "name 'x' is not defined").
EvaluationResult evaluate(const std::string &expression);

} // namespace expression_eval

#endif // TOOLGATE_EXPRESSION_EVAL_HPP
