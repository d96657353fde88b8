#include "utils/expression_eval.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

namespace expression_eval {

Value Value::from_integer(int64_t number) {
    Value value;
    value.is_integer = true;
    value.integer_value = number;
    value.float_value = static_cast<double>(number);
    return value;
}

Value Value::from_float(double number) {
    Value value;
    value.is_integer = false;
    value.integer_value = 0;
    value.float_value = number;
    return value;
}

double Value::as_double() const {
    return is_integer ? static_cast<double>(integer_value) : float_value;
}

const char *Value::type_name() const {
    return is_integer ? "int" : "float";
}

namespace {

class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string &message) : std::runtime_error(message) {}
};

// Bounds recursion for inputs such as "((((...))))" or "------1".
constexpr int kMaximumNestingDepth = 100;

enum class TokenKind { kNumber, kName, kOperator, kEnd };

struct Token {
    TokenKind kind;
    std::string text;
};

bool is_name_start(unsigned char character) {
    return std::isalpha(character) || character == '_';
}

bool is_name_part(unsigned char character) {
    return std::isalnum(character) || character == '_';
}

std::vector<Token> tokenize(const std::string &expression) {
    std::vector<Token> tokens;
    const size_t length = expression.size();
    size_t index = 0;

    while (index < length) {
        unsigned char character = static_cast<unsigned char>(expression[index]);

        if (std::isspace(character)) {
            ++index;
            continue;
        }

        bool starts_fraction = (character == '.' && index + 1 < length &&
                                std::isdigit(static_cast<unsigned char>(expression[index + 1])));
        if (std::isdigit(character) || starts_fraction) {
            size_t start = index;
            while (index < length && std::isdigit(static_cast<unsigned char>(expression[index]))) {
                ++index;
            }
            if (index < length && expression[index] == '.') {
                ++index;
                while (index < length && std::isdigit(static_cast<unsigned char>(expression[index]))) {
                    ++index;
                }
            }
            if (index < length && (expression[index] == 'e' || expression[index] == 'E')) {
                ++index;
                if (index < length && (expression[index] == '+' || expression[index] == '-')) {
                    ++index;
                }
                if (index >= length || !std::isdigit(static_cast<unsigned char>(expression[index]))) {
                    throw EvaluationError("invalid syntax");
                }
                while (index < length && std::isdigit(static_cast<unsigned char>(expression[index]))) {
                    ++index;
                }
            }
            // "2x", "1.2.3" and similar run-ons are malformed.
            if (index < length && (is_name_part(static_cast<unsigned char>(expression[index])) ||
                                   expression[index] == '.')) {
                throw EvaluationError("invalid syntax");
            }
            tokens.push_back({TokenKind::kNumber, expression.substr(start, index - start)});
            continue;
        }

        if (is_name_start(character)) {
            size_t start = index;
            while (index < length && is_name_part(static_cast<unsigned char>(expression[index]))) {
                ++index;
            }
            tokens.push_back({TokenKind::kName, expression.substr(start, index - start)});
            continue;
        }

        if (index + 1 < length) {
            std::string pair = expression.substr(index, 2);
            if (pair == "**" || pair == "//") {
                tokens.push_back({TokenKind::kOperator, pair});
                index += 2;
                continue;
            }
        }

        switch (character) {
        case '+':
        case '-':
        case '*':
        case '/':
        case '%':
        case '(':
        case ')':
        case ',':
        case '[':
        case ']':
            tokens.push_back({TokenKind::kOperator, std::string(1, static_cast<char>(character))});
            ++index;
            break;
        default:
            throw EvaluationError("invalid syntax");
        }
    }

    tokens.push_back({TokenKind::kEnd, ""});
    return tokens;
}

// --- Arithmetic with integer preservation ---

Value to_integer(double number) {
    if (std::isnan(number)) {
        throw EvaluationError("cannot convert float NaN to integer");
    }
    if (std::isinf(number)) {
        throw EvaluationError("cannot convert float infinity to integer");
    }
    if (number >= 9.2233720368547758e18 || number < -9.2233720368547758e18) {
        throw EvaluationError("math range error");
    }
    return Value::from_integer(static_cast<int64_t>(number));
}

Value add(const Value &left, const Value &right) {
    if (left.is_integer && right.is_integer) {
        int64_t sum = 0;
        if (!__builtin_add_overflow(left.integer_value, right.integer_value, &sum)) {
            return Value::from_integer(sum);
        }
    }
    return Value::from_float(left.as_double() + right.as_double());
}

Value subtract(const Value &left, const Value &right) {
    if (left.is_integer && right.is_integer) {
        int64_t difference = 0;
        if (!__builtin_sub_overflow(left.integer_value, right.integer_value, &difference)) {
            return Value::from_integer(difference);
        }
    }
    return Value::from_float(left.as_double() - right.as_double());
}

Value multiply(const Value &left, const Value &right) {
    if (left.is_integer && right.is_integer) {
        int64_t product = 0;
        if (!__builtin_mul_overflow(left.integer_value, right.integer_value, &product)) {
            return Value::from_integer(product);
        }
    }
    return Value::from_float(left.as_double() * right.as_double());
}

Value true_divide(const Value &left, const Value &right) {
    if (right.as_double() == 0.0) {
        throw EvaluationError("division by zero");
    }
    return Value::from_float(left.as_double() / right.as_double());
}

Value floor_divide(const Value &left, const Value &right) {
    if (left.is_integer && right.is_integer) {
        int64_t numerator = left.integer_value;
        int64_t denominator = right.integer_value;
        if (denominator == 0) {
            throw EvaluationError("integer division or modulo by zero");
        }
        if (!(numerator == std::numeric_limits<int64_t>::min() && denominator == -1)) {
            int64_t quotient = numerator / denominator;
            if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
                --quotient;
            }
            return Value::from_integer(quotient);
        }
    }
    if (right.as_double() == 0.0) {
        throw EvaluationError("float floor division by zero");
    }
    return Value::from_float(std::floor(left.as_double() / right.as_double()));
}

Value modulo(const Value &left, const Value &right) {
    if (left.is_integer && right.is_integer) {
        int64_t numerator = left.integer_value;
        int64_t denominator = right.integer_value;
        if (denominator == 0) {
            throw EvaluationError("integer division or modulo by zero");
        }
        if (denominator == -1) {
            return Value::from_integer(0);
        }
        int64_t remainder = numerator % denominator;
        // The result takes the sign of the divisor.
        if (remainder != 0 && ((remainder < 0) != (denominator < 0))) {
            remainder += denominator;
        }
        return Value::from_integer(remainder);
    }
    double denominator = right.as_double();
    if (denominator == 0.0) {
        throw EvaluationError("float modulo");
    }
    double remainder = std::fmod(left.as_double(), denominator);
    if (remainder != 0.0 && ((remainder < 0.0) != (denominator < 0.0))) {
        remainder += denominator;
    }
    return Value::from_float(remainder);
}

Value power(const Value &base, const Value &exponent) {
    if (base.is_integer && exponent.is_integer && exponent.integer_value >= 0) {
        int64_t result = 1;
        int64_t factor = base.integer_value;
        int64_t remaining = exponent.integer_value;
        bool overflow = false;
        while (remaining > 0) {
            if ((remaining & 1) != 0 && __builtin_mul_overflow(result, factor, &result)) {
                overflow = true;
                break;
            }
            remaining >>= 1;
            if (remaining > 0 && __builtin_mul_overflow(factor, factor, &factor)) {
                overflow = true;
                break;
            }
        }
        if (!overflow) {
            return Value::from_integer(result);
        }
    }

    double base_number = base.as_double();
    double exponent_number = exponent.as_double();
    if (base_number == 0.0 && exponent_number < 0.0) {
        throw EvaluationError("0.0 cannot be raised to a negative power");
    }
    if (base_number < 0.0 && std::floor(exponent_number) != exponent_number) {
        throw EvaluationError("math domain error");
    }
    return Value::from_float(std::pow(base_number, exponent_number));
}

Value negate(const Value &operand) {
    if (operand.is_integer && operand.integer_value != std::numeric_limits<int64_t>::min()) {
        return Value::from_integer(-operand.integer_value);
    }
    return Value::from_float(-operand.as_double());
}

// --- Function table ---

using Arguments = std::vector<Value>;
using Function = std::function<Value(const std::string &name, const Arguments &arguments)>;

void require_argument_count(const std::string &name, const Arguments &arguments, size_t minimum, size_t maximum) {
    size_t given = arguments.size();
    if (given >= minimum && given <= maximum) {
        return;
    }
    std::string expected;
    if (minimum == maximum) {
        expected = "exactly " + std::to_string(minimum) + (minimum == 1 ? " argument" : " arguments");
    } else if (given < minimum) {
        expected = "at least " + std::to_string(minimum) + (minimum == 1 ? " argument" : " arguments");
    } else {
        expected = "at most " + std::to_string(maximum) + (maximum == 1 ? " argument" : " arguments");
    }
    throw EvaluationError(name + "() takes " + expected + " (" + std::to_string(given) + " given)");
}

Value checked_float(double number) {
    if (std::isinf(number)) {
        throw EvaluationError("math range error");
    }
    if (std::isnan(number)) {
        throw EvaluationError("math domain error");
    }
    return Value::from_float(number);
}

// Wraps a one-argument floating point function with an optional domain check.
Function unary_float(double (*operation)(double), bool (*in_domain)(double)) {
    return [operation, in_domain](const std::string &name, const Arguments &arguments) {
        require_argument_count(name, arguments, 1, 1);
        double operand = arguments[0].as_double();
        if (in_domain != nullptr && !in_domain(operand)) {
            throw EvaluationError("math domain error");
        }
        return checked_float(operation(operand));
    };
}

Value select_extreme(const std::string &name, const Arguments &arguments, bool want_maximum) {
    if (arguments.empty()) {
        throw EvaluationError(name + "() arg is an empty sequence");
    }
    Value chosen = arguments[0];
    for (size_t index = 1; index < arguments.size(); ++index) {
        double candidate = arguments[index].as_double();
        if (want_maximum ? candidate > chosen.as_double() : candidate < chosen.as_double()) {
            chosen = arguments[index];
        }
    }
    return chosen;
}

Value round_value(const std::string &name, const Arguments &arguments) {
    require_argument_count(name, arguments, 1, 2);
    const Value &number = arguments[0];
    if (arguments.size() == 1) {
        if (number.is_integer) {
            return number;
        }
        // nearbyint uses the default round-half-to-even mode.
        return to_integer(std::nearbyint(number.float_value));
    }
    if (!arguments[1].is_integer) {
        throw EvaluationError("'float' object cannot be interpreted as an integer");
    }
    int64_t digits = arguments[1].integer_value;
    if (number.is_integer && digits >= 0) {
        return number;
    }
    double scale = std::pow(10.0, static_cast<double>(digits));
    double rounded = std::nearbyint(number.as_double() * scale) / scale;
    if (number.is_integer) {
        return to_integer(rounded);
    }
    return checked_float(rounded);
}

Value log_value(const std::string &name, const Arguments &arguments) {
    require_argument_count(name, arguments, 1, 2);
    double operand = arguments[0].as_double();
    if (operand <= 0.0) {
        throw EvaluationError("math domain error");
    }
    if (arguments.size() == 1) {
        return checked_float(std::log(operand));
    }
    double base = arguments[1].as_double();
    if (base <= 0.0) {
        throw EvaluationError("math domain error");
    }
    if (base == 1.0) {
        throw EvaluationError("float division by zero");
    }
    return checked_float(std::log(operand) / std::log(base));
}

const std::map<std::string, Function> &function_table() {
    static const std::map<std::string, Function> table = {
        {"abs", [](const std::string &name, const Arguments &arguments) {
             require_argument_count(name, arguments, 1, 1);
             const Value &operand = arguments[0];
             if (operand.is_integer) {
                 return operand.integer_value < 0 ? negate(operand) : operand;
             }
             return Value::from_float(std::fabs(operand.float_value));
         }},
        {"round", round_value},
        {"min", [](const std::string &name, const Arguments &arguments) {
             return select_extreme(name, arguments, false);
         }},
        {"max", [](const std::string &name, const Arguments &arguments) {
             return select_extreme(name, arguments, true);
         }},
        {"sum", [](const std::string &name, const Arguments &arguments) {
             (void)name;
             Value total = Value::from_integer(0);
             for (const auto &argument : arguments) {
                 total = add(total, argument);
             }
             return total;
         }},
        {"pow", [](const std::string &name, const Arguments &arguments) {
             require_argument_count(name, arguments, 2, 2);
             return power(arguments[0], arguments[1]);
         }},
        {"sqrt", unary_float(std::sqrt, [](double operand) { return operand >= 0.0; })},
        {"sin", unary_float(std::sin, [](double operand) { return !std::isinf(operand); })},
        {"cos", unary_float(std::cos, [](double operand) { return !std::isinf(operand); })},
        {"tan", unary_float(std::tan, [](double operand) { return !std::isinf(operand); })},
        {"asin", unary_float(std::asin, [](double operand) { return operand >= -1.0 && operand <= 1.0; })},
        {"acos", unary_float(std::acos, [](double operand) { return operand >= -1.0 && operand <= 1.0; })},
        {"atan", unary_float(std::atan, nullptr)},
        {"log", log_value},
        {"log10", unary_float(std::log10, [](double operand) { return operand > 0.0; })},
        {"exp", unary_float(std::exp, nullptr)},
        {"floor", [](const std::string &name, const Arguments &arguments) {
             require_argument_count(name, arguments, 1, 1);
             if (arguments[0].is_integer) {
                 return arguments[0];
             }
             return to_integer(std::floor(arguments[0].float_value));
         }},
        {"ceil", [](const std::string &name, const Arguments &arguments) {
             require_argument_count(name, arguments, 1, 1);
             if (arguments[0].is_integer) {
                 return arguments[0];
             }
             return to_integer(std::ceil(arguments[0].float_value));
         }},
    };
    return table;
}

const std::map<std::string, double> &constant_table() {
    static const std::map<std::string, double> table = {
        {"pi", 3.141592653589793},
        {"e", 2.718281828459045},
    };
    return table;
}

// --- Parser ---

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Value parse() {
        Value value = parse_expression();
        if (peek().kind != TokenKind::kEnd) {
            throw EvaluationError("invalid syntax");
        }
        return value;
    }

private:
    class DepthGuard {
    public:
        explicit DepthGuard(int &depth) : depth_(depth) {
            if (++depth_ > kMaximumNestingDepth) {
                --depth_;
                throw EvaluationError("expression is too deeply nested");
            }
        }
        ~DepthGuard() { --depth_; }

    private:
        int &depth_;
    };

    const Token &peek() const { return tokens_[position_]; }

    bool accept(const char *operator_text) {
        const Token &token = peek();
        if (token.kind == TokenKind::kOperator && token.text == operator_text) {
            ++position_;
            return true;
        }
        return false;
    }

    void expect(const char *operator_text) {
        if (!accept(operator_text)) {
            throw EvaluationError("invalid syntax");
        }
    }

    Value parse_expression() {
        DepthGuard guard(depth_);
        Value left = parse_term();
        while (true) {
            if (accept("+")) {
                left = add(left, parse_term());
            } else if (accept("-")) {
                left = subtract(left, parse_term());
            } else {
                return left;
            }
        }
    }

    Value parse_term() {
        Value left = parse_unary();
        while (true) {
            if (accept("*")) {
                left = multiply(left, parse_unary());
            } else if (accept("//")) {
                left = floor_divide(left, parse_unary());
            } else if (accept("/")) {
                left = true_divide(left, parse_unary());
            } else if (accept("%")) {
                left = modulo(left, parse_unary());
            } else {
                return left;
            }
        }
    }

    Value parse_unary() {
        DepthGuard guard(depth_);
        if (accept("+")) {
            return parse_unary();
        }
        if (accept("-")) {
            return negate(parse_unary());
        }
        return parse_power();
    }

    // Exponentiation binds tighter than a unary minus on its left: -2 ** 2 == -4.
    Value parse_power() {
        Value base = parse_primary();
        if (accept("**")) {
            Value exponent = parse_unary();
            return power(base, exponent);
        }
        return base;
    }

    Value parse_primary() {
        const Token token = peek();

        if (token.kind == TokenKind::kNumber) {
            ++position_;
            return parse_number(token.text);
        }

        if (token.kind == TokenKind::kName) {
            ++position_;
            if (accept("(")) {
                Arguments arguments = parse_arguments();
                return call_function(token.text, arguments);
            }
            return resolve_constant(token.text);
        }

        if (accept("(")) {
            Value inner = parse_expression();
            expect(")");
            return inner;
        }

        throw EvaluationError("invalid syntax");
    }

    Arguments parse_arguments() {
        Arguments arguments;
        if (accept(")")) {
            return arguments;
        }
        while (true) {
            if (accept("[")) {
                if (!accept("]")) {
                    while (true) {
                        arguments.push_back(parse_expression());
                        if (accept("]")) {
                            break;
                        }
                        expect(",");
                    }
                }
            } else {
                arguments.push_back(parse_expression());
            }
            if (accept(")")) {
                return arguments;
            }
            expect(",");
        }
    }

    static Value parse_number(const std::string &text) {
        bool is_float = text.find_first_of(".eE") != std::string::npos;
        if (!is_float) {
            errno = 0;
            long long integer = std::strtoll(text.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                return Value::from_integer(static_cast<int64_t>(integer));
            }
        }
        return checked_float(std::strtod(text.c_str(), nullptr));
    }

    static Value call_function(const std::string &name, const Arguments &arguments) {
        const auto &functions = function_table();
        auto function_iterator = functions.find(name);
        if (function_iterator != functions.end()) {
            return function_iterator->second(name, arguments);
        }
        if (constant_table().count(name) != 0) {
            throw EvaluationError("'float' object is not callable");
        }
        throw EvaluationError("name '" + name + "' is not defined");
    }

    static Value resolve_constant(const std::string &name) {
        const auto &constants = constant_table();
        auto constant_iterator = constants.find(name);
        if (constant_iterator != constants.end()) {
            return Value::from_float(constant_iterator->second);
        }
        if (function_table().count(name) != 0) {
            throw EvaluationError("function '" + name + "' must be called with arguments");
        }
        throw EvaluationError("name '" + name + "' is not defined");
    }

    std::vector<Token> tokens_;
    size_t position_ = 0;
    int depth_ = 0;
};

} // namespace

EvaluationResult evaluate(const std::string &expression) {
    EvaluationResult result;
    try {
        Parser parser(tokenize(expression));
        Value value = parser.parse();
        if (!value.is_integer && !std::isfinite(value.float_value)) {
            throw EvaluationError("math range error");
        }
        result.success = true;
        result.value = value;
    } catch (const EvaluationError &error) {
        result.success = false;
        result.error_message = error.what();
    }
    return result;
}

} // namespace expression_eval
