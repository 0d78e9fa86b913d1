// Formula.cpp
//
// Recursive-descent parser producing a small AST, and a tree-walking
// evaluator. Precedence, low to high: ternary, ||, &&, equality, comparison,
// additive, multiplicative, unary, power.
#include "Formula.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/core.h>
#include <functional>

namespace SignalFlow {

struct Formula::Node {
    enum class Type { Number, String, Variable, Unary, Binary, Ternary, Call, Array };
    Type type;
    double number = 0.0;
    std::string text; // string literal, variable/function name or operator
    std::vector<std::shared_ptr<const Node>> children;
};

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

using NodePtr = std::shared_ptr<const Formula::Node>;
using NodeType = Formula::Node::Type;

NodePtr makeNode(NodeType type, std::string text = {}, std::vector<NodePtr> children = {}, double number = 0.0) {
    auto n = std::make_shared<Formula::Node>();
    n->type = type;
    n->text = std::move(text);
    n->children = std::move(children);
    n->number = number;
    return n;
}

class Parser {
public:
    explicit Parser(const std::string& src) : s(src) {}

    NodePtr parseProgram() {
        skipSpace();
        if (matchWord("return")) skipSpace();
        NodePtr root = peek() == '[' ? parseArray() : parseExpression();
        skipSpace();
        while (peek() == ';') { ++pos; skipSpace(); }
        if (pos != s.size()) fail(fmt::format("unexpected '{}'", s[pos]));
        return root;
    }

private:
    const std::string& s;
    size_t pos = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw FormulaError(fmt::format("syntax error at {}: {}", pos, what));
    }

    char peek(size_t ahead = 0) const { return pos + ahead < s.size() ? s[pos + ahead] : '\0'; }

    void skipSpace() {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    }

    bool match(const char* op) {
        skipSpace();
        size_t n = std::char_traits<char>::length(op);
        if (s.compare(pos, n, op) != 0) return false;
        pos += n;
        return true;
    }

    bool matchWord(const char* word) {
        size_t n = std::char_traits<char>::length(word);
        if (s.compare(pos, n, word) != 0) return false;
        char after = peek(n);
        if (std::isalnum(static_cast<unsigned char>(after)) || after == '_') return false;
        pos += n;
        return true;
    }

    void expect(char c) {
        skipSpace();
        if (peek() != c) fail(fmt::format("expected '{}'", c));
        ++pos;
    }

    NodePtr parseArray() {
        expect('[');
        std::vector<NodePtr> items;
        skipSpace();
        if (peek() != ']') {
            do { items.push_back(parseExpression()); } while (match(","));
        }
        expect(']');
        return makeNode(NodeType::Array, {}, std::move(items));
    }

    NodePtr parseExpression() {
        NodePtr cond = parseOr();
        if (match("?")) {
            NodePtr a = parseExpression();
            expect(':');
            NodePtr b = parseExpression();
            return makeNode(NodeType::Ternary, {}, {cond, a, b});
        }
        return cond;
    }

    NodePtr parseOr() {
        NodePtr lhs = parseAnd();
        while (match("||")) lhs = makeNode(NodeType::Binary, "||", {lhs, parseAnd()});
        return lhs;
    }

    NodePtr parseAnd() {
        NodePtr lhs = parseEquality();
        while (match("&&")) lhs = makeNode(NodeType::Binary, "&&", {lhs, parseEquality()});
        return lhs;
    }

    NodePtr parseEquality() {
        NodePtr lhs = parseComparison();
        for (;;) {
            if (match("===") || match("==")) lhs = makeNode(NodeType::Binary, "==", {lhs, parseComparison()});
            else if (match("!==") || match("!=")) lhs = makeNode(NodeType::Binary, "!=", {lhs, parseComparison()});
            else return lhs;
        }
    }

    NodePtr parseComparison() {
        NodePtr lhs = parseAdditive();
        for (;;) {
            if (match("<=")) lhs = makeNode(NodeType::Binary, "<=", {lhs, parseAdditive()});
            else if (match(">=")) lhs = makeNode(NodeType::Binary, ">=", {lhs, parseAdditive()});
            else if (match("<")) lhs = makeNode(NodeType::Binary, "<", {lhs, parseAdditive()});
            else if (match(">")) lhs = makeNode(NodeType::Binary, ">", {lhs, parseAdditive()});
            else return lhs;
        }
    }

    NodePtr parseAdditive() {
        NodePtr lhs = parseMultiplicative();
        for (;;) {
            if (match("+")) lhs = makeNode(NodeType::Binary, "+", {lhs, parseMultiplicative()});
            else if (match("-")) lhs = makeNode(NodeType::Binary, "-", {lhs, parseMultiplicative()});
            else return lhs;
        }
    }

    NodePtr parseMultiplicative() {
        NodePtr lhs = parseUnary();
        for (;;) {
            skipSpace();
            if (peek() == '*' && peek(1) != '*') { ++pos; lhs = makeNode(NodeType::Binary, "*", {lhs, parseUnary()}); }
            else if (match("/")) lhs = makeNode(NodeType::Binary, "/", {lhs, parseUnary()});
            else if (match("%")) lhs = makeNode(NodeType::Binary, "%", {lhs, parseUnary()});
            else return lhs;
        }
    }

    NodePtr parseUnary() {
        if (match("-")) return makeNode(NodeType::Unary, "-", {parseUnary()});
        if (match("+")) return parseUnary();
        skipSpace();
        if (peek() == '!' && peek(1) != '=') {
            ++pos;
            return makeNode(NodeType::Unary, "!", {parseUnary()});
        }
        return parsePower();
    }

    NodePtr parsePower() {
        NodePtr base = parsePrimary();
        if (match("**") || match("^")) return makeNode(NodeType::Binary, "^", {base, parseUnary()});
        return base;
    }

    NodePtr parsePrimary() {
        skipSpace();
        char c = peek();
        if (c == '(') {
            ++pos;
            NodePtr inner = parseExpression();
            expect(')');
            return inner;
        }
        if (c == '"' || c == '\'') return parseString(c);
        if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            const char* begin = s.c_str() + pos;
            char* end = nullptr;
            double v = std::strtod(begin, &end);
            pos += static_cast<size_t>(end - begin);
            return makeNode(NodeType::Number, {}, {}, v);
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = pos;
            while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '.') ++pos;
            std::string name = s.substr(start, pos - start);
            if (name.compare(0, 5, "Math.") == 0) name = name.substr(5);
            if (match("(")) {
                std::vector<NodePtr> args;
                skipSpace();
                if (peek() != ')') {
                    do { args.push_back(parseExpression()); } while (match(","));
                }
                expect(')');
                return makeNode(NodeType::Call, name, std::move(args));
            }
            return makeNode(NodeType::Variable, name);
        }
        if (c == '\0') fail("unexpected end of formula");
        fail(fmt::format("unexpected '{}'", c));
    }

    NodePtr parseString(char quote) {
        ++pos;
        std::string out;
        while (pos < s.size() && s[pos] != quote) {
            if (s[pos] == '\\' && pos + 1 < s.size()) ++pos;
            out.push_back(s[pos++]);
        }
        if (pos >= s.size()) fail("unterminated string");
        ++pos;
        return makeNode(NodeType::String, std::move(out));
    }
};

double number(const Value& v, const char* context) {
    auto n = toNumber(v);
    if (!n) throw FormulaError(fmt::format("{}: '{}' is not a number", context, toString(v)));
    return *n;
}

bool truthy(const Value& v) {
    if (std::holds_alternative<std::string>(v)) return !std::get<std::string>(v).empty();
    auto n = toNumber(v);
    return n && *n != 0.0;
}

Value callFunction(const std::string& name, const std::vector<Value>& args) {
    auto arity = [&](size_t n) {
        if (args.size() != n) throw FormulaError(fmt::format("{}() takes {} argument(s), got {}", name, n, args.size()));
    };
    using Unary = double (*)(double);
    static const std::unordered_map<std::string, Unary> unary = {
        {"sin", [](double x) { return std::sin(x); }},
        {"cos", [](double x) { return std::cos(x); }},
        {"tan", [](double x) { return std::tan(x); }},
        {"abs", [](double x) { return std::fabs(x); }},
        {"floor", [](double x) { return std::floor(x); }},
        {"ceil", [](double x) { return std::ceil(x); }},
        {"round", [](double x) { return std::round(x); }},
        {"sqrt", [](double x) { return std::sqrt(x); }},
        {"log", [](double x) { return std::log(x); }},
        {"exp", [](double x) { return std::exp(x); }},
        {"mtof", [](double x) { return 440.0 * std::pow(2.0, (x - 69.0) / 12.0); }},
        {"ftom", [](double x) { return 69.0 + 12.0 * std::log2(x / 440.0); }},
    };
    auto u = unary.find(name);
    if (u != unary.end()) {
        arity(1);
        return u->second(number(args[0], name.c_str()));
    }
    if (name == "pow") {
        arity(2);
        return std::pow(number(args[0], "pow"), number(args[1], "pow"));
    }
    if (name == "min" || name == "max") {
        if (args.empty()) throw FormulaError(fmt::format("{}() needs arguments", name));
        double acc = number(args[0], name.c_str());
        for (size_t i = 1; i < args.size(); ++i) {
            double v = number(args[i], name.c_str());
            acc = name == "min" ? std::min(acc, v) : std::max(acc, v);
        }
        return acc;
    }
    if (name == "clamp") {
        arity(3);
        double lo = number(args[1], "clamp"), hi = number(args[2], "clamp");
        if (lo > hi) std::swap(lo, hi);
        return std::clamp(number(args[0], "clamp"), lo, hi);
    }
    if (name == "Number") {
        arity(1);
        return number(args[0], "Number");
    }
    if (name == "String") {
        arity(1);
        return toString(args[0]);
    }
    throw FormulaError(fmt::format("unknown function '{}'", name));
}

Value evalScalar(const Formula::Node& n, const FormulaVariables& vars) {
    switch (n.type) {
        case NodeType::Number: return n.number;
        case NodeType::String: return n.text;
        case NodeType::Variable: {
            auto it = vars.find(n.text);
            if (it != vars.end()) return it->second;
            if (n.text == "PI") return kPi;
            if (n.text == "E") return kE;
            if (n.text == "true") return true;
            if (n.text == "false") return false;
            throw FormulaError(fmt::format("unknown name '{}'", n.text));
        }
        case NodeType::Unary: {
            Value v = evalScalar(*n.children[0], vars);
            if (n.text == "!") return !truthy(v);
            return -number(v, "unary -");
        }
        case NodeType::Ternary:
            return truthy(evalScalar(*n.children[0], vars)) ? evalScalar(*n.children[1], vars) : evalScalar(*n.children[2], vars);
        case NodeType::Call: {
            std::vector<Value> args;
            args.reserve(n.children.size());
            for (const auto& c : n.children) args.push_back(evalScalar(*c, vars));
            return callFunction(n.text, args);
        }
        case NodeType::Array:
            throw FormulaError("arrays are only allowed as the whole result");
        case NodeType::Binary: break;
    }

    const std::string& op = n.text;
    if (op == "&&") {
        Value lhs = evalScalar(*n.children[0], vars);
        return truthy(lhs) ? evalScalar(*n.children[1], vars) : lhs;
    }
    if (op == "||") {
        Value lhs = evalScalar(*n.children[0], vars);
        return truthy(lhs) ? lhs : evalScalar(*n.children[1], vars);
    }
    Value a = evalScalar(*n.children[0], vars);
    Value b = evalScalar(*n.children[1], vars);
    bool stringy = std::holds_alternative<std::string>(a) || std::holds_alternative<std::string>(b);
    if (op == "+" && stringy && (!toNumber(a) || !toNumber(b))) return toString(a) + toString(b);
    if (op == "==" || op == "!=") {
        bool eq;
        auto na = toNumber(a), nb = toNumber(b);
        if (na && nb) eq = *na == *nb;
        else eq = toString(a) == toString(b);
        return op == "==" ? eq : !eq;
    }
    double x = number(a, op.c_str());
    double y = number(b, op.c_str());
    if (op == "+") return x + y;
    if (op == "-") return x - y;
    if (op == "*") return x * y;
    if (op == "/") return x / y;
    if (op == "%") return std::fmod(x, y);
    if (op == "^") return std::pow(x, y);
    if (op == "<") return x < y;
    if (op == ">") return x > y;
    if (op == "<=") return x <= y;
    if (op == ">=") return x >= y;
    throw FormulaError(fmt::format("unknown operator '{}'", op));
}

Value finite(Value v) {
    if (std::holds_alternative<double>(v) && !std::isfinite(std::get<double>(v))) {
        throw FormulaError("result is not a finite number");
    }
    return v;
}

} // namespace

Formula::Formula(const std::string& source) : text(source) {
    if (source.find_first_not_of(" \t\r\n") == std::string::npos) throw FormulaError("empty formula");
    Parser parser(text);
    root = parser.parseProgram();
}

FormulaResult Formula::evaluate(const FormulaVariables& vars) const {
    FormulaResult result;
    if (root->type == NodeType::Array) {
        result.isArray = true;
        for (const auto& item : root->children) result.items.push_back(finite(evalScalar(*item, vars)));
        return result;
    }
    result.items.push_back(finite(evalScalar(*root, vars)));
    return result;
}

} // namespace SignalFlow
