// Formula.hpp
//
// Expression language for user-supplied transform nodes. A formula is a
// single expression over named variables (main, input1..N) with arithmetic,
// comparison, logic, a ternary, a handful of math functions and an optional
// top-level array literal whose items become indexed outputs. A leading
// "return" and a trailing ';' are accepted.
#pragma once
#include "GraphTypes.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace SignalFlow {

class FormulaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FormulaResult {
    bool isArray = false;
    std::vector<Value> items; // exactly one item when !isArray
    const Value& scalar() const { return items.front(); }
};

using FormulaVariables = std::unordered_map<std::string, Value>;

class Formula {
public:
    // Throws FormulaError on a syntax error
    explicit Formula(const std::string& source);

    // Throws FormulaError on unknown names, type errors or non-finite results
    FormulaResult evaluate(const FormulaVariables& vars) const;
    const std::string& source() const { return text; }

    struct Node;

private:
    std::string text;
    std::shared_ptr<const Node> root;
};

} // namespace SignalFlow
