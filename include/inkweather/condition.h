#ifndef INKWEATHER_CONDITION_H
#define INKWEATHER_CONDITION_H

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "inkweather/context.h"

namespace inkweather
{

enum class CompareOp
{
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual
};

struct ConditionNode
{
    enum class Kind
    {
        Or,
        And,
        Not,
        Compare,
        Signal,
        Literal
    };

    Kind kind{Kind::Literal};
    CompareOp op{CompareOp::Equal};
    std::string signal;
    SignalValue literal;
    std::unique_ptr<ConditionNode> left;
    std::unique_ptr<ConditionNode> right;
};

// A trigger condition parsed into an expression tree. Only whitelisted
// signal names, numbers, TRUE/FALSE, quoted text, comparisons, AND/OR/NOT
// and parentheses are accepted.
class ParsedCondition
{
public:
    static bool parse(const std::string &expression, ParsedCondition &out, std::string &error);

    // Returns false on a type error; result is only meaningful on success.
    bool evaluate(const ContextSnapshot &context, bool &result, std::string &error) const;

    bool empty() const { return root_ == nullptr; }

private:
    std::shared_ptr<const ConditionNode> root_;
};

class ConditionEvaluator
{
public:
    static constexpr size_t MAX_EXPRESSION_LENGTH = 512;
    static constexpr int MAX_NESTING_DEPTH = 32;

    // Fails closed: malformed expressions, unknown names and type errors
    // are logged and yield false.
    bool evaluate(const std::string &expression, const ContextSnapshot &context) const;
    // Same, for a condition parsed up front; label names it in log lines.
    bool evaluate(const ParsedCondition &condition, const ContextSnapshot &context, const std::string &label) const;

    // Parse-only check for configuration loading.
    bool validate(const std::string &expression, std::string &error) const;

    static bool isSignalName(const std::string &name);
    static const std::vector<std::string> &signalNames();

    // Whitelisted accessor; absent signals resolve to their safe default.
    static SignalValue resolveSignal(const std::string &name, const ContextSnapshot &context);
};

} // namespace inkweather

#endif // INKWEATHER_CONDITION_H
