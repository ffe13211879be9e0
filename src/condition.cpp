#include "inkweather/condition.h"

#include <cctype>
#include <cstdlib>

#include "inkweather/log.h"
#include "inkweather/time_util.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Trigger";
constexpr size_t MAX_TEXT_LITERAL = 32;

enum class TokenKind
{
    Number,
    Signal,
    Text,
    True,
    False,
    And,
    Or,
    Not,
    LeftParen,
    RightParen,
    Compare,
    End
};

struct Token
{
    TokenKind kind{TokenKind::End};
    double number{0.0};
    std::string text;
    CompareOp op{CompareOp::Equal};
    size_t position{0};
};

typedef SignalValue (*SignalAccessor)(const ContextSnapshot &context);

struct SignalEntry
{
    const char *name;
    SignalAccessor accessor;
};

SignalValue accessPrecipitation(const ContextSnapshot &context)
{
    return SignalValue::fromNumber(context.number("precipitation", 0.0));
}

SignalValue accessForecastPrecipitation(const ContextSnapshot &context)
{
    return SignalValue::fromNumber(context.number("forecast_precipitation_2h", 0.0));
}

SignalValue accessTemperature(const ContextSnapshot &context)
{
    return SignalValue::fromNumber(context.number("temperature", 20.0));
}

SignalValue accessWindSpeed(const ContextSnapshot &context)
{
    return SignalValue::fromNumber(context.number("wind_speed", 0.0));
}

SignalValue accessPressureTrend(const ContextSnapshot &context)
{
    return SignalValue::fromText(context.text("pressure_trend", "stable"));
}

SignalValue accessHour(const ContextSnapshot &context)
{
    const struct tm local = toLocalTm(context.capturedAt(), context.timezoneOffset());
    return SignalValue::fromNumber(context.number("time_hour", local.tm_hour));
}

SignalValue accessMonth(const ContextSnapshot &context)
{
    const struct tm local = toLocalTm(context.capturedAt(), context.timezoneOffset());
    return SignalValue::fromNumber(context.number("time_month", local.tm_mon + 1));
}

SignalValue accessUserPreference(const ContextSnapshot &context)
{
    return SignalValue::fromText(context.text("user_preference", "normal"));
}

SignalValue accessDaylight(const ContextSnapshot &context)
{
    return SignalValue::fromBool(context.flag("is_daylight", true));
}

const SignalEntry SIGNALS[] = {
    {"precipitation", accessPrecipitation},
    {"forecast_precipitation_2h", accessForecastPrecipitation},
    {"temperature", accessTemperature},
    {"wind_speed", accessWindSpeed},
    {"pressure_trend", accessPressureTrend},
    {"time_hour", accessHour},
    {"time_month", accessMonth},
    {"user_preference", accessUserPreference},
    {"is_daylight", accessDaylight},
};

const SignalEntry *findSignal(const std::string &name)
{
    for (const SignalEntry &entry : SIGNALS)
    {
        if (name == entry.name)
        {
            return &entry;
        }
    }
    return nullptr;
}

std::string lowercase(const std::string &text)
{
    std::string out(text);
    for (char &c : out)
    {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string positionError(const char *what, size_t position)
{
    return std::string(what) + " at offset " + std::to_string(position);
}

bool tokenize(const std::string &expression, std::vector<Token> &tokens, std::string &error)
{
    size_t i = 0;
    const size_t length = expression.size();
    while (i < length)
    {
        const unsigned char c = static_cast<unsigned char>(expression[i]);
        if (isspace(c))
        {
            ++i;
            continue;
        }

        Token token;
        token.position = i;

        const bool negativeNumber = c == '-' && i + 1 < length &&
                                    (isdigit(static_cast<unsigned char>(expression[i + 1])) || expression[i + 1] == '.');
        if (isdigit(c) || c == '.' || negativeNumber)
        {
            size_t end = negativeNumber ? i + 1 : i;
            bool seenDigit = false;
            bool seenDot = false;
            while (end < length)
            {
                const unsigned char d = static_cast<unsigned char>(expression[end]);
                if (isdigit(d))
                {
                    seenDigit = true;
                }
                else if (d == '.' && !seenDot)
                {
                    seenDot = true;
                }
                else
                {
                    break;
                }
                ++end;
            }
            if (!seenDigit || (end < length && (isalpha(static_cast<unsigned char>(expression[end])) ||
                                                expression[end] == '.' || expression[end] == '_')))
            {
                error = positionError("malformed number", i);
                return false;
            }
            token.kind = TokenKind::Number;
            token.number = std::strtod(expression.substr(i, end - i).c_str(), nullptr);
            tokens.push_back(token);
            i = end;
            continue;
        }

        if (isalpha(c) || c == '_')
        {
            size_t end = i;
            while (end < length &&
                   (isalnum(static_cast<unsigned char>(expression[end])) || expression[end] == '_'))
            {
                ++end;
            }
            const std::string word = expression.substr(i, end - i);
            const std::string keyword = lowercase(word);
            if (keyword == "and")
            {
                token.kind = TokenKind::And;
            }
            else if (keyword == "or")
            {
                token.kind = TokenKind::Or;
            }
            else if (keyword == "not")
            {
                token.kind = TokenKind::Not;
            }
            else if (keyword == "true")
            {
                token.kind = TokenKind::True;
            }
            else if (keyword == "false")
            {
                token.kind = TokenKind::False;
            }
            else if (findSignal(word) != nullptr)
            {
                token.kind = TokenKind::Signal;
                token.text = word;
            }
            else
            {
                error = "unknown identifier '" + word + "'";
                return false;
            }
            tokens.push_back(token);
            i = end;
            continue;
        }

        if (c == '\'' || c == '"')
        {
            const size_t close = expression.find(static_cast<char>(c), i + 1);
            if (close == std::string::npos)
            {
                error = positionError("unterminated text", i);
                return false;
            }
            const std::string text = expression.substr(i + 1, close - i - 1);
            if (text.size() > MAX_TEXT_LITERAL)
            {
                error = positionError("text literal too long", i);
                return false;
            }
            for (const char t : text)
            {
                const unsigned char u = static_cast<unsigned char>(t);
                if (!isalnum(u) && t != '_' && t != '-' && t != ' ')
                {
                    error = positionError("character not allowed in text", i);
                    return false;
                }
            }
            token.kind = TokenKind::Text;
            token.text = text;
            tokens.push_back(token);
            i = close + 1;
            continue;
        }

        if (c == '(' || c == ')')
        {
            token.kind = c == '(' ? TokenKind::LeftParen : TokenKind::RightParen;
            tokens.push_back(token);
            ++i;
            continue;
        }

        if (c == '<' || c == '>' || c == '=' || c == '!')
        {
            const bool followedByEquals = i + 1 < length && expression[i + 1] == '=';
            token.kind = TokenKind::Compare;
            if (c == '<')
            {
                token.op = followedByEquals ? CompareOp::LessEqual : CompareOp::Less;
            }
            else if (c == '>')
            {
                token.op = followedByEquals ? CompareOp::GreaterEqual : CompareOp::Greater;
            }
            else if (followedByEquals)
            {
                token.op = c == '=' ? CompareOp::Equal : CompareOp::NotEqual;
            }
            else
            {
                error = positionError(c == '=' ? "single '=' (use '==')" : "'!' without '='", i);
                return false;
            }
            tokens.push_back(token);
            i += followedByEquals ? 2 : 1;
            continue;
        }

        error = positionError("character not allowed", i);
        return false;
    }

    Token end;
    end.kind = TokenKind::End;
    end.position = length;
    tokens.push_back(end);
    return true;
}

class Parser
{
public:
    explicit Parser(const std::vector<Token> &tokens) : tokens_(tokens) {}

    std::unique_ptr<ConditionNode> parse(std::string &error)
    {
        std::unique_ptr<ConditionNode> root = parseOr(0);
        if (!root)
        {
            error = error_;
            return nullptr;
        }
        if (peek().kind != TokenKind::End)
        {
            error = positionError("unexpected trailing input", peek().position);
            return nullptr;
        }
        return root;
    }

private:
    const Token &peek() const { return tokens_[index_]; }

    const Token &advance() { return tokens_[index_++]; }

    std::unique_ptr<ConditionNode> fail(const std::string &message)
    {
        if (error_.empty())
        {
            error_ = message;
        }
        return nullptr;
    }

    static std::unique_ptr<ConditionNode> binary(ConditionNode::Kind kind, std::unique_ptr<ConditionNode> left,
                                                 std::unique_ptr<ConditionNode> right)
    {
        std::unique_ptr<ConditionNode> node(new ConditionNode());
        node->kind = kind;
        node->left = std::move(left);
        node->right = std::move(right);
        return node;
    }

    std::unique_ptr<ConditionNode> parseOr(int depth)
    {
        std::unique_ptr<ConditionNode> left = parseAnd(depth);
        while (left && peek().kind == TokenKind::Or)
        {
            advance();
            std::unique_ptr<ConditionNode> right = parseAnd(depth);
            if (!right)
            {
                return nullptr;
            }
            left = binary(ConditionNode::Kind::Or, std::move(left), std::move(right));
        }
        return left;
    }

    std::unique_ptr<ConditionNode> parseAnd(int depth)
    {
        std::unique_ptr<ConditionNode> left = parseNot(depth);
        while (left && peek().kind == TokenKind::And)
        {
            advance();
            std::unique_ptr<ConditionNode> right = parseNot(depth);
            if (!right)
            {
                return nullptr;
            }
            left = binary(ConditionNode::Kind::And, std::move(left), std::move(right));
        }
        return left;
    }

    std::unique_ptr<ConditionNode> parseNot(int depth)
    {
        if (depth > ConditionEvaluator::MAX_NESTING_DEPTH)
        {
            return fail("expression nested too deeply");
        }
        if (peek().kind == TokenKind::Not)
        {
            advance();
            std::unique_ptr<ConditionNode> operand = parseNot(depth + 1);
            if (!operand)
            {
                return nullptr;
            }
            std::unique_ptr<ConditionNode> node(new ConditionNode());
            node->kind = ConditionNode::Kind::Not;
            node->left = std::move(operand);
            return node;
        }
        return parsePrimary(depth);
    }

    std::unique_ptr<ConditionNode> parsePrimary(int depth)
    {
        if (peek().kind == TokenKind::LeftParen)
        {
            advance();
            std::unique_ptr<ConditionNode> inner = parseOr(depth + 1);
            if (!inner)
            {
                return nullptr;
            }
            if (peek().kind != TokenKind::RightParen)
            {
                return fail(positionError("expected ')'", peek().position));
            }
            advance();
            return inner;
        }

        std::unique_ptr<ConditionNode> left = parseOperand();
        if (!left)
        {
            return nullptr;
        }
        if (peek().kind != TokenKind::Compare)
        {
            return left;
        }

        const CompareOp op = advance().op;
        std::unique_ptr<ConditionNode> right = parseOperand();
        if (!right)
        {
            return nullptr;
        }
        if (peek().kind == TokenKind::Compare)
        {
            return fail(positionError("chained comparison", peek().position));
        }
        std::unique_ptr<ConditionNode> node = binary(ConditionNode::Kind::Compare, std::move(left), std::move(right));
        node->op = op;
        return node;
    }

    std::unique_ptr<ConditionNode> parseOperand()
    {
        const Token &token = peek();
        std::unique_ptr<ConditionNode> node(new ConditionNode());
        switch (token.kind)
        {
        case TokenKind::Number:
            node->kind = ConditionNode::Kind::Literal;
            node->literal = SignalValue::fromNumber(token.number);
            break;
        case TokenKind::True:
        case TokenKind::False:
            node->kind = ConditionNode::Kind::Literal;
            node->literal = SignalValue::fromBool(token.kind == TokenKind::True);
            break;
        case TokenKind::Text:
            node->kind = ConditionNode::Kind::Literal;
            node->literal = SignalValue::fromText(token.text);
            break;
        case TokenKind::Signal:
            node->kind = ConditionNode::Kind::Signal;
            node->signal = token.text;
            break;
        case TokenKind::End:
            return fail("unexpected end of expression");
        default:
            return fail(positionError("expected a value", token.position));
        }
        advance();
        return node;
    }

    const std::vector<Token> &tokens_;
    size_t index_{0};
    std::string error_;
};

SignalValue valueOf(const ConditionNode &node, const ContextSnapshot &context)
{
    if (node.kind == ConditionNode::Kind::Signal)
    {
        return ConditionEvaluator::resolveSignal(node.signal, context);
    }
    return node.literal;
}

bool compareNumbers(double lhs, double rhs, CompareOp op)
{
    switch (op)
    {
    case CompareOp::Less:
        return lhs < rhs;
    case CompareOp::LessEqual:
        return lhs <= rhs;
    case CompareOp::Greater:
        return lhs > rhs;
    case CompareOp::GreaterEqual:
        return lhs >= rhs;
    case CompareOp::Equal:
        return lhs == rhs;
    case CompareOp::NotEqual:
        return lhs != rhs;
    }
    return false;
}

bool evaluateCompare(const ConditionNode &node, const ContextSnapshot &context, bool &result, std::string &error)
{
    const SignalValue lhs = valueOf(*node.left, context);
    const SignalValue rhs = valueOf(*node.right, context);
    const bool equality = node.op == CompareOp::Equal || node.op == CompareOp::NotEqual;
    typedef SignalValue::Type Type;

    if (lhs.type == Type::Text || rhs.type == Type::Text)
    {
        if (lhs.type != rhs.type || !equality)
        {
            error = "text can only be compared to text with == or !=";
            return false;
        }
        result = (lhs.text == rhs.text) == (node.op == CompareOp::Equal);
        return true;
    }

    if (lhs.type == Type::Boolean && rhs.type == Type::Boolean)
    {
        if (!equality)
        {
            error = "booleans can only be compared with == or !=";
            return false;
        }
        result = (lhs.flag == rhs.flag) == (node.op == CompareOp::Equal);
        return true;
    }

    // Booleans promote to 0/1 against numbers.
    const double left = lhs.type == Type::Boolean ? (lhs.flag ? 1.0 : 0.0) : lhs.number;
    const double right = rhs.type == Type::Boolean ? (rhs.flag ? 1.0 : 0.0) : rhs.number;
    result = compareNumbers(left, right, node.op);
    return true;
}

bool evaluateNode(const ConditionNode &node, const ContextSnapshot &context, bool &result, std::string &error)
{
    switch (node.kind)
    {
    case ConditionNode::Kind::Or:
    case ConditionNode::Kind::And:
    {
        // Both sides are evaluated so type errors surface regardless of values.
        bool left = false;
        bool right = false;
        if (!evaluateNode(*node.left, context, left, error) || !evaluateNode(*node.right, context, right, error))
        {
            return false;
        }
        result = node.kind == ConditionNode::Kind::Or ? (left || right) : (left && right);
        return true;
    }
    case ConditionNode::Kind::Not:
    {
        bool operand = false;
        if (!evaluateNode(*node.left, context, operand, error))
        {
            return false;
        }
        result = !operand;
        return true;
    }
    case ConditionNode::Kind::Compare:
        return evaluateCompare(node, context, result, error);
    case ConditionNode::Kind::Signal:
    case ConditionNode::Kind::Literal:
    {
        const SignalValue value = valueOf(node, context);
        if (value.type != SignalValue::Type::Boolean)
        {
            error = "operand " + (node.kind == ConditionNode::Kind::Signal ? node.signal : value.toString()) +
                    " is not a boolean";
            return false;
        }
        result = value.flag;
        return true;
    }
    }
    error = "invalid expression node";
    return false;
}
} // namespace

bool ParsedCondition::parse(const std::string &expression, ParsedCondition &out, std::string &error)
{
    if (expression.size() > ConditionEvaluator::MAX_EXPRESSION_LENGTH)
    {
        error = "expression too long";
        return false;
    }

    std::vector<Token> tokens;
    if (!tokenize(expression, tokens, error))
    {
        return false;
    }
    if (tokens.size() == 1)
    {
        error = "empty expression";
        return false;
    }

    Parser parser(tokens);
    std::unique_ptr<ConditionNode> root = parser.parse(error);
    if (!root)
    {
        return false;
    }
    out.root_ = std::shared_ptr<const ConditionNode>(std::move(root));
    return true;
}

bool ParsedCondition::evaluate(const ContextSnapshot &context, bool &result, std::string &error) const
{
    if (!root_)
    {
        error = "empty condition";
        return false;
    }
    return evaluateNode(*root_, context, result, error);
}

bool ConditionEvaluator::evaluate(const std::string &expression, const ContextSnapshot &context) const
{
    ParsedCondition condition;
    std::string error;
    if (!ParsedCondition::parse(expression, condition, error))
    {
        INKWEATHER_LOGW(TAG, "Rejected condition '%s': %s", expression.c_str(), error.c_str());
        return false;
    }
    return evaluate(condition, context, expression);
}

bool ConditionEvaluator::evaluate(const ParsedCondition &condition, const ContextSnapshot &context,
                                  const std::string &label) const
{
    bool result = false;
    std::string error;
    if (!condition.evaluate(context, result, error))
    {
        INKWEATHER_LOGW(TAG, "Condition '%s' failed: %s", label.c_str(), error.c_str());
        return false;
    }

    INKWEATHER_LOGD(TAG, "'%s' -> %s", label.c_str(), result ? "true" : "false");
    return result;
}

bool ConditionEvaluator::validate(const std::string &expression, std::string &error) const
{
    ParsedCondition condition;
    return ParsedCondition::parse(expression, condition, error);
}

bool ConditionEvaluator::isSignalName(const std::string &name)
{
    return findSignal(name) != nullptr;
}

const std::vector<std::string> &ConditionEvaluator::signalNames()
{
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const SignalEntry &entry : SIGNALS)
        {
            out.push_back(entry.name);
        }
        return out;
    }();
    return names;
}

SignalValue ConditionEvaluator::resolveSignal(const std::string &name, const ContextSnapshot &context)
{
    const SignalEntry *entry = findSignal(name);
    if (entry == nullptr)
    {
        // Unreachable for parsed conditions; the tokenizer rejects unknown names.
        return SignalValue::fromBool(false);
    }
    return entry->accessor(context);
}

} // namespace inkweather
