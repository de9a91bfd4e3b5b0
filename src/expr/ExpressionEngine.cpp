#include "loglens/expr/ExpressionEngine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>

#include "loglens/core/Errors.hpp"
#include "loglens/utils/StringUtils.hpp"

namespace LogLens
{
    namespace Expr
    {
        using Core::ConfigurationError;
        using Core::EvaluationError;

        enum class NodeKind
        {
            Literal,
            Field,
            List,
            Negate,
            Not,
            And,
            Or,
            Binary,
            In,
            Call,
        };

        struct CompiledExpression::Node
        {
            NodeKind                                 kind = NodeKind::Literal;
            Value                                    literal;
            std::string                              name;     // field root, operator or function
            std::vector<std::string>                 path;     // metadata segments
            std::vector<std::shared_ptr<const Node>> children;
            bool                                     negated = false;  // "not in"
        };

        namespace
        {
            using Node    = CompiledExpression::Node;
            using NodePtr = std::shared_ptr<const Node>;

            // ---------------------------------------------------------------
            // Lexer
            // ---------------------------------------------------------------

            enum class TokenType
            {
                Number,
                String,
                Identifier,
                Operator,
                LParen,
                RParen,
                LBracket,
                RBracket,
                Comma,
                Dot,
                End,
            };

            struct Token
            {
                TokenType   type = TokenType::End;
                std::string text;
                double      number = 0.0;
                std::size_t pos = 0;
            };

            [[noreturn]] void syntaxError(std::string_view source, std::size_t pos, const std::string &what)
            {
                throw ConfigurationError("invalid expression '" + std::string(source) + "' at offset " +
                                         std::to_string(pos) + ": " + what);
            }

            std::vector<Token> tokenize(std::string_view src)
            {
                std::vector<Token> tokens;
                std::size_t i = 0;

                auto isIdentStart = [](char c) {
                    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
                };
                auto isIdentChar = [](char c) {
                    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
                };
                auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

                while (i < src.size())
                {
                    const char c = src[i];
                    if (std::isspace(static_cast<unsigned char>(c)) != 0)
                    {
                        ++i;
                        continue;
                    }

                    Token tok;
                    tok.pos = i;

                    if (isDigit(c))
                    {
                        std::size_t j = i;
                        while (j < src.size() && isDigit(src[j]))
                            ++j;
                        if (j + 1 < src.size() && src[j] == '.' && isDigit(src[j + 1]))
                        {
                            ++j;
                            while (j < src.size() && isDigit(src[j]))
                                ++j;
                        }
                        if (j < src.size() && (src[j] == 'e' || src[j] == 'E'))
                        {
                            std::size_t k = j + 1;
                            if (k < src.size() && (src[k] == '+' || src[k] == '-'))
                                ++k;
                            if (k < src.size() && isDigit(src[k]))
                            {
                                while (k < src.size() && isDigit(src[k]))
                                    ++k;
                                j = k;
                            }
                        }
                        const auto number = Utils::parseDouble(src.substr(i, j - i));
                        if (!number)
                        {
                            syntaxError(src, i, "bad number literal");
                        }
                        tok.type = TokenType::Number;
                        tok.number = *number;
                        tok.text = std::string(src.substr(i, j - i));
                        i = j;
                    }
                    else if (c == '\'' || c == '"')
                    {
                        const char quote = c;
                        std::size_t j = i + 1;
                        std::string text;
                        bool closed = false;
                        while (j < src.size())
                        {
                            const char ch = src[j];
                            if (ch == '\\' && j + 1 < src.size())
                            {
                                const char esc = src[j + 1];
                                switch (esc)
                                {
                                case 'n':  text.push_back('\n'); break;
                                case 't':  text.push_back('\t'); break;
                                case 'r':  text.push_back('\r'); break;
                                default:   text.push_back(esc);  break;
                                }
                                j += 2;
                                continue;
                            }
                            if (ch == quote)
                            {
                                closed = true;
                                ++j;
                                break;
                            }
                            text.push_back(ch);
                            ++j;
                        }
                        if (!closed)
                        {
                            syntaxError(src, i, "unterminated string literal");
                        }
                        tok.type = TokenType::String;
                        tok.text = std::move(text);
                        i = j;
                    }
                    else if (isIdentStart(c))
                    {
                        std::size_t j = i;
                        while (j < src.size() && isIdentChar(src[j]))
                            ++j;
                        tok.type = TokenType::Identifier;
                        tok.text = std::string(src.substr(i, j - i));
                        i = j;
                    }
                    else
                    {
                        const std::string_view two = src.substr(i, 2);
                        if (two == "==" || two == "!=" || two == "<=" || two == ">=" ||
                            two == "&&" || two == "||")
                        {
                            tok.type = TokenType::Operator;
                            tok.text = std::string(two);
                            i += 2;
                        }
                        else
                        {
                            switch (c)
                            {
                            case '(': tok.type = TokenType::LParen;   break;
                            case ')': tok.type = TokenType::RParen;   break;
                            case '[': tok.type = TokenType::LBracket; break;
                            case ']': tok.type = TokenType::RBracket; break;
                            case ',': tok.type = TokenType::Comma;    break;
                            case '.': tok.type = TokenType::Dot;      break;
                            case '<': case '>': case '+': case '-':
                            case '*': case '/': case '%': case '!':
                                tok.type = TokenType::Operator;
                                break;
                            case '=':
                                syntaxError(src, i, "use '==' for comparison");
                            default:
                                syntaxError(src, i, std::string("unexpected character '") + c + "'");
                            }
                            tok.text = std::string(1, c);
                            ++i;
                        }
                    }

                    tokens.push_back(std::move(tok));
                }

                Token end;
                end.type = TokenType::End;
                end.pos = src.size();
                tokens.push_back(end);
                return tokens;
            }

            // ---------------------------------------------------------------
            // Parser
            // ---------------------------------------------------------------

            struct FunctionSpec
            {
                const char *name;
                std::size_t minArgs;
                std::size_t maxArgs;
            };

            constexpr std::size_t kVariadic = static_cast<std::size_t>(-1);

            constexpr FunctionSpec kFunctions[] = {
                {"contains",   2, 2},
                {"startswith", 2, 2},
                {"endswith",   2, 2},
                {"lower",      1, 1},
                {"upper",      1, 1},
                {"len",        1, 1},
                {"exists",     1, 1},
                {"number",     1, 1},
                {"abs",        1, 1},
                {"str",        1, 1},
                {"coalesce",   1, kVariadic},
            };

            const FunctionSpec *findFunction(std::string_view name)
            {
                for (const auto &spec : kFunctions)
                {
                    if (name == spec.name)
                        return &spec;
                }
                return nullptr;
            }

            NodePtr makeLiteral(Value v)
            {
                auto node = std::make_shared<Node>();
                node->kind = NodeKind::Literal;
                node->literal = std::move(v);
                return node;
            }

            NodePtr makeNode(NodeKind kind, std::string name, std::vector<NodePtr> children)
            {
                auto node = std::make_shared<Node>();
                node->kind = kind;
                node->name = std::move(name);
                node->children = std::move(children);
                return node;
            }

            class Parser
            {
            public:
                Parser(std::vector<Token> tokens, std::string_view source)
                    : m_tokens(std::move(tokens)),
                      m_source(source)
                {
                }

                NodePtr parse()
                {
                    if (peek().type == TokenType::End)
                    {
                        fail("empty expression");
                    }
                    NodePtr root = parseOr();
                    if (peek().type != TokenType::End)
                    {
                        fail("unexpected '" + peek().text + "'");
                    }
                    return root;
                }

            private:
                const Token &peek(std::size_t offset = 0) const
                {
                    const std::size_t idx = std::min(m_index + offset, m_tokens.size() - 1);
                    return m_tokens[idx];
                }

                const Token &advance()
                {
                    const Token &tok = m_tokens[m_index];
                    if (m_index + 1 < m_tokens.size())
                        ++m_index;
                    return tok;
                }

                bool isKeyword(const Token &tok, std::string_view word) const
                {
                    return tok.type == TokenType::Identifier && Utils::iequals(tok.text, word);
                }

                bool matchKeyword(std::string_view word)
                {
                    if (isKeyword(peek(), word))
                    {
                        advance();
                        return true;
                    }
                    return false;
                }

                bool matchOperator(std::string_view op)
                {
                    if (peek().type == TokenType::Operator && peek().text == op)
                    {
                        advance();
                        return true;
                    }
                    return false;
                }

                void expect(TokenType type, const char *what)
                {
                    if (peek().type != type)
                    {
                        fail(std::string("expected ") + what);
                    }
                    advance();
                }

                [[noreturn]] void fail(const std::string &what) const
                {
                    syntaxError(m_source, peek().pos, what);
                }

                NodePtr parseOr()
                {
                    NodePtr left = parseAnd();
                    while (matchKeyword("or") || matchOperator("||"))
                    {
                        left = makeNode(NodeKind::Or, "or", {left, parseAnd()});
                    }
                    return left;
                }

                NodePtr parseAnd()
                {
                    NodePtr left = parseNot();
                    while (matchKeyword("and") || matchOperator("&&"))
                    {
                        left = makeNode(NodeKind::And, "and", {left, parseNot()});
                    }
                    return left;
                }

                NodePtr parseNot()
                {
                    if (matchKeyword("not") || matchOperator("!"))
                    {
                        return makeNode(NodeKind::Not, "not", {parseNot()});
                    }
                    return parseComparison();
                }

                NodePtr parseComparison()
                {
                    NodePtr left = parseAdditive();

                    const Token &tok = peek();
                    if (tok.type == TokenType::Operator &&
                        (tok.text == "==" || tok.text == "!=" || tok.text == "<" ||
                         tok.text == "<=" || tok.text == ">" || tok.text == ">="))
                    {
                        const std::string op = advance().text;
                        return makeNode(NodeKind::Binary, op, {left, parseAdditive()});
                    }
                    if (matchKeyword("in"))
                    {
                        return makeNode(NodeKind::In, "in", {left, parseAdditive()});
                    }
                    if (isKeyword(peek(), "not") && isKeyword(peek(1), "in"))
                    {
                        advance();
                        advance();
                        auto node = std::make_shared<Node>();
                        node->kind = NodeKind::In;
                        node->name = "not in";
                        node->negated = true;
                        node->children = {left, parseAdditive()};
                        return node;
                    }
                    return left;
                }

                NodePtr parseAdditive()
                {
                    NodePtr left = parseTerm();
                    while (peek().type == TokenType::Operator &&
                           (peek().text == "+" || peek().text == "-"))
                    {
                        const std::string op = advance().text;
                        left = makeNode(NodeKind::Binary, op, {left, parseTerm()});
                    }
                    return left;
                }

                NodePtr parseTerm()
                {
                    NodePtr left = parseUnary();
                    while (peek().type == TokenType::Operator &&
                           (peek().text == "*" || peek().text == "/" || peek().text == "%"))
                    {
                        const std::string op = advance().text;
                        left = makeNode(NodeKind::Binary, op, {left, parseUnary()});
                    }
                    return left;
                }

                NodePtr parseUnary()
                {
                    if (matchOperator("-"))
                    {
                        return makeNode(NodeKind::Negate, "-", {parseUnary()});
                    }
                    return parsePrimary();
                }

                NodePtr parseList(TokenType closing, const char *closingText)
                {
                    std::vector<NodePtr> items;
                    while (peek().type != closing)
                    {
                        items.push_back(parseOr());
                        if (peek().type == TokenType::Comma)
                        {
                            advance();
                            continue;
                        }
                        break;
                    }
                    expect(closing, closingText);
                    return makeNode(NodeKind::List, "list", std::move(items));
                }

                NodePtr parsePrimary()
                {
                    const Token &tok = peek();
                    switch (tok.type)
                    {
                    case TokenType::Number:
                        return makeLiteral(advance().number);

                    case TokenType::String:
                        return makeLiteral(advance().text);

                    case TokenType::LBracket:
                        advance();
                        return parseList(TokenType::RBracket, "']'");

                    case TokenType::LParen:
                    {
                        advance();
                        if (peek().type == TokenType::RParen)
                        {
                            advance();
                            return makeNode(NodeKind::List, "list", {});
                        }
                        NodePtr first = parseOr();
                        if (peek().type == TokenType::RParen)
                        {
                            advance();
                            return first;
                        }
                        if (peek().type != TokenType::Comma)
                        {
                            fail("expected ')' or ','");
                        }
                        advance();
                        auto rest = parseList(TokenType::RParen, "')'");
                        auto list = std::make_shared<Node>(*rest);
                        list->children.insert(list->children.begin(), first);
                        return list;
                    }

                    case TokenType::Identifier:
                        return parseIdentifier();

                    default:
                        break;
                    }
                    fail(tok.type == TokenType::End ? "unexpected end of expression"
                                                    : "unexpected '" + tok.text + "'");
                }

                NodePtr parseIdentifier()
                {
                    const Token &tok = advance();
                    const std::string lowered = Utils::toLower(tok.text);

                    if (peek().type == TokenType::LParen)
                    {
                        return parseCall(lowered);
                    }
                    if (lowered == "true")
                        return makeLiteral(true);
                    if (lowered == "false")
                        return makeLiteral(false);
                    if (lowered == "null" || lowered == "none")
                        return makeLiteral(std::monostate{});

                    std::string root = lowered;
                    if (root == "event" && peek().type == TokenType::Dot)
                    {
                        advance();
                        if (peek().type != TokenType::Identifier)
                        {
                            fail("expected field name after 'event.'");
                        }
                        root = Utils::toLower(advance().text);
                    }

                    if (root == "level" || root == "source" || root == "message" || root == "timestamp")
                    {
                        return makeNode(NodeKind::Field, root, {});
                    }
                    if (root == "metadata")
                    {
                        return parseMetadataPath();
                    }
                    syntaxError(m_source, tok.pos, "unknown field '" + tok.text + "'");
                }

                NodePtr parseMetadataPath()
                {
                    auto node = std::make_shared<Node>();
                    node->kind = NodeKind::Field;
                    node->name = "metadata";

                    while (true)
                    {
                        if (peek().type == TokenType::Dot)
                        {
                            advance();
                            if (peek().type != TokenType::Identifier)
                            {
                                fail("expected metadata key after '.'");
                            }
                            node->path.push_back(advance().text);
                        }
                        else if (peek().type == TokenType::LBracket)
                        {
                            advance();
                            if (peek().type != TokenType::String)
                            {
                                fail("expected quoted metadata key");
                            }
                            node->path.push_back(advance().text);
                            expect(TokenType::RBracket, "']'");
                        }
                        else
                        {
                            break;
                        }
                    }

                    if (node->path.empty())
                    {
                        fail("metadata needs a key (metadata.key or metadata['key'])");
                    }
                    return node;
                }

                NodePtr parseCall(const std::string &name)
                {
                    const std::size_t pos = peek().pos;
                    const FunctionSpec *spec = findFunction(name);
                    if (!spec)
                    {
                        syntaxError(m_source, pos, "unknown function '" + name + "'");
                    }

                    advance();  // '('
                    auto args = parseList(TokenType::RParen, "')'");
                    const std::size_t argc = args->children.size();
                    if (argc < spec->minArgs || (spec->maxArgs != kVariadic && argc > spec->maxArgs))
                    {
                        syntaxError(m_source, pos, "wrong number of arguments to " + name + "()");
                    }
                    return makeNode(NodeKind::Call, name, args->children);
                }

            private:
                std::vector<Token> m_tokens;
                std::size_t        m_index = 0;
                std::string_view   m_source;
            };

            // ---------------------------------------------------------------
            // Evaluation
            // ---------------------------------------------------------------

            const char *typeName(const Value &v) noexcept
            {
                switch (v.index())
                {
                case 0: return "null";
                case 1: return "boolean";
                case 2: return "number";
                default: return "string";
                }
            }

            bool isNull(const Value &v) noexcept { return std::holds_alternative<std::monostate>(v); }
            const double *asNumber(const Value &v) noexcept { return std::get_if<double>(&v); }
            const std::string *asString(const Value &v) noexcept { return std::get_if<std::string>(&v); }

            bool valuesEqual(const Value &a, const Value &b)
            {
                // Values of different types are never equal.
                return a == b;
            }

            const Core::MetadataValue *lookupMetadata(const Core::Event &event,
                                                      const std::vector<std::string> &path)
            {
                if (path.size() == 1)
                {
                    auto it = event.metadata().find(path.front());
                    return it == event.metadata().end() ? nullptr : &it->second;
                }

                // Flat "a.b" keys take precedence over nested objects.
                std::string joined = path.front();
                for (std::size_t i = 1; i < path.size(); ++i)
                {
                    joined += ".";
                    joined += path[i];
                }
                if (auto it = event.metadata().find(joined); it != event.metadata().end())
                {
                    return &it->second;
                }

                const Core::Metadata *current = &event.metadata();
                const Core::MetadataValue *found = nullptr;
                for (const auto &segment : path)
                {
                    if (!current)
                    {
                        return nullptr;
                    }
                    auto it = current->find(segment);
                    if (it == current->end())
                    {
                        return nullptr;
                    }
                    found = &it->second;
                    current = found->asObject();
                }
                return found;
            }

            Value fromMetadata(const Core::MetadataValue *value)
            {
                if (!value)
                    return std::monostate{};
                if (const auto *b = value->asBool())
                    return *b;
                if (const auto n = value->asNumber())
                    return *n;
                if (const auto *s = value->asString())
                    return *s;
                // Objects only answer exists().
                return std::monostate{};
            }

            Value evaluateNode(const Node &node, const Core::Event &event);

            Value resolveField(const Node &node, const Core::Event &event)
            {
                if (node.name == "level")
                    return std::string(Core::toString(event.level()));
                if (node.name == "source")
                    return event.source();
                if (node.name == "message")
                    return event.message();
                if (node.name == "timestamp")
                    return Utils::toEpochSeconds(event.timestamp());
                return fromMetadata(lookupMetadata(event, node.path));
            }

            double requireNumber(const Value &v, const std::string &op)
            {
                if (const double *n = asNumber(v))
                {
                    return *n;
                }
                throw EvaluationError("operator '" + op + "' expects numbers, got " + typeName(v));
            }

            Value evaluateBinary(const Node &node, const Core::Event &event)
            {
                const Value lhs = evaluateNode(*node.children[0], event);
                const Value rhs = evaluateNode(*node.children[1], event);
                const std::string &op = node.name;

                if (op == "==")
                    return valuesEqual(lhs, rhs);
                if (op == "!=")
                    return !valuesEqual(lhs, rhs);

                if (op == "<" || op == "<=" || op == ">" || op == ">=")
                {
                    if (isNull(lhs) || isNull(rhs))
                    {
                        return false;
                    }
                    int cmp = 0;
                    if (asNumber(lhs) && asNumber(rhs))
                    {
                        const double a = *asNumber(lhs);
                        const double b = *asNumber(rhs);
                        cmp = (a < b) ? -1 : (a > b ? 1 : 0);
                    }
                    else if (asString(lhs) && asString(rhs))
                    {
                        cmp = asString(lhs)->compare(*asString(rhs));
                    }
                    else
                    {
                        throw EvaluationError(std::string("cannot order ") + typeName(lhs) +
                                              " against " + typeName(rhs));
                    }
                    if (op == "<")
                        return cmp < 0;
                    if (op == "<=")
                        return cmp <= 0;
                    if (op == ">")
                        return cmp > 0;
                    return cmp >= 0;
                }

                if (op == "+" && asString(lhs) && asString(rhs))
                {
                    return *asString(lhs) + *asString(rhs);
                }

                const double a = requireNumber(lhs, op);
                const double b = requireNumber(rhs, op);
                if (op == "+")
                    return a + b;
                if (op == "-")
                    return a - b;
                if (op == "*")
                    return a * b;
                if (b == 0.0)
                {
                    throw EvaluationError("division by zero");
                }
                if (op == "/")
                    return a / b;
                return std::fmod(a, b);
            }

            Value evaluateIn(const Node &node, const Core::Event &event)
            {
                const Value needle = evaluateNode(*node.children[0], event);
                const Node &haystack = *node.children[1];

                bool found = false;
                if (haystack.kind == NodeKind::List)
                {
                    for (const auto &item : haystack.children)
                    {
                        if (valuesEqual(needle, evaluateNode(*item, event)))
                        {
                            found = true;
                            break;
                        }
                    }
                }
                else
                {
                    const Value container = evaluateNode(haystack, event);
                    if (isNull(container) || isNull(needle))
                    {
                        found = false;
                    }
                    else if (asString(container) && asString(needle))
                    {
                        found = asString(container)->find(*asString(needle)) != std::string::npos;
                    }
                    else
                    {
                        throw EvaluationError(std::string("'in' expects a list or a string, got ") +
                                              typeName(needle) + " in " + typeName(container));
                    }
                }
                return node.negated ? !found : found;
            }

            Value evaluateCall(const Node &node, const Core::Event &event)
            {
                const std::string &fn = node.name;

                if (fn == "exists")
                {
                    const Node &arg = *node.children[0];
                    if (arg.kind == NodeKind::Field && arg.name == "metadata")
                    {
                        return lookupMetadata(event, arg.path) != nullptr;
                    }
                    return !isNull(evaluateNode(arg, event));
                }

                if (fn == "coalesce")
                {
                    for (const auto &arg : node.children)
                    {
                        Value v = evaluateNode(*arg, event);
                        if (!isNull(v))
                            return v;
                    }
                    return std::monostate{};
                }

                const Value first = evaluateNode(*node.children[0], event);

                if (fn == "contains" || fn == "startswith" || fn == "endswith")
                {
                    const Value second = evaluateNode(*node.children[1], event);
                    if (isNull(first) || isNull(second))
                    {
                        return false;
                    }
                    if (!asString(first) || !asString(second))
                    {
                        throw EvaluationError(fn + "() expects strings");
                    }
                    const std::string &s = *asString(first);
                    const std::string &part = *asString(second);
                    if (fn == "contains")
                        return s.find(part) != std::string::npos;
                    if (fn == "startswith")
                        return Utils::startsWith(s, part);
                    return Utils::endsWith(s, part);
                }

                if (fn == "lower" || fn == "upper")
                {
                    if (isNull(first))
                        return std::monostate{};
                    if (!asString(first))
                        throw EvaluationError(fn + "() expects a string, got " + typeName(first));
                    return fn == "lower" ? Utils::toLower(*asString(first)) : Utils::toUpper(*asString(first));
                }

                if (fn == "len")
                {
                    if (isNull(first))
                        return 0.0;
                    if (!asString(first))
                        throw EvaluationError("len() expects a string, got " + std::string(typeName(first)));
                    return static_cast<double>(asString(first)->size());
                }

                if (fn == "number")
                {
                    if (const double *n = asNumber(first))
                        return *n;
                    if (const bool *b = std::get_if<bool>(&first))
                        return *b ? 1.0 : 0.0;
                    if (const std::string *s = asString(first))
                    {
                        if (const auto parsed = Utils::parseDouble(*s))
                            return *parsed;
                    }
                    return std::monostate{};
                }

                if (fn == "abs")
                {
                    if (isNull(first))
                        return std::monostate{};
                    if (const double *n = asNumber(first))
                        return std::fabs(*n);
                    throw EvaluationError("abs() expects a number, got " + std::string(typeName(first)));
                }

                // str()
                return toDisplayString(first);
            }

            Value evaluateNode(const Node &node, const Core::Event &event)
            {
                switch (node.kind)
                {
                case NodeKind::Literal:
                    return node.literal;

                case NodeKind::Field:
                    return resolveField(node, event);

                case NodeKind::List:
                    throw EvaluationError("a list can only appear on the right of 'in'");

                case NodeKind::Negate:
                {
                    const Value v = evaluateNode(*node.children[0], event);
                    return -requireNumber(v, "-");
                }

                case NodeKind::Not:
                    return !isTruthy(evaluateNode(*node.children[0], event));

                case NodeKind::And:
                    return isTruthy(evaluateNode(*node.children[0], event)) &&
                           isTruthy(evaluateNode(*node.children[1], event));

                case NodeKind::Or:
                    return isTruthy(evaluateNode(*node.children[0], event)) ||
                           isTruthy(evaluateNode(*node.children[1], event));

                case NodeKind::Binary:
                    return evaluateBinary(node, event);

                case NodeKind::In:
                    return evaluateIn(node, event);

                case NodeKind::Call:
                    return evaluateCall(node, event);
                }
                throw EvaluationError("unsupported expression node");
            }

        } // anonymous namespace

        // -------------------------------------------------------------------

        bool isTruthy(const Value &value) noexcept
        {
            if (const bool *b = std::get_if<bool>(&value))
                return *b;
            if (const double *n = std::get_if<double>(&value))
                return *n != 0.0 && !std::isnan(*n);
            if (const std::string *s = std::get_if<std::string>(&value))
                return !s->empty();
            return false;
        }

        std::string toDisplayString(const Value &value)
        {
            if (const bool *b = std::get_if<bool>(&value))
                return *b ? "true" : "false";
            if (const double *n = std::get_if<double>(&value))
                return Utils::formatNumber(*n);
            if (const std::string *s = std::get_if<std::string>(&value))
                return *s;
            return "null";
        }

        CompiledExpression::CompiledExpression(std::shared_ptr<const Node> root, std::string source)
            : m_root(std::move(root)),
              m_source(std::move(source))
        {
        }

        Value CompiledExpression::evaluate(const Core::Event &event) const
        {
            return evaluateNode(*m_root, event);
        }

        CompiledExpression ExpressionEngine::compile(std::string_view expression) const
        {
            const std::string_view trimmed = Utils::trim(expression);
            Parser parser(tokenize(trimmed), trimmed);
            return CompiledExpression(parser.parse(), std::string(trimmed));
        }

        EventPredicate ExpressionEngine::compilePredicate(std::string_view expression) const
        {
            CompiledExpression compiled = compile(expression);
            return [compiled](const Core::Event &event) {
                return isTruthy(compiled.evaluate(event));
            };
        }

        GroupKeyExtractor ExpressionEngine::compileGroupKey(std::string_view expression) const
        {
            CompiledExpression compiled = compile(expression);
            return [compiled](const Core::Event &event) {
                const Value v = compiled.evaluate(event);
                if (isNull(v))
                {
                    throw EvaluationError("group key '" + compiled.source() + "' evaluated to null");
                }
                return toDisplayString(v);
            };
        }

        ValueExtractor ExpressionEngine::compileValue(std::string_view expression) const
        {
            CompiledExpression compiled = compile(expression);
            return [compiled](const Core::Event &event) {
                const Value v = compiled.evaluate(event);
                if (const double *n = asNumber(v))
                {
                    return *n;
                }
                throw EvaluationError("value '" + compiled.source() + "' produced " +
                                      typeName(v) + " instead of a number");
            };
        }

    } // namespace Expr
} // namespace LogLens
