#include "template.hpp"

namespace
{
    bool isSpace(char c)
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    bool isIdentStart(char c)
    {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool isIdentChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool isDigit(char c)
    {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // keywords that may not appear as operands
    const std::unordered_set<std::string_view> KEYWORDS = {
        "block", "define", "else", "end", "if", "range", "template", "with"};
}

bool TemplateTree::isEmpty() const
{
    return std::all_of(root.begin(), root.end(), [](const TemplateNode &node)
                       { return node.kind == TemplateNode::Kind::TEXT &&
                                std::all_of(node.text.begin(), node.text.end(), isSpace); });
}

TemplateParser::TemplateParser(std::string name, std::string_view source, FunctionLookup isFunction)
    : name(std::move(name)), source(source), isFunction(std::move(isFunction))
{
}

void TemplateParser::fail(int line, const std::string &message) const
{
    throw TemplateError("template: " + name + ":" + std::to_string(line) + ": " + message);
}

std::string TemplateParser::describe(const Token &tok)
{
    switch (tok.type)
    {
    case TokenType::END_OF_INPUT:
        return "EOF";
    case TokenType::RIGHT_DELIM:
        return "\"}}\"";
    case TokenType::LEFT_DELIM:
        return "\"{{\"";
    case TokenType::TEXT:
        return "text";
    case TokenType::FIELD:
        return "\"." + tok.value + "\"";
    default:
        return "\"" + tok.value + "\"";
    }
}

void TemplateParser::lex()
{
    const size_t n = source.size();
    size_t i = 0;
    int line = 1;
    bool trimNext = false;

    while (i < n)
    {
        size_t open = source.find("{{", i);
        size_t textEnd = open == std::string_view::npos ? n : open;

        std::string_view text = source.substr(i, textEnd - i);
        int textLine = line;
        line += static_cast<int>(std::count(text.begin(), text.end(), '\n'));

        // "{{- " trims whitespace before the action
        bool trimLeft = open != std::string_view::npos && open + 3 < n &&
                        source[open + 2] == '-' && isSpace(source[open + 3]);

        if (trimNext)
        {
            size_t skip = 0;
            while (skip < text.size() && isSpace(text[skip]))
            {
                if (text[skip] == '\n')
                    ++textLine;
                ++skip;
            }
            text.remove_prefix(skip);
            trimNext = false;
        }
        if (trimLeft)
        {
            while (!text.empty() && isSpace(text.back()))
                text.remove_suffix(1);
        }
        if (!text.empty())
        {
            tokens.push_back({TokenType::TEXT, std::string(text), textLine, false});
        }

        if (open == std::string_view::npos)
        {
            break;
        }
        i = open + 2 + (trimLeft ? 1 : 0);

        // comments occupy a whole action
        size_t k = i;
        while (k < n && isSpace(source[k]))
            ++k;
        if (source.substr(k).starts_with("/*"))
        {
            size_t close = source.find("*/", k + 2);
            if (close == std::string_view::npos)
            {
                fail(line, "unclosed comment");
            }
            std::string_view comment = source.substr(i, close + 2 - i);
            line += static_cast<int>(std::count(comment.begin(), comment.end(), '\n'));

            size_t m = close + 2;
            while (m < n && isSpace(source[m]))
            {
                if (source[m] == '\n')
                    ++line;
                ++m;
            }
            if (m > close + 2 && source.substr(m).starts_with("-}}"))
            {
                trimNext = true;
                i = m + 3;
            }
            else if (source.substr(m).starts_with("}}"))
            {
                i = m + 2;
            }
            else
            {
                fail(line, "comment ends before closing delimiter");
            }
            continue;
        }

        tokens.push_back({TokenType::LEFT_DELIM, "{{", line, false});
        lexAction(i, line, trimNext);
    }

    tokens.push_back({TokenType::END_OF_INPUT, "", line, false});
}

void TemplateParser::lexAction(size_t &i, int &line, bool &trimNext)
{
    const size_t n = source.size();
    bool spaced = false;

    for (;;)
    {
        if (i >= n)
        {
            fail(line, "unclosed action");
        }

        const char c = source[i];
        if (isSpace(c))
        {
            if (c == '\n')
                ++line;
            ++i;
            spaced = true;
            continue;
        }

        // " -}}" trims whitespace after the action
        if (spaced && source.substr(i).starts_with("-}}"))
        {
            tokens.push_back({TokenType::RIGHT_DELIM, "}}", line, true});
            i += 3;
            trimNext = true;
            return;
        }
        if (source.substr(i).starts_with("}}"))
        {
            tokens.push_back({TokenType::RIGHT_DELIM, "}}", line, spaced});
            i += 2;
            return;
        }

        Token tok{TokenType::IDENTIFIER, "", line, spaced};
        spaced = false;

        if (c == '|' || c == '(' || c == ')')
        {
            tok.type = c == '|' ? TokenType::PIPE : (c == '(' ? TokenType::LEFT_PAREN : TokenType::RIGHT_PAREN);
            tok.value = std::string(1, c);
            ++i;
        }
        else if (c == '"')
        {
            size_t j = i + 1;
            for (;;)
            {
                if (j >= n || source[j] == '\n')
                {
                    fail(line, "unterminated quoted string");
                }
                char d = source[j];
                if (d == '"')
                    break;
                if (d == '\\')
                {
                    if (j + 1 >= n)
                        fail(line, "unterminated quoted string");
                    switch (source[++j])
                    {
                    case 'n':
                        tok.value += '\n';
                        break;
                    case 't':
                        tok.value += '\t';
                        break;
                    case 'r':
                        tok.value += '\r';
                        break;
                    case '\\':
                        tok.value += '\\';
                        break;
                    case '"':
                        tok.value += '"';
                        break;
                    case '\'':
                        tok.value += '\'';
                        break;
                    default:
                        fail(line, std::string("unknown escape sequence \\") + source[j]);
                    }
                    ++j;
                    continue;
                }
                tok.value += d;
                ++j;
            }
            tok.type = TokenType::STRING;
            i = j + 1;
        }
        else if (c == '`')
        {
            size_t close = source.find('`', i + 1);
            if (close == std::string_view::npos)
            {
                fail(line, "unterminated raw quoted string");
            }
            tok.type = TokenType::STRING;
            tok.value = std::string(source.substr(i + 1, close - i - 1));
            line += static_cast<int>(std::count(tok.value.begin(), tok.value.end(), '\n'));
            i = close + 1;
        }
        else if (c == '.' && i + 1 < n && isIdentStart(source[i + 1]))
        {
            size_t j = i + 1;
            while (j < n && isIdentChar(source[j]))
                ++j;
            tok.type = TokenType::FIELD;
            tok.value = std::string(source.substr(i + 1, j - i - 1));
            i = j;
        }
        else if (isDigit(c) || ((c == '-' || c == '+' || c == '.') && i + 1 < n && isDigit(source[i + 1])))
        {
            size_t j = i + 1;
            while (j < n && (isIdentChar(source[j]) || source[j] == '.' ||
                             ((source[j] == '+' || source[j] == '-') &&
                              (source[j - 1] == 'e' || source[j - 1] == 'E'))))
                ++j;
            tok.type = TokenType::NUMBER;
            tok.value = std::string(source.substr(i, j - i));
            i = j;
        }
        else if (c == '.')
        {
            tok.type = TokenType::DOT;
            tok.value = ".";
            ++i;
        }
        else if (c == '$')
        {
            size_t j = i + 1;
            while (j < n && isIdentChar(source[j]))
                ++j;
            tok.type = TokenType::VARIABLE;
            tok.value = std::string(source.substr(i, j - i));
            i = j;
        }
        else if (isIdentStart(c))
        {
            size_t j = i + 1;
            while (j < n && isIdentChar(source[j]))
                ++j;
            tok.type = TokenType::IDENTIFIER;
            tok.value = std::string(source.substr(i, j - i));
            i = j;
        }
        else if (c == ':' || c == '=')
        {
            fail(line, "variable declarations are not supported");
        }
        else
        {
            fail(line, std::string("unexpected character '") + c + "' in action");
        }

        tokens.push_back(std::move(tok));
    }
}

const TemplateParser::Token &TemplateParser::peek() const
{
    return tokens[pos];
}

const TemplateParser::Token &TemplateParser::next()
{
    const Token &tok = tokens[pos];
    if (tok.type != TokenType::END_OF_INPUT)
    {
        ++pos;
    }
    return tok;
}

const TemplateParser::Token &TemplateParser::expect(TokenType type, std::string_view context)
{
    const Token &tok = next();
    if (tok.type != type)
    {
        fail(tok.line, "unexpected " + describe(tok) + " in " + std::string(context));
    }
    return tok;
}

std::vector<TemplateTree> TemplateParser::parse()
{
    lex();

    TemplateTree main{name, {}};
    Stop stop = parseList(main.root);
    if (stop == Stop::END)
    {
        fail(stopLine, "unexpected {{end}}");
    }
    if (stop == Stop::ELSE)
    {
        fail(stopLine, "unexpected {{else}}");
    }

    std::vector<TemplateTree> trees;
    trees.reserve(defined.size() + 1);
    trees.push_back(std::move(main));
    for (auto &tree : defined)
    {
        trees.push_back(std::move(tree));
    }
    return trees;
}

TemplateParser::Stop TemplateParser::parseList(std::vector<TemplateNode> &out)
{
    for (;;)
    {
        const Token &tok = next();
        switch (tok.type)
        {
        case TokenType::END_OF_INPUT:
            return Stop::END_OF_INPUT;

        case TokenType::TEXT:
        {
            TemplateNode text;
            text.kind = TemplateNode::Kind::TEXT;
            text.line = tok.line;
            text.text = tok.value;
            out.push_back(std::move(text));
            break;
        }

        case TokenType::LEFT_DELIM:
        {
            const Token &keyword = peek();
            if (keyword.type == TokenType::IDENTIFIER)
            {
                const std::string &word = keyword.value;
                if (word == "end")
                {
                    stopLine = next().line;
                    expect(TokenType::RIGHT_DELIM, "end");
                    return Stop::END;
                }
                if (word == "else")
                {
                    stopLine = next().line;
                    return Stop::ELSE;
                }
                if (word == "if")
                {
                    Token kw = next();
                    out.push_back(parseControl(TemplateNode::Kind::IF, kw));
                    break;
                }
                if (word == "range")
                {
                    Token kw = next();
                    out.push_back(parseControl(TemplateNode::Kind::RANGE, kw));
                    break;
                }
                if (word == "with")
                {
                    Token kw = next();
                    out.push_back(parseControl(TemplateNode::Kind::WITH, kw));
                    break;
                }
                if (word == "template")
                {
                    Token kw = next();
                    out.push_back(parseTemplateCall(kw));
                    break;
                }
                if (word == "define")
                {
                    Token kw = next();
                    parseDefine(kw);
                    break;
                }
                if (word == "block")
                {
                    Token kw = next();
                    out.push_back(parseBlock(kw));
                    break;
                }
            }

            TemplateNode action;
            action.kind = TemplateNode::Kind::ACTION;
            action.line = keyword.line;
            action.pipeline = parsePipeline(TokenType::RIGHT_DELIM, "command");
            out.push_back(std::move(action));
            break;
        }

        default:
            fail(tok.line, "unexpected " + describe(tok));
        }
    }
}

TemplateNode TemplateParser::parseControl(TemplateNode::Kind kind, const Token &keyword)
{
    TemplateNode node;
    node.kind = kind;
    node.line = keyword.line;
    node.pipeline = parsePipeline(TokenType::RIGHT_DELIM, keyword.value);

    ++nesting;
    Stop stop = parseList(node.list);
    if (stop == Stop::END_OF_INPUT)
    {
        fail(keyword.line, "unexpected EOF in " + keyword.value);
    }

    if (stop == Stop::ELSE)
    {
        // {{else if ..}} and {{else with ..}} chain into a nested node sharing one {{end}}
        const Token &after = peek();
        if (after.type == TokenType::IDENTIFIER &&
            ((kind == TemplateNode::Kind::IF && after.value == "if") ||
             (kind == TemplateNode::Kind::WITH && after.value == "with")))
        {
            Token kw = next();
            node.elseList.push_back(parseControl(kind, kw));
            --nesting;
            return node;
        }

        expect(TokenType::RIGHT_DELIM, "else");
        Stop elseStop = parseList(node.elseList);
        if (elseStop == Stop::ELSE)
        {
            fail(stopLine, "expected end; found {{else}}");
        }
        if (elseStop == Stop::END_OF_INPUT)
        {
            fail(keyword.line, "unexpected EOF in " + keyword.value);
        }
    }

    --nesting;
    return node;
}

std::string TemplateParser::parseTemplateName(std::string_view context)
{
    const Token &tok = next();
    if (tok.type != TokenType::STRING)
    {
        fail(tok.line, "unexpected " + describe(tok) + " in " + std::string(context));
    }
    return tok.value;
}

TemplateNode TemplateParser::parseTemplateCall(const Token &keyword)
{
    TemplateNode node;
    node.kind = TemplateNode::Kind::TEMPLATE;
    node.line = keyword.line;
    node.text = parseTemplateName("template clause");

    if (peek().type == TokenType::RIGHT_DELIM)
    {
        next();
    }
    else
    {
        node.pipeline = parsePipeline(TokenType::RIGHT_DELIM, "template clause");
    }
    return node;
}

void TemplateParser::parseDefine(const Token &keyword)
{
    if (nesting > 0)
    {
        fail(keyword.line, "unexpected define inside control structure");
    }

    TemplateTree tree{parseTemplateName("define clause"), {}};
    expect(TokenType::RIGHT_DELIM, "define clause");

    ++nesting;
    Stop stop = parseList(tree.root);
    --nesting;
    if (stop != Stop::END)
    {
        fail(keyword.line, stop == Stop::ELSE ? "unexpected {{else}} in define clause"
                                              : "unexpected EOF in define clause");
    }
    defined.push_back(std::move(tree));
}

TemplateNode TemplateParser::parseBlock(const Token &keyword)
{
    TemplateNode node;
    node.kind = TemplateNode::Kind::TEMPLATE;
    node.line = keyword.line;
    node.text = parseTemplateName("block clause");
    node.pipeline = parsePipeline(TokenType::RIGHT_DELIM, "block clause");

    TemplateTree tree{node.text, {}};
    ++nesting;
    Stop stop = parseList(tree.root);
    --nesting;
    if (stop != Stop::END)
    {
        fail(keyword.line, stop == Stop::ELSE ? "unexpected {{else}} in block clause"
                                              : "unexpected EOF in block clause");
    }
    defined.push_back(std::move(tree));
    return node;
}

TemplatePipeline TemplateParser::parsePipeline(TokenType terminator, std::string_view context)
{
    TemplatePipeline pipeline;
    for (;;)
    {
        TemplateCommand command;
        for (;;)
        {
            const Token &tok = peek();
            if (tok.type == terminator || tok.type == TokenType::PIPE)
            {
                break;
            }
            if (tok.type == TokenType::END_OF_INPUT || tok.type == TokenType::RIGHT_DELIM ||
                tok.type == TokenType::RIGHT_PAREN)
            {
                fail(tok.line, terminator == TokenType::RIGHT_PAREN && tok.type != TokenType::RIGHT_PAREN
                                   ? "unclosed left paren"
                                   : "unexpected " + describe(tok) + " in " + std::string(context));
            }
            command.args.push_back(parseOperand());
        }

        if (command.args.empty())
        {
            fail(peek().line, "missing value for " + std::string(context));
        }
        if (command.args.front().kind == TemplateArg::Kind::NIL)
        {
            fail(peek().line, "nil is not a command");
        }
        pipeline.commands.push_back(std::move(command));

        if (next().type == terminator)
        {
            break;
        }
    }
    return pipeline;
}

void TemplateParser::parseFieldChain(TemplateArg &arg)
{
    while (peek().type == TokenType::FIELD && !peek().spaced)
    {
        arg.fields.push_back(next().value);
    }
}

TemplateArg TemplateParser::parseOperand()
{
    const Token &tok = next();
    TemplateArg arg;

    switch (tok.type)
    {
    case TokenType::DOT:
        arg.kind = TemplateArg::Kind::DOT;
        break;

    case TokenType::FIELD:
        arg.kind = TemplateArg::Kind::FIELD;
        arg.fields.push_back(tok.value);
        parseFieldChain(arg);
        break;

    case TokenType::VARIABLE:
        if (tok.value != "$")
        {
            fail(tok.line, "undefined variable \"" + tok.value + "\"");
        }
        arg.kind = TemplateArg::Kind::VARIABLE;
        parseFieldChain(arg);
        break;

    case TokenType::STRING:
        arg.kind = TemplateArg::Kind::LITERAL;
        arg.literal = tok.value;
        break;

    case TokenType::NUMBER:
    {
        bool ok = false;
        arg.kind = TemplateArg::Kind::LITERAL;
        arg.literal = parseNumber(tok.value, ok);
        if (!ok)
        {
            fail(tok.line, "bad number syntax: \"" + tok.value + "\"");
        }
        break;
    }

    case TokenType::IDENTIFIER:
        if (tok.value == "true" || tok.value == "false")
        {
            arg.kind = TemplateArg::Kind::LITERAL;
            arg.literal = tok.value == "true";
        }
        else if (tok.value == "nil")
        {
            arg.kind = TemplateArg::Kind::NIL;
        }
        else if (KEYWORDS.contains(tok.value))
        {
            fail(tok.line, "unexpected <" + tok.value + "> in operand");
        }
        else if (!isFunction(tok.value))
        {
            fail(tok.line, "function \"" + tok.value + "\" not defined");
        }
        else
        {
            arg.kind = TemplateArg::Kind::FUNCTION;
            arg.name = tok.value;
        }
        break;

    case TokenType::LEFT_PAREN:
        arg.kind = TemplateArg::Kind::PIPELINE;
        arg.pipeline = std::make_shared<TemplatePipeline>(
            parsePipeline(TokenType::RIGHT_PAREN, "parenthesized pipeline"));
        parseFieldChain(arg);
        break;

    default:
        fail(tok.line, "unexpected " + describe(tok) + " in operand");
    }

    if (peek().type == TokenType::DOT && !peek().spaced)
    {
        fail(peek().line, "unexpected . after term");
    }
    return arg;
}

json TemplateParser::parseNumber(const std::string &text, bool &ok)
{
    ok = false;
    std::string_view digits(text);
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+'))
        digits.remove_prefix(1);

    bool isHex = digits.starts_with("0x") || digits.starts_with("0X");
    bool isFloat = !isHex && text.find_first_of(".eE") != std::string::npos;

    try
    {
        size_t used = 0;
        if (isFloat)
        {
            double value = std::stod(text, &used);
            ok = used == text.size();
            return value;
        }
        long long value = std::stoll(text, &used, 0);
        ok = used == text.size();
        return value;
    }
    catch (const std::logic_error &)
    {
        return nullptr;
    }
}
