#ifndef ARBOR_TEMPLATE_HPP
#define ARBOR_TEMPLATE_HPP

#include "common.hpp"
#include "errors.hpp"

// Parse and execution failures of fragment templates
class TemplateError : public MalformedError
{
public:
    using MalformedError::MalformedError;
};

// Functions callable from templates; arguments arrive already evaluated
using TemplateFunction = std::function<json(const std::vector<json> &args)>;
using FuncMap = std::unordered_map<std::string, TemplateFunction>;

struct TemplatePipeline;

// One operand of a command
struct TemplateArg
{
    enum class Kind
    {
        DOT,      // .
        FIELD,    // .a.b, fields applied to dot
        VARIABLE, // $ or $.a.b, fields applied to the root value
        LITERAL,  // string, number or bool
        NIL,      // nil
        FUNCTION, // identifier naming a function
        PIPELINE  // ( pipeline ) with optional trailing fields
    };

    Kind kind{Kind::DOT};
    std::vector<std::string> fields;
    json literal;
    std::string name;
    std::shared_ptr<TemplatePipeline> pipeline;
};

struct TemplateCommand
{
    std::vector<TemplateArg> args;
};

// commands joined by '|', each result is passed as the last argument of the next
struct TemplatePipeline
{
    std::vector<TemplateCommand> commands;
};

struct TemplateNode
{
    enum class Kind
    {
        TEXT,
        ACTION,
        IF,
        RANGE,
        WITH,
        TEMPLATE
    };

    Kind kind{Kind::TEXT};
    int line{1};
    std::string text; // TEXT content, TEMPLATE callee name
    std::optional<TemplatePipeline> pipeline;
    std::vector<TemplateNode> list;
    std::vector<TemplateNode> elseList;
};

struct TemplateTree
{
    std::string name;
    std::vector<TemplateNode> root;

    // only whitespace text, as produced by files holding nothing but defines
    [[nodiscard]] bool isEmpty() const;
};

// Parser for the Go template subset used by fragment files.
//
// parse() returns the tree for the whole source first, followed by one tree
// per {{define}} / {{block}} in source order.
class TemplateParser
{
public:
    using FunctionLookup = std::function<bool(const std::string &)>;

    TemplateParser(std::string name, std::string_view source, FunctionLookup isFunction);

    [[nodiscard]] std::vector<TemplateTree> parse();

private:
    enum class TokenType
    {
        TEXT,
        LEFT_DELIM,
        RIGHT_DELIM,
        IDENTIFIER,
        FIELD,
        DOT,
        VARIABLE,
        STRING,
        NUMBER,
        PIPE,
        LEFT_PAREN,
        RIGHT_PAREN,
        END_OF_INPUT
    };

    struct Token
    {
        TokenType type;
        std::string value;
        int line;
        bool spaced; // whitespace preceded this token inside an action
    };

    enum class Stop
    {
        END_OF_INPUT,
        END,
        ELSE
    };

    std::string name;
    std::string_view source;
    FunctionLookup isFunction;
    std::vector<Token> tokens;
    size_t pos{0};
    int nesting{0};
    int stopLine{1};
    std::vector<TemplateTree> defined;

    void lex();
    void lexAction(size_t &i, int &line, bool &trimNext);

    [[nodiscard]] const Token &peek() const;
    const Token &next();
    const Token &expect(TokenType type, std::string_view context);
    [[noreturn]] void fail(int line, const std::string &message) const;
    [[nodiscard]] static std::string describe(const Token &tok);

    Stop parseList(std::vector<TemplateNode> &out);
    [[nodiscard]] TemplateNode parseControl(TemplateNode::Kind kind, const Token &keyword);
    [[nodiscard]] TemplateNode parseTemplateCall(const Token &keyword);
    void parseDefine(const Token &keyword);
    [[nodiscard]] TemplateNode parseBlock(const Token &keyword);
    [[nodiscard]] TemplatePipeline parsePipeline(TokenType terminator, std::string_view context);
    [[nodiscard]] TemplateArg parseOperand();
    void parseFieldChain(TemplateArg &arg);
    [[nodiscard]] std::string parseTemplateName(std::string_view context);

    [[nodiscard]] static json parseNumber(const std::string &text, bool &ok);
};

#endif // ARBOR_TEMPLATE_HPP
