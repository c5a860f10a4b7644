#include "template_set.hpp"

namespace
{
    const std::unordered_set<std::string_view> BUILTINS = {
        "and", "or", "not", "eq", "ne", "lt", "le", "gt", "ge",
        "len", "index", "print", "urlquery"};

    // scalar kinds that the comparison functions accept
    enum class Basic
    {
        NIL,
        BOOL,
        NUMBER,
        STRING,
        OTHER
    };

    Basic basicKind(const json &value)
    {
        if (value.is_null())
            return Basic::NIL;
        if (value.is_boolean())
            return Basic::BOOL;
        if (value.is_number())
            return Basic::NUMBER;
        if (value.is_string())
            return Basic::STRING;
        return Basic::OTHER;
    }

    bool truthy(const json &value)
    {
        switch (value.type())
        {
        case json::value_t::null:
        case json::value_t::discarded:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<int64_t>() != 0;
        case json::value_t::number_unsigned:
            return value.get<uint64_t>() != 0;
        case json::value_t::number_float:
            return value.get<double>() != 0.0;
        case json::value_t::string:
            return !value.get_ref<const std::string &>().empty();
        default:
            return !value.empty();
        }
    }

    std::string printValue(const json &value)
    {
        if (value.is_null())
            return "";
        if (value.is_string())
            return value.get<std::string>();
        return value.dump();
    }

    // fmt.Sprint spacing: a space between operands when neither is a string
    std::string sprint(const std::vector<json> &args)
    {
        std::string result;
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (i > 0 && !args[i - 1].is_string() && !args[i].is_string())
                result += ' ';
            result += printValue(args[i]);
        }
        return result;
    }
}

class TemplateSet::Execution
{
public:
    explicit Execution(const TemplateSet &set) : set(set) {}

    // $ is the data a template was entered with
    void run(const TemplateTree &tree, const json &dot, int depth)
    {
        std::string caller = std::exchange(treeName, tree.name);
        const json *callerRoot = std::exchange(root, &dot);
        walk(tree.root, dot, depth);
        root = callerRoot;
        treeName = std::move(caller);
    }

    std::string out;

private:
    const TemplateSet &set;
    const json *root{nullptr};
    std::string treeName;

    [[noreturn]] void fail(int line, const std::string &message) const
    {
        throw TemplateError("template: " + treeName + ":" + std::to_string(line) +
                            ": executing \"" + treeName + "\": " + message);
    }

    void walk(const std::vector<TemplateNode> &list, const json &dot, int depth)
    {
        for (const auto &node : list)
        {
            switch (node.kind)
            {
            case TemplateNode::Kind::TEXT:
                out += node.text;
                break;

            case TemplateNode::Kind::ACTION:
                out += escapeHtml(printValue(evalPipeline(*node.pipeline, dot, node.line)));
                break;

            case TemplateNode::Kind::IF:
                if (truthy(evalPipeline(*node.pipeline, dot, node.line)))
                    walk(node.list, dot, depth);
                else
                    walk(node.elseList, dot, depth);
                break;

            case TemplateNode::Kind::WITH:
            {
                json value = evalPipeline(*node.pipeline, dot, node.line);
                if (truthy(value))
                    walk(node.list, value, depth);
                else
                    walk(node.elseList, dot, depth);
                break;
            }

            case TemplateNode::Kind::RANGE:
                range(node, dot, depth);
                break;

            case TemplateNode::Kind::TEMPLATE:
            {
                auto tree = set.find(node.text);
                if (!tree)
                {
                    fail(node.line, "no such template \"" + node.text + "\"");
                }
                if (depth + 1 > MAX_EXEC_DEPTH)
                {
                    fail(node.line, "exceeded maximum template depth (" +
                                        std::to_string(MAX_EXEC_DEPTH) + ")");
                }
                json value = node.pipeline ? evalPipeline(*node.pipeline, dot, node.line) : json();
                run(*tree, value, depth + 1);
                break;
            }
            }
        }
    }

    void range(const TemplateNode &node, const json &dot, int depth)
    {
        json value = evalPipeline(*node.pipeline, dot, node.line);

        if (value.is_array() || value.is_object())
        {
            if (value.empty())
            {
                walk(node.elseList, dot, depth);
                return;
            }
            // objects iterate in key order
            for (const auto &element : value)
            {
                walk(node.list, element, depth);
            }
            return;
        }

        if (value.is_number_integer())
        {
            int64_t count = value.get<int64_t>();
            if (count <= 0)
            {
                walk(node.elseList, dot, depth);
                return;
            }
            for (int64_t i = 0; i < count; ++i)
            {
                walk(node.list, json(i), depth);
            }
            return;
        }

        if (value.is_null())
        {
            walk(node.elseList, dot, depth);
            return;
        }

        fail(node.line, std::string("range can't iterate over ") + value.type_name());
    }

    json evalPipeline(const TemplatePipeline &pipeline, const json &dot, int line)
    {
        json value;
        bool chained = false;
        for (const auto &command : pipeline.commands)
        {
            value = evalCommand(command, dot, chained ? &value : nullptr, line);
            chained = true;
        }
        return value;
    }

    // final is the previous command's result in a pipeline, passed as last argument
    json evalCommand(const TemplateCommand &command, const json &dot, const json *final, int line)
    {
        const TemplateArg &first = command.args.front();

        if (first.kind != TemplateArg::Kind::FUNCTION)
        {
            if (command.args.size() > 1 || final)
            {
                fail(line, "can't give argument to non-function");
            }
            return evalArg(first, dot, line);
        }

        const std::string &fn = first.name;
        bool userDefined = set.funcs.contains(fn);

        // and/or stop evaluating at the deciding argument
        if (!userDefined && (fn == "and" || fn == "or"))
        {
            size_t count = command.args.size() - 1 + (final ? 1 : 0);
            if (count < 1)
            {
                fail(line, "wrong number of args for " + fn + ": want at least 1 got 0");
            }
            json value;
            for (size_t i = 1; i < command.args.size(); ++i)
            {
                value = evalArg(command.args[i], dot, line);
                if (truthy(value) != (fn == "and"))
                    return value;
            }
            if (final)
            {
                value = *final;
            }
            return value;
        }

        std::vector<json> args;
        args.reserve(command.args.size());
        for (size_t i = 1; i < command.args.size(); ++i)
        {
            args.push_back(evalArg(command.args[i], dot, line));
        }
        if (final)
        {
            args.push_back(*final);
        }
        return call(fn, args, line);
    }

    json evalArg(const TemplateArg &arg, const json &dot, int line)
    {
        switch (arg.kind)
        {
        case TemplateArg::Kind::DOT:
            return dot;
        case TemplateArg::Kind::FIELD:
            return evalFields(dot, arg.fields, line);
        case TemplateArg::Kind::VARIABLE:
            return evalFields(*root, arg.fields, line);
        case TemplateArg::Kind::LITERAL:
            return arg.literal;
        case TemplateArg::Kind::NIL:
            return nullptr;
        case TemplateArg::Kind::FUNCTION:
            return call(arg.name, {}, line);
        case TemplateArg::Kind::PIPELINE:
            return evalFields(evalPipeline(*arg.pipeline, dot, line), arg.fields, line);
        }
        return nullptr;
    }

    json evalFields(const json &value, const std::vector<std::string> &fields, int line)
    {
        const json *current = &value;
        for (const auto &field : fields)
        {
            // missing keys evaluate to the zero value, like map lookups
            if (current->is_null())
            {
                return nullptr;
            }
            if (!current->is_object())
            {
                fail(line, "can't evaluate field " + field + " in type " + current->type_name());
            }
            auto it = current->find(field);
            if (it == current->end())
            {
                return nullptr;
            }
            current = &*it;
        }
        return *current;
    }

    void wantArgs(const std::string &fn, const std::vector<json> &args, size_t want, int line) const
    {
        if (args.size() != want)
        {
            fail(line, "wrong number of args for " + fn + ": want " + std::to_string(want) +
                           " got " + std::to_string(args.size()));
        }
    }

    bool equal(const json &a, const json &b, int line) const
    {
        Basic ka = basicKind(a);
        Basic kb = basicKind(b);
        if (ka == Basic::OTHER || kb == Basic::OTHER)
        {
            fail(line, "error calling eq: invalid type for comparison");
        }
        if (ka == Basic::NIL || kb == Basic::NIL)
        {
            return ka == kb;
        }
        if (ka != kb)
        {
            fail(line, "error calling eq: incompatible types for comparison");
        }
        return a == b;
    }

    // negative when a < b
    int compare(const std::string &fn, const json &a, const json &b, int line) const
    {
        Basic ka = basicKind(a);
        Basic kb = basicKind(b);
        if (ka != kb || (ka != Basic::NUMBER && ka != Basic::STRING))
        {
            fail(line, "error calling " + fn + ": incompatible types for comparison");
        }
        if (a < b)
            return -1;
        return a == b ? 0 : 1;
    }

    json call(const std::string &fn, const std::vector<json> &args, int line)
    {
        if (auto it = set.funcs.find(fn); it != set.funcs.end())
        {
            try
            {
                return it->second(args);
            }
            catch (const TemplateError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                fail(line, "error calling " + fn + ": " + e.what());
            }
        }

        if (fn == "not")
        {
            wantArgs(fn, args, 1, line);
            return !truthy(args[0]);
        }
        if (fn == "and" || fn == "or")
        {
            if (args.empty())
                fail(line, "wrong number of args for " + fn + ": want at least 1 got 0");
            for (const auto &arg : args)
            {
                if (truthy(arg) != (fn == "and"))
                    return arg;
            }
            return args.back();
        }
        if (fn == "eq")
        {
            if (args.size() < 2)
                fail(line, "missing argument for comparison");
            for (size_t i = 1; i < args.size(); ++i)
            {
                if (equal(args[0], args[i], line))
                    return true;
            }
            return false;
        }
        if (fn == "ne")
        {
            wantArgs(fn, args, 2, line);
            return !equal(args[0], args[1], line);
        }
        if (fn == "lt" || fn == "le" || fn == "gt" || fn == "ge")
        {
            wantArgs(fn, args, 2, line);
            int order = compare(fn, args[0], args[1], line);
            if (fn == "lt")
                return order < 0;
            if (fn == "le")
                return order <= 0;
            if (fn == "gt")
                return order > 0;
            return order >= 0;
        }
        if (fn == "len")
        {
            wantArgs(fn, args, 1, line);
            const json &item = args[0];
            if (item.is_string())
                return item.get_ref<const std::string &>().size();
            if (item.is_array() || item.is_object())
                return item.size();
            fail(line, std::string("error calling len: len of type ") + item.type_name());
        }
        if (fn == "index")
        {
            if (args.empty())
                fail(line, "wrong number of args for index: want at least 1 got 0");
            json item = args[0];
            for (size_t i = 1; i < args.size(); ++i)
            {
                const json &key = args[i];
                if (item.is_array())
                {
                    if (!key.is_number_integer())
                        fail(line, "error calling index: cannot index slice/array with type " +
                                       std::string(key.type_name()));
                    int64_t at = key.get<int64_t>();
                    if (at < 0 || static_cast<size_t>(at) >= item.size())
                        fail(line, "error calling index: index out of range: " + std::to_string(at));
                    item = json(item[static_cast<size_t>(at)]);
                }
                else if (item.is_object())
                {
                    if (!key.is_string())
                        fail(line, "error calling index: value has type " +
                                       std::string(key.type_name()) + "; should be string");
                    auto it = item.find(key.get<std::string>());
                    item = it == item.end() ? json() : json(*it);
                }
                else
                {
                    fail(line, std::string("error calling index: can't index item of type ") +
                                   item.type_name());
                }
            }
            return item;
        }
        if (fn == "print")
        {
            return sprint(args);
        }
        if (fn == "urlquery")
        {
            return queryEscape(sprint(args));
        }

        fail(line, "function \"" + fn + "\" not defined");
    }
};

TemplateSet::TemplateSet(FuncMap funcs) : funcs(std::move(funcs))
{
}

bool TemplateSet::isFunction(const std::string &name) const
{
    return funcs.contains(name) || BUILTINS.contains(name);
}

void TemplateSet::parse(const std::string &name, std::string_view source)
{
    TemplateParser parser(name, source, [this](const std::string &fn)
                          { return isFunction(fn); });
    std::vector<TemplateTree> parsed = parser.parse();

    for (auto &tree : parsed)
    {
        // a file holding only defines must not blank out an existing template
        if (tree.isEmpty() && trees.contains(tree.name))
        {
            continue;
        }
        std::string key = tree.name;
        trees[key] = std::make_shared<const TemplateTree>(std::move(tree));
    }
}

bool TemplateSet::contains(const std::string &name) const
{
    return trees.contains(name);
}

std::vector<std::string> TemplateSet::names() const
{
    std::vector<std::string> result;
    result.reserve(trees.size());
    for (const auto &[name, tree] : trees)
    {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::shared_ptr<const TemplateTree> TemplateSet::find(const std::string &name) const
{
    auto it = trees.find(name);
    return it == trees.end() ? nullptr : it->second;
}

std::string TemplateSet::execute(const std::string &name, const json &data) const
{
    auto tree = find(name);
    if (!tree)
    {
        throw TemplateError("template: no template \"" + name + "\" associated with template set");
    }

    Execution execution(*this);
    execution.run(*tree, data, 0);
    return std::move(execution.out);
}

std::string TemplateSet::escapeHtml(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&#34;";
            break;
        case '\'':
            escaped += "&#39;";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

std::string TemplateSet::queryEscape(std::string_view text)
{
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string escaped;
    escaped.reserve(text.size());
    for (unsigned char c : text)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            escaped += static_cast<char>(c);
        }
        else if (c == ' ')
        {
            escaped += '+';
        }
        else
        {
            escaped += '%';
            escaped += HEX[c >> 4];
            escaped += HEX[c & 0x0F];
        }
    }
    return escaped;
}
