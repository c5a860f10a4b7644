#ifndef ARBOR_TEMPLATE_SET_HPP
#define ARBOR_TEMPLATE_SET_HPP

#include "common.hpp"
#include "template.hpp"

// A set of named template trees that can call each other through
// {{template "name"}}. Parsing a source adds its main tree under the given
// name and every {{define}} under its own name, replacing earlier trees of
// the same name unless the new tree is empty.
class TemplateSet
{
public:
    explicit TemplateSet(FuncMap funcs = {});

    // throws TemplateError, the set is left unchanged on failure
    void parse(const std::string &name, std::string_view source);

    [[nodiscard]] bool contains(const std::string &name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    // throws TemplateError for unknown templates and execution failures
    [[nodiscard]] std::string execute(const std::string &name, const json &data) const;

    [[nodiscard]] static std::string escapeHtml(std::string_view text);
    [[nodiscard]] static std::string queryEscape(std::string_view text);

private:
    class Execution;

    static constexpr int MAX_EXEC_DEPTH = 1000;

    FuncMap funcs;
    std::unordered_map<std::string, std::shared_ptr<const TemplateTree>> trees;

    [[nodiscard]] bool isFunction(const std::string &name) const;
    [[nodiscard]] std::shared_ptr<const TemplateTree> find(const std::string &name) const;
};

#endif // ARBOR_TEMPLATE_SET_HPP
