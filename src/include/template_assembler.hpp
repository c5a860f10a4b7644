#ifndef ARBOR_TEMPLATE_ASSEMBLER_HPP
#define ARBOR_TEMPLATE_ASSEMBLER_HPP

#include "common.hpp"
#include "directory_matcher.hpp"
#include "errors.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "submatches.hpp"
#include "template_set.hpp"

// Walks the request path down the template tree and composes the fragments
// found on the way into one TemplateSet.
//
// Fragments from deeper directories replace same-named fragments from
// shallower ones. A request only resolves when some directory on the path,
// the root included, provides body.html.tmpl.
class TemplateAssembler
{
public:
    static constexpr std::string_view TEMPLATE_SUFFIX = ".html.tmpl";
    static constexpr const char *NOT_FOUND_MARKER = "404";
    static constexpr const char *HEAD_TEMPLATE = "head";
    static constexpr const char *BODY_TEMPLATE = "body";

    struct Resolution
    {
        TemplateSet templates;
        PathSubmatches submatches;
    };

    explicit TemplateAssembler(std::shared_ptr<const FileSystem> root);

    // throws NotFoundError, MalformedError or IoError
    [[nodiscard]] Resolution assemble(std::span<const std::string> segments,
                                      const FuncMap &funcs = {}) const;

private:
    // what one level of the descent reports to its caller
    struct LevelResult
    {
        bool bodyFound{false};
        PathSubmatches submatches;
    };

    std::shared_ptr<const FileSystem> root;

    [[nodiscard]] LevelResult descend(TemplateSet &templates,
                                      const std::shared_ptr<const FileSystem> &dir,
                                      std::span<const std::string> segments,
                                      const std::string &location) const;

    // false when the file does not exist
    static bool loadFragment(TemplateSet &templates, const FileSystem &dir,
                             const std::string &name, const std::string &file,
                             const std::string &location);

    static void checkNotFoundMarker(const FileSystem &dir, const std::string &location);
};

#endif // ARBOR_TEMPLATE_ASSEMBLER_HPP
