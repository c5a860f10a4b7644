#ifndef ARBOR_DIRECTORY_MATCHER_HPP
#define ARBOR_DIRECTORY_MATCHER_HPP

#include "common.hpp"
#include "errors.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "submatches.hpp"

// Resolves one URL path segment against the children of a directory.
//
// A child named exactly like the segment always wins. Otherwise every child
// directory named "{regex}" is tried as a full-match pattern against the
// segment; among several matches the pattern with the most capture groups
// wins and ties go to the first in name order.
class DirectoryMatcher
{
public:
    // a pattern body compiled for std::regex, with Go-style group names lifted out
    struct CompiledPattern
    {
        std::regex regex;
        std::vector<std::string> groupNames; // one per capture group, "" when unnamed
    };

    // "{...}" with at least one character between the braces
    [[nodiscard]] static bool isPatternName(std::string_view name) noexcept;

    // throws NotFoundError when nothing matches, MalformedError for bad patterns
    [[nodiscard]] static DirEntryWithSubmatches match(const FileSystem &parent,
                                                      const std::string &segment);

    // translate (?P<name>..) / (?<name>..) groups and a leading (?i) flag
    [[nodiscard]] static CompiledPattern compilePattern(std::string_view body);

private:
    static constexpr char PATTERN_OPEN = '{';
    static constexpr char PATTERN_CLOSE = '}';

    [[nodiscard]] static std::optional<std::vector<KeyValuePair>>
    evaluate(const CompiledPattern &pattern, const std::string &segment);
};

#endif // ARBOR_DIRECTORY_MATCHER_HPP
