#include "directory_matcher.hpp"

void to_json(json &j, const KeyValuePair &kv)
{
    j = json{{"key", kv.key}, {"value", kv.value}};
}

void to_json(json &j, const DirEntryWithSubmatches &entry)
{
    j = entry.file;
    j["submatches"] = entry.submatches;
}

bool DirectoryMatcher::isPatternName(std::string_view name) noexcept
{
    return name.size() >= 3 && name.front() == PATTERN_OPEN && name.back() == PATTERN_CLOSE;
}

DirectoryMatcher::CompiledPattern DirectoryMatcher::compilePattern(std::string_view body)
{
    auto flags = std::regex::ECMAScript;
    std::string_view rest = body;
    if (rest.starts_with("(?i)"))
    {
        flags |= std::regex::icase;
        rest.remove_prefix(4);
    }

    std::string translated;
    translated.reserve(rest.size());
    std::vector<std::string> names;
    bool inClass = false;

    for (size_t i = 0; i < rest.size(); ++i)
    {
        const char c = rest[i];

        if (c == '\\')
        {
            translated += c;
            if (i + 1 < rest.size())
                translated += rest[++i];
            continue;
        }

        if (inClass)
        {
            translated += c;
            if (c == ']')
                inClass = false;
            continue;
        }

        if (c == '[')
        {
            inClass = true;
            translated += c;
            // a ']' straight after '[' or '[^' is a literal member
            if (i + 1 < rest.size() && rest[i + 1] == '^')
                translated += rest[++i];
            if (i + 1 < rest.size() && rest[i + 1] == ']')
                translated += rest[++i];
            continue;
        }

        if (c == '(')
        {
            if (i + 1 < rest.size() && rest[i + 1] == '?')
            {
                std::string_view after = rest.substr(i + 2);
                size_t nameStart = std::string_view::npos;
                if (after.starts_with("P<"))
                {
                    nameStart = i + 4;
                }
                else if (after.starts_with("<") && !after.starts_with("<=") && !after.starts_with("<!"))
                {
                    nameStart = i + 3;
                }

                if (nameStart != std::string_view::npos)
                {
                    size_t close = rest.find('>', nameStart);
                    if (close == std::string_view::npos)
                    {
                        throw MalformedError("invalid regex directory name {" + std::string(body) +
                                             "}: unterminated group name");
                    }

                    std::string name(rest.substr(nameStart, close - nameStart));
                    bool valid = !name.empty() &&
                                 std::all_of(name.begin(), name.end(), [](unsigned char ch)
                                             { return std::isalnum(ch) || ch == '_'; });
                    if (!valid)
                    {
                        throw MalformedError("invalid regex directory name {" + std::string(body) +
                                             "}: bad group name '" + name + "'");
                    }

                    names.push_back(std::move(name));
                    translated += '(';
                    i = close;
                    continue;
                }

                // non-capturing group or lookahead, std::regex understands these
                translated += c;
                continue;
            }

            names.emplace_back();
            translated += c;
            continue;
        }

        translated += c;
    }

    try
    {
        std::regex regex(translated, flags);
        if (regex.mark_count() != names.size())
        {
            throw MalformedError("invalid regex directory name {" + std::string(body) +
                                 "}: capture group count mismatch");
        }
        return CompiledPattern{std::move(regex), std::move(names)};
    }
    catch (const std::regex_error &e)
    {
        throw MalformedError("invalid regex directory name {" + std::string(body) +
                             "}: " + e.what());
    }
}

std::optional<std::vector<KeyValuePair>>
DirectoryMatcher::evaluate(const CompiledPattern &pattern, const std::string &segment)
{
    std::smatch m;
    if (!std::regex_match(segment, m, pattern.regex))
    {
        return std::nullopt;
    }

    std::vector<KeyValuePair> submatches;
    submatches.reserve(pattern.groupNames.size());
    for (size_t i = 0; i < pattern.groupNames.size(); ++i)
    {
        // groups that did not take part in the match capture ""
        submatches.push_back({pattern.groupNames[i], m[i + 1].matched ? m[i + 1].str() : ""});
    }
    return submatches;
}

DirEntryWithSubmatches DirectoryMatcher::match(const FileSystem &parent, const std::string &segment)
{
    Logger *logger = Logger::getInstance();

    // raw pattern names are never addressable from outside
    if (isPatternName(segment))
    {
        logger->debug("path includes regex: " + segment);
        throw NotFoundError("path includes regex: " + segment);
    }
    if (segment.empty() || segment == "." || segment == ".." ||
        segment.find('/') != std::string::npos)
    {
        throw NotFoundError("invalid path segment: " + segment);
    }

    std::optional<FileInfo> exact;
    try
    {
        exact = parent.stat(segment);
    }
    catch (const NotFoundError &)
    {
        logger->debug("no directory named " + segment + ", looking up matching regex directories");
    }

    if (exact)
    {
        if (!exact->isDirectory)
        {
            throw NotFoundError(segment + " is not a directory");
        }
        return DirEntryWithSubmatches{std::move(*exact), {}};
    }

    std::vector<FileInfo> entries = parent.list("");

    std::optional<DirEntryWithSubmatches> best;
    for (auto &entry : entries)
    {
        if (!entry.isDirectory || !isPatternName(entry.name))
        {
            continue;
        }

        std::string_view body(entry.name);
        body = body.substr(1, body.size() - 2);
        logger->debug("checking regex directory " + entry.name + " against " + segment);

        CompiledPattern pattern = compilePattern(body);
        auto submatches = evaluate(pattern, segment);
        if (!submatches)
        {
            continue;
        }

        logger->debug("regex directory " + entry.name + " matches with " +
                      std::to_string(submatches->size()) + " submatches");

        // strictly more captures replaces, so ties keep the earlier name
        if (!best || submatches->size() > best->submatches.size())
        {
            best = DirEntryWithSubmatches{std::move(entry), std::move(*submatches)};
        }
    }

    if (!best)
    {
        throw NotFoundError("directory not found: " + segment);
    }

    logger->debug("matching regex directory found: " + best->file.name);
    return std::move(*best);
}
