#include "template_assembler.hpp"
#include "layout.hpp"

TemplateAssembler::TemplateAssembler(std::shared_ptr<const FileSystem> root)
    : root(std::move(root))
{
}

TemplateAssembler::Resolution
TemplateAssembler::assemble(std::span<const std::string> segments, const FuncMap &funcs) const
{
    Logger *logger = Logger::getInstance();

    Resolution resolution{TemplateSet(funcs), {}};
    TemplateSet &templates = resolution.templates;
    templates.parse(LAYOUT_TEMPLATE_NAME, LAYOUT_TEMPLATE);
    templates.parse(FRAGMENT_TEMPLATE_NAME, FRAGMENT_TEMPLATE);

    std::string head = std::string(HEAD_TEMPLATE) + std::string(TEMPLATE_SUFFIX);
    std::string body = std::string(BODY_TEMPLATE) + std::string(TEMPLATE_SUFFIX);

    if (!loadFragment(templates, *root, HEAD_TEMPLATE, head, "/"))
    {
        logger->debug(head + " not found at root");
    }

    bool bodyFound = loadFragment(templates, *root, BODY_TEMPLATE, body, "/");
    if (!bodyFound)
    {
        logger->debug(body + " not found at root");
    }

    LevelResult result = descend(templates, root, segments, "");
    if (!bodyFound && !result.bodyFound)
    {
        throw NotFoundError("no body defined");
    }

    resolution.submatches = std::move(result.submatches);
    return resolution;
}

TemplateAssembler::LevelResult
TemplateAssembler::descend(TemplateSet &templates, const std::shared_ptr<const FileSystem> &dir,
                           std::span<const std::string> segments, const std::string &location) const
{
    if (segments.empty())
    {
        checkNotFoundMarker(*dir, location.empty() ? "/" : location);
        return {};
    }

    Logger *logger = Logger::getInstance();

    DirEntryWithSubmatches entry = DirectoryMatcher::match(*dir, segments.front());
    const std::string dirName = entry.file.name;
    const std::string here = location + "/" + dirName;
    std::shared_ptr<const FileSystem> child = dir->sub(dirName);

    logger->debug("walking directory " + here);

    bool bodyHere = false;
    for (const FileInfo &file : child->list(""))
    {
        if (file.isDirectory || !file.name.ends_with(TEMPLATE_SUFFIX))
        {
            continue;
        }

        std::string name = file.name.substr(0, file.name.size() - TEMPLATE_SUFFIX.size());
        if (name.empty())
        {
            throw MalformedError("template file found without name in " + here);
        }

        logger->debug("template file found: " + here + "/" + file.name);
        if (!loadFragment(templates, *child, name, file.name, here))
        {
            // removed between listing and opening
            continue;
        }
        if (name == BODY_TEMPLATE)
        {
            bodyHere = true;
        }
    }

    LevelResult deeper = descend(templates, child, segments.subspan(1), here);

    LevelResult result;
    result.bodyFound = bodyHere || deeper.bodyFound;
    result.submatches.reserve(deeper.submatches.size() + 1);
    result.submatches.push_back(std::move(entry));
    std::move(deeper.submatches.begin(), deeper.submatches.end(), std::back_inserter(result.submatches));
    return result;
}

bool TemplateAssembler::loadFragment(TemplateSet &templates, const FileSystem &dir,
                                     const std::string &name, const std::string &file,
                                     const std::string &location)
{
    std::string source;
    try
    {
        source = dir.open(file)->readAll();
    }
    catch (const NotFoundError &)
    {
        return false;
    }

    try
    {
        templates.parse(name, source);
    }
    catch (const TemplateError &e)
    {
        throw TemplateError("failed to parse template " + name + " in " + location + ": " + e.what());
    }
    return true;
}

void TemplateAssembler::checkNotFoundMarker(const FileSystem &dir, const std::string &location)
{
    if (dir.exists(NOT_FOUND_MARKER))
    {
        Logger::getInstance()->debug("404 marker found in " + location);
        throw NotFoundError("404 marker found in " + location);
    }
}
