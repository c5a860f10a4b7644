#include "router.hpp"
#include "layout.hpp"

Router::Router(std::shared_ptr<const FileSystem> root)
    : root(root), assembler(root)
{
}

Router &Router::withData(DataFactory factory)
{
    dataFactory = std::move(factory);
    return *this;
}

Router &Router::withFuncs(FuncsFactory factory)
{
    funcsFactory = std::move(factory);
    return *this;
}

Router &Router::withFragments(bool enabled)
{
    fragments = enabled;
    return *this;
}

std::string Router::getMimeType(std::string_view extension)
{
    // define MIME type mappings for lower-cased extensions
    static const std::unordered_map<std::string_view, std::string_view>
        mimeTypes = {{"html", "text/html; charset=utf-8"},
                     {"htm", "text/html; charset=utf-8"},
                     {"css", "text/css; charset=utf-8"},
                     {"js", "text/javascript; charset=utf-8"},
                     {"mjs", "text/javascript; charset=utf-8"},
                     {"json", "application/json"},
                     {"png", "image/png"},
                     {"jpg", "image/jpeg"},
                     {"jpeg", "image/jpeg"},
                     {"gif", "image/gif"},
                     {"svg", "image/svg+xml"},
                     {"ico", "image/x-icon"},
                     {"txt", "text/plain; charset=utf-8"},
                     {"pdf", "application/pdf"},
                     {"xml", "text/xml; charset=utf-8"},
                     {"zip", "application/zip"},
                     {"woff", "font/woff"},
                     {"woff2", "font/woff2"},
                     {"ttf", "font/ttf"},
                     {"otf", "font/otf"},
                     {"eot", "application/vnd.ms-fontobject"},
                     {"mp3", "audio/mpeg"},
                     {"mp4", "video/mp4"},
                     {"webm", "video/webm"},
                     {"webp", "image/webp"},
                     {"avif", "image/avif"},
                     {"wasm", "application/wasm"},
                     {"csv", "text/csv; charset=utf-8"},
                     {"map", "application/json"}};

    std::string lower(extension);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    auto it = mimeTypes.find(lower);
    return it != mimeTypes.end() ? std::string(it->second) : std::string();
}

std::vector<std::string> Router::splitPath(std::string_view path)
{
    std::vector<std::string> segments;
    while (!path.empty())
    {
        size_t slash = path.find('/');
        std::string_view segment = path.substr(0, slash);
        if (!segment.empty())
        {
            segments.emplace_back(segment);
        }
        if (slash == std::string_view::npos)
        {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

HttpResponse Router::route(const HttpRequest &request, const std::string &clientIp) const
{
    Logger *logger = Logger::getInstance();

    if (request.method != "GET")
    {
        logger->info("Method not allowed: " + request.method + " " + request.path, clientIp);
        HttpResponse response = Http::errorResponse(405);
        response.headers.emplace_back("Allow", "GET");
        return response;
    }

    logger->info("Processing request: " + request.path, clientIp);

    std::vector<std::string> segments = splitPath(request.path);

    std::string extension;
    if (!segments.empty())
    {
        const std::string &last = segments.back();
        if (size_t dot = last.rfind('.'); dot != std::string::npos)
        {
            extension = last.substr(dot + 1);
        }
    }

    try
    {
        if (!segments.empty() && segments.back().find('.') != std::string::npos)
        {
            // template sources are never served verbatim
            if (extension == TEMPLATE_EXTENSION)
            {
                throw NotFoundError("template source requested: " + request.path);
            }
            return serveStatic(segments, extension);
        }
        return serveTemplate(request, segments);
    }
    catch (const ArborError &e)
    {
        if (e.kind() == ErrorKind::NOT_FOUND)
        {
            logger->info("Not found: " + request.path + " (" + e.what() + ")", clientIp);
            return Http::errorResponse(404);
        }
        logger->error("Internal server error for " + request.path + ": " + e.what(), clientIp);
        return Http::errorResponse(500);
    }
    catch (const std::exception &e)
    {
        // failures inside caller-supplied hooks
        logger->error("Internal server error for " + request.path + ": " + e.what(), clientIp);
        return Http::errorResponse(500);
    }
}

HttpResponse Router::serveStatic(const std::vector<std::string> &segments,
                                 const std::string &extension) const
{
    std::string path;
    for (const auto &segment : segments)
    {
        path = FileSystem::join(path, segment);
    }

    Logger::getInstance()->debug("attempting to serve file " + path);

    std::unique_ptr<File> file = root->open(path);

    HttpResponse response;
    response.contentType = getMimeType(extension);
    if (response.contentType.empty())
    {
        // sniffed bytes go out first, nothing is lost
        ContentTypeSniffer::Result sniffed = ContentTypeSniffer::sniff(*file);
        response.contentType = std::move(sniffed.contentType);
        response.body = std::move(sniffed.prefix);
    }
    response.body += file->readAll();
    return response;
}

HttpResponse Router::serveTemplate(const HttpRequest &request,
                                   const std::vector<std::string> &segments) const
{
    Logger::getInstance()->debug("loading templates for " + request.path);

    FuncMap funcs = funcsFactory ? funcsFactory(request) : FuncMap{};
    TemplateAssembler::Resolution resolution = assembler.assemble(segments, funcs);

    std::unique_ptr<RequestData> data = dataFactory ? dataFactory(request) : nullptr;
    json context = RequestDataBinder::bind(data.get(), resolution.submatches);

    bool fragmentOnly = fragments && request.header("hx-request") == "true";
    const char *name = fragmentOnly ? FRAGMENT_TEMPLATE_NAME : LAYOUT_TEMPLATE_NAME;

    HttpResponse response;
    response.contentType = HTML_CONTENT_TYPE;
    response.body = resolution.templates.execute(name, context);
    if (fragments)
    {
        response.headers.emplace_back("Vary", "HX-Request");
    }
    return response;
}
