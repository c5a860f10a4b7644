#ifndef ARBOR_ROUTER_HPP
#define ARBOR_ROUTER_HPP

#include "common.hpp"
#include "content_sniffer.hpp"
#include "errors.hpp"
#include "filesystem.hpp"
#include "http.hpp"
#include "logger.hpp"
#include "request_data.hpp"
#include "template_assembler.hpp"

// Answers GET requests from a template tree.
//
// Paths whose last segment has an extension are served as static files,
// anything else is resolved into a composed template set and rendered
// through the layout.
class Router
{
public:
    // builds the render context of one request
    using DataFactory = std::function<std::unique_ptr<RequestData>(const HttpRequest &)>;
    // extra template functions for one request
    using FuncsFactory = std::function<FuncMap(const HttpRequest &)>;

    static constexpr std::string_view TEMPLATE_EXTENSION = "tmpl";
    static constexpr const char *HTML_CONTENT_TYPE = "text/html";

    explicit Router(std::shared_ptr<const FileSystem> root);

    Router &withData(DataFactory factory);
    Router &withFuncs(FuncsFactory factory);
    // answer "HX-Request: true" with the body fragment only
    Router &withFragments(bool enabled);

    [[nodiscard]] HttpResponse route(const HttpRequest &request,
                                     const std::string &clientIp = "-") const;

    // MIME type for a file extension without the dot, "" when unknown
    [[nodiscard]] static std::string getMimeType(std::string_view extension);

    // non-empty segments of a URL path
    [[nodiscard]] static std::vector<std::string> splitPath(std::string_view path);

private:
    std::shared_ptr<const FileSystem> root;
    TemplateAssembler assembler;
    DataFactory dataFactory;
    FuncsFactory funcsFactory;
    bool fragments{false};

    [[nodiscard]] HttpResponse serveStatic(const std::vector<std::string> &segments,
                                           const std::string &extension) const;
    [[nodiscard]] HttpResponse serveTemplate(const HttpRequest &request,
                                             const std::vector<std::string> &segments) const;
};

#endif // ARBOR_ROUTER_HPP
