#include <gtest/gtest.h>

#include "memory_filesystem.hpp"
#include "router.hpp"

namespace
{
    HttpRequest get(const std::string &target, const std::string &extraHeaders = "")
    {
        auto request = Http::parseRequest("GET " + target + " HTTP/1.1\r\nHost: test\r\n" + extraHeaders);
        if (!request)
        {
            throw std::runtime_error("bad test request: " + target);
        }
        return *request;
    }

    std::unique_ptr<RequestData> mapData(const HttpRequest &request)
    {
        auto data = std::make_unique<RequestDataMap>();
        data->set("path", request.path);
        return data;
    }

    std::string header(const HttpResponse &response, const std::string &name)
    {
        for (const auto &[key, value] : response.headers)
        {
            if (key == name)
                return value;
        }
        return "";
    }

    bool contains(const std::string &text, const std::string &needle)
    {
        return text.find(needle) != std::string::npos;
    }
}

TEST(RouterTest, RootBodyRendersInsideLayout)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "<p>welcome</p>");
    Router router(tree);

    HttpResponse response = router.route(get("/"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.contentType, "text/html");
    EXPECT_TRUE(response.body.starts_with("<!DOCTYPE html>")) << response.body;
    EXPECT_TRUE(contains(response.body, "<body>\n\t\t<p>welcome</p>\n\t</body>")) << response.body;
}

TEST(RouterTest, NoBodyAnywhereIs404)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("head.html.tmpl", "<title>x</title>").addDirectory("a");
    Router router(tree);

    EXPECT_EQ(router.route(get("/")).status, 404);
    EXPECT_EQ(router.route(get("/a")).status, 404);
}

TEST(RouterTest, DeeperBodyWinsAndHeadIsInherited)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("head.html.tmpl", "<title>site</title>")
        .addFile("body.html.tmpl", "home")
        .addFile("blog/body.html.tmpl", "blog index");
    Router router(tree);

    HttpResponse response = router.route(get("/blog"));
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(contains(response.body, "<title>site</title>")) << response.body;
    EXPECT_TRUE(contains(response.body, "blog index")) << response.body;
    EXPECT_FALSE(contains(response.body, "home")) << response.body;
}

TEST(RouterTest, LiteralDirectoryBeatsPattern)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("abc/body.html.tmpl", "literal").addFile("{[a-z]+}/body.html.tmpl", "pattern");
    Router router(tree);

    EXPECT_TRUE(contains(router.route(get("/abc")).body, "literal"));
    EXPECT_TRUE(contains(router.route(get("/xyz")).body, "pattern"));
}

TEST(RouterTest, PatternWithMoreCapturesWins)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("{[0-9]+}/body.html.tmpl", "plain")
        .addFile("{([0-9])([0-9])}/body.html.tmpl", "two groups");
    Router router(tree);

    EXPECT_TRUE(contains(router.route(get("/42")).body, "two groups"));
    EXPECT_TRUE(contains(router.route(get("/123")).body, "plain"));
}

TEST(RouterTest, RawPatternNameIs404)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root").addFile("{[a-z]+}/body.html.tmpl", "pattern");
    Router router(tree);

    EXPECT_EQ(router.route(get("/%7B%5Ba-z%5D+%7D")).status, 404);
}

TEST(RouterTest, SubdirectoryTitleRendersInAncestorBody)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "<h1>{{template \"title\" .}}</h1>")
        .addFile("title.html.tmpl", "Home")
        .addFile("about/title.html.tmpl", "About");
    Router router(tree);

    EXPECT_TRUE(contains(router.route(get("/")).body, "<h1>Home</h1>"));
    EXPECT_TRUE(contains(router.route(get("/about")).body, "<h1>About</h1>"));
}

TEST(RouterTest, StaticFileUsesExtensionTable)
{
    auto tree = MemoryFileSystem::create();
    // looks like HTML to the sniffer, the extension decides
    tree->addFile("css/site.css", "<html> body { color: red; }");
    Router router(tree);

    HttpResponse response = router.route(get("/css/site.css"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.contentType, "text/css; charset=utf-8");
    EXPECT_EQ(response.body, "<html> body { color: red; }");
}

TEST(RouterTest, UnknownExtensionIsSniffed)
{
    auto tree = MemoryFileSystem::create();
    std::string png = std::string("\x89PNG\r\n\x1A\n", 8) + std::string(1000, '\0');
    tree->addFile("img/logo.bin", png);
    Router router(tree);

    HttpResponse response = router.route(get("/img/logo.bin"));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.contentType, "image/png");
    EXPECT_EQ(response.body, png);
}

TEST(RouterTest, TemplateSourcesAreNeverServed)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root");
    Router router(tree);

    EXPECT_EQ(router.route(get("/body.html.tmpl")).status, 404);
    EXPECT_EQ(router.route(get("/missing.tmpl")).status, 404);
}

TEST(RouterTest, MissingStaticFileIs404)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root").addDirectory("dir.d");
    Router router(tree);

    EXPECT_EQ(router.route(get("/nope.css")).status, 404);
    EXPECT_EQ(router.route(get("/dir.d")).status, 404);
    EXPECT_EQ(router.route(get("/../body.txt")).status, 404);
}

TEST(RouterTest, NamedCapturesReachTemplates)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("users/{(?P<id>[0-9]+)}/body.html.tmpl",
                  "user {{.id}} at {{.path}} ({{len .pathExpressionSubmatches}})");
    Router router(tree);
    router.withData(mapData);

    HttpResponse response = router.route(get("/users/42"));
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(contains(response.body, "user 42 at /users/42 (2)")) << response.body;
}

TEST(RouterTest, NotFoundMarkerForces404)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root").addFile("private/404", "");
    Router router(tree);

    EXPECT_EQ(router.route(get("/private")).status, 404);
    EXPECT_EQ(router.route(get("/")).status, 200);
}

TEST(RouterTest, MalformedPatternDirectoryIs500)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root").addDirectory("{(unclosed}");
    Router router(tree);

    HttpResponse response = router.route(get("/anything"));
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body, "Internal Server Error");
}

TEST(RouterTest, TemplateErrorsAre500)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "{{if}}");
    Router router(tree);
    EXPECT_EQ(router.route(get("/")).status, 500);

    auto runtime = MemoryFileSystem::create();
    runtime->addFile("body.html.tmpl", "{{template \"missing\"}}");
    Router runtimeRouter(runtime);
    EXPECT_EQ(runtimeRouter.route(get("/")).status, 500);
}

TEST(RouterTest, IoErrorsAre500)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root").addFile("broken/body.html.tmpl", "x");
    tree->failPath("broken");
    Router router(tree);
    EXPECT_EQ(router.route(get("/broken")).status, 500);
}

TEST(RouterTest, NonGetIs405)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root");
    Router router(tree);

    auto request = Http::parseRequest("POST / HTTP/1.1\r\nHost: test");
    ASSERT_TRUE(request);
    HttpResponse response = router.route(*request);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(header(response, "Allow"), "GET");
}

TEST(RouterTest, FailingDataFactoryIs500)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "root");
    Router router(tree);
    router.withData([](const HttpRequest &) -> std::unique_ptr<RequestData>
                    { throw std::runtime_error("no data"); });
    EXPECT_EQ(router.route(get("/")).status, 500);
}

TEST(RouterTest, FuncsFactoryProvidesFunctions)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "{{host}}");
    Router router(tree);
    router.withFuncs([](const HttpRequest &request)
                     { return FuncMap{{"host", [host = request.header("host")](const std::vector<json> &) -> json
                                       { return host; }}}; });

    EXPECT_TRUE(contains(router.route(get("/")).body, "test"));
}

TEST(RouterTest, HtmxRequestsGetTheFragmentOnly)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("head.html.tmpl", "<title>t</title>").addFile("body.html.tmpl", "<p>part</p>");
    Router router(tree);
    router.withFragments(true);

    HttpResponse partial = router.route(get("/", "HX-Request: true\r\n"));
    EXPECT_EQ(partial.body, "<p>part</p>");
    EXPECT_EQ(header(partial, "Vary"), "HX-Request");

    HttpResponse full = router.route(get("/"));
    EXPECT_TRUE(full.body.starts_with("<!DOCTYPE html>"));
}

TEST(RouterTest, HtmxHeaderIgnoredWhenDisabled)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("body.html.tmpl", "<p>part</p>");
    Router router(tree);

    HttpResponse response = router.route(get("/", "HX-Request: true\r\n"));
    EXPECT_TRUE(response.body.starts_with("<!DOCTYPE html>"));
    EXPECT_EQ(header(response, "Vary"), "");
}

TEST(RouterTest, MimeTable)
{
    EXPECT_EQ(Router::getMimeType("html"), "text/html; charset=utf-8");
    EXPECT_EQ(Router::getMimeType("JS"), "text/javascript; charset=utf-8");
    EXPECT_EQ(Router::getMimeType("svg"), "image/svg+xml");
    EXPECT_EQ(Router::getMimeType("woff2"), "font/woff2");
    EXPECT_EQ(Router::getMimeType("unknown"), "");
}

TEST(RouterTest, SplitPathDropsEmptySegments)
{
    EXPECT_TRUE(Router::splitPath("/").empty());
    EXPECT_EQ(Router::splitPath("//a///b/"), (std::vector<std::string>{"a", "b"}));
}
