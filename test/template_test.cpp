#include <gtest/gtest.h>

#include "template_set.hpp"

namespace
{
    std::string render(std::string_view source, const json &data = json::object(),
                       FuncMap funcs = {})
    {
        TemplateSet set(std::move(funcs));
        set.parse("t", source);
        return set.execute("t", data);
    }
}

TEST(TemplateTest, PlainTextPassesThrough)
{
    EXPECT_EQ(render("<p>hello</p>"), "<p>hello</p>");
}

TEST(TemplateTest, FieldsAndRootVariable)
{
    json data = {{"user", {{"name", "ada"}}}, {"site", "arbor"}};
    EXPECT_EQ(render("{{.user.name}}@{{.site}}", data), "ada@arbor");
    EXPECT_EQ(render("{{with .user}}{{.name}}/{{$.site}}{{end}}", data), "ada/arbor");
    EXPECT_EQ(render("[{{.missing}}][{{.missing.deeper}}]", data), "[][]");
}

TEST(TemplateTest, ActionsAreHtmlEscaped)
{
    json data = {{"v", "<b>\"Tom\" & 'Jerry'</b>"}};
    EXPECT_EQ(render("{{.v}}", data),
              "&lt;b&gt;&#34;Tom&#34; &amp; &#39;Jerry&#39;&lt;/b&gt;");
}

TEST(TemplateTest, TrimMarkersEatWhitespace)
{
    EXPECT_EQ(render("a  {{- \"b\" -}}  \n c"), "abc");
}

TEST(TemplateTest, CommentsProduceNothing)
{
    EXPECT_EQ(render("a{{/* ignored */}}b{{- /* trimmed */ -}} c"), "abc");
}

TEST(TemplateTest, IfElseChains)
{
    const char *source = "{{if eq .n 1}}one{{else if eq .n 2}}two{{else}}many{{end}}";
    EXPECT_EQ(render(source, {{"n", 1}}), "one");
    EXPECT_EQ(render(source, {{"n", 2}}), "two");
    EXPECT_EQ(render(source, {{"n", 5}}), "many");
}

TEST(TemplateTest, Truthiness)
{
    const char *source = "{{if .v}}T{{else}}F{{end}}";
    EXPECT_EQ(render(source, {{"v", ""}}), "F");
    EXPECT_EQ(render(source, {{"v", 0}}), "F");
    EXPECT_EQ(render(source, {{"v", json::array()}}), "F");
    EXPECT_EQ(render(source, {{"v", nullptr}}), "F");
    EXPECT_EQ(render(source, {{"v", "x"}}), "T");
    EXPECT_EQ(render(source, {{"v", json::array({0})}}), "T");
    EXPECT_EQ(render(source, {{"v", 0.5}}), "T");
}

TEST(TemplateTest, RangeOverArraysObjectsAndEmpty)
{
    EXPECT_EQ(render("{{range .items}}<{{.}}>{{end}}", {{"items", {"a", "b"}}}), "<a><b>");
    EXPECT_EQ(render("{{range .m}}{{.}},{{end}}", {{"m", {{"z", 1}, {"a", 2}}}}), "2,1,");
    EXPECT_EQ(render("{{range .items}}x{{else}}none{{end}}", {{"items", json::array()}}), "none");
    EXPECT_EQ(render("{{range .absent}}x{{else}}none{{end}}"), "none");
    EXPECT_EQ(render("{{range 3}}{{.}}{{end}}"), "012");
}

TEST(TemplateTest, CalledTemplateRebindsRootVariable)
{
    json data = {{"a", "A"}, {"site", "arbor"}};
    EXPECT_EQ(render("{{define \"x\"}}[{{$}}]{{end}}{{template \"x\" .a}}", data), "[A]");
    // back in the caller $ is the execution data again
    EXPECT_EQ(render("{{define \"x\"}}{{$}}{{end}}{{template \"x\" .a}}/{{$.site}}", data), "A/arbor");
    EXPECT_EQ(render("{{define \"x\"}}[{{$}}]{{end}}{{template \"x\"}}", data), "[]");
}

TEST(TemplateTest, WithAndRangeKeepRootVariable)
{
    json data = {{"items", {"p", "q"}}, {"site", "arbor"}};
    EXPECT_EQ(render("{{range .items}}{{.}}{{$.site}} {{end}}", data), "parbor qarbor ");
    EXPECT_EQ(render("{{define \"x\"}}{{with .}}{{$}}{{end}}{{end}}{{template \"x\" .site}}", data),
              "arbor");
}

TEST(TemplateTest, RangeOverScalarFails)
{
    EXPECT_THROW(render("{{range .s}}{{end}}", {{"s", "text"}}), TemplateError);
}

TEST(TemplateTest, DefineAndTemplateCall)
{
    TemplateSet set;
    set.parse("page", "{{define \"title\"}}T:{{.}}{{end}}[{{template \"title\" .name}}]");
    EXPECT_TRUE(set.contains("title"));
    EXPECT_EQ(set.execute("page", {{"name", "x"}}), "[T:x]");
    EXPECT_EQ(set.names(), (std::vector<std::string>{"page", "title"}));
}

TEST(TemplateTest, BlockDefinesAndCalls)
{
    TemplateSet set;
    set.parse("page", "<{{block \"inner\" .}}default{{end}}>");
    EXPECT_EQ(set.execute("page", json::object()), "<default>");

    set.parse("inner", "override");
    EXPECT_EQ(set.execute("page", json::object()), "<override>");
}

TEST(TemplateTest, EmptyRedefinitionKeepsExistingTree)
{
    TemplateSet set;
    set.parse("body", "content");
    set.parse("body", "{{define \"extra\"}}e{{end}}\n");
    EXPECT_EQ(set.execute("body", json::object()), "content");
    EXPECT_TRUE(set.contains("extra"));
}

TEST(TemplateTest, FailedParseLeavesSetUnchanged)
{
    TemplateSet set;
    set.parse("a", "first");
    EXPECT_THROW(set.parse("a", "{{define \"b\"}}x{{end}}{{if}}"), TemplateError);
    EXPECT_EQ(set.execute("a", json::object()), "first");
    EXPECT_FALSE(set.contains("b"));
}

TEST(TemplateTest, ParseErrorsNameTheLine)
{
    TemplateSet set;
    try
    {
        set.parse("broken", "line one\n{{if .x}}\nunclosed");
        FAIL() << "expected a parse error";
    }
    catch (const TemplateError &e)
    {
        EXPECT_NE(std::string(e.what()).find("broken:"), std::string::npos) << e.what();
    }
}

TEST(TemplateTest, UnknownFunctionIsParseError)
{
    EXPECT_THROW(render("{{nosuch 1}}"), TemplateError);
}

TEST(TemplateTest, NilCommandIsParseError)
{
    EXPECT_THROW(render("{{nil}}"), TemplateError);
    EXPECT_THROW(render("{{. | nil}}"), TemplateError);
    EXPECT_EQ(render("[{{print nil}}]"), "[]");
}

TEST(TemplateTest, DotAfterTermIsParseError)
{
    json data = {{"a", {{"b", 1}}}};
    EXPECT_THROW(render("{{.a.}}", data), TemplateError);
    EXPECT_THROW(render("{{$.}}", data), TemplateError);
    EXPECT_THROW(render("{{(.a).}}", data), TemplateError);
    EXPECT_EQ(render("{{.a.b}} {{len .a}}", data), "1 1");
}

TEST(TemplateTest, UnknownTemplateIsExecutionError)
{
    EXPECT_THROW(render("{{template \"nowhere\"}}"), TemplateError);
    TemplateSet set;
    EXPECT_THROW((void)set.execute("missing", json::object()), TemplateError);
}

TEST(TemplateTest, RecursionIsBounded)
{
    TemplateSet set;
    set.parse("loop", "{{template \"loop\" .}}");
    EXPECT_THROW((void)set.execute("loop", json::object()), TemplateError);
}

TEST(TemplateTest, PipelinesPassLastArgument)
{
    EXPECT_EQ(render("{{\"a b&c\" | urlquery}}"), "a+b%26c");
    EXPECT_EQ(render("{{.n | print \"n=\"}}", {{"n", 3}}), "n=3");
}

TEST(TemplateTest, Builtins)
{
    json data = {{"list", {10, 20, 30}}, {"m", {{"k", "v"}}}, {"s", "abc"}};
    EXPECT_EQ(render("{{len .list}} {{len .s}}", data), "3 3");
    EXPECT_EQ(render("{{index .list 1}} {{index .m \"k\"}}", data), "20 v");
    EXPECT_EQ(render("{{if and .s (not .missing)}}yes{{end}}", data), "yes");
    EXPECT_EQ(render("{{or .missing \"fallback\"}}", data), "fallback");
    EXPECT_EQ(render("{{if lt 1 2}}lt{{end}}{{if ge \"b\" \"a\"}}ge{{end}}", data), "ltge");
    EXPECT_EQ(render("{{if ne .s \"x\"}}ne{{end}}{{if eq .s \"x\" \"abc\"}}eq{{end}}", data), "neeq");
    EXPECT_EQ(render("{{print 1 2 \"x\" 3}}", data), "1 2x3");
}

TEST(TemplateTest, AndShortCircuits)
{
    FuncMap funcs = {{"boom", [](const std::vector<json> &) -> json
                      { throw std::runtime_error("should not run"); }}};
    EXPECT_EQ(render("{{and false (boom)}}", json::object(), funcs), "false");
}

TEST(TemplateTest, UserFunctionsAreCalled)
{
    FuncMap funcs = {{"upper", [](const std::vector<json> &args) -> json
                      {
                          std::string s = args.at(0).get<std::string>();
                          std::transform(s.begin(), s.end(), s.begin(), ::toupper);
                          return s;
                      }}};
    EXPECT_EQ(render("{{upper .name}}", {{"name", "arbor"}}, funcs), "ARBOR");
}

TEST(TemplateTest, FailingUserFunctionIsExecutionError)
{
    FuncMap funcs = {{"fail", [](const std::vector<json> &) -> json
                      { throw std::runtime_error("nope"); }}};
    try
    {
        render("{{fail}}", json::object(), funcs);
        FAIL() << "expected an execution error";
    }
    catch (const TemplateError &e)
    {
        EXPECT_NE(std::string(e.what()).find("error calling fail"), std::string::npos) << e.what();
    }
}

TEST(TemplateTest, NumberLiterals)
{
    EXPECT_EQ(render("{{0x10}} {{010}} {{1.5}} {{-3}}"), "16 8 1.5 -3");
}

TEST(TemplateTest, StringLiterals)
{
    EXPECT_EQ(render("{{\"tab\\there\"}}|{{`raw\\n`}}"), "tab\there|raw\\n");
}

TEST(TemplateSetTest, QueryEscape)
{
    EXPECT_EQ(TemplateSet::queryEscape("a b/c?d=é"), "a+b%2Fc%3Fd%3D%C3%A9");
}
