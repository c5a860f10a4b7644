#include <gtest/gtest.h>

#include "content_sniffer.hpp"
#include "memory_filesystem.hpp"

using namespace std::string_literals;

TEST(ContentSnifferTest, DetectsHtmlCaseInsensitively)
{
    EXPECT_EQ(ContentTypeSniffer::detect("<!DOCTYPE html><html></html>"), "text/html; charset=utf-8");
    EXPECT_EQ(ContentTypeSniffer::detect("  \n<html lang=\"en\">"), "text/html; charset=utf-8");
    EXPECT_EQ(ContentTypeSniffer::detect("<p>hi</p>"), "text/html; charset=utf-8");
    EXPECT_EQ(ContentTypeSniffer::detect("<!-- note -->"), "text/html; charset=utf-8");
}

TEST(ContentSnifferTest, TagMustBeTerminated)
{
    EXPECT_EQ(ContentTypeSniffer::detect("<pre>x</pre>"), "text/plain; charset=utf-8");
    EXPECT_EQ(ContentTypeSniffer::detect("<html"), "text/plain; charset=utf-8");
}

TEST(ContentSnifferTest, DetectsXml)
{
    EXPECT_EQ(ContentTypeSniffer::detect("<?xml version=\"1.0\"?><a/>"), "text/xml; charset=utf-8");
}

TEST(ContentSnifferTest, DetectsBinarySignatures)
{
    EXPECT_EQ(ContentTypeSniffer::detect("\x89PNG\r\n\x1A\n\0\0\0\rIHDR"s), "image/png");
    EXPECT_EQ(ContentTypeSniffer::detect("GIF89a..."), "image/gif");
    EXPECT_EQ(ContentTypeSniffer::detect("\xFF\xD8\xFF\xE0"s), "image/jpeg");
    EXPECT_EQ(ContentTypeSniffer::detect("%PDF-1.7"), "application/pdf");
    EXPECT_EQ(ContentTypeSniffer::detect("PK\x03\x04rest"s), "application/zip");
    EXPECT_EQ(ContentTypeSniffer::detect("\x1F\x8B\x08\x00"s), "application/x-gzip");
    EXPECT_EQ(ContentTypeSniffer::detect("\0asm\x01\0\0\0"s), "application/wasm");
    EXPECT_EQ(ContentTypeSniffer::detect("wOF2...."), "font/woff2");
}

TEST(ContentSnifferTest, DetectsMaskedContainers)
{
    EXPECT_EQ(ContentTypeSniffer::detect("RIFF\x10\x20\x30\x40WEBPVP8 "s), "image/webp");
    EXPECT_EQ(ContentTypeSniffer::detect("RIFF\x10\x20\x30\x40WAVEfmt "s), "audio/wave");
    EXPECT_EQ(ContentTypeSniffer::detect("RIFF\x10\x20\x30\x40" "AVI LIST"s), "video/avi");
}

TEST(ContentSnifferTest, DetectsMp4)
{
    std::string mp4 = "\0\0\0\x18" "ftypisom\0\0\0\0mp41isom"s;
    EXPECT_EQ(ContentTypeSniffer::detect(mp4), "video/mp4");
}

TEST(ContentSnifferTest, FallsBackToTextOrOctetStream)
{
    EXPECT_EQ(ContentTypeSniffer::detect(""), "text/plain; charset=utf-8");
    EXPECT_EQ(ContentTypeSniffer::detect("body { color: red; }\n"), "text/plain; charset=utf-8");
    EXPECT_EQ(ContentTypeSniffer::detect("\x01\x02\x03\x04"s), "application/octet-stream");
}

TEST(ContentSnifferTest, OnlyLooksAtTheFirstBytes)
{
    std::string data(ContentTypeSniffer::SNIFF_LEN, 'a');
    data += '\x01';
    EXPECT_EQ(ContentTypeSniffer::detect(data), "text/plain; charset=utf-8");
}

TEST(ContentSnifferTest, SniffReturnsConsumedPrefix)
{
    std::string content(2000, 'x');
    content.replace(0, 6, "GIF87a");

    auto tree = MemoryFileSystem::create();
    tree->addFile("blob", content);
    auto file = tree->open("blob");

    ContentTypeSniffer::Result result = ContentTypeSniffer::sniff(*file);
    EXPECT_EQ(result.contentType, "image/gif");
    EXPECT_EQ(result.prefix.size(), ContentTypeSniffer::SNIFF_LEN);
    EXPECT_EQ(result.prefix + file->readAll(), content);
}

TEST(ContentSnifferTest, SniffShortFile)
{
    auto tree = MemoryFileSystem::create();
    tree->addFile("short", "hi");
    auto file = tree->open("short");

    ContentTypeSniffer::Result result = ContentTypeSniffer::sniff(*file);
    EXPECT_EQ(result.prefix, "hi");
    EXPECT_EQ(result.contentType, "text/plain; charset=utf-8");
}
