/*
 * MD4C: Markdown parser for C
 * (http://github.com/mity/md4c)
 *
 * Copyright (c) 2016-2020 Martin Mitas
 *
 * Permission is hereby granted, free of charge, to any person obtaining a
 * copy of this software and associated documentation files (the "Software"),
 * to deal in the Software without restriction, including without limitation
 * the rights to use, copy, modify, merge, publish, distribute, sublicense,
 * and/or sell copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
 * IN THE SOFTWARE.
 */

#include "mdtree-parser.h"

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace mdtree;

namespace {

void log_to_vector(mdstringview msg, void *userdata) {
  static_cast<std::vector<std::string> *>(userdata)->emplace_back(msg);
}

} // namespace

TEST(Parser, ParseTrimsOutput) {
  Parser parser;

  EXPECT_EQ(parser.parse("# Title\n\nParagraph text"),
            "<h1 id=\"title\">Title</h1>\n<p>Paragraph text</p>");
  EXPECT_EQ(parser.parse(""), "");
}

TEST(Parser, LineEndingsAreNormalized) {
  Parser parser;

  EXPECT_EQ(parser.parse("a\r\nb"), "<p>a\nb</p>");
}

TEST(Parser, NullInputThrows) {
  Parser parser;
  const char *markdown = nullptr;

  EXPECT_THROW(parser.parse(markdown), Error);
}

TEST(Parser, SkipsByteOrderMark) {
  Parser with_skip({}, {Render_Flag::Skip_UTF8_BOM});
  Parser without_skip;

  EXPECT_EQ(with_skip.parse("\xEF\xBB\xBF# A"), "<h1 id=\"a\">A</h1>");
  EXPECT_EQ(without_skip.parse("\xEF\xBB\xBF# A"), "<p>\xEF\xBB\xBF# A</p>");
}

TEST(Parser, RenderFlags) {
  Parser parser({}, {Render_Flag::XHTML, Render_Flag::Sanitize});

  EXPECT_EQ(parser.parse("![a](b)\n\n<div>x</div>"),
            "<p><img src=\"b\" alt=\"a\" /></p>\n<!-- HTML block sanitized -->");
}

TEST(Parser, PluginsRunOnParse) {
  Parser parser;

  parser.use("rule", [](Node &root) {
    root.children()->push_back(Node{Hr_Node{}});
  });
  EXPECT_TRUE(parser.plugins().has("rule"));
  EXPECT_EQ(parser.parse("a"), "<p>a</p>\n<hr />");

  EXPECT_TRUE(parser.unuse("rule"));
  EXPECT_EQ(parser.parse("a"), "<p>a</p>");
}

TEST(Parser, ParseWithRenderer) {
  Parser parser;
  Html_Renderer renderer;

  renderer.add_renderer(Node_Type::paragraph, [](const Node &node,
                                                 Html_Renderer &r) {
    return "<div class=\"p\">" + r.render_children(node) + "</div>\n";
  });
  EXPECT_EQ(parser.parse_with_renderer("x", renderer), "<div class=\"p\">x</div>\n");
}

TEST(Parser, Options) {
  Parser parser;

  EXPECT_EQ(parser.parse("~~x~~"), "<p><del>x</del></p>");

  Parser_Options options = parser.options();
  options.extensions.erase(Extension::Strikethrough);
  parser.set_options(options);
  EXPECT_FALSE(parser.options().has(Extension::Strikethrough));
  EXPECT_EQ(parser.parse("~~x~~"), "<p>~~x~~</p>");
}

TEST(Parser, Statistics) {
  const std::string markdown = "# T\n\n[a](u) ![i](s)\n\n- x\n- y\n\n"
                               "```\nc\n```\n\n| a |\n|---|\n| 1 |";
  Parser parser;

  Statistics stats = parser.statistics(markdown);
  EXPECT_EQ(stats.lines, 14u);
  EXPECT_EQ(stats.characters, markdown.size());
  EXPECT_EQ(stats.tokens, 8u);
  EXPECT_EQ(stats.nodes, 15u);
  EXPECT_EQ(stats.headings, 1u);
  EXPECT_EQ(stats.links, 1u);
  EXPECT_EQ(stats.images, 1u);
  EXPECT_EQ(stats.lists, 1u);
  EXPECT_EQ(stats.code_blocks, 1u);
  EXPECT_EQ(stats.tables, 1u);
}

TEST(Parser, Validate) {
  Parser parser;

  Validation_Report report = parser.validate("# ok\n\n- fine");
  EXPECT_TRUE(report.valid);
  EXPECT_TRUE(report.errors.empty());

  const char *markdown = nullptr;
  report = parser.validate(markdown);
  EXPECT_FALSE(report.valid);
  ASSERT_EQ(report.errors.size(), 1u);
}

TEST(Parser, ExportJson) {
  Parser parser;

  std::string text = parser.export_json("# Hi");
  EXPECT_NE(text.find("\n  \"children\""), std::string::npos);

  nlohmann::json j = nlohmann::json::parse(text);
  EXPECT_EQ(j["type"], "root");
  EXPECT_EQ(j["children"][0]["id"], "hi");
}

TEST(Parser, CacheKeepsTreesBeforePlugins) {
  std::vector<std::string> log;
  Parser_Options options;
  options.enable_cache = true;
  options.debug_log = log_to_vector;
  options.userdata = &log;
  Parser parser(options);

  parser.use("rule", [](Node &root) {
    root.children()->push_back(Node{Hr_Node{}});
  });

  Node first = parser.parse_to_ast("# A");
  Node second = parser.parse_to_ast("# A");
  EXPECT_EQ(parser.cache_size(), 1u);
  EXPECT_EQ(first.children()->size(), 2u);
  EXPECT_EQ(second.children()->size(), 2u);
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0], "Cache hit.");

  parser.parse_to_ast("# A\r\n");
  parser.parse_to_ast("# A\n");
  EXPECT_EQ(parser.cache_size(), 2u);
  EXPECT_EQ(log.size(), 2u);

  parser.clear_cache();
  EXPECT_EQ(parser.cache_size(), 0u);
}

TEST(Parser, CacheIsOffByDefault) {
  Parser parser;

  parser.parse("# A");
  parser.parse("# A");
  EXPECT_EQ(parser.cache_size(), 0u);
}
