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

#include "mdtree-json.h"

#include <gtest/gtest.h>

#include <string>

using namespace mdtree;
using nlohmann::json;

namespace {

json ast_json(const char *markdown) {
  return Ast_Builder().build(tokenize(markdown));
}

} // namespace

TEST(JsonExport, Tree) {
  json j = ast_json("# Title\n\nParagraph text");

  EXPECT_EQ(j["type"], "root");
  EXPECT_EQ(j["node_count"], 4);
  ASSERT_EQ(j["children"].size(), 2u);

  const json &heading = j["children"][0];
  EXPECT_EQ(heading["type"], "heading");
  EXPECT_EQ(heading["level"], 1);
  EXPECT_EQ(heading["id"], "title");
  EXPECT_EQ(heading["line"], 0);
  EXPECT_EQ(heading["children"][0]["type"], "text");
  EXPECT_EQ(heading["children"][0]["text"], "Title");

  EXPECT_EQ(j["children"][1]["type"], "paragraph");
  EXPECT_EQ(j["children"][1]["line"], 2);
}

TEST(JsonExport, LinksAndImages) {
  json j = ast_json("[a](u) ![i](s \"t\")");
  const json &inlines = j["children"][0]["children"];

  ASSERT_EQ(inlines.size(), 3u);
  EXPECT_EQ(inlines[0]["type"], "link");
  EXPECT_EQ(inlines[0]["href"], "u");
  EXPECT_TRUE(inlines[0]["title"].is_null());
  EXPECT_EQ(inlines[0]["children"][0]["text"], "a");
  EXPECT_EQ(inlines[2]["type"], "image");
  EXPECT_EQ(inlines[2]["alt"], "i");
  EXPECT_EQ(inlines[2]["title"], "t");
}

TEST(JsonExport, ListsUseItems) {
  json j = ast_json("1. x\n2. y");
  const json &list = j["children"][0];

  EXPECT_EQ(list["type"], "orderedList");
  EXPECT_FALSE(list.contains("children"));
  ASSERT_EQ(list["items"].size(), 2u);
  EXPECT_EQ(list["items"][1]["type"], "listItem");
  EXPECT_EQ(list["items"][1]["marker"], "2");
  EXPECT_EQ(list["items"][1]["line"], 1);
}

TEST(JsonExport, Table) {
  json j = ast_json("| a | b |\n|---|:-:|\n| 1 | 2 |");
  const json &table = j["children"][0];

  EXPECT_EQ(table["type"], "table");
  ASSERT_EQ(table["head"]["cells"].size(), 2u);
  EXPECT_TRUE(table["head"]["cells"][0]["align"].is_null());
  EXPECT_EQ(table["head"]["cells"][1]["align"], "center");
  EXPECT_EQ(table["head"]["cells"][0]["is_header"], true);
  EXPECT_EQ(table["body"]["rows"][0]["cells"][1]["content"][0]["text"], "2");
  EXPECT_EQ(table["body"]["rows"][0]["cells"][1]["is_header"], false);
}

TEST(JsonExport, CodeBlock) {
  json j = ast_json("```c\na;\nb;\n```");
  const json &code = j["children"][0];

  EXPECT_EQ(code["type"], "codeBlock");
  EXPECT_EQ(code["language"], "c");
  EXPECT_EQ(code["code"], "a;\nb;");
  EXPECT_EQ(code["line_count"], 2);
}

TEST(JsonExport, BlockTokens) {
  json j = tokens_to_json(tokenize("# Title\n\n- a\n\n| h |\n|---|\n| c |"));

  ASSERT_EQ(j.size(), 4u);
  EXPECT_EQ(j[0]["type"], "heading");
  EXPECT_EQ(j[0]["raw"], "# Title");
  EXPECT_EQ(j[0]["text"], "Title");
  EXPECT_EQ(j[1]["type"], "blank");
  EXPECT_EQ(j[1]["line"], 1);
  EXPECT_EQ(j[2]["type"], "list");
  EXPECT_EQ(j[2]["items"][0]["marker"], "-");
  EXPECT_EQ(j[2]["items"][0]["content"], "a");
  EXPECT_EQ(j[2]["raw"], "- a\n");
  EXPECT_EQ(j[3]["type"], "table");
  EXPECT_EQ(j[3]["headers"][0]["text"], "h");
  EXPECT_TRUE(j[3]["headers"][0]["align"].is_null());
  EXPECT_EQ(j[3]["rows"][0][0], "c");
  EXPECT_EQ(j[3]["line"], 4);
}

TEST(JsonExport, InlineTokens) {
  json j = inline_tokens_to_json(tokenize_inline("a `b` ~~c~~"));

  ASSERT_EQ(j.size(), 4u);
  EXPECT_EQ(j[0], (json{{"type", "text"}, {"text", "a "}, {"raw", "a "}}));
  EXPECT_EQ(j[1]["type"], "inlineCode");
  EXPECT_EQ(j[1]["code"], "b");
  EXPECT_EQ(j[3]["type"], "del");
  EXPECT_EQ(j[3]["raw"], "~~c~~");
}

TEST(JsonExport, TableOfContents) {
  json j = generate_table_of_contents(Ast_Builder().build(tokenize("## Sub")));

  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["level"], 1);
  EXPECT_FALSE(j[0].contains("text"));
  const json &entry = j[0]["children"][0]["items"][0];
  EXPECT_EQ(entry["text"], "Sub");
  EXPECT_EQ(entry["id"], "sub");
  EXPECT_EQ(entry["level"], 2);
}
