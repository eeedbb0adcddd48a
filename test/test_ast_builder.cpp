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

#include "mdtree-ast.h"

#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

using namespace mdtree;

namespace {

Node build(const char *markdown, const Parser_Options &options = {}) {
  return Ast_Builder(options).build(tokenize(markdown, options));
}

const std::vector<Node> &children_of(const Node &node) {
  static const std::vector<Node> none;
  const auto *children = node.children();
  return children != nullptr ? *children : none;
}

} // namespace

TEST(AstBuilder, HeadingAndParagraph) {
  Node root = build("# Title\n\nParagraph text");

  ASSERT_EQ(root.type(), Node_Type::root);
  const auto &blocks = children_of(root);
  ASSERT_EQ(blocks.size(), 2u);

  const auto &heading = std::get<Heading_Node>(blocks[0].value);
  EXPECT_EQ(heading.level, 1);
  EXPECT_EQ(heading.id, "title");
  EXPECT_EQ(heading.line, 0u);
  ASSERT_EQ(heading.children.size(), 1u);
  EXPECT_EQ(std::get<Text_Node>(heading.children[0].value).text, "Title");

  const auto &para = std::get<Paragraph_Node>(blocks[1].value);
  EXPECT_EQ(para.line, 2u);
  ASSERT_EQ(para.children.size(), 1u);
  EXPECT_EQ(std::get<Text_Node>(para.children[0].value).text,
            "Paragraph text");

  EXPECT_EQ(std::get<Root_Node>(root.value).node_count, 4u);
}

TEST(AstBuilder, UnclosedFence) {
  Node root = build("```js\nconst x=1;");

  ASSERT_EQ(children_of(root).size(), 1u);
  const auto &code = std::get<Code_Block_Node>(children_of(root)[0].value);
  EXPECT_EQ(code.language, "js");
  EXPECT_EQ(code.code, "const x=1;");
  EXPECT_EQ(code.line_count, 1u);
}

TEST(AstBuilder, Table) {
  Node root = build("| a | b |\n|---|--:|\n| 1 | 2 | 3 |");

  ASSERT_EQ(children_of(root).size(), 1u);
  const auto &table = std::get<Table_Node>(children_of(root)[0].value);
  ASSERT_EQ(table.head.cells.size(), 2u);
  EXPECT_TRUE(table.head.cells[0].is_header);
  EXPECT_EQ(table.head.cells[0].align, Align::none);
  EXPECT_EQ(table.head.cells[1].align, Align::right);
  ASSERT_EQ(table.body.rows.size(), 1u);
  const auto &cells = table.body.rows[0].cells;
  ASSERT_EQ(cells.size(), 3u);
  EXPECT_FALSE(cells[0].is_header);
  EXPECT_EQ(std::get<Text_Node>(cells[0].content[0].value).text, "1");
  EXPECT_EQ(cells[1].align, Align::right);
  EXPECT_EQ(cells[2].align, Align::none);
}

TEST(AstBuilder, DuplicateHeadingsShareId) {
  Node root = build("# Title\n\n# Title");

  auto headings = extract_headings(root);
  ASSERT_EQ(headings.size(), 2u);
  EXPECT_EQ(headings[0].id, "title");
  EXPECT_EQ(headings[1].id, "title");
}

TEST(AstBuilder, NestedBlockquote) {
  Node root = build("> outer\n> > inner");

  ASSERT_EQ(children_of(root).size(), 1u);
  const Node &outer = children_of(root)[0];
  ASSERT_EQ(outer.type(), Node_Type::blockquote);
  ASSERT_EQ(children_of(outer).size(), 2u);
  EXPECT_EQ(children_of(outer)[0].type(), Node_Type::paragraph);
  EXPECT_EQ(flatten_text(children_of(outer)[0]), "outer");

  const Node &inner = children_of(outer)[1];
  ASSERT_EQ(inner.type(), Node_Type::blockquote);
  EXPECT_EQ(std::get<Blockquote_Node>(inner.value).line, 1u);
  ASSERT_EQ(children_of(inner).size(), 1u);
  EXPECT_EQ(children_of(inner)[0].type(), Node_Type::paragraph);
  EXPECT_EQ(std::get<Paragraph_Node>(children_of(inner)[0].value).line, 1u);
  EXPECT_EQ(flatten_text(children_of(inner)[0]), "inner");
}

TEST(AstBuilder, BlockquoteNestingLimit) {
  Parser_Options options;
  options.max_nesting = 1;

  Node root = build("> > > deep", options);

  const Node &outer = children_of(root)[0];
  const Node &inner = children_of(outer)[0];
  ASSERT_EQ(inner.type(), Node_Type::blockquote);
  ASSERT_EQ(children_of(inner).size(), 1u);
  const Node &para = children_of(inner)[0];
  ASSERT_EQ(para.type(), Node_Type::paragraph);
  ASSERT_EQ(children_of(para).size(), 1u);
  EXPECT_EQ(std::get<Text_Node>(children_of(para)[0].value).text, "> deep");
}

TEST(AstBuilder, InlineNestingLimit) {
  Node root = build("**_a_**");
  const Node &strong = children_of(children_of(root)[0])[0];
  ASSERT_EQ(strong.type(), Node_Type::strong);
  EXPECT_EQ(children_of(strong)[0].type(), Node_Type::em);

  Parser_Options options;
  options.max_nesting = 0;
  root = build("**_a_**", options);
  const Node &limited = children_of(children_of(root)[0])[0];
  ASSERT_EQ(limited.type(), Node_Type::strong);
  ASSERT_EQ(children_of(limited).size(), 1u);
  EXPECT_EQ(std::get<Text_Node>(children_of(limited)[0].value).text, "_a_");
}

TEST(AstBuilder, HeadingWithInlineMarkup) {
  Node root = build("## Hello *World*");

  const Node &heading = children_of(root)[0];
  EXPECT_EQ(std::get<Heading_Node>(heading.value).id, "hello-world");
  ASSERT_EQ(children_of(heading).size(), 2u);
  EXPECT_EQ(children_of(heading)[1].type(), Node_Type::em);
}

TEST(AstBuilder, Lists) {
  Node root = build("para\n\n- a\n- **b**\n\n1. x");

  const auto &blocks = children_of(root);
  ASSERT_EQ(blocks.size(), 3u);
  ASSERT_EQ(blocks[1].type(), Node_Type::list);
  const auto &list = std::get<List_Node>(blocks[1].value);
  EXPECT_EQ(list.line, 2u);
  ASSERT_EQ(list.items.size(), 2u);
  const auto &item = std::get<List_Item_Node>(list.items[1].value);
  EXPECT_EQ(item.marker, "-");
  EXPECT_EQ(item.line, 3u);
  EXPECT_EQ(item.children[0].type(), Node_Type::strong);
  EXPECT_EQ(children_of(blocks[1]).size(), 0u);
  ASSERT_NE(blocks[1].items(), nullptr);
  EXPECT_EQ(blocks[1].items()->size(), 2u);
  EXPECT_EQ(blocks[2].type(), Node_Type::ordered_list);
}

TEST(AstBuilder, ListKindsAreSeparateNodes) {
  Node root = build("- a\n1. b");

  const auto &blocks = children_of(root);
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0].type(), Node_Type::list);
  EXPECT_EQ(blocks[1].type(), Node_Type::ordered_list);
  EXPECT_EQ(std::get<List_Item_Node>(blocks[1].items()->at(0).value).marker,
            "1");
}

TEST(AstBuilder, BlankTokensProduceNoNodes) {
  Node root = build("\n\n\n");

  EXPECT_TRUE(children_of(root).empty());
  EXPECT_EQ(std::get<Root_Node>(root.value).node_count, 0u);
}

TEST(AstBuilder, HrAndHtml) {
  Node root = build("---\n<div>x</div>");

  const auto &blocks = children_of(root);
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0].type(), Node_Type::hr);
  EXPECT_EQ(std::get<Html_Node>(blocks[1].value).html, "<div>x</div>");
  EXPECT_EQ(std::get<Html_Node>(blocks[1].value).line, 1u);
}

TEST(AstBuilder, NodeTypeNames) {
  EXPECT_STREQ(node_type_name(Node_Type::root), "root");
  EXPECT_STREQ(node_type_name(Node_Type::code_block), "codeBlock");
  EXPECT_STREQ(node_type_name(Node_Type::ordered_list), "orderedList");
  EXPECT_STREQ(node_type_name(Node_Type::list_item), "listItem");
  EXPECT_STREQ(node_type_name(Node_Type::inline_code), "inlineCode");
  EXPECT_STREQ(node_type_name(Node_Type::del), "del");
}

TEST(AstUtils, Slugify) {
  EXPECT_EQ(slugify("Hello, World!"), "hello-world");
  EXPECT_EQ(slugify("  A  B  "), "a-b");
  EXPECT_EQ(slugify("C++ & Rust"), "c-rust");
  EXPECT_EQ(slugify("snake_case-name"), "snake_case-name");
  EXPECT_EQ(slugify("Caf\xC3\xA9 \xC3\x9C" "berblick"), "caf-berblick");
  EXPECT_EQ(slugify("\xC3\x9C" "ber Uns"), "ber-uns");
  EXPECT_EQ(slugify("!!!"), "");
}

TEST(AstUtils, WalksIncludeTableCells) {
  Node root = build("| a | b |\n|---|---|\n| 1 | [2](u) |");

  EXPECT_EQ(flatten_text(root), "ab12");
  EXPECT_EQ(extract_links(root).size(), 1u);
  EXPECT_EQ(filter_by_type(root, Node_Type::text).size(), 4u);
  /* table, 4 cell texts, the link */
  EXPECT_EQ(count_nodes(root), 6u);
}

TEST(AstUtils, CountNodesSkipsListItems) {
  Node root = build("- a\n- *b*");

  /* list, text "a", em and its text */
  EXPECT_EQ(count_nodes(root), 4u);
  EXPECT_EQ(std::get<Root_Node>(root.value).node_count, 4u);
}

TEST(AstUtils, ExtractLinksAndImages) {
  Node root = build("[a *b*](u) and ![i](s \"t\")\n\n- [c](v)");

  auto links = extract_links(root);
  ASSERT_EQ(links.size(), 2u);
  EXPECT_EQ(links[0].text, "a b");
  EXPECT_EQ(links[0].href, "u");
  EXPECT_FALSE(links[0].title.has_value());
  EXPECT_EQ(links[1].href, "v");

  auto images = extract_images(root);
  ASSERT_EQ(images.size(), 1u);
  EXPECT_EQ(images[0].alt, "i");
  EXPECT_EQ(images[0].src, "s");
  EXPECT_EQ(images[0].title, "t");
}

TEST(AstUtils, FilterByTypeIsPreOrder) {
  Node root = build("# One\n\n> ## Two\n\n### Three");

  auto headings = filter_by_type(root, Node_Type::heading);
  ASSERT_EQ(headings.size(), 3u);
  EXPECT_EQ(std::get<Heading_Node>(headings[0]->value).level, 1);
  EXPECT_EQ(std::get<Heading_Node>(headings[1]->value).level, 2);
  EXPECT_EQ(std::get<Heading_Node>(headings[2]->value).level, 3);
}

TEST(AstUtils, Transform) {
  Node root = build("# Title\n\nParagraph text");

  Node out = transform(root, [](const Node &node) {
    if (node.type() == Node_Type::paragraph)
      return Node{Hr_Node{std::get<Paragraph_Node>(node.value).line}};
    if (const auto *text = std::get_if<Text_Node>(&node.value)) {
      std::string upper;
      for (char ch : text->text)
        upper += (char)std::toupper((unsigned char)ch);
      return Node{Text_Node{upper}};
    }
    return node;
  });

  ASSERT_EQ(children_of(out).size(), 2u);
  EXPECT_EQ(flatten_text(children_of(out)[0]), "TITLE");
  EXPECT_EQ(children_of(out)[1].type(), Node_Type::hr);
  EXPECT_EQ(std::get<Root_Node>(out.value).node_count, 3u);
  /* The source tree is left alone. */
  EXPECT_EQ(flatten_text(root), "TitleParagraph text");
}

TEST(AstUtils, ValidateBuiltTrees) {
  EXPECT_TRUE(validate(build("# a\n\n- b\n\n> c\n\n|x|\n|-|\n|y|")));
}

TEST(AstUtils, ValidateRejectsBrokenTrees) {
  EXPECT_FALSE(validate(Node{Paragraph_Node{}}));

  Node nested_root{Root_Node{}};
  std::get<Root_Node>(nested_root.value).children.push_back(Node{Root_Node{}});
  EXPECT_FALSE(validate(nested_root));

  Node bad_item{Root_Node{}};
  List_Node list;
  list.items.push_back(Node{Paragraph_Node{}});
  std::get<Root_Node>(bad_item.value).children.push_back(Node{list});
  EXPECT_FALSE(validate(bad_item));

  Node stray_item{Root_Node{}};
  std::get<Root_Node>(stray_item.value)
      .children.push_back(Node{List_Item_Node{"-", {}, 0}});
  EXPECT_FALSE(validate(stray_item));

  Node bad_level{Root_Node{}};
  std::get<Root_Node>(bad_level.value)
      .children.push_back(Node{Heading_Node{0, "", {}, 0}});
  EXPECT_FALSE(validate(bad_level));
}

TEST(TableOfContents, LevelsNest) {
  auto toc = generate_table_of_contents(build("# A\n## B\n## C\n# D"));

  ASSERT_EQ(toc.size(), 1u);
  EXPECT_EQ(toc[0].level, 1u);
  EXPECT_FALSE(toc[0].is_heading);
  ASSERT_EQ(toc[0].items.size(), 2u);
  EXPECT_EQ(toc[0].items[0].text, "A");
  EXPECT_EQ(toc[0].items[1].text, "D");
  ASSERT_EQ(toc[0].children.size(), 1u);
  const auto &second = toc[0].children[0];
  EXPECT_EQ(second.level, 2u);
  ASSERT_EQ(second.items.size(), 2u);
  EXPECT_EQ(second.items[0].text, "B");
  EXPECT_EQ(second.items[0].id, "b");
  EXPECT_TRUE(second.items[0].is_heading);
  EXPECT_EQ(second.items[1].text, "C");
}

TEST(TableOfContents, SkippedLevelsGetContainers) {
  auto toc = generate_table_of_contents(build("### Deep"));

  ASSERT_EQ(toc.size(), 1u);
  ASSERT_EQ(toc[0].children.size(), 1u);
  ASSERT_EQ(toc[0].children[0].children.size(), 1u);
  const auto &third = toc[0].children[0].children[0];
  EXPECT_EQ(third.level, 3u);
  ASSERT_EQ(third.items.size(), 1u);
  EXPECT_EQ(third.items[0].text, "Deep");
  EXPECT_TRUE(toc[0].items.empty());
}

TEST(TableOfContents, NoHeadings) {
  EXPECT_TRUE(generate_table_of_contents(build("text")).empty());
}
