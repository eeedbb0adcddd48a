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

#ifndef MDTREE_AST_H
#define MDTREE_AST_H

#include "mdtree.h"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mdtree {

/* Node types. The order matches the alternatives of Node_Value. */
enum class Node_Type {
  root,
  heading,
  paragraph,
  code_block,
  list,
  ordered_list,
  list_item,
  blockquote,
  table,
  hr,
  html,
  text,
  inline_code,
  link,
  image,
  strong,
  em,
  del
};

struct Node;

/* Block nodes. Each carries the zero-based source line it starts at. */

struct Root_Node {
  std::vector<Node> children;
  unsigned node_count = 0; /* Nodes below the root. */
};

struct Heading_Node {
  unsigned short level; /* 1 - 6 */
  mdstring id;          /* Slug of the heading text; not unique. */
  std::vector<Node> children;
  MD_LINE line = 0;
};

struct Paragraph_Node {
  std::vector<Node> children;
  MD_LINE line = 0;
};

struct Code_Block_Node {
  mdstring language;
  mdstring code;
  unsigned line_count = 0;
  MD_LINE line = 0;
};

/* Items of both list kinds are List_Item_Node values. */
struct List_Node {
  std::vector<Node> items;
  MD_LINE line = 0;
};

struct Ordered_List_Node {
  std::vector<Node> items;
  MD_LINE line = 0;
};

struct List_Item_Node {
  mdstring marker;
  std::vector<Node> children;
  MD_LINE line = 0;
};

struct Blockquote_Node {
  std::vector<Node> children;
  MD_LINE line = 0;
};

struct Table_Cell {
  std::vector<Node> content;
  Align align = Align::none;
  bool is_header = false;
};

struct Table_Row {
  std::vector<Table_Cell> cells;
};

struct Table_Head {
  std::vector<Table_Cell> cells;
};

struct Table_Body {
  std::vector<Table_Row> rows;
};

struct Table_Node {
  Table_Head head;
  Table_Body body;
  MD_LINE line = 0;
};

struct Hr_Node {
  MD_LINE line = 0;
};

struct Html_Node {
  mdstring html;
  MD_LINE line = 0;
};

/* Inline nodes. */

struct Text_Node {
  mdstring text;
};

struct Inline_Code_Node {
  mdstring code;
};

struct Link_Node {
  mdstring href;
  std::optional<mdstring> title;
  std::vector<Node> children;
};

struct Image_Node {
  mdstring alt;
  mdstring src;
  std::optional<mdstring> title;
};

struct Strong_Node {
  std::vector<Node> children;
};

struct Em_Node {
  std::vector<Node> children;
};

struct Del_Node {
  std::vector<Node> children;
};

using Node_Value =
    std::variant<Root_Node, Heading_Node, Paragraph_Node, Code_Block_Node,
                 List_Node, Ordered_List_Node, List_Item_Node,
                 Blockquote_Node, Table_Node, Hr_Node, Html_Node, Text_Node,
                 Inline_Code_Node, Link_Node, Image_Node, Strong_Node,
                 Em_Node, Del_Node>;

struct Node {
  Node_Value value;

  Node_Type type() const { return static_cast<Node_Type>(value.index()); }

  /* Child sequence of the node, or nullptr if the node type has none. */
  std::vector<Node> *children();
  const std::vector<Node> *children() const;

  /* Item sequence of list nodes, nullptr for other types. */
  std::vector<Node> *items();
  const std::vector<Node> *items() const;
};

/* Name of the type as used in the JSON form ("codeBlock", "listItem"...). */
const char *node_type_name(Node_Type type);

/* Visit, in source order, every direct descendant of the node: children,
 * list items and the content of table cells (head cells first). */
void for_each_child(const Node &node,
                    const std::function<void(const Node &)> &fn);
void for_each_child(Node &node, const std::function<void(Node &)> &fn);

/*************************
 ***  Building the AST  ***
 *************************/

class Ast_Builder {
public:
  explicit Ast_Builder(const Parser_Options &options = {})
      : options_(options) {}

  /* Blank tokens produce no node. The builder keeps no state between calls. */
  Node build(const std::vector<Block_Token> &tokens) const;

  /* Map inline tokens of `text` to nodes, recursing into the inner text of
   * links and spans. */
  std::vector<Node> build_inlines(mdstringview text) const;

  const Parser_Options &options() const { return options_; }
  void set_options(const Parser_Options &options) { options_ = options; }

private:
  std::vector<Node> build_blocks(const std::vector<Block_Token> &tokens,
                                 MD_LINE line_offset, unsigned depth) const;
  Node build_block(const Block_Token &token, MD_LINE line_offset,
                   unsigned depth) const;
  std::vector<Node> build_inlines(mdstringview text, unsigned depth) const;

  Parser_Options options_;
};

/*******************
 ***  Utilities  ***
 *******************/

/* ASCII-lowercase, keep word characters (multi-byte UTF-8 included), spaces
 * and hyphens, turn whitespace runs into '-' and collapse repeated '-'. */
mdstring slugify(mdstringview text);

/* Concatenation of all descendant Text and Inline_Code content. */
mdstring flatten_text(const Node &node);

/* Number of nodes below `node`. */
unsigned count_nodes(const Node &node);

/* Pre-order walk collecting every node of the given type. */
std::vector<const Node *> filter_by_type(const Node &root, Node_Type type);

struct Link_Info {
  mdstring text;
  mdstring href;
  std::optional<mdstring> title;
};

struct Image_Info {
  mdstring alt;
  mdstring src;
  std::optional<mdstring> title;
};

struct Heading_Info {
  unsigned level;
  mdstring text;
  mdstring id;
};

std::vector<Link_Info> extract_links(const Node &root);
std::vector<Image_Info> extract_images(const Node &root);
std::vector<Heading_Info> extract_headings(const Node &root);

/* Rebuild the tree top-down: `fn` gets each node and returns its
 * replacement, whose descendants are then transformed in turn. */
Node transform(const Node &root, const std::function<Node(const Node &)> &fn);

/* Check the structural invariants of a (possibly hand-built) tree. */
bool validate(const Node &root);

/* Entry of the table of contents. Entries made for skipped heading levels
 * have `is_heading == false` and no text. */
struct Toc_Node {
  unsigned level = 0;
  bool is_heading = false;
  mdstring text;
  mdstring id;
  std::vector<Toc_Node> items;
  std::vector<Toc_Node> children;
};

std::vector<Toc_Node> generate_table_of_contents(const Node &root);

} // namespace mdtree

#endif /* MDTREE_AST_H */
