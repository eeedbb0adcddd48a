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

#include <algorithm>
#include <cctype>
#include <string>
#include <variant>
#include <vector>

namespace mdtree {

#define MD_LOG(msg)                                                            \
  do {                                                                         \
    if (options_.debug_log != nullptr)                                         \
      options_.debug_log((msg), options_.userdata);                            \
  } while (0)

std::vector<Node> *Node::children() {
  return std::visit(
      [](auto &n) -> std::vector<Node> * {
        if constexpr (requires { n.children; })
          return &n.children;
        else
          return nullptr;
      },
      value);
}

const std::vector<Node> *Node::children() const {
  return const_cast<Node *>(this)->children();
}

std::vector<Node> *Node::items() {
  return std::visit(
      [](auto &n) -> std::vector<Node> * {
        if constexpr (requires { n.items; })
          return &n.items;
        else
          return nullptr;
      },
      value);
}

const std::vector<Node> *Node::items() const {
  return const_cast<Node *>(this)->items();
}

const char *node_type_name(Node_Type type) {
  static constexpr const char *names[]{
      "root",       "heading", "paragraph", "codeBlock", "list",
      "orderedList", "listItem", "blockquote", "table",   "hr",
      "html",       "text",    "inlineCode", "link",     "image",
      "strong",     "em",      "del"};

  return names[static_cast<int>(type)];
}

template <class N, class Fn> static void md_for_each_child(N &node, Fn &&fn) {
  if (auto *children = node.children()) {
    for (auto &child : *children)
      fn(child);
  }
  if (auto *items = node.items()) {
    for (auto &item : *items)
      fn(item);
  }
  if (auto *table = std::get_if<Table_Node>(&node.value)) {
    for (auto &cell : table->head.cells) {
      for (auto &child : cell.content)
        fn(child);
    }
    for (auto &row : table->body.rows) {
      for (auto &cell : row.cells) {
        for (auto &child : cell.content)
          fn(child);
      }
    }
  }
}

void for_each_child(const Node &node,
                    const std::function<void(const Node &)> &fn) {
  md_for_each_child(node, fn);
}

void for_each_child(Node &node, const std::function<void(Node &)> &fn) {
  md_for_each_child(node, fn);
}

/*************************
 ***  Building the AST  ***
 *************************/

Node Ast_Builder::build(const std::vector<Block_Token> &tokens) const {
  Node root{Root_Node{build_blocks(tokens, 0, 0)}};

  std::get<Root_Node>(root.value).node_count = count_nodes(root);
  return root;
}

std::vector<Node>
Ast_Builder::build_blocks(const std::vector<Block_Token> &tokens,
                          MD_LINE line_offset, unsigned depth) const {
  std::vector<Node> nodes;

  for (const Block_Token &token : tokens) {
    if (std::holds_alternative<Blank_Token>(token))
      continue;
    nodes.push_back(build_block(token, line_offset, depth));
  }
  return nodes;
}

Node Ast_Builder::build_block(const Block_Token &token, MD_LINE line_offset,
                              unsigned depth) const {
  const MD_LINE line = line_offset + line_of(token);

  if (const auto *heading = std::get_if<Heading_Token>(&token)) {
    Node node{Heading_Node{heading->level, {},
                           build_inlines(heading->text), line}};
    std::get<Heading_Node>(node.value).id = slugify(flatten_text(node));
    return node;
  }

  if (const auto *para = std::get_if<Paragraph_Token>(&token))
    return Node{Paragraph_Node{build_inlines(para->text), line}};

  if (const auto *code = std::get_if<Code_Block_Token>(&token)) {
    unsigned line_count = std::ranges::count(code->code, '\n') + 1;
    return Node{
        Code_Block_Node{code->language, code->code, line_count, line}};
  }

  if (const auto *list = std::get_if<List_Token>(&token)) {
    std::vector<Node> items;

    /* Continuation lines are part of the item text; they are not scanned
     * for blocks again. */
    for (const List_Item_Token &item : list->items) {
      items.push_back(Node{List_Item_Node{item.marker,
                                          build_inlines(item.content),
                                          line_offset + item.line}});
    }
    if (list->ordered)
      return Node{Ordered_List_Node{std::move(items), line}};
    return Node{List_Node{std::move(items), line}};
  }

  if (const auto *quote = std::get_if<Blockquote_Token>(&token)) {
    if (depth >= options_.max_nesting) {
      MD_LOG("Block quote nesting limit reached, keeping contents as text.");
      std::vector<Node> text;
      text.push_back(Node{Text_Node{quote->content}});
      std::vector<Node> children;
      children.push_back(Node{Paragraph_Node{std::move(text), line}});
      return Node{Blockquote_Node{std::move(children), line}};
    }

    /* The contents are scanned again as a document of their own; nested
     * lines are relative to the first line of the quote. */
    std::vector<Block_Token> nested =
        scan_blocks(split_lines(quote->content), options_);
    return Node{Blockquote_Node{build_blocks(nested, line, depth + 1), line}};
  }

  if (const auto *table = std::get_if<Table_Token>(&token)) {
    Table_Node node;

    node.line = line;
    for (const Table_Header &header : table->headers) {
      node.head.cells.push_back(
          Table_Cell{build_inlines(header.text), header.align, true});
    }
    for (const std::vector<mdstring> &row : table->rows) {
      Table_Row out;
      for (std::size_t i = 0; i < row.size(); i++) {
        /* Cells beyond the header count have no column alignment. */
        Align align = (i < table->headers.size() ? table->headers[i].align
                                                 : Align::none);
        out.cells.push_back(
            Table_Cell{build_inlines(row[i]), align, false});
      }
      node.body.rows.push_back(std::move(out));
    }
    return Node{std::move(node)};
  }

  if (const auto *html = std::get_if<Html_Token>(&token))
    return Node{Html_Node{html->html, line}};

  return Node{Hr_Node{line}};
}

std::vector<Node> Ast_Builder::build_inlines(mdstringview text) const {
  return build_inlines(text, 0);
}

std::vector<Node> Ast_Builder::build_inlines(mdstringview text,
                                             unsigned depth) const {
  std::vector<Node> nodes;

  if (depth > options_.max_nesting) {
    MD_LOG("Inline nesting limit reached, keeping span as text.");
    nodes.push_back(Node{Text_Node{mdstring(text)}});
    return nodes;
  }

  for (const Inline_Token &token : tokenize_inline(text, options_)) {
    if (const auto *t = std::get_if<Text_Token>(&token)) {
      nodes.push_back(Node{Text_Node{t->text}});
    } else if (const auto *code = std::get_if<Code_Span_Token>(&token)) {
      nodes.push_back(Node{Inline_Code_Node{code->code}});
    } else if (const auto *link = std::get_if<Link_Token>(&token)) {
      nodes.push_back(Node{Link_Node{link->href, link->title,
                                     build_inlines(link->text, depth + 1)}});
    } else if (const auto *image = std::get_if<Image_Token>(&token)) {
      nodes.push_back(Node{Image_Node{image->alt, image->src, image->title}});
    } else if (const auto *strong = std::get_if<Strong_Token>(&token)) {
      nodes.push_back(
          Node{Strong_Node{build_inlines(strong->text, depth + 1)}});
    } else if (const auto *em = std::get_if<Em_Token>(&token)) {
      nodes.push_back(Node{Em_Node{build_inlines(em->text, depth + 1)}});
    } else if (const auto *del = std::get_if<Del_Token>(&token)) {
      nodes.push_back(Node{Del_Node{build_inlines(del->text, depth + 1)}});
    }
  }
  return nodes;
}

/*******************
 ***  Utilities  ***
 *******************/

mdstring slugify(mdstringview text) {
  mdstring lowered;
  mdstring kept;
  mdstring slug;
  std::size_t beg = 0;
  std::size_t end;

  for (char ch : text)
    lowered += (char)std::tolower((unsigned char)ch);

  end = lowered.size();
  while (beg < end && std::isspace((unsigned char)lowered[beg]))
    beg++;
  while (end > beg && std::isspace((unsigned char)lowered[end - 1]))
    end--;

  /* Only ASCII word characters survive; multi-byte UTF-8 sequences are
   * dropped. */
  for (std::size_t i = beg; i < end; i++) {
    unsigned char ch = lowered[i];
    if (ch < 0x80 &&
        (std::isalnum(ch) || ch == '_' || ch == '-' || std::isspace(ch)))
      kept += (char)ch;
  }

  for (char ch : kept) {
    if (std::isspace((unsigned char)ch))
      ch = '-';
    if (ch == '-' && !slug.empty() && slug.back() == '-')
      continue;
    slug += ch;
  }
  return slug;
}

mdstring flatten_text(const Node &node) {
  if (const auto *text = std::get_if<Text_Node>(&node.value))
    return text->text;
  if (const auto *code = std::get_if<Inline_Code_Node>(&node.value))
    return code->code;

  mdstring ret;
  for_each_child(node, [&](const Node &child) { ret += flatten_text(child); });
  return ret;
}

unsigned count_nodes(const Node &node) {
  unsigned n = 0;

  /* List items are not counted themselves, only their children. */
  for_each_child(node, [&](const Node &child) {
    n += (child.type() == Node_Type::list_item ? 0 : 1) + count_nodes(child);
  });
  return n;
}

static void md_collect(const Node &node,
                       const std::function<void(const Node &)> &fn) {
  fn(node);
  for_each_child(node, [&](const Node &child) { md_collect(child, fn); });
}

std::vector<const Node *> filter_by_type(const Node &root, Node_Type type) {
  std::vector<const Node *> nodes;

  md_collect(root, [&](const Node &node) {
    if (node.type() == type)
      nodes.push_back(&node);
  });
  return nodes;
}

std::vector<Link_Info> extract_links(const Node &root) {
  std::vector<Link_Info> links;

  for (const Node *node : filter_by_type(root, Node_Type::link)) {
    const auto &link = std::get<Link_Node>(node->value);
    links.push_back(Link_Info{flatten_text(*node), link.href, link.title});
  }
  return links;
}

std::vector<Image_Info> extract_images(const Node &root) {
  std::vector<Image_Info> images;

  for (const Node *node : filter_by_type(root, Node_Type::image)) {
    const auto &image = std::get<Image_Node>(node->value);
    images.push_back(Image_Info{image.alt, image.src, image.title});
  }
  return images;
}

std::vector<Heading_Info> extract_headings(const Node &root) {
  std::vector<Heading_Info> headings;

  for (const Node *node : filter_by_type(root, Node_Type::heading)) {
    const auto &heading = std::get<Heading_Node>(node->value);
    headings.push_back(
        Heading_Info{heading.level, flatten_text(*node), heading.id});
  }
  return headings;
}

Node transform(const Node &root, const std::function<Node(const Node &)> &fn) {
  Node node = fn(root);

  for_each_child(node, [&](Node &child) { child = transform(child, fn); });
  if (auto *r = std::get_if<Root_Node>(&node.value))
    r->node_count = count_nodes(node);
  return node;
}

static bool md_validate_node(const Node &node, bool is_list_item) {
  bool ok = true;

  if (node.type() == Node_Type::root)
    return false;
  if ((node.type() == Node_Type::list_item) != is_list_item)
    return false;
  if (const auto *heading = std::get_if<Heading_Node>(&node.value)) {
    if (heading->level < 1 || heading->level > 6)
      return false;
  }

  if (const auto *items = node.items()) {
    for (const Node &item : *items)
      ok = ok && md_validate_node(item, true);
  }
  if (const auto *children = node.children()) {
    for (const Node &child : *children)
      ok = ok && md_validate_node(child, false);
  }
  if (const auto *table = std::get_if<Table_Node>(&node.value)) {
    auto check_cells = [&](const std::vector<Table_Cell> &cells) {
      for (const Table_Cell &cell : cells) {
        for (const Node &child : cell.content)
          ok = ok && md_validate_node(child, false);
      }
    };
    check_cells(table->head.cells);
    for (const Table_Row &row : table->body.rows)
      check_cells(row.cells);
  }
  return ok;
}

bool validate(const Node &root) {
  const auto *r = std::get_if<Root_Node>(&root.value);

  if (r == nullptr)
    return false;
  return std::ranges::all_of(r->children, [](const Node &child) {
    return md_validate_node(child, false);
  });
}

/* Depth-first search for an entry one level above `level`, children before
 * items. */
static Toc_Node *md_find_toc_parent(Toc_Node &node, unsigned level) {
  if (node.level + 1 == level)
    return &node;
  for (Toc_Node &child : node.children) {
    if (Toc_Node *found = md_find_toc_parent(child, level))
      return found;
  }
  for (Toc_Node &item : node.items) {
    if (Toc_Node *found = md_find_toc_parent(item, level))
      return found;
  }
  return nullptr;
}

std::vector<Toc_Node> generate_table_of_contents(const Node &root) {
  std::vector<Toc_Node> toc;
  Toc_Node *parent = nullptr;
  unsigned current_level = 0;

  for (Heading_Info &heading : extract_headings(root)) {
    if (heading.level > current_level) {
      /* One container per level passed on the way down. */
      for (unsigned level = current_level + 1; level <= heading.level;
           level++) {
        Toc_Node container;
        container.level = level;
        if (parent != nullptr) {
          parent->children.push_back(std::move(container));
          parent = &parent->children.back();
        } else {
          toc.push_back(std::move(container));
          parent = &toc.back();
        }
      }
    } else if (heading.level < current_level) {
      Toc_Node *found = nullptr;
      for (Toc_Node &entry : toc) {
        found = md_find_toc_parent(entry, heading.level);
        if (found != nullptr)
          break;
      }
      /* Without a matching ancestor the last top-level entry takes it. */
      parent = (found != nullptr ? found : &toc.back());
    }

    if (parent != nullptr) {
      Toc_Node entry;
      entry.level = heading.level;
      entry.is_heading = true;
      entry.text = std::move(heading.text);
      entry.id = std::move(heading.id);
      parent->items.push_back(std::move(entry));
    }
    current_level = heading.level;
  }

  return toc;
}

} // namespace mdtree
