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

using nlohmann::json;

namespace mdtree {

static json align_to_json(Align align) {
  switch (align) {
  case Align::left:
    return "left";
  case Align::center:
    return "center";
  case Align::right:
    return "right";
  default:
    return nullptr;
  }
}

static json title_to_json(const std::optional<mdstring> &title) {
  if (title)
    return *title;
  return nullptr;
}

void to_json(json &j, const Table_Cell &cell) {
  j = json{{"content", cell.content},
           {"align", align_to_json(cell.align)},
           {"is_header", cell.is_header}};
}

void to_json(json &j, const Node &node) {
  j = json::object();
  j["type"] = node_type_name(node.type());

  switch (node.type()) {
  case Node_Type::root:
    j["node_count"] = std::get<Root_Node>(node.value).node_count;
    break;
  case Node_Type::heading: {
    const auto &det = std::get<Heading_Node>(node.value);
    j["level"] = det.level;
    j["id"] = det.id;
    j["line"] = det.line;
    break;
  }
  case Node_Type::code_block: {
    const auto &det = std::get<Code_Block_Node>(node.value);
    j["language"] = det.language;
    j["code"] = det.code;
    j["line_count"] = det.line_count;
    j["line"] = det.line;
    break;
  }
  case Node_Type::list_item: {
    const auto &det = std::get<List_Item_Node>(node.value);
    j["marker"] = det.marker;
    j["line"] = det.line;
    break;
  }
  case Node_Type::table: {
    const auto &det = std::get<Table_Node>(node.value);
    json rows = json::array();
    for (const Table_Row &row : det.body.rows)
      rows.push_back(json{{"cells", row.cells}});
    j["head"] = json{{"cells", det.head.cells}};
    j["body"] = json{{"rows", std::move(rows)}};
    j["line"] = det.line;
    break;
  }
  case Node_Type::html: {
    const auto &det = std::get<Html_Node>(node.value);
    j["html"] = det.html;
    j["line"] = det.line;
    break;
  }
  case Node_Type::text:
    j["text"] = std::get<Text_Node>(node.value).text;
    break;
  case Node_Type::inline_code:
    j["code"] = std::get<Inline_Code_Node>(node.value).code;
    break;
  case Node_Type::link: {
    const auto &det = std::get<Link_Node>(node.value);
    j["href"] = det.href;
    j["title"] = title_to_json(det.title);
    break;
  }
  case Node_Type::image: {
    const auto &det = std::get<Image_Node>(node.value);
    j["alt"] = det.alt;
    j["src"] = det.src;
    j["title"] = title_to_json(det.title);
    break;
  }
  case Node_Type::paragraph:
    j["line"] = std::get<Paragraph_Node>(node.value).line;
    break;
  case Node_Type::list:
    j["line"] = std::get<List_Node>(node.value).line;
    break;
  case Node_Type::ordered_list:
    j["line"] = std::get<Ordered_List_Node>(node.value).line;
    break;
  case Node_Type::blockquote:
    j["line"] = std::get<Blockquote_Node>(node.value).line;
    break;
  case Node_Type::hr:
    j["line"] = std::get<Hr_Node>(node.value).line;
    break;
  case Node_Type::strong:
  case Node_Type::em:
  case Node_Type::del:
    break;
  }

  if (const auto *children = node.children())
    j["children"] = *children;
  if (const auto *items = node.items())
    j["items"] = *items;
}

void to_json(json &j, const Toc_Node &entry) {
  j = json::object();
  j["level"] = entry.level;
  if (entry.is_heading) {
    j["text"] = entry.text;
    j["id"] = entry.id;
  }
  j["items"] = entry.items;
  j["children"] = entry.children;
}

static json block_token_to_json(const Block_Token &token) {
  json j{{"type", token_type_name(token)},
         {"raw", raw_of(token)},
         {"line", line_of(token)}};

  if (const auto *h = std::get_if<Heading_Token>(&token)) {
    j["level"] = h->level;
    j["text"] = h->text;
  } else if (const auto *p = std::get_if<Paragraph_Token>(&token)) {
    j["text"] = p->text;
  } else if (const auto *code = std::get_if<Code_Block_Token>(&token)) {
    j["language"] = code->language;
    j["code"] = code->code;
  } else if (const auto *list = std::get_if<List_Token>(&token)) {
    json items = json::array();
    for (const List_Item_Token &item : list->items) {
      items.push_back(json{{"marker", item.marker},
                           {"content", item.content},
                           {"raw", item.raw},
                           {"line", item.line}});
    }
    j["items"] = std::move(items);
  } else if (const auto *quote = std::get_if<Blockquote_Token>(&token)) {
    j["content"] = quote->content;
  } else if (const auto *table = std::get_if<Table_Token>(&token)) {
    json headers = json::array();
    for (const Table_Header &header : table->headers) {
      headers.push_back(
          json{{"text", header.text}, {"align", align_to_json(header.align)}});
    }
    j["headers"] = std::move(headers);
    j["rows"] = table->rows;
  } else if (const auto *html = std::get_if<Html_Token>(&token)) {
    j["html"] = html->html;
  }
  return j;
}

json tokens_to_json(const std::vector<Block_Token> &tokens) {
  json j = json::array();

  for (const Block_Token &token : tokens)
    j.push_back(block_token_to_json(token));
  return j;
}

json inline_tokens_to_json(const std::vector<Inline_Token> &tokens) {
  json j = json::array();

  for (const Inline_Token &token : tokens) {
    json t;
    if (const auto *text = std::get_if<Text_Token>(&token)) {
      t = json{{"type", "text"}, {"text", text->text}, {"raw", text->raw}};
    } else if (const auto *code = std::get_if<Code_Span_Token>(&token)) {
      t = json{{"type", "inlineCode"}, {"code", code->code}, {"raw", code->raw}};
    } else if (const auto *link = std::get_if<Link_Token>(&token)) {
      t = json{{"type", "link"},
               {"text", link->text},
               {"href", link->href},
               {"title", title_to_json(link->title)},
               {"raw", link->raw}};
    } else if (const auto *image = std::get_if<Image_Token>(&token)) {
      t = json{{"type", "image"},
               {"alt", image->alt},
               {"src", image->src},
               {"title", title_to_json(image->title)},
               {"raw", image->raw}};
    } else if (const auto *strong = std::get_if<Strong_Token>(&token)) {
      t = json{{"type", "strong"}, {"text", strong->text}, {"raw", strong->raw}};
    } else if (const auto *em = std::get_if<Em_Token>(&token)) {
      t = json{{"type", "em"}, {"text", em->text}, {"raw", em->raw}};
    } else if (const auto *del = std::get_if<Del_Token>(&token)) {
      t = json{{"type", "del"}, {"text", del->text}, {"raw", del->raw}};
    }
    j.push_back(std::move(t));
  }
  return j;
}

} // namespace mdtree
