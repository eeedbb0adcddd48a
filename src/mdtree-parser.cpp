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
#include "mdtree-json.h"
#include "mdtree-markdown.h"

#include <functional>
#include <string>

namespace mdtree {

#define MD_LOG(msg)                                                            \
  do {                                                                         \
    if (options_.debug_log != nullptr)                                         \
      options_.debug_log((msg), options_.userdata);                            \
  } while (0)

static constexpr mdstringview utf8_bom = "\xEF\xBB\xBF";

static mdstringview md_trim_output(mdstringview str) {
  static constexpr mdstringview ws = " \t\n\r\f\v";
  const auto beg = str.find_first_not_of(ws);

  if (beg == mdstringview::npos)
    return {};
  return str.substr(beg, str.find_last_not_of(ws) - beg + 1);
}

Parser::Parser(const Parser_Options &options,
               std::unordered_set<Render_Flag> render_flags)
    : options_(options), builder_(options), renderer_(std::move(render_flags)) {
}

void Parser::set_options(const Parser_Options &options) {
  options_ = options;
  builder_.set_options(options);
}

mdstring Parser::prepare(mdstringview markdown) const {
  if (renderer_.flags().contains(Render_Flag::Skip_UTF8_BOM) &&
      markdown.starts_with(utf8_bom))
    markdown.remove_prefix(utf8_bom.size());
  return normalize_line_endings(markdown);
}

Node Parser::build_tree(const mdstring &normalized,
                        std::vector<Block_Token> *p_tokens) {
  const std::size_t key = std::hash<mdstring>{}(normalized);

  if (options_.enable_cache && p_tokens == nullptr) {
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second.first == normalized) {
      MD_LOG("Cache hit.");
      return it->second.second;
    }
  }

  std::vector<Block_Token> tokens = scan_blocks(split_lines(normalized), options_);
  validate_tokens(tokens, options_);
  Node root = builder_.build(tokens);

  if (options_.enable_cache)
    cache_.insert_or_assign(key, std::make_pair(normalized, root));
  if (p_tokens != nullptr)
    *p_tokens = std::move(tokens);
  return root;
}

Node Parser::parse_to_ast(mdstringview markdown) {
  Node root = build_tree(prepare(markdown));

  plugins_.apply(root, options_);
  return root;
}

mdstring Parser::parse(mdstringview markdown) {
  return mdstring(md_trim_output(renderer_.render(parse_to_ast(markdown))));
}

mdstring Parser::parse(const char *markdown) {
  if (markdown == nullptr)
    throw Error(Error_Kind::invalid_input, "Markdown text is null");
  return parse(mdstringview(markdown));
}

mdstring Parser::parse_with_renderer(mdstringview markdown,
                                     Html_Renderer &renderer) {
  return renderer.render(parse_to_ast(markdown));
}

Statistics Parser::statistics(mdstringview markdown) {
  const mdstring normalized = prepare(markdown);
  std::vector<Block_Token> tokens;
  const Node root = build_tree(normalized, &tokens);
  Statistics stats;

  auto count = [&](Node_Type type) {
    return static_cast<unsigned>(filter_by_type(root, type).size());
  };

  stats.lines = static_cast<unsigned>(split_lines(normalized).size());
  stats.characters = markdown.size();
  stats.tokens = static_cast<unsigned>(tokens.size());
  stats.nodes = 1 + count_nodes(root);
  stats.headings = count(Node_Type::heading);
  stats.links = count(Node_Type::link);
  stats.images = count(Node_Type::image);
  stats.lists = count(Node_Type::list) + count(Node_Type::ordered_list);
  stats.code_blocks = count(Node_Type::code_block);
  stats.tables = count(Node_Type::table);
  return stats;
}

Validation_Report Parser::validate(mdstringview markdown) {
  Validation_Report report;

  try {
    const Node root = build_tree(prepare(markdown));
    if (!mdtree::validate(root))
      report.errors.emplace_back("Built tree violates its structure rules");
  } catch (const Error &e) {
    report.errors.emplace_back(e.what());
  }
  report.valid = report.errors.empty();
  return report;
}

Validation_Report Parser::validate(const char *markdown) {
  if (markdown == nullptr)
    return Validation_Report{false, {"Markdown text is null"}};
  return validate(mdstringview(markdown));
}

mdstring Parser::export_json(mdstringview markdown) {
  const nlohmann::json j = parse_to_ast(markdown);
  return j.dump(2);
}

mdstring Parser::export_markdown(mdstringview markdown) {
  Markdown_Renderer renderer;

  return renderer.render(parse_to_ast(markdown));
}

} // namespace mdtree
