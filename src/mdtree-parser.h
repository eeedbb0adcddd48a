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

#ifndef MDTREE_PARSER_H
#define MDTREE_PARSER_H

#include "mdtree-ast.h"
#include "mdtree-html.h"
#include "mdtree-plugin.h"

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mdtree {

struct Statistics {
  unsigned lines = 0;
  std::size_t characters = 0; /* Bytes of the input as given. */
  unsigned tokens = 0;        /* Block tokens, blank lines included. */
  unsigned nodes = 0;         /* Tree nodes, the root included. */
  unsigned headings = 0;
  unsigned links = 0;
  unsigned images = 0;
  unsigned lists = 0; /* Bullet and ordered. */
  unsigned code_blocks = 0;
  unsigned tables = 0;
};

struct Validation_Report {
  bool valid = true;
  std::vector<mdstring> errors;
};

/* The whole pipeline: normalize, tokenize, build the tree, run the plugins
 * and render. */
class Parser {
public:
  explicit Parser(const Parser_Options &options = {},
                  std::unordered_set<Render_Flag> render_flags = {});

  /* Render to HTML, leading and trailing whitespace removed. */
  mdstring parse(mdstringview markdown);
  /* Throws Error (invalid_input) on nullptr. */
  mdstring parse(const char *markdown);

  Node parse_to_ast(mdstringview markdown);

  mdstring parse_with_renderer(mdstringview markdown, Html_Renderer &renderer);

  Parser &use(const mdstring &name, Plugin_Manager::Plugin fn) {
    plugins_.use(name, std::move(fn));
    return *this;
  }
  bool unuse(const mdstring &name) { return plugins_.unuse(name); }
  const Plugin_Manager &plugins() const { return plugins_; }

  /* Cached trees are kept; call clear_cache() if they depend on the old
   * options. */
  void set_options(const Parser_Options &options);
  const Parser_Options &options() const { return options_; }

  Html_Renderer &renderer() { return renderer_; }

  Statistics statistics(mdstringview markdown);

  /* Never throws; failures of the pipeline end up in `errors`. */
  Validation_Report validate(mdstringview markdown);
  Validation_Report validate(const char *markdown);

  /* The tree after plugins, as JSON indented by two spaces. */
  mdstring export_json(mdstringview markdown);

  /* The tree after plugins, re-emitted as markup. */
  mdstring export_markdown(mdstringview markdown);

  void clear_cache() { cache_.clear(); }
  std::size_t cache_size() const { return cache_.size(); }

private:
  mdstring prepare(mdstringview markdown) const;
  Node build_tree(const mdstring &normalized,
                  std::vector<Block_Token> *p_tokens = nullptr);

  Parser_Options options_;
  Ast_Builder builder_;
  Html_Renderer renderer_;
  Plugin_Manager plugins_;

  /* Trees as built, before any plugin ran, keyed by hash of the normalized
   * input. */
  std::unordered_map<std::size_t, std::pair<mdstring, Node>> cache_;
};

} // namespace mdtree

#endif /* MDTREE_PARSER_H */
