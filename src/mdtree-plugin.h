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

#ifndef MDTREE_PLUGIN_H
#define MDTREE_PLUGIN_H

#include "mdtree-ast.h"

#include <functional>
#include <utility>
#include <vector>

namespace mdtree {

/* Named tree rewriters run by Parser after the AST is built. */
class Plugin_Manager {
public:
  using Plugin = std::function<void(Node & /*root*/)>;

  /* Register `fn` under `name`. A name already in use keeps its place in the
   * order and gets the new function. Throws Error (invalid_input) if `fn`
   * is empty. */
  void use(const mdstring &name, Plugin fn);

  /* Returns false if no plugin of that name is registered. */
  bool unuse(const mdstring &name);

  bool has(const mdstring &name) const;

  /* Registered names, in the order the plugins run. */
  std::vector<mdstring> list() const;

  /* Run every plugin on `root` in registration order. A plugin that throws
   * is reported through the debug callback of `options` and the remaining
   * plugins still run. Returns the number of plugins which failed. */
  unsigned apply(Node &root, const Parser_Options &options = {}) const;

private:
  std::vector<std::pair<mdstring, Plugin>> plugins_;
};

/* Gives every heading with an empty id the slug of its text. */
Plugin_Manager::Plugin heading_id_plugin();

} // namespace mdtree

#endif /* MDTREE_PLUGIN_H */
