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

#include "mdtree-plugin.h"

#include <algorithm>
#include <exception>

namespace mdtree {

#define MD_LOG(msg)                                                            \
  do {                                                                         \
    if (options.debug_log != nullptr)                                          \
      options.debug_log((msg), options.userdata);                              \
  } while (0)

void Plugin_Manager::use(const mdstring &name, Plugin fn) {
  if (!fn)
    throw Error(Error_Kind::invalid_input,
                "Plugin '" + name + "' has no function");

  auto it = std::find_if(plugins_.begin(), plugins_.end(),
                         [&](const auto &p) { return p.first == name; });
  if (it != plugins_.end())
    it->second = std::move(fn);
  else
    plugins_.emplace_back(name, std::move(fn));
}

bool Plugin_Manager::unuse(const mdstring &name) {
  auto it = std::find_if(plugins_.begin(), plugins_.end(),
                         [&](const auto &p) { return p.first == name; });
  if (it == plugins_.end())
    return false;
  plugins_.erase(it);
  return true;
}

bool Plugin_Manager::has(const mdstring &name) const {
  return std::any_of(plugins_.begin(), plugins_.end(),
                     [&](const auto &p) { return p.first == name; });
}

std::vector<mdstring> Plugin_Manager::list() const {
  std::vector<mdstring> names;

  names.reserve(plugins_.size());
  for (const auto &[name, fn] : plugins_)
    names.push_back(name);
  return names;
}

unsigned Plugin_Manager::apply(Node &root,
                               const Parser_Options &options) const {
  unsigned n_failed = 0;

  for (const auto &[name, fn] : plugins_) {
    try {
      fn(root);
    } catch (const std::exception &e) {
      MD_LOG("Plugin '" + name + "' failed: " + e.what());
      n_failed++;
    }
  }
  return n_failed;
}

static void md_fill_heading_ids(Node &node) {
  if (auto *heading = std::get_if<Heading_Node>(&node.value)) {
    if (heading->id.empty())
      heading->id = slugify(flatten_text(node));
  }
  for_each_child(node, md_fill_heading_ids);
}

Plugin_Manager::Plugin heading_id_plugin() {
  return [](Node &root) { md_fill_heading_ids(root); };
}

} // namespace mdtree
