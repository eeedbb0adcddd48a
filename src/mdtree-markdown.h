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

#ifndef MDTREE_MARKDOWN_H
#define MDTREE_MARKDOWN_H

#include "mdtree-ast.h"

#include <functional>
#include <unordered_map>

namespace mdtree {

/* Renders a tree back to markup of this dialect: ATX headings, "```"
 * fences, "-" and "1." list marks, "---" breaks and pipe tables. Text is
 * emitted as is, without escaping. */
class Markdown_Renderer {
public:
    using Render_Func =
        std::function<mdstring(const Node & /*node*/, Markdown_Renderer &)>;

    Markdown_Renderer();

    /* Render the node through the entry registered for its type. Types
     * without an entry render as the concatenation of their children. */
    mdstring render(const Node &node);

    mdstring render_children(const Node &node);

    /* Throws Error (invalid_input) if `fn` is empty. */
    void add_renderer(Node_Type type, Render_Func fn);
    void remove_renderer(Node_Type type);
    bool has_renderer(Node_Type type) const {
        return renderers_.contains(type);
    }

private:
    void install_default_renderers();

    std::unordered_map<Node_Type, Render_Func> renderers_;
};

} // namespace mdtree

#endif /* MDTREE_MARKDOWN_H */
