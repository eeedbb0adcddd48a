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

#ifndef MDTREE_JSON_H
#define MDTREE_JSON_H

#include "mdtree-ast.h"

#include <nlohmann/json.hpp>

namespace mdtree {

/* The JSON form of a tree is a plain tagged tree: every object has a "type"
 * member ("root", "heading", "codeBlock"...), nested nodes are under
 * "children" or "items", table cells under "head"/"body". A missing
 * alignment or title is null. */

void to_json(nlohmann::json &j, const Node &node);
void to_json(nlohmann::json &j, const Table_Cell &cell);
void to_json(nlohmann::json &j, const Toc_Node &entry);

/* Block tokens, with their "raw" text and "line". */
nlohmann::json tokens_to_json(const std::vector<Block_Token> &tokens);

/* Inline tokens, with their "raw" text. */
nlohmann::json inline_tokens_to_json(const std::vector<Inline_Token> &tokens);

} // namespace mdtree

#endif /* MDTREE_JSON_H */
