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

#include "mdtree-markdown.h"

#include <string>

namespace mdtree {

static mdstringview md_trim(mdstringview str) {
    static constexpr mdstringview ws = " \t\n\r\f\v";
    const auto beg = str.find_first_not_of(ws);

    if (beg == mdstringview::npos)
        return {};
    return str.substr(beg, str.find_last_not_of(ws) - beg + 1);
}

static mdstring render_title(const std::optional<mdstring> &title) {
    if (!title)
        return {};
    return " \"" + *title + "\"";
}

static mdstring render_list_item(Markdown_Renderer &renderer, const Node &item,
                                 mdstringview marker) {
    return mdstring(marker) + " " +
           mdstring(md_trim(renderer.render_children(item)));
}

/* Items one per line; ordered lists are renumbered from 1. */
static mdstring render_list(Markdown_Renderer &renderer,
                            const std::vector<Node> &items, bool ordered) {
    mdstring out;

    for (std::size_t i = 0; i < items.size(); i++) {
        if (i > 0)
            out += '\n';
        out += render_list_item(renderer, items[i],
                                ordered ? std::to_string(i + 1) + "." : "-");
    }
    return out + "\n";
}

static void render_table_row(Markdown_Renderer &renderer, mdstring &out,
                             const std::vector<Table_Cell> &cells) {
    out += "|";
    for (const Table_Cell &cell : cells) {
        mdstring content;
        for (const Node &child : cell.content)
            content += renderer.render(child);
        out += " ";
        out += md_trim(content);
        out += " |";
    }
    out += "\n";
}

static const char *align_underline(Align align) {
    switch (align) {
        case Align::left:
            return ":---";
        case Align::center:
            return ":---:";
        case Align::right:
            return "---:";
        default:
            return "---";
    }
}

static mdstring render_table(Markdown_Renderer &renderer,
                             const Table_Node &table) {
    mdstring out;

    render_table_row(renderer, out, table.head.cells);
    out += "|";
    for (const Table_Cell &cell : table.head.cells) {
        out += " ";
        out += align_underline(cell.align);
        out += " |";
    }
    out += "\n";

    for (const Table_Row &row : table.body.rows)
        render_table_row(renderer, out, row.cells);
    return out;
}

/* Blocks are separated by one blank line. */
static mdstring render_blocks(Markdown_Renderer &renderer,
                              const std::vector<Node> &blocks) {
    mdstring out;

    for (std::size_t i = 0; i < blocks.size(); i++) {
        if (i > 0)
            out += '\n';
        out += renderer.render(blocks[i]);
    }
    return out;
}

/* Every line of the rendered content prefixed by "> ", blank lines by ">". */
static mdstring render_blockquote(const Node &node,
                                  Markdown_Renderer &renderer) {
    mdstring content = render_blocks(
            renderer, std::get<Blockquote_Node>(node.value).children);
    mdstringview rest;
    mdstring out;

    while (!content.empty() && content.back() == '\n')
        content.pop_back();

    rest = content;
    while (true) {
        std::size_t eol = rest.find('\n');
        mdstringview line = rest.substr(0, eol);

        if (md_trim(line).empty()) {
            out += ">\n";
        } else {
            out += "> ";
            out += line;
            out += "\n";
        }
        if (eol == mdstringview::npos)
            break;
        rest.remove_prefix(eol + 1);
    }
    return out;
}

void Markdown_Renderer::install_default_renderers() {
    /* Inline spans wrapping their rendered children. */
    auto wrap = [](const char *mark) -> Render_Func {
        return [mark](const Node &node, Markdown_Renderer &renderer) {
            return mark + renderer.render_children(node) + mark;
        };
    };

    renderers_[Node_Type::root] = [](const Node &node,
                                     Markdown_Renderer &renderer) {
        const mdstring out = render_blocks(
                renderer, std::get<Root_Node>(node.value).children);

        return mdstring(md_trim(out)) + "\n";
    };
    renderers_[Node_Type::heading] = [](const Node &node,
                                        Markdown_Renderer &renderer) {
        const auto &det = std::get<Heading_Node>(node.value);

        return mdstring(det.level, '#') + " " + renderer.render_children(node) +
               "\n";
    };
    renderers_[Node_Type::paragraph] = [](const Node &node,
                                          Markdown_Renderer &renderer) {
        return renderer.render_children(node) + "\n";
    };
    renderers_[Node_Type::code_block] = [](const Node &node,
                                           Markdown_Renderer &) {
        const auto &det = std::get<Code_Block_Node>(node.value);

        return "```" + det.language + "\n" + det.code + "\n```\n";
    };
    renderers_[Node_Type::list] = [](const Node &node,
                                     Markdown_Renderer &renderer) {
        return render_list(renderer, std::get<List_Node>(node.value).items,
                           false);
    };
    renderers_[Node_Type::ordered_list] = [](const Node &node,
                                             Markdown_Renderer &renderer) {
        return render_list(renderer,
                           std::get<Ordered_List_Node>(node.value).items, true);
    };
    /* Only reached for an item rendered on its own. */
    renderers_[Node_Type::list_item] = [](const Node &node,
                                          Markdown_Renderer &renderer) {
        return render_list_item(renderer, node, "-");
    };
    renderers_[Node_Type::blockquote] = render_blockquote;
    renderers_[Node_Type::table] = [](const Node &node,
                                      Markdown_Renderer &renderer) {
        return render_table(renderer, std::get<Table_Node>(node.value));
    };
    renderers_[Node_Type::hr] = [](const Node &, Markdown_Renderer &) {
        return mdstring("---\n");
    };
    renderers_[Node_Type::html] = [](const Node &node, Markdown_Renderer &) {
        return std::get<Html_Node>(node.value).html + "\n";
    };
    renderers_[Node_Type::text] = [](const Node &node, Markdown_Renderer &) {
        return std::get<Text_Node>(node.value).text;
    };
    renderers_[Node_Type::inline_code] = [](const Node &node,
                                            Markdown_Renderer &) {
        return "`" + std::get<Inline_Code_Node>(node.value).code + "`";
    };
    renderers_[Node_Type::link] = [](const Node &node,
                                     Markdown_Renderer &renderer) {
        const auto &det = std::get<Link_Node>(node.value);

        return "[" + renderer.render_children(node) + "](" + det.href +
               render_title(det.title) + ")";
    };
    renderers_[Node_Type::image] = [](const Node &node, Markdown_Renderer &) {
        const auto &det = std::get<Image_Node>(node.value);

        return "![" + det.alt + "](" + det.src + render_title(det.title) + ")";
    };
    renderers_[Node_Type::strong] = wrap("**");
    renderers_[Node_Type::em] = wrap("*");
    renderers_[Node_Type::del] = wrap("~~");
}

Markdown_Renderer::Markdown_Renderer() {
    install_default_renderers();
}

mdstring Markdown_Renderer::render(const Node &node) {
    auto it = renderers_.find(node.type());

    if (it != renderers_.end())
        return it->second(node, *this);
    return render_children(node);
}

mdstring Markdown_Renderer::render_children(const Node &node) {
    mdstring out;

    if (const auto *children = node.children()) {
        for (const Node &child : *children)
            out += render(child);
    }
    if (const auto *items = node.items()) {
        for (const Node &item : *items)
            out += render(item);
    }
    return out;
}

void Markdown_Renderer::add_renderer(Node_Type type, Render_Func fn) {
    if (!fn)
        throw Error(Error_Kind::invalid_input,
                    "Renderer for '" + mdstring(node_type_name(type)) +
                        "' has no function");
    renderers_[type] = std::move(fn);
}

void Markdown_Renderer::remove_renderer(Node_Type type) {
    renderers_.erase(type);
}

} // namespace mdtree
