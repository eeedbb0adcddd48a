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

#include "mdtree-html.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string_view>

namespace mdtree {

using HTML = struct MD_HTML_tag;

/* Output of one render call. */
struct MD_HTML_tag {
    mdstring out;
    const char *escape_map;
    const std::unordered_set<Render_Flag> &flags;
};

#define NEED_HTML_ESC_FLAG 0x1
#define NEED_URL_ESC_FLAG 0x2

static inline void render_verbatim(HTML &r, const mdstringview text) {
    r.out += text;
}

static void render_html_escaped(HTML &r, mdstringview data) {
    MD_OFFSET beg = 0;
    MD_OFFSET off = 0;

/* Some characters need to be escaped in normal HTML text. */
#define NEED_HTML_ESC(ch)                                                      \
  (r.escape_map[(unsigned char)(ch)] & NEED_HTML_ESC_FLAG)

    while (true) {
        /* Optimization: Use some loop unrolling. */
        while (off + 3 < data.size() && !NEED_HTML_ESC(data[off + 0]) &&
               !NEED_HTML_ESC(data[off + 1]) && !NEED_HTML_ESC(data[off + 2]) &&
               !NEED_HTML_ESC(data[off + 3]))
            off += 4;
        while (off < data.size() && !NEED_HTML_ESC(data[off]))
            off++;

        if (off > beg)
            render_verbatim(r, data.substr(beg, off - beg));

        if (off < data.size()) {
            switch (data[off]) {
                case '&':
                    render_verbatim(r, "&amp;");
                    break;
                case '<':
                    render_verbatim(r, "&lt;");
                    break;
                case '>':
                    render_verbatim(r, "&gt;");
                    break;
                case '"':
                    render_verbatim(r, "&quot;");
                    break;
                case '\'':
                    render_verbatim(r, "&#39;");
                    break;
            }
            off++;
        } else {
            break;
        }
        beg = off;
    }
}

static void render_url_escaped(HTML &r, mdstringview data) {
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    MD_OFFSET beg = 0;
    MD_OFFSET off = 0;

/* Some characters need to be escaped in URL attributes. */
#define NEED_URL_ESC(ch) (r.escape_map[(unsigned char)(ch)] & NEED_URL_ESC_FLAG)

    while (true) {
        while (off < data.size() && !NEED_URL_ESC(data[off]))
            off++;
        if (off > beg)
            render_verbatim(r, data.substr(beg, off - beg));

        if (off < data.size()) {
            char hex[3];

            switch (data[off]) {
                case '&':
                    render_verbatim(r, "&amp;");
                    break;
                default:
                    hex[0] = '%';
                    hex[1] = hex_chars[(data[off] >> 4) & 0xf];
                    hex[2] = hex_chars[(data[off] >> 0) & 0xf];
                    render_verbatim(r, mdstringview(hex, 3));
                    break;
            }
            off++;
        } else {
            break;
        }

        beg = off;
    }
}

/* Text with line breaks turned into <br> when requested. */
static void render_text(HTML &r, mdstringview text) {
    if (!r.flags.contains(Render_Flag::Breaks)) {
        render_html_escaped(r, text);
        return;
    }

    while (true) {
        MD_OFFSET eol = text.find('\n');
        render_html_escaped(r, text.substr(0, eol));
        if (eol == mdstringview::npos)
            break;
        render_verbatim(r, r.flags.contains(Render_Flag::XHTML) ? "<br />\n"
                                                                : "<br>\n");
        text.remove_prefix(eol + 1);
    }
}

static const char *align_name(Align align) {
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

/**************************************
 ***  HTML renderer implementation  ***
 **************************************/

static void render_open_code_block(HTML &r, const Code_Block_Node &det) {
    render_verbatim(r, "<pre><code");

    /* If known, output the HTML 5 attribute class="language-LANGNAME". */
    if (!det.language.empty()) {
        render_verbatim(r, " class=\"language-");
        render_html_escaped(r, det.language);
        render_verbatim(r, "\"");
    }

    render_verbatim(r, ">");
}

static void render_table_cell(HTML &r, Html_Renderer &renderer,
                              const Table_Cell &cell) {
    const char *cell_type = (cell.is_header ? "th" : "td");

    render_verbatim(r, "<");
    render_verbatim(r, cell_type);
    if (const char *align = align_name(cell.align)) {
        render_verbatim(r, " style=\"text-align: ");
        render_verbatim(r, align);
        render_verbatim(r, "\"");
    }
    render_verbatim(r, ">");

    for (const Node &child : cell.content)
        render_verbatim(r, renderer.render(child));

    render_verbatim(r, "</");
    render_verbatim(r, cell_type);
    render_verbatim(r, ">\n");
}

static void render_table(HTML &r, Html_Renderer &renderer,
                         const Table_Node &table) {
    render_verbatim(r, "<table>\n<thead>\n<tr>\n");
    for (const Table_Cell &cell : table.head.cells)
        render_table_cell(r, renderer, cell);
    render_verbatim(r, "</tr>\n</thead>\n");

    render_verbatim(r, "<tbody>\n");
    for (const Table_Row &row : table.body.rows) {
        render_verbatim(r, "<tr>\n");
        for (const Table_Cell &cell : row.cells)
            render_table_cell(r, renderer, cell);
        render_verbatim(r, "</tr>\n");
    }
    render_verbatim(r, "</tbody>\n</table>\n");
}

static void render_open_a_span(HTML &r, const Link_Node &det) {
    render_verbatim(r, "<a href=\"");
    render_url_escaped(r, det.href);

    if (det.title) {
        render_verbatim(r, "\" title=\"");
        render_html_escaped(r, *det.title);
    }

    render_verbatim(r, "\">");
}

static void render_img_span(HTML &r, const Image_Node &det) {
    render_verbatim(r, "<img src=\"");
    render_url_escaped(r, det.src);

    render_verbatim(r, "\" alt=\"");
    render_html_escaped(r, det.alt);

    if (det.title) {
        render_verbatim(r, "\" title=\"");
        render_html_escaped(r, *det.title);
    }

    render_verbatim(r, (r.flags.contains(Render_Flag::XHTML)) ? "\" />" : "\">");
}

void Html_Renderer::install_default_renderers() {
    static constexpr const char *head[6]{"<h1", "<h2", "<h3",
                                         "<h4", "<h5", "<h6"};
    static constexpr const char *tail[6]{"</h1>\n", "</h2>\n", "</h3>\n",
                                         "</h4>\n", "</h5>\n", "</h6>\n"};

    /* Block containers wrapping their rendered children. */
    auto wrap = [](const char *open, const char *close) -> Render_Func {
        return [open, close](const Node &node, Html_Renderer &renderer) {
            return open + renderer.render_children(node) + close;
        };
    };

    renderers_[Node_Type::root] = [](const Node &node, Html_Renderer &renderer) {
        return renderer.render_children(node);
    };
    renderers_[Node_Type::heading] = [](const Node &node,
                                        Html_Renderer &renderer) {
        const auto &det = std::get<Heading_Node>(node.value);
        unsigned level = std::clamp<unsigned>(det.level, 1, 6);
        HTML r{{}, renderer.escape_map_, renderer.flags_};

        render_verbatim(r, head[level - 1]);
        if (!det.id.empty()) {
            render_verbatim(r, " id=\"");
            render_html_escaped(r, det.id);
            render_verbatim(r, "\"");
        }
        render_verbatim(r, ">");
        render_verbatim(r, renderer.render_children(node));
        render_verbatim(r, tail[level - 1]);
        return r.out;
    };
    renderers_[Node_Type::paragraph] = wrap("<p>", "</p>\n");
    renderers_[Node_Type::code_block] = [](const Node &node,
                                           Html_Renderer &renderer) {
        const auto &det = std::get<Code_Block_Node>(node.value);
        HTML r{{}, renderer.escape_map_, renderer.flags_};

        render_open_code_block(r, det);
        render_html_escaped(r, det.code);
        render_verbatim(r, "</code></pre>\n");
        return r.out;
    };
    renderers_[Node_Type::list] = wrap("<ul>\n", "</ul>\n");
    renderers_[Node_Type::ordered_list] = wrap("<ol>\n", "</ol>\n");
    renderers_[Node_Type::list_item] = wrap("<li>", "</li>\n");
    renderers_[Node_Type::blockquote] = wrap("<blockquote>\n", "</blockquote>\n");
    renderers_[Node_Type::table] = [](const Node &node,
                                      Html_Renderer &renderer) {
        HTML r{{}, renderer.escape_map_, renderer.flags_};

        render_table(r, renderer, std::get<Table_Node>(node.value));
        return r.out;
    };
    renderers_[Node_Type::hr] = [](const Node &, Html_Renderer &) {
        return mdstring("<hr />\n");
    };
    renderers_[Node_Type::html] = [](const Node &node,
                                     Html_Renderer &renderer) {
        if (renderer.flags_.contains(Render_Flag::Sanitize))
            return mdstring("<!-- HTML block sanitized -->\n");
        return std::get<Html_Node>(node.value).html + "\n";
    };
    renderers_[Node_Type::text] = [](const Node &node,
                                     Html_Renderer &renderer) {
        HTML r{{}, renderer.escape_map_, renderer.flags_};

        render_text(r, std::get<Text_Node>(node.value).text);
        return r.out;
    };
    renderers_[Node_Type::inline_code] = [](const Node &node,
                                            Html_Renderer &renderer) {
        return "<code>" +
               renderer.escape_html(std::get<Inline_Code_Node>(node.value).code) +
               "</code>";
    };
    renderers_[Node_Type::link] = [](const Node &node,
                                     Html_Renderer &renderer) {
        HTML r{{}, renderer.escape_map_, renderer.flags_};

        render_open_a_span(r, std::get<Link_Node>(node.value));
        render_verbatim(r, renderer.render_children(node));
        render_verbatim(r, "</a>");
        return r.out;
    };
    renderers_[Node_Type::image] = [](const Node &node,
                                      Html_Renderer &renderer) {
        HTML r{{}, renderer.escape_map_, renderer.flags_};

        render_img_span(r, std::get<Image_Node>(node.value));
        return r.out;
    };
    renderers_[Node_Type::strong] = wrap("<strong>", "</strong>");
    renderers_[Node_Type::em] = wrap("<em>", "</em>");
    renderers_[Node_Type::del] = wrap("<del>", "</del>");
}

Html_Renderer::Html_Renderer(std::unordered_set<Render_Flag> flags)
    : flags_(std::move(flags)), escape_map_{0} {
    /* Build map of characters which need escaping. */
    for (unsigned i = 0; i <= std::numeric_limits<unsigned char>::max(); i++) {
        auto ch = (unsigned char)i;

        if (mdstringview("\"&<>'").find(ch) != mdstringview::npos)
            escape_map_[i] |= NEED_HTML_ESC_FLAG;

        if (!std::isalnum(ch) &&
            mdstringview("~-_.+!*(),%#@?=;:/,+$").find(ch) == mdstringview::npos)
            escape_map_[i] |= NEED_URL_ESC_FLAG;
    }

    install_default_renderers();
}

mdstring Html_Renderer::render(const Node &node) {
    auto it = renderers_.find(node.type());

    if (it != renderers_.end())
        return it->second(node, *this);
    return render_children(node);
}

mdstring Html_Renderer::render_children(const Node &node) {
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

void Html_Renderer::add_renderer(Node_Type type, Render_Func fn) {
    renderers_[type] = std::move(fn);
}

void Html_Renderer::remove_renderer(Node_Type type) {
    renderers_.erase(type);
}

mdstring Html_Renderer::escape_html(mdstringview text) const {
    HTML r{{}, escape_map_, flags_};

    render_html_escaped(r, text);
    return r.out;
}

mdstring Html_Renderer::escape_url(mdstringview text) const {
    HTML r{{}, escape_map_, flags_};

    render_url_escaped(r, text);
    return r.out;
}

} // namespace mdtree
