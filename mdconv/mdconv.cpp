/* md5cpp: fast Markdown parser in C++20.
Copyright 2021 Charlie Lin
This software is derived from md4c, and is licensed under the same terms as
md4c, reproduced below:
*/
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

#include <cxxopts.hpp>

#include "mdtree-ast.h"
#include "mdtree-html.h"
#include "mdtree-json.h"
#include "mdtree-parser.h"
#include "mdtree.h"

#include <array>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <stdexcept>
#include <variant>
#include <version>

#ifdef __cpp_lib_format
#include <format>
#else

#include <iomanip>

#endif

using mdtree::mdstring;
using mdtree::mdstringview;

/* Global options. */
static mdtree::Parser_Options parser_options{};
static std::unordered_set<mdtree::Render_Flag> rendering_flags{
        mdtree::Render_Flag::Skip_UTF8_BOM};
static bool want_fullhtml;
static bool want_xhtml;
static bool want_stat;
static bool want_toc;
static bool want_doc_stats;
static bool want_validate;

enum class Output_Format { html, json, tokens, markdown };
static Output_Format output_format = Output_Format::html;

static void debug_log_callback(mdstringview msg, [[maybe_unused]] void *userdata) {
    std::cerr << "MDTREE: " << msg << '\n';
}

/*********************************
 ***  Table of contents output  ***
 *********************************/

static void render_toc_entries(const std::vector<mdtree::Toc_Node> &entries,
                               mdtree::Html_Renderer &r, mdstring &out) {
    if (entries.empty())
        return;

    out += "<ul>\n";
    for (const auto &entry: entries) {
        out += "<li>";
        if (entry.is_heading) {
            out += "<a href=\"#";
            out += r.escape_url(entry.id);
            out += "\">";
            out += r.escape_html(entry.text);
            out += "</a>";
        }
        out += '\n';
        render_toc_entries(entry.items, r, out);
        render_toc_entries(entry.children, r, out);
        out += "</li>\n";
    }
    out += "</ul>\n";
}

static mdstring render_toc(const mdtree::Node &root, mdtree::Html_Renderer &r) {
    mdstring out{"<nav class=\"toc\">\n"};

    render_toc_entries(mdtree::generate_table_of_contents(root), r, out);
    out += "</nav>\n";
    return out;
}

/**********************
 ***  Main program  ***
 **********************/

static void print_statistics(const mdtree::Statistics &stats, std::ostream &out) {
    out << "Document statistics:\n"
        << "  Lines: " << stats.lines << '\n'
        << "  Characters: " << stats.characters << '\n'
        << "  Tokens: " << stats.tokens << '\n'
        << "  Nodes: " << stats.nodes << '\n'
        << "  Headings: " << stats.headings << '\n'
        << "  Links: " << stats.links << '\n'
        << "  Images: " << stats.images << '\n'
        << "  Lists: " << stats.lists << '\n'
        << "  Code blocks: " << stats.code_blocks << '\n'
        << "  Tables: " << stats.tables << '\n';
}

/* Render the document in the selected format. Returns the body only; the
 * full-HTML head and foot are added by process_file(). */
static mdstring convert(mdtree::Parser &parser, mdstringview in_buf) {
    switch (output_format) {
        case Output_Format::tokens:
            return mdtree::tokens_to_json(mdtree::tokenize(in_buf, parser.options())).dump(2) + '\n';

        case Output_Format::markdown:
            return parser.export_markdown(in_buf);

        case Output_Format::json: {
            const mdtree::Node root = parser.parse_to_ast(in_buf);
            nlohmann::json j = root;
            if (want_toc)
                j = nlohmann::json{{"toc", mdtree::generate_table_of_contents(root)},
                                   {"ast", std::move(j)}};
            return j.dump(2) + '\n';
        }

        case Output_Format::html:
        default: {
            const mdtree::Node root = parser.parse_to_ast(in_buf);
            mdstring out{};
            if (want_toc)
                out += render_toc(root, parser.renderer());
            out += parser.renderer().render(root);
            return out;
        }
    }
}

static int process_file(std::istream &in, std::ostream &out) {
    const mdstring in_buf{std::istreambuf_iterator<char>(in),
                          std::istreambuf_iterator<char>()};
    if (in.bad()) {
        std::cerr << "Reading input failed.\n";
        return 1;
    }

    mdtree::Parser parser(parser_options, rendering_flags);

    if (want_validate) {
        const auto report{parser.validate(in_buf)};
        if (report.valid) {
            out << "Markdown is valid\n";
            return 0;
        }
        out << "Markdown has errors:\n";
        for (const auto &error: report.errors)
            out << "  - " << error << '\n';
        return 1;
    }

    if (want_doc_stats) {
        print_statistics(parser.statistics(in_buf), out);
        return 0;
    }

    auto t0 = std::chrono::steady_clock::now();

    /* Parse and render the document into memory, so that --stat measures the
     * parser without the I/O. */
    const mdstring out_buf{convert(parser, in_buf)};

    auto t1 = std::chrono::steady_clock::now();

    /* Write down the document in the HTML format. */
    const bool full_html = want_fullhtml && output_format == Output_Format::html;
    if (full_html) {
        if (want_xhtml) {
            out <<
                R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.1//EN" "http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd">
<html xmlns="http://www.w3.org/1999/xhtml">
)";
        } else
            out << R"(<!DOCTYPE html>
<html>
)";
        out << R"(<head>
<title></title>
<meta name="generator" content="mdconv" />
</head>
<body>
)";
    }

    out << out_buf;

    if (full_html)
        out << R"(</body>
</html>
)";

    if (want_stat) {
        const std::chrono::duration<double> elapsed{t1 - t0};
        std::cerr <<
                  #ifdef __cpp_lib_format
                  std::format("Time spent on parsing: {:.3f} s.\n", elapsed.count());
                  #else
                  "Time spent on parsing: " << std::fixed << std::setprecision(3) << elapsed.count()
                  << " s.\n";
#endif
    }

    if (!out) {
        std::cerr << "Writing output failed.\n";
        return 1;
    }
    return 0;
}


struct Opt {
    char short_opt; /* '\0' for long-only options */
    std::string long_opt, description;
    std::variant<std::monostate, mdtree::Render_Flag, mdtree::Extension> flag;
    bool takes_arg = false;
};

struct Option_Group {
    std::string name;
    std::vector<Opt> options;
};

using enum mdtree::Extension; using enum mdtree::Render_Flag;
static const std::array cmdline_options{
        Option_Group{"General", {
                Opt{'o', "output", "Output file (default is stdout)", {}, true},
                Opt{'F', "format", "Output format: html (default), json, tokens or markdown", {}, true},
                Opt{'f', "full-html", "Generate full HTML, including header", {}},
                Opt{'s', "stat", "Measure time of input parsing", {}},
                Opt{'\0', "stats", "Print document statistics instead of converting", {}},
                Opt{'\0', "validate", "Check the document and report errors", {}},
                Opt{'d', "debug", "Print parser diagnostics to stderr", {}},
                Opt{'h', "help", "Print this help message", {}},
                Opt{'v', "version", "Display version", {}},
        }},
        Option_Group{"Markdown suppression", {
                Opt{'\0', "fno-strikethrough", "Disable strike-through spans", Strikethrough},
                Opt{'\0', "fno-indented-code", "Disable indented code blocks", No_Indented_Codeblock},
                Opt{'\0', "fno-html-blocks", "Disable raw HTML blocks", No_Raw_HTML_Block},
        }},
        Option_Group{"Rendering", {
                Opt{'x', "xhtml", "Generate XHTML instead of HTML", XHTML},
                Opt{'\0', "sanitize", "Replace raw HTML blocks by a comment", Sanitize},
                Opt{'\0', "breaks", "Render line breaks inside paragraphs as <br>", Breaks},
                Opt{'\0', "ftoc", "Print a table of contents before the document", {}},
        }},
};

static cxxopts::ParseResult parse_opts(int a, char **v) {
    cxxopts::Options options(
            "mdconv",
            "Convert input FILE (or standard input) in Markdown format to HTML, JSON or normalized Markdown.");
    options.positional_help("[ input file ]").show_positional_help();
    std::vector<std::string> groups{};
    for (const auto &group: cmdline_options) {
        groups.emplace_back(group.name);
        auto &&tmp = options.add_options(group.name);
        for (auto [short_o, long_o, desc, opt, takes_arg]: group.options) {
            if (short_o != '\0')
                long_o.insert(0, ",").insert(0, 1, short_o);
            if (takes_arg)
                tmp(long_o, desc, cxxopts::value<std::string>());
            else
                tmp(long_o, desc);
        }
    }
    options.add_options()("input", "Input file", cxxopts::value<std::string>());
    options.parse_positional({"input"});

    try {
        auto res{options.parse(a, v)};
        if (res.count("help")) {
            std::cout << options.help(groups);
            std::exit(0);
        }
        return res;
    } catch (const cxxopts::OptionException &e) {
        std::cerr << e.what() << '\n';
        std::cerr << "Use --help for more info.\n";
        std::exit(1);
    }
}

using namespace std::filesystem;
static path input_path, output_path;

static void apply_opts(const cxxopts::ParseResult &re) {
    for (const auto &opt_group: cmdline_options) {
        if (opt_group.name == "General") {
            for (const auto &opt: opt_group.options) {
                if (!re.count(opt.long_opt))
                    continue;
                switch (opt.short_opt) {
                    case 'v':
                        std::cout << MDTREE_VERSION << '\n';
                        std::exit(0);
                    case 'o':
                        output_path = re["output"].as<std::string>();
                        break;
                    case 'F': {
                        const auto format{re["format"].as<std::string>()};
                        if (format == "html")
                            output_format = Output_Format::html;
                        else if (format == "json")
                            output_format = Output_Format::json;
                        else if (format == "tokens")
                            output_format = Output_Format::tokens;
                        else if (format == "markdown")
                            output_format = Output_Format::markdown;
                        else {
                            std::cerr << "Unknown output format: " << format << '\n';
                            std::cerr << "Use --help for more info.\n";
                            std::exit(1);
                        }
                        break;
                    }
                    case 'f':
                        want_fullhtml = true;
                        break;
                    case 's':
                        want_stat = true;
                        break;
                    case 'd':
                        parser_options.debug_log = debug_log_callback;
                        break;
                    case '\0':
                        if (opt.long_opt == "stats")
                            want_doc_stats = true;
                        else if (opt.long_opt == "validate")
                            want_validate = true;
                        break;
                }
            }
        } else if (opt_group.name == "Markdown suppression") {
            for (const auto &opt: opt_group.options) {
                if (!re.count(opt.long_opt))
                    continue;
                const auto ext{std::get<mdtree::Extension>(opt.flag)};
                if (ext == Strikethrough)
                    parser_options.extensions.erase(ext);
                else
                    parser_options.extensions.insert(ext);
            }
        } else if (opt_group.name == "Rendering") {
            for (const auto &opt: opt_group.options) {
                if (!re.count(opt.long_opt))
                    continue;
                if (const auto *flag = std::get_if<mdtree::Render_Flag>(&opt.flag)) {
                    rendering_flags.insert(*flag);
                    if (*flag == XHTML)
                        want_xhtml = true;
                } else if (opt.long_opt == "ftoc")
                    want_toc = true;
            }
        }
    }

    if (re.count("input"))
        input_path = re["input"].as<std::string>();
}

int main(int argc, char **argv) {
    const auto p{parse_opts(argc, argv)};
    apply_opts(p);

    const bool from_stdin = input_path.empty() || input_path == "-";
    const bool to_stdout = output_path.empty() || output_path == "-";

    std::ifstream input_file;
    if (!from_stdin) {
        input_file.open(input_path, std::ios_base::binary);
        if (!input_file) {
            std::cerr << "Cannot open " << input_path.string() << ".\n";
            return 1;
        }
    }
    std::ofstream output_file;
    if (!to_stdout) {
        output_file.open(output_path, std::ios_base::trunc);
        if (!output_file) {
            std::cerr << "Cannot open " << output_path.string() << ".\n";
            return 1;
        }
    }

    std::istream &in{from_stdin ? std::cin : input_file};
    std::ostream &out{to_stdout ? std::cout : output_file};

    try {
        return process_file(in, out);
    } catch (const mdtree::Error &e) {
        std::cerr << "Parsing failed: " << e.what() << '\n';
        return 1;
    }
}
