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

#ifndef MDTREE_H
#define MDTREE_H

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

#define MDTREE_VERSION "1.0.0"

namespace mdtree {

using mdstring = std::string;
using mdstringview = std::string_view;

typedef std::size_t MD_OFFSET;

/* Zero-based index of a source line. */
typedef unsigned MD_LINE;

/* Alignment of a table column, as given by its separator cell.
 * `none` is also used for body cells beyond the header count, which have
 * no column to take an alignment from. */
enum class Align { none, left, center, right };

/**********************
 ***  Block tokens  ***
 **********************/

/* Each block token holds the exact source lines it consumed in `raw`
 * (joined by '\n') and the index of its first line in `line`. Joining the
 * `raw` of all tokens returned by a single scan with '\n' gives back the
 * scanned document. */

/* ATX heading: "## Text ##". */
struct Heading_Token {
  unsigned short level; /* 1 - 6 */
  mdstring text;
  mdstring raw;
  MD_LINE line;
};

/* One or more consecutive text lines. `text` keeps the '\n' separators. */
struct Paragraph_Token {
  mdstring text;
  mdstring raw;
  MD_LINE line;
};

/* Fenced or indented code. `language` is the info string of a fence (trimmed)
 * and is always empty for indented code. */
struct Code_Block_Token {
  mdstring language;
  mdstring code;
  mdstring raw;
  MD_LINE line;
};

struct List_Item_Token {
  mdstring marker;  /* Bullet character ("-", "+", "*") or the ordinal ("12"). */
  mdstring content; /* Item text; continuation lines are appended after '\n'. */
  mdstring raw;
  MD_LINE line;
};

struct List_Token {
  bool ordered;
  std::vector<List_Item_Token> items;
  mdstring raw;
  MD_LINE line;
};

/* Contents of a block quote with the '>' markers stripped. It is not parsed
 * by the block scanner; the AST builder scans it again on its own. */
struct Blockquote_Token {
  mdstring content;
  mdstring raw;
  MD_LINE line;
};

struct Table_Header {
  mdstring text;
  Align align;
};

/* Rows are positional against `headers`. A row may have fewer or more cells
 * than there are headers; nothing is padded or dropped. */
struct Table_Token {
  std::vector<Table_Header> headers;
  std::vector<std::vector<mdstring>> rows;
  mdstring raw;
  MD_LINE line;
};

struct Hr_Token {
  mdstring raw;
  MD_LINE line;
};

struct Html_Token {
  mdstring html;
  mdstring raw;
  MD_LINE line;
};

struct Blank_Token {
  mdstring raw;
  MD_LINE line;
};

using Block_Token =
    std::variant<Heading_Token, Paragraph_Token, Code_Block_Token, List_Token,
                 Blockquote_Token, Table_Token, Hr_Token, Html_Token,
                 Blank_Token>;

/* Accessors common to all block token types. */
const mdstring &raw_of(const Block_Token &token);
MD_LINE line_of(const Block_Token &token);

/* Name of the token type, as used in JSON output ("heading", "codeBlock"...).
 */
const char *token_type_name(const Block_Token &token);

/***********************
 ***  Inline tokens  ***
 ***********************/

/* Every inline token keeps the exact source span it consumed in `raw`, so
 * joining the `raw` of all tokens returned by tokenize_inline() gives back
 * the scanned text. */

struct Text_Token {
  mdstring text;
  mdstring raw;
};

struct Code_Span_Token {
  mdstring code;
  mdstring raw;
};

/* [text](href "title") and <autolinks>. `text` is the unparsed label. */
struct Link_Token {
  mdstring text;
  mdstring href;
  std::optional<mdstring> title;
  mdstring raw;
};

struct Image_Token {
  mdstring alt;
  mdstring src;
  std::optional<mdstring> title;
  mdstring raw;
};

/* For the three span tokens below, `text` is the unparsed inner span. */
struct Strong_Token {
  mdstring text;
  mdstring raw;
};

struct Em_Token {
  mdstring text;
  mdstring raw;
};

struct Del_Token {
  mdstring text;
  mdstring raw;
};

using Inline_Token =
    std::variant<Text_Token, Code_Span_Token, Link_Token, Image_Token,
                 Strong_Token, Em_Token, Del_Token>;

/*****************
 ***  Options  ***
 *****************/

enum class Extension : unsigned {
  /* Recognize ~~deleted~~ spans. On by default. */
  Strikethrough = 1 << 0,
  /* Disable indented code blocks. (Only fenced code works.) */
  No_Indented_Codeblock = 1 << 1,
  /* Disable raw HTML blocks. */
  No_Raw_HTML_Block = 1 << 2,
};

struct Parser_Options {
  std::unordered_set<Extension> extensions{Extension::Strikethrough};

  /* Bound on recursion of the AST builder: nested block quotes and nested
   * inline spans deeper than this are kept as plain text. */
  unsigned max_nesting = 64;

  /* Keep built trees keyed by a hash of the input (see Parser). */
  bool enable_cache = false;

  /* Debug callback. Optional (may be nullptr).
   *
   * If provided, this function gets called with diagnostic messages. It is
   * intended for debugging and problem diagnosis for developers; it is not
   * intended to provide any errors suitable for displaying to an end user.
   */
  void (*debug_log)(mdstringview /*msg*/, void * /*userdata*/) = nullptr;
  void *userdata = nullptr;

  bool has(Extension ext) const { return extensions.contains(ext); }
};

/****************
 ***  Errors  ***
 ****************/

enum class Error_Kind {
  /* A required text argument is missing (e.g. a null C string). */
  invalid_input,
  /* A hand-built token array violates a structural invariant. */
  malformed_token_stream
};

class Error : public std::runtime_error {
public:
  Error(Error_Kind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  Error_Kind kind() const noexcept { return kind_; }

private:
  Error_Kind kind_;
};

/********************
 ***  Public API  ***
 ********************/

/* Replace "\r\n" and lone '\r' by '\n'. */
mdstring normalize_line_endings(mdstringview text);

/* Split on '\n'. An empty text gives one empty line. */
std::vector<mdstring> split_lines(mdstringview text);

/* Scan a document already split into lines. Never fails: every line ends up
 * in exactly one token. */
std::vector<Block_Token> scan_blocks(const std::vector<mdstring> &lines,
                                     const Parser_Options &options = {});

/* Normalize line endings, split into lines and scan. */
std::vector<Block_Token> tokenize(mdstringview text,
                                  const Parser_Options &options = {});

/* Same as above for a C string. Throws Error (invalid_input) on nullptr. */
std::vector<Block_Token> tokenize(const char *text,
                                  const Parser_Options &options = {});

/* Scan one span of text into inline tokens. Never fails. */
std::vector<Inline_Token> tokenize_inline(mdstringview text,
                                          const Parser_Options &options = {});

/* Check structural invariants of a (possibly hand-built) token array and
 * throw Error (malformed_token_stream) on the first violation. Output of
 * tokenize() always passes. */
void validate_tokens(const std::vector<Block_Token> &tokens,
                     const Parser_Options &options = {});

} // namespace mdtree

#endif /* MDTREE_H */
