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

#include "mdtree.h"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <span>
#include <string.h>
#include <string>
#include <variant>
#include <vector>

namespace mdtree {

/*****************************
 ***  Miscellaneous Stuff  ***
 *****************************/

typedef char CHAR;
typedef MD_OFFSET OFF;
typedef MD_OFFSET SZ;

#define MD_LOG(msg)                                                            \
  do {                                                                         \
    if (ctx.options.debug_log != nullptr)                                      \
      ctx.options.debug_log((msg), ctx.options.userdata);                      \
  } while (0)

/* Character classification.
 * Note we assume ASCII compatibility of code points < 128 here. */
#define ISIN_(ch, ch_min, ch_max)                                              \
  ((ch_min) <= (unsigned char)(ch) && (unsigned char)(ch) <= (ch_max))
#define ISANYOF_(ch, palette)                                                  \
  ((ch) != '\0' && strchr((palette), (ch)) != nullptr)
#define ISANYOF2_(ch, ch1, ch2) ((ch) == (ch1) || (ch) == (ch2))
#define ISANYOF3_(ch, ch1, ch2, ch3)                                           \
  ((ch) == (ch1) || (ch) == (ch2) || (ch) == (ch3))
#define ISBLANK_(ch) (ISANYOF2_((ch), ' ', '\t'))
#define ISWHITESPACE_(ch) (ISBLANK_(ch) || ISANYOF3_((ch), '\v', '\f', '\n'))
#define ISUPPER_(ch) (ISIN_(ch, 'A', 'Z'))
#define ISLOWER_(ch) (ISIN_(ch, 'a', 'z'))
#define ISALPHA_(ch) (ISUPPER_(ch) || ISLOWER_(ch))
#define ISDIGIT_(ch) (ISIN_(ch, '0', '9'))
#define ISALNUM_(ch) (ISALPHA_(ch) || ISDIGIT_(ch))

/* Character accessors over the current line (or inline span). */
#define CH(off) (str[(off)])
#define ISANYOF(off, palette) ISANYOF_(CH(off), (palette))
#define ISBLANK(off) ISBLANK_(CH(off))
#define ISWHITESPACE(off) ISWHITESPACE_(CH(off))
#define ISDIGIT(off) ISDIGIT_(CH(off))
#define ISALNUM(off) ISALNUM_(CH(off))

static mdstringview md_trim(mdstringview str) {
  OFF beg = 0;
  OFF end = str.size();

  while (beg < end && ISWHITESPACE(beg))
    beg++;
  while (end > beg && ISWHITESPACE(end - 1))
    end--;
  return str.substr(beg, end - beg);
}

static bool md_is_blank_line(mdstringview str) {
  return std::ranges::all_of(str, [](CHAR ch) { return ISWHITESPACE_(ch); });
}

static bool is_case_insensitive_equal(mdstringview s1, mdstringview s2) {
  return std::ranges::equal(s1, s2, [](CHAR x, CHAR y) {
    return std::tolower((unsigned char)x) == std::tolower((unsigned char)y);
  });
}

static bool md_contains_case_insensitive(mdstringview str,
                                         mdstringview needle) {
  if (needle.size() > str.size())
    return false;
  for (OFF off = 0; off + needle.size() <= str.size(); off++) {
    if (is_case_insensitive_equal(str.substr(off, needle.size()), needle))
      return true;
  }
  return false;
}

const mdstring &raw_of(const Block_Token &token) {
  return std::visit([](const auto &tok) -> const mdstring & { return tok.raw; },
                    token);
}

MD_LINE line_of(const Block_Token &token) {
  return std::visit([](const auto &tok) { return tok.line; }, token);
}

const char *token_type_name(const Block_Token &token) {
  static constexpr const char *names[]{"heading",    "paragraph", "codeBlock",
                                       "list",       "blockquote", "table",
                                       "hr",         "html",       "blank"};

  if (const auto *list = std::get_if<List_Token>(&token))
    return list->ordered ? "orderedList" : "list";
  return names[token.index()];
}

/*******************************
 ***  Line-level recognizers  ***
 *******************************/

/* These only look at a single line. The block scanners below decide how many
 * lines a construct takes. */

static bool md_is_atxheader_line(mdstringview str, unsigned *p_level,
                                 mdstringview *p_text) {
  OFF off = 0;
  mdstringview text;

  while (off < str.size() && CH(off) == '#' && off < 7)
    off++;
  if (off == 0 || off > 6)
    return false;
  /* At least one whitespace must follow the opener. */
  if (off >= str.size() || !ISBLANK(off))
    return false;
  *p_level = off;

  text = md_trim(str.substr(off));
  if (text.empty())
    return false;

  /* Optional closing sequence: a run of '#' preceded by whitespace. */
  {
    OFF end = text.size();
    while (end > 0 && text[end - 1] == '#')
      end--;
    if (end < text.size() && end > 0 && ISBLANK_(text[end - 1]))
      text = md_trim(text.substr(0, end));
  }

  *p_text = text;
  return true;
}

static bool md_is_hr_line(mdstringview str) {
  mdstringview line = md_trim(str);
  OFF off;
  int n = 0;

  if (line.empty() || !ISANYOF_(line[0], "*-_"))
    return false;

  for (off = 0; off < line.size(); off++) {
    if (line[off] == line[0])
      n++;
    else if (!ISBLANK_(line[off]))
      return false;
  }

  return (n >= 3);
}

struct Code_Fence {
  CHAR ch;
  SZ length;
};

static bool md_is_opening_code_fence(mdstringview str, Code_Fence *p_fence,
                                     mdstringview *p_info) {
  OFF off = 0;

  if (str.empty() || !ISANYOF2_(CH(0), '`', '~'))
    return false;

  while (off < str.size() && CH(off) == CH(0))
    off++;

  /* Fence must have at least three characters. */
  if (off < 3)
    return false;

  p_fence->ch = CH(0);
  p_fence->length = off;
  *p_info = md_trim(str.substr(off));
  return true;
}

/* Outcome of looking for a closing fence inside a fenced block. */
enum class Fence_Close {
  no,        /* Line is an ordinary code line. */
  yes,       /* Line is the closing fence. */
  after_code /* Line closes the block, its leading part is the last code line. */
};

static Fence_Close md_is_closing_code_fence(mdstringview str,
                                            const Code_Fence &fence,
                                            OFF *p_fence_off) {
  const mdstring fence_str(fence.length, fence.ch);
  OFF fence_off = str.find(fence_str);
  OFF off;

  if (fence_off == mdstringview::npos)
    return Fence_Close::no;

  /* Closing fence must have at least the same length and use same char as
   * opening one; only whitespace may surround it. */
  off = fence_off;
  while (off < str.size() && CH(off) == fence.ch)
    off++;
  if (md_is_blank_line(str.substr(0, fence_off)) &&
      md_is_blank_line(str.substr(off)))
    return Fence_Close::yes;

  if (fence_off > 0) {
    *p_fence_off = fence_off;
    return Fence_Close::after_code;
  }

  return Fence_Close::no;
}

struct List_Mark {
  bool ordered;
  mdstringview marker;
  OFF content_beg;
};

/* Recognize "- ", "+ ", "* ", "12. " or "12) ". With `max_indent` the mark
 * must not be indented by more than that many spaces (list start); subsequent
 * items can be indented arbitrarily. */
static bool md_is_list_mark(mdstringview str, int max_indent,
                            List_Mark *p_mark) {
  OFF off = 0;
  OFF mark_beg;

  while (off < str.size() && ISBLANK(off)) {
    if (max_indent >= 0 && CH(off) != ' ')
      return false;
    off++;
  }
  if (max_indent >= 0 && off > (OFF)max_indent)
    return false;
  if (off >= str.size())
    return false;

  mark_beg = off;
  if (ISANYOF(off, "*+-")) {
    p_mark->ordered = false;
    p_mark->marker = str.substr(off, 1);
    off++;
  } else if (ISDIGIT(off)) {
    while (off < str.size() && ISDIGIT(off) && off - mark_beg < 10)
      off++;
    if (off - mark_beg > 9)
      return false;
    if (off >= str.size() || !ISANYOF2_(CH(off), '.', ')'))
      return false;
    p_mark->ordered = true;
    p_mark->marker = str.substr(mark_beg, off - mark_beg);
    off++;
  } else {
    return false;
  }

  /* The mark must be followed by whitespace. */
  if (off >= str.size() || !ISBLANK(off))
    return false;
  while (off < str.size() && ISBLANK(off))
    off++;

  p_mark->content_beg = off;
  return true;
}

static bool md_is_blockquote_line(mdstringview str) {
  return !str.empty() && CH(0) == '>';
}

/* Split a table row into trimmed cells. One leading and one trailing pipe are
 * removed first; "\|" is an escaped pipe, kept in the cell as "|". */
static std::vector<mdstring> md_split_table_row(mdstringview str) {
  std::vector<mdstring> cells;
  mdstringview row = md_trim(str);
  mdstring cell;

  if (!row.empty() && row.front() == '|')
    row.remove_prefix(1);
  if (!row.empty() && row.back() == '|' &&
      (row.size() < 2 || row[row.size() - 2] != '\\'))
    row.remove_suffix(1);

  for (OFF off = 0; off < row.size(); off++) {
    if (row[off] == '\\' && off + 1 < row.size() && row[off + 1] == '|') {
      cell += '|';
      off++;
    } else if (row[off] == '|') {
      cells.emplace_back(md_trim(cell));
      cell.clear();
    } else {
      cell += row[off];
    }
  }
  cells.emplace_back(md_trim(cell));
  return cells;
}

static bool md_is_table_row(mdstringview str) {
  return str.find('|') != mdstringview::npos;
}

static Align md_analyze_table_alignment(mdstringview cell) {
  if (cell.empty())
    return Align::none;
  if (cell.front() == ':' && cell.back() == ':' && cell.size() > 1)
    return Align::center;
  if (cell.back() == ':')
    return Align::right;
  if (cell.front() == ':')
    return Align::left;
  return Align::none;
}

/* Separator row: every cell is ":?-+:?" or empty, and at least one of them
 * contains a dash. */
static bool md_is_table_underline(mdstringview str, std::vector<Align> *p_aligns) {
  std::vector<Align> aligns;
  bool has_dash = false;

  if (md_is_blank_line(str))
    return false;

  for (const mdstring &cell : md_split_table_row(str)) {
    mdstringview c(cell);
    OFF off = 0;

    if (c.empty()) {
      aligns.push_back(Align::none);
      continue;
    }
    if (c[off] == ':')
      off++;
    if (off >= c.size() || c[off] != '-')
      return false;
    while (off < c.size() && c[off] == '-')
      off++;
    if (off < c.size() && c[off] == ':')
      off++;
    if (off != c.size())
      return false;
    has_dash = true;
    aligns.push_back(md_analyze_table_alignment(c));
  }

  if (!has_dash)
    return false;
  *p_aligns = std::move(aligns);
  return true;
}

/* Raw text tags never open an HTML block; they stay paragraph text. */
static constexpr mdstringview raw_text_tags[]{"script", "style", "pre",
                                              "textarea"};

/* "<tag" followed by whitespace, '>', '/' or the end of line. */
static bool md_is_html_block_start(mdstringview str, mdstringview *p_tag) {
  OFF off = 1;

  if (str.size() < 2 || CH(0) != '<' || !ISALPHA_(CH(1)))
    return false;
  for (mdstringview t : raw_text_tags) {
    if (str.size() > t.size() &&
        is_case_insensitive_equal(str.substr(1, t.size()), t))
      return false;
  }
  while (off < str.size() && (ISALNUM(off) || CH(off) == '-'))
    off++;
  if (off < str.size() && !ISBLANK(off) && CH(off) != '>' && CH(off) != '/')
    return false;

  *p_tag = str.substr(1, off - 1);
  return true;
}

static bool md_is_indented_code_line(mdstringview str) {
  if (md_is_blank_line(str))
    return false;
  return str.starts_with("    ") || str.starts_with('\t');
}

/**************************
 ***  Block scanning  ***
 **************************/

struct Scanning_Context {
  std::span<const mdstring> lines;
  const Parser_Options &options;
};

static mdstring md_join_lines(const Scanning_Context &ctx, MD_LINE beg,
                              MD_LINE end) {
  mdstring ret;

  for (MD_LINE i = beg; i < end; i++) {
    if (i > beg)
      ret += '\n';
    ret += ctx.lines[i];
  }
  return ret;
}

/* Each scanner below either rejects the line at `beg` or produces a token
 * and sets `*p_end` past the last line it consumed. */

static bool md_scan_blank(Scanning_Context &ctx, MD_LINE beg, MD_LINE *p_end,
                          Block_Token *p_token) {
  if (!md_is_blank_line(ctx.lines[beg]))
    return false;

  *p_token = Blank_Token{ctx.lines[beg], beg};
  *p_end = beg + 1;
  return true;
}

static bool md_scan_heading(Scanning_Context &ctx, MD_LINE beg, MD_LINE *p_end,
                            Block_Token *p_token) {
  unsigned level;
  mdstringview text;

  if (!md_is_atxheader_line(ctx.lines[beg], &level, &text))
    return false;

  *p_token = Heading_Token{(unsigned short)level, mdstring(text),
                           ctx.lines[beg], beg};
  *p_end = beg + 1;
  return true;
}

static bool md_scan_hr(Scanning_Context &ctx, MD_LINE beg, MD_LINE *p_end,
                       Block_Token *p_token) {
  if (!md_is_hr_line(ctx.lines[beg]))
    return false;

  *p_token = Hr_Token{ctx.lines[beg], beg};
  *p_end = beg + 1;
  return true;
}

static bool md_scan_fenced_code(Scanning_Context &ctx, MD_LINE beg,
                                MD_LINE *p_end, Block_Token *p_token) {
  Code_Fence fence;
  mdstringview info;
  mdstring code;
  MD_LINE i;
  bool first = true;
  bool closed = false;

  if (!md_is_opening_code_fence(ctx.lines[beg], &fence, &info))
    return false;

  auto append_code = [&](mdstringview str) {
    if (!first)
      code += '\n';
    code += str;
    first = false;
  };

  /* Without a closing fence, the block runs to the end of the document. */
  for (i = beg + 1; i < ctx.lines.size(); i++) {
    OFF fence_off = 0;

    switch (md_is_closing_code_fence(ctx.lines[i], fence, &fence_off)) {
    case Fence_Close::no:
      append_code(ctx.lines[i]);
      continue;
    case Fence_Close::after_code:
      append_code(mdstringview(ctx.lines[i]).substr(0, fence_off));
      break;
    case Fence_Close::yes:
      break;
    }
    closed = true;
    i++;
    break;
  }

  if (!closed)
    MD_LOG("Unclosed code fence runs to the end of document.");

  *p_token = Code_Block_Token{mdstring(info), std::move(code),
                              md_join_lines(ctx, beg, i), beg};
  *p_end = i;
  return true;
}

static bool md_scan_blockquote(Scanning_Context &ctx, MD_LINE beg,
                               MD_LINE *p_end, Block_Token *p_token) {
  mdstring content;
  MD_LINE i;

  if (!md_is_blockquote_line(ctx.lines[beg]))
    return false;

  for (i = beg; i < ctx.lines.size(); i++) {
    mdstringview str = ctx.lines[i];

    if (md_is_blockquote_line(str)) {
      /* Strip the '>' and one optional following whitespace. */
      str.remove_prefix(1);
      if (!str.empty() && ISBLANK(0))
        str.remove_prefix(1);
    } else if (!md_is_blank_line(str)) {
      break;
    }

    if (i > beg)
      content += '\n';
    content += str;
  }

  *p_token = Blockquote_Token{std::move(content), md_join_lines(ctx, beg, i),
                              beg};
  *p_end = i;
  return true;
}

static bool md_scan_list(Scanning_Context &ctx, MD_LINE beg, MD_LINE *p_end,
                         Block_Token *p_token) {
  List_Mark mark;
  List_Token list;
  MD_LINE i;
  MD_LINE end = beg + 1;

  if (!md_is_list_mark(ctx.lines[beg], 3, &mark))
    return false;

  list.ordered = mark.ordered;
  list.line = beg;

  for (i = beg; i < ctx.lines.size(); i++) {
    const mdstring &line = ctx.lines[i];
    List_Mark item_mark;

    /* Blank lines are taken but do not end the list. */
    if (md_is_blank_line(line)) {
      end = i + 1;
      continue;
    }

    if (md_is_list_mark(line, -1, &item_mark) &&
        item_mark.ordered == mark.ordered) {
      list.items.push_back(List_Item_Token{
          mdstring(item_mark.marker), line.substr(item_mark.content_beg), line,
          i});
    } else if (line.starts_with("  ")) {
      /* Continuation lines, nested lists included, stay raw text of the
       * current item. */
      list.items.back().content += '\n';
      list.items.back().content += line;
    } else {
      break;
    }
    end = i + 1;
  }

  list.raw = md_join_lines(ctx, beg, end);
  *p_token = std::move(list);
  *p_end = end;
  return true;
}

static bool md_scan_table(Scanning_Context &ctx, MD_LINE beg, MD_LINE *p_end,
                          Block_Token *p_token) {
  std::vector<Align> aligns;
  Table_Token table;
  MD_LINE i;

  if (!md_is_table_row(ctx.lines[beg]) || beg + 1 >= ctx.lines.size())
    return false;
  if (!md_is_table_underline(ctx.lines[beg + 1], &aligns))
    return false;

  for (mdstring &text : md_split_table_row(ctx.lines[beg])) {
    Align align = Align::none;
    if (table.headers.size() < aligns.size())
      align = aligns[table.headers.size()];
    table.headers.push_back(Table_Header{std::move(text), align});
  }

  for (i = beg + 2; i < ctx.lines.size(); i++) {
    if (!md_is_table_row(ctx.lines[i]))
      break;
    table.rows.push_back(md_split_table_row(ctx.lines[i]));
  }

  table.raw = md_join_lines(ctx, beg, i);
  table.line = beg;
  *p_token = std::move(table);
  *p_end = i;
  return true;
}

static bool md_scan_html_block(Scanning_Context &ctx, MD_LINE beg,
                               MD_LINE *p_end, Block_Token *p_token) {
  mdstringview tag;
  mdstring closer;
  MD_LINE i;
  MD_LINE end = beg + 1;

  if (ctx.options.has(Extension::No_Raw_HTML_Block))
    return false;
  if (!md_is_html_block_start(ctx.lines[beg], &tag))
    return false;

  closer = "</" + mdstring(tag) + ">";
  for (i = beg; i < ctx.lines.size(); i++) {
    if (md_contains_case_insensitive(ctx.lines[i], closer)) {
      end = i + 1;
      break;
    }
  }

  mdstring html = md_join_lines(ctx, beg, end);
  *p_token = Html_Token{html, html, beg};
  *p_end = end;
  return true;
}

static bool md_scan_indented_code(Scanning_Context &ctx, MD_LINE beg,
                                  MD_LINE *p_end, Block_Token *p_token) {
  mdstring code;
  MD_LINE i;

  if (ctx.options.has(Extension::No_Indented_Codeblock))
    return false;
  if (!md_is_indented_code_line(ctx.lines[beg]))
    return false;

  /* Blank lines, trailing ones included, become empty code lines. */
  for (i = beg; i < ctx.lines.size(); i++) {
    mdstringview str = ctx.lines[i];

    if (md_is_indented_code_line(str))
      str.remove_prefix(str.starts_with('\t') ? 1 : 4);
    else if (md_is_blank_line(str))
      str = mdstringview();
    else
      break;

    if (i > beg)
      code += '\n';
    code += str;
  }

  *p_token = Code_Block_Token{mdstring(), std::move(code),
                              md_join_lines(ctx, beg, i), beg};
  *p_end = i;
  return true;
}

static bool md_is_paragraph_interrupt(mdstringview str) {
  unsigned level;
  mdstringview text;
  List_Mark mark;

  return md_is_blank_line(str) || md_is_atxheader_line(str, &level, &text) ||
         md_is_hr_line(str) || md_is_blockquote_line(str) ||
         md_is_list_mark(str, 3, &mark);
}

static bool md_scan_paragraph(Scanning_Context &ctx, MD_LINE beg,
                              MD_LINE *p_end, Block_Token *p_token) {
  MD_LINE i;

  for (i = beg + 1; i < ctx.lines.size(); i++) {
    if (md_is_paragraph_interrupt(ctx.lines[i]))
      break;
  }

  mdstring text = md_join_lines(ctx, beg, i);
  *p_token = Paragraph_Token{text, text, beg};
  *p_end = i;
  return true;
}

typedef bool (*Block_Scanner)(Scanning_Context &, MD_LINE, MD_LINE *,
                              Block_Token *);

/* In order of priority. The paragraph scanner accepts anything. */
static constexpr Block_Scanner block_scanners[]{
    md_scan_blank,       md_scan_heading,    md_scan_hr,
    md_scan_fenced_code, md_scan_blockquote, md_scan_list,
    md_scan_table,       md_scan_html_block, md_scan_indented_code,
    md_scan_paragraph};

std::vector<Block_Token> scan_blocks(const std::vector<mdstring> &lines,
                                     const Parser_Options &options) {
  Scanning_Context ctx{lines, options};
  std::vector<Block_Token> tokens;
  MD_LINE pos = 0;

  while (pos < lines.size()) {
    Block_Token token;
    MD_LINE end = pos;

    for (Block_Scanner scanner : block_scanners) {
      if (scanner(ctx, pos, &end, &token))
        break;
    }

    tokens.push_back(std::move(token));
    pos = end;
  }

  return tokens;
}

mdstring normalize_line_endings(mdstringview text) {
  mdstring ret;

  ret.reserve(text.size());
  for (OFF off = 0; off < text.size(); off++) {
    if (text[off] == '\r') {
      ret += '\n';
      if (off + 1 < text.size() && text[off + 1] == '\n')
        off++;
    } else {
      ret += text[off];
    }
  }
  return ret;
}

std::vector<mdstring> split_lines(mdstringview text) {
  std::vector<mdstring> lines;
  OFF beg = 0;

  while (true) {
    OFF end = text.find('\n', beg);
    if (end == mdstringview::npos) {
      lines.emplace_back(text.substr(beg));
      break;
    }
    lines.emplace_back(text.substr(beg, end - beg));
    beg = end + 1;
  }
  return lines;
}

std::vector<Block_Token> tokenize(mdstringview text,
                                  const Parser_Options &options) {
  return scan_blocks(split_lines(normalize_line_endings(text)), options);
}

std::vector<Block_Token> tokenize(const char *text,
                                  const Parser_Options &options) {
  if (text == nullptr)
    throw Error(Error_Kind::invalid_input, "Input text must not be null");
  return tokenize(mdstringview(text), options);
}

/***************************
 ***  Inline scanning  ***
 ***************************/

struct Inline_Context {
  mdstringview str;
  const Parser_Options &options;
  /* Per mark ('*', '_', '~'): an offset from which a closer is known not to
   * exist, so later openers of the same kind fail without rescanning. */
  OFF emph_unclosed_from[3]{mdstringview::npos, mdstringview::npos,
                            mdstringview::npos};
  OFF doubled_unclosed_from[3]{mdstringview::npos, mdstringview::npos,
                               mdstringview::npos};
};

static int md_mark_index(CHAR mark) {
  return (mark == '*' ? 0 : (mark == '_' ? 1 : 2));
}

#undef CH
#define CH(off) (ctx.str[(off)])

/* Matchers get the position of a potential opener. On success they store the
 * token and the offset past the consumed span. */

static bool md_is_escape(Inline_Context &ctx, OFF beg, OFF *p_end,
                         Inline_Token *p_token) {
  if (CH(beg) != '\\' || beg + 1 >= ctx.str.size())
    return false;
  if (!ISANYOF_(CH(beg + 1), "\\`*{}[]()#+-.!_>~|"))
    return false;

  *p_token = Text_Token{mdstring(1, CH(beg + 1)),
                        mdstring(ctx.str.substr(beg, 2))};
  *p_end = beg + 2;
  return true;
}

static bool md_is_code_span(Inline_Context &ctx, OFF beg, OFF *p_end,
                            Inline_Token *p_token) {
  OFF off = beg;
  SZ opener_len;

  if (CH(beg) != '`')
    return false;

  while (off < ctx.str.size() && CH(off) == '`')
    off++;
  opener_len = off - beg;

  /* Look for a closer run of exactly the same length. */
  while (off < ctx.str.size()) {
    OFF run_beg;

    if (CH(off) != '`') {
      off++;
      continue;
    }
    run_beg = off;
    while (off < ctx.str.size() && CH(off) == '`')
      off++;
    if (off - run_beg == opener_len) {
      mdstringview code =
          ctx.str.substr(beg + opener_len, run_beg - beg - opener_len);

      if (code.size() >= 2 && code.front() == ' ' && code.back() == ' ' &&
          !md_is_blank_line(code))
        code = code.substr(1, code.size() - 2);

      *p_token = Code_Span_Token{mdstring(code),
                                 mdstring(ctx.str.substr(beg, off - beg))};
      *p_end = off;
      return true;
    }
  }

  /* No closer: the whole opener run is literal text. */
  *p_token = Text_Token{mdstring(ctx.str.substr(beg, opener_len)),
                        mdstring(ctx.str.substr(beg, opener_len))};
  *p_end = beg + opener_len;
  return true;
}

struct Link_Parts {
  mdstringview label;
  mdstringview dest;
  std::optional<mdstring> title;
};

/* "[label](dest "title")" starting at `beg`. */
static bool md_is_inline_link_spec(Inline_Context &ctx, OFF beg, OFF *p_end,
                                   Link_Parts *p_parts) {
  OFF off = beg;
  OFF label_beg;
  OFF dest_beg;

  if (off >= ctx.str.size() || CH(off) != '[')
    return false;
  off++;
  label_beg = off;
  while (off < ctx.str.size() && CH(off) != ']')
    off++;
  if (off + 1 >= ctx.str.size() || CH(off + 1) != '(')
    return false;
  p_parts->label = ctx.str.substr(label_beg, off - label_beg);
  off += 2;

  dest_beg = off;
  while (off < ctx.str.size() && !ISWHITESPACE(off) && CH(off) != ')')
    off++;
  if (off == dest_beg)
    return false;
  p_parts->dest = ctx.str.substr(dest_beg, off - dest_beg);

  while (off < ctx.str.size() && ISBLANK(off))
    off++;

  p_parts->title.reset();
  if (off < ctx.str.size() && ISANYOF2_(CH(off), '"', '\'')) {
    CHAR quote = CH(off);
    OFF title_end = ctx.str.find(quote, off + 1);

    if (title_end == mdstringview::npos)
      return false;
    p_parts->title = mdstring(ctx.str.substr(off + 1, title_end - off - 1));
    off = title_end + 1;
    while (off < ctx.str.size() && ISBLANK(off))
      off++;
  }

  if (off >= ctx.str.size() || CH(off) != ')')
    return false;

  *p_end = off + 1;
  return true;
}

static bool md_is_link(Inline_Context &ctx, OFF beg, OFF *p_end,
                       Inline_Token *p_token) {
  Link_Parts parts;

  if (!md_is_inline_link_spec(ctx, beg, p_end, &parts))
    return false;

  *p_token = Link_Token{mdstring(parts.label), mdstring(parts.dest),
                        std::move(parts.title),
                        mdstring(ctx.str.substr(beg, *p_end - beg))};
  return true;
}

static bool md_is_image(Inline_Context &ctx, OFF beg, OFF *p_end,
                        Inline_Token *p_token) {
  Link_Parts parts;

  if (CH(beg) != '!')
    return false;
  if (!md_is_inline_link_spec(ctx, beg + 1, p_end, &parts))
    return false;

  *p_token = Image_Token{mdstring(parts.label), mdstring(parts.dest),
                         std::move(parts.title),
                         mdstring(ctx.str.substr(beg, *p_end - beg))};
  return true;
}

static bool md_is_autolink(Inline_Context &ctx, OFF beg, OFF *p_end,
                           Inline_Token *p_token) {
  OFF off = beg + 1;
  mdstringview address;
  bool is_email = false;

  if (CH(beg) != '<')
    return false;

  while (off < ctx.str.size() && CH(off) != '>' && CH(off) != '<' &&
         !ISWHITESPACE(off))
    off++;
  if (off >= ctx.str.size() || CH(off) != '>')
    return false;

  address = ctx.str.substr(beg + 1, off - beg - 1);
  if (!address.starts_with("http://") && !address.starts_with("https://")) {
    OFF at = address.find('@');
    if (at == mdstringview::npos || at == 0 || at + 1 >= address.size())
      return false;
    is_email = true;
  }

  *p_token = Link_Token{mdstring(address),
                        (is_email ? "mailto:" : "") + mdstring(address),
                        std::nullopt,
                        mdstring(ctx.str.substr(beg, off + 1 - beg))};
  *p_end = off + 1;
  return true;
}

/* Shared by strong and strikethrough: a doubled `mark`, non-empty inner text
 * not starting with whitespace or the mark, closed by the first doubled mark
 * not preceded by whitespace. */
static bool md_is_doubled_span(Inline_Context &ctx, OFF beg, CHAR mark,
                               OFF *p_end, mdstringview *p_inner) {
  OFF off = beg + 2;

  if (beg + 2 >= ctx.str.size() || CH(beg) != mark || CH(beg + 1) != mark)
    return false;
  if (ISWHITESPACE(off) || CH(off) == mark)
    return false;
  OFF &unclosed_from = ctx.doubled_unclosed_from[md_mark_index(mark)];
  if (beg + 3 >= unclosed_from)
    return false;

  for (off = beg + 3; off + 1 < ctx.str.size(); off++) {
    if (CH(off) == mark && CH(off + 1) == mark && !ISWHITESPACE(off - 1)) {
      *p_inner = ctx.str.substr(beg + 2, off - beg - 2);
      *p_end = off + 2;
      return true;
    }
  }
  unclosed_from = beg + 3;
  return false;
}

static bool md_is_strong(Inline_Context &ctx, OFF beg, OFF *p_end,
                         Inline_Token *p_token) {
  mdstringview inner;

  if (!ISANYOF2_(CH(beg), '*', '_'))
    return false;
  if (!md_is_doubled_span(ctx, beg, CH(beg), p_end, &inner))
    return false;

  *p_token = Strong_Token{mdstring(inner),
                          mdstring(ctx.str.substr(beg, *p_end - beg))};
  return true;
}

static bool md_is_emph(Inline_Context &ctx, OFF beg, OFF *p_end,
                       Inline_Token *p_token) {
  CHAR mark = CH(beg);
  OFF off;

  if (!ISANYOF2_(mark, '*', '_'))
    return false;
  if (beg + 2 >= ctx.str.size())
    return false;
  if (ISWHITESPACE(beg + 1) || CH(beg + 1) == mark)
    return false;
  /* Intraword underscore is not an opener. */
  if (mark == '_' && beg > 0 && ISALNUM(beg - 1))
    return false;
  OFF &unclosed_from = ctx.emph_unclosed_from[md_mark_index(mark)];
  if (beg + 2 >= unclosed_from)
    return false;

  for (off = beg + 2; off < ctx.str.size(); off++) {
    if (CH(off) != mark)
      continue;
    /* A doubled mark belongs to a nested strong span. */
    if (off + 1 < ctx.str.size() && CH(off + 1) == mark) {
      off++;
      continue;
    }
    if (ISWHITESPACE(off - 1))
      continue;
    if (mark == '_' && off + 1 < ctx.str.size() && ISALNUM(off + 1))
      continue;

    *p_token = Em_Token{mdstring(ctx.str.substr(beg + 1, off - beg - 1)),
                        mdstring(ctx.str.substr(beg, off + 1 - beg))};
    *p_end = off + 1;
    return true;
  }
  unclosed_from = beg + 2;
  return false;
}

static bool md_is_strikethrough(Inline_Context &ctx, OFF beg, OFF *p_end,
                                Inline_Token *p_token) {
  mdstringview inner;

  if (!ctx.options.has(Extension::Strikethrough))
    return false;
  if (!md_is_doubled_span(ctx, beg, '~', p_end, &inner))
    return false;

  *p_token = Del_Token{mdstring(inner),
                       mdstring(ctx.str.substr(beg, *p_end - beg))};
  return true;
}

typedef bool (*Inline_Matcher)(Inline_Context &, OFF, OFF *, Inline_Token *);

static constexpr Inline_Matcher inline_matchers[]{
    md_is_escape, md_is_code_span, md_is_link,   md_is_image,
    md_is_autolink, md_is_strong,  md_is_emph,   md_is_strikethrough};

static bool md_is_inline_mark(Inline_Context &ctx, OFF off) {
  if (ISANYOF(off, "\\`*_[]~<"))
    return true;
  return CH(off) == '!' && off + 1 < ctx.str.size() && CH(off + 1) == '[';
}

/* Adjacent text pieces are merged into one token. */
static void md_push_text(std::vector<Inline_Token> &tokens, Text_Token text) {
  if (!tokens.empty()) {
    if (auto *prev = std::get_if<Text_Token>(&tokens.back())) {
      prev->text += text.text;
      prev->raw += text.raw;
      return;
    }
  }
  tokens.push_back(std::move(text));
}

std::vector<Inline_Token> tokenize_inline(mdstringview text,
                                          const Parser_Options &options) {
  Inline_Context ctx{text, options};
  std::vector<Inline_Token> tokens;
  OFF off = 0;

  while (off < text.size()) {
    Inline_Token token;
    OFF end = off;
    bool matched = false;

    for (Inline_Matcher matcher : inline_matchers) {
      if (matcher(ctx, off, &end, &token)) {
        matched = true;
        break;
      }
    }

    if (matched) {
      /* Escapes and unclosed backtick runs come back as text. */
      if (auto *t = std::get_if<Text_Token>(&token))
        md_push_text(tokens, std::move(*t));
      else
        tokens.push_back(std::move(token));
      off = end;
      continue;
    }

    /* Plain text up to the next potential mark; at least one character. */
    end = off + 1;
    while (end < text.size() && !md_is_inline_mark(ctx, end))
      end++;
    md_push_text(tokens, Text_Token{mdstring(text.substr(off, end - off)),
                                    mdstring(text.substr(off, end - off))});
    off = end;
  }

  return tokens;
}

/**************************
 ***  Token validation  ***
 **************************/

void validate_tokens(const std::vector<Block_Token> &tokens,
                     const Parser_Options &options) {
  Scanning_Context ctx{{}, options};

  auto fail = [&](const mdstring &msg) {
    MD_LOG(msg);
    throw Error(Error_Kind::malformed_token_stream, msg);
  };

  for (const Block_Token &token : tokens) {
    if (const auto *h = std::get_if<Heading_Token>(&token)) {
      if (h->level < 1 || h->level > 6)
        fail("Heading token at line " + std::to_string(h->line) +
             " has level " + std::to_string(h->level) +
             " (expected 1 - 6)");
    } else if (const auto *list = std::get_if<List_Token>(&token)) {
      if (list->items.empty())
        fail("List token at line " + std::to_string(list->line) +
             " has no items");
    } else if (const auto *table = std::get_if<Table_Token>(&token)) {
      if (table->headers.empty())
        fail("Table token at line " + std::to_string(table->line) +
             " has no headers");
    }
  }
}

} // namespace mdtree
