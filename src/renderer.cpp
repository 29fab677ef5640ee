#include "renderer.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <iterator>

static const char* kHelpLines[] = {
  "Normal mode",
  "  i a I A o O   insert / append / open line",
  "  h j k l       move (arrows too), w b by word",
  "  0 $ gg G      line and buffer bounds",
  "  x dd yy P     delete char / line, yank, put",
  "  r diw ciw     replace, delete / change word",
  "  Shift+arrows  extend selection",
  "  n p ] [ s     exercises, toggle solution",
  "  J K PgDn PgUp scroll output, Home End",
  "  Ctrl+O        expand output",
  "  Ctrl+D Ctrl+U scroll solution",
  "  q             quit",
  "Commands",
  "  :w :q :q! :wq :x   save / quit",
  "  :c :test :lint     check the exercise",
  "  :checkall          check every exercise",
  "  :h :hint           show hint",
  "  :auto :watch       auto-advance / watching",
  "  :r :reset          reload / restore original",
};

static TextStyle style_for(TokenClass c) {
  switch (c) {
    case TokenClass::Keyword: return TextStyle{ColorRole::Keyword, true, false};
    case TokenClass::Type: return TextStyle{ColorRole::Type, false, false};
    case TokenClass::Number: return TextStyle{ColorRole::Number, false, false};
    case TokenClass::String: return TextStyle{ColorRole::String, false, false};
    case TokenClass::Comment: return TextStyle{ColorRole::Comment, false, false};
    case TokenClass::Punctuation: return TextStyle{ColorRole::Punctuation, false, false};
    case TokenClass::Plain: break;
  }
  return TextStyle{};
}

static bool same_style(const TextStyle& a, const TextStyle& b) {
  return a.role == b.role && a.bold == b.bold && a.reverse == b.reverse;
}

static std::string mode_badge(Mode m) { return std::string(" ") + mode_name(m) + " "; }

static void append_grapheme(std::string& out, std::string_view g) {
  if (!g.empty() && static_cast<unsigned char>(g[0]) < 0x20) out.push_back(' ');
  else out.append(g);
}

int text_cells(std::string_view s) {
  int w = 0;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t e = next_grapheme_end(s, pos);
    w += display_width(s.substr(pos, e - pos));
    pos = e;
  }
  return w;
}

std::string clip_to_cells(std::string_view s, int skip, int max_cells) {
  std::string out;
  size_t pos = grapheme_byte_offset(s, std::max(0, skip));
  int used = 0;
  while (pos < s.size()) {
    size_t e = next_grapheme_end(s, pos);
    std::string_view g = s.substr(pos, e - pos);
    int w = display_width(g);
    if (used + w > max_cells) break;
    append_grapheme(out, g);
    used += w;
    pos = e;
  }
  return out;
}

FrameLayout frame_layout(int rows, int cols, const SessionState& s) {
  if (s.output_expanded) return compute_layout(rows, cols, false, rows);
  return compute_layout(rows, cols, s.show_solution);
}

int pane_body_rows(const Rect& pane) { return std::max(0, pane.height - 1); }

int gutter_width(int line_count) {
  int digits = 1;
  int total = std::max(1, line_count);
  while (total >= 10) { total /= 10; digits++; }
  return digits + 1;
}

Rect editor_text_area(const Rect& editor, int line_count) {
  int title = std::min(1, std::max(0, editor.height));
  int gw = std::min(gutter_width(line_count), std::max(0, editor.width));
  return Rect{editor.row + title, editor.col + gw,
              std::max(0, editor.height - title), std::max(0, editor.width - gw)};
}

Viewport follow_cursor(Viewport vp, Cursor cur, int rows, int cols) {
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (rows > 0 && cur.row >= vp.top_line + rows) vp.top_line = cur.row - rows + 1;
  if (cur.col < vp.left_col) vp.left_col = cur.col;
  if (cols > 0 && cur.col >= vp.left_col + cols) vp.left_col = cur.col - cols + 1;
  vp.top_line = std::max(0, vp.top_line);
  vp.left_col = std::max(0, vp.left_col);
  return vp;
}

const char* spinner_frame(std::chrono::milliseconds elapsed) {
  static const char* frames[] = {"|", "/", "-", "\\"};
  long long t = std::max<long long>(0, elapsed.count());
  return frames[(t / 100) % 4];
}

// Bounces across [0, width) once per second each way.
int pulse_position(std::chrono::milliseconds elapsed, int width) {
  if (width <= 1) return 0;
  long long t = std::max<long long>(0, elapsed.count()) % 2000;
  long long span = width - 1;
  long long pos = t < 1000 ? t * span / 1000 : (2000 - t) * span / 1000;
  return static_cast<int>(pos);
}

std::string progress_bar_text(int done, int total, int width, std::chrono::milliseconds elapsed) {
  int pct = total > 0 ? done * 100 / total : 0;
  std::string counts = " " + std::to_string(done) + "/" + std::to_string(total) + " (" + std::to_string(pct) + "%)";
  int bar_w = width - text_cells(counts) - 2;
  if (bar_w < 1) return clip_to_cells(counts, 0, std::max(0, width));
  int filled = total > 0 ? static_cast<int>(static_cast<long long>(done) * bar_w / total) : 0;
  int pulse = filled < bar_w ? filled + pulse_position(elapsed, bar_w - filled) : -1;
  std::string bar = "[";
  for (int i = 0; i < bar_w; ++i) {
    if (i < filled) bar += "█";
    else if (i == pulse) bar += "●";
    else bar += "─";
  }
  bar += "]";
  return bar + counts;
}

void Renderer::draw_title(ITerminal& term, const Rect& r, const std::string& title, bool active) {
  if (r.empty()) return;
  std::string line = "─ " + title + " ";
  int used = text_cells(line);
  for (int i = used; i < r.width; ++i) line += "─";
  term.draw_styled(r.row, r.col, clip_to_cells(line, 0, r.width),
                   TextStyle{active ? ColorRole::Accent : ColorRole::Muted, active, false});
}

void Renderer::draw_code_line(ITerminal& term, int row, int col, int width, std::string_view line,
                              const std::vector<HighlightSpan>& spans, int skip,
                              const std::optional<TextRange>& sel, int line_index) {
  size_t pos = grapheme_byte_offset(line, std::max(0, skip));
  int g = std::max(0, skip);
  int used = 0;
  size_t si = 0;
  std::string run;
  TextStyle run_style;
  int run_col = col;
  auto flush = [&] {
    if (run.empty()) return;
    term.draw_styled(row, run_col, run, run_style);
    run_col += text_cells(run);
    run.clear();
  };
  auto selected = [&](Cursor c) { return sel && sel->begin <= c && c < sel->end; };

  while (pos < line.size()) {
    size_t e = next_grapheme_end(line, pos);
    std::string_view gr = line.substr(pos, e - pos);
    int w = display_width(gr);
    if (used + w > width) break;
    while (si < spans.size() && spans[si].end <= pos) si++;
    TokenClass cls = (si < spans.size() && spans[si].begin <= pos) ? spans[si].cls : TokenClass::Plain;
    TextStyle st = style_for(cls);
    if (selected(Cursor{line_index, g})) st.reverse = true;
    if (!run.empty() && !same_style(st, run_style)) flush();
    if (run.empty()) run_style = st;
    append_grapheme(run, gr);
    used += w;
    g++;
    pos = e;
  }
  flush();
  // a selection running past this line covers its line break
  if (sel && sel->begin.row <= line_index && line_index < sel->end.row && pos >= line.size() && used < width) {
    term.draw_styled(row, col + used, " ", TextStyle{ColorRole::Default, false, true});
  }
}

void Renderer::draw_header(ITerminal& term, const Rect& r, const FrameInput& in) {
  if (r.empty()) return;
  std::string badge = " tutor ";
  std::string name = " " + in.exercise.display_name;
  if (in.exercise.display_name != in.exercise.id) name += " (" + in.exercise.id + ")";
  std::string right = "Exercise " + std::to_string(in.state.current + 1) + "/" + std::to_string(in.exercise_count);
  if (in.exercise_done) right += "  ✓ done";
  right += " ";

  term.draw_styled(r.row, r.col, clip_to_cells(badge, 0, r.width), TextStyle{ColorRole::Badge, true, false});
  int col = std::min(r.width, text_cells(badge));
  int right_w = text_cells(right);
  int room = r.width - col - right_w;
  if (room > 0) {
    term.draw_styled(r.row, r.col + col, clip_to_cells(name, 0, room), TextStyle{ColorRole::Default, true, false});
    term.draw_styled(r.row, r.col + r.width - right_w, right,
                     TextStyle{in.exercise_done ? ColorRole::Success : ColorRole::Muted, false, false});
  } else if (r.width > col) {
    term.draw_text(r.row, r.col + col, clip_to_cells(name, 0, r.width - col));
  }
}

void Renderer::draw_editor(ITerminal& term, const Rect& r, const FrameInput& in) {
  if (r.empty()) return;
  const EditorCore& ed = in.state.editor;
  const TextBuffer& buf = ed.buffer();
  std::string title = in.exercise.path.filename().string();
  if (ed.dirty()) title += " [+]";
  draw_title(term, r, title, !in.state.help_visible);

  Rect text = editor_text_area(r, buf.line_count());
  int gw = text.col - r.col;
  const Viewport& vp = in.state.viewport;
  auto sel = ed.selection_range();
  for (int i = 0; i < text.height; ++i) {
    int li = vp.top_line + i;
    int row = text.row + i;
    if (li >= buf.line_count()) {
      if (r.width > 0) term.draw_styled(row, r.col, "~", TextStyle{ColorRole::Muted, false, false});
      continue;
    }
    if (gw > 0) {
      std::string num = std::to_string(li + 1);
      std::string cell(static_cast<size_t>(std::max(0, gw - 1 - static_cast<int>(num.size()))), ' ');
      cell += num + " ";
      bool here = li == ed.cursor().row;
      term.draw_styled(row, r.col, clip_to_cells(cell, 0, gw),
                       TextStyle{here ? ColorRole::Accent : ColorRole::Muted, here, false});
    }
    draw_code_line(term, row, text.col, text.width, buf.line(li), ed.highlight_line(li), vp.left_col, sel, li);
  }
}

void Renderer::draw_solution(ITerminal& term, const Rect& r, const FrameInput& in) {
  if (r.empty()) return;
  draw_title(term, r, "Solution", false);
  const auto& lines = in.state.solution_lines;
  const LanguageSpec& lang = in.state.editor.language();
  int body = pane_body_rows(r);
  int total = static_cast<int>(lines.size());
  int gw = std::min(gutter_width(total), r.width);
  int top = std::clamp(in.state.solution_scroll, 0, std::max(0, total - body));
  HighlightState st;
  for (int li = 0; li < static_cast<int>(lines.size()) && li < top + body; ++li) {
    HighlightedLine hl = highlight_line(lines[li], st, lang);
    st = hl.exit;
    if (li < top) continue;
    int row = r.row + 1 + (li - top);
    std::string num = std::to_string(li + 1);
    std::string cell(static_cast<size_t>(std::max(0, gw - 1 - static_cast<int>(num.size()))), ' ');
    cell += num + " ";
    term.draw_styled(row, r.col, clip_to_cells(cell, 0, gw), TextStyle{ColorRole::Muted, false, false});
    draw_code_line(term, row, r.col + gw, r.width - gw, lines[li], hl.spans, 0, std::nullopt, li);
  }
}

static ColorRole role_for_output(const std::string& line, OutputStyle style) {
  if (line.rfind("✓", 0) == 0) return ColorRole::Success;
  if (line.rfind("✗", 0) == 0) return ColorRole::Error;
  switch (style) {
    case OutputStyle::Hint: return ColorRole::Accent;
    case OutputStyle::Error: return ColorRole::Error;
    case OutputStyle::Info: return ColorRole::Default;
    case OutputStyle::Success:
    case OutputStyle::Failure:
      break;
  }
  if (line.rfind("error", 0) == 0) return ColorRole::Error;
  if (line.rfind("warning", 0) == 0) return ColorRole::Warning;
  return ColorRole::Default;
}

void Renderer::draw_output(ITerminal& term, const Rect& r, const FrameInput& in) {
  if (r.empty()) return;
  const auto& lines = in.state.output;
  int total = static_cast<int>(lines.size());
  int body = pane_body_rows(r);
  int max_scroll = std::max(0, total - body);
  int scroll = std::clamp(in.state.output_scroll, 0, max_scroll);
  std::string title = "Output";
  if (max_scroll > 0) {
    title += " [" + std::to_string(scroll + 1) + "-" + std::to_string(std::min(total, scroll + body)) +
             "/" + std::to_string(total) + "]";
  }
  if (in.state.output_expanded) title += " (Ctrl+O to shrink)";
  draw_title(term, r, title, false);
  for (int i = 0; i < body && scroll + i < total; ++i) {
    const std::string& line = lines[static_cast<size_t>(scroll + i)];
    term.draw_styled(r.row + 1 + i, r.col + 1, clip_to_cells(line, 0, std::max(0, r.width - 1)),
                     TextStyle{role_for_output(line, in.state.output_style), false, false});
  }
}

void Renderer::draw_progress(ITerminal& term, const Rect& r, const FrameInput& in) {
  if (r.empty()) return;
  std::string prefix = " ";
  if (in.state.running()) {
    prefix += std::string(spinner_frame(in.elapsed)) + " checking ";
    if (in.state.verifying) {
      prefix += "all " + std::to_string(*in.state.verifying + 1) + "/" + std::to_string(in.exercise_count) + " ";
    }
  }
  int pw = std::min(r.width, text_cells(prefix));
  term.draw_styled(r.row, r.col, clip_to_cells(prefix, 0, pw), TextStyle{ColorRole::Warning, true, false});
  std::string bar = progress_bar_text(in.done_count, in.exercise_count, r.width - pw, in.elapsed);
  bool all_done = in.exercise_count > 0 && in.done_count == in.exercise_count;
  term.draw_styled(r.row, r.col + pw, bar, TextStyle{all_done ? ColorRole::Success : ColorRole::Accent, false, false});
}

void Renderer::draw_status(ITerminal& term, const Rect& r, const FrameInput& in) {
  if (r.empty()) return;
  const SessionState& s = in.state;
  std::string badge = mode_badge(s.editor.mode());
  term.draw_styled(r.row, r.col, clip_to_cells(badge, 0, r.width), TextStyle{ColorRole::Badge, true, false});
  int col = std::min(r.width, text_cells(badge) + 1);

  Cursor cur = s.editor.cursor();
  std::string right = std::string(s.watch_enabled ? "watch" : "nowatch") + " " +
                      (s.auto_advance ? "auto" : "manual") + "  " +
                      std::to_string(cur.row + 1) + ":" + std::to_string(cur.col + 1) + " ";
  int right_w = text_cells(right);
  bool show_right = r.width - col - right_w > 8;
  int room = std::max(0, r.width - col - (show_right ? right_w + 1 : 0));

  if (s.editor.mode() == Mode::Command) {
    term.draw_text(r.row, r.col + col, clip_to_cells(":" + s.editor.cmdline(), 0, room));
  } else if (!s.status.empty()) {
    term.draw_styled(r.row, r.col + col, clip_to_cells(s.status, 0, room),
                     TextStyle{s.status_error ? ColorRole::Error : ColorRole::Default, false, false});
  }
  if (show_right) {
    term.draw_styled(r.row, r.col + r.width - right_w, right, TextStyle{ColorRole::Muted, false, false});
  }
}

void Renderer::draw_help(ITerminal& term, int rows, int cols) {
  Rect box = centered_rect(rows, cols, 0.6f, 0.7f);
  if (box.width < 4 || box.height < 3) return;
  int inner = box.width - 2;
  TextStyle frame{ColorRole::Accent, true, false};
  std::string top = "┌─ Help ";
  for (int i = text_cells(top); i < box.width - 1; ++i) top += "─";
  top += "┐";
  std::string bottom = "└";
  for (int i = 0; i < inner; ++i) bottom += "─";
  bottom += "┘";
  term.draw_styled(box.row, box.col, clip_to_cells(top, 0, box.width), frame);

  int body_rows = box.height - 2;
  std::vector<std::string> lines(std::begin(kHelpLines), std::end(kHelpLines));
  lines.push_back("");
  // the close hint always keeps the last row
  if (static_cast<int>(lines.size()) >= body_rows) lines.resize(static_cast<size_t>(std::max(0, body_rows - 1)));
  lines.push_back("press any key to close");
  for (int i = 0; i < body_rows; ++i) {
    int row = box.row + 1 + i;
    term.draw_styled(row, box.col, "│", frame);
    std::string body = i < static_cast<int>(lines.size()) ? " " + lines[static_cast<size_t>(i)] : std::string();
    body = clip_to_cells(body, 0, inner);
    body.append(static_cast<size_t>(inner - text_cells(body)), ' ');
    bool heading = !body.empty() && body.size() > 1 && body[1] != ' ';
    term.draw_styled(row, box.col + 1, body, TextStyle{ColorRole::Default, heading, false});
    term.draw_styled(row, box.col + box.width - 1, "│", frame);
  }
  term.draw_styled(box.row + box.height - 1, box.col, bottom, frame);
}

void Renderer::render(ITerminal& term, const FrameInput& in) {
  TermSize sz = term.getSize();
  term.clear();
  FrameLayout f = frame_layout(sz.rows, sz.cols, in.state);
  draw_header(term, f.header, in);
  draw_editor(term, f.editor, in);
  if (in.state.show_solution && !in.state.output_expanded) draw_solution(term, f.solution, in);
  draw_output(term, f.output, in);
  draw_progress(term, f.progress, in);
  draw_status(term, f.status, in);

  const EditorCore& ed = in.state.editor;
  if (in.state.help_visible) {
    draw_help(term, sz.rows, sz.cols);
    term.set_cursor_visible(false);
  } else if (ed.mode() == Mode::Command && !f.status.empty()) {
    int col = text_cells(mode_badge(ed.mode())) + 1 + text_cells(":" + ed.cmdline());
    term.move_cursor(f.status.row, std::min(col, f.status.width - 1));
    term.set_cursor_visible(true);
  } else {
    Rect text = editor_text_area(f.editor, ed.buffer().line_count());
    Cursor cur = ed.cursor();
    const Viewport& vp = in.state.viewport;
    const std::string& line = ed.buffer().line(cur.row);
    int row = text.row + cur.row - vp.top_line;
    size_t from = grapheme_byte_offset(line, vp.left_col);
    size_t to = grapheme_byte_offset(line, cur.col);
    int col = text.col + (to > from ? text_cells(std::string_view(line).substr(from, to - from)) : 0);
    bool inside = !text.empty() && row >= text.row && row < text.bottom() &&
                  cur.col >= vp.left_col && col < text.right();
    if (inside) term.move_cursor(row, col);
    term.set_cursor_visible(inside);
  }
  term.refresh();
}
