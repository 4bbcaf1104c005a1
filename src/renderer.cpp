#include "renderer.hpp"
#include "term_widgets.hpp"
#include <algorithm>
#include <sstream>

void Renderer::layout_frame(const WidgetPtr& root, const Rect& area) {
  TermNode* n = term_node(root.get());
  if (!n) return;
  n->layout(area);
  n->sync_mapped(true);
  n->layout(area);
}

std::string Renderer::status_text(const StatusInfo& status) {
  if (status.command_mode) {
    if (!status.cmdline.empty() && (status.cmdline[0] == '/' || status.cmdline[0] == '?')) return status.cmdline;
    return ":" + status.cmdline;
  }
  std::ostringstream oss;
  oss << (status.mode.empty() ? "TILE" : status.mode) << "  "
      << (status.location.empty() ? "[no pane]" : status.location);
  if (!status.position.empty()) oss << "  " << status.position;
  if (!status.message.empty()) oss << "  | " << status.message;
  return oss.str();
}

void Renderer::render(ITerminal& term, const WidgetPtr& root, const StatusInfo& status) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }
  int body_rows = std::max(0, rows - 1);
  layout_frame(root, Rect{0, 0, body_rows, cols});
  if (TermNode* n = term_node(root.get())) {
    if (n->node_visible()) n->draw(term);
  }
  std::string line = status_text(status);
  if (static_cast<int>(line.size()) > cols) line.resize(cols);
  term.draw_text(rows - 1, 0, line);
  term.clear_to_eol(rows - 1, static_cast<int>(line.size()));
  if (status.command_mode) {
    term.move_cursor(rows - 1, std::min(cols - 1, static_cast<int>(line.size())));
  } else {
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}
