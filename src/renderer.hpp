#pragma once
/*
 * Renderer
 *
 * Purpose: lay out the widget tree into the terminal and draw one frame plus
 * the status/command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot of the status line from App.
 */
#include <string>
#include "iterminal.hpp"
#include "widget.hpp"

struct StatusInfo {
  std::string mode;      // "TILE", "OMNIBOX", "FIND", "COMMAND"
  std::string location;  // active pane title or uri
  std::string position;  // "2/5" pane index, find counter, ...
  std::string message;
  std::string cmdline;
  bool command_mode = false;
};

class Renderer {
public:
  // layout -> map -> layout, so map handlers that set divider positions are
  // reflected in the same frame
  static void layout_frame(const WidgetPtr& root, const Rect& area);
  void render(ITerminal& term, const WidgetPtr& root, const StatusInfo& status);
  static std::string status_text(const StatusInfo& status);
};
