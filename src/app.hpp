#pragma once
/*
 * App
 *
 * Purpose: the mtile application: owns the Workspace (domain tree), the
 * WorkspaceView that renders it, the content/suggestion collaborators and the
 * frame loop (posted tasks, timers, frame ticks, render, input).
 * Modes: Tile (Ctrl-W window commands, scrolling), Command (":" line),
 * Omnibox and Find (keys go to the overlay).
 * Structure changes (split, stack, close, move) edit the Workspace and then
 * rebuild the view; focus and divider changes go to the view directly.
 */
#include "cmd_registry.hpp"
#include "config.hpp"
#include "document_content.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "pane_tree.hpp"
#include "renderer.hpp"
#include "scheduler.hpp"
#include "status_log.hpp"
#include "suggestion_source.hpp"
#include "term_widgets.hpp"
#include "workspace_view.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class AppMode { Tile, Command, Omnibox, Find };

struct PointerEvent {
  enum class Kind { Motion, Press, WheelUp, WheelDown };
  Kind kind = Kind::Motion;
  int row = 0;
  int col = 0;
};

class App {
public:
  App(ITerminal& term, MainLoop& loop, const std::vector<std::string>& paths,
      std::filesystem::path base_dir = std::filesystem::current_path());
  ~App();
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // blocking ncurses loop; returns when the last pane is closed or on :q
  void run();
  // one frame: posted tasks and due timers, frame tick, render
  void frame();
  void handle_input(int ch);
  void handle_pointer(const PointerEvent& ev);
  bool execute(const std::string& cmdline);
  void load_rc(const std::filesystem::path& path);

  // invoked after ":set" so the backend can follow mouse/frame changes
  void set_on_settings_changed(std::function<void(const Settings&)> fn) { on_settings_changed_ = std::move(fn); }

  bool should_quit() const { return should_quit_; }
  AppMode mode() const { return mode_; }
  const std::string& cmdline() const { return cmdline_; }
  const Settings& settings() const { return settings_; }
  StatusLog& log() { return log_; }
  Workspace& workspace() { return ws_; }
  WorkspaceView& view() { return view_; }
  DocumentContent& content() { return content_; }
  PathSuggestionSource& suggestions() { return *suggestions_; }
  BackgroundWorker& worker() { return worker_; }
  StatusInfo status() const;

  // domain operations; each reports failures to the status log
  bool split_active(SplitDir dir, const std::string& uri);
  bool stack_active(const std::string& uri);
  bool close_pane_id(const std::string& pane_id, bool quit_if_last);
  bool move_active(char dir);
  bool open_in_active(const std::string& uri);
  bool drag_divider(char key, int steps);
  bool set_active_ratio(double ratio);
  void focus_next_pane();
  void focus_direction(char dir);
  void stack_navigate(bool forward);

private:
  std::shared_ptr<Pane> new_pane(const std::string& uri);
  void apply_rebuild();
  void register_commands();
  void handle_tile_input(int ch);
  void handle_command_input(int ch);
  void handle_omnibox_input(int ch);
  void handle_find_input(int ch);
  void execute_cmdline();
  void keyboard_focus(const std::string& pane_id);
  void on_navigate(const std::string& pane_id, const std::string& target);
  void on_ratio_dragged(const std::string& node_id, double ratio);
  PaneNode* enclosing_split(const std::string& pane_id, SplitDir dir, bool& in_start);
  // nearest visible pane whose center lies in direction h/j/k/l; empty if none
  std::string pane_in_direction(char dir) const;
  std::string resolve_uri(const std::string& target) const;
  std::shared_ptr<TermTextView> active_text_view() const;
  TermNode* root_node() const;
  void settings_changed(const std::string& name);

  Settings settings_;
  StatusLog log_;
  MainLoop& loop_;
  ITerminal& term_;
  std::filesystem::path base_dir_;
  TermWidgetFactory factory_;
  DocumentContent content_;
  std::shared_ptr<PathSuggestionSource> suggestions_;
  BackgroundWorker worker_;
  Workspace ws_;
  WorkspaceView view_;
  Renderer renderer_;
  CommandRegistry registry_;
  Input input_;
  PointerTracker pointer_;

  AppMode mode_ = AppMode::Tile;
  std::string cmdline_;
  bool should_quit_ = false;
  int next_pane_ = 1;
  std::function<void(const Settings&)> on_settings_changed_;
};
