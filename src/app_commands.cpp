#include "app.hpp"
#include <algorithm>
#include <sstream>

void App::register_commands() {
  registry_.register_command("q", [this](const std::vector<std::string>&){
    close_pane_id(ws_.active_pane_id, true);
  });
  registry_.register_command("q!", [this](const std::vector<std::string>&){ should_quit_ = true; });
  registry_.alias("qa", "q!");
  registry_.register_command("e", [this](const std::vector<std::string>& args){
    if (args.empty()) {
      PaneNode* leaf = find_leaf(ws_.root.get(), ws_.active_pane_id);
      if (leaf && content_.reload(*leaf->pane)) log_.info("reloaded " + leaf->pane->title);
      return;
    }
    open_in_active(args[0]);
  });
  registry_.alias("edit", "e");
  registry_.register_command("split", [this](const std::vector<std::string>& args){
    split_active(SplitDir::Vertical, args.empty() ? std::string() : args[0]);
  });
  registry_.alias("sp", "split");
  registry_.register_command("vsplit", [this](const std::vector<std::string>& args){
    split_active(SplitDir::Horizontal, args.empty() ? std::string() : args[0]);
  });
  registry_.alias("vsp", "vsplit");
  registry_.register_command("stack", [this](const std::vector<std::string>& args){
    stack_active(args.empty() ? std::string() : args[0]);
  });
  registry_.register_command("close", [this](const std::vector<std::string>&){
    close_pane_id(ws_.active_pane_id, false);
  });
  registry_.alias("clo", "close");
  registry_.register_command("move", [this](const std::vector<std::string>& args){
    if (args.empty() || args[0].size() != 1 || std::string("hjkl").find(args[0][0]) == std::string::npos) {
      log_.error("move: use :move h|j|k|l");
      return;
    }
    move_active(args[0][0]);
  });
  registry_.register_command("focus", [this](const std::vector<std::string>& args){
    if (args.empty()) { log_.error("focus: use :focus <pane-id>"); return; }
    keyboard_focus(args[0]);
  });
  registry_.register_command("ratio", [this](const std::vector<std::string>& args){
    if (args.empty()) { log_.error("ratio: use :ratio <0..1>"); return; }
    std::istringstream iss(args[0]);
    double r = 0.0;
    if (!(iss >> r)) { log_.error("ratio: value must be a number"); return; }
    if (set_active_ratio(r)) log_.info("ratio=" + args[0]);
  });
  registry_.register_command("set", [this](const std::vector<std::string>& args){
    if (args.empty()) {
      std::string all;
      for (const auto& n : setting_names()) all += (all.empty() ? "" : "  ") + describe_setting(settings_, n);
      log_.info(all);
      return;
    }
    std::string name = args[0];
    if (!name.empty() && name.back() == '?') {
      log_.info(describe_setting(settings_, name.substr(0, name.size() - 1)));
      return;
    }
    std::string msg;
    if (!apply_setting(settings_, name, args.size() > 1 ? args[1] : std::string(), msg)) { log_.error(msg); return; }
    log_.info(msg);
    settings_changed(name);
  });
  registry_.register_command("messages", [this](const std::vector<std::string>&){
    auto hist = log_.history();
    if (hist.empty()) { log_.info("no messages"); return; }
    size_t from = hist.size() > 5 ? hist.size() - 5 : 0;
    std::string joined;
    for (size_t i = from; i < hist.size(); ++i) joined += (joined.empty() ? "" : " | ") + hist[i];
    log_.info(joined);
  });
  registry_.alias("mes", "messages");
}

void App::settings_changed(const std::string& name) {
  if (name == "ratiodelay" || name == "ratioframes") {
    view_.renderer().set_split_options(
      SplitOptions{std::chrono::milliseconds(settings_.ratio_notify_ms), settings_.max_ratio_retry_frames});
  }
  // pane views and split views read their delays when they are built
  if (name == "hoverdelay" || name == "ratiodelay" || name == "ratioframes") apply_rebuild();
  if (on_settings_changed_) on_settings_changed_(settings_);
}
