#include "cmd_registry.hpp"
#include "config.hpp"
#include "input.hpp"
#include "status_log.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void test_apply_setting() {
  Settings s;
  std::string msg;
  assert(apply_setting(s, "hoverdelay", "250", msg));
  assert(s.hover_delay_ms == 250);
  assert(msg == "hoverdelay=250");
  assert(s.hover_delay().count() == 250);

  assert(!apply_setting(s, "hoverdelay", "-1", msg));
  assert(!apply_setting(s, "frame", "0", msg));
  assert(msg.find(">= 1") != std::string::npos);

  assert(apply_setting(s, "mouse", "off", msg));
  assert(!s.enable_mouse);
  assert(apply_setting(s, "mouse", "", msg));
  assert(s.enable_mouse);
  assert(!apply_setting(s, "mouse", "maybe", msg));

  assert(apply_setting(s, "ratio", "0.25", msg));
  assert(s.default_split_ratio == 0.25);
  assert(!apply_setting(s, "ratio", "1.5", msg));
  assert(!apply_setting(s, "ratio", "0.3x", msg));

  assert(!apply_setting(s, "bogus", "1", msg));
  assert(msg == "unknown option: bogus");

  assert(describe_setting(s, "mouse") == "mouse=on");
  assert(describe_setting(s, "hoverdelay") == "hoverdelay=250");
  assert(setting_names().size() == 11);
}

static void test_rc_lines() {
  std::string out;
  assert(!normalize_rc_line("   ", out));
  assert(!normalize_rc_line("# comment", out));
  assert(!normalize_rc_line("\" vim comment", out));
  assert(!normalize_rc_line("// slash comment", out));
  assert(!normalize_rc_line(":", out));
  assert(normalize_rc_line("  :set mouse off  ", out));
  assert(out == "set mouse off");

  auto path = std::filesystem::temp_directory_path() / "mtile_test_rc";
  {
    std::ofstream f(path);
    f << "# settings\n:set hoverdelay=90\n\nset mouse off\r\n";
  }
  std::vector<std::string> cmds;
  std::string msg;
  assert(read_rc_commands(path, cmds, msg));
  assert(cmds.size() == 2);
  assert(cmds[0] == "set hoverdelay=90");
  assert(cmds[1] == "set mouse off");
  std::filesystem::remove(path);

  assert(read_rc_commands(path, cmds, msg));
  assert(cmds.empty());
  assert(msg.empty());
}

static void test_registry() {
  CommandRegistry reg;
  Settings s;
  StatusLog log;
  std::vector<std::string> seen;
  reg.register_command("set", [&](const std::vector<std::string>& a){
    std::string msg;
    bool ok = apply_setting(s, a.at(0), a.size() > 1 ? a[1] : std::string(), msg);
    if (ok) log.info(msg);
    else log.error(msg);
  });
  reg.register_command("split", [&](const std::vector<std::string>& a){ seen = a; });
  reg.alias("sp", "split");
  reg.alias("nothing", "missing");
  assert(reg.has("sp"));
  assert(!reg.has("nothing"));

  std::string msg;
  assert(reg.execute_line("set hoverdelay=40", msg));
  assert(s.hover_delay_ms == 40);
  assert(reg.execute_line("set omniboxmax 3", msg));
  assert(s.omnibox_max_results == 3);
  assert(reg.execute_line("set ratio=2", msg));
  assert(log.error_count() == 1);
  assert(log.current() == "E: set ratio: value must be within 0..1");

  assert(reg.execute_line("sp a.txt b.txt", msg));
  assert((seen == std::vector<std::string>{"a.txt", "b.txt"}));
  assert(reg.execute_line("   ", msg));
  assert(!reg.execute_line("frobnicate", msg));
  assert(msg == "unknown command: frobnicate");
}

static void test_status_log_is_bounded() {
  StatusLog log(3);
  for (int i = 0; i < 5; ++i) log.info("m" + std::to_string(i));
  assert(log.size() == 3);
  assert(log.history().front() == "m2");
  assert(log.current() == "m4");
  log.clear_current();
  assert(log.current().empty());
}

static void test_window_keys() {
  Input in;
  WindowCmd cmd;
  assert(!in.consume_window('v', cmd));
  assert(in.consume_window(kCtrlW, cmd));
  assert(in.window_pending());
  assert(cmd == WindowCmd::None);
  assert(in.consume_window('v', cmd));
  assert(cmd == WindowCmd::SplitVertical);
  assert(!in.window_pending());

  // count between the prefix and the command key
  assert(in.consume_window(kCtrlW, cmd));
  assert(in.consume_window('1', cmd));
  assert(in.consume_window('0', cmd));
  assert(in.consume_window('>', cmd));
  assert(cmd == WindowCmd::GrowWidth);
  assert(in.take_count() == 10);
  assert(!in.has_count());

  assert(!in.consume_digit('0'));
  assert(in.consume_digit('3'));
  in.reset();
  assert(!in.has_count());

  assert(Input::window_cmd_for(kCtrlW) == WindowCmd::FocusNext);
  assert(Input::window_cmd_for('q') == WindowCmd::Close);
  assert(Input::window_cmd_for('K') == WindowCmd::MoveUp);
  assert(Input::window_cmd_for('z') == WindowCmd::None);
}

int main() {
  test_apply_setting();
  test_rc_lines();
  test_registry();
  test_status_log_is_bounded();
  test_window_keys();
  return 0;
}
