#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include <string>
#include <vector>

int main(int argc, char** argv) {
  std::vector<std::string> paths;
  for (int i = 1; i < argc; ++i) paths.emplace_back(argv[i]);
  Settings defaults;
  Terminal term(defaults.frame_interval_ms);
  NcursesTerminal screen;
  MainLoop loop;
  App app(screen, loop, paths);
  app.set_on_settings_changed([&](const Settings& s){
    term.set_frame_timeout(s.frame_interval_ms);
    if (s.enable_mouse != screen.mouse_enabled()) screen.set_mouse(s.enable_mouse);
  });
  app.load_rc(default_rc_path());
  screen.set_mouse(app.settings().enable_mouse);
  term.set_frame_timeout(app.settings().frame_interval_ms);
  app.run();
  return 0;
}
