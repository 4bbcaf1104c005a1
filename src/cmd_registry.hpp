#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch ex-commands (":split foo", ":set mouse off").
 * Design: map name → handler (args vector). "set x=y" / "set x y" is routed
 * to the handler registered under "set" with {x, y}.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <sstream>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void alias(const std::string& name, const std::string& target) {
    auto it = map_.find(target);
    if (it != map_.end()) map_[name] = it->second;
  }
  bool has(const std::string& name) const { return map_.count(name) > 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  // Parses one command line; msg is set only when the command is unknown.
  bool execute_line(const std::string& line, std::string& msg) const {
    std::istringstream iss(line);
    std::string cmd; iss >> cmd;
    if (cmd.empty()) return true;
    std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
    if (cmd == "set" && !args.empty()) {
      size_t eq = args[0].find('=');
      if (eq != std::string::npos) {
        std::string value = args[0].substr(eq + 1);
        args[0] = args[0].substr(0, eq);
        args.insert(args.begin() + 1, value);
      }
    }
    if (!execute(cmd, args)) { msg = "unknown command: " + cmd; return false; }
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
