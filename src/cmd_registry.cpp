#include "cmd_registry.hpp"
#include <sstream>

bool CommandRegistry::execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
  auto it = map_.find(name);
  if (it == map_.end()) { msg = "unknown command: " + name; return false; }
  return it->second(args, msg);
}

bool CommandRegistry::execute_line(const std::string& line, std::string& msg) const {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return execute("set " + name, subargs, msg);
  }
  return execute(cmd, args, msg);
}
