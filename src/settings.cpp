#include "settings.hpp"
#include "file_reader.hpp"
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <vector>

static bool parse_positive(const std::vector<std::string>& args, const char* name, long long& out, std::string& msg) {
  if (args.empty()) { msg = std::string("set ") + name + ": use :set " + name + " <number>"; return false; }
  const std::string& s = args[0];
  long long v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) { msg = std::string("set ") + name + ": not a number: " + s; return false; }
  if (v < 1) { msg = std::string("set ") + name + ": must be >= 1"; return false; }
  out = v;
  return true;
}

void register_setting_commands(CommandRegistry& registry, Settings& settings) {
  registry.register_command("set values_cap", [&settings](const std::vector<std::string>& args, std::string& msg) {
    long long v = 0; if (!parse_positive(args, "values_cap", v, msg)) return false;
    settings.values_cap = static_cast<std::size_t>(v); return true;
  });
  registry.register_command("set poll_ms", [&settings](const std::vector<std::string>& args, std::string& msg) {
    long long v = 0; if (!parse_positive(args, "poll_ms", v, msg)) return false;
    settings.poll_ms = static_cast<int>(v); return true;
  });
  registry.register_command("set bins", [&settings](const std::vector<std::string>& args, std::string& msg) {
    long long v = 0; if (!parse_positive(args, "bins", v, msg)) return false;
    settings.hist_bins = static_cast<int>(v); return true;
  });
  registry.register_command("set chunk", [&settings](const std::vector<std::string>& args, std::string& msg) {
    long long v = 0; if (!parse_positive(args, "chunk", v, msg)) return false;
    settings.chunk_elements = static_cast<std::size_t>(v); return true;
  });
  registry.register_command("set jump", [&settings](const std::vector<std::string>& args, std::string& msg) {
    long long v = 0; if (!parse_positive(args, "jump", v, msg)) return false;
    settings.jump_step = static_cast<int>(v); return true;
  });
  registry.register_command("set mouse", [&settings](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { settings.mouse = !settings.mouse; return true; }
    if (args[0] == "on") { settings.mouse = true; return true; }
    if (args[0] == "off") { settings.mouse = false; return true; }
    msg = "set mouse: use :set mouse on|off";
    return false;
  });
  registry.register_command("set log_file", [&settings](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set log_file: use :set log_file <path>"; return false; }
    settings.log_file = args[0];
    return true;
  });
  registry.register_command("set log_level", [&settings](const std::vector<std::string>& args, std::string& msg) {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (!args.empty()) {
      for (const char* l : levels) if (args[0] == l) { settings.log_level = args[0]; return true; }
    }
    msg = "set log_level: use trace|debug|info|warn|error|critical|off";
    return false;
  });
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / H5F_RC_NAME;
}

bool load_rc(const std::filesystem::path& path, Settings& settings, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  CommandRegistry registry;
  register_setting_commands(registry, settings);
  int lineno = 0;
  for (std::string s : lines) {
    lineno++;
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string err;
    if (!registry.execute_line(s, err)) {
      msg = path.filename().string() + ":" + std::to_string(lineno) + ": " + err;
      return false;
    }
  }
  return true;
}
