#include "bumv/config.hpp"

#include "bumv/consts.hpp"
#include "bumv/fs.hpp"
#include "bumv/util.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

const char *env_or_null(const char *name) {
  const char *v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

bool parse_flag(std::string_view key, std::string_view value, const std::filesystem::path &path) {
  if (auto b = bumv::strutil::parse_bool(value))
    return *b;
  throw std::runtime_error(path.string() + ": bad boolean for '" + std::string(key) +
                           "': " + std::string(value));
}

} // namespace

namespace bumv {

std::optional<std::filesystem::path> settings_path() {
  if (const char *xdg = env_or_null("XDG_CONFIG_HOME"))
    return std::filesystem::path(xdg) / consts::kConfigDir / consts::kConfigFile;
  if (const char *home = env_or_null("HOME"))
    return std::filesystem::path(home) / ".config" / consts::kConfigDir / consts::kConfigFile;
  return std::nullopt;
}

void load_settings(const std::filesystem::path &path, Config &cfg) {
  if (!fs::exists(path))
    return;

  std::istringstream iss(fs::read_text(path));
  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(consts::kKeyEditor)) {
      cfg.editor = strutil::trim(sv.substr(consts::kKeyEditor.size()));
    } else if (sv.starts_with(consts::kKeyRecursive)) {
      cfg.recursive =
          parse_flag(consts::kKeyRecursive, sv.substr(consts::kKeyRecursive.size()), path);
    } else if (sv.starts_with(consts::kKeyNoIgnore)) {
      cfg.no_ignore =
          parse_flag(consts::kKeyNoIgnore, sv.substr(consts::kKeyNoIgnore.size()), path);
    } else if (sv.starts_with(consts::kKeyNoLog)) {
      cfg.no_log = parse_flag(consts::kKeyNoLog, sv.substr(consts::kKeyNoLog.size()), path);
    }
  }
}

std::string resolve_editor(const Config &cfg) {
  if (cfg.use_vscode)
    return std::string(consts::kVsCode);
  if (!cfg.editor.empty())
    return cfg.editor;
  if (const char *visual = env_or_null("VISUAL"))
    return visual;
  if (const char *editor = env_or_null("EDITOR"))
    return editor;
  return std::string(consts::kDefaultEditor);
}

} // namespace bumv
