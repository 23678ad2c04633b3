#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace bumv {

// One invocation's configuration, threaded explicitly through every stage
struct Config {
  std::filesystem::path base_path{"."};
  bool recursive = false;  // descend into subdirectories
  bool no_ignore = false;  // list hidden and ignored files too
  bool no_log = false;     // skip writing the bumv_<timestamp>.log file
  bool use_vscode = false; // force `code --wait` as editor
  bool assume_yes = false; // do not prompt before renaming
  std::string editor;      // from the settings file; empty if unset
};

// $XDG_CONFIG_HOME/bumv/config, else $HOME/.config/bumv/config; nullopt if neither is set
auto settings_path() -> std::optional<std::filesystem::path>;

// Apply `key: value` lines from `path` onto `cfg`. A missing file is not an error.
void load_settings(const std::filesystem::path& path, Config& cfg);

// Pick the editor command: --vscode, settings `editor:`, $VISUAL, $EDITOR, then `code`
auto resolve_editor(const Config& cfg) -> std::string;

} // namespace bumv
