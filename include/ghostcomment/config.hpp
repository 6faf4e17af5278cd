#pragma once

#include <ghostcomment/comment.hpp>
#include <ghostcomment/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace ghostcomment {

// Config files looked up in the project root, in order
constexpr const char* kConfigFileNames[] = {".ghostcomment.toml", ".ghostcommentrc"};

// Parse a TOML config. Keys: prefix, include, exclude, fail-on-found.
// Missing keys keep ScanConfig::defaults(). The result is not validated.
Result<ScanConfig> parse_config(const std::string& toml_str);

// Load and parse a TOML config file
Result<ScanConfig> load_config(const std::filesystem::path& path);

// First existing kConfigFileNames entry under root, if any
std::optional<std::filesystem::path> find_config_file(const std::filesystem::path& root);

// Resolve the effective config for a project root:
// explicit path > $GC_CONFIG_PATH > discovered file > defaults.
// The returned config has passed validate_scan_config.
Result<ScanConfig> discover_config(const std::filesystem::path& root,
                                   const std::string& explicit_path = "");

// True if the environment variable is set to 1/true/yes
bool env_flag(const char* name);

} // namespace ghostcomment
