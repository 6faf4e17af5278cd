#include <ghostcomment/config.hpp>
#include <ghostcomment/scanner.hpp>
#include <ghostcomment/log.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace ghostcomment {

namespace fs = std::filesystem;

static Result<std::vector<std::string>> string_array(const toml::table& doc,
                                                     const char* key) {
    auto* arr = doc[key].as_array();
    if (!arr) {
        return GcError{GcError::Config,
            std::string("'") + key + "' must be an array of strings"};
    }
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return GcError{GcError::Config,
                std::string("'") + key + "' must contain only strings"};
        }
        out.push_back(std::string(*s));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<ScanConfig> parse_config(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GcError{GcError::Config, "config TOML parse error"}
            .caused_by(e.what());
    }

    ScanConfig cfg = ScanConfig::defaults();

    if (doc.contains("prefix")) {
        auto v = doc["prefix"].value<std::string>();
        if (!v) {
            return GcError{GcError::Config, "'prefix' must be a string"};
        }
        cfg.prefix = std::string(*v);
    }

    if (doc.contains("include")) {
        auto r = string_array(doc, "include");
        GC_TRY(r);
        cfg.include = std::move(r).value();
    }

    if (doc.contains("exclude")) {
        auto r = string_array(doc, "exclude");
        GC_TRY(r);
        cfg.exclude = std::move(r).value();
    }

    if (doc.contains("fail-on-found")) {
        auto v = doc["fail-on-found"].value<bool>();
        if (!v) {
            return GcError{GcError::Config, "'fail-on-found' must be a boolean"};
        }
        cfg.fail_on_found = *v;
    }

    for (const auto& [key, val] : doc) {
        std::string k(key);
        if (k != "prefix" && k != "include" && k != "exclude" && k != "fail-on-found") {
            log::warn("ignoring unknown config key '%s'", k.c_str());
        }
    }

    return Result<ScanConfig>::ok(std::move(cfg));
}

Result<ScanConfig> load_config(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return GcError{GcError::File,
            "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = parse_config(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path.string();
    }
    return cfg;
}

std::optional<fs::path> find_config_file(const fs::path& root) {
    for (const char* name : kConfigFileNames) {
        std::error_code ec;
        auto candidate = root / name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<ScanConfig> discover_config(const fs::path& root,
                                   const std::string& explicit_path) {
    std::optional<fs::path> path;
    if (!explicit_path.empty()) {
        path = fs::path(explicit_path);
    } else if (const char* env = std::getenv("GC_CONFIG_PATH"); env && *env) {
        path = fs::path(env);
    } else {
        path = find_config_file(root);
    }

    ScanConfig cfg = ScanConfig::defaults();
    if (path) {
        log::debug("loading config from %s", path->c_str());
        auto loaded = load_config(*path);
        GC_TRY(loaded);
        cfg = std::move(loaded).value();
    } else {
        log::debug("no config file found in %s, using defaults", root.c_str());
    }

    GC_TRY(validate_scan_config(cfg));
    return Result<ScanConfig>::ok(std::move(cfg));
}

bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return false;
    std::string s(v);
    return s == "1" || s == "true" || s == "yes";
}

} // namespace ghostcomment
