#include <ulid/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ulid {

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Hex:  return "hex";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Parse,
            std::string("config TOML parse error: ") + e.what(), "", "",
            static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.color = *v;
            cfg.color_set = true;
        }
    }

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto v = (*gen)["count"].value<int64_t>()) {
            if (*v < 1 || *v > MAX_GENERATE_COUNT) {
                return UlidError{UlidError::Config,
                    "generate.count must be between 1 and " + std::to_string(MAX_GENERATE_COUNT),
                    "got " + std::to_string(*v)};
            }
            cfg.generate_count = static_cast<int>(*v);
            cfg.generate_count_set = true;
        }
        if (auto v = (*gen)["format"].value<std::string>()) {
            if (*v == "text") {
                cfg.format = OutputFormat::Text;
            } else if (*v == "hex") {
                cfg.format = OutputFormat::Hex;
            } else {
                return UlidError{UlidError::Config,
                    "unknown generate.format '" + *v + "'",
                    "expected \"text\" or \"hex\""};
            }
            cfg.format_set = true;
        }
    }

    // [store] section
    if (auto st = doc["store"].as_table()) {
        if (auto v = (*st)["path"].value<std::string>()) {
            cfg.store_path = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.generate_count_set) {
        generate_count = other.generate_count;
        generate_count_set = true;
    }
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
    if (!other.store_path.empty()) {
        store_path = other.store_path;
    }
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.ulid/config.toml";
}

} // namespace ulid
