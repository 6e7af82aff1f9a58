// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/config.hpp"

// stdc++
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

// toml++
#include <toml++/toml.h>

// application
#include "gscope/log.hpp"
#include "gscope/settings.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

std::string toupper(std::string&& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

/**************************************************************************************************/

template <typename T>
T parse_enval(std::string&& x);

template <>
std::string parse_enval(std::string&& x) {
    return x;
}

template <>
bool parse_enval(std::string&& x) {
    return x != "0" && toupper(std::move(x)) != "FALSE";
}

template <>
int parse_enval(std::string&& x) {
    return std::atoi(x.c_str());
}

template <>
std::size_t parse_enval(std::string&& x) {
    return std::max<int>(std::atoi(x.c_str()), 0);
}

/**************************************************************************************************/
// Value from the config file if it is there, else `fallback`. An environment variable named
// `GSCOPE_<KEY>` trumps both.
template <typename T>
T derive_configuration(const char* key, const toml::table& config, T&& fallback) {
    T result = config[key].value_or(fallback);
    std::string envar = toupper(std::string("GSCOPE_") + key);
    if (const char* enval = std::getenv(envar.c_str())) {
        result = parse_enval<T>(enval);
    }
    return result;
}

/**************************************************************************************************/

void apply_configuration(const toml::table& config) {
    auto& app_settings = settings::instance();
    const settings defaults;

    const std::string log_level =
        derive_configuration("log_level", config, std::string("warning"));

    if (log_level == "silent") {
        app_settings._log_level = settings::log_level::silent;
    } else if (log_level == "warning") {
        app_settings._log_level = settings::log_level::warning;
    } else if (log_level == "info") {
        app_settings._log_level = settings::log_level::info;
    } else if (log_level == "verbose") {
        app_settings._log_level = settings::log_level::verbose;
    } else {
        // not a known value. Switch to verbose!
        app_settings._log_level = settings::log_level::verbose;
        cout_safe([&](auto& s) {
            s << "warning: unknown log_level '" << log_level << "'; using verbose\n";
        });
    }

    app_settings._parallel_processing =
        derive_configuration("parallel_processing", config, bool(defaults._parallel_processing));
    app_settings._max_goroutines =
        derive_configuration("max_goroutines", config, std::size_t(defaults._max_goroutines));
    app_settings._follow_pointers =
        derive_configuration("follow_pointers", config, bool(defaults._follow_pointers));
    app_settings._max_variable_recurse =
        derive_configuration("max_variable_recurse", config, int(defaults._max_variable_recurse));
    app_settings._max_string_len =
        derive_configuration("max_string_len", config, int(defaults._max_string_len));
    app_settings._max_array_values =
        derive_configuration("max_array_values", config, int(defaults._max_array_values));
    app_settings._max_struct_fields =
        derive_configuration("max_struct_fields", config, int(defaults._max_struct_fields));

    if (app_settings._max_variable_recurse < 0) {
        if (log_level_at_least(settings::log_level::warning)) {
            cout_safe([&](auto& s) {
                s << "warning: negative max_variable_recurse; using 0\n";
            });
        }
        app_settings._max_variable_recurse = 0;
    }
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

void process_configuration_file(const std::filesystem::path& path) {
    toml::table config;

    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        cerr_safe([&](auto& s) { s << "Parsing failed:\n" << err << "\n"; });
        throw std::runtime_error("configuration parsing error");
    }

    apply_configuration(config);

    if (log_level_at_least(settings::log_level::info)) {
        cout_safe([&](auto& s) { s << "info: gscope config file: " << path.string() << "\n"; });
    }
}

/**************************************************************************************************/

std::filesystem::path process_configuration(const std::filesystem::path& start) {
    std::filesystem::path dir(std::filesystem::absolute(start));
    std::filesystem::path config_path;

    // run up the directories looking for the first instance of .gscope-config or _gscope-config
    while (true) {
        std::filesystem::path candidate = dir / ".gscope-config";

        if (exists(candidate)) {
            config_path = std::move(candidate);
            break;
        }

        candidate = dir / "_gscope-config";

        if (exists(candidate)) {
            config_path = std::move(candidate);
            break;
        }

        std::filesystem::path parent = dir.parent_path();

        if (parent == dir) {
            break;
        }

        dir = std::move(parent);
    }

    if (config_path.empty()) {
        if (log_level_at_least(settings::log_level::info)) {
            cout_safe([&](auto& s) { s << "info: gscope config file: not found\n"; });
        }
        // environment overrides still apply.
        apply_configuration(toml::table{});
        return config_path;
    }

    process_configuration_file(config_path);

    return config_path;
}

/**************************************************************************************************/

load_config default_load_config() {
    const auto& app_settings = settings::instance();
    load_config result;
    result._follow_pointers = app_settings._follow_pointers;
    result._max_variable_recurse = app_settings._max_variable_recurse;
    result._max_string_len = app_settings._max_string_len;
    result._max_array_values = app_settings._max_array_values;
    result._max_struct_fields = app_settings._max_struct_fields;
    return result;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
