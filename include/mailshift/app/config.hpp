/*

config.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Loaders for the run configuration (YAML), the mailbox mapping (JSON or YAML) and the exclude
list. Library exceptions stop here and come out as result errors.

*/


#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <json/json.h>
#include <yaml-cpp/yaml.h>
#include <mailshift/detail/redact.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/migrate/message_id.hpp>
#include <mailshift/store/endpoint.hpp>

namespace mailshift::app
{

struct migration_settings
{
    std::size_t batch_size = 50;
    std::chrono::seconds batch_delay{2};
    std::string archive_prefix = "Migrated/";
    std::chrono::seconds cooldown{3};
};

struct app_config
{
    mailshift::store::endpoint_config source;
    mailshift::store::endpoint_config destination;
    std::string database_path;
    migration_settings migration;
};

namespace detail
{
    inline result<std::string> read_file(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            return fail<std::string>(error_code::config_missing_file, "Cannot open " + path + ".");
        std::ostringstream content;
        content << in.rdbuf();
        return ok(content.str());
    }

    template<typename T>
    result<T> scalar(const YAML::Node& parent, const char* key, const std::string& where, T fallback)
    {
        const YAML::Node node = parent[key];
        if (!node || node.IsNull())
            return ok(std::move(fallback));
        try
        {
            return ok(node.as<T>());
        }
        catch (const YAML::Exception&)
        {
            return fail<T>(error_code::config_invalid_value, "Invalid value for " + where + "." + key + ".");
        }
    }

    inline result<std::string> required_string(const YAML::Node& parent, const char* key, const std::string& where)
    {
        std::string value;
        MAILSHIFT_TRY_ASSIGN(value, scalar<std::string>(parent, key, where, std::string{}));
        if (value.empty())
            return fail<std::string>(error_code::config_invalid_value, "Missing " + where + "." + key + ".");
        return ok(std::move(value));
    }

    inline result<mailshift::store::endpoint_config> parse_endpoint(const YAML::Node& root, const char* section)
    {
        const YAML::Node node = root[section];
        if (!node || !node.IsMap())
            return fail<mailshift::store::endpoint_config>(error_code::config_invalid_value,
                std::string("Missing section ") + section + ".");

        mailshift::store::endpoint_config cfg;
        MAILSHIFT_TRY_ASSIGN(cfg.host, required_string(node, "host", section));
        MAILSHIFT_TRY_ASSIGN(cfg.username, required_string(node, "user", section));
        MAILSHIFT_TRY_ASSIGN(cfg.password, required_string(node, "pass", section));
        MAILSHIFT_TRY_ASSIGN(cfg.secure, scalar<bool>(node, "ssl", section, true));
        MAILSHIFT_TRY_ASSIGN(cfg.starttls, scalar<bool>(node, "starttls", section, false));
        MAILSHIFT_TRY_ASSIGN(cfg.verify, scalar<bool>(node, "verify", section, true));
        MAILSHIFT_TRY_ASSIGN(cfg.ca_file, scalar<std::string>(node, "ca_file", section, std::string{}));

        int port = 0;
        MAILSHIFT_TRY_ASSIGN(port, scalar<int>(node, "port", section, 0));
        if (port < 0 || port > 65535)
            return fail<mailshift::store::endpoint_config>(error_code::config_invalid_value,
                std::string("Port out of range in ") + section + ".");
        if (port != 0)
            cfg.port = static_cast<unsigned short>(port);

        int timeout = 0;
        MAILSHIFT_TRY_ASSIGN(timeout, scalar<int>(node, "timeout", section, 0));
        if (timeout < 0)
            return fail<mailshift::store::endpoint_config>(error_code::config_invalid_value,
                std::string("Negative timeout in ") + section + ".");
        if (timeout > 0)
            cfg.timeout = std::chrono::seconds{timeout};
        return ok(std::move(cfg));
    }

    inline result<migration_settings> parse_migration(const YAML::Node& root)
    {
        migration_settings settings;
        const YAML::Node node = root["migration"];
        if (!node || node.IsNull())
            return ok(std::move(settings));
        if (!node.IsMap())
            return fail<migration_settings>(error_code::config_invalid_value, "Section migration is not a map.");

        int batch_size = 0;
        MAILSHIFT_TRY_ASSIGN(batch_size, scalar<int>(node, "batch_size", "migration", 50));
        if (batch_size <= 0)
            return fail<migration_settings>(error_code::config_invalid_value, "migration.batch_size must be positive.");
        settings.batch_size = static_cast<std::size_t>(batch_size);

        int delay = 0;
        MAILSHIFT_TRY_ASSIGN(delay, scalar<int>(node, "batch_delay", "migration", 2));
        int cooldown = 0;
        MAILSHIFT_TRY_ASSIGN(cooldown, scalar<int>(node, "cooldown", "migration", 3));
        if (delay < 0 || cooldown < 0)
            return fail<migration_settings>(error_code::config_invalid_value, "Negative delay in migration.");
        settings.batch_delay = std::chrono::seconds{delay};
        settings.cooldown = std::chrono::seconds{cooldown};
        MAILSHIFT_TRY_ASSIGN(settings.archive_prefix, scalar<std::string>(node, "archive_prefix", "migration",
            settings.archive_prefix));
        return ok(std::move(settings));
    }

    inline result<std::map<std::string, std::string>> parse_json_mapping(const std::string& text, const std::string& path)
    {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream in(text);
        if (!Json::parseFromStream(builder, in, &root, &errors))
            return fail<std::map<std::string, std::string>>(error_code::config_parse_error,
                "Cannot parse " + path + ".", errors);
        if (!root.isObject())
            return fail<std::map<std::string, std::string>>(error_code::config_invalid_value,
                "Mapping " + path + " is not an object.");

        std::map<std::string, std::string> mapping;
        for (const auto& name : root.getMemberNames())
        {
            const Json::Value& value = root[name];
            if (!value.isString())
                return fail<std::map<std::string, std::string>>(error_code::config_invalid_value,
                    "Mapping of " + name + " is not a string.");
            mapping[name] = value.asString();
        }
        return ok(std::move(mapping));
    }

    inline result<std::map<std::string, std::string>> parse_yaml_mapping(const std::string& text, const std::string& path)
    {
        try
        {
            const YAML::Node root = YAML::Load(text);
            std::map<std::string, std::string> mapping;
            if (root.IsNull())
                return ok(std::move(mapping));
            if (!root.IsMap())
                return fail<std::map<std::string, std::string>>(error_code::config_invalid_value,
                    "Mapping " + path + " is not a map.");
            for (const auto& item : root)
                mapping[item.first.as<std::string>()] = item.second.as<std::string>();
            return ok(std::move(mapping));
        }
        catch (const YAML::Exception& exc)
        {
            return fail<std::map<std::string, std::string>>(error_code::config_parse_error,
                "Cannot parse " + path + ".", exc.what());
        }
    }
} // namespace detail

/// Parsing a YAML configuration document.
[[nodiscard]] inline result<app_config> parse_config(const std::string& text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(text);
    }
    catch (const YAML::Exception& exc)
    {
        return fail<app_config>(error_code::config_parse_error, "Cannot parse configuration.", exc.what());
    }
    if (!root.IsMap())
        return fail<app_config>(error_code::config_invalid_value, "Configuration is not a map.");

    app_config cfg;
    MAILSHIFT_TRY_ASSIGN(cfg.source, detail::parse_endpoint(root, "source"));
    MAILSHIFT_TRY_ASSIGN(cfg.destination, detail::parse_endpoint(root, "destination"));

    const YAML::Node database = root["database"];
    if (!database || !database.IsMap())
        return fail<app_config>(error_code::config_invalid_value, "Missing section database.");
    MAILSHIFT_TRY_ASSIGN(cfg.database_path, detail::required_string(database, "path", "database"));

    MAILSHIFT_TRY_ASSIGN(cfg.migration, detail::parse_migration(root));
    return ok(std::move(cfg));
}

[[nodiscard]] inline result<app_config> load_config(const std::string& path)
{
    std::string text;
    MAILSHIFT_TRY_ASSIGN(text, detail::read_file(path));
    return parse_config(text);
}

/**
Loading a source to destination mailbox mapping.

@param path `.json`, `.yml` or `.yaml` file holding one object of names.
@return     The mapping, or a configuration error (unknown extensions included).
**/
[[nodiscard]] inline result<std::map<std::string, std::string>> load_mapping(const std::string& path)
{
    const std::string ext = std::filesystem::path(path).extension().string();
    const bool json = mailshift::detail::iequals_ascii(ext, ".json");
    if (!json && !mailshift::detail::iequals_ascii(ext, ".yml") && !mailshift::detail::iequals_ascii(ext, ".yaml"))
        return fail<std::map<std::string, std::string>>(error_code::config_invalid_value,
            "Unsupported mapping file type: " + path + ".");

    std::string text;
    MAILSHIFT_TRY_ASSIGN(text, detail::read_file(path));
    if (json)
        return detail::parse_json_mapping(text, path);
    return detail::parse_yaml_mapping(text, path);
}

/// Mailbox names of an exclude list: one per line, trimmed, blank lines ignored.
[[nodiscard]] inline std::set<std::string> parse_exclude_list(std::string_view text)
{
    std::set<std::string> names;
    std::size_t pos = 0;
    while (pos <= text.size())
    {
        auto eol = text.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = text.size();
        const std::string_view name = mailshift::migrate::detail::trim_ws(text.substr(pos, eol - pos));
        if (!name.empty())
            names.emplace(name);
        pos = eol + 1;
    }
    return names;
}

[[nodiscard]] inline result<std::set<std::string>> load_exclude_list(const std::string& path)
{
    std::string text;
    MAILSHIFT_TRY_ASSIGN(text, detail::read_file(path));
    return ok(parse_exclude_list(text));
}

} // namespace mailshift::app
