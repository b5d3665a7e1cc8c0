/*

config.cpp
----------

Copyright (C) 2026, gmcli contributors.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <filesystem>
#include <fstream>
#include <string>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <gmcli/config.hpp>


using std::string;
using std::ifstream;
using std::istream;
using std::chrono::milliseconds;
using boost::property_tree::ptree;
using boost::property_tree::ptree_bad_data;
using boost::property_tree::json_parser::json_parser_error;
namespace fs = std::filesystem;


namespace gmcli
{


const string CONFIG_FILE_NAME{"gmail_config.json"};


namespace
{

string required_string(const ptree& tree, const string& key, const string& source)
{
    auto value = tree.get_optional<string>(key);
    if (!value || value->empty())
        throw config_error("Missing configuration key.", "Key=`" + key + "` in `" + source + "`.");
    return *value;
}


template<typename T>
T optional_value(const ptree& tree, const string& key, const T& default_value, const string& source)
{
    try
    {
        auto child = tree.get_child_optional(key);
        if (!child)
            return default_value;
        return child->get_value<T>();
    }
    catch (const ptree_bad_data& exc)
    {
        throw config_error("Invalid configuration value.", "Key=`" + key + "` in `" + source + "`: " + exc.what());
    }
}

} // anonymous namespace


config_t load_config(const string& path)
{
    ifstream input(path);
    if (!input)
        throw config_error("Configuration file not found.", "Path=`" + path + "`.");
    return parse_config(input, path);
}


config_t parse_config(istream& input, const string& source)
{
    ptree tree;
    try
    {
        boost::property_tree::read_json(input, tree);
    }
    catch (const json_parser_error& exc)
    {
        throw config_error("Malformed configuration file.", exc.what());
    }

    config_t cfg;
    cfg.credentials.address = required_string(tree, "email", source);
    cfg.credentials.secret = required_string(tree, "app_password", source);
    cfg.imap_server.host = optional_value<string>(tree, "imap_host", cfg.imap_server.host, source);
    cfg.imap_server.port = optional_value<unsigned>(tree, "imap_port", cfg.imap_server.port, source);
    cfg.smtp_server.host = optional_value<string>(tree, "smtp_host", cfg.smtp_server.host, source);
    cfg.smtp_server.port = optional_value<unsigned>(tree, "smtp_port", cfg.smtp_server.port, source);
    cfg.timeout = milliseconds(optional_value<unsigned long>(tree, "timeout_ms", 0, source));

    string level_name = optional_value<string>(tree, "log_level", log_level_name(cfg.log_level), source);
    auto level = parse_log_level(level_name);
    if (!level.has_value())
        throw config_error("Invalid configuration value.", "Key=`log_level` in `" + source + "`: unknown level `" + level_name + "`.");
    cfg.log_level = *level;
    return cfg;
}


string default_config_path(const string& argv0)
{
    if (!argv0.empty())
    {
        std::error_code ec;
        fs::path beside = fs::path(argv0).parent_path() / CONFIG_FILE_NAME;
        if (fs::exists(beside, ec))
            return beside.string();
    }
    return (fs::path(".") / CONFIG_FILE_NAME).string();
}


config_error::config_error(const string& msg, const string& details) : std::runtime_error(msg), details_(details)
{
}


string config_error::details() const
{
    return details_;
}


} // namespace gmcli
