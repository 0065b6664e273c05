// Settings file handling
#include "json_pager_config.hpp"

#include "json_pager_search.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

using json = nlohmann::json;

static const char *const kConfigFileName = "config.json";

static std::string getHomeDirPath()
{
    const char *home = std::getenv("HOME");
    if (home != nullptr && *home)
        return home;
    const passwd *entry = getpwuid(getuid());
    if (entry != nullptr)
        return entry->pw_dir;
    return std::string();
}

static std::string getConfigDirPath()
{
    std::string root;
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && *xdg)
    {
        root = xdg;
    }
    else
    {
        const std::string home = getHomeDirPath();
        if (home.empty())
            return std::string();
        root = home + "/.config";
    }
    return root + "/json-pager";
}

std::string defaultConfigPath()
{
    const std::string dir = getConfigDirPath();
    if (dir.empty())
        return std::string();
    return dir + "/" + kConfigFileName;
}

const std::vector<std::string> &colorRoles()
{
    static const std::vector<std::string> roles = {
        "punctuation", "key", "string", "number", "boolean", "null",
        "annotation", "search_match", "current_match", "cursor", "status_bar"};
    return roles;
}

bool colorFromName(const std::string &name, int &color)
{
    static const std::map<std::string, int> names = {
        {"default", -1}, {"black", 0}, {"red", 1}, {"green", 2}, {"yellow", 3},
        {"blue", 4}, {"magenta", 5}, {"cyan", 6}, {"white", 7}};
    auto it = names.find(name);
    if (it == names.end())
        return false;
    color = it->second;
    return true;
}

static void readInt(const json &config, const char *key, int minValue, int maxValue, int &target,
                    std::vector<std::string> &warnings)
{
    auto it = config.find(key);
    if (it == config.end())
        return;
    if (!it->is_number_integer() || it->get<long long>() < minValue || it->get<long long>() > maxValue)
    {
        warnings.push_back(std::string("ignoring invalid ") + key + ": " + it->dump());
        return;
    }
    target = it->get<int>();
}

static void readBool(const json &config, const char *key, bool &target, std::vector<std::string> &warnings)
{
    auto it = config.find(key);
    if (it == config.end())
        return;
    if (!it->is_boolean())
    {
        warnings.push_back(std::string("ignoring invalid ") + key + ": " + it->dump());
        return;
    }
    target = it->get<bool>();
}

// Looks up a string setting restricted to the names in `options`.
template <typename V>
static void readEnum(const json &config, const char *key, const std::map<std::string, V> &options, V &target,
                     std::vector<std::string> &warnings)
{
    auto it = config.find(key);
    if (it == config.end())
        return;
    if (it->is_string())
    {
        auto option = options.find(it->get<std::string>());
        if (option != options.end())
        {
            target = option->second;
            return;
        }
    }
    warnings.push_back(std::string("ignoring invalid ") + key + ": " + it->dump());
}

static void readString(const json &config, const char *key, std::string &target, std::vector<std::string> &warnings)
{
    auto it = config.find(key);
    if (it == config.end())
        return;
    if (!it->is_string())
    {
        warnings.push_back(std::string("ignoring invalid ") + key + ": " + it->dump());
        return;
    }
    target = it->get<std::string>();
}

static void readColors(const json &config, Settings &settings)
{
    auto it = config.find("colors");
    if (it == config.end())
        return;
    if (!it->is_object())
    {
        settings.warnings.push_back("ignoring invalid colors: expected an object");
        return;
    }
    const std::vector<std::string> &roles = colorRoles();
    for (auto entry = it->begin(); entry != it->end(); ++entry)
    {
        int color = 0;
        bool knownRole = std::find(roles.begin(), roles.end(), entry.key()) != roles.end();
        if (!knownRole)
        {
            settings.warnings.push_back("ignoring unknown color role " + entry.key());
            continue;
        }
        if (!entry->is_string() || !colorFromName(entry->get<std::string>(), color))
        {
            settings.warnings.push_back("ignoring invalid color for " + entry.key() + ": " + entry->dump());
            continue;
        }
        settings.colors[entry.key()] = color;
    }
}

Settings parseSettings(const std::string &contents)
{
    Settings settings;
    json config;
    try
    {
        // Config files are hand edited, so comments are allowed.
        config = json::parse(contents, nullptr, true, true);
    }
    catch (const json::parse_error &ex)
    {
        settings.warnings.push_back(std::string("config file is not valid JSON: ") + ex.what());
        return settings;
    }
    if (!config.is_object())
    {
        settings.warnings.push_back("config file must contain a JSON object");
        return settings;
    }

    readInt(config, "scrolloff", 0, 1000, settings.scrolloff, settings.warnings);
    readInt(config, "indent_width", 1, 16, settings.indentWidth, settings.warnings);
    readInt(config, "initial_depth", -1, 1000, settings.initialDepth, settings.warnings);
    readBool(config, "allow_special_numbers", settings.allowSpecialNumbers, settings.warnings);
    readString(config, "log_file", settings.logFile, settings.warnings);
    readString(config, "log_level", settings.logLevel, settings.warnings);

    const std::map<std::string, SearchCase> cases = {
        {"smart", SearchCase::Smart}, {"sensitive", SearchCase::Sensitive}, {"insensitive", SearchCase::Insensitive}};
    readEnum(config, "search_case", cases, settings.searchCase, settings.warnings);

    const std::map<std::string, DisplayMode> modes = {{"data", DisplayMode::Data}, {"json", DisplayMode::Json}};
    readEnum(config, "display_mode", modes, settings.displayMode, settings.warnings);

    const std::map<std::string, int> scopes = {{"keys", 1}, {"values", 2}, {"both", 3}};
    int scope = 3;
    readEnum(config, "search_scope", scopes, scope, settings.warnings);
    settings.searchKeys = (scope & 1) != 0;
    settings.searchValues = (scope & 2) != 0;

    readColors(config, settings);
    return settings;
}

Settings loadSettings(const std::string &path)
{
    if (path.empty())
        return Settings();
    std::ifstream f(path);
    if (!f)
        return Settings();
    std::stringstream ss;
    ss << f.rdbuf();
    Settings settings = parseSettings(ss.str());
    for (std::string &warning : settings.warnings)
        warning = path + ": " + warning;
    return settings;
}

bool caseSensitiveFor(const Settings &settings, const std::string &pattern)
{
    switch (settings.searchCase)
    {
    case SearchCase::Sensitive:
        return true;
    case SearchCase::Insensitive:
        return false;
    case SearchCase::Smart:
        break;
    }
    return smartCaseSensitive(pattern);
}
