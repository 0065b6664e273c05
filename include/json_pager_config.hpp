#pragma once

#include "json_pager_render.hpp"

#include <map>
#include <string>
#include <vector>

enum class SearchCase
{
    Smart,
    Sensitive,
    Insensitive
};

// Color roles that can be overridden under "colors" in the config file.
// Values are curses color numbers (0-7) or -1 for the terminal default.
const std::vector<std::string> &colorRoles();
// "black" .. "white", "default".  Returns false for unknown names.
bool colorFromName(const std::string &name, int &color);

struct Settings
{
    int scrolloff = 3;
    bool searchKeys = true;
    bool searchValues = true;
    SearchCase searchCase = SearchCase::Smart;
    DisplayMode displayMode = DisplayMode::Data;
    int indentWidth = 2;
    int initialDepth = -1;
    bool allowSpecialNumbers = true;
    std::string logFile;
    std::string logLevel = "info";
    std::map<std::string, int> colors;

    // Problems found while reading the file.  They are logged once logging
    // has been configured from these very settings.
    std::vector<std::string> warnings;
};

// $XDG_CONFIG_HOME/json-pager/config.json or ~/.config/json-pager/config.json,
// empty if neither can be determined.
std::string defaultConfigPath();

// Reads the config file at `path`.  A missing file yields the defaults;
// malformed files and invalid values are reported in `warnings` and replaced
// by defaults.
Settings loadSettings(const std::string &path);
Settings parseSettings(const std::string &contents);

bool caseSensitiveFor(const Settings &settings, const std::string &pattern);
