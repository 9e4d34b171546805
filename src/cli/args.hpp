#pragma once
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

/*
  Minimal "--key=value" / "--flag" helpers for csp_scan.
  Missing keys and unparsable numbers fall back to the default.
*/

inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        return std::stoi(v);
    } catch (const std::logic_error&) {
        return def;
    }
}

inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* "0", "12": camera index. False for anything else, including digit strings
   too large for int, which are then treated as file paths. */
inline bool argAsIndex(const std::string& s, int& out) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        return false;
    try {
        out = std::stoi(s);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}
