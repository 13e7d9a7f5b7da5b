#pragma once
#include <string>
#include <algorithm>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the mode.
      Example:   rvfstream-cli receive --port=50070 --view
    - Keys are case-sensitive.

  Missing keys and unparsable numbers fall back to the default value.
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Get int value for "--key=value". Returns 'def' on missing or parse error. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) { return def; }
}

/* Get double value for "--key=value". Returns 'def' on missing or parse error. */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        return std::stod(v);
    } catch (const std::exception&) { return def; }
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}
