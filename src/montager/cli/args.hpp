#pragma once
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the subcommand.
      Example:   montager-cli compose --ch1=a.tif --ch2=b.tif
    - Keys are case-sensitive.

  Notes:
    - If a key is missing, the default value is returned.
    - A value that is not a number is reported on stderr and the default is used.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
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
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        return std::stoi(v);
    } catch (const std::logic_error&) {
        std::cerr << "[args] bad integer for --" << key << "='" << v << "', using " << def << "\n";
        return def;
    }
}

/* Get double value for "--key=value". Returns 'def' on missing or parse error. */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        return std::stod(v);
    } catch (const std::logic_error&) {
        std::cerr << "[args] bad number for --" << key << "='" << v << "', using " << def << "\n";
        return def;
    }
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* Split "a,b,c" on commas. Empty items are kept so "--columns=A,,C" leaves a blank label. */
inline std::vector<std::string> splitCommas(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') { out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}
