#include "Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/core.h>

using namespace tessel;

std::any Config::guessValue(const std::string& value)
{
    if (value.empty() || value == "true") {
        return std::any(true);
    }
    if (value == "false") {
        return std::any(false);
    }
    char* end;
    const long long l = strtoll(value.c_str(), &end, 0);
    if (*end == '\0') {
        return std::any(static_cast<int64_t>(l));
    }
    const double d = strtod(value.c_str(), &end);
    if (*end == '\0') {
        return std::any(d);
    }
    return std::any(value);
}

static void setFlag(unordered_dense::map<std::string, std::any>& values, const std::string& key)
{
    if (key.size() > 3 && key.compare(0, 3, "no-") == 0) {
        values[key.substr(3)] = std::any(false);
    } else if (key.size() > 8 && key.compare(0, 8, "disable-") == 0) {
        values[key.substr(8)] = std::any(false);
    } else {
        values[key] = std::any(true);
    }
}

Result<Config> Config::parse(int argc, char** argv, char** envp, const std::string& envPrefix)
{
    Config config;

    if (envp != nullptr) {
        for (char** env = envp; *env != nullptr; ++env) {
            const std::string entry(*env);
            if (entry.compare(0, envPrefix.size(), envPrefix) != 0) {
                continue;
            }
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == envPrefix.size()) {
                continue;
            }
            std::string key = entry.substr(envPrefix.size(), eq - envPrefix.size());
            std::transform(key.begin(), key.end(), key.begin(), [](unsigned char ch) {
                return static_cast<char>(tolower(ch));
            });
            std::replace(key.begin(), key.end(), '_', '-');
            config.mValues[key] = guessValue(entry.substr(eq + 1));
        }
    }

    bool positionalOnly = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (positionalOnly || arg.size() < 2 || arg[0] != '-') {
            config.mPositional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            positionalOnly = true;
            continue;
        }
        if (arg[1] != '-') {
            // -abc
            for (std::size_t n = 1; n < arg.size(); ++n) {
                if (!isalnum(static_cast<unsigned char>(arg[n]))) {
                    return makeError(fmt::format("unexpected character '{}' in argument {}", arg[n], i), Span { static_cast<std::size_t>(i), n });
                }
                config.mValues[std::string(1, arg[n])] = std::any(true);
            }
            continue;
        }
        const auto eq = arg.find('=');
        const std::string key = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        if (key.empty()) {
            return makeError(fmt::format("missing key in argument {}", i), Span { static_cast<std::size_t>(i), 2 });
        }
        if (eq != std::string::npos) {
            config.mValues[key] = guessValue(arg.substr(eq + 1));
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            config.mValues[key] = guessValue(argv[++i]);
        } else {
            setFlag(config.mValues, key);
        }
    }

    return config;
}
