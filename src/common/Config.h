#pragma once

#include <Result.h>
#include <UnorderedDense.h>
#include <any>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>
#include <cstdint>

namespace tessel {

/* Config

   command line and environment configuration

   --key=value and --key value set a value, --flag sets true and --no-flag or
   --disable-flag set false. -abc sets a, b and c to true. everything after a
   lone -- is positional. environment variables starting with the prefix are
   added with the prefix stripped, lowercased and _ replaced by -, so
   TESSEL_LOG_LEVEL=debug becomes log-level. command line values win over
   environment values.
*/

class Config
{
public:
    Config() = default;

    bool has(const std::string& key) const;

    template<typename T>
    T value(const std::string& key, const T& defaultValue = T()) const;

    std::size_t positionalSize() const;
    std::string positional(std::size_t idx) const;

    void set(const std::string& key, std::any value);

    static Result<Config> parse(int argc, char** argv, char** envp, const std::string& envPrefix);
    static std::any guessValue(const std::string& value);

private:
    unordered_dense::map<std::string, std::any> mValues;
    std::vector<std::string> mPositional;
};

inline bool Config::has(const std::string& key) const
{
    return mValues.find(key) != mValues.end();
}

template<typename T>
inline T Config::value(const std::string& key, const T& defaultValue) const
{
    auto it = mValues.find(key);
    if (it == mValues.end()) {
        return defaultValue;
    }
    const std::any& v = it->second;
    if (v.type() == typeid(T)) {
        return std::any_cast<T>(v);
    }
    if constexpr (std::is_arithmetic_v<T>) {
        if (v.type() == typeid(int64_t)) {
            return static_cast<T>(std::any_cast<int64_t>(v));
        }
        if constexpr (std::is_floating_point_v<T>) {
            if (v.type() == typeid(double)) {
                return static_cast<T>(std::any_cast<double>(v));
            }
        }
    }
    return defaultValue;
}

inline std::size_t Config::positionalSize() const
{
    return mPositional.size();
}

inline std::string Config::positional(std::size_t idx) const
{
    if (idx >= mPositional.size()) {
        return {};
    }
    return mPositional[idx];
}

inline void Config::set(const std::string& key, std::any value)
{
    mValues[key] = std::move(value);
}

} // namespace tessel
