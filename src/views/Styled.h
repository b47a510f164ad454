#pragma once

#include <Contexts.h>
#include <optional>
#include <string>
#include <utility>

namespace tessel {

/* Styled

   a view property that is either set inline on the view or looked up in
   the stylesheet under a key. an inline value always wins.
*/

template<typename T>
class Styled
{
public:
    Styled() = default;
    Styled(T value);

    static Styled key(std::string key);

    bool isInline() const;
    const std::optional<T>& value() const;
    const std::string& styleKey() const;

    // key is used when no key was given to key()
    T resolve(ViewCx& cx, const std::string& key, const T& fallback) const;

    bool operator==(const Styled& other) const = default;

private:
    std::optional<T> mValue;
    std::string mKey;
};

template<typename T>
inline Styled<T>::Styled(T value)
    : mValue(std::move(value))
{
}

template<typename T>
inline Styled<T> Styled<T>::key(std::string key)
{
    Styled ret;
    ret.mKey = std::move(key);
    return ret;
}

template<typename T>
inline bool Styled<T>::isInline() const
{
    return mValue.has_value();
}

template<typename T>
inline const std::optional<T>& Styled<T>::value() const
{
    return mValue;
}

template<typename T>
inline const std::string& Styled<T>::styleKey() const
{
    return mKey;
}

template<typename T>
T Styled<T>::resolve(ViewCx& cx, const std::string& key, const T& fallback) const
{
    if (mValue.has_value()) {
        return *mValue;
    }
    return cx.styleOr<T>(mKey.empty() ? key : mKey, fallback);
}

} // namespace tessel
