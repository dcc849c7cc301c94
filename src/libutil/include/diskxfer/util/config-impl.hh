#pragma once
/**
 * @file
 *
 * Template implementations (as opposed to mere declarations).
 *
 * One only needs to include this when one is declaring a
 * `BaseSetting<CustomType>` setting, or a derived class of such an
 * instantiation.
 */

#include "diskxfer/util/util.hh"
#include "diskxfer/util/configuration.hh"

namespace diskxfer {

template<typename T>
void BaseSetting<T>::set(const std::string & str)
{
    value = parse(str);
}

#define DECLARE_CONFIG_SERIALISER(TY)                         \
    template<>                                                \
    TY BaseSetting<TY>::parse(const std::string & str) const; \
    template<>                                                \
    std::string BaseSetting<TY>::to_string() const;

DECLARE_CONFIG_SERIALISER(std::string)
DECLARE_CONFIG_SERIALISER(bool)

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    try {
        return string2IntWithUnitPrefix<T>(str);
    } catch (UsageError &) {
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
    }
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    return std::to_string(value);
}

} // namespace diskxfer
