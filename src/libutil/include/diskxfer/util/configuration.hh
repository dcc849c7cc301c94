#pragma once
///@file

#include <map>
#include <optional>

#include "diskxfer/util/types.hh"

namespace diskxfer {

class AbstractSetting;

/**
 * A set of named settings that can be changed by name, either one at
 * a time with `set()` or from the text of a configuration file with
 * `applyConfig()`.
 *
 * Names that are not (yet) known are remembered in `unknownSettings`,
 * so a setting registered later still picks up its value.
 */
class AbstractConfig
{
protected:
    StringMap unknownSettings;

    AbstractConfig(StringMap initials = {});

public:

    /**
     * @return whether `name` is a known setting or alias.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    /**
     * Add every setting (aliases excluded) to `res`, or only those
     * changed since the last `resetOverridden()`.
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const = 0;

    /**
     * Apply `name = value` lines. `#` starts a comment. `include FILE`
     * reads another file, `!include FILE` does so only if it exists;
     * relative names are looked up next to `path`.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    virtual void resetOverridden() = 0;

    /**
     * All settings in configuration file syntax, sorted by name.
     */
    virtual std::string toKeyValue() = 0;

    void warnUnknownSettings();

    virtual ~AbstractConfig() = default;
};

/**
 * The usual way to declare settings:
 *
 *   struct StreamSettings : Config
 *   {
 *       Setting<uint64_t> bufferSize{this, 1 << 20, "buffer-size", "Size of the write buffer."};
 *   };
 */
class Config : public AbstractConfig
{
    friend class AbstractSetting;

    struct SettingData
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    std::map<std::string, SettingData> _settings;

public:

    Config(StringMap initials = {});

    bool set(const std::string & name, const std::string & value) override;

    void addSetting(AbstractSetting * setting);

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    std::string toKeyValue() override;
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    /**
     * Set by `Config::set()` and by assignment.
     */
    bool overridden = false;

protected:

    AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases);

    virtual ~AbstractSetting();

    virtual void set(const std::string & value) = 0;

    virtual std::string to_string() const = 0;
};

/**
 * A setting holding a `T`. Strings, booleans (`true`/`yes`/`1` and
 * `false`/`no`/`0`) and unsigned integers with an optional K, M, G or
 * T suffix are supported; see config-impl.hh.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;

    virtual T parse(const std::string & str) const;

public:

    BaseSetting(
        const T & def, const std::string & name, const std::string & description, const StringSet & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    void set(const std::string & str) override final;

    std::string to_string() const override;
};

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(
        Config * options,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : BaseSetting<T>(def, name, description, aliases)
    {
        options->addSetting(this);
    }

    void operator=(const T & v)
    {
        this->value = v;
        this->overridden = true;
    }
};

} // namespace diskxfer
