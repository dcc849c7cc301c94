#pragma once
///@file

#include "diskxfer/util/configuration.hh"

namespace diskxfer {

/**
 * All settings objects of the program behind one `AbstractConfig`, so
 * that configuration files and `--option` reach each of them.
 */
struct GlobalConfig : public AbstractConfig
{
    typedef std::vector<Config *> ConfigRegistrations;

    static ConfigRegistrations & configRegistrations()
    {
        static ConfigRegistrations configRegistrations;
        return configRegistrations;
    }

    bool set(const std::string & name, const std::string & value) override;

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    std::string toKeyValue() override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

} // namespace diskxfer
