#include "diskxfer/util/config-global.hh"
#include "diskxfer/util/logging.hh"

namespace diskxfer {

GlobalConfig globalConfig;

GlobalConfig::Register::Register(Config * config)
{
    configRegistrations().push_back(config);
}

bool GlobalConfig::set(const std::string & name, const std::string & value)
{
    for (auto config : configRegistrations())
        if (config->set(name, value))
            return true;

    /* Kept so that `warnUnknownSettings()` can name it once every
       source of settings has been read. */
    unknownSettings.insert_or_assign(name, value);
    return false;
}

void GlobalConfig::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto config : configRegistrations())
        config->getSettings(res, overriddenOnly);
}

void GlobalConfig::resetOverridden()
{
    for (auto config : configRegistrations())
        config->resetOverridden();
}

std::string GlobalConfig::toKeyValue()
{
    std::map<std::string, SettingInfo> settings;
    getSettings(settings);

    std::string res;
    for (auto & [name, info] : settings)
        res += fmt("%s = %s\n", name, info.value);
    return res;
}

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

} // namespace diskxfer
