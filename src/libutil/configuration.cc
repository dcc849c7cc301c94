#include "diskxfer/util/configuration.hh"
#include "diskxfer/util/file-descriptor.hh"
#include "diskxfer/util/util.hh"

#include "diskxfer/util/config-impl.hh"

#include "diskxfer/util/strings.hh"

#include <sys/stat.h>

namespace diskxfer {

AbstractConfig::AbstractConfig(StringMap initials)
    : unknownSettings(std::move(initials))
{
}

void AbstractConfig::warnUnknownSettings()
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

Config::Config(StringMap initials)
    : AbstractConfig(std::move(initials))
{
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = _settings.find(name);
    if (i == _settings.end())
        return false;
    i->second.setting->set(value);
    i->second.setting->overridden = true;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, SettingData{false, setting});
    for (auto & alias : setting->aliases)
        _settings.emplace(alias, SettingData{true, setting});

    /* A value read before the setting existed is applied now. The
       canonical name wins over its aliases. */
    std::optional<std::string> setVia;
    auto adopt = [&](const std::string & key) {
        auto i = unknownSettings.find(key);
        if (i == unknownSettings.end())
            return;
        if (setVia)
            warn("setting '%s' is also set as '%s'; ignoring the latter", *setVia, key);
        else {
            setting->set(i->second);
            setting->overridden = true;
            setVia = key;
        }
        unknownSettings.erase(i);
    };

    adopt(setting->name);
    for (auto & alias : setting->aliases)
        adopt(alias);
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto & [name, data] : _settings)
        if (!data.isAlias && (!overriddenOnly || data.setting->overridden))
            res.emplace(name, SettingInfo{data.setting->to_string(), data.setting->description});
}

void Config::resetOverridden()
{
    for (auto & [name, data] : _settings)
        data.setting->overridden = false;
}

std::string Config::toKeyValue()
{
    std::string res;
    for (auto & [name, data] : _settings)
        if (!data.isAlias)
            res += fmt("%s = %s\n", name, data.setting->to_string());
    return res;
}

namespace {

typedef std::vector<std::pair<std::string, std::string>> Assignments;

Path resolveInclude(const std::string & target, const Path & from)
{
    if (hasPrefix(target, "/"))
        return target;
    auto slash = from.rfind('/');
    if (slash == from.npos)
        return target;
    return from.substr(0, slash + 1) + target;
}

bool pathExists(const Path & path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

/**
 * Collect the `name = value` lines of `contents`, following `include`
 * and `!include` directives. Includes are resolved relative to the
 * directory of `path`.
 */
void parseConfigLines(const std::string & contents, const Path & path, Assignments & out)
{
    std::string_view rest = contents;
    size_t lineNo = 0;

    while (!rest.empty()) {
        auto eol = rest.find('\n');
        auto rawLine = rest.substr(0, eol);
        rest.remove_prefix(eol == rest.npos ? rest.size() : eol + 1);
        lineNo++;

        std::string line(rawLine.substr(0, rawLine.find('#')));
        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        auto syntaxError = [&]() {
            return UsageError("syntax error in '%s' line %d: '%s'", path, lineNo, trim(line));
        };

        if (tokens[0] == "include" || tokens[0] == "!include") {
            if (tokens.size() != 2)
                throw syntaxError();
            auto target = resolveInclude(tokens[1], path);
            if (pathExists(target))
                parseConfigLines(readFile(target), target, out);
            else if (tokens[0] == "include")
                throw Error("file '%s' included from '%s' not found", target, path);
            continue;
        }

        if (tokens.size() < 2 || tokens[1] != "=")
            throw syntaxError();

        out.emplace_back(tokens[0], concatStringsSep(" ", std::vector<std::string>(tokens.begin() + 2, tokens.end())));
    }
}

} // namespace

void AbstractConfig::applyConfig(const std::string & contents, const std::string & path)
{
    Assignments assignments;
    parseConfigLines(contents, path, assignments);

    for (auto & [name, value] : assignments)
        if (!set(name, value))
            unknownSettings.insert_or_assign(name, value);
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases)
    : name(name)
    , description(stripIndentation(description))
    , aliases(aliases)
{
}

AbstractSetting::~AbstractSetting() {}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<>
bool BaseSetting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("boolean setting '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template class BaseSetting<unsigned int>;
template class BaseSetting<uint64_t>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;

} // namespace diskxfer
