#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace config
{

/*
Declarative JSON config. Properties are declared as members with CFG_PROP and nested with
CFG_GROUP / CFG_GROUP_END. A property named "sctp.mtu" is looked up as the flat key "sctp.mtu" first
and then as the nested path {"sctp": {"mtu": ...}}.

class StackConfig : public ConfigReader
{
public:
    CFG_GROUP()
    CFG_PROP(uint32_t, mtu, 1200);
    CFG_GROUP_END(sctp);
};

    StackConfig cfg;
    cfg.readFromString(R"({"sctp.mtu": 1400})");
*/
class ConfigReader
{
public:
    bool readFromFile(const std::string& fileName);
    bool readFromString(const std::string& json);

    // From the last read. Keys present with a type that does not convert.
    const std::vector<std::string>& getInvalidKeys() const { return _invalidKeys; }
    // From the last read. Mandatory keys that were absent.
    const std::vector<std::string>& getMissingKeys() const { return _missingKeys; }

protected:
    enum class ReadResult
    {
        Ok,
        Defaulted,
        Missing,
        WrongType
    };

    struct IProperty
    {
        virtual ~IProperty() = default;
        virtual ReadResult read(const nlohmann::json& document) = 0;
        virtual const std::string& getName() const = 0;
    };

    struct Mandatory
    {
    };

    template <typename T>
    class PropertyImpl : public IProperty
    {
    public:
        PropertyImpl(const char* key, T defaultValue, std::vector<IProperty*>& registry, const std::string& group)
            : _name(qualify(group, key)),
              _defaultValue(std::move(defaultValue)),
              _value(_defaultValue),
              _mandatory(false)
        {
            registry.push_back(this);
        }

        PropertyImpl(const char* key, Mandatory, std::vector<IProperty*>& registry, const std::string& group)
            : _name(qualify(group, key)),
              _defaultValue(),
              _value(),
              _mandatory(true)
        {
            registry.push_back(this);
        }

        const T& get() const { return _value; }
        operator const T&() const { return _value; }

        PropertyImpl& operator=(const T& value)
        {
            _value = value;
            return *this;
        }

        ReadResult read(const nlohmann::json& document) override
        {
            _value = _defaultValue;
            const auto* node = ConfigReader::findNode(document, _name);
            if (!node || node->is_null())
            {
                return _mandatory ? ReadResult::Missing : ReadResult::Defaulted;
            }

            try
            {
                node->get_to(_value);
            }
            catch (const nlohmann::json::exception&)
            {
                _value = _defaultValue;
                return ReadResult::WrongType;
            }
            return ReadResult::Ok;
        }

        const std::string& getName() const override { return _name; }

    private:
        const std::string _name;
        const T _defaultValue;
        T _value;
        const bool _mandatory;
    };

    static std::string qualify(const std::string& group, const char* key)
    {
        return group.empty() ? std::string(key) : group + "." + key;
    }

    bool parse(const char* buffer);
    static const nlohmann::json* findNode(const nlohmann::json& document, const std::string& name);

    std::vector<IProperty*> _properties;
    std::vector<std::string> _invalidKeys;
    std::vector<std::string> _missingKeys;
    std::string _groupName;
};
} // namespace config

#define RTCSTACK_CFG_CONCAT_IMPL(x, y) x##y
#define RTCSTACK_CFG_CONCAT(x, y) RTCSTACK_CFG_CONCAT_IMPL(x, y)

#define CFG_GROUP()                                                                                                    \
    struct RTCSTACK_CFG_CONCAT(Group, __LINE__)                                                                        \
    {                                                                                                                  \
        const std::string _groupName;                                                                                  \
        std::vector<IProperty*>& _properties;                                                                          \
        RTCSTACK_CFG_CONCAT(Group, __LINE__)                                                                           \
        (const std::string& parent, const std::string& name, std::vector<IProperty*>& p)                               \
            : _groupName(parent.empty() ? name : parent + "." + name),                                                 \
              _properties(p)                                                                                           \
        {                                                                                                              \
        }
#define CFG_GROUP_END(name)                                                                                            \
    }                                                                                                                  \
    name{_groupName, #name, _properties};

#define CFG_PROP(type, name, defaultValue) PropertyImpl<type> name = {#name, defaultValue, _properties, _groupName}

#define CFG_MANDATORY_PROP(type, name) PropertyImpl<type> name = {#name, Mandatory(), _properties, _groupName}
