#include "config/ConfigReader.h"
#include "logger/Logger.h"
#include "utils/ScopedFileHandle.h"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace config
{

bool ConfigReader::readFromFile(const std::string& fileName)
{
    logger::info("Reading config file %s", "ConfigReader", fileName.c_str());
    utils::ScopedFileHandle configFile(utils::ScopedFileHandle::open(fileName, "r"));
    if (!configFile.get())
    {
        logger::warn("Failed reading config file %s, unable to open file", "ConfigReader", fileName.c_str());
        return false;
    }

    fseek(configFile.get(), 0, SEEK_END);
    const auto fileLength = ftell(configFile.get());
    fseek(configFile.get(), 0, SEEK_SET);
    if (fileLength < 0)
    {
        logger::warn("Failed reading config file %s, cannot determine size", "ConfigReader", fileName.c_str());
        return false;
    }

    std::vector<char> fileBuffer(fileLength + 1, 0);
    if (fread(fileBuffer.data(), 1, fileLength, configFile.get()) != static_cast<size_t>(fileLength))
    {
        logger::warn("Failed reading config file %s, short read", "ConfigReader", fileName.c_str());
        return false;
    }

    return parse(&fileBuffer[0]);
}

bool ConfigReader::readFromString(const std::string& json) { return parse(json.c_str()); }

const nlohmann::json* ConfigReader::findNode(const nlohmann::json& document, const std::string& name)
{
    if (!document.is_object())
    {
        return nullptr;
    }

    auto flat = document.find(name);
    if (flat != document.end())
    {
        return &*flat;
    }

    const nlohmann::json* node = &document;
    size_t start = 0;
    while (start <= name.size())
    {
        const size_t dot = std::min(name.find('.', start), name.size());
        if (!node->is_object())
        {
            return nullptr;
        }
        auto child = node->find(name.substr(start, dot - start));
        if (child == node->end())
        {
            return nullptr;
        }
        node = &*child;
        start = dot + 1;
    }
    return node;
}

bool ConfigReader::parse(const char* buffer)
{
    _invalidKeys.clear();
    _missingKeys.clear();
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(buffer);
    }
    catch (const nlohmann::json::exception& e)
    {
        logger::warn("Failed parsing config: %s", "ConfigReader", e.what());
        return false;
    }

    if (!document.is_object())
    {
        logger::warn("Config root is not an object", "ConfigReader");
        return false;
    }

    bool result = true;
    for (auto* property : _properties)
    {
        switch (property->read(document))
        {
        case ReadResult::Ok:
        case ReadResult::Defaulted:
            break;
        case ReadResult::WrongType:
            logger::error("Config param %s has wrong type", "ConfigReader", property->getName().c_str());
            _invalidKeys.push_back(property->getName());
            result = false;
            break;
        case ReadResult::Missing:
            logger::error("Config param is missing %s", "ConfigReader", property->getName().c_str());
            _missingKeys.push_back(property->getName());
            result = false;
            break;
        }
    }

    return result;
}

} // namespace config
