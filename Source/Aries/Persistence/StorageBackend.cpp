#include "Aries/Persistence/StorageBackend.h"

namespace Aries::Persistence
{
    namespace
    {
        size_t utf8Size(const juce::String& text)
        {
            return text.getNumBytesAsUTF8();
        }
    }

    GridResult StorageBackend::checkQuota(const juce::String& key, const juce::String& value) const
    {
        if (quotaBytes == 0)
            return GridResult::ok();

        size_t total = utf8Size(key) + utf8Size(value);
        for (const auto& existingKey : keys())
        {
            if (existingKey == key)
                continue;

            total += utf8Size(existingKey);
            if (const auto existing = read(existingKey))
                total += utf8Size(*existing);
        }

        if (total > quotaBytes)
        {
            return GridResult::fail(GridError::persistenceQuota,
                                    "storage quota exceeded writing '" + key + "' ("
                                        + juce::String(static_cast<juce::int64>(total)) + " > "
                                        + juce::String(static_cast<juce::int64>(quotaBytes)) + " bytes)");
        }

        return GridResult::ok();
    }

    std::optional<juce::String> StorageBackend::readBack(const juce::String& key) const
    {
        return read(key);
    }

    std::optional<juce::String> MemoryStorage::read(const juce::String& key) const
    {
        const auto it = values.find(key);
        if (it == values.end())
            return std::nullopt;
        return it->second;
    }

    GridResult MemoryStorage::write(const juce::String& key, const juce::String& value)
    {
        const auto quota = checkQuota(key, value);
        if (quota.failed())
            return quota;

        values[key] = value;
        return GridResult::ok();
    }

    GridResult MemoryStorage::remove(const juce::String& key)
    {
        values.erase(key);
        return GridResult::ok();
    }

    juce::StringArray MemoryStorage::keys() const
    {
        juce::StringArray result;
        for (const auto& [key, value] : values)
        {
            juce::ignoreUnused(value);
            result.add(key);
        }

        return result;
    }

    PropertiesFileStorage::PropertiesFileStorage(const juce::PropertiesFile::Options& optionsIn)
        : options(optionsIn),
          properties(std::make_unique<juce::PropertiesFile>(optionsIn))
    {
    }

    PropertiesFileStorage::PropertiesFileStorage(const juce::File& file)
        : options(optionsForFile(file)),
          properties(std::make_unique<juce::PropertiesFile>(file, options))
    {
    }

    std::optional<juce::String> PropertiesFileStorage::read(const juce::String& key) const
    {
        if (!properties->containsKey(key))
            return std::nullopt;
        return properties->getValue(key);
    }

    GridResult PropertiesFileStorage::write(const juce::String& key, const juce::String& value)
    {
        const auto quota = checkQuota(key, value);
        if (quota.failed())
            return quota;

        properties->setValue(key, value);
        if (!properties->saveIfNeeded())
            return GridResult::fail(GridError::persistenceIo, "failed to write " + properties->getFile().getFullPathName());

        return GridResult::ok();
    }

    GridResult PropertiesFileStorage::remove(const juce::String& key)
    {
        properties->removeValue(key);
        if (!properties->saveIfNeeded())
            return GridResult::fail(GridError::persistenceIo, "failed to write " + properties->getFile().getFullPathName());

        return GridResult::ok();
    }

    juce::StringArray PropertiesFileStorage::keys() const
    {
        return properties->getAllProperties().getAllKeys();
    }

    // The live PropertiesFile answers from memory, so verification re-parses the file itself.
    std::optional<juce::String> PropertiesFileStorage::readBack(const juce::String& key) const
    {
        const juce::PropertiesFile onDisk(properties->getFile(), options);
        if (!onDisk.containsKey(key))
            return std::nullopt;
        return onDisk.getValue(key);
    }

    juce::File PropertiesFileStorage::getFile() const
    {
        return properties->getFile();
    }

    juce::PropertiesFile::Options PropertiesFileStorage::optionsForFile(const juce::File& file)
    {
        auto options = defaultStorageOptions();
        options.filenameSuffix = file.getFileExtension().trimCharactersAtStart(".");
        return options;
    }

    juce::PropertiesFile::Options defaultStorageOptions()
    {
        juce::PropertiesFile::Options options;
        options.applicationName = "AriesGrid";
        options.folderName = "AriesGrid";
        options.filenameSuffix = "layout";
        options.osxLibrarySubFolder = "Application Support";
        options.storageFormat = juce::PropertiesFile::storeAsXML;
        options.millisecondsBeforeSaving = -1;
        return options;
    }
}
