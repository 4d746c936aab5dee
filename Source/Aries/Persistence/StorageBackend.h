#pragma once

#include "Aries/Public/GridResult.h"
#include <juce_data_structures/juce_data_structures.h>
#include <map>
#include <memory>
#include <optional>

namespace Aries::Persistence
{
    inline constexpr const char* kGridStateKey = "aries-grid-state";
    inline constexpr const char* kProfilesKey = "aries-profiles";
    inline constexpr const char* kActiveProfileKey = "aries-active-profile";

    // Durable string key/value store. A write that would push the stored total over the quota fails
    // with persistenceQuota and leaves the previous value in place.
    class StorageBackend
    {
    public:
        virtual ~StorageBackend() = default;

        virtual std::optional<juce::String> read(const juce::String& key) const = 0;
        virtual GridResult write(const juce::String& key, const juce::String& value) = 0;
        virtual GridResult remove(const juce::String& key) = 0;
        virtual juce::StringArray keys() const = 0;

        // Reads what actually reached the medium, bypassing any cache. Used to verify writes.
        virtual std::optional<juce::String> readBack(const juce::String& key) const;

        void setQuotaBytes(size_t bytes) noexcept { quotaBytes = bytes; }
        size_t getQuotaBytes() const noexcept { return quotaBytes; }

    protected:
        GridResult checkQuota(const juce::String& key, const juce::String& value) const;

    private:
        size_t quotaBytes = 0;   // 0 == unlimited
    };

    class MemoryStorage : public StorageBackend
    {
    public:
        std::optional<juce::String> read(const juce::String& key) const override;
        GridResult write(const juce::String& key, const juce::String& value) override;
        GridResult remove(const juce::String& key) override;
        juce::StringArray keys() const override;

    private:
        std::map<juce::String, juce::String> values;
    };

    class PropertiesFileStorage : public StorageBackend
    {
    public:
        explicit PropertiesFileStorage(const juce::PropertiesFile::Options& options);
        explicit PropertiesFileStorage(const juce::File& file);

        std::optional<juce::String> read(const juce::String& key) const override;
        GridResult write(const juce::String& key, const juce::String& value) override;
        GridResult remove(const juce::String& key) override;
        juce::StringArray keys() const override;
        std::optional<juce::String> readBack(const juce::String& key) const override;

        juce::File getFile() const;

    private:
        static juce::PropertiesFile::Options optionsForFile(const juce::File& file);

        juce::PropertiesFile::Options options;
        std::unique_ptr<juce::PropertiesFile> properties;
    };

    juce::PropertiesFile::Options defaultStorageOptions();
}
