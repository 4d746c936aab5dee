#include "Aries/Core/GridQueries.h"
#include "Aries/Core/GridValidator.h"
#include "Aries/Editor/Perf/CullingEngine.h"
#include "Aries/Serialization/GridJson.h"
#include <iostream>

namespace
{
    juce::StringArray parseCommandLineArgs(int argc, char* argv[])
    {
        juce::StringArray args;
        for (int i = 1; i < argc; ++i)
            args.add(juce::String::fromUTF8(argv[i]));
        args.trim();
        args.removeEmptyStrings();
        return args;
    }

    bool hasArg(const juce::StringArray& args, const juce::String& key)
    {
        for (const auto& arg : args)
        {
            if (arg == key)
                return true;
        }

        return false;
    }

    juce::String argValue(const juce::StringArray& args, const juce::String& prefix)
    {
        for (const auto& arg : args)
        {
            if (arg.startsWith(prefix))
                return arg.fromFirstOccurrenceOf(prefix, false, false).unquoted();
        }

        return {};
    }

    juce::File resolveFile(const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }

    void printUsage()
    {
        std::cout << "usage: aries-grid --validate=<file>\n"
                  << "       aries-grid --stats=<file> [--viewport=x,y,zoom] [--size=WxH]\n"
                  << "       aries-grid --normalize=<file> --out=<file>" << std::endl;
    }

    juce::Result loadDocument(const juce::String& path, Aries::Serialization::GridDocument& document)
    {
        if (path.isEmpty())
            return juce::Result::fail("missing document path");

        const auto result = Aries::Serialization::loadGridFromFile(resolveFile(path), document);
        if (result.failed())
            return juce::Result::fail(juce::String(result.errorName()) + ": " + result.getErrorMessage());

        return juce::Result::ok();
    }

    juce::Result runValidate(const juce::StringArray& args)
    {
        Aries::Serialization::GridDocument document;
        const auto loaded = loadDocument(argValue(args, "--validate="), document);
        if (loaded.failed())
            return loaded;

        std::cout << "OK: " << Aries::Core::GridQueries::widgetCount(document.model) << " widgets, "
                  << document.model.nestContainers.size() << " nests" << std::endl;
        return juce::Result::ok();
    }

    juce::Result runStats(const juce::StringArray& args)
    {
        Aries::Serialization::GridDocument document;
        const auto loaded = loadDocument(argValue(args, "--stats="), document);
        if (loaded.failed())
            return loaded;

        auto viewport = document.viewport;
        if (const auto text = argValue(args, "--viewport="); text.isNotEmpty())
        {
            auto parts = juce::StringArray::fromTokens(text, ",", {});
            parts.trim();
            if (parts.size() != 3)
                return juce::Result::fail("--viewport expects x,y,zoom");

            viewport.x = parts[0].getFloatValue();
            viewport.y = parts[1].getFloatValue();
            viewport.zoom = Aries::clampZoom(parts[2].getFloatValue());
        }

        Aries::Core::Geometry::ItemSize size { 1280.0f, 800.0f };
        if (const auto text = argValue(args, "--size="); text.isNotEmpty())
        {
            size.width = text.upToFirstOccurrenceOf("x", false, true).getFloatValue();
            size.height = text.fromFirstOccurrenceOf("x", false, true).getFloatValue();
            if (size.width <= 0.0f || size.height <= 0.0f)
                return juce::Result::fail("--size expects WxH with positive values");
        }

        Aries::Editor::Perf::CullingEngine culling;
        Aries::Editor::Perf::CullingSettings settings;
        settings.minItemsForVirtualization = 0;
        culling.setSettings(settings);

        const auto result = culling.compute(document.model, viewport, size);

        std::cout << "widgets:  " << Aries::Core::GridQueries::widgetCount(document.model) << "\n"
                  << "nests:    " << document.model.nestContainers.size() << "\n"
                  << "gridSize: " << document.model.gridSize << "\n"
                  << "viewport: " << viewport.x << "," << viewport.y << " @ " << viewport.zoom << "\n"
                  << "rendered: " << result.renderedItems << "/" << result.totalItems << "\n"
                  << "culled:   " << result.culledItems << " ("
                  << juce::String(result.cullingPercentage, 1) << "%)" << std::endl;
        return juce::Result::ok();
    }

    juce::Result runNormalize(const juce::StringArray& args)
    {
        const auto outPath = argValue(args, "--out=");
        if (outPath.isEmpty())
            return juce::Result::fail("--normalize needs --out=<file>");

        Aries::Serialization::GridDocument document;
        const auto loaded = loadDocument(argValue(args, "--normalize="), document);
        if (loaded.failed())
            return loaded;

        const auto target = resolveFile(outPath);
        const auto saved = Aries::Serialization::saveGridToFile(target,
                                                                document.model,
                                                                document.viewport,
                                                                document.timestamp.value_or(juce::Time::getCurrentTime()));
        if (saved.failed())
            return saved;

        std::cout << "Wrote " << target.getFullPathName() << std::endl;
        return juce::Result::ok();
    }
}

int main(int argc, char* argv[])
{
    const auto args = parseCommandLineArgs(argc, argv);

    juce::Result result = juce::Result::ok();
    if (argValue(args, "--validate=").isNotEmpty())
        result = runValidate(args);
    else if (argValue(args, "--stats=").isNotEmpty())
        result = runStats(args);
    else if (argValue(args, "--normalize=").isNotEmpty())
        result = runNormalize(args);
    else
    {
        printUsage();
        return hasArg(args, "--help") ? 0 : 1;
    }

    if (result.failed())
    {
        std::cerr << "aries-grid: " << result.getErrorMessage() << std::endl;
        return 1;
    }

    return 0;
}
