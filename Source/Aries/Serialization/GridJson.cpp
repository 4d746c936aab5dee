#include "Aries/Serialization/GridJson.h"

#include "Aries/Core/GridValidator.h"
#include <cmath>

namespace
{
    juce::var serializeConfig(const Aries::PropertyBag& bag)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        for (int i = 0; i < bag.size(); ++i)
            object->setProperty(bag.getName(i), bag.getValueAt(i));

        return juce::var(object.release());
    }

    juce::Result parseConfig(const juce::var& value, const juce::String& context, Aries::PropertyBag& outBag)
    {
        outBag.clear();
        if (value.isVoid() || value.isUndefined())
            return juce::Result::ok();

        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail(context + ".config must be object");

        const auto& props = object->getProperties();
        for (int i = 0; i < props.size(); ++i)
            outBag.set(props.getName(i), props.getValueAt(i));

        const auto check = Aries::validatePropertyBag(outBag);
        if (check.failed())
            return juce::Result::fail(context + ".config: " + check.getErrorMessage());

        return juce::Result::ok();
    }

    void writeBounds(juce::DynamicObject& object, const juce::Rectangle<float>& bounds)
    {
        object.setProperty("x", bounds.getX());
        object.setProperty("y", bounds.getY());
        object.setProperty("w", bounds.getWidth());
        object.setProperty("h", bounds.getHeight());
    }

    juce::Result parseBounds(const juce::NamedValueSet& props,
                             const juce::String& context,
                             juce::Rectangle<float>& outBounds)
    {
        for (const auto* key : { "x", "y", "w", "h" })
        {
            if (!props.contains(key) || !Aries::isNumericVar(props[key]))
                return juce::Result::fail(context + "." + key + " must be numeric");
        }

        outBounds = { static_cast<float>(props["x"]),
                      static_cast<float>(props["y"]),
                      static_cast<float>(props["w"]),
                      static_cast<float>(props["h"]) };
        return juce::Result::ok();
    }

    void writeTimestamps(juce::DynamicObject& object, juce::Time createdAt, juce::Time updatedAt)
    {
        object.setProperty("createdAt", Aries::Serialization::timeToIsoString(createdAt));
        object.setProperty("updatedAt", Aries::Serialization::timeToIsoString(updatedAt));
    }

    void readTimestamps(const juce::NamedValueSet& props, juce::Time& createdAt, juce::Time& updatedAt)
    {
        if (const auto parsed = Aries::Serialization::timeFromIsoString(props["createdAt"].toString()))
            createdAt = *parsed;
        if (const auto parsed = Aries::Serialization::timeFromIsoString(props["updatedAt"].toString()))
            updatedAt = *parsed;
    }

    juce::var serializeWidget(const Aries::WidgetModel& widget)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", widget.id);
        object->setProperty("type", widget.type);
        object->setProperty("title", widget.title);
        object->setProperty("content", widget.content);
        writeBounds(*object, widget.bounds);
        object->setProperty("container", widget.nestId.has_value() ? "nest" : "main");
        if (widget.nestId.has_value())
            object->setProperty("nestId", *widget.nestId);
        if (widget.ariesModType.isNotEmpty())
            object->setProperty("ariesModType", widget.ariesModType);
        object->setProperty("config", serializeConfig(widget.config));
        writeTimestamps(*object, widget.createdAt, widget.updatedAt);
        return juce::var(object.release());
    }

    juce::Result parseWidget(const juce::var& value, const juce::String& context, Aries::WidgetModel& outWidget)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail(context + " must be object");

        const auto& props = object->getProperties();
        if (!props.contains("id") || props["id"].toString().trim().isEmpty())
            return juce::Result::fail(context + " requires id");

        Aries::WidgetModel widget;
        widget.id = props["id"].toString();
        widget.type = props.contains("type") ? props["type"].toString() : juce::String("basic");
        widget.title = props["title"].toString();
        widget.content = props["content"].toString();
        widget.ariesModType = props["ariesModType"].toString();

        const auto boundsResult = parseBounds(props, context, widget.bounds);
        if (boundsResult.failed())
            return boundsResult;

        const auto nestId = props["nestId"].toString().trim();
        if (nestId.isNotEmpty())
            widget.nestId = nestId;

        const auto configResult = parseConfig(props["config"], context, widget.config);
        if (configResult.failed())
            return configResult;

        readTimestamps(props, widget.createdAt, widget.updatedAt);
        outWidget = std::move(widget);
        return juce::Result::ok();
    }

    juce::var serializeNest(const Aries::NestModel& nest)
    {
        auto object = std::make_unique<juce::DynamicObject>();
        object->setProperty("id", nest.id);
        object->setProperty("title", nest.title);
        writeBounds(*object, nest.bounds);
        if (nest.parentNestId.has_value())
            object->setProperty("parentNestId", *nest.parentNestId);
        writeTimestamps(*object, nest.createdAt, nest.updatedAt);
        return juce::var(object.release());
    }

    juce::Result parseNest(const juce::var& value, const juce::String& context, Aries::NestModel& outNest)
    {
        const auto* object = value.getDynamicObject();
        if (object == nullptr)
            return juce::Result::fail(context + " must be object");

        const auto& props = object->getProperties();
        if (!props.contains("id") || props["id"].toString().trim().isEmpty())
            return juce::Result::fail(context + " requires id");

        Aries::NestModel nest;
        nest.id = props["id"].toString();
        nest.title = props.contains("title") ? props["title"].toString() : juce::String("Nest Container");

        const auto boundsResult = parseBounds(props, context, nest.bounds);
        if (boundsResult.failed())
            return boundsResult;

        const auto parentId = props["parentNestId"].toString().trim();
        if (parentId.isNotEmpty())
            nest.parentNestId = parentId;

        readTimestamps(props, nest.createdAt, nest.updatedAt);
        outNest = std::move(nest);
        return juce::Result::ok();
    }

    template <typename Model, typename Parser>
    juce::Result parseArray(const juce::NamedValueSet& rootProps,
                            const char* key,
                            bool required,
                            std::vector<Model>& out,
                            Parser&& parser)
    {
        if (!rootProps.contains(key))
            return required ? juce::Result::fail(juce::String("document requires ") + key) : juce::Result::ok();

        const auto* array = rootProps[key].getArray();
        if (array == nullptr)
            return juce::Result::fail(juce::String(key) + " must be array");

        out.reserve(static_cast<size_t>(array->size()));
        for (int i = 0; i < array->size(); ++i)
        {
            Model item;
            const auto result = parser(array->getReference(i), juce::String(key) + "[" + juce::String(i) + "]", item);
            if (result.failed())
                return result;
            out.push_back(std::move(item));
        }

        return juce::Result::ok();
    }
}

namespace Aries::Serialization
{
    juce::String timeToIsoString(juce::Time time)
    {
        return time.toISO8601(true);
    }

    std::optional<juce::Time> timeFromIsoString(const juce::String& text)
    {
        const auto trimmed = text.trim();
        if (trimmed.isEmpty())
            return std::nullopt;

        const auto parsed = juce::Time::fromISO8601(trimmed);
        if (parsed.toMilliseconds() == 0 && !trimmed.startsWith("1970"))
            return std::nullopt;

        return parsed;
    }

    juce::var serializeGrid(const GridModel& model,
                            const Viewport& viewport,
                            TimestampField field,
                            juce::Time timestamp)
    {
        auto root = std::make_unique<juce::DynamicObject>();
        root->setProperty("version", kDocumentFormatVersion);

        juce::Array<juce::var> mainItems;
        for (const auto& widget : model.mainItems)
            mainItems.add(serializeWidget(widget));

        juce::Array<juce::var> nests;
        for (const auto& nest : model.nestContainers)
            nests.add(serializeNest(nest));

        juce::Array<juce::var> nestedItems;
        for (const auto& widget : model.nestedItems)
            nestedItems.add(serializeWidget(widget));

        root->setProperty("mainItems", mainItems);
        root->setProperty("nestContainers", nests);
        root->setProperty("nestedItems", nestedItems);
        root->setProperty("gridSize", model.gridSize);

        auto viewportObject = std::make_unique<juce::DynamicObject>();
        viewportObject->setProperty("x", viewport.x);
        viewportObject->setProperty("y", viewport.y);
        viewportObject->setProperty("zoom", viewport.zoom);
        root->setProperty("viewport", juce::var(viewportObject.release()));

        root->setProperty(field == TimestampField::lastSaved ? "lastSaved" : "exportedAt", timeToIsoString(timestamp));
        return juce::var(root.release());
    }

    juce::Result serializeGridToJsonString(const GridModel& model,
                                           const Viewport& viewport,
                                           TimestampField field,
                                           juce::Time timestamp,
                                           juce::String& jsonOut,
                                           bool allOnOneLine)
    {
        const auto validation = Core::GridValidator::validateGrid(model);
        if (validation.failed())
            return validation.toResult();

        jsonOut = juce::JSON::toString(serializeGrid(model, viewport, field, timestamp), allOnOneLine);
        return juce::Result::ok();
    }

    GridResult parseGrid(const juce::var& root, GridDocument& documentOut)
    {
        const auto* rootObject = root.getDynamicObject();
        if (rootObject == nullptr)
            return GridResult::fail(GridError::parse, "document root must be object");

        const auto& rootProps = rootObject->getProperties();

        GridDocument next;
        auto result = parseArray(rootProps, "mainItems", true, next.model.mainItems, parseWidget);
        if (result.wasOk())
            result = parseArray(rootProps, "nestContainers", true, next.model.nestContainers, parseNest);
        if (result.wasOk())
            result = parseArray(rootProps, "nestedItems", false, next.model.nestedItems, parseWidget);
        if (result.failed())
            return GridResult::fromResult(result, GridError::parse);

        // Keep the main/nested split consistent with each widget's nestId.
        std::vector<WidgetModel> allWidgets;
        allWidgets.reserve(next.model.mainItems.size() + next.model.nestedItems.size());
        for (auto* list : { &next.model.mainItems, &next.model.nestedItems })
            for (auto& widget : *list)
                allWidgets.push_back(std::move(widget));

        next.model.mainItems.clear();
        next.model.nestedItems.clear();
        for (auto& widget : allWidgets)
            (widget.nestId.has_value() ? next.model.nestedItems : next.model.mainItems).push_back(std::move(widget));

        if (rootProps.contains("gridSize"))
        {
            if (!isNumericVar(rootProps["gridSize"]))
                return GridResult::fail(GridError::parse, "gridSize must be numeric");
            next.model.gridSize = static_cast<float>(rootProps["gridSize"]);
        }

        if (const auto* viewportObject = rootProps["viewport"].getDynamicObject())
        {
            const auto& viewportProps = viewportObject->getProperties();
            for (const auto* key : { "x", "y", "zoom" })
            {
                if (!isNumericVar(viewportProps[key]))
                    return GridResult::fail(GridError::parse, juce::String("viewport.") + key + " must be numeric");
            }

            next.viewport.x = static_cast<float>(viewportProps["x"]);
            next.viewport.y = static_cast<float>(viewportProps["y"]);
            next.viewport.zoom = clampZoom(static_cast<float>(viewportProps["zoom"]));
        }

        if (rootProps.contains("exportedAt"))
            next.timestamp = timeFromIsoString(rootProps["exportedAt"].toString());
        else if (rootProps.contains("lastSaved"))
            next.timestamp = timeFromIsoString(rootProps["lastSaved"].toString());

        const auto validation = Core::GridValidator::validateGrid(next.model);
        if (validation.failed())
            return validation;

        documentOut = std::move(next);
        return GridResult::ok();
    }

    GridResult parseGridFromJsonString(const juce::String& json, GridDocument& documentOut)
    {
        juce::var root;
        const auto parseResult = juce::JSON::parse(json, root);
        if (parseResult.failed())
            return GridResult::fail(GridError::parse, "JSON parse error: " + parseResult.getErrorMessage());

        return parseGrid(root, documentOut);
    }

    juce::Result saveGridToFile(const juce::File& file,
                                const GridModel& model,
                                const Viewport& viewport,
                                juce::Time exportedAt)
    {
        juce::String json;
        const auto serialized = serializeGridToJsonString(model, viewport, TimestampField::exportedAt, exportedAt, json, false);
        if (serialized.failed())
            return serialized;

        const auto parent = file.getParentDirectory();
        if (!parent.exists())
        {
            const auto created = parent.createDirectory();
            if (created.failed())
                return created;
        }

        if (!file.replaceWithText(json))
            return juce::Result::fail("Failed to write file: " + file.getFullPathName());

        return juce::Result::ok();
    }

    GridResult loadGridFromFile(const juce::File& file, GridDocument& documentOut)
    {
        if (!file.existsAsFile())
            return GridResult::fail(GridError::notFound, "File not found: " + file.getFullPathName());

        return parseGridFromJsonString(file.loadFileAsString(), documentOut);
    }
}
