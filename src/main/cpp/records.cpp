#include <algorithm>
#include <cstddef>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/function_ref.hpp"
#include "lamina/util/result.hpp"
#include "lamina/util/severity.hpp"

#include "lamina/annotation.hpp"
#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/diagnostic.hpp"
#include "lamina/json.hpp"
#include "lamina/layer.hpp"
#include "lamina/records.hpp"
#include "lamina/services.hpp"
#include "lamina/span.hpp"
#include "lamina/text.hpp"

namespace lamina {

namespace {

constexpr std::u8string_view layer_record_keys[] {
    u8"name",     u8"attributes", u8"parent",         u8"enveloping",
    u8"fragment", u8"ambiguous",  u8"default_values", u8"spans",
};

constexpr std::u8string_view span_record_keys[] { u8"base_span", u8"annotations" };

constexpr std::u8string_view text_record_keys[] { u8"text", u8"meta", u8"layers" };

[[nodiscard]]
Consistency_Error make_record_error(
    Annotation_Error code,
    std::u8string_view what,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string message { memory };
    message += u8"Malformed record: ";
    message += what;
    message += u8" (";
    message += annotation_error_message(code);
    message += u8')';
    return { .code = code, .message = std::move(message) };
}

[[nodiscard]]
Consistency_Error malformed(std::u8string_view what, std::pmr::memory_resource* memory)
{
    return make_record_error(Annotation_Error::malformed_record, what, memory);
}

/// @brief Returns `true` if every key of `object` is one of `keys`
/// and no key appears twice.
[[nodiscard]]
bool has_only_keys(const json::Object& object, std::span<const std::u8string_view> keys)
{
    for (std::size_t i = 0; i < object.size(); ++i) {
        const std::u8string_view key = object[i].key;
        if (std::ranges::find(keys, key) == keys.end()) {
            return false;
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (object[j].key == key) {
                return false;
            }
        }
    }
    return true;
}

/// @brief Returns `true` if the keys of `object` are exactly `keys`, in the same order.
[[nodiscard]]
bool has_keys_in_order(const json::Object& object, std::span<const std::u8string_view> keys)
{
    return std::ranges::equal(object, keys, [](const json::Member& member, std::u8string_view key) {
        return member.key == key;
    });
}

[[nodiscard]]
json::Value make_span_record(const Span& span, std::pmr::memory_resource* memory)
{
    json::Array result { memory };
    result.emplace_back(Integer(span.start));
    result.emplace_back(Integer(span.end));
    return result;
}

[[nodiscard]]
json::Value make_base_span_record(const Base_Span& span, std::pmr::memory_resource* memory)
{
    if (!span.is_enveloping()) {
        return make_span_record(span.location, memory);
    }
    json::Array result { memory };
    for (const Span& child : span.children) {
        result.push_back(make_span_record(child, memory));
    }
    return result;
}

[[nodiscard]]
json::Value make_nullable_name(std::u8string_view name, std::pmr::memory_resource* memory)
{
    if (name.empty()) {
        return json::null;
    }
    return json::String { name, memory };
}

[[nodiscard]]
std::optional<Span> parse_span(const json::Value& value)
{
    const json::Array* const pair = value.as_array();
    if (!pair || pair->size() != 2) {
        return {};
    }
    const Integer* const start = (*pair)[0].as_integer();
    const Integer* const end = (*pair)[1].as_integer();
    if (!start || !end) {
        return {};
    }
    const Result<Span, Annotation_Error> result = make_span(*start, *end);
    if (!result) {
        return {};
    }
    return *result;
}

[[nodiscard]]
Result<Base_Span, Consistency_Error>
parse_base_span(const json::Value& value, std::pmr::memory_resource* memory)
{
    const json::Array* const array = value.as_array();
    if (!array || array->empty()) {
        return malformed(u8"\"base_span\" has to be a non-empty array", memory);
    }
    if (!array->front().as_array()) {
        if (const std::optional<Span> span = parse_span(value)) {
            return Base_Span { *span, memory };
        }
        return make_record_error(
            Annotation_Error::invalid_range, u8"\"base_span\" is not a valid span", memory
        );
    }

    std::pmr::vector<Span> children { memory };
    children.reserve(array->size());
    for (const json::Value& child : *array) {
        const std::optional<Span> span = parse_span(child);
        if (!span) {
            return make_record_error(
                Annotation_Error::invalid_range, u8"a child of \"base_span\" is not a valid span",
                memory
            );
        }
        children.push_back(*span);
    }
    Result<Base_Span, Annotation_Error> result = make_enveloping_span(children, memory);
    if (!result) {
        return make_record_error(result.error(), u8"\"base_span\" has invalid children", memory);
    }
    return std::move(*result);
}

[[nodiscard]]
Result<std::pmr::vector<Attribute>, Consistency_Error>
parse_attributes(const json::Object& object, std::pmr::memory_resource* memory)
{
    std::pmr::vector<Attribute> result { memory };
    result.reserve(object.size());
    for (const json::Member& member : object) {
        std::optional<Attribute_Value> value = json::to_attribute_value(member.value, memory);
        if (!value) {
            return malformed(u8"attribute values have to be scalars", memory);
        }
        result.push_back({ String { member.key, memory }, std::move(*value) });
    }
    return result;
}

[[nodiscard]]
json::Value make_attribute_object(
    std::span<const Attribute> attributes,
    std::pmr::memory_resource* memory
)
{
    json::Object result { memory };
    for (const Attribute& attribute : attributes) {
        result.emplace(attribute.name, json::to_json(attribute.value, memory));
    }
    return result;
}

struct Topology_Record {
    Topology topology;
    bool valid = true;
};

[[nodiscard]]
Topology_Record parse_topology(const json::Object& record)
{
    constexpr std::pair<std::u8string_view, Topology_Kind> kinds[] {
        { u8"parent", Topology_Kind::parent },
        { u8"enveloping", Topology_Kind::enveloping },
        { u8"fragment", Topology_Kind::fragment },
    };
    Topology_Record result;
    for (const auto& [key, kind] : kinds) {
        const json::Value* const value = record.find_value(key);
        if (!value || value->as_null()) {
            result.valid &= value != nullptr;
            continue;
        }
        const json::String* const base = value->as_string();
        if (!base || result.topology.is_dependent()) {
            result.valid = false;
            continue;
        }
        result.topology = { kind, *base };
    }
    return result;
}

} // namespace

json::Value layer_to_record(const Layer& layer, std::pmr::memory_resource* memory)
{
    const Topology topology = layer.get_topology();
    const auto base_if = [&](Topology_Kind kind) -> json::Value {
        const std::u8string_view base = topology.kind == kind ? topology.base : std::u8string_view {};
        return make_nullable_name(base, memory);
    };

    json::Array attributes { memory };
    json::Object default_values { memory };
    for (std::size_t i = 0; i < layer.get_attributes().size(); ++i) {
        const String& name = layer.get_attributes()[i];
        attributes.emplace_back(json::String { name, memory });
        default_values.emplace(name, json::to_json(layer.get_default_values()[i], memory));
    }

    json::Array spans { memory };
    spans.reserve(layer.size());
    for (const Span_Entry& entry : layer.spans()) {
        json::Array annotations { memory };
        for (const Annotation& annotation : entry.annotations) {
            json::Object values { memory };
            for (const String& name : layer.get_attributes()) {
                const Attribute_Value* const value = annotation.find(name);
                LAMINA_ASSERT(value);
                values.emplace(name, json::to_json(*value, memory));
            }
            annotations.emplace_back(std::move(values));
        }
        json::Object span_record { memory };
        span_record.emplace(u8"base_span", make_base_span_record(entry.base_span, memory));
        span_record.emplace(u8"annotations", std::move(annotations));
        spans.emplace_back(std::move(span_record));
    }

    json::Object result { memory };
    result.emplace(u8"name", json::String { layer.get_name(), memory });
    result.emplace(u8"attributes", std::move(attributes));
    result.emplace(u8"parent", base_if(Topology_Kind::parent));
    result.emplace(u8"enveloping", base_if(Topology_Kind::enveloping));
    result.emplace(u8"fragment", base_if(Topology_Kind::fragment));
    result.emplace(u8"ambiguous", layer.is_ambiguous());
    result.emplace(u8"default_values", std::move(default_values));
    result.emplace(u8"spans", std::move(spans));
    return result;
}

Result<Layer, Consistency_Error>
record_to_layer(const json::Value& record, std::pmr::memory_resource* memory)
{
    const json::Object* const object = record.as_object();
    if (!object) {
        return malformed(u8"a layer record has to be an object", memory);
    }
    if (!has_only_keys(*object, layer_record_keys)) {
        return malformed(u8"a layer record has unknown or repeated members", memory);
    }

    const json::String* const name = object->find_string(u8"name");
    const json::Array* const attribute_array = object->find_array(u8"attributes");
    const bool* const ambiguous = object->find_bool(u8"ambiguous");
    const json::Object* const default_object = object->find_object(u8"default_values");
    const json::Array* const span_array = object->find_array(u8"spans");
    if (!name || !attribute_array || !ambiguous || !default_object || !span_array) {
        return malformed(u8"a layer record lacks a member or has one of the wrong type", memory);
    }
    const Topology_Record topology = parse_topology(*object);
    if (!topology.valid) {
        return malformed(
            u8"\"parent\", \"enveloping\", and \"fragment\" have to be null or a string, "
            u8"and at most one of them may be a string",
            memory
        );
    }

    std::pmr::vector<std::u8string_view> attribute_names { memory };
    attribute_names.reserve(attribute_array->size());
    for (const json::Value& attribute : *attribute_array) {
        const json::String* const attribute_name = attribute.as_string();
        if (!attribute_name) {
            return malformed(u8"attribute names have to be strings", memory);
        }
        attribute_names.push_back(*attribute_name);
    }

    Result<std::pmr::vector<Attribute>, Consistency_Error> default_values
        = parse_attributes(*default_object, memory);
    if (!default_values) {
        return std::move(default_values).error();
    }

    const Layer_Schema schema { .name = *name,
                                .attributes = attribute_names,
                                .topology = topology.topology,
                                .ambiguous = *ambiguous,
                                .default_values = *default_values };
    Result<Layer, Annotation_Error> layer = Layer::create(schema, memory);
    if (!layer) {
        return make_record_error(layer.error(), u8"the layer schema is invalid", memory);
    }
    if (!has_keys_in_order(*default_object, attribute_names)) {
        return malformed(
            u8"\"default_values\" has to hold every declared attribute in declaration order",
            memory
        );
    }

    std::pmr::vector<Span_Entry> entries { memory };
    entries.reserve(span_array->size());
    for (const json::Value& span : *span_array) {
        const json::Object* const span_object = span.as_object();
        if (!span_object || !has_only_keys(*span_object, span_record_keys)) {
            return malformed(u8"a span record has to be an object with known members", memory);
        }
        const json::Value* const base_span_value = span_object->find_value(u8"base_span");
        const json::Array* const annotation_array = span_object->find_array(u8"annotations");
        if (!base_span_value || !annotation_array) {
            return malformed(u8"a span record needs \"base_span\" and \"annotations\"", memory);
        }

        Result<Base_Span, Consistency_Error> base_span = parse_base_span(*base_span_value, memory);
        if (!base_span) {
            return std::move(base_span).error();
        }
        Span_Entry& entry = entries.emplace_back(std::move(*base_span), memory);
        entry.annotations.reserve(annotation_array->size());
        for (const json::Value& annotation : *annotation_array) {
            const json::Object* const annotation_object = annotation.as_object();
            if (!annotation_object) {
                return malformed(u8"annotations have to be objects", memory);
            }
            if (!has_keys_in_order(*annotation_object, attribute_names)) {
                return malformed(
                    u8"annotations have to hold every declared attribute in declaration order",
                    memory
                );
            }
            Result<std::pmr::vector<Attribute>, Consistency_Error> attributes
                = parse_attributes(*annotation_object, memory);
            if (!attributes) {
                return std::move(attributes).error();
            }
            entry.annotations.emplace_back(*attributes, memory);
        }
    }

    // The audit of replace_spans rejects unsorted and duplicate entries.
    if (auto replaced = layer->replace_spans(std::move(entries)); !replaced) {
        return std::move(replaced).error();
    }
    return std::move(*layer);
}

json::Value text_to_record(const Text& text, std::pmr::memory_resource* memory)
{
    json::Array layers { memory };
    for (const Layer& layer : text.layers()) {
        layers.push_back(layer_to_record(layer, memory));
    }

    json::Object result { memory };
    result.emplace(u8"text", json::String { text.get_text(), memory });
    result.emplace(u8"meta", make_attribute_object(text.meta(), memory));
    result.emplace(u8"layers", std::move(layers));
    return result;
}

Result<std::unique_ptr<Text>, Consistency_Error> record_to_text(
    const json::Value& record,
    std::pmr::memory_resource* memory,
    Logger& logger
)
{
    auto accept_all = [](std::u8string_view) { return true; };
    return record_to_text(record, memory, logger, accept_all);
}

Result<std::unique_ptr<Text>, Consistency_Error> record_to_text(
    const json::Value& record,
    std::pmr::memory_resource* memory,
    Logger& logger,
    Function_Ref<bool(std::u8string_view)> layer_filter
)
{
    const auto reject = [&](Consistency_Error&& error
                        ) -> Result<std::unique_ptr<Text>, Consistency_Error> {
        logger.log(Severity::error, diagnostic::record_malformed, error.message);
        return std::move(error);
    };

    const json::Object* const object = record.as_object();
    if (!object || !has_only_keys(*object, text_record_keys)) {
        return reject(malformed(u8"a text record has to be an object with known members", memory)
        );
    }
    const json::String* const source = object->find_string(u8"text");
    const json::Object* const meta = object->find_object(u8"meta");
    const json::Array* const layers = object->find_array(u8"layers");
    if (!source || !meta || !layers) {
        return reject(
            malformed(u8"a text record needs \"text\", \"meta\", and \"layers\"", memory)
        );
    }

    Result<std::pmr::vector<Attribute>, Consistency_Error> meta_attributes
        = parse_attributes(*meta, memory);
    if (!meta_attributes) {
        return reject(std::move(meta_attributes).error());
    }

    auto result = std::make_unique<Text>(*source, memory, logger);
    result->meta() = std::move(*meta_attributes);

    std::pmr::vector<String> skipped { memory };
    for (const json::Value& layer_record : *layers) {
        Result<Layer, Consistency_Error> layer = record_to_layer(layer_record, memory);
        if (!layer) {
            return reject(std::move(layer).error());
        }
        const bool base_skipped = layer->get_topology().is_dependent()
            && std::ranges::find(skipped, layer->get_base()) != skipped.end();
        if (base_skipped || !layer_filter(layer->get_name())) {
            skipped.emplace_back(layer->get_name());
            continue;
        }
        // Rejected attachments are logged by the text itself.
        if (auto attached = result->add_layer(std::move(*layer)); !attached) {
            return std::move(attached).error();
        }
    }
    return result;
}

} // namespace lamina
