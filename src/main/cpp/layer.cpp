#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/result.hpp"
#include "lamina/util/strings.hpp"

#include "lamina/annotation.hpp"
#include "lamina/annotation_error.hpp"
#include "lamina/layer.hpp"
#include "lamina/settings.hpp"
#include "lamina/span.hpp"
#include "lamina/text.hpp"

namespace lamina {

namespace {

[[nodiscard]]
bool is_valid_layer_name(std::u8string_view name)
{
    return is_ascii_identifier(name)
        && std::ranges::find(reserved_layer_names, name) == std::end(reserved_layer_names);
}

} // namespace

Result<void, Annotation_Error>
Layer::check_alignment_with_base(const Layer& base, Topology_Kind topology, const Base_Span& span)
{
    switch (topology) {
    case Topology_Kind::independent: return {};
    case Topology_Kind::parent: {
        if (!base.find(span.location)) {
            return Annotation_Error::no_matching_parent_span;
        }
        return {};
    }
    case Topology_Kind::enveloping: {
        for (const Span& child : span.children) {
            if (!base.find(child)) {
                return Annotation_Error::no_matching_enveloped_span;
            }
        }
        return {};
    }
    case Topology_Kind::fragment: {
        if (!base.find_containing(span.location)) {
            return Annotation_Error::no_matching_fragment_base;
        }
        return {};
    }
    }
    LAMINA_ASSERT_UNREACHABLE(u8"Invalid topology.");
}

Layer::Layer(std::pmr::memory_resource* const memory)
    : m_memory { memory }
    , m_name { memory }
    , m_attributes { memory }
    , m_topology { Topology_Kind::independent }
    , m_base { memory }
    , m_ambiguous { false }
    , m_default_values { memory }
    , m_spans { memory }
    , m_foreign_attributes { memory }
{
}

Result<Layer, Annotation_Error>
Layer::create(const Layer_Schema& schema, std::pmr::memory_resource* const memory)
{
    if (!is_valid_layer_name(schema.name)) {
        return Annotation_Error::invalid_layer_name;
    }
    if (schema.topology.is_dependent()) {
        if (!is_valid_layer_name(schema.topology.base) || schema.topology.base == schema.name) {
            return Annotation_Error::invalid_layer_name;
        }
    }
    else if (!schema.topology.base.empty()) {
        return Annotation_Error::invalid_layer_name;
    }

    Layer result { memory };
    result.m_name = schema.name;
    result.m_topology = schema.topology.kind;
    result.m_base = schema.topology.base;
    result.m_ambiguous = schema.ambiguous;

    for (const std::u8string_view attribute : schema.attributes) {
        if (!is_ascii_identifier(attribute)) {
            return Annotation_Error::invalid_attribute_name;
        }
        if (result.declares(attribute)) {
            return Annotation_Error::duplicate_attribute_name;
        }
        result.m_attributes.emplace_back(attribute);
    }

    result.m_default_values.resize(result.m_attributes.size());
    for (const Attribute& default_value : schema.default_values) {
        const std::optional<std::size_t> index = result.attribute_index(default_value.name);
        if (!index) {
            return Annotation_Error::unknown_attribute;
        }
        result.m_default_values[*index] = default_value.value;
    }

    return result;
}

Layer Layer::empty_copy() const
{
    Layer result { m_memory };
    result.m_name = m_name;
    result.m_attributes = m_attributes;
    result.m_topology = m_topology;
    result.m_base = m_base;
    result.m_ambiguous = m_ambiguous;
    result.m_default_values = m_default_values;
    result.m_foreign_attributes = m_foreign_attributes;
    result.m_text = m_text;
    return result;
}

std::optional<std::size_t> Layer::attribute_index(std::u8string_view attribute) const noexcept
{
    const auto it = std::ranges::find(m_attributes, attribute);
    if (it == m_attributes.end()) {
        return {};
    }
    return std::size_t(it - m_attributes.begin());
}

Result<const Attribute_Value*, Annotation_Error>
Layer::get_default(std::u8string_view name) const
{
    const std::optional<std::size_t> index = attribute_index(name);
    if (!index) {
        return Annotation_Error::unknown_attribute;
    }
    return &m_default_values[*index];
}

Result<Annotation, Annotation_Error>
Layer::make_annotation(std::span<const Attribute> attributes) const
{
    std::pmr::vector<const Attribute_Value*> values(m_attributes.size(), nullptr, m_memory);
    for (const Attribute& attribute : attributes) {
        const std::optional<std::size_t> index = attribute_index(attribute.name);
        if (!index || values[*index]) {
            return Annotation_Error::attribute_mismatch;
        }
        values[*index] = &attribute.value;
    }

    Annotation result { m_memory };
    for (std::size_t i = 0; i < m_attributes.size(); ++i) {
        result.set(m_attributes[i], values[i] ? *values[i] : m_default_values[i]);
    }
    return result;
}

Result<void, Annotation_Error> Layer::check_alignment(const Base_Span& span) const
{
    if (!m_text) {
        return {};
    }
    if (span.end() > m_text->get_text().size()) {
        return Annotation_Error::invalid_range;
    }
    if (m_topology == Topology_Kind::independent) {
        return {};
    }
    const Layer* const base = m_text->find_layer(m_base);
    if (!base) {
        return Annotation_Error::missing_dependency;
    }
    return check_alignment_with_base(*base, m_topology, span);
}

Result<void, Annotation_Error> Layer::insert(Base_Span&& span, Annotation&& annotation)
{
    const auto it = std::ranges::lower_bound(m_spans, span.location, {}, &Span_Entry::location);
    if (it != m_spans.end() && it->location() == span.location) {
        if (!m_ambiguous || it->base_span != span) {
            return Annotation_Error::duplicate_span;
        }
        it->annotations.push_back(std::move(annotation));
        return {};
    }
    const auto inserted = m_spans.emplace(it, std::move(span), m_memory);
    inserted->annotations.push_back(std::move(annotation));
    return {};
}

Result<void, Annotation_Error>
Layer::add_span(const Span& span, std::span<const Attribute> attributes)
{
    if (m_topology == Topology_Kind::enveloping) {
        return Annotation_Error::wrong_topology;
    }
    if (span.start >= span.end) {
        return Annotation_Error::invalid_range;
    }
    Result<Annotation, Annotation_Error> annotation = make_annotation(attributes);
    if (!annotation) {
        return annotation.error();
    }
    Base_Span base_span { span, m_memory };
    if (auto aligned = check_alignment(base_span); !aligned) {
        return aligned;
    }
    return insert(std::move(base_span), std::move(*annotation));
}

Result<void, Annotation_Error>
Layer::add_enveloping_span(std::span<const Span> children, std::span<const Attribute> attributes)
{
    if (m_topology != Topology_Kind::enveloping) {
        return Annotation_Error::wrong_topology;
    }
    Result<Base_Span, Annotation_Error> base_span = make_enveloping_span(children, m_memory);
    if (!base_span) {
        return base_span.error();
    }
    Result<Annotation, Annotation_Error> annotation = make_annotation(attributes);
    if (!annotation) {
        return annotation.error();
    }
    if (auto aligned = check_alignment(*base_span); !aligned) {
        return aligned;
    }
    return insert(std::move(*base_span), std::move(*annotation));
}

Result<void, Annotation_Error> Layer::from_records(std::span<const Annotation_Record> records)
{
    std::pmr::vector<Span_Entry> incoming { m_memory };
    incoming.reserve(records.size());

    for (const Annotation_Record& record : records) {
        const Base_Span& base_span = record.base_span;
        if (m_topology == Topology_Kind::enveloping) {
            if (!base_span.is_enveloping()) {
                return Annotation_Error::wrong_topology;
            }
            const Span extent { base_span.children.front().start, base_span.children.back().end };
            if (!children_are_contiguous(base_span.children) || extent != base_span.location) {
                return Annotation_Error::non_contiguous_children;
            }
        }
        else {
            if (base_span.is_enveloping()) {
                return Annotation_Error::wrong_topology;
            }
            if (base_span.start() >= base_span.end()) {
                return Annotation_Error::invalid_range;
            }
        }
        Result<Annotation, Annotation_Error> annotation = make_annotation(record.attributes);
        if (!annotation) {
            return annotation.error();
        }
        if (auto aligned = check_alignment(base_span); !aligned) {
            return aligned;
        }
        Span_Entry& entry = incoming.emplace_back(Base_Span { base_span }, m_memory);
        entry.annotations.push_back(std::move(*annotation));
    }

    std::ranges::stable_sort(incoming, {}, &Span_Entry::location);

    std::pmr::vector<Span_Entry> merged { m_memory };
    merged.reserve(m_spans.size() + incoming.size());

    const auto append = [&](Span_Entry&& entry) -> Result<void, Annotation_Error> {
        if (!merged.empty() && merged.back().location() == entry.location()) {
            if (!m_ambiguous || merged.back().base_span != entry.base_span) {
                return Annotation_Error::duplicate_span;
            }
            for (Annotation& annotation : entry.annotations) {
                merged.back().annotations.push_back(std::move(annotation));
            }
            return {};
        }
        merged.push_back(std::move(entry));
        return {};
    };

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < m_spans.size() || j < incoming.size()) {
        // On equal locations, existing entries come first.
        const bool take_existing = j == incoming.size()
            || (i < m_spans.size() && !(incoming[j].location() < m_spans[i].location()));
        Result<void, Annotation_Error> appended
            = take_existing ? append(Span_Entry { m_spans[i++] }) : append(std::move(incoming[j++]));
        if (!appended) {
            return appended;
        }
    }

    m_spans = std::move(merged);
    return {};
}

Result<void, Consistency_Error> Layer::replace_spans(std::pmr::vector<Span_Entry>&& spans)
{
    Layer candidate = empty_copy();
    candidate.m_spans = std::move(spans);
    if (auto consistent = candidate.check_span_consistency(); !consistent) {
        return consistent;
    }

    std::pmr::vector<Span_Entry> previous = std::move(m_spans);
    m_spans = std::move(candidate.m_spans);

    if constexpr (audit_dependents_on_change) {
        if (m_text && m_text->find_layer(m_name) == this) {
            if (auto dependents = m_text->check_dependents(m_name); !dependents) {
                m_spans = std::move(previous);
                return dependents;
            }
        }
    }
    return {};
}

std::optional<std::size_t> Layer::find(const Span& location) const noexcept
{
    const auto it = std::ranges::lower_bound(m_spans, location, {}, &Span_Entry::location);
    if (it == m_spans.end() || it->location() != location) {
        return {};
    }
    return std::size_t(it - m_spans.begin());
}

std::optional<std::size_t> Layer::find_containing(const Span& location) const noexcept
{
    // Entries starting after location.start cannot contain it.
    const auto last = std::ranges::upper_bound(
        m_spans, location.start, {}, [](const Span_Entry& e) { return e.location().start; }
    );
    for (auto it = m_spans.begin(); it != last; ++it) {
        if (it->location().contains(location)) {
            return std::size_t(it - m_spans.begin());
        }
    }
    return {};
}

Result<Span_View, Annotation_Error> Layer::at(std::ptrdiff_t index) const
{
    const auto size = std::ptrdiff_t(m_spans.size());
    if (index < 0) {
        index += size;
    }
    if (index < 0 || index >= size) {
        return Annotation_Error::index_out_of_range;
    }
    return Span_View { *this, std::size_t(index) };
}

void Layer::bind(const Text* text, std::pmr::vector<Foreign_Attribute>&& foreign_attributes)
{
    m_text = text;
    m_foreign_attributes = std::move(foreign_attributes);
}

bool operator==(const Layer& x, const Layer& y)
{
    return x.m_name == y.m_name //
        && x.m_attributes == y.m_attributes //
        && x.m_topology == y.m_topology //
        && x.m_base == y.m_base //
        && x.m_ambiguous == y.m_ambiguous //
        && x.m_default_values == y.m_default_values //
        && x.m_spans == y.m_spans;
}

// SPAN VIEW =======================================================================================

const Span_Entry& Span_View::entry() const noexcept
{
    return m_layer->spans()[m_index];
}

Result<std::u8string_view, Annotation_Error> Span_View::text() const
{
    const Text* const text = m_layer->get_text();
    if (!text) {
        return Annotation_Error::unbound;
    }
    if (base_span().is_enveloping()) {
        return Annotation_Error::wrong_topology;
    }
    return text->slice(location());
}

Result<std::pmr::vector<std::u8string_view>, Annotation_Error>
Span_View::texts(std::pmr::memory_resource* const memory) const
{
    const Text* const text = m_layer->get_text();
    if (!text) {
        return Annotation_Error::unbound;
    }
    std::pmr::vector<std::u8string_view> result { memory };
    const auto append = [&](const Span& span) -> Result<void, Annotation_Error> {
        Result<std::u8string_view, Annotation_Error> slice = text->slice(span);
        if (!slice) {
            return slice.error();
        }
        result.push_back(*slice);
        return {};
    };

    if (!base_span().is_enveloping()) {
        if (auto r = append(location()); !r) {
            return r.error();
        }
        return result;
    }
    for (const Span& child : base_span().children) {
        if (auto r = append(child); !r) {
            return r.error();
        }
    }
    return result;
}

Result<const Annotation*, Annotation_Error> Span_View::annotation() const
{
    if (m_layer->is_ambiguous()) {
        return Annotation_Error::wrong_topology;
    }
    return &annotations().front();
}

Result<const Attribute_Value*, Annotation_Error> Span_View::get(std::u8string_view name) const
{
    if (!m_layer->declares(name)) {
        return Annotation_Error::unknown_attribute;
    }
    if (const Attribute_Value* const value = annotations().front().find(name)) {
        return value;
    }
    return m_layer->get_default(name);
}

Result<const Attribute_Value*, Annotation_Error> Span_View::resolve(std::u8string_view name) const
{
    if (m_layer->declares(name)) {
        return get(name);
    }
    const std::span<const Foreign_Attribute> foreign = m_layer->foreign_attributes();
    const auto it = std::ranges::find(foreign, name, &Foreign_Attribute::name);
    if (it == foreign.end()) {
        return Annotation_Error::unknown_attribute;
    }
    const Text* const text = m_layer->get_text();
    if (!text) {
        return Annotation_Error::unbound;
    }

    const Layer* current = m_layer;
    std::size_t index = m_index;
    while (current->get_name() != it->layer) {
        const Layer* const base = text->find_layer(current->get_base());
        if (!base) {
            return Annotation_Error::missing_dependency;
        }
        const Span& location = current->spans()[index].location();
        std::optional<std::size_t> base_index;
        switch (current->get_topology_kind()) {
        case Topology_Kind::parent: {
            base_index = base->find(location);
            if (!base_index) {
                return Annotation_Error::no_matching_parent_span;
            }
            break;
        }
        case Topology_Kind::fragment: {
            base_index = base->find_containing(location);
            if (!base_index) {
                return Annotation_Error::no_matching_fragment_base;
            }
            break;
        }
        default: return Annotation_Error::wrong_topology;
        }
        current = base;
        index = *base_index;
    }
    return (*current)[index].get(name);
}

Result<std::pmr::vector<const Attribute_Value*>, Annotation_Error>
Span_View::resolve_children(std::u8string_view name, std::pmr::memory_resource* memory) const
{
    if (m_layer->get_topology_kind() != Topology_Kind::enveloping) {
        return Annotation_Error::wrong_topology;
    }
    const std::span<const Foreign_Attribute> foreign = m_layer->foreign_attributes();
    if (std::ranges::find(foreign, name, &Foreign_Attribute::name) == foreign.end()) {
        return Annotation_Error::unknown_attribute;
    }
    const Text* const text = m_layer->get_text();
    if (!text) {
        return Annotation_Error::unbound;
    }
    const Layer* const base = text->find_layer(m_layer->get_base());
    if (!base) {
        return Annotation_Error::missing_dependency;
    }

    std::pmr::vector<const Attribute_Value*> result { memory };
    result.reserve(base_span().children.size());
    for (const Span& child : base_span().children) {
        const std::optional<std::size_t> index = base->find(child);
        if (!index) {
            return Annotation_Error::no_matching_enveloped_span;
        }
        Result<const Attribute_Value*, Annotation_Error> value = (*base)[*index].resolve(name);
        if (!value) {
            return value.error();
        }
        result.push_back(*value);
    }
    return result;
}

} // namespace lamina
