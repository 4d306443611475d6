#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/util/result.hpp"
#include "lamina/util/severity.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/diagnostic.hpp"
#include "lamina/layer.hpp"
#include "lamina/services.hpp"
#include "lamina/text.hpp"

namespace lamina {

namespace {

[[nodiscard]]
Consistency_Error make_layer_error(
    Annotation_Error code,
    std::u8string_view layer,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u8string message { memory };
    message += u8"Layer \"";
    message += layer;
    message += u8"\": ";
    message += annotation_error_message(code);
    return { .code = code, .message = std::move(message) };
}

void log_layer_event(
    Logger& logger,
    Severity severity,
    std::u8string_view id,
    std::u8string_view verb,
    std::u8string_view layer,
    std::pmr::memory_resource* memory
)
{
    if (!logger.can_log(severity)) {
        return;
    }
    std::pmr::u8string message { memory };
    message += verb;
    message += u8" layer \"";
    message += layer;
    message += u8"\".";
    logger.log(severity, id, message);
}

} // namespace

Text::Text(std::u8string_view text, std::pmr::memory_resource* memory, Logger& logger)
    : m_memory { memory }
    , m_logger { &logger }
    , m_text { text, memory }
    , m_layers { memory }
    , m_meta { memory }
{
}

Result<std::u8string_view, Annotation_Error> Text::slice(const Span& span) const
{
    if (span.start > span.end || span.end > m_text.size()) {
        return Annotation_Error::index_out_of_range;
    }
    return std::u8string_view { m_text }.substr(span.start, span.length());
}

const Layer* Text::find_layer(std::u8string_view name) const noexcept
{
    const auto it = std::ranges::find(m_layers, name, &Layer::get_name);
    return it == m_layers.end() ? nullptr : &*it;
}

Layer* Text::find_mutable_layer(std::u8string_view name) noexcept
{
    const auto it = std::ranges::find(m_layers, name, &Layer::get_name);
    return it == m_layers.end() ? nullptr : &*it;
}

Result<const Layer*, Annotation_Error> Text::layer(std::u8string_view name) const
{
    if (const Layer* const result = find_layer(name)) {
        return result;
    }
    return Annotation_Error::missing_dependency;
}

std::pmr::vector<std::u8string_view> Text::layer_names(std::pmr::memory_resource* memory) const
{
    std::pmr::vector<std::u8string_view> result { memory };
    result.reserve(m_layers.size());
    for (const Layer& layer : m_layers) {
        result.push_back(layer.get_name());
    }
    return result;
}

std::pmr::vector<std::u8string_view>
Text::dependents_of(std::u8string_view name, std::pmr::memory_resource* memory) const
{
    std::pmr::vector<std::u8string_view> result { memory };
    for (const Layer& layer : m_layers) {
        if (layer.get_topology().is_dependent() && layer.get_base() == name) {
            result.push_back(layer.get_name());
        }
    }
    return result;
}

Result<void, Consistency_Error> Text::check_dependents(std::u8string_view name) const
{
    for (const std::u8string_view dependent : dependents_of(name, m_memory)) {
        const Layer* const layer = find_layer(dependent);
        LAMINA_ASSERT(layer);
        if (auto consistent = layer->check_span_consistency(); !consistent) {
            return consistent;
        }
        if (auto consistent = check_dependents(dependent); !consistent) {
            return consistent;
        }
    }
    return {};
}

std::pmr::vector<Foreign_Attribute> Text::make_foreign_attributes(const Layer& layer) const
{
    std::pmr::vector<Foreign_Attribute> result { m_memory };
    const Topology_Kind topology = layer.get_topology_kind();
    if (topology == Topology_Kind::independent) {
        return result;
    }
    const Layer* const base = find_layer(layer.get_base());
    LAMINA_ASSERT(base);

    const auto add = [&](std::u8string_view name, std::u8string_view owner) {
        if (layer.declares(name)
            || std::ranges::find(result, name, &Foreign_Attribute::name) != result.end()) {
            return;
        }
        result.push_back({ String { name, m_memory }, String { owner, m_memory } });
    };
    for (const String& attribute : base->get_attributes()) {
        add(attribute, base->get_name());
    }
    // Foreign attributes of an enveloping base have no single value per span.
    if (base->get_topology_kind() != Topology_Kind::enveloping) {
        for (const Foreign_Attribute& attribute : base->foreign_attributes()) {
            add(attribute.name, attribute.layer);
        }
    }
    return result;
}

Result<void, Consistency_Error> Text::add_layer(Layer&& layer)
{
    const auto reject = [&](Consistency_Error&& error) -> Result<void, Consistency_Error> {
        m_logger->log(Severity::error, diagnostic::layer_attach_rejected, error.message);
        return std::move(error);
    };

    if (layer.get_text() && layer.get_text() != this) {
        return reject(make_layer_error(Annotation_Error::already_bound, layer.get_name(), m_memory)
        );
    }
    if (contains(layer.get_name())) {
        return reject(
            make_layer_error(Annotation_Error::layer_name_collision, layer.get_name(), m_memory)
        );
    }
    if (layer.get_topology().is_dependent() && !contains(layer.get_base())) {
        return reject(
            make_layer_error(Annotation_Error::missing_dependency, layer.get_name(), m_memory)
        );
    }
    if (auto consistent = layer.check_span_consistency(this); !consistent) {
        return reject(std::move(consistent).error());
    }

    std::pmr::vector<Foreign_Attribute> foreign_attributes = make_foreign_attributes(layer);
    Layer& attached = m_layers.emplace_back(std::move(layer));
    attached.bind(this, std::move(foreign_attributes));

    log_layer_event(
        *m_logger, Severity::debug, diagnostic::layer_attach, u8"Attached", attached.get_name(),
        m_memory
    );
    return {};
}

void Text::erase_layer(std::u8string_view name)
{
    const auto it = std::ranges::find(m_layers, name, &Layer::get_name);
    LAMINA_ASSERT(it != m_layers.end());
    log_layer_event(
        *m_logger, Severity::debug, diagnostic::layer_remove, u8"Removed", name, m_memory
    );
    m_layers.erase(it);
}

Result<void, Annotation_Error> Text::remove_layer(std::u8string_view name, Removal removal)
{
    if (!contains(name)) {
        return Annotation_Error::missing_dependency;
    }
    if (removal == Removal::restrict) {
        if (!dependents_of(name, m_memory).empty()) {
            return Annotation_Error::dependent_layers_exist;
        }
        erase_layer(name);
        return {};
    }

    // Every layer has at most one base, so the dependents form a tree.
    // Breadth-first order lists every layer before its dependents.
    std::pmr::vector<String> doomed { m_memory };
    doomed.emplace_back(name);
    for (std::size_t i = 0; i < doomed.size(); ++i) {
        for (const std::u8string_view dependent : dependents_of(doomed[i], m_memory)) {
            doomed.emplace_back(dependent);
        }
    }
    for (const String& layer : std::views::reverse(doomed)) {
        erase_layer(layer);
    }
    return {};
}

Result<std::size_t, Annotation_Error>
Text::mark(std::u8string_view parent, std::size_t parent_index, std::u8string_view child)
{
    const Layer* const parent_layer = find_layer(parent);
    Layer* const child_layer = find_mutable_layer(child);
    if (!parent_layer || !child_layer) {
        return Annotation_Error::missing_dependency;
    }
    if (child_layer->get_topology_kind() != Topology_Kind::parent
        || child_layer->get_base() != parent) {
        return Annotation_Error::wrong_topology;
    }
    if (parent_index >= parent_layer->size()) {
        return Annotation_Error::index_out_of_range;
    }

    const Span location = parent_layer->spans()[parent_index].location();
    if (const std::optional<std::size_t> existing = child_layer->find(location)) {
        return *existing;
    }
    if (auto added = child_layer->add_span(location); !added) {
        return added.error();
    }
    const std::optional<std::size_t> created = child_layer->find(location);
    LAMINA_ASSERT(created);
    return *created;
}

} // namespace lamina
