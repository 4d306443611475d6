#ifndef LAMINA_TEXT_HPP
#define LAMINA_TEXT_HPP

#include <cstddef>
#include <list>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/fwd.hpp"
#include "lamina/layer.hpp"
#include "lamina/services.hpp"

namespace lamina {

enum struct Removal : Default_Underlying {
    /// @brief Removal fails if other layers depend on the layer.
    restrict,
    /// @brief Layers depending on the layer are removed first, transitively.
    cascade,
};

/// @brief A raw string together with the layers attached to it.
/// Layer names are unique within a text,
/// and every layer is attached after the layer it depends on.
///
/// Attached layers refer to their text,
/// so a `Text` can neither be copied nor moved.
struct Text {
private:
    std::pmr::memory_resource* m_memory;
    Logger* m_logger;
    String m_text;
    std::pmr::list<Layer> m_layers;
    std::pmr::vector<Attribute> m_meta;

public:
    [[nodiscard]]
    Text(std::u8string_view text, std::pmr::memory_resource* memory, Logger& logger = ignorant_logger);

    Text(const Text&) = delete;
    Text& operator=(const Text&) = delete;

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const noexcept
    {
        return m_memory;
    }

    [[nodiscard]]
    Logger& get_logger() const noexcept
    {
        return *m_logger;
    }

    [[nodiscard]]
    std::u8string_view get_text() const noexcept
    {
        return m_text;
    }

    /// @brief Returns the text covered by `span`,
    /// or `index_out_of_range` if `span` exceeds the text.
    [[nodiscard]]
    Result<std::u8string_view, Annotation_Error> slice(const Span& span) const;

    /// @brief Attaches `layer`.
    /// The layer is audited against this text and its base layer,
    /// and the table of its foreign attributes is built.
    /// On failure, the text is left unchanged.
    Result<void, Consistency_Error> add_layer(Layer&& layer);

    /// @brief Removes the layer named `name`.
    /// With `Removal::restrict`, fails with `dependent_layers_exist`
    /// if other layers depend on it.
    Result<void, Annotation_Error> remove_layer(std::u8string_view name, Removal removal);

    [[nodiscard]]
    const Layer* find_layer(std::u8string_view name) const noexcept;

    /// @brief Like `find_layer`, but fails with `missing_dependency` if there is no such layer.
    [[nodiscard]]
    Result<const Layer*, Annotation_Error> layer(std::u8string_view name) const;

    [[nodiscard]]
    bool contains(std::u8string_view name) const noexcept
    {
        return find_layer(name) != nullptr;
    }

    /// @brief Returns the attached layers in attachment order.
    [[nodiscard]]
    const std::pmr::list<Layer>& layers() const noexcept
    {
        return m_layers;
    }

    [[nodiscard]]
    std::pmr::vector<std::u8string_view> layer_names(std::pmr::memory_resource* memory) const;

    /// @brief Returns the names of the layers which depend on the layer `name` directly,
    /// in attachment order.
    [[nodiscard]]
    std::pmr::vector<std::u8string_view>
    dependents_of(std::u8string_view name, std::pmr::memory_resource* memory) const;

    /// @brief Audits every layer depending on the layer `name`, transitively.
    [[nodiscard]]
    Result<void, Consistency_Error> check_dependents(std::u8string_view name) const;

    /// @brief Text-level metadata, such as the source of the text.
    [[nodiscard]]
    std::pmr::vector<Attribute>& meta() noexcept
    {
        return m_meta;
    }
    [[nodiscard]]
    const std::pmr::vector<Attribute>& meta() const noexcept
    {
        return m_meta;
    }

    /// @brief Returns the index of the span of the layer `child`
    /// which is aligned with the span at `parent_index` of the layer `parent`.
    /// If there is no such span, one is created with the default values of `child`.
    /// Fails with `wrong_topology` unless `child` is parent-attached to `parent`.
    Result<std::size_t, Annotation_Error>
    mark(std::u8string_view parent, std::size_t parent_index, std::u8string_view child);

private:
    friend Result<void, Consistency_Error>
    retag(Retagger& retagger, Text& text, std::pmr::memory_resource* memory);

    [[nodiscard]]
    Layer* find_mutable_layer(std::u8string_view name) noexcept;

    [[nodiscard]]
    std::pmr::vector<Foreign_Attribute> make_foreign_attributes(const Layer& layer) const;

    void erase_layer(std::u8string_view name);
};

} // namespace lamina

#endif
