#ifndef LAMINA_LAYER_HPP
#define LAMINA_LAYER_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/function_ref.hpp"
#include "lamina/util/result.hpp"

#include "lamina/annotation.hpp"
#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/fwd.hpp"
#include "lamina/span.hpp"

namespace lamina {

enum struct Topology_Kind : Default_Underlying {
    /// @brief The layer has its own elementary spans.
    independent,
    /// @brief Every span equals a span of the base layer and adds attributes to it.
    parent,
    /// @brief Every span wraps an ordered run of spans of the base layer.
    enveloping,
    /// @brief Every span is elementary and lies inside some span of the base layer.
    fragment,
};

[[nodiscard]]
constexpr std::u8string_view topology_kind_name(Topology_Kind kind)
{
    using enum Topology_Kind;
    switch (kind) {
        LAMINA_ENUM_STRING_CASE8(independent);
        LAMINA_ENUM_STRING_CASE8(parent);
        LAMINA_ENUM_STRING_CASE8(enveloping);
        LAMINA_ENUM_STRING_CASE8(fragment);
    }
    LAMINA_ASSERT_UNREACHABLE(u8"Invalid topology.");
}

/// @brief The topology of a layer together with the name of the layer it depends on.
/// `base` is empty exactly when `kind` is `independent`.
struct Topology {
    Topology_Kind kind = Topology_Kind::independent;
    std::u8string_view base;

    [[nodiscard]]
    static constexpr Topology independent() noexcept
    {
        return {};
    }
    [[nodiscard]]
    static constexpr Topology parent(std::u8string_view base) noexcept
    {
        return { Topology_Kind::parent, base };
    }
    [[nodiscard]]
    static constexpr Topology enveloping(std::u8string_view base) noexcept
    {
        return { Topology_Kind::enveloping, base };
    }
    [[nodiscard]]
    static constexpr Topology fragment(std::u8string_view base) noexcept
    {
        return { Topology_Kind::fragment, base };
    }

    [[nodiscard]]
    constexpr bool is_dependent() const noexcept
    {
        return kind != Topology_Kind::independent;
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Topology&, const Topology&)
        = default;
};

/// @brief The immutable part of a layer, given on creation.
struct Layer_Schema {
    std::u8string_view name;
    /// @brief The declared attributes, in order.
    std::span<const std::u8string_view> attributes;
    Topology topology = Topology::independent();
    /// @brief If `true`, one span location may hold multiple annotations.
    bool ambiguous = false;
    /// @brief Values used for declared attributes which are not given explicitly.
    /// Attributes without a default value default to `null`.
    std::span<const Attribute> default_values;
};

/// @brief A span location of a layer and the annotations attached to it.
struct Span_Entry {
    Base_Span base_span;
    std::pmr::vector<Annotation> annotations;

    [[nodiscard]]
    Span_Entry(Base_Span&& base_span, std::pmr::memory_resource* memory)
        : base_span { std::move(base_span) }
        , annotations { memory }
    {
    }

    [[nodiscard]]
    const Span& location() const noexcept
    {
        return base_span.location;
    }

    [[nodiscard]]
    friend bool operator==(const Span_Entry&, const Span_Entry&)
        = default;
};

/// @brief An attribute that spans of a layer can resolve
/// through the chain of layers they are attached to.
struct Foreign_Attribute {
    String name;
    /// @brief The name of the layer which declares the attribute.
    String layer;

    [[nodiscard]]
    friend bool operator==(const Foreign_Attribute&, const Foreign_Attribute&)
        = default;
};

/// @brief Whether an indexing operation may produce an empty layer.
enum struct Selection : Default_Underlying {
    allow_empty,
    /// @brief An empty result fails with `Annotation_Error::empty_selection`.
    forbid_empty,
};

/// @brief The values of one attribute, one per span.
using Attribute_List = std::pmr::vector<Attribute_Value>;
/// @brief The values of one attribute, one row per span and one value per annotation.
using Ambiguous_Attribute_List = std::pmr::vector<std::pmr::vector<Attribute_Value>>;

/// @brief The values of one attribute across a layer.
/// Unambiguous layers produce an `Attribute_List`,
/// ambiguous layers an `Ambiguous_Attribute_List`.
using Attribute_Column = std::variant<Attribute_List, Ambiguous_Attribute_List>;

struct Value_Count {
    Attribute_Value value;
    std::size_t count;

    [[nodiscard]]
    friend bool operator==(const Value_Count&, const Value_Count&)
        = default;
};

/// @brief A read-only view of the span entry at some index of a layer.
/// The view is invalidated by any change to the layer.
struct Span_View {
private:
    const Layer* m_layer;
    std::size_t m_index;

public:
    [[nodiscard]]
    constexpr Span_View(const Layer& layer, std::size_t index) noexcept
        : m_layer { &layer }
        , m_index { index }
    {
    }

    [[nodiscard]]
    constexpr const Layer& layer() const noexcept
    {
        return *m_layer;
    }

    [[nodiscard]]
    constexpr std::size_t index() const noexcept
    {
        return m_index;
    }

    [[nodiscard]]
    const Span_Entry& entry() const noexcept;

    [[nodiscard]]
    const Base_Span& base_span() const noexcept
    {
        return entry().base_span;
    }

    [[nodiscard]]
    const Span& location() const noexcept
    {
        return entry().location();
    }

    [[nodiscard]]
    std::size_t start() const noexcept
    {
        return location().start;
    }

    [[nodiscard]]
    std::size_t end() const noexcept
    {
        return location().end;
    }

    /// @brief Returns the text covered by this elementary span.
    /// Fails with `unbound` if the layer is not attached to a text,
    /// and with `wrong_topology` if the span is enveloping.
    [[nodiscard]]
    Result<std::u8string_view, Annotation_Error> text() const;

    /// @brief Returns the texts of the children of an enveloping span in order,
    /// or the text of an elementary span as the only element.
    /// Fails with `unbound` if the layer is not attached to a text.
    [[nodiscard]]
    Result<std::pmr::vector<std::u8string_view>, Annotation_Error>
    texts(std::pmr::memory_resource* memory) const;

    [[nodiscard]]
    std::span<const Annotation> annotations() const noexcept
    {
        return entry().annotations;
    }

    /// @brief Returns the only annotation of a span in an unambiguous layer.
    /// Fails with `wrong_topology` if the layer is ambiguous.
    [[nodiscard]]
    Result<const Annotation*, Annotation_Error> annotation() const;

    /// @brief Returns the value of `name` in the first annotation.
    /// Fails with `unknown_attribute` if the layer does not declare `name`.
    [[nodiscard]]
    Result<const Attribute_Value*, Annotation_Error> get(std::u8string_view name) const;

    /// @brief Like `get`, but also resolves foreign attributes
    /// through the layers this layer is attached to.
    /// Fails with `wrong_topology` for foreign attributes of enveloping spans,
    /// which have one value per child; see `resolve_children`.
    [[nodiscard]]
    Result<const Attribute_Value*, Annotation_Error> resolve(std::u8string_view name) const;

    /// @brief Resolves the foreign attribute `name` for every child of an enveloping span,
    /// in child order.
    /// Fails with
    /// - `wrong_topology` if the layer is not enveloping,
    /// - `unknown_attribute` if `name` is not a foreign attribute of the layer,
    /// - `unbound` if the layer is not attached to a text,
    /// - `no_matching_enveloped_span` if a child is not a span of the enveloped layer.
    [[nodiscard]]
    Result<std::pmr::vector<const Attribute_Value*>, Annotation_Error>
    resolve_children(std::u8string_view name, std::pmr::memory_resource* memory) const;
};

/// @brief A named, ordered collection of span entries with a fixed schema.
/// Span entries are strictly increasing by location,
/// and no two entries share a location.
struct Layer {
private:
    std::pmr::memory_resource* m_memory;
    String m_name;
    std::pmr::vector<String> m_attributes;
    Topology_Kind m_topology;
    String m_base;
    bool m_ambiguous;
    /// @brief One default value per declared attribute, in declaration order.
    std::pmr::vector<Attribute_Value> m_default_values;
    std::pmr::vector<Span_Entry> m_spans;
    std::pmr::vector<Foreign_Attribute> m_foreign_attributes;
    const Text* m_text = nullptr;

    [[nodiscard]]
    explicit Layer(std::pmr::memory_resource* memory);

public:
    /// @brief Creates an empty, unbound layer.
    /// Fails with
    /// - `invalid_layer_name` if the name or base name is not an identifier,
    /// is reserved, or the layer would depend on itself,
    /// - `invalid_attribute_name` if an attribute name is not an identifier,
    /// - `duplicate_attribute_name` if an attribute is declared twice,
    /// - `unknown_attribute` if a default value is given for an undeclared attribute.
    [[nodiscard]]
    static Result<Layer, Annotation_Error>
    create(const Layer_Schema& schema, std::pmr::memory_resource* memory);

    /// @brief Returns a layer with the same schema and text, but no spans.
    [[nodiscard]]
    Layer empty_copy() const;

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const noexcept
    {
        return m_memory;
    }

    [[nodiscard]]
    std::u8string_view get_name() const noexcept
    {
        return m_name;
    }

    [[nodiscard]]
    std::span<const String> get_attributes() const noexcept
    {
        return m_attributes;
    }

    [[nodiscard]]
    bool declares(std::u8string_view attribute) const noexcept
    {
        return attribute_index(attribute).has_value();
    }

    [[nodiscard]]
    std::optional<std::size_t> attribute_index(std::u8string_view attribute) const noexcept;

    [[nodiscard]]
    Topology get_topology() const noexcept
    {
        return { m_topology, m_base };
    }

    [[nodiscard]]
    Topology_Kind get_topology_kind() const noexcept
    {
        return m_topology;
    }

    /// @brief Returns the name of the layer this layer depends on,
    /// or an empty string for independent layers.
    [[nodiscard]]
    std::u8string_view get_base() const noexcept
    {
        return m_base;
    }

    [[nodiscard]]
    bool is_ambiguous() const noexcept
    {
        return m_ambiguous;
    }

    [[nodiscard]]
    bool is_bound() const noexcept
    {
        return m_text != nullptr;
    }

    [[nodiscard]]
    const Text* get_text() const noexcept
    {
        return m_text;
    }

    /// @brief Returns the default value of the declared attribute `name`.
    [[nodiscard]]
    Result<const Attribute_Value*, Annotation_Error> get_default(std::u8string_view name) const;

    [[nodiscard]]
    std::span<const Attribute_Value> get_default_values() const noexcept
    {
        return m_default_values;
    }

    /// @brief The attributes that spans of this layer can resolve through the layers
    /// they are attached to.
    /// This table is built when the layer is attached to a text.
    [[nodiscard]]
    std::span<const Foreign_Attribute> foreign_attributes() const noexcept
    {
        return m_foreign_attributes;
    }

    // MUTATION ====================================================================================

    /// @brief Adds an annotation at the elementary span `span`.
    /// Declared attributes that are not given receive their default value.
    /// In an ambiguous layer, the annotation is appended to an existing entry at `span`.
    /// Fails with
    /// - `wrong_topology` if this is an enveloping layer,
    /// - `invalid_range` if `span` is empty,
    /// - `attribute_mismatch` if an undeclared attribute is given, or one is given twice,
    /// - `duplicate_span` if this layer is unambiguous and already contains `span`,
    /// - `no_matching_parent_span` or `no_matching_fragment_base`
    /// if the layer is bound and `span` does not align with the base layer.
    Result<void, Annotation_Error>
    add_span(const Span& span, std::span<const Attribute> attributes = {});

    /// @brief Adds an annotation at the enveloping span made of `children`.
    /// Fails like `add_span`, and additionally with
    /// - `non_contiguous_children` if `children` are empty, unordered, or overlapping,
    /// - `no_matching_enveloped_span` if the layer is bound
    /// and a child is not a span of the enveloped layer.
    Result<void, Annotation_Error>
    add_enveloping_span(std::span<const Span> children, std::span<const Attribute> attributes = {});

    /// @brief Adds all `records` as if by repeated `add_span` or `add_enveloping_span`,
    /// but sorts only once.
    /// Either all records are added, or none.
    Result<void, Annotation_Error> from_records(std::span<const Annotation_Record> records);

    /// @brief Replaces all span entries at once.
    /// The new entries are audited as if by `check_span_consistency`
    /// before they become visible;
    /// on failure, the layer is left unchanged.
    Result<void, Consistency_Error> replace_spans(std::pmr::vector<Span_Entry>&& spans);

    // ACCESS ======================================================================================

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_spans.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_spans.empty();
    }

    [[nodiscard]]
    std::span<const Span_Entry> spans() const noexcept
    {
        return m_spans;
    }

    [[nodiscard]]
    Span_View operator[](std::size_t index) const
    {
        LAMINA_ASSERT(index < m_spans.size());
        return { *this, index };
    }

    /// @brief Returns the span at `index`, where negative indices count from the end.
    [[nodiscard]]
    Result<Span_View, Annotation_Error> at(std::ptrdiff_t index) const;

    /// @brief Returns the index of the entry at `location`, if any.
    [[nodiscard]]
    std::optional<std::size_t> find(const Span& location) const noexcept;

    /// @brief Returns the index of the first entry whose location contains `location`, if any.
    [[nodiscard]]
    std::optional<std::size_t> find_containing(const Span& location) const noexcept;

    /// @brief Returns a layer containing every `step`-th span in `[first, last)`.
    /// Negative positions count from the end and positions are clamped to the layer.
    /// Fails with `index_out_of_range` if `step` is not positive.
    [[nodiscard]]
    Result<Layer, Annotation_Error> slice(
        std::ptrdiff_t first,
        std::ptrdiff_t last,
        std::ptrdiff_t step = 1,
        Selection selection = Selection::allow_empty
    ) const;

    /// @brief Returns a layer containing the spans at `indices`.
    /// Repeated indices select a span once.
    [[nodiscard]]
    Result<Layer, Annotation_Error>
    select(std::span<const std::size_t> indices, Selection selection = Selection::allow_empty)
        const;

    /// @brief Returns a layer containing the spans for which `flags` is `true`.
    /// Fails with `index_out_of_range` if `flags` and the layer differ in size.
    [[nodiscard]]
    Result<Layer, Annotation_Error>
    mask(std::span<const bool> flags, Selection selection = Selection::allow_empty) const;

    [[nodiscard]]
    Result<Layer, Annotation_Error> filter(
        Function_Ref<bool(const Span_View&)> predicate,
        Selection selection = Selection::allow_empty
    ) const;

    /// @brief Returns the values of the attribute `name` in span order.
    [[nodiscard]]
    Result<Attribute_Column, Annotation_Error> attribute_list(std::u8string_view name) const;

    /// @brief Returns one tuple of the values of `names` per annotation,
    /// in span order.
    [[nodiscard]]
    Result<std::pmr::vector<std::pmr::vector<Attribute_Value>>, Annotation_Error>
    attribute_tuples(std::span<const std::u8string_view> names) const;

    /// @brief Counts how often each value of `name` occurs across all annotations.
    /// Values are listed in order of first occurrence.
    [[nodiscard]]
    Result<std::pmr::vector<Value_Count>, Annotation_Error>
    count_values(std::u8string_view name) const;

    // CONSISTENCY =================================================================================

    /// @brief Audits every invariant of this layer and returns the first violation.
    /// If the layer is bound, alignment with its base layer is audited as well.
    /// This function has no side effects.
    [[nodiscard]]
    Result<void, Consistency_Error> check_span_consistency() const;

    /// @brief Returns `true` if both layers have the same schema and spans.
    /// Whether the layers are bound does not matter.
    [[nodiscard]]
    friend bool operator==(const Layer& x, const Layer& y);

private:
    friend Text;

    [[nodiscard]]
    Result<Annotation, Annotation_Error> make_annotation(std::span<const Attribute> attributes
    ) const;

    [[nodiscard]]
    Result<void, Annotation_Error> check_alignment(const Base_Span& span) const;

    [[nodiscard]]
    static Result<void, Annotation_Error>
    check_alignment_with_base(const Layer& base, Topology_Kind topology, const Base_Span& span);

    Result<void, Annotation_Error> insert(Base_Span&& span, Annotation&& annotation);

    [[nodiscard]]
    Result<Layer, Annotation_Error> make_selection(std::pmr::vector<Span_Entry>&& spans, Selection)
        const;

    /// @brief Audits this layer as if it was attached to `text`.
    [[nodiscard]]
    Result<void, Consistency_Error> check_span_consistency(const Text* text) const;

    [[nodiscard]]
    Result<void, Consistency_Error> check_alignment_with(const Layer& base) const;

    [[nodiscard]]
    Consistency_Error
    make_consistency_error(Annotation_Error code, std::size_t span_index) const;

    void bind(const Text* text, std::pmr::vector<Foreign_Attribute>&& foreign_attributes);
};

} // namespace lamina

#endif
