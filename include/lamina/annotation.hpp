#ifndef LAMINA_ANNOTATION_HPP
#define LAMINA_ANNOTATION_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "lamina/attribute_value.hpp"
#include "lamina/fwd.hpp"
#include "lamina/span.hpp"

namespace lamina {

/// @brief The attribute values of one analysis of a span location.
/// Within a layer, an annotation holds exactly the declared attributes
/// in declaration order.
struct Annotation {
private:
    std::pmr::vector<Attribute> m_attributes;

public:
    [[nodiscard]]
    explicit Annotation(std::pmr::memory_resource* memory)
        : m_attributes { memory }
    {
    }

    [[nodiscard]]
    Annotation(std::span<const Attribute> attributes, std::pmr::memory_resource* memory)
        : m_attributes(attributes.begin(), attributes.end(), memory)
    {
    }

    [[nodiscard]]
    const Attribute_Value* find(std::u8string_view name) const noexcept;
    [[nodiscard]]
    Attribute_Value* find(std::u8string_view name) noexcept;

    [[nodiscard]]
    bool contains(std::u8string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /// @brief Sets the value of the attribute named `name`,
    /// appending the attribute if it is not yet present.
    void set(std::u8string_view name, const Attribute_Value& value);

    /// @brief Removes the attribute named `name`, if present.
    /// Returns `true` if an attribute was removed.
    bool erase(std::u8string_view name);

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_attributes.size();
    }

    [[nodiscard]]
    std::span<const Attribute> attributes() const noexcept
    {
        return m_attributes;
    }

    [[nodiscard]]
    auto begin() const noexcept
    {
        return m_attributes.begin();
    }
    [[nodiscard]]
    auto end() const noexcept
    {
        return m_attributes.end();
    }

    /// @brief Two annotations are equal if they hold the same attributes with the same values,
    /// regardless of order.
    [[nodiscard]]
    friend bool operator==(const Annotation& x, const Annotation& y);
};

/// @brief One span with the values of one annotation,
/// used to construct layers in bulk.
struct Annotation_Record {
    Base_Span base_span;
    std::pmr::vector<Attribute> attributes;
};

} // namespace lamina

#endif
