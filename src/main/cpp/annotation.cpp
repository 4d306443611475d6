#include <algorithm>
#include <string_view>

#include "lamina/annotation.hpp"

namespace lamina {

const Attribute_Value* Annotation::find(std::u8string_view name) const noexcept
{
    const auto it = std::ranges::find(m_attributes, name, &Attribute::name);
    return it == m_attributes.end() ? nullptr : &it->value;
}

Attribute_Value* Annotation::find(std::u8string_view name) noexcept
{
    const auto it = std::ranges::find(m_attributes, name, &Attribute::name);
    return it == m_attributes.end() ? nullptr : &it->value;
}

void Annotation::set(std::u8string_view name, const Attribute_Value& value)
{
    if (Attribute_Value* const existing = find(name)) {
        *existing = value;
        return;
    }
    m_attributes.push_back({ String { name, m_attributes.get_allocator() }, value });
}

bool Annotation::erase(std::u8string_view name)
{
    return std::erase_if(m_attributes, [&](const Attribute& a) { return a.name == name; }) != 0;
}

bool operator==(const Annotation& x, const Annotation& y)
{
    if (x.size() != y.size()) {
        return false;
    }
    // Attribute names are unique within an annotation,
    // so equal sizes and one-sided containment imply equality.
    return std::ranges::all_of(x.m_attributes, [&](const Attribute& a) {
        const Attribute_Value* const other = y.find(a.name);
        return other && *other == a.value;
    });
}

} // namespace lamina
