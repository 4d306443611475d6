#include <memory_resource>
#include <string>
#include <variant>

#include "lamina/util/strings.hpp"

#include "lamina/attribute_value.hpp"

namespace lamina {

void append_display(std::pmr::u8string& out, const Attribute_Value& value)
{
    struct Visitor {
        std::pmr::u8string& out;

        void operator()(Null) const
        {
            out += u8"null";
        }
        void operator()(bool x) const
        {
            out += x ? u8"true" : u8"false";
        }
        void operator()(Integer x) const
        {
            append_number(out, x);
        }
        void operator()(Float x) const
        {
            append_number(out, x);
        }
        void operator()(const String& x) const
        {
            out += x;
        }
    };
    std::visit(Visitor { out }, static_cast<const Attribute_Value_Variant&>(value));
}

} // namespace lamina
