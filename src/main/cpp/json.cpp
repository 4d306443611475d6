#include <charconv>
#include <cmath>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "ulight/json.hpp"

#include "lamina/util/assert.hpp"
#include "lamina/util/strings.hpp"

#include "lamina/attribute_value.hpp"
#include "lamina/json.hpp"

namespace lamina::json {
namespace {

[[nodiscard]]
std::optional<Integer> parse_integer(std::u8string_view chars)
{
    if (chars.find_first_of(u8".eE") != std::u8string_view::npos) {
        return {};
    }
    const std::string_view digits = as_string_view(chars);
    Integer result {};
    const std::from_chars_result parsed
        = std::from_chars(digits.data(), digits.data() + digits.size(), result);
    if (parsed.ec != std::errc {} || parsed.ptr != digits.data() + digits.size()) {
        return {};
    }
    return result;
}

struct Building_Visitor final : ulight::JSON_Visitor {
    using Pos = ulight::Source_Position;

    std::pmr::memory_resource* memory;
    std::optional<json::Value> root_value;
    std::pmr::vector<json::Value> structure_stack;
    std::pmr::vector<std::pmr::u8string> property_stack;

    std::pmr::u8string current_string;

    explicit Building_Visitor(std::pmr::memory_resource* memory)
        : memory { memory }
        , structure_stack { memory }
        , property_stack { memory }
        , current_string { memory }
    {
    }

    void literal(const Pos&, std::u8string_view chars) final
    {
        current_string.append(chars);
    }

    void escape(const Pos&, std::u8string_view, char32_t, std::u8string_view code_units) final
    {
        current_string.append(code_units.begin(), code_units.end());
    }

    void number(const Pos&, std::u8string_view chars, double value) final
    {
        if (const std::optional<Integer> integer = parse_integer(chars)) {
            insert_value(*integer);
        }
        else {
            insert_value(value);
        }
    }

    void null(const Pos&) final
    {
        insert_value(json::Null {});
    }
    void boolean(const Pos&, bool value) final
    {
        insert_value(value);
    }

    void push_string(const Pos&) final
    {
        current_string.clear();
    }
    void pop_string(const Pos&) final
    {
        insert_value(String { current_string, memory });
    }

    void push_property(const Pos&) final
    {
        current_string.clear();
    }
    void pop_property(const Pos&) final
    {
        property_stack.push_back(current_string);
    }

    void push_object(const Pos&) final
    {
        structure_stack.push_back(json::Object { memory });
    }
    void pop_object(const Pos&) final
    {
        json::Value object = std::move(structure_stack.back());
        structure_stack.pop_back();
        insert_value(std::move(object));
    }

    void push_array(const Pos&) final
    {
        structure_stack.push_back(json::Array { memory });
    }
    void pop_array(const Pos&) final
    {
        json::Value array = std::move(structure_stack.back());
        structure_stack.pop_back();
        insert_value(std::move(array));
    }

    void insert_value(json::Value&& value)
    {
        if (structure_stack.empty()) {
            root_value = std::move(value);
            LAMINA_ASSERT(property_stack.empty());
        }
        else if (auto* const array = std::get_if<json::Array>(&structure_stack.back())) {
            array->push_back(std::move(value));
        }
        else if (auto* const object = std::get_if<json::Object>(&structure_stack.back())) {
            object->emplace(property_stack.back(), std::move(value));
            property_stack.pop_back();
        }
    }
};

void write_string(std::pmr::u8string& out, std::u8string_view str)
{
    constexpr char8_t hex_digits[] = u8"0123456789abcdef";

    out += u8'"';
    for (const char8_t c : str) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\b': out += u8"\\b"; break;
        case u8'\f': out += u8"\\f"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\r': out += u8"\\r"; break;
        case u8'\t': out += u8"\\t"; break;
        default:
            if (c < 0x20) {
                out += u8"\\u00";
                out += hex_digits[c >> 4];
                out += hex_digits[c & 0xf];
            }
            else {
                out += c;
            }
        }
    }
    out += u8'"';
}

void write_number(std::pmr::u8string& out, Number x)
{
    // JSON has no representation for these.
    if (!std::isfinite(x)) {
        out += u8"null";
        return;
    }
    const std::size_t start = out.size();
    append_number(out, x);
    if (std::u8string_view { out }.substr(start).find_first_of(u8".e") == std::u8string_view::npos) {
        out += u8".0";
    }
}

} // namespace

std::optional<json::Value> load(std::u8string_view source, std::pmr::memory_resource* memory)
{
    constexpr ulight::JSON_Options options { .allow_comments = false,
                                             .parse_numbers = true,
                                             .escapes = ulight::Escape_Parsing::parse_encode };
    Building_Visitor visitor { memory };
    if (!parse_json(visitor, source, options)) {
        return {};
    }
    return std::move(visitor.root_value);
}

void write(std::pmr::u8string& out, const json::Value& value)
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
        void operator()(Number x) const
        {
            write_number(out, x);
        }
        void operator()(const String& x) const
        {
            write_string(out, x);
        }
        void operator()(const Array& x) const
        {
            out += u8'[';
            bool first = true;
            for (const json::Value& element : x) {
                if (!first) {
                    out += u8',';
                }
                first = false;
                write(out, element);
            }
            out += u8']';
        }
        void operator()(const Object& x) const
        {
            out += u8'{';
            bool first = true;
            for (const Member& member : x) {
                if (!first) {
                    out += u8',';
                }
                first = false;
                write_string(out, member.key);
                out += u8':';
                write(out, member.value);
            }
            out += u8'}';
        }
    };
    std::visit(Visitor { out }, static_cast<const Value_Variant&>(value));
}

json::Value to_json(const Attribute_Value& value, std::pmr::memory_resource* memory)
{
    struct Visitor {
        std::pmr::memory_resource* memory;

        json::Value operator()(Null) const
        {
            return json::Null {};
        }
        json::Value operator()(bool x) const
        {
            return x;
        }
        json::Value operator()(Integer x) const
        {
            return x;
        }
        json::Value operator()(Float x) const
        {
            return x;
        }
        json::Value operator()(const lamina::String& x) const
        {
            return String { x, memory };
        }
    };
    return std::visit(Visitor { memory }, static_cast<const Attribute_Value_Variant&>(value));
}

std::optional<Attribute_Value>
to_attribute_value(const json::Value& value, std::pmr::memory_resource* memory)
{
    struct Visitor {
        std::pmr::memory_resource* memory;

        std::optional<Attribute_Value> operator()(Null) const
        {
            return Attribute_Value {};
        }
        std::optional<Attribute_Value> operator()(bool x) const
        {
            return Attribute_Value { std::in_place_type<bool>, x };
        }
        std::optional<Attribute_Value> operator()(Integer x) const
        {
            return Attribute_Value { std::in_place_type<Integer>, x };
        }
        std::optional<Attribute_Value> operator()(Number x) const
        {
            return Attribute_Value { std::in_place_type<Float>, x };
        }
        std::optional<Attribute_Value> operator()(const String& x) const
        {
            return Attribute_Value { std::u8string_view { x }, memory };
        }
        std::optional<Attribute_Value> operator()(const Array&) const
        {
            return {};
        }
        std::optional<Attribute_Value> operator()(const Object&) const
        {
            return {};
        }
    };
    return std::visit(Visitor { memory }, static_cast<const Value_Variant&>(value));
}

} // namespace lamina::json
