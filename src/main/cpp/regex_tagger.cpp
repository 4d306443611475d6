#include <algorithm>
#include <cstddef>
#include <memory>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lamina/util/assert.hpp"
#include "lamina/util/result.hpp"
#include "lamina/util/strings.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/conflict_resolver.hpp"
#include "lamina/layer.hpp"
#include "lamina/regex_tagger.hpp"
#include "lamina/text.hpp"

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace lamina {

namespace {

struct Compiled_Rule {
    boost::u32regex regex;
    std::size_t group;
    Integer priority;
    std::pmr::vector<Attribute> attributes;
};

/// @brief Returns the length of the UTF-8 sequence starting with `lead`,
/// or `1` if `lead` is not a valid leading code unit.
[[nodiscard]]
constexpr std::size_t utf8_sequence_length(char8_t lead) noexcept
{
    if ((lead & 0x80) == 0x00) {
        return 1;
    }
    if ((lead & 0xe0) == 0xc0) {
        return 2;
    }
    if ((lead & 0xf0) == 0xe0) {
        return 3;
    }
    if ((lead & 0xf8) == 0xf0) {
        return 4;
    }
    return 1;
}


/// @brief Rewrites the escapes `\uXXXX` of an ECMAScript pattern as `\x{XXXX}`.
/// Even in ECMAScript mode, Boost.Regex reads `\u` as "any uppercase character".
/// Every other part of the pattern is kept as is.
[[nodiscard]]
std::u8string ecma_pattern_to_boost_pattern(std::u8string_view ecma_pattern)
{
    std::u8string result;
    result.reserve(ecma_pattern.size());
    bool escape = false;
    for (std::size_t i = 0; i < ecma_pattern.size(); ++i) {
        const char8_t c = ecma_pattern[i];
        if (!escape) {
            if (c == u8'\\') {
                escape = true;
            }
            else {
                result += c;
            }
            continue;
        }
        escape = false;
        if (c != u8'u') {
            result += u8'\\';
            result += c;
            continue;
        }
        const bool is_code_point_escape = i + 4 < ecma_pattern.size()
            && std::ranges::all_of(ecma_pattern.substr(i + 1, 4), [](char8_t d) {
                   return is_ascii_hex_digit(d);
               });
        if (!is_code_point_escape) {
            // Any other "\u" stands for the letter itself.
            result += u8'u';
            continue;
        }
        // The code point is not inserted literally since it may be a metacharacter.
        result += u8"\\x{";
        result += ecma_pattern.substr(i + 1, 4);
        result += u8'}';
        i += 4;
    }
    if (escape) {
        result += u8'\\';
    }
    return result;
}

} // namespace

struct Regex_Tagger::Impl {
    std::pmr::memory_resource* memory;
    String output_layer;
    std::pmr::vector<String> attribute_names;
    std::pmr::vector<std::u8string_view> output_attributes;
    Conflict_Strategy strategy;
    String priority_attribute;
    bool ambiguous;
    bool keep_equal;
    std::pmr::vector<Compiled_Rule> rules;

    [[nodiscard]]
    Impl(const Regex_Tagger_Options& options, std::pmr::memory_resource* memory)
        : memory { memory }
        , output_layer { options.output_layer, memory }
        , attribute_names { memory }
        , output_attributes { memory }
        , strategy { options.strategy }
        , priority_attribute { options.priority_attribute, memory }
        , ambiguous { options.ambiguous }
        , keep_equal { options.keep_equal }
        , rules { memory }
    {
        for (const std::u8string_view name : options.output_attributes) {
            attribute_names.emplace_back(name);
        }
        // Views are only taken once the names no longer move.
        for (const String& name : attribute_names) {
            output_attributes.push_back(name);
        }
    }

    [[nodiscard]]
    bool declares_priority() const
    {
        return std::ranges::find(output_attributes, priority_attribute) != output_attributes.end();
    }

    [[nodiscard]]
    Layer_Schema candidate_schema(std::span<const std::u8string_view> attributes) const
    {
        return { .name = output_layer, .attributes = attributes, .ambiguous = true };
    }
};

Regex_Tagger::Regex_Tagger(Construction_Tag, std::unique_ptr<Impl>&& impl, Logger& logger)
    : m_impl { std::move(impl) }
    , m_logger { &logger }
{
}

Regex_Tagger::~Regex_Tagger() = default;

Result<std::unique_ptr<Regex_Tagger>, Annotation_Error> Regex_Tagger::create(
    std::span<const Regex_Rule> rules,
    const Regex_Tagger_Options& options,
    std::pmr::memory_resource* memory,
    Logger& logger
)
{
    const Layer_Schema output_schema { .name = options.output_layer,
                                       .attributes = options.output_attributes,
                                       .ambiguous = options.ambiguous };
    if (auto output = Layer::create(output_schema, memory); !output) {
        return output.error();
    }
    if (!is_ascii_identifier(options.priority_attribute)) {
        return Annotation_Error::invalid_attribute_name;
    }

    auto impl = std::make_unique<Impl>(options, memory);
    for (const Regex_Rule& rule : rules) {
        constexpr auto flags
            = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;
        const std::u8string pattern = ecma_pattern_to_boost_pattern(rule.pattern);
        boost::u32regex regex = boost::make_u32regex(pattern.begin(), pattern.end(), flags);
        if (regex.status() != 0 || rule.group > regex.mark_count()) {
            return Annotation_Error::invalid_pattern;
        }
        for (const Attribute& attribute : rule.attributes) {
            const bool declared = std::ranges::find(impl->output_attributes, attribute.name)
                != impl->output_attributes.end();
            if (!declared || attribute.name == impl->priority_attribute) {
                return Annotation_Error::attribute_mismatch;
            }
        }
        impl->rules.push_back({ .regex = std::move(regex),
                                .group = rule.group,
                                .priority = rule.priority,
                                .attributes = std::pmr::vector<Attribute>(
                                    rule.attributes.begin(), rule.attributes.end(), memory
                                ) });
    }
    return std::make_unique<Regex_Tagger>(Construction_Tag {}, std::move(impl), logger);
}

std::u8string_view Regex_Tagger::get_output_layer() const
{
    return m_impl->output_layer;
}

std::span<const std::u8string_view> Regex_Tagger::get_output_attributes() const
{
    return m_impl->output_attributes;
}

std::span<const std::u8string_view> Regex_Tagger::get_input_layers() const
{
    return {};
}

Result<Layer, Annotation_Error> Regex_Tagger::make_layer(
    const Text& text,
    std::span<const Layer* const>,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::u8string_view> candidate_attributes(m_impl->output_attributes, memory);
    if (!m_impl->declares_priority()) {
        candidate_attributes.push_back(m_impl->priority_attribute);
    }
    Result<Layer, Annotation_Error> candidates
        = Layer::create(m_impl->candidate_schema(candidate_attributes), memory);
    if (!candidates) {
        return candidates;
    }

    const std::u8string_view source = text.get_text();
    const char8_t* const begin = source.data();
    const char8_t* const end = begin + source.size();

    std::pmr::vector<Attribute> attributes { memory };
    for (const Compiled_Rule& rule : m_impl->rules) {
        attributes.assign(rule.attributes.begin(), rule.attributes.end());
        attributes.push_back({ m_impl->priority_attribute, Attribute_Value { rule.priority } });

        const char8_t* position = begin;
        boost::match_results<const char8_t*> match;
        while (position <= end) {
            const boost::regex_constants::match_flag_type flags = position == begin
                ? boost::regex_constants::match_default
                : boost::regex_constants::match_prev_avail;
            if (!boost::u32regex_search(position, end, match, rule.regex, flags)) {
                break;
            }
            if (rule.group >= match.size()) {
                return Annotation_Error::invalid_pattern;
            }
            const auto& whole = match[0];
            const auto& captured = match[int(rule.group)];
            if (captured.matched && captured.first != captured.second) {
                const Span span { std::size_t(captured.first - begin),
                                  std::size_t(captured.second - begin) };
                if (auto added = candidates->add_span(span, attributes); !added) {
                    return added.error();
                }
            }
            if (whole.first != whole.second) {
                position = whole.second;
            }
            else if (whole.second == end) {
                break;
            }
            else {
                position = std::min(end, whole.second + utf8_sequence_length(*whole.second));
            }
        }
    }

    const Resolve_Options resolve_options { .strategy = m_impl->strategy,
                                            .priority_attribute = m_impl->priority_attribute,
                                            .keep_equal = m_impl->keep_equal };
    Result<Layer, Annotation_Error> resolved
        = resolve_conflicts(*candidates, resolve_options, memory, *m_logger);
    if (!resolved) {
        return resolved;
    }

    const Layer_Schema output_schema { .name = m_impl->output_layer,
                                       .attributes = m_impl->output_attributes,
                                       .ambiguous = m_impl->ambiguous };
    Result<Layer, Annotation_Error> output = Layer::create(output_schema, memory);
    if (!output) {
        return output;
    }
    const bool strip_priority = !m_impl->declares_priority();
    for (const Span_Entry& entry : resolved->spans()) {
        for (const Annotation& annotation : entry.annotations) {
            attributes.clear();
            for (const Attribute& attribute : annotation) {
                if (!strip_priority || attribute.name != m_impl->priority_attribute) {
                    attributes.push_back(attribute);
                }
            }
            if (auto added = output->add_span(entry.location(), attributes); !added) {
                return added.error();
            }
            if (!m_impl->ambiguous) {
                break;
            }
        }
    }
    return output;
}

} // namespace lamina
