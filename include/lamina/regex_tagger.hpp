#ifndef LAMINA_REGEX_TAGGER_HPP
#define LAMINA_REGEX_TAGGER_HPP

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <span>
#include <string_view>

#include "lamina/util/result.hpp"

#include "lamina/annotation_error.hpp"
#include "lamina/attribute_value.hpp"
#include "lamina/conflict_resolver.hpp"
#include "lamina/fwd.hpp"
#include "lamina/services.hpp"
#include "lamina/settings.hpp"
#include "lamina/tagger.hpp"

namespace lamina {

/// @brief A pattern whose matches become candidate spans.
struct Regex_Rule {
    /// @brief An ECMAScript regular expression.
    /// Escapes of the form `\uXXXX` denote the code point U+XXXX.
    std::u8string_view pattern;
    /// @brief The capture group whose extent becomes the span; `0` is the whole match.
    std::size_t group = 0;
    /// @brief The priority of the candidates, where lower values take precedence.
    Integer priority = 0;
    /// @brief The attribute values of the candidates.
    std::span<const Attribute> attributes;
};

struct Regex_Tagger_Options {
    std::u8string_view output_layer;
    std::span<const std::u8string_view> output_attributes;
    Conflict_Strategy strategy = Conflict_Strategy::max;
    /// @brief The attribute that priorities are stored in during conflict resolution.
    /// The priority is kept in the output only if `output_attributes` declares this attribute.
    std::u8string_view priority_attribute = default_priority_attribute;
    bool ambiguous = false;
    bool keep_equal = true;
};

/// @brief A tagger which finds the matches of a list of rules in the text
/// and resolves conflicts between them.
/// If the output layer is unambiguous,
/// only the first surviving annotation per location is kept.
struct Regex_Tagger final : Tagger {
private:
    struct Impl;
    struct Construction_Tag { };

    std::unique_ptr<Impl> m_impl;
    Logger* m_logger;

public:
    /// @brief Used by `create`; the tag cannot be named outside this class.
    [[nodiscard]]
    Regex_Tagger(Construction_Tag, std::unique_ptr<Impl>&& impl, Logger& logger);

    /// @brief Compiles `rules`.
    /// Fails with `invalid_pattern` if a pattern is not a valid regular expression,
    /// with `invalid_layer_name` or `invalid_attribute_name` if the options name invalid
    /// layers or attributes,
    /// and with `attribute_mismatch` if a rule sets undeclared attributes.
    [[nodiscard]]
    static Result<std::unique_ptr<Regex_Tagger>, Annotation_Error> create(
        std::span<const Regex_Rule> rules,
        const Regex_Tagger_Options& options,
        std::pmr::memory_resource* memory,
        Logger& logger = ignorant_logger
    );

    ~Regex_Tagger() override;

    [[nodiscard]]
    std::u8string_view get_output_layer() const final;

    [[nodiscard]]
    std::span<const std::u8string_view> get_output_attributes() const final;

    [[nodiscard]]
    std::span<const std::u8string_view> get_input_layers() const final;

    [[nodiscard]]
    Result<Layer, Annotation_Error> make_layer(
        const Text& text,
        std::span<const Layer* const> inputs,
        std::pmr::memory_resource* memory
    ) final;
};

} // namespace lamina

#endif
