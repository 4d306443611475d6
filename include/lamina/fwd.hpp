#ifndef LAMINA_FWD_HPP
#define LAMINA_FWD_HPP

#include "lamina/settings.hpp"

LAMINA_IF_DEBUG() // silence unused warning for settings.hpp

namespace lamina {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define LAMINA_ENUM_STRING_CASE(...)                                                               \
    case __VA_ARGS__: return #__VA_ARGS__

#define LAMINA_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

enum struct Annotation_Error : Default_Underlying;
struct Annotation;
struct Annotation_Record;
struct Attribute;
struct Attribute_Value;
struct Base_Span;
struct Collecting_Logger;
enum struct Conflict_Strategy : Default_Underlying;
struct Consistency_Error;
struct Diagnostic;
struct Error_Tag;
using Float = double;
struct Foreign_Attribute;
struct Ignorant_Logger;
using Integer = long long;
struct Layer;
struct Layer_Schema;
struct Logger;
struct Null;
struct Prioritized_Span;
struct Regex_Rule;
struct Regex_Tagger;
struct Regex_Tagger_Options;
enum struct Removal : Default_Underlying;
struct Resolve_Options;
template <typename, typename>
struct Result;
struct Retagger;
enum struct Selection : Default_Underlying;
enum struct Severity : Default_Underlying;
struct Span;
struct Span_Entry;
struct Span_View;
struct Success_Tag;
struct Tagger;
struct Text;
struct Topology;
enum struct Topology_Kind : Default_Underlying;
struct Value_Count;

namespace json {

struct Array;
struct Member;
struct Object;
struct Value;

} // namespace json

} // namespace lamina

#endif
