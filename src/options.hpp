#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "json_ld.hpp"

namespace jsonld
{

// Options handed to the JSON-LD engine. The member defaults are the
// engine's own defaults.
struct TransformerOptions
{
    std::string base;
    bool compact_arrays = true;
    bool use_native_types = false;
    bool use_rdf_type = false;
    bool use_namespaces = false;
    bool produce_generalized_rdf = false;
    std::string processing_mode = "json-ld-1.0";
    std::optional<JsonValue> expand_context;
    // Framing only.
    bool embed = true;
    bool explicit_inclusion = false;
    bool omit_default = false;

    bool operator==(const TransformerOptions&) const = default;
};

// Caller options win as they are. Without them the options are tuned
// for plain-looking JSON: native numbers and booleans, single values
// instead of one-element arrays, and prefixes used as namespaces.
TransformerOptions resolveOptions(
    std::string_view base_uri,
    const std::optional<TransformerOptions>& caller_options);

} // namespace jsonld
