#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"
#include "json_ld.hpp"
#include "options.hpp"

namespace jsonld
{

// Everything a caller can tune in a write. Every member is optional;
// the defaults give compacted output with a derived context.
struct SerializationConfig
{
    // The “@context” to compact or flatten with. If not set, one is
    // derived from the data. A JSON null is passed to the engine as is.
    std::optional<JsonValue> explicit_context;
    // Replaces the value of “@context” in compacted or flattened output,
    // after the transformation. Useful to point “@context” to a URL
    // without the engine having to fetch it.
    std::optional<JsonValue> context_substitution;
    // Required for framed output.
    std::optional<JsonValue> frame;
    // Used unmodified if set.
    std::optional<TransformerOptions> transformer_options;
    // Prefer “ex:p” over “p” as keys of derived properties.
    bool prefer_prefixed_properties = false;

    // Read from a YAML document. JSON-valued keys (“context”,
    // “context_substitution”, “frame”, “expand_context”) hold JSON text.
    static E<SerializationConfig> fromYAML(std::string_view content);
    static E<SerializationConfig> load(const std::string& path);
};

} // namespace jsonld
