#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "error.hpp"

namespace jsonld
{

// Objects keep their insertion order, which matters for contexts.
using JsonValue = nlohmann::ordered_json;
using Context = JsonValue;

constexpr char KEY_CONTEXT[] = "@context";
constexpr char KEY_ID[] = "@id";
constexpr char KEY_TYPE[] = "@type";

// Parse JSON text. Failures are reported as TransformError, callers
// that read configuration map them to ConfigurationError.
E<JsonValue> parseJson(std::string_view text);

// Serialize a value, indented by two spaces if “pretty”. The result
// does not have a trailing newline.
E<std::string> dumpJson(const JsonValue& value, bool pretty);

// A context entry for an IRI-valued or typed-literal property.
JsonValue typedTerm(std::string_view iri, std::string_view type);

} // namespace jsonld
