#include "json_ld.hpp"

#include <format>

namespace jsonld
{

E<JsonValue> parseJson(std::string_view text)
{
    JsonValue value = JsonValue::parse(text, nullptr, false);
    if(value.is_discarded())
    {
        return std::unexpected(transformError(
            std::format("Invalid JSON: {}", text)));
    }
    return value;
}

E<std::string> dumpJson(const JsonValue& value, bool pretty)
{
    try
    {
        if(pretty)
        {
            return value.dump(2);
        }
        return value.dump();
    }
    catch(const nlohmann::json::type_error& e)
    {
        return std::unexpected(transformError(
            std::format("Cannot serialize JSON-LD: {}", e.what())));
    }
}

JsonValue typedTerm(std::string_view iri, std::string_view type)
{
    JsonValue term = JsonValue::object();
    term[KEY_ID] = iri;
    term[KEY_TYPE] = type;
    return term;
}

} // namespace jsonld
