#include "config.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <sstream>

#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support
#include <spdlog/spdlog.h>

namespace jsonld
{

namespace {

constexpr std::array<std::string_view, 5> KNOWN_KEYS = {
    "context", "context_substitution", "frame", "prefer_prefixed_properties",
    "transformer_options"};

constexpr std::array<std::string_view, 11> KNOWN_OPTION_KEYS = {
    "base", "compact_arrays", "use_native_types", "use_rdf_type",
    "use_namespaces", "produce_generalized_rdf", "processing_mode",
    "expand_context", "embed", "explicit", "omit_default"};

E<std::string> readFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        return std::unexpected(ioError("Cannot open config file: " + path));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string str(ryml::csubstr s)
{
    return std::string(s.str, s.len);
}

struct YamlError
{
    std::string msg;
};

[[noreturn]] void onYamlError(const char* msg, size_t len, ryml::Location loc,
                              void*)
{
    throw YamlError{std::format("{} (line {}, column {})",
                                std::string_view(msg, len), loc.line + 1,
                                loc.col + 1)};
}

// Routes rapidyaml errors to onYamlError() for the lifetime of the
// guard. Rapidyaml aborts on errors by default.
class YamlErrorGuard
{
public:
    YamlErrorGuard() : saved(ryml::get_callbacks())
    {
        ryml::Callbacks cb = saved;
        cb.m_error = onYamlError;
        ryml::set_callbacks(cb);
    }
    ~YamlErrorGuard()
    {
        ryml::set_callbacks(saved);
    }
    YamlErrorGuard(const YamlErrorGuard&) = delete;
    YamlErrorGuard& operator=(const YamlErrorGuard&) = delete;

private:
    ryml::Callbacks saved;
};

// Convert a YAML mapping or sequence written inline in the config
// into JSON. Quoted scalars stay strings, other scalars are read as
// JSON values when they parse as one.
JsonValue yamlToJson(ryml::NodeRef node)
{
    if(node.is_map())
    {
        JsonValue obj = JsonValue::object();
        for(ryml::NodeRef child: node.children())
        {
            obj[str(child.key())] = yamlToJson(child);
        }
        return obj;
    }
    if(node.is_seq())
    {
        JsonValue arr = JsonValue::array();
        for(ryml::NodeRef child: node.children())
        {
            arr.push_back(yamlToJson(child));
        }
        return arr;
    }
    std::string text = str(node.val());
    if(node.is_val_quoted())
    {
        return text;
    }
    auto value = parseJson(text);
    if(value.has_value())
    {
        return *std::move(value);
    }
    return text;
}

template<size_t N>
void warnUnknownKeys(ryml::NodeRef node,
                     const std::array<std::string_view, N>& known)
{
    for(ryml::NodeRef child: node.children())
    {
        std::string key = str(child.key());
        if(std::find(known.begin(), known.end(), key) == known.end())
        {
            spdlog::warn("Ignoring unknown config key: {}", key);
        }
    }
}

E<void> readString(ryml::NodeRef node, const char* key, std::string& value)
{
    if(!node.has_child(ryml::to_csubstr(key)))
    {
        return {};
    }
    ryml::NodeRef child = node[ryml::to_csubstr(key)];
    if(!child.has_val())
    {
        return std::unexpected(configurationError(
            std::format("Expected a scalar value for {}", key)));
    }
    child >> value;
    return {};
}

E<void> readBool(ryml::NodeRef node, const char* key, bool& value)
{
    if(!node.has_child(ryml::to_csubstr(key)))
    {
        return {};
    }
    std::string s;
    DO_OR_RETURN(readString(node, key, s));
    if(s == "true" || s == "yes" || s == "1")
    {
        value = true;
    }
    else if(s == "false" || s == "no" || s == "0")
    {
        value = false;
    }
    else
    {
        return std::unexpected(configurationError(
            std::format("Invalid boolean for {}: {}", key, s)));
    }
    return {};
}

E<std::optional<JsonValue>> readJson(ryml::NodeRef node, const char* key)
{
    if(!node.has_child(ryml::to_csubstr(key)))
    {
        return std::nullopt;
    }
    ryml::NodeRef child = node[ryml::to_csubstr(key)];
    if(child.is_map() || child.is_seq())
    {
        return yamlToJson(child);
    }
    std::string text;
    child >> text;
    auto value = parseJson(text);
    if(!value.has_value())
    {
        return std::unexpected(configurationError(
            std::format("Invalid JSON in {}: {}", key, errorMsg(value.error()))));
    }
    return *std::move(value);
}

E<TransformerOptions> readTransformerOptions(ryml::NodeRef node)
{
    warnUnknownKeys(node, KNOWN_OPTION_KEYS);

    TransformerOptions opts;
    DO_OR_RETURN(readString(node, "base", opts.base));
    DO_OR_RETURN(readString(node, "processing_mode", opts.processing_mode));
    DO_OR_RETURN(readBool(node, "compact_arrays", opts.compact_arrays));
    DO_OR_RETURN(readBool(node, "use_native_types", opts.use_native_types));
    DO_OR_RETURN(readBool(node, "use_rdf_type", opts.use_rdf_type));
    DO_OR_RETURN(readBool(node, "use_namespaces", opts.use_namespaces));
    DO_OR_RETURN(readBool(node, "produce_generalized_rdf",
                          opts.produce_generalized_rdf));
    DO_OR_RETURN(readBool(node, "embed", opts.embed));
    DO_OR_RETURN(readBool(node, "explicit", opts.explicit_inclusion));
    DO_OR_RETURN(readBool(node, "omit_default", opts.omit_default));
    ASSIGN_OR_RETURN(opts.expand_context, readJson(node, "expand_context"));
    return opts;
}

E<SerializationConfig> readConfig(ryml::Tree& tree)
{
    SerializationConfig config;
    ryml::NodeRef root = tree.rootref();
    if(!root.is_map())
    {
        return config;
    }
    warnUnknownKeys(root, KNOWN_KEYS);

    ASSIGN_OR_RETURN(config.explicit_context, readJson(root, "context"));
    ASSIGN_OR_RETURN(config.context_substitution,
                     readJson(root, "context_substitution"));
    ASSIGN_OR_RETURN(config.frame, readJson(root, "frame"));
    DO_OR_RETURN(readBool(root, "prefer_prefixed_properties",
                          config.prefer_prefixed_properties));
    if(root.has_child("transformer_options"))
    {
        if(!root["transformer_options"].is_map())
        {
            return std::unexpected(configurationError(
                "Expected a mapping for transformer_options"));
        }
        ASSIGN_OR_RETURN(config.transformer_options,
                         readTransformerOptions(root["transformer_options"]));
    }
    return config;
}

} // namespace

E<SerializationConfig> SerializationConfig::fromYAML(std::string_view content)
{
    YamlErrorGuard guard;
    try
    {
        // Parse_in_arena() copies the buffer into the tree, so
        // “content” does not need to outlive it.
        ryml::Tree tree = ryml::parse_in_arena(
            ryml::csubstr(content.data(), content.size()));
        return readConfig(tree);
    }
    catch(const YamlError& e)
    {
        return std::unexpected(configurationError("Invalid YAML: " + e.msg));
    }
}

E<SerializationConfig> SerializationConfig::load(const std::string& path)
{
    ASSIGN_OR_RETURN(std::string content, readFile(path));
    spdlog::debug("Loading serialization config from {}", path);
    return fromYAML(content);
}

} // namespace jsonld
