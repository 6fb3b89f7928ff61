#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonld
{

// Prefix to namespace IRI mapping, kept in declaration order.
class PrefixMap
{
public:
    using Entry = std::pair<std::string, std::string>;

    PrefixMap() = default;
    PrefixMap(std::initializer_list<Entry> entries);

    // Declare a prefix. Re-declaring a prefix replaces its IRI in
    // place.
    void add(std::string_view prefix, std::string_view iri);
    std::optional<std::string> get(std::string_view prefix) const;

    const std::vector<Entry>& entries() const { return mapping; }
    bool empty() const { return mapping.empty(); }
    size_t size() const { return mapping.size(); }

    // Abbreviate “iri” into “prefix:local” using the longest matching
    // namespace. Returns nullopt if no prefix gives a usable local
    // part.
    std::optional<std::string> abbreviate(std::string_view iri) const;

private:
    std::vector<Entry> mapping;
};

} // namespace jsonld
