#include "prefix_map.hpp"

#include <algorithm>

namespace jsonld
{

namespace {

bool isUsableLocalPart(std::string_view local)
{
    return !local.empty() &&
        local.find_first_of("/#?:") == std::string_view::npos;
}

} // namespace

PrefixMap::PrefixMap(std::initializer_list<Entry> entries)
{
    for(const auto& [prefix, iri]: entries)
    {
        add(prefix, iri);
    }
}

void PrefixMap::add(std::string_view prefix, std::string_view iri)
{
    auto it = std::find_if(mapping.begin(), mapping.end(),
                           [&](const Entry& e) { return e.first == prefix; });
    if(it == mapping.end())
    {
        mapping.emplace_back(prefix, iri);
    }
    else
    {
        it->second = iri;
    }
}

std::optional<std::string> PrefixMap::get(std::string_view prefix) const
{
    for(const auto& [p, iri]: mapping)
    {
        if(p == prefix)
        {
            return iri;
        }
    }
    return std::nullopt;
}

std::optional<std::string> PrefixMap::abbreviate(std::string_view iri) const
{
    const Entry* best = nullptr;
    for(const Entry& e: mapping)
    {
        const std::string& ns = e.second;
        if(ns.empty() || !iri.starts_with(ns) ||
           !isUsableLocalPart(iri.substr(ns.size())))
        {
            continue;
        }
        if(best == nullptr || ns.size() > best->second.size())
        {
            best = &e;
        }
    }
    if(best == nullptr)
    {
        return std::nullopt;
    }
    return best->first + ":" + std::string(iri.substr(best->second.size()));
}

} // namespace jsonld
