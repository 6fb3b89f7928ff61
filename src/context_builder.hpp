#pragma once

#include <span>

#include "json_ld.hpp"
#include "prefix_map.hpp"
#include "rdf.hpp"

namespace jsonld
{

// Derive a default “@context” so that compaction uses local names (or
// “prefix:local” if “prefer_prefixed” is set) as property keys.
//
// Every predicate except rdf:type gets one entry, decided by the first
// triple that maps to its key:
//
// - IRI or blank object: {"@id": p, "@type": "@id"}
// - typed literal, other than xsd:string and rdf:langString:
//   {"@id": p, "@type": datatype}
// - anything else: the IRI of p as a plain string
//
// Prefixes follow the properties. The empty prefix is left out since
// JSON-LD does not allow an empty term, and a prefix never overrides a
// property with the same key.
Context buildContext(std::span<const Triple> triples,
                     const PrefixMap& prefixes, bool prefer_prefixed);

// Same as above, with the default graph and the prefixes of “dataset”.
Context buildContext(const DatasetInterface& dataset, bool prefer_prefixed);

} // namespace jsonld
