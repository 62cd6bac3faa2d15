#ifndef METADUMP_SRC_CATALOG_CATALOG_LOADER_H_
#define METADUMP_SRC_CATALOG_CATALOG_LOADER_H_

#include <string>
#include <vector>

#include "catalog_object.h"

namespace YAML {
class Node;
}

namespace Metadump {

/**
 * Record set captured from one source database, plus the server version
 * string that selects version-specific statement syntax.
 */
struct CatalogSnapshot {
    std::string version;
    std::vector<CatalogObjectRecord> records;
};

/**
 * Reads a catalog snapshot written as YAML:
 *
 *   version: "6.20.0"
 *   objects:
 *     - oid: 16390
 *       schema: public
 *       name: complex
 *       kind: base_type
 *       depends_upon: ["public.complex_in(cstring)"]
 *       metadata: {owner: gpadmin, comment: "...", privileges: [{grantee: "", privileges: USAGE}]}
 *       definition: {input: public.complex_in, output: public.complex_out}
 *
 * The definition keys are the field names of the kind's definition struct.
 * Every object except session_gucs needs an oid, and no two objects may
 * share one. Any malformed document throws TocFormatError.
 */
class CatalogLoader {
public:
    static CatalogSnapshot LoadFromFile(const std::string& path);
    static CatalogSnapshot LoadFromString(const std::string& yaml);

private:
    static CatalogSnapshot FromNode(const YAML::Node& root);
    static CatalogObjectRecord ParseRecord(const YAML::Node& node, size_t position);
    static KindDefinition ParseDefinition(ObjectKind kind, const YAML::Node& node);
};

} // namespace Metadump

#endif // METADUMP_SRC_CATALOG_CATALOG_LOADER_H_
