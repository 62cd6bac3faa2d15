#ifndef METADUMP_SRC_RENDER_DDL_RENDERER_H_
#define METADUMP_SRC_RENDER_DDL_RENDERER_H_

#include <string>

#include "statement_renderer.h"

namespace Metadump {

/**
 * Renders CREATE/ALTER statements for the object kinds metadump dumps.
 *
 * The source version tag selects version-specific output: sources before
 * major version 5 get a separate gp_strict_xml_parse session setting and no
 * RESOURCE GROUP role attribute. A version tag without a usable leading
 * number is treated as the current major version.
 */
class DdlRenderer : public StatementRenderer {
public:
    explicit DdlRenderer(std::string source_version);

    RenderedStatement Render(const SequencedObject& object) override;

    int source_major_version() const { return major_version_; }

private:
    std::string RenderSessionGucs(const CatalogObjectRecord& record) const;
    std::string RenderDatabase(const CatalogObjectRecord& record) const;
    std::string RenderDatabaseGuc(const CatalogObjectRecord& record) const;
    std::string RenderResourceQueue(const CatalogObjectRecord& record) const;
    std::string RenderResourceGroup(const CatalogObjectRecord& record) const;
    std::string RenderRole(const CatalogObjectRecord& record) const;
    std::string RenderRoleGrant(const CatalogObjectRecord& record) const;
    std::string RenderTablespace(const CatalogObjectRecord& record) const;
    std::string RenderShellType(const CatalogObjectRecord& record) const;
    std::string RenderBaseType(const CatalogObjectRecord& record) const;
    std::string RenderCompositeType(const CatalogObjectRecord& record) const;
    std::string RenderEnumType(const CatalogObjectRecord& record) const;
    std::string RenderDomainType(const CatalogObjectRecord& record) const;
    std::string RenderFunction(const CatalogObjectRecord& record) const;
    std::string RenderIndex(const CatalogObjectRecord& record) const;

    // COMMENT, OWNER and GRANT lines for the object, or "" when it has none.
    std::string RenderObjectMetadata(const CatalogObjectRecord& record) const;

    std::string source_version_;
    int major_version_;
};

} // namespace Metadump

#endif // METADUMP_SRC_RENDER_DDL_RENDERER_H_
