#include "statement_renderer.h"

namespace Metadump {

std::string TocObjectType(const SequencedObject& object) {
    if (object.is_shell()) return "SHELL TYPE";
    switch (object.record->kind) {
        case ObjectKind::kSessionGucs: return "SESSION GUCS";
        case ObjectKind::kDatabase: return "DATABASE";
        case ObjectKind::kDatabaseGuc: return "DATABASE GUC";
        case ObjectKind::kResourceQueue: return "RESOURCE QUEUE";
        case ObjectKind::kResourceGroup: return "RESOURCE GROUP";
        case ObjectKind::kRole: return "ROLE";
        case ObjectKind::kRoleGrant: return "ROLE GRANT";
        case ObjectKind::kTablespace: return "TABLESPACE";
        case ObjectKind::kShellType: return "SHELL TYPE";
        case ObjectKind::kBaseType:
        case ObjectKind::kCompositeType:
        case ObjectKind::kEnumType:
            return "TYPE";
        case ObjectKind::kDomainType: return "DOMAIN";
        case ObjectKind::kFunction: return "FUNCTION";
        case ObjectKind::kIndex: return "INDEX";
    }
    return "UNKNOWN";
}

} // namespace Metadump
