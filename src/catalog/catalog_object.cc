#include "catalog_object.h"

#include <sstream>

namespace Metadump {

namespace {

struct KindInfo {
    ObjectKind kind;
    const char* name;
};

constexpr KindInfo kKinds[] = {
    {ObjectKind::kSessionGucs, "session_gucs"},
    {ObjectKind::kDatabase, "database"},
    {ObjectKind::kDatabaseGuc, "database_guc"},
    {ObjectKind::kResourceQueue, "resource_queue"},
    {ObjectKind::kResourceGroup, "resource_group"},
    {ObjectKind::kRole, "role"},
    {ObjectKind::kRoleGrant, "role_grant"},
    {ObjectKind::kTablespace, "tablespace"},
    {ObjectKind::kShellType, "shell_type"},
    {ObjectKind::kBaseType, "base_type"},
    {ObjectKind::kCompositeType, "composite_type"},
    {ObjectKind::kDomainType, "domain_type"},
    {ObjectKind::kEnumType, "enum_type"},
    {ObjectKind::kFunction, "function"},
    {ObjectKind::kIndex, "index"},
};

bool IsGlobalKind(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::kDatabase:
        case ObjectKind::kDatabaseGuc:
        case ObjectKind::kResourceQueue:
        case ObjectKind::kResourceGroup:
        case ObjectKind::kRole:
        case ObjectKind::kRoleGrant:
        case ObjectKind::kTablespace:
            return true;
        default:
            return false;
    }
}

} // namespace

const char* ObjectKindName(ObjectKind kind) {
    for (const auto& info : kKinds) {
        if (info.kind == kind) return info.name;
    }
    return "unknown";
}

std::optional<ObjectKind> ParseObjectKind(const std::string& name) {
    for (const auto& info : kKinds) {
        if (name == info.name) return info.kind;
    }
    return std::nullopt;
}

const char* SectionName(Section section) {
    switch (section) {
        case Section::kGlobal: return "global";
        case Section::kPredata: return "predata";
        case Section::kPostdata: return "postdata";
    }
    return "unknown";
}

std::optional<Section> ParseSection(const std::string& name) {
    if (name == "global") return Section::kGlobal;
    if (name == "predata") return Section::kPredata;
    if (name == "postdata") return Section::kPostdata;
    return std::nullopt;
}

std::vector<Section> SectionsFor(ObjectKind kind) {
    if (kind == ObjectKind::kSessionGucs) {
        return {Section::kGlobal, Section::kPredata, Section::kPostdata};
    }
    if (IsGlobalKind(kind)) {
        return {Section::kGlobal};
    }
    if (kind == ObjectKind::kIndex) {
        return {Section::kPostdata};
    }
    return {Section::kPredata};
}

bool BelongsTo(ObjectKind kind, Section section) {
    for (Section s : SectionsFor(kind)) {
        if (s == section) return true;
    }
    return false;
}

bool IsShellCapable(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::kBaseType:
        case ObjectKind::kCompositeType:
        case ObjectKind::kDomainType:
        case ObjectKind::kEnumType:
            return true;
        default:
            return false;
    }
}

int PriorityClass(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::kSessionGucs: return 0;
        case ObjectKind::kDatabase: return 1;
        case ObjectKind::kDatabaseGuc: return 2;
        case ObjectKind::kResourceQueue: return 3;
        case ObjectKind::kResourceGroup: return 4;
        case ObjectKind::kRole: return 5;
        case ObjectKind::kRoleGrant: return 6;
        case ObjectKind::kTablespace: return 7;
        case ObjectKind::kShellType: return 8;
        case ObjectKind::kBaseType:
        case ObjectKind::kCompositeType:
        case ObjectKind::kDomainType:
        case ObjectKind::kEnumType:
        case ObjectKind::kFunction:
            return 9;
        case ObjectKind::kIndex: return 10;
    }
    return 11;
}

std::string QualifiedName(const CatalogObjectRecord& record) {
    if (record.schema.empty()) {
        return record.name;
    }
    std::string qualified = record.schema + "." + record.name;
    if (record.kind == ObjectKind::kFunction) {
        const auto* function = record.As<FunctionDefinition>();
        qualified += "(" + (function ? function->arguments : std::string()) + ")";
    }
    return qualified;
}

bool IsImplicitType(const CatalogObjectRecord& record) {
    const auto* type = record.As<TypeDefinition>();
    if (type == nullptr) return false;
    if (type->array_of_oid != 0) return true;
    return type->relation_kind == 'r' || type->relation_kind == 'S' || type->relation_kind == 'v';
}

std::string DescribeObject(const CatalogObjectRecord& record) {
    std::ostringstream out;
    out << QualifiedName(record) << " (" << ObjectKindName(record.kind) << ", " << record.oid << ")";
    return out.str();
}

} // namespace Metadump
