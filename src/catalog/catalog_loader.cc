#include "catalog_loader.h"

#include <utility>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "absl/container/flat_hash_map.h"

#include "common/errors.h"

namespace Metadump {

namespace {

template<typename T>
void Read(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void ReadList(const YAML::Node& node, const char* key, std::vector<std::string>& out) {
    if (!node[key]) return;
    if (!node[key].IsSequence()) {
        throw TocFormatError(std::string("'") + key + "' must be a list");
    }
    for (const auto& item : node[key]) {
        out.push_back(item.as<std::string>());
    }
}

ObjectMetadata ParseMetadata(const YAML::Node& node) {
    ObjectMetadata metadata;
    if (!node) return metadata;
    Read(node, "owner", metadata.owner);
    Read(node, "comment", metadata.comment);
    if (node["privileges"]) {
        for (const auto& grant : node["privileges"]) {
            PrivilegeGrant privilege;
            Read(grant, "grantee", privilege.grantee);
            Read(grant, "privileges", privilege.privileges);
            if (privilege.privileges.empty()) {
                throw TocFormatError("privilege grant without privileges");
            }
            metadata.privileges.push_back(std::move(privilege));
        }
    }
    return metadata;
}

TypeDefinition ParseType(const YAML::Node& node) {
    TypeDefinition type;
    Read(node, "input", type.input);
    Read(node, "output", type.output);
    Read(node, "receive", type.receive);
    Read(node, "send", type.send);
    Read(node, "modin", type.modin);
    Read(node, "modout", type.modout);
    Read(node, "internal_length", type.internal_length);
    Read(node, "passed_by_value", type.passed_by_value);
    Read(node, "alignment", type.alignment);
    Read(node, "storage", type.storage);
    Read(node, "default_value", type.default_value);
    Read(node, "element", type.element);
    Read(node, "delimiter", type.delimiter);
    ReadList(node, "enum_labels", type.enum_labels);
    Read(node, "base_type", type.base_type);
    Read(node, "not_null", type.not_null);
    ReadList(node, "attributes", type.attributes);
    Read(node, "array_of_oid", type.array_of_oid);
    std::string relation_kind;
    Read(node, "relation_kind", relation_kind);
    if (relation_kind.size() > 1) {
        throw TocFormatError("relation_kind must be a single character, got '" + relation_kind + "'");
    }
    if (!relation_kind.empty()) type.relation_kind = relation_kind[0];
    return type;
}

RoleDefinition ParseRole(const YAML::Node& node) {
    RoleDefinition role;
    Read(node, "super", role.super);
    Read(node, "inherit", role.inherit);
    Read(node, "create_role", role.create_role);
    Read(node, "create_db", role.create_db);
    Read(node, "can_login", role.can_login);
    Read(node, "connection_limit", role.connection_limit);
    Read(node, "password", role.password);
    Read(node, "valid_until", role.valid_until);
    Read(node, "resource_queue", role.resource_queue);
    Read(node, "resource_group", role.resource_group);
    Read(node, "create_readable_http", role.create_readable_http);
    Read(node, "create_readable_gpfdist", role.create_readable_gpfdist);
    Read(node, "create_writable_gpfdist", role.create_writable_gpfdist);
    Read(node, "create_readable_hdfs", role.create_readable_hdfs);
    Read(node, "create_writable_hdfs", role.create_writable_hdfs);
    if (node["time_constraints"]) {
        for (const auto& item : node["time_constraints"]) {
            TimeConstraint constraint;
            Read(item, "start_day", constraint.start_day);
            Read(item, "start_time", constraint.start_time);
            Read(item, "end_day", constraint.end_day);
            Read(item, "end_time", constraint.end_time);
            role.time_constraints.push_back(std::move(constraint));
        }
    }
    return role;
}

} // namespace

CatalogSnapshot CatalogLoader::LoadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw TocFormatError("Failed to read catalog snapshot " + path + ": " + e.what());
    }
    CatalogSnapshot snapshot = FromNode(root);
    LOG(INFO) << "Loaded " << snapshot.records.size() << " catalog objects from " << path
              << " (source version " << snapshot.version << ")";
    return snapshot;
}

CatalogSnapshot CatalogLoader::LoadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw TocFormatError(std::string("Failed to parse catalog snapshot: ") + e.what());
    }
    return FromNode(root);
}

CatalogSnapshot CatalogLoader::FromNode(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw TocFormatError("Catalog snapshot must be a mapping");
    }
    CatalogSnapshot snapshot;
    try {
        if (!root["version"]) {
            throw TocFormatError("Catalog snapshot has no version");
        }
        snapshot.version = root["version"].as<std::string>();
        const YAML::Node objects = root["objects"];
        if (objects && !objects.IsSequence()) {
            throw TocFormatError("Catalog snapshot 'objects' must be a list");
        }
        if (objects) {
            snapshot.records.reserve(objects.size());
            // oid -> position of the record that owns it
            absl::flat_hash_map<Oid, size_t> positions;
            for (size_t i = 0; i < objects.size(); ++i) {
                CatalogObjectRecord record = ParseRecord(objects[i], i);
                auto [it, inserted] = positions.emplace(record.oid, i);
                if (!inserted) {
                    throw TocFormatError("catalog object #" + std::to_string(i) + " reuses oid " +
                                         std::to_string(record.oid) + " of catalog object #" +
                                         std::to_string(it->second));
                }
                snapshot.records.push_back(std::move(record));
            }
        }
    } catch (const YAML::Exception& e) {
        throw TocFormatError(std::string("Invalid catalog snapshot: ") + e.what());
    }
    return snapshot;
}

CatalogObjectRecord CatalogLoader::ParseRecord(const YAML::Node& node, size_t position) {
    const std::string where = "catalog object #" + std::to_string(position);
    if (!node.IsMap()) {
        throw TocFormatError(where + " is not a mapping");
    }
    if (!node["kind"]) {
        throw TocFormatError(where + " has no kind");
    }
    const std::string kind_name = node["kind"].as<std::string>();
    std::optional<ObjectKind> kind = ParseObjectKind(kind_name);
    if (!kind) {
        throw TocFormatError(where + " has unknown kind '" + kind_name + "'");
    }

    // The singleton session settings are the only record without a catalog row.
    if (!node["oid"] && *kind != ObjectKind::kSessionGucs) {
        throw TocFormatError(where + " (" + kind_name + ") has no oid");
    }

    CatalogObjectRecord record;
    record.kind = *kind;
    Read(node, "oid", record.oid);
    Read(node, "schema", record.schema);
    Read(node, "name", record.name);
    if (record.name.empty() && record.kind != ObjectKind::kSessionGucs) {
        throw TocFormatError(where + " (" + kind_name + ") has no name");
    }
    try {
        ReadList(node, "depends_upon", record.depends_upon);
        record.metadata = ParseMetadata(node["metadata"]);
        record.definition = ParseDefinition(record.kind, node["definition"] ? node["definition"] : YAML::Node());
    } catch (const TocFormatError& e) {
        throw TocFormatError(where + " " + record.name + ": " + e.what());
    }
    VLOG(3) << "Loaded " << DescribeObject(record);
    return record;
}

KindDefinition CatalogLoader::ParseDefinition(ObjectKind kind, const YAML::Node& node) {
    switch (kind) {
        case ObjectKind::kSessionGucs: {
            SessionGucsDefinition gucs;
            Read(node, "client_encoding", gucs.client_encoding);
            Read(node, "default_with_oids", gucs.default_with_oids);
            return gucs;
        }
        case ObjectKind::kDatabase: {
            DatabaseDefinition database;
            Read(node, "tablespace", database.tablespace);
            return database;
        }
        case ObjectKind::kDatabaseGuc: {
            DatabaseGucDefinition guc;
            Read(node, "setting", guc.setting);
            if (guc.setting.empty()) {
                throw TocFormatError("database GUC without a setting");
            }
            return guc;
        }
        case ObjectKind::kResourceQueue: {
            ResourceQueueDefinition queue;
            Read(node, "active_statements", queue.active_statements);
            Read(node, "max_cost", queue.max_cost);
            Read(node, "cost_overcommit", queue.cost_overcommit);
            Read(node, "min_cost", queue.min_cost);
            Read(node, "priority", queue.priority);
            Read(node, "memory_limit", queue.memory_limit);
            return queue;
        }
        case ObjectKind::kResourceGroup: {
            ResourceGroupDefinition group;
            Read(node, "cpu_rate_limit", group.cpu_rate_limit);
            Read(node, "memory_limit", group.memory_limit);
            Read(node, "memory_shared_quota", group.memory_shared_quota);
            Read(node, "memory_spill_ratio", group.memory_spill_ratio);
            Read(node, "concurrency", group.concurrency);
            return group;
        }
        case ObjectKind::kRole:
            return ParseRole(node);
        case ObjectKind::kRoleGrant: {
            RoleGrantDefinition grant;
            Read(node, "role", grant.role);
            Read(node, "member", grant.member);
            Read(node, "grantor", grant.grantor);
            Read(node, "is_admin", grant.is_admin);
            if (grant.role.empty() || grant.member.empty()) {
                throw TocFormatError("role grant needs both role and member");
            }
            return grant;
        }
        case ObjectKind::kTablespace: {
            TablespaceDefinition tablespace;
            Read(node, "filespace", tablespace.filespace);
            return tablespace;
        }
        case ObjectKind::kShellType:
        case ObjectKind::kBaseType:
        case ObjectKind::kCompositeType:
        case ObjectKind::kDomainType:
        case ObjectKind::kEnumType:
            return ParseType(node);
        case ObjectKind::kFunction: {
            FunctionDefinition function;
            Read(node, "arguments", function.arguments);
            Read(node, "result_type", function.result_type);
            Read(node, "language", function.language);
            Read(node, "body", function.body);
            return function;
        }
        case ObjectKind::kIndex: {
            IndexDefinition index;
            Read(node, "statement", index.statement);
            return index;
        }
    }
    return std::monostate();
}

} // namespace Metadump
