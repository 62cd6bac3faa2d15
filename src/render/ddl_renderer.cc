#include "ddl_renderer.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "common/errors.h"

namespace Metadump {

namespace {

constexpr int kCurrentMajorVersion = 7;
constexpr long kMaxMajorVersion = 1000;

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

std::string QuoteLiteral(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string ToUpper(std::string value) {
    for (auto& c : value) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return value;
}

double ParseCost(const std::string& value, const CatalogObjectRecord& record, const char* attribute) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw MetadumpError("resource queue " + record.name + " has invalid " + attribute + " '" + value + "'");
    }
}

template<typename T>
const T& DefinitionOf(const CatalogObjectRecord& record) {
    const T* definition = record.As<T>();
    if (definition == nullptr) {
        throw MetadumpError(DescribeObject(record) + " has no definition for its kind");
    }
    return *definition;
}

std::string SchemaQualified(const CatalogObjectRecord& record) {
    return record.schema + "." + record.name;
}

const char* AlignmentName(const std::string& alignment) {
    if (alignment == "c") return "char";
    if (alignment == "s") return "int2";
    if (alignment == "i") return "int4";
    if (alignment == "d") return "double";
    return nullptr;
}

const char* StorageName(const std::string& storage) {
    if (storage == "p") return "plain";
    if (storage == "e") return "external";
    if (storage == "m") return "main";
    if (storage == "x") return "extended";
    return nullptr;
}

// Keyword used in COMMENT/ALTER/GRANT statements, or nullptr if the kind takes no metadata.
const char* MetadataKeyword(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::kDatabase: return "DATABASE";
        case ObjectKind::kResourceQueue: return "RESOURCE QUEUE";
        case ObjectKind::kResourceGroup: return "RESOURCE GROUP";
        case ObjectKind::kRole: return "ROLE";
        case ObjectKind::kTablespace: return "TABLESPACE";
        case ObjectKind::kShellType:
        case ObjectKind::kBaseType:
        case ObjectKind::kCompositeType:
        case ObjectKind::kEnumType:
            return "TYPE";
        case ObjectKind::kDomainType: return "DOMAIN";
        case ObjectKind::kFunction: return "FUNCTION";
        case ObjectKind::kIndex: return "INDEX";
        default: return nullptr;
    }
}

bool HasOwner(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::kResourceQueue:
        case ObjectKind::kResourceGroup:
        case ObjectKind::kRole:
        case ObjectKind::kIndex:
            return false;
        default:
            return true;
    }
}

bool HasPrivileges(ObjectKind kind) {
    return HasOwner(kind) && kind != ObjectKind::kShellType;
}

} // namespace

DdlRenderer::DdlRenderer(std::string source_version)
    : source_version_(std::move(source_version)),
      major_version_(0) {
    size_t digits = 0;
    while (digits < source_version_.size() && std::isdigit(static_cast<unsigned char>(source_version_[digits]))) {
        ++digits;
    }
    errno = 0;
    const long major = digits == 0 ? 0 : std::strtol(source_version_.substr(0, digits).c_str(), nullptr, 10);
    if (digits == 0 || errno == ERANGE || major > kMaxMajorVersion) {
        LOG(WARNING) << "Unrecognized source version '" << source_version_ << "', assuming current syntax";
        major_version_ = kCurrentMajorVersion;
    } else {
        major_version_ = static_cast<int>(major);
    }
}

RenderedStatement DdlRenderer::Render(const SequencedObject& object) {
    const CatalogObjectRecord& record = *object.record;
    RenderedStatement rendered;
    if (object.is_shell()) {
        rendered.statement = RenderShellType(record);
        return rendered;
    }
    switch (record.kind) {
        case ObjectKind::kSessionGucs:
            rendered.statement = RenderSessionGucs(record);
            if (major_version_ < 5) {
                // Restores into any version must not parse XML strictly.
                rendered.supplements.push_back({"GPDB4 SESSION GUCS", "SET gp_strict_xml_parse = off;\n"});
            }
            break;
        case ObjectKind::kDatabase: rendered.statement = RenderDatabase(record); break;
        case ObjectKind::kDatabaseGuc: rendered.statement = RenderDatabaseGuc(record); break;
        case ObjectKind::kResourceQueue: rendered.statement = RenderResourceQueue(record); break;
        case ObjectKind::kResourceGroup: rendered.statement = RenderResourceGroup(record); break;
        case ObjectKind::kRole: rendered.statement = RenderRole(record); break;
        case ObjectKind::kRoleGrant: rendered.statement = RenderRoleGrant(record); break;
        case ObjectKind::kTablespace: rendered.statement = RenderTablespace(record); break;
        case ObjectKind::kShellType: rendered.statement = RenderShellType(record); break;
        case ObjectKind::kBaseType: rendered.statement = RenderBaseType(record); break;
        case ObjectKind::kCompositeType: rendered.statement = RenderCompositeType(record); break;
        case ObjectKind::kEnumType: rendered.statement = RenderEnumType(record); break;
        case ObjectKind::kDomainType: rendered.statement = RenderDomainType(record); break;
        case ObjectKind::kFunction: rendered.statement = RenderFunction(record); break;
        case ObjectKind::kIndex: rendered.statement = RenderIndex(record); break;
    }
    rendered.annotation = RenderObjectMetadata(record);
    return rendered;
}

std::string DdlRenderer::RenderSessionGucs(const CatalogObjectRecord& record) const {
    const auto& gucs = DefinitionOf<SessionGucsDefinition>(record);
    std::string text = "SET statement_timeout = 0;\n"
                       "SET check_function_bodies = false;\n"
                       "SET client_min_messages = error;\n"
                       "SET client_encoding = '" + gucs.client_encoding + "';\n"
                       "SET standard_conforming_strings = on;\n"
                       "SET default_with_oids = " + gucs.default_with_oids + ";\n";
    return text;
}

std::string DdlRenderer::RenderDatabase(const CatalogObjectRecord& record) const {
    const auto& database = DefinitionOf<DatabaseDefinition>(record);
    std::string text = "\n\nCREATE DATABASE " + record.name;
    if (!database.tablespace.empty() && database.tablespace != "pg_default") {
        text += " TABLESPACE " + database.tablespace;
    }
    return text + ";";
}

std::string DdlRenderer::RenderDatabaseGuc(const CatalogObjectRecord& record) const {
    const auto& guc = DefinitionOf<DatabaseGucDefinition>(record);
    return "\nALTER DATABASE " + record.name + " " + guc.setting + ";";
}

std::string DdlRenderer::RenderResourceQueue(const CatalogObjectRecord& record) const {
    const auto& queue = DefinitionOf<ResourceQueueDefinition>(record);
    std::vector<std::string> attributes;
    if (queue.active_statements != -1) {
        attributes.push_back("ACTIVE_STATEMENTS=" + std::to_string(queue.active_statements));
    }
    if (ParseCost(queue.max_cost, record, "MAX_COST") > -1) {
        attributes.push_back("MAX_COST=" + queue.max_cost);
    }
    if (queue.cost_overcommit) {
        attributes.push_back("COST_OVERCOMMIT=TRUE");
    }
    if (ParseCost(queue.min_cost, record, "MIN_COST") > 0) {
        attributes.push_back("MIN_COST=" + queue.min_cost);
    }
    if (queue.priority != "medium") {
        attributes.push_back("PRIORITY=" + ToUpper(queue.priority));
    }
    if (queue.memory_limit != "-1") {
        attributes.push_back("MEMORY_LIMIT='" + queue.memory_limit + "'");
    }
    // pg_default exists in every cluster.
    const char* action = record.name == "pg_default" ? "ALTER" : "CREATE";
    return std::string("\n\n") + action + " RESOURCE QUEUE " + record.name + " WITH (" + Join(attributes, ", ") + ");";
}

std::string DdlRenderer::RenderResourceGroup(const CatalogObjectRecord& record) const {
    const auto& group = DefinitionOf<ResourceGroupDefinition>(record);
    const std::vector<std::pair<const char*, int>> settings = {
        {"CPU_RATE_LIMIT", group.cpu_rate_limit},
        {"MEMORY_LIMIT", group.memory_limit},
        {"MEMORY_SHARED_QUOTA", group.memory_shared_quota},
        {"MEMORY_SPILL_RATIO", group.memory_spill_ratio},
        {"CONCURRENCY", group.concurrency},
    };
    std::ostringstream text;
    if (record.name == "default_group" || record.name == "admin_group") {
        for (const auto& setting : settings) {
            text << "\n\nALTER RESOURCE GROUP " << record.name << " SET " << setting.first << " " << setting.second
                 << ";";
        }
        return text.str();
    }
    std::vector<std::string> attributes;
    for (const auto& setting : settings) {
        attributes.push_back(std::string(setting.first) + "=" + std::to_string(setting.second));
    }
    text << "\n\nCREATE RESOURCE GROUP " << record.name << " WITH (" << Join(attributes, ", ") << ");";
    return text.str();
}

std::string DdlRenderer::RenderRole(const CatalogObjectRecord& record) const {
    const auto& role = DefinitionOf<RoleDefinition>(record);
    std::vector<std::string> attrs;
    attrs.push_back(role.super ? "SUPERUSER" : "NOSUPERUSER");
    attrs.push_back(role.inherit ? "INHERIT" : "NOINHERIT");
    attrs.push_back(role.create_role ? "CREATEROLE" : "NOCREATEROLE");
    attrs.push_back(role.create_db ? "CREATEDB" : "NOCREATEDB");
    attrs.push_back(role.can_login ? "LOGIN" : "NOLOGIN");
    if (role.connection_limit != -1) {
        attrs.push_back("CONNECTION LIMIT " + std::to_string(role.connection_limit));
    }
    if (!role.password.empty()) {
        attrs.push_back("PASSWORD '" + role.password + "'");
    }
    if (!role.valid_until.empty()) {
        attrs.push_back("VALID UNTIL '" + role.valid_until + "'");
    }
    attrs.push_back("RESOURCE QUEUE " + role.resource_queue);
    if (major_version_ >= 5 && !role.resource_group.empty()) {
        attrs.push_back("RESOURCE GROUP " + role.resource_group);
    }
    if (role.create_readable_http) {
        attrs.push_back("CREATEEXTTABLE (protocol='http')");
    }
    if (role.create_readable_gpfdist) {
        attrs.push_back("CREATEEXTTABLE (protocol='gpfdist', type='readable')");
    }
    if (role.create_writable_gpfdist) {
        attrs.push_back("CREATEEXTTABLE (protocol='gpfdist', type='writable')");
    }
    if (role.create_readable_hdfs) {
        attrs.push_back("CREATEEXTTABLE (protocol='gphdfs', type='readable')");
    }
    if (role.create_writable_hdfs) {
        attrs.push_back("CREATEEXTTABLE (protocol='gphdfs', type='writable')");
    }

    std::ostringstream text;
    text << "\n\nCREATE ROLE " << record.name << ";\nALTER ROLE " << record.name << " WITH " << Join(attrs, " ")
         << ";";
    for (const auto& constraint : role.time_constraints) {
        text << "\nALTER ROLE " << record.name << " DENY BETWEEN DAY " << constraint.start_day << " TIME '"
             << constraint.start_time << "' AND DAY " << constraint.end_day << " TIME '" << constraint.end_time
             << "';";
    }
    return text.str();
}

std::string DdlRenderer::RenderRoleGrant(const CatalogObjectRecord& record) const {
    const auto& grant = DefinitionOf<RoleGrantDefinition>(record);
    std::string text = "\nGRANT " + grant.role + " TO " + grant.member;
    if (grant.is_admin) {
        text += " WITH ADMIN OPTION";
    }
    return text + " GRANTED BY " + grant.grantor + ";";
}

std::string DdlRenderer::RenderTablespace(const CatalogObjectRecord& record) const {
    const auto& tablespace = DefinitionOf<TablespaceDefinition>(record);
    return "\n\nCREATE TABLESPACE " + record.name + " FILESPACE " + tablespace.filespace + ";";
}

std::string DdlRenderer::RenderShellType(const CatalogObjectRecord& record) const {
    return "\n\nCREATE TYPE " + SchemaQualified(record) + ";";
}

std::string DdlRenderer::RenderBaseType(const CatalogObjectRecord& record) const {
    const auto& type = DefinitionOf<TypeDefinition>(record);
    std::vector<std::string> attributes;
    attributes.push_back("INPUT = " + type.input);
    attributes.push_back("OUTPUT = " + type.output);
    if (!type.receive.empty()) attributes.push_back("RECEIVE = " + type.receive);
    if (!type.send.empty()) attributes.push_back("SEND = " + type.send);
    if (!type.modin.empty()) attributes.push_back("TYPMOD_IN = " + type.modin);
    if (!type.modout.empty()) attributes.push_back("TYPMOD_OUT = " + type.modout);
    if (type.internal_length > 0) {
        attributes.push_back("INTERNALLENGTH = " + std::to_string(type.internal_length));
    }
    if (type.passed_by_value) attributes.push_back("PASSEDBYVALUE");
    if (const char* alignment = AlignmentName(type.alignment)) {
        attributes.push_back(std::string("ALIGNMENT = ") + alignment);
    }
    if (const char* storage = StorageName(type.storage)) {
        attributes.push_back(std::string("STORAGE = ") + storage);
    }
    if (!type.default_value.empty()) attributes.push_back("DEFAULT = " + QuoteLiteral(type.default_value));
    if (!type.element.empty()) attributes.push_back("ELEMENT = " + type.element);
    if (!type.delimiter.empty() && type.delimiter != ",") {
        attributes.push_back("DELIMITER = " + QuoteLiteral(type.delimiter));
    }
    return "\n\nCREATE TYPE " + SchemaQualified(record) + " (\n\t" + Join(attributes, ",\n\t") + "\n);";
}

std::string DdlRenderer::RenderCompositeType(const CatalogObjectRecord& record) const {
    const auto& type = DefinitionOf<TypeDefinition>(record);
    return "\n\nCREATE TYPE " + SchemaQualified(record) + " AS (\n\t" + Join(type.attributes, ",\n\t") + "\n);";
}

std::string DdlRenderer::RenderEnumType(const CatalogObjectRecord& record) const {
    const auto& type = DefinitionOf<TypeDefinition>(record);
    std::vector<std::string> labels;
    labels.reserve(type.enum_labels.size());
    for (const auto& label : type.enum_labels) {
        labels.push_back(QuoteLiteral(label));
    }
    return "\n\nCREATE TYPE " + SchemaQualified(record) + " AS ENUM (\n\t" + Join(labels, ",\n\t") + "\n);";
}

std::string DdlRenderer::RenderDomainType(const CatalogObjectRecord& record) const {
    const auto& type = DefinitionOf<TypeDefinition>(record);
    std::string text = "\n\nCREATE DOMAIN " + SchemaQualified(record) + " AS " + type.base_type;
    if (!type.default_value.empty()) text += " DEFAULT " + type.default_value;
    if (type.not_null) text += " NOT NULL";
    return text + ";";
}

std::string DdlRenderer::RenderFunction(const CatalogObjectRecord& record) const {
    const auto& function = DefinitionOf<FunctionDefinition>(record);
    return "\n\nCREATE FUNCTION " + SchemaQualified(record) + "(" + function.arguments + ") RETURNS " +
           function.result_type + " AS $$" + function.body + "$$\nLANGUAGE " + function.language + ";";
}

std::string DdlRenderer::RenderIndex(const CatalogObjectRecord& record) const {
    const auto& index = DefinitionOf<IndexDefinition>(record);
    if (index.statement.empty()) return "";
    std::string text = "\n\n" + index.statement;
    if (text.back() != ';') text += ";";
    return text;
}

std::string DdlRenderer::RenderObjectMetadata(const CatalogObjectRecord& record) const {
    const char* keyword = MetadataKeyword(record.kind);
    const ObjectMetadata& metadata = record.metadata;
    if (keyword == nullptr || metadata.empty()) return "";

    std::string target = std::string(keyword) + " " + QualifiedName(record);
    std::ostringstream text;
    if (!metadata.comment.empty()) {
        text << "\n\nCOMMENT ON " << target << " IS " << QuoteLiteral(metadata.comment) << ";";
    }
    if (!metadata.owner.empty() && HasOwner(record.kind)) {
        text << "\n\nALTER " << target << " OWNER TO " << metadata.owner << ";";
    }
    if (!metadata.privileges.empty() && HasPrivileges(record.kind)) {
        text << "\n\nREVOKE ALL ON " << target << " FROM PUBLIC;";
        if (!metadata.owner.empty()) {
            text << "\nREVOKE ALL ON " << target << " FROM " << metadata.owner << ";";
        }
        for (const auto& grant : metadata.privileges) {
            text << "\nGRANT " << grant.privileges << " ON " << target << " TO "
                 << (grant.grantee.empty() ? "PUBLIC" : grant.grantee) << ";";
        }
    }
    return text.str();
}

} // namespace Metadump
