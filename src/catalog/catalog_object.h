#ifndef METADUMP_SRC_CATALOG_CATALOG_OBJECT_H_
#define METADUMP_SRC_CATALOG_CATALOG_OBJECT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Metadump {

using Oid = uint32_t;

/**
 * Output streams of one run. Each section is written to its own file and
 * indexed separately in the table of contents.
 */
enum class Section {
    kGlobal = 0,
    kPredata = 1,
    kPostdata = 2,
};

constexpr int kNumSections = 3;

enum class ObjectKind {
    kSessionGucs,
    kDatabase,
    kDatabaseGuc,
    kResourceQueue,
    kResourceGroup,
    kRole,
    kRoleGrant,
    kTablespace,
    kShellType,
    kBaseType,
    kCompositeType,
    kDomainType,
    kEnumType,
    kFunction,
    kIndex,
};

// Owner, comment and privileges printed after an object's primary statement.
struct PrivilegeGrant {
    std::string grantee;    // empty grantee means PUBLIC
    std::string privileges; // e.g. "USAGE" or "ALL"
};

struct ObjectMetadata {
    std::string owner;
    std::string comment;
    std::vector<PrivilegeGrant> privileges;

    bool empty() const { return owner.empty() && comment.empty() && privileges.empty(); }
};

struct SessionGucsDefinition {
    std::string client_encoding = "UTF8";
    std::string default_with_oids = "false";
};

struct DatabaseDefinition {
    std::string tablespace = "pg_default";
};

struct DatabaseGucDefinition {
    std::string setting; // "SET search_path TO public"
};

struct ResourceQueueDefinition {
    int active_statements = -1;
    std::string max_cost = "-1";
    bool cost_overcommit = false;
    std::string min_cost = "0";
    std::string priority = "medium";
    std::string memory_limit = "-1";
};

struct ResourceGroupDefinition {
    int cpu_rate_limit = 0;
    int memory_limit = 0;
    int memory_shared_quota = 0;
    int memory_spill_ratio = 0;
    int concurrency = 0;
};

struct TimeConstraint {
    int start_day = 0;
    std::string start_time;
    int end_day = 0;
    std::string end_time;
};

struct RoleDefinition {
    bool super = false;
    bool inherit = true;
    bool create_role = false;
    bool create_db = false;
    bool can_login = false;
    int connection_limit = -1;
    std::string password;
    std::string valid_until;
    std::string resource_queue = "pg_default";
    std::string resource_group;
    bool create_readable_http = false;
    bool create_readable_gpfdist = false;
    bool create_writable_gpfdist = false;
    bool create_readable_hdfs = false;
    bool create_writable_hdfs = false;
    std::vector<TimeConstraint> time_constraints;
};

struct RoleGrantDefinition {
    std::string role;
    std::string member;
    std::string grantor;
    bool is_admin = false;
};

struct TablespaceDefinition {
    std::string filespace;
};

/**
 * Fields of pg_type needed to render base, composite, domain, enum and shell
 * types. array_of_oid and relation_kind identify types the catalog creates
 * implicitly; those are never dumped.
 */
struct TypeDefinition {
    std::string input;
    std::string output;
    std::string receive;
    std::string send;
    std::string modin;
    std::string modout;
    int internal_length = -1;
    bool passed_by_value = false;
    std::string alignment;
    std::string storage;
    std::string default_value;
    std::string element;
    std::string delimiter;
    std::vector<std::string> enum_labels;
    std::string base_type;
    bool not_null = false;
    std::vector<std::string> attributes; // "name type" per composite member

    // Non-zero when this is the array type generated for the type with this oid.
    Oid array_of_oid = 0;
    // 'r', 'S' or 'v' when this is the row type of a table, sequence or view.
    char relation_kind = '\0';
};

struct FunctionDefinition {
    std::string arguments;
    std::string result_type;
    std::string language = "sql";
    std::string body;
};

struct IndexDefinition {
    std::string statement; // pg_get_indexdef output
};

using KindDefinition = std::variant<std::monostate,
                                    SessionGucsDefinition,
                                    DatabaseDefinition,
                                    DatabaseGucDefinition,
                                    ResourceQueueDefinition,
                                    ResourceGroupDefinition,
                                    RoleDefinition,
                                    RoleGrantDefinition,
                                    TablespaceDefinition,
                                    TypeDefinition,
                                    FunctionDefinition,
                                    IndexDefinition>;

/**
 * One catalog object as produced by the catalog query layer. Schema and name
 * are already quoted identifiers. Global objects have an empty schema.
 */
struct CatalogObjectRecord {
    Oid oid = 0;
    std::string schema;
    std::string name;
    ObjectKind kind = ObjectKind::kBaseType;
    KindDefinition definition;
    std::vector<std::string> depends_upon;
    ObjectMetadata metadata;

    template<typename T>
    const T* As() const { return std::get_if<T>(&definition); }
};

const char* ObjectKindName(ObjectKind kind);
std::optional<ObjectKind> ParseObjectKind(const std::string& name);

const char* SectionName(Section section);
std::optional<Section> ParseSection(const std::string& name);

// Sections an object of this kind is written to. Session GUCs open every section.
std::vector<Section> SectionsFor(ObjectKind kind);
bool BelongsTo(ObjectKind kind, Section section);

// Types that may be forward declared with a shell to break a dependency cycle.
bool IsShellCapable(ObjectKind kind);

/**
 * Static emission rank of a kind. Global objects follow the fixed order the
 * server requires (roles before anything granted to them, and so on); all
 * dependency-sorted predata kinds share one class.
 */
int PriorityClass(ObjectKind kind);

/**
 * Name other objects use in depends_upon to refer to this record:
 * "schema.name(arguments)" for functions, "schema.name" for other schema
 * objects, and "name" for global objects.
 */
std::string QualifiedName(const CatalogObjectRecord& record);

// True for array and row types the catalog generates alongside another object.
bool IsImplicitType(const CatalogObjectRecord& record);

// "schema.name (kind, oid)" for log and error messages.
std::string DescribeObject(const CatalogObjectRecord& record);

} // namespace Metadump

#endif // METADUMP_SRC_CATALOG_CATALOG_OBJECT_H_
