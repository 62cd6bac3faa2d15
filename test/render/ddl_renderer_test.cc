#include <gtest/gtest.h>
#include "../../src/render/ddl_renderer.h"
#include "../../src/common/errors.h"

using namespace Metadump;

namespace {

template<typename Definition>
CatalogObjectRecord MakeRecord(ObjectKind kind, const std::string& schema, const std::string& name,
                               Definition definition) {
    CatalogObjectRecord record;
    record.oid = 1;
    record.kind = kind;
    record.schema = schema;
    record.name = name;
    record.definition = std::move(definition);
    return record;
}

} // namespace

class DdlRendererTest : public ::testing::Test {
protected:
    RenderedStatement Render(const CatalogObjectRecord& record, EmissionForm form = EmissionForm::kFull) {
        return renderer_.Render(SequencedObject{&record, form});
    }

    DdlRenderer renderer_{"6.20.3 build commit:abc"};
};

TEST_F(DdlRendererTest, ParsesMajorVersion) {
    EXPECT_EQ(renderer_.source_major_version(), 6);
    EXPECT_EQ(DdlRenderer("4.3.33").source_major_version(), 4);
    EXPECT_EQ(DdlRenderer("unknown").source_major_version(), 7);
}

TEST_F(DdlRendererTest, SessionGucs) {
    auto record = MakeRecord(ObjectKind::kSessionGucs, "", "", SessionGucsDefinition{"LATIN1", "true"});

    auto rendered = Render(record);

    EXPECT_EQ(rendered.statement,
              "SET statement_timeout = 0;\n"
              "SET check_function_bodies = false;\n"
              "SET client_min_messages = error;\n"
              "SET client_encoding = 'LATIN1';\n"
              "SET standard_conforming_strings = on;\n"
              "SET default_with_oids = true;\n");
    EXPECT_TRUE(rendered.annotation.empty());
}

TEST_F(DdlRendererTest, OldSourcesDisableStrictXmlParse) {
    DdlRenderer renderer("4.3.33");
    auto record = MakeRecord(ObjectKind::kSessionGucs, "", "", SessionGucsDefinition{});

    auto rendered = renderer.Render(SequencedObject{&record, EmissionForm::kFull});

    EXPECT_EQ(rendered.statement.find("gp_strict_xml_parse"), std::string::npos);
    ASSERT_EQ(rendered.supplements.size(), 1u);
    EXPECT_EQ(rendered.supplements[0].object_type, "GPDB4 SESSION GUCS");
    EXPECT_EQ(rendered.supplements[0].text, "SET gp_strict_xml_parse = off;\n");
    EXPECT_TRUE(Render(record).supplements.empty());
}

TEST_F(DdlRendererTest, OverlongVersionFallsBackToCurrentSyntax) {
    DdlRenderer overlong("99999999999999999999.1");
    DdlRenderer garbage("devel");
    DdlRenderer old("4.3.33");

    EXPECT_EQ(overlong.source_major_version(), 7);
    EXPECT_EQ(garbage.source_major_version(), 7);
    EXPECT_EQ(old.source_major_version(), 4);
}

TEST_F(DdlRendererTest, DatabaseWithTablespaceAndMetadata) {
    auto record = MakeRecord(ObjectKind::kDatabase, "", "sales", DatabaseDefinition{"fast"});
    record.metadata.owner = "gpadmin";
    record.metadata.comment = "Sales data";

    auto rendered = Render(record);

    EXPECT_EQ(rendered.statement, "\n\nCREATE DATABASE sales TABLESPACE fast;");
    EXPECT_EQ(rendered.annotation,
              "\n\nCOMMENT ON DATABASE sales IS 'Sales data';"
              "\n\nALTER DATABASE sales OWNER TO gpadmin;");
}

TEST_F(DdlRendererTest, DefaultTablespaceIsOmitted) {
    auto record = MakeRecord(ObjectKind::kDatabase, "", "sales", DatabaseDefinition{});

    EXPECT_EQ(Render(record).statement, "\n\nCREATE DATABASE sales;");
}

TEST_F(DdlRendererTest, DatabaseGuc) {
    auto record = MakeRecord(ObjectKind::kDatabaseGuc, "", "sales", DatabaseGucDefinition{"SET search_path TO public"});

    EXPECT_EQ(Render(record).statement, "\nALTER DATABASE sales SET search_path TO public;");
}

TEST_F(DdlRendererTest, ResourceQueueListsOnlyNonDefaults) {
    ResourceQueueDefinition queue;
    queue.active_statements = 5;
    queue.max_cost = "32000.00";
    queue.priority = "high";
    auto record = MakeRecord(ObjectKind::kResourceQueue, "", "etl", queue);

    EXPECT_EQ(Render(record).statement,
              "\n\nCREATE RESOURCE QUEUE etl WITH (ACTIVE_STATEMENTS=5, MAX_COST=32000.00, PRIORITY=HIGH);");
}

TEST_F(DdlRendererTest, DefaultResourceQueueIsAltered) {
    ResourceQueueDefinition queue;
    queue.active_statements = 20;
    auto record = MakeRecord(ObjectKind::kResourceQueue, "", "pg_default", queue);

    EXPECT_EQ(Render(record).statement, "\n\nALTER RESOURCE QUEUE pg_default WITH (ACTIVE_STATEMENTS=20);");
}

TEST_F(DdlRendererTest, InvalidQueueCostIsAnError) {
    ResourceQueueDefinition queue;
    queue.max_cost = "lots";
    auto record = MakeRecord(ObjectKind::kResourceQueue, "", "etl", queue);

    EXPECT_THROW(Render(record), MetadumpError);
}

TEST_F(DdlRendererTest, ResourceGroups) {
    ResourceGroupDefinition group{20, 30, 80, 10, 5};
    auto created = MakeRecord(ObjectKind::kResourceGroup, "", "reporting", group);
    auto builtin = MakeRecord(ObjectKind::kResourceGroup, "", "admin_group", group);

    EXPECT_EQ(Render(created).statement,
              "\n\nCREATE RESOURCE GROUP reporting WITH (CPU_RATE_LIMIT=20, MEMORY_LIMIT=30, "
              "MEMORY_SHARED_QUOTA=80, MEMORY_SPILL_RATIO=10, CONCURRENCY=5);");
    std::string altered = Render(builtin).statement;
    EXPECT_EQ(altered.find("\n\nALTER RESOURCE GROUP admin_group SET CPU_RATE_LIMIT 20;"), 0u);
    EXPECT_NE(altered.find("\n\nALTER RESOURCE GROUP admin_group SET CONCURRENCY 5;"), std::string::npos);
}

TEST_F(DdlRendererTest, RoleAttributes) {
    RoleDefinition role;
    role.can_login = true;
    role.connection_limit = 10;
    role.valid_until = "2027-01-01 00:00:00-08";
    role.resource_queue = "etl";
    role.resource_group = "reporting";
    role.create_writable_gpfdist = true;
    role.time_constraints.push_back(TimeConstraint{0, "09:00:00", 0, "17:00:00"});
    auto record = MakeRecord(ObjectKind::kRole, "", "analyst", role);
    record.metadata.comment = "Analysts";

    auto rendered = Render(record);

    EXPECT_EQ(rendered.statement,
              "\n\nCREATE ROLE analyst;\n"
              "ALTER ROLE analyst WITH NOSUPERUSER INHERIT NOCREATEROLE NOCREATEDB LOGIN CONNECTION LIMIT 10 "
              "VALID UNTIL '2027-01-01 00:00:00-08' RESOURCE QUEUE etl RESOURCE GROUP reporting "
              "CREATEEXTTABLE (protocol='gpfdist', type='writable');\n"
              "ALTER ROLE analyst DENY BETWEEN DAY 0 TIME '09:00:00' AND DAY 0 TIME '17:00:00';");
    EXPECT_EQ(rendered.annotation, "\n\nCOMMENT ON ROLE analyst IS 'Analysts';");
}

TEST_F(DdlRendererTest, ResourceGroupNeedsVersionFive) {
    RoleDefinition role;
    role.resource_group = "reporting";
    auto record = MakeRecord(ObjectKind::kRole, "", "analyst", role);
    DdlRenderer old_renderer("4.3.0");

    auto rendered = old_renderer.Render(SequencedObject{&record, EmissionForm::kFull});

    EXPECT_EQ(rendered.statement.find("RESOURCE GROUP"), std::string::npos);
}

TEST_F(DdlRendererTest, RoleGrant) {
    auto record = MakeRecord(ObjectKind::kRoleGrant, "", "analyst", RoleGrantDefinition{"readers", "analyst", "gpadmin", true});

    EXPECT_EQ(Render(record).statement, "\nGRANT readers TO analyst WITH ADMIN OPTION GRANTED BY gpadmin;");
}

TEST_F(DdlRendererTest, Tablespace) {
    auto record = MakeRecord(ObjectKind::kTablespace, "", "fast", TablespaceDefinition{"ssd_fs"});
    record.metadata.owner = "gpadmin";

    auto rendered = Render(record);

    EXPECT_EQ(rendered.statement, "\n\nCREATE TABLESPACE fast FILESPACE ssd_fs;");
    EXPECT_EQ(rendered.annotation, "\n\nALTER TABLESPACE fast OWNER TO gpadmin;");
}

TEST_F(DdlRendererTest, ShellFormHasNoAnnotation) {
    auto record = MakeRecord(ObjectKind::kBaseType, "public", "complex", TypeDefinition{});
    record.metadata.owner = "gpadmin";

    auto rendered = Render(record, EmissionForm::kShell);

    EXPECT_EQ(rendered.statement, "\n\nCREATE TYPE public.complex;");
    EXPECT_TRUE(rendered.annotation.empty());
}

TEST_F(DdlRendererTest, BaseType) {
    TypeDefinition type;
    type.input = "public.complex_in";
    type.output = "public.complex_out";
    type.receive = "public.complex_recv";
    type.internal_length = 16;
    type.alignment = "d";
    type.storage = "p";
    type.default_value = "(0,0)";
    type.delimiter = ",";
    auto record = MakeRecord(ObjectKind::kBaseType, "public", "complex", type);

    EXPECT_EQ(Render(record).statement,
              "\n\nCREATE TYPE public.complex (\n"
              "\tINPUT = public.complex_in,\n"
              "\tOUTPUT = public.complex_out,\n"
              "\tRECEIVE = public.complex_recv,\n"
              "\tINTERNALLENGTH = 16,\n"
              "\tALIGNMENT = double,\n"
              "\tSTORAGE = plain,\n"
              "\tDEFAULT = '(0,0)'\n"
              ");");
}

TEST_F(DdlRendererTest, CompositeEnumAndDomainTypes) {
    TypeDefinition composite;
    composite.attributes = {"r double precision", "i double precision"};
    TypeDefinition enumeration;
    enumeration.enum_labels = {"sad", "it's ok"};
    TypeDefinition domain;
    domain.base_type = "integer";
    domain.default_value = "0";
    domain.not_null = true;

    EXPECT_EQ(Render(MakeRecord(ObjectKind::kCompositeType, "public", "pair", composite)).statement,
              "\n\nCREATE TYPE public.pair AS (\n\tr double precision,\n\ti double precision\n);");
    EXPECT_EQ(Render(MakeRecord(ObjectKind::kEnumType, "public", "mood", enumeration)).statement,
              "\n\nCREATE TYPE public.mood AS ENUM (\n\t'sad',\n\t'it''s ok'\n);");
    EXPECT_EQ(Render(MakeRecord(ObjectKind::kDomainType, "public", "counter", domain)).statement,
              "\n\nCREATE DOMAIN public.counter AS integer DEFAULT 0 NOT NULL;");
}

TEST_F(DdlRendererTest, FunctionWithPrivileges) {
    FunctionDefinition function{"integer, integer", "integer", "sql", "SELECT $1 + $2"};
    auto record = MakeRecord(ObjectKind::kFunction, "public", "add", function);
    record.metadata.owner = "gpadmin";
    record.metadata.privileges.push_back(PrivilegeGrant{"", "EXECUTE"});
    record.metadata.privileges.push_back(PrivilegeGrant{"analyst", "ALL"});

    auto rendered = Render(record);

    EXPECT_EQ(rendered.statement,
              "\n\nCREATE FUNCTION public.add(integer, integer) RETURNS integer AS $$SELECT $1 + $2$$\n"
              "LANGUAGE sql;");
    EXPECT_EQ(rendered.annotation,
              "\n\nALTER FUNCTION public.add(integer, integer) OWNER TO gpadmin;"
              "\n\nREVOKE ALL ON FUNCTION public.add(integer, integer) FROM PUBLIC;"
              "\nREVOKE ALL ON FUNCTION public.add(integer, integer) FROM gpadmin;"
              "\nGRANT EXECUTE ON FUNCTION public.add(integer, integer) TO PUBLIC;"
              "\nGRANT ALL ON FUNCTION public.add(integer, integer) TO analyst;");
}

TEST_F(DdlRendererTest, IndexStatement) {
    auto with_text = MakeRecord(ObjectKind::kIndex, "public", "idx",
                                IndexDefinition{"CREATE INDEX idx ON public.t USING btree (a)"});
    auto without_text = MakeRecord(ObjectKind::kIndex, "public", "idx2", IndexDefinition{});

    EXPECT_EQ(Render(with_text).statement, "\n\nCREATE INDEX idx ON public.t USING btree (a);");
    EXPECT_EQ(Render(without_text).statement, "");
}

TEST_F(DdlRendererTest, MissingDefinitionIsAnError) {
    CatalogObjectRecord record;
    record.kind = ObjectKind::kRole;
    record.name = "ghost";

    EXPECT_THROW(Render(record), MetadumpError);
}

TEST_F(DdlRendererTest, TocObjectTypes) {
    auto type = MakeRecord(ObjectKind::kBaseType, "public", "t", TypeDefinition{});
    auto domain = MakeRecord(ObjectKind::kDomainType, "public", "d", TypeDefinition{});
    auto grant = MakeRecord(ObjectKind::kRoleGrant, "", "g", RoleGrantDefinition{});

    EXPECT_EQ(TocObjectType({&type, EmissionForm::kShell}), "SHELL TYPE");
    EXPECT_EQ(TocObjectType({&type, EmissionForm::kFull}), "TYPE");
    EXPECT_EQ(TocObjectType({&domain, EmissionForm::kFull}), "DOMAIN");
    EXPECT_EQ(TocObjectType({&grant, EmissionForm::kFull}), "ROLE GRANT");
}
