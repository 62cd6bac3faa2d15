#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "../../src/emitter/metadata_emitter.h"
#include "../../src/output/section_reader.h"
#include "../../src/common/errors.h"

#include <cstdlib>
#include <unistd.h>

using namespace Metadump;
using ::testing::Return;
using ::testing::Throw;
using ::testing::Truly;

class MockStatementRenderer : public StatementRenderer {
public:
    MOCK_METHOD(RenderedStatement, Render, (const SequencedObject& object), (override));
};

namespace {

CatalogObjectRecord MakeRecord(Oid oid, ObjectKind kind, const std::string& schema, const std::string& name) {
    CatalogObjectRecord record;
    record.oid = oid;
    record.kind = kind;
    record.schema = schema;
    record.name = name;
    return record;
}

auto NamedShell(const std::string& name) {
    return Truly([name](const SequencedObject& object) { return object.is_shell() && object.record->name == name; });
}

auto NamedFull(const std::string& name) {
    return Truly([name](const SequencedObject& object) { return !object.is_shell() && object.record->name == name; });
}

} // namespace

class MetadataEmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir_template[] = "/tmp/metadump_emitter_XXXXXX";
        char* dir = ::mkdtemp(dir_template);
        ASSERT_NE(dir, nullptr);
        dir_ = dir;

        gucs_ = MakeRecord(0, ObjectKind::kSessionGucs, "", "");
        role_ = MakeRecord(10, ObjectKind::kRole, "", "gpadmin");
        type_ = MakeRecord(20, ObjectKind::kBaseType, "public", "complex");
        function_ = MakeRecord(21, ObjectKind::kFunction, "public", "complex_in");
        index_ = MakeRecord(30, ObjectKind::kIndex, "public", "idx_orders");
        sequence_ = {
            {&gucs_, EmissionForm::kFull},
            {&role_, EmissionForm::kFull},
            {&type_, EmissionForm::kShell},
            {&function_, EmissionForm::kFull},
            {&type_, EmissionForm::kFull},
            {&index_, EmissionForm::kFull},
        };
    }

    void TearDown() override {
        for (const char* file : {"/global.sql", "/predata.sql", "/postdata.sql"}) {
            ::unlink((dir_ + file).c_str());
        }
        ::rmdir(dir_.c_str());
    }

    std::string dir_;
    CatalogObjectRecord gucs_, role_, type_, function_, index_;
    EmissionSequence sequence_;
    MockStatementRenderer renderer_;
    TableOfContents toc_;
};

TEST_F(MetadataEmitterTest, RecordsExactRangesForPredata) {
    EXPECT_CALL(renderer_, Render(NamedFull("")))
            .WillOnce(Return(RenderedStatement{"SET client_encoding = 'UTF8';\n", ""}));
    EXPECT_CALL(renderer_, Render(NamedShell("complex")))
            .WillOnce(Return(RenderedStatement{"\n\nCREATE TYPE public.complex;", ""}));
    EXPECT_CALL(renderer_, Render(NamedFull("complex_in")))
            .WillOnce(Return(RenderedStatement{"\n\nCREATE FUNCTION public.complex_in() ...;",
                                               "\n\nALTER FUNCTION public.complex_in() OWNER TO gpadmin;"}));
    EXPECT_CALL(renderer_, Render(NamedFull("complex")))
            .WillOnce(Return(RenderedStatement{"\n\nCREATE TYPE public.complex (...);", ""}));

    MetadataEmitter emitter(renderer_, toc_);
    std::string path = dir_ + "/predata.sql";
    {
        ByteCountingWriter writer(Section::kPredata, path);
        EXPECT_EQ(emitter.EmitSection(sequence_, writer), 4u);
        writer.Commit();
    }

    auto entries = toc_.Entries(Section::kPredata);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].object_type, "SESSION GUCS");
    EXPECT_EQ(entries[1].object_type, "SHELL TYPE");
    EXPECT_EQ(entries[2].object_type, "FUNCTION");
    EXPECT_EQ(entries[3].object_type, "TYPE");

    // Primary text and annotation share one entry.
    EXPECT_EQ(entries[2].length(),
              std::string("\n\nCREATE FUNCTION public.complex_in() ...;").size() +
              std::string("\n\nALTER FUNCTION public.complex_in() OWNER TO gpadmin;").size());

    // Entries are contiguous and cover the whole section.
    SectionReader reader(path);
    uint64_t expected_start = 0;
    std::string concatenated;
    for (const auto& entry : entries) {
        EXPECT_EQ(entry.start_offset, expected_start);
        expected_start = entry.end_offset;
        concatenated += reader.Extract(entry);
    }
    EXPECT_EQ(expected_start, reader.size());
    EXPECT_EQ(reader.Extract(TocEntry{Section::kPredata, "", "", "", 0, reader.size()}), concatenated);
    EXPECT_EQ(reader.Extract(entries[1]), "\n\nCREATE TYPE public.complex;");
}

TEST_F(MetadataEmitterTest, EmptyTextProducesZeroLengthEntry) {
    EXPECT_CALL(renderer_, Render(NamedFull(""))).WillOnce(Return(RenderedStatement{"SET a = b;\n", ""}));
    EXPECT_CALL(renderer_, Render(NamedFull("idx_orders"))).WillOnce(Return(RenderedStatement{}));

    MetadataEmitter emitter(renderer_, toc_);
    ByteCountingWriter writer(Section::kPostdata, dir_ + "/postdata.sql");
    EXPECT_EQ(emitter.EmitSection(sequence_, writer), 2u);

    auto index = toc_.FindFirst(Section::kPostdata, "public", "idx_orders", "INDEX");
    ASSERT_TRUE(index.has_value());
    EXPECT_TRUE(index->empty());
    EXPECT_EQ(index->start_offset, writer.CurrentOffset());
}

TEST_F(MetadataEmitterTest, GlobalSectionSkipsSchemaObjects) {
    EXPECT_CALL(renderer_, Render(NamedFull(""))).WillOnce(Return(RenderedStatement{"SET a = b;\n", ""}));
    EXPECT_CALL(renderer_, Render(NamedFull("gpadmin")))
            .WillOnce(Return(RenderedStatement{"\n\nCREATE ROLE gpadmin;", ""}));

    MetadataEmitter emitter(renderer_, toc_);
    ByteCountingWriter writer(Section::kGlobal, dir_ + "/global.sql");
    emitter.EmitSection(sequence_, writer);

    auto entries = toc_.Entries(Section::kGlobal);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].name, "gpadmin");
    EXPECT_EQ(entries[1].object_type, "ROLE");
    EXPECT_EQ(entries[1].start_offset, 11u);
    EXPECT_EQ(entries[1].end_offset, 11u + 22u);
}

TEST_F(MetadataEmitterTest, SupplementalStatementsGetTheirOwnEntries) {
    RenderedStatement gucs{"SET a = b;\n", ""};
    gucs.supplements.push_back({"GPDB4 SESSION GUCS", "SET gp_strict_xml_parse = off;\n"});
    EXPECT_CALL(renderer_, Render(NamedFull(""))).WillOnce(Return(gucs));
    EXPECT_CALL(renderer_, Render(NamedFull("gpadmin")))
            .WillOnce(Return(RenderedStatement{"\n\nCREATE ROLE gpadmin;", ""}));

    MetadataEmitter emitter(renderer_, toc_);
    std::string path = dir_ + "/global.sql";
    {
        ByteCountingWriter writer(Section::kGlobal, path);
        EXPECT_EQ(emitter.EmitSection(sequence_, writer), 3u);
        writer.Commit();
    }

    auto entries = toc_.Entries(Section::kGlobal);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].object_type, "SESSION GUCS");
    EXPECT_EQ(entries[1].object_type, "GPDB4 SESSION GUCS");
    EXPECT_EQ(entries[2].object_type, "ROLE");
    EXPECT_EQ(entries[1].start_offset, entries[0].end_offset);
    EXPECT_EQ(entries[2].start_offset, entries[1].end_offset);

    SectionReader reader(path);
    EXPECT_EQ(reader.Extract(entries[0]), "SET a = b;\n");
    EXPECT_EQ(reader.Extract(entries[1]), "SET gp_strict_xml_parse = off;\n");
}

TEST_F(MetadataEmitterTest, RendererFailureStopsSection) {
    EXPECT_CALL(renderer_, Render(NamedFull(""))).WillOnce(Return(RenderedStatement{"SET a = b;\n", ""}));
    EXPECT_CALL(renderer_, Render(NamedFull("gpadmin"))).WillOnce(Throw(MetadumpError("bad role")));

    MetadataEmitter emitter(renderer_, toc_);
    ByteCountingWriter writer(Section::kGlobal, dir_ + "/global.sql");

    EXPECT_THROW(emitter.EmitSection(sequence_, writer), MetadumpError);
    EXPECT_EQ(toc_.Entries(Section::kGlobal).size(), 1u);
}
