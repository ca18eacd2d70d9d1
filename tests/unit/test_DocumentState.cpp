#include <gtest/gtest.h>
#include "types/Document.hpp"
#include "types/DocumentState.hpp"
#include "types/CustomMetadata.hpp"

#include <nlohmann/json.hpp>

using namespace dm::types;

TEST(DocumentStateTest, LifecycleNamesRoundTrip) {
    for (const auto l : {Lifecycle::Pending, Lifecycle::Active, Lifecycle::Failed})
        EXPECT_EQ(DocumentState::fromString(to_string(l)), DocumentState(l));
}

TEST(DocumentStateTest, UnspecifiedReadsAsPending) {
    EXPECT_EQ(DocumentState::fromString("STATE_UNSPECIFIED").primary, Lifecycle::Pending);
}

TEST(DocumentStateTest, OverlayKeepsSuppliedLifecycle) {
    const auto s = DocumentState::fromString("DUPLICATE_FILE", Lifecycle::Active);
    EXPECT_EQ(s.primary, Lifecycle::Active);
    ASSERT_TRUE(s.advisory.has_value());
    EXPECT_EQ(*s.advisory, Advisory::DuplicateFile);
    EXPECT_TRUE(s.flagged());
    EXPECT_EQ(to_string(s), "DUPLICATE_FILE");
    EXPECT_EQ(s.cleared(), DocumentState(Lifecycle::Active));
}

TEST(DocumentStateTest, UnknownNameThrows) {
    EXPECT_THROW(DocumentState::fromString("STATE_BOGUS"), std::invalid_argument);
}

TEST(DocumentStateTest, OverlayPriorityOrder) {
    EXPECT_GT(advisoryPriority(Advisory::DuplicateFile), advisoryPriority(Advisory::MissingMetadata));
    EXPECT_GT(advisoryPriority(Advisory::MissingMetadata), advisoryPriority(Advisory::MetadataMismatch));
}

TEST(DocumentStateTest, MarkersDecideLifecycle) {
    Document d;
    EXPECT_EQ(d.markerLifecycle(), Lifecycle::Pending);
    EXPECT_FALSE(d.inFlight());

    d.started_at = 100;
    EXPECT_TRUE(d.inFlight());
    EXPECT_EQ(d.markerLifecycle(), Lifecycle::Pending);

    d.uploaded_at = 200;
    EXPECT_FALSE(d.inFlight());
    EXPECT_EQ(d.markerLifecycle(), Lifecycle::Active);

    d.error = "boom";
    EXPECT_EQ(d.markerLifecycle(), Lifecycle::Failed);

    d.error = "";
    EXPECT_FALSE(d.hasError());
}

TEST(DocumentStateTest, SampleLabelIncludesCategory) {
    Document d;
    d.display_name = "h1.md";
    EXPECT_EQ(d.sampleLabel(), "h1.md");
    d.category = "guides";
    EXPECT_EQ(d.sampleLabel(), "guides/h1.md");
}

TEST(CustomMetadataTest, ParsesRemoteEntries) {
    const auto j = nlohmann::json::parse(R"([
        {"key": "id", "numericValue": 42},
        {"key": "size", "numericValue": "7"},
        {"key": "hash", "stringValue": "abc"},
        {"key": "tags", "stringListValue": {"values": ["a", "b"]}}
    ])");
    const auto metadata = j.get<CustomMetadata>();
    ASSERT_EQ(metadata.size(), 4u);

    ASSERT_NE(findEntry(metadata, "id"), nullptr);
    EXPECT_EQ(findEntry(metadata, "id")->valueAsString(), "42");
    EXPECT_EQ(findEntry(metadata, "size")->valueAsString(), "7");
    EXPECT_EQ(findEntry(metadata, "hash")->valueAsString(), "abc");
    EXPECT_EQ(findEntry(metadata, "tags")->valueAsString(), "a,b");
    EXPECT_EQ(findEntry(metadata, "category"), nullptr);
}

TEST(CustomMetadataTest, SerializesCamelCaseKeys) {
    const nlohmann::json j = CustomMetadataEntry::numeric("id", 3);
    EXPECT_EQ(j.at("key"), "id");
    EXPECT_EQ(j.at("numericValue"), 3.0);
    EXPECT_FALSE(j.contains("stringValue"));
}

TEST(CustomMetadataTest, NumericValuesBeyondIntegerRangeStayPrintable) {
    EXPECT_EQ(CustomMetadataEntry::numeric("id", 42).valueAsString(), "42");
    EXPECT_EQ(CustomMetadataEntry::numeric("id", -3).valueAsString(), "-3");
    EXPECT_EQ(CustomMetadataEntry::numeric("ratio", 2.5).valueAsString(), "2.5");
    EXPECT_EQ(CustomMetadataEntry::numeric("id", 1e20).valueAsString(), "100000000000000000000");
    EXPECT_EQ(CustomMetadataEntry::numeric("id", -1e20).valueAsString(), "-100000000000000000000");
    EXPECT_FALSE(CustomMetadataEntry::numeric("id", 1e300).valueAsString().empty());
}
