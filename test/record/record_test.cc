#include <gtest/gtest.h>
#include "../../src/record/record.h"

using namespace Estuary;

class RecordTest : public ::testing::Test {
protected:
	void SetUp() override {
		record_.id = "r1";
		record_.creator = "pk1";
		record_.kind = 1934;
		record_.created_at = 100;
		record_.tags = {
			{"title", "First"},
			{"title", "Second"},
			{"p", "agent-a"},
			{"p"},
			{"p", "agent-b", "wss://relay"},
			{"status", ""},
			{},
		};
	}

	Record record_;
};

TEST_F(RecordTest, TagValueUsesFirstMatchingGroup) {
	EXPECT_EQ(TagValue(record_, "title"), "First");
	EXPECT_FALSE(TagValue(record_, "missing").has_value());
}

TEST_F(RecordTest, EmptyValueIsPresentButNotNonEmpty) {
	EXPECT_EQ(TagValue(record_, "status"), "");
	EXPECT_FALSE(NonEmptyTagValue(record_, "status").has_value());
	EXPECT_EQ(NonEmptyTagValue(record_, "title"), "First");
}

TEST_F(RecordTest, TagValuesSkipsShortGroups) {
	EXPECT_EQ(TagValues(record_, "p"), (std::vector<std::string>{"agent-a", "agent-b"}));
	EXPECT_TRUE(TagValues(record_, "t").empty());
}

TEST_F(RecordTest, FirstGroupWithoutValueResolvesToAbsent) {
	Record record;
	record.tags = {{"d"}, {"d", "late"}};
	EXPECT_FALSE(TagValue(record, "d").has_value());
	EXPECT_TRUE(HasTag(record, "d"));
}

TEST_F(RecordTest, AddressableIdentity) {
	EXPECT_EQ(AddressableIdentity(31933, "pk1", "proj1"), "31933:pk1:proj1");
}

TEST_F(RecordTest, NormalizeAddressKeepsThreeSegments) {
	EXPECT_EQ(NormalizeAddress("31933:pk1:proj1"), "31933:pk1:proj1");
	EXPECT_EQ(NormalizeAddress("31933:pk1:proj1:wss://relay.example"), "31933:pk1:proj1");
	EXPECT_EQ(NormalizeAddress("31933:pk1"), "31933:pk1");
	EXPECT_EQ(NormalizeAddress(""), "");
}

TEST_F(RecordTest, ProjectReferenceIsNormalized) {
	record_.tags.push_back({"a", "31933:pk1:proj1:extra"});
	EXPECT_EQ(ProjectReference(record_), "31933:pk1:proj1");
	Record bare;
	EXPECT_EQ(ProjectReference(bare), "");
}

TEST_F(RecordTest, FirstLine) {
	EXPECT_EQ(FirstLine("hello\nworld"), "hello");
	EXPECT_EQ(FirstLine("single"), "single");
	EXPECT_EQ(FirstLine(""), "");
	EXPECT_EQ(FirstLine("\nsecond"), "");
}

TEST_F(RecordTest, Equality) {
	Record copy = record_;
	EXPECT_EQ(copy, record_);
	copy.tags.pop_back();
	EXPECT_NE(copy, record_);
}
