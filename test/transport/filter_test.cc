#include <gtest/gtest.h>
#include "../../src/transport/transport.h"

using namespace Estuary;

namespace {

Record Reply(const std::string& root) {
	Record record;
	record.id = "reply";
	record.creator = "pk1";
	record.kind = 1111;
	record.tags = {{"e", root}};
	return record;
}

}  // namespace

TEST(FilterTest, SignatureIsOrderIndependent) {
	Filter a;
	a.kinds = {1111, 11};
	a.authors = {"pk2", "pk1"};
	Filter b;
	b.kinds = {11, 1111};
	b.authors = {"pk1", "pk2"};
	EXPECT_EQ(a.Signature(), b.Signature());
}

TEST(FilterTest, SeparatorsInValuesDoNotCollide) {
	Filter split;
	split.kinds = {1111};
	split.tags["e"] = {"x", "y"};
	Filter joined;
	joined.kinds = {1111};
	joined.tags["e"] = {"x,y"};

	EXPECT_NE(split.Signature(), joined.Signature());
	EXPECT_TRUE(split.Matches(Reply("x")));
	EXPECT_FALSE(joined.Matches(Reply("x")));
}

TEST(FilterTest, TagKeysAndFieldsDoNotCollide) {
	Filter a;
	a.tags["e"] = {"x];#p[1:y"};
	Filter b;
	b.tags["e"] = {"x"};
	b.tags["p"] = {"y"};
	EXPECT_NE(a.Signature(), b.Signature());

	Filter author;
	author.authors = {"11"};
	Filter kind;
	kind.kinds = {11};
	EXPECT_NE(author.Signature(), kind.Signature());
}

TEST(FilterTest, MatchesEveryConstraint) {
	Filter filter;
	filter.authors = {"pk1"};
	filter.kinds = {1111};
	filter.tags["e"] = {"conv-1"};
	EXPECT_TRUE(filter.Matches(Reply("conv-1")));
	EXPECT_FALSE(filter.Matches(Reply("conv-2")));

	Record other = Reply("conv-1");
	other.creator = "pk2";
	EXPECT_FALSE(filter.Matches(other));

	EXPECT_TRUE(Filter{}.Matches(other));
}

TEST(FilterTest, CachePolicyNames) {
	EXPECT_EQ(ParseCachePolicy("cache_only"), CachePolicy::kCacheOnly);
	EXPECT_EQ(ParseCachePolicy(CachePolicyName(CachePolicy::kCacheThenNetwork)), CachePolicy::kCacheThenNetwork);
	EXPECT_FALSE(ParseCachePolicy("sometimes").has_value());
}
