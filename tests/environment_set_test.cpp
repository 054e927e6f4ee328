#include "matrixforge/environment/environment_set.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <unordered_set>

#include "gtest/gtest.h"

using namespace matrixforge;
using matrixforge::test::env_set;

TEST(EnvironmentSetTest, LabelsAreSortedAndDeduplicated) {
  auto env = EnvironmentSet::from_labels({"linux", "gcc", "linux"});
  ASSERT_TRUE(env.has_value());
  EXPECT_EQ(env->labels(), (std::vector<std::string>{"gcc", "linux"}));
  EXPECT_EQ(env->canonical_name(), "gcc,linux");
  EXPECT_EQ(env->size(), 2U);
}

TEST(EnvironmentSetTest, DeclarationOrderDoesNotMatter) {
  EXPECT_EQ(env_set({"linux", "gcc"}), env_set({"gcc", "linux"}));
  EXPECT_EQ(std::hash<EnvironmentSet>{}(env_set({"linux", "gcc"})),
            std::hash<EnvironmentSet>{}(env_set({"gcc", "linux"})));
}

TEST(EnvironmentSetTest, EmptyLabelListIsDefault) {
  auto env = EnvironmentSet::from_labels({});
  ASSERT_TRUE(env.has_value());
  EXPECT_TRUE(env->is_default());
  EXPECT_EQ(env->canonical_name(), "default");
  EXPECT_EQ(*env, EnvironmentSet{});
}

TEST(EnvironmentSetTest, RejectsInvalidLabels) {
  EXPECT_FALSE(EnvironmentSet::from_labels({""}).has_value());
  EXPECT_FALSE(EnvironmentSet::from_labels({"a,b"}).has_value());
  EXPECT_FALSE(EnvironmentSet::from_labels({"tab\there"}).has_value());
  EXPECT_EQ(EnvironmentSet::from_labels({"linux", ""}).error(),
            make_error_code(Error::InvalidArgument));
}

TEST(EnvironmentSetTest, DefaultLabelAloneIsReserved) {
  EXPECT_FALSE(EnvironmentSet::from_labels({"default"}).has_value());
  EXPECT_TRUE(EnvironmentSet::from_labels({"default", "linux"}).has_value());
}

TEST(EnvironmentSetTest, ParseInvertsCanonicalName) {
  for (const auto &env : {EnvironmentSet{}, env_set({"linux"}),
                          env_set({"x86", "gcc", "linux"})}) {
    auto parsed = EnvironmentSet::parse(env.canonical_name());
    ASSERT_TRUE(parsed.has_value()) << env.canonical_name();
    EXPECT_EQ(*parsed, env);
  }
}

TEST(EnvironmentSetTest, ParseRejectsNonCanonicalNames) {
  EXPECT_EQ(EnvironmentSet::parse("linux,gcc").error(),
            make_error_code(Error::MalformedIdentifier));
  EXPECT_FALSE(EnvironmentSet::parse("gcc,gcc").has_value());
  EXPECT_FALSE(EnvironmentSet::parse("").has_value());
  EXPECT_FALSE(EnvironmentSet::parse("gcc,").has_value());
}

TEST(EnvironmentSetTest, ContainsAndSubset) {
  auto full = env_set({"linux", "gcc", "x86"});
  EXPECT_TRUE(full.contains("gcc"));
  EXPECT_FALSE(full.contains("clang"));
  EXPECT_TRUE(env_set({"linux"}).is_subset_of(full));
  EXPECT_TRUE(EnvironmentSet{}.is_subset_of(full));
  EXPECT_FALSE(env_set({"linux", "clang"}).is_subset_of(full));
}

TEST(EnvironmentSetTest, MatchesAnyConstraintLabel) {
  auto env = env_set({"linux", "gcc"});
  EXPECT_TRUE(env.matches({"windows", "gcc"}));
  EXPECT_FALSE(env.matches({"windows"}));
  EXPECT_FALSE(EnvironmentSet{}.matches({"linux"}));
}

TEST(EnvironmentSetTest, DefaultSetMatchesDefaultToken) {
  EXPECT_TRUE(EnvironmentSet{}.matches({"linux", "default"}));
  EXPECT_FALSE(env_set({"linux"}).matches({"default"}));
}

TEST(EnvironmentSetTest, OrdersLabelByLabelWithPrefixFirst) {
  EXPECT_LT(EnvironmentSet{}, env_set({"a"}));
  EXPECT_LT(env_set({"a"}), env_set({"a", "b"}));
  EXPECT_LT(env_set({"a", "b"}), env_set({"b"}));
  EXPECT_LT(env_set({"a", "z"}), env_set({"b"}));
  EXPECT_FALSE(env_set({"b", "a"}) < env_set({"a", "b"}));

  std::vector<EnvironmentSet> sets{env_set({"b"}), env_set({"a", "b"}),
                                   EnvironmentSet{}, env_set({"a"})};
  std::ranges::sort(sets);
  EXPECT_EQ(sets, (std::vector<EnvironmentSet>{EnvironmentSet{}, env_set({"a"}),
                                               env_set({"a", "b"}),
                                               env_set({"b"})}));
}

TEST(EnvironmentSetTest, DistinctSetsHaveDistinctNames) {
  const std::vector<std::string> pool{"a", "b", "ab", "default", "linux",
                                      "x86_64", "a.b"};
  std::vector<EnvironmentSet> sets;
  for (unsigned mask = 0; mask < (1U << pool.size()); ++mask) {
    std::vector<std::string> labels;
    for (std::size_t i = 0; i < pool.size(); ++i) {
      if ((mask & (1U << i)) != 0) {
        labels.push_back(pool[i]);
      }
    }
    if (auto env = EnvironmentSet::from_labels(std::move(labels))) {
      sets.push_back(std::move(*env));
    }
  }
  // every subset except {"default"} alone
  ASSERT_EQ(sets.size(), (1U << pool.size()) - 1);

  std::unordered_set<std::string> names;
  std::unordered_set<std::string> keys;
  for (const auto &env : sets) {
    EXPECT_TRUE(names.insert(env.canonical_name()).second)
        << env.canonical_name();
    EXPECT_TRUE(keys.insert(env.directory_key().generic_string()).second)
        << env.canonical_name();
  }
}

TEST(EnvironmentSetTest, DirectoryKeyEncodesComponents) {
  EXPECT_EQ(EnvironmentSet{}.directory_key(), std::filesystem::path("env-"));
  EXPECT_EQ(env_set({"linux", "gcc"}).directory_key(),
            std::filesystem::path("env-gcc") / "env-linux");
  auto key = env_set({"a/b"}).directory_key();
  EXPECT_EQ(std::distance(key.begin(), key.end()), 1);
  EXPECT_EQ(key.string().find('/'), std::string::npos);
}

TEST(EnvironmentSetTest, UsableAsHashKey) {
  std::unordered_set<EnvironmentSet> seen;
  seen.insert(env_set({"linux", "gcc"}));
  seen.insert(env_set({"gcc", "linux"}));
  seen.insert(EnvironmentSet{});
  EXPECT_EQ(seen.size(), 2U);
}

TEST(EnvironmentSetTest, FormatsAsCanonicalName) {
  EXPECT_EQ(std::format("{}", env_set({"b", "a"})), "a,b");
}

TEST(EnvironmentConstraintTest, SplitsOnWhitespaceAndCommas) {
  auto c = parse_environment_constraint("linux, gcc\tx86\n");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(*c, (EnvironmentConstraint{"linux", "gcc", "x86"}));
}

TEST(EnvironmentConstraintTest, QuotesAndEscapesKeepSeparators) {
  auto c = parse_environment_constraint(R"("my label" 'a,b' x\ y `q"t`)");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(*c, (EnvironmentConstraint{"my label", "a,b", "x y", "q\"t"}));
}

TEST(EnvironmentConstraintTest, DuplicatesCollapseInFirstSeenOrder) {
  auto c = parse_environment_constraint("b a b a");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(*c, (EnvironmentConstraint{"b", "a"}));
}

TEST(EnvironmentConstraintTest, BlankTextIsAbsent) {
  EXPECT_FALSE(parse_environment_constraint("").has_value());
  EXPECT_FALSE(parse_environment_constraint(" , \t").has_value());
  EXPECT_FALSE(parse_environment_constraint(R"("")").has_value());
}

TEST(EnvironmentConstraintTest, FormatQuotesWhatWouldNotReparse) {
  EnvironmentConstraint c{"linux", "my label", "quo\"te", "back\\slash"};
  auto text = format_environment_constraint(c);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, R"(linux "my label" "quo\"te" "back\\slash")");
  auto reparsed = parse_environment_constraint(*text);
  ASSERT_TRUE(reparsed.has_value());
  EXPECT_EQ(*reparsed, c);
}

TEST(EnvironmentConstraintTest, FormatOfEmptyTokensIsAbsent) {
  EXPECT_FALSE(format_environment_constraint({}).has_value());
  EXPECT_FALSE(format_environment_constraint({"", ""}).has_value());
}
