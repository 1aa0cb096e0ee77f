// tests/pagerank_config_test.cc
#include "dfrank/errors.hh"
#include "dfrank/pagerank_config.hh"

#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <string>

namespace dfrank {
namespace {

TEST(PageRankConfigBuilderTest, NoModeIsMissingConfiguration) {
  PageRankConfig::Builder builder;
  builder.SetResetProbability(0.2);
  EXPECT_THROW(builder.Build(), MissingConfigurationError);
}

TEST(PageRankConfigBuilderTest, FixedIterationsWithDefaults) {
  PageRankConfig config = PageRankConfig::Builder().FixedIterations(7).Build();
  ASSERT_TRUE(config.IsFixedIterations());
  EXPECT_EQ(std::get<FixedIterations>(config.mode()).num_iterations, 7);
  EXPECT_DOUBLE_EQ(config.reset_probability(), 0.15);
  EXPECT_FALSE(config.IsPersonalized());
  EXPECT_FALSE(config.mode_conflict());
}

TEST(PageRankConfigBuilderTest, UntilConvergenceCarriesAllFields) {
  PageRankConfig config = PageRankConfig::Builder()
                              .UntilConvergence(1e-4)
                              .SetResetProbability(0.3)
                              .SetSourceId(12)
                              .SetMaxSupersteps(50)
                              .Build();
  ASSERT_TRUE(config.IsUntilConvergence());
  EXPECT_DOUBLE_EQ(std::get<UntilConvergence>(config.mode()).tolerance, 1e-4);
  EXPECT_DOUBLE_EQ(config.reset_probability(), 0.3);
  ASSERT_TRUE(config.source_id().has_value());
  EXPECT_EQ(*config.source_id(), 12);
  EXPECT_EQ(config.max_supersteps(), 50u);
}

TEST(PageRankConfigBuilderTest, BothModesPreferConvergenceVisibly) {
  PageRankConfig config = PageRankConfig::Builder()
                              .FixedIterations(10)
                              .UntilConvergence(0.01)
                              .Build();
  EXPECT_TRUE(config.IsUntilConvergence());
  EXPECT_TRUE(config.mode_conflict());

  // Order of the setters does not matter
  PageRankConfig reversed = PageRankConfig::Builder()
                                .UntilConvergence(0.01)
                                .FixedIterations(10)
                                .Build();
  EXPECT_TRUE(reversed.IsUntilConvergence());
  EXPECT_TRUE(reversed.mode_conflict());
}

TEST(PageRankConfigBuilderTest, LastSetterOfAModeWins) {
  PageRankConfig config =
      PageRankConfig::Builder().FixedIterations(3).FixedIterations(9).Build();
  EXPECT_EQ(std::get<FixedIterations>(config.mode()).num_iterations, 9);
}

TEST(PageRankConfigBuilderTest, NonPositiveIterationsRejected) {
  EXPECT_THROW(PageRankConfig::Builder().FixedIterations(0).Build(),
               InvalidArgumentError);
  EXPECT_THROW(PageRankConfig::Builder().FixedIterations(-4).Build(),
               InvalidArgumentError);
}

TEST(PageRankConfigBuilderTest, NonPositiveToleranceRejected) {
  EXPECT_THROW(PageRankConfig::Builder().UntilConvergence(0.0).Build(),
               InvalidArgumentError);
  EXPECT_THROW(PageRankConfig::Builder().UntilConvergence(-1e-3).Build(),
               InvalidArgumentError);
}

TEST(PageRankConfigBuilderTest, ResetProbabilityMustBeOpenUnitInterval) {
  for (double p : {0.0, 1.0, -0.1, 1.5}) {
    EXPECT_THROW(PageRankConfig::Builder()
                     .FixedIterations(1)
                     .SetResetProbability(p)
                     .Build(),
                 InvalidArgumentError)
        << "p = " << p;
  }
}

TEST(PageRankConfigBuilderTest, ZeroSuperstepCapRejected) {
  EXPECT_THROW(
      PageRankConfig::Builder().UntilConvergence(0.1).SetMaxSupersteps(0).Build(),
      InvalidArgumentError);
}

TEST(PageRankConfigBuilderTest, UnsignedSourceOutOfRangeIsTypeMismatch) {
  PageRankConfig::Builder builder;
  EXPECT_THROW(builder.SetSourceId(std::numeric_limits<uint64_t>::max()),
               TypeMismatchError);
  EXPECT_NO_THROW(builder.SetSourceId(uint64_t{5}));
}

TEST(PageRankConfigBuilderTest, ParsesTextualSourceIds) {
  PageRankConfig config =
      PageRankConfig::Builder().FixedIterations(1).ParseSourceId("-17").Build();
  EXPECT_EQ(config.source_id().value(), -17);

  PageRankConfig::Builder builder;
  EXPECT_THROW(builder.ParseSourceId("abc"), TypeMismatchError);
  EXPECT_THROW(builder.ParseSourceId("12x"), TypeMismatchError);
  EXPECT_THROW(builder.ParseSourceId("1.5"), TypeMismatchError);
  EXPECT_THROW(builder.ParseSourceId("99999999999999999999"),
               TypeMismatchError);
}

TEST(PageRankConfigBuilderTest, ClearSourceId) {
  PageRankConfig config = PageRankConfig::Builder()
                              .FixedIterations(1)
                              .SetSourceId(3)
                              .ClearSourceId()
                              .Build();
  EXPECT_FALSE(config.IsPersonalized());
}

TEST(PageRankConfigTest, DirectConstructionValidates) {
  EXPECT_THROW(PageRankConfig(FixedIterations{0}), InvalidArgumentError);
  EXPECT_THROW(PageRankConfig(UntilConvergence{1e-3}, 1.0),
               InvalidArgumentError);
  PageRankConfig config(UntilConvergence{1e-3}, 0.25, VertexId{4});
  EXPECT_EQ(config.source_id().value(), 4);
  EXPECT_EQ(config.max_supersteps(), PageRankConfig::kDefaultMaxSupersteps);
}

TEST(PageRankConfigTest, DescribeNamesTheMode) {
  PageRankConfig fixed(FixedIterations{5});
  EXPECT_NE(fixed.Describe().find("fixed iterations=5"), std::string::npos);
  PageRankConfig dynamic(UntilConvergence{0.5}, 0.15, VertexId{2});
  EXPECT_NE(dynamic.Describe().find("until convergence"), std::string::npos);
  EXPECT_NE(dynamic.Describe().find("source=2"), std::string::npos);
}

} // namespace
} // namespace dfrank
