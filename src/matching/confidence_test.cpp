#include "matching/confidence.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cmath>

namespace transitperf {
namespace {

TEST(ConfidenceTest, DistanceTerm) {
  EXPECT_DOUBLE_EQ(DistanceTerm(0.0), 1.0);
  EXPECT_DOUBLE_EQ(DistanceTerm(250.0), 0.5);
  EXPECT_DOUBLE_EQ(DistanceTerm(500.0), 0.0);
  EXPECT_DOUBLE_EQ(DistanceTerm(5000.0), 0.0);
}

TEST(ConfidenceTest, TimeTermLate) {
  EXPECT_DOUBLE_EQ(TimeTerm(0.0), 1.0);
  EXPECT_DOUBLE_EQ(TimeTerm(450.0), 0.5);
  EXPECT_DOUBLE_EQ(TimeTerm(900.0), 0.0);
  EXPECT_DOUBLE_EQ(TimeTerm(3600.0), 0.0);
}

TEST(ConfidenceTest, TimeTermPenalizesRunningEarly) {
  // Within the grace period early and late score the same.
  EXPECT_DOUBLE_EQ(TimeTerm(-90.0), TimeTerm(90.0));
  EXPECT_DOUBLE_EQ(TimeTerm(-120.0), TimeTerm(120.0));
  // Beyond it early costs an extra 0.3.
  EXPECT_NEAR(TimeTerm(-180.0), TimeTerm(180.0) - 0.3, 1e-12);
  EXPECT_DOUBLE_EQ(TimeTerm(-800.0), 0.0);
}

TEST(ConfidenceTest, ScoreWeighsTermsEqually) {
  EXPECT_DOUBLE_EQ(Score(1.0, 1.0), 1.0);
  EXPECT_DOUBLE_EQ(Score(0.0, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(Score(1.0, 0.0), 0.5);
  EXPECT_DOUBLE_EQ(Score(0.4, 0.8), 0.6);
}

TEST(ConfidenceTest, ThresholdIsExclusive) {
  EXPECT_FALSE(IsConfident(0.3));
  EXPECT_FALSE(IsConfident(Score(0.6, 0.0)));
  EXPECT_TRUE(IsConfident(0.31));
  EXPECT_TRUE(IsConfident(Score(0.62, 0.0)));
  EXPECT_FALSE(IsConfident(0.0));
}

RC_GTEST_PROP(ConfidenceProp, ScoreStaysInUnitInterval, ()) {
  const double distance = *rc::gen::inRange(0, 2000000) / 1000.0;
  const double deviation = *rc::gen::inRange(-3600000, 3600000) / 1000.0;
  const double score = Score(DistanceTerm(distance), TimeTerm(deviation));
  RC_ASSERT(score >= 0.0);
  RC_ASSERT(score <= 1.0);
}

RC_GTEST_PROP(ConfidenceProp, CloserInSpaceNeverLowersScore, ()) {
  const double deviation = *rc::gen::inRange(-3600, 3600);
  const double far = *rc::gen::inRange(0, 2000);
  const double near = *rc::gen::inRange(0, static_cast<int>(far) + 1);
  RC_ASSERT(
      Score(DistanceTerm(near), TimeTerm(deviation)) >=
      Score(DistanceTerm(far), TimeTerm(deviation))
  );
}

RC_GTEST_PROP(ConfidenceProp, CloserInTimeNeverLowersScore, ()) {
  const double distance = *rc::gen::inRange(0, 1000);
  const int far = *rc::gen::inRange(-3600, 3600);
  // Same side of the schedule, nearer to zero deviation.
  const int magnitude = *rc::gen::inRange(0, std::abs(far) + 1);
  const int near = far < 0 ? -magnitude : magnitude;
  RC_ASSERT(
      Score(DistanceTerm(distance), TimeTerm(near)) >=
      Score(DistanceTerm(distance), TimeTerm(far))
  );
}

}  // namespace
}  // namespace transitperf
