// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//

#include <cmath>
#include <optional>
#include <stdexcept>

#include <gtest/gtest.h>

#include "learners/qtab_q_learner.h"


TEST(QLearnerTest, AppliesTheQLearningUpdate) {
    QLearner learner(0.5, 0.9, 0.0);

    // 1.0 + 0.5 * (2.0 + 0.9 * 3.0 - 1.0) = 2.85
    EXPECT_DOUBLE_EQ(learner.update(1.0, 2.0, 3.0), 2.85);
}

TEST(QLearnerTest, UnseenOldValueStartsAtInitialValue) {
    QLearner learner(0.5, 0.5, 2.0);

    // 2.0 + 0.5 * (-1.0 + 0.5 * 4.0 - 2.0) = 1.5
    EXPECT_DOUBLE_EQ(learner.update(std::nullopt, -1.0, 4.0), 1.5);
    EXPECT_DOUBLE_EQ(learner.initial_value(), 2.0);
}

TEST(QLearnerTest, MissingNextValueCountsAsZero) {
    QLearner learner(0.5, 0.9, 5.0);

    // 1.0 + 0.5 * (3.0 + 0.9 * 0.0 - 1.0) = 2.0
    EXPECT_DOUBLE_EQ(learner.update(1.0, 3.0, std::nullopt), 2.0);
}

TEST(QLearnerTest, ZeroLearningRateKeepsTheOldValue) {
    QLearner learner(0.0, 0.7, 2.0);

    EXPECT_DOUBLE_EQ(learner.update(-3.25, 10.0, 100.0), -3.25);
    EXPECT_DOUBLE_EQ(learner.update(std::nullopt, 10.0, 100.0), 2.0);
    EXPECT_DOUBLE_EQ(learner.update(std::nullopt, -4.0, std::nullopt), 2.0);
}

TEST(QLearnerTest, FullLearningRateReplacesTheOldValue) {
    QLearner learner(1.0, 0.25, 2.0);

    EXPECT_DOUBLE_EQ(learner.update(-7.0, 3.0, 8.0), 3.0 + 0.25 * 8.0);
    EXPECT_DOUBLE_EQ(learner.update(std::nullopt, -1.5, 2.0), -1.5 + 0.25 * 2.0);
    EXPECT_DOUBLE_EQ(learner.update(4.0, -1.5, std::nullopt), -1.5);
}

TEST(QLearnerTest, ZeroDiscountIgnoresTheFuture) {
    QLearner learner(0.2, 0.0, 0.0);

    EXPECT_DOUBLE_EQ(learner.update(1.0, 2.0, 1000.0), 1.0 + 0.2 * (2.0 - 1.0));
}

TEST(QLearnerTest, IsDeterministic) {
    QLearner learner(0.3, 0.8, 1.0);

    double first = learner.update(0.4, -2.0, 1.1);
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(learner.update(0.4, -2.0, 1.1), first);
    }
}

TEST(QLearnerTest, RejectsRatesOutsideTheUnitInterval) {
    EXPECT_THROW(QLearner(-0.1, 0.5, 0.0), std::invalid_argument);
    EXPECT_THROW(QLearner(1.1, 0.5, 0.0), std::invalid_argument);
    EXPECT_THROW(QLearner(0.5, -0.01, 0.0), std::invalid_argument);
    EXPECT_THROW(QLearner(0.5, 1.5, 0.0), std::invalid_argument);
    EXPECT_THROW(QLearner(std::nan(""), 0.5, 0.0), std::invalid_argument);
    EXPECT_THROW(QLearner(0.5, std::nan(""), 0.0), std::invalid_argument);
    EXPECT_NO_THROW(QLearner(0.0, 1.0, -3.0));
}
