// -------------------------- Tabular Q-Learning Framework ------------------------------------//
//  qtab
//  --------------------------------------------------------------------------------------------//

#include <cmath>

#include <gtest/gtest.h>

#include "test_problems.h"


TEST(TrainerTest, StartsEmpty) {
    Trainer<GridState> trainer;

    EXPECT_TRUE(trainer.learned_values().empty());
    EXPECT_FALSE(trainer.expected_value(GridState{0, 0}, UP).has_value());
    EXPECT_FALSE(trainer.best_action(GridState{0, 0}).has_value());
    EXPECT_TRUE(trainer.expected_values(GridState{0, 0}).empty());
    EXPECT_EQ(trainer.get_timestep(), 0);
    EXPECT_EQ(trainer.get_episode(), 0);
}

TEST(TrainerTest, StopsWithoutUpdatesInTerminalStartState) {
    Trainer<ChainState> trainer;
    ChainAgent agent(ChainState{4, 4});
    QLearner learner(0.5, 0.9, 0.0);
    CountingTerminator<ChainState> terminator(1000);
    RandomPolicy<ChainState> policy(1);

    trainer.train(agent, learner, terminator, policy);

    EXPECT_TRUE(trainer.learned_values().empty());
    EXPECT_EQ(terminator.calls, 0);
    EXPECT_EQ(trainer.get_timestep(), 0);
    EXPECT_EQ(agent.current_state().position, 4);
}

TEST(TrainerTest, RunsExactlyTheRequestedIterations) {
    Trainer<GridState> trainer;
    GridAgent agent(GridState{0, 0});
    QLearner learner(0.2, 0.5, 0.0);
    FixedIterations<GridState> terminator(37);
    RandomPolicy<GridState> policy(8);

    trainer.train(agent, learner, terminator, policy);

    EXPECT_EQ(trainer.get_timestep(), 37);
    EXPECT_EQ(trainer.get_episode(), 1);
    EXPECT_GE(trainer.learned_values().size(), 1u);
    EXPECT_LE(trainer.learned_values().size(), 37u);
}

TEST(TrainerTest, FirstUpdateUsesInitialValues) {
    Trainer<ChainState> trainer;
    ChainAgent agent(ChainState{0, 3});
    QLearner learner(0.5, 0.5, 2.0);
    FixedIterations<ChainState> terminator(1);
    ExploreFirstPolicy<ChainState> policy;

    trainer.train(agent, learner, terminator, policy);

    // Explore-first steps left from 0 and stays at 0: 2.0 + 0.5 * (0.0 + 0.5 * 2.0 - 2.0) = 1.5
    ASSERT_TRUE(trainer.expected_value(ChainState{0, 3}, STEP_LEFT).has_value());
    EXPECT_DOUBLE_EQ(*trainer.expected_value(ChainState{0, 3}, STEP_LEFT), 1.5);
    EXPECT_FALSE(trainer.expected_value(ChainState{0, 3}, STEP_RIGHT).has_value());
}

TEST(TrainerTest, TerminalStateUsesZeroByDefault) {
    Trainer<ChainState> trainer;
    ASSERT_EQ(trainer.get_terminal_type(), TerminalType::TERMINAL_ZERO);
    ChainAgent agent(ChainState{0, 1});
    QLearner learner(1.0, 1.0, 5.0);
    CountingTerminator<ChainState> terminator(2);
    ExploreFirstPolicy<ChainState> policy;

    trainer.train(agent, learner, terminator, policy);

    // Explore-first steps left (stays at 0), then right into the goal.
    EXPECT_DOUBLE_EQ(*trainer.expected_value(ChainState{0, 1}, STEP_LEFT), 5.0);
    EXPECT_DOUBLE_EQ(*trainer.expected_value(ChainState{0, 1}, STEP_RIGHT), 1.0);
    EXPECT_EQ(agent.current_state().position, 1);
}

TEST(TrainerTest, TerminalStatePassesExplicitZeroToLearner) {
    Trainer<ChainState> trainer;
    ChainAgent agent(ChainState{0, 1});
    RecordingLearner learner(5.0);
    CountingTerminator<ChainState> terminator(2);
    ExploreFirstPolicy<ChainState> policy;

    trainer.train(agent, learner, terminator, policy);

    // Left keeps the agent at 0, right lands in the goal.
    ASSERT_EQ(learner.seen.size(), 2u);
    ASSERT_TRUE(learner.seen[1].has_value());
    EXPECT_DOUBLE_EQ(*learner.seen[1], 0.0);
    EXPECT_DOUBLE_EQ(*trainer.expected_value(ChainState{0, 1}, STEP_RIGHT), 1.0);
}

TEST(TrainerTest, TerminalStateCanUseInitialOrConstantValue) {
    QLearner learner(1.0, 0.5, 4.0);
    ExploreFirstPolicy<ChainState> policy;

    Trainer<ChainState> initial;
    initial.set_terminal(TerminalType::TERMINAL_INITIAL);
    ChainAgent first(ChainState{0, 1});
    CountingTerminator<ChainState> first_stop(2);
    initial.train(first, learner, first_stop, policy);

    // Explore-first steps left (stays at 0), then right into the goal.
    EXPECT_DOUBLE_EQ(*initial.expected_value(ChainState{0, 1}, STEP_RIGHT), 1.0 + 0.5 * 4.0);

    Trainer<ChainState> constant;
    constant.set_terminal(TerminalType::TERMINAL_CONSTANT, -6.0);
    ChainAgent second(ChainState{0, 1});
    CountingTerminator<ChainState> second_stop(2);
    constant.train(second, learner, second_stop, policy);

    EXPECT_DOUBLE_EQ(*constant.expected_value(ChainState{0, 1}, STEP_RIGHT), 1.0 + 0.5 * -6.0);
}

TEST(TrainerTest, BestActionPrefersFirstDeclaredOnTies) {
    QLearner learner(1.0, 0.0, 0.0);
    ExploreFirstPolicy<BanditState> policy;

    Trainer<BanditState> trainer;
    BanditAgent agent(BanditState{false}, 1.0);
    FixedIterations<BanditState> terminator(2);
    trainer.train(agent, learner, terminator, policy);

    ASSERT_DOUBLE_EQ(*trainer.expected_value(BanditState{false}, ARM_A), 1.0);
    ASSERT_DOUBLE_EQ(*trainer.expected_value(BanditState{false}, ARM_B), 1.0);
    EXPECT_EQ(*trainer.best_action(BanditState{false}), ARM_A);

    Trainer<BanditState> reversed;
    BanditAgent reversed_agent(BanditState{true}, 1.0);
    FixedIterations<BanditState> reversed_terminator(2);
    reversed.train(reversed_agent, learner, reversed_terminator, policy);

    EXPECT_EQ(*reversed.best_action(BanditState{true}), ARM_B);
}

TEST(TrainerTest, BestActionIsAbsentWithoutLegalActions) {
    Trainer<ChainState> trainer;

    EXPECT_FALSE(trainer.best_action(ChainState{2, 2}).has_value());
}

TEST(TrainerTest, ZeroLearningRateNeverMovesAwayFromInitialValue) {
    Trainer<GridState> trainer;
    GridAgent agent(GridState{0, 0});
    QLearner learner(0.0, 0.9, 2.0);
    FixedIterations<GridState> terminator(5000);
    RandomPolicy<GridState> policy(21);

    trainer.train(agent, learner, terminator, policy);

    ASSERT_FALSE(trainer.learned_values().empty());
    for (const auto &entry: trainer.learned_values()) {
        EXPECT_EQ(entry.second, 2.0);
    }
}

TEST(TrainerTest, UnvisitedPairsStayAbsent) {
    Trainer<ChainState> trainer;
    ChainAgent agent(ChainState{0, 10});
    QLearner learner(0.5, 0.9, 0.0);
    FixedIterations<ChainState> terminator(3);
    RandomPolicy<ChainState> policy(4);

    trainer.train(agent, learner, terminator, policy);

    // Three steps from position 0 can not reach position 5.
    EXPECT_FALSE(trainer.expected_value(ChainState{5, 10}, STEP_LEFT).has_value());
    EXPECT_FALSE(trainer.expected_value(ChainState{5, 10}, STEP_RIGHT).has_value());
    EXPECT_FALSE(trainer.expected_value(ChainState{0, 11}, STEP_RIGHT).has_value());
}

TEST(TrainerTest, ExpectedValuesListsLearnedActionsInDeclaredOrder) {
    QLearner learner(1.0, 0.0, 0.0);
    ExploreFirstPolicy<BanditState> policy;
    Trainer<BanditState> trainer;
    BanditAgent agent(BanditState{true}, -2.0);
    FixedIterations<BanditState> terminator(1);

    trainer.train(agent, learner, terminator, policy);

    auto values = trainer.expected_values(BanditState{true});
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(values[0].first, ARM_B);
    EXPECT_DOUBLE_EQ(values[0].second, -2.0);
}

TEST(TrainerTest, ConvergesToDiscountedReturnOnChain) {
    const int length = 5;
    const double gamma = 0.9;
    Trainer<ChainState> trainer;
    QLearner learner(0.5, gamma, 0.0);
    SinkStates<ChainState> terminator;
    RandomPolicy<ChainState> policy(1234);

    for (int episode = 0; episode < 3000; episode++) {
        ChainAgent agent(ChainState{0, length});
        trainer.train(agent, learner, terminator, policy);
    }

    EXPECT_EQ(trainer.get_episode(), 3000);
    for (int position = 0; position < length; position++) {
        double expected = std::pow(gamma, length - 1 - position);
        ASSERT_TRUE(trainer.expected_value(ChainState{position, length}, STEP_RIGHT).has_value());
        EXPECT_NEAR(*trainer.expected_value(ChainState{position, length}, STEP_RIGHT), expected, 1e-3);
        EXPECT_EQ(*trainer.best_action(ChainState{position, length}), STEP_RIGHT);
    }
}

TEST(TrainerTest, AccumulatesAcrossTrainCalls) {
    Trainer<GridState> trainer;
    QLearner learner(0.2, 0.5, 0.0);
    RandomPolicy<GridState> policy(6);

    GridAgent agent(GridState{0, 0});
    FixedIterations<GridState> terminator(10);
    trainer.train(agent, learner, terminator, policy);
    terminator.reset();
    trainer.train(agent, learner, terminator, policy);

    EXPECT_EQ(trainer.get_timestep(), 20);
    EXPECT_EQ(trainer.get_episode(), 2);
}
