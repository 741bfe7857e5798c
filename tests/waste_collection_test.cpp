#include "routelib/problems/waste_collection.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <tuple>

using namespace routelib;
using problems::WasteCollectionProblem;
using problems::WasteComponent;
using problems::WasteMove;

namespace {

    std::tuple<int, int, int, int> Key(const WasteMove &m)
    {
        return {m.i, m.j, m.iOrientation, m.jOrientation};
    }

    // 3 containers with hand-picked costs, blocks indexed by pairIndex
    WasteCollectionProblem SmallProblem()
    {
        std::array<WasteCollectionProblem::Row, 2> entry = {{{5, 9, 4}, {6, 8, 5}}};
        std::array<WasteCollectionProblem::Row, 2> exit = {{{7, 3, 6}, {6, 4, 7}}};
        std::array<WasteCollectionProblem::Table, 4> pair = {{
            {{0, 4, 6}, {4, 0, 3}, {6, 3, 0}},
            {{0, 5, 7}, {5, 0, 4}, {7, 4, 0}},
            {{0, 6, 8}, {6, 0, 5}, {8, 5, 0}},
            {{0, 3, 5}, {3, 0, 2}, {5, 2, 0}}
        }};
        return WasteCollectionProblem(3, entry, exit, pair);
    }

}

TEST(WasteCollectionTest, EmptySolution)
{
    WasteCollectionProblem problem = SmallProblem();
    auto s = problem.emptySolution();

    EXPECT_FALSE(s->isComplete());
    EXPECT_FALSE(s->isFeasible());
    EXPECT_FALSE(s->objective().has_value());
    ASSERT_TRUE(s->lowerBound().has_value());
    EXPECT_GE(*s->lowerBound(), 0.0);
    EXPECT_DOUBLE_EQ(s->accumulatedCost(), 0.0);
    EXPECT_EQ(s->addCandidates().collect().size(), 6u);
    EXPECT_TRUE(s->localMoveCandidates().empty());
    EXPECT_NO_THROW(s->checkConsistency());
}

TEST(WasteCollectionTest, ObjectiveOfHandBuiltRoute)
{
    WasteCollectionProblem problem = SmallProblem();
    auto s = problem.emptySolution();

    // depot -> 2 (o 0) -> 0 (o 1) -> 1 (o 1) -> plant
    s->apply(WasteComponent{2, 0});
    s->apply(WasteComponent{0, 1});
    s->apply(WasteComponent{1, 1});

    double expected = problem.entryCost(0, 2)
                    + problem.pairCost(WasteCollectionProblem::pairIndex(0, 1), 2, 0)
                    + problem.pairCost(WasteCollectionProblem::pairIndex(1, 1), 0, 1)
                    + problem.exitCost(1, 1);

    ASSERT_TRUE(s->isComplete());
    EXPECT_TRUE(s->isFeasible());
    ASSERT_TRUE(s->objective().has_value());
    EXPECT_DOUBLE_EQ(*s->objective(), expected);
    EXPECT_FALSE(s->lowerBound().has_value());
}

TEST(WasteCollectionTest, ComponentsFollowTheRoute)
{
    WasteCollectionProblem problem = SmallProblem();
    auto s = problem.emptySolution();
    s->apply(WasteComponent{1, 0});
    s->apply(WasteComponent{2, 1});

    std::vector<WasteComponent> expected = {{1, 0}, {2, 1}};
    EXPECT_EQ(s->components().collect(), expected);
}

TEST(WasteCollectionTest, AddDeltaMatchesCostIncrease)
{
    for (unsigned int seed = 1; seed <= 20; seed++) {
        WasteCollectionProblem problem = test::RandomWasteProblem(5, seed);
        std::mt19937 rng(seed);
        auto s = problem.emptySolution();

        while (!s->isComplete()) {
            std::vector<WasteComponent> candidates = s->addCandidates().collect();
            WasteComponent c = candidates[rng() % candidates.size()];

            double delta = s->deltaForAdd(c);
            double before = s->accumulatedCost();
            s->apply(c);

            // the completing add also pays the plant exit
            double after = s->isComplete() ? *s->objective() : s->accumulatedCost();
            EXPECT_NEAR(after - before, delta, 1e-9);
        }
    }
}

TEST(WasteCollectionTest, LocalMoveDeltaMatchesRecomputation)
{
    for (int n : {1, 2, 3, 5, 8}) {
        for (unsigned int seed = 1; seed <= 10; seed++) {
            WasteCollectionProblem problem = test::RandomWasteProblem(n, seed);
            std::mt19937 rng(seed * 31 + n);
            auto s = test::RandomWasteRoute(problem, rng);

            for (const WasteMove &m : s->localMoveCandidates()) {
                auto t = s->copy();
                double delta = t->deltaForLocalMove(m);
                t->apply(m);

                EXPECT_NEAR(*t->objective() - *s->objective(), delta, 1e-9)
                    << "n=" << n << " i=" << m.i << " j=" << m.j
                    << " oi=" << m.iOrientation << " oj=" << m.jOrientation;
                EXPECT_NO_THROW(t->checkConsistency());
            }
        }
    }
}

TEST(WasteCollectionTest, SwapAndOrientationSemantics)
{
    WasteCollectionProblem problem = SmallProblem();
    auto base = problem.newSolution();
    base.apply(WasteComponent{0, 0});
    base.apply(WasteComponent{1, 0});
    base.apply(WasteComponent{2, 0});

    auto swapped = base;
    swapped.apply(WasteMove{0, 2, 1, 0});
    EXPECT_EQ(swapped.units(), (std::vector<int>{2, 1, 0}));
    EXPECT_EQ(swapped.orientations(), (std::vector<int>{1, 0, 0}));

    // i == j only flips the orientation, jOrientation wins
    auto flipped = base;
    flipped.apply(WasteMove{1, 1, 0, 1});
    EXPECT_EQ(flipped.units(), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(flipped.orientations(), (std::vector<int>{0, 1, 0}));
}

TEST(WasteCollectionTest, InvariantsHoldUnderRandomMoves)
{
    WasteCollectionProblem problem = test::RandomWasteProblem(7, 42);
    std::mt19937 rng(42);
    auto s = test::RandomWasteRoute(problem, rng);
    s->setVerification(true);

    for (int k = 0; k < 500; k++) {
        std::optional<WasteMove> m = s->randomLocalMove(rng);
        ASSERT_TRUE(m.has_value());
        ASSERT_NO_THROW(s->apply(*m));
    }

    auto &route = dynamic_cast<problems::WasteCollectionSolution&>(*s);
    EXPECT_EQ(route.visited().size(), 7u);
    EXPECT_TRUE(route.unvisited().empty());
    EXPECT_NEAR(route.recomputeCost(), route.accumulatedCost(), 1e-9);
}

TEST(WasteCollectionTest, LowerBoundIsAdmissible)
{
    for (int n = 1; n <= 5; n++) {
        for (unsigned int seed = 1; seed <= 6; seed++) {
            WasteCollectionProblem problem = test::RandomWasteProblem(n, seed + 100 * n);
            std::mt19937 rng(seed);
            auto s = problem.emptySolution();

            // check the bound along a random construction path
            while (!s->isComplete()) {
                double best = test::BestCompletion(*s);
                EXPECT_LE(*s->lowerBound(), best + 1e-9) << "n=" << n << " seed=" << seed;

                std::vector<WasteComponent> candidates = s->addCandidates().collect();
                s->apply(candidates[rng() % candidates.size()]);
            }
        }
    }
}

TEST(WasteCollectionTest, LowerBoundIsAdmissibleForSixUnits)
{
    WasteCollectionProblem problem = test::RandomWasteProblem(6, 7);
    auto s = problem.emptySolution();
    EXPECT_LE(*s->lowerBound(), test::BestCompletion(*s) + 1e-9);
}

TEST(WasteCollectionTest, LowerBoundIncrementMatchesChildBound)
{
    WasteCollectionProblem problem = test::RandomWasteProblem(6, 3);
    std::mt19937 rng(3);
    auto s = problem.emptySolution();

    while (!s->isComplete()) {
        std::vector<WasteComponent> candidates = s->addCandidates().collect();
        for (const WasteComponent &c : candidates) {
            auto child = s->copy();
            double incr = s->lowerBoundIncrForAdd(c);
            child->apply(c);
            if (!child->isComplete())
                EXPECT_NEAR(*s->lowerBound() + incr, *child->lowerBound(), 1e-9);
        }
        s->apply(candidates[rng() % candidates.size()]);
    }
}

TEST(WasteCollectionTest, LowerBoundIncrementIsZeroForLastUnit)
{
    WasteCollectionProblem problem = test::RandomWasteProblem(4, 11);
    auto s = problem.emptySolution();
    s->apply(WasteComponent{3, 0});
    s->apply(WasteComponent{0, 1});
    s->apply(WasteComponent{2, 0});

    EXPECT_EQ(s->lowerBoundIncrForAdd(WasteComponent{1, 0}), 0.0);
    EXPECT_EQ(s->lowerBoundIncrForAdd(WasteComponent{1, 1}), 0.0);
}

TEST(WasteCollectionTest, RandomStreamCoversNeighborhoodOnce)
{
    for (int n : {1, 2, 4, 6}) {
        WasteCollectionProblem problem = test::RandomWasteProblem(n, 5);
        std::mt19937 rng(n);
        auto s = test::RandomWasteRoute(problem, rng);

        std::set<std::tuple<int, int, int, int>> exhaustive;
        for (const WasteMove &m : s->localMoveCandidates()) exhaustive.insert(Key(m));

        std::vector<WasteMove> drawn = s->randomLocalMovesWithoutReplacement(rng).collect();
        std::set<std::tuple<int, int, int, int>> sampled;
        for (const WasteMove &m : drawn) sampled.insert(Key(m));

        EXPECT_EQ(drawn.size(), sampled.size()) << "duplicate move for n=" << n;
        EXPECT_EQ(sampled, exhaustive);
        EXPECT_EQ(exhaustive.size(), static_cast<std::size_t>(2 * n * (n + 1)));
    }
}

TEST(WasteCollectionTest, RandomStreamOnPartialSolutionIsEmpty)
{
    WasteCollectionProblem problem = SmallProblem();
    std::mt19937 rng(1);
    auto s = problem.emptySolution();
    s->apply(WasteComponent{0, 0});

    EXPECT_TRUE(s->randomLocalMovesWithoutReplacement(rng).empty());
    EXPECT_FALSE(s->randomLocalMove(rng).has_value());
}

TEST(WasteCollectionTest, GreedyCandidateIsCheapestLink)
{
    WasteCollectionProblem problem = SmallProblem();
    auto s = problem.emptySolution();

    // cheapest entry is unit 2 in orientation 0 (cost 4)
    std::optional<WasteComponent> c = s->greedyAddCandidate();
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, (WasteComponent{2, 0}));

    s->apply(*c);
    // from (2, 0): pair 00 to 1 costs 3, pair 01 to 1 costs 4, pair 00 to 0 costs 6
    c = s->greedyAddCandidate();
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, (WasteComponent{1, 0}));
}

TEST(WasteCollectionTest, CopyIsIndependent)
{
    WasteCollectionProblem problem = SmallProblem();
    auto s = problem.emptySolution();
    s->apply(WasteComponent{0, 0});

    auto t = s->copy();
    t->apply(WasteComponent{1, 1});

    EXPECT_EQ(s->components().collect().size(), 1u);
    EXPECT_EQ(t->components().collect().size(), 2u);
}

TEST(WasteCollectionTest, PreconditionViolationsThrow)
{
    WasteCollectionProblem problem = SmallProblem();
    auto s = problem.emptySolution();
    s->apply(WasteComponent{0, 0});

    EXPECT_THROW(s->apply(WasteComponent{0, 1}), core::PreconditionError);
    EXPECT_THROW(s->deltaForAdd(WasteComponent{3, 0}), core::PreconditionError);
    EXPECT_THROW(s->deltaForAdd(WasteComponent{1, 2}), core::PreconditionError);
    EXPECT_THROW(s->deltaForLocalMove(WasteMove{0, 0, 0, 0}), core::PreconditionError);

    s->apply(WasteComponent{1, 0});
    s->apply(WasteComponent{2, 0});

    EXPECT_THROW(s->apply(WasteComponent{1, 0}), core::PreconditionError);
    EXPECT_THROW(s->deltaForLocalMove(WasteMove{2, 1, 0, 0}), core::PreconditionError);
    EXPECT_THROW(s->deltaForLocalMove(WasteMove{0, 3, 0, 0}), core::PreconditionError);
    EXPECT_NO_THROW(s->checkConsistency());
}

TEST(WasteCollectionTest, ProblemRejectsMismatchedTables)
{
    std::array<WasteCollectionProblem::Row, 2> entry = {{{1, 2}, {1, 2}}};
    std::array<WasteCollectionProblem::Row, 2> exit = {{{1, 2}, {1}}};
    std::array<WasteCollectionProblem::Table, 4> pair = {{
        {{0, 1}, {1, 0}}, {{0, 1}, {1, 0}}, {{0, 1}, {1, 0}}, {{0, 1}, {1, 0}}
    }};

    EXPECT_THROW(WasteCollectionProblem(2, entry, exit, pair), core::PreconditionError);
}

TEST(WasteCollectionTest, VerificationDetectsCostMismatch)
{
    std::array<WasteCollectionProblem::Row, 2> entry = {{{1, 2}, {1, 2}}};
    std::array<WasteCollectionProblem::Row, 2> exit = {{{1, 2}, {1, 2}}};
    std::array<WasteCollectionProblem::Table, 4> pair = {{
        {{0, 1}, {1, 0}}, {{0, 1}, {1, 0}}, {{0, 1}, {1, 0}}, {{0, 1}, {1, 0}}
    }};
    entry[0][0] = std::numeric_limits<double>::quiet_NaN();
    WasteCollectionProblem problem(2, entry, exit, pair);

    auto plain = problem.emptySolution();
    EXPECT_FALSE(plain->verification());
    EXPECT_NO_THROW(plain->apply(WasteComponent{0, 0}));
    EXPECT_THROW(plain->checkConsistency(), core::ConsistencyError);

    auto checked = problem.emptySolution();
    checked->setVerification(true);
    EXPECT_TRUE(checked->verification());
    EXPECT_NO_THROW(checked->copy()->apply(WasteComponent{1, 0}));
    EXPECT_THROW(checked->apply(WasteComponent{0, 0}), core::ConsistencyError);
}
