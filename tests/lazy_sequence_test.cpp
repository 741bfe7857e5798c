#include "routelib/core/lazy_sequence.hpp"

#include <gtest/gtest.h>

using routelib::core::LazySequence;
using routelib::core::FromVector;

namespace {

    // 0, 1, ..., n - 1, counting the generators handed out
    LazySequence<int> CountingSequence(int n, int &generators)
    {
        using Generator = LazySequence<int>::Generator;
        return LazySequence<int>([n, &generators] {
            generators++;
            int k = 0;
            return Generator([n, k]() mutable -> std::optional<int> {
                if (k >= n) return std::nullopt;
                return k++;
            });
        });
    }

}

TEST(LazySequenceTest, DefaultSequenceIsEmpty)
{
    LazySequence<int> seq;
    EXPECT_TRUE(seq.empty());
    EXPECT_FALSE(seq.first().has_value());
    EXPECT_TRUE(seq.collect().empty());
    EXPECT_TRUE(seq.begin() == seq.end());
}

TEST(LazySequenceTest, FromVectorReplaysSnapshot)
{
    std::vector<int> values = {4, 8, 15};
    LazySequence<int> seq = FromVector(values);
    values.push_back(16);

    EXPECT_EQ(seq.collect(), (std::vector<int>{4, 8, 15}));
    EXPECT_EQ(seq.collect(), (std::vector<int>{4, 8, 15}));
    ASSERT_TRUE(seq.first().has_value());
    EXPECT_EQ(*seq.first(), 4);
}

TEST(LazySequenceTest, EveryTraversalStartsFresh)
{
    int generators = 0;
    LazySequence<int> seq = CountingSequence(3, generators);

    int sum = 0;
    for (int v : seq) sum += v;
    for (int v : seq) sum += v;

    EXPECT_EQ(sum, 6);
    EXPECT_EQ(generators, 2);
}

TEST(LazySequenceTest, PartialTraversalDoesNotAffectNextOne)
{
    int generators = 0;
    LazySequence<int> seq = CountingSequence(5, generators);

    auto it = seq.begin();
    ++it;
    ++it;
    EXPECT_EQ(*it, 2);

    EXPECT_EQ(seq.collect(), (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(LazySequenceTest, ElementsAreProducedOnDemand)
{
    int produced = 0;
    using Generator = LazySequence<int>::Generator;
    LazySequence<int> seq([&produced] {
        return Generator([&produced]() -> std::optional<int> { return ++produced; });
    });

    // an unbounded sequence is fine as long as the consumer stops
    for (int v : seq) {
        if (v == 3) break;
    }
    EXPECT_EQ(produced, 3);
}
