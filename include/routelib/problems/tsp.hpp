#pragma once

#include "routelib/core/iproblem.hpp"

namespace routelib::problems {

    struct Point
    {
        double x = 0.0;
        double y = 0.0;
    };

    // edge from point `from` to point `to`; TspComponent and TspMove are both
    // pairs of ints, so apply() needs the named type (apply({a, b}) is ambiguous)
    struct TspComponent
    {
        int from = 0;
        int to = 0;

        std::pair<int, int> cid() const { return {from, to}; }
        bool operator==(const TspComponent&) const = default;
    };

    // 2-opt: reverse the path positions [i, j)
    struct TspMove
    {
        int i = 0;
        int j = 0;

        bool operator==(const TspMove&) const = default;
    };

    class TspProblem;

    /**
     * @brief Closed tour under construction
     *
     * The path starts with the start point; the tour is complete once the
     * closing edge back to the start was added (n + 1 path entries).
     */
    class TspSolution final : public core::ISolution<TspComponent, TspMove> {
        public:
            TspSolution(const TspProblem &problem, int start);

            Ptr copy() const override;
            bool isFeasible() const override;
            bool isComplete() const override;
            double accumulatedCost() const override { return cost_; }
            std::optional<double> objective() const override;
            std::optional<double> lowerBound() const override;

            core::LazySequence<TspComponent> addCandidates() const override;
            core::LazySequence<TspMove> localMoveCandidates() const override;
            core::LazySequence<TspMove> randomLocalMovesWithoutReplacement(std::mt19937 &rng) const override;
            std::optional<TspMove> randomLocalMove(std::mt19937 &rng) const override;
            std::optional<TspComponent> greedyAddCandidate() const override;
            core::LazySequence<TspComponent> components() const override;

            double deltaForAdd(const TspComponent &c) const override;
            double deltaForLocalMove(const TspMove &m) const override;
            double lowerBoundIncrForAdd(const TspComponent &c) const override;

            void checkConsistency() const override;

            const TspProblem& problem() const { return *problem_; }
            int start() const { return start_; }
            const std::vector<int>& path() const { return path_; }
            const std::set<int>& visited() const { return visited_; }
            const std::set<int>& unvisited() const { return unvisited_; }

            double recomputeCost() const;

        protected:
            void doAdd(const TspComponent &c) override;
            void doStep(const TspMove &m) override;

        private:
            void requireAddable(const TspComponent &c) const;
            void requireApplicable(const TspMove &m) const;

            const TspProblem *problem_;
            int start_;
            std::vector<int> path_;
            std::set<int> visited_;
            std::set<int> unvisited_;
            double cost_ = 0.0;
    };

    class TspProblem final : public core::IProblem<TspComponent, TspMove> {
        public:
            explicit TspProblem(std::vector<Point> coords);

            int getDimension() const override { return n_; }

            // tour starting at point 0
            std::unique_ptr<Solution> emptySolution() const override;
            std::unique_ptr<Solution> emptySolutionWithStart(int start) const;

            double pointDistance(int a, int b) const { return dist_[a][b]; }
            double transitionCost(const TspComponent &c) const { return dist_[c.from][c.to]; }

        private:
            int n_;
            std::vector<std::vector<double>> dist_;     // symmetric, computed once
    };

    double euclideanDistance(const Point &a, const Point &b);

} // namespace routelib::problems
