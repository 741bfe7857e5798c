#pragma once

#include "routelib/core/iproblem.hpp"

namespace routelib::problems {

    //--------------------------------------------------------------------------
    // Struct: WasteComponent
    // Description: container `unit` collected in direction `orientation` (0 or 1)
    //--------------------------------------------------------------------------
    struct WasteComponent
    {
        int unit = 0;
        int orientation = 0;

        std::pair<int, int> cid() const { return {unit, orientation}; }
        bool operator==(const WasteComponent&) const = default;
    };

    //--------------------------------------------------------------------------
    // Struct: WasteMove
    // Description: swap positions i <= j, then position i gets iOrientation and
    //              position j gets jOrientation (jOrientation wins when i == j)
    //--------------------------------------------------------------------------
    struct WasteMove
    {
        int i = 0;
        int j = 0;
        int iOrientation = 0;
        int jOrientation = 0;

        bool operator==(const WasteMove&) const = default;
    };

    class WasteCollectionProblem;

    /**
     * @brief Route from the depot through every container to the treatment plant
     *
     * Running cost covers the depot entry and every container-to-container
     * transition made so far; the plant exit is only added by objective().
     */
    class WasteCollectionSolution final : public core::ISolution<WasteComponent, WasteMove> {
        public:
            explicit WasteCollectionSolution(const WasteCollectionProblem &problem);

            // -------------------------------------------------------------------------
            // ISolution
            // -------------------------------------------------------------------------
            Ptr copy() const override;
            bool isFeasible() const override;
            bool isComplete() const override;
            double accumulatedCost() const override { return cost_; }
            std::optional<double> objective() const override;
            std::optional<double> lowerBound() const override;

            core::LazySequence<WasteComponent> addCandidates() const override;
            core::LazySequence<WasteMove> localMoveCandidates() const override;
            core::LazySequence<WasteMove> randomLocalMovesWithoutReplacement(std::mt19937 &rng) const override;
            std::optional<WasteMove> randomLocalMove(std::mt19937 &rng) const override;
            std::optional<WasteComponent> greedyAddCandidate() const override;
            core::LazySequence<WasteComponent> components() const override;

            double deltaForAdd(const WasteComponent &c) const override;
            double deltaForLocalMove(const WasteMove &m) const override;
            double lowerBoundIncrForAdd(const WasteComponent &c) const override;

            void checkConsistency() const override;

            // -------------------------------------------------------------------------
            // ACCESSORS
            // -------------------------------------------------------------------------
            const WasteCollectionProblem& problem() const { return *problem_; }
            const std::vector<int>& units() const { return units_; }
            const std::vector<int>& orientations() const { return orientations_; }
            const std::set<int>& visited() const { return visited_; }
            const std::set<int>& unvisited() const { return unvisited_; }
            std::optional<WasteComponent> lastComponent() const;

            // full recomputation of the running cost (exit excluded)
            double recomputeCost() const;

        protected:
            void doAdd(const WasteComponent &c) override;
            void doStep(const WasteMove &m) override;

        private:
            void requireAddable(const WasteComponent &c) const;
            void requireApplicable(const WasteMove &m) const;

            // component at position p once m is applied
            WasteComponent movedAt(const WasteMove &m, int p) const;

            // sum of the deltas of the edges touched by m; edge k enters position k, edge n is the exit
            double edgeDelta(const WasteMove &m, bool withExit) const;

            const WasteCollectionProblem *problem_;
            std::vector<int> units_;            // visiting order
            std::vector<int> orientations_;     // orientation per position
            std::set<int> visited_;
            std::set<int> unvisited_;
            double cost_ = 0.0;
    };

    /**
     * @brief Immutable cost model of the waste collection problem
     *
     * Pair tables are indexed by (fromOrientation << 1) | toOrientation.
     */
    class WasteCollectionProblem final : public core::IProblem<WasteComponent, WasteMove> {
        public:
            using Row = std::vector<double>;
            using Table = std::vector<Row>;

            WasteCollectionProblem(int n, std::array<Row, 2> entry, std::array<Row, 2> exit,
                                   std::array<Table, 4> pair);

            int getDimension() const override { return n_; }
            std::unique_ptr<Solution> emptySolution() const override;
            WasteCollectionSolution newSolution() const { return WasteCollectionSolution(*this); }

            static int pairIndex(int fromOrientation, int toOrientation) {
                return (fromOrientation << 1) | toOrientation;
            }

            double entryCost(int orientation, int unit) const { return entry_[orientation][unit]; }
            double exitCost(int orientation, int unit) const { return exit_[orientation][unit]; }
            double pairCost(int index, int from, int to) const { return pair_[index][from][to]; }

            double transitionCost(const WasteComponent &from, const WasteComponent &to) const {
                return pair_[pairIndex(from.orientation, to.orientation)][from.unit][to.unit];
            }

            // entry cost when `from` is the depot
            double linkCost(const std::optional<WasteComponent> &from, const WasteComponent &to) const {
                return from ? transitionCost(*from, to) : entryCost(to.orientation, to.unit);
            }

            /**
             * Method: minimalConnections
             * Description: admissible estimate of the cost still needed to route every unit of
             *              `pending` after `anchor` (the depot when empty) and reach the plant
             */
            double minimalConnections(const std::vector<int> &pending,
                                      const std::optional<WasteComponent> &anchor) const;

        private:
            int n_;
            std::array<Row, 2> entry_;      // depot -> unit
            std::array<Row, 2> exit_;       // unit -> plant
            std::array<Table, 4> pair_;     // unit -> unit
    };

} // namespace routelib::problems
