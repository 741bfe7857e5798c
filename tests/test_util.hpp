#pragma once

#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::test {

    using problems::WasteCollectionProblem;
    using problems::WasteComponent;
    using problems::TspProblem;

    // integer costs in [1, 20], zero on the diagonal of every pair table
    inline WasteCollectionProblem RandomWasteProblem(int n, unsigned int seed)
    {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> cost(1, 20);

        auto row = [&] {
            WasteCollectionProblem::Row r(n);
            for (double &v : r) v = cost(rng);
            return r;
        };

        std::array<WasteCollectionProblem::Row, 2> entry = {row(), row()};
        std::array<WasteCollectionProblem::Row, 2> exit = {row(), row()};
        std::array<WasteCollectionProblem::Table, 4> pair;
        for (auto &table : pair) {
            for (int a = 0; a < n; a++) {
                table.push_back(row());
                table.back()[a] = 0.0;
            }
        }
        return WasteCollectionProblem(n, entry, exit, pair);
    }

    inline TspProblem RandomTspProblem(int n, unsigned int seed)
    {
        std::mt19937 rng(seed);
        std::uniform_real_distribution<double> coord(0.0, 100.0);

        std::vector<problems::Point> points;
        for (int k = 0; k < n; k++) points.push_back({coord(rng), coord(rng)});
        return TspProblem(std::move(points));
    }

    // complete route visiting the units in a random order with random orientations
    inline std::unique_ptr<WasteCollectionProblem::Solution>
    RandomWasteRoute(const WasteCollectionProblem &problem, std::mt19937 &rng)
    {
        std::vector<int> order(problem.getDimension());
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        auto s = problem.emptySolution();
        for (int u : order)
            s->apply(WasteComponent{u, std::uniform_int_distribution<int>(0, 1)(rng)});
        return s;
    }

    inline std::unique_ptr<TspProblem::Solution>
    RandomTour(const TspProblem &problem, std::mt19937 &rng)
    {
        std::vector<int> order(problem.getDimension() - 1);
        std::iota(order.begin(), order.end(), 1);
        std::shuffle(order.begin(), order.end(), rng);

        auto s = problem.emptySolution();
        int last = 0;
        for (int v : order) {
            s->apply(problems::TspComponent{last, v});
            last = v;
        }
        s->apply(problems::TspComponent{last, 0});
        return s;
    }

    /**
     * Method: BestCompletion
     * Description: exhaustive minimum objective over every completion of `s`
     */
    inline double BestCompletion(const WasteCollectionProblem::Solution &s)
    {
        if (s.isComplete()) return *s.objective();

        double best = core::kInfinity;
        for (const WasteComponent &c : s.addCandidates()) {
            auto child = s.copy();
            child->apply(c);
            best = std::min(best, BestCompletion(*child));
        }
        return best;
    }

} // namespace routelib::test
