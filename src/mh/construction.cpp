#include "routelib/mh/construction.hpp"

#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::mh {

    using namespace routelib::core;

    template <class C, class M>
    SolutionPtr<C, M> Heuristic(const ISolution<C, M> &start, SearchContext &ctx)
    {
        SolutionPtr<C, M> s = start.copy();

        while (std::optional<C> c = s->greedyAddCandidate())
            s->apply(*c);

        LogMessage(ctx, LogLevel::Debug, "Heuristic: construction finished");
        return s;
    }

    template <class C, class M>
    SolutionPtr<C, M> Greedy(const ISolution<C, M> &start, SearchContext &ctx)
    {
        SolutionPtr<C, M> s = start.copy();

        while (true)
        {
            std::optional<C> best;              // cheapest candidate of this step
            double bestDelta = kInfinity;

            for (const C &c : s->addCandidates()) {
                double delta = s->deltaForAdd(c);
                if (!best || delta < bestDelta) {
                    best = c;
                    bestDelta = delta;
                }
            }

            if (!best) break;
            s->apply(*best);
        }

        LogMessage(ctx, LogLevel::Debug, "Greedy: construction finished");
        return s;
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> Heuristic(const ISolution<WasteComponent, WasteMove>&, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> Heuristic(const ISolution<TspComponent, TspMove>&, SearchContext&);
    template SolutionPtr<WasteComponent, WasteMove> Greedy(const ISolution<WasteComponent, WasteMove>&, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> Greedy(const ISolution<TspComponent, TspMove>&, SearchContext&);

} // namespace routelib::mh
