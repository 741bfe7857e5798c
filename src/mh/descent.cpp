#include "routelib/mh/descent.hpp"

#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::mh {

    using namespace routelib::core;

    template <class C, class M>
    SolutionPtr<C, M> FirstImprovement(const ISolution<C, M> &start, double budget, SearchContext &ctx)
    {
        TimeBudget clock(budget);
        SolutionPtr<C, M> s = start.copy();
        int improvements = 0;               // moves applied
        bool improv = true;                 // improvement flag

        while (improv && !clock.expired() && !ctx.shouldStop())
        {
            improv = false;

            // the stream is invalidated by apply(), restart the scan after every move
            for (const M &m : s->randomLocalMovesWithoutReplacement(ctx.getRng())) {
                if (s->deltaForLocalMove(m) < -kImprovementEpsilon) {
                    s->apply(m);
                    improvements++;
                    improv = true;
                    break;
                }
                if (clock.expired() || ctx.shouldStop()) break;
            }
        }

        if (ctx.logEnabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << "FirstImprovement: " << improvements << " improving moves";
            LogMessage(ctx, LogLevel::Debug, msg.str());
        }
        return s;
    }

    template <class C, class M>
    SolutionPtr<C, M> BestImprovement(const ISolution<C, M> &start, double budget, SearchContext &ctx)
    {
        TimeBudget clock(budget);
        SolutionPtr<C, M> s = start.copy();
        int improvements = 0;

        while (!clock.expired() && !ctx.shouldStop())
        {
            std::optional<M> best;          // best move of the neighborhood
            double bestDelta = -kImprovementEpsilon;

            for (const M &m : s->localMoveCandidates()) {
                double delta = s->deltaForLocalMove(m);
                if (delta < bestDelta) {
                    best = m;
                    bestDelta = delta;
                }
            }

            if (!best) break;               // local optimum
            s->apply(*best);
            improvements++;
        }

        if (ctx.logEnabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << "BestImprovement: " << improvements << " improving moves";
            LogMessage(ctx, LogLevel::Debug, msg.str());
        }
        return s;
    }

    template <class C, class M>
    SolutionPtr<C, M> RLS(const ISolution<C, M> &start, double budget, SearchContext &ctx)
    {
        TimeBudget clock(budget);
        SolutionPtr<C, M> s = start.copy();

        while (!clock.expired() && !ctx.shouldStop())
        {
            std::optional<M> m = s->randomLocalMove(ctx.getRng());
            if (!m) break;                  // empty neighborhood

            if (s->deltaForLocalMove(*m) <= 0.0)
                s->apply(*m);
        }
        return s;
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> FirstImprovement(const ISolution<WasteComponent, WasteMove>&, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> FirstImprovement(const ISolution<TspComponent, TspMove>&, double, SearchContext&);
    template SolutionPtr<WasteComponent, WasteMove> BestImprovement(const ISolution<WasteComponent, WasteMove>&, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> BestImprovement(const ISolution<TspComponent, TspMove>&, double, SearchContext&);
    template SolutionPtr<WasteComponent, WasteMove> RLS(const ISolution<WasteComponent, WasteMove>&, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> RLS(const ISolution<TspComponent, TspMove>&, double, SearchContext&);

} // namespace routelib::mh
