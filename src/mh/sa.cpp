#include "routelib/mh/sa.hpp"

#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::mh {

    using namespace routelib::core;

    template <class C, class M>
    SolutionPtr<C, M> SA(const ISolution<C, M> &start, double budget, double T0, SearchContext &ctx)
    {
        core::Require(T0 >= 0, "the initial temperature must not be negative");

        const char* method = "SA";
        TimeBudget clock(budget);
        double T = T0;                      // current temperature
        double delta = 0;                   // difference between solutions
        long long iter = 0;                 // moves drawn

        SolutionPtr<C, M> s = start.copy();         // current solution
        SolutionPtr<C, M> sBest = start.copy();     // best solution of SA
        if (!s->isComplete()) return sBest;

        while (!clock.expired() && !ctx.shouldStop())
        {
            iter++;
            T = T0 * (1.0 - clock.fraction());

            std::optional<M> m = s->randomLocalMove(ctx.getRng());
            if (!m) break;

            delta = s->deltaForLocalMove(*m);

            // define from which solution to continue the search
            if (delta <= 0)
            {
                s->apply(*m);

                // update the best solution found by SA
                if (*s->objective() < *sBest->objective() - kImprovementEpsilon)
                {
                    sBest = s->copy();

                    if (ctx.logEnabled(LogLevel::Debug)) {
                        std::ostringstream msg;
                        msg << method << ": improved to " << *sBest->objective() << " at T = " << T;
                        LogMessage(ctx, LogLevel::Debug, msg.str());
                    }
                }
            }
            else if (T > 0)
            {
                // metropolis criterion
                double x = randomico(ctx.getRng(), 0, 1);
                if (x < std::exp(-delta / T))
                    s->apply(*m);
            }
        }

        if (ctx.logEnabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << method << ": " << iter << " moves drawn";
            LogMessage(ctx, LogLevel::Debug, msg.str());
        }
        return sBest;
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> SA(const ISolution<WasteComponent, WasteMove>&, double, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> SA(const ISolution<TspComponent, TspMove>&, double, double, SearchContext&);

} // namespace routelib::mh
