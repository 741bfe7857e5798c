#include "routelib/mh/ils.hpp"

#include "routelib/mh/descent.hpp"
#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::mh {

    using namespace routelib::core;

    template <class C, class M>
    SolutionPtr<C, M> ILS(const ISolution<C, M> &start, double budget, int kick, SearchContext &ctx)
    {
        core::Require(kick >= 0, "the kick strength must not be negative");

        const char* method = "ILS";
        TimeBudget clock(budget);
        int Iter = 0;                       // count the number of iterations of the ILS
        int IterImprov = 0;                 // store the last iteration that improve the current solution

        // local optimal solution (current)
        SolutionPtr<C, M> sBest = FirstImprovement(start, clock.remaining(), ctx);
        if (!sBest->isComplete()) return sBest;

        while (!clock.expired() && !ctx.shouldStop())
        {
            Iter++;

            // neighborhood solution
            SolutionPtr<C, M> sLine = sBest->copy();
            sLine->perturb(kick, ctx.getRng());

            // local optimal of the neighborhood solution
            SolutionPtr<C, M> sBestLine = FirstImprovement(*sLine, clock.remaining(), ctx);

            if (*sBestLine->objective() < *sBest->objective() - kImprovementEpsilon) {
                sBest = std::move(sBestLine);
                IterImprov = Iter;

                if (ctx.logEnabled(LogLevel::Debug)) {
                    std::ostringstream msg;
                    msg << method << ": iteration " << Iter << " improved to " << *sBest->objective();
                    LogMessage(ctx, LogLevel::Debug, msg.str());
                }
            }
        }

        if (ctx.logEnabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << method << ": " << Iter << " iterations, last improvement at " << IterImprov;
            LogMessage(ctx, LogLevel::Debug, msg.str());
        }
        return sBest;
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> ILS(const ISolution<WasteComponent, WasteMove>&, double, int, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> ILS(const ISolution<TspComponent, TspMove>&, double, int, SearchContext&);

} // namespace routelib::mh
