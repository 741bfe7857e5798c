#include "routelib/mh/grasp.hpp"

#include "routelib/mh/descent.hpp"
#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::mh {

    using namespace routelib::core;

    // -------------------------------------------------------------------------
    // Helper Function: ConstructiveGreedyRandomized (Internal)
    // -------------------------------------------------------------------------
    template <class C, class M>
    static SolutionPtr<C, M> ConstructiveGreedyRandomized(const ISolution<C, M> &start, double alpha,
                                                          SearchContext &ctx)
    {
        SolutionPtr<C, M> s = start.copy();
        std::vector<C> candidates;          // add candidates of the current step
        std::vector<double> g;              // delta of each candidate
        std::vector<int> RCL;               // restricted candidate list

        while (!ctx.shouldStop())
        {
            candidates = s->addCandidates().collect();
            if (candidates.empty()) break;

            double min = kInfinity;
            double max = -kInfinity;

            g.resize(candidates.size());
            for (std::size_t k = 0; k < candidates.size(); k++) {
                g[k] = s->deltaForAdd(candidates[k]);
                min = std::min(min, g[k]);
                max = std::max(max, g[k]);
            }

            // candidates within alpha of the best one
            double threshold = min + alpha * (max - min);
            RCL.clear();
            for (std::size_t k = 0; k < candidates.size(); k++)
                if (g[k] <= threshold) RCL.push_back(static_cast<int>(k));

            int pick = RCL[irandomico(ctx.getRng(), 0, static_cast<int>(RCL.size()) - 1)];
            s->apply(candidates[pick]);
        }
        return s;
    }

    // -------------------------------------------------------------------------
    // Main Algorithm: GRASP
    // -------------------------------------------------------------------------
    template <class C, class M>
    SolutionPtr<C, M> GRASP(const ISolution<C, M> &start, double budget, double alpha,
                            double lsBudget, SearchContext &ctx)
    {
        core::Require(alpha >= 0 && alpha <= 1, "alpha must lie in [0, 1]");

        const char* method = "GRASP";
        TimeBudget clock(budget);
        SolutionPtr<C, M> sBest;            // best solution of GRASP
        double bestOFV = kInfinity;
        int Iter = 0;                       // constructions performed

        do
        {
            Iter++;

            // constructive solution
            SolutionPtr<C, M> sLine = ConstructiveGreedyRandomized(start, alpha, ctx);

            // local search solution
            if (lsBudget > 0 && sLine->isComplete())
                sLine = FirstImprovement(*sLine, std::min(lsBudget, clock.remaining()), ctx);

            if (!sLine->isComplete()) {
                if (!sBest) sBest = std::move(sLine);
                continue;
            }

            if (*sLine->objective() < bestOFV) {
                bestOFV = *sLine->objective();
                sBest = std::move(sLine);

                if (ctx.logEnabled(LogLevel::Debug)) {
                    std::ostringstream msg;
                    msg << method << ": construction " << Iter << " improved to " << bestOFV;
                    LogMessage(ctx, LogLevel::Debug, msg.str());
                }
            }
        } while (!clock.expired() && !ctx.shouldStop());

        return sBest;
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> GRASP(const ISolution<WasteComponent, WasteMove>&, double, double, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> GRASP(const ISolution<TspComponent, TspMove>&, double, double, double, SearchContext&);

} // namespace routelib::mh
