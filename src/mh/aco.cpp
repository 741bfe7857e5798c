#include "routelib/mh/aco.hpp"

#include "routelib/mh/descent.hpp"
#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

#include <exception>

namespace routelib::mh {

    using namespace routelib::core;

    namespace {

        struct PairHash
        {
            template <class A, class B>
            std::size_t operator()(const std::pair<A, B> &p) const {
                std::size_t h = std::hash<A>{}(p.first);
                return h ^ (std::hash<B>{}(p.second) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
            }
        };

        //----------------------------------------------------------------------
        // Struct: Pheromone
        // Description: trail per component id; ids never deposited on share `base`
        //----------------------------------------------------------------------
        template <class C>
        struct Pheromone
        {
            using Key = decltype(std::declval<const C&>().cid());

            std::unordered_map<Key, double, PairHash> trail;
            double base = 0.0;

            double at(const C &c) const {
                auto it = trail.find(c.cid());
                return it == trail.end() ? base : it->second;
            }

            void evaporate(double rho) {
                for (auto &entry : trail) entry.second *= (1.0 - rho);
                base *= (1.0 - rho);
            }

            void deposit(const C &c, double amount) {
                trail[c.cid()] = at(c) + amount;
            }

            void clamp(double tauMin, double tauMax) {
                for (auto &entry : trail) entry.second = std::clamp(entry.second, tauMin, tauMax);
                base = std::clamp(base, tauMin, tauMax);
            }
        };

        // -------------------------------------------------------------------------
        // Helper Function: BuildAnt
        // Description: complete one ant with the random proportional rule
        // -------------------------------------------------------------------------
        template <class C, class M>
        SolutionPtr<C, M> BuildAnt(const ISolution<C, M> &start, const Pheromone<C> &tau, double beta,
                                   std::mt19937 &rng)
        {
            SolutionPtr<C, M> s = start.copy();
            std::vector<C> candidates;
            std::vector<double> weights;

            while (true)
            {
                candidates = s->addCandidates().collect();
                if (candidates.empty()) break;

                weights.resize(candidates.size());
                double total = 0.0;
                for (std::size_t k = 0; k < candidates.size(); k++) {
                    double eta = 1.0 / (std::max(s->deltaForAdd(candidates[k]), 0.0) + 1e-6);
                    weights[k] = tau.at(candidates[k]) * std::pow(eta, beta);
                    total += weights[k];
                }

                // vanished or overflowing trails fall back to a uniform choice
                if (!(total > 0.0) || !std::isfinite(total))
                    std::fill(weights.begin(), weights.end(), 1.0);

                std::discrete_distribution<std::size_t> choose(weights.begin(), weights.end());
                s->apply(candidates[choose(rng)]);
            }
            return s;
        }

        // -------------------------------------------------------------------------
        // Helper Function: BuildColony
        // Description: build every ant of one iteration in parallel, then improve them
        // -------------------------------------------------------------------------
        template <class C, class M>
        std::vector<SolutionPtr<C, M>> BuildColony(const std::vector<SolutionPtr<C, M>> &ants,
                                                   const Pheromone<C> &tau, double beta,
                                                   double lsBudget, const TimeBudget &clock,
                                                   SearchContext &ctx)
        {
            const int numAnts = static_cast<int>(ants.size());
            std::vector<SolutionPtr<C, M>> colony(numAnts);

            // one generator per ant, seeded from the context so runs stay reproducible
            std::vector<std::mt19937::result_type> seeds(numAnts);
            for (auto &seed : seeds) seed = ctx.getRng()();

            std::exception_ptr error;

            #pragma omp parallel for schedule(dynamic)
            for (int k = 0; k < numAnts; k++)
            {
                try {
                    std::mt19937 rng(seeds[k]);
                    colony[k] = BuildAnt(*ants[k], tau, beta, rng);
                }
                catch (...) {
                    #pragma omp critical(routelib_aco_error)
                    {
                        if (!error) error = std::current_exception();
                    }
                }
            }

            if (error) std::rethrow_exception(error);

            // the descent shares the context generator, keep it sequential
            if (lsBudget > 0) {
                for (auto &ant : colony) {
                    if (clock.expired() || ctx.shouldStop()) break;
                    if (ant->isComplete())
                        ant = FirstImprovement(*ant, std::min(lsBudget, clock.remaining()), ctx);
                }
            }
            return colony;
        }

        // index of the complete ant with the smallest objective, -1 if none is complete
        template <class C, class M>
        int BestAnt(const std::vector<SolutionPtr<C, M>> &colony)
        {
            int best = -1;
            for (int k = 0; k < (int)colony.size(); k++) {
                if (!colony[k]->isComplete()) continue;
                if (best < 0 || *colony[k]->objective() < *colony[best]->objective())
                    best = k;
            }
            return best;
        }

        void LogImprovement(SearchContext &ctx, const char* method, int iter, double ofv)
        {
            if (!ctx.logEnabled(LogLevel::Debug)) return;
            std::ostringstream msg;
            msg << method << ": iteration " << iter << " improved to " << ofv;
            LogMessage(ctx, LogLevel::Debug, msg.str());
        }

    } // namespace

    // -------------------------------------------------------------------------
    // Main Algorithm: AS
    // -------------------------------------------------------------------------
    template <class C, class M>
    SolutionPtr<C, M> AS(const std::vector<SolutionPtr<C, M>> &ants, double budget,
                         double beta, double rho, double tau0, double lsBudget,
                         SearchContext &ctx)
    {
        core::Require(!ants.empty(), "the colony needs at least one ant");
        core::Require(rho >= 0 && rho <= 1, "rho must lie in [0, 1]");

        const char* method = "AS";
        TimeBudget clock(budget);
        Pheromone<C> tau;
        tau.base = tau0;

        SolutionPtr<C, M> sBest;            // best ant of AS
        int Iter = 0;

        do
        {
            Iter++;
            std::vector<SolutionPtr<C, M>> colony = BuildColony(ants, tau, beta, lsBudget, clock, ctx);

            tau.evaporate(rho);
            for (const auto &ant : colony) {
                if (!ant->isComplete()) continue;
                double amount = 1.0 / std::max(*ant->objective(), kCostTolerance);
                for (const C &c : ant->components())
                    tau.deposit(c, amount);
            }

            int best = BestAnt(colony);
            if (best >= 0 && (!sBest || *colony[best]->objective() < *sBest->objective())) {
                sBest = std::move(colony[best]);
                LogImprovement(ctx, method, Iter, *sBest->objective());
            }
            else if (!sBest && best < 0) {
                sBest = std::move(colony.front());
            }
        } while (!clock.expired() && !ctx.shouldStop());

        return sBest;
    }

    // -------------------------------------------------------------------------
    // Main Algorithm: MMAS
    // -------------------------------------------------------------------------
    template <class C, class M>
    SolutionPtr<C, M> MMAS(const std::vector<SolutionPtr<C, M>> &ants, double budget,
                           double beta, double rho, double tauMax, double globalRatio,
                           double lsBudget, SearchContext &ctx)
    {
        core::Require(!ants.empty(), "the colony needs at least one ant");
        core::Require(rho >= 0 && rho <= 1, "rho must lie in [0, 1]");
        core::Require(globalRatio >= 0 && globalRatio <= 1, "globalRatio must lie in [0, 1]");

        const char* method = "MMAS";
        TimeBudget clock(budget);
        Pheromone<C> tau;
        tau.base = tauMax;

        SolutionPtr<C, M> sBest;            // best ant so far
        int Iter = 0;

        do
        {
            Iter++;
            std::vector<SolutionPtr<C, M>> colony = BuildColony(ants, tau, beta, lsBudget, clock, ctx);

            int best = BestAnt(colony);
            if (best < 0) {
                // nothing complete to learn from
                if (!sBest) sBest = std::move(colony.front());
                continue;
            }

            if (!sBest || !sBest->isComplete() || *colony[best]->objective() < *sBest->objective()) {
                sBest = colony[best]->copy();
                LogImprovement(ctx, method, Iter, *sBest->objective());
            }

            // global best with probability globalRatio, otherwise the iteration best
            const ISolution<C, M> &depositor =
                randomico(ctx.getRng(), 0, 1) < globalRatio ? *sBest : *colony[best];

            std::vector<C> trail = depositor.components().collect();
            double tauMin = tauMax / (2.0 * std::max<std::size_t>(trail.size(), 1));
            double amount = 1.0 / std::max(*depositor.objective(), kCostTolerance);

            tau.evaporate(rho);
            for (const C &c : trail)
                tau.deposit(c, amount);
            tau.clamp(tauMin, tauMax);

        } while (!clock.expired() && !ctx.shouldStop());

        return sBest;
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> AS(const std::vector<SolutionPtr<WasteComponent, WasteMove>>&, double, double, double, double, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> AS(const std::vector<SolutionPtr<TspComponent, TspMove>>&, double, double, double, double, double, SearchContext&);
    template SolutionPtr<WasteComponent, WasteMove> MMAS(const std::vector<SolutionPtr<WasteComponent, WasteMove>>&, double, double, double, double, double, double, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> MMAS(const std::vector<SolutionPtr<TspComponent, TspMove>>&, double, double, double, double, double, double, SearchContext&);

} // namespace routelib::mh
