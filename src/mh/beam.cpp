#include "routelib/mh/beam.hpp"

#include "routelib/core/method.hpp"
#include "routelib/problems/waste_collection.hpp"
#include "routelib/problems/tsp.hpp"

namespace routelib::mh {

    using namespace routelib::core;

    template <class C, class M>
    SolutionPtr<C, M> BeamSearch(const ISolution<C, M> &start, int width, SearchContext &ctx)
    {
        core::Require(width > 0, "the beam width must be positive");

        // extension of beam[parent] by component, ranked by the bound of the child
        struct Candidate {
            double bound;
            std::size_t parent;
            C component;
        };

        if (start.isComplete()) return start.copy();

        std::vector<SolutionPtr<C, M>> beam;
        beam.push_back(start.copy());

        SolutionPtr<C, M> best;
        double bestOFV = kInfinity;
        int level = 0;

        while (!beam.empty())
        {
            if (ctx.shouldStop()) break;

            std::vector<Candidate> candidates;
            for (std::size_t b = 0; b < beam.size(); b++) {
                double lb = *beam[b]->lowerBound();
                for (const C &c : beam[b]->addCandidates()) {
                    double bound = lb + beam[b]->lowerBoundIncrForAdd(c);
                    if (bound < bestOFV)
                        candidates.push_back(Candidate{bound, b, c});
                }
            }

            if (candidates.empty()) break;

            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const Candidate &a, const Candidate &b) { return a.bound < b.bound; });

            std::size_t keep = std::min(candidates.size(), static_cast<std::size_t>(width));
            std::vector<SolutionPtr<C, M>> next;

            for (std::size_t k = 0; k < keep; k++) {
                SolutionPtr<C, M> child = beam[candidates[k].parent]->copy();
                child->apply(candidates[k].component);

                if (child->isComplete()) {
                    double ofv = *child->objective();
                    if (ofv < bestOFV) {
                        bestOFV = ofv;
                        best = std::move(child);
                    }
                }
                else {
                    next.push_back(std::move(child));
                }
            }

            beam = std::move(next);
            level++;
        }

        if (ctx.logEnabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << "BeamSearch: " << level << " levels, best " << bestOFV;
            LogMessage(ctx, LogLevel::Debug, msg.str());
        }

        if (best) return best;
        if (!beam.empty()) return std::move(beam.front());
        return start.copy();
    }

    using problems::WasteComponent;
    using problems::WasteMove;
    using problems::TspComponent;
    using problems::TspMove;

    template SolutionPtr<WasteComponent, WasteMove> BeamSearch(const ISolution<WasteComponent, WasteMove>&, int, SearchContext&);
    template SolutionPtr<TspComponent, TspMove> BeamSearch(const ISolution<TspComponent, TspMove>&, int, SearchContext&);

} // namespace routelib::mh
