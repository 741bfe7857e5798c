#include "routelib/problems/waste_collection.hpp"

namespace routelib::problems {

    using core::LazySequence;

    // -----------------------------------------------------------------------------
    // Problem
    // -----------------------------------------------------------------------------

    WasteCollectionProblem::WasteCollectionProblem(int n, std::array<Row, 2> entry, std::array<Row, 2> exit,
                                                   std::array<Table, 4> pair)
        : n_(n), entry_(std::move(entry)), exit_(std::move(exit)), pair_(std::move(pair))
    {
        core::Require(n_ > 0, "the problem needs at least one container");

        for (int o = 0; o < 2; o++) {
            core::Require((int)entry_[o].size() == n_, "entry table has the wrong size");
            core::Require((int)exit_[o].size() == n_, "exit table has the wrong size");
        }
        for (const Table &table : pair_) {
            core::Require((int)table.size() == n_, "pair table has the wrong number of rows");
            for (const Row &row : table)
                core::Require((int)row.size() == n_, "pair table has the wrong number of columns");
        }
    }

    std::unique_ptr<WasteCollectionProblem::Solution> WasteCollectionProblem::emptySolution() const
    {
        return std::make_unique<WasteCollectionSolution>(*this);
    }

    double WasteCollectionProblem::minimalConnections(const std::vector<int> &pending,
                                                      const std::optional<WasteComponent> &anchor) const
    {
        if (pending.empty()) return 0.0;

        double total = 0.0;

        // cheapest way into each pending unit: from the anchor or from another pending unit
        for (int d : pending) {
            double best = core::kInfinity;

            for (int od = 0; od < 2; od++)
                best = std::min(best, linkCost(anchor, WasteComponent{d, od}));

            for (int s : pending) {
                if (s == d) continue;
                for (int p = 0; p < 4; p++)
                    best = std::min(best, pair_[p][s][d]);
            }
            total += best;
        }

        // the last pending unit still has to reach the plant
        double exitMin = core::kInfinity;
        for (int u : pending)
            for (int o = 0; o < 2; o++)
                exitMin = std::min(exitMin, exit_[o][u]);

        return total + exitMin;
    }

    // -----------------------------------------------------------------------------
    // Solution state
    // -----------------------------------------------------------------------------

    WasteCollectionSolution::WasteCollectionSolution(const WasteCollectionProblem &problem)
        : problem_(&problem)
    {
        for (int u = 0; u < problem.getDimension(); u++)
            unvisited_.insert(unvisited_.end(), u);
    }

    WasteCollectionSolution::Ptr WasteCollectionSolution::copy() const
    {
        return std::make_unique<WasteCollectionSolution>(*this);
    }

    bool WasteCollectionSolution::isComplete() const
    {
        return (int)units_.size() == problem_->getDimension();
    }

    bool WasteCollectionSolution::isFeasible() const
    {
        std::set<int> distinct(units_.begin(), units_.end());
        return (int)distinct.size() == problem_->getDimension();
    }

    std::optional<WasteComponent> WasteCollectionSolution::lastComponent() const
    {
        if (units_.empty()) return std::nullopt;
        return WasteComponent{units_.back(), orientations_.back()};
    }

    std::optional<double> WasteCollectionSolution::objective() const
    {
        if (!isComplete()) return std::nullopt;
        return cost_ + problem_->exitCost(orientations_.back(), units_.back());
    }

    std::optional<double> WasteCollectionSolution::lowerBound() const
    {
        if (isComplete()) return std::nullopt;

        std::vector<int> pending(unvisited_.begin(), unvisited_.end());
        return cost_ + problem_->minimalConnections(pending, lastComponent());
    }

    double WasteCollectionSolution::recomputeCost() const
    {
        double total = 0.0;
        std::optional<WasteComponent> prev;
        for (std::size_t p = 0; p < units_.size(); p++) {
            WasteComponent cur{units_[p], orientations_[p]};
            total += problem_->linkCost(prev, cur);
            prev = cur;
        }
        return total;
    }

    // -----------------------------------------------------------------------------
    // Preconditions
    // -----------------------------------------------------------------------------

    void WasteCollectionSolution::requireAddable(const WasteComponent &c) const
    {
        core::Require(!isComplete(), "the solution is already complete");
        core::Require(c.unit >= 0 && c.unit < problem_->getDimension(), "unit out of range");
        core::Require(c.orientation == 0 || c.orientation == 1, "orientation must be 0 or 1");
        core::Require(unvisited_.count(c.unit) == 1, "unit " + std::to_string(c.unit) + " is already visited");
    }

    void WasteCollectionSolution::requireApplicable(const WasteMove &m) const
    {
        core::Require(isComplete(), "local moves need a complete solution");
        core::Require(m.i >= 0 && m.i <= m.j && m.j < problem_->getDimension(),
                      "positions must satisfy 0 <= i <= j < n");
        core::Require((m.iOrientation == 0 || m.iOrientation == 1) &&
                      (m.jOrientation == 0 || m.jOrientation == 1), "orientation must be 0 or 1");
    }

    // -----------------------------------------------------------------------------
    // Incremental evaluation
    // -----------------------------------------------------------------------------

    double WasteCollectionSolution::deltaForAdd(const WasteComponent &c) const
    {
        requireAddable(c);

        double delta = problem_->linkCost(lastComponent(), c);

        // the add that completes the route also closes it at the plant
        if (unvisited_.size() == 1)
            delta += problem_->exitCost(c.orientation, c.unit);

        return delta;
    }

    WasteComponent WasteCollectionSolution::movedAt(const WasteMove &m, int p) const
    {
        if (p == m.j) return WasteComponent{units_[m.i], m.jOrientation};
        if (p == m.i) return WasteComponent{units_[m.j], m.iOrientation};
        return WasteComponent{units_[p], orientations_[p]};
    }

    double WasteCollectionSolution::edgeDelta(const WasteMove &m, bool withExit) const
    {
        const int n = problem_->getDimension();

        auto current = [this](int p) { return WasteComponent{units_[p], orientations_[p]}; };
        auto moved = [this, &m](int p) { return movedAt(m, p); };

        auto edgeCost = [this, n](int k, const auto &at) -> double {
            if (k == 0) {
                WasteComponent c = at(0);
                return problem_->entryCost(c.orientation, c.unit);
            }
            if (k == n) {
                WasteComponent c = at(n - 1);
                return problem_->exitCost(c.orientation, c.unit);
            }
            return problem_->transitionCost(at(k - 1), at(k));
        };

        // adjacent or equal positions share edges: count each one once
        std::array<int, 4> edges = {m.i, m.i + 1, m.j, m.j + 1};
        std::sort(edges.begin(), edges.end());

        double delta = 0.0;
        for (std::size_t e = 0; e < edges.size(); e++) {
            int k = edges[e];
            if (e > 0 && k == edges[e - 1]) continue;
            if (k == n && !withExit) continue;
            delta += edgeCost(k, moved) - edgeCost(k, current);
        }
        return delta;
    }

    double WasteCollectionSolution::deltaForLocalMove(const WasteMove &m) const
    {
        requireApplicable(m);
        return edgeDelta(m, true);
    }

    double WasteCollectionSolution::lowerBoundIncrForAdd(const WasteComponent &c) const
    {
        requireAddable(c);

        // the bound is undefined once the last unit is in: nothing left to estimate
        if (unvisited_.size() == 1) return 0.0;

        std::vector<int> pending;
        pending.reserve(unvisited_.size() - 1);
        for (int u : unvisited_)
            if (u != c.unit) pending.push_back(u);

        double after = cost_ + problem_->linkCost(lastComponent(), c)
                     + problem_->minimalConnections(pending, c);

        return after - *lowerBound();
    }

    // -----------------------------------------------------------------------------
    // Mutation
    // -----------------------------------------------------------------------------

    void WasteCollectionSolution::doAdd(const WasteComponent &c)
    {
        requireAddable(c);

        cost_ += problem_->linkCost(lastComponent(), c);

        units_.push_back(c.unit);
        orientations_.push_back(c.orientation);

        visited_.insert(c.unit);
        unvisited_.erase(c.unit);
    }

    void WasteCollectionSolution::doStep(const WasteMove &m)
    {
        requireApplicable(m);

        // the plant exit is not part of the running cost
        cost_ += edgeDelta(m, false);

        std::swap(units_[m.i], units_[m.j]);
        orientations_[m.i] = m.iOrientation;
        orientations_[m.j] = m.jOrientation;
    }

    // -----------------------------------------------------------------------------
    // Neighborhoods
    // -----------------------------------------------------------------------------

    LazySequence<WasteComponent> WasteCollectionSolution::addCandidates() const
    {
        using Generator = LazySequence<WasteComponent>::Generator;

        auto pending = std::make_shared<const std::vector<int>>(unvisited_.begin(), unvisited_.end());

        return LazySequence<WasteComponent>([pending] {
            std::size_t k = 0;
            return Generator([pending, k]() mutable -> std::optional<WasteComponent> {
                if (k >= 2 * pending->size()) return std::nullopt;
                WasteComponent c{(*pending)[k / 2], static_cast<int>(k % 2)};
                k++;
                return c;
            });
        });
    }

    LazySequence<WasteMove> WasteCollectionSolution::localMoveCandidates() const
    {
        using Generator = LazySequence<WasteMove>::Generator;

        if (!isComplete()) return {};

        const int n = problem_->getDimension();

        return LazySequence<WasteMove>([n] {
            int i = 0, j = 0, d = 0;
            return Generator([n, i, j, d]() mutable -> std::optional<WasteMove> {
                if (i >= n) return std::nullopt;

                WasteMove m{i, j, d >> 1, d & 1};

                if (++d == 4) {
                    d = 0;
                    if (++j == n) {
                        i++;
                        j = i;
                    }
                }
                return m;
            });
        });
    }

    namespace {

        // cursor of the three independently shuffled axes (outer index, inner index, orientations)
        struct WorCursor
        {
            std::vector<int> outer;
            std::size_t oi = 0;
            std::vector<int> inner;
            std::size_t ii = 0;
            std::array<int, 4> dirs = {0, 1, 2, 3};
            std::size_t di = 4;
            int i = 0;
            int j = 0;
        };

    }

    LazySequence<WasteMove> WasteCollectionSolution::randomLocalMovesWithoutReplacement(std::mt19937 &rng) const
    {
        using Generator = LazySequence<WasteMove>::Generator;

        if (!isComplete()) return {};

        const int n = problem_->getDimension();
        std::mt19937 *gen = &rng;

        return LazySequence<WasteMove>([n, gen] {
            auto st = std::make_shared<WorCursor>();
            st->outer.resize(n);
            std::iota(st->outer.begin(), st->outer.end(), 0);
            std::shuffle(st->outer.begin(), st->outer.end(), *gen);

            return Generator([n, gen, st]() -> std::optional<WasteMove> {
                while (st->di >= st->dirs.size()) {
                    if (st->ii >= st->inner.size()) {
                        if (st->oi >= st->outer.size()) return std::nullopt;

                        st->i = st->outer[st->oi++];
                        st->inner.resize(n - st->i);
                        std::iota(st->inner.begin(), st->inner.end(), st->i);
                        std::shuffle(st->inner.begin(), st->inner.end(), *gen);
                        st->ii = 0;
                    }
                    st->j = st->inner[st->ii++];
                    std::shuffle(st->dirs.begin(), st->dirs.end(), *gen);
                    st->di = 0;
                }

                int d = st->dirs[st->di++];
                return WasteMove{st->i, st->j, d >> 1, d & 1};
            });
        });
    }

    std::optional<WasteMove> WasteCollectionSolution::randomLocalMove(std::mt19937 &rng) const
    {
        return randomLocalMovesWithoutReplacement(rng).first();
    }

    std::optional<WasteComponent> WasteCollectionSolution::greedyAddCandidate() const
    {
        std::optional<WasteComponent> best;
        double bestCost = core::kInfinity;
        std::optional<WasteComponent> last = lastComponent();

        for (int u : unvisited_) {
            for (int o = 0; o < 2; o++) {
                WasteComponent c{u, o};
                double cost = problem_->linkCost(last, c);
                if (!best || cost < bestCost) {
                    best = c;
                    bestCost = cost;
                }
            }
        }
        return best;
    }

    LazySequence<WasteComponent> WasteCollectionSolution::components() const
    {
        std::vector<WasteComponent> snapshot;
        snapshot.reserve(units_.size());
        for (std::size_t p = 0; p < units_.size(); p++)
            snapshot.push_back(WasteComponent{units_[p], orientations_[p]});

        return core::FromVector(std::move(snapshot));
    }

    // -----------------------------------------------------------------------------
    // Verification
    // -----------------------------------------------------------------------------

    void WasteCollectionSolution::checkConsistency() const
    {
        const int n = problem_->getDimension();

        if (units_.size() != orientations_.size())
            throw core::ConsistencyError("units and orientations differ in length");

        if ((int)(visited_.size() + unvisited_.size()) != n)
            throw core::ConsistencyError("visited and unvisited do not cover every unit");

        for (int u : visited_)
            if (unvisited_.count(u))
                throw core::ConsistencyError("unit " + std::to_string(u) + " is both visited and unvisited");

        std::set<int> inSequence(units_.begin(), units_.end());
        if (inSequence.size() != units_.size())
            throw core::ConsistencyError("the sequence contains a duplicate unit");
        if (inSequence != visited_)
            throw core::ConsistencyError("the sequence and the visited set disagree");

        for (int o : orientations_)
            if (o != 0 && o != 1)
                throw core::ConsistencyError("orientation must be 0 or 1");

        double full = recomputeCost();
        if (!core::nearlyEqual(full, cost_)) {
            std::ostringstream msg;
            msg << std::setprecision(17) << "running cost " << cost_ << " != recomputed cost " << full;
            throw core::ConsistencyError(msg.str());
        }
    }

} // namespace routelib::problems
