#include "routelib/problems/tsp.hpp"
#include "routelib/core/method.hpp"

namespace routelib::problems {

    using core::LazySequence;

    double euclideanDistance(const Point &a, const Point &b)
    {
        double dx = a.x - b.x;
        double dy = a.y - b.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    // -----------------------------------------------------------------------------
    // Problem
    // -----------------------------------------------------------------------------

    TspProblem::TspProblem(std::vector<Point> coords)
        : n_(static_cast<int>(coords.size()))
    {
        core::Require(n_ > 0, "the problem needs at least one point");

        dist_.assign(n_, std::vector<double>(n_, 0.0));
        for (int a = 0; a < n_; a++)
            for (int b = a + 1; b < n_; b++)
                dist_[a][b] = dist_[b][a] = euclideanDistance(coords[a], coords[b]);
    }

    std::unique_ptr<TspProblem::Solution> TspProblem::emptySolution() const
    {
        return emptySolutionWithStart(0);
    }

    std::unique_ptr<TspProblem::Solution> TspProblem::emptySolutionWithStart(int start) const
    {
        return std::make_unique<TspSolution>(*this, start);
    }

    // -----------------------------------------------------------------------------
    // Solution state
    // -----------------------------------------------------------------------------

    TspSolution::TspSolution(const TspProblem &problem, int start)
        : problem_(&problem), start_(start)
    {
        core::Require(start >= 0 && start < problem.getDimension(), "start point out of range");

        path_.push_back(start);
        visited_.insert(start);
        for (int p = 0; p < problem.getDimension(); p++)
            if (p != start) unvisited_.insert(unvisited_.end(), p);
    }

    TspSolution::Ptr TspSolution::copy() const
    {
        return std::make_unique<TspSolution>(*this);
    }

    bool TspSolution::isComplete() const
    {
        return (int)path_.size() == problem_->getDimension() + 1;
    }

    bool TspSolution::isFeasible() const
    {
        return isComplete();
    }

    std::optional<double> TspSolution::objective() const
    {
        if (!isComplete()) return std::nullopt;
        return cost_;
    }

    std::optional<double> TspSolution::lowerBound() const
    {
        // no lookahead: the distance travelled so far
        if (isComplete()) return std::nullopt;
        return cost_;
    }

    double TspSolution::recomputeCost() const
    {
        double total = 0.0;
        for (std::size_t k = 1; k < path_.size(); k++)
            total += problem_->pointDistance(path_[k - 1], path_[k]);
        return total;
    }

    void TspSolution::requireAddable(const TspComponent &c) const
    {
        const int n = problem_->getDimension();

        core::Require(!isComplete(), "the tour is already closed");
        core::Require(c.from == path_.back(), "the edge must leave the last point of the path");
        core::Require(c.to >= 0 && c.to < n, "point out of range");

        if ((int)path_.size() < n)
            core::Require(unvisited_.count(c.to) == 1, "point " + std::to_string(c.to) + " is already visited");
        else
            core::Require(c.to == start_, "only the closing edge to the start can be added");
    }

    void TspSolution::requireApplicable(const TspMove &m) const
    {
        core::Require(isComplete(), "local moves need a closed tour");
        core::Require(m.i >= 1 && m.i < m.j && m.j < (int)path_.size(),
                      "positions must satisfy 1 <= i < j <= n");
    }

    // -----------------------------------------------------------------------------
    // Incremental evaluation
    // -----------------------------------------------------------------------------

    double TspSolution::deltaForAdd(const TspComponent &c) const
    {
        requireAddable(c);
        return problem_->transitionCost(c);
    }

    double TspSolution::deltaForLocalMove(const TspMove &m) const
    {
        requireApplicable(m);

        // interior edges keep their length under a symmetric distance
        const auto &p = path_;
        return problem_->pointDistance(p[m.i - 1], p[m.j - 1])
             + problem_->pointDistance(p[m.i], p[m.j])
             - problem_->pointDistance(p[m.i - 1], p[m.i])
             - problem_->pointDistance(p[m.j - 1], p[m.j]);
    }

    double TspSolution::lowerBoundIncrForAdd(const TspComponent &c) const
    {
        requireAddable(c);

        // the closing edge completes the tour and leaves the bound undefined
        if ((int)path_.size() + 1 <= problem_->getDimension())
            return problem_->transitionCost(c);
        return 0.0;
    }

    // -----------------------------------------------------------------------------
    // Mutation
    // -----------------------------------------------------------------------------

    void TspSolution::doAdd(const TspComponent &c)
    {
        requireAddable(c);

        path_.push_back(c.to);
        if (c.to != start_) {
            unvisited_.erase(c.to);
            visited_.insert(c.to);
        }
        cost_ += problem_->transitionCost(c);
    }

    void TspSolution::doStep(const TspMove &m)
    {
        cost_ += deltaForLocalMove(m);
        std::reverse(path_.begin() + m.i, path_.begin() + m.j);
    }

    // -----------------------------------------------------------------------------
    // Neighborhoods
    // -----------------------------------------------------------------------------

    LazySequence<TspComponent> TspSolution::addCandidates() const
    {
        const int n = problem_->getDimension();
        const int u = path_.back();

        std::vector<TspComponent> candidates;
        if ((int)path_.size() < n) {
            candidates.reserve(unvisited_.size());
            for (int v : unvisited_)
                candidates.push_back(TspComponent{u, v});
        }
        else if ((int)path_.size() == n) {
            candidates.push_back(TspComponent{u, start_});
        }
        return core::FromVector(std::move(candidates));
    }

    LazySequence<TspMove> TspSolution::localMoveCandidates() const
    {
        using Generator = LazySequence<TspMove>::Generator;

        if (!isComplete()) return {};

        const int len = static_cast<int>(path_.size());

        return LazySequence<TspMove>([len] {
            int i = 1, j = 3;
            return Generator([len, i, j]() mutable -> std::optional<TspMove> {
                if (j >= len) return std::nullopt;

                TspMove m{i, j};
                if (++j >= len) {
                    i++;
                    j = i + 2;
                }
                return m;
            });
        });
    }

    LazySequence<TspMove> TspSolution::randomLocalMovesWithoutReplacement(std::mt19937 &rng) const
    {
        using Generator = LazySequence<TspMove>::Generator;

        if (!isComplete()) return {};

        const std::size_t len = path_.size();
        std::mt19937 *gen = &rng;

        // uniform order over the len x len grid, pairs outside the move domain are skipped
        return LazySequence<TspMove>([len, gen] {
            auto perm = std::make_shared<core::LazyPermutation>(len * len);
            return Generator([len, gen, perm]() -> std::optional<TspMove> {
                while (std::optional<std::size_t> k = perm->next(*gen)) {
                    int i = static_cast<int>(*k / len);
                    int j = static_cast<int>(*k % len);
                    if (i >= 1 && j >= i + 2)
                        return TspMove{i, j};
                }
                return std::nullopt;
            });
        });
    }

    std::optional<TspMove> TspSolution::randomLocalMove(std::mt19937 &rng) const
    {
        const int len = static_cast<int>(path_.size());
        if (!isComplete() || len < 4) return std::nullopt;

        int i = core::irandomico(rng, 1, len - 3);
        int j = core::irandomico(rng, i + 2, len - 1);
        return TspMove{i, j};
    }

    std::optional<TspComponent> TspSolution::greedyAddCandidate() const
    {
        const int n = problem_->getDimension();
        const int u = path_.back();

        // nearest unvisited point
        if ((int)path_.size() < n) {
            std::optional<TspComponent> best;
            double bestDist = core::kInfinity;
            for (int v : unvisited_) {
                double d = problem_->pointDistance(u, v);
                if (!best || d < bestDist) {
                    best = TspComponent{u, v};
                    bestDist = d;
                }
            }
            return best;
        }
        if ((int)path_.size() == n)
            return TspComponent{u, start_};
        return std::nullopt;
    }

    LazySequence<TspComponent> TspSolution::components() const
    {
        std::vector<TspComponent> edges;
        edges.reserve(path_.size());
        for (std::size_t k = 1; k < path_.size(); k++)
            edges.push_back(TspComponent{path_[k - 1], path_[k]});
        return core::FromVector(std::move(edges));
    }

    // -----------------------------------------------------------------------------
    // Verification
    // -----------------------------------------------------------------------------

    void TspSolution::checkConsistency() const
    {
        const int n = problem_->getDimension();

        if (path_.empty() || path_.front() != start_)
            throw core::ConsistencyError("the path does not begin at the start point");

        if ((int)(visited_.size() + unvisited_.size()) != n)
            throw core::ConsistencyError("visited and unvisited do not cover every point");

        for (int v : visited_)
            if (unvisited_.count(v))
                throw core::ConsistencyError("point " + std::to_string(v) + " is both visited and unvisited");

        // the closing return to the start is the only repeated point
        std::size_t open = isComplete() ? path_.size() - 1 : path_.size();
        if (isComplete() && path_.back() != start_)
            throw core::ConsistencyError("the tour does not return to the start point");

        std::set<int> inPath(path_.begin(), path_.begin() + open);
        if (inPath.size() != open)
            throw core::ConsistencyError("the path contains a duplicate point");
        if (inPath != visited_)
            throw core::ConsistencyError("the path and the visited set disagree");

        double full = recomputeCost();
        if (!core::nearlyEqual(full, cost_)) {
            std::ostringstream msg;
            msg << std::setprecision(17) << "running cost " << cost_ << " != recomputed cost " << full;
            throw core::ConsistencyError(msg.str());
        }
    }

} // namespace routelib::problems
