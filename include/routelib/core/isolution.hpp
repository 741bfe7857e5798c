#pragma once

#include "routelib/core/common.hpp"
#include "routelib/core/errors.hpp"
#include "routelib/core/lazy_sequence.hpp"

namespace routelib::core {

    /**
     * @brief Driver-facing contract of a (partial or complete) solution
     *
     * Drivers are written against this interface only. Every query is pure;
     * the two apply() overloads are the only mutators and keep the running
     * cost in lock-step with the structure.
     *
     * Sequences returned by the enumerators are invalidated by any mutation
     * of the solution they came from.
     */
    template <class TComponent, class TLocalMove>
    class ISolution {
        public:
            using Component = TComponent;
            using LocalMove = TLocalMove;
            using Ptr = std::unique_ptr<ISolution>;

            virtual ~ISolution() = default;

            // -------------------------------------------------------------------------
            // STATE
            // -------------------------------------------------------------------------
            virtual Ptr copy() const = 0;
            virtual bool isFeasible() const = 0;
            virtual bool isComplete() const = 0;
            virtual double accumulatedCost() const = 0;

            // total cost, std::nullopt while the solution is not complete
            virtual std::optional<double> objective() const = 0;

            // admissible bound on any completion, std::nullopt once complete
            virtual std::optional<double> lowerBound() const = 0;

            // -------------------------------------------------------------------------
            // NEIGHBORHOODS
            // -------------------------------------------------------------------------
            virtual LazySequence<Component> addCandidates() const = 0;
            virtual LazySequence<LocalMove> localMoveCandidates() const = 0;
            virtual LazySequence<LocalMove> randomLocalMovesWithoutReplacement(std::mt19937 &rng) const = 0;
            virtual std::optional<LocalMove> randomLocalMove(std::mt19937 &rng) const = 0;
            virtual std::optional<Component> greedyAddCandidate() const = 0;

            // constituent transitions of the current solution
            virtual LazySequence<Component> components() const = 0;

            // -------------------------------------------------------------------------
            // INCREMENTAL EVALUATION
            // -------------------------------------------------------------------------
            virtual double deltaForAdd(const Component &c) const = 0;
            virtual double deltaForLocalMove(const LocalMove &m) const = 0;
            virtual double lowerBoundIncrForAdd(const Component &c) const = 0;

            // -------------------------------------------------------------------------
            // MUTATION
            // -------------------------------------------------------------------------

            // with verification on, every mutation ends with checkConsistency()
            void apply(const Component &c) {
                doAdd(c);
                if (verify_) checkConsistency();
            }

            void apply(const LocalMove &m) {
                doStep(m);
                if (verify_) checkConsistency();
            }

            /**
             * Method: perturb
             * Description: apply `strength` random local moves in sequence
             */
            void perturb(int strength, std::mt19937 &rng) {
                for (int k = 0; k < strength; k++) {
                    std::optional<LocalMove> m = randomLocalMove(rng);
                    if (!m) return;
                    apply(*m);
                }
            }

            // -------------------------------------------------------------------------
            // VERIFICATION
            // -------------------------------------------------------------------------

            // throws ConsistencyError if the bookkeeping disagrees with a full recomputation
            virtual void checkConsistency() const = 0;

            void setVerification(bool on) { verify_ = on; }
            bool verification() const { return verify_; }

        protected:
            ISolution() = default;
            ISolution(const ISolution&) = default;
            ISolution& operator=(const ISolution&) = default;

            virtual void doAdd(const Component &c) = 0;
            virtual void doStep(const LocalMove &m) = 0;

        private:
            bool verify_ = false;
    };

    template <class TComponent, class TLocalMove>
    using SolutionPtr = std::unique_ptr<ISolution<TComponent, TLocalMove>>;

} // namespace routelib::core
