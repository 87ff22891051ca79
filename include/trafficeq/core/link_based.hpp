/* Link-based equilibrium solvers: MSA, Frank-Wolfe and Conjugate Frank-Wolfe. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "trafficeq/core/cost_functions.hpp"
#include "trafficeq/core/network.hpp"
#include "trafficeq/core/options.hpp"
#include "trafficeq/core/solver.hpp"

namespace trafficeq::core {

// LinkBasedSolver keeps only link flows. Each step loads an all-or-nothing
// auxiliary flow x_bar and blends it in: flow <- alpha*x_bar + (1-alpha)*flow.
// The first step always uses alpha = 1 since flows start at zero.
class LinkBasedSolver final : public EquilibriumSolver {
public:
  // Throws AlgorithmError unless algorithm is MSA, FrankWolfe or
  // ConjugateFrankWolfe.
  LinkBasedSolver(Algorithm algorithm, CostModel model, LineSearchOptions line_search = {});

  void start(TransportNetwork& net) override;
  double step(TransportNetwork& net, std::int32_t iteration) override;
  [[nodiscard]] const CostModel& cost_model() const noexcept override { return model_; }
  [[nodiscard]] Algorithm algorithm() const noexcept override { return algorithm_; }

private:
  Algorithm algorithm_;
  CostModel model_;
  LineSearchOptions line_search_;
  // CFW: previous conjugate direction and the step applied along it.
  std::vector<Flow> conjugate_dir_ {};
  double prev_alpha_ {1.0};
};

// MSA step 2 / (iteration + 1).
[[nodiscard]] double msa_step(std::int32_t iteration) noexcept;

// alpha in [0, 1] minimizing sum over links of the cost integral at
// flow + alpha * (aux_flow - flow).
[[nodiscard]] double frank_wolfe_step(const TransportNetwork& net, const CostModel& model,
                                      std::span<const Flow> aux_flow,
                                      const LineSearchOptions& opts);

// CFW coefficient sum(d_bar*d_fw*c') / sum(d_bar*(d_fw-d_bar)*c') with c'
// the cost derivative at current flow. 0 for a zero denominator, otherwise
// clamped to [0, kConjugateBetaMax].
[[nodiscard]] double conjugate_beta(const TransportNetwork& net, const CostModel& model,
                                    std::span<const Flow> d_fw,
                                    std::span<const Flow> d_bar) noexcept;

} // namespace trafficeq::core
