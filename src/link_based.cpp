/*
  Link-based solvers (MSA / FW / CFW).

  Step sizes:
    - MSA uses the predetermined 2/(k+1).
    - FW minimizes the Beckmann objective along x_bar - flow with a bisection
      on its directional derivative sum(cost(flow + a*d) * d).
    - CFW first bends the FW direction towards the previous conjugate
      direction, then runs the same line search.
*/
#include "trafficeq/core/link_based.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "trafficeq/core/constants.hpp"
#include "trafficeq/core/error.hpp"
#include "trafficeq/core/line_search.hpp"
#include "trafficeq/core/loading.hpp"

namespace trafficeq::core {

double msa_step(std::int32_t iteration) noexcept {
  return 2.0 / (static_cast<double>(iteration) + 1.0);
}

double frank_wolfe_step(const TransportNetwork& net, const CostModel& model,
                        std::span<const Flow> aux_flow,
                        const LineSearchOptions& opts) {
  const auto links = net.links();
  if (aux_flow.size() != links.size()) {
    throw ValueError("frank_wolfe_step: aux_flow length mismatch");
  }
  auto derivative = [&](double a) {
    double g = 0.0;
    for (std::size_t i = 0; i < links.size(); ++i) {
      const Flow d = aux_flow[i] - links[i].flow;
      if (d == 0.0) continue;
      const Flow x = std::max(0.0, links[i].flow + a * d);
      g += model.cost(links[i], x) * d;
    }
    return g;
  };
  return std::clamp(bisection_line_search(derivative, opts), 0.0, 1.0);
}

double conjugate_beta(const TransportNetwork& net, const CostModel& model,
                      std::span<const Flow> d_fw,
                      std::span<const Flow> d_bar) noexcept {
  const auto links = net.links();
  double numerator = 0.0;
  double denominator = 0.0;
  for (std::size_t i = 0; i < links.size(); ++i) {
    const Cost c = model.derivative(links[i], links[i].flow);
    numerator += d_bar[i] * d_fw[i] * c;
    denominator += d_bar[i] * (d_fw[i] - d_bar[i]) * c;
  }
  if (denominator == 0.0) return 0.0;
  return std::clamp(numerator / denominator, 0.0, kConjugateBetaMax);
}

LinkBasedSolver::LinkBasedSolver(Algorithm algorithm, CostModel model, LineSearchOptions line_search)
    : algorithm_(algorithm), model_(model), line_search_(line_search) {
  if (algorithm != Algorithm::MSA && algorithm != Algorithm::FrankWolfe &&
      algorithm != Algorithm::ConjugateFrankWolfe) {
    throw AlgorithmError("LinkBasedSolver: algorithm must be MSA, FW or CFW, got " + to_string(algorithm));
  }
}

void LinkBasedSolver::start(TransportNetwork& net) {
  net.reset_flow();
  update_link_costs(net, model_);
  conjugate_dir_.clear();
  prev_alpha_ = 1.0;
}

double LinkBasedSolver::step(TransportNetwork& net, std::int32_t iteration) {
  auto aon = all_or_nothing(net);
  std::vector<Flow>& x_bar = aon.aux_flow;
  auto links = net.links();
  const std::size_t m = links.size();

  if (algorithm_ == Algorithm::ConjugateFrankWolfe) {
    std::vector<Flow> d_fw(m);
    for (std::size_t i = 0; i < m; ++i) d_fw[i] = x_bar[i] - links[i].flow;
    if (iteration == 1 || conjugate_dir_.size() != m) {
      conjugate_dir_ = std::move(d_fw);
    } else {
      std::vector<Flow> d_bar(m);
      for (std::size_t i = 0; i < m; ++i) d_bar[i] = (1.0 - prev_alpha_) * conjugate_dir_[i];
      const double beta = conjugate_beta(net, model_, d_fw, d_bar);
      for (std::size_t i = 0; i < m; ++i) {
        conjugate_dir_[i] = d_fw[i] + beta * (d_bar[i] - d_fw[i]);
        x_bar[i] = links[i].flow + conjugate_dir_[i];
      }
    }
  }

  double alpha = 1.0;
  if (algorithm_ == Algorithm::MSA || iteration == 1) {
    alpha = msa_step(iteration);
  } else {
    alpha = frank_wolfe_step(net, model_, x_bar, line_search_);
  }

  for (std::size_t i = 0; i < m; ++i) {
    links[i].flow = std::max(0.0, alpha * x_bar[i] + (1.0 - alpha) * links[i].flow);
  }
  update_link_costs(net, model_);
  prev_alpha_ = alpha;
  return alpha;
}

} // namespace trafficeq::core
