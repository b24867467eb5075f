// Ticket: 0006_sdp_lowering

#include "pep-engine/src/Problem/SdpLowering.hpp"

#include <stdexcept>
#include <utility>

namespace pep_engine
{

LinearForm SdpLowering::lowerExpression(const Expression& expression,
                                        const BasisRegistry& registry,
                                        Eigen::Index valueSize)
{
  const auto n = static_cast<Eigen::Index>(registry.pointDimension());

  std::vector<Eigen::Triplet<double>> triplets;
  triplets.reserve(2 * expression.bilinearTerms().size());
  for (const auto& [pair, coefficient] : expression.bilinearTerms())
  {
    const auto i = static_cast<Eigen::Index>(registry.pointRow(pair.first));
    const auto j = static_cast<Eigen::Index>(registry.pointRow(pair.second));
    if (i == j)
    {
      triplets.emplace_back(i, i, coefficient);
    }
    else
    {
      triplets.emplace_back(i, j, 0.5 * coefficient);
      triplets.emplace_back(j, i, 0.5 * coefficient);
    }
  }

  LinearForm form;
  form.gram.resize(n, n);
  form.gram.setFromTriplets(triplets.begin(), triplets.end());
  form.values = Eigen::VectorXd::Zero(valueSize);
  for (const auto& [id, coefficient] : expression.linearTerms())
  {
    form.values(static_cast<Eigen::Index>(registry.valueRow(id))) +=
      coefficient;
  }
  return form;
}

SdpRow SdpLowering::lowerConstraint(const Constraint& constraint,
                                    const BasisRegistry& registry,
                                    Eigen::Index valueSize)
{
  SdpRow row;
  row.form = lowerExpression(constraint.expression, registry, valueSize);
  row.relation = constraint.relation;
  row.bound = constraint.bound - constraint.expression.constantTerm();
  return row;
}

LoweredProblem SdpLowering::build(
  const BasisRegistry& registry,
  const std::vector<Constraint>& initialConditions,
  const std::vector<Constraint>& userConstraints,
  std::vector<Constraint> interpolationConstraints,
  const std::vector<Expression>& metrics)
{
  if (metrics.empty())
  {
    throw std::logic_error{
      "SdpLowering::build: no performance metric has been set"};
  }

  LoweredProblem lowered;
  lowered.auxiliaryTau = metrics.size() > 1;

  const auto n = static_cast<Eigen::Index>(registry.pointDimension());
  const auto m = static_cast<Eigen::Index>(registry.valueDimension());
  const Eigen::Index valueSize = lowered.auxiliaryTau ? m + 1 : m;

  SdpProblem& sdp = lowered.sdp;
  sdp.gramSize = n;
  sdp.valueSize = valueSize;
  sdp.maximize = true;

  const std::size_t rowCount = initialConditions.size() +
                               userConstraints.size() +
                               interpolationConstraints.size() +
                               (lowered.auxiliaryTau ? metrics.size() : 0);
  sdp.rows.reserve(rowCount);
  lowered.rowTags.reserve(rowCount);

  auto append = [&](const Constraint& constraint)
  {
    sdp.rows.push_back(lowerConstraint(constraint, registry, valueSize));
    lowered.rowTags.push_back(constraint.tag);
  };

  for (const auto& constraint : initialConditions)
  {
    append(constraint);
  }
  for (const auto& constraint : userConstraints)
  {
    append(constraint);
  }
  for (const auto& constraint : interpolationConstraints)
  {
    append(constraint);
  }

  if (lowered.auxiliaryTau)
  {
    // maximize tau s.t. tau - metric_k <= 0
    sdp.objective.gram.resize(n, n);
    sdp.objective.values = Eigen::VectorXd::Zero(valueSize);
    sdp.objective.values(m) = 1.0;
    for (std::size_t k = 0; k < metrics.size(); ++k)
    {
      const LinearForm metricForm =
        lowerExpression(metrics[k], registry, valueSize);
      SdpRow row;
      row.form.gram = -metricForm.gram;
      row.form.values = -metricForm.values;
      row.form.values(m) += 1.0;
      row.relation = Relation::LessEqual;
      row.bound = metrics[k].constantTerm();
      sdp.rows.push_back(std::move(row));

      ConstraintTag tag;
      tag.origin = ConstraintOrigin::PerformanceMetric;
      tag.i = k;
      lowered.rowTags.push_back(std::move(tag));
    }
  }
  else
  {
    sdp.objective = lowerExpression(metrics.front(), registry, valueSize);
    sdp.objectiveConstant = metrics.front().constantTerm();
  }

  ProblemDiagnostics& diagnostics = lowered.diagnostics;
  diagnostics.gramSize = static_cast<std::size_t>(n);
  diagnostics.valueSize = static_cast<std::size_t>(m);
  diagnostics.metricCount = metrics.size();
  diagnostics.initialConditionCount = initialConditions.size();
  diagnostics.userConstraintCount = userConstraints.size();
  diagnostics.interpolationConstraintCount = interpolationConstraints.size();
  diagnostics.rowCount = sdp.rows.size();

  lowered.interpolationConstraints = std::move(interpolationConstraints);
  return lowered;
}

}  // namespace pep_engine
