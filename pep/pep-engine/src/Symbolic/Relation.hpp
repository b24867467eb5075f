// Ticket: 0002_symbolic_algebra

#ifndef PEP_ENGINE_SYMBOLIC_RELATION_HPP
#define PEP_ENGINE_SYMBOLIC_RELATION_HPP

namespace pep_engine
{

/// Relation between an affine form and its bound: form <= bound or form == bound
enum class Relation
{
  LessEqual,
  Equal
};

}  // namespace pep_engine

#endif  // PEP_ENGINE_SYMBOLIC_RELATION_HPP
