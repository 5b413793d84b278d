#pragma once
#include <ostream>
#include <string>
#include <vector>

namespace gcx::pddl {

struct TypedVar {
  std::string name;   // without the leading '?'
  std::string type;
};

// Predicate applied to arguments. Arguments starting with '?' are variables
// of the enclosing action, anything else is an object name.
struct Atom {
  std::string predicate;
  std::vector<std::string> args;
  bool negated = false;
};

struct TypeDecl {
  std::string name;
  std::string parent;   // empty: no supertype
};

struct PredicateDecl {
  std::string name;
  std::vector<TypedVar> params;
};

struct ActionSchema {
  std::string name;
  std::vector<TypedVar> params;
  std::vector<Atom> precondition;   // conjunction
  std::vector<Atom> effect;         // conjunction
};

enum class Connective { And, Or };

struct Condition {
  Connective op = Connective::And;
  std::vector<Atom> atoms;
};

struct ObjectGroup {
  std::string type;
  std::vector<std::string> names;
};

// Immutable once built; only DomainBuilder creates one.
class Domain {
public:
  const std::string& name() const { return name_; }
  const std::vector<std::string>& requirements() const { return requirements_; }
  const std::vector<TypeDecl>& types() const { return types_; }
  const std::vector<PredicateDecl>& predicates() const { return predicates_; }
  const std::vector<ActionSchema>& actions() const { return actions_; }

  bool has_type(const std::string& t) const;
  const PredicateDecl* predicate(const std::string& name) const;
  const ActionSchema* action(const std::string& name) const;

private:
  friend class DomainBuilder;
  std::string name_;
  std::vector<std::string> requirements_;
  std::vector<TypeDecl> types_;
  std::vector<PredicateDecl> predicates_;
  std::vector<ActionSchema> actions_;
};

class Problem {
public:
  const std::string& name() const { return name_; }
  const std::string& domain_name() const { return domain_name_; }
  const std::vector<ObjectGroup>& objects() const { return objects_; }
  const std::vector<Atom>& init() const { return init_; }
  const Condition& goal() const { return goal_; }

private:
  friend class ProblemBuilder;
  std::string name_;
  std::string domain_name_;
  std::vector<ObjectGroup> objects_;
  std::vector<Atom> init_;
  Condition goal_;
};

// Calls may come in any order; build() checks the document is complete and
// consistent and throws EncodingError otherwise.
class DomainBuilder {
public:
  explicit DomainBuilder(std::string name);

  DomainBuilder& requirement(std::string req);
  DomainBuilder& type(std::string name, std::string parent = {});
  DomainBuilder& predicate(std::string name, std::vector<TypedVar> params);
  DomainBuilder& action(ActionSchema a);

  Domain build() const;

private:
  Domain doc_;
};

class ProblemBuilder {
public:
  ProblemBuilder(std::string name, const Domain& domain);
  ProblemBuilder(std::string name, Domain&& domain) = delete;   // keeps a reference

  ProblemBuilder& objects(std::string type, std::vector<std::string> names);
  ProblemBuilder& fact(Atom a);
  ProblemBuilder& goal(Condition c);

  Problem build() const;

private:
  const Domain& domain_;
  Problem doc_;
  bool goal_set_{false};
};

void write_domain(std::ostream& os, const Domain& d);
void write_problem(std::ostream& os, const Problem& p);
std::string to_pddl(const Domain& d);
std::string to_pddl(const Problem& p);

// "(at pt0pt0 0 agent1)" / "(not (blocked pt1pt0 2))"
std::string format_atom(const Atom& a);

} // namespace gcx::pddl
