#include <gcx/pddl.hpp>
#include <gcx/errors.hpp>
#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace gcx::pddl {

bool Domain::has_type(const std::string& t) const {
  if (t == "object") return true;
  return std::any_of(types_.begin(), types_.end(), [&](const TypeDecl& d){ return d.name == t; });
}

const PredicateDecl* Domain::predicate(const std::string& name) const {
  for (const auto& p : predicates_) if (p.name == name) return &p;
  return nullptr;
}

const ActionSchema* Domain::action(const std::string& name) const {
  for (const auto& a : actions_) if (a.name == name) return &a;
  return nullptr;
}

// ---- DomainBuilder ----

DomainBuilder::DomainBuilder(std::string name) { doc_.name_ = std::move(name); }

DomainBuilder& DomainBuilder::requirement(std::string req) {
  doc_.requirements_.push_back(std::move(req));
  return *this;
}

DomainBuilder& DomainBuilder::type(std::string name, std::string parent) {
  doc_.types_.push_back(TypeDecl{std::move(name), std::move(parent)});
  return *this;
}

DomainBuilder& DomainBuilder::predicate(std::string name, std::vector<TypedVar> params) {
  doc_.predicates_.push_back(PredicateDecl{std::move(name), std::move(params)});
  return *this;
}

DomainBuilder& DomainBuilder::action(ActionSchema a) {
  doc_.actions_.push_back(std::move(a));
  return *this;
}

static void check_params(const Domain& d, const std::string& owner, const std::vector<TypedVar>& params) {
  for (const auto& p : params) {
    if (p.name.empty()) throw EncodingError(owner + ": parameter without a name");
    if (!d.has_type(p.type)) throw EncodingError(owner + ": undeclared type '" + p.type + "'");
  }
}

static void check_atom(const Domain& d, const ActionSchema& a, const Atom& atom) {
  const auto* pred = d.predicate(atom.predicate);
  if (!pred) {
    throw EncodingError("action " + a.name + ": undeclared predicate '" + atom.predicate + "'");
  }
  if (pred->params.size() != atom.args.size()) {
    throw EncodingError("action " + a.name + ": '" + atom.predicate + "' expects " +
                        std::to_string(pred->params.size()) + " arguments");
  }
  for (const auto& arg : atom.args) {
    if (arg.empty() || arg[0] != '?') continue;
    const auto var = arg.substr(1);
    const bool bound = std::any_of(a.params.begin(), a.params.end(),
                                   [&](const TypedVar& p){ return p.name == var; });
    if (!bound) throw EncodingError("action " + a.name + ": unbound variable " + arg);
  }
}

Domain DomainBuilder::build() const {
  const Domain& d = doc_;
  if (d.name_.empty()) throw EncodingError("domain without a name");
  if (d.types_.empty()) throw EncodingError("domain " + d.name_ + " declares no types");
  if (d.predicates_.empty()) throw EncodingError("domain " + d.name_ + " declares no predicates");
  if (d.actions_.empty()) throw EncodingError("domain " + d.name_ + " declares no actions");

  std::unordered_set<std::string> seen;
  for (const auto& t : d.types_) {
    if (!seen.insert(t.name).second) throw EncodingError("duplicate type '" + t.name + "'");
  }
  for (const auto& t : d.types_) {
    if (!t.parent.empty() && !d.has_type(t.parent)) {
      throw EncodingError("type '" + t.name + "' has undeclared parent '" + t.parent + "'");
    }
  }

  seen.clear();
  for (const auto& p : d.predicates_) {
    if (!seen.insert(p.name).second) throw EncodingError("duplicate predicate '" + p.name + "'");
    check_params(d, "predicate " + p.name, p.params);
  }

  seen.clear();
  for (const auto& a : d.actions_) {
    if (!seen.insert(a.name).second) throw EncodingError("duplicate action '" + a.name + "'");
    check_params(d, "action " + a.name, a.params);
    if (a.effect.empty()) throw EncodingError("action " + a.name + " has no effect");
    for (const auto& atom : a.precondition) check_atom(d, a, atom);
    for (const auto& atom : a.effect) check_atom(d, a, atom);
  }
  return d;
}

// ---- ProblemBuilder ----

ProblemBuilder::ProblemBuilder(std::string name, const Domain& domain) : domain_(domain) {
  doc_.name_ = std::move(name);
  doc_.domain_name_ = domain.name();
}

ProblemBuilder& ProblemBuilder::objects(std::string type, std::vector<std::string> names) {
  doc_.objects_.push_back(ObjectGroup{std::move(type), std::move(names)});
  return *this;
}

ProblemBuilder& ProblemBuilder::fact(Atom a) {
  doc_.init_.push_back(std::move(a));
  return *this;
}

ProblemBuilder& ProblemBuilder::goal(Condition c) {
  doc_.goal_ = std::move(c);
  goal_set_ = true;
  return *this;
}

Problem ProblemBuilder::build() const {
  const Problem& p = doc_;
  if (p.name_.empty()) throw EncodingError("problem without a name");

  std::unordered_set<std::string> objects;
  for (const auto& g : p.objects_) {
    if (!domain_.has_type(g.type)) {
      throw EncodingError("problem " + p.name_ + ": objects of undeclared type '" + g.type + "'");
    }
    for (const auto& n : g.names) {
      if (!objects.insert(n).second) throw EncodingError("problem " + p.name_ + ": duplicate object '" + n + "'");
    }
  }

  auto check = [&](const Atom& a, const char* where) {
    const auto* pred = domain_.predicate(a.predicate);
    if (!pred) {
      throw EncodingError(std::string(where) + ": undeclared predicate '" + a.predicate + "'");
    }
    if (pred->params.size() != a.args.size()) {
      throw EncodingError(std::string(where) + ": " + format_atom(a) + " has wrong arity");
    }
    for (const auto& arg : a.args) {
      if (!objects.count(arg)) {
        throw EncodingError(std::string(where) + ": " + format_atom(a) + " names unknown object '" + arg + "'");
      }
    }
  };

  for (const auto& a : p.init_) check(a, "init");
  if (!goal_set_ || p.goal_.atoms.empty()) throw EncodingError("problem " + p.name_ + " has no goal");
  for (const auto& a : p.goal_.atoms) check(a, "goal");
  return p;
}

// ---- Serialization ----

std::string format_atom(const Atom& a) {
  std::string s = "(" + a.predicate;
  for (const auto& arg : a.args) {
    s.push_back(' ');
    s += arg;
  }
  s.push_back(')');
  if (a.negated) return "(not " + s + ")";
  return s;
}

static void write_params(std::ostream& os, const std::vector<TypedVar>& params) {
  for (const auto& p : params) os << " ?" << p.name << " - " << p.type;
}

static void write_conjunction(std::ostream& os, const std::vector<Atom>& atoms) {
  if (atoms.size() == 1) {
    os << format_atom(atoms.front());
    return;
  }
  os << "(and";
  for (const auto& a : atoms) os << ' ' << format_atom(a);
  os << ')';
}

void write_domain(std::ostream& os, const Domain& d) {
  os << "(define (domain " << d.name() << ")\n";
  if (!d.requirements().empty()) {
    os << "(:requirements";
    for (const auto& r : d.requirements()) os << ' ' << r;
    os << ")\n";
  }

  os << "(:types\n";
  for (const auto& t : d.types()) {
    os << "  " << t.name;
    if (!t.parent.empty()) os << " - " << t.parent;
    os << '\n';
  }
  os << ")\n";

  os << "(:predicates\n";
  for (const auto& p : d.predicates()) {
    os << "  (" << p.name;
    write_params(os, p.params);
    os << ")\n";
  }
  os << ")\n";

  for (const auto& a : d.actions()) {
    os << "(:action " << a.name << '\n';
    os << "  :parameters (";
    write_params(os, a.params);
    os << ")\n";
    if (!a.precondition.empty()) {
      os << "  :precondition ";
      write_conjunction(os, a.precondition);
      os << '\n';
    }
    os << "  :effect ";
    write_conjunction(os, a.effect);
    os << "\n)\n";
  }
  os << ")\n";
}

void write_problem(std::ostream& os, const Problem& p) {
  os << "(define (problem " << p.name() << ")\n";
  os << "(:domain " << p.domain_name() << ")\n";

  os << "(:objects\n";
  for (const auto& g : p.objects()) {
    if (g.names.empty()) continue;
    os << ' ';
    for (const auto& n : g.names) os << ' ' << n;
    os << " - " << g.type << '\n';
  }
  os << ")\n";

  os << "(:init\n";
  for (const auto& a : p.init()) os << "  " << format_atom(a) << '\n';
  os << ")\n";

  const auto& g = p.goal();
  os << "(:goal ";
  if (g.atoms.size() == 1) {
    os << format_atom(g.atoms.front());
  } else {
    os << (g.op == Connective::Or ? "(or" : "(and");
    for (const auto& a : g.atoms) os << "\n  " << format_atom(a);
    os << ')';
  }
  os << ")\n)\n";
}

std::string to_pddl(const Domain& d) {
  std::ostringstream ss;
  write_domain(ss, d);
  return ss.str();
}

std::string to_pddl(const Problem& p) {
  std::ostringstream ss;
  write_problem(ss, p);
  return ss.str();
}

} // namespace gcx::pddl
