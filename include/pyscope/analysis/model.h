/***
 * Name: pyscope::analysis (model)
 * Purpose: The structural model of one analyzed module: declarations, imports
 *   and the raw call graph. Built fresh per analysis, consumed by renderers.
 * Inputs: Populated by StructuralExtractor
 * Outputs: Read by the text renderer and the graph model builder
 * Theory of Operation: Plain value types with defaulted equality so two
 *   analyses of the same file compare equal. Sequences keep definition
 *   order; the call graph is ordered (std::map/std::set) so iteration is
 *   deterministic.
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pyscope {
namespace analysis {

/*** Variable: global variable or class attribute. */
struct Variable {
  std::string name;
  std::optional<std::string> annotation;
  std::optional<std::string> value;  // absent for `x: int` without a value

  bool operator==(const Variable&) const = default;
};

/*** FunctionRecord: one def (sync or async), global function or method. */
struct FunctionRecord {
  std::string name;
  std::vector<std::string> args;  // "name[: annotation][=default]", "*a", "**kw"
  std::optional<std::string> docstring;
  std::optional<std::string> return_annotation;  // annotation text without " -> "
  std::vector<std::string> decorators;
  bool is_async{false};

  bool operator==(const FunctionRecord&) const = default;
};

struct ClassRecord {
  std::string name;
  std::vector<std::string> bases;
  std::optional<std::string> docstring;
  std::vector<std::string> decorators;
  std::vector<Variable> attributes;
  std::vector<FunctionRecord> methods;

  bool operator==(const ClassRecord&) const = default;
};

struct Imports {
  std::vector<std::string> direct;  // import a.b
  std::vector<std::string> from;    // from a import b -> "a.b"

  bool operator==(const Imports&) const = default;
};

/***
 * Name: pyscope::analysis::CalleeDescriptor
 * Purpose: Target of an edge leaving a scope: a resolved callee or a
 *   synthetic control-flow marker (condition, for loop, while loop).
 * Theory of Operation: Ordered by (label, kind) so sorted output is
 *   lexicographic by display label.
 */
enum class CalleeKind { Call, Condition, ForLoop, WhileLoop };

struct CalleeDescriptor {
  CalleeKind kind{CalleeKind::Call};
  std::string text;

  /*** label: text for calls, "Condition: x" / "For Loop: x" / "While Loop: x" otherwise. */
  std::string label() const;
  bool synthetic() const { return kind != CalleeKind::Call; }

  bool operator==(const CalleeDescriptor&) const = default;
  bool operator<(const CalleeDescriptor& other) const;
};

/***
 * Name: pyscope::analysis::CallGraph
 * Purpose: Mapping scope id -> set of callee descriptors.
 */
class CallGraph {
 public:
  using CalleeSet = std::set<CalleeDescriptor>;

  /*** insert: get the callee set for scope_id, creating it when absent. */
  CalleeSet& insert(const std::string& scope_id);
  void add(const std::string& scope_id, CalleeDescriptor callee) { insert(scope_id).insert(std::move(callee)); }

  /*** find: callee set for scope_id or nullptr. */
  const CalleeSet* find(const std::string& scope_id) const;
  const std::map<std::string, CalleeSet>& entries() const { return edges_; }
  std::size_t edgeCount() const;

  bool operator==(const CallGraph&) const = default;

 private:
  std::map<std::string, CalleeSet> edges_;
};

/*** Structure: everything one analysis pass knows about a module. */
struct Structure {
  std::string module_name;
  std::vector<Variable> global_variables;
  std::vector<FunctionRecord> functions;
  std::vector<ClassRecord> classes;  // every class, nested ones included, in source order
  Imports imports;
  CallGraph calls;

  bool operator==(const Structure&) const = default;
};

}  // namespace analysis
}  // namespace pyscope
