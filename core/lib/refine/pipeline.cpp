// refiner/refine/pipeline.cpp - Per-call-site refinement and program walk
#include "refiner/refine/pipeline.hpp"

#include "refiner/ast/visitor.hpp"
#include "refiner/refine/consolidate.hpp"
#include "refiner/refine/derive_patches.hpp"
#include "refiner/refine/extractor.hpp"
#include "refiner/refine/patch_guards.hpp"
#include "refiner/refine/patch_planner.hpp"
#include "refiner/refine/prune_patches.hpp"
#include "refiner/refine/report.hpp"
#include "refiner/refine/tree_patcher.hpp"
#include "refiner/refine/validator.hpp"

namespace refiner
{

bool process_component(
  const ComponentMatch & match, const RefineOptions & options, AstContext & ast)
{
  if (!match.props || !match.rule) return false;
  const ComponentRule & rule = *match.rule;

  // 1. Extract
  PreservedExpressions preserved;
  ExtractOptions extract_options;
  extract_options.preserved_keys = options.preserved_keys;
  extract_options.preserved_expressions = &preserved;
  const Value extracted =
    extract_static_props(match.props, extract_options).value_or(Value::make_null());

  // 2. Validate
  const Value validated = validate_with_schema(rule.schema.get(), extracted, match.component);
  if (!options.apply_transforms) return false;

  // 3. Plan
  std::vector<PatchGroup> groups;
  groups.push_back(
    {PatchPhase::Diff, calculate_patches(extracted, validated, options.preserved_keys)});
  groups.push_back({PatchPhase::Derive, collect_derive_patches(rule.derive, validated)});
  groups.push_back(
    {PatchPhase::Prune,
     plan_prune_patches(
       extracted, rule.prune_keys.value_or(std::vector<std::string>{}), options.preserved_keys)});

  const ConsolidatedPatches consolidated = consolidate_patches(groups);

  PreservationCheckOptions guard_options;
  guard_options.scope = GuardScope::RootOnly;
  guard_options.key_type_label = "preserved";
  assert_patches_respect_preservation(
    consolidated.patches, options.preserved_keys, match.component, guard_options);

  if (consolidated.patches.empty()) return false;

  // 4. Apply
  const ExpressionRefResolver resolver = [&preserved](const Value & ref) {
    return preserved.resolve(ref);
  };
  const ApplyPatchesResult result =
    apply_patches(ast, match.props, consolidated.patches, options.preserved_keys, resolver);

  // 5. Report
  if (result.first_unapplied_path_key) {
    PatchReportOptions report;
    report.component = match.component;
    report.phase_of = [&consolidated](const std::string & key) {
      return consolidated.phase_of(key);
    };
    report.summary.remaining_set_path_keys = result.remaining_set_path_keys;
    report.summary.remaining_delete_path_keys = result.remaining_delete_path_keys;
    report_patch_failure(*result.first_unapplied_path_key, report);
  }
  return true;
}

namespace
{

class CallSiteWalker : public RecursiveAstVisitor<CallSiteWalker>
{
public:
  CallSiteWalker(
    AstContext & ast, const RuleRegistry & registry, const RefineOptions & options,
    const CallSiteErrorHandler & on_error)
  : ast_(ast), registry_(registry), options_(options), on_error_(on_error)
  {
  }

  [[nodiscard]] size_t modified() const noexcept { return modified_; }

  bool visit_call_expr(CallExpr * node)
  {
    std::optional<ComponentMatch> match;
    try {
      match = resolve_component_match(node, registry_);
      if (match && process_component(*match, options_, ast_)) ++modified_;
    } catch (const RefineError & e) {
      if (!on_error_) throw;
      ComponentMatch where = match.value_or(ComponentMatch{});
      where.call = node;
      if (!on_error_(where, e)) return false;
    }
    return RecursiveAstVisitor::visit_call_expr(node);
  }

private:
  AstContext & ast_;
  const RuleRegistry & registry_;
  const RefineOptions & options_;
  const CallSiteErrorHandler & on_error_;
  size_t modified_ = 0;
};

}  // namespace

size_t refine_program(
  Program * program, AstContext & ast, const RuleRegistry & registry,
  const RefineOptions & options, const CallSiteErrorHandler & on_error)
{
  if (!program) return 0;
  CallSiteWalker walker(ast, registry, options, on_error);
  walker.visit(program);
  return walker.modified();
}

}  // namespace refiner
