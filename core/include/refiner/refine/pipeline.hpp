// refiner/refine/pipeline.hpp - Per-call-site refinement and program walk
//
// For each matched call site: extract static props, validate them, plan
// diff/derive/prune patches, consolidate, guard preserved keys, and apply
// the result to the props literal in place.
//
#pragma once

#include <functional>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_context.hpp"
#include "refiner/refine/callsite_resolver.hpp"
#include "refiner/refine/error.hpp"
#include "refiner/refine/property_path.hpp"
#include "refiner/refine/rule.hpp"

namespace refiner
{

struct RefineOptions
{
  /// Keys whose subtrees are owned by the runtime and never rewritten.
  PreservedKeySet preserved_keys = {"children"};

  /// When false, call sites are validated but never rewritten.
  bool apply_transforms = true;
};

/**
 * Refine one call site.
 *
 * @return true when patches were applied to the props literal
 * @throws RefineError subclasses for any configuration, validation,
 *         encoding or patch-application failure
 */
bool process_component(
  const ComponentMatch & match, const RefineOptions & options, AstContext & ast);

/**
 * Receives a failure at one call site. Return true to keep walking the
 * program, false to stop.
 */
using CallSiteErrorHandler =
  std::function<bool(const ComponentMatch & match, const RefineError & error)>;

/**
 * Refine every registered component call site in `program`.
 *
 * Calls are visited depth-first, an enclosing call site before the call
 * sites nested in its arguments.
 *
 * @param on_error Failure sink; when empty, the first failure propagates
 * @return number of call sites that were rewritten
 */
size_t refine_program(
  Program * program, AstContext & ast, const RuleRegistry & registry,
  const RefineOptions & options, const CallSiteErrorHandler & on_error = {});

}  // namespace refiner
