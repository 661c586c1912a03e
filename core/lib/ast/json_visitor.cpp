// refiner/ast/json_visitor.cpp - JSON serialization implementation
//
#include "refiner/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_enums.hpp"
#include "refiner/basic/casting.hpp"
#include "refiner/basic/source_manager.hpp"

namespace refiner
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_node(const AstNode * n, std::string_view type)
{
  return json{{"type", std::string(type)}, {"range", j_range(n->get_range())}};
}

json j_expr(const Expr * e);
json j_stmt(const Stmt * s);

template <typename Span>
json j_exprs(const Span & exprs)
{
  json arr = json::array();
  for (const auto * e : exprs) {
    // Array holes serialize as null
    arr.push_back(e ? j_expr(e) : json(nullptr));
  }
  return arr;
}

json j_property(const Property * p)
{
  json j = j_node(p, "Property");
  j["key"] = j_expr(p->key);
  j["value"] = j_expr(p->value);
  j["computed"] = p->computed;
  j["shorthand"] = p->shorthand;
  return j;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  switch (e->get_kind()) {
    case NodeKind::StringLiteral: {
      json j = j_node(e, "StringLiteral");
      j["value"] = std::string(cast<StringLiteral>(e)->value);
      return j;
    }
    case NodeKind::NumberLiteral: {
      json j = j_node(e, "NumberLiteral");
      j["value"] = cast<NumberLiteral>(e)->value;
      return j;
    }
    case NodeKind::BigIntLiteral: {
      json j = j_node(e, "BigIntLiteral");
      j["digits"] = std::string(cast<BigIntLiteral>(e)->digits);
      return j;
    }
    case NodeKind::BoolLiteral: {
      json j = j_node(e, "BoolLiteral");
      j["value"] = cast<BoolLiteral>(e)->value;
      return j;
    }
    case NodeKind::NullLiteral:
      return j_node(e, "NullLiteral");
    case NodeKind::RegExpLiteral: {
      const auto * re = cast<RegExpLiteral>(e);
      json j = j_node(e, "RegExpLiteral");
      j["pattern"] = std::string(re->pattern);
      j["flags"] = std::string(re->flags);
      return j;
    }
    case NodeKind::TemplateLiteral: {
      const auto * tl = cast<TemplateLiteral>(e);
      json quasis = json::array();
      for (const auto & q : tl->quasis) {
        json jq{{"raw", std::string(q.raw)}};
        jq["cooked"] = q.cooked ? json(std::string(*q.cooked)) : json(nullptr);
        quasis.push_back(std::move(jq));
      }
      json j = j_node(e, "TemplateLiteral");
      j["quasis"] = std::move(quasis);
      j["expressions"] = j_exprs(tl->expressions);
      return j;
    }
    case NodeKind::Identifier: {
      json j = j_node(e, "Identifier");
      j["name"] = std::string(cast<Identifier>(e)->name);
      return j;
    }
    case NodeKind::ThisExpr:
      return j_node(e, "ThisExpr");
    case NodeKind::ObjectExpr: {
      json props = json::array();
      for (const auto * entry : cast<ObjectExpr>(e)->properties) {
        if (const auto * p = dyn_cast<Property>(entry)) {
          props.push_back(j_property(p));
        } else {
          props.push_back(j_expr(cast<Expr>(entry)));
        }
      }
      json j = j_node(e, "ObjectExpr");
      j["properties"] = std::move(props);
      return j;
    }
    case NodeKind::ArrayExpr: {
      json j = j_node(e, "ArrayExpr");
      j["elements"] = j_exprs(cast<ArrayExpr>(e)->elements);
      return j;
    }
    case NodeKind::SpreadElement: {
      json j = j_node(e, "SpreadElement");
      j["argument"] = j_expr(cast<SpreadElement>(e)->argument);
      return j;
    }
    case NodeKind::CallExpr: {
      const auto * call = cast<CallExpr>(e);
      json j = j_node(e, "CallExpr");
      j["callee"] = j_expr(call->callee);
      j["arguments"] = j_exprs(call->args);
      j["optional"] = call->optional;
      return j;
    }
    case NodeKind::NewExpr: {
      const auto * ne = cast<NewExpr>(e);
      json j = j_node(e, "NewExpr");
      j["callee"] = j_expr(ne->callee);
      j["arguments"] = j_exprs(ne->args);
      return j;
    }
    case NodeKind::MemberExpr: {
      const auto * m = cast<MemberExpr>(e);
      json j = j_node(e, "MemberExpr");
      j["object"] = j_expr(m->object);
      j["property"] = j_expr(m->property);
      j["computed"] = m->computed;
      j["optional"] = m->optional;
      return j;
    }
    case NodeKind::UnaryExpr: {
      const auto * u = cast<UnaryExpr>(e);
      json j = j_node(e, "UnaryExpr");
      j["op"] = std::string(to_string(u->op));
      j["operand"] = j_expr(u->operand);
      return j;
    }
    case NodeKind::BinaryExpr: {
      const auto * b = cast<BinaryExpr>(e);
      json j = j_node(e, "BinaryExpr");
      j["op"] = std::string(to_string(b->op));
      j["lhs"] = j_expr(b->lhs);
      j["rhs"] = j_expr(b->rhs);
      return j;
    }
    case NodeKind::ConditionalExpr: {
      const auto * c = cast<ConditionalExpr>(e);
      json j = j_node(e, "ConditionalExpr");
      j["test"] = j_expr(c->test);
      j["consequent"] = j_expr(c->consequent);
      j["alternate"] = j_expr(c->alternate);
      return j;
    }
    case NodeKind::AssignExpr: {
      const auto * a = cast<AssignExpr>(e);
      json j = j_node(e, "AssignExpr");
      j["op"] = std::string(to_string(a->op));
      j["target"] = j_expr(a->target);
      j["value"] = j_expr(a->value);
      return j;
    }
    case NodeKind::ArrowFunctionExpr: {
      const auto * fn = cast<ArrowFunctionExpr>(e);
      json j = j_node(e, "ArrowFunctionExpr");
      j["params"] = j_exprs(fn->params);
      j["async"] = fn->is_async;
      j["body"] = fn->expr_body ? j_expr(fn->expr_body) : j_stmt(fn->block_body);
      return j;
    }
    case NodeKind::MissingExpr:
      return j_node(e, "MissingExpr");
    default:
      break;
  }
  return j_node(e, "UnknownExpr");
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (!s) return json(nullptr);

  switch (s->get_kind()) {
    case NodeKind::RawStmt: {
      json j = j_node(s, "RawStmt");
      j["text"] = std::string(cast<RawStmt>(s)->text);
      return j;
    }
    case NodeKind::VarDecl: {
      const auto * vd = cast<VarDecl>(s);
      json decls = json::array();
      for (const auto * d : vd->declarators) {
        json jd = j_node(d, "VarDeclarator");
        jd["target"] = j_expr(d->target);
        jd["init"] = d->init ? j_expr(d->init) : json(nullptr);
        decls.push_back(std::move(jd));
      }
      json j = j_node(s, "VarDecl");
      j["kind"] = std::string(to_string(vd->var_kind));
      j["exported"] = vd->exported;
      j["declarators"] = std::move(decls);
      return j;
    }
    case NodeKind::FunctionDecl: {
      const auto * fn = cast<FunctionDecl>(s);
      json j = j_node(s, "FunctionDecl");
      j["name"] = std::string(fn->name);
      j["params"] = j_exprs(fn->params);
      j["exported"] = fn->exported;
      j["default"] = fn->is_default;
      j["async"] = fn->is_async;
      j["body"] = j_stmt(fn->body);
      return j;
    }
    case NodeKind::ReturnStmt: {
      const auto * r = cast<ReturnStmt>(s);
      json j = j_node(s, "ReturnStmt");
      j["argument"] = r->argument ? j_expr(r->argument) : json(nullptr);
      return j;
    }
    case NodeKind::IfStmt: {
      const auto * is = cast<IfStmt>(s);
      json j = j_node(s, "IfStmt");
      j["test"] = j_expr(is->test);
      j["consequent"] = j_stmt(is->consequent);
      j["alternate"] = j_stmt(is->alternate);
      return j;
    }
    case NodeKind::BlockStmt: {
      json body = json::array();
      for (const auto * child : cast<BlockStmt>(s)->body) {
        body.push_back(j_stmt(child));
      }
      json j = j_node(s, "BlockStmt");
      j["body"] = std::move(body);
      return j;
    }
    case NodeKind::ThrowStmt: {
      json j = j_node(s, "ThrowStmt");
      j["argument"] = j_expr(cast<ThrowStmt>(s)->argument);
      return j;
    }
    case NodeKind::ExprStmt: {
      json j = j_node(s, "ExprStmt");
      j["expr"] = j_expr(cast<ExprStmt>(s)->expr);
      return j;
    }
    case NodeKind::ExportDefaultStmt: {
      json j = j_node(s, "ExportDefaultStmt");
      j["expr"] = j_expr(cast<ExportDefaultStmt>(s)->expr);
      return j;
    }
    default:
      break;
  }
  return j_node(s, "UnknownStmt");
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const Program * program)
{
  if (!program) return nullptr;

  json body = json::array();
  for (const auto * s : program->body) {
    body.push_back(j_stmt(s));
  }
  json j = j_node(program, "Program");
  j["body"] = std::move(body);
  return j;
}

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nullptr;

  if (const auto * p = dyn_cast<Program>(node)) return to_json(p);
  if (const auto * p = dyn_cast<Property>(node)) return j_property(p);
  if (const auto * e = dyn_cast<Expr>(node)) return j_expr(e);
  if (const auto * s = dyn_cast<Stmt>(node)) return j_stmt(s);
  if (const auto * d = dyn_cast<VarDeclarator>(node)) {
    json j = j_node(d, "VarDeclarator");
    j["target"] = j_expr(d->target);
    j["init"] = d->init ? j_expr(d->init) : json(nullptr);
    return j;
  }
  return json{{"type", "Unknown"}, {"range", j_range(node->get_range())}};
}

}  // namespace refiner
