// refiner/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for any AST node (used by `refinec dump-ast`).
//
#pragma once

#include <nlohmann/json.hpp>

#include "refiner/ast/ast.hpp"

namespace refiner
{

/**
 * Serialize an AST node to JSON.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program node including all its statements.
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace refiner
