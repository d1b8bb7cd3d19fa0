/**
 * @file graph_validator.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/common/pipeline_enums.hpp"
#include "dagcheck/common/pipeline_exceptions.hpp"
#include "dagcheck/common/pipeline_graph.hpp"
#include "dagcheck/common/validation_result.hpp"

#include <nlohmann/json.hpp>

namespace dagcheck
{

/**
 * @brief Decides whether a submitted pipeline is a well-formed DAG.
 *
 * @details
 * `GraphValidator` checks the shape of the submitted node and edge records
 * and then runs Kahn's algorithm over the resolved edges. It reports every
 * outcome that concerns the records themselves as a `ValidationResult`; only
 * input that is not a pair of lists is thrown as `PipelineError`.
 *
 * @par Order of checks
 * 1. Both inputs must be lists (`ShapeError` otherwise).
 * 2. Empty node list: `Empty` if there are no edges, else `EdgesWithoutNodes`.
 * 3. Record issues: `MalformedNode`, then `MalformedEdge`, then
 *    `DanglingReference`.
 * 4. No edges: `IsolatedNodes`.
 * 5. Kahn's algorithm: `Valid` if every node is processed, else `Cyclic`.
 *
 * @par Complexity
 * O(N + E) expected time and space.
 *
 * @par Thread safety
 * - Stateless; `validate()` may be called concurrently from any thread.
 */
class GraphValidator
{
public:
    /**
     * @brief Validate decoded node and edge lists.
     * @param nodes_raw Decoded value of the `nodes` field.
     * @param edges_raw Decoded value of the `edges` field.
     * @return The validation result.
     * @throw PipelineError with `ShapeError` if either value is not a list.
     */
    ValidationResult validate(const nlohmann::json& nodes_raw, const nlohmann::json& edges_raw) const;

    /**
     * @brief Validate an already shape-checked pipeline.
     * @param graph The typed pipeline.
     * @return The validation result.
     */
    ValidationResult validate(const PipelineGraph& graph) const;

private:
    /// Run Kahn's algorithm and fill in the acyclicity verdict.
    void check_acyclic(const PipelineGraph& graph, ValidationResult& result) const;
};

} // namespace dagcheck
