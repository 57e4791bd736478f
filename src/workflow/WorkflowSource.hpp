#pragma once

#include "workflow/Types.hpp"

namespace weft {
namespace workflow {

/**
 * Anything that can load the graph of a workflow by id
 */
class WorkflowSource {
public:
    virtual ~WorkflowSource() = default;

    /**
     * Nodes, edges and triggers of a workflow. Throws NotFoundError.
     */
    virtual WorkflowGraph loadGraph(int64_t workflowId) const = 0;
};

} // namespace workflow
} // namespace weft
