// graph/graph.h - Umbrella header for the graph layer
// Part of the architectural statement engine (C++20)
//
// Model:       snapshot, runtime_graph, from_snapshot, weighted_graph
// Transforms:  transpose, filter_edge_types, coarsen
// Algorithms:  traverse, topological_sort, layer_violations,
//              strongly_connected_components, enumerate_cycles,
//              transitive_edges, detect_communities, compute_metrics,
//              hopcroft_karp

#ifndef ARCHGOV_GRAPH_GRAPH_H
#define ARCHGOV_GRAPH_GRAPH_H

#include "graph_concepts.h"
#include "snapshot.h"
#include "runtime_graph.h"
#include "from_snapshot.h"
#include "weighted_graph.h"

#include "transpose.h"
#include "edge_filter.h"
#include "coarsen.h"

#include "traversal.h"
#include "topological_sort.h"
#include "scc.h"
#include "cycles.h"
#include "transitive_reduction.h"
#include "community.h"
#include "metrics.h"
#include "bipartite_matching.h"

#endif // ARCHGOV_GRAPH_GRAPH_H
