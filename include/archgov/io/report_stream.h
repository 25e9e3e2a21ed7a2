// io/report_stream.h - Line-oriented text reports
// Part of the architectural statement engine (C++20)
//
// Writes verdicts, batch results and graph analyses to a caller-supplied
// stream.  Uses <ostream>, not <iostream>, so the engine never touches
// the standard streams itself.
//
// FORMAT: one record per line, fields separated by single spaces, keys
// written as stored.  Nested records of a statement are indented by two
// spaces.
//
//   status violated severity error
//   offending billing
//   edge billing ledger-db
//   note reach not stated; evaluated as direct
//   error syntax 9 -: unexpected end of expression

#ifndef ARCHGOV_IO_REPORT_STREAM_H
#define ARCHGOV_IO_REPORT_STREAM_H

#include <archgov/core/diagnostic.h>
#include <archgov/core/eval_stats.h>
#include <archgov/graph/community.h>
#include <archgov/graph/metrics.h>
#include <archgov/graph/runtime_graph.h>
#include <archgov/graph/scc.h>
#include <archgov/stmt/batch.h>
#include <archgov/stmt/evaluator.h>

#include <cstddef>
#include <ostream>
#include <string_view>

namespace archgov::io {

/// "error <kind> <position|-> <token|->: <message>"
inline void write(std::ostream& os, diagnostic const& d, std::string_view indent = {}) {
    os << indent << "error " << to_string(d.kind) << ' ';
    if (d.has_position()) os << d.position;
    else os << '-';
    os << ' ' << (d.token.empty() ? std::string_view("-") : std::string_view(d.token))
       << ": " << d.message << '\n';
}

inline void write(std::ostream& os, stmt::verdict const& v, std::string_view indent = {}) {
    os << indent << "status " << to_string(v.status)
       << " severity " << to_string(v.severity) << '\n';
    for (auto const& key : v.evidence.offending) os << indent << "offending " << key << '\n';
    for (auto const& [src, dst] : v.evidence.edges) {
        os << indent << "edge " << src << ' ' << dst << '\n';
    }
    for (auto const& note : v.evidence.notes) os << indent << "note " << note << '\n';
    for (auto const& d : v.errors) write(os, d, indent);
}

inline void write(std::ostream& os, eval_stats const& s) {
    os << "stats resolutions " << s.resolutions
       << " memo_hits " << s.memo_hits
       << " memo_misses " << s.memo_misses
       << " parsed " << s.statements_parsed
       << " evaluated " << s.statements_evaluated
       << " edges_scanned " << s.edges_scanned
       << " max_resolution_size " << s.max_resolution_size << '\n';
}

/// One block per statement, then a summary line and the stats line.
///
/// Output:
///   statement 0 formal containment must
///     status satisfied severity none
///   statement 1 informal unclassified none
///     status not_evaluated severity none
///     note statement is informal
///   summary 2 satisfied 1 violated 0 not_evaluated 1 warnings 0 errors 0
///   stats resolutions 2 ...
inline void write(std::ostream& os, stmt::batch_result const& b) {
    for (std::size_t i = 0; i < b.items.size(); ++i) {
        auto const& item = b.items[i];
        os << "statement " << i << ' ' << to_string(item.statement.classification) << ' '
           << to_string(item.statement.type) << ' ' << to_string(item.statement.modifier)
           << '\n';
        write(os, item.result, "  ");
    }
    os << "summary " << b.size()
       << " satisfied " << b.satisfied
       << " violated " << b.violated
       << " not_evaluated " << b.not_evaluated
       << " warnings " << b.warnings
       << " errors " << b.errors << '\n';
    write(os, b.stats);
}

/// Header line, then one row per node in key order.
inline void write(std::ostream& os, graph::metrics_table const& t) {
    os << "# key fan_in fan_out instability coupling degree betweenness closeness"
          " eigenvector dependency_types\n";
    for (auto const& m : t.nodes) {
        os << m.key << ' ' << m.fan_in << ' ' << m.fan_out << ' ' << m.instability << ' '
           << m.coupling << ' ' << m.degree_centrality << ' ' << m.betweenness << ' '
           << m.closeness << ' ' << m.eigenvector << ' ' << m.dependency_types << '\n';
    }
    if (!t.eigenvector_converged) {
        os << "# eigenvector not converged after " << t.eigenvector_iterations
           << " iterations\n";
    }
}

/// Components with their keys, then the condensed DAG.
///
/// Output:
///   components 2
///   component 0 size 3 external 1 cyclic: a b c
///   component 1 size 1 external 1: d
///   condensed 0 1 1
inline void write(std::ostream& os, graph::scc_result const& r) {
    os << "components " << r.component_count() << '\n';
    for (std::size_t c = 0; c < r.components.size(); ++c) {
        auto const& comp = r.components[c];
        os << "component " << c << " size " << comp.size()
           << " external " << comp.external_edges << (comp.is_cyclic() ? " cyclic" : "")
           << ':';
        for (auto const& key : comp.keys) os << ' ' << key;
        os << '\n';
    }
    for (auto const& e : r.condensed.edges) {
        os << "condensed " << e.src << ' ' << e.dst << ' ' << e.weight << '\n';
    }
}

/// Communities with their member keys.
inline void write(std::ostream& os, graph::community_result const& r,
                  graph::runtime_graph const& g) {
    os << "communities " << r.community_count << " modularity " << r.modularity << '\n';
    auto const members = r.members();
    for (std::size_t c = 0; c < members.size(); ++c) {
        os << "community " << c << ':';
        for (auto u : members[c]) os << ' ' << g.key(u);
        os << '\n';
    }
}

} // namespace archgov::io

#endif // ARCHGOV_IO_REPORT_STREAM_H
