// archgov.h - Umbrella header for the architectural statement engine
// Part of the architectural statement engine (C++20)
//
// core:  diagnostics, eval_stats, limits, key_set
// graph: dependency graph model and algorithms
// ref:   tag store, layer index, reference definitions and resolution
// stmt:  statement parsing, evaluation, batches
// io:    text reports

#ifndef ARCHGOV_ARCHGOV_H
#define ARCHGOV_ARCHGOV_H

#include <archgov/core/diagnostic.h>
#include <archgov/core/eval_stats.h>
#include <archgov/core/key_set.h>
#include <archgov/core/limits.h>

#include <archgov/graph/graph.h>

#include <archgov/ref/context.h>
#include <archgov/ref/definition_parser.h>
#include <archgov/ref/resolver.h>

#include <archgov/stmt/batch.h>
#include <archgov/stmt/evaluator.h>
#include <archgov/stmt/parser.h>
#include <archgov/stmt/render.h>

#include <archgov/io/report_stream.h>

#endif // ARCHGOV_ARCHGOV_H
