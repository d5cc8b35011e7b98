/*
 * The public surface of reflow: the Runtime and the typed handles built on it.
 */

#ifndef REFLOW_H
#define REFLOW_H

#include <reflow/runtime/runtime.h>
#include <reflow/runtime/runtime_config.h>
#include <reflow/runtime/observers/runtime_observer.h>
#include <reflow/runtime/observers/runtime_profiler.h>
#include <reflow/runtime/observers/runtime_trace.h>

#include <reflow/api/batch.h>
#include <reflow/api/context.h>
#include <reflow/api/derived_signal.h>
#include <reflow/api/effect.h>
#include <reflow/api/memo.h>
#include <reflow/api/scope.h>
#include <reflow/api/signal.h>
#include <reflow/api/stored_value.h>
#include <reflow/api/trigger.h>
#include <reflow/api/watch.h>

#endif  // REFLOW_H
