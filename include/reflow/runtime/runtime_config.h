#ifndef REFLOW_RUNTIME_CONFIG_H
#define REFLOW_RUNTIME_CONFIG_H

#include <reflow/reflow_base.h>
#include <reflow/runtime/observers/runtime_observer.h>

namespace reflow {
    /**
     * Construction options of a Runtime.
     */
    struct REFLOW_EXPORT RuntimeConfig {
        // Registered when the Runtime is constructed
        std::vector<RuntimeObserver::s_ptr> observers;

        // Installs a RuntimeTrace writing to std::cerr
        bool trace{false};

        // Only trace nodes whose name contains this text
        std::optional<std::string> trace_filter;

        /**
         * Reads the REFLOW_TRACE and REFLOW_TRACE_FILTER environment variables. REFLOW_TRACE enables the trace when
         * it is set to anything, REFLOW_TRACE_FILTER implies REFLOW_TRACE.
         */
        static RuntimeConfig from_environment();
    };
} // namespace reflow

#endif  // REFLOW_RUNTIME_CONFIG_H
