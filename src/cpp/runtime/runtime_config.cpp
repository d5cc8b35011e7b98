#include <reflow/runtime/runtime_config.h>

#include <cstdlib>

namespace reflow {
    RuntimeConfig RuntimeConfig::from_environment() {
        RuntimeConfig config;
        config.trace = std::getenv("REFLOW_TRACE") != nullptr;
        if (const char *filter = std::getenv("REFLOW_TRACE_FILTER"); filter != nullptr && *filter != '\0') {
            config.trace = true;
            config.trace_filter = std::string{filter};
        }
        return config;
    }
} // namespace reflow
