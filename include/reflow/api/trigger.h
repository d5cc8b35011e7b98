#ifndef REFLOW_API_TRIGGER_H
#define REFLOW_API_TRIGGER_H

#include <reflow/api/handle.h>

namespace reflow {
    /**
     * A dependency without a value: track() subscribes the current observer, notify() propagates to subscribers.
     */
    class REFLOW_EXPORT Trigger : public NodeHandle {
    public:
        using NodeHandle::NodeHandle;

        void track() const { rt().track(_id); }

        void notify() const {
            if (is_disposed()) { throw_error<DisposedError>(fmt::format("Trigger {} has been disposed", _id)); }
            _runtime->notify_changed(_id);
        }

        bool try_track() const {
            if (is_disposed()) { return false; }
            _runtime->track(_id);
            return true;
        }

        bool try_notify() const {
            if (is_disposed()) { return false; }
            _runtime->notify_changed(_id);
            return true;
        }

        void operator()() const { track(); }
    };

    inline Trigger create_trigger(Runtime &rt) { return Trigger{&rt, rt.create_trigger_node()}; }
} // namespace reflow

#endif  // REFLOW_API_TRIGGER_H
