#pragma once

#include "event.hpp"

namespace beatlight {

// Receives finished events from the audio thread. emit() must not block;
// it returns false when the event could not be accepted.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual bool emit(const Event& event) = 0;
};

} // namespace beatlight
