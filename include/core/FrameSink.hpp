#pragma once

#include "core/Types.hpp"

namespace core {

/**
 * Consumer of fused frames (overlay renderer, network publisher, ...).
 *
 * consume() is called on the pipeline thread once per produced frame, in
 * capture order. The reference is only valid for the duration of the call;
 * a sink that needs the data later must copy it.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void consume(const FusedFrame& frame) = 0;
};

} // namespace core
