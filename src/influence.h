// ============================================================================
// influence.h — disturbances painted into the water after each step
// ============================================================================
#pragma once

class WaterPlane;

// Called by Waves::propagate() once the new front buffer is written and is
// still bound as the render target.  Implementations add to the red
// channel in the packed domain (packSigned), the same encoding the
// propagation pass stores.
class InfluenceSource {
public:
    virtual ~InfluenceSource() = default;
    virtual void applyInfluences(WaterPlane& water) = 0;
};
