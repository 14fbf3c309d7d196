// ============================================================================
// water_plane.h — GPU height field: two render targets in ping-pong
//
// The cell grid covers a world-space rectangle at `scale` cells per world
// unit.  Dimensions are fixed for the lifetime of the plane.  A zero-sized
// plane owns no GL objects and every pass over it is a no-op.
// ============================================================================
#pragma once

#include "height_field.h"
#include "ping_pong.h"
#include "render_target.h"

class WaterPlane {
public:
    // Cell dimensions are ceil(world * scale)
    WaterPlane(float worldWidth, float worldHeight, float scale);

    int   width()  const { return width_; }
    int   height() const { return height_; }
    float scale()  const { return scale_; }
    bool  empty()  const { return width_ == 0 || height_ == 0; }

    RenderTarget&       front()       { return buffers_.front(); }
    const RenderTarget& front() const { return buffers_.front(); }
    RenderTarget&       back()        { return buffers_.back(); }
    const RenderTarget& back()  const { return buffers_.back(); }

    int frontIndex() const { return buffers_.frontIndex(); }

    void flip() { buffers_.flip(); }

    // Both buffers back to the neutral state
    void clear();

    // Host <-> front buffer transfer; field dimensions must match the plane
    void upload(const HeightField& field);
    HeightField download() const;

    void release();

private:
    int   width_;
    int   height_;
    float scale_;
    PingPong<RenderTarget> buffers_;
};
