// ============================================================================
// ripple_painter.h — queued radial drops added to the water surface
//
// Drops are given in world units and painted on the next propagation step
// as a cosine bump  amplitude * (0.5 + 0.5 * cos(pi * d / radius)),
// the same profile as HeightField::addDrop().
// ============================================================================
#pragma once

#include <vector>

#include "influence.h"
#include "mesh.h"
#include "shader.h"

struct Drop {
    float x, y;
    float radius;
    float amplitude;
};

class RipplePainter : public InfluenceSource {
public:
    // Needs a current GL context; throws ShaderError
    RipplePainter();

    // Ignored unless radius > 0
    void drop(float x, float y, float radius, float amplitude);

    const std::vector<Drop>& pending() const { return drops_; }

    // Paints every queued drop into water.front() and empties the queue
    void applyInfluences(WaterPlane& water) override;

    void release();

private:
    Shader shader_;
    GLint  uSize, uScale, uCenter, uRadius, uAmplitude;
    GLint  aPosition;
    Mesh   quad_;
    std::vector<Drop> drops_;
};
