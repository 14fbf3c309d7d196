// ============================================================================
// waves.h — GPU wave propagation and water distortion passes
//
// Two programs:
//   propagate – one damped wave-equation step from water.back() into
//               water.front()
//   distort   – refracts and shades a background through the surface,
//               interpolating between the last two steps
//
// Construction needs a current GL 3.3 context and throws ShaderError if
// either program fails.  release() must run before the context goes away.
// ============================================================================
#pragma once

#include "influence.h"
#include "mesh.h"
#include "shader.h"
#include "water_plane.h"

struct WaveSettings {
    float damping = 0.995f;
    float depth   = 0.1f;     // refraction depth at render scale 1
};

class Waves {
public:
    explicit Waves(WaveSettings settings = WaveSettings());

    // Advance the water one step: flip, write the new front, then let the
    // influence source paint into it.  The host framebuffer, viewport,
    // clear colour and blend state are restored afterwards.
    void propagate(WaterPlane& water, InfluenceSource& influences, const Mesh& mesh);

    // Draw the distorted background into the currently bound target.
    // width/height are the background size in pixels, scale the render
    // scale, time the interpolation factor between back and front.
    void render(GLuint background, const Mesh& mesh, const WaterPlane& water,
                int width, int height, float scale, float time) const;

    void release();

    const WaveSettings& settings() const { return settings_; }

    // ------------------------------------------------------------------
    // Resolved program handles
    // ------------------------------------------------------------------
    struct DistortProgram {
        Shader shader;
        GLint  uScale, uBackground, uWaterBack, uWaterFront;
        GLint  uDepth, uSize, uWaterSize, uTime;
        GLint  aPosition;
        DistortProgram();
    };

    struct PropagateProgram {
        Shader shader;
        GLint  uSize, uScale, uDamping;
        GLint  aPosition;
        PropagateProgram();
    };

    const DistortProgram&   distortProgram()   const { return distort_; }
    const PropagateProgram& propagateProgram() const { return propagate_; }

private:
    WaveSettings     settings_;
    DistortProgram   distort_;
    PropagateProgram propagate_;
};
