#include "ripple_painter.h"

#include "water_plane.h"

// Unit quad stretched over the drop's bounding square
static const char* dropVertSrc = R"(
#version 330 core
uniform vec2  size;
uniform float scale;
uniform vec2  center;
uniform float radius;

in vec2 position;

out vec2 world;

void main() {
    world = center + (position * 2.0 - 1.0) * radius;
    gl_Position = vec4(vec2(2.0, -2.0) * world / size * scale + vec2(-1.0, 1.0), 0.0, 1.0);
}
)";

// Output is added to the front buffer (GL_ONE, GL_ONE)
static const char* dropFragBody = R"(
uniform vec2  center;
uniform float radius;
uniform float amplitude;

in vec2 world;

out vec4 fragColor;

const float PI = 3.14159265358979;

void main() {
    float d = distance(world, center);
    if (d >= radius) discard;

    float bump = amplitude * (0.5 + 0.5 * cos(PI * d / radius));
    fragColor = vec4(packSigned(bump) - HEIGHT_NEUTRAL, 0.0, 0.0, 0.0);
}
)";

RipplePainter::RipplePainter()
    : shader_("ripple", dropVertSrc, fragmentSource(dropFragBody).c_str()),
      uSize     (shader_.uniform("size")),
      uScale    (shader_.uniform("scale")),
      uCenter   (shader_.uniform("center")),
      uRadius   (shader_.uniform("radius")),
      uAmplitude(shader_.uniform("amplitude")),
      aPosition (shader_.attribute("position")),
      quad_(std::vector<Rect>{{0.f, 0.f, 1.f, 1.f}}) {}

void RipplePainter::drop(float x, float y, float radius, float amplitude) {
    if (radius <= 0.f) return;
    drops_.push_back({x, y, radius, amplitude});
}

void RipplePainter::applyInfluences(WaterPlane& water) {
    if (drops_.empty()) return;
    if (water.empty()) {
        drops_.clear();
        return;
    }

    shader_.use();
    water.front().target();

    glEnable(GL_BLEND);
    glBlendEquation(GL_FUNC_ADD);
    glBlendFunc(GL_ONE, GL_ONE);

    glUniform2f(uSize, (float)water.width(), (float)water.height());
    glUniform1f(uScale, water.scale());

    quad_.bind(aPosition);
    for (const Drop& d : drops_) {
        glUniform2f(uCenter, d.x, d.y);
        glUniform1f(uRadius, d.radius);
        glUniform1f(uAmplitude, d.amplitude);
        quad_.draw();
    }

    glDisable(GL_BLEND);
    drops_.clear();
}

void RipplePainter::release() {
    shader_.release();
    quad_.release();
}
