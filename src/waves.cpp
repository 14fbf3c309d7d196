#include "waves.h"

// ============================================================================
//  GLSL Shader Sources  (embedded as raw string literals)
// ============================================================================

// World-space positions to clip space; y grows downwards on screen
static const char* waterVertSrc = R"(
#version 330 core
uniform float scale;
uniform vec2  size;

in vec2 position;

void main() {
    gl_Position = vec4(vec2(2.0, -2.0) * position / size * scale + vec2(-1.0, 1.0), 0.0, 1.0);
}
)";

// ---- Propagation -----------------------------------------------------------
// r: current height, g: previous height.  Sampling is nearest and
// clamp-to-edge, so the pond walls reflect.
static const char* propagateFragBody = R"(
uniform sampler2D source;
uniform vec2  size;
uniform float damping;

out vec4 fragColor;

void main() {
    vec2 uv    = gl_FragCoord.xy / size;
    vec2 texel = vec2(1.0 / size.x, 1.0 / size.y);
    vec3 state = texture(source, uv).rgb;
    float hLeft  = texture(source, vec2(uv.x - texel.x, uv.y)).r;
    float hRight = texture(source, vec2(uv.x + texel.x, uv.y)).r;
    float hUp    = texture(source, vec2(uv.x, uv.y - texel.y)).r;
    float hDown  = texture(source, vec2(uv.x, uv.y + texel.y)).r;
    float momentum  = unpackSigned(state.g + state.b);
    float newHeight = (hLeft + hUp + hRight + hDown) - 2.0;

    fragColor = vec4(
        packSigned((newHeight - momentum) * damping),
        state.r,
        0.0,
        0.0);
}
)";

// ---- Distortion ------------------------------------------------------------
static const char* distortFragBody = R"(
uniform sampler2D background;
uniform sampler2D waterBack;
uniform sampler2D waterFront;
uniform float depth;
uniform vec2  size;
uniform vec2  waterSize;
uniform float time;

out vec4 fragColor;

float get(vec2 delta) {
    vec2 uv = gl_FragCoord.xy / size + delta / waterSize;

    return decodeHeight(mix(texture(waterBack, uv).r, texture(waterFront, uv).r, time));
}

void main() {
    float dyx = get(vec2(1.0, 0.0)) - get(vec2(-1.0, 0.0));
    float dyz = get(vec2(0.0, 1.0)) - get(vec2(0.0, -1.0));
    vec3 normal = cross(
        normalize(vec3(2.0, dyx, 0.0)),
        normalize(vec3(0.0, dyz, 2.0)));
    vec2 displacement = depth * normal.xz / size;
    float shiny = dot(normalize(vec3(1.0, 0.0, 1.0)), normal);

    if (shiny < 0.0)
        shiny *= 0.5;
    else {
        if (shiny > 0.5) // specular boost, hand tuned
            shiny *= 1.5;
    }

    vec4 dullFilter = vec4(0.93, 0.98, 1.0, 1.0) * vec4(0.92, 0.97, 1.0, 1.0);
    vec4 sky        = vec4(0.88, 0.96, 1.0, 1.0);

    vec4 pixel = texture(background, gl_FragCoord.xy / size - displacement);

    if (pixel.a == 0.0)
        pixel = vec4(1.0);

    fragColor = mix(
        dullFilter * pixel,
        sky,
        shiny);
}
)";

// ============================================================================
//  Programs
// ============================================================================

Waves::DistortProgram::DistortProgram()
    : shader("distort", waterVertSrc, fragmentSource(distortFragBody).c_str()),
      uScale     (shader.uniform("scale")),
      uBackground(shader.uniform("background")),
      uWaterBack (shader.uniform("waterBack")),
      uWaterFront(shader.uniform("waterFront")),
      uDepth     (shader.uniform("depth")),
      uSize      (shader.uniform("size")),
      uWaterSize (shader.uniform("waterSize")),
      uTime      (shader.uniform("time")),
      aPosition  (shader.attribute("position")) {}

Waves::PropagateProgram::PropagateProgram()
    : shader("propagate", waterVertSrc, fragmentSource(propagateFragBody).c_str()),
      uSize    (shader.uniform("size")),
      uScale   (shader.uniform("scale")),
      uDamping (shader.uniform("damping")),
      aPosition(shader.attribute("position")) {}

Waves::Waves(WaveSettings settings)
    : settings_(settings) {}

// ============================================================================
//  Host render state kept across a propagation step
// ============================================================================
namespace {

struct HostTargetGuard {
    GLint   framebuffer = 0;
    GLint   viewport[4] = {0, 0, 0, 0};
    GLfloat clearColor[4] = {0.f, 0.f, 0.f, 0.f};
    GLboolean blend = GL_FALSE;
    GLint   srcRgb = GL_ONE, dstRgb = GL_ZERO;
    GLint   srcAlpha = GL_ONE, dstAlpha = GL_ZERO;
    GLint   equationRgb = GL_FUNC_ADD, equationAlpha = GL_FUNC_ADD;

    HostTargetGuard() {
        glGetIntegerv(GL_FRAMEBUFFER_BINDING, &framebuffer);
        glGetIntegerv(GL_VIEWPORT, viewport);
        glGetFloatv(GL_COLOR_CLEAR_VALUE, clearColor);
        blend = glIsEnabled(GL_BLEND);
        glGetIntegerv(GL_BLEND_SRC_RGB, &srcRgb);
        glGetIntegerv(GL_BLEND_DST_RGB, &dstRgb);
        glGetIntegerv(GL_BLEND_SRC_ALPHA, &srcAlpha);
        glGetIntegerv(GL_BLEND_DST_ALPHA, &dstAlpha);
        glGetIntegerv(GL_BLEND_EQUATION_RGB, &equationRgb);
        glGetIntegerv(GL_BLEND_EQUATION_ALPHA, &equationAlpha);
    }
    ~HostTargetGuard() {
        glBindFramebuffer(GL_FRAMEBUFFER, (GLuint)framebuffer);
        glViewport(viewport[0], viewport[1], viewport[2], viewport[3]);
        glClearColor(clearColor[0], clearColor[1], clearColor[2], clearColor[3]);
        glBlendFuncSeparate((GLenum)srcRgb, (GLenum)dstRgb, (GLenum)srcAlpha, (GLenum)dstAlpha);
        glBlendEquationSeparate((GLenum)equationRgb, (GLenum)equationAlpha);
        if (blend) glEnable(GL_BLEND);
        else       glDisable(GL_BLEND);
    }
};

void setFilter(GLenum filter) {
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
}

} // namespace

// ============================================================================
//  Passes
// ============================================================================

void Waves::propagate(WaterPlane& water, InfluenceSource& influences, const Mesh& mesh) {
    if (water.empty() || mesh.empty()) return;

    HostTargetGuard host;
    const PropagateProgram& p = propagate_;
    p.shader.use();

    water.flip();
    water.front().target();

    glDisable(GL_BLEND);
    glClearColor(HEIGHT_NEUTRAL, HEIGHT_NEUTRAL, 0.f, 0.f);
    glClear(GL_COLOR_BUFFER_BIT);

    glUniform2f(p.uSize, (float)water.width(), (float)water.height());
    glUniform1f(p.uScale, water.scale());
    glUniform1f(p.uDamping, settings_.damping);

    mesh.bind(p.aPosition);

    // The stencil must not blend across cells
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, water.back().texture());
    setFilter(GL_NEAREST);

    mesh.draw();

    setFilter(GL_LINEAR);

    influences.applyInfluences(water);
}

void Waves::render(GLuint background, const Mesh& mesh, const WaterPlane& water,
                   int width, int height, float scale, float time) const {
    if (water.empty() || mesh.empty() || width <= 0 || height <= 0) return;

    const DistortProgram& p = distort_;
    p.shader.use();

    glUniform1f(p.uScale, scale);
    glUniform1i(p.uBackground, 0);
    glUniform1i(p.uWaterBack, 1);
    glUniform1i(p.uWaterFront, 2);
    glUniform1f(p.uDepth, settings_.depth * scale);
    glUniform2f(p.uSize, (float)width, (float)height);
    glUniform2f(p.uWaterSize, (float)water.width(), (float)water.height());
    glUniform1f(p.uTime, time);

    mesh.bind(p.aPosition);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, background);
    glActiveTexture(GL_TEXTURE1);
    glBindTexture(GL_TEXTURE_2D, water.back().texture());
    glActiveTexture(GL_TEXTURE2);
    glBindTexture(GL_TEXTURE_2D, water.front().texture());

    mesh.draw();

    glActiveTexture(GL_TEXTURE0);
}

void Waves::release() {
    distort_.shader.release();
    propagate_.shader.release();
}
