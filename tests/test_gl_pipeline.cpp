/**
 * @file test_gl_pipeline.cpp
 * @brief GPU passes checked against the host reference kernels
 *
 * Needs an OpenGL 3.3 core context; every test is skipped when no hidden
 * GLFW window can be created (headless machines without a display).  A
 * passing run on such a machine says nothing about the shaders: check the
 * output for skipped tests before reading it as GPU coverage.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "gl_api.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "height_field.h"
#include "mesh.h"
#include "render_target.h"
#include "ripple_painter.h"
#include "water_plane.h"
#include "waves.h"

namespace {

// Half floats keep about three decimal digits
constexpr float HALF_TOL = 2e-3f;

struct CountingInfluence : InfluenceSource {
    int calls = 0;
    int frontIndexSeen = -1;
    void applyInfluences(WaterPlane& water) override {
        ++calls;
        frontIndexSeen = water.frontIndex();
    }
};

const char* passThroughVert = R"(
#version 330 core
in vec2 position;
void main() { gl_Position = vec4(position, 0.0, 1.0); }
)";

// Renders `water` over `background` into an N x N float target and reads it back
std::vector<float> renderWater(const Waves& waves, GLuint background,
                               const WaterPlane& water, int n, float time) {
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, (float)n, (float)n}});
    RenderTarget screen(n, n);
    screen.target();
    waves.render(background, mesh, water, n, n, 1.f, time);

    std::vector<float> out(size_t(n) * n * 4);
    glReadPixels(0, 0, n, n, GL_RGBA, GL_FLOAT, out.data());
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    return out;
}

} // namespace

class GlPipelineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!glfwInit()) return;
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
        window = glfwCreateWindow(64, 64, "waves-test", nullptr, nullptr);
        if (window) glfwMakeContextCurrent(window);
    }

    static void TearDownTestSuite() {
        if (window) glfwDestroyWindow(window);
        window = nullptr;
        glfwTerminate();
    }

    void SetUp() override {
        if (!window) GTEST_SKIP() << "no OpenGL 3.3 context available";
    }

    static GLFWwindow* window;
};

GLFWwindow* GlPipelineTest::window = nullptr;

// ============================================================================
// Programs
// ============================================================================

TEST_F(GlPipelineTest, ProgramsResolveEveryNamedSymbol) {
    Waves waves;
    const Waves::DistortProgram& d = waves.distortProgram();
    const Waves::PropagateProgram& p = waves.propagateProgram();

    EXPECT_NE(d.shader.program(), 0u);
    EXPECT_NE(p.shader.program(), 0u);
    EXPECT_NE(d.shader.program(), p.shader.program());

    for (GLint loc : {d.uScale, d.uBackground, d.uWaterBack, d.uWaterFront,
                      d.uDepth, d.uSize, d.uWaterSize, d.uTime, d.aPosition})
        EXPECT_GE(loc, 0);
    for (GLint loc : {p.uSize, p.uScale, p.uDamping, p.aPosition})
        EXPECT_GE(loc, 0);

    EXPECT_FLOAT_EQ(waves.settings().damping, 0.995f);
    EXPECT_FLOAT_EQ(waves.settings().depth, 0.1f);
    waves.release();
}

TEST_F(GlPipelineTest, CompileErrorNamesProgramAndStage) {
    try {
        Shader broken("broken", passThroughVert, "#version 330 core\nvoid main() { nope }\n");
        FAIL() << "expected ShaderError";
    } catch (const ShaderError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("broken"), std::string::npos) << what;
        EXPECT_NE(what.find("fragment"), std::string::npos) << what;
    }
}

TEST_F(GlPipelineTest, MissingSymbolFailsFast) {
    Shader shader("plain", passThroughVert,
                  "#version 330 core\nout vec4 c;\nvoid main() { c = vec4(1.0); }\n");
    EXPECT_GE(shader.attribute("position"), 0);
    EXPECT_THROW(shader.uniform("doesNotExist"), ShaderError);
    EXPECT_THROW(shader.attribute("normal"), ShaderError);
}

TEST_F(GlPipelineTest, ReleaseIsIdempotent) {
    Waves waves;
    waves.release();
    waves.release();
    EXPECT_EQ(waves.distortProgram().shader.program(), 0u);
    EXPECT_EQ(waves.propagateProgram().shader.program(), 0u);
}

// ============================================================================
// Propagation
// ============================================================================

TEST_F(GlPipelineTest, PropagateSwapsRolesAndMatchesHostKernel) {
    Waves waves;
    WaterPlane water(4.f, 4.f, 1.f);
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, 4.f, 4.f}});
    ASSERT_EQ(water.width(), 4);
    ASSERT_EQ(water.height(), 4);

    HeightField start(4, 4, 1.f);
    start.setHeight(2, 2, 1.f);
    water.upload(start);

    GLuint wasFront = water.front().texture();
    GLuint wasBack  = water.back().texture();
    CountingInfluence influence;
    waves.propagate(water, influence, mesh);

    EXPECT_EQ(water.back().texture(), wasFront);
    EXPECT_EQ(water.front().texture(), wasBack);
    EXPECT_NE(water.front().texture(), water.back().texture());
    EXPECT_EQ(influence.calls, 1);
    EXPECT_EQ(influence.frontIndexSeen, water.frontIndex());

    HeightField expected(4, 4, 1.f);
    propagateField(start, expected, waves.settings().damping);
    HeightField actual = water.download();
    for (int j = 0; j < 4; ++j)
        for (int i = 0; i < 4; ++i) {
            EXPECT_NEAR(actual.at(i, j).r, expected.at(i, j).r, HALF_TOL) << i << "," << j;
            EXPECT_NEAR(actual.at(i, j).g, expected.at(i, j).g, HALF_TOL) << i << "," << j;
        }
    EXPECT_NE(actual.at(1, 2).r, HEIGHT_NEUTRAL);
    EXPECT_NEAR(actual.at(0, 0).r, HEIGHT_NEUTRAL, HALF_TOL);
}

TEST_F(GlPipelineTest, SeveralStepsTrackHostKernel) {
    Waves waves;
    WaterPlane water(12.f, 8.f, 1.f);
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, 12.f, 8.f}});
    CountingInfluence influence;

    HeightField host(12, 8, 1.f);
    host.setHeight(3, 4, 0.8f);
    water.upload(host);

    HeightField next(12, 8, 1.f);
    for (int s = 0; s < 6; ++s) {
        waves.propagate(water, influence, mesh);
        propagateField(host, next, waves.settings().damping);
        std::swap(host, next);
    }

    HeightField actual = water.download();
    for (int j = 0; j < 8; ++j)
        for (int i = 0; i < 12; ++i)
            EXPECT_NEAR(actual.at(i, j).r, host.at(i, j).r, 4.f * HALF_TOL) << i << "," << j;
    EXPECT_EQ(influence.calls, 6);
}

TEST_F(GlPipelineTest, PropagateRestoresHostTarget) {
    Waves waves;
    WaterPlane water(8.f, 8.f, 1.f);
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, 8.f, 8.f}});
    RenderTarget host(32, 16);
    RipplePainter ripples;
    ripples.drop(4.f, 4.f, 2.f, 0.5f);

    host.target();
    glClearColor(0.25f, 0.5f, 0.75f, 1.f);
    glEnable(GL_BLEND);
    glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
    glBlendEquationSeparate(GL_FUNC_ADD, GL_MAX);
    waves.propagate(water, ripples, mesh);
    EXPECT_TRUE(ripples.pending().empty());

    GLint fbo = 0;
    GLint viewport[4];
    GLfloat clear[4];
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &fbo);
    glGetIntegerv(GL_VIEWPORT, viewport);
    glGetFloatv(GL_COLOR_CLEAR_VALUE, clear);
    EXPECT_EQ((GLuint)fbo, host.framebuffer());
    EXPECT_EQ(viewport[2], 32);
    EXPECT_EQ(viewport[3], 16);
    EXPECT_FLOAT_EQ(clear[0], 0.25f);
    EXPECT_FLOAT_EQ(clear[2], 0.75f);

    GLint srcRgb = 0, dstRgb = 0, srcAlpha = 0, dstAlpha = 0;
    GLint equationRgb = 0, equationAlpha = 0;
    glGetIntegerv(GL_BLEND_SRC_RGB, &srcRgb);
    glGetIntegerv(GL_BLEND_DST_RGB, &dstRgb);
    glGetIntegerv(GL_BLEND_SRC_ALPHA, &srcAlpha);
    glGetIntegerv(GL_BLEND_DST_ALPHA, &dstAlpha);
    glGetIntegerv(GL_BLEND_EQUATION_RGB, &equationRgb);
    glGetIntegerv(GL_BLEND_EQUATION_ALPHA, &equationAlpha);
    EXPECT_EQ(glIsEnabled(GL_BLEND), GL_TRUE);
    EXPECT_EQ(srcRgb, GL_SRC_ALPHA);
    EXPECT_EQ(dstRgb, GL_ONE_MINUS_SRC_ALPHA);
    EXPECT_EQ(srcAlpha, GL_ONE);
    EXPECT_EQ(dstAlpha, GL_ONE_MINUS_SRC_ALPHA);
    EXPECT_EQ(equationRgb, GL_FUNC_ADD);
    EXPECT_EQ(equationAlpha, GL_MAX);

    glBlendFunc(GL_ONE, GL_ZERO);
    glBlendEquation(GL_FUNC_ADD);
    glDisable(GL_BLEND);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    ripples.release();
}

TEST_F(GlPipelineTest, ClearingWaterKeepsHostClearColour) {
    glClearColor(0.1f, 0.2f, 0.3f, 1.f);
    WaterPlane water(6.f, 6.f, 1.f);
    water.clear();

    GLfloat clear[4];
    glGetFloatv(GL_COLOR_CLEAR_VALUE, clear);
    EXPECT_FLOAT_EQ(clear[0], 0.1f);
    EXPECT_FLOAT_EQ(clear[1], 0.2f);
    EXPECT_FLOAT_EQ(clear[2], 0.3f);
    EXPECT_FLOAT_EQ(clear[3], 1.f);

    HeightField cleared = water.download();
    for (const Cell& c : cleared.cells) {
        EXPECT_FLOAT_EQ(c.r, HEIGHT_NEUTRAL);
        EXPECT_FLOAT_EQ(c.g, HEIGHT_NEUTRAL);
    }
    glClearColor(0.f, 0.f, 0.f, 0.f);
}

TEST_F(GlPipelineTest, EmptyWaterOrMeshIsANoOp) {
    Waves waves;
    CountingInfluence influence;

    WaterPlane empty(0.f, 10.f, 1.f);
    EXPECT_TRUE(empty.empty());
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, 4.f, 4.f}});
    int before = empty.frontIndex();
    waves.propagate(empty, influence, mesh);
    EXPECT_EQ(empty.frontIndex(), before);

    WaterPlane water(4.f, 4.f, 1.f);
    Mesh noMesh(std::vector<Rect>{});
    before = water.frontIndex();
    waves.propagate(water, influence, noMesh);
    EXPECT_EQ(water.frontIndex(), before);

    EXPECT_EQ(influence.calls, 0);
    waves.render(0, noMesh, water, 4, 4, 1.f, 0.5f);
}

// ============================================================================
// Influences
// ============================================================================

TEST_F(GlPipelineTest, RippleDropMatchesHostDrop) {
    Waves waves;
    RipplePainter ripples;
    WaterPlane water(16.f, 16.f, 1.f);
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, 16.f, 16.f}});

    ripples.drop(8.f, 8.f, 4.f, 0.5f);
    ripples.drop(3.f, 3.f, 0.f, 0.5f);          // ignored
    EXPECT_EQ(ripples.pending().size(), 1u);

    waves.propagate(water, ripples, mesh);
    EXPECT_TRUE(ripples.pending().empty());

    // A neutral field propagates to itself; only the drop remains
    HeightField expected(16, 16, 1.f);
    expected.addDrop(8.f, 8.f, 4.f, 0.5f);

    HeightField actual = water.download();
    for (int j = 0; j < 16; ++j)
        for (int i = 0; i < 16; ++i)
            EXPECT_NEAR(actual.at(i, j).r, expected.at(i, j).r, HALF_TOL) << i << "," << j;

    ripples.release();
}

// ============================================================================
// Distortion
// ============================================================================

TEST_F(GlPipelineTest, FlatWaterShowsFilteredBackground) {
    const int N = 8;
    Waves waves;
    WaterPlane water((float)N, (float)N, 1.f);
    Mesh mesh(std::vector<Rect>{{0.f, 0.f, (float)N, (float)N}});

    std::vector<unsigned char> bg(N * N * 4);
    for (int j = 0; j < N; ++j)
        for (int i = 0; i < N; ++i) {
            unsigned char* p = &bg[(j * N + i) * 4];
            p[0] = (unsigned char)(i * 30);
            p[1] = (unsigned char)(j * 30);
            p[2] = 128;
            p[3] = 255;
        }
    bg[(5 * N + 2) * 4 + 3] = 0;             // one transparent texel at (2, 5)
    GLuint background = createColorTexture(N, N, bg.data());

    RenderTarget screen(N, N);
    screen.target();
    waves.render(background, mesh, water, N, N, 1.f, 0.5f);

    std::vector<float> out(N * N * 4);
    glReadPixels(0, 0, N, N, GL_RGBA, GL_FLOAT, out.data());
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glDeleteTextures(1, &background);

    const glm::vec4 filter = DULL_FILTER_A * DULL_FILTER_B;
    for (int j = 0; j < N; ++j)
        for (int i = 0; i < N; ++i) {
            const unsigned char* p = &bg[(j * N + i) * 4];
            glm::vec4 texel(p[0] / 255.f, p[1] / 255.f, p[2] / 255.f, p[3] / 255.f);
            glm::vec4 want = compositeWater(texel, 0.f);
            const float* got = &out[(j * N + i) * 4];
            for (int c = 0; c < 4; ++c)
                EXPECT_NEAR(got[c], want[c], 3e-3f) << i << "," << j << " channel " << c;
        }

    const float* white = &out[(5 * N + 2) * 4];
    EXPECT_NEAR(white[0], filter.r, 3e-3f);
    EXPECT_NEAR(white[1], filter.g, 3e-3f);
    EXPECT_NEAR(white[3], 1.f, 3e-3f);
}

TEST_F(GlPipelineTest, RippledWaterMatchesHostShading) {
    const int N = 12;
    const float TIME = 0.3f;
    Waves waves;
    WaterPlane water((float)N, (float)N, 1.f);

    // Packed heights on a 1/32 grid are exact in half precision
    HeightField back(N, N, 1.f);
    HeightField front(N, N, 1.f);
    for (int j = 0; j < N; ++j)
        for (int i = 0; i < N; ++i) {
            back.at(i, j).r  = 0.5f + ((i * 3 + j * 5) % 9 - 4) / 32.f;
            front.at(i, j).r = 0.5f + ((i * 7 + j * 2) % 7 - 3) / 32.f;
        }
    water.upload(back);
    water.flip();
    water.upload(front);

    const unsigned char shade[4] = {100, 150, 200, 255};
    std::vector<unsigned char> bg(N * N * 4);
    for (int k = 0; k < N * N; ++k)
        for (int c = 0; c < 4; ++c) bg[k * 4 + c] = shade[c];
    GLuint background = createColorTexture(N, N, bg.data());

    std::vector<float> out = renderWater(waves, background, water, N, TIME);

    const glm::vec4 texel(100 / 255.f, 150 / 255.f, 200 / 255.f, 1.f);
    const float depth = waves.settings().depth;
    const glm::vec3 light = glm::normalize(glm::vec3(1.f, 0.f, 1.f));
    int compared = 0;
    for (int j = 1; j < N - 1; ++j)
        for (int i = 1; i < N - 1; ++i) {
            SurfaceSample s = shadeCell(back, front, i, j, TIME, depth, glm::vec2(N, N));
            // The highlight boost jumps at 0.5; rounding could land either side
            if (std::fabs(glm::dot(light, s.normal) - 0.5f) < 0.02f) continue;
            glm::vec4 want = compositeWater(texel, s.shiny);
            const float* got = &out[(j * N + i) * 4];
            for (int c = 0; c < 4; ++c)
                EXPECT_NEAR(got[c], want[c], 3e-3f) << i << "," << j << " channel " << c;
            ++compared;
        }
    EXPECT_GT(compared, (N - 2) * (N - 2) / 2);

    // Swapping the two states changes the picture
    water.flip();
    std::vector<float> swapped = renderWater(waves, background, water, N, TIME);
    glDeleteTextures(1, &background);
    float largest = 0.f;
    for (size_t k = 0; k < out.size(); ++k)
        largest = std::max(largest, std::fabs(out[k] - swapped[k]));
    EXPECT_GT(largest, 0.05f);
}

TEST_F(GlPipelineTest, SlopeShiftsBackgroundAgainstTheNormal) {
    const int N = 16;
    WaveSettings settings;
    settings.depth = 4.f;
    Waves waves(settings);
    WaterPlane water((float)N, (float)N, 1.f);

    // Height rising to the right, identical in both states
    HeightField ramp(N, N, 1.f);
    for (int j = 0; j < N; ++j)
        for (int i = 0; i < N; ++i)
            ramp.at(i, j).r = 0.5f + (i - 8) / 16.f;
    water.upload(ramp);
    water.flip();
    water.upload(ramp);

    // Red grows by 16/255 per texel
    std::vector<unsigned char> bg(N * N * 4);
    for (int j = 0; j < N; ++j)
        for (int i = 0; i < N; ++i) {
            unsigned char* p = &bg[(j * N + i) * 4];
            p[0] = (unsigned char)(i * 16);
            p[1] = 64;
            p[2] = 64;
            p[3] = 255;
        }
    GLuint background = createColorTexture(N, N, bg.data());

    std::vector<float> out = renderWater(waves, background, water, N, 0.5f);
    glDeleteTextures(1, &background);

    const glm::vec4 filter = DULL_FILTER_A * DULL_FILTER_B;
    for (int j = 3; j < N - 3; ++j)
        for (int i = 3; i < N - 3; ++i) {
            SurfaceSample s = shadeCell(ramp, ramp, i, j, 0.5f, settings.depth, glm::vec2(N, N));
            ASSERT_GT(std::fabs(s.displacement.x * N), 1.f);

            // Background read at the pixel centre minus the displacement
            float texelPos = i - s.displacement.x * N;
            float red = texelPos * 16.f / 255.f;
            float want = filter.r * red + (SKY_COLOR.r - filter.r * red) * s.shiny;
            EXPECT_NEAR(out[(j * N + i) * 4], want, 3e-3f) << i << "," << j;
        }
}
