// ============================================================================
// main.cpp — Koi Pond
//
// A pond seen from above.  The water surface is a GPU height field that
// refracts and shades a procedural pond bed.  Click to drop a ripple,
// SPACE toggles rain.
//
// Dependencies:
//   • GLFW  — windowing & input
//   • GLM   — vector math for the procedural background
//   • OpenGL 3.3 Core
// ============================================================================

#include <iostream>
#include <vector>
#include <cmath>
#include <random>
#include <algorithm>
#include <exception>

#include "gl_api.h"

#define GLFW_INCLUDE_NONE            // we supply our own GL header above
#include <GLFW/glfw3.h>

#include <glm/glm.hpp>

#include "mesh.h"
#include "render_target.h"
#include "ripple_painter.h"
#include "step_clock.h"
#include "water_plane.h"
#include "waves.h"

// ============================================================================
//  Configuration
// ============================================================================
constexpr int   WINDOW_W = 1280;
constexpr int   WINDOW_H = 800;

constexpr float WORLD_W = 640.f;          // pond size in world units
constexpr float WORLD_H = 400.f;
constexpr float WATER_SCALE = 0.5f;       // simulation cells per world unit

constexpr float SIM_RATE = 30.f;          // propagation steps per second
constexpr int   MAX_STEPS_PER_FRAME = 8;

constexpr float CLICK_RADIUS    = 14.f;
constexpr float CLICK_AMPLITUDE = 0.6f;
constexpr float RAIN_INTERVAL   = 0.12f;  // seconds between rain drops
constexpr float RAIN_RADIUS     = 5.f;
constexpr float RAIN_AMPLITUDE  = 0.25f;

// ============================================================================
//  Procedural pond bed
//
//  RGBA8, first row at the bottom of the screen.  The reed border is left
//  fully transparent; the distortion pass shows it as white.
// ============================================================================
static std::vector<unsigned char> makePondBed(int w, int h) {
    std::vector<unsigned char> px(size_t(w) * size_t(h) * 4);

    const glm::vec3 sand    (0.76f, 0.60f, 0.42f);
    const glm::vec3 deep    (0.05f, 0.22f, 0.28f);
    const glm::vec3 shallow (0.20f, 0.48f, 0.46f);
    const glm::vec3 koiRed  (0.93f, 0.38f, 0.12f);
    const glm::vec3 koiWhite(0.97f, 0.95f, 0.90f);

    // A few koi resting on the bed: centre, half-axes, angle
    struct Koi { glm::vec2 c; glm::vec2 r; float angle; bool white; };
    const Koi koi[] = {
        {{0.30f, 0.40f}, {0.070f, 0.022f},  0.4f, false},
        {{0.62f, 0.62f}, {0.060f, 0.020f}, -0.9f, true },
        {{0.72f, 0.30f}, {0.080f, 0.025f},  2.2f, false},
    };

    const float border = 0.035f;

    for (int j = 0; j < h; ++j)
        for (int i = 0; i < w; ++i) {
            float u = (i + 0.5f) / w;
            float v = (j + 0.5f) / h;
            unsigned char* p = &px[(size_t(j) * w + i) * 4];

            float edge = std::min(std::min(u, 1.f - u), std::min(v, 1.f - v));
            if (edge < border) {
                p[0] = p[1] = p[2] = p[3] = 0;
                continue;
            }

            // Deeper towards the middle, sandy near the rim
            float depth = glm::smoothstep(border, 0.25f, edge);
            glm::vec3 col = glm::mix(sand, glm::mix(shallow, deep, depth),
                                     glm::smoothstep(0.f, 0.4f, depth));

            // Pebble noise
            float n = std::sin(u * 173.f) * std::sin(v * 211.f) * std::sin((u + v) * 97.f);
            col *= 0.94f + 0.06f * n;

            for (const Koi& k : koi) {
                glm::vec2 d(u - k.c.x, (v - k.c.y) * (float)h / (float)w);
                float ca = std::cos(k.angle), sa = std::sin(k.angle);
                glm::vec2 q(ca * d.x + sa * d.y, -sa * d.x + ca * d.y);
                float e = (q.x * q.x) / (k.r.x * k.r.x) + (q.y * q.y) / (k.r.y * k.r.y);
                if (e < 1.f) {
                    bool patch = k.white ? (std::sin(q.x * 90.f) > 0.3f)
                                         : (std::sin(q.x * 70.f + 1.f) > 0.6f);
                    glm::vec3 body = k.white ? (patch ? koiRed : koiWhite)
                                             : (patch ? koiWhite : koiRed);
                    col = glm::mix(col, body, glm::smoothstep(1.f, 0.7f, e));
                }
            }

            col = glm::clamp(col, 0.f, 1.f);
            p[0] = (unsigned char)(col.r * 255.f + 0.5f);
            p[1] = (unsigned char)(col.g * 255.f + 0.5f);
            p[2] = (unsigned char)(col.b * 255.f + 0.5f);
            p[3] = 255;
        }
    return px;
}

// ============================================================================
//  Application state
// ============================================================================
struct AppState {
    // Window
    int winW = WINDOW_W, winH = WINDOW_H;

    // Input
    bool   clickPending = false;
    double clickX = 0, clickY = 0;      // window coordinates

    // Simulation control
    bool  raining       = true;
    bool  resetRequested = false;
    float rainTimer     = 0.f;
};
static AppState app;

// ============================================================================
//  GLFW callbacks
// ============================================================================
static void keyCallback(GLFWwindow* win, int key, int, int action, int) {
    if (action != GLFW_PRESS) return;
    if (key == GLFW_KEY_ESCAPE) glfwSetWindowShouldClose(win, true);
    if (key == GLFW_KEY_SPACE) {
        app.raining = !app.raining;
        std::cout << (app.raining ? "Rain on.\n" : "Rain off.\n");
    }
    if (key == GLFW_KEY_R) {
        app.resetRequested = true;
    }
}
static void mbCallback(GLFWwindow* win, int btn, int act, int) {
    if (btn == GLFW_MOUSE_BUTTON_LEFT && act == GLFW_PRESS) {
        glfwGetCursorPos(win, &app.clickX, &app.clickY);
        app.clickPending = true;
    }
}
static void sizeCallback(GLFWwindow*, int w, int h) {
    app.winW = w; app.winH = h;
}

// ============================================================================
//  Pond loop — GL objects live in this scope so they are released before
//  the context is destroyed, also when something throws.
// ============================================================================
static void runPond(GLFWwindow* window) {
    std::cout << "GL Version : " << glGetString(GL_VERSION)  << '\n';
    std::cout << "GL Renderer: " << glGetString(GL_RENDERER) << '\n';

    Waves         waves;
    RipplePainter ripples;
    WaterPlane    water(WORLD_W, WORLD_H, WATER_SCALE);
    Mesh          mesh(std::vector<Rect>{{0.f, 0.f, WORLD_W, WORLD_H}});

    std::cout << "Water field: " << water.width() << " x " << water.height() << " cells\n";

    const int bedW = (int)WORLD_W, bedH = (int)WORLD_H;
    std::vector<unsigned char> bed = makePondBed(bedW, bedH);
    GLuint background = createColorTexture(bedW, bedH, bed.data());

    std::mt19937 rng(1234u);
    std::uniform_real_distribution<float> rainX(0.f, WORLD_W);
    std::uniform_real_distribution<float> rainY(0.f, WORLD_H);

    FixedStepClock clock(1.f / SIM_RATE, MAX_STEPS_PER_FRAME);

    // --- Print controls -----------------------------------------------------
    std::cout << "\n=== Koi Pond ===\n"
              << "  Click  Drop a ripple\n"
              << "  SPACE  Toggle rain\n"
              << "  R      Calm the water\n"
              << "  ESC    Quit\n"
              << "================\n\n";

    // --- Main loop ----------------------------------------------------------
    float lastT = (float)glfwGetTime();
    int   frames = 0;
    float fpsAcc = 0.f;

    while (!glfwWindowShouldClose(window)) {
        float now = (float)glfwGetTime();
        float dt  = std::min(now - lastT, 0.25f);
        lastT = now;

        ++frames; fpsAcc += dt;
        if (fpsAcc >= 1.f) {
            std::cout << "FPS: " << frames << '\n';
            frames = 0; fpsAcc = 0.f;
        }

        glfwPollEvents();

        if (app.resetRequested) {
            app.resetRequested = false;
            water.clear();
            std::cout << "Water calmed.\n";
        }

        if (app.clickPending) {
            app.clickPending = false;
            float x = (float)(app.clickX / std::max(app.winW, 1)) * WORLD_W;
            float y = (float)(app.clickY / std::max(app.winH, 1)) * WORLD_H;
            ripples.drop(x, y, CLICK_RADIUS, CLICK_AMPLITUDE);
        }

        if (app.raining) {
            app.rainTimer += dt;
            while (app.rainTimer >= RAIN_INTERVAL) {
                app.rainTimer -= RAIN_INTERVAL;
                ripples.drop(rainX(rng), rainY(rng), RAIN_RADIUS, RAIN_AMPLITUDE);
            }
        }

        // Fixed-rate simulation
        int steps = clock.advance(dt);
        for (int s = 0; s < steps; ++s)
            waves.propagate(water, ripples, mesh);

        // Variable-rate render, interpolated between the last two steps
        int fbW, fbH;
        glfwGetFramebufferSize(window, &fbW, &fbH);
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glViewport(0, 0, fbW, fbH);
        glClear(GL_COLOR_BUFFER_BIT);

        float renderScale = (float)fbW / WORLD_W;
        waves.render(background, mesh, water, fbW, fbH, renderScale, clock.alpha());

        glfwSwapBuffers(window);
    }

    // --- Cleanup ------------------------------------------------------------
    glDeleteTextures(1, &background);
    mesh.release();
    water.release();
    ripples.release();
    waves.release();
}

// ============================================================================
//  main
// ============================================================================
int main() {
    // --- GLFW init ----------------------------------------------------------
    if (!glfwInit()) { std::cerr << "GLFW init failed\n"; return 1; }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);   // required on macOS
#endif
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);             // pond aspect is fixed

    GLFWwindow* window = glfwCreateWindow(app.winW, app.winH, "Koi Pond", nullptr, nullptr);
    if (!window) { std::cerr << "Window creation failed\n"; glfwTerminate(); return 1; }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);                                    // VSync

    glfwSetKeyCallback        (window, keyCallback);
    glfwSetMouseButtonCallback(window, mbCallback);
    glfwSetWindowSizeCallback (window, sizeCallback);

    glClearColor(1.f, 1.f, 1.f, 1.f);

    int status = 0;
    try {
        runPond(window);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        status = 1;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return status;
}
