// ============================================================================
// height_field.h — host-side height field and reference wave kernels
//
// Mirrors the GPU state texel for texel.  Each cell packs
//   r – current height   (packSigned)
//   g – previous height  (packSigned), read back as momentum
//   b – reserved momentum component (always 0 after a step)
//   a – reserved
//
// Rows are stored in texture order: row 0 is the first row handed to
// glTexImage2D, which is the bottom of the render target.  World y runs
// down the screen, so worldY() flips.
//
// propagateField() and shadeCell() perform the same arithmetic as the
// propagate and distort shaders; they define what the GPU is expected to
// produce and are what the tests check against.
// ============================================================================
#pragma once

#include <vector>
#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

#include "height_codec.h"

struct Cell {
    float r, g, b, a;
};

constexpr Cell NEUTRAL_CELL{HEIGHT_NEUTRAL, HEIGHT_NEUTRAL, 0.f, 0.f};

class HeightField {
public:
    int   width  = 0;
    int   height = 0;
    float scale  = 1.f;       // cells per world unit

    std::vector<Cell> cells;  // row-major: index = j*width + i

    HeightField() = default;
    HeightField(int w, int h, float s = 1.f)
        : width(std::max(w, 0)), height(std::max(h, 0)), scale(s)
    {
        cells.assign(size_t(width) * size_t(height), NEUTRAL_CELL);
    }

    bool empty() const { return width == 0 || height == 0; }

    int idx(int i, int j) const { return j * width + i; }

    Cell&       at(int i, int j)       { return cells[idx(i, j)]; }
    const Cell& at(int i, int j) const { return cells[idx(i, j)]; }

    // Out-of-range coordinates read the nearest edge cell (GL_CLAMP_TO_EDGE)
    const Cell& clamped(int i, int j) const {
        return at(std::clamp(i, 0, width - 1), std::clamp(j, 0, height - 1));
    }

    // Cell centres in world units
    float worldX(int i) const { return (i + 0.5f) / scale; }
    float worldY(int j) const { return (height - j - 0.5f) / scale; }

    void clear() { std::fill(cells.begin(), cells.end(), NEUTRAL_CELL); }

    // Signed height carried in the red channel
    float heightAt(int i, int j) const { return unpackSigned(at(i, j).r); }
    void  setHeight(int i, int j, float h) { at(i, j).r = packSigned(h); }

    // Sum of squared signed heights over the field
    double energy() const {
        double e = 0.0;
        for (const Cell& c : cells) {
            double h = unpackSigned(c.r);
            e += h * h;
        }
        return e;
    }

    // ------------------------------------------------------------------
    // Radial cosine bump added to the current height, centred at (x, y)
    // in world units.  Same profile as the ripple painter's shader.
    // ------------------------------------------------------------------
    void addDrop(float x, float y, float radius, float amplitude) {
        if (radius <= 0.f) return;
        constexpr float PI = 3.14159265358979f;
        for (int j = 0; j < height; ++j)
            for (int i = 0; i < width; ++i) {
                float dx = worldX(i) - x;
                float dy = worldY(j) - y;
                float d  = std::sqrt(dx * dx + dy * dy);
                if (d >= radius) continue;
                float bump = amplitude * (0.5f + 0.5f * std::cos(PI * d / radius));
                at(i, j).r += packSigned(bump) - HEIGHT_NEUTRAL;
            }
    }
};

// ----------------------------------------------------------------------------
// One propagation step from back into front (same dimensions).
// ----------------------------------------------------------------------------
inline void propagateField(const HeightField& back, HeightField& front, float damping) {
    if (back.empty() || back.width != front.width || back.height != front.height)
        return;

    for (int j = 0; j < back.height; ++j) {
        for (int i = 0; i < back.width; ++i) {
            const Cell& state = back.at(i, j);
            float hLeft  = back.clamped(i - 1, j).r;
            float hRight = back.clamped(i + 1, j).r;
            float hUp    = back.clamped(i, j - 1).r;
            float hDown  = back.clamped(i, j + 1).r;
            float momentum  = unpackSigned(state.g + state.b);
            float newHeight = (hLeft + hUp + hRight + hDown) - 2.f;

            front.at(i, j) = Cell{
                packSigned((newHeight - momentum) * damping),
                state.r,
                0.f,
                0.f};
        }
    }
}

// ----------------------------------------------------------------------------
// Distortion / shading
// ----------------------------------------------------------------------------

// Encoded heights blended between two states and decoded to [-3, 3]
inline float blendedHeight(const HeightField& back, const HeightField& front,
                           int i, int j, float time) {
    float b = back.clamped(i, j).r;
    float f = front.clamped(i, j).r;
    return decodeHeight(b + (f - b) * time);
}

struct SurfaceSample {
    glm::vec3 normal;
    glm::vec2 displacement;   // in uv units
    float     shiny;
};

const glm::vec4 DULL_FILTER_A{0.93f, 0.98f, 1.f, 1.f};
const glm::vec4 DULL_FILTER_B{0.92f, 0.97f, 1.f, 1.f};
const glm::vec4 SKY_COLOR    {0.88f, 0.96f, 1.f, 1.f};

// Heights are already decoded; size is the render target size in pixels
inline SurfaceSample shadeSurface(float left, float right, float down, float up,
                                  float depth, glm::vec2 size) {
    float dyx = right - left;
    float dyz = up - down;
    glm::vec3 normal = glm::cross(
        glm::normalize(glm::vec3(2.f, dyx, 0.f)),
        glm::normalize(glm::vec3(0.f, dyz, 2.f)));

    SurfaceSample s;
    s.normal       = normal;
    s.displacement = depth * glm::vec2(normal.x, normal.z) / size;
    s.shiny        = glm::dot(glm::normalize(glm::vec3(1.f, 0.f, 1.f)), normal);

    if (s.shiny < 0.f)
        s.shiny *= 0.5f;
    else if (s.shiny > 0.5f) // specular boost, hand tuned
        s.shiny *= 1.5f;

    return s;
}

inline SurfaceSample shadeCell(const HeightField& back, const HeightField& front,
                               int i, int j, float time, float depth, glm::vec2 size) {
    return shadeSurface(blendedHeight(back, front, i - 1, j, time),
                        blendedHeight(back, front, i + 1, j, time),
                        blendedHeight(back, front, i, j - 1, time),
                        blendedHeight(back, front, i, j + 1, time),
                        depth, size);
}

inline glm::vec4 compositeWater(glm::vec4 pixel, float shiny) {
    if (pixel.a == 0.f)
        pixel = glm::vec4(1.f);
    return glm::mix(DULL_FILTER_A * DULL_FILTER_B * pixel, SKY_COLOR, shiny);
}
