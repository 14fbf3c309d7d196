// ============================================================================
// render_target.h — float texture with its own framebuffer
// ============================================================================
#pragma once

#include "gl_api.h"

class RenderTarget {
public:
    RenderTarget() = default;
    // RGBA16F, linear filtering, clamp-to-edge.  Throws std::runtime_error
    // if the framebuffer is incomplete.
    RenderTarget(int width, int height);
    ~RenderTarget();

    RenderTarget(const RenderTarget&)            = delete;
    RenderTarget& operator=(const RenderTarget&) = delete;
    RenderTarget(RenderTarget&& other) noexcept;
    RenderTarget& operator=(RenderTarget&& other) noexcept;

    // Bind the framebuffer and cover it with the viewport
    void target() const;

    GLuint texture()     const { return texture_; }
    GLuint framebuffer() const { return framebuffer_; }
    int    width()       const { return width_; }
    int    height()      const { return height_; }

    void release();

private:
    GLuint texture_     = 0;
    GLuint framebuffer_ = 0;
    int    width_  = 0;
    int    height_ = 0;
};

// RGBA8 texture from tightly packed rows, first row at the bottom.
// Linear filtering, clamp-to-edge.  Caller owns the handle.
GLuint createColorTexture(int width, int height, const unsigned char* rgba);
