#include "water_plane.h"

#include <cmath>
#include <stdexcept>

static int cellCount(float world, float scale) {
    if (world <= 0.f || scale <= 0.f) return 0;
    return (int)std::ceil(world * scale);
}

WaterPlane::WaterPlane(float worldWidth, float worldHeight, float scale)
    : width_(cellCount(worldWidth, scale)),
      height_(cellCount(worldHeight, scale)),
      scale_(scale)
{
    if (empty()) {
        width_ = height_ = 0;
        return;
    }
    buffers_ = PingPong<RenderTarget>(RenderTarget(width_, height_),
                                      RenderTarget(width_, height_));
    clear();
}

void WaterPlane::clear() {
    if (empty()) return;

    GLint previous = 0;
    GLfloat clearColor[4] = {0.f, 0.f, 0.f, 0.f};
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &previous);
    glGetFloatv(GL_COLOR_CLEAR_VALUE, clearColor);
    glClearColor(HEIGHT_NEUTRAL, HEIGHT_NEUTRAL, 0.f, 0.f);
    for (int i = 0; i < 2; ++i) {
        glBindFramebuffer(GL_FRAMEBUFFER, buffers_.slot(i).framebuffer());
        glClear(GL_COLOR_BUFFER_BIT);
    }
    glClearColor(clearColor[0], clearColor[1], clearColor[2], clearColor[3]);
    glBindFramebuffer(GL_FRAMEBUFFER, (GLuint)previous);
}

void WaterPlane::upload(const HeightField& field) {
    if (field.width != width_ || field.height != height_)
        throw std::invalid_argument("WaterPlane::upload: field size does not match the plane");
    if (empty()) return;

    glBindTexture(GL_TEXTURE_2D, front().texture());
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width_, height_, GL_RGBA, GL_FLOAT,
                    field.cells.data());
}

HeightField WaterPlane::download() const {
    HeightField field(width_, height_, scale_);
    if (empty()) return field;

    GLint previous = 0;
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &previous);
    glBindFramebuffer(GL_FRAMEBUFFER, front().framebuffer());
    glPixelStorei(GL_PACK_ALIGNMENT, 4);
    glReadPixels(0, 0, width_, height_, GL_RGBA, GL_FLOAT, field.cells.data());
    glBindFramebuffer(GL_FRAMEBUFFER, (GLuint)previous);
    return field;
}

void WaterPlane::release() {
    buffers_.slot(0).release();
    buffers_.slot(1).release();
}
