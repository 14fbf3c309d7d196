#include "render_target.h"

#include <stdexcept>
#include <string>
#include <utility>

static void setSamplerState(GLenum filter) {
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
}

RenderTarget::RenderTarget(int width, int height)
    : width_(width), height_(height)
{
    GLint previous = 0;
    glGetIntegerv(GL_FRAMEBUFFER_BINDING, &previous);

    glGenTextures(1, &texture_);
    glBindTexture(GL_TEXTURE_2D, texture_);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA16F, width, height, 0, GL_RGBA, GL_FLOAT, nullptr);
    setSamplerState(GL_LINEAR);

    glGenFramebuffers(1, &framebuffer_);
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer_);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, texture_, 0);
    GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, (GLuint)previous);

    if (status != GL_FRAMEBUFFER_COMPLETE) {
        release();
        throw std::runtime_error("Water buffer framebuffer incomplete (status " +
                                 std::to_string(status) + ")");
    }
}

RenderTarget::~RenderTarget() {
    release();
}

RenderTarget::RenderTarget(RenderTarget&& other) noexcept
    : texture_(std::exchange(other.texture_, 0)),
      framebuffer_(std::exchange(other.framebuffer_, 0)),
      width_(other.width_), height_(other.height_) {}

RenderTarget& RenderTarget::operator=(RenderTarget&& other) noexcept {
    if (this != &other) {
        release();
        texture_     = std::exchange(other.texture_, 0);
        framebuffer_ = std::exchange(other.framebuffer_, 0);
        width_  = other.width_;
        height_ = other.height_;
    }
    return *this;
}

void RenderTarget::target() const {
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer_);
    glViewport(0, 0, width_, height_);
}

void RenderTarget::release() {
    if (framebuffer_) { glDeleteFramebuffers(1, &framebuffer_); framebuffer_ = 0; }
    if (texture_)     { glDeleteTextures(1, &texture_);         texture_ = 0; }
}

GLuint createColorTexture(int width, int height, const unsigned char* rgba) {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, rgba);
    setSamplerState(GL_LINEAR);
    return texture;
}
