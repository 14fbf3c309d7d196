// ============================================================================
// mesh.h — static rectangle geometry shared by the water passes
//
// Vertices are vec2 positions in world units (8-byte stride), indices are
// 32-bit, two triangles per rectangle.  The attribute pointer is set by
// whoever draws, because each program resolves its own `position` slot.
// ============================================================================
#pragma once

#include <vector>

#include "gl_api.h"

struct Rect {
    float x, y, width, height;
};

class Mesh {
public:
    Mesh() = default;
    explicit Mesh(const std::vector<Rect>& rects);
    ~Mesh();

    Mesh(const Mesh&)            = delete;
    Mesh& operator=(const Mesh&) = delete;
    Mesh(Mesh&& other) noexcept;
    Mesh& operator=(Mesh&& other) noexcept;

    bool    empty()      const { return indexCount_ == 0; }
    GLsizei indexCount() const { return indexCount_; }

    // Binds the vertex array and points `location` at the positions
    void bind(GLint location) const;
    void draw() const;

    void release();

private:
    GLuint  vao_ = 0, vbo_ = 0, ebo_ = 0;
    GLsizei indexCount_ = 0;
};

// CPU side of the geometry, exposed for tests
void buildRectGeometry(const std::vector<Rect>& rects,
                       std::vector<float>& vertices,
                       std::vector<unsigned int>& indices);
