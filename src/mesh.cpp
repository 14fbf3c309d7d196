#include "mesh.h"

#include <utility>

void buildRectGeometry(const std::vector<Rect>& rects,
                       std::vector<float>& vertices,
                       std::vector<unsigned int>& indices) {
    vertices.clear();
    indices.clear();
    vertices.reserve(rects.size() * 8);
    indices.reserve(rects.size() * 6);

    for (const Rect& r : rects) {
        if (r.width <= 0.f || r.height <= 0.f) continue;

        unsigned tl = (unsigned)(vertices.size() / 2);
        unsigned tr = tl + 1;
        unsigned bl = tl + 2;
        unsigned br = tl + 3;
        const float quad[] = {
            r.x,           r.y,
            r.x + r.width, r.y,
            r.x,           r.y + r.height,
            r.x + r.width, r.y + r.height,
        };
        vertices.insert(vertices.end(), quad, quad + 8);
        indices.push_back(tl); indices.push_back(bl); indices.push_back(tr);
        indices.push_back(tr); indices.push_back(bl); indices.push_back(br);
    }
}

Mesh::Mesh(const std::vector<Rect>& rects) {
    std::vector<float> vertices;
    std::vector<unsigned int> indices;
    buildRectGeometry(rects, vertices, indices);
    if (indices.empty()) return;

    glGenVertexArrays(1, &vao_);
    glGenBuffers(1, &vbo_);
    glGenBuffers(1, &ebo_);

    glBindVertexArray(vao_);
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    glBufferData(GL_ARRAY_BUFFER,
                 (GLsizeiptr)(vertices.size() * sizeof(float)),
                 vertices.data(), GL_STATIC_DRAW);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo_);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER,
                 (GLsizeiptr)(indices.size() * sizeof(unsigned)),
                 indices.data(), GL_STATIC_DRAW);
    glBindVertexArray(0);

    indexCount_ = (GLsizei)indices.size();
}

Mesh::~Mesh() {
    release();
}

Mesh::Mesh(Mesh&& other) noexcept
    : vao_(std::exchange(other.vao_, 0)),
      vbo_(std::exchange(other.vbo_, 0)),
      ebo_(std::exchange(other.ebo_, 0)),
      indexCount_(std::exchange(other.indexCount_, 0)) {}

Mesh& Mesh::operator=(Mesh&& other) noexcept {
    if (this != &other) {
        release();
        vao_ = std::exchange(other.vao_, 0);
        vbo_ = std::exchange(other.vbo_, 0);
        ebo_ = std::exchange(other.ebo_, 0);
        indexCount_ = std::exchange(other.indexCount_, 0);
    }
    return *this;
}

void Mesh::bind(GLint location) const {
    glBindVertexArray(vao_);
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    // layout: vec2 position
    glVertexAttribPointer((GLuint)location, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), (void*)0);
    glEnableVertexAttribArray((GLuint)location);
}

void Mesh::draw() const {
    glDrawElements(GL_TRIANGLES, indexCount_, GL_UNSIGNED_INT, 0);
}

void Mesh::release() {
    if (vao_) { glDeleteVertexArrays(1, &vao_); vao_ = 0; }
    if (vbo_) { glDeleteBuffers(1, &vbo_); vbo_ = 0; }
    if (ebo_) { glDeleteBuffers(1, &ebo_); ebo_ = 0; }
    indexCount_ = 0;
}
