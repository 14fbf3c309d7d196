// ============================================================================
// shader.h — compiled GLSL program with fail-fast symbol lookup
// ============================================================================
#pragma once

#include <stdexcept>
#include <string>

#include "gl_api.h"

// Compile, link or symbol-resolution failure.  The message names the
// program, the stage and the driver's info log.
class ShaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Shader {
public:
    // Throws ShaderError; nothing is leaked on failure.
    Shader(std::string name, const char* vertexSrc, const char* fragmentSrc);
    ~Shader();

    Shader(const Shader&)            = delete;
    Shader& operator=(const Shader&) = delete;
    Shader(Shader&& other) noexcept;
    Shader& operator=(Shader&& other) noexcept;

    void use() const;

    // Throw ShaderError if the symbol is not active in the linked program
    GLint uniform(const char* name) const;
    GLint attribute(const char* name) const;

    GLuint program() const { return program_; }
    const std::string& name() const { return name_; }

    // Deletes the GL program; safe to call more than once
    void release();

private:
    std::string name_;
    GLuint      program_ = 0;
};

// Prepends the version line and the shared height codec to a shader body
std::string fragmentSource(const char* body);
