#include "shader.h"

#include <utility>
#include <vector>

#include "height_codec.h"

// ============================================================================
//  Shader helpers
// ============================================================================

static std::string infoLog(GLuint object, bool isProgram) {
    GLint length = 0;
    if (isProgram) glGetProgramiv(object, GL_INFO_LOG_LENGTH, &length);
    else           glGetShaderiv (object, GL_INFO_LOG_LENGTH, &length);
    if (length <= 1) return "(no log)";

    std::vector<char> log(length);
    if (isProgram) glGetProgramInfoLog(object, length, nullptr, log.data());
    else           glGetShaderInfoLog (object, length, nullptr, log.data());
    return std::string(log.data());
}

static GLuint compileShader(const std::string& program, GLenum type, const char* src) {
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, nullptr);
    glCompileShader(s);
    GLint ok = GL_FALSE;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        std::string log = infoLog(s, false);
        glDeleteShader(s);
        throw ShaderError(program + ": " +
                          (type == GL_VERTEX_SHADER ? "vertex" : "fragment") +
                          " shader compile error:\n" + log);
    }
    return s;
}

Shader::Shader(std::string name, const char* vertexSrc, const char* fragmentSrc)
    : name_(std::move(name))
{
    GLuint v = compileShader(name_, GL_VERTEX_SHADER, vertexSrc);
    GLuint f = 0;
    try {
        f = compileShader(name_, GL_FRAGMENT_SHADER, fragmentSrc);
    } catch (...) {
        glDeleteShader(v);
        throw;
    }

    GLuint p = glCreateProgram();
    glAttachShader(p, v);
    glAttachShader(p, f);
    glLinkProgram(p);
    glDeleteShader(v);
    glDeleteShader(f);

    GLint ok = GL_FALSE;
    glGetProgramiv(p, GL_LINK_STATUS, &ok);
    if (!ok) {
        std::string log = infoLog(p, true);
        glDeleteProgram(p);
        throw ShaderError(name_ + ": program link error:\n" + log);
    }
    program_ = p;
}

Shader::~Shader() {
    release();
}

Shader::Shader(Shader&& other) noexcept
    : name_(std::move(other.name_)), program_(std::exchange(other.program_, 0)) {}

Shader& Shader::operator=(Shader&& other) noexcept {
    if (this != &other) {
        release();
        name_    = std::move(other.name_);
        program_ = std::exchange(other.program_, 0);
    }
    return *this;
}

void Shader::use() const {
    glUseProgram(program_);
}

GLint Shader::uniform(const char* name) const {
    GLint location = glGetUniformLocation(program_, name);
    if (location == -1)
        throw ShaderError(name_ + ": no active uniform '" + name + "'");
    return location;
}

GLint Shader::attribute(const char* name) const {
    GLint location = glGetAttribLocation(program_, name);
    if (location == -1)
        throw ShaderError(name_ + ": no active attribute '" + name + "'");
    return location;
}

void Shader::release() {
    if (program_ != 0) {
        glDeleteProgram(program_);
        program_ = 0;
    }
}

std::string fragmentSource(const char* body) {
    return std::string("#version 330 core\n") + heightCodecGlsl + body;
}
