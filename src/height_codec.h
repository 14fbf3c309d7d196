// ============================================================================
// height_codec.h — mapping between physical wave values and texel storage
//
// Two affine maps are in use:
//   packSigned / unpackSigned   [-1, 1] <-> [0, 1]   (propagation state)
//   encodeHeight / decodeHeight [-3, 3] <-> [0, 1]   (shading read)
//
// The GLSL snippet below defines the exact same functions and is pasted
// into every fragment shader, so the constants exist once per language.
// ============================================================================
#pragma once

constexpr float HEIGHT_NEUTRAL = 0.5f;
constexpr float HEIGHT_RANGE   = 3.f;

constexpr float packSigned  (float x) { return x * 0.5f + 0.5f; }
constexpr float unpackSigned(float v) { return v * 2.f - 1.f; }

constexpr float encodeHeight(float h) { return h / (2.f * HEIGHT_RANGE) + 0.5f; }
constexpr float decodeHeight(float v) { return v * (2.f * HEIGHT_RANGE) - HEIGHT_RANGE; }

inline constexpr const char* heightCodecGlsl = R"(
const float HEIGHT_NEUTRAL = 0.5;

float packSigned(float x)   { return x * 0.5 + 0.5; }
float unpackSigned(float v) { return v * 2.0 - 1.0; }

float encodeHeight(float h) { return h / 6.0 + 0.5; }
float decodeHeight(float v) { return v * 6.0 - 3.0; }
)";
