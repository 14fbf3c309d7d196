// ============================================================================
// gl_api.h — OpenGL 3.3 core entry points
//
// Every file that talks to the GPU includes this instead of a GL header
// directly, so the platform switch lives in one place.
// ============================================================================
#pragma once

#ifdef __APPLE__
    #include <OpenGL/gl3.h>          // macOS ships GL 3.3–4.1 in the framework
#else
    // Mesa / libglvnd export the full core API from libGL
    #ifndef GL_GLEXT_PROTOTYPES
        #define GL_GLEXT_PROTOTYPES 1
    #endif
    #include <GL/gl.h>
    #include <GL/glext.h>
#endif
