// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#ifndef _GLCONTEXT_H_
#define _GLCONTEXT_H_

#include <EGL/egl.h>
#include <EGL/eglext.h>
#include <GLES3/gl31.h>
#include <GLES2/gl2ext.h>   // for the robustness entry points

#include <string>

// An off-screen OpenGL ES context created through EGL.  Each GPU backend
// owns one.  The EGL display is shared and reference counted so that
// several contexts can coexist in one process.
//
// Device loss is latched: once the driver reports a reset (or the
// context cannot be made current) islost() stays true until destroy().

class glcontext {
public:
    glcontext();
    ~glcontext();

    // create a context for OpenGL ES major.minor; returns NULL on success,
    // otherwise an error message
    const char* create(int major, int minor);
    void destroy();
    bool iscreated() const { return context != EGL_NO_CONTEXT; }

    // make this context current on the calling thread; false if lost
    bool makecurrent();

    // poll the driver's reset status and latch any loss; returns false
    // once the context has been lost
    bool checkreset();
    bool islost() const { return lost; }
    bool isrobust() const { return robust; }

    // GL_VERSION, GL_VENDOR and GL_RENDERER on one line
    std::string describe();

    bool hasextension(const char* name);

private:
    EGLDisplay display;
    EGLContext context;
    EGLSurface surface;
    bool robust;
    bool lost;
    PFNGLGETGRAPHICSRESETSTATUSEXTPROC getresetstatus;
};

// compile a shader; returns 0 and fills log on failure
GLuint LoadShader(GLenum type, const char* shader_source, std::string& log);

// link the given shaders into a program (the shaders are deleted);
// returns 0 and fills log on failure
GLuint LinkProgram(const GLuint* shaders, int count, std::string& log);

#endif
