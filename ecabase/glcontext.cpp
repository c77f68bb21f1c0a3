// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include <string.h>     // for strstr, strlen, strcmp

#include "glcontext.h"

// -----------------------------------------------------------------------------

// the display is shared by every context in the process

static EGLDisplay shareddisplay = EGL_NO_DISPLAY;
static int displayrefs = 0;

static bool HasToken(const char* list, const char* name)
{
    if (list == NULL) return false;
    size_t len = strlen(name);
    const char* p = list;
    while ((p = strstr(p, name)) != NULL) {
        if ((p == list || p[-1] == ' ') && (p[len] == ' ' || p[len] == 0))
            return true;
        p += len;
    }
    return false;
}

// -----------------------------------------------------------------------------

static EGLDisplay AcquireDisplay()
{
    if (displayrefs > 0) {
        displayrefs++;
        return shareddisplay;
    }

    EGLDisplay dpy = EGL_NO_DISPLAY;

    // prefer a surfaceless platform display so no window system is needed
    const char* clientexts = eglQueryString(EGL_NO_DISPLAY, EGL_EXTENSIONS);
    if (HasToken(clientexts, "EGL_MESA_platform_surfaceless") &&
        HasToken(clientexts, "EGL_EXT_platform_base")) {
        PFNEGLGETPLATFORMDISPLAYEXTPROC getplatformdisplay =
            (PFNEGLGETPLATFORMDISPLAYEXTPROC) eglGetProcAddress("eglGetPlatformDisplayEXT");
        if (getplatformdisplay) {
            dpy = getplatformdisplay(EGL_PLATFORM_SURFACELESS_MESA, EGL_DEFAULT_DISPLAY, NULL);
        }
    }
    if (dpy == EGL_NO_DISPLAY) dpy = eglGetDisplay(EGL_DEFAULT_DISPLAY);
    if (dpy == EGL_NO_DISPLAY) return EGL_NO_DISPLAY;

    EGLint major, minor;
    if (!eglInitialize(dpy, &major, &minor)) return EGL_NO_DISPLAY;

    shareddisplay = dpy;
    displayrefs = 1;
    return dpy;
}

// -----------------------------------------------------------------------------

static void ReleaseDisplay()
{
    if (displayrefs <= 0) return;
    displayrefs--;
    if (displayrefs == 0) {
        eglMakeCurrent(shareddisplay, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        eglTerminate(shareddisplay);
        shareddisplay = EGL_NO_DISPLAY;
    }
}

// -----------------------------------------------------------------------------

glcontext::glcontext()
{
    display = EGL_NO_DISPLAY;
    context = EGL_NO_CONTEXT;
    surface = EGL_NO_SURFACE;
    robust = false;
    lost = false;
    getresetstatus = NULL;
}

// -----------------------------------------------------------------------------

glcontext::~glcontext()
{
    destroy();
}

// -----------------------------------------------------------------------------

const char* glcontext::create(int major, int minor)
{
    destroy();

    display = AcquireDisplay();
    if (display == EGL_NO_DISPLAY) return "No EGL display is available.";

    if (!eglBindAPI(EGL_OPENGL_ES_API)) {
        destroy();
        return "EGL cannot bind the OpenGL ES API.";
    }

    const char* exts = eglQueryString(display, EGL_EXTENSIONS);
    bool surfaceless = HasToken(exts, "EGL_KHR_surfaceless_context");
    bool canberobust = HasToken(exts, "EGL_EXT_create_context_robustness");

    EGLint configattribs[] = {
        EGL_RENDERABLE_TYPE, EGL_OPENGL_ES3_BIT,
        EGL_SURFACE_TYPE, surfaceless ? 0 : EGL_PBUFFER_BIT,
        EGL_NONE
    };
    EGLConfig config;
    EGLint numconfigs = 0;
    if (!eglChooseConfig(display, configattribs, &config, 1, &numconfigs) || numconfigs < 1) {
        destroy();
        return "No EGL config supports OpenGL ES 3.";
    }

    if (canberobust) {
        EGLint robustattribs[] = {
            EGL_CONTEXT_MAJOR_VERSION, major,
            EGL_CONTEXT_MINOR_VERSION, minor,
            EGL_CONTEXT_OPENGL_ROBUST_ACCESS_EXT, EGL_TRUE,
            EGL_CONTEXT_OPENGL_RESET_NOTIFICATION_STRATEGY_EXT, EGL_LOSE_CONTEXT_ON_RESET_EXT,
            EGL_NONE
        };
        context = eglCreateContext(display, config, EGL_NO_CONTEXT, robustattribs);
        robust = context != EGL_NO_CONTEXT;
    }
    if (context == EGL_NO_CONTEXT) {
        // the driver may refuse robust access; a plain context still works
        EGLint attribs[] = {
            EGL_CONTEXT_MAJOR_VERSION, major,
            EGL_CONTEXT_MINOR_VERSION, minor,
            EGL_NONE
        };
        context = eglCreateContext(display, config, EGL_NO_CONTEXT, attribs);
    }
    if (context == EGL_NO_CONTEXT) {
        destroy();
        return "EGL could not create an OpenGL ES context of the requested version.";
    }

    if (!surfaceless) {
        EGLint pbufferattribs[] = { EGL_WIDTH, 1, EGL_HEIGHT, 1, EGL_NONE };
        surface = eglCreatePbufferSurface(display, config, pbufferattribs);
        if (surface == EGL_NO_SURFACE) {
            destroy();
            return "EGL could not create a pbuffer surface.";
        }
    }

    if (!eglMakeCurrent(display, surface, surface, context)) {
        destroy();
        return "EGL could not make the new context current.";
    }

    // the core entry point exists from ES 3.2, otherwise use an extension
    if (robust) {
        GLint glmajor = 0, glminor = 0;
        glGetIntegerv(GL_MAJOR_VERSION, &glmajor);
        glGetIntegerv(GL_MINOR_VERSION, &glminor);
        if (glmajor > 3 || (glmajor == 3 && glminor >= 2)) {
            getresetstatus = (PFNGLGETGRAPHICSRESETSTATUSEXTPROC)
                eglGetProcAddress("glGetGraphicsResetStatus");
        }
        if (getresetstatus == NULL && hasextension("GL_EXT_robustness")) {
            getresetstatus = (PFNGLGETGRAPHICSRESETSTATUSEXTPROC)
                eglGetProcAddress("glGetGraphicsResetStatusEXT");
        }
        if (getresetstatus == NULL && hasextension("GL_KHR_robustness")) {
            getresetstatus = (PFNGLGETGRAPHICSRESETSTATUSEXTPROC)
                eglGetProcAddress("glGetGraphicsResetStatusKHR");
        }
    }

    lost = false;
    return NULL;
}

// -----------------------------------------------------------------------------

void glcontext::destroy()
{
    if (display != EGL_NO_DISPLAY) {
        if (eglGetCurrentContext() == context)
            eglMakeCurrent(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        if (surface != EGL_NO_SURFACE) eglDestroySurface(display, surface);
        if (context != EGL_NO_CONTEXT) eglDestroyContext(display, context);
        ReleaseDisplay();
    }
    display = EGL_NO_DISPLAY;
    context = EGL_NO_CONTEXT;
    surface = EGL_NO_SURFACE;
    robust = false;
    lost = false;
    getresetstatus = NULL;
}

// -----------------------------------------------------------------------------

bool glcontext::makecurrent()
{
    if (lost || context == EGL_NO_CONTEXT) return false;
    if (eglGetCurrentContext() == context) return true;
    if (!eglMakeCurrent(display, surface, surface, context)) {
        if (eglGetError() == EGL_CONTEXT_LOST) lost = true;
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------

bool glcontext::checkreset()
{
    if (lost) return false;
    if (!makecurrent()) return false;
    if (getresetstatus && getresetstatus() != GL_NO_ERROR) lost = true;
    return !lost;
}

// -----------------------------------------------------------------------------

std::string glcontext::describe()
{
    std::string s;
    if (!makecurrent()) return s;
    const char* version = (const char*) glGetString(GL_VERSION);
    const char* vendor = (const char*) glGetString(GL_VENDOR);
    const char* renderer = (const char*) glGetString(GL_RENDERER);
    s += version ? version : "unknown version";
    s += "; ";
    s += vendor ? vendor : "unknown vendor";
    s += "; ";
    s += renderer ? renderer : "unknown renderer";
    if (robust) s += "; robust";
    return s;
}

// -----------------------------------------------------------------------------

bool glcontext::hasextension(const char* name)
{
    GLint count = 0;
    glGetIntegerv(GL_NUM_EXTENSIONS, &count);
    for (GLint i = 0; i < count; i++) {
        const char* ext = (const char*) glGetStringi(GL_EXTENSIONS, (GLuint)i);
        if (ext && strcmp(ext, name) == 0) return true;
    }
    return false;
}

// -----------------------------------------------------------------------------

GLuint LoadShader(GLenum type, const char* shader_source, std::string& log)
{
    // create a shader object, load the shader source, and compile the shader

    GLuint shader = glCreateShader(type);
    if (shader == 0) {
        log = "glCreateShader failed";
        return 0;
    }

    glShaderSource(shader, 1, &shader_source, NULL);

    glCompileShader(shader);

    // check the compile status
    GLint compiled;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (!compiled) {
        char buf[1024];
        GLsizei len = 0;
        glGetShaderInfoLog(shader, sizeof(buf), &len, buf);
        log = "Error compiling shader: ";
        log.append(buf, len);
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

// -----------------------------------------------------------------------------

GLuint LinkProgram(const GLuint* shaders, int count, std::string& log)
{
    GLuint program = glCreateProgram();
    if (program == 0) {
        log = "glCreateProgram failed";
    } else {
        for (int i = 0; i < count; i++) glAttachShader(program, shaders[i]);

        glLinkProgram(program);

        // check the link status
        GLint linked;
        glGetProgramiv(program, GL_LINK_STATUS, &linked);
        if (!linked) {
            char buf[1024];
            GLsizei len = 0;
            glGetProgramInfoLog(program, sizeof(buf), &len, buf);
            log = "Error linking program: ";
            log.append(buf, len);
            glDeleteProgram(program);
            program = 0;
        }
    }

    // the program keeps what it needs
    for (int i = 0; i < count; i++) glDeleteShader(shaders[i]);
    return program;
}
