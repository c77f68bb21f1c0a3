// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "rasterbackend.h"
#include "util.h"
#include <stdio.h>

static const char *vertexsource =
   "#version 300 es\n"
   "in vec2 a_position;\n"
   "void main() {\n"
   "    gl_Position = vec4(a_position, 0.0, 1.0);\n"
   "}\n" ;

// gl_FragCoord.x is the pixel center (i + 0.5), so x +/- 1 divided by the
// width lands on the centers of the neighboring texels
static const char *fragmentsource =
   "#version 300 es\n"
   "precision highp float;\n"
   "uniform sampler2D u_state;\n"
   "uniform float u_width;\n"
   "uniform float u_rule[8];\n"
   "out vec4 fragcolor;\n"
   "void main() {\n"
   "    float x = gl_FragCoord.x;\n"
   "    float l = texture(u_state, vec2((x - 1.0) / u_width, 0.5)).r;\n"
   "    float c = texture(u_state, vec2(x / u_width, 0.5)).r;\n"
   "    float r = texture(u_state, vec2((x + 1.0) / u_width, 0.5)).r;\n"
   "    int index = (l > 0.5 ? 4 : 0) + (c > 0.5 ? 2 : 0) + (r > 0.5 ? 1 : 0);\n"
   "    fragcolor = vec4(u_rule[index], 0.0, 0.0, 1.0);\n"
   "}\n" ;

// full-row quad as a triangle strip
static const GLfloat quad[] = { -1.0f, -1.0f, 1.0f, -1.0f, -1.0f, 1.0f, 1.0f, 1.0f } ;

rasterbackend::rasterbackend() : program(0), quadbuffer(0), vertexarray(0),
      ruleloc(-1), widthloc(-1), stateloc(-1), lastrule(-1) {
   info = "raster: not initialized" ;
}

rasterbackend::~rasterbackend() {
   dispose() ;
}

int rasterbackend::glerror(const char *where) {
   GLenum e = glGetError() ;
   if (e == GL_NO_ERROR)
      return BACKEND_OK ;
   if (e == GL_CONTEXT_LOST_KHR || !ctx.checkreset()) {
      lost = 1 ;
      return fail(BACKEND_LOST, "raster: context lost during %s", where) ;
   }
   return fail(BACKEND_UNAVAILABLE, "raster: GL error 0x%x during %s", e, where) ;
}

int rasterbackend::buildprogram() {
   std::string log ;
   GLuint shaders[2] ;
   shaders[0] = LoadShader(GL_VERTEX_SHADER, vertexsource, log) ;
   if (shaders[0] == 0)
      return fail(BACKEND_UNAVAILABLE, "raster: %s", log.c_str()) ;
   shaders[1] = LoadShader(GL_FRAGMENT_SHADER, fragmentsource, log) ;
   if (shaders[1] == 0) {
      glDeleteShader(shaders[0]) ;
      return fail(BACKEND_UNAVAILABLE, "raster: %s", log.c_str()) ;
   }
   program = LinkProgram(shaders, 2, log) ;
   if (program == 0)
      return fail(BACKEND_UNAVAILABLE, "raster: %s", log.c_str()) ;
   ruleloc = glGetUniformLocation(program, "u_rule") ;
   widthloc = glGetUniformLocation(program, "u_width") ;
   stateloc = glGetUniformLocation(program, "u_state") ;
   GLint posloc = glGetAttribLocation(program, "a_position") ;
   if (ruleloc < 0 || widthloc < 0 || stateloc < 0 || posloc < 0)
      return fail(BACKEND_UNAVAILABLE, "raster: failed to get a location in the program") ;

   glGenVertexArrays(1, &vertexarray) ;
   glBindVertexArray(vertexarray) ;
   glGenBuffers(1, &quadbuffer) ;
   glBindBuffer(GL_ARRAY_BUFFER, quadbuffer) ;
   glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW) ;
   glEnableVertexAttribArray(posloc) ;
   glVertexAttribPointer(posloc, 2, GL_FLOAT, GL_FALSE, 0, 0) ;
   return glerror("program setup") ;
}

int rasterbackend::init(int w) {
   dispose() ;
   int r = checkwidth(w, 0) ;
   if (r != BACKEND_OK)
      return r ;
   const char *err = ctx.create(3, 0) ;
   if (err)
      return fail(BACKEND_UNAVAILABLE, "raster: %s", err) ;
   GLint maxtexture = 0 ;
   glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxtexture) ;
   r = checkwidth(w, maxtexture) ;
   if (r != BACKEND_OK) {
      dispose() ;
      return r ;
   }
   r = buildprogram() ;
   if (r != BACKEND_OK) {
      dispose() ;
      return r ;
   }

   std::vector<unsigned char> zeros(w, 0) ;
   glPixelStorei(GL_UNPACK_ALIGNMENT, 1) ;
   for (int i=0; i<2; i++) {
      rastertarget &t = targets[i] ;
      glGenTextures(1, &t.texture) ;
      glBindTexture(GL_TEXTURE_2D, t.texture) ;
      glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, w, 1, 0, GL_RED, GL_UNSIGNED_BYTE, &zeros[0]) ;
      glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST) ;
      glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST) ;
      glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT) ;
      glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE) ;
      glGenFramebuffers(1, &t.framebuffer) ;
      glBindFramebuffer(GL_FRAMEBUFFER, t.framebuffer) ;
      glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, t.texture, 0) ;
      if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE) {
         dispose() ;
         return fail(BACKEND_UNAVAILABLE, "raster: R8 framebuffer is incomplete") ;
      }
   }
   targets.resetroles() ;
   r = glerror("texture setup") ;
   if (r != BACKEND_OK) {
      dispose() ;
      return r ;
   }

   glUseProgram(program) ;
   glUniform1i(stateloc, 0) ;
   glUniform1f(widthloc, (GLfloat)w) ;
   glViewport(0, 0, w, 1) ;
   glDisable(GL_BLEND) ;
   glDisable(GL_DEPTH_TEST) ;
   glDisable(GL_DITHER) ;

   width = w ;
   lastrule = -1 ;
   lost = 0 ;
   busy = 0 ;
   pixels.resize(4 * (size_t)w) ;
   char buf[ECAMSGSIZE] ;
   snprintf(buf, sizeof(buf), "raster: %s; max texture %d",
            ctx.describe().c_str(), (int)maxtexture) ;
   info = buf ;
   return BACKEND_OK ;
}

int rasterbackend::upload(const generation &g) {
   if ((int)g.size() != width)
      return fail(INVALID_GRID_SIZE, "raster: upload of %d cells into a row of %d",
                  (int)g.size(), width) ;
   if (lost || !ctx.makecurrent())
      return fail(BACKEND_LOST, "raster: context lost before upload") ;
   std::vector<unsigned char> texels(width) ;
   for (int i=0; i<width; i++)
      texels[i] = g[i] ? 255 : 0 ;
   glPixelStorei(GL_UNPACK_ALIGNMENT, 1) ;
   glBindTexture(GL_TEXTURE_2D, targets.front().texture) ;
   glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, 1, GL_RED, GL_UNSIGNED_BYTE, &texels[0]) ;
   busy = 0 ;
   return glerror("upload") ;
}

int rasterbackend::readtarget(const rastertarget &t, generation &g) {
   // RGBA/UNSIGNED_BYTE is the one readback format every ES 3.0 driver
   // must accept; the cell is in the red channel
   glBindFramebuffer(GL_FRAMEBUFFER, t.framebuffer) ;
   glReadPixels(0, 0, width, 1, GL_RGBA, GL_UNSIGNED_BYTE, &pixels[0]) ;
   int r = glerror("readback") ;
   if (r != BACKEND_OK)
      return r ;
   g.resize(width) ;
   for (int i=0; i<width; i++)
      g[i] = pixels[4 * i] > 127 ? 1 : 0 ;
   return BACKEND_OK ;
}

int rasterbackend::readback(generation &g) {
   if (lost || !ctx.makecurrent())
      return fail(BACKEND_LOST, "raster: context lost before readback") ;
   return readtarget(targets.front(), g) ;
}

int rasterbackend::computenext(const ecarule &rule) {
   if (width <= 0)
      return fail(INVALID_GRID_SIZE, "raster: not initialized") ;
   if (lost || !ctx.checkreset()) {
      lost = 1 ;
      return fail(BACKEND_LOST, "raster: context lost") ;
   }
   glUseProgram(program) ;
   if (rule.getid() != lastrule) {
      GLfloat values[NUMNEIGHBORHOODS] ;
      const unsigned char *t = rule.gettable() ;
      for (int i=0; i<NUMNEIGHBORHOODS; i++)
         values[i] = t[i] ? 1.0f : 0.0f ;
      glUniform1fv(ruleloc, NUMNEIGHBORHOODS, values) ;
      lastrule = rule.getid() ;
   }
   glBindFramebuffer(GL_FRAMEBUFFER, targets.back().framebuffer) ;
   glViewport(0, 0, width, 1) ;
   glActiveTexture(GL_TEXTURE0) ;
   glBindTexture(GL_TEXTURE_2D, targets.front().texture) ;
   glBindVertexArray(vertexarray) ;
   glDrawArrays(GL_TRIANGLE_STRIP, 0, 4) ;
   int r = glerror("draw") ;
   if (r != BACKEND_OK)
      return r ;
   busy = 1 ;
   return BACKEND_OK ;
}

int rasterbackend::collect(generation &g) {
   if (!busy)
      return fail(BACKEND_UNAVAILABLE, "raster: no step in flight") ;
   if (lost || !ctx.makecurrent()) {
      lost = 1 ;
      return fail(BACKEND_LOST, "raster: context lost before collect") ;
   }
   int r = readtarget(targets.back(), g) ;
   if (r != BACKEND_OK)
      return r ;
   targets.swap() ;
   busy = 0 ;
   return BACKEND_OK ;
}

int rasterbackend::checkhealth() {
   if (!lost && ctx.iscreated() && !ctx.checkreset())
      lost = 1 ;
   return lost ? BACKEND_LOST : BACKEND_OK ;
}

void rasterbackend::dispose() {
   if (ctx.iscreated() && ctx.makecurrent()) {
      for (int i=0; i<2; i++) {
         if (targets[i].framebuffer)
            glDeleteFramebuffers(1, &targets[i].framebuffer) ;
         if (targets[i].texture)
            glDeleteTextures(1, &targets[i].texture) ;
      }
      if (quadbuffer)
         glDeleteBuffers(1, &quadbuffer) ;
      if (vertexarray)
         glDeleteVertexArrays(1, &vertexarray) ;
      if (program)
         glDeleteProgram(program) ;
   }
   // a lost context takes its objects with it
   ctx.destroy() ;
   targets[0] = rastertarget() ;
   targets[1] = rastertarget() ;
   program = quadbuffer = vertexarray = 0 ;
   ruleloc = widthloc = stateloc = -1 ;
   lastrule = -1 ;
   width = 0 ;
   busy = 0 ;
   std::vector<unsigned char>().swap(pixels) ;
}

static ecabackend *creator() { return new rasterbackend() ; }
void rasterbackend::doInitializeBackendInfo(staticBackendInfo &ai) {
   ai.setBackendName("Raster") ;
   ai.setBackendTier(TIER_RASTER) ;
   ai.setBackendCreator(&creator) ;
}
