// This file is part of Ecaline.
// See docs/License.html for the copyright notice.

#include "computebackend.h"
#include "ecaprefs.h"
#include "util.h"
#include <stdio.h>
#include <string.h>

// printf format: %d is the workgroup size, %% the modulo operator
static const char *computesource =
   "#version 310 es\n"
   "layout(local_size_x = %d) in;\n"
   "layout(std430, binding = 0) readonly buffer InputState { uint cells_in[]; };\n"
   "layout(std430, binding = 1) writeonly buffer OutputState { uint cells_out[]; };\n"
   "layout(std140, binding = 2) uniform Params {\n"
   "    uint grid_size;\n"
   "    uvec4 rule[2];\n"
   "};\n"
   "void main() {\n"
   "    uint i = gl_GlobalInvocationID.x;\n"
   "    if (i >= grid_size) return;\n"
   "    uint left = cells_in[(i + grid_size - 1u) %% grid_size];\n"
   "    uint center = cells_in[i];\n"
   "    uint right = cells_in[(i + 1u) %% grid_size];\n"
   "    uint index = (left << 2u) | (center << 1u) | right;\n"
   "    cells_out[i] = rule[index >> 2u][index & 3u];\n"
   "}\n" ;

// rule used by the validation dispatch: an all-dead row becomes all-live
const int VALIDATION_RULE = 1 ;

computebackend::computebackend() : program(0), parambuffer(0), staging(0),
      fence(0), issuetime(0), lastrule(-1), validating(0),
      workgroup(64), timeoutms(2000) {
   buffers[0] = buffers[1] = 0 ;
   info = "compute: not initialized" ;
}

computebackend::~computebackend() {
   dispose() ;
}

void computebackend::setoptions(const ecaprefs &prefs) {
   ecabackend::setoptions(prefs) ;
   workgroup = prefs.workgroup_size ;
   timeoutms = prefs.readback_timeout_ms ;
}

int computebackend::glerror(const char *where) {
   GLenum e = glGetError() ;
   if (e == GL_NO_ERROR)
      return BACKEND_OK ;
   if (e == GL_CONTEXT_LOST_KHR || !ctx.checkreset()) {
      lost = 1 ;
      return fail(BACKEND_LOST, "compute: context lost during %s", where) ;
   }
   return fail(BACKEND_UNAVAILABLE, "compute: GL error 0x%x during %s", e, where) ;
}

std::string computeshadersource(int workgroup) {
   char source[2048] ;
   snprintf(source, sizeof(source), computesource, workgroup) ;
   return source ;
}

int computebackend::buildprogram() {
   std::string source = computeshadersource(workgroup) ;
   std::string log ;
   GLuint shader = LoadShader(GL_COMPUTE_SHADER, source.c_str(), log) ;
   if (shader == 0)
      return fail(BACKEND_UNAVAILABLE, "compute: %s", log.c_str()) ;
   program = LinkProgram(&shader, 1, log) ;
   if (program == 0)
      return fail(BACKEND_UNAVAILABLE, "compute: %s", log.c_str()) ;
   return BACKEND_OK ;
}

void computebackend::setparams(int ruleid) {
   computeparams p ;
   memset(&p, 0, sizeof(p)) ;
   p.gridsize = (GLuint)width ;
   const unsigned char *t = ruletable(ruleid) ;
   for (int i=0; i<NUMNEIGHBORHOODS; i++)
      p.rule[i] = t[i] ;
   glBindBuffer(GL_UNIFORM_BUFFER, parambuffer) ;
   glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(p), &p) ;
   lastrule = ruleid ;
}

// the bindings follow the roles, so they are rebuilt after every swap
void computebackend::bindstate() {
   glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 0, buffers.front()) ;
   glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 1, buffers.back()) ;
   glBindBufferBase(GL_UNIFORM_BUFFER, 2, parambuffer) ;
}

void computebackend::dispatch() {
   glUseProgram(program) ;
   glDispatchCompute((GLuint)((width + workgroup - 1) / workgroup), 1, 1) ;
   glMemoryBarrier(GL_SHADER_STORAGE_BARRIER_BIT | GL_BUFFER_UPDATE_BARRIER_BIT) ;
   glBindBuffer(GL_COPY_READ_BUFFER, buffers.back()) ;
   glBindBuffer(GL_COPY_WRITE_BUFFER, staging) ;
   glCopyBufferSubData(GL_COPY_READ_BUFFER, GL_COPY_WRITE_BUFFER, 0, 0,
                       (GLsizeiptr)width * sizeof(GLuint)) ;
   fence = glFenceSync(GL_SYNC_GPU_COMMANDS_COMPLETE, 0) ;
   glFlush() ;
   issuetime = ecaSecondCount() ;
}

void computebackend::dropfence() {
   if (fence) {
      glDeleteSync(fence) ;
      fence = 0 ;
   }
}

// non-blocking check of the fence
int computebackend::waitfence(double deadline) {
   if (fence == 0)
      return fail(BACKEND_LOST, "compute: no fence to wait on") ;
   GLenum r = glClientWaitSync(fence, 0, 0) ;
   if (r == GL_ALREADY_SIGNALED || r == GL_CONDITION_SATISFIED) {
      dropfence() ;
      return BACKEND_OK ;
   }
   if (r == GL_WAIT_FAILED) {
      dropfence() ;
      lost = 1 ;
      return fail(BACKEND_LOST, "compute: fence wait failed") ;
   }
   if (!ctx.checkreset()) {
      dropfence() ;
      lost = 1 ;
      return fail(BACKEND_LOST, "compute: context lost while waiting for readback") ;
   }
   if (deadline > 0 && ecaSecondCount() > deadline) {
      dropfence() ;
      return fail(COMPUTE_TIMEOUT, "compute: readback did not resolve within %d ms", timeoutms) ;
   }
   return BACKEND_PENDING ;
}

int computebackend::mapstaging(GLuint buffer, generation &g) {
   glBindBuffer(GL_COPY_READ_BUFFER, buffer) ;
   void *p = glMapBufferRange(GL_COPY_READ_BUFFER, 0, (GLsizeiptr)width * sizeof(GLuint),
                              GL_MAP_READ_BIT) ;
   if (p == 0) {
      int r = glerror("map") ;
      return r != BACKEND_OK ? r : fail(BACKEND_LOST, "compute: readback could not be mapped") ;
   }
   const GLuint *src = (const GLuint *)p ;
   g.resize(width) ;
   for (int i=0; i<width; i++)
      g[i] = src[i] ? 1 : 0 ;
   if (glUnmapBuffer(GL_COPY_READ_BUFFER) == GL_FALSE) {
      lost = 1 ;
      return fail(BACKEND_LOST, "compute: staging buffer contents were lost") ;
   }
   return BACKEND_OK ;
}

int computebackend::init(int w) {
   dispose() ;
   int r = checkwidth(w, 0) ;
   if (r != BACKEND_OK)
      return r ;
   const char *err = ctx.create(3, 1) ;
   if (err)
      return fail(BACKEND_UNAVAILABLE, "compute: %s", err) ;

   GLint maxblock = 0, maxcount = 0, maxsize = 0, maxinvocations = 0 ;
   glGetIntegerv(GL_MAX_SHADER_STORAGE_BLOCK_SIZE, &maxblock) ;
   glGetIntegeri_v(GL_MAX_COMPUTE_WORK_GROUP_COUNT, 0, &maxcount) ;
   glGetIntegeri_v(GL_MAX_COMPUTE_WORK_GROUP_SIZE, 0, &maxsize) ;
   glGetIntegerv(GL_MAX_COMPUTE_WORK_GROUP_INVOCATIONS, &maxinvocations) ;
   if (workgroup > maxsize || workgroup > maxinvocations) {
      dispose() ;
      return fail(BACKEND_UNAVAILABLE, "compute: workgroup size %d exceeds the device limit of %d",
                  workgroup, maxsize < maxinvocations ? maxsize : maxinvocations) ;
   }
   long long limit = maxblock / (long long)sizeof(GLuint) ;
   long long dispatchlimit = (long long)maxcount * workgroup ;
   if (dispatchlimit < limit)
      limit = dispatchlimit ;
   if (limit > 0x7fffffff)
      limit = 0x7fffffff ;
   r = checkwidth(w, (int)limit) ;
   if (r != BACKEND_OK) {
      dispose() ;
      return r ;
   }
   r = buildprogram() ;
   if (r != BACKEND_OK) {
      dispose() ;
      return r ;
   }

   width = w ;
   GLsizeiptr bytes = (GLsizeiptr)w * sizeof(GLuint) ;
   cells.assign(w, 0) ;
   glGenBuffers(1, &buffers[0]) ;
   glGenBuffers(1, &buffers[1]) ;
   for (int i=0; i<2; i++) {
      glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffers[i]) ;
      glBufferData(GL_SHADER_STORAGE_BUFFER, bytes, &cells[0], GL_DYNAMIC_COPY) ;
   }
   glGenBuffers(1, &parambuffer) ;
   glBindBuffer(GL_UNIFORM_BUFFER, parambuffer) ;
   glBufferData(GL_UNIFORM_BUFFER, sizeof(computeparams), 0, GL_DYNAMIC_DRAW) ;
   glGenBuffers(1, &staging) ;
   glBindBuffer(GL_COPY_WRITE_BUFFER, staging) ;
   glBufferData(GL_COPY_WRITE_BUFFER, bytes, 0, GL_STREAM_READ) ;
   buffers.resetroles() ;
   r = glerror("buffer setup") ;
   if (r != BACKEND_OK) {
      dispose() ;
      return r ;
   }

   // submit one dispatch over the zeroed row; the selector polls it
   // through pollinit() so a device that never answers cannot hang us
   setparams(VALIDATION_RULE) ;
   bindstate() ;
   dispatch() ;
   r = glerror("validation dispatch") ;
   if (r != BACKEND_OK || fence == 0) {
      dispose() ;
      return r != BACKEND_OK ? r : fail(BACKEND_UNAVAILABLE, "compute: fence creation failed") ;
   }
   validating = 1 ;
   lost = 0 ;
   busy = 0 ;

   char buf[ECAMSGSIZE] ;
   snprintf(buf, sizeof(buf), "compute: %s; workgroup %d; max width %d",
            ctx.describe().c_str(), workgroup, (int)limit) ;
   info = buf ;
   return BACKEND_PENDING ;
}

int computebackend::pollinit() {
   if (!validating)
      return width > 0 ? BACKEND_OK : fail(BACKEND_UNAVAILABLE, "compute: not initialized") ;
   if (lost || !ctx.makecurrent()) {
      dispose() ;
      return fail(BACKEND_UNAVAILABLE, "compute: context lost during validation") ;
   }
   int r = waitfence(0) ;
   if (r == BACKEND_PENDING)
      return r ;
   if (r == BACKEND_OK) {
      generation g ;
      r = mapstaging(staging, g) ;
      if (r == BACKEND_OK && population(g) != width)
         r = fail(BACKEND_UNAVAILABLE, "compute: validation dispatch produced wrong results") ;
   }
   validating = 0 ;
   if (r != BACKEND_OK) {
      std::string why = errmsg ;
      dispose() ;
      return fail(BACKEND_UNAVAILABLE, "%s", why.c_str()) ;
   }
   return BACKEND_OK ;
}

int computebackend::upload(const generation &g) {
   if ((int)g.size() != width)
      return fail(INVALID_GRID_SIZE, "compute: upload of %d cells into a row of %d",
                  (int)g.size(), width) ;
   if (lost || !ctx.makecurrent())
      return fail(BACKEND_LOST, "compute: context lost before upload") ;
   abandon() ;
   for (int i=0; i<width; i++)
      cells[i] = g[i] ? 1 : 0 ;
   glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffers.front()) ;
   glBufferSubData(GL_SHADER_STORAGE_BUFFER, 0, (GLsizeiptr)width * sizeof(GLuint), &cells[0]) ;
   return glerror("upload") ;
}

int computebackend::readback(generation &g) {
   if (lost || !ctx.makecurrent())
      return fail(BACKEND_LOST, "compute: context lost before readback") ;
   glMemoryBarrier(GL_BUFFER_UPDATE_BARRIER_BIT) ;
   return mapstaging(buffers.front(), g) ;
}

int computebackend::computenext(const ecarule &rule) {
   if (width <= 0 || validating)
      return fail(BACKEND_UNAVAILABLE, "compute: not initialized") ;
   if (busy)
      return fail(BACKEND_PENDING, "compute: a step is already in flight") ;
   if (lost || !ctx.checkreset()) {
      lost = 1 ;
      return fail(BACKEND_LOST, "compute: context lost") ;
   }
   if (rule.getid() != lastrule)
      setparams(rule.getid()) ;
   bindstate() ;
   dispatch() ;
   int r = glerror("dispatch") ;
   if (r != BACKEND_OK)
      return r ;
   if (fence == 0)
      return fail(BACKEND_LOST, "compute: fence creation failed") ;
   busy = 1 ;
   return BACKEND_OK ;
}

int computebackend::collect(generation &g) {
   if (!busy)
      return fail(BACKEND_UNAVAILABLE, "compute: no step in flight") ;
   if (lost || !ctx.makecurrent()) {
      lost = 1 ;
      return fail(BACKEND_LOST, "compute: context lost before collect") ;
   }
   int r = waitfence(issuetime + timeoutms / 1000.0) ;
   if (r == BACKEND_PENDING)
      return r ;
   if (r == BACKEND_OK)
      r = mapstaging(staging, g) ;
   if (r != BACKEND_OK) {
      busy = 0 ;
      return r ;
   }
   buffers.swap() ;
   bindstate() ;
   busy = 0 ;
   return BACKEND_OK ;
}

void computebackend::abandon() {
   if (busy && ctx.iscreated() && ctx.makecurrent())
      dropfence() ;
   busy = 0 ;
}

int computebackend::checkhealth() {
   if (!lost && ctx.iscreated() && !ctx.checkreset())
      lost = 1 ;
   return lost ? BACKEND_LOST : BACKEND_OK ;
}

void computebackend::dispose() {
   if (ctx.iscreated() && ctx.makecurrent()) {
      dropfence() ;
      if (buffers[0])
         glDeleteBuffers(1, &buffers[0]) ;
      if (buffers[1])
         glDeleteBuffers(1, &buffers[1]) ;
      if (parambuffer)
         glDeleteBuffers(1, &parambuffer) ;
      if (staging)
         glDeleteBuffers(1, &staging) ;
      if (program)
         glDeleteProgram(program) ;
   }
   // a lost context takes its objects with it
   ctx.destroy() ;
   fence = 0 ;
   buffers[0] = buffers[1] = 0 ;
   parambuffer = staging = program = 0 ;
   lastrule = -1 ;
   validating = 0 ;
   width = 0 ;
   busy = 0 ;
   std::vector<GLuint>().swap(cells) ;
}

static ecabackend *creator() { return new computebackend() ; }
void computebackend::doInitializeBackendInfo(staticBackendInfo &ai) {
   ai.setBackendName("Compute") ;
   ai.setBackendTier(TIER_COMPUTE) ;
   ai.setBackendCreator(&creator) ;
}
