/*
Copyright 2025 The goARRG Authors.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

	http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
*/

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef NDEBUG
#define SPVMSL_DEBUG 0
#else
#define SPVMSL_DEBUG 1
#endif

#define SPVMSL_FN __attribute__((nothrow))
#define SPVMSL_HANDLE(object) typedef struct object##_t* object

#define SPVMSL_TRUE 1U
#define SPVMSL_FALSE 0U

#ifdef __cplusplus
extern "C" {
#endif

typedef void (*spvmsl_loggerCallback)(size_t, char*);
typedef uint32_t spvmsl_bool;

SPVMSL_HANDLE(spvmsl_msl_session);
SPVMSL_HANDLE(spvmsl_msl_compileResult);

typedef enum {
	spvmsl_errorKind_none = 0,
	spvmsl_errorKind_construction,
	spvmsl_errorKind_configuration,
	spvmsl_errorKind_compilation,
	spvmsl_errorKind_encoding,
	spvmsl_errorKind_query,
} spvmsl_errorKind;

typedef struct {
	spvmsl_errorKind kind;
	// spvc_result reported by SPIRV-Cross. Records rejected before reaching it carry
	// SPVC_ERROR_INVALID_ARGUMENT, encoding errors carry 0.
	int32_t nativeCode;
} spvmsl_error;

// Field order is relied upon by foreign callers, append only.
typedef struct {
	spvmsl_bool vertexInvertY;
	spvmsl_bool vertexTransformClipSpace;
	// spvc_msl_platform
	uint32_t platform;
	// SPVC_MAKE_MSL_VERSION(major, minor, patch)
	uint32_t version;
	spvmsl_bool enablePointSizeBuiltin;
	spvmsl_bool disableRasterization;
	uint32_t swizzleBufferIndex;
	uint32_t indirectParamsBufferIndex;
	uint32_t shaderOutputBufferIndex;
	uint32_t shaderPatchOutputBufferIndex;
	uint32_t shaderTessFactorBufferIndex;
	uint32_t bufferSizeBufferIndex;
	spvmsl_bool captureOutputToBuffer;
	spvmsl_bool swizzleTextureSamples;
	spvmsl_bool tessDomainOriginLowerLeft;
	spvmsl_bool argumentBuffers;
	spvmsl_bool padFragmentOutputComponents;
} spvmsl_compilerOptions;

typedef struct {
	uint32_t location;
	uint32_t buffer;
	uint32_t offset;
	uint32_t stride;
	spvmsl_bool perInstance;
	// spvc_msl_vertex_format
	uint32_t format;
	// SpvBuiltIn, SpvBuiltInMax when the attribute is not a built-in
	uint32_t builtin;
} spvmsl_vertexAttribute;

typedef struct {
	// SpvExecutionModel
	uint32_t stage;
	uint32_t descSet;
	uint32_t binding;
	uint32_t buffer;
	uint32_t texture;
	uint32_t sampler;
} spvmsl_resourceBinding;

extern SPVMSL_FN void spvmsl_stdlib_init(spvmsl_loggerCallback, spvmsl_loggerCallback, spvmsl_loggerCallback,
										 spvmsl_loggerCallback, spvmsl_loggerCallback);

extern SPVMSL_FN void spvmsl_msl_getDefaultCompilerOptions(spvmsl_compilerOptions*);

extern SPVMSL_FN spvmsl_error spvmsl_msl_createSession(size_t, const uint32_t*, spvmsl_msl_session*);
extern SPVMSL_FN void spvmsl_msl_destroySession(spvmsl_msl_session);

extern SPVMSL_FN spvmsl_error spvmsl_msl_session_configure(spvmsl_msl_session, const spvmsl_compilerOptions*, uint32_t,
														   const spvmsl_vertexAttribute*, uint32_t,
														   const spvmsl_resourceBinding*);
extern SPVMSL_FN spvmsl_error spvmsl_msl_session_compile(spvmsl_msl_session, spvmsl_msl_compileResult*);
extern SPVMSL_FN spvmsl_error spvmsl_msl_session_isRasterizationEnabled(spvmsl_msl_session, spvmsl_bool*);
extern SPVMSL_FN void spvmsl_msl_session_getLastErrorString(spvmsl_msl_session, size_t*, const char**);

extern SPVMSL_FN void spvmsl_msl_compileResult_getSource(spvmsl_msl_compileResult, size_t*, const char**);
extern SPVMSL_FN void spvmsl_msl_destroyCompileResult(spvmsl_msl_compileResult);

#ifdef __cplusplus
}
#endif
