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

#ifndef __cplusplus
#error C++ only header
#endif

#include <stddef.h>
#include <stdint.h>

#include <spirv_cross/spirv.h>
#include <spirv_cross/spirv_cross_c.h>

#include "std/stdlib.hpp"

namespace spvmsl::msl {
enum class platform : uint8_t {
	iOS = 0,
	macOS = 1,
};

enum class version : uint8_t {
	v1_0,
	v1_1,
	v1_2,
	v2_0,
	v2_1,
	v2_2,
	v2_3,
	v2_4,
	v3_0,
};

enum class vertexFormat : uint8_t {
	other,
	uint8,
	uint16,
};

enum class vertexStep : uint8_t {
	vertex,
	instance,
};

enum class executionStage : uint8_t {
	vertex,
	tessellationControl,
	tessellationEvaluation,
	geometry,
	fragment,
	compute,
	kernel,
};

enum class builtIn : uint8_t {
	none,
	position,
	pointSize,
	clipDistance,
	cullDistance,
	vertexID,
	instanceID,
	primitiveID,
	invocationID,
	layer,
	viewportIndex,
	tessLevelOuter,
	tessLevelInner,
	tessCoord,
	patchVertices,
	fragCoord,
	pointCoord,
	frontFacing,
	sampleID,
	samplePosition,
	sampleMask,
	fragDepth,
	helperInvocation,
	numWorkgroups,
	workgroupSize,
	workgroupID,
	localInvocationID,
	globalInvocationID,
	localInvocationIndex,
	vertexIndex,
	instanceIndex,
	baseVertex,
	baseInstance,
	drawIndex,
	deviceIndex,
	viewIndex,
};

[[nodiscard]] constexpr uint32_t translate(platform p) noexcept {
	switch (p) {
		case platform::iOS:
			return SPVC_MSL_PLATFORM_IOS;
		case platform::macOS:
			return SPVC_MSL_PLATFORM_MACOS;
	}
	spvmsl::std::abort("Unknown msl platform");
}

// major * 10000 + minor * 100 + patch
[[nodiscard]] constexpr uint32_t translate(version v) noexcept {
	switch (v) {
		case version::v1_0:
			return SPVC_MAKE_MSL_VERSION(1, 0, 0);
		case version::v1_1:
			return SPVC_MAKE_MSL_VERSION(1, 1, 0);
		case version::v1_2:
			return SPVC_MAKE_MSL_VERSION(1, 2, 0);
		case version::v2_0:
			return SPVC_MAKE_MSL_VERSION(2, 0, 0);
		case version::v2_1:
			return SPVC_MAKE_MSL_VERSION(2, 1, 0);
		case version::v2_2:
			return SPVC_MAKE_MSL_VERSION(2, 2, 0);
		case version::v2_3:
			return SPVC_MAKE_MSL_VERSION(2, 3, 0);
		case version::v2_4:
			return SPVC_MAKE_MSL_VERSION(2, 4, 0);
		case version::v3_0:
			return SPVC_MAKE_MSL_VERSION(3, 0, 0);
	}
	spvmsl::std::abort("Unknown msl version");
}

[[nodiscard]] constexpr uint32_t translate(vertexFormat f) noexcept {
	switch (f) {
		case vertexFormat::other:
			return SPVC_MSL_VERTEX_FORMAT_OTHER;
		case vertexFormat::uint8:
			return SPVC_MSL_VERTEX_FORMAT_UINT8;
		case vertexFormat::uint16:
			return SPVC_MSL_VERTEX_FORMAT_UINT16;
	}
	spvmsl::std::abort("Unknown vertex format");
}

// Per instance flag.
[[nodiscard]] constexpr bool translate(vertexStep s) noexcept {
	switch (s) {
		case vertexStep::vertex:
			return false;
		case vertexStep::instance:
			return true;
	}
	spvmsl::std::abort("Unknown vertex step");
}

[[nodiscard]] constexpr uint32_t translate(executionStage s) noexcept {
	switch (s) {
		case executionStage::vertex:
			return SpvExecutionModelVertex;
		case executionStage::tessellationControl:
			return SpvExecutionModelTessellationControl;
		case executionStage::tessellationEvaluation:
			return SpvExecutionModelTessellationEvaluation;
		case executionStage::geometry:
			return SpvExecutionModelGeometry;
		case executionStage::fragment:
			return SpvExecutionModelFragment;
		case executionStage::compute:
			return SpvExecutionModelGLCompute;
		case executionStage::kernel:
			return SpvExecutionModelKernel;
	}
	spvmsl::std::abort("Unknown execution stage");
}

[[nodiscard]] constexpr uint32_t translate(builtIn b) noexcept {
	switch (b) {
		case builtIn::none:
			return SpvBuiltInMax;
		case builtIn::position:
			return SpvBuiltInPosition;
		case builtIn::pointSize:
			return SpvBuiltInPointSize;
		case builtIn::clipDistance:
			return SpvBuiltInClipDistance;
		case builtIn::cullDistance:
			return SpvBuiltInCullDistance;
		case builtIn::vertexID:
			return SpvBuiltInVertexId;
		case builtIn::instanceID:
			return SpvBuiltInInstanceId;
		case builtIn::primitiveID:
			return SpvBuiltInPrimitiveId;
		case builtIn::invocationID:
			return SpvBuiltInInvocationId;
		case builtIn::layer:
			return SpvBuiltInLayer;
		case builtIn::viewportIndex:
			return SpvBuiltInViewportIndex;
		case builtIn::tessLevelOuter:
			return SpvBuiltInTessLevelOuter;
		case builtIn::tessLevelInner:
			return SpvBuiltInTessLevelInner;
		case builtIn::tessCoord:
			return SpvBuiltInTessCoord;
		case builtIn::patchVertices:
			return SpvBuiltInPatchVertices;
		case builtIn::fragCoord:
			return SpvBuiltInFragCoord;
		case builtIn::pointCoord:
			return SpvBuiltInPointCoord;
		case builtIn::frontFacing:
			return SpvBuiltInFrontFacing;
		case builtIn::sampleID:
			return SpvBuiltInSampleId;
		case builtIn::samplePosition:
			return SpvBuiltInSamplePosition;
		case builtIn::sampleMask:
			return SpvBuiltInSampleMask;
		case builtIn::fragDepth:
			return SpvBuiltInFragDepth;
		case builtIn::helperInvocation:
			return SpvBuiltInHelperInvocation;
		case builtIn::numWorkgroups:
			return SpvBuiltInNumWorkgroups;
		case builtIn::workgroupSize:
			return SpvBuiltInWorkgroupSize;
		case builtIn::workgroupID:
			return SpvBuiltInWorkgroupId;
		case builtIn::localInvocationID:
			return SpvBuiltInLocalInvocationId;
		case builtIn::globalInvocationID:
			return SpvBuiltInGlobalInvocationId;
		case builtIn::localInvocationIndex:
			return SpvBuiltInLocalInvocationIndex;
		case builtIn::vertexIndex:
			return SpvBuiltInVertexIndex;
		case builtIn::instanceIndex:
			return SpvBuiltInInstanceIndex;
		case builtIn::baseVertex:
			return SpvBuiltInBaseVertex;
		case builtIn::baseInstance:
			return SpvBuiltInBaseInstance;
		case builtIn::drawIndex:
			return SpvBuiltInDrawIndex;
		case builtIn::deviceIndex:
			return SpvBuiltInDeviceIndex;
		case builtIn::viewIndex:
			return SpvBuiltInViewIndex;
	}
	spvmsl::std::abort("Unknown built-in");
}

// NOLINTBEGIN(modernize-avoid-c-arrays)
inline constexpr platform knownPlatforms[] = {platform::iOS, platform::macOS};
inline constexpr version knownVersions[] = {
	version::v1_0, version::v1_1, version::v1_2, version::v2_0, version::v2_1,
	version::v2_2, version::v2_3, version::v2_4, version::v3_0,
};
inline constexpr vertexFormat knownVertexFormats[] = {vertexFormat::other, vertexFormat::uint8, vertexFormat::uint16};
inline constexpr executionStage knownStages[] = {
	executionStage::vertex,	  executionStage::tessellationControl, executionStage::tessellationEvaluation,
	executionStage::geometry, executionStage::fragment,			   executionStage::compute,
	executionStage::kernel,
};
inline constexpr builtIn knownBuiltIns[] = {
	builtIn::none,			  builtIn::position,		   builtIn::pointSize,		   builtIn::clipDistance,
	builtIn::cullDistance,	  builtIn::vertexID,		   builtIn::instanceID,		   builtIn::primitiveID,
	builtIn::invocationID,	  builtIn::layer,			   builtIn::viewportIndex,	   builtIn::tessLevelOuter,
	builtIn::tessLevelInner,  builtIn::tessCoord,		   builtIn::patchVertices,	   builtIn::fragCoord,
	builtIn::pointCoord,	  builtIn::frontFacing,		   builtIn::sampleID,		   builtIn::samplePosition,
	builtIn::sampleMask,	  builtIn::fragDepth,		   builtIn::helperInvocation,  builtIn::numWorkgroups,
	builtIn::workgroupSize,	  builtIn::workgroupID,		   builtIn::localInvocationID, builtIn::globalInvocationID,
	builtIn::localInvocationIndex, builtIn::vertexIndex,  builtIn::instanceIndex,	   builtIn::baseVertex,
	builtIn::baseInstance,	  builtIn::drawIndex,		   builtIn::deviceIndex,	   builtIn::viewIndex,
};
// NOLINTEND(modernize-avoid-c-arrays)

[[nodiscard]] constexpr const char* toString(platform p) noexcept {
	switch (p) {
		case platform::iOS:
			return "iOS";
		case platform::macOS:
			return "macOS";
	}
	return "unknown";
}

[[nodiscard]] constexpr const char* toString(version v) noexcept {
	switch (v) {
		case version::v1_0:
			return "1.0";
		case version::v1_1:
			return "1.1";
		case version::v1_2:
			return "1.2";
		case version::v2_0:
			return "2.0";
		case version::v2_1:
			return "2.1";
		case version::v2_2:
			return "2.2";
		case version::v2_3:
			return "2.3";
		case version::v2_4:
			return "2.4";
		case version::v3_0:
			return "3.0";
	}
	return "unknown";
}

[[nodiscard]] constexpr const char* toString(vertexFormat f) noexcept {
	switch (f) {
		case vertexFormat::other:
			return "other";
		case vertexFormat::uint8:
			return "uint8";
		case vertexFormat::uint16:
			return "uint16";
	}
	return "unknown";
}

[[nodiscard]] constexpr const char* toString(vertexStep s) noexcept {
	switch (s) {
		case vertexStep::vertex:
			return "vertex";
		case vertexStep::instance:
			return "instance";
	}
	return "unknown";
}

[[nodiscard]] constexpr const char* toString(executionStage s) noexcept {
	switch (s) {
		case executionStage::vertex:
			return "vertex";
		case executionStage::tessellationControl:
			return "tessellationControl";
		case executionStage::tessellationEvaluation:
			return "tessellationEvaluation";
		case executionStage::geometry:
			return "geometry";
		case executionStage::fragment:
			return "fragment";
		case executionStage::compute:
			return "compute";
		case executionStage::kernel:
			return "kernel";
	}
	return "unknown";
}

[[nodiscard]] constexpr const char* toString(builtIn b) noexcept {
	switch (b) {
		case builtIn::none:
			return "none";
		case builtIn::position:
			return "position";
		case builtIn::pointSize:
			return "pointSize";
		case builtIn::clipDistance:
			return "clipDistance";
		case builtIn::cullDistance:
			return "cullDistance";
		case builtIn::vertexID:
			return "vertexID";
		case builtIn::instanceID:
			return "instanceID";
		case builtIn::primitiveID:
			return "primitiveID";
		case builtIn::invocationID:
			return "invocationID";
		case builtIn::layer:
			return "layer";
		case builtIn::viewportIndex:
			return "viewportIndex";
		case builtIn::tessLevelOuter:
			return "tessLevelOuter";
		case builtIn::tessLevelInner:
			return "tessLevelInner";
		case builtIn::tessCoord:
			return "tessCoord";
		case builtIn::patchVertices:
			return "patchVertices";
		case builtIn::fragCoord:
			return "fragCoord";
		case builtIn::pointCoord:
			return "pointCoord";
		case builtIn::frontFacing:
			return "frontFacing";
		case builtIn::sampleID:
			return "sampleID";
		case builtIn::samplePosition:
			return "samplePosition";
		case builtIn::sampleMask:
			return "sampleMask";
		case builtIn::fragDepth:
			return "fragDepth";
		case builtIn::helperInvocation:
			return "helperInvocation";
		case builtIn::numWorkgroups:
			return "numWorkgroups";
		case builtIn::workgroupSize:
			return "workgroupSize";
		case builtIn::workgroupID:
			return "workgroupID";
		case builtIn::localInvocationID:
			return "localInvocationID";
		case builtIn::globalInvocationID:
			return "globalInvocationID";
		case builtIn::localInvocationIndex:
			return "localInvocationIndex";
		case builtIn::vertexIndex:
			return "vertexIndex";
		case builtIn::instanceIndex:
			return "instanceIndex";
		case builtIn::baseVertex:
			return "baseVertex";
		case builtIn::baseInstance:
			return "baseInstance";
		case builtIn::drawIndex:
			return "drawIndex";
		case builtIn::deviceIndex:
			return "deviceIndex";
		case builtIn::viewIndex:
			return "viewIndex";
	}
	return "unknown";
}

// Name of a raw native encoding, "unknown" when no tag translates to it.
template <typename E, size_t N>
[[nodiscard]] constexpr const char* nameOf(uint32_t raw, const E (&known)[N]) noexcept {	// NOLINT(modernize-avoid-c-arrays)
	for (auto v : known) {
		if (translate(v) == raw) {
			return toString(v);
		}
	}
	return "unknown";
}

// Raw encodings as they arrive through the C API.
[[nodiscard]] constexpr bool isKnownPlatform(uint32_t raw) noexcept {
	return raw == SPVC_MSL_PLATFORM_IOS || raw == SPVC_MSL_PLATFORM_MACOS;
}
[[nodiscard]] constexpr bool isKnownVersion(uint32_t raw) noexcept {
	for (auto v : knownVersions) {
		if (translate(v) == raw) {
			return true;
		}
	}
	return false;
}
[[nodiscard]] constexpr bool versionAtLeast(uint32_t raw, uint32_t major, uint32_t minor) noexcept {
	return raw >= SPVC_MAKE_MSL_VERSION(major, minor, 0);
}
}  // namespace spvmsl::msl
