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

#include <stdint.h>

#include "std/vector.hpp"

#include "spvmsl/spvmsl.h"
#include "msl/format.hpp"
#include "msl/overrides.hpp"

namespace spvmsl::msl {
struct compilerVertexOptions {
	bool invertY = false;
	bool transformClipSpace = false;
};

/*
	Everything that tunes MSL generation for one session. Built by the caller,
	then committed with session::configure. The defaults match the ones
	SPIRV-Cross uses when nothing is installed.
*/
struct compilerOptions {
	msl::platform platform = msl::platform::macOS;
	msl::version version = msl::version::v1_2;
	compilerVertexOptions vertex;

	uint32_t swizzleBufferIndex = 30;
	uint32_t indirectParamsBufferIndex = 29;
	uint32_t outputBufferIndex = 28;
	uint32_t patchOutputBufferIndex = 27;
	uint32_t tessellationFactorBufferIndex = 26;
	uint32_t bufferSizeBufferIndex = 25;

	bool enablePointSizeBuiltin = true;
	bool enableRasterization = true;
	bool captureOutputToBuffer = false;
	bool swizzleTextureSamples = false;
	bool tessellationDomainOriginLowerLeft = false;
	// Requires msl 2.0 or newer.
	bool enableArgumentBuffers = false;
	bool padFragmentOutputComponents = false;

	vertexAttributeOverrides vertexAttributes;
	resourceBindingOverrides resourceBindings;

	// Scalar fields only, the override tables are translated separately.
	[[nodiscard]] spvmsl_compilerOptions translate() const noexcept;
	[[nodiscard]] spvmsl::std::vector<spvmsl_vertexAttribute> translateVertexAttributes() const noexcept {
		return this->vertexAttributes.translate();
	}
	[[nodiscard]] spvmsl::std::vector<spvmsl_resourceBinding> translateResourceBindings() const noexcept {
		return this->resourceBindings.translate();
	}
};
}  // namespace spvmsl::msl
