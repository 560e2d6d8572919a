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

#include "spvmsl/spvmsl.h"  // IWYU pragma: associated

#include "msl/format.hpp"
#include "msl/options.hpp"

static constexpr spvmsl_bool toBool(bool b) noexcept {
	return b ? SPVMSL_TRUE : SPVMSL_FALSE;
}

namespace spvmsl::msl {
spvmsl_compilerOptions compilerOptions::translate() const noexcept {
	return spvmsl_compilerOptions{
		.vertexInvertY = toBool(this->vertex.invertY),
		.vertexTransformClipSpace = toBool(this->vertex.transformClipSpace),
		.platform = msl::translate(this->platform),
		.version = msl::translate(this->version),
		.enablePointSizeBuiltin = toBool(this->enablePointSizeBuiltin),
		// the native record stores the inverse
		.disableRasterization = toBool(!this->enableRasterization),
		.swizzleBufferIndex = this->swizzleBufferIndex,
		.indirectParamsBufferIndex = this->indirectParamsBufferIndex,
		.shaderOutputBufferIndex = this->outputBufferIndex,
		.shaderPatchOutputBufferIndex = this->patchOutputBufferIndex,
		.shaderTessFactorBufferIndex = this->tessellationFactorBufferIndex,
		.bufferSizeBufferIndex = this->bufferSizeBufferIndex,
		.captureOutputToBuffer = toBool(this->captureOutputToBuffer),
		.swizzleTextureSamples = toBool(this->swizzleTextureSamples),
		.tessDomainOriginLowerLeft = toBool(this->tessellationDomainOriginLowerLeft),
		.argumentBuffers = toBool(this->enableArgumentBuffers),
		.padFragmentOutputComponents = toBool(this->padFragmentOutputComponents),
	};
}
}  // namespace spvmsl::msl

extern "C" {
SPVMSL_FN void spvmsl_msl_getDefaultCompilerOptions(spvmsl_compilerOptions* options) {
	*options = spvmsl::msl::compilerOptions().translate();
}
}
