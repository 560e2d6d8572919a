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

#include <stdint.h>

#include "std/vector.hpp"

#include "spvmsl/spvmsl.h"
#include "msl/format.hpp"
#include "msl/overrides.hpp"

namespace spvmsl::msl {
spvmsl::std::vector<spvmsl_vertexAttribute> vertexAttributeOverrides::translate() const noexcept {
	spvmsl::std::vector<spvmsl_vertexAttribute> out(0, this->entries.size());
	for (const auto& e : this->entries) {
		out.pushBack(spvmsl_vertexAttribute{
			.location = e.key.location,
			.buffer = e.value.bufferID,
			.offset = e.value.offset,
			.stride = e.value.stride,
			.perInstance = msl::translate(e.value.step) ? SPVMSL_TRUE : SPVMSL_FALSE,
			.format = msl::translate(e.value.format),
			.builtin = msl::translate(e.value.builtin),
		});
	}
	return out;
}

spvmsl::std::vector<spvmsl_resourceBinding> resourceBindingOverrides::translate() const noexcept {
	spvmsl::std::vector<spvmsl_resourceBinding> out(0, this->entries.size());
	for (const auto& e : this->entries) {
		out.pushBack(spvmsl_resourceBinding{
			.stage = msl::translate(e.key.stage),
			.descSet = e.key.descSet,
			.binding = e.key.binding,
			.buffer = e.value.bufferID,
			.texture = e.value.textureID,
			.sampler = e.value.samplerID,
		});
	}
	return out;
}
}  // namespace spvmsl::msl
