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

#include <spirv_cross/spirv_cross_c.h>

#include "std/memory.hpp"
#include "std/string.hpp"
#include "std/vector.hpp"

#include "spvmsl/spvmsl.h"
#include "msl/error.hpp"
#include "msl/options.hpp"

namespace spvmsl::msl {
/*
	One SPIR-V module being cross compiled to MSL.

	The session keeps a copy of the module words and owns exactly one spvc
	context at a time. The parsed IR, the compiler and every string handed
	back live inside that context. A successful configure parses the words
	into a fresh context and releases the previous one, so reconfiguring
	never accumulates compilers.

	Overrides are cached at configure time and submitted again on each
	compile. Not safe to use from multiple threads at once.
*/
class session {
   private:
	spvmsl::std::vector<uint32_t> words;
	spvc_context spvcContext = nullptr;
	spvc_compiler spvcCompiler = nullptr;
	bool compiledSinceConfigure = false;
	spvmsl::std::string<char> lastError;

	bool configured = false;
	spvmsl_compilerOptions options = {};
	spvmsl::std::vector<spvmsl_vertexAttribute> vertexAttributes;
	spvmsl::std::vector<spvmsl_resourceBinding> resourceBindings;

	session() noexcept = default;

	static void onSpvcError(void* userdata, const char* error);
	static void releaseContext(spvc_context) noexcept;

	// On failure nothing is left allocated.
	[[nodiscard]] result<void> createContext(spvmsl_errorKind, spvc_context*, spvc_compiler*) noexcept;
	[[nodiscard]] result<void> installOptions(spvc_compiler, const spvmsl_compilerOptions&) const noexcept;
	[[nodiscard]] result<void> submitOverrides() const noexcept;

   public:
	session(const session&) = delete;
	session& operator=(const session&) = delete;
	session(session&&) = delete;
	session& operator=(session&&) = delete;
	~session() noexcept;

	[[nodiscard]] static result<spvmsl::std::smartPtr<session>> create(size_t numWords, const uint32_t* words) noexcept;

	// On failure the previous configuration stays in effect.
	[[nodiscard]] result<void> configure(const compilerOptions&) noexcept;
	[[nodiscard]] result<void> configure(const spvmsl_compilerOptions&, spvmsl::std::vector<spvmsl_vertexAttribute>&&,
										 spvmsl::std::vector<spvmsl_resourceBinding>&&) noexcept;

	[[nodiscard]] result<spvmsl::std::string<char>> compile() noexcept;
	[[nodiscard]] result<bool> isRasterizationEnabled() const noexcept;

	// Last diagnostic SPIRV-Cross reported for this session, including from a configure that was rolled back.
	[[nodiscard]] const char* getLastErrorString() const noexcept { return this->lastError.cStr(); }
	// nullptr until the first successful configure.
	[[nodiscard]] const spvmsl_compilerOptions* getCompilerOptions() const noexcept {
		return this->configured ? &this->options : nullptr;
	}
	[[nodiscard]] const spvmsl::std::vector<spvmsl_vertexAttribute>& getVertexAttributes() const noexcept {
		return this->vertexAttributes;
	}
	[[nodiscard]] const spvmsl::std::vector<spvmsl_resourceBinding>& getResourceBindings() const noexcept {
		return this->resourceBindings;
	}

	// spvc contexts currently held by all sessions in the process.
	[[nodiscard]] static size_t liveContexts() noexcept;

	[[nodiscard]] spvmsl_msl_session handle() noexcept { return reinterpret_cast<spvmsl_msl_session>(this); }
	[[nodiscard]] static session* fromHandle(spvmsl_msl_session handle) noexcept {
		return reinterpret_cast<session*>(handle);
	}
};
}  // namespace spvmsl::msl
