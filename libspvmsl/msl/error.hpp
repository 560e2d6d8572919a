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

#include <spirv_cross/spirv_cross_c.h>

#include "std/result.hpp"

#include "spvmsl/spvmsl.h"

namespace spvmsl::msl {
template <typename T>
using result = spvmsl::std::result<T, spvmsl_error>;

[[nodiscard]] inline spvmsl::std::failure<spvmsl_error> fail(spvmsl_errorKind kind, int32_t nativeCode) noexcept {
	return spvmsl::std::failure<spvmsl_error>{spvmsl_error{kind, nativeCode}};
}

inline static const char* spvcResultStr(spvc_result code) noexcept {
	switch (code) {
		case SPVC_SUCCESS:
			return "SPVC_SUCCESS";
		case SPVC_ERROR_INVALID_SPIRV:
			return "SPVC_ERROR_INVALID_SPIRV";
		case SPVC_ERROR_UNSUPPORTED_SPIRV:
			return "SPVC_ERROR_UNSUPPORTED_SPIRV";
		case SPVC_ERROR_OUT_OF_MEMORY:
			return "SPVC_ERROR_OUT_OF_MEMORY";
		case SPVC_ERROR_INVALID_ARGUMENT:
			return "SPVC_ERROR_INVALID_ARGUMENT";
		default:
			return "Unknown spvc_result";
	}
}

inline static const char* errorKindStr(spvmsl_errorKind kind) noexcept {
	switch (kind) {
		case spvmsl_errorKind_none:
			return "none";
		case spvmsl_errorKind_construction:
			return "construction";
		case spvmsl_errorKind_configuration:
			return "configuration";
		case spvmsl_errorKind_compilation:
			return "compilation";
		case spvmsl_errorKind_encoding:
			return "encoding";
		case spvmsl_errorKind_query:
			return "query";
	}
	return "unknown";
}
}  // namespace spvmsl::msl
