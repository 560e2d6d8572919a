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

#define SPVMSL_LOG_LEVEL_VERBOSE 0
#define SPVMSL_LOG_LEVEL_INFO 1
#define SPVMSL_LOG_LEVEL_WARN 2
#define SPVMSL_LOG_LEVEL_ERROR 3

#ifndef SPVMSL_LOG_LEVEL
#ifdef NDEBUG
#define SPVMSL_LOG_LEVEL SPVMSL_LOG_LEVEL_WARN
#else
#define SPVMSL_LOG_LEVEL SPVMSL_LOG_LEVEL_VERBOSE
#endif
#endif

#include <stdio.h>

#include "stdlib.hpp"
#include "vector.hpp"
#include "string.hpp"

namespace spvmsl::std {
namespace internal {
template <typename... T>
inline static void dispatch(loggerCallback callback, const char* fmt, T... args) noexcept {
	if constexpr (sizeof...(T) > 0) {
		//+1 for null terminator
		const int n = snprintf(nullptr, 0, fmt, args...) + 1;
		spvmsl::std::vector<char> buf(n);
		snprintf(buf.get(), n, fmt, args...);

		//-1 to get strlen
		callback(n - 1, buf.get());
	} else {
		callback(strlen(fmt), const_cast<char*>(fmt));
	}
}
}  // namespace internal

template <typename... T>
inline static void vPrintf([[maybe_unused]] const char* fmt, [[maybe_unused]] T... args) noexcept {
#if SPVMSL_LOG_LEVEL <= SPVMSL_LOG_LEVEL_VERBOSE
	internal::dispatch(internal::callbackV, fmt, args...);
#endif
}

template <typename... T>
inline static void iPrintf([[maybe_unused]] const char* fmt, [[maybe_unused]] T... args) noexcept {
#if SPVMSL_LOG_LEVEL <= SPVMSL_LOG_LEVEL_INFO
	internal::dispatch(internal::callbackI, fmt, args...);
#endif
}

template <typename... T>
inline static void wPrintf([[maybe_unused]] const char* fmt, [[maybe_unused]] T... args) noexcept {
#if SPVMSL_LOG_LEVEL <= SPVMSL_LOG_LEVEL_WARN
	internal::dispatch(internal::callbackW, fmt, args...);
#endif
}

template <typename... T>
inline static void ePrintf(const char* fmt, T... args) noexcept {
	internal::dispatch(internal::callbackE, fmt, args...);
}
}  // namespace spvmsl::std
