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

#include <type_traits>
#include "concepts.hpp"	 // IWYU pragma: keep

namespace spvmsl::std {
template <typename T>
[[nodiscard]] constexpr ::std::remove_reference_t<T>&& move(T&& t) noexcept {
	return static_cast<::std::remove_reference_t<T>&&>(t);
}

template <typename T>
constexpr void swap(T& a, T& b) noexcept {
	if (&a == &b) {
		return;
	}
	T c(spvmsl::std::move(a));
	a = spvmsl::std::move(b);
	b = spvmsl::std::move(c);
}
}  // namespace spvmsl::std
