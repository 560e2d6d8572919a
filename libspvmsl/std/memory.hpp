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

namespace spvmsl::std {
template <typename T>
class smartPtr {
	T* ptr = nullptr;

   public:
	smartPtr(const smartPtr&) = delete;
	smartPtr& operator=(const smartPtr&) = delete;

	constexpr smartPtr() noexcept = default;
	constexpr explicit smartPtr(T* ptr) noexcept : ptr(ptr) {}
	constexpr smartPtr(smartPtr&& other) noexcept {
		this->ptr = other.ptr;
		other.ptr = nullptr;
	}
	~smartPtr() noexcept { delete this->ptr; }

	smartPtr& operator=(smartPtr&& other) noexcept {
		if (this == &other) {
			return *this;
		}
		delete this->ptr;
		this->ptr = other.ptr;
		other.ptr = nullptr;
		return *this;
	}

	[[nodiscard]] constexpr T* get() const noexcept { return ptr; }
	[[nodiscard]] constexpr explicit operator bool() const noexcept { return ptr != nullptr; }
	[[nodiscard]] constexpr T* release() noexcept {
		T* p = this->ptr;
		this->ptr = nullptr;
		return p;
	}

	[[nodiscard]] constexpr T& operator*() const noexcept { return *this->ptr; }
	[[nodiscard]] constexpr T* operator->() const noexcept { return this->ptr; }
};
}  // namespace spvmsl::std
