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

#include "stdlib.hpp"
#include "utility.hpp"
#include "concepts.hpp"	 // IWYU pragma: keep

namespace spvmsl::std {
template <typename E>
struct failure {
	E value;
};
template <typename E>
failure(E) -> failure<E>;

// Holds either a T or an E, never both.
template <typename T, typename E>
class result {
   private:
	T val = T();
	E err = E();
	bool ok = false;

   public:
	result(const result&) = delete;
	result& operator=(const result&) = delete;

	result(result&&) noexcept = default;
	result& operator=(result&&) noexcept = default;

	result(T&& value) noexcept : val(spvmsl::std::move(value)), ok(true) {}
	result(const T& value) noexcept
		requires copy_constructible<T>
		: val(value), ok(true) {}
	result(failure<E> f) noexcept : err(f.value) {}

	[[nodiscard]] bool hasValue() const noexcept { return this->ok; }
	[[nodiscard]] explicit operator bool() const noexcept { return this->ok; }

	[[nodiscard]] T& value() noexcept {
		if (!this->ok) {
			abort("Accessing the value of a failed result");
		}
		return this->val;
	}
	[[nodiscard]] const T& value() const noexcept {
		if (!this->ok) {
			abort("Accessing the value of a failed result");
		}
		return this->val;
	}
	[[nodiscard]] const E& error() const noexcept {
		if (this->ok) {
			abort("Accessing the error of a successful result");
		}
		return this->err;
	}
};

template <typename E>
class result<void, E> {
   private:
	E err = E();
	bool ok = true;

   public:
	result() noexcept = default;
	result(failure<E> f) noexcept : err(f.value), ok(false) {}

	[[nodiscard]] bool hasValue() const noexcept { return this->ok; }
	[[nodiscard]] explicit operator bool() const noexcept { return this->ok; }

	[[nodiscard]] const E& error() const noexcept {
		if (this->ok) {
			abort("Accessing the error of a successful result");
		}
		return this->err;
	}
};
}  // namespace spvmsl::std
