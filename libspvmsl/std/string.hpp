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
#include <stdlib.h>
#include <string.h>
#include <type_traits>

#include "concepts.hpp"	 // IWYU pragma: keep
#include "stdlib.hpp"
#include "utility.hpp"

namespace spvmsl::std {
template <typename T>
concept character = ::std::is_same_v<T, char>;

template <character T>
constexpr size_t strlen(const T* const str) noexcept {
	if (str == nullptr) {
		return 0;
	}

	size_t sz = 0;
	for (; str[sz] != '\0'; ++sz) {
	}
	return sz;
}

// Rejects overlong encodings, surrogates and code points past U+10FFFF.
[[nodiscard]] constexpr bool validUTF8(const char* str, size_t n) noexcept {
	size_t i = 0;
	while (i < n) {
		const auto c = static_cast<uint8_t>(str[i]);
		if (c < 0x80) {
			i++;
			continue;
		}

		size_t extra = 0;
		uint32_t cp = 0;
		uint32_t minCp = 0;
		if ((c & 0xE0) == 0xC0) {
			extra = 1;
			cp = c & 0x1F;
			minCp = 0x80;
		} else if ((c & 0xF0) == 0xE0) {
			extra = 2;
			cp = c & 0x0F;
			minCp = 0x800;
		} else if ((c & 0xF8) == 0xF0) {
			extra = 3;
			cp = c & 0x07;
			minCp = 0x10000;
		} else {
			return false;
		}

		if (n - i <= extra) {
			return false;
		}
		for (size_t j = 1; j <= extra; j++) {
			const auto cc = static_cast<uint8_t>(str[i + j]);
			if ((cc & 0xC0) != 0x80) {
				return false;
			}
			cp = (cp << 6) | (cc & 0x3F);
		}
		if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
			return false;
		}
		i += extra + 1;
	}
	return true;
}

template <character T = char>
class string {
   private:
	size_t len = 0;
	T* str = nullptr;

	void copy(size_t n, const T* val) noexcept {
		if (n == 0) {
			free(this->str);
			this->len = 0;
			this->str = nullptr;
			return;
		}
		if (val == nullptr) {
			abort("Unexpected nullptr");
		}
		const size_t sz = (n + 1) * sizeof(T);
		if (this->len != n || this->str == nullptr) {
			T* newptr = static_cast<T*>(realloc(this->str, sz));
			if (newptr == nullptr) {
				abort("Failed realloc");
			}
			this->str = newptr;
		}
		memcpy(this->str, val, sz - sizeof(T));
		this->len = n;
		this->str[this->len] = 0;
	}

   public:
	constexpr string() noexcept = default;
	string(const T* val) noexcept : string(strlen(val), val) {}
	string(size_t n, const T* val) noexcept { copy(n, val); }
	string(const string& other) noexcept { copy(other.len, other.str); }
	string(string&& other) noexcept { *this = spvmsl::std::move(other); }
	~string() noexcept {
		free(this->str);
		this->len = 0;
		this->str = nullptr;
	}
	[[nodiscard]] constexpr size_t size() const noexcept { return this->len; }
	[[nodiscard]] constexpr bool empty() const noexcept { return this->len == 0; }
	// Never null, an empty string yields "".
	[[nodiscard]] const T* cStr() const noexcept {
		static const T nul = 0;
		return this->str != nullptr ? this->str : &nul;
	}
	string& operator=(const T* val) noexcept {
		copy(strlen(val), val);
		return *this;
	}
	string& operator=(const string& val) noexcept {
		if (this != &val) {
			copy(val.len, val.str);
		}
		return *this;
	}
	string& operator=(string&& other) noexcept {
		if (this == &other) {
			return *this;
		}
		free(this->str);

		this->len = other.len;
		this->str = other.str;

		other.len = 0;
		other.str = nullptr;
		return *this;
	}
	[[nodiscard]] bool operator==(const T* u) const noexcept {
		const size_t n = strlen(u);
		return n == this->len && (n == 0 || memcmp(this->str, u, n * sizeof(T)) == 0);
	}
	[[nodiscard]] bool operator!=(const T* u) const noexcept { return !(*this == u); }
};
}  // namespace spvmsl::std
