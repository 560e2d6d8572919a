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

#include "concepts.hpp"	 // IWYU pragma: keep
#include "utility.hpp"
#include "vector.hpp"

namespace spvmsl::std {
// Ordered map backed by a sorted vector, iteration is in ascending key order.
template <typename K, typename V>
	requires lessComparable<K>
class sortedmap {
   public:
	struct entry {
		K key = K();
		V value = V();
	};

   private:
	vector<entry> entries;

	[[nodiscard]] size_t lowerBound(const K& key) const noexcept {
		size_t lo = 0;
		size_t hi = this->entries.size();
		while (lo < hi) {
			const size_t mid = lo + ((hi - lo) / 2);
			if (this->entries[mid].key < key) {
				lo = mid + 1;
			} else {
				hi = mid;
			}
		}
		return lo;
	}
	[[nodiscard]] bool matches(size_t i, const K& key) const noexcept {
		return i < this->entries.size() && !(key < this->entries[i].key);
	}

   public:
	sortedmap(const sortedmap&) = delete;
	sortedmap& operator=(const sortedmap&) = delete;

	constexpr sortedmap() noexcept = default;
	sortedmap(sortedmap&&) noexcept = default;
	sortedmap& operator=(sortedmap&&) noexcept = default;

	// Replaces the value if the key is already present.
	void insert(const K& key, const V& value) noexcept {
		const size_t i = lowerBound(key);
		if (matches(i, key)) {
			this->entries[i].value = value;
			return;
		}
		this->entries.insert(i, entry{key, value});
	}

	bool erase(const K& key) noexcept {
		const size_t i = lowerBound(key);
		if (!matches(i, key)) {
			return false;
		}
		this->entries.erase(i);
		return true;
	}

	[[nodiscard]] const V* find(const K& key) const noexcept {
		const size_t i = lowerBound(key);
		if (!matches(i, key)) {
			return nullptr;
		}
		return &this->entries[i].value;
	}

	void clear() noexcept { this->entries.clear(); }

	[[nodiscard]] size_t size() const noexcept { return this->entries.size(); }
	[[nodiscard]] bool empty() const noexcept { return this->entries.size() == 0; }
	[[nodiscard]] const entry* begin() const noexcept { return this->entries.begin(); }
	[[nodiscard]] const entry* end() const noexcept { return this->entries.end(); }
};
}  // namespace spvmsl::std
