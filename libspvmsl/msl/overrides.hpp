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

#include "std/vector.hpp"
#include "std/sortedmap.hpp"

#include "spvmsl/spvmsl.h"
#include "msl/format.hpp"

namespace spvmsl::msl {
struct vertexAttributeLocation {
	uint32_t location = 0;

	[[nodiscard]] constexpr bool operator<(const vertexAttributeLocation& other) const noexcept {
		return this->location < other.location;
	}
};

struct vertexAttribute {
	uint32_t bufferID = 0;
	uint32_t offset = 0;
	uint32_t stride = 0;
	vertexStep step = vertexStep::vertex;
	vertexFormat format = vertexFormat::other;
	builtIn builtin = builtIn::none;
};

// Ordered by stage, then descriptor set, then binding.
struct resourceBindingLocation {
	executionStage stage = executionStage::vertex;
	uint32_t descSet = 0;
	uint32_t binding = 0;

	[[nodiscard]] constexpr bool operator<(const resourceBindingLocation& other) const noexcept {
		if (this->stage != other.stage) {
			return this->stage < other.stage;
		}
		if (this->descSet != other.descSet) {
			return this->descSet < other.descSet;
		}
		return this->binding < other.binding;
	}
};

struct resourceBinding {
	uint32_t bufferID = 0;
	uint32_t textureID = 0;
	uint32_t samplerID = 0;
};

class vertexAttributeOverrides {
   private:
	spvmsl::std::sortedmap<vertexAttributeLocation, vertexAttribute> entries;

   public:
	void insert(vertexAttributeLocation location, const vertexAttribute& attribute) noexcept {
		this->entries.insert(location, attribute);
	}
	bool erase(vertexAttributeLocation location) noexcept { return this->entries.erase(location); }
	void clear() noexcept { this->entries.clear(); }

	[[nodiscard]] const vertexAttribute* find(vertexAttributeLocation location) const noexcept {
		return this->entries.find(location);
	}
	[[nodiscard]] size_t size() const noexcept { return this->entries.size(); }
	[[nodiscard]] bool empty() const noexcept { return this->entries.empty(); }
	[[nodiscard]] auto begin() const noexcept { return this->entries.begin(); }
	[[nodiscard]] auto end() const noexcept { return this->entries.end(); }

	[[nodiscard]] spvmsl::std::vector<spvmsl_vertexAttribute> translate() const noexcept;
};

class resourceBindingOverrides {
   private:
	spvmsl::std::sortedmap<resourceBindingLocation, resourceBinding> entries;

   public:
	void insert(resourceBindingLocation location, const resourceBinding& binding) noexcept {
		this->entries.insert(location, binding);
	}
	bool erase(resourceBindingLocation location) noexcept { return this->entries.erase(location); }
	void clear() noexcept { this->entries.clear(); }

	[[nodiscard]] const resourceBinding* find(resourceBindingLocation location) const noexcept {
		return this->entries.find(location);
	}
	[[nodiscard]] size_t size() const noexcept { return this->entries.size(); }
	[[nodiscard]] bool empty() const noexcept { return this->entries.empty(); }
	[[nodiscard]] auto begin() const noexcept { return this->entries.begin(); }
	[[nodiscard]] auto end() const noexcept { return this->entries.end(); }

	[[nodiscard]] spvmsl::std::vector<spvmsl_resourceBinding> translate() const noexcept;
};
}  // namespace spvmsl::msl
