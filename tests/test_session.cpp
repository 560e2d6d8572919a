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
#include <string.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <shaderc/shaderc.h>
#include <spirv_cross/spirv_cross_c.h>

#include "std/memory.hpp"
#include "std/utility.hpp"
#include "std/vector.hpp"

#include "spvmsl/spvmsl.h"
#include "msl/format.hpp"
#include "msl/options.hpp"
#include "msl/session.hpp"

#include "spirv_fixtures.hpp"

using namespace spvmsl::msl;
using spvmsl::test::contains;

class SessionTest : public ::testing::Test {
   protected:
	static spvmsl::std::smartPtr<session> make(const std::vector<uint32_t>& words) {
		auto created = session::create(words.size(), words.data());
		EXPECT_TRUE(created);
		if (!created) {
			return {};
		}
		return spvmsl::std::move(created.value());
	}

	static std::string compile(session& s) {
		auto compiled = s.compile();
		EXPECT_TRUE(compiled);
		if (!compiled) {
			return {};
		}
		return std::string(compiled.value().cStr(), compiled.value().size());
	}
};

TEST_F(SessionTest, CompilesMinimalVertexShader) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	ASSERT_TRUE(s->configure(compilerOptions{}));
	const auto msl = compile(*s);

	EXPECT_FALSE(msl.empty());
	EXPECT_TRUE(contains(msl, "#include <metal_stdlib>"));
	EXPECT_TRUE(contains(msl, "main0"));
	EXPECT_TRUE(contains(msl, "[[position]]"));
}

TEST_F(SessionTest, TruncatedModuleFailsConstruction) {
	const auto& words = spvmsl::test::truncatedModule;
	auto created = session::create(words.size(), words.data());

	ASSERT_FALSE(created);
	EXPECT_EQ(created.error().kind, spvmsl_errorKind_construction);
	EXPECT_NE(created.error().nativeCode, SPVC_SUCCESS);
}

TEST_F(SessionTest, BadMagicFailsConstruction) {
	const auto words = spvmsl::test::badMagicModule();
	auto created = session::create(words.size(), words.data());

	ASSERT_FALSE(created);
	EXPECT_EQ(created.error().kind, spvmsl_errorKind_construction);
	EXPECT_EQ(created.error().nativeCode, SPVC_ERROR_INVALID_SPIRV);
}

TEST_F(SessionTest, OptionsAreUnsetUntilConfigured) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	EXPECT_EQ(s->getCompilerOptions(), nullptr);
	EXPECT_EQ(s->getVertexAttributes().size(), 0u);
	EXPECT_EQ(s->getResourceBindings().size(), 0u);

	ASSERT_TRUE(s->configure(compilerOptions{}));
	ASSERT_NE(s->getCompilerOptions(), nullptr);
	EXPECT_EQ(s->getCompilerOptions()->version, 10200u);
}

TEST_F(SessionTest, ConfigureTwiceIsIdempotent) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	compilerOptions options;
	options.version = version::v2_1;
	options.vertexAttributes.insert({0}, vertexAttribute{.bufferID = 1, .stride = 16});
	options.resourceBindings.insert({executionStage::vertex, 0, 0}, resourceBinding{.bufferID = 4});

	ASSERT_TRUE(s->configure(options));
	const spvmsl_compilerOptions firstOptions = *s->getCompilerOptions();
	const std::vector<spvmsl_vertexAttribute> firstAttributes(s->getVertexAttributes().begin(),
															  s->getVertexAttributes().end());
	const std::vector<spvmsl_resourceBinding> firstBindings(s->getResourceBindings().begin(),
															s->getResourceBindings().end());
	const auto firstMsl = compile(*s);

	ASSERT_TRUE(s->configure(options));
	EXPECT_EQ(memcmp(&firstOptions, s->getCompilerOptions(), sizeof(firstOptions)), 0);
	ASSERT_EQ(firstAttributes.size(), s->getVertexAttributes().size());
	EXPECT_EQ(memcmp(firstAttributes.data(), s->getVertexAttributes().get(),
					 firstAttributes.size() * sizeof(spvmsl_vertexAttribute)),
			  0);
	ASSERT_EQ(firstBindings.size(), s->getResourceBindings().size());
	EXPECT_EQ(memcmp(firstBindings.data(), s->getResourceBindings().get(),
					 firstBindings.size() * sizeof(spvmsl_resourceBinding)),
			  0);
	EXPECT_EQ(firstMsl, compile(*s));
}

TEST_F(SessionTest, ConfigureReplacesCachedOverrides) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	compilerOptions options;
	options.vertexAttributes.insert({0}, vertexAttribute{.stride = 16});
	options.vertexAttributes.insert({1}, vertexAttribute{.stride = 8});
	options.resourceBindings.insert({executionStage::vertex, 0, 0}, resourceBinding{.bufferID = 1});
	ASSERT_TRUE(s->configure(options));
	EXPECT_EQ(s->getVertexAttributes().size(), 2u);
	EXPECT_EQ(s->getResourceBindings().size(), 1u);

	options.vertexAttributes.erase({0});
	options.resourceBindings.clear();
	ASSERT_TRUE(s->configure(options));
	ASSERT_EQ(s->getVertexAttributes().size(), 1u);
	EXPECT_EQ(s->getVertexAttributes()[0].location, 1u);
	EXPECT_EQ(s->getResourceBindings().size(), 0u);
}

TEST_F(SessionTest, CompileIsRepeatable) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);
	ASSERT_TRUE(s->configure(compilerOptions{}));

	const auto first = compile(*s);
	EXPECT_EQ(first, compile(*s));
}

TEST_F(SessionTest, CompileBeforeConfigureUsesDefaults) {
	auto unconfigured = make(spvmsl::test::minimalVertexShader);
	auto configured = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(unconfigured);
	ASSERT_TRUE(configured);

	ASSERT_TRUE(configured->configure(compilerOptions{}));
	EXPECT_EQ(compile(*unconfigured), compile(*configured));
}

// The native flag is computed while generating code, so each query follows a compile.
TEST_F(SessionTest, RasterizationRoundTrip) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	compilerOptions options;
	options.enableRasterization = false;
	ASSERT_TRUE(s->configure(options));
	EXPECT_FALSE(compile(*s).empty());
	auto disabled = s->isRasterizationEnabled();
	ASSERT_TRUE(disabled);
	EXPECT_FALSE(disabled.value());

	ASSERT_TRUE(s->configure(compilerOptions{}));
	EXPECT_FALSE(compile(*s).empty());
	auto enabled = s->isRasterizationEnabled();
	ASSERT_TRUE(enabled);
	EXPECT_TRUE(enabled.value());
}

TEST_F(SessionTest, ArgumentBuffersBelowMsl2AreRejected) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	compilerOptions previous;
	previous.resourceBindings.insert({executionStage::vertex, 0, 0}, resourceBinding{.bufferID = 2});
	ASSERT_TRUE(s->configure(previous));

	compilerOptions options;
	options.version = version::v1_2;
	options.enableArgumentBuffers = true;
	auto configured = s->configure(options);
	ASSERT_FALSE(configured);
	EXPECT_EQ(configured.error().kind, spvmsl_errorKind_configuration);
	EXPECT_EQ(configured.error().nativeCode, SPVC_ERROR_INVALID_ARGUMENT);

	ASSERT_NE(s->getCompilerOptions(), nullptr);
	EXPECT_EQ(s->getCompilerOptions()->argumentBuffers, SPVMSL_FALSE);
	EXPECT_EQ(s->getResourceBindings().size(), 1u);
	EXPECT_FALSE(compile(*s).empty());

	options.version = version::v2_0;
	EXPECT_TRUE(s->configure(options));
	EXPECT_EQ(s->getCompilerOptions()->argumentBuffers, SPVMSL_TRUE);
}

TEST_F(SessionTest, UnknownPlatformAndVersionAreRejected) {
	auto s = make(spvmsl::test::minimalVertexShader);
	ASSERT_TRUE(s);

	auto flat = compilerOptions{}.translate();
	flat.platform = 9;
	auto badPlatform = s->configure(flat, {}, {});
	ASSERT_FALSE(badPlatform);
	EXPECT_EQ(badPlatform.error().kind, spvmsl_errorKind_configuration);

	flat = compilerOptions{}.translate();
	flat.version = 10250;
	auto badVersion = s->configure(flat, {}, {});
	ASSERT_FALSE(badVersion);
	EXPECT_EQ(badVersion.error().kind, spvmsl_errorKind_configuration);

	EXPECT_EQ(s->getCompilerOptions(), nullptr);
}

TEST_F(SessionTest, ResourceBindingOverridesReachGeneratedSource) {
	const auto words = spvmsl::test::compileGLSL(spvmsl::test::texturedFragmentShader, shaderc_glsl_fragment_shader,
												 "textured.frag");
	ASSERT_FALSE(words.empty());
	auto s = make(words);
	ASSERT_TRUE(s);

	compilerOptions options;
	options.resourceBindings.insert({executionStage::fragment, 0, 0}, resourceBinding{.bufferID = 7});
	options.resourceBindings.insert({executionStage::fragment, 0, 1}, resourceBinding{.textureID = 3, .samplerID = 4});
	ASSERT_TRUE(s->configure(options));

	const auto remapped = compile(*s);
	EXPECT_TRUE(contains(remapped, "[[buffer(7)]]"));
	EXPECT_TRUE(contains(remapped, "[[texture(3)]]"));
	EXPECT_TRUE(contains(remapped, "[[sampler(4)]]"));

	ASSERT_TRUE(s->configure(compilerOptions{}));
	const auto plain = compile(*s);
	EXPECT_FALSE(contains(plain, "[[buffer(7)]]"));
	EXPECT_FALSE(contains(plain, "[[texture(3)]]"));
}

TEST_F(SessionTest, VertexAttributeOverridesCompile) {
	const auto words = spvmsl::test::compileGLSL(spvmsl::test::texturedVertexShader, shaderc_glsl_vertex_shader,
												 "textured.vert");
	ASSERT_FALSE(words.empty());
	auto s = make(words);
	ASSERT_TRUE(s);

	compilerOptions options;
	options.vertexAttributes.insert({0}, vertexAttribute{.bufferID = 0, .offset = 0, .stride = 20});
	options.vertexAttributes.insert({1}, vertexAttribute{.bufferID = 0, .offset = 12, .stride = 20});
	ASSERT_TRUE(s->configure(options));

	const auto msl = compile(*s);
	EXPECT_TRUE(contains(msl, "[[attribute(0)]]"));
	EXPECT_TRUE(contains(msl, "[[attribute(1)]]"));
}

TEST_F(SessionTest, ReconfigureReleasesPreviousContext) {
	const size_t before = session::liveContexts();
	{
		auto s = make(spvmsl::test::minimalVertexShader);
		ASSERT_TRUE(s);
		EXPECT_EQ(session::liveContexts(), before + 1);

		for (uint32_t i = 0; i < 32; i++) {
			compilerOptions options;
			options.version = (i % 2) == 0 ? version::v2_0 : version::v1_2;
			options.resourceBindings.insert({executionStage::vertex, 0, i}, resourceBinding{.bufferID = i});
			ASSERT_TRUE(s->configure(options));
			EXPECT_EQ(session::liveContexts(), before + 1);
		}

		compilerOptions rejected;
		rejected.version = version::v1_0;
		rejected.enableArgumentBuffers = true;
		EXPECT_FALSE(s->configure(rejected));
		EXPECT_EQ(session::liveContexts(), before + 1);

		EXPECT_FALSE(compile(*s).empty());
		EXPECT_EQ(s->getResourceBindings().size(), 1u);
		EXPECT_EQ(s->getResourceBindings()[0].binding, 31u);
	}
	EXPECT_EQ(session::liveContexts(), before);
}

TEST_F(SessionTest, FailedConstructionReleasesContext) {
	const size_t before = session::liveContexts();

	const auto words = spvmsl::test::badMagicModule();
	auto created = session::create(words.size(), words.data());
	ASSERT_FALSE(created);
	EXPECT_EQ(session::liveContexts(), before);

	const auto& truncated = spvmsl::test::truncatedModule;
	created = session::create(truncated.size(), truncated.data());
	ASSERT_FALSE(created);
	EXPECT_EQ(session::liveContexts(), before);
}
