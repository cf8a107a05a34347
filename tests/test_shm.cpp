/*
 * Copyright (c) 2026, the wlrt authors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
 * ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <algorithm>
#include <memory>

#include <gtest/gtest.h>

#include <wlrt-runtime.hpp>
#include <wlrt-shm.hpp>

#include "test_support.hpp"

using namespace wlrt;
using namespace wlrt::test;

TEST(shared_mem, zero_size_is_rejected)
{
  EXPECT_THROW(shared_mem_t(0), resource_error);
}

TEST(shared_mem, maps_requested_size)
{
  shared_mem_t memory(4096);
  EXPECT_EQ(4096u, memory.get_size());
  EXPECT_GE(memory.get_fd(), 0);
  ASSERT_NE(nullptr, memory.get_mem());

  // writable
  static_cast<char*>(memory.get_mem())[4095] = 1;
}

TEST(shared_mem, bytes_per_pixel)
{
  EXPECT_EQ(4u, bytes_per_pixel(WL_SHM_FORMAT_ARGB8888));
  EXPECT_EQ(4u, bytes_per_pixel(WL_SHM_FORMAT_XRGB8888));
  EXPECT_THROW(bytes_per_pixel(WL_SHM_FORMAT_RGB565), protocol_precondition_error);
}

class pool_test : public ::testing::Test
{
protected:
  fake_compositor_t fake;
  recording_core_t core;
  std::unique_ptr<runtime_t> runtime;

  void SetUp() override
  {
    runtime.reset(new runtime_t(core, connect_to(fake)));
  }
};

TEST_F(pool_test, buffer_geometry_is_checked)
{
  pool_t pool(runtime->get_shm(), 64 * 64 * 4);
  EXPECT_EQ(64u * 64u * 4u, pool.get_size());

  // stride must match width
  EXPECT_THROW(pool.create_buffer(0, 64, 64, 64 * 4 + 4, WL_SHM_FORMAT_ARGB8888), protocol_precondition_error);
  // does not fit
  EXPECT_THROW(pool.create_buffer(4, 64, 64, 64 * 4, WL_SHM_FORMAT_ARGB8888), protocol_precondition_error);
  EXPECT_THROW(pool.create_buffer(0, 64, 65, 64 * 4, WL_SHM_FORMAT_ARGB8888), protocol_precondition_error);
  EXPECT_THROW(pool.create_buffer(0, 0, 64, 0, WL_SHM_FORMAT_ARGB8888), protocol_precondition_error);
  EXPECT_THROW(pool.create_buffer(0, 64, 64, 64 * 2, WL_SHM_FORMAT_RGB565), protocol_precondition_error);
  // pixels must be aligned
  EXPECT_THROW(pool.create_buffer(1, 8, 8, 8 * 4, WL_SHM_FORMAT_ARGB8888), protocol_precondition_error);
  EXPECT_THROW(pool.create_buffer(6, 8, 8, 8 * 4, WL_SHM_FORMAT_XRGB8888), protocol_precondition_error);

  runtime->get_display().roundtrip();
  EXPECT_FALSE(fake.has_request("wl_shm_pool.create_buffer"));
}

TEST_F(pool_test, buffer_fill_covers_region)
{
  pool_t pool(runtime->get_shm(), 2 * 32 * 32 * 4);
  pixel_buffer_t first = pool.create_buffer(0, 32, 32, 32 * 4, WL_SHM_FORMAT_ARGB8888);
  pixel_buffer_t second = pool.create_buffer(32 * 32 * 4, 32, 32, 32 * 4, WL_SHM_FORMAT_XRGB8888);

  second.fill(0xff00ff00);
  first.fill(0xff112233);

  uint32_t *begin = first.get_pixels();
  EXPECT_TRUE(std::all_of(begin, begin + 32 * 32, [] (uint32_t p) { return p == 0xff112233; }));
  begin = second.get_pixels();
  EXPECT_TRUE(std::all_of(begin, begin + 32 * 32, [] (uint32_t p) { return p == 0xff00ff00; }));

  EXPECT_EQ(32 * 32 * 4, second.get_offset());
  EXPECT_EQ(static_cast<uint32_t>(WL_SHM_FORMAT_XRGB8888), second.get_format());

  runtime->get_display().roundtrip();
  std::vector<std::string> requests = fake.get_requests();
  EXPECT_EQ(1, std::count(requests.begin(), requests.end(), "wl_shm.create_pool"));
  EXPECT_EQ(2, std::count(requests.begin(), requests.end(), "wl_shm_pool.create_buffer"));
}

TEST_F(pool_test, advertised_formats_are_collected)
{
  EXPECT_TRUE(runtime->supports_format(WL_SHM_FORMAT_ARGB8888));
  EXPECT_TRUE(runtime->supports_format(WL_SHM_FORMAT_XRGB8888));
  EXPECT_FALSE(runtime->supports_format(WL_SHM_FORMAT_RGB565));
}
