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

#ifndef WLRT_TEST_SUPPORT_HPP
#define WLRT_TEST_SUPPORT_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <wlrt-runtime.hpp>

#include "fake_compositor.hpp"

namespace wlrt
{
  namespace test
  {
    /** \brief Core recording every call, with overridable behavior
     */
    class recording_core_t : public core_t
    {
    public:
      int ticks = 0;
      std::vector<window_t*> added;
      std::vector<window_t*> deleted;
      std::vector<std::string> app_configs;
      std::vector<std::string> surface_configs;

      std::function<bool(runtime_t&)> on_tick;
      std::function<void(window_t&)> on_add;
      std::function<void(const config_t&)> on_update;

      bool tick(runtime_t &runtime) override
      {
        ticks++;
        return on_tick ? on_tick(runtime) : false;
      }

      void add_surface(window_t &window) override
      {
        if(on_add)
          on_add(window);
        added.push_back(&window);
      }

      void delete_surface(window_t &window) override
      {
        deleted.push_back(&window);
      }

      void update_config(runtime_t& /*unused*/, const config_t &config) override
      {
        if(on_update)
          on_update(config);
        app_configs.push_back(config.title);
      }

      void update_surface_config(window_t& /*unused*/, const config_t &config) override
      {
        if(on_update)
          on_update(config);
        surface_configs.push_back(config.title);
      }
    };

    /** \brief Fixture capturing log messages
     */
    class log_capture_test : public ::testing::Test
    {
    protected:
      std::vector<std::pair<log_level, std::string>> messages;

      void SetUp() override
      {
        set_log_handler([this] (log_level level, std::string message)
                        {
                          messages.push_back(std::make_pair(level, message));
                        });
      }

      void TearDown() override
      {
        set_log_handler(nullptr);
      }

      bool logged(log_level level, std::string const &message) const
      {
        return std::find(messages.begin(), messages.end(), std::make_pair(level, message)) != messages.end();
      }
    };

    /** \brief Options connecting to a fake compositor, without a config file
     */
    inline runtime_options_t connect_to(fake_compositor_t &fake)
    {
      runtime_options_t options;
      options.display_fd = fake.take_client_fd();
      options.config.skip_default_file = true;
      return options;
    }

    inline std::ptrdiff_t position_of(std::vector<std::string> const &requests, std::string const &request)
    {
      auto it = std::find(requests.begin(), requests.end(), request);
      return it == requests.end() ? -1 : it - requests.begin();
    }
  }
}

#endif
