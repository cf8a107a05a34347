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

#include <exception>
#include <iostream>
#include <sstream>

#include "demo_app.hpp"

using namespace wlrt;
using namespace wlrt::demo;

void demo_core::request_quit()
{
  quit_requested = true;
}

bool demo_core::tick(runtime_t &runtime)
{
  for(auto *window : runtime.get_windows())
    if(window->should_close())
      runtime.close_window(*window);
  return quit_requested;
}

void demo_core::add_surface(window_t &window)
{
  std::stringstream ss;
  ss << "window " << window.get_surface().get_id() << " \"" << window.get_title() << "\" opened";
  detail::log(log_level::info, ss.str());
}

void demo_core::delete_surface(window_t &window)
{
  std::stringstream ss;
  ss << "window " << window.get_surface().get_id() << " closed";
  detail::log(log_level::info, ss.str());
}

void demo_core::update_config(runtime_t &runtime, const config_t &config)
{
  for(auto *window : runtime.get_windows())
    window->update_config(config);
}

int demo_app_t::start(runtime_options_t const &options)
{
  try
    {
      runtime.reset(new runtime_t(core, options));
    }
  catch(std::exception &e)
    {
      std::cerr << "wlrt-demo: " << e.what() << std::endl;
      return 1;
    }
  return 0;
}

int demo_app_t::run()
{
  try
    {
      runtime->run();
    }
  catch(std::exception &e)
    {
      std::cerr << "wlrt-demo: " << e.what() << std::endl;
      return 2;
    }
  return 0;
}

void demo_app_t::request_quit()
{
  core.request_quit();
  runtime->wakeup();
}

void demo_app_t::request_reload()
{
  runtime->post(target_t::app(), action_t::reload_config, action_value_t(reload_config_t(false)));
}
