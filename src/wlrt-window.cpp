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

#include <cerrno>
#include <sstream>

#include <wlrt-errors.hpp>
#include <wlrt-log.hpp>
#include <wlrt-runtime.hpp>
#include <wlrt-window.hpp>

using namespace wlrt;

constexpr int32_t window_t::width;
constexpr int32_t window_t::height;

namespace
{
  const uint32_t buffer_format = WL_SHM_FORMAT_ARGB8888;

  shm_t &checked_shm(runtime_t &runtime)
  {
    if(!runtime.supports_format(buffer_format))
      throw resource_error(ENOTSUP, "compositor does not support ARGB8888 buffers");
    return runtime.get_shm();
  }
}

window_t::window_t(runtime_t &runtime, window_t *parent)
  : runtime(runtime), parent(parent), title(runtime.get_config().title),
    pool(checked_shm(runtime), static_cast<std::size_t>(width) * height * 4),
    buffer(pool.create_buffer(0, width, height, width * 4, buffer_format))
{
  const config_t &config = runtime.get_config();
  buffer.fill(config.background);

  surface = runtime.get_compositor().create_surface();
  xdg = runtime.get_wm_base().get_xdg_surface(surface);
  toplevel = xdg.get_toplevel();

  xdg.on_configure() = [this] (uint32_t serial) { handle_configure(serial); };
  toplevel.on_configure() = [this] (int32_t w, int32_t h, std::vector<uint32_t> states)
    {
      // the buffer keeps its fixed size
      std::stringstream ss;
      ss << "toplevel configure " << w << "x" << h << " states=" << states.size()
         << " surface=" << surface.get_id();
      detail::log(log_level::debug, ss.str());
    };
  toplevel.on_close() = [this] () { close_requested = true; };

  toplevel.set_title(config.title);
  toplevel.set_app_id(config.app_id);

  // initial commit without a buffer, answered by the first configure
  surface.commit();
  state = state_t::awaiting_first_configure;
  runtime.get_display().roundtrip();

  if(state != state_t::configured)
    throw protocol_precondition_error("no configure event received for the new window");

  attach();
}

void window_t::handle_configure(uint32_t serial)
{
  configure_pending = true;
  configure_serial = serial;
  ack_configure(serial);

  surface.commit();
  if(state == state_t::awaiting_first_configure)
    state = state_t::configured;
}

void window_t::ack_configure(uint32_t serial)
{
  if(state == state_t::destroyed)
    throw protocol_precondition_error("ack_configure on a destroyed window");
  if(!configure_pending || serial != configure_serial)
    {
      std::stringstream ss;
      ss << "ack_configure with serial " << serial << " that is not pending";
      throw protocol_precondition_error(ss.str());
    }
  xdg.ack_configure(serial);
  configure_pending = false;
}

void window_t::attach()
{
  if(state != state_t::configured && state != state_t::attached)
    throw protocol_precondition_error("attach in state " + to_string(state));

  surface.attach(buffer.get_proxy(), 0, 0);
  surface.damage(0, 0, buffer.get_width(), buffer.get_height());
  surface.commit();
  state = state_t::attached;
}

void window_t::destroy()
{
  if(state == state_t::destroyed)
    throw protocol_precondition_error("window destroyed twice");

  toplevel.release();
  xdg.release();
  surface.release();
  buffer.release();
  pool.release();
  state = state_t::destroyed;
}

void window_t::update_config(const config_t &config)
{
  if(state == state_t::destroyed)
    throw protocol_precondition_error("update_config on a destroyed window");

  title = config.title;
  toplevel.set_title(config.title);
  toplevel.set_app_id(config.app_id);
  buffer.fill(config.background);
  if(state == state_t::attached)
    attach();
}

bool window_t::should_close() const
{
  return close_requested;
}

window_t::state_t window_t::get_state() const
{
  return state;
}

std::string const &window_t::get_title() const
{
  return title;
}

std::pair<int32_t, int32_t> window_t::get_size() const
{
  return std::make_pair(width, height);
}

std::pair<float, float> window_t::get_content_scale() const
{
  return std::make_pair(1.0f, 1.0f);
}

window_t *window_t::get_parent() const
{
  return parent;
}

const surface_t &window_t::get_surface() const
{
  return surface;
}

const pixel_buffer_t &window_t::get_buffer() const
{
  return buffer;
}

std::string wlrt::to_string(window_t::state_t state)
{
  switch(state)
    {
    case window_t::state_t::created:
      return "created";
    case window_t::state_t::awaiting_first_configure:
      return "awaiting_first_configure";
    case window_t::state_t::configured:
      return "configured";
    case window_t::state_t::attached:
      return "attached";
    case window_t::state_t::destroyed:
      return "destroyed";
    }
  return "unknown";
}
