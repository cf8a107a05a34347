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

// Hand-maintained, see wlrt-protocol.hpp.

#include <stdexcept>

#include <wlrt-protocol.hpp>

using namespace wlrt;

namespace
{
  std::vector<uint32_t> to_vector(wl_array *array)
  {
    if(!array || !array->data)
      return std::vector<uint32_t>();
    const uint32_t *begin = static_cast<const uint32_t*>(array->data);
    return std::vector<uint32_t>(begin, begin + array->size / sizeof(uint32_t));
  }

  void check_listener(int return_value, std::string const &function_name)
  {
    if(return_value < 0)
      throw std::runtime_error(function_name + " failed.");
  }
}

constexpr const char *buffer_t::interface_name;
constexpr const char *shm_pool_t::interface_name;
constexpr const char *shm_t::interface_name;
constexpr const char *surface_t::interface_name;
constexpr const char *compositor_t::interface_name;
constexpr const char *xdg_toplevel_t::interface_name;
constexpr const char *xdg_surface_t::interface_name;
constexpr const char *xdg_wm_base_t::interface_name;
constexpr const char *registry_t::interface_name;

const wl_interface *const shm_t::interface = &wl_shm_interface;
const wl_interface *const compositor_t::interface = &wl_compositor_interface;
const wl_interface *const xdg_wm_base_t::interface = &xdg_wm_base_interface;

// wl_buffer

const wl_buffer_listener buffer_t::listener = {
  [] (void *data, wl_buffer* /*unused*/)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->release) events->release();
  }
};

buffer_t::buffer_t(wl_buffer *buffer)
  : proxy_t<wl_buffer>(buffer, wl_buffer_destroy), events(new events_t)
{
  check_listener(wl_buffer_add_listener(c_ptr(), &listener, events.get()), "wl_buffer_add_listener");
}

std::function<void()> &buffer_t::on_release()
{
  return events->release;
}

// wl_shm_pool

shm_pool_t::shm_pool_t(wl_shm_pool *pool)
  : proxy_t<wl_shm_pool>(pool, wl_shm_pool_destroy)
{
}

buffer_t shm_pool_t::create_buffer(int32_t offset, int32_t width, int32_t height, int32_t stride, uint32_t format)
{
  wl_buffer *buffer = wl_shm_pool_create_buffer(c_ptr(), offset, width, height, stride, format);
  return buffer_t(detail::check_object(buffer, "wl_shm_pool_create_buffer"));
}

// wl_shm

const wl_shm_listener shm_t::listener = {
  [] (void *data, wl_shm* /*unused*/, uint32_t format)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->format) events->format(format);
  }
};

shm_t::shm_t(wl_shm *shm)
  : proxy_t<wl_shm>(shm, wl_shm_destroy), events(new events_t)
{
  check_listener(wl_shm_add_listener(c_ptr(), &listener, events.get()), "wl_shm_add_listener");
}

shm_pool_t shm_t::create_pool(int fd, int32_t size)
{
  wl_shm_pool *pool = wl_shm_create_pool(c_ptr(), fd, size);
  return shm_pool_t(detail::check_object(pool, "wl_shm_create_pool"));
}

std::function<void(uint32_t)> &shm_t::on_format()
{
  return events->format;
}

// wl_surface

surface_t::surface_t(wl_surface *surface)
  : proxy_t<wl_surface>(surface, wl_surface_destroy)
{
}

void surface_t::attach(buffer_t const &buffer, int32_t x, int32_t y)
{
  wl_surface_attach(c_ptr(), buffer.c_ptr(), x, y);
}

void surface_t::damage(int32_t x, int32_t y, int32_t width, int32_t height)
{
  wl_surface_damage(c_ptr(), x, y, width, height);
}

void surface_t::commit()
{
  wl_surface_commit(c_ptr());
}

// wl_compositor

compositor_t::compositor_t(wl_compositor *compositor)
  : proxy_t<wl_compositor>(compositor, wl_compositor_destroy)
{
}

surface_t compositor_t::create_surface()
{
  wl_surface *surface = wl_compositor_create_surface(c_ptr());
  return surface_t(detail::check_object(surface, "wl_compositor_create_surface"));
}

// xdg_toplevel

const xdg_toplevel_listener xdg_toplevel_t::listener = {
  [] (void *data, xdg_toplevel* /*unused*/, int32_t width, int32_t height, wl_array *states)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->configure) events->configure(width, height, to_vector(states));
  },
  [] (void *data, xdg_toplevel* /*unused*/)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->close) events->close();
  }
};

xdg_toplevel_t::xdg_toplevel_t(xdg_toplevel *toplevel)
  : proxy_t<xdg_toplevel>(toplevel, xdg_toplevel_destroy), events(new events_t)
{
  check_listener(xdg_toplevel_add_listener(c_ptr(), &listener, events.get()), "xdg_toplevel_add_listener");
}

void xdg_toplevel_t::set_title(std::string const &title)
{
  xdg_toplevel_set_title(c_ptr(), title.c_str());
}

void xdg_toplevel_t::set_app_id(std::string const &app_id)
{
  xdg_toplevel_set_app_id(c_ptr(), app_id.c_str());
}

std::function<void(int32_t, int32_t, std::vector<uint32_t>)> &xdg_toplevel_t::on_configure()
{
  return events->configure;
}

std::function<void()> &xdg_toplevel_t::on_close()
{
  return events->close;
}

// xdg_surface

const xdg_surface_listener xdg_surface_t::listener = {
  [] (void *data, xdg_surface* /*unused*/, uint32_t serial)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->configure) events->configure(serial);
  }
};

xdg_surface_t::xdg_surface_t(xdg_surface *surface)
  : proxy_t<xdg_surface>(surface, xdg_surface_destroy), events(new events_t)
{
  check_listener(xdg_surface_add_listener(c_ptr(), &listener, events.get()), "xdg_surface_add_listener");
}

xdg_toplevel_t xdg_surface_t::get_toplevel()
{
  xdg_toplevel *toplevel = xdg_surface_get_toplevel(c_ptr());
  return xdg_toplevel_t(detail::check_object(toplevel, "xdg_surface_get_toplevel"));
}

void xdg_surface_t::ack_configure(uint32_t serial)
{
  xdg_surface_ack_configure(c_ptr(), serial);
}

std::function<void(uint32_t)> &xdg_surface_t::on_configure()
{
  return events->configure;
}

// xdg_wm_base

const xdg_wm_base_listener xdg_wm_base_t::listener = {
  [] (void *data, xdg_wm_base* /*unused*/, uint32_t serial)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->ping) events->ping(serial);
  }
};

xdg_wm_base_t::xdg_wm_base_t(xdg_wm_base *wm_base)
  : proxy_t<xdg_wm_base>(wm_base, xdg_wm_base_destroy), events(new events_t)
{
  check_listener(xdg_wm_base_add_listener(c_ptr(), &listener, events.get()), "xdg_wm_base_add_listener");
}

xdg_surface_t xdg_wm_base_t::get_xdg_surface(surface_t const &surface)
{
  xdg_surface *xdg = xdg_wm_base_get_xdg_surface(c_ptr(), surface.c_ptr());
  return xdg_surface_t(detail::check_object(xdg, "xdg_wm_base_get_xdg_surface"));
}

void xdg_wm_base_t::pong(uint32_t serial)
{
  xdg_wm_base_pong(c_ptr(), serial);
}

std::function<void(uint32_t)> &xdg_wm_base_t::on_ping()
{
  return events->ping;
}

// wl_registry

const wl_registry_listener registry_t::listener = {
  [] (void *data, wl_registry* /*unused*/, uint32_t name, const char *interface, uint32_t version)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->global) events->global(name, interface ? interface : "", version);
  },
  [] (void *data, wl_registry* /*unused*/, uint32_t name)
  {
    events_t *events = static_cast<events_t*>(data);
    if(events->global_remove) events->global_remove(name);
  }
};

registry_t::registry_t(wl_registry *registry)
  : proxy_t<wl_registry>(registry, wl_registry_destroy), events(new events_t)
{
  check_listener(wl_registry_add_listener(c_ptr(), &listener, events.get()), "wl_registry_add_listener");
}

std::function<void(uint32_t, std::string, uint32_t)> &registry_t::on_global()
{
  return events->global;
}

std::function<void(uint32_t)> &registry_t::on_global_remove()
{
  return events->global_remove;
}
