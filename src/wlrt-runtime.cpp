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
#include <sstream>
#include <utility>

#include <wlrt-errors.hpp>
#include <wlrt-log.hpp>
#include <wlrt-runtime.hpp>

using namespace wlrt;

namespace
{
  display_t connect(runtime_options_t const &options)
  {
    if(options.display_fd >= 0)
      return display_t(options.display_fd);
    return display_t(options.display_name);
  }

  template <typename proxy>
  bool bind_first(registry_t &registry, proxy &p, uint32_t name, std::string const &interface)
  {
    if(interface != proxy::interface_name)
      return false;
    if(p.has_object())
      {
        detail::log(log_level::debug, "ignoring duplicate " + interface + " global");
        return true;
      }
    registry.bind(name, p, 1);
    std::stringstream ss;
    ss << "bound " << interface << " global " << name;
    detail::log(log_level::debug, ss.str());
    return true;
  }
}

reload_config_t::reload_config_t()
  : soft(false)
{
}

reload_config_t::reload_config_t(bool soft)
  : soft(soft)
{
}

action_value_t::action_value_t()
{
}

action_value_t::action_value_t(reload_config_t const &reload_config)
  : reload_config(reload_config)
{
}

target_t::target_t(window_t *surface)
  : surface(surface)
{
}

target_t target_t::app()
{
  return target_t(nullptr);
}

target_t target_t::window(window_t &surface)
{
  return target_t(&surface);
}

bool target_t::is_app() const
{
  return surface == nullptr;
}

window_t *target_t::get_surface() const
{
  return surface;
}

void core_t::update_surface_config(window_t& /*unused*/, const config_t& /*unused*/)
{
}

runtime_options_t::runtime_options_t()
  : config_loader(&config_t::load)
{
}

runtime_t::runtime_t(core_t &core, runtime_options_t const &options)
  : core(core), options(options), display(connect(options))
{
  bind_globals();
  load_config();
  post(target_t::app(), action_t::new_window);
}

runtime_t::~runtime_t()
{
  windows.clear();
}

void runtime_t::bind_globals()
{
  registry = display.get_registry();
  registry.on_global() = [this] (uint32_t name, std::string interface, uint32_t /*version*/)
    {
      if(bind_first(registry, shm, name, interface))
        return;
      if(bind_first(registry, compositor, name, interface))
        return;
      bind_first(registry, wm_base, name, interface);
    };
  registry.on_global_remove() = [] (uint32_t name)
    {
      std::stringstream ss;
      ss << "global " << name << " removed";
      detail::log(log_level::debug, ss.str());
    };
  display.roundtrip();

  if(!shm.has_object())
    throw missing_capability_error(shm_t::interface_name);
  if(!compositor.has_object())
    throw missing_capability_error(compositor_t::interface_name);
  if(!wm_base.has_object())
    throw missing_capability_error(xdg_wm_base_t::interface_name);

  shm.on_format() = [this] (uint32_t format) { shm_formats.push_back(format); };
  wm_base.on_ping() = [this] (uint32_t serial) { wm_base.pong(serial); };

  // the format events answer the bind requests sent above
  display.roundtrip();
}

void runtime_t::load_config()
{
  config = options.config_loader(options.config);
  for(auto const &diagnostic : config.diagnostics.get_items())
    {
      std::stringstream ss;
      diagnostic.write(ss);
      detail::log(log_level::warning, ss.str());
    }
  if(config.diagnostics.contains_location(diagnostic_location::cli))
    throw config_error("invalid command line arguments");
}

void runtime_t::run()
{
  while(true)
    {
      display.dispatch(wake);
      process_mailbox();

      bool quit = core.tick(*this);
      if(quit || windows.empty())
        {
          while(!windows.empty())
            close_window(*windows.back());
          display.flush();
          return;
        }
    }
}

void runtime_t::process_mailbox()
{
  std::deque<message_t> pending;
  {
    std::lock_guard<std::mutex> lock(mailbox_mutex);
    pending.swap(mailbox);
  }

  for(auto const &message : pending)
    {
      if(!message.target.is_app() && !contains(message.target.get_surface()))
        {
          detail::log(log_level::debug, "dropping action=" + to_string(message.action) + " for a closed window");
          continue;
        }

      try
        {
          perform_action(message.target, message.action, message.value);
        }
      catch(resource_error &e)
        {
          // without any window there is nothing left to keep running for
          if(windows.empty())
            throw;
          detail::log(log_level::error, "action=" + to_string(message.action) + " failed: " + e.what());
        }
      catch(config_error &e)
        {
          if(windows.empty())
            throw;
          detail::log(log_level::error, "action=" + to_string(message.action) + " failed: " + e.what());
        }
    }
}

void runtime_t::perform_action(target_t const &target, action_t action, action_value_t const &value)
{
  switch(action)
    {
    case action_t::new_window:
      new_window(target.get_surface());
      break;
    case action_t::reload_config:
      reload_config(target, value.reload_config);
      break;
    default:
      detail::log(log_level::info, "unimplemented action=" + to_string(action));
      break;
    }
}

void runtime_t::post(target_t const &target, action_t action, action_value_t const &value)
{
  {
    std::lock_guard<std::mutex> lock(mailbox_mutex);
    mailbox.push_back(message_t{target, action, value});
  }
  wake.signal();
}

void runtime_t::wakeup()
{
  wake.signal();
}

window_t &runtime_t::new_window(window_t *parent)
{
  std::unique_ptr<window_t> window(new window_t(*this, parent));
  windows.push_back(std::move(window));
  try
    {
      core.add_surface(*windows.back());
    }
  catch(...)
    {
      windows.pop_back();
      throw;
    }
  return *windows.back();
}

void runtime_t::close_window(window_t &window)
{
  auto it = std::find_if(windows.begin(), windows.end(),
                         [&window] (std::unique_ptr<window_t> const &w) { return w.get() == &window; });
  if(it == windows.end())
    throw protocol_precondition_error("close_window on a window the runtime does not own");

  core.delete_surface(window);
  window.destroy();
  windows.erase(it);
}

void runtime_t::reload_config(target_t const &target, reload_config_t const &reload)
{
  if(reload.soft)
    {
      apply_config(target, config);
      return;
    }

  config_t snapshot = options.config_loader(options.config);
  for(auto const &diagnostic : snapshot.diagnostics.get_items())
    {
      std::stringstream ss;
      diagnostic.write(ss);
      detail::log(log_level::warning, ss.str());
    }
  if(snapshot.diagnostics.contains_location(diagnostic_location::cli))
    throw config_error("invalid command line arguments");

  apply_config(target, snapshot);
  config = snapshot;
}

void runtime_t::apply_config(target_t const &target, const config_t &snapshot)
{
  if(target.is_app())
    {
      core.update_config(*this, snapshot);
      return;
    }

  window_t &window = *target.get_surface();
  core.update_surface_config(window, snapshot);
  window.update_config(snapshot);
}

bool runtime_t::contains(window_t const *window) const
{
  return std::any_of(windows.begin(), windows.end(),
                     [window] (std::unique_ptr<window_t> const &w) { return w.get() == window; });
}

void runtime_t::redraw_surface(window_t& /*unused*/)
{
}

void runtime_t::redraw_inspector(window_t& /*unused*/)
{
}

bool runtime_t::supports_format(uint32_t format) const
{
  return shm_formats.empty()
    || std::find(shm_formats.begin(), shm_formats.end(), format) != shm_formats.end();
}

const config_t &runtime_t::get_config() const
{
  return config;
}

std::vector<window_t*> runtime_t::get_windows() const
{
  std::vector<window_t*> result;
  for(auto const &window : windows)
    result.push_back(window.get());
  return result;
}

display_t &runtime_t::get_display()
{
  return display;
}

shm_t &runtime_t::get_shm()
{
  return shm;
}

compositor_t &runtime_t::get_compositor()
{
  return compositor;
}

xdg_wm_base_t &runtime_t::get_wm_base()
{
  return wm_base;
}

std::string wlrt::to_string(action_t action)
{
  switch(action)
    {
    case action_t::new_window: return "new_window";
    case action_t::new_tab: return "new_tab";
    case action_t::new_split: return "new_split";
    case action_t::close_all_windows: return "close_all_windows";
    case action_t::toggle_fullscreen: return "toggle_fullscreen";
    case action_t::toggle_tab_overview: return "toggle_tab_overview";
    case action_t::toggle_window_decorations: return "toggle_window_decorations";
    case action_t::toggle_quick_terminal: return "toggle_quick_terminal";
    case action_t::toggle_visibility: return "toggle_visibility";
    case action_t::move_tab: return "move_tab";
    case action_t::goto_tab: return "goto_tab";
    case action_t::goto_split: return "goto_split";
    case action_t::resize_split: return "resize_split";
    case action_t::equalize_splits: return "equalize_splits";
    case action_t::toggle_split_zoom: return "toggle_split_zoom";
    case action_t::present_terminal: return "present_terminal";
    case action_t::size_limit: return "size_limit";
    case action_t::initial_size: return "initial_size";
    case action_t::cell_size: return "cell_size";
    case action_t::inspector: return "inspector";
    case action_t::render_inspector: return "render_inspector";
    case action_t::desktop_notification: return "desktop_notification";
    case action_t::set_title: return "set_title";
    case action_t::pwd: return "pwd";
    case action_t::mouse_shape: return "mouse_shape";
    case action_t::mouse_visibility: return "mouse_visibility";
    case action_t::mouse_over_link: return "mouse_over_link";
    case action_t::renderer_health: return "renderer_health";
    case action_t::open_config: return "open_config";
    case action_t::quit_timer: return "quit_timer";
    case action_t::secure_input: return "secure_input";
    case action_t::key_sequence: return "key_sequence";
    case action_t::color_change: return "color_change";
    case action_t::reload_config: return "reload_config";
    case action_t::config_change: return "config_change";
    }
  return "unknown";
}
