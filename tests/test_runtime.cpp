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
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <wlrt-runtime.hpp>

#include "test_support.hpp"

using namespace wlrt;
using namespace wlrt::test;

class runtime_test : public log_capture_test
{
protected:
  std::unique_ptr<fake_compositor_t> fake;
  recording_core_t core;
  std::unique_ptr<runtime_t> runtime;

  runtime_options_t options_for(fake_options_t const &fake_options = fake_options_t())
  {
    fake.reset(new fake_compositor_t(fake_options));
    return connect_to(*fake);
  }

  void start(runtime_options_t const &options)
  {
    runtime.reset(new runtime_t(core, options));
  }

  void start()
  {
    start(options_for());
  }

  void TearDown() override
  {
    runtime.reset();
    fake.reset();
    log_capture_test::TearDown();
  }
};

TEST_F(runtime_test, startup_binds_globals)
{
  start();

  EXPECT_TRUE(runtime->get_shm().has_object());
  EXPECT_TRUE(runtime->get_compositor().has_object());
  EXPECT_TRUE(runtime->get_wm_base().has_object());
  EXPECT_TRUE(runtime->get_windows().empty());
  EXPECT_EQ("wlrt", runtime->get_config().title);
}

TEST_F(runtime_test, missing_globals_fail_startup)
{
  fake_options_t without_shm;
  without_shm.shm = false;
  fake_options_t without_compositor;
  without_compositor.compositor = false;
  fake_options_t without_wm_base;
  without_wm_base.wm_base = false;

  std::vector<std::pair<fake_options_t, std::string>> cases = {
    std::make_pair(without_shm, std::string("wl_shm")),
    std::make_pair(without_compositor, std::string("wl_compositor")),
    std::make_pair(without_wm_base, std::string("xdg_wm_base"))
  };

  for(auto const &c : cases)
    {
      runtime_options_t options = options_for(c.first);
      try
        {
          runtime_t failing(core, options);
          ADD_FAILURE() << "startup without " << c.second << " succeeded";
        }
      catch(missing_capability_error &e)
        {
          EXPECT_EQ(c.second, e.interface_name());
          EXPECT_EQ("No " + c.second + " global", std::string(e.what()));
        }
      EXPECT_TRUE(fake->get_requests().empty());
    }
  EXPECT_TRUE(core.added.empty());
}

TEST_F(runtime_test, connection_failure)
{
  runtime_options_t options;
  options.display_name = "wlrt-test-no-such-display";
  options.config.skip_default_file = true;
  EXPECT_THROW(runtime_t failing(core, options), connection_error);
}

TEST_F(runtime_test, throwing_log_handler_does_not_unwind_into_libwayland)
{
  int calls = 0;
  set_log_handler([&calls] (log_level, std::string)
                  {
                    calls++;
                    throw std::runtime_error("log handler failed");
                  });

  // the C library logs either the unusable runtime dir or the overlong socket path
  runtime_options_t options;
  options.display_name = std::string(200, 'w');
  options.config.skip_default_file = true;
  EXPECT_THROW(runtime_t failing(core, options), connection_error);
  EXPECT_GE(calls, 1);
}

TEST_F(runtime_test, bad_command_line_fails_startup)
{
  runtime_options_t options = options_for();
  options.config.args.push_back("--bogus=1");
  EXPECT_THROW(start(options), config_error);
  EXPECT_TRUE(logged(log_level::warning, "cli: bogus: unknown field"));
}

TEST_F(runtime_test, file_diagnostics_are_logged_only)
{
  runtime_options_t options = options_for();
  options.config_loader = [] (config_sources_t const& /*unused*/) -> config_t
    {
      config_t config;
      config.diagnostics.add(diagnostic_location::file, "font", "unknown field");
      return config;
    };
  start(options);
  EXPECT_TRUE(logged(log_level::warning, "file: font: unknown field"));
}

TEST_F(runtime_test, ping_is_answered)
{
  start();
  uint32_t serial = fake->send_ping();
  runtime->get_display().roundtrip();
  runtime->get_display().roundtrip();
  EXPECT_EQ(serial, fake->get_last_pong_serial());
}

TEST_F(runtime_test, two_new_window_actions_create_two_windows)
{
  start();
  runtime->perform_action(target_t::app(), action_t::new_window);
  runtime->perform_action(target_t::app(), action_t::new_window);

  std::vector<window_t*> windows = runtime->get_windows();
  ASSERT_EQ(2u, windows.size());
  EXPECT_NE(windows[0]->get_surface().get_id(), windows[1]->get_surface().get_id());
  EXPECT_EQ(windows, core.added);
  EXPECT_EQ(window_t::state_t::attached, windows[0]->get_state());
  EXPECT_EQ(window_t::state_t::attached, windows[1]->get_state());
}

TEST_F(runtime_test, new_window_records_parent)
{
  start();
  window_t &parent = runtime->new_window();
  runtime->perform_action(target_t::window(parent), action_t::new_window);

  ASSERT_EQ(2u, runtime->get_windows().size());
  EXPECT_EQ(&parent, runtime->get_windows()[1]->get_parent());
}

TEST_F(runtime_test, failed_new_window_leaves_list_unchanged)
{
  fake_options_t fake_options;
  fake_options.configure_on_commit = false;
  start(options_for(fake_options));

  EXPECT_THROW(runtime->new_window(), protocol_precondition_error);
  EXPECT_TRUE(runtime->get_windows().empty());
  EXPECT_TRUE(core.added.empty());
}

TEST_F(runtime_test, rejected_window_is_removed_again)
{
  start();
  core.on_add = [] (window_t&) { throw std::runtime_error("rejected"); };

  EXPECT_THROW(runtime->new_window(), std::runtime_error);
  EXPECT_TRUE(runtime->get_windows().empty());
}

TEST_F(runtime_test, unimplemented_actions_are_logged)
{
  start();
  runtime->perform_action(target_t::app(), action_t::toggle_fullscreen);
  runtime->perform_action(target_t::app(), action_t::goto_tab);

  EXPECT_TRUE(logged(log_level::info, "unimplemented action=toggle_fullscreen"));
  EXPECT_TRUE(logged(log_level::info, "unimplemented action=goto_tab"));
  EXPECT_TRUE(runtime->get_windows().empty());
}

TEST_F(runtime_test, close_window)
{
  start();
  window_t &window = runtime->new_window();
  runtime->close_window(window);

  EXPECT_TRUE(runtime->get_windows().empty());
  ASSERT_EQ(1u, core.deleted.size());
  runtime->get_display().roundtrip();
  EXPECT_TRUE(fake->has_request("xdg_toplevel.destroy"));
}

TEST_F(runtime_test, close_unknown_window_is_rejected)
{
  start();
  window_t window(*runtime, nullptr);
  EXPECT_THROW(runtime->close_window(window), protocol_precondition_error);
  EXPECT_TRUE(core.deleted.empty());
  EXPECT_EQ(window_t::state_t::attached, window.get_state());
}

TEST_F(runtime_test, failed_reload_keeps_snapshot)
{
  int loads = 0;
  runtime_options_t options = options_for();
  options.config_loader = [&loads] (config_sources_t const& /*unused*/) -> config_t
    {
      if(loads++ > 0)
        throw config_error("broken configuration");
      config_t config;
      config.title = "first";
      return config;
    };
  start(options);

  config_t before = runtime->get_config();
  EXPECT_THROW(runtime->reload_config(target_t::app(), reload_config_t(false)), config_error);
  EXPECT_TRUE(before == runtime->get_config());
  EXPECT_TRUE(core.app_configs.empty());
}

TEST_F(runtime_test, failed_apply_keeps_snapshot)
{
  int loads = 0;
  runtime_options_t options = options_for();
  options.config_loader = [&loads] (config_sources_t const& /*unused*/) -> config_t
    {
      config_t config;
      config.title = loads++ == 0 ? "first" : "second";
      return config;
    };
  start(options);

  core.on_update = [] (const config_t&) { throw std::runtime_error("cannot apply"); };
  config_t before = runtime->get_config();

  EXPECT_THROW(runtime->reload_config(target_t::app(), reload_config_t(false)), std::runtime_error);
  EXPECT_EQ(2, loads);
  EXPECT_TRUE(before == runtime->get_config());
  EXPECT_EQ("first", runtime->get_config().title);

  EXPECT_THROW(runtime->reload_config(target_t::app(), reload_config_t(true)), std::runtime_error);
  EXPECT_TRUE(before == runtime->get_config());
}

TEST_F(runtime_test, reload_replaces_snapshot)
{
  int loads = 0;
  runtime_options_t options = options_for();
  options.config_loader = [&loads] (config_sources_t const& /*unused*/) -> config_t
    {
      config_t config;
      config.title = loads++ == 0 ? "first" : "reloaded";
      return config;
    };
  start(options);
  window_t &window = runtime->new_window();
  EXPECT_EQ("first", window.get_title());

  runtime->perform_action(target_t::window(window), action_t::reload_config,
                          action_value_t(reload_config_t(false)));
  runtime->get_display().roundtrip();

  EXPECT_EQ("reloaded", runtime->get_config().title);
  EXPECT_EQ("reloaded", window.get_title());
  EXPECT_EQ("reloaded", fake->get_last_title());
  ASSERT_EQ(1u, core.surface_configs.size());
  EXPECT_EQ("reloaded", core.surface_configs.front());
}

TEST_F(runtime_test, soft_reload_reapplies_current_snapshot)
{
  int loads = 0;
  runtime_options_t options = options_for();
  options.config_loader = [&loads] (config_sources_t const& /*unused*/) -> config_t
    {
      loads++;
      return config_t();
    };
  start(options);

  runtime->reload_config(target_t::app(), reload_config_t(true));
  EXPECT_EQ(1, loads);
  ASSERT_EQ(1u, core.app_configs.size());
  EXPECT_EQ("wlrt", core.app_configs.front());
}

TEST_F(runtime_test, run_opens_initial_window_and_ends_on_close)
{
  start();
  fake_compositor_t &compositor = *fake;
  core.on_add = [&compositor] (window_t&) { compositor.send_close(); };
  core.on_tick = [] (runtime_t &r) -> bool
    {
      for(auto *window : r.get_windows())
        if(window->should_close())
          r.close_window(*window);
      return false;
    };

  runtime->run();

  EXPECT_EQ(1u, core.added.size());
  EXPECT_EQ(core.added, core.deleted);
  EXPECT_TRUE(runtime->get_windows().empty());
  EXPECT_GE(core.ticks, 2);
}

TEST_F(runtime_test, run_closes_remaining_windows_on_quit)
{
  start();
  core.on_tick = [] (runtime_t &r) -> bool
    {
      r.new_window();
      return true;
    };

  runtime->run();

  EXPECT_EQ(1, core.ticks);
  EXPECT_EQ(2u, core.deleted.size());
  EXPECT_TRUE(runtime->get_windows().empty());
  runtime->get_display().roundtrip();
  std::vector<std::string> requests = fake->get_requests();
  EXPECT_EQ(2, std::count(requests.begin(), requests.end(), "xdg_toplevel.destroy"));
}

TEST_F(runtime_test, post_from_another_thread_wakes_the_loop)
{
  start();
  bool reloaded = false;
  std::thread poster;
  runtime_t *r = runtime.get();

  core.on_update = [&reloaded] (const config_t&) { reloaded = true; };
  core.on_tick = [&] (runtime_t&) -> bool
    {
      if(core.ticks == 1)
        poster = std::thread([r] ()
          {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            r->post(target_t::app(), action_t::reload_config, action_value_t(reload_config_t(true)));
          });
      return reloaded;
    };

  runtime->run();
  poster.join();

  EXPECT_TRUE(reloaded);
  EXPECT_GE(core.ticks, 2);
  EXPECT_TRUE(runtime->get_windows().empty());
}

TEST_F(runtime_test, actions_for_closed_windows_are_dropped)
{
  start();
  window_t *closed = nullptr;
  core.on_tick = [&] (runtime_t &r) -> bool
    {
      if(core.ticks == 1)
        {
          closed = r.get_windows().front();
          r.post(target_t::window(*closed), action_t::reload_config, action_value_t(reload_config_t(true)));
          r.new_window();
          r.close_window(*closed);
          return false;
        }
      return true;
    };

  runtime->run();

  EXPECT_TRUE(core.surface_configs.empty());
  EXPECT_TRUE(logged(log_level::debug, "dropping action=reload_config for a closed window"));
}

TEST_F(runtime_test, failed_first_window_ends_the_loop)
{
  start();
  core.on_add = [] (window_t&) { throw resource_error(ENOMEM, "no memory for window"); };

  EXPECT_THROW(runtime->run(), resource_error);
  EXPECT_TRUE(runtime->get_windows().empty());
  EXPECT_EQ(0, core.ticks);
}

TEST_F(runtime_test, window_errors_in_the_loop_are_logged)
{
  start();
  std::size_t open_after_failure = 0;
  core.on_tick = [&] (runtime_t &r) -> bool
    {
      if(core.ticks == 1)
        {
          core.on_add = [] (window_t&) { throw resource_error(ENOMEM, "no memory for window"); };
          r.post(target_t::app(), action_t::new_window);
          return false;
        }
      open_after_failure = r.get_windows().size();
      return true;
    };

  runtime->run();

  EXPECT_EQ(2, core.ticks);
  EXPECT_EQ(1u, open_after_failure);
  bool found = false;
  for(auto const &message : messages)
    if(message.first == log_level::error && message.second.find("action=new_window failed") == 0)
      found = true;
  EXPECT_TRUE(found);
}

TEST(action, names)
{
  EXPECT_EQ("new_window", to_string(action_t::new_window));
  EXPECT_EQ("toggle_quick_terminal", to_string(action_t::toggle_quick_terminal));
  EXPECT_EQ("config_change", to_string(action_t::config_change));
}
