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

#ifndef WLRT_RUNTIME_HPP
#define WLRT_RUNTIME_HPP

/** \file */

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <wlrt-client.hpp>
#include <wlrt-config.hpp>
#include <wlrt-window.hpp>

namespace wlrt
{
  class runtime_t;

  /** \brief Actions the embedding core can request from the runtime
   */
  enum class action_t
  {
    new_window,
    new_tab,
    new_split,
    close_all_windows,
    toggle_fullscreen,
    toggle_tab_overview,
    toggle_window_decorations,
    toggle_quick_terminal,
    toggle_visibility,
    move_tab,
    goto_tab,
    goto_split,
    resize_split,
    equalize_splits,
    toggle_split_zoom,
    present_terminal,
    size_limit,
    initial_size,
    cell_size,
    inspector,
    render_inspector,
    desktop_notification,
    set_title,
    pwd,
    mouse_shape,
    mouse_visibility,
    mouse_over_link,
    renderer_health,
    open_config,
    quit_timer,
    secure_input,
    key_sequence,
    color_change,
    reload_config,
    config_change
  };

  std::string to_string(action_t action);

  /** \brief Payload of action_t::reload_config
   */
  struct reload_config_t
  {
    /** Re-apply the current snapshot instead of loading a new one */
    bool soft;

    reload_config_t();
    explicit reload_config_t(bool soft);
  };

  /** \brief Payload of an action. Only the member matching the action is
   *         meaningful.
   */
  struct action_value_t
  {
    reload_config_t reload_config;

    action_value_t();
    action_value_t(reload_config_t const &reload_config);
  };

  /** \brief Receiver of an action: the whole application or one window
   */
  class target_t
  {
  private:
    window_t *surface;

    explicit target_t(window_t *surface);

  public:
    static target_t app();
    static target_t window(window_t &surface);

    bool is_app() const;

    /** \brief The window of a window target, null for the app target
     */
    window_t *get_surface() const;
  };

  /** \brief The application embedding the runtime

      All functions are called on the thread running runtime_t::run().
  */
  class core_t
  {
  public:
    virtual ~core_t() = default;

    /** \brief Called once per loop iteration
        \return true to leave the loop
    */
    virtual bool tick(runtime_t &runtime) = 0;

    /** \brief A window was created */
    virtual void add_surface(window_t &window) = 0;

    /** \brief A window is about to be destroyed */
    virtual void delete_surface(window_t &window) = 0;

    /** \brief A snapshot was applied to the whole application */
    virtual void update_config(runtime_t &runtime, const config_t &config) = 0;

    /** \brief A snapshot was applied to a single window */
    virtual void update_surface_config(window_t &window, const config_t &config);
  };

  struct runtime_options_t
  {
    /** Display to connect to, empty for $WAYLAND_DISPLAY */
    std::string display_name;

    /** Already connected socket, used instead of display_name if not -1.
        Ownership passes to the runtime. */
    int display_fd = -1;

    config_sources_t config;

    /** Produces configuration snapshots, at startup and on reload */
    std::function<config_t(const config_sources_t&)> config_loader;

    runtime_options_t();
  };

  /** \brief Connection, globals, windows and the main loop

      The constructor connects to the compositor, binds wl_shm,
      wl_compositor and xdg_wm_base, loads the configuration and queues a
      new_window action. run() then creates that window and loops until
      the core asks to quit or no window is left.
  */
  class runtime_t
  {
  private:
    struct message_t
    {
      target_t target;
      action_t action;
      action_value_t value;
    };

    core_t &core;
    runtime_options_t options;

    display_t display;
    registry_t registry;
    shm_t shm;
    compositor_t compositor;
    xdg_wm_base_t wm_base;
    std::vector<uint32_t> shm_formats;

    config_t config;
    wakeup_t wake;

    std::mutex mailbox_mutex;
    std::deque<message_t> mailbox;

    // destroyed first, the windows use the globals above
    std::vector<std::unique_ptr<window_t>> windows;

    void bind_globals();
    void load_config();
    void process_mailbox();
    void apply_config(target_t const &target, const config_t &snapshot);
    bool contains(window_t const *window) const;

  public:
    /** \brief Connect and initialize
        \exception connection_error if the display cannot be reached
        \exception roundtrip_error if the initial round-trip fails
        \exception missing_capability_error if a required global is missing
        \exception config_error if command line arguments are invalid
    */
    runtime_t(core_t &core, runtime_options_t const &options = runtime_options_t());
    runtime_t(const runtime_t&) = delete;
    runtime_t& operator=(const runtime_t&) = delete;
    ~runtime_t();

    /** \brief Run the main loop

        A resource_error or config_error raised by a queued action is logged
        while other windows are open, and ends the loop otherwise.
        \exception dispatch_error if the connection fails
    */
    void run();

    /** \brief Perform an action immediately

        Actions other than new_window and reload_config are accepted and
        logged as unimplemented.
    */
    void perform_action(target_t const &target, action_t action,
                        action_value_t const &value = action_value_t());

    /** \brief Queue an action for the loop. Thread-safe.
     */
    void post(target_t const &target, action_t action,
              action_value_t const &value = action_value_t());

    /** \brief Interrupt a blocked run(). Thread-safe.
     */
    void wakeup();

    /** \brief Open a window
        \param parent window it was requested from, may be null
        \return the new window, owned by the runtime
    */
    window_t &new_window(window_t *parent = nullptr);

    /** \brief Destroy a window and forget it
        \exception protocol_precondition_error if the window is unknown
    */
    void close_window(window_t &window);

    /** \brief Apply the current snapshot (soft) or a freshly loaded one

        A failing reload leaves the current snapshot unchanged.
    */
    void reload_config(target_t const &target, reload_config_t const &reload);

    void redraw_surface(window_t &window);
    void redraw_inspector(window_t &window);

    /** \brief Whether the compositor announced the given wl_shm format.
     *         True if it announced none.
     */
    bool supports_format(uint32_t format) const;

    const config_t &get_config() const;
    std::vector<window_t*> get_windows() const;
    display_t &get_display();
    shm_t &get_shm();
    compositor_t &get_compositor();
    xdg_wm_base_t &get_wm_base();
  };
}

#endif
