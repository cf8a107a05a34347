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

#ifndef WLRT_WINDOW_HPP
#define WLRT_WINDOW_HPP

/** \file */

#include <cstdint>
#include <string>
#include <utility>

#include <wlrt-config.hpp>
#include <wlrt-protocol.hpp>
#include <wlrt-shm.hpp>

namespace wlrt
{
  class runtime_t;

  /** \brief A top-level xdg-shell window showing one shared memory buffer

      The window walks through
      created -> awaiting_first_configure -> configured -> attached
      and ends in destroyed. A buffer is never attached before the first
      configure event was received and acknowledged.
  */
  class window_t
  {
  public:
    enum class state_t
    {
      created,
      awaiting_first_configure,
      configured,
      attached,
      destroyed
    };

    static constexpr int32_t width = 128;
    static constexpr int32_t height = 128;

  private:
    runtime_t &runtime;
    window_t *parent;
    std::string title;

    // released in reverse order of declaration
    pool_t pool;
    pixel_buffer_t buffer;
    surface_t surface;
    xdg_surface_t xdg;
    xdg_toplevel_t toplevel;

    state_t state = state_t::created;
    bool close_requested = false;
    bool configure_pending = false;
    uint32_t configure_serial = 0;

    void handle_configure(uint32_t serial);

  public:
    /** \brief Create the window and show it

        Performs a round-trip, so the first configure event has been
        handled when the constructor returns.

        \param runtime runtime holding the globals and the configuration
        \param parent window this one was opened from, may be null. Only
        recorded, nothing is inherited from it.
        \exception resource_error if the buffer cannot be allocated or the
        compositor does not support ARGB8888
        \exception roundtrip_error if the round-trip fails
        \exception protocol_precondition_error if no configure event arrived
    */
    window_t(runtime_t &runtime, window_t *parent);
    window_t(const window_t&) = delete;
    window_t& operator=(const window_t&) = delete;

    /** \brief Acknowledge a configure event
        \param serial serial of the last configure event received
        \exception protocol_precondition_error if no configure is pending or
        serial is not the one last received
    */
    void ack_configure(uint32_t serial);

    /** \brief Attach the buffer, damage all of it and commit
        \exception protocol_precondition_error unless configured or attached
    */
    void attach();

    /** \brief Destroy the protocol objects

        Releases the toplevel, the xdg surface, the surface, the buffer and
        the pool, in that order.
        \exception protocol_precondition_error if already destroyed
    */
    void destroy();

    /** \brief Apply title, application id and background of a snapshot

        Re-attaches the buffer if it was attached.
    */
    void update_config(const config_t &config);

    /** \brief Whether the compositor asked to close the window
     */
    bool should_close() const;

    state_t get_state() const;
    std::string const &get_title() const;
    std::pair<int32_t, int32_t> get_size() const;
    std::pair<float, float> get_content_scale() const;
    window_t *get_parent() const;
    const surface_t &get_surface() const;
    const pixel_buffer_t &get_buffer() const;
  };

  std::string to_string(window_t::state_t state);
}

#endif
