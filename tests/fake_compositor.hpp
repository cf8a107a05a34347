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

#ifndef WLRT_TEST_FAKE_COMPOSITOR_HPP
#define WLRT_TEST_FAKE_COMPOSITOR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wlrt
{
  namespace test
  {
    struct fake_options_t
    {
      bool shm = true;
      bool compositor = true;
      bool wm_base = true;

      /** Answer the first commit of an xdg surface with a configure */
      bool configure_on_commit = true;
    };

    /** \brief A minimal compositor serving one client on its own thread

        Speaks wl_shm, wl_compositor and xdg_wm_base over a socketpair and
        records every request it receives as "interface.request". The
        send_XXX() functions run on the server thread and return once the
        events are queued; a client round-trip afterwards receives them.
    */
    class fake_compositor_t
    {
    private:
      struct impl;
      std::unique_ptr<impl> d;

    public:
      explicit fake_compositor_t(fake_options_t const &options = fake_options_t());
      fake_compositor_t(const fake_compositor_t&) = delete;
      fake_compositor_t& operator=(const fake_compositor_t&) = delete;
      ~fake_compositor_t();

      /** \brief Client end of the socketpair. Ownership passes to the caller.
       */
      int take_client_fd();

      std::vector<std::string> get_requests() const;
      void clear_requests();
      bool has_request(std::string const &request) const;

      /** \brief Send xdg_toplevel.close to every toplevel
       */
      void send_close();

      /** \brief Send a configure sequence to the newest toplevel
          \return serial of the xdg_surface.configure event
      */
      uint32_t send_configure();

      /** \brief Send xdg_wm_base.ping
          \return the serial
      */
      uint32_t send_ping();

      uint32_t get_last_configure_serial() const;
      uint32_t get_last_acked_serial() const;
      uint32_t get_last_pong_serial() const;
      std::string get_last_title() const;
      std::string get_last_app_id() const;

      /** \brief Whether a protocol error was posted to the client
       */
      bool has_protocol_error() const;
    };
  }
}

#endif
