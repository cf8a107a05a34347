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

#ifndef WLRT_DEMO_APP_HPP
#define WLRT_DEMO_APP_HPP

#include <atomic>
#include <memory>

#include <wlrt-runtime.hpp>

namespace wlrt
{
  namespace demo
  {
    /** \brief Closes windows that should close and applies reloads to all of them
     */
    class demo_core : public core_t
    {
    private:
      std::atomic<bool> quit_requested{false};

    public:
      void request_quit();

      bool tick(runtime_t &runtime) override;
      void add_surface(window_t &window) override;
      void delete_surface(window_t &window) override;
      void update_config(runtime_t &runtime, const config_t &config) override;
    };

    /** \brief The demo client without its process and signal handling

        start() and run() return the process exit status: 0 after a normal
        shutdown, 1 when the runtime could not start and 2 when the main
        loop failed. Errors are written to std::cerr.
    */
    class demo_app_t
    {
    private:
      demo_core core;
      std::unique_ptr<runtime_t> runtime;

    public:
      int start(runtime_options_t const &options);
      int run();

      /** \brief Leave the main loop. Thread-safe.
       */
      void request_quit();

      /** \brief Queue a hard configuration reload. Thread-safe.
       */
      void request_reload();
    };
  }
}

#endif
