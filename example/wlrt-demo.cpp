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

/** \example wlrt-demo.cpp
 * Opens one window filled with the configured background color and runs
 * until it is closed.
 *
 * SIGHUP reloads the configuration, SIGINT and SIGTERM quit.
 */

#include <atomic>
#include <csignal>
#include <thread>

#include <pthread.h>

#include "demo_app.hpp"

using namespace wlrt;

int main(int argc, char *argv[])
{
  // handled by the signal thread only
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGHUP);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  runtime_options_t options;
  options.config.args.assign(argv + 1, argv + argc);

  demo::demo_app_t app;
  int result = app.start(options);
  if(result != 0)
    return result;

  std::atomic<bool> done{false};
  std::thread signal_thread([&] ()
    {
      int signal = 0;
      while(!done && sigwait(&signals, &signal) == 0)
        {
          if(signal == SIGHUP)
            app.request_reload();
          else
            {
              app.request_quit();
              return;
            }
        }
    });

  result = app.run();

  done = true;
  pthread_kill(signal_thread.native_handle(), SIGTERM);
  signal_thread.join();
  return result;
}
