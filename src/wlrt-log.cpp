/*
 * Copyright (c) 2026, the wlrt authors
 * Portions Copyright (c) 2014-2022, Nils Christopher Brause, Philipp Kerling
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

#include <cstdarg>
#include <cstdio>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <wayland-client-core.h>
#include <wlrt-log.hpp>

using namespace wlrt;

namespace
{

void default_log_handler(log_level level, std::string message)
{
  std::cerr << "wlrt(" << to_string(level) << "): " << message << std::endl;
}

log_handler g_log_handler = default_log_handler;

bool format_c_message(const char *format, va_list args, std::string &message)
{
  va_list args_copy;

  // vsnprintf consumes args, so copy beforehand
  va_copy(args_copy, args);
  int length = std::vsnprintf(nullptr, 0, format, args);
  if(length < 0)
    {
      va_end(args_copy);
      return false;
    }

  static_assert(std::numeric_limits<std::vector<char>::size_type>::max() >= std::numeric_limits<int>::max() + 1u /* NUL */, "vector constructor must allow size big enough for vsnprintf return value");

  // for terminating NUL
  std::vector<char> buf(static_cast<std::vector<char>::size_type>(length) + 1);
  int written = std::vsnprintf(buf.data(), buf.size(), format, args_copy);
  va_end(args_copy);
  if(written < 0)
    return false;

  // the C library terminates its messages with a newline
  message = buf.data();
  if(!message.empty() && message.back() == '\n')
    message.pop_back();
  return true;
}

// Called from C frames, nothing may propagate out of it.
extern "C"
void _c_log_handler(const char *format, va_list args)
{
  try
    {
      std::string message;
      if(!format_c_message(format, args, message))
        message = std::string("unformattable wayland-client log message: ") + format;
      g_log_handler(log_level::error, message);
    }
  catch(std::exception &e)
    {
      std::cerr << "wlrt(error): wayland-client log message lost: " << e.what() << std::endl;
    }
}

}

void wlrt::set_log_handler(log_handler handler)
{
  if(handler)
    g_log_handler = handler;
  else
    g_log_handler = default_log_handler;
  wl_log_set_handler_client(_c_log_handler);
}

std::string wlrt::to_string(log_level level)
{
  switch(level)
    {
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warning:
      return "warning";
    case log_level::error:
      return "error";
    }
  return "unknown";
}

void wlrt::detail::log(log_level level, std::string const &message)
{
  g_log_handler(level, message);
}
