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

#ifndef WLRT_LOG_HPP
#define WLRT_LOG_HPP

/** \file */

#include <functional>
#include <string>

namespace wlrt
{
  /** \brief Severity of a log message
   */
  enum class log_level
  {
    debug,
    info,
    warning,
    error
  };

  /** \brief Type for functions that handle log messages
   *
   * Severity is the first argument, the log message the second.
   */
  using log_handler = std::function<void(log_level, std::string)>;

  /** \brief Set the log handler
   *
   * Receives the runtime's own messages as well as the ones the Wayland C
   * library would otherwise print to the standard error output, such as
   * protocol error messages. Those arrive with log_level::error. An
   * exception thrown while handling one of those is written to std::cerr
   * instead of unwinding into the C library.
   *
   * Passing an empty handler restores the default one, which writes every
   * message to std::cerr.
   *
   * \param handler function that should be called for log messages
   */
  void set_log_handler(log_handler handler);

  /** \brief Printable name of a log level
   */
  std::string to_string(log_level level);

  namespace detail
  {
    void log(log_level level, std::string const &message);
  }
}

#endif
