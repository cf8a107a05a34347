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

#ifndef WLRT_ERRORS_HPP
#define WLRT_ERRORS_HPP

/** \file */

#include <stdexcept>
#include <string>
#include <system_error>

namespace wlrt
{
  /** \brief The compositor could not be reached

      Thrown when connecting to the Wayland display fails, e.g. because
      the server socket does not exist.
  */
  class connection_error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /** \brief Reading or dispatching events from the display failed

      The connection cannot be used any further. The run loop terminates
      with this error and does not retry.
  */
  class dispatch_error : public std::system_error
  {
  public:
    dispatch_error(int ev, std::string const &what)
      : std::system_error(ev, std::generic_category(), what)
    {
    }
  };

  /** \brief A round-trip to the compositor failed
   */
  class roundtrip_error : public dispatch_error
  {
  public:
    using dispatch_error::dispatch_error;
  };

  /** \brief Allocating or mapping shared memory failed

      Only the window creation that needed the memory fails.
  */
  class resource_error : public std::system_error
  {
  public:
    resource_error(int ev, std::string const &what)
      : std::system_error(ev, std::generic_category(), what)
    {
    }
  };

  /** \brief A request was issued out of protocol order

      E.g. attaching a buffer before the first configure event was
      acknowledged, acknowledging a serial that was never received or
      destroying a window twice. Nothing is sent to the compositor.
  */
  class protocol_precondition_error : public std::logic_error
  {
  public:
    using std::logic_error::logic_error;
  };

  /** \brief A required global was not advertised by the compositor
   */
  class missing_capability_error : public std::runtime_error
  {
  private:
    std::string interface;

  public:
    explicit missing_capability_error(std::string const &interface)
      : std::runtime_error("No " + interface + " global"), interface(interface)
    {
    }

    /** \brief Name of the missing interface, e.g. "wl_shm"
     */
    std::string const &interface_name() const
    {
      return interface;
    }
  };

  /** \brief The configuration contains fatal errors

      Raised at startup when command line arguments could not be applied.
  */
  class config_error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };
}

#endif
