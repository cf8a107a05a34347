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

#include <array>
#include <cerrno>
#include <cstdint>
#include <sstream>
#include <system_error>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <wlrt-client.hpp>

using namespace wlrt;

namespace
{
  int check_dispatch(display_t const &display, int return_value, std::string const &function_name)
  {
    if(return_value < 0)
      {
        int error = display.get_error() ? display.get_error() : errno;
        throw dispatch_error(error, function_name + ": " + display.describe_error());
      }
    return return_value;
  }
}

int wlrt::detail::check_return_value(int return_value, std::string const &function_name)
{
  if(return_value < 0)
    throw std::system_error(errno, std::generic_category(), function_name);
  return return_value;
}

wakeup_t::wakeup_t()
  : fd(detail::check_return_value(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK), "eventfd"))
{
}

wakeup_t::~wakeup_t() noexcept
{
  if(fd >= 0 && close(fd) < 0)
    detail::log(log_level::warning, "close of wakeup descriptor failed");
}

void wakeup_t::signal() const
{
  uint64_t one = 1;
  // EAGAIN means the counter is saturated, which still wakes up the reader
  if(write(fd, &one, sizeof(one)) < 0 && errno != EAGAIN)
    throw std::system_error(errno, std::generic_category(), "eventfd write");
}

bool wakeup_t::drain() const
{
  uint64_t count = 0;
  if(read(fd, &count, sizeof(count)) < 0)
    {
      if(errno == EAGAIN)
        return false;
      throw std::system_error(errno, std::generic_category(), "eventfd read");
    }
  return count > 0;
}

int wakeup_t::get_fd() const
{
  return fd;
}

read_intent::read_intent(wl_display *display)
  : display(display)
{
}

read_intent::read_intent(read_intent &&other) noexcept
  : display(other.display), finalized(other.finalized)
{
  other.finalized = true;
}

read_intent::~read_intent()
{
  if(!finalized)
    cancel();
}

bool read_intent::is_finalized() const
{
  return finalized;
}

void read_intent::cancel()
{
  if(finalized)
    throw std::logic_error("Trying to cancel read_intent that was already finalized");
  wl_display_cancel_read(display);
  finalized = true;
}

void read_intent::read()
{
  if(finalized)
    throw std::logic_error("Trying to read with read_intent that was already finalized");
  // wl_display_read_events finalizes the intent even when it fails
  finalized = true;
  if(wl_display_read_events(display) != 0)
    throw dispatch_error(errno, "wl_display_read_events");
}

display_t::display_t(int fd)
  : detail::unique_wrapper<wl_display>(wl_display_connect_to_fd(fd), wl_display_disconnect)
{
  // wl_display_connect_to_fd closes fd on failure
  if(!has_object())
    throw connection_error("Could not connect to Wayland display server via file-descriptor");
}

display_t::display_t(std::string const &name)
  : detail::unique_wrapper<wl_display>(wl_display_connect(name.empty() ? nullptr : name.c_str()), wl_display_disconnect)
{
  if(!has_object())
    throw connection_error("Could not connect to Wayland display server" + (name.empty() ? std::string() : " " + name));
}

int display_t::get_fd() const
{
  return wl_display_get_fd(c_ptr());
}

int display_t::roundtrip() const
{
  int dispatched = wl_display_roundtrip(c_ptr());
  if(dispatched < 0)
    {
      int error = get_error() ? get_error() : errno;
      throw roundtrip_error(error, "wl_display_roundtrip: " + describe_error());
    }
  return dispatched;
}

read_intent display_t::obtain_read_intent() const
{
  while(wl_display_prepare_read(c_ptr()) != 0)
    {
      if(errno != EAGAIN)
        throw dispatch_error(errno, "wl_display_prepare_read");

      dispatch_pending();
    }
  return read_intent(c_ptr());
}

int display_t::dispatch() const
{
  return check_dispatch(*this, wl_display_dispatch(c_ptr()), "wl_display_dispatch");
}

int display_t::dispatch(const wakeup_t &wakeup) const
{
  int dispatched = dispatch_pending();
  if(dispatched > 0)
    return dispatched;

  read_intent intent = obtain_read_intent();
  bool all_sent = std::get<1>(flush());

  std::array<pollfd, 2> fds{{
      { get_fd(), static_cast<short>(all_sent ? POLLIN : POLLIN | POLLOUT), 0 },
      { wakeup.get_fd(), POLLIN, 0 }
    }};
  while(poll(fds.data(), fds.size(), -1) < 0)
    {
      if(errno != EINTR)
        throw dispatch_error(errno, "poll");
    }

  // A hangup or error still has to be read to learn about a protocol error
  if(fds[0].revents & (POLLIN | POLLERR | POLLHUP))
    intent.read();
  else
    intent.cancel();

  if(fds[0].revents & POLLOUT)
    flush();
  if(fds[1].revents & POLLIN)
    wakeup.drain();

  return dispatch_pending();
}

int display_t::dispatch_pending() const
{
  return check_dispatch(*this, wl_display_dispatch_pending(c_ptr()), "wl_display_dispatch_pending");
}

int display_t::get_error() const
{
  return wl_display_get_error(c_ptr());
}

std::string display_t::describe_error() const
{
  int error = get_error();
  if(error == 0)
    return "no error";
  if(error != EPROTO)
    return std::generic_category().message(error);

  const wl_interface *interface = nullptr;
  uint32_t id = 0;
  uint32_t code = wl_display_get_protocol_error(c_ptr(), &interface, &id);
  std::stringstream ss;
  ss << "protocol error " << code << " on "
     << (interface ? interface->name : "unknown interface") << "#" << id;
  return ss.str();
}

std::tuple<int, bool> display_t::flush() const
{
  int bytes_written = wl_display_flush(c_ptr());
  if(bytes_written < 0)
  {
    if(errno == EAGAIN)
    {
      return std::make_tuple(bytes_written, false);
    }
    else
    {
      throw dispatch_error(errno, "wl_display_flush");
    }
  }
  else
  {
    return std::make_tuple(bytes_written, true);
  }
}

registry_t display_t::get_registry() const
{
  wl_registry *registry = wl_display_get_registry(c_ptr());
  return registry_t(detail::check_object(registry, "wl_display_get_registry"));
}
