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

#ifndef WLRT_CLIENT_HPP
#define WLRT_CLIENT_HPP

/** \file */

#include <cstdint>
#include <string>
#include <tuple>
#include <wayland-client-core.h>
#include <wlrt-errors.hpp>
#include <wlrt-log.hpp>
#include <wlrt-util.hpp>

namespace wlrt
{
  /** \brief A signalable file descriptor for interrupting a blocked dispatch

      Wraps an eventfd. signal() may be called from any thread; the thread
      blocked in display_t::dispatch(const wakeup_t&) returns as soon as the
      descriptor becomes readable.
  */
  class wakeup_t
  {
  private:
    int fd = -1;

  public:
    /** \brief Create the eventfd
        \exception std::system_error on failure
    */
    wakeup_t();
    wakeup_t(const wakeup_t&) = delete;
    wakeup_t& operator=(const wakeup_t&) = delete;
    ~wakeup_t() noexcept;

    /** \brief Wake up the dispatching thread. Thread-safe.
     */
    void signal() const;

    /** \brief Reset the descriptor
        \return Whether signal() was called since the last drain
    */
    bool drain() const;

    int get_fd() const;
  };

  /** \brief Represents an intention to read from the display file
   *  descriptor
   *
   * Threads that want to read events from a Wayland display file
   * descriptor must announce their intention to do so beforehand - in the C
   * API, this is done using wl_display_prepare_read. This intention must then
   * be resolved either by actually invoking a read from the file descriptor or
   * cancelling.
   *
   * This RAII class makes sure that when it goes out of scope, the intent
   * is cancelled automatically if it was not finalized by manually cancelling
   * or reading before. Otherwise, it would be easy to forget resolving the
   * intent e.g. when handling errors, potentially leading to a deadlock.
   *
   * Read intents can only be created by a \ref display_t with
   * \ref display_t::obtain_read_intent.
   */
  class read_intent
  {
  public:
    read_intent(read_intent &&other) noexcept;
    read_intent(read_intent const &other) = delete;
    read_intent& operator=(read_intent const &other) = delete;
    read_intent& operator=(read_intent &&other) noexcept = delete;
    ~read_intent();

    /** \brief Check whether this intent was already finalized with \ref cancel
     * or \ref read
     */
    bool is_finalized() const;

    /** \brief Cancel read intent
     *
     * An exception is thrown when the read intent was already finalized.
     */
    void cancel();

    /** \brief Read events from display file descriptor
     *
     * Reads and queues events, but does not dispatch them. Call
     * \ref display_t::dispatch_pending afterwards.
     *
     * \exception dispatch_error when reading fails
     * \exception std::logic_error when the read intent was already finalized
     */
    void read();

  private:
    read_intent(wl_display *display);
    friend class display_t;

    wl_display *display;
    bool finalized = false;
  };

  class registry_t;

  /** \brief Represents a connection to the compositor

      All requests are written to the display's buffer and sent when
      flush() is called or when a dispatch blocks. Incoming events are read
      from the display fd, queued and then dispatched to the closures set
      with the on_XXX() functions of each protocol object.

      A display_t is driven by one thread only. The only way to interact
      with it from another thread is to signal the \ref wakeup_t passed to
      dispatch(const wakeup_t&).
  */
  class display_t : public detail::unique_wrapper<wl_display>
  {
  public:
    /** \brief Connect to Wayland display on an already open fd.
        \param fd The fd to use for the connection
        \exception connection_error on failure

        The display_t takes ownership of the fd and will close it when
        the display is destroyed.
    */
    explicit display_t(int fd);

    /**  \brief Connect to a Wayland display.
         \param name Optional name of the Wayland display to connect to
         \exception connection_error on failure

         If name is empty, its value will be replaced with the
         WAYLAND_DISPLAY environment variable if it is set, otherwise
         display "wayland-0" will be used.
    */
    explicit display_t(std::string const &name = {});

    display_t(display_t &&d) noexcept = default;
    display_t(const display_t &d) = delete;
    display_t &operator=(const display_t &d) = delete;
    display_t &operator=(display_t &&d) noexcept = default;
    ~display_t() noexcept = default;

    /** \brief Get a display context's file descriptor.
     */
    int get_fd() const;

    /** \brief Block until all pending request are processed by the server.
        \return The number of dispatched events
        \exception roundtrip_error on failure

        Sends a sync request and dispatches events until the compositor
        answered it. Every event caused by the requests issued before is
        delivered when this returns.
    */
    int roundtrip() const;

    /** \brief Announce calling thread's intention to read events from the
     * Wayland display file descriptor
     *
     * During preparation, all undispatched events in the event queue
     * are dispatched until the queue is empty.
     *
     * \return New \ref read_intent for this display
     * \exception dispatch_error on failure
     */
    read_intent obtain_read_intent() const;

    /** \brief Process incoming events.
        \return The number of dispatched events
        \exception dispatch_error on failure

        Blocks until there are events to be read from the display fd,
        then dispatches them.
    */
    int dispatch() const;

    /** \brief Process incoming events or return when woken up.
        \param wakeup Descriptor watched together with the display fd
        \return The number of dispatched events
        \exception dispatch_error on failure

        Dispatches already queued events without blocking if there are
        any. Otherwise flushes outgoing requests and blocks in poll(2)
        until the display fd is readable or wakeup was signalled, reads
        what arrived and dispatches it. A return value of 0 means that
        the call returned because of the wakeup.
    */
    int dispatch(const wakeup_t &wakeup) const;

    /** \brief Dispatch queued events without reading from the display fd.
        \return The number of dispatched events
        \exception dispatch_error on failure
    */
    int dispatch_pending() const;

    /** \brief Retrieve the last error that occurred on a display.
        \return The last error (an errno value) or 0 if no error occurred

        Errors are fatal. If this function returns non-zero the
        display can no longer be used.
    */
    int get_error() const;

    /** \brief Describe the last error, including the interface, object id
     *         and code of a protocol error
     */
    std::string describe_error() const;

    /** \brief Send all buffered requests on the display to the server.
        \return Tuple of the number of bytes sent and whether all data
        was sent.
        \exception dispatch_error on failure

        Never blocks. If not all data could be written, the second element
        of the tuple is false and the caller should wait for the display fd
        to become writable.
    */
    std::tuple<int, bool> flush() const;

    /** \brief get global registry object

        Globals are announced as events on the returned registry. Set
        registry_t::on_global() before the next dispatch or round-trip,
        or announcements are lost.
    */
    registry_t get_registry() const;
  };
}

#include <wlrt-protocol.hpp>

#endif
