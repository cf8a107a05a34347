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

#ifndef WLRT_PROTOCOL_HPP
#define WLRT_PROTOCOL_HPP

/** \file
 *
 * Typed wrappers for the protocol objects used by the runtime: the core
 * Wayland globals needed for shared memory surfaces and the stable
 * xdg-shell window management interfaces.
 *
 * Each wrapper owns its wl_proxy and destroys it (sending the interface's
 * destructor request, if it has one) on release() or destruction. Events
 * are delivered to the closures set with the on_XXX() functions. The
 * closures are stored per object and passed to the C library as the
 * listener data, so they stay valid when the wrapper is moved.
 *
 * These wrappers are written and maintained by hand, they are not generated.
 * Only the C glue underneath (xdg-shell-client-protocol.h and
 * xdg-shell-protocol.c) comes from wayland-scanner. A request or event added
 * to one of the interfaces here needs a matching change in
 * src/wlrt-protocol.cpp.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <wayland-client-core.h>
#include <wayland-client-protocol.h>
#include <xdg-shell-client-protocol.h>

#include <wlrt-util.hpp>

namespace wlrt
{
  /** \brief Common base of all protocol object wrappers
   */
  template<typename native_t>
  class proxy_t : public detail::unique_wrapper<native_t>
  {
  protected:
    proxy_t(native_t *object, typename detail::unique_wrapper<native_t>::deleter_t deleter)
      : detail::unique_wrapper<native_t>(object, deleter)
    {
    }

  public:
    typedef native_t native_type;

    proxy_t() = default;

    /** \brief Get the id of the protocol object
     */
    uint32_t get_id() const
    {
      return wl_proxy_get_id(reinterpret_cast<wl_proxy*>(this->c_ptr()));
    }

    /** \brief Get the protocol object version
     */
    uint32_t get_version() const
    {
      return wl_proxy_get_version(reinterpret_cast<wl_proxy*>(this->c_ptr()));
    }
  };

  class buffer_t : public proxy_t<wl_buffer>
  {
  private:
    struct events_t
    {
      std::function<void()> release;
    };
    std::unique_ptr<events_t> events;
    static const wl_buffer_listener listener;

  public:
    static constexpr const char *interface_name = "wl_buffer";

    buffer_t() = default;
    explicit buffer_t(wl_buffer *buffer);

    /** \brief compositor releases buffer

        The compositor no longer reads from the buffer. The client may
        reuse or destroy it.
    */
    std::function<void()> &on_release();
  };

  class shm_pool_t : public proxy_t<wl_shm_pool>
  {
  public:
    static constexpr const char *interface_name = "wl_shm_pool";

    shm_pool_t() = default;
    explicit shm_pool_t(wl_shm_pool *pool);

    /** \brief create a buffer from the pool
        \param offset buffer byte offset within the pool
        \param width buffer width, in pixels
        \param height buffer height, in pixels
        \param stride number of bytes from the beginning of one row to the beginning of the next row
        \param format buffer pixel format (WL_SHM_FORMAT_*)
    */
    buffer_t create_buffer(int32_t offset, int32_t width, int32_t height, int32_t stride, uint32_t format);
  };

  class shm_t : public proxy_t<wl_shm>
  {
  private:
    struct events_t
    {
      std::function<void(uint32_t)> format;
    };
    std::unique_ptr<events_t> events;
    static const wl_shm_listener listener;

  public:
    static constexpr const char *interface_name = "wl_shm";
    static const wl_interface *const interface;

    shm_t() = default;
    explicit shm_t(wl_shm *shm);

    /** \brief create a shm pool
        \param fd file descriptor for the pool; the compositor maps it, the caller keeps ownership
        \param size pool size, in bytes
    */
    shm_pool_t create_pool(int fd, int32_t size);

    /** \brief pixel format description

        Informs the client about a valid pixel format that can be used
        for buffers.
    */
    std::function<void(uint32_t)> &on_format();
  };

  class surface_t : public proxy_t<wl_surface>
  {
  public:
    static constexpr const char *interface_name = "wl_surface";

    surface_t() = default;
    explicit surface_t(wl_surface *surface);

    /** \brief set the surface contents
        \param buffer buffer of surface contents
        \param x surface-local x coordinate
        \param y surface-local y coordinate
    */
    void attach(buffer_t const &buffer, int32_t x, int32_t y);

    /** \brief mark part of the surface damaged
     */
    void damage(int32_t x, int32_t y, int32_t width, int32_t height);

    /** \brief commit pending surface state
     */
    void commit();
  };

  class compositor_t : public proxy_t<wl_compositor>
  {
  public:
    static constexpr const char *interface_name = "wl_compositor";
    static const wl_interface *const interface;

    compositor_t() = default;
    explicit compositor_t(wl_compositor *compositor);

    surface_t create_surface();
  };

  class xdg_toplevel_t : public proxy_t<xdg_toplevel>
  {
  private:
    struct events_t
    {
      std::function<void(int32_t, int32_t, std::vector<uint32_t>)> configure;
      std::function<void()> close;
    };
    std::unique_ptr<events_t> events;
    static const xdg_toplevel_listener listener;

  public:
    static constexpr const char *interface_name = "xdg_toplevel";

    xdg_toplevel_t() = default;
    explicit xdg_toplevel_t(xdg_toplevel *toplevel);

    void set_title(std::string const &title);
    void set_app_id(std::string const &app_id);

    /** \brief suggest a surface change

        Width and height of 0 leave the size to the client. The states
        are xdg_toplevel_state values.
    */
    std::function<void(int32_t, int32_t, std::vector<uint32_t>)> &on_configure();

    /** \brief surface wants to be closed
     */
    std::function<void()> &on_close();
  };

  class xdg_surface_t : public proxy_t<xdg_surface>
  {
  private:
    struct events_t
    {
      std::function<void(uint32_t)> configure;
    };
    std::unique_ptr<events_t> events;
    static const xdg_surface_listener listener;

  public:
    static constexpr const char *interface_name = "xdg_surface";

    xdg_surface_t() = default;
    explicit xdg_surface_t(xdg_surface *surface);

    /** \brief assign the xdg_toplevel surface role
     */
    xdg_toplevel_t get_toplevel();

    /** \brief ack a configure event
        \param serial the serial from the configure event
    */
    void ack_configure(uint32_t serial);

    /** \brief suggest a surface change

        Marks the end of a configure sequence. The client must answer
        with ack_configure(serial) before committing a buffer.
    */
    std::function<void(uint32_t)> &on_configure();
  };

  class xdg_wm_base_t : public proxy_t<xdg_wm_base>
  {
  private:
    struct events_t
    {
      std::function<void(uint32_t)> ping;
    };
    std::unique_ptr<events_t> events;
    static const xdg_wm_base_listener listener;

  public:
    static constexpr const char *interface_name = "xdg_wm_base";
    static const wl_interface *const interface;

    xdg_wm_base_t() = default;
    explicit xdg_wm_base_t(xdg_wm_base *wm_base);

    xdg_surface_t get_xdg_surface(surface_t const &surface);

    void pong(uint32_t serial);

    /** \brief check if the client is alive
     */
    std::function<void(uint32_t)> &on_ping();
  };

  class registry_t : public proxy_t<wl_registry>
  {
  private:
    struct events_t
    {
      std::function<void(uint32_t, std::string, uint32_t)> global;
      std::function<void(uint32_t)> global_remove;
    };
    std::unique_ptr<events_t> events;
    static const wl_registry_listener listener;

  public:
    static constexpr const char *interface_name = "wl_registry";

    registry_t() = default;
    explicit registry_t(wl_registry *registry);

    /** \brief bind an object to the display
        \param name unique numeric name of the global
        \param p wrapper that receives the bound object
        \param version requested version

        Any object p held before is destroyed.
    */
    template <typename proxy>
    void bind(uint32_t name, proxy &p, uint32_t version)
    {
      void *object = wl_registry_bind(c_ptr(), name, proxy::interface, version);
      p = proxy(static_cast<typename proxy::native_type*>(detail::check_object(object, "wl_registry_bind")));
    }

    /** \brief announce global object
        \param name numeric name of the global object
        \param interface interface implemented by the object
        \param version interface version
    */
    std::function<void(uint32_t, std::string, uint32_t)> &on_global();

    /** \brief announce removal of global object
        \param name numeric name of the global object
    */
    std::function<void(uint32_t)> &on_global_remove();
  };
}

#endif
