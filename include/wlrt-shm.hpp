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

#ifndef WLRT_SHM_HPP
#define WLRT_SHM_HPP

/** \file */

#include <cstddef>
#include <cstdint>
#include <string>

#include <wlrt-protocol.hpp>

namespace wlrt
{
  /** \brief Anonymous shared memory

      A memfd of a fixed size, mapped read/write and shared, so that the
      compositor sees what the client writes.
  */
  class shared_mem_t
  {
  private:
    int fd = -1;
    void *mem = nullptr;
    std::size_t len = 0;

  public:
    /** \brief Allocate and map size bytes
        \exception resource_error if the memfd cannot be created, resized or mapped
    */
    explicit shared_mem_t(std::size_t size, std::string const &name = "wlrt");
    shared_mem_t(const shared_mem_t&) = delete;
    shared_mem_t& operator=(const shared_mem_t&) = delete;
    ~shared_mem_t() noexcept;

    int get_fd() const;
    void *get_mem() const;
    std::size_t get_size() const;
  };

  /** \brief Bytes per pixel of a wl_shm format
      \exception protocol_precondition_error for formats other than ARGB8888 and XRGB8888
  */
  std::size_t bytes_per_pixel(uint32_t format);

  /** \brief A rectangular region of a pool that the compositor can display
   */
  class pixel_buffer_t
  {
  private:
    buffer_t buffer;
    uint32_t *pixels = nullptr;
    int32_t offset = 0;
    int32_t width = 0;
    int32_t height = 0;
    int32_t stride = 0;
    uint32_t format = 0;

    pixel_buffer_t(buffer_t &&buffer, uint32_t *pixels, int32_t offset, int32_t width,
                   int32_t height, int32_t stride, uint32_t format);
    friend class pool_t;

  public:
    pixel_buffer_t(pixel_buffer_t &&other) noexcept = default;
    pixel_buffer_t &operator=(pixel_buffer_t &&other) noexcept = default;

    /** \brief Fill every pixel with one color
        \param argb color as 0xAARRGGBB
    */
    void fill(uint32_t argb);

    /** \brief First pixel of the buffer; rows are get_stride() bytes apart
     */
    uint32_t *get_pixels() const;

    const buffer_t &get_proxy() const;
    int32_t get_offset() const;
    int32_t get_width() const;
    int32_t get_height() const;
    int32_t get_stride() const;
    uint32_t get_format() const;

    /** \brief Destroy the wl_buffer. The pixels stay mapped until the pool
     *         is destroyed.
     */
    void release();
  };

  /** \brief Shared memory registered with the compositor

      Pixel buffers are carved from it with create_buffer(). The pool must
      outlive every buffer created from it.
  */
  class pool_t
  {
  private:
    shared_mem_t memory;
    shm_pool_t pool;

  public:
    /** \brief Allocate size bytes and create a wl_shm_pool from them
        \exception resource_error if the memory cannot be allocated
    */
    pool_t(shm_t &shm, std::size_t size);
    pool_t(const pool_t&) = delete;
    pool_t& operator=(const pool_t&) = delete;

    /** \brief Create a buffer
        \exception protocol_precondition_error if stride does not match
        width and format, or the buffer does not fit into the pool
    */
    pixel_buffer_t create_buffer(int32_t offset, int32_t width, int32_t height,
                                 int32_t stride, uint32_t format);

    std::size_t get_size() const;

    /** \brief Destroy the wl_shm_pool
     */
    void release();
  };
}

#endif
