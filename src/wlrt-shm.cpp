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

#include <algorithm>
#include <cerrno>
#include <limits>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <wlrt-errors.hpp>
#include <wlrt-log.hpp>
#include <wlrt-shm.hpp>

using namespace wlrt;

shared_mem_t::shared_mem_t(std::size_t size, std::string const &name)
  : len(size)
{
  if(size == 0 || size > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
    throw resource_error(EINVAL, "shared memory size out of range");

  // open shared memory file
  fd = memfd_create(name.c_str(), MFD_CLOEXEC);
  if(fd < 0)
    throw resource_error(errno, "memfd_create failed");

  // set size
  if(ftruncate(fd, static_cast<off_t>(size)) < 0)
    {
      int error = errno;
      close(fd);
      throw resource_error(error, "ftruncate failed");
    }

  // map memory
  mem = mmap(nullptr, len, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
  if(mem == MAP_FAILED) // NOLINT
    {
      int error = errno;
      close(fd);
      throw resource_error(error, "mmap failed");
    }
}

shared_mem_t::~shared_mem_t() noexcept
{
  if(munmap(mem, len) < 0)
    detail::log(log_level::warning, "munmap failed");
  if(close(fd) < 0)
    detail::log(log_level::warning, "close of shared memory failed");
}

int shared_mem_t::get_fd() const
{
  return fd;
}

void *shared_mem_t::get_mem() const
{
  return mem;
}

std::size_t shared_mem_t::get_size() const
{
  return len;
}

std::size_t wlrt::bytes_per_pixel(uint32_t format)
{
  switch(format)
    {
    case WL_SHM_FORMAT_ARGB8888:
    case WL_SHM_FORMAT_XRGB8888:
      return 4;
    default:
      {
        std::stringstream ss;
        ss << "unsupported pixel format 0x" << std::hex << format;
        throw protocol_precondition_error(ss.str());
      }
    }
}

pixel_buffer_t::pixel_buffer_t(buffer_t &&buffer, uint32_t *pixels, int32_t offset, int32_t width,
                               int32_t height, int32_t stride, uint32_t format)
  : buffer(std::move(buffer)), pixels(pixels), offset(offset), width(width),
    height(height), stride(stride), format(format)
{
}

void pixel_buffer_t::fill(uint32_t argb)
{
  // stride is a whole number of pixels for the supported formats
  std::fill_n(pixels, static_cast<std::size_t>(stride / 4) * height, argb);
}

uint32_t *pixel_buffer_t::get_pixels() const
{
  return pixels;
}

const buffer_t &pixel_buffer_t::get_proxy() const
{
  return buffer;
}

int32_t pixel_buffer_t::get_offset() const
{
  return offset;
}

int32_t pixel_buffer_t::get_width() const
{
  return width;
}

int32_t pixel_buffer_t::get_height() const
{
  return height;
}

int32_t pixel_buffer_t::get_stride() const
{
  return stride;
}

uint32_t pixel_buffer_t::get_format() const
{
  return format;
}

void pixel_buffer_t::release()
{
  buffer.release();
}

pool_t::pool_t(shm_t &shm, std::size_t size)
  : memory(size)
{
  pool = shm.create_pool(memory.get_fd(), static_cast<int32_t>(size));
}

pixel_buffer_t pool_t::create_buffer(int32_t offset, int32_t width, int32_t height,
                                     int32_t stride, uint32_t format)
{
  if(offset < 0 || width <= 0 || height <= 0)
    throw protocol_precondition_error("invalid buffer geometry");
  if(static_cast<std::size_t>(stride) != static_cast<std::size_t>(width) * bytes_per_pixel(format))
    throw protocol_precondition_error("stride does not match width and pixel format");
  if(static_cast<std::size_t>(offset) % bytes_per_pixel(format) != 0)
    throw protocol_precondition_error("offset is not aligned to the pixel size");
  if(static_cast<std::size_t>(offset) + static_cast<std::size_t>(stride) * static_cast<std::size_t>(height) > memory.get_size())
    throw protocol_precondition_error("buffer exceeds the pool");

  uint32_t *pixels = reinterpret_cast<uint32_t*>(static_cast<char*>(memory.get_mem()) + offset);
  return pixel_buffer_t(pool.create_buffer(offset, width, height, stride, format),
                        pixels, offset, width, height, stride, format);
}

std::size_t pool_t::get_size() const
{
  return memory.get_size();
}

void pool_t::release()
{
  pool.release();
}
