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

#ifndef WLRT_UTIL_HPP
#define WLRT_UTIL_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace wlrt
{
  namespace detail
  {
    /** \brief Check the return value of a C function and throw exception on
     *         failure
     *
     * \param return_value return value of the function to check
     * \param function_name name of the function, for error message
     * \return return_value if it was >= 0
     * \exception std::system_error with errno if return_value < 0
     */
    int check_return_value(int return_value, std::string const &function_name);

    /** \brief Check the result of a C constructor function
     *
     * \param object pointer returned by the function
     * \param function_name name of the function, for error message
     * \return object if it was not nullptr
     * \exception std::runtime_error if object is nullptr
     */
    template<typename native_t>
    native_t *check_object(native_t *object, std::string const &function_name)
    {
      if(!object)
        throw std::runtime_error(function_name + " failed.");
      return object;
    }

    /** \brief Owning wrapper for C objects
     *
     * The wrapped object is destroyed exactly once, either by release() or
     * when the wrapper goes out of scope. Wrappers can be moved but not
     * copied. Assigning to a wrapper destroys the object it held before.
     */
    template<typename native_t>
    class unique_wrapper
    {
    public:
      typedef void (*deleter_t)(native_t*);

    private:
      native_t *object = nullptr;
      deleter_t deleter = nullptr;

    protected:
      unique_wrapper(native_t *object, deleter_t deleter)
      : object{object}, deleter{deleter}
      {
      }

    public:
      unique_wrapper()
      {
      }

      unique_wrapper(unique_wrapper const &other) = delete;
      unique_wrapper& operator=(unique_wrapper const &right) = delete;

      unique_wrapper(unique_wrapper &&other) noexcept
      {
        *this = std::move(other);
      }

      unique_wrapper& operator=(unique_wrapper &&right) noexcept
      {
        // Check for self-assignment
        if(this == &right)
          return *this;
        release();
        std::swap(object, right.object);
        std::swap(deleter, right.deleter);
        return *this;
      }

      ~unique_wrapper()
      {
        release();
      }

      native_t *c_ptr() const
      {
        if(!object)
          throw std::runtime_error("Tried to access empty object");
        return object;
      }

      bool has_object() const
      {
        return object;
      }

      operator bool() const
      {
        return has_object();
      }

      operator native_t*() const
      {
        return c_ptr();
      }

      /** \brief Destroy the wrapped object (if any), making this an empty
       *         wrapper
       */
      void release()
      {
        if(object)
          {
            native_t *p = object;
            object = nullptr;
            deleter(p);
          }
      }

      bool operator==(const unique_wrapper &right) const
      {
        return object == right.object;
      }

      bool operator!=(const unique_wrapper &right) const
      {
        return !(*this == right); // Reuse equals operator
      }
    };
  }
}

#endif
