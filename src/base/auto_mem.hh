/**
 * Copyright (c) 2007-2019, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file auto_mem.hh
 */

#ifndef piiguard_auto_mem_hh
#define piiguard_auto_mem_hh

#include <utility>

#include <stdlib.h>

using free_func_t = void (*)(void*);

/**
 * Resource management class for objects allocated by a C library, such as
 * compiled regexes, JSON trees and digest contexts.
 *
 * @param T The object type.
 * @param default_free The function to call to free the managed object.
 */
template<class T, free_func_t default_free = free>
class auto_mem {
public:
    explicit auto_mem(T* ptr = nullptr)
        : am_ptr(ptr), am_free_func(default_free)
    {
    }

    auto_mem(const auto_mem& am) = delete;

    template<typename F>
    explicit auto_mem(F free_func) noexcept
        : am_ptr(nullptr), am_free_func((free_func_t) free_func)
    {
    }

    auto_mem(auto_mem&& other) noexcept
        : am_ptr(other.release()), am_free_func(other.am_free_func)
    {
    }

    ~auto_mem() { this->reset(); }

    bool empty() const { return this->am_ptr == nullptr; }

    operator T*() const { return this->am_ptr; }

    T* operator->() { return this->am_ptr; }

    auto_mem& operator=(T* ptr)
    {
        this->reset(ptr);
        return *this;
    }

    auto_mem& operator=(const auto_mem&) = delete;

    auto_mem& operator=(auto_mem&& am) noexcept
    {
        this->reset(am.release());
        this->am_free_func = am.am_free_func;
        return *this;
    }

    T* release()
    {
        T* retval = this->am_ptr;

        this->am_ptr = nullptr;
        return retval;
    }

    T* in() const { return this->am_ptr; }

    T** out()
    {
        this->reset();
        return &this->am_ptr;
    }

    void reset(T* ptr = nullptr)
    {
        if (this->am_ptr != ptr) {
            if (this->am_ptr != nullptr) {
                this->am_free_func((void*) this->am_ptr);
            }
            this->am_ptr = ptr;
        }
    }

private:
    T* am_ptr;
    void (*am_free_func)(void*);
};

#endif
