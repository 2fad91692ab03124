// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Firo Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STEALTH_SUPPORT_ALLOCATORS_SECURE_H
#define STEALTH_SUPPORT_ALLOCATORS_SECURE_H

#include "support/cleanse.h"

#include <memory>
#include <string>
#include <vector>

//
// Allocator that clears its contents before deletion.
// Used for private scalars and shared secrets.
//
template <typename T>
struct secure_allocator : public std::allocator<T> {
    using base = std::allocator<T>;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using reference = T&;
    using const_reference = const T&;

    secure_allocator() noexcept {}
    secure_allocator(const secure_allocator& a) noexcept : base(a) {}
    template <typename U>
    secure_allocator(const secure_allocator<U>& a) noexcept : base(a)
    {
    }
    ~secure_allocator() noexcept {}
    template <typename _Other>
    struct rebind {
        typedef secure_allocator<_Other> other;
    };

    T* allocate(std::size_t n)
    {
        return base::allocate(n);
    }

    void deallocate(T* p, std::size_t n)
    {
        if (p != nullptr) {
            memory_cleanse(p, sizeof(T) * n);
        }
        base::deallocate(p, n);
    }
};

template <typename T, typename U>
bool operator==(const secure_allocator<T>&, const secure_allocator<U>&) noexcept { return true; }
template <typename T, typename U>
bool operator!=(const secure_allocator<T>&, const secure_allocator<U>&) noexcept { return false; }

// This is exactly like std::string, but with a custom allocator.
typedef std::basic_string<char, std::char_traits<char>, secure_allocator<char> > SecureString;
// This is exactly like std::vector, but with a custom allocator.
typedef std::vector<unsigned char, secure_allocator<unsigned char> > SecureVector;

#endif // STEALTH_SUPPORT_ALLOCATORS_SECURE_H
