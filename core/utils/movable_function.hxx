/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024. Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

namespace relay::core::utils
{
template<typename Signature>
class movable_function;

/**
 * Type-erased callable that only needs to be move constructible, so handlers may own
 * timers, connections or other move-only state. Unlike std::function it is never copied.
 */
template<typename R, typename... Args>
class movable_function<R(Args...)>
{
  struct callable {
    virtual ~callable() = default;
    virtual auto invoke(Args... args) -> R = 0;
  };

  template<typename Functor>
  struct holder : callable {
    Functor fn;

    explicit holder(Functor&& f)
      : fn(std::move(f))
    {
    }

    auto invoke(Args... args) -> R override
    {
      return fn(std::forward<Args>(args)...);
    }
  };

public:
  movable_function() noexcept = default;

  movable_function(std::nullptr_t) noexcept
  {
  }

  template<typename Functor,
           typename = std::enable_if_t<!std::is_same_v<std::decay_t<Functor>, movable_function> &&
                                       std::is_invocable_r_v<R, std::decay_t<Functor>&, Args...>>>
  movable_function(Functor&& f)
    : impl_{ std::make_unique<holder<std::decay_t<Functor>>>(std::decay_t<Functor>(
        std::forward<Functor>(f))) }
  {
  }

  movable_function(const movable_function&) = delete;
  auto operator=(const movable_function&) -> movable_function& = delete;

  movable_function(movable_function&& other) noexcept = default;
  auto operator=(movable_function&& other) noexcept -> movable_function& = default;

  auto operator=(std::nullptr_t) noexcept -> movable_function&
  {
    impl_.reset();
    return *this;
  }

  ~movable_function() = default;

  explicit operator bool() const noexcept
  {
    return impl_ != nullptr;
  }

  auto operator()(Args... args) const -> R
  {
    return impl_->invoke(std::forward<Args>(args)...);
  }

private:
  std::unique_ptr<callable> impl_{};
};
} // namespace relay::core::utils
