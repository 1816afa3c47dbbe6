#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#include <vector>
#include <optional>

#include <boost/system/error_code.hpp>

namespace grab
{
  // Cancellation scope.
  //
  // A scope is a cheap handle to shared cancellation state: copies refer to
  // the same state so canceling through any copy is observed by all of them.
  // A scope is canceled when cancel() was called on it, when its deadline
  // (if any) has passed, or when any of its parents is canceled. Cancellation
  // never propagates upwards.
  //
  // Cancellation is cooperative: the transfer machinery polls canceled() at
  // its check points (before each state machine step and before each read).
  //
  class cancel_scope
  {
  public:
    using clock      = std::chrono::steady_clock;
    using time_point = clock::time_point;

    // Create a new root scope that is only canceled explicitly.
    //
    cancel_scope ();

    // Derive a child scope that can be canceled independently of the parent.
    //
    static cancel_scope
    with_cancel (const cancel_scope& parent);

    // Derive a child scope that is canceled once the deadline passes.
    //
    static cancel_scope
    with_deadline (const cancel_scope& parent, time_point);

    static cancel_scope
    with_timeout (const cancel_scope& parent, clock::duration);

    // Derive a scope that is canceled when either of the two is.
    //
    static cancel_scope
    linked (const cancel_scope&, const cancel_scope&);

    // Request cancellation. Idempotent.
    //
    void
    cancel () const noexcept;

    bool
    canceled () const noexcept
    {
      return static_cast<bool> (error ());
    }

    // Return error::canceled or error::deadline_exceeded if the scope is
    // canceled and an empty error code otherwise.
    //
    boost::system::error_code
    error () const noexcept;

    // Return the earliest deadline of this scope and its parents, if any.
    //
    std::optional<time_point>
    deadline () const noexcept;

    // Return true if both handles refer to the same scope.
    //
    bool
    operator== (const cancel_scope& s) const noexcept
    {
      return state_ == s.state_;
    }

  private:
    struct state
    {
      std::atomic<bool> canceled {false};
      std::optional<time_point> deadline;
      std::vector<std::shared_ptr<const state>> parents;
    };

    explicit
    cancel_scope (std::shared_ptr<state> s): state_ (std::move (s)) {}

    static boost::system::error_code
    error (const state&) noexcept;

    static std::optional<time_point>
    deadline (const state&) noexcept;

  private:
    std::shared_ptr<state> state_;
  };
}
